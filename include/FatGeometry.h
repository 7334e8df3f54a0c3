#pragma once

// FAT12 layout of a virtual volume, matching the boot ROM's interpretation

const int DEFAULT_ALLOCATION_UNIT = 64;
const int MAX_ALLOCATION_UNIT = 128;
const int MAX_FAT12_CLUSTERS = 4084;
const int MAX_FAT_ITERATIONS = 16;
const int FAT_COPIES = 2;
const int DIR_ENTRY_SIZE = 32;

struct FatParams
{
    uint32_t capacity = 0;                          // sectors, including the volume label
    int allocation_unit = DEFAULT_ALLOCATION_UNIT;  // sectors per cluster
    int root_entries = 0;                           // 0 for the capacity default
    int reserved_sectors = 1;                       // the volume label
    uint32_t volume_address = 0;                    // physical sector of the label
};

struct FatGeometry
{
    int allocation_unit = 0;
    int reserved_sectors = 0;
    int cluster_count = 0;
    int fat_bytes = 0;
    int fat_sectors = 0;
    std::array<int, FAT_COPIES> fat_logical_sectors{};
    int root_entries = 0;
    int directory_bytes = 0;
    int directory_sectors = 0;
    int first_data_logical = 0;
    uint32_t first_data_physical = 0;

    int directory_logical() const { return reserved_sectors + FAT_COPIES * fat_sectors; }
    int64_t fat_offset(int copy) const { return static_cast<int64_t>(fat_logical_sectors[copy]) * SECTOR_SIZE; }
    int64_t directory_offset() const { return static_cast<int64_t>(directory_logical()) * SECTOR_SIZE; }
    int64_t data_offset() const { return static_cast<int64_t>(first_data_logical) * SECTOR_SIZE; }
};

inline bool operator==(const FatGeometry& a, const FatGeometry& b)
{
    return a.allocation_unit == b.allocation_unit && a.reserved_sectors == b.reserved_sectors &&
        a.cluster_count == b.cluster_count && a.fat_sectors == b.fat_sectors &&
        a.directory_sectors == b.directory_sectors && a.root_entries == b.root_entries &&
        a.first_data_physical == b.first_data_physical;
}

int DefaultRootEntries(uint32_t capacity, int allocation_unit = DEFAULT_ALLOCATION_UNIT, int reserved_sectors = 1);
int FatSectorsForClusters(int cluster_count);
FatGeometry CalculateFatGeometry(const FatParams& params);
