#pragma once

#include "Label.h"
#include "FatGeometry.h"

// Conversion between native volumes and standard FAT boot sector volume images

struct BootSectorInfo
{
    std::string oem_name{};
    int bytes_per_sector = 0;
    int sectors_per_cluster = 0;
    int reserved_sectors = 0;
    int fat_count = 0;
    int root_entries = 0;
    uint32_t total_sectors = 0;     // 16-bit field, or the large field when that's zero
    int media = 0;
    int fat_sectors = 0;
    int sectors_per_track = 0;
    int heads = 0;
    uint32_t hidden_sectors = 0;
    bool extended = false;
    uint32_t volume_id = 0;
    std::string volume_label{};
    std::string fs_type{};

    int directory_sectors() const { return (root_entries * DIR_ENTRY_SIZE + SECTOR_SIZE - 1) / SECTOR_SIZE; }
};

BootSectorInfo ReadBootSector(const Data& volume);
Data MakeBootSector(const MasterLabel& master, const VolumeLabel& label, uint32_t address, const FatGeometry& fat);

FatGeometry VolumeFatGeometry(const VolumeLabel& label, uint32_t address);
int SectorsPerTrack(const MasterLabel& master);

Data ExtractVolumeData(const Data& image, int index);
Data InsertVolumeData(const Data& image, int index, const Data& edited);
