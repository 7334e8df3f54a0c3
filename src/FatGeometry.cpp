// FAT12 geometry calculation for virtual volumes

#include "V9Kdisk.h"
#include "FatGeometry.h"

// Root directory sizes by capacity. A larger directory only takes over once it
// costs no clusters compared with one sector less at the smaller size.
struct RootEntryStep
{
    uint32_t first_capacity;
    int entries;
};

static const RootEntryStep root_entry_table[] =
{
    { 0, 128 },
    { 4097, 256 },
    { 16385, 512 },
};

// 12-bit entries, including the two reserved ones at the start of the table
int FatSectorsForClusters(int cluster_count)
{
    auto fat_bytes = ((cluster_count + 2) * 3 + 1) / 2;
    return (fat_bytes + SECTOR_SIZE - 1) / SECTOR_SIZE;
}

static int DirectorySectors(int root_entries)
{
    return (root_entries * DIR_ENTRY_SIZE + SECTOR_SIZE - 1) / SECTOR_SIZE;
}

static bool IsValidAllocationUnit(int allocation_unit)
{
    return allocation_unit >= 1 && allocation_unit <= MAX_ALLOCATION_UNIT &&
        !(allocation_unit & (allocation_unit - 1));
}

// Settle the FAT size for the space left after the fixed sectors. Returns the
// cluster count, 0 if not even one cluster fits, or -1 if the size never settles.
static int64_t SolveFat(uint32_t capacity, int allocation_unit, int64_t fixed_sectors, int& fat_sectors)
{
    // Clusters that fit alongside two FAT copies of the given size
    auto clusters_for = [&](int sectors) -> int64_t
    {
        auto avail = static_cast<int64_t>(capacity) - fixed_sectors - FAT_COPIES * sectors;
        return (avail < 0) ? 0 : avail / allocation_unit;
    };

    // A larger FAT leaves fewer clusters to describe, so the smallest FAT big
    // enough for the clusters it leaves room for is reached by growing from one
    // sector. Once found, confirm no smaller size also fits.
    fat_sectors = 1;
    auto converged = false;
    for (auto i = 0; i < MAX_FAT_ITERATIONS; ++i)
    {
        auto clusters = clusters_for(fat_sectors);
        if (clusters < 1)
            return 0;

        auto needed = FatSectorsForClusters(static_cast<int>(clusters));
        if (needed <= fat_sectors)
        {
            converged = true;
            break;
        }

        fat_sectors = needed;
    }

    if (!converged)
        return -1;

    while (fat_sectors > 1)
    {
        auto clusters = clusters_for(fat_sectors - 1);
        if (clusters < 1 || FatSectorsForClusters(static_cast<int>(clusters)) > fat_sectors - 1)
            break;
        --fat_sectors;
    }

    return clusters_for(fat_sectors);
}

static int64_t ClusterCount(uint32_t capacity, int allocation_unit, int reserved_sectors, int root_entries)
{
    int fat_sectors = 0;
    return SolveFat(capacity, allocation_unit, static_cast<int64_t>(reserved_sectors) + DirectorySectors(root_entries), fat_sectors);
}

// Root directory size used when the volume doesn't ask for one
int DefaultRootEntries(uint32_t capacity, int allocation_unit, int reserved_sectors)
{
    auto entries = root_entry_table[0].entries;

    for (size_t i = 1; i < arraysize(root_entry_table); ++i)
    {
        auto start = root_entry_table[i].first_capacity;
        if (capacity < start)
            break;

        // Cluster counts line up again within one allocation unit of the
        // boundary, or never do for this unit size.
        auto larger = root_entry_table[i].entries;
        auto end = std::min(capacity, start + static_cast<uint32_t>(allocation_unit) - 1);
        auto step = start;
        for (; step <= end; ++step)
        {
            auto clusters = ClusterCount(step, allocation_unit, reserved_sectors, larger);
            if (clusters > 0 && clusters >= ClusterCount(step - 1, allocation_unit, reserved_sectors, entries))
                break;
        }

        if (step > end)
            break;

        entries = larger;
    }

    return entries;
}

FatGeometry CalculateFatGeometry(const FatParams& params)
{
    if (!IsValidAllocationUnit(params.allocation_unit))
        throw geometry_error("allocation unit (", params.allocation_unit, ") must be a power of 2 from 1 to ", MAX_ALLOCATION_UNIT);

    if (params.reserved_sectors < 1)
        throw geometry_error("invalid reserved sector count (", params.reserved_sectors, ")");

    auto root_entries = params.root_entries ? params.root_entries :
        DefaultRootEntries(params.capacity, params.allocation_unit, params.reserved_sectors);
    if (root_entries < 1 || root_entries > 0xffff)
        throw geometry_error("invalid root directory size (", root_entries, " entries)");

    FatGeometry g;
    g.allocation_unit = params.allocation_unit;
    g.reserved_sectors = params.reserved_sectors;
    g.root_entries = root_entries;
    g.directory_bytes = root_entries * DIR_ENTRY_SIZE;
    g.directory_sectors = DirectorySectors(root_entries);

    auto fat_sectors = 0;
    auto clusters = SolveFat(params.capacity, params.allocation_unit,
        static_cast<int64_t>(g.reserved_sectors) + g.directory_sectors, fat_sectors);

    if (clusters < 0)
        throw geometry_error("FAT size failed to settle within ", MAX_FAT_ITERATIONS, " iterations");
    else if (clusters < 1)
        throw geometry_error("volume capacity (", params.capacity, " sectors) is too small for ",
            g.reserved_sectors, " reserved, ", FAT_COPIES, " FATs, ", g.directory_sectors,
            " directory sectors and one cluster");

    if (clusters > MAX_FAT12_CLUSTERS)
        throw geometry_error("volume needs ", clusters, " clusters, FAT12 limit is ", MAX_FAT12_CLUSTERS,
            " (use a larger allocation unit)");

    g.cluster_count = static_cast<int>(clusters);
    g.fat_sectors = fat_sectors;
    g.fat_bytes = ((g.cluster_count + 2) * 3 + 1) / 2;
    g.fat_logical_sectors[0] = g.reserved_sectors;
    g.fat_logical_sectors[1] = g.reserved_sectors + fat_sectors;
    g.first_data_logical = g.directory_logical() + g.directory_sectors;
    g.first_data_physical = params.volume_address + static_cast<uint32_t>(g.first_data_logical);

    return g;
}
