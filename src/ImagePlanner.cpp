// Image layout planning

#include "V9Kdisk.h"
#include "ImagePlanner.h"

uint32_t VolumeSectorsFromMiB(const std::string& name, double mib)
{
    auto sectors = std::llround(mib * (1024 * 1024 / SECTOR_SIZE));
    if (sectors <= 0)
        throw volume_too_large(name, sectors, MAX_VOLUME_SECTORS);
    if (sectors > MAX_VOLUME_SECTORS)
        throw volume_too_large(name, sectors, MAX_VOLUME_SECTORS);

    return static_cast<uint32_t>(sectors);
}

ControllerParams DefaultControllerParams()
{
    ControllerParams cp;
    cp.reduced_current = 128;
    cp.write_precomp = 128;
    cp.ecc_burst = 11;
    cp.fast_step = 7;
    cp.interleave = 5;
    return cp;
}

// Consecutive whole-cylinder regions, each within the ROM's block counter
std::vector<MediaRegion> ChunkRegions(uint32_t total_sectors, int cylinder_sectors)
{
    std::vector<MediaRegion> regions;

    auto max_chunk = static_cast<uint32_t>(std::max(1, MAX_REGION_BLOCKS / cylinder_sectors) * cylinder_sectors);
    if (max_chunk > static_cast<uint32_t>(MAX_REGION_BLOCKS))
        max_chunk = MAX_REGION_BLOCKS;

    for (uint32_t start = 0; start < total_sectors; )
    {
        MediaRegion region;
        region.physical_address = start;
        region.block_count = std::min(total_sectors - start, max_chunk);
        regions.push_back(region);

        start += region.block_count;
    }

    return regions;
}

uint32_t AlignToCylinder(uint32_t sector, int cylinder_sectors)
{
    auto remainder = sector % cylinder_sectors;
    return remainder ? sector + (cylinder_sectors - remainder) : sector;
}


static void ValidateGeometry(const Geometry& geometry)
{
    if (geometry.cyls <= 0 || geometry.heads <= 0 || geometry.sectors <= 0)
        throw geometry_error("invalid geometry (", geometry.cyls, '/', geometry.heads, '/', geometry.sectors, ")");

    if (geometry.cyls > 0xffff || geometry.heads > 0xff)
        throw geometry_error("geometry (", geometry.cyls, '/', geometry.heads, ") doesn't fit the controller parameters");

    if (geometry.total_sectors() >= MAX_ADDRESS_SECTORS)
        throw geometry_too_large(geometry.cyls, geometry.heads, geometry.sectors, MAX_ADDRESS_SECTORS);
}

ImagePlan PlanImage(const PlanConfig& config)
{
    auto& geometry = config.geometry;
    ValidateGeometry(geometry);

    if (config.label_revision < 1 || config.label_revision > MAX_LABEL_REVISION)
        throw invariant_violation("label_revision", MAX_LABEL_REVISION, config.label_revision);

    if (config.volumes.empty())
        throw geometry_error("no volumes requested");

    if (config.boot_volume < 0 || config.boot_volume >= static_cast<int>(config.volumes.size()))
        throw volume_index_error(config.boot_volume, static_cast<int>(config.volumes.size()));

    ImagePlan plan;
    plan.geometry = geometry;
    plan.total_sectors = static_cast<uint32_t>(geometry.total_sectors());

    auto& ml = plan.master;
    ml.label_type = static_cast<uint16_t>(config.label_revision);
    ml.device_id = config.device_id;
    ml.set_serial(config.serial);
    ml.primary_boot_volume = static_cast<uint16_t>(config.boot_volume);
    ml.controller = config.controller;
    ml.controller.cyls = static_cast<uint16_t>(geometry.cyls);
    ml.controller.heads = static_cast<uint8_t>(geometry.heads);

    // Bad sector remapping isn't supported, so all media is working media
    ml.available_media = ChunkRegions(plan.total_sectors, geometry.cylinder_sectors());
    ml.working_media = ml.available_media;

    auto cursor = FIRST_VOLUME_SECTOR;
    for (size_t index = 0; index < config.volumes.size(); ++index)
    {
        auto& request = config.volumes[index];

        if (!request.sectors || request.sectors > static_cast<uint32_t>(MAX_VOLUME_SECTORS))
            throw volume_too_large(request.name, request.sectors, MAX_VOLUME_SECTORS);

        if (config.align_to_cylinder && cursor > FIRST_VOLUME_SECTOR)
            cursor = AlignToCylinder(cursor, geometry.cylinder_sectors());

        auto end_sector = static_cast<int64_t>(cursor) + request.sectors;
        if (end_sector > plan.total_sectors)
            throw capacity_exceeded(request.name, end_sector, plan.total_sectors);

        PlannedVolume volume;
        volume.address = cursor;

        auto& label = volume.label;
        label.label_type = request.label_type;
        label.set_name(request.name);
        // Only the boot volume carries a loader, the rest get a zeroed vector
        label.ipl = (static_cast<int>(index) == config.boot_volume) ? request.ipl : IplVector{};
        label.capacity = request.sectors;
        label.data_start = 1;
        label.host_block_size = SECTOR_SIZE;

        if (label.is_msdos())
        {
            FatParams params;
            params.capacity = request.sectors;
            params.allocation_unit = request.allocation_unit ? request.allocation_unit : config.default_allocation_unit;
            params.root_entries = request.root_entries ? request.root_entries : config.default_root_entries;
            params.reserved_sectors = static_cast<int>(label.data_start);
            params.volume_address = cursor;

            volume.fat = CalculateFatGeometry(params);
            volume.has_fat = true;

            label.allocation_unit = static_cast<uint16_t>(volume.fat.allocation_unit);
            label.directory_entries = static_cast<uint16_t>(volume.fat.root_entries);
        }
        else
        {
            label.allocation_unit = static_cast<uint16_t>(request.allocation_unit);
            label.directory_entries = static_cast<uint16_t>(request.root_entries);
        }

        ValidateVolumeLabel(label);

        VolumeDirectoryEntry entry;
        entry.logical_address = cursor;
        ml.virtual_volumes.push_back(entry);

        plan.volumes.push_back(std::move(volume));
        cursor = static_cast<uint32_t>(end_sector);
    }

    // The ROM boots from the master label's IPL vector
    ml.ipl = plan.volumes[config.boot_volume].label.ipl;

    ValidateMasterLabel(ml);
    return plan;
}
