// Image planning and building tests

#include "TestRunner.h"
#include "ImagePlanner.h"
#include "ImageBuilder.h"

static VolumeRequest Volume(const std::string& name, uint32_t sectors)
{
    VolumeRequest request;
    request.name = name;
    request.sectors = sectors;
    return request;
}

// 3800 cylinders of 8x17, eight 30MiB volumes and a 10MiB tail, aligned
static PlanConfig LargeDiskConfig()
{
    PlanConfig config;
    config.geometry.cyls = 3800;
    config.align_to_cylinder = true;

    for (int i = 0; i < 8; ++i)
        config.volumes.push_back(Volume(util::fmt("VOL%d", i), VolumeSectorsFromMiB("vol", 30)));
    config.volumes.push_back(Volume("TAIL", VolumeSectorsFromMiB("tail", 10)));

    return config;
}

// 700x10x17 with two DOS volumes and a reserved maintenance area
static PlanConfig SmallDiskConfig()
{
    PlanConfig config;
    config.geometry.cyls = 700;
    config.geometry.heads = 10;

    config.volumes.push_back(Volume("SYSTEM", 60000));
    config.volumes.push_back(Volume("DATA", 58453));

    auto maint = Volume("MAINT", 528);
    maint.label_type = 0x4d;
    maint.allocation_unit = 4;
    config.volumes.push_back(maint);

    return config;
}

static void MiBConversion()
{
    CHECK_EQUAL(VolumeSectorsFromMiB("a", 30), 61440u);
    CHECK_EQUAL(VolumeSectorsFromMiB("b", 10), 20480u);
    CHECK_EQUAL(VolumeSectorsFromMiB("c", 0.5), 1024u);

    auto e = EXPECT_ERROR(volume_too_large, VolumeSectorsFromMiB("big", 40));
    CHECK_EQUAL(e.sectors, 81920);
    CHECK_EQUAL(e.name, std::string("big"));
    CHECK_THROWS(VolumeSectorsFromMiB("zero", 0), volume_too_large);
}

static void RegionChunks()
{
    auto regions = ChunkRegions(516800, 136);
    CHECK_EQUAL(regions.size(), 8u);
    for (size_t i = 0; i < 7; ++i)
    {
        CHECK_EQUAL(regions[i].physical_address, static_cast<uint32_t>(i * 65416));
        CHECK_EQUAL(regions[i].block_count, 65416u);
    }
    CHECK_EQUAL(regions[7].block_count, 58888u);

    // A single cylinder larger than the block counter is split
    regions = ChunkRegions(160000, 80000);
    CHECK_EQUAL(regions.size(), 3u);
    CHECK_EQUAL(regions[0].block_count, 65535u);
    CHECK_EQUAL(regions[2].block_count, 160000u - 2 * 65535);
}

static void CylinderAlignment()
{
    CHECK_EQUAL(AlignToCylinder(0, 136), 0u);
    CHECK_EQUAL(AlignToCylinder(136, 136), 136u);
    CHECK_EQUAL(AlignToCylinder(61442, 136), 61472u);
}

static void LargeDiskPlan()
{
    auto plan = PlanImage(LargeDiskConfig());
    auto& ml = plan.master;

    CHECK_EQUAL(plan.total_sectors, 516800u);
    CHECK_EQUAL(ml.controller.cyls, 3800);
    CHECK_EQUAL(ml.controller.heads, 8);
    CHECK_EQUAL(ml.label_type, LABEL_TYPE_MSDOS_REVISION);
    CHECK_EQUAL(ml.serial(), std::string(DEFAULT_SERIAL));

    CHECK(ml.working_media == ml.available_media);
    CHECK_EQUAL(TotalBlocks(ml.available_media), 516800u);
    for (auto& region : ml.available_media)
        CHECK(region.block_count <= static_cast<uint32_t>(MAX_REGION_BLOCKS));

    CHECK_EQUAL(plan.volumes.size(), 9u);
    CHECK_EQUAL(plan.volumes[0].address, 2u);
    for (uint32_t i = 1; i < 8; ++i)
        CHECK_EQUAL(plan.volumes[i].address, 61472u * i);
    CHECK_EQUAL(plan.volumes[8].address, 491776u);
    CHECK_EQUAL(plan.volumes[8].label.capacity, 20480u);

    for (size_t i = 0; i < plan.volumes.size(); ++i)
    {
        auto& volume = plan.volumes[i];
        CHECK_EQUAL(ml.virtual_volumes[i].logical_address, volume.address);
        CHECK(volume.has_fat);
        CHECK_EQUAL(volume.label.allocation_unit, DEFAULT_ALLOCATION_UNIT);
        CHECK_EQUAL(volume.fat.first_data_physical, volume.address + volume.fat.first_data_logical);
        CHECK(volume.address + volume.label.capacity <= plan.total_sectors);
    }
}

static void SmallDiskPlan()
{
    auto plan = PlanImage(SmallDiskConfig());

    CHECK_EQUAL(plan.total_sectors, 119000u);
    CHECK_EQUAL(plan.master.available_media.size(), 2u);
    CHECK_EQUAL(plan.master.available_media[0].block_count, 65450u);
    CHECK_EQUAL(plan.master.available_media[1].block_count, 53550u);

    CHECK_EQUAL(plan.volumes[0].address, 2u);
    CHECK_EQUAL(plan.volumes[1].address, 60002u);
    CHECK_EQUAL(plan.volumes[2].address, 118455u);

    auto& maint = plan.volumes[2];
    CHECK(!maint.has_fat);
    CHECK_EQUAL(maint.label.label_type, 0x4d);
    CHECK_EQUAL(maint.label.allocation_unit, 4);
}

static void TooLargeVolume()
{
    PlanConfig config;
    config.geometry.cyls = 3800;
    config.volumes.push_back(Volume("BIG", 81920));

    auto e = EXPECT_ERROR(volume_too_large, PlanImage(config));
    CHECK_EQUAL(e.name, std::string("BIG"));
}

static void GeometryLimits()
{
    PlanConfig config;
    config.volumes.push_back(Volume("A", 1000));

    config.geometry.cyls = 4000;        // 544000 sectors
    CHECK_THROWS(PlanImage(config), geometry_too_large);

    config.geometry.cyls = 0;
    CHECK_THROWS(PlanImage(config), geometry_error);

    config.geometry.cyls = 100;
    config.geometry.heads = 256;
    CHECK_THROWS(PlanImage(config), geometry_error);
}

static void DiskFull()
{
    PlanConfig config;
    config.geometry.cyls = 10;          // 1360 sectors
    config.volumes.push_back(Volume("A", 1000));
    config.volumes.push_back(Volume("B", 400));

    auto e = EXPECT_ERROR(capacity_exceeded, PlanImage(config));
    CHECK_EQUAL(e.name, std::string("B"));

    config.volumes.back().sectors = 358;
    PlanImage(config);
}

static void ConfigValidation()
{
    auto config = SmallDiskConfig();
    config.boot_volume = 3;
    auto e = EXPECT_ERROR(volume_index_error, PlanImage(config));
    CHECK_EQUAL(e.count, 3);

    config.boot_volume = 0;
    config.label_revision = 4;
    CHECK_THROWS(PlanImage(config), invariant_violation);

    config.label_revision = DEFAULT_LABEL_REVISION;
    config.volumes.clear();
    CHECK_THROWS(PlanImage(config), geometry_error);
}

static void BootVolumeIpl()
{
    auto config = SmallDiskConfig();
    auto& ipl = config.volumes[1].ipl;
    ipl.disk_address = 60040;
    ipl.load_address = 0x60;
    ipl.load_length = 0x40;
    ipl.code_entry = 0x00600000;
    config.boot_volume = 1;

    // Loaders on the other volumes are not carried into the image
    config.volumes[0].ipl.disk_address = 40;
    config.volumes[0].ipl.load_length = 0x20;
    config.volumes[2].ipl.code_entry = 0x00500000;

    auto plan = PlanImage(config);
    CHECK(plan.master.ipl == ipl);
    CHECK_EQUAL(plan.master.primary_boot_volume, 1);
    CHECK(plan.volumes[1].label.ipl == ipl);
    CHECK(plan.volumes[0].label.ipl.empty());
    CHECK(plan.volumes[2].label.ipl.empty());

    auto image = BuildImage(plan);
    CHECK(DecodeVolumeLabel(image, plan.volumes[0].address).ipl.empty());
    CHECK(DecodeVolumeLabel(image, plan.volumes[1].address).ipl == ipl);
}

static void BuiltImage()
{
    auto config = SmallDiskConfig();
    auto plan = PlanImage(config);
    auto image = BuildImage(plan);

    CHECK_EQUAL(image.size(), 119000 * SECTOR_SIZE);
    CHECK(DecodeMasterLabel(image) == plan.master);

    for (auto& volume : plan.volumes)
    {
        CHECK(DecodeVolumeLabel(image, volume.address) == volume.label);

        // Everything after the label is left blank for formatting
        auto data = image.begin() + (volume.address + 1) * SECTOR_SIZE;
        CHECK(std::all_of(data, data + SECTOR_SIZE, [](uint8_t b) { return b == 0; }));
    }

    CHECK(BuildImage(config) == image);
}

int main()
{
    return RunTests({
        { "MiB volume sizes", MiBConversion },
        { "media region chunks", RegionChunks },
        { "cylinder alignment", CylinderAlignment },
        { "aligned 9 volume plan", LargeDiskPlan },
        { "plan with maintenance volume", SmallDiskPlan },
        { "oversized volume", TooLargeVolume },
        { "geometry limits", GeometryLimits },
        { "disk full", DiskFull },
        { "plan validation", ConfigValidation },
        { "boot volume IPL", BootVolumeIpl },
        { "built image", BuiltImage },
    });
}
