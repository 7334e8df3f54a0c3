// Image inspection tests

#include "TestRunner.h"
#include "ImageBuilder.h"
#include "Inspector.h"

static Data SampleImage(int revision = DEFAULT_LABEL_REVISION)
{
    PlanConfig config;
    config.geometry.cyls = 700;
    config.geometry.heads = 10;
    config.label_revision = revision;
    config.serial = "chs 700,10,17";

    VolumeRequest system, data, maint;
    system.name = "SYSTEM";
    system.sectors = 60000;
    data.name = "DATA";
    data.sectors = 58453;
    maint.name = "MAINT";
    maint.sectors = 528;
    maint.label_type = 0x4d;
    config.volumes = { system, data, maint };

    return BuildImage(config);
}

static bool HasWarning(const DiskReport& report, const std::string& text)
{
    return std::any_of(report.warnings.begin(), report.warnings.end(),
        [&](const std::string& w) { return w.find(text) != std::string::npos; });
}

static void CleanImage()
{
    auto report = Inspect(SampleImage());

    CHECK_EQUAL(report.image_size, 119000 * SECTOR_SIZE);
    CHECK(report.warnings.empty());
    CHECK_EQUAL(report.master.serial(), std::string("chs 700,10,17"));
    CHECK_EQUAL(report.master.controller.cyls, 700);
    CHECK_EQUAL(TotalBlocks(report.master.available_media), 119000u);

    CHECK_EQUAL(report.volumes.size(), 3u);
    CHECK_EQUAL(report.volumes[0].address, 2u);
    CHECK_EQUAL(report.volumes[1].address, 60002u);
    CHECK_EQUAL(report.volumes[2].address, 118455u);
    CHECK_EQUAL(report.volumes[0].label.capacity, 60000u);
    CHECK_EQUAL(report.volumes[1].label.capacity, 58453u);
    CHECK_EQUAL(report.volumes[2].label.capacity, 528u);
    CHECK_EQUAL(report.volumes[1].label.volume_name(), std::string("DATA"));

    for (auto& vr : report.volumes)
    {
        CHECK(vr.decoded);
        CHECK(!vr.has_fat);
    }
}

static void VerboseGeometry()
{
    auto report = Inspect(SampleImage(), true);

    CHECK(report.volumes[0].has_fat);
    CHECK(report.volumes[1].has_fat);
    CHECK(!report.volumes[2].has_fat);
    CHECK(report.volumes[2].fat_error.empty());
    CHECK_EQUAL(report.volumes[1].fat.first_data_physical, 60002u + report.volumes[1].fat.first_data_logical);

    PrintReport(report, 2);
}

static std::string CaptureReport(const DiskReport& report, int verbose)
{
    std::ostringstream ss;
    auto screen = util::cout.screen;
    util::cout.screen = &ss;
    PrintReport(report, verbose);
    util::cout.screen = screen;
    return ss.str();
}

// Controller spare bytes and the rest of each volume label are shown when verbose
static void VerboseLabelFields()
{
    auto image = SampleImage();
    image[offsetof(V9K_DISK_LABEL, control) + offsetof(V9K_CONTROL_PARAMS, abSpare) + 5] = 0xc3;
    image[60002 * SECTOR_SIZE + offsetof(V9K_VOLUME_LABEL, abReserved)] = 0x7e;

    auto report = Inspect(image);
    CHECK_EQUAL(report.master.controller.spare[5], 0xc3);
    CHECK_EQUAL(report.volumes[1].label.reserved[0], 0x7e);

    auto text = CaptureReport(report, 1);
    CHECK(text.find("Spare:     00 00 00 00 00 C3") != std::string::npos);
    CHECK(text.find("Data start 1, host block 512, reserved 7E 00") != std::string::npos);
    CHECK(text.find("reserved 00 00 00 00 00 00 00 00 00 00 00 00 00 00 00 00") != std::string::npos);

    text = CaptureReport(report, 0);
    CHECK(text.find("Spare:") == std::string::npos);
    CHECK(text.find("Data start") == std::string::npos);
}

static void MissingRevisionBit()
{
    auto report = Inspect(SampleImage(LABEL_TYPE_QUALIFIED));
    CHECK_EQUAL(report.master.label_type, LABEL_TYPE_QUALIFIED);
    CHECK(HasWarning(report, "MS-DOS revision"));
}

static void RegionOverLimit()
{
    auto image = SampleImage();

    // First available region grows to 65536 blocks
    image[57] = 0x00;
    image[58] = 0x00;
    image[59] = 0x01;
    image[60] = 0x00;

    auto report = Inspect(image);
    CHECK_EQUAL(report.master.available_media[0].block_count, 65536u);
    CHECK(HasWarning(report, "available media region 0"));
    CHECK(HasWarning(report, "working media list differs"));
}

static void BadVolumeLabel()
{
    auto image = SampleImage();
    image[60002 * SECTOR_SIZE + 39] = 0x04;     // 1024-byte host blocks

    auto report = Inspect(image);
    CHECK(report.volumes[0].decoded);
    CHECK(!report.volumes[1].decoded);
    CHECK(!report.volumes[1].error.empty());
    CHECK(report.volumes[2].decoded);
    CHECK(HasWarning(report, "volume 1"));

    PrintReport(report);
}

static void BadAllocationUnit()
{
    auto image = SampleImage();
    image[2 * SECTOR_SIZE + 40] = 3;

    auto report = Inspect(image, true);
    CHECK(report.volumes[0].decoded);
    CHECK(!report.volumes[0].has_fat);
    CHECK(!report.volumes[0].fat_error.empty());
    CHECK(report.volumes[1].has_fat);
}

static void TruncatedImage()
{
    auto image = SampleImage();
    image.resize(100000 * SECTOR_SIZE + 100);

    auto report = Inspect(image);
    CHECK(HasWarning(report, "multiple of 512"));
    CHECK(HasWarning(report, "volume 1 extends beyond"));
    CHECK(!report.volumes[2].decoded);

    image.resize(1000);
    CHECK_THROWS(Inspect(image), format_error);
}

int main()
{
    return RunTests({
        { "clean image", CleanImage },
        { "verbose FAT geometry", VerboseGeometry },
        { "verbose label fields", VerboseLabelFields },
        { "missing MS-DOS revision bit", MissingRevisionBit },
        { "media region over limit", RegionOverLimit },
        { "undecodable volume label", BadVolumeLabel },
        { "bad allocation unit", BadAllocationUnit },
        { "truncated image", TruncatedImage },
    });
}
