// Volume extract and insert tests

#include "TestRunner.h"
#include "ImageBuilder.h"
#include "VolumeTranscoder.h"
#include "bpb.h"

static Data SampleImage()
{
    PlanConfig config;
    config.geometry.cyls = 700;
    config.geometry.heads = 10;

    VolumeRequest system, data, maint;
    system.name = "System";
    system.sectors = 60000;
    data.name = "Data";
    data.sectors = 58453;
    maint.name = "MAINT";
    maint.sectors = 528;
    maint.label_type = 0x4d;
    config.volumes = { system, data, maint };

    auto image = BuildImage(config);

    // Some recognisable content in the second volume's data area
    auto offset = (60002 + 100) * SECTOR_SIZE;
    for (int i = 0; i < SECTOR_SIZE; ++i)
        image[offset + i] = static_cast<uint8_t>(i);

    return image;
}

static void ExtractedBootSector()
{
    auto image = SampleImage();
    auto volume = ExtractVolumeData(image, 1);
    CHECK_EQUAL(volume.size(), 58453 * SECTOR_SIZE);

    auto info = ReadBootSector(volume);
    CHECK_EQUAL(info.oem_name, std::string("MSDOS3.1"));
    CHECK_EQUAL(info.bytes_per_sector, SECTOR_SIZE);
    CHECK_EQUAL(info.sectors_per_cluster, 64);
    CHECK_EQUAL(info.reserved_sectors, 1);
    CHECK_EQUAL(info.fat_count, 2);
    CHECK_EQUAL(info.root_entries, 512);
    CHECK_EQUAL(info.total_sectors, 58453u);
    CHECK_EQUAL(info.media, 0xf8);
    CHECK_EQUAL(info.sectors_per_track, 17);
    CHECK_EQUAL(info.heads, 10);
    CHECK_EQUAL(info.hidden_sectors, 60002u);
    CHECK(info.extended);
    CHECK_EQUAL(info.volume_label, std::string("DATA"));
    CHECK_EQUAL(info.fs_type, std::string("FAT12"));

    auto fat = VolumeFatGeometry(DecodeVolumeLabel(image, 60002), 60002);
    CHECK_EQUAL(info.fat_sectors, fat.fat_sectors);

    // The rest of the volume is copied as-is
    CHECK(std::equal(volume.begin() + SECTOR_SIZE, volume.end(), image.begin() + 60003 * SECTOR_SIZE));
    CHECK_EQUAL(volume[100 * SECTOR_SIZE + 7], 7);
}

static void RepeatableExtract()
{
    auto image = SampleImage();
    CHECK(ExtractVolumeData(image, 0) == ExtractVolumeData(image, 0));

    auto v0 = ReadBootSector(ExtractVolumeData(image, 0));
    auto v1 = ReadBootSector(ExtractVolumeData(image, 1));
    CHECK(v0.volume_id != v1.volume_id);
}

static void UnchangedRoundTrip()
{
    auto image = SampleImage();
    for (int index : { 0, 1 })
    {
        auto volume = ExtractVolumeData(image, index);
        CHECK(InsertVolumeData(image, index, volume) == image);
    }
}

static void InsertEditedVolume()
{
    auto image = SampleImage();
    auto volume = ExtractVolumeData(image, 1);

    auto fat = VolumeFatGeometry(DecodeVolumeLabel(image, 60002), 60002);
    auto dir = fat.directory_offset();
    memcpy(volume.data() + dir, "README  TXT", 11);
    volume[volume.size() - 1] = 0x5a;

    auto output = InsertVolumeData(image, 1, volume);
    CHECK_EQUAL(output.size(), image.size());

    // Only the volume's data sectors change
    auto start = 60002 * SECTOR_SIZE;
    for (size_t i = 0; i < output.size(); ++i)
    {
        if (output[i] != image[i])
        {
            CHECK(i >= static_cast<size_t>(start + SECTOR_SIZE));
            CHECK(i < static_cast<size_t>(start) + volume.size());
        }
    }

    CHECK_EQUAL(output[start + dir], 'R');
    CHECK_EQUAL(output[start + volume.size() - 1], 0x5a);
    CHECK(DecodeMasterLabel(output) == DecodeMasterLabel(image));
    CHECK(DecodeVolumeLabel(output, 60002) == DecodeVolumeLabel(image, 60002));
    CHECK(ExtractVolumeData(output, 1) == volume);
}

// A label the encoder would reject still round trips, as its sector is never rewritten
static void LabelSectorKept()
{
    auto image = SampleImage();
    auto label = image.data() + 2 * SECTOR_SIZE;

    V9K_VOLUME_LABEL vl;
    memcpy(&vl, label, sizeof(vl));
    util::set_le_value(vl.abCapacity, 70000);
    util::set_le_value(vl.abAllocationUnit, 128);
    memcpy(label, &vl, sizeof(vl));
    label[SECTOR_SIZE - 1] = 0xa5;
    CHECK_THROWS(EncodeVolumeLabel(DecodeVolumeLabel(image, 2)), invariant_violation);

    auto volume = ExtractVolumeData(image, 0);
    CHECK_EQUAL(volume.size(), 70000 * SECTOR_SIZE);
    CHECK_EQUAL(ReadBootSector(volume).total_sectors, 70000u);

    volume[volume.size() - 1] = 0x5a;
    auto output = InsertVolumeData(image, 0, volume);
    CHECK(std::equal(output.begin() + 2 * SECTOR_SIZE, output.begin() + 3 * SECTOR_SIZE, image.begin() + 2 * SECTOR_SIZE));
    CHECK_EQUAL(output[(2 + 70000) * SECTOR_SIZE - 1], 0x5a);
}

static void MismatchedGeometry()
{
    auto image = SampleImage();
    auto volume = ExtractVolumeData(image, 1);

    auto edited = volume;
    edited[offsetof(BIOS_PARAMETER_BLOCK, bSecPerClust)] = 32;
    auto e = EXPECT_ERROR(geometry_mismatch, InsertVolumeData(image, 1, edited));
    CHECK_EQUAL(e.field, std::string("sectors per cluster"));
    CHECK_EQUAL(e.expected, 64);
    CHECK_EQUAL(e.found, 32);

    edited = volume;
    edited.resize(volume.size() - SECTOR_SIZE);
    e = EXPECT_ERROR(geometry_mismatch, InsertVolumeData(image, 1, edited));
    CHECK_EQUAL(e.field, std::string("size"));

    edited = volume;
    edited[offsetof(BIOS_PARAMETER_BLOCK, abRootDirEnts) + 1] = 1;     // 256 entries
    e = EXPECT_ERROR(geometry_mismatch, InsertVolumeData(image, 1, edited));
    CHECK_EQUAL(e.field, std::string("root directory sectors"));

    // A volume formatted for the first volume doesn't fit the second
    CHECK_THROWS(InsertVolumeData(image, 1, ExtractVolumeData(image, 0)), geometry_mismatch);
}

static void NotABootSector()
{
    auto image = SampleImage();
    auto volume = ExtractVolumeData(image, 1);
    volume[511] = 0;

    auto e = EXPECT_ERROR(format_error, InsertVolumeData(image, 1, volume));
    CHECK_EQUAL(e.offset, 510u);

    CHECK_THROWS(ReadBootSector(Data(100)), format_error);
}

static void BadVolumeIndex()
{
    auto image = SampleImage();

    auto e = EXPECT_ERROR(volume_index_error, ExtractVolumeData(image, 3));
    CHECK_EQUAL(e.index, 3);
    CHECK_EQUAL(e.count, 3);
    CHECK_THROWS(ExtractVolumeData(image, -1), volume_index_error);
    CHECK_THROWS(InsertVolumeData(image, 5, Data(SECTOR_SIZE)), volume_index_error);
}

static void OpaqueVolume()
{
    auto image = SampleImage();
    auto e = EXPECT_ERROR(volume_type_error, ExtractVolumeData(image, 2));
    CHECK_EQUAL(e.type, 0x4d);
}

static void TruncatedImage()
{
    auto image = SampleImage();
    image.resize(100000 * SECTOR_SIZE);
    CHECK_THROWS(ExtractVolumeData(image, 1), format_error);
    ExtractVolumeData(image, 0);
}

int main()
{
    return RunTests({
        { "extracted boot sector", ExtractedBootSector },
        { "repeatable extract", RepeatableExtract },
        { "unchanged round trip", UnchangedRoundTrip },
        { "insert edited volume", InsertEditedVolume },
        { "label sector kept on insert", LabelSectorKept },
        { "mismatched geometry", MismatchedGeometry },
        { "missing boot signature", NotABootSector },
        { "volume index", BadVolumeIndex },
        { "opaque volume type", OpaqueVolume },
        { "truncated image", TruncatedImage },
    });
}
