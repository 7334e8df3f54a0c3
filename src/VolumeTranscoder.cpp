// Volume extraction to, and insertion from, standard FAT volume images

#include "V9Kdisk.h"
#include "VolumeTranscoder.h"
#include "ImagePlanner.h"
#include "bpb.h"

static std::string BootString(const uint8_t* pb, size_t len)
{
    std::string s(reinterpret_cast<const char*>(pb), len);
    return util::trim(s);
}

BootSectorInfo ReadBootSector(const Data& volume)
{
    if (volume.size() < SECTOR_SIZE)
        throw format_error(volume.size(), "volume image is too short for a boot sector");

    BOOT_SECTOR bs;
    memcpy(&bs, volume.data(), sizeof(bs));

    if (bs.abSignature[0] != 0x55 || bs.abSignature[1] != 0xaa)
        throw format_error(offsetof(BOOT_SECTOR, abSignature), "missing boot sector signature");

    auto& bpb = bs.bpb;
    BootSectorInfo info;
    info.oem_name = BootString(bpb.bOemName, sizeof(bpb.bOemName));
    info.bytes_per_sector = util::le_value(bpb.abBytesPerSec);
    info.sectors_per_cluster = bpb.bSecPerClust;
    info.reserved_sectors = util::le_value(bpb.abResSectors);
    info.fat_count = bpb.bFATs;
    info.root_entries = util::le_value(bpb.abRootDirEnts);
    info.total_sectors = util::le_value(bpb.abSectors);
    info.media = bpb.bMedia;
    info.fat_sectors = util::le_value(bpb.abFATSecs);
    info.sectors_per_track = util::le_value(bpb.abSecPerTrack);
    info.heads = util::le_value(bpb.abHeads);
    info.hidden_sectors = util::le_value(bpb.abHiddenSecs);

    if (!info.total_sectors)
        info.total_sectors = util::le_value(bpb.abLargeSecs);

    if (bpb.bBootSignature == EXTENDED_BOOT_SIGNATURE)
    {
        info.extended = true;
        info.volume_id = util::le_value(bpb.abVolumeId);
        info.volume_label = BootString(bpb.abVolumeLabel, sizeof(bpb.abVolumeLabel));
        info.fs_type = BootString(bpb.abFsType, sizeof(bpb.abFsType));
    }

    if (info.bytes_per_sector != SECTOR_SIZE)
        throw format_error(offsetof(BIOS_PARAMETER_BLOCK, abBytesPerSec), "unsupported bytes per sector (", info.bytes_per_sector, ")");

    return info;
}

// Sectors per track isn't stored in the label, so derive it from the media size
int SectorsPerTrack(const MasterLabel& master)
{
    auto cyl_heads = master.controller.cyls * master.controller.heads;
    auto total = TotalBlocks(master.available_media);

    if (cyl_heads && total && !(total % cyl_heads) && total / cyl_heads <= 0xff)
        return static_cast<int>(total / cyl_heads);

    return DEFAULT_SECTORS;
}

FatGeometry VolumeFatGeometry(const VolumeLabel& label, uint32_t address)
{
    FatParams params;
    params.capacity = label.capacity;
    params.allocation_unit = label.allocation_unit;
    params.root_entries = label.directory_entries;
    params.reserved_sectors = static_cast<int>(label.data_start);
    params.volume_address = address;
    return CalculateFatGeometry(params);
}

Data MakeBootSector(const MasterLabel& master, const VolumeLabel& label, uint32_t address, const FatGeometry& fat)
{
    BOOT_SECTOR bs{};
    auto& bpb = bs.bpb;

    static const uint8_t jump[] = { 0xeb, 0x3c, 0x90 };
    std::copy(std::begin(jump), std::end(jump), bpb.abJump);
    memcpy(bpb.bOemName, "MSDOS3.1", sizeof(bpb.bOemName));

    util::set_le_value(bpb.abBytesPerSec, SECTOR_SIZE);
    bpb.bSecPerClust = static_cast<uint8_t>(fat.allocation_unit);
    util::set_le_value(bpb.abResSectors, static_cast<uint32_t>(fat.reserved_sectors));
    bpb.bFATs = FAT_COPIES;
    util::set_le_value(bpb.abRootDirEnts, static_cast<uint32_t>(fat.directory_sectors * (SECTOR_SIZE / DIR_ENTRY_SIZE)));
    if (label.capacity > 0xffff)
        util::set_le_value(bpb.abLargeSecs, label.capacity);
    else
        util::set_le_value(bpb.abSectors, label.capacity);
    bpb.bMedia = MEDIA_FIXED_DISK;
    util::set_le_value(bpb.abFATSecs, static_cast<uint32_t>(fat.fat_sectors));
    util::set_le_value(bpb.abSecPerTrack, static_cast<uint32_t>(SectorsPerTrack(master)));
    util::set_le_value(bpb.abHeads, master.controller.heads ? master.controller.heads : 1u);
    util::set_le_value(bpb.abHiddenSecs, address);

    bpb.bDriveNumber = FIXED_DISK_DRIVE;
    bpb.bBootSignature = EXTENDED_BOOT_SIGNATURE;

    // Volume serial from its position and size, so repeated extractions match
    util::set_le_value(bpb.abVolumeId, (address << 16) ^ label.capacity);

    auto name = util::uppercase(label.volume_name());
    if (name.empty())
        name = "NO NAME";
    name.resize(sizeof(bpb.abVolumeLabel), ' ');
    memcpy(bpb.abVolumeLabel, name.data(), sizeof(bpb.abVolumeLabel));
    memcpy(bpb.abFsType, "FAT12   ", sizeof(bpb.abFsType));

    bs.abSignature[0] = 0x55;
    bs.abSignature[1] = 0xaa;

    Data sector(sizeof(bs));
    memcpy(sector.data(), &bs, sizeof(bs));
    return sector;
}


struct LocatedVolume
{
    MasterLabel master;
    VolumeLabel label;
    uint32_t address;
};

static LocatedVolume LocateVolume(const Data& image, int index)
{
    LocatedVolume v;
    v.master = DecodeMasterLabel(image);

    auto count = static_cast<int>(v.master.virtual_volumes.size());
    if (index < 0 || index >= count)
        throw volume_index_error(index, count);

    v.address = v.master.virtual_volumes[index].logical_address;
    v.label = DecodeVolumeLabel(image, v.address);

    if (!v.label.is_msdos())
        throw volume_type_error(index, v.label.label_type);

    if (v.label.capacity < 1)
        throw format_error(static_cast<size_t>(v.address) * SECTOR_SIZE, "volume ", index, " has no capacity");

    auto end_sector = static_cast<int64_t>(v.address) + v.label.capacity;
    if (end_sector * SECTOR_SIZE > image.size())
        throw format_error(static_cast<size_t>(image.size()), "volume ", index, " ends at sector ", end_sector, ", beyond the end of the image");

    return v;
}

Data ExtractVolumeData(const Data& image, int index)
{
    auto v = LocateVolume(image, index);
    auto fat = VolumeFatGeometry(v.label, v.address);

    auto begin = image.begin() + static_cast<size_t>(v.address) * SECTOR_SIZE;
    Data volume(begin, begin + static_cast<size_t>(v.label.capacity) * SECTOR_SIZE);

    auto boot = MakeBootSector(v.master, v.label, v.address, fat);
    std::copy(boot.begin(), boot.end(), volume.begin());
    return volume;
}

Data InsertVolumeData(const Data& image, int index, const Data& edited)
{
    auto v = LocateVolume(image, index);
    auto fat = VolumeFatGeometry(v.label, v.address);
    auto info = ReadBootSector(edited);

    auto expected_size = static_cast<int64_t>(v.label.capacity) * SECTOR_SIZE;
    if (edited.size() != expected_size)
        throw geometry_mismatch("size", expected_size, edited.size());
    if (info.sectors_per_cluster != fat.allocation_unit)
        throw geometry_mismatch("sectors per cluster", fat.allocation_unit, info.sectors_per_cluster);
    if (info.reserved_sectors != fat.reserved_sectors)
        throw geometry_mismatch("reserved sectors", fat.reserved_sectors, info.reserved_sectors);
    if (info.fat_count != FAT_COPIES)
        throw geometry_mismatch("FAT count", FAT_COPIES, info.fat_count);
    if (info.fat_sectors != fat.fat_sectors)
        throw geometry_mismatch("sectors per FAT", fat.fat_sectors, info.fat_sectors);
    if (info.directory_sectors() != fat.directory_sectors)
        throw geometry_mismatch("root directory sectors", fat.directory_sectors, info.directory_sectors());
    if (info.total_sectors != v.label.capacity)
        throw geometry_mismatch("total sectors", v.label.capacity, info.total_sectors);

    // The native label sector stays exactly as it was, everything after it is the edited content
    Data output(image);
    auto offset = static_cast<size_t>(v.address) * SECTOR_SIZE;
    std::copy(edited.begin() + SECTOR_SIZE, edited.end(), output.begin() + offset + SECTOR_SIZE);

    return output;
}
