// Victor 9000 master and volume label encoding

#include "V9Kdisk.h"
#include "Label.h"

static IplVector ReadIpl(const V9K_IPL_VECTOR& ipl)
{
    IplVector v;
    v.disk_address = util::le_value(ipl.abDiskAddress);
    v.load_address = util::le_value(ipl.abLoadAddress);
    v.load_length = util::le_value(ipl.abLoadLength);
    v.code_entry = util::le_value(ipl.abCodeEntry);
    return v;
}

static void WriteIpl(V9K_IPL_VECTOR& ipl, const IplVector& v)
{
    util::set_le_value(ipl.abDiskAddress, v.disk_address);
    util::set_le_value(ipl.abLoadAddress, v.load_address);
    util::set_le_value(ipl.abLoadLength, v.load_length);
    util::set_le_value(ipl.abCodeEntry, v.code_entry);
}

// Fixed-width text fields are padded with NULs or spaces
static std::string FieldString(const std::array<uint8_t, 16>& field)
{
    std::string s(field.begin(), std::find(field.begin(), field.end(), 0));
    return util::trim(s);
}

static void SetFieldString(std::array<uint8_t, 16>& field, const std::string& str, const char* name)
{
    if (str.size() > field.size())
        throw invariant_violation(util::make_string(name, " length"), field.size(), str.size());

    field.fill(0);
    std::copy(str.begin(), str.end(), field.begin());
}

// Trailing zeros are padding, not content
static Data TrimmedTail(const Data& buf, int pos, int end)
{
    while (end > pos && !buf[end - 1])
        --end;
    return Data(buf.begin() + pos, buf.begin() + end);
}


bool operator==(const IplVector& a, const IplVector& b)
{
    return a.disk_address == b.disk_address && a.load_address == b.load_address &&
        a.load_length == b.load_length && a.code_entry == b.code_entry;
}

bool operator==(const ControllerParams& a, const ControllerParams& b)
{
    return a.cyls == b.cyls && a.heads == b.heads &&
        a.reduced_current == b.reduced_current && a.write_precomp == b.write_precomp &&
        a.ecc_burst == b.ecc_burst && a.fast_step == b.fast_step &&
        a.interleave == b.interleave && a.spare == b.spare;
}

bool operator==(const MasterLabel& a, const MasterLabel& b)
{
    return a.label_type == b.label_type && a.device_id == b.device_id &&
        a.serial_number == b.serial_number && a.sector_size == b.sector_size &&
        a.ipl == b.ipl && a.primary_boot_volume == b.primary_boot_volume &&
        a.controller == b.controller && a.available_media == b.available_media &&
        a.working_media == b.working_media && a.virtual_volumes == b.virtual_volumes &&
        a.extra == b.extra;
}

bool operator==(const VolumeLabel& a, const VolumeLabel& b)
{
    return a.label_type == b.label_type && a.name == b.name && a.ipl == b.ipl &&
        a.capacity == b.capacity && a.data_start == b.data_start &&
        a.host_block_size == b.host_block_size && a.allocation_unit == b.allocation_unit &&
        a.directory_entries == b.directory_entries && a.reserved == b.reserved &&
        a.assignments == b.assignments && a.extra == b.extra;
}


std::string MasterLabel::serial() const
{
    return FieldString(serial_number);
}

void MasterLabel::set_serial(const std::string& serial)
{
    SetFieldString(serial_number, serial, "serial number");
}

int MasterLabel::encoded_size() const
{
    return static_cast<int>(sizeof(V9K_DISK_LABEL)) +
        1 + static_cast<int>(available_media.size() * sizeof(V9K_MEDIA_REGION)) +
        1 + static_cast<int>(working_media.size() * sizeof(V9K_MEDIA_REGION)) +
        1 + static_cast<int>(virtual_volumes.size() * sizeof(V9K_VOLUME_ENTRY)) +
        extra.size();
}

std::string VolumeLabel::volume_name() const
{
    return FieldString(name);
}

void VolumeLabel::set_name(const std::string& name_)
{
    SetFieldString(name, name_, "volume name");
}

int VolumeLabel::encoded_size() const
{
    return static_cast<int>(sizeof(V9K_VOLUME_LABEL)) +
        1 + static_cast<int>(assignments.size() * sizeof(V9K_ASSIGNMENT)) +
        extra.size();
}


uint32_t TotalBlocks(const std::vector<MediaRegion>& regions)
{
    return std::accumulate(regions.begin(), regions.end(), uint32_t(0),
        [](uint32_t sum, const MediaRegion& r) { return sum + r.block_count; });
}

std::string LabelTypeString(uint16_t label_type)
{
    std::string s;
    if (label_type & LABEL_TYPE_QUALIFIED)
        s += "qualified";
    if (label_type & LABEL_TYPE_MSDOS_REVISION)
        s += s.empty() ? "MS-DOS revision" : ", MS-DOS revision";
    if (label_type & ~(LABEL_TYPE_QUALIFIED | LABEL_TYPE_MSDOS_REVISION))
        s += util::fmt("%sflags %04X", s.empty() ? "" : ", ", label_type);
    return s.empty() ? "none" : s;
}

std::string VolumeTypeString(uint16_t label_type)
{
    switch (label_type)
    {
    case VOLUME_TYPE_MSDOS: return "MS-DOS";
    case 0:                 return "undefined";
    }
    return util::fmt("type %u", label_type);
}

///////////////////////////////////////////////////////////////////////////////

static std::vector<MediaRegion> ReadRegionList(const Data& label, int& pos, const char* list_name)
{
    std::vector<MediaRegion> regions;

    auto count = label[pos];
    auto end = pos + 1 + count * static_cast<int>(sizeof(V9K_MEDIA_REGION));
    if (end > MASTER_LABEL_SIZE)
        throw format_error(pos, list_name, " count ", static_cast<int>(count), " runs past the end of the label");

    ++pos;
    for (int i = 0; i < count; ++i)
    {
        V9K_MEDIA_REGION r;
        memcpy(&r, label.data() + pos, sizeof(r));
        pos += sizeof(r);

        MediaRegion region;
        region.physical_address = util::le_value(r.abAddress);
        region.block_count = util::le_value(r.abBlocks);
        regions.push_back(region);
    }

    return regions;
}

MasterLabel DecodeMasterLabel(const Data& image)
{
    if (image.size() < MASTER_LABEL_SIZE)
        throw format_error(image.size(), "image is too short for a master label (", MASTER_LABEL_SIZE, " bytes needed)");

    Data label(image.begin(), image.begin() + MASTER_LABEL_SIZE);

    V9K_DISK_LABEL dl;
    memcpy(&dl, label.data(), sizeof(dl));

    MasterLabel ml;
    ml.label_type = util::le_value(dl.abLabelType);
    ml.device_id = util::le_value(dl.abDeviceId);
    std::copy(std::begin(dl.abSerial), std::end(dl.abSerial), ml.serial_number.begin());
    ml.sector_size = util::le_value(dl.abSectorSize);
    ml.ipl = ReadIpl(dl.ipl);
    ml.primary_boot_volume = util::le_value(dl.abPrimaryBootVolume);

    if (ml.sector_size != SECTOR_SIZE)
        throw format_error(offsetof(V9K_DISK_LABEL, abSectorSize), "unsupported sector size (", ml.sector_size, ")");

    auto& cp = dl.control;
    ml.controller.cyls = util::be_value(cp.abCylinders);
    ml.controller.heads = cp.bHeads;
    ml.controller.reduced_current = util::be_value(cp.abReducedCurrent);
    ml.controller.write_precomp = util::be_value(cp.abWritePrecomp);
    ml.controller.ecc_burst = cp.bEccBurst;
    ml.controller.fast_step = cp.bFastStep;
    ml.controller.interleave = cp.bInterleave;
    std::copy(std::begin(cp.abSpare), std::end(cp.abSpare), ml.controller.spare.begin());

    int pos = sizeof(V9K_DISK_LABEL);
    ml.available_media = ReadRegionList(label, pos, "available media");

    if (pos >= MASTER_LABEL_SIZE)
        throw format_error(pos, "working media list is missing");
    ml.working_media = ReadRegionList(label, pos, "working media");

    if (pos >= MASTER_LABEL_SIZE)
        throw format_error(pos, "virtual volume list is missing");

    auto count = label[pos];
    if (pos + 1 + count * static_cast<int>(sizeof(V9K_VOLUME_ENTRY)) > MASTER_LABEL_SIZE)
        throw format_error(pos, "virtual volume count ", static_cast<int>(count), " runs past the end of the label");

    ++pos;
    for (int i = 0; i < count; ++i)
    {
        V9K_VOLUME_ENTRY e;
        memcpy(&e, label.data() + pos, sizeof(e));
        pos += sizeof(e);

        VolumeDirectoryEntry entry;
        entry.logical_address = util::le_value(e.abAddress);
        ml.virtual_volumes.push_back(entry);
    }

    ml.extra = TrimmedTail(label, pos, MASTER_LABEL_SIZE);
    return ml;
}


void ValidateMasterLabel(const MasterLabel& ml)
{
    if (ml.sector_size != SECTOR_SIZE)
        throw invariant_violation("sector_size", SECTOR_SIZE, ml.sector_size);

    auto check_list = [](const std::vector<MediaRegion>& regions, const std::string& name)
    {
        if (regions.size() > 0xff)
            throw invariant_violation(name + " count", 0xff, regions.size());

        for (size_t i = 0; i < regions.size(); ++i)
        {
            if (regions[i].block_count > static_cast<uint32_t>(MAX_REGION_BLOCKS))
                throw invariant_violation(util::make_string(name, "[", i, "].block_count"), MAX_REGION_BLOCKS, regions[i].block_count);
        }

        // Sum in 64 bits so a huge list can't wrap back under the limit
        int64_t total = 0;
        for (auto& r : regions)
            total += r.block_count;

        if (total >= MAX_ADDRESS_SECTORS)
            throw invariant_violation(name + " total blocks", MAX_ADDRESS_SECTORS - 1, total);
    };

    check_list(ml.available_media, "available_media");
    check_list(ml.working_media, "working_media");

    if (ml.virtual_volumes.size() > 0xff)
        throw invariant_violation("virtual_volumes count", 0xff, ml.virtual_volumes.size());

    for (size_t i = 0; i < ml.virtual_volumes.size(); ++i)
    {
        auto address = ml.virtual_volumes[i].logical_address;
        if (address >= static_cast<uint32_t>(MAX_ADDRESS_SECTORS))
            throw invariant_violation(util::make_string("virtual_volumes[", i, "].logical_address"), MAX_ADDRESS_SECTORS - 1, address);
    }

    if (ml.encoded_size() > MASTER_LABEL_SIZE)
        throw invariant_violation("master label size", MASTER_LABEL_SIZE, ml.encoded_size());
}

Data EncodeMasterLabel(const MasterLabel& ml)
{
    ValidateMasterLabel(ml);

    V9K_DISK_LABEL dl{};
    util::set_le_value(dl.abLabelType, ml.label_type);
    util::set_le_value(dl.abDeviceId, ml.device_id);
    std::copy(ml.serial_number.begin(), ml.serial_number.end(), dl.abSerial);
    util::set_le_value(dl.abSectorSize, ml.sector_size);
    WriteIpl(dl.ipl, ml.ipl);
    util::set_le_value(dl.abPrimaryBootVolume, ml.primary_boot_volume);

    auto& cp = dl.control;
    util::set_be_value(cp.abCylinders, ml.controller.cyls);
    cp.bHeads = ml.controller.heads;
    util::set_be_value(cp.abReducedCurrent, ml.controller.reduced_current);
    util::set_be_value(cp.abWritePrecomp, ml.controller.write_precomp);
    cp.bEccBurst = ml.controller.ecc_burst;
    cp.bFastStep = ml.controller.fast_step;
    cp.bInterleave = ml.controller.interleave;
    std::copy(ml.controller.spare.begin(), ml.controller.spare.end(), cp.abSpare);

    Data label(MASTER_LABEL_SIZE);
    memcpy(label.data(), &dl, sizeof(dl));
    auto pos = static_cast<int>(sizeof(dl));

    for (auto regions : { &ml.available_media, &ml.working_media })
    {
        label[pos++] = static_cast<uint8_t>(regions->size());
        for (auto& region : *regions)
        {
            V9K_MEDIA_REGION r{};
            util::set_le_value(r.abAddress, region.physical_address);
            util::set_le_value(r.abBlocks, region.block_count);
            memcpy(label.data() + pos, &r, sizeof(r));
            pos += sizeof(r);
        }
    }

    label[pos++] = static_cast<uint8_t>(ml.virtual_volumes.size());
    for (auto& entry : ml.virtual_volumes)
    {
        V9K_VOLUME_ENTRY e{};
        util::set_le_value(e.abAddress, entry.logical_address);
        memcpy(label.data() + pos, &e, sizeof(e));
        pos += sizeof(e);
    }

    std::copy(ml.extra.begin(), ml.extra.end(), label.begin() + pos);
    return label;
}

///////////////////////////////////////////////////////////////////////////////

VolumeLabel DecodeVolumeLabel(const Data& image, uint32_t sector)
{
    auto offset = static_cast<int64_t>(sector) * SECTOR_SIZE;
    if (offset + SECTOR_SIZE > image.size())
        throw format_error(static_cast<size_t>(offset), "volume label at sector ", sector, " is beyond the end of the image");

    Data label(image.begin() + static_cast<size_t>(offset), image.begin() + static_cast<size_t>(offset) + SECTOR_SIZE);

    V9K_VOLUME_LABEL vl;
    memcpy(&vl, label.data(), sizeof(vl));

    VolumeLabel v;
    v.label_type = util::le_value(vl.abLabelType);
    std::copy(std::begin(vl.abName), std::end(vl.abName), v.name.begin());
    v.ipl = ReadIpl(vl.ipl);
    v.capacity = util::le_value(vl.abCapacity);
    v.data_start = util::le_value(vl.abDataStart);
    v.host_block_size = util::le_value(vl.abHostBlockSize);
    v.allocation_unit = util::le_value(vl.abAllocationUnit);
    v.directory_entries = util::le_value(vl.abDirEntries);
    std::copy(std::begin(vl.abReserved), std::end(vl.abReserved), v.reserved.begin());

    if (v.is_msdos() && v.host_block_size != SECTOR_SIZE)
    {
        throw format_error(static_cast<size_t>(offset) + offsetof(V9K_VOLUME_LABEL, abHostBlockSize),
            "unsupported host block size (", v.host_block_size, ")");
    }

    int pos = sizeof(V9K_VOLUME_LABEL);
    auto count = label[pos];
    if (pos + 1 + count * static_cast<int>(sizeof(V9K_ASSIGNMENT)) > SECTOR_SIZE)
    {
        throw format_error(static_cast<size_t>(offset) + pos, "configuration assignment count ",
            static_cast<int>(count), " runs past the end of the volume label");
    }

    ++pos;
    for (int i = 0; i < count; ++i)
    {
        V9K_ASSIGNMENT a;
        memcpy(&a, label.data() + pos, sizeof(a));
        pos += sizeof(a);

        ConfigurationAssignment assignment;
        assignment.device_unit = util::le_value(a.abDeviceUnit);
        assignment.volume_index = util::le_value(a.abVolumeIndex);
        v.assignments.push_back(assignment);
    }

    v.extra = TrimmedTail(label, pos, SECTOR_SIZE);
    return v;
}

void ValidateVolumeLabel(const VolumeLabel& v)
{
    if (v.capacity > static_cast<uint32_t>(MAX_VOLUME_SECTORS))
        throw invariant_violation("capacity", MAX_VOLUME_SECTORS, v.capacity);

    if (v.is_msdos() && v.host_block_size != SECTOR_SIZE)
        throw invariant_violation("host_block_size", SECTOR_SIZE, v.host_block_size);

    if (v.assignments.size() > 0xff)
        throw invariant_violation("assignments count", 0xff, v.assignments.size());

    if (v.encoded_size() > SECTOR_SIZE)
        throw invariant_violation("volume label size", SECTOR_SIZE, v.encoded_size());
}

Data EncodeVolumeLabel(const VolumeLabel& v)
{
    ValidateVolumeLabel(v);

    V9K_VOLUME_LABEL vl{};
    util::set_le_value(vl.abLabelType, v.label_type);
    std::copy(v.name.begin(), v.name.end(), vl.abName);
    WriteIpl(vl.ipl, v.ipl);
    util::set_le_value(vl.abCapacity, v.capacity);
    util::set_le_value(vl.abDataStart, v.data_start);
    util::set_le_value(vl.abHostBlockSize, v.host_block_size);
    util::set_le_value(vl.abAllocationUnit, v.allocation_unit);
    util::set_le_value(vl.abDirEntries, v.directory_entries);
    std::copy(v.reserved.begin(), v.reserved.end(), vl.abReserved);

    Data label(SECTOR_SIZE);
    memcpy(label.data(), &vl, sizeof(vl));
    auto pos = static_cast<int>(sizeof(vl));

    label[pos++] = static_cast<uint8_t>(v.assignments.size());
    for (auto& assignment : v.assignments)
    {
        V9K_ASSIGNMENT a{};
        util::set_le_value(a.abDeviceUnit, assignment.device_unit);
        util::set_le_value(a.abVolumeIndex, assignment.volume_index);
        memcpy(label.data() + pos, &a, sizeof(a));
        pos += sizeof(a);
    }

    std::copy(v.extra.begin(), v.extra.end(), label.begin() + pos);
    return label;
}
