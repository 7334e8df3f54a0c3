#pragma once

// Victor 9000 hard disk labels
//
// Sectors 0-1 hold the master label: drive identity, the boot ROM's IPL vector,
// controller parameters, then variable-length lists of available media regions,
// working media regions and virtual volume addresses. Each virtual volume starts
// with its own one-sector label, which is also the sector the ROM boots from.

const int LABEL_SECTORS = 2;
const int MASTER_LABEL_SIZE = LABEL_SECTORS * SECTOR_SIZE;

const int MAX_REGION_BLOCKS = 0xffff;       // 16-bit block counter in the ROM
const int MAX_ADDRESS_SECTORS = 0x80000;    // 21-bit address fields; totals must stay below this
const int MAX_VOLUME_SECTORS = 0xffff;

const int LABEL_TYPE_QUALIFIED = 0x01;
const int LABEL_TYPE_MSDOS_REVISION = 0x02; // required by the MS-DOS hdsetup loader

const int VOLUME_TYPE_MSDOS = 1;


struct V9K_IPL_VECTOR
{
    uint8_t abDiskAddress[4];       // sector of the boot code
    uint8_t abLoadAddress[2];       // paragraph to load at
    uint8_t abLoadLength[2];        // length in paragraphs
    uint8_t abCodeEntry[4];         // segment:offset entry point
};

// Controller words are big-endian, unlike everything else in the label
struct V9K_CONTROL_PARAMS
{
    uint8_t abCylinders[2];
    uint8_t bHeads;
    uint8_t abReducedCurrent[2];    // first reduced write current cylinder
    uint8_t abWritePrecomp[2];      // first write precompensation cylinder
    uint8_t bEccBurst;              // ECC data burst length
    uint8_t bFastStep;              // fast step control
    uint8_t bInterleave;
    uint8_t abSpare[6];
};

struct V9K_DISK_LABEL
{
    uint8_t abLabelType[2];         // b0 = qualified, b1 = MS-DOS revision
    uint8_t abDeviceId[2];
    uint8_t abSerial[16];           // ASCII, space or NUL padded
    uint8_t abSectorSize[2];
    V9K_IPL_VECTOR ipl;
    uint8_t abPrimaryBootVolume[2];
    V9K_CONTROL_PARAMS control;
    // followed by: available media list, working media list, virtual volume list
};

struct V9K_MEDIA_REGION
{
    uint8_t abAddress[4];           // physical sector
    uint8_t abBlocks[4];            // sector count, below 65536
};

struct V9K_VOLUME_ENTRY
{
    uint8_t abAddress[4];           // logical sector of the volume label
};

struct V9K_VOLUME_LABEL
{
    uint8_t abLabelType[2];         // 1 = MS-DOS
    uint8_t abName[16];
    V9K_IPL_VECTOR ipl;
    uint8_t abCapacity[4];          // sectors, including this label
    uint8_t abDataStart[4];         // first sector after the label
    uint8_t abHostBlockSize[2];
    uint8_t abAllocationUnit[2];    // sectors per cluster
    uint8_t abDirEntries[2];        // root directory entries
    uint8_t abReserved[16];
    // followed by: configuration assignment count and entries
};

struct V9K_ASSIGNMENT
{
    uint8_t abDeviceUnit[2];
    uint8_t abVolumeIndex[2];
};

static_assert(sizeof(V9K_IPL_VECTOR) == 12, "IPL vector size");
static_assert(sizeof(V9K_CONTROL_PARAMS) == 16, "controller parameter size");
static_assert(sizeof(V9K_DISK_LABEL) == 52, "disk label header size");
static_assert(sizeof(V9K_MEDIA_REGION) == 8, "media region size");
static_assert(sizeof(V9K_VOLUME_ENTRY) == 4, "volume entry size");
static_assert(sizeof(V9K_VOLUME_LABEL) == 60, "volume label header size");
static_assert(sizeof(V9K_ASSIGNMENT) == 4, "assignment size");


struct IplVector
{
    uint32_t disk_address = 0;
    uint16_t load_address = 0;
    uint16_t load_length = 0;
    uint32_t code_entry = 0;

    bool empty() const { return !disk_address && !load_address && !load_length && !code_entry; }
};

bool operator==(const IplVector& a, const IplVector& b);
inline bool operator!=(const IplVector& a, const IplVector& b) { return !(a == b); }

struct ControllerParams
{
    uint16_t cyls = 0;
    uint8_t heads = 0;
    uint16_t reduced_current = 0;
    uint16_t write_precomp = 0;
    uint8_t ecc_burst = 0;
    uint8_t fast_step = 0;
    uint8_t interleave = 0;
    std::array<uint8_t, 6> spare{};
};

bool operator==(const ControllerParams& a, const ControllerParams& b);

struct MediaRegion
{
    uint32_t physical_address = 0;
    uint32_t block_count = 0;
};

inline bool operator==(const MediaRegion& a, const MediaRegion& b)
{
    return a.physical_address == b.physical_address && a.block_count == b.block_count;
}

struct VolumeDirectoryEntry
{
    uint32_t logical_address = 0;
};

inline bool operator==(const VolumeDirectoryEntry& a, const VolumeDirectoryEntry& b)
{
    return a.logical_address == b.logical_address;
}

struct MasterLabel
{
    uint16_t label_type = LABEL_TYPE_MSDOS_REVISION;
    uint16_t device_id = 0;
    std::array<uint8_t, 16> serial_number{};
    uint16_t sector_size = SECTOR_SIZE;
    IplVector ipl{};
    uint16_t primary_boot_volume = 0;
    ControllerParams controller{};
    std::vector<MediaRegion> available_media{};
    std::vector<MediaRegion> working_media{};
    std::vector<VolumeDirectoryEntry> virtual_volumes{};
    Data extra{};   // bytes after the volume list, trailing zeros removed

    std::string serial() const;
    void set_serial(const std::string& serial);
    int encoded_size() const;
};

bool operator==(const MasterLabel& a, const MasterLabel& b);
inline bool operator!=(const MasterLabel& a, const MasterLabel& b) { return !(a == b); }

struct ConfigurationAssignment
{
    uint16_t device_unit = 0;
    uint16_t volume_index = 0;
};

inline bool operator==(const ConfigurationAssignment& a, const ConfigurationAssignment& b)
{
    return a.device_unit == b.device_unit && a.volume_index == b.volume_index;
}

struct VolumeLabel
{
    uint16_t label_type = VOLUME_TYPE_MSDOS;
    std::array<uint8_t, 16> name{};
    IplVector ipl{};
    uint32_t capacity = 0;
    uint32_t data_start = 1;
    uint16_t host_block_size = SECTOR_SIZE;
    uint16_t allocation_unit = 0;
    uint16_t directory_entries = 0;
    std::array<uint8_t, 16> reserved{};
    std::vector<ConfigurationAssignment> assignments{};  // owned by the configuration tool
    Data extra{};   // boot area after the assignments, trailing zeros removed

    bool is_msdos() const { return label_type == VOLUME_TYPE_MSDOS; }
    std::string volume_name() const;
    void set_name(const std::string& name);
    int encoded_size() const;
};

bool operator==(const VolumeLabel& a, const VolumeLabel& b);
inline bool operator!=(const VolumeLabel& a, const VolumeLabel& b) { return !(a == b); }


MasterLabel DecodeMasterLabel(const Data& image);
Data EncodeMasterLabel(const MasterLabel& label);
void ValidateMasterLabel(const MasterLabel& label);

VolumeLabel DecodeVolumeLabel(const Data& image, uint32_t sector);
Data EncodeVolumeLabel(const VolumeLabel& label);
void ValidateVolumeLabel(const VolumeLabel& label);

uint32_t TotalBlocks(const std::vector<MediaRegion>& regions);
std::string LabelTypeString(uint16_t label_type);
std::string VolumeTypeString(uint16_t label_type);
