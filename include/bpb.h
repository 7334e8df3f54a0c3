#pragma once

// Standard boot sector with BIOS Parameter Block, as written by MS-DOS 3.1+ and FAT tools

struct BIOS_PARAMETER_BLOCK
{
    uint8_t abJump[3];              // usually x86 jump (0xeb or 0xe9)
    uint8_t bOemName[8];            // OEM string

    uint8_t abBytesPerSec[2];       // bytes per sector
    uint8_t bSecPerClust;           // sectors per cluster
    uint8_t abResSectors[2];        // number of reserved sectors
    uint8_t bFATs;                  // number of FATs
    uint8_t abRootDirEnts[2];       // number of root directory entries
    uint8_t abSectors[2];           // total number of sectors
    uint8_t bMedia;                 // media descriptor
    uint8_t abFATSecs[2];           // number of sectors per FAT
    uint8_t abSecPerTrack[2];       // sectors per track
    uint8_t abHeads[2];             // number of heads
    uint8_t abHiddenSecs[4];        // number of hidden sectors
    uint8_t abLargeSecs[4];         // number of large sectors
    // extended fields below
    uint8_t bDriveNumber;           // BIOS drive number
    uint8_t bReserved;
    uint8_t bBootSignature;         // 0x29 if the next three fields are valid
    uint8_t abVolumeId[4];          // volume serial number
    uint8_t abVolumeLabel[11];      // space padded
    uint8_t abFsType[8];            // informational only
};

struct BOOT_SECTOR
{
    BIOS_PARAMETER_BLOCK bpb;
    uint8_t abBootCode[448];
    uint8_t abSignature[2];         // 0x55, 0xaa
};

static_assert(sizeof(BIOS_PARAMETER_BLOCK) == 62, "BPB size");
static_assert(sizeof(BOOT_SECTOR) == SECTOR_SIZE, "boot sector size");

const uint8_t EXTENDED_BOOT_SIGNATURE = 0x29;
const uint8_t MEDIA_FIXED_DISK = 0xf8;
const uint8_t FIXED_DISK_DRIVE = 0x80;
