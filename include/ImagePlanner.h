#pragma once

#include "Label.h"
#include "FatGeometry.h"

// Partition planning for a new image: regions, volume placement and labels

const int DEFAULT_LABEL_REVISION = LABEL_TYPE_MSDOS_REVISION;
const int MAX_LABEL_REVISION = LABEL_TYPE_QUALIFIED | LABEL_TYPE_MSDOS_REVISION;
const uint16_t DEFAULT_DEVICE_ID = 1;
const char DEFAULT_SERIAL[] = "V9000";
const int DEFAULT_HEADS = 8;
const int DEFAULT_SECTORS = 17;
const uint32_t FIRST_VOLUME_SECTOR = LABEL_SECTORS;

struct Geometry
{
    int cyls = 0;
    int heads = DEFAULT_HEADS;
    int sectors = DEFAULT_SECTORS;

    int64_t total_sectors() const { return static_cast<int64_t>(cyls) * heads * sectors; }
    int cylinder_sectors() const { return heads * sectors; }
};

struct VolumeRequest
{
    std::string name{};
    uint32_t sectors = 0;
    int allocation_unit = 0;            // 0 for PlanConfig::default_allocation_unit
    int root_entries = 0;               // 0 for PlanConfig::default_root_entries
    uint16_t label_type = VOLUME_TYPE_MSDOS;
    IplVector ipl{};
};

uint32_t VolumeSectorsFromMiB(const std::string& name, double mib);

ControllerParams DefaultControllerParams();

struct PlanConfig
{
    Geometry geometry{};
    std::vector<VolumeRequest> volumes{};
    int boot_volume = 0;
    bool align_to_cylinder = false;
    int label_revision = DEFAULT_LABEL_REVISION;
    std::string serial{ DEFAULT_SERIAL };
    uint16_t device_id = DEFAULT_DEVICE_ID;
    ControllerParams controller = DefaultControllerParams();    // cylinders and heads come from geometry
    int default_allocation_unit = DEFAULT_ALLOCATION_UNIT;
    int default_root_entries = 0;                               // 0 for the capacity table
};

struct PlannedVolume
{
    uint32_t address = 0;
    VolumeLabel label{};
    bool has_fat = false;               // opaque volume types have no FAT layout
    FatGeometry fat{};
};

struct ImagePlan
{
    Geometry geometry{};
    uint32_t total_sectors = 0;
    MasterLabel master{};
    std::vector<PlannedVolume> volumes{};
};

std::vector<MediaRegion> ChunkRegions(uint32_t total_sectors, int cylinder_sectors);
uint32_t AlignToCylinder(uint32_t sector, int cylinder_sectors);
ImagePlan PlanImage(const PlanConfig& config);
