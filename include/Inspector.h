#pragma once

#include "Label.h"
#include "FatGeometry.h"

struct VolumeReport
{
    int index = 0;
    uint32_t address = 0;
    bool decoded = false;
    std::string error{};            // why the label couldn't be decoded
    VolumeLabel label{};
    bool has_fat = false;
    FatGeometry fat{};
    std::string fat_error{};
};

struct DiskReport
{
    int64_t image_size = 0;
    MasterLabel master{};
    std::vector<std::string> warnings{};
    std::vector<VolumeReport> volumes{};
};

DiskReport Inspect(const Data& image, bool verbose = false);
void PrintReport(const DiskReport& report, int verbose = 0);
