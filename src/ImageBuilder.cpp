// Raw image construction from a plan

#include "V9Kdisk.h"
#include "ImageBuilder.h"

Data BuildImage(const ImagePlan& plan)
{
    if (plan.total_sectors > static_cast<uint32_t>(MAX_IMAGE_SIZE / SECTOR_SIZE))
        throw geometry_too_large(plan.geometry.cyls, plan.geometry.heads, plan.geometry.sectors, MAX_IMAGE_SIZE / SECTOR_SIZE);

    // Encode everything first, so nothing is allocated for an invalid plan
    auto master = EncodeMasterLabel(plan.master);

    std::vector<Data> labels;
    for (auto& volume : plan.volumes)
        labels.push_back(EncodeVolumeLabel(volume.label));

    Data image(static_cast<size_t>(plan.total_sectors) * SECTOR_SIZE);
    std::copy(master.begin(), master.end(), image.begin());

    for (size_t i = 0; i < plan.volumes.size(); ++i)
    {
        auto offset = static_cast<size_t>(plan.volumes[i].address) * SECTOR_SIZE;
        if (offset + SECTOR_SIZE > static_cast<size_t>(image.size()))
            throw capacity_exceeded(plan.volumes[i].label.volume_name(), plan.volumes[i].address + 1, plan.total_sectors);

        std::copy(labels[i].begin(), labels[i].end(), image.begin() + offset);
    }

    return image;
}

Data BuildImage(const PlanConfig& config)
{
    return BuildImage(PlanImage(config));
}
