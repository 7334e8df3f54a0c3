// Create command

#include "V9Kdisk.h"
#include "ImageBuilder.h"
#include "ImageFile.h"

// Sizes are in MiB, or in sectors with an 's' suffix
static uint32_t VolumeSectors(const VOLUME_OPTION& vol)
{
    auto size = util::lowercase(vol.size);

    if (!size.empty() && size.back() == 's')
    {
        auto sectors = util::str_value<long>(size.substr(0, size.size() - 1));
        if (!sectors || sectors > MAX_VOLUME_SECTORS)
            throw volume_too_large(vol.name, sectors, MAX_VOLUME_SECTORS);
        return static_cast<uint32_t>(sectors);
    }

    return VolumeSectorsFromMiB(vol.name, util::str_double(vol.size));
}

static PlanConfig PlanConfigFromOptions()
{
    if (opt.cyls == -1)
        throw util::exception("cylinder count must be given with -c");

    PlanConfig config;
    config.geometry.cyls = opt.cyls;
    if (opt.heads != -1) config.geometry.heads = opt.heads;
    if (opt.sectors != -1) config.geometry.sectors = opt.sectors;

    config.boot_volume = opt.boot_volume;
    config.align_to_cylinder = opt.align != 0;
    config.label_revision = opt.revision;
    config.serial = opt.serial;
    config.device_id = static_cast<uint16_t>(opt.device_id);
    if (opt.allocation_unit != -1) config.default_allocation_unit = opt.allocation_unit;
    if (opt.root_entries != -1) config.default_root_entries = opt.root_entries;

    for (auto& vol : opt.volumes)
    {
        VolumeRequest request;
        request.name = vol.name;
        request.sectors = VolumeSectors(vol);
        request.allocation_unit = vol.allocation_unit;
        request.root_entries = vol.root_entries;
        request.label_type = static_cast<uint16_t>(vol.label_type);
        config.volumes.push_back(request);
    }

    return config;
}

bool CreateHddImage(const std::string& path)
{
    if (opt.volumes.empty())
        throw util::exception("no volumes given, use -V NAME:SIZE");

    auto plan = PlanImage(PlanConfigFromOptions());
    auto image = BuildImage(plan);

    // Write to the output disk image, ensuring we don't overwrite any existing file
    WriteImageFile(path, image, opt.force != 0);

    auto& g = plan.geometry;
    util::cout << util::fmt("Created %u cyl%s, %u head%s, %2u sectors/track, %u sectors (",
        g.cyls, (g.cyls == 1) ? "" : "s", g.heads, (g.heads == 1) ? "" : "s",
        g.sectors, plan.total_sectors) << AbbreviateSize(image.size()) << ")\n";

    if (opt.verbose)
    {
        for (size_t i = 0; i < plan.master.working_media.size(); ++i)
        {
            auto& r = plan.master.working_media[i];
            util::cout << util::fmt(" Region %u: start=%u length=%u\n", static_cast<unsigned>(i), r.physical_address, r.block_count);
        }
    }

    for (size_t i = 0; i < plan.volumes.size(); ++i)
    {
        auto& v = plan.volumes[i];
        util::cout << util::fmt(" Volume %02u '%s': start=%u sectors=%u", static_cast<unsigned>(i),
            v.label.volume_name().c_str(), v.address, v.label.capacity);
        if (v.has_fat)
            util::cout << util::fmt(", %u clusters of %u sectors", v.fat.cluster_count, v.fat.allocation_unit);
        util::cout << '\n';
    }

    return true;
}
