// Read-only image inspection

#include "V9Kdisk.h"
#include "Inspector.h"
#include "VolumeTranscoder.h"

static void CheckRegions(const std::vector<MediaRegion>& regions, const char* name, std::vector<std::string>& warnings)
{
    for (size_t i = 0; i < regions.size(); ++i)
    {
        if (regions[i].block_count > static_cast<uint32_t>(MAX_REGION_BLOCKS))
            warnings.push_back(util::fmt("%s region %u has %u blocks, the ROM limit is %u",
                name, static_cast<unsigned>(i), regions[i].block_count, MAX_REGION_BLOCKS));
    }

    int64_t total = 0;
    for (auto& r : regions)
        total += r.block_count;

    if (total >= MAX_ADDRESS_SECTORS)
        warnings.push_back(util::fmt("%s totals %lld sectors, which must be below %u",
            name, static_cast<long long>(total), MAX_ADDRESS_SECTORS));
}

DiskReport Inspect(const Data& image, bool verbose)
{
    DiskReport report;
    report.image_size = image.size();
    report.master = DecodeMasterLabel(image);

    auto& ml = report.master;
    auto& warnings = report.warnings;

    if (image.size() % SECTOR_SIZE)
        warnings.push_back(util::fmt("image size isn't a multiple of %u bytes", SECTOR_SIZE));

    if (!(ml.label_type & LABEL_TYPE_MSDOS_REVISION))
        warnings.push_back("label type lacks the MS-DOS revision bit needed by hdsetup");

    CheckRegions(ml.available_media, "available media", warnings);
    CheckRegions(ml.working_media, "working media", warnings);

    if (ml.available_media != ml.working_media)
        warnings.push_back("working media list differs from available media (remapped sectors?)");

    if (!ml.virtual_volumes.empty() && ml.primary_boot_volume >= ml.virtual_volumes.size())
        warnings.push_back(util::fmt("primary boot volume %u doesn't exist", ml.primary_boot_volume));

    for (size_t i = 0; i < ml.virtual_volumes.size(); ++i)
    {
        VolumeReport vr;
        vr.index = static_cast<int>(i);
        vr.address = ml.virtual_volumes[i].logical_address;

        try
        {
            vr.label = DecodeVolumeLabel(image, vr.address);
            vr.decoded = true;
        }
        catch (const format_error& e)
        {
            vr.error = e.what();
            warnings.push_back(util::fmt("volume %u: %s", static_cast<unsigned>(i), e.what()));
        }

        if (vr.decoded)
        {
            auto end_sector = static_cast<int64_t>(vr.address) + vr.label.capacity;
            if (end_sector * SECTOR_SIZE > image.size())
                warnings.push_back(util::fmt("volume %u extends beyond the end of the image", static_cast<unsigned>(i)));

            if (vr.label.capacity > static_cast<uint32_t>(MAX_VOLUME_SECTORS))
                warnings.push_back(util::fmt("volume %u capacity %u exceeds %u sectors",
                    static_cast<unsigned>(i), vr.label.capacity, MAX_VOLUME_SECTORS));

            if (verbose && vr.label.is_msdos())
            {
                try
                {
                    vr.fat = VolumeFatGeometry(vr.label, vr.address);
                    vr.has_fat = true;
                }
                catch (const geometry_error& e)
                {
                    vr.fat_error = e.what();
                }
            }
        }

        report.volumes.push_back(std::move(vr));
    }

    return report;
}


static std::string IplString(const IplVector& ipl)
{
    if (ipl.empty())
        return "none";

    return util::fmt("sector %u, load %04X, %u paragraphs, entry %04X:%04X",
        ipl.disk_address, ipl.load_address, ipl.load_length,
        ipl.code_entry >> 16, ipl.code_entry & 0xffff);
}

template <typename T>
static std::string HexBytes(const T& bytes)
{
    std::string s;
    for (auto b : bytes)
        s += util::fmt(s.empty() ? "%02X" : " %02X", b);
    return s;
}

void PrintReport(const DiskReport& report, int verbose)
{
    auto& ml = report.master;
    auto& cp = ml.controller;

    util::cout << " Capacity:  " << util::fmt("%lld bytes = %lld sectors = ",
        static_cast<long long>(report.image_size), static_cast<long long>(report.image_size / SECTOR_SIZE)) <<
        colour::WHITE << AbbreviateSize(report.image_size) << colour::none << '\n';
    util::cout << " Geometry:  " << util::fmt("%u Cyls, %u Heads, %u Sectors\n", cp.cyls, cp.heads, SectorsPerTrack(ml));
    util::cout << " Label:     " << util::fmt("type %u (%s), device %u, serial ", ml.label_type,
        LabelTypeString(ml.label_type).c_str(), ml.device_id) << colour::CYAN << ml.serial() << colour::none << '\n';
    util::cout << " Boot:      volume " << ml.primary_boot_volume << ", IPL " << IplString(ml.ipl) << '\n';

    if (verbose)
    {
        util::cout << " Control:   " << util::fmt("interleave %u, fast step %u, ECC burst %u, reduced current cyl %u, precomp cyl %u\n",
            cp.interleave, cp.fast_step, cp.ecc_burst, cp.reduced_current, cp.write_precomp);
        util::cout << " Spare:     " << HexBytes(cp.spare) << '\n';
    }

    util::cout << " Media:     " << ml.available_media.size() << " available (" << TotalBlocks(ml.available_media) <<
        " sectors), " << ml.working_media.size() << " working (" << TotalBlocks(ml.working_media) << " sectors)\n";

    if (verbose)
    {
        for (size_t i = 0; i < ml.working_media.size(); ++i)
        {
            auto& r = ml.working_media[i];
            util::cout << util::fmt("   Region %u: start=%u length=%u\n", static_cast<unsigned>(i), r.physical_address, r.block_count);
        }
    }

    util::cout << " Volumes:   " << colour::GREEN << report.volumes.size() << colour::none << '\n';

    for (auto& vr : report.volumes)
    {
        util::cout << util::fmt("  %2u: ", vr.index);

        if (!vr.decoded)
        {
            util::cout << util::fmt("sector %u, ", vr.address) << colour::RED << vr.error << colour::none << '\n';
            continue;
        }

        auto& v = vr.label;
        util::cout << colour::CYAN << util::fmt("%-16s", v.volume_name().c_str()) << colour::none <<
            util::fmt(" %-9s start=%-7u sectors=%-6u", VolumeTypeString(v.label_type).c_str(), vr.address, v.capacity);

        if (v.is_msdos())
            util::cout << util::fmt(" AU=%u dir=%u", v.allocation_unit, v.directory_entries);
        if (vr.index == ml.primary_boot_volume)
            util::cout << colour::YELLOW << " [boot]" << colour::none;
        util::cout << '\n';

        if (!verbose)
            continue;

        util::cout << "      IPL " << IplString(v.ipl) << '\n';
        util::cout << util::fmt("      Data start %u, host block %u, reserved ", v.data_start, v.host_block_size) <<
            HexBytes(v.reserved) << '\n';

        if (!v.assignments.empty())
        {
            util::cout << "      Assignments:";
            for (auto& a : v.assignments)
                util::cout << util::fmt(" unit %u=vol %u", a.device_unit, a.volume_index);
            util::cout << '\n';
        }

        if (vr.has_fat)
        {
            auto& g = vr.fat;
            util::cout << util::fmt("      FAT12: %u clusters, %u sectors/FAT at %u and %u, dir %u sectors at %u, data at %u (physical %u)\n",
                g.cluster_count, g.fat_sectors, g.fat_logical_sectors[0], g.fat_logical_sectors[1],
                g.directory_sectors, g.directory_logical(), g.first_data_logical, g.first_data_physical);
        }
        else if (!vr.fat_error.empty())
            util::cout << "      FAT12: " << colour::RED << vr.fat_error << colour::none << '\n';
    }

    for (auto& warning : report.warnings)
        Message(msgWarning, "%s", warning.c_str());
}
