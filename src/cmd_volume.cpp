// Extract and insert commands, for editing volumes with standard FAT tools

#include "V9Kdisk.h"
#include "VolumeTranscoder.h"
#include "ImageFile.h"

static Data ReadInput(const std::string& path)
{
    auto compression = Compress::None;
    auto data = ReadImageFile(path, !opt.nozip, &compression);

    if (compression != Compress::None && opt.verbose)
        Message(msgInfo, "%s is %s compressed", path.c_str(), to_string(compression).c_str());

    return data;
}

bool ExtractVolume(const std::string& volume_path, const std::string& target_path)
{
    int index = 0;
    if (!IsVolumePath(volume_path, &index))
        throw util::exception("expected <image>:<volume> source, not '", volume_path, "'");

    auto image_path = VolumeImagePath(volume_path);
    if (IsSamePath(image_path, target_path))
        throw util::exception("target must differ from the source image");

    auto image = ReadInput(image_path);
    auto volume = ExtractVolumeData(image, index);

    WriteImageFile(target_path, volume, opt.force != 0);

    util::cout << util::fmt("Extracted volume %u (%u sectors) to ", index, volume.size() / SECTOR_SIZE) <<
        colour::CYAN << target_path << colour::none << '\n';
    return true;
}

bool InsertVolume(const std::string& source_path, const std::string& volume_path, const std::string& output_path)
{
    int index = 0;
    if (!IsVolumePath(volume_path, &index))
        throw util::exception("expected <image>:<volume> target, not '", volume_path, "'");

    if (output_path.empty())
        throw util::exception("output image must be given with -o");

    // The original image is never modified
    auto image_path = VolumeImagePath(volume_path);
    if (IsSamePath(image_path, output_path))
        throw util::exception("output image must differ from the original image");

    auto edited = ReadInput(source_path);
    auto image = ReadInput(image_path);
    auto output = InsertVolumeData(image, index, edited);

    WriteImageFile(output_path, output, opt.force != 0);

    util::cout << util::fmt("Inserted %s as volume %u, wrote ", source_path.c_str(), index) <<
        colour::CYAN << output_path << colour::none << '\n';
    return true;
}
