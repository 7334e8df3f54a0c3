// Info command

#include "V9Kdisk.h"
#include "Inspector.h"
#include "ImageFile.h"

bool HddInfo(const std::string& path, int verbose)
{
    auto compression = Compress::None;
    auto image = ReadImageFile(path, !opt.nozip, &compression);

    if (compression != Compress::None && verbose)
        Message(msgInfo, "%s is %s compressed", path.c_str(), to_string(compression).c_str());

    util::cout << '[' << path << "]\n";
    util::cout.screen->flush();

    auto report = Inspect(image, verbose > 0);
    PrintReport(report, verbose);

    // Dump the raw master label at higher verbosity
    if (verbose > 1)
    {
        util::cout << '\n';
        util::hex_dump(image.begin(), image.begin() + MASTER_LABEL_SIZE);
    }

    return true;
}
