// Main entry point and command-line handler

#include "V9Kdisk.h"
#include "ImagePlanner.h"

#include <getopt.h>

enum { cmdCreate, cmdInfo, cmdExtract, cmdInsert, cmdVersion, cmdEnd };

static const char* aszCommands[] =
{ "create",  "info",  "extract",  "insert",  "version",  nullptr };


void Version()
{
    util::cout << colour::WHITE << "V9Kdisk 1.0 (" __DATE__ ")" <<
        colour::none << ", Victor 9000 hard disk image tool\n";
}

[[noreturn]] void Usage()
{
    Version();

    util::cout << "\n"
        << " V9KDISK [create|info|extract|insert|version] <args>\n"
        << "\n"
        << "  V9KDISK create <image> -c CYLS [-h HEADS] [-s SPT] -V NAME:SIZE[:AU[:ROOT[:TYPE]]] ...\n"
        << "  V9KDISK info <image> [-v]\n"
        << "  V9KDISK extract <image>:<volume> <volume-image>\n"
        << "  V9KDISK insert <volume-image> <image>:<volume> -o <new-image>\n"
        << "\n"
        << "  -c, --cyls=N        cylinder count\n"
        << "  -h, --heads=N       head count (default=" << DEFAULT_HEADS << ")\n"
        << "  -s, --sectors=N     sectors per track (default=" << DEFAULT_SECTORS << ")\n"
        << "  -V, --volume=SPEC   add a volume, SIZE in MiB or sectors with 's' suffix\n"
        << "  -b, --boot-volume=N primary boot volume (default=0)\n"
        << "  -a, --align         align volumes after the first to cylinder boundaries\n"
        << "  -L, --serial=TEXT   drive serial number (default=" << DEFAULT_SERIAL << ")\n"
        << "      --revision=N    label revision bits (default=" << DEFAULT_LABEL_REVISION << ")\n"
        << "      --allocation-unit=N  default sectors per cluster (default=" << DEFAULT_ALLOCATION_UNIT << ")\n"
        << "      --root-entries=N     default root directory entries (default=by size)\n"
        << "  -o, --output=FILE   new image written by insert\n"
        << "  -f, --force         overwrite existing output files\n"
        << "  -v, --verbose       show more detail\n"
        << "\n";

    exit(1);
}

void ReportBuildOptions()
{
    static const std::vector<const char*> options{
#ifdef HAVE_ZLIB
        "zlib",
#endif
#ifdef HAVE_BZIP2
        "bzip2",
#endif
#ifdef HAVE_LZMA
        "lzma",
#endif
    };

    if (options.size())
    {
        util::cout << "\nBuild features:\n";
        for (const auto& o : options)
            util::cout << ' ' << o;
        util::cout << "\n";
    }
}

void LongVersion()
{
    Version();
    ReportBuildOptions();
}


enum {
    OPT_LOG = 256, OPT_VERSION, OPT_REVISION, OPT_DEVICE_ID, OPT_ALLOCATION_UNIT, OPT_ROOT_ENTRIES
};

struct option long_options[] =
{
    { "cyls",       required_argument, nullptr, 'c' },
    { "heads",      required_argument, nullptr, 'h' },
    { "sectors",    required_argument, nullptr, 's' },
    { "volume",     required_argument, nullptr, 'V' },
    { "boot-volume",required_argument, nullptr, 'b' },
    { "align",            no_argument, nullptr, 'a' },
    { "serial",     required_argument, nullptr, 'L' },
    { "output",     required_argument, nullptr, 'o' },
    { "verbose",          no_argument, nullptr, 'v' },
    { "force",            no_argument, nullptr, 'f' },

    { "no-zip",           no_argument, &opt.nozip, 1 },
    { "time",             no_argument, &opt.time, 1 },          // undocumented
    { "tty",              no_argument, &opt.tty, 1 },
    { "help",             no_argument, nullptr, '?' },

    { "log",        optional_argument, nullptr, OPT_LOG },
    { "revision",   required_argument, nullptr, OPT_REVISION },
    { "device-id",  required_argument, nullptr, OPT_DEVICE_ID },
    { "allocation-unit", required_argument, nullptr, OPT_ALLOCATION_UNIT },
    { "root-entries", required_argument, nullptr, OPT_ROOT_ENTRIES },
    { "version",          no_argument, nullptr, OPT_VERSION },

    { 0, 0, 0, 0 }
};

static char short_options[] = "?avfc:h:s:V:b:L:o:";

// NAME:SIZE[:AU[:ROOT[:TYPE]]]
static VOLUME_OPTION ParseVolumeOption(const std::string& value)
{
    auto parts = util::split(value, ':');
    if (parts.size() < 2 || parts.size() > 5 || parts[1].empty())
        throw util::exception("invalid volume '", value, "', expected NAME:SIZE[:AU[:ROOT[:TYPE]]]");

    VOLUME_OPTION vol;
    vol.name = parts[0];
    vol.size = parts[1];

    if (parts.size() > 2 && !parts[2].empty())
        vol.allocation_unit = util::str_value<int>(parts[2]);
    if (parts.size() > 3 && !parts[3].empty())
        vol.root_entries = util::str_value<int>(parts[3]);
    if (parts.size() > 4 && !parts[4].empty())
    {
        auto type = util::lowercase(parts[4]);
        vol.label_type = (type == "msdos") ? VOLUME_TYPE_MSDOS : util::str_value<int>(type);
        if (vol.label_type > 0xffff)
            throw util::exception("invalid volume type '", parts[4], "'");
    }

    return vol;
}

bool ParseCommandLine(int argc_, char* argv_[])
{
    int arg;
    opterr = 1;

    while ((arg = getopt_long(argc_, argv_, short_options, long_options, nullptr)) != -1)
    {
        switch (arg)
        {
        case 'c':   opt.cyls = util::str_value<int>(optarg); break;
        case 'h':   opt.heads = util::str_value<int>(optarg); break;
        case 's':   opt.sectors = util::str_value<int>(optarg); break;
        case 'b':   opt.boot_volume = util::str_value<int>(optarg); break;

        case 'V':
            opt.volumes.push_back(ParseVolumeOption(optarg));
            break;

        case 'L':
            opt.serial = optarg;
            if (opt.serial.size() > 16)
                throw util::exception("serial number '", optarg, "' is longer than 16 characters");
            break;

        case 'o':   strncpy(opt.szOutput, optarg, arraysize(opt.szOutput) - 1); break;

        case 'a':   opt.align = 1; break;
        case 'f':   ++opt.force; break;
        case 'v':   ++opt.verbose; break;

        case OPT_LOG:
            util::log.open(optarg ? optarg : "v9kdisk.log");
            if (util::log.bad())
                throw util::exception("failed to open log file for writing");
            util::cout.file = &util::log;
            break;

        case OPT_REVISION:
            opt.revision = util::str_value<int>(optarg);
            if (opt.revision < 1 || opt.revision > MAX_LABEL_REVISION)
                throw util::exception("invalid label revision '", optarg, "', expected 1-", MAX_LABEL_REVISION);
            break;

        case OPT_DEVICE_ID:
            opt.device_id = util::str_value<int>(optarg);
            if (opt.device_id > 0xffff)
                throw util::exception("invalid device id '", optarg, "'");
            break;

        case OPT_ALLOCATION_UNIT:
            opt.allocation_unit = util::str_value<int>(optarg);
            break;
        case OPT_ROOT_ENTRIES:
            opt.root_entries = util::str_value<int>(optarg);
            break;

        case OPT_VERSION:
            LongVersion();
            return false;

        case ':':
        case '?':   // error
            util::cout << '\n';
            Usage();

            // long option return
        case 0:
            break;
        }
    }

    // Fail if there are no non-option arguments
    if (optind >= argc_)
    {
        if (!opt.verbose)
            Usage();

        // Allow -v to show the --version details
        LongVersion();
        return false;
    }

    // The command is the first argument
    char* pszCommand = argv_[optind];

    // Match against known commands
    opt.command = cmdEnd;
    for (int i = 0; i < cmdEnd; ++i)
    {
        if (!strcasecmp(pszCommand, aszCommands[i]))
        {
            opt.command = i;
            ++optind;
            break;
        }
    }

    return true;
}


int main(int argc_, char* argv_[])
{
    auto start_time = std::chrono::system_clock::now();

    bool f = false;

    try
    {
        if (!ParseCommandLine(argc_, argv_))
            return 1;

        // Read at most two non-option command-line arguments
        if (optind < argc_) strncpy(opt.szSource, argv_[optind++], arraysize(opt.szSource) - 1);
        if (optind < argc_) strncpy(opt.szTarget, argv_[optind++], arraysize(opt.szTarget) - 1);
        if (optind < argc_) Usage();

        bool have_source = opt.szSource[0] != '\0';
        bool have_target = opt.szTarget[0] != '\0';

        switch (opt.command)
        {
        case cmdCreate:
            if (!have_source || have_target)
                Usage();

            f = CreateHddImage(opt.szSource);
            break;

        case cmdInfo:
            if (!have_source || have_target)
                Usage();

            f = HddInfo(opt.szSource, opt.verbose);
            break;

        case cmdExtract:
            if (!have_source || !have_target)
                Usage();

            f = ExtractVolume(opt.szSource, opt.szTarget);
            break;

        case cmdInsert:
            if (!have_source || !have_target)
                Usage();

            f = InsertVolume(opt.szSource, opt.szTarget, opt.szOutput);
            break;

        case cmdVersion:
            if (have_source || have_target)
                Usage();

            LongVersion();
            f = true;
            break;

        default:
            Usage();
            break;
        }
    }
    catch (util::exception & e)
    {
        util::cout << colour::RED << "Error: " << e.what() << colour::none << '\n';
    }
    catch (std::system_error & e)
    {
        util::cout << colour::RED << "Error: " << e.what() << colour::none << '\n';
    }
    catch (std::exception & e)
    {
        util::cout << colour::RED << "Error: " << e.what() << colour::none << '\n';
    }

    if (opt.time)
    {
        auto end_time = std::chrono::system_clock::now();
        auto elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time).count();
        util::cout << "Elapsed time: " << elapsed_ms << "ms\n";
    }

    util::cout << colour::none << "";
    util::log.close();

    return f ? 0 : 1;
}
