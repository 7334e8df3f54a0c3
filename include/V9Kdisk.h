#pragma once

#include "config.h"

#if defined(_WIN32) && !defined(WINVER)
#define WINVER 0x0500
#define _WIN32_WINNT 0x0501
#endif


#ifdef _WIN32
#define PATH_SEPARATOR_CHR  '\\'
#else
#define PATH_SEPARATOR_CHR  '/'
#endif

#ifndef _WIN32
#define MAX_PATH    512
#endif


#ifdef _MSC_VER
#define _CRT_SECURE_NO_DEPRECATE
#define _CRT_NONSTDC_NO_DEPRECATE

#pragma warning(default:4062)       // enumerator 'identifier' in a switch of enum 'enumeration' is not handled
#endif // _MSC_VER

#include <string>
#include <sstream>
#include <iostream>
#include <iomanip>
#include <array>
#include <vector>
#include <map>
#include <memory>    // for unique_ptr
#include <algorithm> // for sort
#include <functional>
#include <numeric>
#include <limits>
#include <type_traits>

#include <cstdio>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <cstdlib>
#include <cstdarg>
#include <cctype>
#include <cmath>
#include <fstream>
#include <sys/stat.h>
#include <cerrno>
#include <ctime>
#include <fcntl.h>
#include <chrono>
#include <cassert>
#include <system_error>


#ifndef HAVE_O_BINARY
#define O_BINARY    0
#endif

#if !defined(HAVE_STRCASECMP) && defined(HAVE__STRCMPI)
#define strcasecmp  _stricmp
#define HAVE_STRCASECMP
#endif

#ifdef _WIN32
#define WIN32_LEAN_AND_MEAN
#define NOMINMAX
#define STRICT
#include <windows.h>
#endif // WIN32

#ifdef HAVE_IO_H
#include <io.h>
#endif

#ifdef HAVE_UNISTD_H
#include <unistd.h>
#endif

#ifdef HAVE_STRINGS_H
#include <strings.h>
#endif

#include "utils.h"
#include "Errors.h"
#include "Util.h"
#include "MemFile.h"

static const int MAX_IMAGE_SIZE = 256 * 1024 * 1024;    // 256MiB, the full 0x80000 sector address space

// create
bool CreateHddImage(const std::string& path);

// info
bool HddInfo(const std::string& path, int verbose);

// extract, insert
bool ExtractVolume(const std::string& volume_path, const std::string& target_path);
bool InsertVolume(const std::string& source_path, const std::string& volume_path, const std::string& output_path);

struct VOLUME_OPTION
{
    std::string name{};
    std::string size{};
    int allocation_unit = 0;
    int root_entries = 0;
    int label_type = 1;
};

struct OPTIONS
{
    int cyls = -1, heads = -1, sectors = -1;
    int boot_volume = 0, revision = 2, device_id = 1;
    int allocation_unit = -1, root_entries = -1;

    int command = 0, verbose = 0, force = 0, align = 0, nozip = 0;
    int tty = 0, time = 0;

    std::string serial{ "V9000" };
    std::vector<VOLUME_OPTION> volumes{};

    char szSource[MAX_PATH], szTarget[MAX_PATH], szOutput[MAX_PATH];
};

extern OPTIONS opt;
