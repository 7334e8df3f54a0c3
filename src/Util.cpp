// Legacy utility functions

#include "V9Kdisk.h"

OPTIONS opt;


int64_t FileSize (const std::string &path)
{
#ifdef _WIN32
	WIN32_FILE_ATTRIBUTE_DATA wfad;
	if (GetFileAttributesEx(path.c_str(), GetFileExInfoStandard, &wfad))
		return (static_cast<int64_t>(wfad.nFileSizeHigh) << 32) | wfad.nFileSizeLow;
#else
	struct stat st = {};
	if (stat(path.c_str(), &st) == 0)
		return st.st_size;
#endif

	return -1;
}


bool IsFile (const std::string &path)
{
#ifdef _WIN32
	WIN32_FILE_ATTRIBUTE_DATA wfad;
	return GetFileAttributesEx(path.c_str(), GetFileExInfoStandard, &wfad) &&
		!(wfad.dwFileAttributes & FILE_ATTRIBUTE_DIRECTORY);
#else
	struct stat st = {};
	return stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode);
#endif
}

bool IsDir (const std::string &path)
{
#ifdef _WIN32
	WIN32_FILE_ATTRIBUTE_DATA wfad;
	return GetFileAttributesEx(path.c_str(), GetFileExInfoStandard, &wfad) &&
		(wfad.dwFileAttributes & FILE_ATTRIBUTE_DIRECTORY);
#else
	struct stat st = {};
	return stat(path.c_str(), &st) == 0 && S_ISDIR(st.st_mode);
#endif
}

// Same file on disk, even if reached through different names
bool IsSamePath (const std::string &path1, const std::string &path2)
{
#ifndef _WIN32
	struct stat st1 = {}, st2 = {};
	if (stat(path1.c_str(), &st1) == 0 && stat(path2.c_str(), &st2) == 0)
		return st1.st_dev == st2.st_dev && st1.st_ino == st2.st_ino;
#endif
	return path1 == path2;
}

// Volume references take the form <image>:<index>
bool IsVolumePath (const std::string &path, int *pVolume)
{
	// Path must contain a colon
	auto it = path.rfind(':');
	if (it == std::string::npos)
		return false;

	// A volume number must be present
	std::string strVolume = path.substr(it + 1);
	if (strVolume.empty() || !std::isdigit(static_cast<uint8_t>(strVolume[0])))
		return false;

	// Extract the volume number
	char *pEnd = nullptr;
	auto volume = std::strtoul(strVolume.c_str(), &pEnd, 0);

	// Pass volume number to caller if required
	if (pVolume)
		*pVolume = static_cast<int>(volume);

	// Valid if nothing remaining in string
	return !*pEnd;
}

std::string VolumeImagePath (const std::string &path)
{
	return IsVolumePath(path) ? path.substr(0, path.rfind(':')) : path;
}

///////////////////////////////////////////////////////////////////////////////

std::string FileExt (const std::string &path)
{
	auto idx = path.rfind('.');
	return (idx == std::string::npos) ? "" : path.substr(idx + 1);
}

bool IsFileExt (const std::string &path, const std::string &ext)
{
	return util::lowercase(FileExt(path)) == util::lowercase(ext);
}


std::string AbbreviateSize (int64_t total_bytes)
{
	static const std::vector<std::string> units = { "KB", "MB", "GB", "TB", "PB", "EB" };

	// Work up from Kilobytes
	auto unit_idx = 0;
	total_bytes /= 1000;

	// Loop while there are more than 1000 and we have another unit to move up to
	while (total_bytes >= 1000)
	{
		// Determine the percentage error/loss in the next scaling
		auto clip_percent = (total_bytes % 1000) * 100 / (total_bytes - (total_bytes % 1000));

		// Stop if it's at least 20%
		if (clip_percent >= 20)
			break;

		// Next unit, rounding to nearest
		++unit_idx;
		total_bytes = (total_bytes + 500) / 1000;
	}

	return util::format(total_bytes, units[unit_idx]);
}
