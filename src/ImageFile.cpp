// Image file reading and writing

#include "V9Kdisk.h"
#include "ImageFile.h"

Data ReadImageFile(const std::string& path, bool uncompress, Compress* compression)
{
    MemFile file;

    if (path.empty())
        throw util::exception("invalid empty path");

    file.open(path, uncompress);

    if (compression)
        *compression = file.compression();

    return file.data();
}

void WriteImageFile(const std::string& path, const Data& data, bool overwrite)
{
    if (path.empty())
        throw util::exception("invalid empty path");

    if (IsDir(path))
        throw util::exception(path, " is a directory");

    if (!overwrite && IsFile(path))
        throw util::exception(path, " already exists (use -f to overwrite)");

    // Write alongside the target and rename into place once complete
    auto temp_path = path + ".tmp";

    FILE* file = fopen(temp_path.c_str(), "wb");
    if (!file)
        throw posix_error(errno, temp_path.c_str());

    try
    {
        if (fwrite(data.data(), 1, data.size(), file) != static_cast<size_t>(data.size()))
            throw posix_error(errno, temp_path.c_str());

        if (fclose(file))
        {
            file = nullptr;
            throw posix_error(errno, temp_path.c_str());
        }
        file = nullptr;

#ifdef _WIN32
        if (overwrite)
            std::remove(path.c_str());
#endif
        if (std::rename(temp_path.c_str(), path.c_str()))
            throw posix_error(errno, path.c_str());
    }
    catch (...)
    {
        if (file)
            fclose(file);
        std::remove(temp_path.c_str());
        throw;
    }
}
