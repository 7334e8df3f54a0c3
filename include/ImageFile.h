#pragma once

// Whole-image file access

// Compressed images are expanded unless uncompress is false
Data ReadImageFile(const std::string& path, bool uncompress = true, Compress* compression = nullptr);
void WriteImageFile(const std::string& path, const Data& data, bool overwrite = false);
