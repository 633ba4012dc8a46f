#include "core/file_utils.hpp"
#include "core/dlp_errors.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <map>

namespace fs = std::filesystem;

std::vector<uint8_t> FileUtils::readBinaryFile(const std::string &file_path)
{
    std::error_code ec;
    if (!fs::is_regular_file(file_path, ec))
    {
        throw IoError("Cannot read file: " + file_path + " (not a regular file)");
    }

    std::ifstream in(file_path, std::ios::binary);
    if (!in.is_open())
    {
        throw IoError("Cannot open file for reading: " + file_path);
    }

    std::vector<uint8_t> data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad())
    {
        throw IoError("Error reading file: " + file_path);
    }

    Logger::debug("Read " + std::to_string(data.size()) + " bytes from " + file_path);
    return data;
}

void FileUtils::writeBinaryFile(const std::string &file_path, const std::vector<uint8_t> &data)
{
    std::ofstream out(file_path, std::ios::binary | std::ios::out | std::ios::trunc);
    if (!out.is_open())
    {
        throw IoError("Cannot open file for writing: " + file_path);
    }

    out.write(reinterpret_cast<const char *>(data.data()), static_cast<std::streamsize>(data.size()));
    out.flush();
    if (!out.good())
    {
        throw IoError("Error writing file: " + file_path);
    }

    out.close();
    if (out.fail())
    {
        throw IoError("Error closing file: " + file_path);
    }

    Logger::debug("Wrote " + std::to_string(data.size()) + " bytes to " + file_path);
}

std::string FileUtils::guessMimeType(const std::string &file_path)
{
    static const std::map<std::string, std::string> mime_types = {
        {"png", "image/png"},
        {"jpg", "image/jpeg"},
        {"jpeg", "image/jpeg"},
        {"jpe", "image/jpeg"},
        {"gif", "image/gif"},
        {"bmp", "image/bmp"},
        {"tif", "image/tiff"},
        {"tiff", "image/tiff"},
        {"svg", "image/svg+xml"},
        {"txt", "text/plain"},
        {"csv", "text/csv"},
        {"htm", "text/html"},
        {"html", "text/html"},
        {"json", "application/json"},
        {"pdf", "application/pdf"}};

    std::string extension = fs::path(file_path).extension().string();
    if (!extension.empty() && extension[0] == '.')
    {
        extension = extension.substr(1);
    }
    std::transform(extension.begin(), extension.end(), extension.begin(),
                   [](unsigned char c)
                   { return static_cast<char>(std::tolower(c)); });

    auto it = mime_types.find(extension);
    if (it == mime_types.end())
    {
        return "application/octet-stream";
    }
    return it->second;
}
