#pragma once

#include <cstdint>
#include <string>
#include <vector>

/**
 * @brief File utilities for reading inputs and writing redacted output
 */
class FileUtils
{
public:
    /**
     * @brief Read a whole file as raw bytes
     * @param file_path Path to the file
     * @return File contents
     * @throws IoError if the file cannot be opened or read
     */
    static std::vector<uint8_t> readBinaryFile(const std::string &file_path);

    /**
     * @brief Write bytes to a file, truncating any existing content
     * @param file_path Destination path
     * @param data Bytes to write
     * @throws IoError if the file cannot be opened, written or closed
     */
    static void writeBinaryFile(const std::string &file_path, const std::vector<uint8_t> &data);

    /**
     * @brief Guess a MIME type from the file name's extension
     * @param file_path Path or file name
     * @return MIME type, or application/octet-stream if the extension is unknown
     */
    static std::string guessMimeType(const std::string &file_path);
};
