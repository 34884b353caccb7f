/**
 * @file config_file_io.hpp
 * @brief modbusconf source file.
 */

#pragma once

#include <string>

#include <json/json.h>

namespace mbc {

/**
 * @brief Loads and saves configuration documents on disk.
 */
class ConfigFileIo {
public:
    /**
     * @brief Read a whole file into @p out.
     *
     * @param path File to read.
     * @param out File bytes on success.
     * @param outError Human-readable IO error on failure.
     * @return true if the file was read.
     */
    static bool readFile(const std::string& path, std::string& out, std::string& outError);

    /**
     * @brief Replace the contents of @p path with @p text.
     */
    static bool writeFile(const std::string& path, const std::string& text, std::string& outError);

    /**
     * @brief Read and parse a JSON document.
     *
     * @param outError IO error or JSON syntax error on failure.
     * @return true if @p outRoot holds the parsed document.
     */
    static bool loadDocument(const std::string& path, Json::Value& outRoot, std::string& outError);
};

} // namespace mbc
