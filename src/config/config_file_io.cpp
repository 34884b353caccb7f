/**
 * @file config_file_io.cpp
 * @brief modbusconf source file.
 */

#include "modbusconf/config/config_file_io.hpp"

#include <fstream>
#include <sstream>

#include "modbusconf/codec/config_document.hpp"
#include "modbusconf/core/config_errors.hpp"

namespace mbc {

bool ConfigFileIo::readFile(const std::string& path, std::string& out, std::string& outError) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        outError = "Cannot open file: " + path;
        return false;
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    out = buffer.str();
    return true;
}

bool ConfigFileIo::writeFile(const std::string& path, const std::string& text, std::string& outError) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        outError = "Cannot open file for writing: " + path;
        return false;
    }
    file << text;
    file.flush();
    if (!file) {
        outError = "Failed writing file: " + path;
        return false;
    }
    return true;
}

bool ConfigFileIo::loadDocument(const std::string& path, Json::Value& outRoot, std::string& outError) {
    std::string text;
    if (!readFile(path, text, outError)) {
        return false;
    }
    try {
        outRoot = ConfigDocumentJson::parse(text);
    } catch (const ConfigFormatError& ex) {
        outError = path + ": " + ex.what();
        return false;
    }
    return true;
}

} // namespace mbc
