/**
 * @file import_modes_demo.cpp
 * @brief Re-import one document into an existing catalog under every import mode.
 */

#include <iostream>
#include <string>

#include "modbusconf/catalog/memory_catalog_store.hpp"
#include "modbusconf/core/config_errors.hpp"
#include "modbusconf/service/config_exchange_service.hpp"

namespace {

const char* kInitial = R"json({
  "controller": {"name": "Boiler", "host": "10.0.0.5", "port": 502, "timeout": 5},
  "points": [{"name": "temp", "type": "holding_register", "data_type": "uint16", "address": 100}]
})json";

const char* kUpdate = R"json({
  "controller": {"name": "Boiler (rev B)", "host": "10.0.0.5", "port": 502, "timeout": 8},
  "points": [
    {"name": "temp2", "type": "holding_register", "data_type": "int16", "address": 100},
    {"name": "flow", "type": "input_register", "data_type": "float32", "address": 200, "len": 2},
    {"name": "bogus", "type": "coil", "data_type": "bool", "address": 90000}
  ]
})json";

void printReport(const mbc::ImportReport& report) {
    std::cout << mbc::ConfigDocumentJson::serialize(report.toJson()) << '\n';
}

} // namespace

int main() {
    for (const auto mode : {mbc::ImportMode::SkipController, mbc::ImportMode::OverwriteController,
                            mbc::ImportMode::SkipDuplicatePoints, mbc::ImportMode::OverwriteDuplicatePoints}) {
        mbc::MemoryCatalogStore store;
        mbc::ConfigExchangeService service(store, mbc::CodecOptions::fromEnvironment());
        try {
            service.importDocument(kInitial, mbc::ConfigDialect::Native);
            std::cout << "== " << mbc::toString(mode) << '\n';
            printReport(service.importDocument(kUpdate, mbc::ConfigDialect::Native, mode));
        } catch (const mbc::ConfigError& ex) {
            std::cerr << mbc::toString(mode) << ": " << ex.what() << '\n';
            return 1;
        }
    }

    mbc::MemoryCatalogStore store;
    mbc::ConfigExchangeService service(store);
    try {
        service.importDocument(kInitial, mbc::ConfigDialect::Native);
        service.importDocument(kUpdate, mbc::ConfigDialect::Native);
    } catch (const mbc::DuplicateError& ex) {
        std::cout << "== no mode\n" << ex.code() << ": " << ex.what() << '\n';
    }
    return 0;
}
