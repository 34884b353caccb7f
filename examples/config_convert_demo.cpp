/**
 * @file config_convert_demo.cpp
 * @brief Validate a configuration file, import it and export it in another dialect.
 */

#include <iostream>
#include <string>

#include "modbusconf/catalog/memory_catalog_store.hpp"
#include "modbusconf/config/config_file_io.hpp"
#include "modbusconf/core/config_errors.hpp"
#include "modbusconf/service/config_exchange_service.hpp"

int main(int argc, char** argv) {
    if (argc < 4) {
        std::cerr << "usage: " << argv[0] << " <input.json> <native|gateway> <native|gateway> [out-dir]\n";
        return 2;
    }
    const std::string inputPath = argv[1];
    const std::string outDir = argc > 4 ? argv[4] : ".";

    std::string text;
    std::string error;
    if (!mbc::ConfigFileIo::readFile(inputPath, text, error)) {
        std::cerr << error << '\n';
        return 1;
    }

    mbc::MemoryCatalogStore store;
    mbc::ConfigExchangeService service(store, mbc::CodecOptions::fromEnvironment());
    try {
        const auto inputDialect = mbc::requireConfigDialect(argv[2]);
        const auto outputDialect = mbc::requireConfigDialect(argv[3]);

        const auto validation = service.validate(text, inputDialect);
        for (const auto& message : validation.errors()) {
            std::cout << "error: " << message << '\n';
        }
        for (const auto& message : validation.warnings()) {
            std::cout << "warning: " << message << '\n';
        }
        if (!validation.isValid()) {
            return 1;
        }

        const auto report = service.importDocument(text, inputDialect);
        std::cout << "imported controller=" << report.controller.name
                  << " status=" << mbc::toString(report.controller.status)
                  << " points=" << report.totalPoints()
                  << " ok=" << report.count(mbc::PointStatus::Success)
                  << " failed=" << report.count(mbc::PointStatus::Error) << '\n';
        for (const auto& point : report.points) {
            if (point.status == mbc::PointStatus::Error) {
                std::cout << "  ! " << point.name << ": " << point.message << '\n';
            }
        }

        const auto artifact = service.exportController(report.controller.id, outputDialect);
        const auto outPath = outDir + "/" + artifact.filename;
        if (!mbc::ConfigFileIo::writeFile(outPath, artifact.text, error)) {
            std::cerr << error << '\n';
            return 1;
        }
        std::cout << "wrote " << outPath << '\n';
    } catch (const mbc::ConfigError& ex) {
        std::cerr << ex.code() << " (" << ex.status() << "): " << ex.what() << '\n';
        return 1;
    }
    return 0;
}
