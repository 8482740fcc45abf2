// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * datadem_datalists: Inspect and dump catalogs.
 *
 * Usage:
 *   ./datadem_datalists <list|echo|dump|extent> [options] <catalog>...
 *
 *   list    resolved leaf entries with their effective weights
 *   echo    every entry, catalogs included, in catalog-line form
 *   dump    "x y z [w]" records
 *   extent  merged extent as -Rw/e/s/n
 *
 * Example:
 *   ./datadem_datalists dump -R -5/5/-5/5 -w survey.datalist > points.xyz
 */

#include <spdlog/spdlog.h>

#include <datadem/catalog/resolver.hpp>
#include <datadem/config/datadem.hpp>
#include <datadem/errors.hpp>
#include <datadem/services/raster_io.hpp>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using namespace datadem;

namespace {

void printUsage() {
  std::cerr << "Usage: datadem_datalists <list|echo|dump|extent> [options] "
               "<catalog>...\n"
            << "  -c <config.yaml>   load settings\n"
            << "  -R <w/e/s/n>       prune to region\n"
            << "  -w                 use catalog weights\n"
            << "  --verbose          debug logging\n";
}

}  // namespace

int main(int argc, char** argv) {
  if (argc < 3) {
    printUsage();
    return 1;
  }

  const std::string command = argv[1];
  if (command != "list" && command != "echo" && command != "dump" &&
      command != "extent") {
    std::cerr << "Unknown command '" << command << "'" << std::endl;
    printUsage();
    return 1;
  }

  Config config;
  std::optional<Region> region;
  std::vector<std::string> catalogs;
  try {
    for (int i = 2; i < argc; ++i) {
      const std::string arg = argv[i];
      if (arg == "--verbose") {
        spdlog::set_level(spdlog::level::debug);
      } else if (arg == "-c" && i + 1 < argc) {
        config = loadConfig(argv[++i]);
      } else if (arg == "-R" && i + 1 < argc) {
        region = parseRegion(argv[++i]);
      } else if (arg == "-w") {
        config.catalog.use_weights = true;
      } else if (!arg.empty() && arg[0] == '-') {
        throw std::invalid_argument("unknown option " + arg);
      } else {
        catalogs.push_back(arg);
      }
    }
  } catch (const std::exception& e) {
    std::cerr << e.what() << std::endl;
    return 1;
  }

  if (catalogs.empty()) {
    printUsage();
    return 1;
  }

  CatalogResolver resolver(config.xyz, config.catalog);
  resolver.setRasterScanner(std::make_shared<GridRasterScanner>(
      std::make_shared<AsciiGridIO>()));
  resolver.setZLimits(config.point_filter.z_min, config.point_filter.z_max);
  if (region) resolver.setRegion(*region);

  try {
    if (command == "extent") {
      const auto extent = resolver.extent(catalogs);
      if (!extent) {
        std::cerr << "No data" << std::endl;
        return 2;
      }
      std::cout << formatRegion(*extent) << std::endl;
      return 0;
    }

    for (const auto& catalog : catalogs) {
      if (command == "dump") {
        const size_t n =
            resolver.dump(catalog, std::cout, config.catalog.use_weights);
        spdlog::info("[Catalog] {}: {} records", catalog, n);
        continue;
      }

      const bool with_catalogs = command == "echo";
      for (const auto& resolved : resolver.entries(catalog, with_catalogs)) {
        if (command == "echo") {
          std::cout << std::string(2 * resolved.depth, ' ')
                    << formatEntry(resolved.entry) << std::endl;
        } else {
          const auto& info = infoOf(resolved.entry);
          std::cout << info.path << ' ' << info.format_code << ' '
                    << resolved.weight << std::endl;
        }
      }
    }
  } catch (const Error& e) {
    spdlog::error("[Catalog] {}", e.what());
    return 1;
  }

  return 0;
}
