// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * datadem_waffles: Grid one or more catalogs into a DEM.
 *
 * Pipeline: resolve catalogs → bin / interpolate → mask → uncertainty
 *
 * Usage:
 *   ./datadem_waffles [options] <catalog>...
 *
 * Example:
 *   ./datadem_waffles -R -5/5/-5/5 -E 1s -O out/test -k -u survey.datalist
 */

#include <spdlog/spdlog.h>

#include <datadem/datadem.hpp>
#include <datadem/errors.hpp>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using namespace datadem;

namespace {

void printUsage() {
  std::cerr
      << "Usage: datadem_waffles [options] <catalog>...\n"
      << "  -c <config.yaml>   load settings (defaults otherwise)\n"
      << "  -R <w/e/s/n>       region (default: extent of the catalogs)\n"
      << "  -E <increment>     cell size, e.g. 0.5, 1s, 0.25m\n"
      << "  -O <name>          output name\n"
      << "  -P <prefix>        derive the name from prefix, increment, region\n"
      << "  -M <num|surface>   gridding module\n"
      << "  -B <count|mean|mask>  binning mode for the num module\n"
      << "  -X <ext[:proc]>    output / processing padding in cells\n"
      << "  -C <n>             chunks per row\n"
      << "  -Z <zmin/zmax>     elevation limits (either side may be empty)\n"
      << "  -p                 grid-node registration\n"
      << "  -w                 use catalog weights\n"
      << "  -k                 write a data mask\n"
      << "  -u                 estimate interpolation uncertainty\n"
      << "  -s                 write spatial metadata\n"
      << "  --verbose          debug logging\n";
}

std::optional<double> parseLimit(const std::string& text) {
  if (text.empty()) return std::nullopt;
  return std::stod(text);
}

}  // namespace

int main(int argc, char** argv) {
  if (argc < 2) {
    printUsage();
    return 1;
  }

  std::vector<std::string> args(argv + 1, argv + argc);
  std::vector<std::string> catalogs;

  // Config first so that flags override it
  Config config;
  for (size_t i = 0; i + 1 < args.size(); ++i) {
    if (args[i] == "-c") {
      try {
        config = loadConfig(args[i + 1]);
      } catch (const std::exception& e) {
        std::cerr << e.what() << std::endl;
        return 1;
      }
    }
  }

  DataDEM dem(config);
  try {
    for (size_t i = 0; i < args.size(); ++i) {
      const std::string& arg = args[i];
      auto value = [&]() -> const std::string& {
        if (i + 1 >= args.size()) {
          throw std::invalid_argument("missing value for " + arg);
        }
        return args[++i];
      };

      if (arg == "--verbose") {
        spdlog::set_level(spdlog::level::debug);
      } else if (arg == "-h" || arg == "--help") {
        printUsage();
        return 0;
      } else if (arg == "-c") {
        ++i;
      } else if (arg == "-R") {
        dem.setRegion(parseRegion(value()));
      } else if (arg == "-E") {
        dem.setIncrement(parseIncrement(value()));
      } else if (arg == "-O") {
        dem.setName(value());
      } else if (arg == "-P") {
        dem.setNamePrefix(value());
      } else if (arg == "-M") {
        const auto& m = value();
        if (m != "num" && m != "surface") {
          throw std::invalid_argument("unknown module '" + m + "'");
        }
        dem.setModule(m == "num" ? GridModule::Num : GridModule::Surface);
      } else if (arg == "-B") {
        const auto& m = value();
        if (m == "count") {
          dem.setBinMode(BinMode::Count);
        } else if (m == "mean") {
          dem.setBinMode(BinMode::Mean);
        } else if (m == "mask") {
          dem.setBinMode(BinMode::Presence);
        } else {
          throw std::invalid_argument("unknown binning mode '" + m + "'");
        }
      } else if (arg == "-X") {
        const auto& x = value();
        const auto sep = x.find(':');
        const int ext = std::stoi(x.substr(0, sep));
        const int proc = sep == std::string::npos
                             ? dem.config().grid.extend_proc
                             : std::stoi(x.substr(sep + 1));
        dem.setExtend(ext, proc);
      } else if (arg == "-C") {
        dem.setChunks(std::stoi(value()));
      } else if (arg == "-Z") {
        const auto& z = value();
        const auto sep = z.find('/');
        if (sep == std::string::npos) {
          throw std::invalid_argument("-Z expects zmin/zmax");
        }
        dem.setZLimits(parseLimit(z.substr(0, sep)),
                       parseLimit(z.substr(sep + 1)));
      } else if (arg == "-p") {
        dem.setNodeRegistration(NodeRegistration::Grid);
      } else if (arg == "-w") {
        dem.useWeights();
      } else if (arg == "-k") {
        dem.enableMask();
      } else if (arg == "-u") {
        dem.enableUncertainty();
      } else if (arg == "-s") {
        dem.enableSpatialMetadata();
      } else if (!arg.empty() && arg[0] == '-') {
        throw std::invalid_argument("unknown option " + arg);
      } else {
        catalogs.push_back(arg);
      }
    }
  } catch (const std::exception& e) {
    std::cerr << e.what() << std::endl;
    printUsage();
    return 1;
  }

  if (catalogs.empty()) {
    std::cerr << "No catalogs given" << std::endl;
    return 1;
  }

  try {
    const auto products = dem.run(catalogs);
    if (!products) {
      std::cerr << "No data in the requested region" << std::endl;
      return 2;
    }

    std::cout << "DEM: " << products->dem << std::endl;
    if (products->mask) std::cout << "Mask: " << *products->mask << std::endl;
    if (products->proximity_uncertainty) {
      std::cout << "Proximity uncertainty: "
                << *products->proximity_uncertainty << std::endl;
    }
    if (products->slope_uncertainty) {
      std::cout << "Slope uncertainty: " << *products->slope_uncertainty
                << std::endl;
    }
    if (products->uncertainty) {
      std::cout << "Uncertainty: " << *products->uncertainty << std::endl;
    }
    if (products->spatial_metadata) {
      std::cout << "Spatial metadata: " << *products->spatial_metadata
                << std::endl;
    }
    if (products->chunks_dropped > 0) {
      std::cout << products->chunks_dropped << " of " << products->chunks
                << " chunks produced no data" << std::endl;
    }
  } catch (const Error& e) {
    spdlog::error("[DataDEM] {}", e.what());
    return 1;
  } catch (const std::exception& e) {
    spdlog::error("[DataDEM] Unexpected failure: {}", e.what());
    return 1;
  }

  return 0;
}
