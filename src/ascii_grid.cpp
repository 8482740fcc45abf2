// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * ascii_grid.cpp
 *
 * ESRI ASCII grid reader/writer and raster window helpers.
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <sstream>

#include "datadem/errors.hpp"
#include "datadem/services/raster_io.hpp"

namespace fs = std::filesystem;

namespace datadem {

namespace {

std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}

struct AsciiHeader {
  RasterInfo info;
  int header_lines = 0;
};

AsciiHeader readHeader(std::ifstream& in, const std::string& path) {
  AsciiHeader h;
  double xll = 0.0, yll = 0.0, cell = 0.0;
  bool x_center = false, y_center = false;
  bool have_cols = false, have_rows = false, have_x = false, have_y = false,
       have_cell = false;

  std::string line;
  std::streampos data_start = in.tellg();
  while (std::getline(in, line)) {
    std::istringstream ss(line);
    std::string key;
    if (!(ss >> key) || !std::isalpha(static_cast<unsigned char>(key[0]))) {
      break;
    }
    double value = 0.0;
    if (!(ss >> value)) {
      throw ExternalToolFailure("bad ASCII grid header line '" + line +
                                "' in " + path);
    }
    key = lower(key);
    if (key == "ncols") {
      h.info.width = static_cast<int>(value);
      have_cols = true;
    } else if (key == "nrows") {
      h.info.height = static_cast<int>(value);
      have_rows = true;
    } else if (key == "xllcorner" || key == "xllcenter") {
      xll = value;
      x_center = key == "xllcenter";
      have_x = true;
    } else if (key == "yllcorner" || key == "yllcenter") {
      yll = value;
      y_center = key == "yllcenter";
      have_y = true;
    } else if (key == "cellsize") {
      cell = value;
      have_cell = true;
    } else if (key == "nodata_value") {
      h.info.nodata = value;
    } else {
      spdlog::warn("[AsciiGrid] Unknown header key '{}' in {}", key, path);
    }
    ++h.header_lines;
    data_start = in.tellg();
  }

  if (!(have_cols && have_rows && have_x && have_y && have_cell) ||
      h.info.width <= 0 || h.info.height <= 0 || !(cell > 0.0)) {
    throw ExternalToolFailure("incomplete ASCII grid header in " + path);
  }

  const double west = x_center ? xll - cell / 2.0 : xll;
  const double south = y_center ? yll - cell / 2.0 : yll;
  h.info.transform = {west, cell, south + h.info.height * cell, -cell};

  in.clear();
  in.seekg(data_start);
  return h;
}

std::ifstream openStream(const std::string& path) {
  if (!fs::exists(path)) throw SourceUnavailable(path);
  std::ifstream in(path);
  if (!in.is_open()) throw SourceUnavailable(path);
  return in;
}

}  // namespace

RasterWindow windowFor(const RasterInfo& info, const Region& region) {
  const auto& gt = info.transform;
  const double c0 = std::floor((region.west() - gt.origin_x) / gt.cell_x);
  const double c1 = std::ceil((region.east() - gt.origin_x) / gt.cell_x);
  const double r0 = std::floor((region.north() - gt.origin_y) / gt.cell_y);
  const double r1 = std::ceil((region.south() - gt.origin_y) / gt.cell_y);

  const int col_off = static_cast<int>(std::clamp(c0, 0.0, 1.0 * info.width));
  const int col_end = static_cast<int>(std::clamp(c1, 0.0, 1.0 * info.width));
  const int row_off = static_cast<int>(std::clamp(r0, 0.0, 1.0 * info.height));
  const int row_end = static_cast<int>(std::clamp(r1, 0.0, 1.0 * info.height));
  return {col_off, row_off, col_end - col_off, row_end - row_off};
}

Region rasterExtent(const RasterInfo& info) {
  const auto& gt = info.transform;
  return {gt.origin_x, gt.origin_x + info.width * gt.cell_x,
          gt.origin_y + info.height * gt.cell_y, gt.origin_y};
}

RasterInfo AsciiGridIO::open(const std::string& path) {
  auto in = openStream(path);
  return readHeader(in, path).info;
}

Raster AsciiGridIO::readWindow(const std::string& path,
                               const RasterWindow& window) {
  auto in = openStream(path);
  const auto header = readHeader(in, path);
  const auto& info = header.info;

  if (window.empty() || window.col_off < 0 || window.row_off < 0 ||
      window.col_off + window.cols > info.width ||
      window.row_off + window.rows > info.height) {
    throw ExternalToolFailure(fmt::format(
        "window {}x{}+{}+{} outside {}x{} grid {}", window.cols, window.rows,
        window.col_off, window.row_off, info.width, info.height, path));
  }

  const auto& gt = info.transform;
  GridSpec spec;
  spec.cell_size = gt.cell_x;
  spec.width = window.cols;
  spec.height = window.rows;
  spec.transform = {gt.origin_x + window.col_off * gt.cell_x, gt.cell_x,
                    gt.origin_y + window.row_off * gt.cell_y, gt.cell_y};
  spec.nodata = static_cast<float>(info.nodata.value_or(-9999.0));
  spec.region = spec.extent();

  Raster raster(spec);
  const int last_row = window.row_off + window.rows;
  for (int r = 0; r < last_row; ++r) {
    for (int c = 0; c < info.width; ++c) {
      double v = 0.0;
      if (!(in >> v)) {
        throw ExternalToolFailure(
            fmt::format("truncated ASCII grid {} at row {} col {}", path, r, c));
      }
      if (r < window.row_off || c < window.col_off ||
          c >= window.col_off + window.cols) {
        continue;
      }
      raster(r - window.row_off, c - window.col_off) = static_cast<float>(v);
    }
  }
  return raster;
}

std::string AsciiGridIO::write(const Raster& raster, const std::string& path) {
  const auto& gt = raster.spec().transform;
  if (std::abs(std::abs(gt.cell_x) - std::abs(gt.cell_y)) >
      1e-9 * std::abs(gt.cell_x)) {
    throw ExternalToolFailure("ASCII grid requires square cells: " + path);
  }

  fs::path out_path(path);
  if (!out_path.has_extension()) out_path += extension();
  if (out_path.has_parent_path()) {
    std::error_code ec;
    fs::create_directories(out_path.parent_path(), ec);
    if (ec) {
      throw ExternalToolFailure("cannot create " +
                                out_path.parent_path().string() + ": " +
                                ec.message());
    }
  }

  std::ofstream out(out_path);
  if (!out.is_open()) {
    throw ExternalToolFailure("cannot open " + out_path.string() +
                              " for writing");
  }

  out << fmt::format("ncols {}\nnrows {}\n", raster.cols(), raster.rows());
  out << fmt::format("xllcorner {:.12g}\nyllcorner {:.12g}\n", gt.origin_x,
                     gt.origin_y + raster.rows() * gt.cell_y);
  out << fmt::format("cellsize {:.12g}\nNODATA_value {}\n", gt.cell_x,
                     raster.nodata());
  for (int r = 0; r < raster.rows(); ++r) {
    for (int c = 0; c < raster.cols(); ++c) {
      const float v = raster.isValid(r, c) ? raster(r, c) : raster.nodata();
      out << (c ? " " : "") << fmt::format("{}", v);
    }
    out << '\n';
  }

  if (!out) {
    throw ExternalToolFailure("write failed: " + out_path.string());
  }
  spdlog::debug("[AsciiGrid] Wrote {}x{} grid to {}", raster.cols(),
                raster.rows(), out_path.string());
  return out_path.string();
}

}  // namespace datadem
