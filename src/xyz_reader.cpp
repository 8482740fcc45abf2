// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * xyz_reader.cpp
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#include "datadem/catalog/xyz_reader.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdlib>
#include <vector>

#include "datadem/errors.hpp"

namespace datadem {

namespace {

std::string trim(const std::string& s) {
  const auto b = s.find_first_not_of(" \t\r\n");
  if (b == std::string::npos) return {};
  const auto e = s.find_last_not_of(" \t\r\n");
  return s.substr(b, e - b + 1);
}

bool isBlank(char c) { return c == ' ' || c == '\t'; }

std::vector<std::string> splitFields(const std::string& line, char delim) {
  std::vector<std::string> fields;
  if (isBlank(delim)) {
    std::string cur;
    for (char c : line) {
      if (isBlank(c)) {
        if (!cur.empty()) fields.push_back(std::move(cur));
        cur.clear();
      } else {
        cur.push_back(c);
      }
    }
    if (!cur.empty()) fields.push_back(std::move(cur));
    return fields;
  }

  size_t start = 0;
  while (true) {
    const auto pos = line.find(delim, start);
    fields.push_back(trim(line.substr(start, pos - start)));
    if (pos == std::string::npos) break;
    start = pos + 1;
  }
  return fields;
}

double toDouble(const std::string& field, const std::string& line) {
  const char* begin = field.c_str();
  char* end = nullptr;
  const double v = std::strtod(begin, &end);
  if (field.empty() || end != begin + field.size()) {
    throw MalformedRecord("non-numeric field '" + field + "' in '" + line +
                          "'");
  }
  return v;
}

}  // namespace

std::optional<char> detectDelimiter(const std::string& line) {
  const auto text = trim(line);
  for (char c : kDelimiterCandidates) {
    if (text.find(c) != std::string::npos) return c;
  }
  return std::nullopt;
}

PointRecord parseXyzLine(const std::string& line, char delimiter,
                         const config::Xyz& layout) {
  const auto fields = splitFields(trim(line), delimiter);
  const int need =
      std::max({layout.x_column, layout.y_column, layout.z_column}) + 1;
  if (static_cast<int>(fields.size()) < need) {
    throw MalformedRecord("expected at least " + std::to_string(need) +
                          " fields in '" + line + "'");
  }
  PointRecord pt;
  pt.x = toDouble(fields[layout.x_column], line);
  pt.y = toDouble(fields[layout.y_column], line);
  pt.z = toDouble(fields[layout.z_column], line);
  return pt;
}

// ─── XyzReader ──────────────────────────────────────────────────────────────

XyzReader::XyzReader(const std::string& path, const config::Xyz& layout)
    : path_(path), in_(path), layout_(layout) {
  if (!in_.is_open()) throw SourceUnavailable(path);
  if (!layout_.delimiter.empty()) delimiter_ = layout_.delimiter[0];
}

bool XyzReader::next(PointRecord& out) {
  std::string line;
  while (std::getline(in_, line)) {
    ++line_no_;
    if (static_cast<int>(line_no_) <= layout_.skip_lines) continue;
    if (trim(line).empty()) continue;

    if (!delimiter_) {
      delimiter_ = detectDelimiter(line);
      if (!delimiter_) {
        spdlog::warn("[XYZ] {}:{}: no delimiter found, skipping line", path_,
                     line_no_);
        ++malformed_;
        continue;
      }
    }

    PointRecord pt;
    try {
      pt = parseXyzLine(line, *delimiter_, layout_);
    } catch (const MalformedRecord& e) {
      spdlog::warn("[XYZ] {}:{}: {}", path_, line_no_, e.what());
      ++malformed_;
      continue;
    }

    if (region_ && !contains(*region_, pt.x, pt.y)) continue;
    if (!zPass(pt.z, z_lower_, z_upper_)) continue;

    pt.weight = weight_;
    ++records_;
    out = pt;
    return true;
  }

  spdlog::debug("[XYZ] parsed {} records from {}", records_, path_);
  return false;
}

std::optional<Region> scanXyzExtent(const std::string& path,
                                    const config::Xyz& layout) {
  XyzReader reader(path, layout);
  PointRecord pt;
  if (!reader.next(pt)) return std::nullopt;

  double xmin = pt.x, xmax = pt.x, ymin = pt.y, ymax = pt.y;
  double zmin = pt.z, zmax = pt.z;
  while (reader.next(pt)) {
    xmin = std::min(xmin, pt.x);
    xmax = std::max(xmax, pt.x);
    ymin = std::min(ymin, pt.y);
    ymax = std::max(ymax, pt.y);
    zmin = std::min(zmin, pt.z);
    zmax = std::max(zmax, pt.z);
  }
  return Region(xmin, xmax, ymin, ymax, zmin, zmax);
}

}  // namespace datadem
