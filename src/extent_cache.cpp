// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#include "datadem/catalog/extent_cache.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace fs = std::filesystem;

namespace datadem {

namespace {

bool parseNumbers(const std::vector<std::string>& tokens,
                  std::vector<double>& out) {
  out.clear();
  for (const auto& t : tokens) {
    char* end = nullptr;
    const double v = std::strtod(t.c_str(), &end);
    if (end != t.c_str() + t.size()) return false;
    out.push_back(v);
  }
  return true;
}

std::optional<Region> toExtent(const std::vector<double>& v) {
  if (v.size() < 4) return std::nullopt;
  Region r(v[0], v[1], v[2], v[3]);
  if (v.size() >= 6) r = r.withZ(v[4], v[5]);
  if (r.west() > r.east() || r.south() > r.north()) return std::nullopt;
  return r;
}

}  // namespace

std::string infPath(const std::string& source) { return source + ".inf"; }

std::optional<Region> readInf(const std::string& inf_path) {
  std::ifstream in(inf_path);
  if (!in.is_open()) return std::nullopt;

  // MB-System layout: "Minimum Longitude: a Maximum Longitude: b"
  std::vector<double> mb(6, 0.0);
  bool have_lon = false, have_lat = false, have_depth = false;

  std::string line;
  std::vector<double> values;
  while (std::getline(in, line)) {
    std::istringstream ss(line);
    std::vector<std::string> tok;
    std::string t;
    while (ss >> t) tok.push_back(t);
    if (tok.size() < 2) continue;

    if (parseNumbers(tok, values)) return toExtent(values);

    if (tok[0] == "Minimum" && tok.size() >= 6) {
      const double lo = std::strtod(tok[2].c_str(), nullptr);
      const double hi = std::strtod(tok[5].c_str(), nullptr);
      if (tok[1] == "Longitude:") {
        mb[0] = lo;
        mb[1] = hi;
        have_lon = true;
      } else if (tok[1] == "Latitude:") {
        mb[2] = lo;
        mb[3] = hi;
        have_lat = true;
      } else if (tok[1] == "Depth:") {
        // Depths are positive down
        mb[4] = -hi;
        mb[5] = -lo;
        have_depth = true;
      }
    }
  }

  if (!have_lon || !have_lat) return std::nullopt;
  if (!have_depth) mb.resize(4);
  return toExtent(mb);
}

void writeInf(const std::string& inf_path, const Region& extent) {
  std::ofstream out(inf_path, std::ios::trunc);
  if (!out.is_open()) {
    throw std::runtime_error("cannot write extent file " + inf_path);
  }
  out << formatRegion(extent, RegionFormat::Inf) << "\n";
}

// ─── ExtentCache ────────────────────────────────────────────────────────────

bool ExtentCache::needsRefresh(const std::string& source,
                               const std::string& inf) const {
  std::error_code ec;
  if (!fs::exists(inf, ec)) return true;
  if (overwrite_) return true;
  if (refresh_stale_) {
    const auto src_time = fs::last_write_time(source, ec);
    if (ec) return false;
    const auto inf_time = fs::last_write_time(inf, ec);
    if (ec) return true;
    return src_time > inf_time;
  }
  return false;
}

std::optional<Region> ExtentCache::get(const std::string& source,
                                       const Compute& compute) {
  {
    std::lock_guard<std::mutex> lock(memo_mutex_);
    auto it = memo_.find(source);
    if (it != memo_.end()) return it->second;
  }

  const std::string inf = infPath(source);
  std::optional<Region> extent;
  bool recompute = needsRefresh(source, inf);
  if (!recompute) {
    extent = readInf(inf);
    if (!extent) {
      spdlog::warn("[ExtentCache] Unreadable extent file {}, regenerating",
                   inf);
      recompute = true;
    }
  }

  if (recompute) {
    extent = compute();
    // Single points and lines give zero-area extents; those are still usable
    if (extent && extent->west() <= extent->east() &&
        extent->south() <= extent->north()) {
      std::lock_guard<std::mutex> lock(write_mutex_);
      spdlog::debug("[ExtentCache] writing {}", inf);
      try {
        writeInf(inf, *extent);
      } catch (const std::runtime_error& e) {
        spdlog::warn("[ExtentCache] {}", e.what());
      }
    } else {
      extent.reset();
    }
  }

  std::lock_guard<std::mutex> lock(memo_mutex_);
  memo_[source] = extent;
  return extent;
}

void ExtentCache::clear() {
  std::lock_guard<std::mutex> lock(memo_mutex_);
  memo_.clear();
}

}  // namespace datadem
