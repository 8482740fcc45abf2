// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * catalog_resolver.cpp
 *
 * Depth-first catalog traversal with extent pruning, and the point stream
 * built on top of it.
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#include "datadem/catalog/resolver.hpp"

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <filesystem>
#include <fstream>

#include "datadem/catalog/xyz_reader.hpp"
#include "datadem/errors.hpp"

namespace fs = std::filesystem;

namespace datadem {

namespace {

std::string canonicalPath(const std::string& path) {
  std::error_code ec;
  auto canonical = fs::weakly_canonical(path, ec);
  return ec ? fs::absolute(path).lexically_normal().string()
            : canonical.string();
}

bool onPath(const std::vector<std::string>& path, const std::string& key) {
  return std::find(path.begin(), path.end(), key) != path.end();
}

/// Applies region and z-limit predicates to an upstream stream.
class FilteredPointStream : public PointStream {
 public:
  FilteredPointStream(PointStreamPtr upstream, std::optional<Region> region,
                      std::optional<double> z_lower,
                      std::optional<double> z_upper)
      : upstream_(std::move(upstream)),
        region_(std::move(region)),
        z_lower_(z_lower),
        z_upper_(z_upper) {}

  bool next(PointRecord& out) override {
    while (upstream_->next(out)) {
      if (region_ && !contains(*region_, out.x, out.y)) continue;
      if (!zPass(out.z, z_lower_, z_upper_)) continue;
      return true;
    }
    return false;
  }

 private:
  PointStreamPtr upstream_;
  std::optional<Region> region_;
  std::optional<double> z_lower_;
  std::optional<double> z_upper_;
};

}  // namespace

// ─── Traversal ──────────────────────────────────────────────────────────────

/**
 * @brief Depth-first walk over catalog entries.
 *
 * Holds one open catalog file per nesting level. The active recursion path
 * doubles as the cycle guard.
 */
class CatalogWalker {
 public:
  CatalogWalker(const CatalogResolver& resolver, std::vector<Entry> roots,
                bool include_catalogs)
      : resolver_(resolver),
        roots_(std::move(roots)),
        include_catalogs_(include_catalogs) {}

  bool next(ResolvedEntry& out) {
    while (true) {
      Entry entry;
      double parent_weight = resolver_.weight_override_.value_or(1.0);

      if (stack_.empty()) {
        if (root_pos_ >= roots_.size()) return false;
        entry = roots_[root_pos_++];
      } else {
        Frame& top = stack_.back();
        std::string line;
        if (!std::getline(*top.in, line)) {
          active_.pop_back();
          stack_.pop_back();
          continue;
        }
        if (isIgnorableLine(line)) continue;
        try {
          entry = parseEntry(line, resolver_.registry_, top.dir, top.stem);
        } catch (const UnsupportedFormat& e) {
          spdlog::warn("[Catalog] {}: {}", top.path, e.what());
          continue;
        } catch (const MalformedRecord& e) {
          spdlog::warn("[Catalog] {}: {}", top.path, e.what());
          continue;
        }
        parent_weight = top.weight;
      }

      const double weight =
          resolver_.effectiveWeight(infoOf(entry).weight, parent_weight);
      const int depth = static_cast<int>(stack_.size());
      if (!resolver_.admit(entry)) continue;

      if (kindOf(entry) == FormatKind::Catalog) {
        enter(infoOf(entry).path, weight);
        if (!include_catalogs_) continue;
      }
      out = {std::move(entry), weight, depth};
      return true;
    }
  }

 private:
  struct Frame {
    std::unique_ptr<std::ifstream> in;
    std::string path;
    std::string dir;
    std::string stem;
    double weight;
  };

  void enter(const std::string& path, double weight) {
    const auto key = canonicalPath(path);
    if (onPath(active_, key)) throw CatalogCycle(path);

    auto in = std::make_unique<std::ifstream>(path);
    if (!in->is_open()) {
      spdlog::warn("[Catalog] Skipping {}: cannot open catalog", path);
      return;
    }
    const fs::path p(path);
    stack_.push_back({std::move(in), path, p.parent_path().string(),
                      p.stem().string(), weight});
    active_.push_back(key);
  }

  const CatalogResolver& resolver_;
  std::vector<Entry> roots_;
  size_t root_pos_ = 0;
  bool include_catalogs_;
  std::vector<Frame> stack_;
  std::vector<std::string> active_;
};

// ─── Point stream ───────────────────────────────────────────────────────────

class CatalogStream : public PointStream {
 public:
  CatalogStream(const CatalogResolver& resolver, std::vector<Entry> roots)
      : resolver_(resolver), walker_(resolver_, std::move(roots), false) {}

  bool next(PointRecord& out) override {
    while (true) {
      if (current_) {
        if (current_->next(out)) {
          out.weight = weight_;
          ++records_;
          return true;
        }
        current_.reset();
      }

      ResolvedEntry leaf;
      if (!walker_.next(leaf)) {
        if (!finished_) {
          finished_ = true;
          spdlog::debug("[Catalog] Resolved {} records from {} sources",
                        records_, sources_);
        }
        return false;
      }

      const auto& info = infoOf(leaf.entry);
      try {
        current_ = resolver_.openLeaf(leaf.entry);
      } catch (const SourceUnavailable& e) {
        spdlog::warn("[Catalog] Skipping {}: {}", info.path, e.what());
        continue;
      } catch (const UnsupportedFormat& e) {
        spdlog::warn("[Catalog] Skipping {}: {}", info.path, e.what());
        continue;
      } catch (const ExternalToolFailure& e) {
        spdlog::warn("[Catalog] Skipping {}: {}", info.path, e.what());
        continue;
      }
      weight_ = leaf.weight;
      ++sources_;
    }
  }

 private:
  // Copy: the stream outlives setter calls on the original resolver
  CatalogResolver resolver_;
  CatalogWalker walker_;
  PointStreamPtr current_;
  double weight_ = 1.0;
  size_t records_ = 0;
  size_t sources_ = 0;
  bool finished_ = false;
};

// ─── CatalogResolver ────────────────────────────────────────────────────────

CatalogResolver::CatalogResolver(const config::Xyz& layout,
                                 const config::Catalog& catalog,
                                 FormatRegistry registry)
    : layout_(layout),
      registry_(std::move(registry)),
      remote_padding_(catalog.remote_padding),
      cache_(std::make_shared<ExtentCache>(catalog.overwrite_extents,
                                           catalog.refresh_stale_extents)),
      weight_mode_(catalog.weight_mode) {
  if (catalog.use_weights) weight_override_ = 1.0;
}

Entry CatalogResolver::rootEntry(const std::string& ref) const {
  return parseEntry(ref, registry_);
}

PointStreamPtr CatalogResolver::resolve(const std::string& root) const {
  return resolve(std::vector<std::string>{root});
}

PointStreamPtr CatalogResolver::resolve(
    const std::vector<std::string>& roots) const {
  std::vector<Entry> entries;
  for (const auto& ref : roots) entries.push_back(rootEntry(ref));
  return resolveEntries(std::move(entries));
}

PointStreamPtr CatalogResolver::resolveEntries(std::vector<Entry> roots) const {
  return std::make_unique<CatalogStream>(*this, std::move(roots));
}

std::vector<ResolvedEntry> CatalogResolver::entries(
    const std::string& root, bool include_catalogs) const {
  CatalogWalker walker(*this, {rootEntry(root)}, include_catalogs);
  std::vector<ResolvedEntry> out;
  ResolvedEntry entry;
  while (walker.next(entry)) out.push_back(entry);
  return out;
}

std::optional<Region> CatalogResolver::extent(const Entry& entry) const {
  std::vector<std::string> visiting;
  return extentOf(entry, visiting);
}

std::optional<Region> CatalogResolver::extent(
    const std::vector<std::string>& roots) const {
  std::optional<Region> total;
  for (const auto& ref : roots) {
    auto ext = extent(rootEntry(ref));
    if (!ext) continue;
    total = total ? merge(*total, *ext) : *ext;
  }
  return total;
}

size_t CatalogResolver::dump(const std::string& root, std::ostream& out,
                             bool with_weight) const {
  auto stream = resolve(root);
  size_t n = 0;
  PointRecord pt;
  while (stream->next(pt)) {
    out << (with_weight
                ? fmt::format("{} {} {} {}\n", pt.x, pt.y, pt.z, pt.weight)
                : fmt::format("{} {} {}\n", pt.x, pt.y, pt.z));
    ++n;
  }
  return n;
}

double CatalogResolver::effectiveWeight(double entry_weight,
                                        double parent_weight) const {
  if (!weight_override_) return entry_weight;
  if (weight_mode_ == WeightMode::RootOnly) {
    return *weight_override_ * entry_weight;
  }
  return parent_weight * entry_weight;
}

bool CatalogResolver::admit(const Entry& entry) const {
  const auto kind = kindOf(entry);
  if (kind == FormatKind::Remote) return true;

  const auto& path = infoOf(entry).path;
  if (!fs::exists(path)) {
    spdlog::warn("[Catalog] Skipping {}: source unavailable", path);
    return false;
  }
  if (kind == FormatKind::Raster && !scanner_) {
    spdlog::warn("[Catalog] Skipping {}: no raster scanner configured", path);
    return false;
  }

  const bool pruning = region_ || z_lower_ || z_upper_;
  if (!pruning) return true;

  std::optional<Region> ext;
  try {
    ext = extent(entry);
  } catch (const ExternalToolFailure& e) {
    spdlog::warn("[Catalog] Skipping {}: {}", path, e.what());
    return false;
  } catch (const SourceUnavailable& e) {
    spdlog::warn("[Catalog] Skipping {}: {}", path, e.what());
    return false;
  }

  if (!ext) {
    // Catalogs without a known extent are descended; their children prune
    if (kind == FormatKind::Catalog) return true;
    spdlog::debug("[Catalog] {} has no data", path);
    return false;
  }
  if (region_ && !intersects(*region_, *ext)) {
    spdlog::debug("[Catalog] {} outside {}", path, formatRegion(*region_));
    return false;
  }
  if (!zRangePass(*ext, z_lower_, z_upper_)) {
    spdlog::debug("[Catalog] {} outside z-limits", path);
    return false;
  }
  return true;
}

std::optional<Region> CatalogResolver::extentOf(
    const Entry& entry, std::vector<std::string>& visiting) const {
  const auto& path = infoOf(entry).path;
  switch (kindOf(entry)) {
    case FormatKind::Remote:
      return std::nullopt;
    case FormatKind::Points:
      return cache_->get(path, [&] { return scanXyzExtent(path, layout_); });
    case FormatKind::Raster:
      if (!scanner_) return std::nullopt;
      return cache_->get(path, [&] { return scanner_->extent(path); });
    case FormatKind::Catalog:
      break;
  }

  const auto key = canonicalPath(path);
  if (onPath(visiting, key)) throw CatalogCycle(path);
  visiting.push_back(key);
  auto ext =
      cache_->get(path, [&] { return catalogExtent(path, visiting); });
  visiting.pop_back();
  return ext;
}

std::optional<Region> CatalogResolver::catalogExtent(
    const std::string& path, std::vector<std::string>& visiting) const {
  std::ifstream in(path);
  if (!in.is_open()) throw SourceUnavailable(path);

  const fs::path p(path);
  const auto dir = p.parent_path().string();
  const auto stem = p.stem().string();

  std::optional<Region> total;
  std::string line;
  while (std::getline(in, line)) {
    if (isIgnorableLine(line)) continue;
    Entry child;
    try {
      child = parseEntry(line, registry_, dir, stem);
    } catch (const UnsupportedFormat& e) {
      spdlog::warn("[Catalog] {}: {}", path, e.what());
      continue;
    } catch (const MalformedRecord& e) {
      spdlog::warn("[Catalog] {}: {}", path, e.what());
      continue;
    }

    const auto kind = kindOf(child);
    // Remote coverage is unknown until fetched, so neither is the catalog's
    if (kind == FormatKind::Remote) return std::nullopt;
    if (!fs::exists(infoOf(child).path)) continue;
    std::optional<Region> ext;
    try {
      ext = extentOf(child, visiting);
    } catch (const ExternalToolFailure& e) {
      spdlog::warn("[Catalog] {}: {}", infoOf(child).path, e.what());
      continue;
    }
    if (!ext) continue;
    total = total ? merge(*total, *ext) : *ext;
  }
  return total;
}

PointStreamPtr CatalogResolver::openLeaf(const Entry& entry) const {
  const auto& info = infoOf(entry);

  if (std::holds_alternative<PointEntry>(entry)) {
    auto reader = std::make_unique<XyzReader>(info.path, layout_);
    if (region_) reader->setRegion(*region_);
    reader->setZLimits(z_lower_, z_upper_);
    return reader;
  }

  if (std::holds_alternative<RasterEntry>(entry)) {
    if (!scanner_) {
      throw UnsupportedFormat("no raster scanner for " + info.path);
    }
    return scanner_->scan(info.path, region_, z_lower_, z_upper_);
  }

  if (const auto* remote = std::get_if<RemoteEntry>(&entry)) {
    auto plugin = fetch_ ? fetch_->find(remote->scheme) : nullptr;
    if (!plugin) {
      throw UnsupportedFormat("no fetch plugin for scheme '" +
                              remote->scheme + "'");
    }
    if (!region_) {
      throw UnsupportedFormat("remote source " + info.path +
                              " needs a query region");
    }
    const Region query = buffer(*region_, remote_padding_, true);
    spdlog::info("[Fetch] {} over {}", remote->scheme, formatRegion(query));
    return std::make_unique<FilteredPointStream>(
        plugin->fetch(query, remote->args), region_, z_lower_, z_upper_);
  }

  throw UnsupportedFormat("catalog entries are not point sources: " +
                          info.path);
}

}  // namespace datadem
