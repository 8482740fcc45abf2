// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * spatial_metadata.cpp
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#include "datadem/metadata/spatial_metadata.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>
#include <filesystem>
#include <map>
#include <thread>

#include "datadem/errors.hpp"
#include "datadem/grid/binning.hpp"
#include "datadem/metadata/work_queue.hpp"

namespace datadem {

std::vector<std::string> metadataFieldNames() {
  return {kMetadataFields.begin(), kMetadataFields.end()};
}

std::vector<std::string> metadataValues(const EntryInfo& info,
                                        const std::string& name) {
  if (info.metadata.size() == kMetadataFields.size()) return info.metadata;
  return {name,    "Unknown", "0",      "xyz_elevation",
          "Unknown", "WGS84",   "NAVD88", "URL"};
}

MultiPolygon polygonize(const Raster& mask) {
  struct Run {
    int c0, c1;  // inclusive column span
    int r0;      // first row
  };

  const auto& gt = mask.spec().transform;
  MultiPolygon out;
  const auto emit = [&](const Run& run, int last_row) {
    const double x0 = gt.origin_x + run.c0 * gt.cell_x;
    const double x1 = gt.origin_x + (run.c1 + 1) * gt.cell_x;
    const double y0 = gt.origin_y + run.r0 * gt.cell_y;
    const double y1 = gt.origin_y + (last_row + 1) * gt.cell_y;
    Ring ring{{x0, y1}, {x1, y1}, {x1, y0}, {x0, y0}, {x0, y1}};
    out.push_back(Polygon{ring});
  };

  // Open runs keyed by column span
  std::map<std::pair<int, int>, Run> open;
  for (int r = 0; r < mask.rows(); ++r) {
    std::map<std::pair<int, int>, Run> next;
    int c = 0;
    while (c < mask.cols()) {
      if (!mask.isValid(r, c) || mask(r, c) == 0.0f) {
        ++c;
        continue;
      }
      const int c0 = c;
      while (c < mask.cols() && mask.isValid(r, c) && mask(r, c) != 0.0f) ++c;
      const auto key = std::make_pair(c0, c - 1);
      auto it = open.find(key);
      if (it != open.end()) {
        next.emplace(key, it->second);
        open.erase(it);
      } else {
        next.emplace(key, Run{c0, c - 1, r});
      }
    }
    for (const auto& kv : open) emit(kv.second, r - 1);
    open = std::move(next);
  }
  for (const auto& kv : open) emit(kv.second, mask.rows() - 1);
  return out;
}

bool SpatialMetadata::footprint(const ResolvedEntry& entry,
                                const GridSpec& spec, Feature& feature) const {
  const auto& info = infoOf(entry.entry);
  const auto name = std::filesystem::path(info.path).stem().string();

  CatalogResolver local = resolver_;
  local.setRegion(spec.region);
  auto stream = local.resolveEntries({entry.entry});
  const Raster mask = GridBinner(BinMode::Presence).bin(*stream, spec);

  feature.geometry = polygonize(mask);
  if (feature.geometry.empty()) {
    spdlog::debug("[Metadata] {} has no data in region", name);
    return false;
  }

  const auto values = metadataValues(info, name);
  for (size_t i = 0; i < kMetadataFields.size(); ++i) {
    feature.attributes[kMetadataFields[i]] = values[i];
  }
  return true;
}

size_t SpatialMetadata::run(const std::string& root, const Region& region,
                            double increment, VectorLayer& layer) {
  const double inc = std::max(increment, cfg_.min_increment);
  const auto spec = GridSpec::fromRegion(region, inc);

  CatalogResolver pruned = resolver_;
  pruned.setRegion(region);
  std::vector<ResolvedEntry> catalogs;
  for (auto& e : pruned.entries(root, true)) {
    if (e.depth == 1 && kindOf(e.entry) == FormatKind::Catalog) {
      catalogs.push_back(std::move(e));
    }
  }
  spdlog::info("[Metadata] {} sub-catalogs over {} at {}", catalogs.size(),
               formatRegion(region), inc);

  WorkQueue<ResolvedEntry> queue;
  size_t appended = 0;
  std::exception_ptr failure;

  const auto worker = [&] {
    while (auto item = queue.pop()) {
      try {
        Feature feature;
        if (footprint(*item, spec, feature)) {
          std::lock_guard<std::mutex> lock(layer_mutex_);
          layer.append(feature);
          ++appended;
        }
      } catch (const Error& e) {
        spdlog::warn("[Metadata] Skipping {}: {}", infoOf(item->entry).path,
                     e.what());
      } catch (...) {
        std::lock_guard<std::mutex> lock(layer_mutex_);
        if (!failure) failure = std::current_exception();
      }
      queue.taskDone();
    }
  };

  const int n_workers = std::max(1, cfg_.workers);
  std::vector<std::thread> pool;
  pool.reserve(n_workers);
  for (int i = 0; i < n_workers; ++i) pool.emplace_back(worker);

  for (auto& c : catalogs) queue.push(std::move(c));
  queue.join();
  queue.close();
  for (auto& t : pool) t.join();

  if (failure) std::rethrow_exception(failure);
  spdlog::info("[Metadata] Appended {} footprints", appended);
  return appended;
}

}  // namespace datadem
