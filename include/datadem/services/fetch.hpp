// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * fetch.hpp
 *
 * Remote data plugins, addressed by scheme ("nos", "srtm", ...).
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef DATADEM_SERVICES_FETCH_HPP
#define DATADEM_SERVICES_FETCH_HPP

#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "datadem/point_types.hpp"
#include "datadem/region.hpp"

namespace datadem {

/**
 * @brief Produces points for a region from a remote service.
 *
 * @throws SourceUnavailable when the service cannot be reached
 */
class FetchPlugin {
 public:
  virtual ~FetchPlugin() = default;

  virtual PointStreamPtr fetch(const Region& region,
                               const std::vector<std::string>& args) = 0;
};

/// Scheme to plugin lookup.
class FetchRegistry {
 public:
  FetchRegistry& add(const std::string& scheme,
                     std::shared_ptr<FetchPlugin> plugin) {
    plugins_[scheme] = std::move(plugin);
    return *this;
  }

  /// @return nullptr if no plugin is registered for scheme
  std::shared_ptr<FetchPlugin> find(const std::string& scheme) const {
    auto it = plugins_.find(scheme);
    return it == plugins_.end() ? nullptr : it->second;
  }

  bool contains(const std::string& scheme) const {
    return plugins_.count(scheme) > 0;
  }

 private:
  std::map<std::string, std::shared_ptr<FetchPlugin>> plugins_;
};

}  // namespace datadem

#endif  // DATADEM_SERVICES_FETCH_HPP
