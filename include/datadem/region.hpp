// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * region.hpp
 *
 * Axis-aligned bounding boxes (west/east/south/north, optional z-range)
 * and the pure operations on them: reduce, merge, buffer, tile.
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef DATADEM_REGION_HPP
#define DATADEM_REGION_HPP

#include <optional>
#include <string>
#include <vector>

namespace datadem {

/**
 * @brief Immutable 2D (optionally 3D) bounding box.
 *
 * A region is valid when west < east and south < north. Degenerate regions
 * can be constructed (e.g. as the result of reduce()) and must be checked
 * with isValid() before use.
 */
class Region {
 public:
  Region() = default;
  Region(double west, double east, double south, double north)
      : west_(west), east_(east), south_(south), north_(north) {}
  Region(double west, double east, double south, double north, double z_min,
         double z_max)
      : west_(west),
        east_(east),
        south_(south),
        north_(north),
        z_min_(z_min),
        z_max_(z_max) {}

  double west() const { return west_; }
  double east() const { return east_; }
  double south() const { return south_; }
  double north() const { return north_; }

  bool hasZ() const { return z_min_.has_value() && z_max_.has_value(); }
  std::optional<double> zMin() const { return z_min_; }
  std::optional<double> zMax() const { return z_max_; }

  double width() const { return east_ - west_; }
  double height() const { return north_ - south_; }
  double centerX() const { return west_ + width() / 2.0; }
  double centerY() const { return south_ + height() / 2.0; }

  /// Copy with the given z-range.
  Region withZ(double z_min, double z_max) const {
    return {west_, east_, south_, north_, z_min, z_max};
  }
  /// Copy without a z-range.
  Region xy() const { return {west_, east_, south_, north_}; }

  bool operator==(const Region& other) const {
    return west_ == other.west_ && east_ == other.east_ &&
           south_ == other.south_ && north_ == other.north_ &&
           z_min_ == other.z_min_ && z_max_ == other.z_max_;
  }
  bool operator!=(const Region& other) const { return !(*this == other); }

 private:
  double west_ = 0.0;
  double east_ = 0.0;
  double south_ = 0.0;
  double north_ = 0.0;
  std::optional<double> z_min_;
  std::optional<double> z_max_;
};

/// Output styles for formatRegion().
enum class RegionFormat {
  Str,    ///< w/e/s/n
  Gmt,    ///< -Rw/e/s/n
  BBox,   ///< w,s,e,n
  Te,     ///< w s e n
  UlLr,   ///< w n e s
  Fn,     ///< n40x25_w074x00 (file-name friendly)
  Inf,    ///< w e s n [zmin zmax]
};

// ─── Predicates ─────────────────────────────────────────────────────────────

/// west < east and south < north.
bool isValid(const Region& r);

/// True if the closed boxes overlap or touch. Used for extent pruning.
bool intersects(const Region& a, const Region& b);

/// Inclusive point-in-region test on x/y.
bool contains(const Region& r, double x, double y);

/// Strict interior test (points on the boundary are rejected).
bool containsStrict(const Region& r, double x, double y);

/// z within optional [lower, upper] limits.
bool zPass(double z, std::optional<double> lower, std::optional<double> upper);

/// False if the region's z-range lies wholly outside [lower, upper].
/// Regions without a z-range always pass.
bool zRangePass(const Region& r, std::optional<double> lower,
                std::optional<double> upper);

// ─── Operations ─────────────────────────────────────────────────────────────

/// Intersection. May be degenerate when a and b do not overlap.
Region reduce(const Region& a, const Region& b);

/// Smallest region containing both; z-ranges merged when both carry one.
Region merge(const Region& a, const Region& b);

/**
 * @brief Expand all four edges.
 *
 * @param value Absolute distance, or a fraction when is_percentage is true:
 *   the distance becomes ((east - west) + (north - south)) * value / 2.
 */
Region buffer(const Region& r, double value, bool is_percentage = false);

/**
 * @brief Split a region into tiles of tile_cells x tile_cells cells.
 *
 * Tiles are emitted row by row (south to north, west to east within a row).
 * The last row/column is clipped to the region's bound, so the tiles cover
 * the region exactly with shared edges.
 *
 * @throws InvalidRegion if r is degenerate.
 * @throws std::invalid_argument if increment <= 0 or tile_cells < 1.
 */
std::vector<Region> tile(const Region& r, double increment, int tile_cells);

/// Planar distance between two region centers (region units).
double centerDistance(const Region& a, const Region& b);

// ─── Text ───────────────────────────────────────────────────────────────────

std::string formatRegion(const Region& r,
                         RegionFormat style = RegionFormat::Gmt);

/**
 * @brief Parse "w/e/s/n[/zmin/zmax]", optionally prefixed with "-R".
 * @throws InvalidRegion on malformed text or a degenerate box.
 */
Region parseRegion(const std::string& text);

/**
 * @brief Parse a GMT-style increment: "6s"/"6c" arc-seconds, "1m"
 * arc-minutes, or a plain number in region units.
 * @throws std::invalid_argument on malformed text.
 */
double parseIncrement(const std::string& text);

/// Arc-second fraction string used in generated names (1/3" -> "13").
std::string incrementToString(double increment);

}  // namespace datadem

#endif  // DATADEM_REGION_HPP
