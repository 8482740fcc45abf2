// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#include "datadem/region.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <numeric>
#include <sstream>
#include <stdexcept>

#include "datadem/errors.hpp"

namespace datadem {

namespace {

// Number of increment-sized cells needed to span an extent (at least 1).
int cellSpan(double extent, double increment) {
  const double cells = extent / increment;
  const int n = static_cast<int>(std::ceil(cells - 1e-9));
  return std::max(n, 1);
}

std::vector<std::string> split(const std::string& text, char delim) {
  std::vector<std::string> out;
  std::stringstream ss(text);
  std::string item;
  while (std::getline(ss, item, delim)) out.push_back(item);
  return out;
}

}  // namespace

// ─── Predicates ─────────────────────────────────────────────────────────────

bool isValid(const Region& r) {
  return r.west() < r.east() && r.south() < r.north();
}

bool intersects(const Region& a, const Region& b) {
  return a.west() <= b.east() && b.west() <= a.east() &&
         a.south() <= b.north() && b.south() <= a.north();
}

bool contains(const Region& r, double x, double y) {
  return x >= r.west() && x <= r.east() && y >= r.south() && y <= r.north();
}

bool containsStrict(const Region& r, double x, double y) {
  return x > r.west() && x < r.east() && y > r.south() && y < r.north();
}

bool zPass(double z, std::optional<double> lower,
           std::optional<double> upper) {
  if (upper && z > *upper) return false;
  if (lower && z < *lower) return false;
  return true;
}

bool zRangePass(const Region& r, std::optional<double> lower,
                std::optional<double> upper) {
  if (!r.hasZ()) return true;
  if (upper && *r.zMin() > *upper) return false;
  if (lower && *r.zMax() < *lower) return false;
  return true;
}

// ─── Operations ─────────────────────────────────────────────────────────────

Region reduce(const Region& a, const Region& b) {
  return {std::max(a.west(), b.west()), std::min(a.east(), b.east()),
          std::max(a.south(), b.south()), std::min(a.north(), b.north())};
}

Region merge(const Region& a, const Region& b) {
  Region out(std::min(a.west(), b.west()), std::max(a.east(), b.east()),
             std::min(a.south(), b.south()), std::max(a.north(), b.north()));
  if (a.hasZ() && b.hasZ()) {
    out = out.withZ(std::min(*a.zMin(), *b.zMin()),
                    std::max(*a.zMax(), *b.zMax()));
  }
  return out;
}

Region buffer(const Region& r, double value, bool is_percentage) {
  const double d =
      is_percentage ? (r.width() + r.height()) * value / 2.0 : value;
  Region out(r.west() - d, r.east() + d, r.south() - d, r.north() + d);
  if (r.hasZ()) out = out.withZ(*r.zMin(), *r.zMax());
  return out;
}

std::vector<Region> tile(const Region& r, double increment, int tile_cells) {
  if (!isValid(r)) {
    throw InvalidRegion("cannot tile degenerate region " + formatRegion(r));
  }
  if (increment <= 0.0 || tile_cells < 1) {
    throw std::invalid_argument("tile: increment must be > 0 and tile size >= 1");
  }

  const int cols = cellSpan(r.width(), increment);
  const int rows = cellSpan(r.height(), increment);
  const double step = increment * tile_cells;

  std::vector<Region> tiles;
  tiles.reserve(static_cast<size_t>((cols + tile_cells - 1) / tile_cells) *
                static_cast<size_t>((rows + tile_cells - 1) / tile_cells));

  for (int row = 0; row < rows; row += tile_cells) {
    const double s = r.south() + row * increment;
    const double n =
        (row + tile_cells >= rows) ? r.north() : std::min(r.north(), s + step);
    for (int col = 0; col < cols; col += tile_cells) {
      const double w = r.west() + col * increment;
      const double e =
          (col + tile_cells >= cols) ? r.east() : std::min(r.east(), w + step);
      tiles.emplace_back(w, e, s, n);
    }
  }
  return tiles;
}

double centerDistance(const Region& a, const Region& b) {
  return std::hypot(a.centerX() - b.centerX(), a.centerY() - b.centerY());
}

// ─── Text ───────────────────────────────────────────────────────────────────

std::string formatRegion(const Region& r, RegionFormat style) {
  switch (style) {
    case RegionFormat::Str:
      return fmt::format("{}/{}/{}/{}", r.west(), r.east(), r.south(),
                         r.north());
    case RegionFormat::Gmt:
      return fmt::format("-R{}/{}/{}/{}", r.west(), r.east(), r.south(),
                         r.north());
    case RegionFormat::BBox:
      return fmt::format("{},{},{},{}", r.west(), r.south(), r.east(),
                         r.north());
    case RegionFormat::Te:
      return fmt::format("{} {} {} {}", r.west(), r.south(), r.east(),
                         r.north());
    case RegionFormat::UlLr:
      return fmt::format("{} {} {} {}", r.west(), r.north(), r.east(),
                         r.south());
    case RegionFormat::Fn: {
      const char ns = r.north() < 0 ? 's' : 'n';
      const char ew = r.west() > 0 ? 'e' : 'w';
      const auto whole = [](double v) { return std::abs(static_cast<int>(v)); };
      const auto frac = [](double v) {
        return std::abs(static_cast<int>(v * 100)) % 100;
      };
      return fmt::format("{}{:02d}x{:02d}_{}{:03d}x{:02d}", ns, whole(r.north()),
                         frac(r.north()), ew, whole(r.west()), frac(r.west()));
    }
    case RegionFormat::Inf:
      if (r.hasZ()) {
        return fmt::format("{} {} {} {} {} {}", r.west(), r.east(), r.south(),
                           r.north(), *r.zMin(), *r.zMax());
      }
      return fmt::format("{} {} {} {}", r.west(), r.east(), r.south(),
                         r.north());
  }
  return {};
}

Region parseRegion(const std::string& text) {
  std::string body = text;
  if (body.rfind("-R", 0) == 0) body = body.substr(2);

  const auto parts = split(body, '/');
  if (parts.size() != 4 && parts.size() != 6) {
    throw InvalidRegion("region must be w/e/s/n[/zmin/zmax]: '" + text + "'");
  }

  std::vector<double> v;
  v.reserve(parts.size());
  for (const auto& p : parts) {
    try {
      v.push_back(std::stod(p));
    } catch (const std::exception&) {
      throw InvalidRegion("bad region value '" + p + "' in '" + text + "'");
    }
  }

  Region r(v[0], v[1], v[2], v[3]);
  if (v.size() == 6) r = r.withZ(v[4], v[5]);
  if (!isValid(r)) {
    throw InvalidRegion("degenerate region '" + text + "'");
  }
  return r;
}

double parseIncrement(const std::string& text) {
  if (text.empty()) throw std::invalid_argument("empty increment");

  const char unit = text.back();
  double divisor = 1.0;
  std::string number = text;
  if (unit == 's' || unit == 'c') {
    divisor = 3600.0;
    number.pop_back();
  } else if (unit == 'm') {
    divisor = 60.0;
    number.pop_back();
  }

  try {
    size_t used = 0;
    const double value = std::stod(number, &used);
    if (used != number.size()) throw std::invalid_argument(text);
    return value / divisor;
  } catch (const std::exception&) {
    throw std::invalid_argument("could not parse increment '" + text + "'");
  }
}

std::string incrementToString(double increment) {
  // Best rational approximation of the arc-second value with denominator <= 10
  const double arcsec = increment * 3600.0;
  long best_num = std::lround(arcsec);
  long best_den = 1;
  double best_err = std::abs(arcsec - static_cast<double>(best_num));
  for (long den = 2; den <= 10; ++den) {
    const long num = std::lround(arcsec * static_cast<double>(den));
    const double err =
        std::abs(arcsec - static_cast<double>(num) / static_cast<double>(den));
    if (err < best_err - 1e-12) {
      best_num = num;
      best_den = den;
      best_err = err;
    }
  }
  const long g = std::gcd(best_num, best_den);
  if (g > 1) {
    best_num /= g;
    best_den /= g;
  }
  if (best_den == 1) return std::to_string(best_num);
  return std::to_string(best_num) + std::to_string(best_den);
}

}  // namespace datadem
