// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#include "datadem/catalog/format_registry.hpp"

#include <algorithm>
#include <cctype>

namespace datadem {

namespace {

std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}

// Extension of the final path component, without the dot.
std::string extensionOf(const std::string& path) {
  const auto slash = path.find_last_of('/');
  const auto name = slash == std::string::npos ? path : path.substr(slash + 1);
  const auto dot = name.find_last_of('.');
  if (dot == std::string::npos || dot + 1 >= name.size()) return {};
  return lower(name.substr(dot + 1));
}

}  // namespace

FormatRegistry FormatRegistry::defaults() {
  FormatRegistry r;
  r.add({-1, FormatKind::Catalog, {"datalist", "mb-1"}, ""});
  r.add({168, FormatKind::Points, {"xyz", "csv", "dat", "ascii"}, ""});
  r.add({200, FormatKind::Raster,
         {"tif", "img", "grd", "nc", "vrt", "bag", "asc"}, ""});
  r.add({400, FormatKind::Remote,
         {"nos", "dc", "gmrt", "srtm", "charts", "mb"}, ""});
  r.add({401, FormatKind::Remote, {}, "nos"});
  r.add({402, FormatKind::Remote, {}, "dc"});
  r.add({403, FormatKind::Remote, {}, "charts"});
  r.add({404, FormatKind::Remote, {}, "srtm"});
  r.add({406, FormatKind::Remote, {}, "mb"});
  r.add({408, FormatKind::Remote, {}, "gmrt"});
  return r;
}

void FormatRegistry::add(FormatSpec spec) {
  auto it = std::find_if(formats_.begin(), formats_.end(),
                         [&](const FormatSpec& f) { return f.code == spec.code; });
  if (it != formats_.end()) {
    *it = std::move(spec);
  } else {
    formats_.push_back(std::move(spec));
  }
}

std::optional<FormatSpec> FormatRegistry::find(int code) const {
  for (const auto& f : formats_) {
    if (f.code == code) return f;
  }
  return std::nullopt;
}

std::optional<int> FormatRegistry::lookup(const std::string& key) const {
  if (key.empty()) return std::nullopt;
  for (const auto& f : formats_) {
    if (std::find(f.extensions.begin(), f.extensions.end(), key) !=
        f.extensions.end()) {
      return f.code;
    }
  }
  return std::nullopt;
}

std::optional<int> FormatRegistry::infer(const std::string& path) const {
  if (auto code = lookup(extensionOf(path))) return code;
  // Scheme form, e.g. "nos:datatype=xyz"
  const auto colon = path.find(':');
  if (colon == std::string::npos) return std::nullopt;
  return lookup(lower(path.substr(0, colon)));
}

const char* toString(FormatKind kind) {
  switch (kind) {
    case FormatKind::Catalog:
      return "catalog";
    case FormatKind::Points:
      return "points";
    case FormatKind::Raster:
      return "raster";
    case FormatKind::Remote:
      return "remote";
  }
  return "unknown";
}

}  // namespace datadem
