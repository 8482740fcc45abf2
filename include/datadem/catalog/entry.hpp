// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * entry.hpp
 *
 * Parsed catalog lines as a closed set of entry types.
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef DATADEM_CATALOG_ENTRY_HPP
#define DATADEM_CATALOG_ENTRY_HPP

#include <string>
#include <variant>
#include <vector>

#include "datadem/catalog/format_registry.hpp"

namespace datadem {

/// Maximum number of metadata fields kept per entry.
constexpr size_t kMaxEntryMetadata = 8;

/// Fields common to every entry kind.
struct EntryInfo {
  std::string path;  ///< Resolved path, or the raw reference for remotes
  int format_code = 0;
  double weight = 1.0;                ///< The entry's own weight
  std::vector<std::string> metadata;  ///< Up to kMaxEntryMetadata fields
  std::string parent;                 ///< Stem of the listing catalog
};

struct CatalogEntry {
  EntryInfo info;
};

struct PointEntry {
  EntryInfo info;
};

struct RasterEntry {
  EntryInfo info;
};

struct RemoteEntry {
  EntryInfo info;
  std::string scheme;             ///< Plugin key
  std::vector<std::string> args;  ///< "key=value" arguments after the scheme
};

using Entry = std::variant<CatalogEntry, PointEntry, RasterEntry, RemoteEntry>;

const EntryInfo& infoOf(const Entry& entry);
EntryInfo& infoOf(Entry& entry);
FormatKind kindOf(const Entry& entry);

/**
 * @brief Parse one catalog line: "path [format] [weight] [meta,meta,...]".
 *
 * Missing format is inferred from the extension or scheme, missing weight
 * defaults to 1. Local paths are joined to base_dir.
 *
 * @param line Non-comment, non-blank catalog line
 * @param registry Known formats
 * @param base_dir Directory of the listing catalog ("" = as given)
 * @param parent Stem of the listing catalog
 * @throws UnsupportedFormat if the format is unknown or cannot be inferred
 * @throws MalformedRecord if format or weight fields are not numbers, or the
 *   weight is not positive
 */
Entry parseEntry(const std::string& line, const FormatRegistry& registry,
                 const std::string& base_dir = "",
                 const std::string& parent = "");

/// True for lines the catalog reader ignores ('#' comments, blank lines).
bool isIgnorableLine(const std::string& line);

/// Render an entry back to catalog-line form.
std::string formatEntry(const Entry& entry);

}  // namespace datadem

#endif  // DATADEM_CATALOG_ENTRY_HPP
