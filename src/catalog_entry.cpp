// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * catalog_entry.cpp
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#include "datadem/catalog/entry.hpp"

#include <spdlog/fmt/fmt.h>

#include <filesystem>
#include <sstream>

#include "datadem/errors.hpp"

namespace fs = std::filesystem;

namespace datadem {

namespace {

std::vector<std::string> splitWhitespace(const std::string& line) {
  std::istringstream ss(line);
  std::vector<std::string> out;
  std::string tok;
  while (ss >> tok) out.push_back(tok);
  return out;
}

std::vector<std::string> splitOn(const std::string& text, char delim) {
  std::vector<std::string> out;
  std::string item;
  std::istringstream ss(text);
  while (std::getline(ss, item, delim)) out.push_back(item);
  return out;
}

int parseCode(const std::string& tok, const std::string& line) {
  size_t used = 0;
  int code = 0;
  try {
    code = std::stoi(tok, &used);
  } catch (const std::exception&) {
    used = 0;
  }
  if (used == 0 || used != tok.size()) {
    throw MalformedRecord("bad format code '" + tok + "' in entry '" + line +
                          "'");
  }
  return code;
}

double parseWeight(const std::string& tok, const std::string& line) {
  double w = 0.0;
  try {
    size_t used = 0;
    w = std::stod(tok, &used);
    if (used != tok.size()) w = 0.0;
  } catch (const std::exception&) {
    w = 0.0;
  }
  if (!(w > 0.0)) {
    throw MalformedRecord("bad weight '" + tok + "' in entry '" + line + "'");
  }
  return w;
}

}  // namespace

const EntryInfo& infoOf(const Entry& entry) {
  return std::visit([](const auto& e) -> const EntryInfo& { return e.info; },
                    entry);
}

EntryInfo& infoOf(Entry& entry) {
  return std::visit([](auto& e) -> EntryInfo& { return e.info; }, entry);
}

FormatKind kindOf(const Entry& entry) {
  switch (entry.index()) {
    case 0:
      return FormatKind::Catalog;
    case 1:
      return FormatKind::Points;
    case 2:
      return FormatKind::Raster;
    default:
      return FormatKind::Remote;
  }
}

bool isIgnorableLine(const std::string& line) {
  const auto first = line.find_first_not_of(" \t\r\n");
  return first == std::string::npos || line[first] == '#';
}

Entry parseEntry(const std::string& line, const FormatRegistry& registry,
                 const std::string& base_dir, const std::string& parent) {
  const auto fields = splitWhitespace(line);
  if (fields.empty()) throw MalformedRecord("empty catalog entry");

  EntryInfo info;
  info.parent = parent;
  const std::string& ref = fields[0];

  if (fields.size() > 1) {
    info.format_code = parseCode(fields[1], line);
  } else {
    auto inferred = registry.infer(ref);
    if (!inferred) {
      throw UnsupportedFormat("cannot infer format of '" + ref + "'");
    }
    info.format_code = *inferred;
  }
  if (fields.size() > 2) info.weight = parseWeight(fields[2], line);

  if (fields.size() > 3) {
    std::string joined = fields[3];
    for (size_t i = 4; i < fields.size(); ++i) joined += " " + fields[i];
    for (auto& m : splitOn(joined, ',')) {
      if (info.metadata.size() >= kMaxEntryMetadata) break;
      info.metadata.push_back(m);
    }
  }

  const auto spec = registry.find(info.format_code);
  if (!spec) {
    throw UnsupportedFormat(
        fmt::format("unsupported format {} for '{}'", info.format_code, ref));
  }

  if (spec->kind == FormatKind::Remote) {
    info.path = ref;
    RemoteEntry remote{info, {}, {}};
    auto parts = splitOn(ref, ':');
    if (spec->plugin.empty()) {
      remote.scheme = parts.empty() ? ref : parts[0];
      for (size_t i = 1; i < parts.size(); ++i) remote.args.push_back(parts[i]);
    } else {
      remote.scheme = spec->plugin;
    }
    return remote;
  }

  info.path = base_dir.empty() ? ref : (fs::path(base_dir) / ref).string();
  switch (spec->kind) {
    case FormatKind::Catalog:
      return CatalogEntry{info};
    case FormatKind::Points:
      return PointEntry{info};
    case FormatKind::Raster:
      return RasterEntry{info};
    case FormatKind::Remote:
      break;
  }
  throw UnsupportedFormat("unsupported entry kind for '" + ref + "'");
}

std::string formatEntry(const Entry& entry) {
  const auto& info = infoOf(entry);
  std::string out = fmt::format("{} {} {}", info.path, info.format_code,
                                info.weight);
  if (!info.metadata.empty()) {
    out += " ";
    for (size_t i = 0; i < info.metadata.size(); ++i) {
      if (i > 0) out += ",";
      out += info.metadata[i];
    }
  }
  return out;
}

}  // namespace datadem
