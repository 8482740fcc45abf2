// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * errors.hpp
 *
 * Exception taxonomy shared by the catalog, gridding and uncertainty stages.
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef DATADEM_ERRORS_HPP
#define DATADEM_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace datadem {

/// Base class for all datadem runtime failures.
class Error : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

/// Missing or unreadable source. Entry is skipped, run continues.
class SourceUnavailable : public Error {
 public:
  explicit SourceUnavailable(const std::string& path)
      : Error("source unavailable: " + path), path_(path) {}

  const std::string& path() const { return path_; }

 private:
  std::string path_;
};

/// Unknown format code or extension. Entry is skipped.
class UnsupportedFormat : public Error {
 public:
  using Error::Error;
};

/// Unparsable point record. Only the offending line is skipped.
class MalformedRecord : public Error {
 public:
  using Error::Error;
};

/// Degenerate bounding box where a valid one is required. Fatal.
class InvalidRegion : public Error {
 public:
  using Error::Error;
};

/// A collaborator (interpolation, proximity, raster I/O) failed.
/// Fails the current tile/chunk.
class ExternalToolFailure : public Error {
 public:
  using Error::Error;
};

/// A catalog references itself, directly or through descendants.
class CatalogCycle : public Error {
 public:
  explicit CatalogCycle(const std::string& path)
      : Error("catalog cycle detected at " + path), path_(path) {}

  const std::string& path() const { return path_; }

 private:
  std::string path_;
};

}  // namespace datadem

#endif  // DATADEM_ERRORS_HPP
