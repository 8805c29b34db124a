//===- CacheIndex.h ---------------------------------------------*- C++ -*-===//
//
// This source file is part of the Swift.org open source project
//
// Copyright (c) 2026 Apple Inc. and the Swift project authors
// Licensed under Apache License v2.0 with Runtime Library Exception
//
// See http://swift.org/LICENSE.txt for license information
// See http://swift.org/CONTRIBUTORS.txt for the list of Swift project authors
//
//===----------------------------------------------------------------------===//

#ifndef STAGEBUILD_BOOTSTRAP_CACHEINDEX_H
#define STAGEBUILD_BOOTSTRAP_CACHEINDEX_H

#include "stagebuild/Basic/Compiler.h"
#include "stagebuild/Basic/LLVM.h"

#include "llvm/ADT/StringRef.h"

#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

struct sqlite3;

namespace stagebuild {
namespace bootstrap {

/// A row of the cache index, as stored.
///
/// Values are kept in their textual form; interpreting (and rejecting) them is
/// left to the cache.
struct CacheIndexRow {
  std::string fingerprint;
  uint32_t stage = 0;
  uint8_t kind = 0;
  std::string host;
  std::string target;
  /// The entry directory, relative to the cache directory.
  std::string path;
  std::string contentDigest;
  uint64_t createdAt = 0;
  bool valid = true;
};

/// The SQLite index of committed cache entries.
///
/// A row is only inserted once its entry directory is complete, so the index
/// is the commit point of the cache. All methods are thread-safe.
class CacheIndex {
  CacheIndex(const CacheIndex&) STAGEBUILD_DELETED_FUNCTION;
  void operator=(const CacheIndex&) STAGEBUILD_DELETED_FUNCTION;

  std::string path;

  sqlite3* db = nullptr;

  /// The mutex to protect all access to the database.
  std::mutex dbMutex;

  std::string getCurrentErrorMessage();

  bool createSchema(std::string* error_out);

  void close();

public:
  explicit CacheIndex(StringRef path);
  ~CacheIndex();

  /// Open the index, creating (or recreating, on a schema version mismatch)
  /// it as necessary.
  bool open(std::string* error_out);

  /// Find the row for \p fingerprint.
  ///
  /// \param found_out Set to whether the row exists.
  /// \returns False on a database error.
  bool lookup(StringRef fingerprint, CacheIndexRow& row_out, bool* found_out,
              std::string* error_out);

  /// Insert \p row unless a row for the same fingerprint exists.
  bool insert(const CacheIndexRow& row, bool* inserted_out,
              std::string* error_out);

  bool remove(StringRef fingerprint, std::string* error_out);

  /// Get all rows, ordered by fingerprint.
  bool getRows(std::vector<CacheIndexRow>& rows_out, std::string* error_out);
};

}
}

#endif
