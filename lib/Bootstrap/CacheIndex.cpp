//===-- CacheIndex.cpp ----------------------------------------------------===//
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

#include "CacheIndex.h"

#include "stagebuild/Basic/PlatformUtility.h"

#include "llvm/Support/raw_ostream.h"

#include <cassert>
#include <cerrno>
#include <cstring>

#include <sqlite3.h>

using namespace stagebuild;
using namespace stagebuild::bootstrap;

// Helper macro checking and returning error messages for failed SQLite calls
#define checkSQLiteResultOKReturnFalse(result) \
if (result != SQLITE_OK) { \
  *error_out = getCurrentErrorMessage(); \
  return false; \
}

namespace {

/// Version History:
/// * 2: Add `kind` and `content_digest`.
/// * 1: Initial schema.
const int currentSchemaVersion = 2;

std::string getColumnText(sqlite3_stmt* stmt, int column) {
  const unsigned char* text = sqlite3_column_text(stmt, column);
  if (!text)
    return std::string();
  return std::string(reinterpret_cast<const char*>(text),
                     sqlite3_column_bytes(stmt, column));
}

void readRow(sqlite3_stmt* stmt, CacheIndexRow& row) {
  assert(sqlite3_column_count(stmt) == 9);
  row.fingerprint = getColumnText(stmt, 0);
  row.stage = uint32_t(sqlite3_column_int64(stmt, 1));
  row.kind = uint8_t(sqlite3_column_int(stmt, 2));
  row.host = getColumnText(stmt, 3);
  row.target = getColumnText(stmt, 4);
  row.path = getColumnText(stmt, 5);
  row.contentDigest = getColumnText(stmt, 6);
  row.createdAt = uint64_t(sqlite3_column_int64(stmt, 7));
  row.valid = sqlite3_column_int(stmt, 8) != 0;
}

const char* const selectColumnsSQL =
  "SELECT fingerprint, stage, kind, host, target, path, content_digest, "
  "created_at, valid FROM entries";

}

CacheIndex::CacheIndex(StringRef path) : path(path.str()) {}

CacheIndex::~CacheIndex() {
  std::lock_guard<std::mutex> guard(dbMutex);
  close();
}

std::string CacheIndex::getCurrentErrorMessage() {
  int err_code = sqlite3_errcode(db);
  const char* err_message = sqlite3_errmsg(db);

  std::string out;
  llvm::raw_string_ostream outStream(out);
  outStream << "accessing cache index \"" << path << "\": " << err_message;

  if (err_code == SQLITE_BUSY || err_code == SQLITE_LOCKED) {
    outStream << " (possibly another stagebuild process is holding the cache)";
  }

  outStream.flush();
  return out;
}

void CacheIndex::close() {
  if (!db) return;

  int result = sqlite3_close(db);
  (void)result;
  assert(result == SQLITE_OK && "cache index has unfinalized statements");
  db = nullptr;
}

bool CacheIndex::createSchema(std::string* error_out) {
  char* cError = nullptr;

  // Create the schema in a single transaction.
  int result = sqlite3_exec(db, "BEGIN EXCLUSIVE;", nullptr, nullptr, &cError);

  if (result == SQLITE_OK) {
    result = sqlite3_exec(
      db, ("CREATE TABLE info ("
           "id INTEGER PRIMARY KEY, "
           "version INTEGER);"),
      nullptr, nullptr, &cError);
  }
  if (result == SQLITE_OK) {
    char* query = sqlite3_mprintf("INSERT INTO info VALUES (0, %d);",
                                  currentSchemaVersion);
    result = sqlite3_exec(db, query, nullptr, nullptr, &cError);
    sqlite3_free(query);
  }
  if (result == SQLITE_OK) {
    result = sqlite3_exec(
      db, ("CREATE TABLE entries ("
           "fingerprint TEXT PRIMARY KEY, "
           "stage INTEGER, "
           "kind INTEGER, "
           "host TEXT, "
           "target TEXT, "
           "path TEXT, "
           "content_digest TEXT, "
           "created_at INTEGER, "
           "valid INTEGER);"),
      nullptr, nullptr, &cError);
  }

  // Sync changes to disk.
  if (result == SQLITE_OK) {
    result = sqlite3_exec(db, "END;", nullptr, nullptr, &cError);
  }

  if (result != SQLITE_OK) {
    *error_out = std::string("unable to initialize cache index (") +
      (cError ? cError : sqlite3_errstr(result)) + ")";
    sqlite3_free(cError);
    return false;
  }
  return true;
}

bool CacheIndex::open(std::string* error_out) {
  std::lock_guard<std::mutex> guard(dbMutex);

  if (db) return true;

  int result = sqlite3_open(path.c_str(), &db);
  if (result != SQLITE_OK) {
    *error_out = "unable to open cache index: " + std::string(
        sqlite3_errstr(result));
    close();
    return false;
  }

  sqlite3_busy_timeout(db, 5000);

  // Read the schema version, if there is one.
  int version = -1;
  sqlite3_stmt* stmt;
  result = sqlite3_prepare_v2(db, "SELECT version FROM info LIMIT 1",
                              -1, &stmt, nullptr);
  if (result == SQLITE_OK) {
    result = sqlite3_step(stmt);
    if (result == SQLITE_ROW) {
      version = sqlite3_column_int(stmt, 0);
    } else if (result != SQLITE_DONE) {
      *error_out = getCurrentErrorMessage();
      sqlite3_finalize(stmt);
      close();
      return false;
    }
    sqlite3_finalize(stmt);
  } else if (result != SQLITE_ERROR && result != SQLITE_NOTADB &&
             result != SQLITE_CORRUPT) {
    *error_out = getCurrentErrorMessage();
    close();
    return false;
  }

  if (version == currentSchemaVersion)
    return true;

  // Always recreate the index from scratch when the schema changes; entries
  // without a row are then treated as corrupted and evicted.
  close();
  if (basic::sys::unlink(path.c_str()) == -1 && errno != ENOENT) {
    *error_out = std::string("unable to remove stale cache index: ") +
      ::strerror(errno);
    return false;
  }
  result = sqlite3_open(path.c_str(), &db);
  if (result != SQLITE_OK) {
    *error_out = "unable to open cache index: " + std::string(
        sqlite3_errstr(result));
    close();
    return false;
  }
  sqlite3_busy_timeout(db, 5000);

  if (!createSchema(error_out)) {
    close();
    return false;
  }
  return true;
}

bool CacheIndex::lookup(StringRef fingerprint, CacheIndexRow& row_out,
                        bool* found_out, std::string* error_out) {
  std::lock_guard<std::mutex> guard(dbMutex);
  assert(db && "cache index is not open");

  *found_out = false;

  std::string query = std::string(selectColumnsSQL) +
    " WHERE fingerprint == ?;";
  sqlite3_stmt* stmt;
  int result = sqlite3_prepare_v2(db, query.c_str(), -1, &stmt, nullptr);
  checkSQLiteResultOKReturnFalse(result);
  result = sqlite3_bind_text(stmt, /*index=*/1, fingerprint.data(),
                             fingerprint.size(), SQLITE_STATIC);
  if (result != SQLITE_OK) {
    *error_out = getCurrentErrorMessage();
    sqlite3_finalize(stmt);
    return false;
  }

  result = sqlite3_step(stmt);
  if (result == SQLITE_ROW) {
    readRow(stmt, row_out);
    *found_out = true;
  } else if (result != SQLITE_DONE) {
    *error_out = getCurrentErrorMessage();
    sqlite3_finalize(stmt);
    return false;
  }

  sqlite3_finalize(stmt);
  return true;
}

bool CacheIndex::insert(const CacheIndexRow& row, bool* inserted_out,
                        std::string* error_out) {
  std::lock_guard<std::mutex> guard(dbMutex);
  assert(db && "cache index is not open");

  *inserted_out = false;

  sqlite3_stmt* stmt;
  int result = sqlite3_prepare_v2(
    db, "INSERT OR IGNORE INTO entries VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?);",
    -1, &stmt, nullptr);
  checkSQLiteResultOKReturnFalse(result);

  int index = 1;
  result = sqlite3_bind_text(stmt, index++, row.fingerprint.data(),
                             row.fingerprint.size(), SQLITE_STATIC);
  if (result == SQLITE_OK)
    result = sqlite3_bind_int64(stmt, index++, row.stage);
  if (result == SQLITE_OK)
    result = sqlite3_bind_int(stmt, index++, row.kind);
  if (result == SQLITE_OK)
    result = sqlite3_bind_text(stmt, index++, row.host.data(),
                               row.host.size(), SQLITE_STATIC);
  if (result == SQLITE_OK)
    result = sqlite3_bind_text(stmt, index++, row.target.data(),
                               row.target.size(), SQLITE_STATIC);
  if (result == SQLITE_OK)
    result = sqlite3_bind_text(stmt, index++, row.path.data(),
                               row.path.size(), SQLITE_STATIC);
  if (result == SQLITE_OK)
    result = sqlite3_bind_text(stmt, index++, row.contentDigest.data(),
                               row.contentDigest.size(), SQLITE_STATIC);
  if (result == SQLITE_OK)
    result = sqlite3_bind_int64(stmt, index++, int64_t(row.createdAt));
  if (result == SQLITE_OK)
    result = sqlite3_bind_int(stmt, index++, row.valid ? 1 : 0);
  if (result != SQLITE_OK) {
    *error_out = getCurrentErrorMessage();
    sqlite3_finalize(stmt);
    return false;
  }

  result = sqlite3_step(stmt);
  if (result != SQLITE_DONE) {
    *error_out = getCurrentErrorMessage();
    sqlite3_finalize(stmt);
    return false;
  }
  *inserted_out = sqlite3_changes(db) != 0;

  sqlite3_finalize(stmt);
  return true;
}

bool CacheIndex::remove(StringRef fingerprint, std::string* error_out) {
  std::lock_guard<std::mutex> guard(dbMutex);
  assert(db && "cache index is not open");

  sqlite3_stmt* stmt;
  int result = sqlite3_prepare_v2(
    db, "DELETE FROM entries WHERE fingerprint == ?;", -1, &stmt, nullptr);
  checkSQLiteResultOKReturnFalse(result);
  result = sqlite3_bind_text(stmt, /*index=*/1, fingerprint.data(),
                             fingerprint.size(), SQLITE_STATIC);
  if (result != SQLITE_OK) {
    *error_out = getCurrentErrorMessage();
    sqlite3_finalize(stmt);
    return false;
  }

  result = sqlite3_step(stmt);
  if (result != SQLITE_DONE) {
    *error_out = getCurrentErrorMessage();
    sqlite3_finalize(stmt);
    return false;
  }

  sqlite3_finalize(stmt);
  return true;
}

bool CacheIndex::getRows(std::vector<CacheIndexRow>& rows_out,
                         std::string* error_out) {
  std::lock_guard<std::mutex> guard(dbMutex);
  assert(db && "cache index is not open");

  std::string query = std::string(selectColumnsSQL) +
    " ORDER BY fingerprint;";
  sqlite3_stmt* stmt;
  int result = sqlite3_prepare_v2(db, query.c_str(), -1, &stmt, nullptr);
  checkSQLiteResultOKReturnFalse(result);

  while (true) {
    result = sqlite3_step(stmt);
    if (result == SQLITE_DONE)
      break;
    if (result != SQLITE_ROW) {
      *error_out = getCurrentErrorMessage();
      sqlite3_finalize(stmt);
      return false;
    }

    CacheIndexRow row;
    readRow(stmt, row);
    rows_out.push_back(std::move(row));
  }

  sqlite3_finalize(stmt);
  return true;
}
