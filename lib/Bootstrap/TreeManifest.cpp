//===-- TreeManifest.cpp --------------------------------------------------===//
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

#include "stagebuild/Bootstrap/TreeManifest.h"

#include <algorithm>

using namespace stagebuild;
using namespace stagebuild::bootstrap;

basic::Digest TreeManifest::getDigest() const {
  basic::BinaryEncoder coder;
  coder.writeString("stagebuild.tree.v1");
  coder.write(*this);
  return basic::hashBytes(coder.getData());
}

const TreeManifestEntry* TreeManifest::find(StringRef path) const {
  auto it = std::lower_bound(entries.begin(), entries.end(), path,
                             [](const TreeManifestEntry& entry,
                                StringRef path) {
                               return StringRef(entry.path) < path;
                             });
  if (it == entries.end() || it->path != path)
    return nullptr;
  return &*it;
}

bool bootstrap::computeTreeManifest(basic::FileSystem& fs, StringRef root,
                                    ArrayRef<std::string> ignorePatterns,
                                    bool hashContents, TreeManifest& result,
                                    std::string* error_out) {
  std::vector<basic::TreeEntry> items;
  if (!fs.listTree(root.str(), ignorePatterns, items, error_out))
    return false;

  result.entries.clear();
  result.entries.reserve(items.size());
  for (const auto& item: items) {
    TreeManifestEntry entry;
    entry.path = item.path;
    entry.kind = item.info.kind;
    switch (item.info.kind) {
    case basic::FileInfo::Kind::File:
      entry.size = item.info.size;
      entry.isExecutable = item.info.isExecutable;
      if (hashContents &&
          !basic::hashFile(root.str() + "/" + item.path, entry.digest,
                           error_out))
        return false;
      break;
    case basic::FileInfo::Kind::Symlink:
      entry.size = item.linkTarget.size();
      entry.digest = basic::hashBytes(item.linkTarget);
      break;
    case basic::FileInfo::Kind::Directory:
      break;
    case basic::FileInfo::Kind::Missing:
      // Removed while we were walking the tree.
      *error_out = "'" + root.str() + "/" + item.path +
        "' disappeared while it was being read";
      return false;
    case basic::FileInfo::Kind::Other:
      *error_out = "unsupported file type at '" + root.str() + "/" +
        item.path + "'";
      return false;
    }
    result.entries.push_back(std::move(entry));
  }
  return true;
}

std::vector<std::string> bootstrap::diffTreeManifests(const TreeManifest& lhs,
                                                      const TreeManifest& rhs,
                                                      unsigned limit) {
  std::vector<std::string> result;
  auto lit = lhs.entries.begin(), lend = lhs.entries.end();
  auto rit = rhs.entries.begin(), rend = rhs.entries.end();
  while ((lit != lend || rit != rend) && result.size() < limit) {
    if (rit == rend || (lit != lend && lit->path < rit->path)) {
      result.push_back("only in the first tree: " + lit->path);
      ++lit;
    } else if (lit == lend || rit->path < lit->path) {
      result.push_back("only in the second tree: " + rit->path);
      ++rit;
    } else {
      if (*lit != *rit) {
        if (lit->kind != rit->kind)
          result.push_back("file type differs: " + lit->path);
        else if (lit->isExecutable != rit->isExecutable)
          result.push_back("permissions differ: " + lit->path);
        else
          result.push_back("contents differ: " + lit->path);
      }
      ++lit;
      ++rit;
    }
  }
  return result;
}
