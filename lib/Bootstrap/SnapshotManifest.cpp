//===-- SnapshotManifest.cpp ----------------------------------------------===//
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

#include "stagebuild/Bootstrap/SnapshotManifest.h"

#include "stagebuild/Basic/FileSystem.h"
#include "stagebuild/Bootstrap/BootstrapError.h"

#include "YAMLReader.h"

#include "llvm/Support/Casting.h"
#include "llvm/Support/MemoryBuffer.h"

using namespace stagebuild;
using namespace stagebuild::bootstrap;

namespace {

class ManifestParser {
  YAMLReader& reader;
  std::map<Platform, SnapshotEntry>& entries;
  std::map<Platform, std::string>& rejected;

public:
  ManifestParser(YAMLReader& reader,
                 std::map<Platform, SnapshotEntry>& entries,
                 std::map<Platform, std::string>& rejected)
      : reader(reader), entries(entries), rejected(rejected) {}

  void parseRoot(llvm::yaml::Node* root) {
    auto mapping = llvm::dyn_cast<llvm::yaml::MappingNode>(root);
    if (!mapping) {
      reader.error(root, "unexpected top-level node (expected map)");
      return;
    }

    bool sawSnapshots = false;
    for (auto& entry: *mapping) {
      auto keyNode = llvm::dyn_cast<llvm::yaml::ScalarNode>(entry.getKey());
      if (!keyNode ||
          YAMLReader::stringFromScalarNode(keyNode) != "snapshots") {
        reader.error(entry.getKey(),
                     "unexpected top-level key (expected 'snapshots')");
        return;
      }
      auto snapshots =
        llvm::dyn_cast<llvm::yaml::MappingNode>(entry.getValue());
      if (!snapshots) {
        reader.error(entry.getValue(),
                     "unexpected 'snapshots' value (expected map)");
        return;
      }
      sawSnapshots = true;
      for (auto& snapshot: *snapshots) {
        if (!parseSnapshot(snapshot))
          return;
      }
    }

    if (!sawSnapshots)
      reader.error(root, "missing 'snapshots' map");
  }

  bool parseSnapshot(llvm::yaml::KeyValueNode& node) {
    std::string spelling;
    if (!reader.readString(node.getKey(), "platform", spelling))
      return false;
    auto platform = Platform::parse(spelling);
    if (!platform) {
      reader.error(node.getKey(),
                   describeError(platform.takeError()).message);
      return false;
    }
    if (entries.count(*platform) || rejected.count(*platform)) {
      reader.error(node.getKey(),
                   "duplicate snapshot for '" + platform->str() + "'");
      return false;
    }

    auto fields = llvm::dyn_cast<llvm::yaml::MappingNode>(node.getValue());
    if (!fields) {
      reader.error(node.getValue(),
                   "unexpected snapshot value (expected map)");
      return false;
    }

    SnapshotEntry result;
    result.platform = *platform;
    bool sawURL = false, sawChecksum = false, sawVersion = false;
    for (auto& field: *fields) {
      std::string key;
      if (!reader.readString(field.getKey(), "key", key))
        return false;

      if (key == "url") {
        if (!reader.readString(field.getValue(), key, result.url))
          return false;
        if (result.url.empty()) {
          reader.error(field.getValue(), "invalid empty 'url'");
          return false;
        }
        sawURL = true;
      } else if (key == "checksum") {
        std::string checksum;
        if (!reader.readString(field.getValue(), key, checksum))
          return false;
        StringRef hex = checksum;
        if (!hex.consume_front("sha256:")) {
          reader.error(field.getValue(),
                       "invalid checksum '" + checksum +
                       "' (expected 'sha256:<hex>')");
          return false;
        }
        auto digest = basic::Digest::fromHex(hex);
        if (!digest) {
          reader.error(field.getValue(),
                       "invalid checksum '" + checksum +
                       "' (expected 64 hexadecimal digits)");
          return false;
        }
        result.checksum = *digest;
        sawChecksum = true;
      } else if (key == "format-version") {
        if (!reader.readUnsigned(field.getValue(), key, result.formatVersion))
          return false;
        sawVersion = true;
      } else {
        reader.error(field.getKey(), "unknown snapshot key '" + key + "'");
        return false;
      }
    }

    if (!sawURL || !sawChecksum || !sawVersion) {
      reader.error(node.getValue(),
                   "snapshot for '" + platform->str() +
                   "' requires 'url', 'checksum' and 'format-version'");
      return false;
    }

    if (result.formatVersion != SnapshotManifest::SupportedFormatVersion) {
      rejected[*platform] = "unsupported snapshot format version " +
        std::to_string(result.formatVersion) + " (expected " +
        std::to_string(SnapshotManifest::SupportedFormatVersion) + ")";
      return true;
    }

    entries[*platform] = std::move(result);
    return true;
  }
};

}

llvm::Expected<SnapshotManifest> SnapshotManifest::parse(StringRef contents,
                                                         StringRef path) {
  SnapshotManifest result;
  YAMLReader reader(contents, path);
  ManifestParser parser(reader, result.entries, result.rejected);
  if (!reader.readDocument([&](llvm::yaml::Node* root) {
        parser.parseRoot(root);
      })) {
    return reader.takeError(ErrorKind::InvalidConfiguration);
  }
  return std::move(result);
}

llvm::Expected<SnapshotManifest> SnapshotManifest::load(basic::FileSystem& fs,
                                                        StringRef path) {
  auto buffer = fs.getFileContents(path.str());
  if (!buffer) {
    return makeError(ErrorKind::InvalidConfiguration,
                     "unable to read snapshot manifest '" + path + "'");
  }
  return parse(buffer->getBuffer(), path);
}

llvm::Expected<SnapshotEntry>
SnapshotManifest::lookup(const Platform& platform) const {
  auto it = entries.find(platform);
  if (it != entries.end())
    return it->second;

  ErrorContext context;
  context.stage = 0;
  context.platform = platform.str();

  auto rejectedIt = rejected.find(platform);
  if (rejectedIt != rejected.end()) {
    return makeError(ErrorKind::PlatformUnsupported,
                     "no usable snapshot for '" + platform.str() + "': " +
                     rejectedIt->second, context);
  }
  return makeError(ErrorKind::PlatformUnsupported,
                   "no snapshot for '" + platform.str() +
                   "' in the snapshot manifest", context);
}

std::vector<Platform> SnapshotManifest::getPlatforms() const {
  std::vector<Platform> result;
  for (const auto& it: entries)
    result.push_back(it.first);
  return result;
}
