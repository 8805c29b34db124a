//===-- FakeToolchain.cpp -------------------------------------------------===//
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

#include "FakeToolchain.h"
#include "TempDir.h"

#include "stagebuild/Basic/FileSystem.h"

#include "llvm/ADT/SmallVector.h"
#include "llvm/Support/MemoryBuffer.h"

using namespace stagebuild;
using namespace stagebuild::unittests;

std::string unittests::getFakeBuildToolScript(StringRef logPath) {
  std::string script = R"(#!/bin/sh
mode=$1
shift
while [ $# -gt 0 ]; do
  case "$1" in
    --stage) stage=$2; shift 2 ;;
    --host) host=$2; shift 2 ;;
    --target) target=$2; shift 2 ;;
    --source-dir) src=$2; shift 2 ;;
    --output-dir) out=$2; shift 2 ;;
    --artifact-dir) artifact=$2; shift 2 ;;
    *) echo "unknown argument '$1'" >&2; exit 2 ;;
  esac
done
)";
  script += "echo \"$mode $stage $host $target\" >> '" + logPath.str() +
    "'\n";
  script += R"SH(
if [ "$mode" = "test" ]; then
  if [ -f "$src/fail-tests" ]; then
    echo "error: 1 test failed" >&2
    exit 1
  fi
  [ -x "$artifact/bin/build-tool" ] || exit 4
  echo "all tests passed"
  exit 0
fi

if [ -f "$src/sleep-stage-$stage" ]; then
  sleep "$(cat "$src/sleep-stage-$stage")"
fi
if [ -f "$src/fail-stage-$stage" ]; then
  echo "main.src:1:1: error: cannot compile stage $stage" >&2
  exit 1
fi
if [ -f "$src/fail-target-$target" ]; then
  echo "main.src:1:1: error: no backend for $target" >&2
  exit 1
fi
if [ -f "$src/crash-stage-$stage" ]; then
  exit 3
fi

mkdir -p "$out/bin" "$out/lib" || exit 5
cp "$0" "$out/bin/build-tool" || exit 5
cat "$src"/*.src > "$out/lib/stdlib" 2>/dev/null
echo "$target" > "$out/lib/target"
if [ -f "$src/nondeterministic" ]; then
  echo "$stage" > "$out/lib/stage"
fi
echo "built stage $stage for $target"
exit 0
)SH";
  return script;
}

std::string unittests::writeFakeToolchain(TmpDir& tmp, StringRef relativeDir,
                                          StringRef logPath) {
  tmp.writeFile(relativeDir.str() + "/bin/build-tool",
                getFakeBuildToolScript(logPath), /*executable=*/true);
  return tmp.path(relativeDir);
}

std::vector<std::string> unittests::readInvocationLog(StringRef logPath) {
  std::vector<std::string> result;
  auto buffer = llvm::MemoryBuffer::getFile(logPath);
  if (!buffer)
    return result;
  SmallVector<StringRef, 16> lines;
  (*buffer)->getBuffer().split(lines, '\n', -1, /*KeepEmpty=*/false);
  for (auto line: lines)
    result.push_back(line.str());
  return result;
}

basic::Digest FakeSnapshotTransport::addSnapshot(StringRef url,
                                                 StringRef contents,
                                                 StringRef toolchainDir) {
  std::lock_guard<std::mutex> guard(mutex);
  snapshots[url] = Snapshot{ contents.str(), toolchainDir.str() };
  return basic::hashBytes(contents);
}

bool FakeSnapshotTransport::fetch(StringRef url, StringRef destination,
                                  std::string* error_out) {
  ++numFetches;
  if (failuresRemaining != 0) {
    --failuresRemaining;
    *error_out = "connection reset by peer";
    return false;
  }

  std::string contents;
  {
    std::lock_guard<std::mutex> guard(mutex);
    auto it = snapshots.find(url);
    if (it == snapshots.end()) {
      *error_out = "404 not found: " + url.str();
      return false;
    }
    contents = it->second.contents;
  }

  auto fs = basic::createLocalFileSystem();
  return fs->writeFileContents(destination.str(), contents, error_out);
}

bool FakeSnapshotTransport::unpack(StringRef archive, StringRef destination,
                                   std::string* error_out) {
  ++numUnpacks;
  auto fs = basic::createLocalFileSystem();
  auto buffer = fs->getFileContents(archive.str());
  if (!buffer) {
    *error_out = "unable to read archive";
    return false;
  }

  std::string toolchainDir;
  {
    std::lock_guard<std::mutex> guard(mutex);
    for (const auto& entry: snapshots) {
      if (entry.getValue().contents == buffer->getBuffer())
        toolchainDir = entry.getValue().toolchainDir;
    }
  }
  if (toolchainDir.empty()) {
    *error_out = "unrecognized archive format";
    return false;
  }

  // Archives wrap their contents in a single directory.
  return fs->copyTree(toolchainDir, destination.str() + "/toolchain",
                      error_out);
}

std::string unittests::getManifestEntryText(const bootstrap::Platform& platform,
                                            StringRef url,
                                            const basic::Digest& checksum,
                                            unsigned formatVersion) {
  return "  " + platform.str() + ":\n" +
    "    url: " + url.str() + "\n" +
    "    checksum: sha256:" + checksum.toHex() + "\n" +
    "    format-version: " + std::to_string(formatVersion) + "\n";
}
