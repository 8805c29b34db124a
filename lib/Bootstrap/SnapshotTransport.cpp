//===-- SnapshotTransport.cpp ---------------------------------------------===//
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

#include "stagebuild/Bootstrap/SnapshotManager.h"

#include "stagebuild/Basic/FileSystem.h"
#include "stagebuild/Basic/POSIXEnvironment.h"
#include "stagebuild/Basic/Subprocess.h"

#include "llvm/ADT/StringRef.h"

#include <atomic>
#include <string>
#include <utility>
#include <vector>

#include <signal.h>

using namespace stagebuild;
using namespace stagebuild::bootstrap;

namespace {

/// Variables forwarded to `curl` and `tar`; everything else is dropped.
const StringRef forwardedEnvironment[] = {
  "http_proxy", "https_proxy", "all_proxy", "no_proxy",
  "HTTP_PROXY", "HTTPS_PROXY", "ALL_PROXY", "NO_PROXY",
  "SSL_CERT_FILE", "SSL_CERT_DIR", "CURL_CA_BUNDLE",
};

/// Transport which fetches with `curl` and unpacks with `tar`.
///
/// Local paths and `file://` URLs are copied without spawning anything.
class DefaultSnapshotTransport : public SnapshotTransport {
  basic::FileSystem& fs;

  std::vector<std::pair<std::string, std::string>> environment;

  basic::ProcessGroup processGroup;

  std::atomic<bool> cancelled{false};

  bool run(ArrayRef<StringRef> commandLine, std::string* error_out) {
    basic::POSIXEnvironment env;
    for (const auto& entry: environment)
      env.setIfMissing(entry.first, entry.second);
    env.setIfMissing("PATH", "/usr/bin:/bin");
    env.setIfMissing("LC_ALL", "C");

    std::string output;
    std::string errors;
    auto result = basic::executeProcessAndCollect(
        processGroup, commandLine, std::move(env),
        { /*canSafelyInterrupt=*/true }, &output, &errors);

    switch (result.status) {
    case basic::ProcessStatus::Succeeded:
      return true;
    case basic::ProcessStatus::Cancelled:
      *error_out = "'" + commandLine[0].str() + "' was cancelled";
      return false;
    case basic::ProcessStatus::TimedOut:
    case basic::ProcessStatus::Failed:
      break;
    }

    std::string detail = StringRef(errors.empty() ? output : errors)
      .trim().str();
    *error_out = "'" + commandLine[0].str() + "' failed";
    if (result.exitCode >= 0)
      *error_out += " with exit code " + std::to_string(result.exitCode);
    else if (result.signal)
      *error_out += " with signal " + std::to_string(result.signal);
    if (!detail.empty())
      *error_out += ": " + detail;
    return false;
  }

public:
  DefaultSnapshotTransport(basic::FileSystem& fs,
                           const char* const* envp)
      : fs(fs) {
    for (auto name: forwardedEnvironment) {
      if (auto value = basic::lookupEnvironment(envp, name))
        environment.emplace_back(name.str(), *value);
    }
  }

  ~DefaultSnapshotTransport() override {}

  bool fetch(StringRef url, StringRef destination,
             std::string* error_out) override {
    if (cancelled) {
      *error_out = "cancelled";
      return false;
    }

    StringRef path = url;
    if (path.consume_front("file://") || !url.contains("://")) {
      return fs.copyTree(path.str(), destination.str(), error_out);
    }

    return run({ "curl", "--location", "--fail", "--silent", "--show-error",
                 "--output", destination, url }, error_out);
  }

  bool unpack(StringRef archive, StringRef destination,
              std::string* error_out) override {
    if (cancelled) {
      *error_out = "cancelled";
      return false;
    }

    return run({ "tar", "-xf", archive, "-C", destination }, error_out);
  }

  void cancel() override {
    cancelled = true;
    {
      std::lock_guard<std::mutex> lock(processGroup.mutex);
      processGroup.close();
    }
    processGroup.signalAll(SIGINT);
  }
};

}

std::unique_ptr<SnapshotTransport>
bootstrap::createDefaultSnapshotTransport(basic::FileSystem& fs,
                                          const char* const* environment) {
  return std::unique_ptr<SnapshotTransport>(
      new DefaultSnapshotTransport(fs, environment));
}
