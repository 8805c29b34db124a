//===-- CommandLineStatusOutput.cpp ---------------------------------------===//
//
// This source file is part of the Swift.org open source project
//
// Copyright (c) 2014 - 2026 Apple Inc. and the Swift project authors
// Licensed under Apache License v2.0 with Runtime Library Exception
//
// See http://swift.org/LICENSE.txt for license information
// See http://swift.org/CONTRIBUTORS.txt for the list of Swift project authors
//
//===----------------------------------------------------------------------===//

#include "CommandLineStatusOutput.h"

#include "stagebuild/Basic/POSIXEnvironment.h"

#include "llvm/Support/Process.h"

#include <algorithm>
#include <cassert>
#include <cctype>

using namespace stagebuild;

namespace {

struct CommandLineStatusOutputImpl {
  /// The output stream.
  FILE* fp{nullptr};

  /// Whether the output device supports ANSI color.
  bool stripColor{true};

  /// Whether the output stream honors '\r'.
  bool termHonorsCarriageReturn{false};

  /// Whether the stream has current output.
  bool hasOutput{false};

  /// Whether the stream has been closed.
  bool isClosed{false};

  /// The number of characters written to the current line.
  int numCurrentCharacters{0};

  CommandLineStatusOutputImpl() {}

  ~CommandLineStatusOutputImpl() {
    if (isOpen()) {
      std::string error;
      close(&error);
    }
  }

  bool isOpen() const {
    return fp != nullptr;
  }

  bool open(FILE* output, const char* const* environment,
            std::string* error_out) {
    assert(!isOpen() && !isClosed);
    if (!output) {
      *error_out = "no output stream";
      return false;
    }
    fp = output;

    // Only rewrite lines on an interactive terminal which understands '\r'.
    if (llvm::sys::Process::FileDescriptorIsDisplayed(fileno(fp))) {
      auto term = basic::lookupEnvironment(environment, "TERM");
      if (term && *term != "dumb") {
        termHonorsCarriageReturn = true;
        stripColor = false;
      }
    }

    if (basic::lookupEnvironment(environment, "NO_COLOR"))
      stripColor = true;
    if (auto force = basic::lookupEnvironment(environment, "CLICOLOR_FORCE"))
      stripColor = *force == "0";

    return true;
  }

  bool close(std::string* error_out) {
    if (hasOutput) {
      fprintf(fp, "\n");
      hasOutput = false;
    }
    if (fflush(fp) != 0) {
      *error_out = "unable to flush output";
      fp = nullptr;
      isClosed = true;
      return false;
    }

    fp = nullptr;
    isClosed = true; // Don't allow re-opening.
    return true;
  }

  bool canUpdateCurrentLine() const {
    assert(isOpen());
    return termHonorsCarriageReturn;
  }

  void clearOutput() {
    assert(isOpen());
    assert(canUpdateCurrentLine());

    if (hasOutput) {
      // Clear the line before writing, this tends to produce better results
      // than clearing the unwritten tail of the line written below.
      fprintf(fp, "\r%*s\r", numCurrentCharacters, "");
      fflush(fp);
      hasOutput = false;
    }
  }

  int getNumColumns() {
    auto result = llvm::sys::Process::StandardOutColumns();
    if (!result) {
      return 80;
    }
    return result;
  }

  static bool isEscape(char c) { return c == '\x1b'; }

  static size_t countBytesIgnoringColors(const std::string& s) {
    size_t count = 0;
    bool inAnsiSequence = false;
    for (char c: s) {
      if (isEscape(c)) {
        inAnsiSequence = true;
      } else if (inAnsiSequence) {
        inAnsiSequence = !::isalpha(c);
      } else {
        count++;
      }
    }
    return count;
  }

  void stripColorCodes(std::string& s) {
    if (!stripColor) {
      return;
    }
    std::string result;
    bool inAnsiSequence = false;
    for (char c: s) {
      if (isEscape(c)) {
        inAnsiSequence = true;
      } else if (inAnsiSequence) {
        inAnsiSequence = !::isalpha(c);
      } else {
        result += c;
      }
    }
    s = std::move(result);
  }

  void setCurrentLine(const std::string& attributedText) {
    assert(isOpen());
    assert(attributedText.find('\r') == std::string::npos);
    assert(attributedText.find('\n') == std::string::npos);

    clearOutput();

    std::string text = attributedText;
    stripColorCodes(text);

    // Step names end with the platform, so elide the middle of long lines.
    int columns = getNumColumns();
    if (columns > 3 && (int)text.size() > columns) {
      int midpoint = columns / 2;
      text = text.substr(0, std::max(0, midpoint - 2)) + "..." +
        text.substr(text.size() - (columns - (midpoint + 1)));
    }

    fprintf(fp, "%s", text.c_str());
    numCurrentCharacters = countBytesIgnoringColors(text);
    fflush(fp);

    hasOutput = numCurrentCharacters != 0;
  }

  void setOrWriteLine(const std::string& text) {
    if (canUpdateCurrentLine())
      return setCurrentLine(text);
    writeText(text + "\n");
  }

  void finishLine() {
    assert(isOpen());

    if (canUpdateCurrentLine() && hasOutput) {
      fputc('\n', fp);
      fflush(fp);
      hasOutput = false;
    }
  }

  void writeText(std::string text) {
    assert(isOpen());
    assert(text.size() && text.back() == '\n');

    if (hasOutput)
      clearOutput();

    stripColorCodes(text);
    fwrite(text.c_str(), text.size(), 1, fp);
    fflush(fp);
  }
};

}

namespace stagebuild {
namespace commands {

CommandLineStatusOutput::CommandLineStatusOutput()
    : impl(new CommandLineStatusOutputImpl())
{
}

CommandLineStatusOutput::~CommandLineStatusOutput() {
  delete static_cast<CommandLineStatusOutputImpl*>(impl);
}

bool CommandLineStatusOutput::open(FILE* fp, const char* const* environment,
                                   std::string* error_out) {
  return static_cast<CommandLineStatusOutputImpl*>(impl)->open(
      fp, environment, error_out);
}

bool CommandLineStatusOutput::close(std::string* error_out) {
  return static_cast<CommandLineStatusOutputImpl*>(impl)->close(error_out);
}

bool CommandLineStatusOutput::canUpdateCurrentLine() const {
  return
    static_cast<CommandLineStatusOutputImpl*>(impl)->canUpdateCurrentLine();
}

void CommandLineStatusOutput::clearOutput() {
  return static_cast<CommandLineStatusOutputImpl*>(impl)->clearOutput();
}

void CommandLineStatusOutput::setCurrentLine(const std::string& text) {
  return
    static_cast<CommandLineStatusOutputImpl*>(impl)->setCurrentLine(text);
}

void CommandLineStatusOutput::setOrWriteLine(const std::string& text) {
  return
    static_cast<CommandLineStatusOutputImpl*>(impl)->setOrWriteLine(text);
}

void CommandLineStatusOutput::finishLine() {
  return static_cast<CommandLineStatusOutputImpl*>(impl)->finishLine();
}

void CommandLineStatusOutput::writeText(std::string text) {
  return
    static_cast<CommandLineStatusOutputImpl*>(impl)->writeText(std::move(text));
}

}
}
