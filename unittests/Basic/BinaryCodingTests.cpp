//===-- BinaryCodingTests.cpp ---------------------------------------------===//
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

#include "stagebuild/Basic/BinaryCoding.h"

#include "gtest/gtest.h"

#include <string>

using namespace stagebuild;
using namespace stagebuild::basic;

struct StepRecord {
  uint32_t stage;
  std::string target;
  bool valid;
};

inline bool operator==(const StepRecord& lhs, const StepRecord& rhs) {
  return lhs.stage == rhs.stage && lhs.target == rhs.target &&
    lhs.valid == rhs.valid;
}

template<>
struct stagebuild::basic::BinaryCodingTraits<StepRecord> {
  static inline void encode(const StepRecord& value, BinaryEncoder& coder) {
    coder.write(value.stage);
    coder.writeString(value.target);
    coder.write(value.valid);
  }
  static inline void decode(StepRecord& value, BinaryDecoder& coder) {
    coder.read(value.stage);
    coder.readString(value.target);
    coder.read(value.valid);
  }
};

namespace {

TEST(BinaryCodingTests, integersAreLittleEndian) {
  BinaryEncoder encoder;
  encoder.write(uint16_t(0x0102));
  encoder.write(uint32_t(0x03040506));
  encoder.write(uint64_t(0x0708090A0B0C0D0EULL));

  std::vector<uint8_t> expected{
    0x02, 0x01,
    0x06, 0x05, 0x04, 0x03,
    0x0E, 0x0D, 0x0C, 0x0B, 0x0A, 0x09, 0x08, 0x07 };
  EXPECT_EQ(expected, encoder.contents());

  BinaryDecoder decoder(encoder.contents());
  uint16_t a;
  uint32_t b;
  uint64_t c;
  decoder.read(a);
  decoder.read(b);
  decoder.read(c);
  EXPECT_EQ(0x0102, a);
  EXPECT_EQ(0x03040506u, b);
  EXPECT_EQ(0x0708090A0B0C0D0EULL, c);
  EXPECT_TRUE(decoder.finish());
}

TEST(BinaryCodingTests, bytesAndStrings) {
  BinaryEncoder encoder;
  encoder.writeBytes(StringRef("stage"));
  encoder.writeString("x86_64-unknown-linux-gnu");
  encoder.writeString("");

  // Raw bytes carry no length, strings a 32-bit one.
  StringRef data = encoder.getData();
  EXPECT_EQ(StringRef("stage"), data.substr(0, 5));
  EXPECT_EQ(5u + 4u + 24u + 4u, data.size());

  BinaryDecoder decoder(data);
  StringRef bytes;
  std::string triple, empty = "unset";
  decoder.readBytes(5, bytes);
  decoder.readString(triple);
  decoder.readString(empty);
  EXPECT_EQ("stage", bytes);
  EXPECT_EQ("x86_64-unknown-linux-gnu", triple);
  EXPECT_EQ("", empty);
  EXPECT_TRUE(decoder.finish());
}

TEST(BinaryCodingTests, customType) {
  StepRecord record{ 2, "aarch64-apple-darwin", true };

  BinaryEncoder encoder;
  encoder.write(record);

  BinaryDecoder decoder(encoder.getData());
  StepRecord decoded{ 0, "", false };
  decoder.read(decoded);
  EXPECT_TRUE(decoder.finish());
  EXPECT_EQ(record, decoded);
}

TEST(BinaryCodingTests, truncatedInputIsAnError) {
  BinaryEncoder encoder;
  encoder.writeString("a long enough string");
  StringRef data = encoder.getData();

  // Cut into the string payload.
  BinaryDecoder decoder(data.drop_back(3));
  std::string value;
  decoder.readString(value);
  EXPECT_TRUE(decoder.hadError());
  EXPECT_FALSE(decoder.finish());

  // Reads past the end keep failing and yield zero.
  uint32_t number = 42;
  decoder.read(number);
  EXPECT_EQ(0u, number);
  EXPECT_TRUE(decoder.hadError());
}

TEST(BinaryCodingTests, trailingDataIsNotFinished) {
  BinaryEncoder encoder;
  encoder.write(uint8_t(1));
  encoder.write(uint8_t(2));

  BinaryDecoder decoder(encoder.getData());
  uint8_t value;
  decoder.read(value);
  EXPECT_FALSE(decoder.hadError());
  EXPECT_FALSE(decoder.isEmpty());
  EXPECT_FALSE(decoder.finish());
}

}
