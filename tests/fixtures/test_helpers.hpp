#pragma once

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <cstdint>
#include <initializer_list>
#include <optional>
#include <span>
#include <vector>

#include "error.hpp"
#include "frame_splitter.hpp"

namespace robomaster {
namespace testing {

/**
 * @brief Helper to check if optional has value and matches expected
 */
template <typename T>
void ExpectOptionalEq(const std::optional<T>& opt, const T& expected) {
  ASSERT_TRUE(opt.has_value()) << "Optional should have a value";
  EXPECT_EQ(opt.value(), expected);
}

/**
 * @brief Helper to check if optional is empty
 */
template <typename T>
void ExpectOptionalEmpty(const std::optional<T>& opt) {
  EXPECT_FALSE(opt.has_value()) << "Optional should be empty";
}

/**
 * @brief Helper to check that a Result holds an error with the given code
 */
template <typename T>
void ExpectErrorCode(const Result<T>& result, ErrorCode code) {
  ASSERT_TRUE(IsError(result)) << "Result should hold an error";
  EXPECT_EQ(GetError(result).code, code)
      << "Got " << ToString(GetError(result).code) << ", expected "
      << ToString(code);
}

/**
 * @brief Byte vector from a literal list: Bytes({0x55, 0x0d, 0x04})
 */
inline std::vector<uint8_t> Bytes(std::initializer_list<uint8_t> bytes) {
  return std::vector<uint8_t>(bytes);
}

/**
 * @brief Vector copy of a span (for EXPECT_EQ against vectors)
 */
inline std::vector<uint8_t> ToVector(std::span<const uint8_t> bytes) {
  return std::vector<uint8_t>(bytes.begin(), bytes.end());
}

/**
 * @brief Build a received CAN frame with the given payload
 */
inline CanFrame MakeFrame(std::initializer_list<uint8_t> bytes,
                          uint32_t id = kControlArbitrationId,
                          bool extended = false) {
  CanFrame frame;
  frame.id = id;
  frame.extended = extended;
  for (uint8_t b : bytes) {
    if (frame.len == kMaxFrameData) break;
    frame.data[frame.len++] = b;
  }
  return frame;
}

/**
 * @brief Twist echo telemetry frame carrying the given device counter
 */
inline CanFrame MakeTwistEcho(uint16_t counter) {
  return MakeFrame({0x55, 0x1b, 0x04, 0x75, 0x09, 0xc3,
                    static_cast<uint8_t>(counter & 0xFF),
                    static_cast<uint8_t>((counter >> 8) & 0xFF)});
}

}  // namespace testing
}  // namespace robomaster
