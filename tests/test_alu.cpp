#include "vpu/alu.hpp"
#include <gtest/gtest.h>
#include <cstdint>
#include <limits>

using namespace vpu;

TEST(Alu, AddWrapsToZeroAndSetsZero) {
  const auto r = alu::add(0xFFFFFFFFu, 1);
  EXPECT_EQ(r.value, 0u);
  EXPECT_TRUE(r.zero);
  EXPECT_FALSE(r.overflow); // -1 + 1
}

TEST(Alu, AddSignedOverflow) {
  auto r = alu::add(0x7FFFFFFFu, 1);
  EXPECT_EQ(r.value, 0x80000000u);
  EXPECT_TRUE(r.overflow);
  EXPECT_FALSE(r.zero);

  r = alu::add(0x80000000u, 0x80000000u);
  EXPECT_TRUE(r.overflow);
  EXPECT_TRUE(r.zero);
}

// C sii (a+b) mod 2^32 == 0; O sii la suma con signo no entra en 32 bits
TEST(Alu, AddFlagsMatchReferenceArithmetic) {
  const Word samples[] = {0u, 1u, 2u, 0x7FFFFFFFu, 0x80000000u, 0x80000001u,
                          0xFFFFFFFEu, 0xFFFFFFFFu, 0x00FFFFFFu, 0x12345678u};
  for (Word a : samples) {
    for (Word b : samples) {
      const auto r = alu::add(a, b);
      const std::int64_t s = static_cast<std::int64_t>(static_cast<std::int32_t>(a)) +
                              static_cast<std::int32_t>(b);
      const bool ovf = s > std::numeric_limits<std::int32_t>::max() ||
                       s < std::numeric_limits<std::int32_t>::min();
      EXPECT_EQ(r.value, static_cast<Word>(a + b));
      EXPECT_EQ(r.zero, static_cast<Word>(a + b) == 0) << a << "+" << b;
      EXPECT_EQ(r.overflow, ovf) << a << "+" << b;
    }
  }
}

TEST(Alu, ArithmeticShiftKeepsSign) {
  EXPECT_EQ(alu::asr(0x80000000u, 4), 0xF8000000u);
  EXPECT_EQ(alu::asr(0x40000000u, 4), 0x04000000u);
  EXPECT_EQ(alu::asr(0x80000000u, 0), 0x80000000u);
  EXPECT_EQ(alu::asr(0x80000000u, 40), 0xFFFFFFFFu);
  EXPECT_EQ(alu::asr(0x40000000u, 40), 0u);
}

TEST(Alu, LogicalShiftsDropSign) {
  EXPECT_EQ(alu::lsr(0x80000000u, 4), 0x08000000u);
  EXPECT_EQ(alu::lsl(1u, 31), 0x80000000u);
  EXPECT_EQ(alu::lsl(1u, 32), 0u);
  EXPECT_EQ(alu::lsr(0xFFFFFFFFu, 32), 0u);
  EXPECT_EQ(alu::lsl(0xFFFu, 20), 0xFFF00000u);
}
