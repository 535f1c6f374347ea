#include "vpu/dma.hpp"
#include "vpu/memory.hpp"
#include <gtest/gtest.h>

using namespace vpu;

namespace {

class DmaTest : public ::testing::Test {
protected:
  Memory    mem_{1024 * 1024};
  DmaEngine dma_{mem_, 64};
};

} // namespace

TEST_F(DmaTest, SetTruncatesValueToLowByte) {
  dma_.set_dest(0x100);
  dma_.set_length(16);
  EXPECT_EQ(dma_.fill(0x1234), 16u);
  for (Addr a = 0x100; a < 0x110; ++a) EXPECT_EQ(mem_.read8(a), 0x34);
  EXPECT_EQ(mem_.read8(0xFF), 0);
  EXPECT_EQ(mem_.read8(0x110), 0);
}

TEST_F(DmaTest, CopyMovesLengthBytes) {
  for (Addr a = 0; a < 32; ++a) mem_.write8(0x200 + a, static_cast<std::uint8_t>(a + 1));
  dma_.set_source(0x200);
  dma_.set_dest(0x400);
  dma_.set_length(32);
  EXPECT_EQ(dma_.copy(), 32u);
  for (Addr a = 0; a < 32; ++a) EXPECT_EQ(mem_.read8(0x400 + a), a + 1);
  EXPECT_EQ(mem_.read8(0x420), 0);
}

TEST_F(DmaTest, OverlappingCopyIsDeterministic) {
  for (Addr a = 0; a < 8; ++a) mem_.write8(0x10 + a, static_cast<std::uint8_t>(a));
  dma_.set_source(0x10);
  dma_.set_dest(0x12);
  dma_.set_length(8);
  dma_.copy();
  for (Addr a = 0; a < 8; ++a) EXPECT_EQ(mem_.read8(0x12 + a), a);
}

TEST_F(DmaTest, ZeroLengthDoesNothing) {
  dma_.set_dest(0x10);
  dma_.set_length(0);
  EXPECT_EQ(dma_.fill(0xFF), 0u);
  EXPECT_EQ(mem_.read8(0x10), 0);
}

TEST_F(DmaTest, OutOfRangeIsFatal) {
  dma_.set_dest(1024 * 1024 - 4);
  dma_.set_length(8);
  EXPECT_THROW(dma_.fill(1), ExecutionError);
  dma_.set_source(0);
  EXPECT_THROW(dma_.copy(), ExecutionError);
}

TEST_F(DmaTest, BeatsRoundUpToAccessWidth) {
  EXPECT_EQ(dma_.beats(0x10000), 1024u);
  EXPECT_EQ(dma_.beats(1), 1u);
  EXPECT_EQ(dma_.beats(65), 2u);
  EXPECT_EQ(dma_.beats(0), 0u);
}
