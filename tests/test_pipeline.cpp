#include "vpu/pipeline.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>

using namespace vpu;

namespace {

constexpr PipeId kSched   = 0;
constexpr PipeId kDma     = 1;
constexpr PipeId kBlitter = 2;

class PipelineTest : public ::testing::Test {
protected:
  std::array<Word, kMaxOperands> vals(Word a = 0, Word b = 0) const { return {a, b, 0}; }

  Config              config_ = test::small_config();
  Memory              mem_{config_.memory_bytes};
  Metrics             metrics_;
  PipelineCoordinator pipes_{config_, Registry::instance(), mem_, metrics_};
};

} // namespace

TEST_F(PipelineTest, StartsWithAllPipesIdle) {
  ASSERT_EQ(pipes_.pipes().size(), 3u);
  EXPECT_EQ(pipes_.pipe(kSched).prefix, "SCH");
  EXPECT_EQ(pipes_.pipe(kDma).kind, PipeKind::Dma);
  EXPECT_EQ(pipes_.pipe(kBlitter).kind, PipeKind::Blitter);
  EXPECT_EQ(pipes_.busy_count(), 0u);
  EXPECT_TRUE(pipes_.barrier_ready());
}

TEST_F(PipelineTest, ExternalKickRetiresAfterCountdown) {
  pipes_.issue_kick(kSched, 0x1000, 3);
  EXPECT_TRUE(pipes_.is_busy(kSched));
  EXPECT_EQ(pipes_.pipe(kSched).stream_base, 0x1000u);
  EXPECT_FALSE(pipes_.barrier_ready());

  pipes_.advance_cycle();
  pipes_.advance_cycle();
  EXPECT_TRUE(pipes_.is_busy(kSched));
  pipes_.advance_cycle();
  EXPECT_FALSE(pipes_.is_busy(kSched));
  EXPECT_TRUE(pipes_.barrier_ready());
  EXPECT_EQ(metrics_.kicks, 1u);
}

TEST_F(PipelineTest, KickingBusyPipeIsFatalRegardlessOfElapsedCycles) {
  pipes_.issue_kick(kSched, 0x1000, 10);
  EXPECT_THROW(pipes_.issue_kick(kSched, 0x2000), ExecutionError);
  for (int i = 0; i < 5; ++i) pipes_.advance_cycle();
  EXPECT_THROW(pipes_.issue_kick(kSched, 0x2000), ExecutionError);
  // el kick en vuelo no se pisa
  EXPECT_EQ(pipes_.pipe(kSched).stream_base, 0x1000u);
}

TEST_F(PipelineTest, CompleteForcesIdle) {
  pipes_.issue_kick(kBlitter, 0x40, 1000);
  pipes_.complete(kBlitter);
  EXPECT_FALSE(pipes_.is_busy(kBlitter));
  EXPECT_NO_THROW(pipes_.complete(kBlitter));
  EXPECT_NO_THROW(pipes_.issue_kick(kBlitter, 0x80));
}

TEST_F(PipelineTest, QueueDepthBoundsBusyPipes) {
  config_.sched_queue_depth = 1;
  pipes_.issue_kick(kSched, 0x10, 5);
  EXPECT_THROW(pipes_.execute(test::def_of("BLI.CLR", {}), vals(), 0x20), ExecutionError);
  EXPECT_FALSE(pipes_.blitter().active());
  EXPECT_FALSE(pipes_.is_busy(kBlitter));
}

TEST_F(PipelineTest, DmaKickIsSynchronousAndNeverBusy) {
  mem_.write32(0x100, 0xCAFEBABEu);
  pipes_.execute(test::def_of("DMA.SRC", {OperandType::REG}), vals(0x100), 0);
  pipes_.execute(test::def_of("DMA.DST", {OperandType::REG}), vals(0x200), 4);
  pipes_.execute(test::def_of("DMA.LEN", {OperandType::REG}), vals(4), 8);
  EXPECT_EQ(pipes_.dma().source(), 0x100u);
  EXPECT_EQ(pipes_.dma().dest(), 0x200u);
  EXPECT_EQ(pipes_.dma().length(), 4u);
  pipes_.execute(test::def_of("DMA.CPY", {}), vals(), 12);

  EXPECT_FALSE(pipes_.is_busy(kDma));
  EXPECT_EQ(mem_.read32(0x200), 0xCAFEBABEu);

  pipes_.execute(test::def_of("DMA.SET", {OperandType::REG}), vals(0xAB), 16);
  EXPECT_EQ(mem_.read32(0x200), 0xABABABABu);
  EXPECT_FALSE(pipes_.is_busy(kDma));

  // kick externo al DMA: repite la copia configurada
  mem_.write32(0x100, 0x01020304u);
  pipes_.issue_kick(kDma, 0);
  EXPECT_FALSE(pipes_.is_busy(kDma));
  EXPECT_EQ(mem_.read32(0x200), 0x01020304u);

  EXPECT_EQ(metrics_.dma_ops, 3u);
  EXPECT_EQ(metrics_.dma_bytes, 12u);
  EXPECT_EQ(metrics_.dma_beats, 3u);
}

TEST_F(PipelineTest, PixelKickWritesOnNextAdvance) {
  pipes_.execute(test::def_of("BLI.COL", {OperandType::REG}), vals(0x00FF00), 0);
  pipes_.execute(test::def_of("BLI.PIX", {OperandType::REG, OperandType::REG}), vals(5, 7), 4);
  EXPECT_TRUE(pipes_.is_busy(kBlitter));
  EXPECT_EQ(pipes_.blitter().pixel(5, 7), 0u);

  pipes_.advance_cycle();
  EXPECT_FALSE(pipes_.is_busy(kBlitter));
  EXPECT_EQ(pipes_.blitter().pixel(5, 7), 0x00FF00u);
  EXPECT_EQ(metrics_.pixels, 1u);
}

TEST_F(PipelineTest, ClearTakesFramebufferOverPixelsPerCycle) {
  ASSERT_EQ(config_.pixels_per_cycle(), 16u);
  pipes_.execute(test::def_of("BLI.COL", {OperandType::REG}), vals(0x123456), 0);
  pipes_.execute(test::def_of("BLI.CLR", {}), vals(), 4);

  int cycles = 0;
  while (pipes_.is_busy(kBlitter)) {
    pipes_.advance_cycle();
    ++cycles;
  }
  EXPECT_EQ(cycles, 320 * 240 / 16);
  EXPECT_EQ(metrics_.clears, 1u);
  EXPECT_EQ(metrics_.pixels, 320u * 240u);
  EXPECT_EQ(pipes_.blitter().pixel(0, 0), 0x123456u);
  EXPECT_EQ(pipes_.blitter().pixel(319, 239), 0x123456u);
}

TEST_F(PipelineTest, CompleteDrainsActiveBlitterJob) {
  pipes_.execute(test::def_of("BLI.COL", {OperandType::REG}), vals(0xFF), 0);
  pipes_.execute(test::def_of("BLI.CLR", {}), vals(), 4);
  pipes_.advance_cycle();
  pipes_.complete(kBlitter);
  EXPECT_FALSE(pipes_.blitter().active());
  EXPECT_EQ(pipes_.blitter().pixel(319, 239), 0xFFu);
  EXPECT_EQ(metrics_.pixels, 320u * 240u);
  EXPECT_EQ(metrics_.clears, 1u);
}

TEST_F(PipelineTest, BarrierIsNotDispatchedToPipes) {
  EXPECT_THROW(pipes_.execute(test::def_of("SCH.FNC", {}), vals(), 0), ExecutionError);
  EXPECT_THROW(pipes_.execute(test::def_of("NOP", {}), vals(), 0), ExecutionError);
  EXPECT_EQ(pipes_.busy_count(), 0u);
}

TEST_F(PipelineTest, UnknownPipeIsFatal) {
  EXPECT_THROW(pipes_.issue_kick(7, 0), ExecutionError);
  EXPECT_THROW(pipes_.is_busy(3), ExecutionError);
  EXPECT_THROW(pipes_.complete(15), ExecutionError);
}

TEST_F(PipelineTest, ResetReturnsToIdle) {
  pipes_.issue_kick(kSched, 0x10, 50);
  pipes_.execute(test::def_of("BLI.CLR", {}), vals(), 4);
  pipes_.reset();
  EXPECT_EQ(pipes_.busy_count(), 0u);
  EXPECT_FALSE(pipes_.blitter().active());
  EXPECT_EQ(pipes_.pipe(kSched).kicks, 0u);
}
