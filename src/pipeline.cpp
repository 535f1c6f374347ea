#include "vpu/pipeline.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>

namespace vpu {

PipelineCoordinator::PipelineCoordinator(const Config& config, const Registry& reg,
                                         Memory& mem, Metrics& metrics)
    : config_(config), metrics_(metrics),
      dma_(mem, config.access_width), blitter_(mem, config) {
  // Un slot por índice de pipe (los índices vienen de la tabla)
  std::size_t n = 0;
  for (const auto& p : reg.pipes()) n = std::max<std::size_t>(n, p.index + 1u);
  pipes_.resize(n);
  for (const auto& p : reg.pipes()) {
    auto& slot  = pipes_[p.index];
    slot.id     = p.index;
    slot.name   = p.name;
    slot.prefix = p.prefix;
    slot.kind   = p.kind;
  }
}

void PipelineCoordinator::reset() {
  for (auto& p : pipes_) {
    p.state       = PipeState::Idle;
    p.stream_base = 0;
    p.countdown   = 0;
    p.kicks       = 0;
  }
  dma_.reset();
  blitter_.reset();
}

Pipeline& PipelineCoordinator::checked(PipeId id) {
  if (id >= pipes_.size() || pipes_[id].name.empty())
    throw ExecutionError("Pipe inexistente: " + std::to_string(id));
  return pipes_[id];
}

const Pipeline& PipelineCoordinator::pipe(PipeId id) const {
  if (id >= pipes_.size() || pipes_[id].name.empty())
    throw ExecutionError("Pipe inexistente: " + std::to_string(id));
  return pipes_[id];
}

bool PipelineCoordinator::is_busy(PipeId id) const { return pipe(id).busy(); }

std::size_t PipelineCoordinator::busy_count() const {
  std::size_t n = 0;
  for (const auto& p : pipes_)
    if (p.busy()) ++n;
  return n;
}

void PipelineCoordinator::ensure_idle(const Pipeline& p) const {
  if (p.busy()) {
    std::ostringstream oss;
    oss << "Kick a pipe ocupado: " << p.prefix << " (control stream en curso @0x"
        << std::hex << p.stream_base << ")";
    throw ExecutionError(oss.str());
  }
}

void PipelineCoordinator::check_kick(const Pipeline& p) const {
  ensure_idle(p);
  if (busy_count() >= config_.sched_queue_depth)
    throw ExecutionError("Cola del scheduler llena: " + std::to_string(busy_count()) +
                         " kicks en vuelo");
}

void PipelineCoordinator::mark_busy(Pipeline& p, Addr stream_base, std::uint64_t countdown) {
  check_kick(p);
  p.state       = PipeState::Busy;
  p.stream_base = stream_base;
  p.countdown   = countdown == 0 ? 1 : countdown;
  ++p.kicks;
  ++metrics_.kicks;
  VPU_LOG_IF(cfg::kLogPipe, "[PIPE " << p.prefix << "] kick @0x" << std::hex << stream_base
             << std::dec << " (" << p.countdown << ")");
}

void PipelineCoordinator::retire(Pipeline& p) {
  p.state     = PipeState::Idle;
  p.countdown = 0;
  VPU_LOG_IF(cfg::kLogPipe, "[PIPE " << p.prefix << "] idle");
}

// DMA: la operación termina antes de que la instrucción se retire
void PipelineCoordinator::run_dma(Pipeline& p, bool set, Word value) {
  ensure_idle(p);
  const std::uint64_t bytes = set ? dma_.fill(value) : dma_.copy();
  ++p.kicks;
  ++metrics_.kicks;
  ++metrics_.dma_ops;
  metrics_.dma_bytes += bytes;
  metrics_.dma_beats += dma_.beats(bytes);
}

void PipelineCoordinator::issue_kick(PipeId id, Addr stream_base, std::uint64_t countdown) {
  auto& p = checked(id);
  if (p.kind == PipeKind::Dma) {
    run_dma(p, /*set=*/false, 0);
    return;
  }
  mark_busy(p, stream_base, countdown);
}

void PipelineCoordinator::complete(PipeId id) {
  auto& p = checked(id);
  if (!p.busy()) return;
  // Si era un trabajo del blitter se termina de escribir
  if (p.kind == PipeKind::Blitter && blitter_.active()) {
    const auto& j = *blitter_.job();
    const bool clearing = j.kind == BlitJob::Kind::Clear;
    metrics_.pixels += blitter_.advance(j.total - j.done);
    if (clearing) ++metrics_.clears;
  }
  retire(p);
}

void PipelineCoordinator::advance_cycle() {
  for (auto& p : pipes_) {
    if (!p.busy()) continue;

    if (p.kind == PipeKind::Blitter && blitter_.active()) {
      const bool clearing = blitter_.job()->kind == BlitJob::Kind::Clear;
      metrics_.pixels += blitter_.advance(config_.pixels_per_cycle());
      if (!blitter_.active()) {
        if (clearing) ++metrics_.clears;
        retire(p);
      }
      continue;
    }

    if (p.countdown > 0) --p.countdown;
    if (p.countdown == 0) retire(p);
  }
}

void PipelineCoordinator::execute(const InstrDef& def, const std::array<Word, kMaxOperands>& values,
                                  Addr pc) {
  switch (def.op) {
    case Op::DMA_DST: dma_.set_dest(values[0]);   break;
    case Op::DMA_SRC: dma_.set_source(values[0]); break;
    case Op::DMA_LEN: dma_.set_length(values[0]); break;
    case Op::DMA_SET: run_dma(checked(def.pipe), /*set=*/true, values[0]); break;
    case Op::DMA_CPY: run_dma(checked(def.pipe), /*set=*/false, 0);        break;

    case Op::BLI_COL: blitter_.set_color(values[0]); break;
    case Op::BLI_CLR: {
      auto& p = checked(def.pipe);
      check_kick(p);
      mark_busy(p, pc, blitter_.start_clear());
      break;
    }
    case Op::BLI_PIX: {
      auto& p = checked(def.pipe);
      check_kick(p);
      mark_busy(p, pc, blitter_.start_pixel(values[0], values[1]));
      break;
    }

    default:
      throw ExecutionError("Instrucción sin despacho de hardware: " + def.mnemonic);
  }
}

} // namespace vpu
