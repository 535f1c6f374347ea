#pragma once
#include "branch_predictor.hpp"
#include "config.hpp"
#include "isa.hpp"
#include "memory.hpp"
#include "metrics.hpp"
#include "pipeline.hpp"
#include "types.hpp"
#include <algorithm>
#include <cstdint>
#include <optional>
#include <vector>

namespace vpu {

// Estado arquitectónico: R1..Rn, ACC, PC y los flags C/O
struct CpuState {
  std::vector<Word> regs;
  Word acc{0};
  Addr pc{0};
  bool flag_c{false};
  bool flag_o{false};
  bool halted{false};
  bool waiting{false};   // parada en barrera

  explicit CpuState(std::size_t num_regs) : regs(num_regs, 0) {}

  void reset(Addr entry) {
    std::fill(regs.begin(), regs.end(), 0);
    acc = 0;
    pc = entry;
    flag_c = flag_o = false;
    halted = waiting = false;
  }
};

class Processor {
public:
  Processor(const Config& config, const Registry& reg, Memory& mem,
            PipelineCoordinator& pipes, BranchPredictor& bp, Metrics& metrics);

  void reset(Addr entry = 0);

  // Un ciclo: fetch + decode + execute de una instrucción (o espera en barrera)
  void step();

  bool halted() const  { return st_.halted; }
  bool waiting() const { return st_.waiting; }

  // Por ID de registro (incluye ACC y PC)
  Word get_reg(RegId id) const;
  void set_reg(RegId id, Word value);

  Word acc() const { return st_.acc; }
  Addr pc() const  { return st_.pc; }
  bool flag(Flag f) const { return f == Flag::C ? st_.flag_c : st_.flag_o; }

  const CpuState& state() const { return st_; }

private:
  // Palabra buscada por adelantado en el camino predicho
  struct Prefetch {
    Addr pc;
    Word word;
  };

  Word fetch(Addr pc);
  void speculate(Addr next);
  void execute(const Decoded& d, Addr pc, Addr& next);
  void resolve_branch(const InstrDef& def, Addr pc, Addr target, bool taken, Addr& next);

  const Config&        config_;
  const Registry&      reg_;
  Memory&              mem_;
  PipelineCoordinator& pipes_;
  BranchPredictor&     bp_;
  Metrics&             metrics_;

  CpuState                st_;
  std::optional<Prefetch> prefetch_;
};

} // namespace vpu
