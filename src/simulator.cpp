#include "vpu/simulator.hpp"
#include "vpu/debug_io.hpp"
#include "vpu/disassembler.hpp"

#include <iomanip>
#include <sstream>
#include <vector>

namespace vpu {

// ---------- Ciclo de vida ----------
Config Simulator::validated(Config c) {
  c.validate();
  return c;
}

Simulator::Simulator(Config config)
    : config_(validated(std::move(config))),
      reg_(Registry::instance()),
      mem_(config_.memory_bytes),
      bp_(config_.bht_entries, config_.btb_entries),
      pipes_(config_, reg_, mem_, metrics_),
      cpu_(config_, reg_, mem_, pipes_, bp_, metrics_) {
  VPU_LOG_IF(cfg::kLogSim,
    "[Sim] memoria=" << config_.memory_bytes << "B"
    << " fb=0x" << std::hex << config_.framebuffer_base() << std::dec
    << " (" << config_.fb_width << "x" << config_.fb_height << "@" << config_.fb_bpp << ")"
    << " px/ciclo=" << config_.pixels_per_cycle());
}

void Simulator::reset() {
  mem_.clear();
  bp_.reset();
  pipes_.reset();
  cpu_.reset(0);
  cycle_.reset();
  metrics_.reset();
}

// ---------- Carga de programas ----------
Image Simulator::assemble(const std::string& src) const {
  return Assembler(reg_, config_).assemble(src);
}

void Simulator::load(const Image& img) {
  reset();
  if (!img.bytes.empty() && !mem_.write_block(img.entry, img.bytes.data(), img.bytes.size()))
    throw ExecutionError("La imagen no entra en memoria");
  cpu_.reset(img.entry);
  VPU_LOG_IF(cfg::kLogSim, "[Sim] imagen cargada: " << img.words() << " palabras @0x"
             << std::hex << img.entry << std::dec);
}

void Simulator::load_program_from_string(const std::string& src) {
  load(assemble(src));
}

// ---------- Ejecución ----------
void Simulator::advance_cycle() {
  cycle_.tick();
  cpu_.step();             // CPU primero: un kick de este ciclo ya avanza abajo
  pipes_.advance_cycle();
  metrics_.cycles = cycle_.value();
}

bool Simulator::run_until_halt(std::uint64_t max_cycles) {
  for (std::uint64_t c = 0; c < max_cycles && !cpu_.halted(); ++c)
    advance_cycle();

  if (!cpu_.halted()) {
    VPU_LOG_IF(cfg::kLogSim, "[Sim] sin HLT tras " << max_cycles << " ciclos (pc=0x"
               << std::hex << cpu_.pc() << std::dec
               << (cpu_.waiting() ? ", esperando barrera)" : ")"));
    return false;
  }
  VPU_LOG_IF(cfg::kLogSim, "[Sim] HLT en ciclo " << cycle_.value()
             << " (" << metrics_.instructions << " instrucciones)");
  return true;
}

// ---------- Ganchos ----------
void Simulator::issue_kick(PipeId pipe, Addr stream_base, std::uint64_t countdown) {
  pipes_.issue_kick(pipe, stream_base, countdown);
}

bool Simulator::is_pipeline_busy(PipeId pipe) const {
  return pipes_.is_busy(pipe);
}

void Simulator::complete_pipeline(PipeId pipe) {
  pipes_.complete(pipe);
}

// ---------- Dumps ----------
void Simulator::step_one(std::ostream& os) {
  const CpuState before = cpu_.state();
  const Addr pc = before.pc;

  if (!before.halted && mem_.in_range(pc, cfg::kWordBytes) && pc % cfg::kWordBytes == 0) {
    os << "[ciclo " << cycle_.value() << "] 0x" << std::hex << pc << std::dec << "  "
       << Disassembler(reg_, config_).instruction(mem_.read32(pc)) << "\n";
  }

  advance_cycle();

  const CpuState& after = cpu_.state();
  for (std::size_t r = 0; r < after.regs.size(); ++r)
    dbg::print_reg_diff(os, reg_name(static_cast<RegId>(r), config_.num_regs),
                        before.regs[r], after.regs[r]);
  dbg::print_reg_diff(os, "ACC", before.acc, after.acc);
  if (before.flag_c != after.flag_c || before.flag_o != after.flag_o) {
    os << "  flags: ";
    dbg::print_flags(os, after.flag_c, after.flag_o);
    os << "\n";
  }
  if (after.waiting) os << "  (esperando barrera)\n";
}

void Simulator::dump_regs(std::ostream& os) const {
  const CpuState& st = cpu_.state();
  os << "REGISTROS:\n";
  for (std::size_t r = 0; r < st.regs.size(); ++r) {
    os << "  ";
    dbg::print_reg_compact(os, reg_name(static_cast<RegId>(r), config_.num_regs), st.regs[r]);
    os << "\n";
  }
  os << "  ";
  dbg::print_reg_compact(os, "ACC", st.acc);
  os << "\n  ";
  dbg::print_reg_compact(os, "PC", st.pc);
  os << "\n  ";
  dbg::print_flags(os, st.flag_c, st.flag_o);
  os << (st.halted ? "  [HLT]" : "") << (st.waiting ? "  [BARRERA]" : "") << "\n";
}

void Simulator::dump_pipes(std::ostream& os) const {
  for (const auto& p : pipes_.pipes()) {
    if (p.name.empty()) continue;
    os << "PIPE " << std::left << std::setw(4) << p.prefix << std::right
       << " (" << to_string(p.kind) << ") " << to_string(p.state)
       << " kicks=" << p.kicks;
    if (p.busy())
      os << " stream=0x" << std::hex << p.stream_base << std::dec << " resta=" << p.countdown;
    os << "\n";
  }
}

void Simulator::dump_metrics(std::ostream& os) const {
  const auto& m = metrics_;
  os << "----- Métricas -----\n"
     << "Ciclos: " << m.cycles
     << " | Instrucciones: " << m.instructions
     << " | Barrera (ciclos): " << m.barrier_stalls << "\n"
     << "Saltos: " << m.branches
     << " | Fallos pred.: " << m.mispredictions
     << " | Fetch descartados: " << m.fetch_flushes << "\n"
     << "Kicks: " << m.kicks
     << " | DMA ops: " << m.dma_ops
     << " | DMA bytes: " << m.dma_bytes
     << " | DMA beats: " << m.dma_beats << "\n"
     << "Píxeles: " << m.pixels
     << " | Clears: " << m.clears << "\n"
     << "--------------------\n";
}

} // namespace vpu
