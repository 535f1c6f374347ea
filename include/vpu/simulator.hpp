#pragma once
/**
 * Simulator: contexto de una sesión. Orquesta memoria, CPU, predictor y
 * pipes con un único hilo y avanza por ciclos globales:
 *   ciclo = CPU (1 instrucción o espera en barrera) -> pipes Busy (1 paso c/u)
 * Cada instancia es independiente (nada de estado global mutable).
 */

#include <cstddef>
#include <cstdint>
#include <limits>
#include <ostream>
#include <string>

#include "assembler.hpp"
#include "branch_predictor.hpp"
#include "config.hpp"
#include "isa.hpp"
#include "memory.hpp"
#include "metrics.hpp"
#include "pipeline.hpp"
#include "processor.hpp"
#include "types.hpp"

namespace vpu {

// Contador global de ciclos con guarda de overflow
class CycleCounter {
public:
  explicit CycleCounter(std::uint64_t start = 0) : value_(start) {}

  std::uint64_t value() const { return value_; }
  void reset() { value_ = 0; }

  void tick() {
    if (value_ == std::numeric_limits<std::uint64_t>::max())
      throw ExecutionError("Overflow del contador de ciclos");
    ++value_;
  }

private:
  std::uint64_t value_;
};

class Simulator {
public:
  explicit Simulator(Config config = Config{});

  Simulator(const Simulator&) = delete;
  Simulator& operator=(const Simulator&) = delete;

  // ---- Carga de programas
  Image assemble(const std::string& src) const;
  void  load(const Image& img);                          // reset + copia en memoria
  void  load_program_from_string(const std::string& src);

  // Vuelve todo a estado de reset (memoria incluida, ciclo 0)
  void reset();

  // ---- Ejecución
  void advance_cycle();
  // true si la CPU llegó a HLT; false si se agotó max_cycles (timeout externo)
  bool run_until_halt(std::uint64_t max_cycles = 10'000'000);
  bool halted() const { return cpu_.halted(); }

  // ---- Ganchos hacia afuera (driver / render)
  void issue_kick(PipeId pipe, Addr stream_base, std::uint64_t countdown = 1);
  bool is_pipeline_busy(PipeId pipe) const;
  void complete_pipeline(PipeId pipe);

  // ---- Acceso
  std::uint64_t              cycle() const { return cycle_.value(); }
  const Config&              config() const { return config_; }
  const Registry&            registry() const { return reg_; }
  Processor&                 cpu() { return cpu_; }
  const Processor&           cpu() const { return cpu_; }
  Memory&                    memory() { return mem_; }
  const Memory&              memory() const { return mem_; }
  PipelineCoordinator&       pipes() { return pipes_; }
  const PipelineCoordinator& pipes() const { return pipes_; }
  BranchPredictor&           predictor() { return bp_; }
  const Metrics&             metrics() const { return metrics_; }

  // ---- Utilidades
  void step_one(std::ostream& os);    // 1 ciclo con diffs de registros
  void dump_regs(std::ostream& os) const;
  void dump_pipes(std::ostream& os) const;
  void dump_metrics(std::ostream& os) const;

private:
  static Config validated(Config c);

  // ------------- Componentes (orden importa: config primero) -------------
  Config              config_;
  const Registry&     reg_;
  Metrics             metrics_;
  Memory              mem_;
  BranchPredictor     bp_;
  PipelineCoordinator pipes_;
  Processor           cpu_;
  CycleCounter        cycle_;
};

} // namespace vpu
