#pragma once
#include "blitter.hpp"
#include "config.hpp"
#include "dma.hpp"
#include "isa.hpp"
#include "memory.hpp"
#include "metrics.hpp"
#include "types.hpp"
#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace vpu {

// Estado de un pipe de hardware. Idle -> (kick) -> Busy -> (fin) -> Idle
struct Pipeline {
  PipeId        id{0};
  std::string   name;
  std::string   prefix;
  PipeKind      kind{PipeKind::Scheduler};
  PipeState     state{PipeState::Idle};
  Addr          stream_base{0};   // control stream del kick en curso
  std::uint64_t countdown{0};     // ciclos restantes (kicks opacos)
  std::uint64_t kicks{0};

  bool busy() const { return state == PipeState::Busy; }
};

/**
 * Coordinador de pipes.
 * - Un solo kick en vuelo por pipe: kickear un pipe Busy es una violación
 *   arquitectónica (ExecutionError), nunca se encola ni se pisa.
 * - Los kicks no bloquean: marcan Busy y la CPU sigue. advance_cycle()
 *   avanza una vez cada pipe Busy (lo llama el Simulator por ciclo).
 * - DMA es la excepción: SET/CPY corren completos en el mismo ciclo y el
 *   pipe nunca se ve Busy.
 * - La barrera (SCH.FNC / BLOCK) se cumple cuando no queda ningún pipe Busy.
 * El comportamiento por pipe se despacha por PipeKind.
 */
class PipelineCoordinator {
public:
  PipelineCoordinator(const Config& config, const Registry& reg, Memory& mem, Metrics& metrics);

  // ---- Ganchos externos ----
  // Kick genérico con control stream opaco que dura 'countdown' ciclos.
  // En el pipe DMA ejecuta la copia configurada de forma síncrona.
  void issue_kick(PipeId pipe, Addr stream_base, std::uint64_t countdown = 1);
  bool is_busy(PipeId pipe) const;
  void complete(PipeId pipe);
  void advance_cycle();

  // ---- Desde la CPU ----
  // Instrucción de hardware (no barrera). values = operandos REG ya leídos.
  void execute(const InstrDef& def, const std::array<Word, kMaxOperands>& values, Addr pc);

  bool        barrier_ready() const { return busy_count() == 0; }
  std::size_t busy_count() const;

  const Pipeline&              pipe(PipeId id) const;
  const std::vector<Pipeline>& pipes() const { return pipes_; }

  DmaEngine&       dma()           { return dma_; }
  const DmaEngine& dma() const     { return dma_; }
  Blitter&         blitter()       { return blitter_; }
  const Blitter&   blitter() const { return blitter_; }

  void reset();

private:
  Pipeline& checked(PipeId id);
  void      ensure_idle(const Pipeline& p) const;
  void      check_kick(const Pipeline& p) const;
  void      mark_busy(Pipeline& p, Addr stream_base, std::uint64_t countdown);
  void      retire(Pipeline& p);
  void      run_dma(Pipeline& p, bool set, Word value);

  const Config&         config_;
  Metrics&              metrics_;
  std::vector<Pipeline> pipes_;
  DmaEngine             dma_;
  Blitter               blitter_;
};

} // namespace vpu
