#pragma once
#include <cstdint>

namespace vpu {

/**
 * Métricas de una sesión de simulación.
 * - CPU: instrucciones retiradas, saltos, fallos de predicción y fetch
 *   especulativos descartados.
 * - Pipes: kicks emitidos, ciclos de CPU parada en barrera.
 * - DMA: bytes movidos y beats de bus (bytes / ancho de acceso, redondeado).
 * - Blitter: píxeles escritos y clears completos.
 */
struct Metrics {
  std::uint64_t cycles = 0;
  std::uint64_t instructions = 0;

  std::uint64_t branches = 0;
  std::uint64_t mispredictions = 0;
  std::uint64_t fetch_flushes = 0;

  std::uint64_t kicks = 0;
  std::uint64_t barrier_stalls = 0;

  std::uint64_t dma_ops = 0;
  std::uint64_t dma_bytes = 0;
  std::uint64_t dma_beats = 0;

  std::uint64_t pixels = 0;
  std::uint64_t clears = 0;

  void reset() { *this = {}; }
};

} // namespace vpu
