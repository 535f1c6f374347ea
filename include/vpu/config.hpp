#pragma once
#include <cstddef>
#include <cstdint>
#include <iostream> // logs
#include <syncstream>

namespace cfg
{
    // Stderr sincronizado para logs
    #define VPU_SERR  std::osyncstream(std::cerr)

    // --- Memoria (perfil de instructions.yaml) ---
    inline constexpr std::uint64_t kMemoryMB   = 512; // 512 MB
    inline constexpr std::size_t   kAccessWidth = 64; // bytes por acceso

    // --- Registros: R1..R8 + ACC + PC ---
    inline constexpr std::size_t kNumRegs = 8;

    // --- Framebuffer: RGB empaquetado en 32 bits ---
    inline constexpr std::size_t kFbWidth  = 320;
    inline constexpr std::size_t kFbHeight = 240;
    inline constexpr std::size_t kFbBpp    = 32;
    inline constexpr std::uint64_t kFbAlign = 64 * 1024; // 64KB

    // --- Predicción de saltos ---
    inline constexpr std::size_t kBhtEntries = 16;
    inline constexpr std::size_t kBtbEntries = 4;

    // Kicks en vuelo que el scheduler puede seguir a la vez
    inline constexpr std::size_t kSchedQueueDepth = 4;

    // Límite blando del programa (bytes emitidos)
    inline constexpr std::size_t kMaxProgramBytes = 64 * 1024;

    // Ancho fijo del mnemónico en el desensamblado ("DMA.DST" = 7)
    inline constexpr std::size_t kMnemonicWidth = 8;

    // Palabra de instrucción: 4 bytes siempre
    inline constexpr std::size_t kWordBytes = 4;

    // --- Flags de log rápidos ---
    inline constexpr bool kLogSim    = true;  // resumen del simulador
    inline constexpr bool kLogCpu    = false; // traza por instrucción (ruidoso)
    inline constexpr bool kLogPipe   = true;  // kicks / retiros de pipes
    inline constexpr bool kLogAsm    = false; // pasadas del ensamblador
    inline constexpr bool kLogBranch = false; // aciertos/fallos del predictor

    // Macro simple de logging condicional
    #define VPU_LOG_IF(flag, msg)        \
        do {                             \
            if (flag) {                  \
                VPU_SERR << msg << '\n'; \
            }                            \
        } while (0)
} // namespace cfg

namespace vpu {

/**
 * Parámetros de la máquina. Arranca con los defaults de cfg:: y se puede
 * ajustar antes de construir el Simulator (que llama a validate()).
 */
struct Config {
  std::uint64_t memory_bytes      = cfg::kMemoryMB * 1024 * 1024;
  std::size_t   access_width      = cfg::kAccessWidth;
  std::size_t   num_regs          = cfg::kNumRegs;
  std::size_t   fb_width          = cfg::kFbWidth;
  std::size_t   fb_height         = cfg::kFbHeight;
  std::size_t   fb_bpp            = cfg::kFbBpp;
  std::size_t   bht_entries       = cfg::kBhtEntries;
  std::size_t   btb_entries       = cfg::kBtbEntries;
  std::size_t   sched_queue_depth = cfg::kSchedQueueDepth;
  std::size_t   max_program_bytes = cfg::kMaxProgramBytes;
  std::size_t   mnemonic_width    = cfg::kMnemonicWidth;
  bool          predict_jumps     = true; // JMP pasa también por BHT/BTB

  static Config with_memory_mb(std::uint64_t mb) {
    Config c;
    c.memory_bytes = mb * 1024 * 1024;
    return c;
  }

  // Lanza std::invalid_argument si la combinación no es construible.
  void validate() const;

  std::uint64_t framebuffer_bytes() const;
  std::uint64_t framebuffer_base() const;  // alineado a cfg::kFbAlign
  std::size_t   pixels_per_cycle() const;  // bits por acceso / bpp

  // IDs de los registros especiales (después de los generales)
  std::uint8_t reg_acc() const { return static_cast<std::uint8_t>(num_regs); }
  std::uint8_t reg_pc()  const { return static_cast<std::uint8_t>(num_regs + 1); }
};

} // namespace vpu
