#pragma once
#include "config.hpp"
#include "types.hpp"
#include <cstdint>
#include <vector>

namespace vpu {

/**
 * Memoria plana direccionable por byte, tamaño configurable.
 * - read32/write32: palabra big-endian alineada a 4B. Fuera de rango o
 *   desalineado -> ExecutionError (falla de la máquina).
 * - read_block/write_block: copia cruda, devuelve false si hay OOB.
 * - fill/copy: operaciones de rango que usa el DMA (copy tolera solape).
 * Un solo hilo: CPU, DMA y blitter actúan por turnos dentro del ciclo.
 */
class Memory {
public:
  explicit Memory(std::uint64_t size_bytes);

  std::uint64_t size() const { return mem_.size(); }

  std::uint8_t read8(Addr addr) const;
  void         write8(Addr addr, std::uint8_t value);

  Word read32(Addr addr) const;
  void write32(Addr addr, Word value);

  bool read_block(Addr addr, void* dst, std::size_t bytes) const;
  bool write_block(Addr addr, const void* src, std::size_t bytes);

  void fill(Addr dest, std::uint64_t len, std::uint8_t value);
  void copy(Addr dest, Addr src, std::uint64_t len);

  // Deja todo en cero (reset de la máquina)
  void clear();

  bool in_range(std::uint64_t addr, std::uint64_t bytes) const {
    return addr <= mem_.size() && bytes <= mem_.size() - addr;
  }

private:
  void check_range(std::uint64_t addr, std::uint64_t bytes, const char* what) const;

  std::vector<std::uint8_t> mem_;  // backing store
};

} // namespace vpu
