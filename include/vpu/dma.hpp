#pragma once
#include "memory.hpp"
#include "types.hpp"
#include <cstdint>

namespace vpu {

/**
 * Motor DMA. Tres registros de configuración (DEST, SOURCE, LENGTH) que la
 * CPU escribe con DMA.DST/SRC/LEN. fill() y copy() son síncronos: terminan
 * la operación completa antes de volver (no hay estado Busy observable).
 */
class DmaEngine {
public:
  DmaEngine(Memory& mem, std::size_t access_width);

  void set_dest(Addr a)       { dest_ = a; }
  void set_source(Addr a)     { source_ = a; }
  void set_length(Word bytes) { length_ = bytes; }

  Addr dest() const   { return dest_; }
  Addr source() const { return source_; }
  Word length() const { return length_; }

  // SET: sólo se usa el byte menos significativo de value. Devuelve bytes escritos.
  std::uint64_t fill(Word value);
  // CPY: LENGTH bytes de SOURCE a DEST. Devuelve bytes copiados.
  std::uint64_t copy();

  // Beats de bus que ocupa una transferencia de 'bytes'
  std::uint64_t beats(std::uint64_t bytes) const {
    return (bytes + access_width_ - 1) / access_width_;
  }

  void reset() { dest_ = source_ = 0; length_ = 0; }

private:
  Memory&     mem_;
  std::size_t access_width_;
  Addr dest_{0};
  Addr source_{0};
  Word length_{0};
};

} // namespace vpu
