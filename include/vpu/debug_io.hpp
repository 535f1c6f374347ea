#pragma once
// Utilidades de impresión compactas para registros y flags.
// Pensado para dumps de stepping y resúmenes.

#include <cstdint>
#include <iomanip>
#include <ostream>
#include <string>

namespace vpu::dbg {

inline void print_hex32(std::ostream& os, std::uint32_t v) {
  os << "0x" << std::hex << std::setw(8) << std::setfill('0') << v
     << std::dec << std::setfill(' ');
}

inline void print_reg_compact(std::ostream& os, const std::string& name, std::uint32_t v) {
  os << name << "=";
  print_hex32(os, v);
  // Valor con signo sólo si es negativo (útil para ASR)
  if (v & 0x80000000u) os << " (" << static_cast<std::int32_t>(v) << ")";
}

inline void print_reg_diff(std::ostream& os, const std::string& name,
                           std::uint32_t before, std::uint32_t after) {
  if (before == after) return;
  os << "  " << name << ": ";
  print_hex32(os, before);
  os << " -> ";
  print_hex32(os, after);
  os << "\n";
}

inline void print_flags(std::ostream& os, bool c, bool o) {
  os << "C=" << (c ? 1 : 0) << " O=" << (o ? 1 : 0);
}

} // namespace vpu::dbg
