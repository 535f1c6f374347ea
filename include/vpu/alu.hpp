#pragma once
#include "types.hpp"
#include <cstdint>

// ALU de la VPU: opera siempre sobre ACC (32 bits).

namespace vpu::alu {

inline constexpr unsigned kWidth = 32;

struct AddResult {
  Word value{0};
  bool overflow{false}; // overflow con signo
  bool zero{false};     // resultado == 0 (va al flag C)
};

inline AddResult add(Word a, Word b) {
  AddResult r;
  r.value    = a + b; // mod 2^32
  // Overflow con signo: operandos del mismo signo y resultado de otro
  r.overflow = ((~(a ^ b) & (a ^ r.value)) >> (kWidth - 1)) != 0;
  r.zero     = r.value == 0;
  return r;
}

inline Word lsl(Word v, Word amount) { return amount >= kWidth ? 0 : v << amount; }
inline Word lsr(Word v, Word amount) { return amount >= kWidth ? 0 : v >> amount; }

// Conserva el signo; >= 32 deja todo en el bit de signo
inline Word asr(Word v, Word amount) {
  const bool neg = (v >> (kWidth - 1)) != 0;
  if (amount >= kWidth) return neg ? 0xFFFFFFFFu : 0u;
  if (amount == 0) return v;
  Word r = v >> amount;
  if (neg) r |= ~(0xFFFFFFFFu >> amount);
  return r;
}

} // namespace vpu::alu
