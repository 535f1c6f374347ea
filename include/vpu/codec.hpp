#pragma once
#include "types.hpp"
#include <cassert>
#include <cstdint>

//
// Codec de la palabra de instrucción (32 bits, big-endian en memoria).
//
//   byte 0 (MSB) : opcode. bit 0 = kick (1 = pipe de hardware)
//                  bits 4..7 de un opcode kick = índice de pipe
//   bytes 1..3   : operandos según la forma registrada:
//                  REG,REG -> [r0][r1][pad]
//                  REG,IMM16 -> [r0][imm16]
//                  REG -> [r0][pad][pad]
//                  IMM24 / LAB -> [valor de 24 bits]
//
// Funciones puras y totales sobre sus rangos de bits. Un valor fuera de
// rango es un bug del llamador (el ensamblador ya validó), por eso assert.
//

namespace vpu::codec {

inline constexpr Word kMask16 = 0xFFFFu;
inline constexpr Word kMask24 = 0xFFFFFFu;

inline constexpr std::uint8_t opcode_of(Word w) {
  return static_cast<std::uint8_t>(w >> 24);
}

inline constexpr bool is_kick(std::uint8_t opcode) { return (opcode & 1u) != 0; }

// Sólo tiene sentido si is_kick(opcode)
inline constexpr PipeId pipe_of(std::uint8_t opcode) {
  return static_cast<PipeId>(opcode >> 4);
}

// index 0..2 contado desde el byte de operando más significativo
inline constexpr RegId get_register(Word w, unsigned index) {
  return static_cast<RegId>((w >> (16 - 8 * index)) & 0xFFu);
}

inline constexpr std::uint16_t get_u16(Word w) { return static_cast<std::uint16_t>(w & kMask16); }
inline constexpr Word          get_u24(Word w) { return w & kMask24; }
inline constexpr Addr          get_label(Word w) { return static_cast<Addr>(w & kMask24); }

inline Word encode_none(std::uint8_t opcode) {
  return static_cast<Word>(opcode) << 24;
}

inline Word encode_r(std::uint8_t opcode, RegId r0) {
  return encode_none(opcode) | (static_cast<Word>(r0) << 16);
}

inline Word encode_rr(std::uint8_t opcode, RegId r0, RegId r1) {
  return encode_r(opcode, r0) | (static_cast<Word>(r1) << 8);
}

inline Word encode_r16(std::uint8_t opcode, RegId r0, Word imm16) {
  assert(imm16 <= kMask16 && "IMM16 fuera de rango");
  return encode_r(opcode, r0) | (imm16 & kMask16);
}

inline Word encode_24(std::uint8_t opcode, Word imm24) {
  assert(imm24 <= kMask24 && "IMM24/LAB fuera de rango");
  return encode_none(opcode) | (imm24 & kMask24);
}

} // namespace vpu::codec
