#pragma once
#include "types.hpp"
#include <array>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace vpu {

// Versión de la tabla de instrucciones embebida (isa_table.cpp)
inline constexpr int kIsaVersion = 1;

// Semántica de cada variante. El opcode numérico lo asigna el Registry.
enum class Op : std::uint8_t {
  NOP, HLT,
  MOV_RR, MOV_RI16, MOV_I24,
  ADD_I24, ADD_R,
  ASR_I24, ASR_R, LSR_I24, LSR_R, LSL_I24, LSL_R,
  CMP_R, CMP_RR,
  JMP, BRA,
  LDW_L, LDW_R, STW_L, STW_R,
  BLOCK,
  SCH_FNC,
  DMA_DST, DMA_SRC, DMA_LEN, DMA_SET, DMA_CPY,
  BLI_CLR, BLI_PIX, BLI_COL
};

inline constexpr std::size_t kMaxOperands = 3;

// Fila de la tabla fuente (sin opcode)
struct InstrSpec {
  const char* pipe;      // prefijo del pipe ("DMA"...) o nullptr si es core
  const char* name;
  std::uint8_t nops;
  std::array<OperandType, kMaxOperands> ops;
  std::uint8_t flags;    // kFlagC | kFlagO
  Op op;
  const char* desc;
};

struct PipeSpec {
  PipeId      index;
  const char* name;
  const char* prefix;
  PipeKind    kind;
};

// Variante ya registrada
struct InstrDef {
  std::string  mnemonic;   // "MOV", "DMA.DST"...
  std::uint8_t opcode{0};
  std::vector<OperandType> ops;
  std::uint8_t flags{0};
  Op           op{Op::NOP};
  std::string  desc;
  bool         hardware{false};
  PipeId       pipe{0};    // válido si hardware

  bool affects(Flag f) const {
    return (flags & (f == Flag::C ? kFlagC : kFlagO)) != 0;
  }
  bool is_branch() const { return op == Op::JMP || op == Op::BRA; }
  bool is_barrier() const { return op == Op::SCH_FNC || op == Op::BLOCK; }
};

// Tablas embebidas (isa_table.cpp)
const std::vector<InstrSpec>& builtin_instructions();
const std::vector<PipeSpec>&  builtin_pipes();

/**
 * Registro de instrucciones. Se construye una vez a partir de la tabla y
 * asigna opcodes:
 *   core     -> index << 1                 (bit kick = 0)
 *   hardware -> pipe << 4 | slot << 1 | 1  (hasta 8 por pipe, 16 pipes)
 * Búsquedas O(1): por opcode (array de 256) y por mnemónico + forma.
 */
class Registry {
public:
  Registry(const std::vector<InstrSpec>& table, const std::vector<PipeSpec>& pipes);

  // Guarda punteros a sus propias defs: no se copia
  Registry(const Registry&) = delete;
  Registry& operator=(const Registry&) = delete;

  // Registro global construido con las tablas embebidas
  static const Registry& instance();

  int version() const { return kIsaVersion; }

  const InstrDef* by_opcode(std::uint8_t opcode) const { return by_opcode_[opcode]; }

  // shape con IMM genérico (el parser no conoce el ancho); nullptr si no hay match
  const InstrDef* match(const std::string& mnemonic, const std::vector<OperandType>& shape) const;

  // Todas las variantes de un mnemónico (para diagnósticos)
  const std::vector<const InstrDef*>* variants(const std::string& mnemonic) const;
  bool has_mnemonic(const std::string& mnemonic) const { return variants(mnemonic) != nullptr; }

  const std::vector<InstrDef>& all() const { return defs_; }
  const std::vector<PipeSpec>& pipes() const { return pipes_; }
  const PipeSpec* pipe_by_prefix(const std::string& prefix) const;

  std::size_t max_mnemonic_len() const { return max_len_; }

  // Partición core / hardware / por pipe
  std::vector<const InstrDef*> core_instructions() const;
  std::vector<const InstrDef*> pipe_instructions(PipeId pipe) const;

private:
  static std::string shape_key(const std::string& mnemonic, const std::vector<OperandType>& shape);

  std::vector<InstrDef> defs_;
  std::vector<PipeSpec> pipes_;
  std::array<const InstrDef*, 256> by_opcode_{};
  std::unordered_map<std::string, const InstrDef*> by_shape_;
  std::unordered_map<std::string, std::vector<const InstrDef*>> by_mnemonic_;
  std::size_t max_len_{0};
};

// Instrucción decodificada: definición + valores crudos de operandos
struct Decoded {
  const InstrDef* def{nullptr};
  std::array<Word, kMaxOperands> operands{};
};

// decode(word): nullptr en def si el opcode no existe
Decoded decode(const Registry& reg, Word word);

// encode(def, operands): operandos ya validados
Word encode(const InstrDef& def, const std::array<Word, kMaxOperands>& operands);

} // namespace vpu
