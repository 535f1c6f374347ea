#pragma once
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace vpu {

using Addr   = std::uint32_t;  // Dirección en bytes (espacio de 32 bits)
using Word   = std::uint32_t;  // Palabra de máquina / instrucción
using RegId  = std::uint8_t;
using PipeId = std::uint8_t;

// Forma de cada operando dentro de la palabra
enum class OperandType : std::uint8_t {
  REG,   // ID de registro en 8 bits
  LAB,   // dirección/label de 24 bits
  IMM,   // inmediato genérico (sólo al parsear, antes de fijar el ancho)
  IMM16,
  IMM24
};

enum class Flag : std::uint8_t { C, O };

// Máscara de flags que una instrucción puede tocar
inline constexpr std::uint8_t kFlagC = 1u << 0;
inline constexpr std::uint8_t kFlagO = 1u << 1;

enum class PipeKind : std::uint8_t { Scheduler, Dma, Blitter };

enum class PipeState : std::uint8_t { Idle, Busy };

// Error de ensamblado con posición en el fuente (1-based). Con la línea
// fuente el mensaje la repite y marca la columna:
//   linea 2, col 5: label no definido: NOWHERE
//     JMP NOWHERE
//         ^
class AssemblyError : public std::runtime_error {
public:
  AssemblyError(std::size_t line, std::size_t col, const std::string& msg,
                const std::string& source = {})
    : std::runtime_error(format(line, col, msg, source)),
      line_(line), col_(col), detail_(msg), source_(source) {}

  std::size_t        line()   const { return line_; }
  std::size_t        col()    const { return col_; }
  const std::string& detail() const { return detail_; }
  const std::string& source() const { return source_; }

private:
  static std::string format(std::size_t line, std::size_t col, const std::string& msg,
                            const std::string& source) {
    std::string s = "linea " + std::to_string(line) + ", col " + std::to_string(col) + ": " + msg;
    if (!source.empty()) {
      s += "\n  " + source + "\n  ";
      // tabs se respetan para que el '^' caiga bajo el token
      for (std::size_t i = 0; i + 1 < col && i < source.size(); ++i)
        s.push_back(source[i] == '\t' ? '\t' : ' ');
      s.push_back('^');
    }
    return s;
  }

  std::size_t line_;
  std::size_t col_;
  std::string detail_;
  std::string source_;
};

// Violación arquitectónica en ejecución: detiene la simulación
class ExecutionError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

inline const char* to_string(OperandType t) {
  switch (t) {
    case OperandType::REG:   return "REG";
    case OperandType::LAB:   return "LAB";
    case OperandType::IMM:   return "IMM";
    case OperandType::IMM16: return "IMM16";
    case OperandType::IMM24: return "IMM24";
  }
  return "?";
}

inline const char* to_string(PipeKind k) {
  switch (k) {
    case PipeKind::Scheduler: return "sched";
    case PipeKind::Dma:       return "dma";
    case PipeKind::Blitter:   return "blitter";
  }
  return "?";
}

inline const char* to_string(PipeState s) {
  return s == PipeState::Busy ? "Busy" : "Idle";
}

// Nombre de registro: R1..Rn, luego ACC y PC
inline std::string reg_name(RegId id, std::size_t num_regs) {
  if (id < num_regs)      return "R" + std::to_string(id + 1);
  if (id == num_regs)     return "ACC";
  if (id == num_regs + 1) return "PC";
  return "R?" + std::to_string(id);
}

// Inverso de reg_name (sin distinguir mayúsculas). nullopt si no es registro.
std::optional<RegId> parse_reg(const std::string& token, std::size_t num_regs);

} // namespace vpu
