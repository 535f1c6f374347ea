#pragma once
#include "config.hpp"
#include "isa.hpp"
#include "types.hpp"
#include <cstdint>
#include <string>
#include <vector>

//
// Ensamblador de la VPU.
// Toma texto y devuelve la imagen binaria (desde la dirección 0).
//
// Sintaxis por línea:
//   LABEL                 ; identificador solo = definición de label
//   LABEL:  [instr]       ; también vale con ':' y una instrucción detrás
//   MOV   R1, ACC         ; destino, fuente
//   MOV   R4, 0xFF        ; REG, IMM16
//   MOV   4095            ; IMM24 -> ACC
//   BRA   LOOP            ; LAB (dirección absoluta de 24 bits)
//   DMA.DST R1            ; instrucciones de pipe con prefijo (P.DMA.DST también)
//
// Notas rápidas:
// - Registros: R1..Rn, ACC, PC
// - Los comentarios empiezan con ';'
// - Separadores: espacios y/o comas
// - Literales en decimal o 0xHEX
// - Cualquier error lanza AssemblyError (línea y columna, con la línea
//   fuente y un '^' bajo la columna), sin imagen parcial
//

namespace vpu {

// Imagen de memoria lista para cargar
struct Image {
  std::vector<std::uint8_t> bytes;  // big-endian, palabra 0 en 'entry'
  Addr entry{0};                    // vector de reset
  Addr end{0};                      // primera dirección libre tras el programa

  std::size_t words() const { return bytes.size() / cfg::kWordBytes; }
  Word        word(std::size_t i) const;
};

class Assembler {
public:
  Assembler(const Registry& reg, const Config& config);

  Image assemble(const std::string& src) const;

private:
  struct Token {
    std::string text;
    std::size_t col;   // 1-based
  };

  // Instrucción ya ubicada en la pasada 1
  struct SourceInstr {
    std::size_t        line;
    Addr               addr;
    Token              mnemonic;
    std::vector<Token> operands;
  };

  static std::string        strip_comment(const std::string& line);
  static std::vector<Token> tokenize(const std::string& line);
  static bool               is_identifier(const std::string& s);
  static std::string        canonical_mnemonic(const std::string& text);

  Image assemble_lines(const std::vector<std::string>& lines) const;

  std::string normalize_mnemonic(const Token& tok, std::size_t line) const;
  bool        is_mnemonic(const std::string& text) const;
  OperandType classify(const Token& tok, std::size_t line) const;
  Word        parse_number(const Token& tok, std::size_t line) const;
  void        check_label_name(const Token& tok, std::size_t line) const;

  const InstrDef& select(const SourceInstr& si, const std::string& mnemonic,
                         const std::vector<OperandType>& shape) const;

  const Registry& reg_;
  const Config&   config_;
};

} // namespace vpu
