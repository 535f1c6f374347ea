#pragma once
#include "assembler.hpp"
#include "config.hpp"
#include "isa.hpp"
#include <string>
#include <vector>

namespace vpu {

// Palabra -> texto. Mnemónico con ancho fijo (Config::mnemonic_width).
// Los labels ya no existen en la imagen: se muestran como dirección 0x.
class Disassembler {
public:
  Disassembler(const Registry& reg, const Config& config);

  std::string instruction(Word word) const;

  // "0x000004: 0x0a020800  MOV      R3, ACC"
  std::vector<std::string> listing(const Image& img) const;

  // Secuencia opcode/operandos de toda la imagen
  std::vector<Decoded> decode_image(const Image& img) const;

private:
  const Registry& reg_;
  const Config&   config_;
  std::size_t     width_;
};

} // namespace vpu
