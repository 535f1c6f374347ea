#include "vpu/disassembler.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>

namespace vpu {

Disassembler::Disassembler(const Registry& reg, const Config& config)
    : reg_(reg), config_(config),
      width_(std::max(config.mnemonic_width, reg.max_mnemonic_len())) {}

std::string Disassembler::instruction(Word word) const {
  const Decoded d = decode(reg_, word);
  std::ostringstream os;
  if (!d.def) {
    os << ".word 0x" << std::hex << std::setw(8) << std::setfill('0') << word;
    return os.str();
  }

  const auto& ops = d.def->ops;
  if (ops.empty()) return d.def->mnemonic;

  os << std::left << std::setw(static_cast<int>(width_)) << d.def->mnemonic << std::right;
  for (std::size_t i = 0; i < ops.size(); ++i) {
    if (i) os << ", ";
    switch (ops[i]) {
      case OperandType::REG:
        os << reg_name(static_cast<RegId>(d.operands[i]), config_.num_regs);
        break;
      case OperandType::LAB:
        os << "0x" << std::hex << d.operands[i] << std::dec;
        break;
      default:
        os << d.operands[i];
        break;
    }
  }
  return os.str();
}

std::vector<std::string> Disassembler::listing(const Image& img) const {
  std::vector<std::string> out;
  out.reserve(img.words());
  for (std::size_t i = 0; i < img.words(); ++i) {
    const Word w = img.word(i);
    std::ostringstream os;
    os << "0x" << std::hex << std::setw(6) << std::setfill('0') << (img.entry + i * cfg::kWordBytes)
       << ": 0x" << std::setw(8) << w << std::dec << std::setfill(' ')
       << "  " << instruction(w);
    out.push_back(os.str());
  }
  return out;
}

std::vector<Decoded> Disassembler::decode_image(const Image& img) const {
  std::vector<Decoded> out;
  out.reserve(img.words());
  for (std::size_t i = 0; i < img.words(); ++i) out.push_back(decode(reg_, img.word(i)));
  return out;
}

} // namespace vpu
