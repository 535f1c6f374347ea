#include "vpu/isa.hpp"
#include "vpu/codec.hpp"
#include <algorithm>
#include <cassert>
#include <cctype>
#include <stdexcept>

namespace vpu {

std::optional<RegId> parse_reg(const std::string& token, std::size_t num_regs) {
  std::string t;
  t.reserve(token.size());
  for (char c : token) t.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));

  if (t == "ACC") return static_cast<RegId>(num_regs);
  if (t == "PC")  return static_cast<RegId>(num_regs + 1);

  // R1..Rn
  if (t.size() < 2 || t[0] != 'R') return std::nullopt;
  for (std::size_t i = 1; i < t.size(); ++i)
    if (!std::isdigit(static_cast<unsigned char>(t[i]))) return std::nullopt;
  if (t.size() > 4) return std::nullopt; // R999 como mucho
  int n = std::stoi(t.substr(1));
  if (n < 1 || static_cast<std::size_t>(n) > num_regs) return std::nullopt;
  return static_cast<RegId>(n - 1);
}

// ===== Registry =====

Registry::Registry(const std::vector<InstrSpec>& table, const std::vector<PipeSpec>& pipes)
    : pipes_(pipes) {
  // Punteros a defs_ en los índices: reservar antes de llenar
  defs_.reserve(table.size());

  std::size_t core_count = 0;
  std::array<std::size_t, 16> pipe_slots{};

  for (const auto& spec : table) {
    InstrDef d;
    d.flags = spec.flags;
    d.op    = spec.op;
    d.desc  = spec.desc;
    d.ops.assign(spec.ops.begin(), spec.ops.begin() + spec.nops);

    if (spec.pipe == nullptr) {
      if (core_count >= 128)
        throw std::invalid_argument("Demasiadas instrucciones core (max 128)");
      d.mnemonic = spec.name;
      d.opcode   = static_cast<std::uint8_t>(core_count << 1);
      ++core_count;
    } else {
      const PipeSpec* p = pipe_by_prefix(spec.pipe);
      if (!p)
        throw std::invalid_argument(std::string("Pipe desconocido: ") + spec.pipe);
      if (p->index >= 16)
        throw std::invalid_argument(std::string("Índice de pipe fuera de rango: ") + spec.pipe);
      std::size_t& slot = pipe_slots[p->index];
      if (slot >= 8)
        throw std::invalid_argument(std::string("Demasiadas instrucciones en pipe ") + spec.pipe);
      d.mnemonic = std::string(p->prefix) + "." + spec.name;
      d.hardware = true;
      d.pipe     = p->index;
      d.opcode   = static_cast<std::uint8_t>((p->index << 4) | (slot << 1) | 1u);
      ++slot;
    }

    for (const auto* other : by_mnemonic_[d.mnemonic]) {
      if (other->ops == d.ops)
        throw std::invalid_argument("Variante duplicada: " + d.mnemonic);
    }

    defs_.push_back(std::move(d));
    const InstrDef* def = &defs_.back();
    by_opcode_[def->opcode] = def;
    by_mnemonic_[def->mnemonic].push_back(def);
    max_len_ = std::max(max_len_, def->mnemonic.size());

    // La clave usa IMM genérico: dos variantes que sólo difieran en el
    // ancho del inmediato serían ambiguas al ensamblar
    std::vector<OperandType> generic = def->ops;
    for (auto& t : generic)
      if (t == OperandType::IMM16 || t == OperandType::IMM24) t = OperandType::IMM;
    if (!by_shape_.emplace(shape_key(def->mnemonic, generic), def).second)
      throw std::invalid_argument("Variante ambigua: " + def->mnemonic);
  }
}

const Registry& Registry::instance() {
  static const Registry reg(builtin_instructions(), builtin_pipes());
  return reg;
}

std::string Registry::shape_key(const std::string& mnemonic, const std::vector<OperandType>& shape) {
  std::string key = mnemonic;
  for (auto t : shape) {
    key.push_back('_');
    key += to_string(t);
  }
  return key;
}

const InstrDef* Registry::match(const std::string& mnemonic, const std::vector<OperandType>& shape) const {
  auto it = by_shape_.find(shape_key(mnemonic, shape));
  return it == by_shape_.end() ? nullptr : it->second;
}

const std::vector<const InstrDef*>* Registry::variants(const std::string& mnemonic) const {
  auto it = by_mnemonic_.find(mnemonic);
  return it == by_mnemonic_.end() ? nullptr : &it->second;
}

const PipeSpec* Registry::pipe_by_prefix(const std::string& prefix) const {
  for (const auto& p : pipes_)
    if (prefix == p.prefix) return &p;
  return nullptr;
}

std::vector<const InstrDef*> Registry::core_instructions() const {
  std::vector<const InstrDef*> out;
  for (const auto& d : defs_)
    if (!d.hardware) out.push_back(&d);
  return out;
}

std::vector<const InstrDef*> Registry::pipe_instructions(PipeId pipe) const {
  std::vector<const InstrDef*> out;
  for (const auto& d : defs_)
    if (d.hardware && d.pipe == pipe) out.push_back(&d);
  return out;
}

// ===== encode / decode =====

Decoded decode(const Registry& reg, Word word) {
  Decoded out;
  out.def = reg.by_opcode(codec::opcode_of(word));
  if (!out.def) return out;

  const auto& ops = out.def->ops;
  for (std::size_t i = 0; i < ops.size(); ++i) {
    switch (ops[i]) {
      case OperandType::REG:
        out.operands[i] = codec::get_register(word, static_cast<unsigned>(i));
        break;
      case OperandType::IMM16:
        out.operands[i] = codec::get_u16(word);
        break;
      case OperandType::IMM24:
      case OperandType::IMM:
        out.operands[i] = codec::get_u24(word);
        break;
      case OperandType::LAB:
        out.operands[i] = codec::get_label(word);
        break;
    }
  }
  return out;
}

Word encode(const InstrDef& def, const std::array<Word, kMaxOperands>& operands) {
  const auto& ops = def.ops;
  Word w = codec::encode_none(def.opcode);
  for (std::size_t i = 0; i < ops.size(); ++i) {
    switch (ops[i]) {
      case OperandType::REG:
        assert(operands[i] <= 0xFFu && "ID de registro fuera de rango");
        w |= static_cast<Word>(operands[i] & 0xFFu) << (16 - 8 * i);
        break;
      case OperandType::IMM16:
        w = codec::encode_r16(def.opcode, codec::get_register(w, 0), operands[i]);
        break;
      case OperandType::IMM24:
      case OperandType::IMM:
      case OperandType::LAB:
        w = codec::encode_24(def.opcode, operands[i]);
        break;
    }
  }
  return w;
}

} // namespace vpu
