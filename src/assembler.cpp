#include "vpu/assembler.hpp"
#include "vpu/codec.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>
#include <unordered_map>

namespace vpu
{
// Ensamblador de 2 pasadas.
// 1) Ubica cada instrucción (una palabra) y junta labels -> dirección.
// 2) Resuelve labels, valida contra el Registry y emite las palabras.

Word Image::word(std::size_t i) const {
  const std::size_t b = i * cfg::kWordBytes;
  return (static_cast<Word>(bytes.at(b))     << 24) |
         (static_cast<Word>(bytes.at(b + 1)) << 16) |
         (static_cast<Word>(bytes.at(b + 2)) << 8)  |
          static_cast<Word>(bytes.at(b + 3));
}

Assembler::Assembler(const Registry& reg, const Config& config) : reg_(reg), config_(config) {}

// ===== Helpers =====

// Quita comentarios que empiecen con ';'
std::string Assembler::strip_comment(const std::string& line) {
  auto pos = line.find(';');
  if (pos == std::string::npos) return line;
  return line.substr(0, pos);
}

// Split por espacios/comas, guardando la columna de cada token
std::vector<Assembler::Token> Assembler::tokenize(const std::string& line) {
  std::vector<Token> t;
  std::string cur;
  std::size_t start = 0;
  auto flush = [&] {
    if (!cur.empty()) t.push_back({cur, start + 1});
    cur.clear();
  };

  for (std::size_t i = 0; i < line.size(); ++i) {
    const char c = line[i];
    if (std::isspace(static_cast<unsigned char>(c)) || c == ',') {
      flush();
    } else {
      if (cur.empty()) start = i;
      cur.push_back(c);
    }
  }
  flush();
  return t;
}

bool Assembler::is_identifier(const std::string& s) {
  if (s.empty()) return false;
  if (!(std::isalpha(static_cast<unsigned char>(s[0])) || s[0] == '_')) return false;
  return std::all_of(s.begin(), s.end(), [](char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
  });
}

// "p.dma.dst" -> "DMA.DST". El pipe tiene que existir.
// Mayúsculas y sin el "P." opcional; el prefijo sólo se quita delante de
// un mnemónico de pipe ("P.DMA.DST"), "P.NOP" queda como está
std::string Assembler::canonical_mnemonic(const std::string& text) {
  std::string m;
  m.reserve(text.size());
  for (char c : text) m.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
  if (m.size() > 2 && m[0] == 'P' && m[1] == '.' && m.find('.', 2) != std::string::npos)
    m = m.substr(2);
  return m;
}

std::string Assembler::normalize_mnemonic(const Token& tok, std::size_t line) const {
  const std::string m = canonical_mnemonic(tok.text);

  auto dot = m.find('.');
  if (dot != std::string::npos && !reg_.pipe_by_prefix(m.substr(0, dot)))
    throw AssemblyError(line, tok.col, "pipe desconocido: " + tok.text);
  return m;
}

bool Assembler::is_mnemonic(const std::string& text) const {
  return reg_.has_mnemonic(canonical_mnemonic(text));
}

Word Assembler::parse_number(const Token& tok, std::size_t line) const {
  const std::string& s = tok.text;
  const bool hex = s.size() > 2 && s[0] == '0' && (s[1] == 'x' || s[1] == 'X');
  unsigned long long val = 0;
  std::size_t used = 0;
  try {
    val = std::stoull(s, &used, hex ? 16 : 10);
  } catch (const std::invalid_argument&) {
    throw AssemblyError(line, tok.col, "literal inválido: " + s);
  } catch (const std::out_of_range&) {
    throw AssemblyError(line, tok.col, "literal fuera de rango: " + s);
  }
  if (used != s.size())
    throw AssemblyError(line, tok.col, "literal inválido: " + s);
  if (val > 0xFFFFFFFFull)
    throw AssemblyError(line, tok.col, "literal fuera de rango: " + s);
  return static_cast<Word>(val);
}

OperandType Assembler::classify(const Token& tok, std::size_t line) const {
  if (parse_reg(tok.text, config_.num_regs)) return OperandType::REG;
  if (std::isdigit(static_cast<unsigned char>(tok.text[0]))) {
    (void)parse_number(tok, line); // valida el formato ya
    return OperandType::IMM;
  }
  if (is_identifier(tok.text)) return OperandType::LAB;
  throw AssemblyError(line, tok.col, "operando inválido: " + tok.text);
}

void Assembler::check_label_name(const Token& tok, std::size_t line) const {
  if (!is_identifier(tok.text))
    throw AssemblyError(line, tok.col, "nombre de label inválido: " + tok.text);
  if (parse_reg(tok.text, config_.num_regs))
    throw AssemblyError(line, tok.col, "label con nombre de registro: " + tok.text);
  if (is_mnemonic(tok.text))
    throw AssemblyError(line, tok.col, "label con nombre de instrucción: " + tok.text);
}

// Elige la variante según aridad y tipos; si no hay, arma el diagnóstico
const InstrDef& Assembler::select(const SourceInstr& si, const std::string& mnemonic,
                                  const std::vector<OperandType>& shape) const {
  if (const InstrDef* def = reg_.match(mnemonic, shape)) return *def;

  const auto* vars = reg_.variants(mnemonic);
  if (!vars)
    throw AssemblyError(si.line, si.mnemonic.col, "instrucción desconocida: " + si.mnemonic.text);

  const bool arity_ok = std::any_of(vars->begin(), vars->end(), [&](const InstrDef* d) {
    return d->ops.size() == shape.size();
  });
  if (!arity_ok) {
    std::ostringstream oss;
    oss << "cantidad de operandos inválida (" << shape.size() << ") para " << mnemonic;
    throw AssemblyError(si.line, si.mnemonic.col, oss.str());
  }

  auto fmt = [](const std::vector<OperandType>& ops) {
    std::string s = "[";
    for (std::size_t i = 0; i < ops.size(); ++i) {
      if (i) s += ",";
      s += to_string(ops[i]);
    }
    return s + "]";
  };
  std::string expected;
  for (const auto* d : *vars) {
    if (d->ops.size() != shape.size()) continue;
    if (!expected.empty()) expected += " o ";
    expected += fmt(d->ops);
  }
  throw AssemblyError(si.line, si.operands.front().col,
                      "tipos de operandos no coinciden para " + mnemonic +
                      ". Se obtuvo " + fmt(shape) + ", se esperaba " + expected);
}

// ===== Ensamblado =====

Image Assembler::assemble(const std::string& src) const {
  std::vector<std::string> lines;
  {
    std::istringstream is(src);
    std::string text;
    while (std::getline(is, text)) lines.push_back(text);
  }

  try {
    return assemble_lines(lines);
  } catch (const AssemblyError& e) {
    // Se relanza con el fuente anotado
    if (e.line() == 0 || e.line() > lines.size()) throw;
    throw AssemblyError(e.line(), e.col(), e.detail(), lines[e.line() - 1]);
  }
}

Image Assembler::assemble_lines(const std::vector<std::string>& lines) const {
  // 1) Pasada 1: labels -> dirección, instrucciones ubicadas
  std::unordered_map<std::string, Addr> symbols;
  std::vector<SourceInstr> code;
  Addr addr = 0; // vector de reset

  {
    std::size_t line_no = 0;
    for (const auto& text : lines) {
      ++line_no;
      auto tok = tokenize(strip_comment(text));
      if (tok.empty()) continue;

      auto define = [&](const Token& name) {
        check_label_name(name, line_no);
        if (!symbols.emplace(name.text, addr).second)
          throw AssemblyError(line_no, name.col, "label duplicado: " + name.text);
        VPU_LOG_IF(cfg::kLogAsm, "[ASM] label " << name.text << " = 0x" << std::hex << addr << std::dec);
      };

      // "NAME:" con o sin instrucción detrás
      if (tok[0].text.size() > 1 && tok[0].text.back() == ':') {
        Token name{tok[0].text.substr(0, tok[0].text.size() - 1), tok[0].col};
        define(name);
        tok.erase(tok.begin());
        if (tok.empty()) continue;
      } else if (tok.size() == 1 && !is_mnemonic(tok[0].text) && is_identifier(tok[0].text)) {
        // identificador solo en la línea = label
        define(tok[0]);
        continue;
      }

      SourceInstr si{line_no, addr, tok[0], {tok.begin() + 1, tok.end()}};
      code.push_back(std::move(si));
      addr += cfg::kWordBytes;
    }
  }

  // 2) Pasada 2: resolver, validar y emitir
  Image img;
  img.entry = 0;
  img.bytes.reserve(code.size() * cfg::kWordBytes);

  for (const auto& si : code) {
    const std::string mnem = normalize_mnemonic(si.mnemonic, si.line);

    std::vector<OperandType> shape;
    shape.reserve(si.operands.size());
    for (const auto& op : si.operands) shape.push_back(classify(op, si.line));

    const InstrDef& def = select(si, mnem, shape);

    std::array<Word, kMaxOperands> values{};
    for (std::size_t i = 0; i < si.operands.size(); ++i) {
      const Token& op = si.operands[i];
      switch (def.ops[i]) {
        case OperandType::REG:
          values[i] = *parse_reg(op.text, config_.num_regs);
          break;
        case OperandType::IMM16:
        case OperandType::IMM24:
        case OperandType::IMM: {
          const Word v = parse_number(op, si.line);
          const Word max = def.ops[i] == OperandType::IMM16 ? codec::kMask16 : codec::kMask24;
          if (v > max) {
            std::ostringstream oss;
            oss << "inmediato fuera de rango para " << to_string(def.ops[i]) << ": " << op.text;
            throw AssemblyError(si.line, op.col, oss.str());
          }
          values[i] = v;
          break;
        }
        case OperandType::LAB: {
          auto it = symbols.find(op.text);
          if (it == symbols.end())
            throw AssemblyError(si.line, op.col, "label no definido: " + op.text);
          if (it->second > codec::kMask24)
            throw AssemblyError(si.line, op.col, "label fuera del rango de 24 bits: " + op.text);
          values[i] = it->second;
          break;
        }
      }
    }

    if (img.bytes.size() + cfg::kWordBytes > config_.max_program_bytes) {
      std::ostringstream oss;
      oss << "programa excede el límite de " << config_.max_program_bytes << " bytes";
      throw AssemblyError(si.line, si.mnemonic.col, oss.str());
    }

    const Word w = encode(def, values);
    img.bytes.push_back(static_cast<std::uint8_t>(w >> 24));
    img.bytes.push_back(static_cast<std::uint8_t>(w >> 16));
    img.bytes.push_back(static_cast<std::uint8_t>(w >> 8));
    img.bytes.push_back(static_cast<std::uint8_t>(w));
  }

  img.end = static_cast<Addr>(img.bytes.size());
  VPU_LOG_IF(cfg::kLogAsm, "[ASM] " << img.words() << " instrucciones, " << symbols.size() << " labels");
  return img;
}

} // namespace vpu
