#include "vpu/processor.hpp"
#include "vpu/alu.hpp"
#include "vpu/disassembler.hpp"
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace vpu
{

  // CPU de la VPU: casi no calcula, despacha trabajo a los pipes.
  // - step(): una instrucción por ciclo (o un ciclo de espera en barrera)
  // - los kicks de hardware van al PipelineCoordinator
  // - JMP/BRA consultan BHT/BTB y llenan un slot de fetch especulativo
  Processor::Processor(const Config &config, const Registry &reg, Memory &mem,
                       PipelineCoordinator &pipes, BranchPredictor &bp, Metrics &metrics)
      : config_(config), reg_(reg), mem_(mem), pipes_(pipes), bp_(bp), metrics_(metrics),
        st_(config.num_regs) {}

  void Processor::reset(Addr entry)
  {
    st_.reset(entry);
    prefetch_.reset();
  }

  Word Processor::get_reg(RegId id) const
  {
    if (id < st_.regs.size())
      return st_.regs[id];
    if (id == config_.reg_acc())
      return st_.acc;
    if (id == config_.reg_pc())
      return st_.pc;
    throw ExecutionError("Registro inexistente: " + std::to_string(id));
  }

  void Processor::set_reg(RegId id, Word value)
  {
    if (id < st_.regs.size()) {
      st_.regs[id] = value;
      return;
    }
    if (id == config_.reg_acc()) {
      st_.acc = value;
      return;
    }
    if (id == config_.reg_pc())
      throw ExecutionError("PC es de solo lectura");
    throw ExecutionError("Registro inexistente: " + std::to_string(id));
  }

  // ===== Fetch =====
  Word Processor::fetch(Addr pc)
  {
    if (prefetch_ && prefetch_->pc == pc) {
      const Word w = prefetch_->word;
      prefetch_.reset();
      return w;
    }
    prefetch_.reset();
    return mem_.read32(pc);
  }

  // Trae la instrucción del camino predicho (si la dirección es válida)
  void Processor::speculate(Addr next)
  {
    if (next % cfg::kWordBytes == 0 && mem_.in_range(next, cfg::kWordBytes))
      prefetch_ = Prefetch{next, mem_.read32(next)};
    else
      prefetch_.reset();
  }

  void Processor::resolve_branch(const InstrDef &def, Addr pc, Addr target, bool taken, Addr &next)
  {
    const Addr actual = taken ? target : pc + cfg::kWordBytes;

    if (def.op == Op::BRA || config_.predict_jumps) {
      ++metrics_.branches;
      const Prediction p = bp_.predict(pc);
      speculate(p.next);
      bp_.update(pc, taken, target);

      if (p.next != actual) {
        ++metrics_.mispredictions;
        if (prefetch_) {
          prefetch_.reset();  // se descarta lo buscado y se vuelve a buscar
          ++metrics_.fetch_flushes;
        }
        VPU_LOG_IF(cfg::kLogBranch, "[CPU] mispredict @0x" << std::hex << pc
                   << " pred=0x" << p.next << " real=0x" << actual << std::dec);
      }
    }
    next = actual;
  }

  // ===== Ejecución (una instrucción) =====
  void Processor::execute(const Decoded &d, Addr pc, Addr &next)
  {
    const InstrDef &def = *d.def;
    const auto &o = d.operands;

    auto reg = [&](std::size_t i) { return get_reg(static_cast<RegId>(o[i])); };
    auto set_add = [&](Word b) {
      const auto r = alu::add(st_.acc, b);
      st_.acc    = r.value;
      st_.flag_o = r.overflow;
      st_.flag_c = r.zero;
    };

    // SCH.FNC es de hardware pero no kickea nada: es la barrera
    if (def.hardware && !def.is_barrier()) {
      // Operandos REG se leen ahora: el pipe trabaja con una copia
      std::array<Word, kMaxOperands> values{};
      for (std::size_t i = 0; i < def.ops.size(); ++i)
        values[i] = def.ops[i] == OperandType::REG ? reg(i) : o[i];
      pipes_.execute(def, values, pc);
      return;
    }

    switch (def.op) {
    case Op::NOP:
      break;
    case Op::HLT:
      st_.halted = true;
      break;

    case Op::MOV_RR:   set_reg(static_cast<RegId>(o[0]), reg(1)); break;
    case Op::MOV_RI16: set_reg(static_cast<RegId>(o[0]), o[1]);   break;
    case Op::MOV_I24:  st_.acc = o[0];                            break;

    case Op::ADD_I24: set_add(o[0]);  break;
    case Op::ADD_R:   set_add(reg(0)); break;

    case Op::ASR_I24: st_.acc = alu::asr(st_.acc, o[0]);  break;
    case Op::ASR_R:   st_.acc = alu::asr(st_.acc, reg(0)); break;
    case Op::LSR_I24: st_.acc = alu::lsr(st_.acc, o[0]);  break;
    case Op::LSR_R:   st_.acc = alu::lsr(st_.acc, reg(0)); break;
    case Op::LSL_I24: st_.acc = alu::lsl(st_.acc, o[0]);  break;
    case Op::LSL_R:   st_.acc = alu::lsl(st_.acc, reg(0)); break;

    case Op::CMP_R:  st_.flag_c = reg(0) == 0;      break;
    case Op::CMP_RR: st_.flag_c = reg(0) == reg(1); break;

    case Op::JMP: resolve_branch(def, pc, o[0], true, next);       break;
    case Op::BRA: resolve_branch(def, pc, o[0], st_.flag_c, next); break;

    case Op::LDW_L: st_.acc = mem_.read32(o[0]);   break;
    case Op::LDW_R: st_.acc = mem_.read32(reg(0)); break;
    case Op::STW_L: mem_.write32(o[0], st_.acc);   break;
    case Op::STW_R: mem_.write32(reg(0), st_.acc); break;

    case Op::BLOCK:
    case Op::SCH_FNC:
      break; // la espera se resuelve en step()

    default:
      throw std::logic_error("Instrucción core sin implementar: " + def.mnemonic);
    }
  }

  void Processor::step()
  {
    if (st_.halted)
      return;

    const Addr pc = st_.pc;
    const Word word = fetch(pc);
    const Decoded d = decode(reg_, word);
    if (!d.def) {
      std::ostringstream oss;
      oss << "Opcode inválido 0x" << std::hex << static_cast<unsigned>(word >> 24)
          << " @0x" << pc;
      throw ExecutionError(oss.str());
    }

    // Barrera: no se retira hasta que todos los pipes estén Idle.
    // Se reevalúa en el próximo ciclo (sin timeout).
    if (d.def->is_barrier()) {
      if (!pipes_.barrier_ready()) {
        if (!st_.waiting)
          VPU_LOG_IF(cfg::kLogCpu, "[CPU] barrera @0x" << std::hex << pc << std::dec
                     << " esperando " << pipes_.busy_count() << " pipe(s)");
        st_.waiting = true;
        ++metrics_.barrier_stalls;
        return;
      }
      st_.waiting = false;
    }

    VPU_LOG_IF(cfg::kLogCpu, "[CPU] 0x" << std::hex << std::setw(6) << std::setfill('0') << pc
               << std::dec << std::setfill(' ') << "  "
               << Disassembler(reg_, config_).instruction(word));

    Addr next = pc + cfg::kWordBytes;
    execute(d, pc, next);
    st_.pc = next;
    ++metrics_.instructions;
  }

} // namespace vpu
