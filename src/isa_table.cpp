#include "vpu/isa.hpp"

namespace vpu {

// Tabla de instrucciones de la VPU (versión kIsaVersion).
// Orden = orden de asignación de opcodes, no reordenar sin subir la versión.

namespace {

constexpr OperandType R   = OperandType::REG;
constexpr OperandType L   = OperandType::LAB;
constexpr OperandType I16 = OperandType::IMM16;
constexpr OperandType I24 = OperandType::IMM24;
constexpr OperandType X   = OperandType::REG; // relleno, ignorado por nops

} // namespace

const std::vector<InstrSpec>& builtin_instructions() {
  static const std::vector<InstrSpec> table = {
    // ---- core ----
    {nullptr, "NOP",   0, {X,   X,   X  }, 0,               Op::NOP,      "No operation"},
    {nullptr, "HLT",   0, {X,   X,   X  }, 0,               Op::HLT,      "Halt execution at this point"},
    {nullptr, "MOV",   2, {R,   R,   X  }, 0,               Op::MOV_RR,   "Move contents of REG to REG"},
    {nullptr, "MOV",   2, {R,   I16, X  }, 0,               Op::MOV_RI16, "Load 16-bit immediate into REG"},
    {nullptr, "MOV",   1, {I24, X,   X  }, 0,               Op::MOV_I24,  "Load 24-bit immediate into ACC"},
    {nullptr, "ADD",   1, {I24, X,   X  }, kFlagO | kFlagC, Op::ADD_I24,  "Add 24-bit immediate to ACC. Set O on overflow and C if result is 0."},
    {nullptr, "ADD",   1, {R,   X,   X  }, kFlagO | kFlagC, Op::ADD_R,    "Add value in REG to ACC. Set O on overflow and C if result is 0."},
    {nullptr, "ASR",   1, {I24, X,   X  }, 0,               Op::ASR_I24,  "Arithmetic shift right by IMM24"},
    {nullptr, "ASR",   1, {R,   X,   X  }, 0,               Op::ASR_R,    "Arithmetic shift right by value in REG"},
    {nullptr, "LSR",   1, {I24, X,   X  }, 0,               Op::LSR_I24,  "Logical shift right by IMM"},
    {nullptr, "LSR",   1, {R,   X,   X  }, 0,               Op::LSR_R,    "Logical shift right by value in REG"},
    {nullptr, "LSL",   1, {I24, X,   X  }, 0,               Op::LSL_I24,  "Logical shift left by IMM"},
    {nullptr, "LSL",   1, {R,   X,   X  }, 0,               Op::LSL_R,    "Logical shift left by value in REG"},
    {nullptr, "CMP",   1, {R,   X,   X  }, kFlagC,          Op::CMP_R,    "Set C if REG is zero."},
    {nullptr, "CMP",   2, {R,   R,   X  }, kFlagC,          Op::CMP_RR,   "Set C if values in operand registers are equal"},
    {nullptr, "JMP",   1, {L,   X,   X  }, 0,               Op::JMP,      "Change PC to Label."},
    {nullptr, "BRA",   1, {L,   X,   X  }, 0,               Op::BRA,      "Change PC to Label if C is set."},
    {nullptr, "LDW",   1, {L,   X,   X  }, 0,               Op::LDW_L,    "Load value from mem address Label to ACC."},
    {nullptr, "LDW",   1, {R,   X,   X  }, 0,               Op::LDW_R,    "Load value from mem address in REG to ACC."},
    {nullptr, "STW",   1, {L,   X,   X  }, 0,               Op::STW_L,    "Store value from ACC to address Label."},
    {nullptr, "STW",   1, {R,   X,   X  }, 0,               Op::STW_R,    "Store value from ACC to address in REG."},
    {nullptr, "BLOCK", 0, {X,   X,   X  }, 0,               Op::BLOCK,    "Wait until every busy hardware pipe is idle."},

    // ---- sched ----
    {"SCH",   "FNC",   0, {X,   X,   X  }, 0,               Op::SCH_FNC,  "Wait for the scheduler to report all hardware kicks have completed."},

    // ---- dma ----
    {"DMA",   "DST",   1, {R,   X,   X  }, 0,               Op::DMA_DST,  "Set the DMA DEST reg address."},
    {"DMA",   "SRC",   1, {R,   X,   X  }, 0,               Op::DMA_SRC,  "Set the DMA SOURCE reg address."},
    {"DMA",   "LEN",   1, {R,   X,   X  }, 0,               Op::DMA_LEN,  "Set the DMA LENGTH reg, bytes."},
    {"DMA",   "SET",   1, {R,   X,   X  }, 0,               Op::DMA_SET,  "Write the same byte to every entry in the DMA range. Reg truncated to LS byte"},
    {"DMA",   "CPY",   0, {X,   X,   X  }, 0,               Op::DMA_CPY,  "Copy LENGTH bytes from SOURCE to DEST."},

    // ---- blitter ----
    {"BLI",   "CLR",   0, {X,   X,   X  }, 0,               Op::BLI_CLR,  "Clear the framebuffer to most recent colour given to blitter"},
    {"BLI",   "PIX",   2, {R,   R,   X  }, 0,               Op::BLI_PIX,  "Blit one pixel to framebuffer, regs give positions. Uses most recent colour given to blitter"},
    {"BLI",   "COL",   1, {R,   X,   X  }, 0,               Op::BLI_COL,  "Set blitter to use colour in register. Format is RGB in lower 24 bits."},
  };
  return table;
}

const std::vector<PipeSpec>& builtin_pipes() {
  static const std::vector<PipeSpec> pipes = {
    {0, "sched",   "SCH", PipeKind::Scheduler},
    {1, "dma",     "DMA", PipeKind::Dma},
    {2, "blitter", "BLI", PipeKind::Blitter},
  };
  return pipes;
}

} // namespace vpu
