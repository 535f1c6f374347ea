#include "vpu/assembler.hpp"
#include "vpu/codec.hpp"
#include "vpu/disassembler.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>
#include <sstream>

using namespace vpu;

namespace {

class AssemblerTest : public ::testing::Test {
protected:
  Config          config_ = test::small_config();
  const Registry& reg_    = Registry::instance();

  Image assemble(const std::string& src) { return Assembler(reg_, config_).assemble(src); }

  std::vector<Op> ops_of(const Image& img) {
    std::vector<Op> out;
    for (const auto& d : Disassembler(reg_, config_).decode_image(img)) out.push_back(d.def->op);
    return out;
  }

  // Espera AssemblyError en la línea/columna dadas
  void expect_error(const std::string& src, std::size_t line, std::size_t col) {
    try {
      assemble(src);
      FAIL() << "se esperaba AssemblyError";
    } catch (const AssemblyError& e) {
      EXPECT_EQ(e.line(), line) << e.what();
      EXPECT_EQ(e.col(), col) << e.what();
    }
  }
};

} // namespace

TEST_F(AssemblerTest, EmitsOneWordPerInstruction) {
  const Image img = assemble(
    "MOV 4095      ; 0xFFF en ACC\n"
    "LSL 20\n"
    "MOV R1, ACC\n"
    "HLT\n");
  ASSERT_EQ(img.words(), 4u);
  EXPECT_EQ(img.bytes.size(), 16u);
  EXPECT_EQ(img.entry, 0u);
  EXPECT_EQ(img.end, 16u);

  EXPECT_EQ(img.word(0), codec::encode_24(test::def_of("MOV", {OperandType::IMM}).opcode, 4095));
  EXPECT_EQ(img.word(2), codec::encode_rr(test::def_of("MOV", {OperandType::REG, OperandType::REG}).opcode,
                                          0, config_.reg_acc()));
  // big-endian: opcode en el primer byte
  EXPECT_EQ(img.bytes[0], test::def_of("MOV", {OperandType::IMM}).opcode);
}

TEST_F(AssemblerTest, ResolvesLabelsToAbsoluteAddresses) {
  const Image img = assemble(
    "START\n"
    "    MOV 1\n"
    "LOOP: ADD 1\n"
    "    BRA DONE      ; referencia hacia adelante\n"
    "    JMP LOOP\n"
    "DONE\n"
    "    JMP START\n");
  ASSERT_EQ(img.words(), 5u);
  EXPECT_EQ(codec::get_label(img.word(2)), 16u); // DONE
  EXPECT_EQ(codec::get_label(img.word(3)), 4u);  // LOOP
  EXPECT_EQ(codec::get_label(img.word(4)), 0u);  // START
}

TEST_F(AssemblerTest, AcceptsPipePrefixesCaseAndHex) {
  const Image img = assemble(
    "p.dma.dst r1\n"
    "DMA.LEN R3\n"
    "P.SCH.FNC\n"
    "mov r4, 0xff\n");
  EXPECT_EQ(ops_of(img), (std::vector<Op>{Op::DMA_DST, Op::DMA_LEN, Op::SCH_FNC, Op::MOV_RI16}));
  EXPECT_EQ(codec::get_u16(img.word(3)), 0xFF);
  EXPECT_TRUE(codec::is_kick(codec::opcode_of(img.word(0))));
}

TEST_F(AssemblerTest, CommentsAndBlankLinesEmitNothing) {
  const Image img = assemble("\n   ; sólo comentario\n\nNOP ; fin\n\n");
  EXPECT_EQ(img.words(), 1u);
}

TEST_F(AssemblerTest, SameMnemonicDifferentArity) {
  const Image img = assemble("CMP R1\nCMP R1, R2\n");
  EXPECT_EQ(ops_of(img), (std::vector<Op>{Op::CMP_R, Op::CMP_RR}));
}

TEST_F(AssemblerTest, UnknownMnemonic) {
  expect_error("NOP\n  FOO R1\n", 2, 3);
}

TEST_F(AssemblerTest, UnknownPipe) {
  expect_error("XYZ.FOO R1\n", 1, 1);
  expect_error("    P.SNC.FNC\n", 1, 5);
}

// "P." sólo se quita delante de un mnemónico de pipe
TEST_F(AssemblerTest, PipePrefixNeedsPipeMnemonic) {
  expect_error("P.NOP\n", 1, 1);
  expect_error("  P.NOP:\nHLT\n", 1, 3);
  EXPECT_EQ(assemble("p.dma.cpy\nP.SCH.FNC\n").words(), 2u);
}

TEST_F(AssemblerTest, ErrorEchoesSourceWithCaret) {
  try {
    assemble("NOP\n  JMP NOWHERE   ; sin label\n");
    FAIL() << "se esperaba AssemblyError";
  } catch (const AssemblyError& e) {
    EXPECT_EQ(e.line(), 2u);
    EXPECT_EQ(e.col(), 7u);
    EXPECT_EQ(e.detail(), "label no definido: NOWHERE");
    EXPECT_EQ(e.source(), "  JMP NOWHERE   ; sin label");
    EXPECT_EQ(std::string(e.what()),
              "linea 2, col 7: label no definido: NOWHERE\n"
              "    JMP NOWHERE   ; sin label\n"
              "        ^");
  }
}

TEST_F(AssemblerTest, WrongArity) {
  expect_error("MOV R1, R2, R3\n", 1, 1);
  expect_error("DMA.CPY R1\n", 1, 1);
}

TEST_F(AssemblerTest, WrongOperandKind) {
  expect_error("LDW 5\n", 1, 5);
  expect_error("DMA.DST 0x10\n", 1, 9);
}

TEST_F(AssemblerTest, ImmediateOutOfRange) {
  expect_error("MOV R1, 0x10000\n", 1, 9);  // IMM16
  expect_error("MOV 0x1000000\n", 1, 5);    // IMM24
  expect_error("ADD 16777216\n", 1, 5);
  EXPECT_NO_THROW(assemble("MOV R1, 0xFFFF\nMOV 0xFFFFFF\n"));
}

TEST_F(AssemblerTest, MalformedLiteral) {
  expect_error("MOV 12abc\n", 1, 5);
}

TEST_F(AssemblerTest, UndefinedLabel) {
  expect_error("NOP\nJMP NOWHERE\n", 2, 5);
}

TEST_F(AssemblerTest, DuplicateLabel) {
  expect_error("A\nNOP\nA\n", 3, 1);
}

TEST_F(AssemblerTest, LabelCannotShadowRegisterOrMnemonic) {
  expect_error("R1:\nNOP\n", 1, 1);
  expect_error("HLT:\nNOP\n", 1, 1);
}

TEST_F(AssemblerTest, ProgramLimitCountsEmittedBytes) {
  config_.max_program_bytes = 8;
  EXPECT_NO_THROW(assemble("NOP\nNOP\nLAB1\nLAB2\n"));
  expect_error("NOP\nNOP\nNOP\n", 3, 1);
}

TEST_F(AssemblerTest, DisassemblyUsesFixedMnemonicWidth) {
  const Disassembler dis(reg_, config_);
  const Image img = assemble("MOV R1, ACC\nHLT\n");
  EXPECT_EQ(dis.instruction(img.word(0)), "MOV     R1, ACC");
  EXPECT_EQ(dis.instruction(img.word(1)), "HLT");
  EXPECT_EQ(dis.instruction(0xFE000000u), ".word 0xfe000000");
}

TEST_F(AssemblerTest, DisassembledLabelShowsAddress) {
  const Disassembler dis(reg_, config_);
  const Image img = assemble("NOP\nNOP\nNOP\nNOP\nEND\nJMP END\n");
  EXPECT_EQ(dis.instruction(img.word(4)), "JMP     0x10");
  const auto lines = dis.listing(img);
  ASSERT_EQ(lines.size(), 5u);
  EXPECT_EQ(lines[4].substr(0, 9), "0x000010:");
}

// Ensamblar -> desensamblar -> ensamblar reproduce la misma imagen
TEST_F(AssemblerTest, DisassemblyReassemblesToSameImage) {
  const Image img = assemble(
    "MOV 4095\n"
    "LSL 20\n"
    "MOV R1, ACC\n"
    "MOV R4, 255\n"
    "ADD R4\n"
    "CMP R1, R4\n"
    "DMA.DST R1\n"
    "DMA.SET R4\n"
    "BLI.PIX R1, R4\n"
    "SCH.FNC\n"
    "HLT\n");
  const Disassembler dis(reg_, config_);
  std::ostringstream text;
  for (std::size_t i = 0; i < img.words(); ++i) text << dis.instruction(img.word(i)) << "\n";
  const Image again = assemble(text.str());
  EXPECT_EQ(again.bytes, img.bytes);
}

TEST_F(AssemblerTest, DisassemblyPreservesOpcodeSequenceWithLabels) {
  const Image img = assemble(
    "LOOP\n"
    "  ADD R2\n"
    "  BRA OUT\n"
    "  JMP LOOP\n"
    "OUT: STW R1\n"
    "  LDW OUT\n");
  EXPECT_EQ(ops_of(img), (std::vector<Op>{Op::ADD_R, Op::BRA, Op::JMP, Op::STW_R, Op::LDW_L}));
  const auto decoded = Disassembler(reg_, config_).decode_image(img);
  EXPECT_EQ(decoded[1].operands[0], 12u);
  EXPECT_EQ(decoded[2].operands[0], 0u);
  EXPECT_EQ(decoded[4].operands[0], 12u);
}
