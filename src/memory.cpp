#include "vpu/memory.hpp"
#include <algorithm>
#include <cstring> // std::memcpy / std::memmove
#include <sstream>

namespace vpu {

Memory::Memory(std::uint64_t size_bytes) : mem_(size_bytes, 0) {}

void Memory::check_range(std::uint64_t addr, std::uint64_t bytes, const char* what) const {
  if (!in_range(addr, bytes)) {
    std::ostringstream oss;
    oss << what << " fuera de memoria: 0x" << std::hex << addr
        << " +" << std::dec << bytes << " (tamaño " << mem_.size() << ")";
    throw ExecutionError(oss.str());
  }
}

std::uint8_t Memory::read8(Addr addr) const {
  check_range(addr, 1, "read8");
  return mem_[addr];
}

void Memory::write8(Addr addr, std::uint8_t value) {
  check_range(addr, 1, "write8");
  mem_[addr] = value;
}

// Palabras en big-endian: byte 0 = MSB (el opcode en una instrucción)
Word Memory::read32(Addr addr) const {
  if (addr % cfg::kWordBytes != 0) {
    std::ostringstream oss;
    oss << "read32 desalineado @0x" << std::hex << addr;
    throw ExecutionError(oss.str());
  }
  check_range(addr, cfg::kWordBytes, "read32");
  return (static_cast<Word>(mem_[addr])     << 24) |
         (static_cast<Word>(mem_[addr + 1]) << 16) |
         (static_cast<Word>(mem_[addr + 2]) << 8)  |
          static_cast<Word>(mem_[addr + 3]);
}

void Memory::write32(Addr addr, Word value) {
  if (addr % cfg::kWordBytes != 0) {
    std::ostringstream oss;
    oss << "write32 desalineado @0x" << std::hex << addr;
    throw ExecutionError(oss.str());
  }
  check_range(addr, cfg::kWordBytes, "write32");
  mem_[addr]     = static_cast<std::uint8_t>(value >> 24);
  mem_[addr + 1] = static_cast<std::uint8_t>(value >> 16);
  mem_[addr + 2] = static_cast<std::uint8_t>(value >> 8);
  mem_[addr + 3] = static_cast<std::uint8_t>(value);
}

bool Memory::read_block(Addr addr, void* dst, std::size_t bytes) const {
  if (!in_range(addr, bytes)) return false;
  std::memcpy(dst, mem_.data() + addr, bytes);
  return true;
}

bool Memory::write_block(Addr addr, const void* src, std::size_t bytes) {
  if (!in_range(addr, bytes)) return false;
  std::memcpy(mem_.data() + addr, src, bytes);
  return true;
}

void Memory::fill(Addr dest, std::uint64_t len, std::uint8_t value) {
  check_range(dest, len, "fill");
  std::fill_n(mem_.begin() + dest, len, value);
}

void Memory::copy(Addr dest, Addr src, std::uint64_t len) {
  check_range(src, len, "copy (origen)");
  check_range(dest, len, "copy (destino)");
  if (len == 0) return;
  std::memmove(mem_.data() + dest, mem_.data() + src, len);
}

void Memory::clear() {
  std::fill(mem_.begin(), mem_.end(), 0);
}

} // namespace vpu
