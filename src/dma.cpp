#include "vpu/dma.hpp"
#include "vpu/config.hpp"
#include <iomanip>

namespace vpu {

DmaEngine::DmaEngine(Memory& mem, std::size_t access_width)
    : mem_(mem), access_width_(access_width) {}

std::uint64_t DmaEngine::fill(Word value) {
  const auto byte = static_cast<std::uint8_t>(value & 0xFFu); // truncado al LSB
  mem_.fill(dest_, length_, byte);
  VPU_LOG_IF(cfg::kLogPipe, "[DMA] SET dst=0x" << std::hex << dest_
             << " len=0x" << length_ << " val=0x" << static_cast<unsigned>(byte) << std::dec);
  return length_;
}

std::uint64_t DmaEngine::copy() {
  mem_.copy(dest_, source_, length_);
  VPU_LOG_IF(cfg::kLogPipe, "[DMA] CPY src=0x" << std::hex << source_
             << " dst=0x" << dest_ << " len=0x" << length_ << std::dec);
  return length_;
}

} // namespace vpu
