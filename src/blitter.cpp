#include "vpu/blitter.hpp"
#include <algorithm>
#include <array>

namespace vpu {

Blitter::Blitter(Memory& mem, const Config& config)
    : mem_(mem),
      base_(static_cast<Addr>(config.framebuffer_base())),
      bytes_(config.framebuffer_bytes()),
      width_(config.fb_width),
      height_(config.fb_height),
      bytes_pp_(config.fb_bpp / 8) {}

void Blitter::reset() {
  color_ = 0;
  job_.reset();
}

Addr Blitter::pixel_addr(Word x, Word y) const {
  return base_ + static_cast<Addr>((static_cast<std::uint64_t>(y) * width_ + x) * bytes_pp_);
}

void Blitter::write_pixel(Word x, Word y, Word rgb) {
  std::array<std::uint8_t, 4> px{};
  // big-endian: en 24bpp R,G,B; en 32bpp 0,R,G,B
  for (std::size_t i = 0; i < bytes_pp_; ++i)
    px[i] = static_cast<std::uint8_t>(rgb >> (8 * (bytes_pp_ - 1 - i)));
  if (!mem_.write_block(pixel_addr(x, y), px.data(), bytes_pp_))
    throw ExecutionError("framebuffer fuera de memoria");
}

Word Blitter::pixel(Word x, Word y) const {
  if (x >= width_ || y >= height_) return 0;
  std::array<std::uint8_t, 4> px{};
  if (!mem_.read_block(pixel_addr(x, y), px.data(), bytes_pp_)) return 0;
  Word v = 0;
  for (std::size_t i = 0; i < bytes_pp_; ++i) v = (v << 8) | px[i];
  return v & 0xFFFFFFu;
}

std::uint64_t Blitter::start_clear() {
  BlitJob j;
  j.kind  = BlitJob::Kind::Clear;
  j.color = color_;
  j.total = static_cast<std::uint64_t>(width_) * height_;
  job_ = j;
  return j.total;
}

std::uint64_t Blitter::start_pixel(Word x, Word y) {
  BlitJob j;
  j.kind  = BlitJob::Kind::Pixel;
  j.x     = x;
  j.y     = y;
  j.color = color_;
  j.total = 1;
  if (x >= width_ || y >= height_) {
    VPU_LOG_IF(cfg::kLogPipe, "[BLI] PIX (" << x << "," << y << ") fuera del framebuffer, recortado");
  }
  job_ = j;
  return j.total;
}

std::uint64_t Blitter::advance(std::uint64_t budget) {
  if (!job_) return 0;
  auto& j = *job_;

  std::uint64_t written = 0;
  const std::uint64_t n = std::min(budget, j.total - j.done);
  if (j.kind == BlitJob::Kind::Clear) {
    for (std::uint64_t i = 0; i < n; ++i) {
      const std::uint64_t idx = j.done + i;
      write_pixel(static_cast<Word>(idx % width_), static_cast<Word>(idx / width_), j.color);
    }
    written = n;
  } else if (n > 0 && j.x < width_ && j.y < height_) {
    write_pixel(j.x, j.y, j.color);
    written = 1;
  }
  j.done += n;

  if (j.done >= j.total) job_.reset();
  return written;
}

} // namespace vpu
