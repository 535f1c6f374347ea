#include "vpu/config.hpp"
#include <stdexcept>
#include <string>

namespace vpu {

namespace {

bool is_pow2(std::uint64_t v) { return v != 0 && (v & (v - 1)) == 0; }

} // namespace

std::uint64_t Config::framebuffer_bytes() const {
  return static_cast<std::uint64_t>(fb_width) * fb_height * (fb_bpp / 8);
}

// Tope de memoria menos el framebuffer, bajado al límite de 64KB
std::uint64_t Config::framebuffer_base() const {
  const std::uint64_t bytes = framebuffer_bytes();
  if (bytes > memory_bytes) return 0;
  return (memory_bytes - bytes) & ~(cfg::kFbAlign - 1);
}

std::size_t Config::pixels_per_cycle() const {
  if (fb_bpp == 0) return 1;
  const std::size_t n = (access_width * 8) / fb_bpp;
  return n == 0 ? 1 : n;
}

void Config::validate() const {
  auto fail = [](const std::string& msg) { throw std::invalid_argument("Config: " + msg); };

  if (memory_bytes == 0)
    fail("memoria de 0 bytes");
  if (memory_bytes > 0x100000000ull)
    fail("la memoria excede el espacio de direcciones de 32 bits");
  if (!is_pow2(access_width))
    fail("ancho de acceso debe ser potencia de 2: " + std::to_string(access_width));
  if (num_regs == 0 || num_regs > 254)
    fail("cantidad de registros fuera de rango (1..254): " + std::to_string(num_regs));

  if (fb_width == 0 || fb_height == 0)
    fail("framebuffer sin dimensiones");
  if (fb_bpp != 24 && fb_bpp != 32)
    fail("bpp soportados: 24 o 32, no " + std::to_string(fb_bpp));
  if (framebuffer_bytes() > memory_bytes / 4)
    fail("framebuffer de " + std::to_string(framebuffer_bytes()) +
         " bytes excede 1/4 de la memoria");

  if (!is_pow2(bht_entries))
    fail("BHT debe tener potencia de 2 entradas: " + std::to_string(bht_entries));
  if (!is_pow2(btb_entries))
    fail("BTB debe tener potencia de 2 entradas: " + std::to_string(btb_entries));
  if (sched_queue_depth == 0)
    fail("profundidad de cola del scheduler en 0");

  if (max_program_bytes == 0 || max_program_bytes % cfg::kWordBytes != 0)
    fail("límite de programa debe ser múltiplo de " + std::to_string(cfg::kWordBytes));
  if (max_program_bytes > framebuffer_base())
    fail("el límite de programa se solapa con el framebuffer");
}

} // namespace vpu
