#pragma once
#include "config.hpp"
#include "memory.hpp"
#include "types.hpp"
#include <cstdint>
#include <optional>

namespace vpu {

// Trabajo en curso del blitter (uno a la vez)
struct BlitJob {
  enum class Kind : std::uint8_t { Clear, Pixel };
  Kind          kind{Kind::Clear};
  Word          x{0};
  Word          y{0};
  Word          color{0};   // color capturado al hacer el kick
  std::uint64_t done{0};    // píxeles retirados
  std::uint64_t total{0};
};

/**
 * Blitter: escribe en el framebuffer reservado al tope de la memoria.
 * Formato: RGB empaquetado en los 24 bits bajos, 3 o 4 bytes por píxel
 * (big-endian, en 32bpp el byte alto queda en 0).
 * advance(budget) retira hasta 'budget' píxeles por ciclo.
 */
class Blitter {
public:
  Blitter(Memory& mem, const Config& config);

  void set_color(Word rgb) { color_ = rgb & 0xFFFFFFu; }
  Word color() const { return color_; }

  // Arrancan un trabajo nuevo. Devuelven la cantidad de píxeles a retirar.
  std::uint64_t start_clear();
  std::uint64_t start_pixel(Word x, Word y);

  bool active() const { return job_.has_value(); }
  const std::optional<BlitJob>& job() const { return job_; }

  // Retira hasta 'budget' píxeles; devuelve cuántos escribió.
  std::uint64_t advance(std::uint64_t budget);

  // Lectura de un píxel (para dumps y pruebas)
  Word pixel(Word x, Word y) const;

  Addr          base() const  { return base_; }
  std::uint64_t bytes() const { return bytes_; }
  std::size_t   width() const  { return width_; }
  std::size_t   height() const { return height_; }

  void reset();

private:
  Addr pixel_addr(Word x, Word y) const;
  void write_pixel(Word x, Word y, Word rgb);

  Memory&       mem_;
  Addr          base_;
  std::uint64_t bytes_;
  std::size_t   width_;
  std::size_t   height_;
  std::size_t   bytes_pp_;
  Word          color_{0};
  std::optional<BlitJob> job_;
};

} // namespace vpu
