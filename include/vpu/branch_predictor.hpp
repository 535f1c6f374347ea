#pragma once
#include "types.hpp"
#include <cstdint>
#include <vector>

namespace vpu {

// Contador de 2 bits por entrada de la BHT
enum class BhtState : std::uint8_t { StrongNot = 0, WeakNot = 1, WeakTaken = 2, StrongTaken = 3 };

struct BhtEntry {
  bool     valid{false};
  Addr     pc{0};                      // dirección completa del salto
  BhtState state{BhtState::WeakNot};
};

struct BtbEntry {
  bool valid{false};
  Addr pc{0};
  Addr target{0};
};

struct Prediction {
  bool taken{false};
  Addr next{0};    // dirección que el front-end va a buscar
};

/**
 * BHT + BTB de mapeo directo.
 *   índice BHT = (pc >> 2) & (bht_entries - 1)
 *   índice BTB = (pc >> 2) & (btb_entries - 1)
 * Una entrada se crea (o se pisa si otro salto comparte el índice) en la
 * primera referencia. update() escribe BHT y BTB en cada resolución, tomada
 * o no; predecir tomado exige contador >= WeakTaken y acierto en la BTB.
 * Sólo reset() borra.
 * El flush/refetch lo decide el Processor, acá sólo predict/update.
 */
class BranchPredictor {
public:
  BranchPredictor(std::size_t bht_entries, std::size_t btb_entries);

  Prediction predict(Addr pc);
  void       update(Addr pc, bool taken, Addr target);
  void       reset();

  std::size_t bht_index(Addr pc) const { return (pc >> 2) & (bht_.size() - 1); }
  std::size_t btb_index(Addr pc) const { return (pc >> 2) & (btb_.size() - 1); }

  const BhtEntry& bht(std::size_t idx) const { return bht_.at(idx); }
  const BtbEntry& btb(std::size_t idx) const { return btb_.at(idx); }

private:
  BhtEntry& touch_bht(Addr pc);

  std::vector<BhtEntry> bht_;
  std::vector<BtbEntry> btb_;
};

} // namespace vpu
