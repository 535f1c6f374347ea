#include "vpu/branch_predictor.hpp"
#include "vpu/config.hpp"
#include <algorithm>
#include <iomanip>

namespace vpu {

BranchPredictor::BranchPredictor(std::size_t bht_entries, std::size_t btb_entries)
    : bht_(bht_entries), btb_(btb_entries) {}

void BranchPredictor::reset() {
  std::fill(bht_.begin(), bht_.end(), BhtEntry{});
  std::fill(btb_.begin(), btb_.end(), BtbEntry{});
}

// Entrada fría: débil no-tomado, así un solo salto tomado ya la invierte
BhtEntry& BranchPredictor::touch_bht(Addr pc) {
  auto& e = bht_[bht_index(pc)];
  if (!e.valid || e.pc != pc) {
    e.valid = true;
    e.pc    = pc;
    e.state = BhtState::WeakNot;
  }
  return e;
}

Prediction BranchPredictor::predict(Addr pc) {
  const auto& h = touch_bht(pc);
  const auto& t = btb_[btb_index(pc)];

  Prediction p;
  p.next  = pc + cfg::kWordBytes;
  p.taken = h.state >= BhtState::WeakTaken;
  // Sin destino en la BTB no hay a dónde saltar: se sigue secuencial
  if (p.taken && t.valid && t.pc == pc) {
    p.next = t.target;
  } else {
    p.taken = false;
  }
  return p;
}

void BranchPredictor::update(Addr pc, bool taken, Addr target) {
  auto& h = touch_bht(pc);
  auto s = static_cast<int>(h.state);
  s = taken ? std::min(s + 1, 3) : std::max(s - 1, 0);
  h.state = static_cast<BhtState>(s);

  // El destino se conoce aunque no se tome: la BTB se escribe siempre
  auto& t = btb_[btb_index(pc)];
  t.valid  = true;
  t.pc     = pc;
  t.target = target;

  VPU_LOG_IF(cfg::kLogBranch, "[BP] update pc=0x" << std::hex << pc
             << (taken ? " T" : " NT") << " -> 0x" << target << std::dec
             << " bht[" << bht_index(pc) << "]=" << s);
}

} // namespace vpu
