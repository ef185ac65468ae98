#include "skydome/core/batch_gate.hpp"

#include <algorithm>

namespace skydome::core {

BatchGateDecision evaluate_batch_gate(int usable_masks, int total_photos,
                                      int min_usable) {
  BatchGateDecision out;
  if (usable_masks < std::max(1, min_usable)) {
    return out;
  }

  if (usable_masks < total_photos) {
    out.mode = BatchMode::Partial;
    out.partial = true;
    out.should_abort = false;
    return out;
  }

  out.mode = BatchMode::Full;
  out.partial = false;
  out.should_abort = false;
  return out;
}

} // namespace skydome::core
