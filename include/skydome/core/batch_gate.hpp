#pragma once

namespace skydome::core {

enum class BatchMode {
  AbortNoMasks,
  Partial,
  Full,
};

struct BatchGateDecision {
  BatchMode mode = BatchMode::AbortNoMasks;
  bool partial = false;
  bool should_abort = true;
};

// Decides whether aggregation may start after segmentation. A batch with
// fewer than min_usable masks is fatal; any failed photo makes it partial.
BatchGateDecision evaluate_batch_gate(int usable_masks, int total_photos,
                                      int min_usable = 1);

} // namespace skydome::core
