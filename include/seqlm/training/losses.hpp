// include/seqlm/training/losses.hpp
#pragma once

#include "seqlm/core/tensor.hpp"
#include "seqlm/core/types.hpp"

namespace seqlm {

struct LossResult {
    float loss = 0.0f;   // mean over counted positions
    Tensor grad;         // d(loss)/d(logits), same shape as the logits
    size_t count = 0;    // positions whose target was not kIgnoreIndex
};

// Softmax cross-entropy of (batch x seq_len x vocab_size) logits against
// (batch x seq_len) targets. Positions with target kIgnoreIndex are skipped.
LossResult cross_entropy_loss(const Tensor& logits, const TargetBatch& targets);

} // namespace seqlm
