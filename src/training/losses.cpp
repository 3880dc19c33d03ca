// src/training/losses.cpp
#include "seqlm/training/losses.hpp"
#include <cmath>
#include <stdexcept>

namespace seqlm {

LossResult cross_entropy_loss(const Tensor& logits, const TargetBatch& targets) {
    if (logits.ndim() != 3) {
        throw InvalidShape("logits must be a 3D tensor [batch, seq_len, vocab_size], got " +
                           logits.shape_string());
    }

    const size_t batch_size = logits.dim(0);
    const size_t seq_len = logits.dim(1);
    const size_t vocab_size = logits.dim(2);

    if (targets.size() != batch_size) {
        throw InvalidShape("logits and targets must have compatible shapes");
    }
    for (const auto& row : targets) {
        if (row.size() != seq_len) {
            throw InvalidShape("logits and targets must have compatible shapes");
        }
    }

    LossResult result;
    result.grad = Tensor(logits.shape());

    double total = 0.0;
    for (size_t b = 0; b < batch_size; ++b) {
        const auto scores = logits.matrix(b);
        auto grad = result.grad.matrix(b);
        for (size_t s = 0; s < seq_len; ++s) {
            const int target = targets[b][s];
            if (target == kIgnoreIndex) {
                continue;
            }
            if (target < 0 || target >= static_cast<int>(vocab_size)) {
                throw std::out_of_range("Target index out of vocabulary range");
            }

            const auto row = static_cast<Eigen::Index>(s);
            const float max_logit = scores.row(row).maxCoeff();
            Eigen::RowVectorXf probs = (scores.row(row).array() - max_logit).exp().matrix();
            const float sum_exp = probs.sum();
            probs /= sum_exp;

            total -= static_cast<double>(scores(row, target) - max_logit - std::log(sum_exp));
            probs(target) -= 1.0f;
            grad.row(row) = probs;
            ++result.count;
        }
    }

    if (result.count > 0) {
        result.loss = static_cast<float>(total / static_cast<double>(result.count));
        result.grad.data() /= static_cast<float>(result.count);
    }
    return result;
}

} // namespace seqlm
