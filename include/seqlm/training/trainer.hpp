// include/seqlm/training/trainer.hpp
#pragma once

#include "seqlm/config_manager.hpp"
#include "seqlm/models/transformer_model.hpp"
#include "seqlm/optimizers/adam.hpp"
#include <memory>
#include <vector>

namespace seqlm {
namespace training {

// Drives forward, loss, backward and Adam updates for a TransformerModel.
// Each step publishes a new ParameterSnapshot; snapshots handed out earlier
// stay valid and unchanged.
class Trainer {
public:
    Trainer(std::shared_ptr<const TransformerModel> model, ParameterSnapshot initial,
            const TrainingConfig& config);

    // One optimizer step on a batch; returns the loss before the update.
    float train_step(const TokenBatch& inputs, const TargetBatch& targets);

    // Next-token training on one sequence.
    // Without a causal mask: for i in 1..n-1 the input is tokens[0:i] and only its
    // final position is scored against tokens[i], one step per prefix.
    // With a causal mask: one step on tokens[0:n-1] against tokens[1:n].
    // Returns the mean loss of the steps taken.
    float train_sequence(const std::vector<TokenID>& tokens);

    float train_epoch(const std::vector<std::vector<TokenID>>& sequences);

    // Runs config.epochs epochs; returns the mean loss of the last one.
    float fit(const std::vector<std::vector<TokenID>>& sequences);

    ParameterSnapshot snapshot() const { return snapshot_; }
    const AdamOptimizer& optimizer() const { return optimizer_; }
    size_t steps() const { return steps_; }

private:
    std::shared_ptr<const TransformerModel> model_;
    ParameterSnapshot snapshot_;
    TrainingConfig config_;
    AdamOptimizer optimizer_;
    size_t steps_ = 0;
};

} // namespace training
} // namespace seqlm
