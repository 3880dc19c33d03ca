// src/training/trainer.cpp
#include "seqlm/training/trainer.hpp"
#include "seqlm/training/losses.hpp"
#include <iostream>
#include <cstddef>
#include <stdexcept>
#include <utility>

namespace seqlm {
namespace training {

Trainer::Trainer(std::shared_ptr<const TransformerModel> model, ParameterSnapshot initial,
                 const TrainingConfig& config)
    : model_(std::move(model)), snapshot_(std::move(initial)), config_(config),
      optimizer_(config.learning_rate, config.beta1, config.beta2, config.epsilon) {
    if (!model_ || !snapshot_) {
        throw std::invalid_argument("Trainer needs a model and an initial parameter snapshot");
    }
    config_.validate();
    model_->check_parameters(*snapshot_);
}

float Trainer::train_step(const TokenBatch& inputs, const TargetBatch& targets) {
    TransformerModel::ForwardCache cache;
    Tensor logits = model_->forward(*snapshot_, inputs, &cache);

    LossResult loss = cross_entropy_loss(logits, targets);
    ModelParameters grads = model_->backward(*snapshot_, cache, loss.grad);

    if (config_.max_grad_norm > 0.0f) {
        clip_grad_norm(grads, config_.max_grad_norm);
    }

    snapshot_ = std::make_shared<const ModelParameters>(
        optimizer_.step(*snapshot_, std::move(grads)));
    steps_++;
    return loss.loss;
}

float Trainer::train_sequence(const std::vector<TokenID>& tokens) {
    if (tokens.size() < 2) {
        throw std::invalid_argument("Training sequence needs at least two tokens");
    }

    if (model_->config().causal) {
        std::vector<TokenID> inputs(tokens.begin(), tokens.end() - 1);
        std::vector<int> targets(tokens.begin() + 1, tokens.end());
        return train_step(TokenBatch{inputs}, TargetBatch{targets});
    }

    float total = 0.0f;
    for (size_t i = 1; i < tokens.size(); ++i) {
        std::vector<TokenID> prefix(tokens.begin(), tokens.begin() + static_cast<std::ptrdiff_t>(i));
        std::vector<int> targets(i, kIgnoreIndex);
        targets.back() = static_cast<int>(tokens[i]);
        total += train_step(TokenBatch{prefix}, TargetBatch{targets});
    }
    return total / static_cast<float>(tokens.size() - 1);
}

float Trainer::train_epoch(const std::vector<std::vector<TokenID>>& sequences) {
    if (sequences.empty()) {
        throw std::invalid_argument("No training sequences");
    }

    float total = 0.0f;
    for (const auto& sequence : sequences) {
        total += train_sequence(sequence);
    }
    return total / static_cast<float>(sequences.size());
}

float Trainer::fit(const std::vector<std::vector<TokenID>>& sequences) {
    float loss = 0.0f;
    for (size_t epoch = 0; epoch < config_.epochs; ++epoch) {
        loss = train_epoch(sequences);

        if (config_.verbose && config_.log_every > 0 && (epoch + 1) % config_.log_every == 0) {
            std::cout << "Epoch " << (epoch + 1) << "/" << config_.epochs
                      << ", Loss: " << loss << std::endl;
        }
    }
    return loss;
}

} // namespace training
} // namespace seqlm
