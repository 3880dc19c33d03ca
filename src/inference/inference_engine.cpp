// src/inference/inference_engine.cpp
#include "seqlm/inference/inference_engine.hpp"
#include <stdexcept>
#include <utility>

namespace seqlm {

InferenceEngine::InferenceEngine(std::shared_ptr<const TransformerModel> model,
                                 ParameterSnapshot parameters)
    : model_(std::move(model)) {
    if (!model_) {
        throw std::invalid_argument("InferenceEngine needs a model");
    }
    set_parameters(std::move(parameters));
}

void InferenceEngine::set_parameters(ParameterSnapshot parameters) {
    if (!parameters) {
        throw std::invalid_argument("InferenceEngine needs a parameter snapshot");
    }
    model_->check_parameters(*parameters);
    parameters_ = std::move(parameters);
}

Eigen::VectorXf InferenceEngine::next_token_logits(const std::vector<TokenID>& context) const {
    // Hold the snapshot for the duration of the call
    ParameterSnapshot parameters = parameters_;
    Tensor logits = model_->forward(*parameters, context);
    const auto last = static_cast<Eigen::Index>(logits.dim(1) - 1);
    return logits.matrix(0).row(last).transpose();
}

TokenID InferenceEngine::predict_next(const std::vector<TokenID>& context) const {
    Eigen::VectorXf logits = next_token_logits(context);
    Eigen::Index best_index = 0;
    logits.maxCoeff(&best_index);
    return static_cast<TokenID>(best_index);
}

} // namespace seqlm
