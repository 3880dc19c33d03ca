// include/seqlm/inference/inference_engine.hpp
#pragma once

#include "seqlm/models/transformer_model.hpp"
#include <Eigen/Dense>
#include <memory>
#include <vector>

namespace seqlm {

// Read-only consumer of a model and a parameter snapshot. Swapping in a new
// snapshot does not affect calls already running on the old one.
class InferenceEngine {
public:
    InferenceEngine(std::shared_ptr<const TransformerModel> model, ParameterSnapshot parameters);

    // Logits over the vocabulary for the position after the last token.
    Eigen::VectorXf next_token_logits(const std::vector<TokenID>& context) const;

    // Index of the largest final-position logit.
    TokenID predict_next(const std::vector<TokenID>& context) const;

    void set_parameters(ParameterSnapshot parameters);
    ParameterSnapshot parameters() const { return parameters_; }

private:
    std::shared_ptr<const TransformerModel> model_;
    ParameterSnapshot parameters_;
};

} // namespace seqlm
