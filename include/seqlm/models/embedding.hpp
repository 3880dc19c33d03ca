#pragma once

#include "seqlm/core/parameter.hpp"
#include "seqlm/core/tensor.hpp"
#include "seqlm/core/types.hpp"
#include <random>
#include <string>
#include <vector>

namespace seqlm {

struct EmbeddingParameters {
    Eigen::MatrixXf table;  // vocab_size x d_model

    void collect(const std::string& prefix, std::vector<ParameterView>& out);
};

class Embedding {
public:
    Embedding(size_t vocab_size, size_t d_model);

    EmbeddingParameters init_parameters(std::mt19937& gen) const;
    void check_parameters(const EmbeddingParameters& params) const;

    // (batch x seq_len) ids -> (batch x seq_len x d_model) rows of the table
    Tensor forward(const EmbeddingParameters& params, const TokenBatch& tokens) const;

    // Scatter-adds each position's gradient into the row of the token it looked up.
    void backward(const TokenBatch& tokens, const Tensor& grad_output,
                  EmbeddingParameters& grads) const;

    size_t vocab_size() const { return vocab_size_; }
    size_t d_model() const { return d_model_; }

private:
    size_t vocab_size_;
    size_t d_model_;
};

// Rows must be non-empty and of equal length; returns that length.
size_t check_token_batch(const TokenBatch& tokens);

} // namespace seqlm
