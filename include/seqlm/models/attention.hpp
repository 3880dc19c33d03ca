#pragma once

#include "seqlm/core/tensor.hpp"
#include "seqlm/models/linear.hpp"
#include <random>
#include <string>
#include <vector>

namespace seqlm {

struct AttentionParameters {
    LinearParameters query;
    LinearParameters key;
    LinearParameters value;

    void collect(const std::string& prefix, std::vector<ParameterView>& out);
};

// Single-head scaled dot-product self-attention.
//
// Without the causal flag every position attends to every other position,
// including later ones. With it, scores for j > i are suppressed before the
// softmax so position i only sees positions 0..i.
class SelfAttention {
public:
    // Activations kept from forward() for backward(), one entry per batch element.
    struct Cache {
        std::vector<RowMatrix> input;
        std::vector<RowMatrix> q;
        std::vector<RowMatrix> k;
        std::vector<RowMatrix> v;
        std::vector<RowMatrix> weights;
    };

    explicit SelfAttention(size_t d_model, bool causal = false, bool verbose = false);

    AttentionParameters init_parameters(std::mt19937& gen) const;
    void check_parameters(const AttentionParameters& params) const;

    // (batch x seq_len x d_model) -> (batch x seq_len x d_model)
    Tensor forward(const AttentionParameters& params, const Tensor& input,
                   Cache* cache = nullptr) const;

    // Row-stochastic (batch x seq_len x seq_len) attention weights.
    Tensor attention_weights(const AttentionParameters& params, const Tensor& input) const;

    Tensor backward(const AttentionParameters& params, const Cache& cache,
                    const Tensor& grad_output, AttentionParameters& grads) const;

    size_t d_model() const { return d_model_; }
    bool causal() const { return causal_; }

private:
    void check_input(const Tensor& input) const;
    RowMatrix softmax_scores(const RowMatrix& q, const RowMatrix& k) const;

    size_t d_model_;
    bool causal_;
    float scale_;
};

} // namespace seqlm
