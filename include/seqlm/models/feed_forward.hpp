#pragma once

#include "seqlm/core/tensor.hpp"
#include "seqlm/models/linear.hpp"
#include <random>
#include <string>
#include <vector>

namespace seqlm {

struct FeedForwardParameters {
    LinearParameters fc1;  // d_model -> d_ff
    LinearParameters fc2;  // d_ff -> d_model

    void collect(const std::string& prefix, std::vector<ParameterView>& out);
};

// Position-wise d_model -> d_ff -> d_model network with a ReLU in between.
class FeedForward {
public:
    struct Cache {
        std::vector<RowMatrix> input;
        std::vector<RowMatrix> hidden;  // post-activation
    };

    FeedForward(size_t d_model, size_t d_ff);

    FeedForwardParameters init_parameters(std::mt19937& gen) const;
    void check_parameters(const FeedForwardParameters& params) const;

    Tensor forward(const FeedForwardParameters& params, const Tensor& input,
                   Cache* cache = nullptr) const;
    Tensor backward(const FeedForwardParameters& params, const Cache& cache,
                    const Tensor& grad_output, FeedForwardParameters& grads) const;

    size_t d_model() const { return d_model_; }
    size_t d_ff() const { return d_ff_; }

private:
    size_t d_model_;
    size_t d_ff_;
};

} // namespace seqlm
