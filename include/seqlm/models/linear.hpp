#pragma once

#include "seqlm/core/parameter.hpp"
#include "seqlm/core/types.hpp"
#include <Eigen/Dense>
#include <random>
#include <string>
#include <vector>

namespace seqlm {

// y = x * weight + bias, applied row by row
struct LinearParameters {
    Eigen::MatrixXf weight;   // in_features x out_features
    Eigen::RowVectorXf bias;  // out_features

    static LinearParameters init(size_t in_features, size_t out_features, std::mt19937& gen);

    size_t in_features() const { return static_cast<size_t>(weight.rows()); }
    size_t out_features() const { return static_cast<size_t>(weight.cols()); }

    void collect(const std::string& prefix, std::vector<ParameterView>& out);
    void check(const std::string& name, size_t in_features, size_t out_features) const;
};

RowMatrix linear_forward(const LinearParameters& params, const Eigen::Ref<const RowMatrix>& input);

// Accumulates weight and bias gradients into grads and returns the input gradient.
RowMatrix linear_backward(const LinearParameters& params,
                          const Eigen::Ref<const RowMatrix>& input,
                          const Eigen::Ref<const RowMatrix>& grad_output,
                          LinearParameters& grads);

} // namespace seqlm
