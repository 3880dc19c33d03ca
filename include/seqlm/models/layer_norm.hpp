#pragma once

#include "seqlm/core/parameter.hpp"
#include "seqlm/core/tensor.hpp"
#include <string>
#include <vector>

namespace seqlm {

struct LayerNormParameters {
    Eigen::RowVectorXf gamma;  // scale, initialized to ones
    Eigen::RowVectorXf beta;   // shift, initialized to zeros

    void collect(const std::string& prefix, std::vector<ParameterView>& out);
};

class LayerNorm {
public:
    struct Cache {
        std::vector<RowMatrix> normalized;
        std::vector<Eigen::VectorXf> inv_std;
    };

    explicit LayerNorm(size_t d_model, float eps = 1e-5f);

    LayerNormParameters init_parameters() const;
    void check_parameters(const LayerNormParameters& params) const;

    Tensor forward(const LayerNormParameters& params, const Tensor& input,
                   Cache* cache = nullptr) const;
    Tensor backward(const LayerNormParameters& params, const Cache& cache,
                    const Tensor& grad_output, LayerNormParameters& grads) const;

    size_t d_model() const { return d_model_; }
    float eps() const { return eps_; }

private:
    size_t d_model_;
    float eps_;
};

} // namespace seqlm
