#include "seqlm/models/layer_norm.hpp"
#include <cmath>

namespace seqlm {

void LayerNormParameters::collect(const std::string& prefix, std::vector<ParameterView>& out) {
    add_parameter(out, prefix + ".gamma", gamma);
    add_parameter(out, prefix + ".beta", beta);
}

LayerNorm::LayerNorm(size_t d_model, float eps)
    : d_model_(d_model), eps_(eps) {}

LayerNormParameters LayerNorm::init_parameters() const {
    LayerNormParameters params;
    params.gamma = Eigen::RowVectorXf::Ones(static_cast<Eigen::Index>(d_model_));
    params.beta = Eigen::RowVectorXf::Zero(static_cast<Eigen::Index>(d_model_));
    return params;
}

void LayerNorm::check_parameters(const LayerNormParameters& params) const {
    if (static_cast<size_t>(params.gamma.size()) != d_model_ ||
        static_cast<size_t>(params.beta.size()) != d_model_) {
        throw InvalidShape("layer norm expects gain and shift of size " +
                           std::to_string(d_model_));
    }
}

Tensor LayerNorm::forward(const LayerNormParameters& params, const Tensor& input,
                          Cache* cache) const {
    if (input.ndim() != 3 || input.dim(2) != d_model_) {
        throw InvalidShape("layer norm expects (batch, seq_len, " + std::to_string(d_model_) +
                           "), got " + input.shape_string());
    }

    if (cache) {
        *cache = Cache();
    }

    Tensor output(input.shape());
    const auto n = static_cast<float>(d_model_);
    for (size_t b = 0; b < input.dim(0); ++b) {
        const auto x = input.matrix(b);
        const Eigen::Index seq_len = x.rows();

        RowMatrix normalized(seq_len, x.cols());
        Eigen::VectorXf inv_std(seq_len);
        for (Eigen::Index t = 0; t < seq_len; ++t) {
            const float mean = x.row(t).mean();
            const Eigen::RowVectorXf centered = (x.row(t).array() - mean).matrix();
            const float variance = centered.squaredNorm() / n;
            inv_std(t) = 1.0f / std::sqrt(variance + eps_);
            normalized.row(t) = centered * inv_std(t);
        }

        RowMatrix y = (normalized.array().rowwise() * params.gamma.array()).matrix();
        y.rowwise() += params.beta;
        output.set_matrix(b, y);

        if (cache) {
            cache->normalized.push_back(std::move(normalized));
            cache->inv_std.push_back(std::move(inv_std));
        }
    }

    return output;
}

Tensor LayerNorm::backward(const LayerNormParameters& params, const Cache& cache,
                           const Tensor& grad_output, LayerNormParameters& grads) const {
    if (cache.normalized.size() != grad_output.dim(0)) {
        throw InvalidShape("layer norm cache does not match gradient batch size");
    }

    Tensor grad_input(grad_output.shape());
    const auto n = static_cast<float>(d_model_);
    for (size_t b = 0; b < grad_output.dim(0); ++b) {
        const auto grad_out = grad_output.matrix(b);
        const RowMatrix& x_hat = cache.normalized[b];
        const Eigen::VectorXf& inv_std = cache.inv_std[b];

        grads.gamma += (grad_out.array() * x_hat.array()).colwise().sum().matrix();
        grads.beta += grad_out.colwise().sum();

        RowMatrix grad_x_hat = (grad_out.array().rowwise() * params.gamma.array()).matrix();
        auto grad_x = grad_input.matrix(b);
        for (Eigen::Index t = 0; t < x_hat.rows(); ++t) {
            const float sum_grad = grad_x_hat.row(t).sum();
            const float sum_grad_xhat = grad_x_hat.row(t).dot(x_hat.row(t));
            grad_x.row(t) = (inv_std(t) / n) *
                (n * grad_x_hat.row(t).array() - sum_grad - x_hat.row(t).array() * sum_grad_xhat)
                    .matrix();
        }
    }

    return grad_input;
}

} // namespace seqlm
