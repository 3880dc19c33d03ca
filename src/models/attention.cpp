#include "seqlm/models/attention.hpp"
#include <cmath>
#include <iostream>

namespace seqlm {

void AttentionParameters::collect(const std::string& prefix, std::vector<ParameterView>& out) {
    query.collect(prefix + ".w_q", out);
    key.collect(prefix + ".w_k", out);
    value.collect(prefix + ".w_v", out);
}

SelfAttention::SelfAttention(size_t d_model, bool causal, bool verbose)
    : d_model_(d_model), causal_(causal),
      scale_(1.0f / std::sqrt(static_cast<float>(d_model))) {
    if (d_model == 0) {
        throw std::invalid_argument("d_model must be positive");
    }

    if (verbose) {
        std::cout << "Initialized SelfAttention with:\n";
        std::cout << "  d_model: " << d_model_ << "\n";
        std::cout << "  causal: " << (causal_ ? "true" : "false") << "\n";
    }
}

AttentionParameters SelfAttention::init_parameters(std::mt19937& gen) const {
    AttentionParameters params;
    params.query = LinearParameters::init(d_model_, d_model_, gen);
    params.key = LinearParameters::init(d_model_, d_model_, gen);
    params.value = LinearParameters::init(d_model_, d_model_, gen);
    return params;
}

void SelfAttention::check_parameters(const AttentionParameters& params) const {
    params.query.check("attention query", d_model_, d_model_);
    params.key.check("attention key", d_model_, d_model_);
    params.value.check("attention value", d_model_, d_model_);
}

void SelfAttention::check_input(const Tensor& input) const {
    if (input.ndim() != 3 || input.dim(2) != d_model_) {
        throw InvalidShape("self-attention expects (batch, seq_len, " +
                           std::to_string(d_model_) + "), got " + input.shape_string());
    }
}

RowMatrix SelfAttention::softmax_scores(const RowMatrix& q, const RowMatrix& k) const {
    RowMatrix scores = (q * k.transpose()) * scale_;
    const Eigen::Index seq_len = scores.rows();

    if (causal_) {
        for (Eigen::Index i = 0; i < seq_len; ++i) {
            for (Eigen::Index j = i + 1; j < seq_len; ++j) {
                scores(i, j) = -1e9f;
            }
        }
    }

    // Subtract the row max for numerical stability
    for (Eigen::Index i = 0; i < seq_len; ++i) {
        const float max_val = scores.row(i).maxCoeff();
        scores.row(i) = (scores.row(i).array() - max_val).exp().matrix();
    }

    // Vectorized exp clamps its input, so -1e9 does not reach exactly zero
    if (causal_) {
        scores.triangularView<Eigen::StrictlyUpper>().setZero();
    }

    for (Eigen::Index i = 0; i < seq_len; ++i) {
        scores.row(i) /= scores.row(i).sum();
    }
    return scores;
}

Tensor SelfAttention::forward(const AttentionParameters& params, const Tensor& input,
                              Cache* cache) const {
    check_input(input);
    const size_t batch_size = input.dim(0);

    if (cache) {
        *cache = Cache();
    }

    std::vector<RowMatrix> outputs;
    outputs.reserve(batch_size);
    for (size_t b = 0; b < batch_size; ++b) {
        const auto x = input.matrix(b);
        RowMatrix q = linear_forward(params.query, x);
        RowMatrix k = linear_forward(params.key, x);
        RowMatrix v = linear_forward(params.value, x);
        RowMatrix weights = softmax_scores(q, k);

        outputs.push_back(weights * v);

        if (cache) {
            cache->input.emplace_back(x);
            cache->q.push_back(std::move(q));
            cache->k.push_back(std::move(k));
            cache->v.push_back(std::move(v));
            cache->weights.push_back(std::move(weights));
        }
    }

    return Tensor::stack(outputs);
}

Tensor SelfAttention::attention_weights(const AttentionParameters& params,
                                        const Tensor& input) const {
    check_input(input);
    std::vector<RowMatrix> weights;
    weights.reserve(input.dim(0));
    for (size_t b = 0; b < input.dim(0); ++b) {
        const auto x = input.matrix(b);
        weights.push_back(softmax_scores(linear_forward(params.query, x),
                                         linear_forward(params.key, x)));
    }
    return Tensor::stack(weights);
}

Tensor SelfAttention::backward(const AttentionParameters& params, const Cache& cache,
                               const Tensor& grad_output, AttentionParameters& grads) const {
    check_input(grad_output);
    const size_t batch_size = grad_output.dim(0);
    if (cache.weights.size() != batch_size) {
        throw InvalidShape("attention cache holds " + std::to_string(cache.weights.size()) +
                           " batch entries, gradient has " + std::to_string(batch_size));
    }

    std::vector<RowMatrix> grad_inputs;
    grad_inputs.reserve(batch_size);
    for (size_t b = 0; b < batch_size; ++b) {
        const RowMatrix grad_out = grad_output.matrix(b);
        const RowMatrix& weights = cache.weights[b];

        // output = weights * v
        RowMatrix grad_weights = grad_out * cache.v[b].transpose();
        RowMatrix grad_v = weights.transpose() * grad_out;

        // Row softmax: dS = W * (dW - rowsum(dW * W))
        Eigen::VectorXf row_dot =
            (grad_weights.array() * weights.array()).rowwise().sum().matrix();
        RowMatrix grad_scores =
            (weights.array() * (grad_weights.colwise() - row_dot).array()).matrix() * scale_;

        RowMatrix grad_q = grad_scores * cache.k[b];
        RowMatrix grad_k = grad_scores.transpose() * cache.q[b];

        RowMatrix grad_x = linear_backward(params.query, cache.input[b], grad_q, grads.query);
        grad_x += linear_backward(params.key, cache.input[b], grad_k, grads.key);
        grad_x += linear_backward(params.value, cache.input[b], grad_v, grads.value);
        grad_inputs.push_back(std::move(grad_x));
    }

    return Tensor::stack(grad_inputs);
}

} // namespace seqlm
