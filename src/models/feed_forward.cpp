#include "seqlm/models/feed_forward.hpp"

namespace seqlm {

void FeedForwardParameters::collect(const std::string& prefix, std::vector<ParameterView>& out) {
    fc1.collect(prefix + ".fc1", out);
    fc2.collect(prefix + ".fc2", out);
}

FeedForward::FeedForward(size_t d_model, size_t d_ff)
    : d_model_(d_model), d_ff_(d_ff) {}

FeedForwardParameters FeedForward::init_parameters(std::mt19937& gen) const {
    FeedForwardParameters params;
    params.fc1 = LinearParameters::init(d_model_, d_ff_, gen);
    params.fc2 = LinearParameters::init(d_ff_, d_model_, gen);
    return params;
}

void FeedForward::check_parameters(const FeedForwardParameters& params) const {
    params.fc1.check("feed-forward fc1", d_model_, d_ff_);
    params.fc2.check("feed-forward fc2", d_ff_, d_model_);
}

Tensor FeedForward::forward(const FeedForwardParameters& params, const Tensor& input,
                            Cache* cache) const {
    if (input.ndim() != 3 || input.dim(2) != d_model_) {
        throw InvalidShape("feed-forward expects (batch, seq_len, " + std::to_string(d_model_) +
                           "), got " + input.shape_string());
    }

    if (cache) {
        *cache = Cache();
    }

    Tensor output(input.shape());
    for (size_t b = 0; b < input.dim(0); ++b) {
        const auto x = input.matrix(b);
        RowMatrix hidden = linear_forward(params.fc1, x).cwiseMax(0.0f);
        output.set_matrix(b, linear_forward(params.fc2, hidden));

        if (cache) {
            cache->input.emplace_back(x);
            cache->hidden.push_back(std::move(hidden));
        }
    }

    return output;
}

Tensor FeedForward::backward(const FeedForwardParameters& params, const Cache& cache,
                             const Tensor& grad_output, FeedForwardParameters& grads) const {
    if (cache.input.size() != grad_output.dim(0)) {
        throw InvalidShape("feed-forward cache does not match gradient batch size");
    }

    std::vector<RowMatrix> grad_inputs;
    grad_inputs.reserve(cache.input.size());
    for (size_t b = 0; b < cache.input.size(); ++b) {
        const RowMatrix& hidden = cache.hidden[b];
        RowMatrix grad_hidden = linear_backward(params.fc2, hidden, grad_output.matrix(b), grads.fc2);

        // ReLU passes gradient only where the activation was positive
        grad_hidden.array() *= (hidden.array() > 0.0f).cast<float>();

        grad_inputs.push_back(linear_backward(params.fc1, cache.input[b], grad_hidden, grads.fc1));
    }

    return Tensor::stack(grad_inputs);
}

} // namespace seqlm
