#include "seqlm/models/transformer_block.hpp"
#include <iostream>

namespace seqlm {

void TransformerBlockParameters::collect(const std::string& prefix,
                                         std::vector<ParameterView>& out) {
    attention.collect(prefix + ".attention", out);
    norm1.collect(prefix + ".norm1", out);
    feed_forward.collect(prefix + ".feed_forward", out);
    norm2.collect(prefix + ".norm2", out);
}

TransformerBlock::TransformerBlock(size_t d_model, size_t d_ff, bool causal, bool verbose)
    : d_model_(d_model), d_ff_(d_ff) {
    attention_ = std::make_unique<SelfAttention>(d_model, causal, verbose);
    feed_forward_ = std::make_unique<FeedForward>(d_model, d_ff);
    norm1_ = std::make_unique<LayerNorm>(d_model);
    norm2_ = std::make_unique<LayerNorm>(d_model);

    if (verbose) {
        std::cout << "Initialized TransformerBlock with:\n";
        std::cout << "  d_model: " << d_model_ << "\n";
        std::cout << "  d_ff: " << d_ff_ << "\n";
    }
}

TransformerBlockParameters TransformerBlock::init_parameters(std::mt19937& gen) const {
    TransformerBlockParameters params;
    params.attention = attention_->init_parameters(gen);
    params.norm1 = norm1_->init_parameters();
    params.feed_forward = feed_forward_->init_parameters(gen);
    params.norm2 = norm2_->init_parameters();
    return params;
}

void TransformerBlock::check_parameters(const TransformerBlockParameters& params) const {
    attention_->check_parameters(params.attention);
    norm1_->check_parameters(params.norm1);
    feed_forward_->check_parameters(params.feed_forward);
    norm2_->check_parameters(params.norm2);
}

Tensor TransformerBlock::forward(const TransformerBlockParameters& params, const Tensor& input,
                                 Cache* cache) const {
    // Self-attention with residual connection
    Tensor attended = attention_->forward(params.attention, input,
                                          cache ? &cache->attention : nullptr);
    Tensor x1 = norm1_->forward(params.norm1, input + attended,
                                cache ? &cache->norm1 : nullptr);

    // Feed-forward with residual connection
    Tensor forwarded = feed_forward_->forward(params.feed_forward, x1,
                                              cache ? &cache->feed_forward : nullptr);
    return norm2_->forward(params.norm2, x1 + forwarded, cache ? &cache->norm2 : nullptr);
}

Tensor TransformerBlock::backward(const TransformerBlockParameters& params, const Cache& cache,
                                  const Tensor& grad_output,
                                  TransformerBlockParameters& grads) const {
    // Through norm2; the residual sends the same gradient to x1 and the feed-forward
    Tensor grad_sum2 = norm2_->backward(params.norm2, cache.norm2, grad_output, grads.norm2);
    Tensor grad_x1 = grad_sum2 + feed_forward_->backward(params.feed_forward, cache.feed_forward,
                                                         grad_sum2, grads.feed_forward);

    Tensor grad_sum1 = norm1_->backward(params.norm1, cache.norm1, grad_x1, grads.norm1);
    return grad_sum1 + attention_->backward(params.attention, cache.attention,
                                            grad_sum1, grads.attention);
}

} // namespace seqlm
