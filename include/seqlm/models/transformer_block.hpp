#pragma once

#include "seqlm/core/tensor.hpp"
#include "seqlm/models/attention.hpp"
#include "seqlm/models/feed_forward.hpp"
#include "seqlm/models/layer_norm.hpp"
#include <memory>
#include <random>
#include <string>
#include <vector>

namespace seqlm {

struct TransformerBlockParameters {
    AttentionParameters attention;
    LayerNormParameters norm1;
    FeedForwardParameters feed_forward;
    LayerNormParameters norm2;

    void collect(const std::string& prefix, std::vector<ParameterView>& out);
};

// Post-norm block:
//   x1 = norm1(x + attention(x))
//   x2 = norm2(x1 + feed_forward(x1))
// Output shape equals input shape, so blocks stack without adaptation.
class TransformerBlock {
public:
    struct Cache {
        SelfAttention::Cache attention;
        LayerNorm::Cache norm1;
        FeedForward::Cache feed_forward;
        LayerNorm::Cache norm2;
    };

    TransformerBlock(size_t d_model, size_t d_ff, bool causal = false, bool verbose = false);

    TransformerBlockParameters init_parameters(std::mt19937& gen) const;
    void check_parameters(const TransformerBlockParameters& params) const;

    Tensor forward(const TransformerBlockParameters& params, const Tensor& input,
                   Cache* cache = nullptr) const;
    Tensor backward(const TransformerBlockParameters& params, const Cache& cache,
                    const Tensor& grad_output, TransformerBlockParameters& grads) const;

    const SelfAttention& attention() const { return *attention_; }
    size_t d_model() const { return d_model_; }
    size_t d_ff() const { return d_ff_; }

private:
    size_t d_model_;
    size_t d_ff_;

    std::unique_ptr<SelfAttention> attention_;
    std::unique_ptr<FeedForward> feed_forward_;
    std::unique_ptr<LayerNorm> norm1_;
    std::unique_ptr<LayerNorm> norm2_;
};

} // namespace seqlm
