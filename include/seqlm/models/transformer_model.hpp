#pragma once

#include "seqlm/config_manager.hpp"
#include "seqlm/core/parameter.hpp"
#include "seqlm/core/tensor.hpp"
#include "seqlm/core/types.hpp"
#include "seqlm/models/embedding.hpp"
#include "seqlm/models/linear.hpp"
#include "seqlm/models/positional_encoding.hpp"
#include "seqlm/models/transformer_block.hpp"
#include <memory>
#include <string>
#include <vector>

namespace seqlm {

// Every learned value of a TransformerModel, in one explicit container.
struct ModelParameters {
    EmbeddingParameters embedding;
    std::vector<TransformerBlockParameters> blocks;
    LinearParameters output;  // embedding_dim -> vocab_size

    // Stable traversal order for optimizers:
    //   embedding.table, blocks.<i>.attention.w_q.weight, ..., output.bias
    std::vector<ParameterView> parameters();
    size_t parameter_count() const;

    // Same shapes, every entry zero. Used for gradients and optimizer moments.
    ModelParameters zeros_like() const;
};

// Immutable view handed to forward calls; training publishes a new one per step.
using ParameterSnapshot = std::shared_ptr<const ModelParameters>;

// token ids -> embedding -> + positional signal -> N blocks -> vocabulary logits.
// The model object holds only the architecture and the positional table; all
// learned state comes in through a ModelParameters argument.
class TransformerModel {
public:
    struct ForwardCache {
        TokenBatch tokens;
        std::vector<TransformerBlock::Cache> blocks;
        Tensor final_hidden;
    };

    explicit TransformerModel(const ModelConfig& config);

    ModelParameters initialize_parameters() const;
    ModelParameters initialize_parameters(uint32_t seed) const;

    // Throws InvalidShape if params do not match this model's configuration.
    void check_parameters(const ModelParameters& params) const;

    // (batch x seq_len) -> (batch x seq_len x vocab_size) logits
    Tensor forward(const ModelParameters& params, const TokenBatch& tokens,
                   ForwardCache* cache = nullptr) const;
    Tensor forward(const ModelParameters& params, const std::vector<TokenID>& tokens) const;

    // Embedding lookup plus positional signal, before any block.
    Tensor embed(const ModelParameters& params, const TokenBatch& tokens) const;

    // Gradient of a scalar loss w.r.t. every parameter, given d(loss)/d(logits).
    ModelParameters backward(const ModelParameters& params, const ForwardCache& cache,
                             const Tensor& grad_logits) const;

    const ModelConfig& config() const { return config_; }
    const PositionalEncoding& positional_encoding() const { return positional_; }
    const TransformerBlock& block(size_t index) const { return layers_.at(index); }
    size_t num_layers() const { return layers_.size(); }

private:
    ModelConfig config_;
    Embedding embedding_;
    PositionalEncoding positional_;
    std::vector<TransformerBlock> layers_;
};

} // namespace seqlm
