// src/models/transformer_model.cpp
#include "seqlm/models/transformer_model.hpp"
#include <iostream>
#include <random>

namespace seqlm {

namespace {

const ModelConfig& validated(const ModelConfig& config) {
    config.validate();
    return config;
}

} // anonymous namespace

std::vector<ParameterView> ModelParameters::parameters() {
    std::vector<ParameterView> params;
    embedding.collect("embedding", params);
    for (size_t i = 0; i < blocks.size(); ++i) {
        blocks[i].collect("blocks." + std::to_string(i), params);
    }
    output.collect("output", params);
    return params;
}

size_t ModelParameters::parameter_count() const {
    auto linear_size = [](const LinearParameters& p) {
        return static_cast<size_t>(p.weight.size() + p.bias.size());
    };
    auto norm_size = [](const LayerNormParameters& p) {
        return static_cast<size_t>(p.gamma.size() + p.beta.size());
    };

    size_t total = static_cast<size_t>(embedding.table.size());
    for (const auto& block : blocks) {
        total += linear_size(block.attention.query) + linear_size(block.attention.key) +
                 linear_size(block.attention.value);
        total += norm_size(block.norm1) + norm_size(block.norm2);
        total += linear_size(block.feed_forward.fc1) + linear_size(block.feed_forward.fc2);
    }
    total += linear_size(output);
    return total;
}

ModelParameters ModelParameters::zeros_like() const {
    ModelParameters zeros(*this);
    for (auto& param : zeros.parameters()) {
        param.values().setZero();
    }
    return zeros;
}

TransformerModel::TransformerModel(const ModelConfig& config)
    : config_(validated(config)),
      embedding_(config.vocab_size, config.embedding_dim),
      positional_(config.embedding_dim, config.max_seq_len) {
    layers_.reserve(config_.num_layers);
    for (size_t i = 0; i < config_.num_layers; ++i) {
        layers_.emplace_back(config_.embedding_dim, config_.hidden_dim, config_.causal,
                             config_.verbose);
    }

    if (config_.verbose) {
        std::cout << "Initialized TransformerModel with:\n";
        std::cout << "  vocab_size: " << config_.vocab_size << "\n";
        std::cout << "  embedding_dim: " << config_.embedding_dim << "\n";
        std::cout << "  hidden_dim: " << config_.hidden_dim << "\n";
        std::cout << "  num_layers: " << config_.num_layers << "\n";
        std::cout << "  max_seq_len: " << config_.max_seq_len << "\n";
    }
}

ModelParameters TransformerModel::initialize_parameters() const {
    return initialize_parameters(config_.seed);
}

ModelParameters TransformerModel::initialize_parameters(uint32_t seed) const {
    std::mt19937 gen(seed);

    ModelParameters params;
    params.embedding = embedding_.init_parameters(gen);
    params.blocks.reserve(layers_.size());
    for (const auto& layer : layers_) {
        params.blocks.push_back(layer.init_parameters(gen));
    }
    params.output = LinearParameters::init(config_.embedding_dim, config_.vocab_size, gen);

    if (config_.verbose) {
        std::cout << "Initialized " << params.parameter_count()
                  << " parameters with seed " << seed << std::endl;
    }
    return params;
}

void TransformerModel::check_parameters(const ModelParameters& params) const {
    embedding_.check_parameters(params.embedding);
    if (params.blocks.size() != layers_.size()) {
        throw InvalidShape("model has " + std::to_string(layers_.size()) +
                           " blocks, parameters provide " +
                           std::to_string(params.blocks.size()));
    }
    for (size_t i = 0; i < layers_.size(); ++i) {
        layers_[i].check_parameters(params.blocks[i]);
    }
    params.output.check("output projection", config_.embedding_dim, config_.vocab_size);
}

Tensor TransformerModel::embed(const ModelParameters& params, const TokenBatch& tokens) const {
    check_parameters(params);
    return positional_.forward(embedding_.forward(params.embedding, tokens));
}

Tensor TransformerModel::forward(const ModelParameters& params, const TokenBatch& tokens,
                                 ForwardCache* cache) const {
    Tensor x = embed(params, tokens);

    if (cache) {
        cache->tokens = tokens;
        cache->blocks.assign(layers_.size(), TransformerBlock::Cache());
    }

    for (size_t i = 0; i < layers_.size(); ++i) {
        x = layers_[i].forward(params.blocks[i], x, cache ? &cache->blocks[i] : nullptr);
    }

    std::vector<RowMatrix> logits;
    logits.reserve(x.dim(0));
    for (size_t b = 0; b < x.dim(0); ++b) {
        logits.push_back(linear_forward(params.output, x.matrix(b)));
    }

    if (cache) {
        cache->final_hidden = std::move(x);
    }
    return Tensor::stack(logits);
}

Tensor TransformerModel::forward(const ModelParameters& params,
                                 const std::vector<TokenID>& tokens) const {
    return forward(params, TokenBatch{tokens});
}

ModelParameters TransformerModel::backward(const ModelParameters& params,
                                           const ForwardCache& cache,
                                           const Tensor& grad_logits) const {
    const Tensor& hidden = cache.final_hidden;
    if (grad_logits.ndim() != 3 || grad_logits.dim(0) != hidden.dim(0) ||
        grad_logits.dim(1) != hidden.dim(1) || grad_logits.dim(2) != config_.vocab_size) {
        throw InvalidShape("logit gradient " + grad_logits.shape_string() +
                           " does not match the cached forward pass");
    }

    ModelParameters grads = params.zeros_like();

    std::vector<RowMatrix> grad_hidden;
    grad_hidden.reserve(hidden.dim(0));
    for (size_t b = 0; b < hidden.dim(0); ++b) {
        grad_hidden.push_back(linear_backward(params.output, hidden.matrix(b),
                                              grad_logits.matrix(b), grads.output));
    }

    Tensor grad = Tensor::stack(grad_hidden);
    for (size_t i = layers_.size(); i-- > 0;) {
        grad = layers_[i].backward(params.blocks[i], cache.blocks[i], grad, grads.blocks[i]);
    }

    // The positional signal is additive and fixed, so the gradient reaches the
    // embedding rows unchanged.
    embedding_.backward(cache.tokens, grad, grads.embedding);
    return grads;
}

} // namespace seqlm
