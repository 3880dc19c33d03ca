#include "seqlm/models/embedding.hpp"
#include <stdexcept>

namespace seqlm {

size_t check_token_batch(const TokenBatch& tokens) {
    if (tokens.empty()) {
        throw InvalidShape("token batch is empty");
    }
    const size_t seq_len = tokens.front().size();
    if (seq_len == 0) {
        throw InvalidShape("token sequences must not be empty");
    }
    for (size_t b = 1; b < tokens.size(); ++b) {
        if (tokens[b].size() != seq_len) {
            throw InvalidShape("sequence " + std::to_string(b) + " has length " +
                               std::to_string(tokens[b].size()) + ", expected " +
                               std::to_string(seq_len));
        }
    }
    return seq_len;
}

void EmbeddingParameters::collect(const std::string& prefix, std::vector<ParameterView>& out) {
    add_parameter(out, prefix + ".table", table);
}

Embedding::Embedding(size_t vocab_size, size_t d_model)
    : vocab_size_(vocab_size), d_model_(d_model) {}

EmbeddingParameters Embedding::init_parameters(std::mt19937& gen) const {
    EmbeddingParameters params;
    params.table = random_normal(static_cast<Eigen::Index>(vocab_size_),
                                 static_cast<Eigen::Index>(d_model_), 0.0f, 1.0f, gen);
    return params;
}

void Embedding::check_parameters(const EmbeddingParameters& params) const {
    if (static_cast<size_t>(params.table.rows()) != vocab_size_ ||
        static_cast<size_t>(params.table.cols()) != d_model_) {
        throw InvalidShape("embedding table expects " + std::to_string(vocab_size_) + "x" +
                           std::to_string(d_model_) + ", got " +
                           std::to_string(params.table.rows()) + "x" +
                           std::to_string(params.table.cols()));
    }
}

Tensor Embedding::forward(const EmbeddingParameters& params, const TokenBatch& tokens) const {
    const size_t seq_len = check_token_batch(tokens);
    Tensor output({tokens.size(), seq_len, d_model_});

    for (size_t b = 0; b < tokens.size(); ++b) {
        auto out = output.matrix(b);
        for (size_t t = 0; t < seq_len; ++t) {
            const TokenID id = tokens[b][t];
            if (id >= vocab_size_) {
                throw std::out_of_range("Token id " + std::to_string(id) +
                                        " out of vocabulary range " +
                                        std::to_string(vocab_size_));
            }
            out.row(static_cast<Eigen::Index>(t)) = params.table.row(id);
        }
    }

    return output;
}

void Embedding::backward(const TokenBatch& tokens, const Tensor& grad_output,
                         EmbeddingParameters& grads) const {
    for (size_t b = 0; b < tokens.size(); ++b) {
        auto grad = grad_output.matrix(b);
        for (size_t t = 0; t < tokens[b].size(); ++t) {
            grads.table.row(tokens[b][t]) += grad.row(static_cast<Eigen::Index>(t));
        }
    }
}

} // namespace seqlm
