// tests/test_transformer_model.cpp
#include "seqlm/models/transformer_model.hpp"
#include "test_utils.hpp"
#include <iostream>
#include <stdexcept>

using namespace seqlm;
using namespace seqlm::test;

namespace {

ModelConfig demo_config() {
    ModelConfig config;
    config.vocab_size = 6;
    config.embedding_dim = 16;
    config.hidden_dim = 32;
    config.num_layers = 2;
    return config;
}

bool same_parameters(ModelParameters a, ModelParameters b) {
    auto va = a.parameters();
    auto vb = b.parameters();
    if (va.size() != vb.size()) return false;
    for (size_t i = 0; i < va.size(); ++i) {
        if (va[i].size() != vb[i].size() || !(va[i].values() == vb[i].values()).all()) {
            return false;
        }
    }
    return true;
}

} // namespace

int main() {
    std::cout << "Testing TransformerModel..." << std::endl;

    run("Logits have shape (batch, L, vocab_size)", [] {
        TransformerModel model(demo_config());
        ModelParameters params = model.initialize_parameters();

        Tensor logits = model.forward(params, std::vector<TokenID>{0, 1, 2});
        check(logits.shape() == std::vector<size_t>({1, 3, 6}), "single sequence gives (1, 3, 6)");

        TokenBatch batch = {{0, 1, 2, 3}, {4, 5, 0, 1}};
        Tensor batched = model.forward(params, batch);
        check(batched.shape() == std::vector<size_t>({2, 4, 6}), "batch of two gives (2, 4, 6)");

        for (size_t len = 1; len <= 8; ++len) {
            Tensor out = model.forward(params, std::vector<TokenID>(len, 1));
            check(out.dim(1) == len, "length " + std::to_string(len));
        }
    });

    run("Batch entries are computed independently", [] {
        TransformerModel model(demo_config());
        ModelParameters params = model.initialize_parameters();
        Tensor single = model.forward(params, std::vector<TokenID>{4, 5, 0, 1});
        Tensor batched = model.forward(params, TokenBatch{{0, 1, 2, 3}, {4, 5, 0, 1}});
        float diff = (single.matrix(0) - batched.matrix(1)).cwiseAbs().maxCoeff();
        check(diff < 1e-5f, "second batch entry equals the single-sequence result");
    });

    run("Sequences longer than max_seq_len raise SequenceTooLong", [] {
        ModelConfig config = demo_config();
        config.max_seq_len = 4;
        TransformerModel model(config);
        ModelParameters params = model.initialize_parameters();

        Tensor ok = model.forward(params, std::vector<TokenID>{0, 1, 2, 3});
        check(ok.dim(1) == 4, "length equal to max_seq_len is accepted");
        check_throws<SequenceTooLong>(
            [&] { (void)model.forward(params, std::vector<TokenID>{0, 1, 2, 3, 4}); },
            "length 5 with max_seq_len 4");
    });

    run("Malformed input raises InvalidShape", [] {
        TransformerModel model(demo_config());
        ModelParameters params = model.initialize_parameters();
        check_throws<InvalidShape>([&] { (void)model.forward(params, TokenBatch{{0, 1}, {2}}); },
                                   "ragged batch");
        check_throws<InvalidShape>([&] { (void)model.forward(params, TokenBatch{}); },
                                   "empty batch");
        check_throws<InvalidShape>([&] { (void)model.forward(params, std::vector<TokenID>{}); },
                                   "empty sequence");
        check_throws<std::out_of_range>(
            [&] { (void)model.forward(params, std::vector<TokenID>{0, 6}); },
            "token id outside the vocabulary");
    });

    run("Parameters for another configuration are rejected", [] {
        TransformerModel model(demo_config());
        ModelConfig other_config = demo_config();
        other_config.num_layers = 1;
        TransformerModel other(other_config);
        ModelParameters wrong = other.initialize_parameters();
        check_throws<InvalidShape>(
            [&] { (void)model.forward(wrong, std::vector<TokenID>{0, 1}); },
            "block count mismatch");

        ModelParameters params = model.initialize_parameters();
        params.output.weight.resize(16, 5);
        check_throws<InvalidShape>([&] { model.check_parameters(params); },
                                   "output projection of the wrong size");
    });

    run("Invalid configuration is rejected", [] {
        ModelConfig config = demo_config();
        config.num_layers = 0;
        check_throws<std::invalid_argument>([&] { TransformerModel model(config); }, "zero layers");
        config = demo_config();
        config.embedding_dim = 0;
        check_throws<std::invalid_argument>([&] { TransformerModel model(config); }, "zero dimension");
    });

    run("Initialization is seeded", [] {
        TransformerModel model(demo_config());
        check(same_parameters(model.initialize_parameters(), model.initialize_parameters()),
              "same seed, same parameters");
        check(!same_parameters(model.initialize_parameters(1), model.initialize_parameters(2)),
              "different seeds, different parameters");
    });

    run("Parameter enumeration", [] {
        TransformerModel model(demo_config());
        ModelParameters params = model.initialize_parameters();
        auto views = params.parameters();

        check(views.size() == 1 + 2 * 14 + 2, "embedding + 2 blocks + output projection");
        check(views.front().name == "embedding.table", "embedding first");
        check(views[1].name == "blocks.0.attention.w_q.weight", "first block follows");
        check(views.back().name == "output.bias", "output bias last");

        size_t total = 0;
        for (const auto& view : views) total += static_cast<size_t>(view.size());
        const size_t d = 16, h = 32, v = 6;
        const size_t per_block = 3 * (d * d + d) + (d * h + h) + (h * d + d) + 2 * (2 * d);
        const size_t expected = v * d + 2 * per_block + (d * v + v);
        check(total == expected, "view sizes add up");
        check(params.parameter_count() == expected, "parameter_count matches");

        ModelParameters zeros = params.zeros_like();
        for (auto& view : zeros.parameters()) {
            check(view.values().isZero(0.0f), view.name + " is zero");
        }
    });

    run("Forward leaves the parameters untouched", [] {
        TransformerModel model(demo_config());
        const ModelParameters params = model.initialize_parameters();
        const ModelParameters before = params;
        TransformerModel::ForwardCache cache;
        (void)model.forward(params, TokenBatch{{0, 1, 2}}, &cache);
        check(same_parameters(params, before), "snapshot unchanged by forward");
        check(cache.blocks.size() == 2, "one cache entry per block");
    });

    run("Causal model logits ignore later tokens", [] {
        ModelConfig config = demo_config();
        config.causal = true;
        TransformerModel model(config);
        ModelParameters params = model.initialize_parameters();

        Tensor a = model.forward(params, std::vector<TokenID>{0, 1, 2, 3});
        Tensor b = model.forward(params, std::vector<TokenID>{0, 1, 2, 5});
        float prefix_diff = (a.matrix(0).topRows(3) - b.matrix(0).topRows(3)).cwiseAbs().maxCoeff();
        check(prefix_diff < 1e-6f, "first three positions unchanged");
    });

    return summary();
}
