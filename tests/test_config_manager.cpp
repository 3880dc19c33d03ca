#include "seqlm/config_manager.hpp"
#include "test_utils.hpp"
#include <cstdio>
#include <fstream>
#include <iostream>

using namespace seqlm;
using namespace seqlm::test;

namespace {

const char* kConfigPath = "test_seqlm_config.json";

void write_file(const std::string& path, const std::string& content) {
    std::ofstream file(path);
    file << content;
}

} // namespace

int main() {
    std::cout << "Testing configuration..." << std::endl;

    run("Defaults", [] {
        ConfigManager config(kConfigPath);
        const auto& model = config.model_config();
        const auto& training = config.training_config();
        check(model.vocab_size == 0, "vocab_size unset");
        check(model.num_layers == 1, "one layer");
        check(model.max_seq_len == 5000, "positional table length");
        check(!model.causal, "bidirectional attention");
        check(model.seed == 42, "seed");
        check(training.epochs == 100, "epochs");
        check_close(training.learning_rate, 0.001f, 1e-9f, "learning rate");
        check_close(training.beta1, 0.9f, 1e-9f, "beta1");
        check_close(training.beta2, 0.999f, 1e-9f, "beta2");
    });

    run("Validation names the offending field", [] {
        ModelConfig model;
        check_throws<std::invalid_argument>([&] { model.validate(); }, "vocab_size 0");
        model.vocab_size = 6;
        model.embedding_dim = 16;
        model.hidden_dim = 32;
        model.validate();
        model.num_layers = 0;
        check_throws<std::invalid_argument>([&] { model.validate(); }, "zero layers");

        TrainingConfig training;
        training.validate();
        training.learning_rate = 0.0f;
        check_throws<std::invalid_argument>([&] { training.validate(); }, "zero learning rate");
        training.learning_rate = 0.01f;
        training.beta2 = 1.0f;
        check_throws<std::invalid_argument>([&] { training.validate(); }, "beta2 of 1");
    });

    run("Save and load", [] {
        ConfigManager config(kConfigPath);
        config.model_config().vocab_size = 6;
        config.model_config().embedding_dim = 16;
        config.model_config().hidden_dim = 32;
        config.model_config().num_layers = 2;
        config.model_config().causal = true;
        config.training_config().learning_rate = 0.01f;
        config.training_config().epochs = 7;
        config.save_config();

        ConfigManager loaded(kConfigPath);
        check(loaded.load_config(), "file found");
        check(loaded.model_config().vocab_size == 6, "vocab_size");
        check(loaded.model_config().embedding_dim == 16, "embedding_dim");
        check(loaded.model_config().hidden_dim == 32, "hidden_dim");
        check(loaded.model_config().num_layers == 2, "num_layers");
        check(loaded.model_config().causal, "causal");
        check(loaded.training_config().epochs == 7, "epochs");
        check_close(loaded.training_config().learning_rate, 0.01f, 1e-7f, "learning_rate");

        loaded.reset_to_defaults();
        check(loaded.model_config().vocab_size == 0, "reset restores defaults");
        std::remove(kConfigPath);
    });

    run("Missing keys keep their defaults", [] {
        ConfigManager config(kConfigPath);
        config.from_json(nlohmann::json::parse(R"({"model": {"embedding_dim": 8}})"));
        check(config.model_config().embedding_dim == 8, "embedding_dim read");
        check(config.model_config().max_seq_len == 5000, "max_seq_len default");
        check(config.training_config().epochs == 100, "training section default");
    });

    run("Missing, malformed and invalid files", [] {
        ConfigManager missing("does_not_exist_seqlm.json");
        check(!missing.load_config(), "missing file reports false");

        write_file(kConfigPath, "{ \"model\": ");
        ConfigManager malformed(kConfigPath);
        check_throws<std::runtime_error>([&] { malformed.load_config(); }, "truncated JSON");

        write_file(kConfigPath, R"({"training": {"learning_rate": -1.0}})");
        ConfigManager invalid(kConfigPath);
        check_throws<std::invalid_argument>([&] { invalid.load_config(); },
                                            "negative learning rate");
        check_close(invalid.training_config().learning_rate, 0.001f, 1e-9f,
                    "rejected document leaves the config unchanged");

        write_file(kConfigPath, R"({"model": {"embedding_dim": "wide"}})");
        ConfigManager mistyped(kConfigPath);
        check_throws<std::invalid_argument>([&] { mistyped.load_config(); }, "string dimension");

        write_file(kConfigPath, R"({"model": {"vocab_size": 6, "hidden_dim": -1}})");
        ConfigManager negative(kConfigPath);
        check_throws<std::invalid_argument>([&] { negative.load_config(); },
                                            "negative hidden_dim");
        check(negative.model_config().hidden_dim == 0, "negative size does not wrap around");

        check_throws<std::invalid_argument>(
            [&] { negative.from_json(nlohmann::json::parse(R"({"training": {"epochs": -5}})")); },
            "negative epochs");
        check(negative.training_config().epochs == 100, "epochs left at the default");

        check_throws<std::invalid_argument>([&] { missing.from_json(nlohmann::json::array()); },
                                            "top level must be an object");
        std::remove(kConfigPath);
    });

    return summary();
}
