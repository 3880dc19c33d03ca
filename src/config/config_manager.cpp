#include "seqlm/config_manager.hpp"
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace seqlm {

namespace {

// Reads an unsigned field; negative numbers would otherwise wrap around.
template <typename T>
T unsigned_value(const nlohmann::json& j, const char* key, T fallback) {
    if (!j.contains(key)) {
        return fallback;
    }
    const auto& value = j.at(key);
    if (value.is_number() && !value.is_number_unsigned() && value.get<double>() < 0.0) {
        throw std::invalid_argument(std::string(key) + " must not be negative");
    }
    return value.get<T>();
}

} // anonymous namespace

void ModelConfig::validate() const {
    if (vocab_size == 0) {
        throw std::invalid_argument("vocab_size must be positive");
    }
    if (embedding_dim == 0) {
        throw std::invalid_argument("embedding_dim must be positive");
    }
    if (hidden_dim == 0) {
        throw std::invalid_argument("hidden_dim must be positive");
    }
    if (num_layers == 0) {
        throw std::invalid_argument("num_layers must be at least 1");
    }
    if (max_seq_len == 0) {
        throw std::invalid_argument("max_seq_len must be positive");
    }
}

void ModelConfig::print() const {
    std::cout << "=== Model Configuration ===" << std::endl;
    std::cout << "Vocabulary Size: " << vocab_size << std::endl;
    std::cout << "Embedding Dim: " << embedding_dim << std::endl;
    std::cout << "Hidden Dim: " << hidden_dim << std::endl;
    std::cout << "Layers: " << num_layers << std::endl;
    std::cout << "Max Sequence Length: " << max_seq_len << std::endl;
    std::cout << "Causal Mask: " << (causal ? "true" : "false") << std::endl;
    std::cout << "Seed: " << seed << std::endl;
    std::cout << "===========================" << std::endl;
}

void TrainingConfig::validate() const {
    if (learning_rate <= 0.0f) {
        throw std::invalid_argument("learning_rate must be positive");
    }
    if (beta1 < 0.0f || beta1 >= 1.0f || beta2 < 0.0f || beta2 >= 1.0f) {
        throw std::invalid_argument("Adam betas must lie in [0, 1)");
    }
    if (epsilon <= 0.0f) {
        throw std::invalid_argument("epsilon must be positive");
    }
    if (max_grad_norm < 0.0f) {
        throw std::invalid_argument("max_grad_norm must not be negative");
    }
}

void TrainingConfig::print() const {
    std::cout << "=== Training Configuration ===" << std::endl;
    std::cout << "Epochs: " << epochs << std::endl;
    std::cout << "Learning Rate: " << learning_rate << std::endl;
    std::cout << "Betas: " << beta1 << ", " << beta2 << std::endl;
    std::cout << "Epsilon: " << epsilon << std::endl;
    std::cout << "Max Grad Norm: " << max_grad_norm << std::endl;
    std::cout << "==============================" << std::endl;
}

void to_json(nlohmann::json& j, const ModelConfig& config) {
    j = nlohmann::json{
        {"vocab_size", config.vocab_size},
        {"embedding_dim", config.embedding_dim},
        {"hidden_dim", config.hidden_dim},
        {"num_layers", config.num_layers},
        {"max_seq_len", config.max_seq_len},
        {"causal", config.causal},
        {"seed", config.seed},
        {"verbose", config.verbose}
    };
}

void from_json(const nlohmann::json& j, ModelConfig& config) {
    config.vocab_size = unsigned_value(j, "vocab_size", config.vocab_size);
    config.embedding_dim = unsigned_value(j, "embedding_dim", config.embedding_dim);
    config.hidden_dim = unsigned_value(j, "hidden_dim", config.hidden_dim);
    config.num_layers = unsigned_value(j, "num_layers", config.num_layers);
    config.max_seq_len = unsigned_value(j, "max_seq_len", config.max_seq_len);
    config.causal = j.value("causal", config.causal);
    config.seed = unsigned_value(j, "seed", config.seed);
    config.verbose = j.value("verbose", config.verbose);
}

void to_json(nlohmann::json& j, const TrainingConfig& config) {
    j = nlohmann::json{
        {"epochs", config.epochs},
        {"learning_rate", config.learning_rate},
        {"beta1", config.beta1},
        {"beta2", config.beta2},
        {"epsilon", config.epsilon},
        {"max_grad_norm", config.max_grad_norm},
        {"log_every", config.log_every},
        {"verbose", config.verbose}
    };
}

void from_json(const nlohmann::json& j, TrainingConfig& config) {
    config.epochs = unsigned_value(j, "epochs", config.epochs);
    config.learning_rate = j.value("learning_rate", config.learning_rate);
    config.beta1 = j.value("beta1", config.beta1);
    config.beta2 = j.value("beta2", config.beta2);
    config.epsilon = j.value("epsilon", config.epsilon);
    config.max_grad_norm = j.value("max_grad_norm", config.max_grad_norm);
    config.log_every = unsigned_value(j, "log_every", config.log_every);
    config.verbose = j.value("verbose", config.verbose);
}

ConfigManager::ConfigManager(const std::string& config_path)
    : config_path_(config_path) {}

bool ConfigManager::load_config() {
    std::ifstream file(config_path_);
    if (!file.is_open()) {
        return false;
    }

    nlohmann::json document;
    try {
        file >> document;
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Failed to parse config " + config_path_ + ": " + e.what());
    }

    from_json(document);
    return true;
}

void ConfigManager::save_config() const {
    std::ofstream file(config_path_);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open file for writing: " + config_path_);
    }
    file << to_json().dump(2) << std::endl;
}

void ConfigManager::reset_to_defaults() {
    model_ = ModelConfig();
    training_ = TrainingConfig();
}

nlohmann::json ConfigManager::to_json() const {
    return nlohmann::json{{"model", model_}, {"training", training_}};
}

void ConfigManager::from_json(const nlohmann::json& document) {
    if (!document.is_object()) {
        throw std::invalid_argument("Config document must be a JSON object");
    }

    ModelConfig model = model_;
    TrainingConfig training = training_;
    try {
        if (document.contains("model")) {
            document.at("model").get_to(model);
        }
        if (document.contains("training")) {
            document.at("training").get_to(training);
        }
    } catch (const nlohmann::json::exception& e) {
        throw std::invalid_argument(std::string("Invalid config value: ") + e.what());
    }

    // vocab_size may still be unset here; TransformerModel validates on construction
    training.validate();
    model_ = model;
    training_ = training;
}

void ConfigManager::print_config() const {
    model_.print();
    training_.print();
}

} // namespace seqlm
