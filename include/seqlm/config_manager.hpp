#pragma once

#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>

namespace seqlm {

// Construction-time model shape; not mutable once a model is built.
struct ModelConfig {
    size_t vocab_size = 0;
    size_t embedding_dim = 0;
    size_t hidden_dim = 0;
    size_t num_layers = 1;
    size_t max_seq_len = 5000;

    // Mask future positions in self-attention
    bool causal = false;

    uint32_t seed = 42;
    bool verbose = false;

    // Throws std::invalid_argument naming the first offending field.
    void validate() const;
    void print() const;
};

struct TrainingConfig {
    size_t epochs = 100;
    float learning_rate = 0.001f;
    float beta1 = 0.9f;
    float beta2 = 0.999f;
    float epsilon = 1e-8f;

    // Global L2 gradient clipping; 0 disables it
    float max_grad_norm = 0.0f;

    size_t log_every = 10;
    bool verbose = false;

    void validate() const;
    void print() const;
};

void to_json(nlohmann::json& j, const ModelConfig& config);
void from_json(const nlohmann::json& j, ModelConfig& config);
void to_json(nlohmann::json& j, const TrainingConfig& config);
void from_json(const nlohmann::json& j, TrainingConfig& config);

// JSON configuration file with "model" and "training" sections. Keys missing
// from the file keep their defaults.
class ConfigManager {
public:
    explicit ConfigManager(const std::string& config_path = "seqlm.json");

    // Returns false if the file does not exist; throws on malformed or invalid content.
    bool load_config();
    void save_config() const;
    void reset_to_defaults();

    const ModelConfig& model_config() const { return model_; }
    ModelConfig& model_config() { return model_; }
    const TrainingConfig& training_config() const { return training_; }
    TrainingConfig& training_config() { return training_; }

    nlohmann::json to_json() const;
    void from_json(const nlohmann::json& document);

    std::string get_config_path() const { return config_path_; }
    void set_config_path(const std::string& path) { config_path_ = path; }

    void print_config() const;

private:
    std::string config_path_;
    ModelConfig model_;
    TrainingConfig training_;
};

} // namespace seqlm
