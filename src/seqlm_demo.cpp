// src/seqlm_demo.cpp
#include "seqlm/config_manager.hpp"
#include "seqlm/inference/inference_engine.hpp"
#include "seqlm/models/transformer_model.hpp"
#include "seqlm/tokenizer/vocabulary.hpp"
#include "seqlm/training/trainer.hpp"
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace seqlm;

int main(int argc, char* argv[]) {
    try {
        ConfigManager config(argc > 1 ? argv[1] : "config/seqlm_demo.json");
        if (!config.load_config()) {
            std::cout << "Config " << config.get_config_path()
                      << " not found, using defaults" << std::endl;
            config.model_config().embedding_dim = 16;
            config.model_config().hidden_dim = 32;
            config.model_config().num_layers = 2;
            config.training_config().learning_rate = 0.01f;
            config.training_config().verbose = true;
        }

        const std::vector<std::string> sentences = {
            "hello world how are you",
            "how are you hello world"
        };

        Vocabulary vocab(sentences);
        config.model_config().vocab_size = vocab.size();
        config.print_config();

        auto model = std::make_shared<const TransformerModel>(config.model_config());
        ParameterSnapshot initial =
            std::make_shared<const ModelParameters>(model->initialize_parameters());

        const std::string prompt = "hello world how";
        const std::vector<TokenID> context = vocab.encode(prompt);

        Tensor logits = model->forward(*initial, context);
        std::cout << "Untrained logits shape: " << logits.shape_string() << std::endl;

        std::vector<std::vector<TokenID>> corpus;
        for (const auto& sentence : sentences) {
            corpus.push_back(vocab.encode(sentence));
        }

        training::Trainer trainer(model, initial, config.training_config());
        float loss = trainer.fit(corpus);
        std::cout << "Final loss: " << loss << " after " << trainer.steps() << " steps" << std::endl;

        InferenceEngine engine(model, trainer.snapshot());
        TokenID next = engine.predict_next(context);
        std::cout << "Input: '" << prompt << "'" << std::endl;
        std::cout << "Predicted next word: '" << vocab.id_to_token(next) << "'" << std::endl;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
