#include "seqlm/tokenizer/vocabulary.hpp"
#include <sstream>
#include <stdexcept>

namespace seqlm {

Vocabulary::Vocabulary() {
    unk_id_ = add_word(kUnkToken);
}

Vocabulary::Vocabulary(const std::vector<std::string>& corpus) {
    for (const auto& text : corpus) {
        for (const auto& word : split_words(text)) {
            if (word != kUnkToken && !contains(word)) {
                add_word(word);
            }
        }
    }
    unk_id_ = add_word(kUnkToken);
}

std::vector<std::string> Vocabulary::split_words(const std::string& text) {
    std::vector<std::string> words;
    std::istringstream stream(text);
    std::string word;
    while (stream >> word) {
        words.push_back(word);
    }
    return words;
}

TokenID Vocabulary::add_word(const std::string& word) {
    const auto id = static_cast<TokenID>(id_to_token_.size());
    token_to_id_.emplace(word, id);
    id_to_token_.push_back(word);
    return id;
}

bool Vocabulary::contains(const std::string& word) const {
    return token_to_id_.find(word) != token_to_id_.end();
}

TokenID Vocabulary::token_to_id(const std::string& word) const {
    auto it = token_to_id_.find(word);
    return it != token_to_id_.end() ? it->second : unk_id_;
}

const std::string& Vocabulary::id_to_token(TokenID id) const {
    if (id >= id_to_token_.size()) {
        throw std::out_of_range("Token id " + std::to_string(id) + " not in vocabulary");
    }
    return id_to_token_[id];
}

std::vector<TokenID> Vocabulary::encode(const std::string& text) const {
    std::vector<TokenID> tokens;
    for (const auto& word : split_words(text)) {
        tokens.push_back(token_to_id(word));
    }
    return tokens;
}

std::string Vocabulary::decode(const std::vector<TokenID>& tokens) const {
    std::string text;
    for (size_t i = 0; i < tokens.size(); ++i) {
        if (i > 0) text += " ";
        text += id_to_token(tokens[i]);
    }
    return text;
}

} // namespace seqlm
