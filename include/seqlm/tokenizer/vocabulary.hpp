#pragma once

#include "seqlm/core/types.hpp"
#include <string>
#include <unordered_map>
#include <vector>

namespace seqlm {

// Whole-word vocabulary. Words get ids in order of first appearance and the
// unknown-word token is appended last, e.g. for "hello world how are you":
//   hello:0 world:1 how:2 are:3 you:4 <UNK>:5
class Vocabulary {
public:
    static constexpr const char* kUnkToken = "<UNK>";

    Vocabulary();
    explicit Vocabulary(const std::vector<std::string>& corpus);

    // Unknown words map to unk_token_id()
    std::vector<TokenID> encode(const std::string& text) const;
    std::string decode(const std::vector<TokenID>& tokens) const;

    TokenID token_to_id(const std::string& word) const;
    const std::string& id_to_token(TokenID id) const;
    bool contains(const std::string& word) const;

    size_t size() const { return id_to_token_.size(); }
    TokenID unk_token_id() const { return unk_id_; }

    static std::vector<std::string> split_words(const std::string& text);

private:
    TokenID add_word(const std::string& word);

    std::unordered_map<std::string, TokenID> token_to_id_;
    std::vector<std::string> id_to_token_;
    TokenID unk_id_ = 0;
};

} // namespace seqlm
