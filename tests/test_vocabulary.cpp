#include "seqlm/tokenizer/vocabulary.hpp"
#include "test_utils.hpp"
#include <iostream>
#include <string>
#include <vector>

using namespace seqlm;
using namespace seqlm::test;

int main() {
    std::cout << "Testing vocabulary..." << std::endl;

    run("Ids follow first appearance with <UNK> last", [] {
        Vocabulary vocab(std::vector<std::string>{"hello world how are you",
                                                   "how are you hello world"});
        check(vocab.size() == 6, "five words plus <UNK>");
        check(vocab.token_to_id("hello") == 0, "hello:0");
        check(vocab.token_to_id("world") == 1, "world:1");
        check(vocab.token_to_id("how") == 2, "how:2");
        check(vocab.token_to_id("are") == 3, "are:3");
        check(vocab.token_to_id("you") == 4, "you:4");
        check(vocab.unk_token_id() == 5, "<UNK>:5");
        check(vocab.id_to_token(5) == Vocabulary::kUnkToken, "id 5 decodes to <UNK>");
    });

    run("Encoding maps unknown words to <UNK>", [] {
        Vocabulary vocab(std::vector<std::string>{"hello world how are you"});
        auto ids = vocab.encode("hello  there\tworld");
        check(ids == std::vector<TokenID>({0, 5, 1}), "whitespace split, unknown word -> 5");
        check(vocab.token_to_id("Hello") == vocab.unk_token_id(), "lookup is case-sensitive");
        check(vocab.encode("").empty(), "empty text encodes to nothing");
    });

    run("Decoding joins words with single spaces", [] {
        Vocabulary vocab(std::vector<std::string>{"hello world how are you"});
        check(vocab.decode({2, 3, 4}) == "how are you", "decode known ids");
        check(vocab.decode(vocab.encode("you are")) == "you are", "encode then decode");
        check(vocab.decode({}).empty(), "empty id list");
        check_throws<std::out_of_range>([&] { (void)vocab.decode({0, 6}); }, "id past the end");
        check_throws<std::out_of_range>([&] { (void)vocab.id_to_token(42); }, "unknown id");
    });

    run("Repeated words and a literal <UNK> in the corpus", [] {
        Vocabulary vocab(std::vector<std::string>{"a a b <UNK> b a"});
        check(vocab.size() == 3, "a, b and <UNK>");
        check(vocab.unk_token_id() == 2, "<UNK> still appended last");
        check(vocab.contains("b"), "contains b");
        check(!vocab.contains("c"), "does not contain c");
    });

    run("Default vocabulary holds only <UNK>", [] {
        Vocabulary vocab;
        check(vocab.size() == 1, "single entry");
        check(vocab.unk_token_id() == 0, "<UNK> is id 0");
        check(vocab.encode("anything at all") == std::vector<TokenID>({0, 0, 0}),
              "every word is unknown");
    });

    return summary();
}
