#pragma once

#include <stdexcept>
#include <string>

namespace seqlm {

// Tensors passed between stages violate the expected rank/dimension contract.
class InvalidShape : public std::invalid_argument {
public:
    explicit InvalidShape(const std::string& what)
        : std::invalid_argument("Invalid shape: " + what) {}
};

// Input sequence is longer than the positional table.
class SequenceTooLong : public std::length_error {
public:
    SequenceTooLong(size_t length, size_t limit)
        : std::length_error("Sequence length " + std::to_string(length) +
                            " exceeds max_seq_len " + std::to_string(limit)),
          length_(length), limit_(limit) {}

    size_t length() const { return length_; }
    size_t limit() const { return limit_; }

private:
    size_t length_;
    size_t limit_;
};

} // namespace seqlm
