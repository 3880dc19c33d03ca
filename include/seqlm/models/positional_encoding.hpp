#pragma once

#include "seqlm/core/tensor.hpp"
#include "seqlm/core/types.hpp"

namespace seqlm {

// Fixed sinusoidal position signal:
//   PE[pos, 2i]   = sin(pos / 10000^(2i/d))
//   PE[pos, 2i+1] = cos(pos / 10000^(2i/d))
// The table is built once in the constructor and never changes afterwards.
// When d is odd the last column carries the sine of the final frequency.
class PositionalEncoding {
public:
    explicit PositionalEncoding(size_t d_model, size_t max_seq_len = 5000);

    // Adds the first seq_len rows of the table to every batch entry.
    // Throws SequenceTooLong when seq_len > max_seq_len.
    Tensor forward(const Tensor& input) const;

    void check_length(size_t seq_len) const;

    const RowMatrix& table() const { return table_; }
    size_t d_model() const { return d_model_; }
    size_t max_seq_len() const { return max_seq_len_; }

private:
    size_t d_model_;
    size_t max_seq_len_;
    RowMatrix table_;
};

} // namespace seqlm
