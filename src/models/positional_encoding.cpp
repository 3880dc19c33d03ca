#include "seqlm/models/positional_encoding.hpp"
#include <cmath>

namespace seqlm {

PositionalEncoding::PositionalEncoding(size_t d_model, size_t max_seq_len)
    : d_model_(d_model), max_seq_len_(max_seq_len),
      table_(static_cast<Eigen::Index>(max_seq_len), static_cast<Eigen::Index>(d_model)) {
    const double log_base = std::log(10000.0);
    for (size_t pos = 0; pos < max_seq_len_; ++pos) {
        for (size_t i = 0; 2 * i < d_model_; ++i) {
            const double inv_freq = std::exp(-static_cast<double>(2 * i) * log_base /
                                              static_cast<double>(d_model_));
            const double angle = static_cast<double>(pos) * inv_freq;
            const auto row = static_cast<Eigen::Index>(pos);
            table_(row, static_cast<Eigen::Index>(2 * i)) = static_cast<float>(std::sin(angle));
            if (2 * i + 1 < d_model_) {
                table_(row, static_cast<Eigen::Index>(2 * i + 1)) =
                    static_cast<float>(std::cos(angle));
            }
        }
    }
}

void PositionalEncoding::check_length(size_t seq_len) const {
    if (seq_len > max_seq_len_) {
        throw SequenceTooLong(seq_len, max_seq_len_);
    }
}

Tensor PositionalEncoding::forward(const Tensor& input) const {
    if (input.ndim() != 3 || input.dim(2) != d_model_) {
        throw InvalidShape("positional encoding expects (batch, seq_len, " +
                           std::to_string(d_model_) + "), got " + input.shape_string());
    }
    const size_t seq_len = input.dim(1);
    check_length(seq_len);

    Tensor output(input);
    const auto rows = table_.topRows(static_cast<Eigen::Index>(seq_len));
    for (size_t b = 0; b < input.dim(0); ++b) {
        output.matrix(b) += rows;
    }
    return output;
}

} // namespace seqlm
