#pragma once

#include <Eigen/Dense>
#include <vector>

namespace seqlm {

using TokenID = unsigned int;

// batch x seq_len; every row must have the same length
using TokenBatch = std::vector<std::vector<TokenID>>;

// Next-token targets, batch x seq_len. kIgnoreIndex marks positions without a target.
using TargetBatch = std::vector<std::vector<int>>;
constexpr int kIgnoreIndex = -100;

// Per-sequence activations are (seq_len x dim) row-major matrices so that they
// alias the flat storage of a 3D tensor directly.
using RowMatrix = Eigen::Matrix<float, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

} // namespace seqlm
