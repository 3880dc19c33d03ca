#include "seqlm/core/parameter.hpp"
#include <cmath>

namespace seqlm {

Eigen::MatrixXf xavier_uniform(Eigen::Index fan_in, Eigen::Index fan_out, std::mt19937& gen) {
    const float limit = std::sqrt(6.0f / static_cast<float>(fan_in + fan_out));
    std::uniform_real_distribution<float> dist(-limit, limit);
    return Eigen::MatrixXf::NullaryExpr(fan_in, fan_out, [&]() { return dist(gen); });
}

Eigen::MatrixXf random_normal(Eigen::Index rows, Eigen::Index cols,
                              float mean, float stddev, std::mt19937& gen) {
    std::normal_distribution<float> dist(mean, stddev);
    return Eigen::MatrixXf::NullaryExpr(rows, cols, [&]() { return dist(gen); });
}

} // namespace seqlm
