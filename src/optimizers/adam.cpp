// src/optimizers/adam.cpp
#include "seqlm/optimizers/adam.hpp"
#include <cmath>
#include <stdexcept>

namespace seqlm {

AdamOptimizer::AdamOptimizer(float lr, float b1, float b2, float eps)
    : learning_rate_(lr), beta1_(b1), beta2_(b2), epsilon_(eps), t_(0) {}

void AdamOptimizer::initialize_moments(const ModelParameters& parameters) {
    m_ = parameters.zeros_like();
    v_ = parameters.zeros_like();
    initialized_ = true;
}

ModelParameters AdamOptimizer::step(const ModelParameters& parameters,
                                    ModelParameters gradients) {
    if (!initialized_) {
        initialize_moments(parameters);
    }

    ModelParameters updated(parameters);

    auto params = updated.parameters();
    auto grads = gradients.parameters();
    auto m = m_.parameters();
    auto v = v_.parameters();

    if (grads.size() != params.size() || m.size() != params.size()) {
        throw InvalidShape("gradients and optimizer state do not match the parameters");
    }

    t_++;
    const float bias_correction1 = 1.0f - std::pow(beta1_, static_cast<float>(t_));
    const float bias_correction2 = 1.0f - std::pow(beta2_, static_cast<float>(t_));

    for (size_t i = 0; i < params.size(); i++) {
        if (grads[i].size() != params[i].size() || m[i].size() != params[i].size()) {
            throw InvalidShape("gradient for " + params[i].name + " has the wrong size");
        }

        auto g = grads[i].values();

        // Update biased first moment estimate
        m[i].values() = beta1_ * m[i].values() + (1.0f - beta1_) * g;

        // Update biased second raw moment estimate
        v[i].values() = beta2_ * v[i].values() + (1.0f - beta2_) * g.square();

        // Bias-corrected estimates
        Eigen::ArrayXf m_hat = m[i].values() / bias_correction1;
        Eigen::ArrayXf v_hat = v[i].values() / bias_correction2;

        params[i].values() -= learning_rate_ * m_hat / (v_hat.sqrt() + epsilon_);
    }

    return updated;
}

void AdamOptimizer::reset() {
    m_ = ModelParameters();
    v_ = ModelParameters();
    initialized_ = false;
    t_ = 0;
}

float clip_grad_norm(ModelParameters& gradients, float max_norm) {
    auto grads = gradients.parameters();

    double sum_squares = 0.0;
    for (const auto& grad : grads) {
        sum_squares += static_cast<double>(grad.values().square().sum());
    }
    const auto norm = static_cast<float>(std::sqrt(sum_squares));

    if (max_norm > 0.0f && norm > max_norm) {
        const float scale = max_norm / (norm + 1e-6f);
        for (auto& grad : grads) {
            grad.values() *= scale;
        }
    }
    return norm;
}

} // namespace seqlm
