// include/seqlm/optimizers/adam.hpp
#pragma once

#include "seqlm/models/transformer_model.hpp"
#include <cstddef>

namespace seqlm {

class AdamOptimizer {
public:
    AdamOptimizer(float lr = 0.001f, float b1 = 0.9f, float b2 = 0.999f, float eps = 1e-8f);

    // Returns the updated parameters; the input snapshot is left untouched.
    // Gradients are taken by value; move them in when they are no longer needed.
    ModelParameters step(const ModelParameters& parameters, ModelParameters gradients);

    // Reset the optimizer state
    void reset();

    size_t timestep() const { return t_; }
    float learning_rate() const { return learning_rate_; }
    void set_learning_rate(float lr) { learning_rate_ = lr; }

private:
    void initialize_moments(const ModelParameters& parameters);

    float learning_rate_;
    float beta1_;
    float beta2_;
    float epsilon_;
    size_t t_;

    bool initialized_ = false;
    ModelParameters m_;  // first moment
    ModelParameters v_;  // second raw moment
};

// Scales gradients in place so their global L2 norm is at most max_norm.
// Returns the norm before clipping.
float clip_grad_norm(ModelParameters& gradients, float max_norm);

} // namespace seqlm
