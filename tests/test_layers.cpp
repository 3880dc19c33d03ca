#include "seqlm/models/feed_forward.hpp"
#include "seqlm/models/layer_norm.hpp"
#include "test_utils.hpp"
#include <iostream>
#include <random>

using namespace seqlm;
using namespace seqlm::test;

namespace {

Tensor random_tensor(const std::vector<size_t>& shape, unsigned seed, float mean, float stddev) {
    std::mt19937 gen(seed);
    std::normal_distribution<float> dist(mean, stddev);
    Tensor t(shape);
    for (size_t i = 0; i < t.size(); ++i) t(i) = dist(gen);
    return t;
}

} // namespace

int main() {
    std::cout << "Testing LayerNorm and FeedForward..." << std::endl;

    run("LayerNorm gives zero mean and unit variance per position", [] {
        LayerNorm norm(16);
        LayerNormParameters params = norm.init_parameters();
        Tensor out = norm.forward(params, random_tensor({2, 5, 16}, 1, 3.0f, 4.0f));

        for (size_t b = 0; b < 2; ++b) {
            const auto y = out.matrix(b);
            for (Eigen::Index t = 0; t < y.rows(); ++t) {
                const float mean = y.row(t).mean();
                const float variance = (y.row(t).array() - mean).square().mean();
                check_close(mean, 0.0f, 1e-5f, "mean is 0");
                check_close(variance, 1.0f, 1e-3f, "variance is 1");
            }
        }
    });

    run("LayerNorm applies gain and shift", [] {
        LayerNorm norm(4);
        LayerNormParameters params = norm.init_parameters();
        params.gamma.setConstant(2.0f);
        params.beta.setConstant(0.5f);

        Tensor x({1, 1, 4});
        x(0, 0, 0) = 1.0f;
        x(0, 0, 1) = -1.0f;
        x(0, 0, 2) = 1.0f;
        x(0, 0, 3) = -1.0f;
        Tensor out = norm.forward(params, x);
        // normalized values are +-1 (up to eps)
        check_close(out(0, 0, 0), 2.5f, 1e-4f, "2 * 1 + 0.5");
        check_close(out(0, 0, 1), -1.5f, 1e-4f, "2 * -1 + 0.5");
    });

    run("LayerNorm of a constant row is the shift", [] {
        LayerNorm norm(3);
        LayerNormParameters params = norm.init_parameters();
        params.beta << 1.0f, 2.0f, 3.0f;
        Tensor out = norm.forward(params, Tensor({1, 2, 3}, 5.0f));
        check_close(out(0, 1, 2), 3.0f, 1e-6f, "constant input normalizes to zero");
    });

    run("FeedForward keeps the input shape", [] {
        FeedForward ff(8, 32);
        std::mt19937 gen(2);
        FeedForwardParameters params = ff.init_parameters(gen);
        Tensor out = ff.forward(params, random_tensor({2, 3, 8}, 3, 0.0f, 1.0f));
        check(out.shape() == std::vector<size_t>({2, 3, 8}), "output is (batch, L, d)");
    });

    run("FeedForward applies ReLU between projections", [] {
        FeedForward ff(2, 3);
        std::mt19937 gen(4);
        FeedForwardParameters params = ff.init_parameters(gen);
        params.fc1.weight.setZero();
        params.fc1.bias << -1.0f, 2.0f, 0.0f;
        params.fc2.weight.setOnes();
        params.fc2.bias << 0.25f, -0.25f;

        Tensor out = ff.forward(params, random_tensor({1, 2, 2}, 5, 0.0f, 1.0f));
        // hidden = relu([-1, 2, 0]) = [0, 2, 0]; output = [2.25, 1.75]
        check_close(out(0, 0, 0), 2.25f, 1e-6f, "first output");
        check_close(out(0, 1, 1), 1.75f, 1e-6f, "second output");
    });

    run("Shape violations raise InvalidShape", [] {
        FeedForward ff(8, 16);
        std::mt19937 gen(6);
        FeedForwardParameters params = ff.init_parameters(gen);
        check_throws<InvalidShape>([&] { (void)ff.forward(params, Tensor({1, 2, 4})); },
                                   "feed-forward with wrong dimension");

        LayerNorm norm(8);
        LayerNormParameters norm_params = norm.init_parameters();
        check_throws<InvalidShape>([&] { (void)norm.forward(norm_params, Tensor({1, 2, 4})); },
                                   "layer norm with wrong dimension");

        FeedForward wide(8, 32);
        check_throws<InvalidShape>([&] { wide.check_parameters(params); },
                                   "parameters with another hidden size");
    });

    return summary();
}
