#include "seqlm/models/linear.hpp"
#include "seqlm/core/errors.hpp"

namespace seqlm {

LinearParameters LinearParameters::init(size_t in_features, size_t out_features, std::mt19937& gen) {
    LinearParameters params;
    params.weight = xavier_uniform(static_cast<Eigen::Index>(in_features),
                                   static_cast<Eigen::Index>(out_features), gen);
    params.bias = Eigen::RowVectorXf::Zero(static_cast<Eigen::Index>(out_features));
    return params;
}

void LinearParameters::collect(const std::string& prefix, std::vector<ParameterView>& out) {
    add_parameter(out, prefix + ".weight", weight);
    add_parameter(out, prefix + ".bias", bias);
}

void LinearParameters::check(const std::string& name, size_t in, size_t out) const {
    if (in_features() != in || out_features() != out ||
        static_cast<size_t>(bias.size()) != out) {
        throw InvalidShape(name + " expects a " + std::to_string(in) + "x" +
                           std::to_string(out) + " projection, got weight " +
                           std::to_string(weight.rows()) + "x" + std::to_string(weight.cols()) +
                           " and bias " + std::to_string(bias.size()));
    }
}

RowMatrix linear_forward(const LinearParameters& params, const Eigen::Ref<const RowMatrix>& input) {
    RowMatrix output = input * params.weight;
    output.rowwise() += params.bias;
    return output;
}

RowMatrix linear_backward(const LinearParameters& params,
                          const Eigen::Ref<const RowMatrix>& input,
                          const Eigen::Ref<const RowMatrix>& grad_output,
                          LinearParameters& grads) {
    grads.weight.noalias() += input.transpose() * grad_output;
    grads.bias += grad_output.colwise().sum();
    return grad_output * params.weight.transpose();
}

} // namespace seqlm
