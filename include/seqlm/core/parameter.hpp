#pragma once

#include <Eigen/Dense>
#include <random>
#include <string>
#include <vector>

namespace seqlm {

// Flat, named window onto one learned parameter. The optimizer walks these in the
// order a container's parameters() returns them.
struct ParameterView {
    std::string name;
    float* data;
    Eigen::Index rows;
    Eigen::Index cols;

    Eigen::Index size() const { return rows * cols; }
    Eigen::Map<Eigen::ArrayXf> values() const {
        return Eigen::Map<Eigen::ArrayXf>(data, size());
    }
};

template <typename Derived>
void add_parameter(std::vector<ParameterView>& out, const std::string& name,
                   Eigen::PlainObjectBase<Derived>& value) {
    out.push_back(ParameterView{name, value.data(), value.rows(), value.cols()});
}

// Glorot/Xavier uniform initialization for a (fan_in x fan_out) weight.
Eigen::MatrixXf xavier_uniform(Eigen::Index fan_in, Eigen::Index fan_out, std::mt19937& gen);

Eigen::MatrixXf random_normal(Eigen::Index rows, Eigen::Index cols,
                              float mean, float stddev, std::mt19937& gen);

} // namespace seqlm
