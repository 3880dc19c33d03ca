#pragma once

#include "seqlm/core/errors.hpp"
#include "seqlm/core/types.hpp"
#include <Eigen/Dense>
#include <algorithm>
#include <cmath>
#include <iostream>
#include <string>
#include <vector>

namespace seqlm {

// Dense row-major float tensor of rank 1 to 3. Element (i, j, k) of a 3D tensor
// lives at flat index i * shape[1] * shape[2] + j * shape[2] + k.
class Tensor {
public:
    Tensor() : shape_({0}) {}

    explicit Tensor(const std::vector<size_t>& shape, float value = 0.0f) : shape_(shape) {
        if (shape.empty() || shape.size() > 3) {
            throw InvalidShape("tensor rank must be between 1 and 3, got " +
                               std::to_string(shape.size()));
        }
        size_t total_size = 1;
        for (auto dim : shape) total_size *= dim;
        data_ = Eigen::VectorXf::Constant(static_cast<Eigen::Index>(total_size), value);
    }

    // Stack equally shaped (seq_len x dim) matrices into a (batch x seq_len x dim) tensor.
    static Tensor stack(const std::vector<RowMatrix>& slices) {
        if (slices.empty()) {
            throw InvalidShape("cannot stack an empty list of matrices");
        }
        const size_t rows = static_cast<size_t>(slices.front().rows());
        const size_t cols = static_cast<size_t>(slices.front().cols());
        Tensor result({slices.size(), rows, cols});
        for (size_t b = 0; b < slices.size(); ++b) {
            result.set_matrix(b, slices[b]);
        }
        return result;
    }

    // Accessors
    const std::vector<size_t>& shape() const { return shape_; }
    Eigen::VectorXf& data() { return data_; }
    const Eigen::VectorXf& data() const { return data_; }

    size_t size() const { return static_cast<size_t>(data_.size()); }
    size_t ndim() const { return shape_.size(); }
    size_t dim(size_t axis) const {
        return (axis < shape_.size()) ? shape_[axis] : 1;
    }

    // Element access
    float& operator()(size_t i) { return data_(static_cast<Eigen::Index>(i)); }
    float operator()(size_t i) const { return data_(static_cast<Eigen::Index>(i)); }

    float& operator()(size_t i, size_t j) {
        if (shape_.size() != 2) {
            throw InvalidShape("2D access requires 2D tensor");
        }
        return data_(static_cast<Eigen::Index>(i * shape_[1] + j));
    }
    float operator()(size_t i, size_t j) const {
        if (shape_.size() != 2) {
            throw InvalidShape("2D access requires 2D tensor");
        }
        return data_(static_cast<Eigen::Index>(i * shape_[1] + j));
    }

    float& operator()(size_t i, size_t j, size_t k) {
        if (shape_.size() != 3) {
            throw InvalidShape("3D access requires 3D tensor");
        }
        return data_(static_cast<Eigen::Index>(i * shape_[1] * shape_[2] + j * shape_[2] + k));
    }
    float operator()(size_t i, size_t j, size_t k) const {
        if (shape_.size() != 3) {
            throw InvalidShape("3D access requires 3D tensor");
        }
        return data_(static_cast<Eigen::Index>(i * shape_[1] * shape_[2] + j * shape_[2] + k));
    }

    // (shape[1] x shape[2]) view of batch entry b
    Eigen::Map<RowMatrix> matrix(size_t b) {
        check_batch_index(b);
        return Eigen::Map<RowMatrix>(data_.data() + b * shape_[1] * shape_[2],
                                     static_cast<Eigen::Index>(shape_[1]),
                                     static_cast<Eigen::Index>(shape_[2]));
    }
    Eigen::Map<const RowMatrix> matrix(size_t b) const {
        check_batch_index(b);
        return Eigen::Map<const RowMatrix>(data_.data() + b * shape_[1] * shape_[2],
                                           static_cast<Eigen::Index>(shape_[1]),
                                           static_cast<Eigen::Index>(shape_[2]));
    }

    void set_matrix(size_t b, const RowMatrix& value) {
        if (static_cast<size_t>(value.rows()) != dim(1) ||
            static_cast<size_t>(value.cols()) != dim(2)) {
            throw InvalidShape("slice is " + std::to_string(value.rows()) + "x" +
                               std::to_string(value.cols()) + ", tensor expects " +
                               shape_string());
        }
        matrix(b) = value;
    }

    Tensor operator+(const Tensor& other) const {
        if (shape_ != other.shape_) {
            throw InvalidShape("tensor shapes must match for addition: " +
                               shape_string() + " vs " + other.shape_string());
        }
        Tensor result(*this);
        result.data_ += other.data_;
        return result;
    }

    Tensor operator*(float scalar) const {
        Tensor result(*this);
        result.data_ *= scalar;
        return result;
    }

    Tensor& operator+=(const Tensor& other) {
        if (shape_ != other.shape_) {
            throw InvalidShape("tensor shapes must match for addition: " +
                               shape_string() + " vs " + other.shape_string());
        }
        data_ += other.data_;
        return *this;
    }

    std::string shape_string() const {
        std::string out = "(";
        for (size_t i = 0; i < shape_.size(); ++i) {
            if (i > 0) out += ", ";
            out += std::to_string(shape_[i]);
        }
        return out + ")";
    }

    void print(const std::string& name = "") const {
        if (!name.empty()) {
            std::cout << name << " ";
        }
        std::cout << "shape " << shape_string() << std::endl;
        std::cout << data_.transpose() << std::endl;
    }

private:
    void check_batch_index(size_t b) const {
        if (shape_.size() != 3) {
            throw InvalidShape("matrix view requires a 3D tensor, got " + shape_string());
        }
        if (b >= shape_[0]) {
            throw InvalidShape("batch index " + std::to_string(b) + " out of range for " +
                               shape_string());
        }
    }

    std::vector<size_t> shape_;
    Eigen::VectorXf data_;
};

inline Tensor operator*(float scalar, const Tensor& tensor) {
    return tensor * scalar;
}

inline float max_abs_diff(const Tensor& a, const Tensor& b) {
    if (a.shape() != b.shape()) {
        throw InvalidShape("cannot compare " + a.shape_string() + " with " + b.shape_string());
    }
    if (a.size() == 0) return 0.0f;
    return (a.data() - b.data()).cwiseAbs().maxCoeff();
}

} // namespace seqlm
