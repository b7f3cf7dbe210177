#pragma once

#include "errors.hpp"

#include <torch/torch.h>

#include <string>

/// Format a tensor's sizes as "[2, 64, 32, 32]" for error messages.
inline std::string shape_string(torch::Tensor const& t) {
    std::string out = "[";
    for (int64_t i = 0; i < t.dim(); ++i) {
        if (i > 0) out += ", ";
        out += std::to_string(t.size(i));
    }
    return out + "]";
}

/// Throw ShapeError unless t is a defined 4-D (N, C, H, W) tensor.
inline void require_4d(torch::Tensor const& t, char const* what) {
    if (!t.defined() || t.dim() != 4) {
        throw ShapeError(std::string(what) + " must be a 4-D (N, C, H, W) tensor, got " +
                         (t.defined() ? shape_string(t) : std::string("undefined")));
    }
}

/// Throw ShapeError unless a and b have identical sizes.
inline void require_same_shape(
    torch::Tensor const& a,
    torch::Tensor const& b,
    char const* what) {

    if (a.sizes() != b.sizes()) {
        throw ShapeError(std::string(what) + ": " + shape_string(a) + " vs " + shape_string(b));
    }
}
