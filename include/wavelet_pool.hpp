#pragma once

#include <torch/torch.h>

#include <string>

#include "wavelet.hpp"

/// How wavelet pooling treats a feature map with an odd height or width.
///   reject:        throw ShapeError.
///   replicate_pad: pad one replicated row (bottom) / column (right) before
///                  pooling; unpooling crops back to the reference shape.
enum class OddSizePolicy { reject, replicate_pad };

/// Parse an odd-size policy from a string.
/// Accepted values: "reject", "replicate_pad".
OddSizePolicy parse_odd_size_policy(std::string const& name);

/// The four sub-bands of one decomposition, each [N, C, ceil(H/2), ceil(W/2)].
struct SubbandBundle {
    torch::Tensor ll;
    torch::Tensor lh;
    torch::Tensor hl;
    torch::Tensor hh;
};

/// Forward 2-D wavelet decomposition of an [N, C, H, W] feature map.
/// Each channel is filtered independently by the fixed 2x2 analysis kernels
/// with stride 2. Parameter free and exact.
SubbandBundle wavelet_pool(
    torch::Tensor const& input,
    Wavelet const& wavelet,
    OddSizePolicy policy = OddSizePolicy::reject);

/// Inverse of wavelet_pool. The sub-bands must share one shape [N, C, h, w].
/// If reference is defined, the result is cropped to its height and width,
/// which must be 2h or 2h - 1 (resp. 2w or 2w - 1). Otherwise the result is
/// [N, C, 2h, 2w].
torch::Tensor wavelet_unpool(
    torch::Tensor const& ll,
    torch::Tensor const& lh,
    torch::Tensor const& hl,
    torch::Tensor const& hh,
    Wavelet const& wavelet,
    torch::Tensor const& reference = {});

inline torch::Tensor wavelet_unpool(
    SubbandBundle const& bands,
    Wavelet const& wavelet,
    torch::Tensor const& reference = {}) {
    return wavelet_unpool(bands.ll, bands.lh, bands.hl, bands.hh, wavelet, reference);
}
