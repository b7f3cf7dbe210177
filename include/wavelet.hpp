#pragma once

#include <torch/torch.h>

#include <string>
#include <vector>

/// A two-tap orthogonal wavelet defined by its four filter banks.
/// The decomposition (analysis) filters split a feature map into lowpass and
/// highpass subbands. The reconstruction (synthesis) filters recombine them.
struct Wavelet {
    std::string name;
    std::vector<double> dec_lo;   // decomposition lowpass  (analysis scaling)
    std::vector<double> dec_hi;   // decomposition highpass (analysis wavelet)
    std::vector<double> rec_lo;   // reconstruction lowpass  (synthesis scaling)
    std::vector<double> rec_hi;   // reconstruction highpass (synthesis wavelet)

    int dec_len() const { return static_cast<int>(dec_lo.size()); }
    int rec_len() const { return static_cast<int>(rec_lo.size()); }
};

Wavelet make_wavelet(std::string const& name);

/// The four 2-D kernels of one decomposition level, each [2, 2].
/// Row index runs along height, column index along width.
struct SubbandKernels {
    torch::Tensor ll;   // lowpass height,  lowpass width
    torch::Tensor lh;   // lowpass height,  highpass width
    torch::Tensor hl;   // highpass height, lowpass width
    torch::Tensor hh;   // highpass height, highpass width
};

/// Separable analysis kernels: outer products of dec_lo / dec_hi.
SubbandKernels analysis_kernels(
    Wavelet const& wavelet,
    torch::TensorOptions const& opts);

/// Separable synthesis kernels for use with a stride-2 transposed convolution.
/// Built from the time-reversed reconstruction filters.
SubbandKernels synthesis_kernels(
    Wavelet const& wavelet,
    torch::TensorOptions const& opts);
