#include "wavelet.hpp"

#include <cmath>
#include <stdexcept>

static Wavelet make_haar() {
    double const s = std::sqrt(2.0) / 2.0;
    return Wavelet{
        .name = "haar",
        .dec_lo = { s,  s},
        .dec_hi = {-s,  s},
        .rec_lo = { s,  s},
        .rec_hi = { s, -s},
    };
}

Wavelet make_wavelet(std::string const& name) {
    if (name == "haar" || name == "db1") {
        return make_haar();
    }
    throw std::invalid_argument("Unknown wavelet: " + name);
}

static SubbandKernels outer_kernels(
    torch::Tensor const& lo,
    torch::Tensor const& hi) {

    return SubbandKernels{
        .ll = torch::outer(lo, lo),
        .lh = torch::outer(lo, hi),
        .hl = torch::outer(hi, lo),
        .hh = torch::outer(hi, hi),
    };
}

SubbandKernels analysis_kernels(
    Wavelet const& wavelet,
    torch::TensorOptions const& opts) {

    if (wavelet.dec_len() != 2) {
        throw std::invalid_argument(
            "Wavelet pooling needs a two-tap filter, " + wavelet.name +
            " has " + std::to_string(wavelet.dec_len()));
    }
    auto dec_lo = torch::tensor(wavelet.dec_lo, opts);
    auto dec_hi = torch::tensor(wavelet.dec_hi, opts);
    return outer_kernels(dec_lo, dec_hi);
}

SubbandKernels synthesis_kernels(
    Wavelet const& wavelet,
    torch::TensorOptions const& opts) {

    if (wavelet.rec_len() != 2) {
        throw std::invalid_argument(
            "Wavelet unpooling needs a two-tap filter, " + wavelet.name +
            " has " + std::to_string(wavelet.rec_len()));
    }
    // Reconstruction filters are time-reversed relative to their stored form;
    // the transposed convolution then acts as the adjoint of the analysis.
    auto rec_lo = torch::tensor(wavelet.rec_lo, opts).flip(0);
    auto rec_hi = torch::tensor(wavelet.rec_hi, opts).flip(0);
    return outer_kernels(rec_lo, rec_hi);
}
