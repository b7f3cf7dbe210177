#include "wavelet_pool.hpp"

#include "errors.hpp"
#include "tensor_util.hpp"

#include <stdexcept>
#include <string>

OddSizePolicy parse_odd_size_policy(std::string const& name) {
    if (name == "reject") return OddSizePolicy::reject;
    if (name == "replicate_pad") return OddSizePolicy::replicate_pad;
    throw std::invalid_argument("Unknown odd size policy: " + name);
}

/// Expand a [2, 2] kernel to a depthwise weight [channels, 1, 2, 2].
static torch::Tensor depthwise_weight(torch::Tensor const& kernel, int64_t channels) {
    return kernel.view({1, 1, 2, 2}).expand({channels, 1, 2, 2}).contiguous();
}

namespace F = torch::nn::functional;

static torch::Tensor analyze(torch::Tensor const& x, torch::Tensor const& kernel) {
    int64_t const channels = x.size(1);
    return F::conv2d(x, depthwise_weight(kernel, channels),
                     F::Conv2dFuncOptions().stride(2).groups(channels));
}

static torch::Tensor synthesize(torch::Tensor const& band, torch::Tensor const& kernel) {
    int64_t const channels = band.size(1);
    return F::conv_transpose2d(band, depthwise_weight(kernel, channels),
                               F::ConvTranspose2dFuncOptions().stride(2).groups(channels));
}

SubbandBundle wavelet_pool(
    torch::Tensor const& input,
    Wavelet const& wavelet,
    OddSizePolicy policy) {

    require_4d(input, "wavelet_pool input");
    int64_t const H = input.size(2);
    int64_t const W = input.size(3);
    int64_t const pad_h = H % 2;
    int64_t const pad_w = W % 2;

    auto x = input;
    if (pad_h != 0 || pad_w != 0) {
        if (policy == OddSizePolicy::reject) {
            throw ShapeError(
                "wavelet_pool needs even height and width, got " + shape_string(input));
        }
        // Padding order is (left, right, top, bottom) for the last two dims.
        x = F::pad(x, F::PadFuncOptions({0, pad_w, 0, pad_h}).mode(torch::kReplicate));
    }

    auto const kernels = analysis_kernels(wavelet, x.options());
    return SubbandBundle{
        .ll = analyze(x, kernels.ll),
        .lh = analyze(x, kernels.lh),
        .hl = analyze(x, kernels.hl),
        .hh = analyze(x, kernels.hh),
    };
}

torch::Tensor wavelet_unpool(
    torch::Tensor const& ll,
    torch::Tensor const& lh,
    torch::Tensor const& hl,
    torch::Tensor const& hh,
    Wavelet const& wavelet,
    torch::Tensor const& reference) {

    require_4d(ll, "wavelet_unpool LL");
    require_same_shape(ll, lh, "wavelet_unpool LL/LH mismatch");
    require_same_shape(ll, hl, "wavelet_unpool LL/HL mismatch");
    require_same_shape(ll, hh, "wavelet_unpool LL/HH mismatch");

    int64_t const h = ll.size(2);
    int64_t const w = ll.size(3);
    int64_t out_h = 2 * h;
    int64_t out_w = 2 * w;

    if (reference.defined()) {
        require_4d(reference, "wavelet_unpool reference");
        int64_t const ref_h = reference.size(2);
        int64_t const ref_w = reference.size(3);
        bool const batch_ok = reference.size(0) == ll.size(0);
        bool const channels_ok = reference.size(1) == ll.size(1);
        bool const height_ok = ref_h == out_h || ref_h == out_h - 1;
        bool const width_ok = ref_w == out_w || ref_w == out_w - 1;
        if (!batch_ok || !channels_ok || !height_ok || !width_ok) {
            throw ShapeError(
                "wavelet_unpool reference " + shape_string(reference) +
                " does not match sub-bands " + shape_string(ll));
        }
        out_h = ref_h;
        out_w = ref_w;
    }

    auto const kernels = synthesis_kernels(wavelet, ll.options());
    auto result = synthesize(ll, kernels.ll)
                + synthesize(lh, kernels.lh)
                + synthesize(hl, kernels.hl)
                + synthesize(hh, kernels.hh);

    if (out_h != 2 * h || out_w != 2 * w) {
        result = result.slice(2, 0, out_h).slice(3, 0, out_w).contiguous();
    }
    return result;
}
