#pragma once

#include <torch/torch.h>

#include <optional>
#include <vector>

#include "backbone.hpp"
#include "layout.hpp"
#include "skip_stack.hpp"
#include "wavelet.hpp"
#include "wavelet_pool.hpp"

/// Result of running one stage slice.
struct StageOutput {
    torch::Tensor features;
    std::optional<SkipConnection> skip;   // set by pool stages
};

/// The end-to-end WCT2 reconstruction network realized from a ModelLayout.
///
/// Encoder convs are copies of the backbone's weights and never train.
/// Decoder convs and the output conv are trainable. Wavelet layers carry no
/// parameters. Submodules are registered under the layer names.
class Wct2AutoencoderImpl : public torch::nn::Module {
public:
    Wct2AutoencoderImpl(
        ModelLayout layout,
        Vgg19Backbone const& backbone,
        Wavelet wavelet = make_wavelet("haar"),
        OddSizePolicy odd_size_policy = OddSizePolicy::replicate_pad);

    /// Full graph: every stage in order, skips routed through a SkipStack.
    torch::Tensor forward(torch::Tensor const& image);

    /// Run the layers of one stage. Unpool stages need the skip stored by the
    /// pool of the same depth; pool stages return the skip they create.
    StageOutput run_stage(
        StageSpec const& stage,
        torch::Tensor const& input,
        SkipConnection const* skip = nullptr);

    ModelLayout const& layout() const { return layout_; }

    /// Parameters the optimizer may update (decoder and output convs).
    std::vector<torch::Tensor> trainable_parameters();

    /// Disable gradients on the encoder convs.
    void freeze_encoder();

private:
    torch::Tensor apply_conv(size_t index, torch::Tensor const& x);

    ModelLayout layout_;
    Wavelet wavelet_;
    OddSizePolicy odd_size_policy_;
    std::vector<torch::nn::Conv2d> convs_;   // one per layer, empty for wavelet layers
};
TORCH_MODULE(Wct2Autoencoder);
