#pragma once

#include <torch/torch.h>

#include <string>
#include <vector>

/// One 3x3 convolution of the backbone, followed by ReLU.
struct BackboneLayer {
    std::string name;
    int64_t in_channels;
    int64_t out_channels;
    bool pool_after;   // a 2x2 max pool follows this layer in the classifier
};

/// VGG19 convolutions from block1_conv1 up to and including block4_conv1.
std::vector<BackboneLayer> vgg19_encoder_layers();

/// Layers whose activations feed the gram loss: block{1,2,3,4}_conv1.
std::vector<std::string> vgg19_style_layers();

/// Frozen VGG19 prefix. Serves as the loss network and as the weight source
/// for the autoencoder's encoder. Submodules are registered under the layer
/// names, so an archive with keys "block1_conv1.weight", ... loads directly.
class Vgg19BackboneImpl : public torch::nn::Module {
public:
    Vgg19BackboneImpl();

    /// Activations of vgg19_style_layers(), in order.
    std::vector<torch::Tensor> forward(torch::Tensor x);

    /// Convolution registered under the given layer name.
    /// Throws std::invalid_argument for unknown names.
    torch::nn::Conv2d const& conv(std::string const& name) const;

    std::vector<BackboneLayer> const& layers() const { return layers_; }

    /// Disable gradients on every parameter and switch to eval mode.
    void freeze();

private:
    std::vector<BackboneLayer> layers_;
    std::vector<torch::nn::Conv2d> convs_;
    std::vector<std::string> style_layers_;
};
TORCH_MODULE(Vgg19Backbone);
