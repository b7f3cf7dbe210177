#include "backbone.hpp"

#include <algorithm>
#include <stdexcept>

std::vector<BackboneLayer> vgg19_encoder_layers() {
    return {
        {"block1_conv1",   3,  64, false},
        {"block1_conv2",  64,  64, true},
        {"block2_conv1",  64, 128, false},
        {"block2_conv2", 128, 128, true},
        {"block3_conv1", 128, 256, false},
        {"block3_conv2", 256, 256, false},
        {"block3_conv3", 256, 256, false},
        {"block3_conv4", 256, 256, true},
        {"block4_conv1", 256, 512, false},
    };
}

std::vector<std::string> vgg19_style_layers() {
    return {"block1_conv1", "block2_conv1", "block3_conv1", "block4_conv1"};
}

Vgg19BackboneImpl::Vgg19BackboneImpl()
    : layers_(vgg19_encoder_layers()),
      style_layers_(vgg19_style_layers()) {

    convs_.reserve(layers_.size());
    for (auto const& layer : layers_) {
        auto conv = torch::nn::Conv2d(
            torch::nn::Conv2dOptions(layer.in_channels, layer.out_channels, 3).padding(1));
        register_module(layer.name, conv);
        convs_.push_back(conv);
    }
    freeze();
}

std::vector<torch::Tensor> Vgg19BackboneImpl::forward(torch::Tensor x) {
    std::vector<torch::Tensor> outputs;
    outputs.reserve(style_layers_.size());

    for (size_t i = 0; i < layers_.size(); ++i) {
        x = torch::relu(convs_[i]->forward(x));
        auto const& name = layers_[i].name;
        if (std::find(style_layers_.begin(), style_layers_.end(), name) != style_layers_.end()) {
            outputs.push_back(x);
        }
        if (outputs.size() == style_layers_.size()) {
            break;
        }
        if (layers_[i].pool_after) {
            x = torch::max_pool2d(x, /*kernel_size=*/2, /*stride=*/2);
        }
    }
    return outputs;
}

torch::nn::Conv2d const& Vgg19BackboneImpl::conv(std::string const& name) const {
    for (size_t i = 0; i < layers_.size(); ++i) {
        if (layers_[i].name == name) {
            return convs_[i];
        }
    }
    throw std::invalid_argument("Unknown backbone layer: " + name);
}

void Vgg19BackboneImpl::freeze() {
    for (auto& param : parameters()) {
        param.set_requires_grad(false);
    }
    eval();
}
