#include "autoencoder.hpp"

#include "errors.hpp"
#include "tensor_util.hpp"

#include <stdexcept>
#include <string>
#include <utility>

Wct2AutoencoderImpl::Wct2AutoencoderImpl(
    ModelLayout layout,
    Vgg19Backbone const& backbone,
    Wavelet wavelet,
    OddSizePolicy odd_size_policy)
    : layout_(std::move(layout)),
      wavelet_(std::move(wavelet)),
      odd_size_policy_(odd_size_policy) {

    validate_layout(layout_);

    convs_.reserve(layout_.layers.size());
    for (auto const& layer : layout_.layers) {
        if (layer.kind == LayerKind::wavelet_pool || layer.kind == LayerKind::wavelet_unpool) {
            convs_.push_back(nullptr);
            continue;
        }
        auto conv = torch::nn::Conv2d(
            torch::nn::Conv2dOptions(layer.in_channels, layer.out_channels, 3).padding(1));
        register_module(layer.name, conv);

        if (layer.kind == LayerKind::encode_conv) {
            auto const& source = backbone->conv(layer.backbone_layer);
            if (source->weight.sizes() != conv->weight.sizes()) {
                throw ShapeError(
                    "Backbone layer " + layer.backbone_layer + " has weight " +
                    shape_string(source->weight) + ", " + layer.name + " expects " +
                    shape_string(conv->weight));
            }
            torch::NoGradGuard no_grad;
            conv->weight.copy_(source->weight);
            conv->bias.copy_(source->bias);
        }
        convs_.push_back(conv);
    }
    freeze_encoder();
}

void Wct2AutoencoderImpl::freeze_encoder() {
    for (size_t i = 0; i < layout_.layers.size(); ++i) {
        if (layout_.layers[i].kind != LayerKind::encode_conv) {
            continue;
        }
        for (auto& param : convs_[i]->parameters()) {
            param.set_requires_grad(false);
        }
    }
}

std::vector<torch::Tensor> Wct2AutoencoderImpl::trainable_parameters() {
    std::vector<torch::Tensor> trainable;
    for (auto& param : parameters()) {
        if (param.requires_grad()) {
            trainable.push_back(param);
        }
    }
    return trainable;
}

torch::Tensor Wct2AutoencoderImpl::apply_conv(size_t index, torch::Tensor const& x) {
    auto y = convs_[index]->forward(x);
    if (layout_.layers[index].kind == LayerKind::output_conv) {
        return y;
    }
    return torch::relu(y);
}

StageOutput Wct2AutoencoderImpl::run_stage(
    StageSpec const& stage,
    torch::Tensor const& input,
    SkipConnection const* skip) {

    require_4d(input, stage_name(stage.id));
    if (input.size(1) != stage.in_channels) {
        throw ShapeError(
            std::string("Stage ") + stage_name(stage.id) + " expects " +
            std::to_string(stage.in_channels) + " channels, got " + shape_string(input));
    }

    StageOutput out;
    auto x = input;
    for (size_t i = stage.first_layer; i < stage.end_layer; ++i) {
        auto const& layer = layout_.layers[i];
        switch (layer.kind) {
            case LayerKind::wavelet_pool: {
                auto bands = wavelet_pool(x, wavelet_, odd_size_policy_);
                out.skip = SkipConnection{
                    .original = x,
                    .lh = std::move(bands.lh),
                    .hl = std::move(bands.hl),
                    .hh = std::move(bands.hh),
                };
                x = std::move(bands.ll);
                break;
            }
            case LayerKind::wavelet_unpool: {
                if (skip == nullptr) {
                    throw std::logic_error(layer.name + " needs the skip of depth " +
                                           std::to_string(layer.skip_depth));
                }
                x = wavelet_unpool(x, skip->lh, skip->hl, skip->hh, wavelet_, skip->original);
                break;
            }
            case LayerKind::encode_conv:
            case LayerKind::decode_conv:
            case LayerKind::output_conv:
                x = apply_conv(i, x);
                break;
        }
    }
    out.features = x;
    return out;
}

torch::Tensor Wct2AutoencoderImpl::forward(torch::Tensor const& image) {
    SkipStack skips;
    auto x = image;
    for (auto const& stage : layout_.stages) {
        SkipConnection const* skip = nullptr;
        if (stage.kind == StageKind::unpool) {
            skip = &skips.pop(stage.skip_depth);
        }
        auto out = run_stage(stage, x, skip);
        if (out.skip) {
            skips.push(stage.skip_depth, std::move(*out.skip));
        }
        x = std::move(out.features);
    }
    return x;
}
