#include "wct2.hpp"

#include "errors.hpp"
#include "layout.hpp"

#include <iostream>
#include <utility>
#include <vector>

static Vgg19Backbone make_backbone(Wct2Config const& config) {
    if (config.seed != 0) {
        torch::manual_seed(config.seed);
    }
    Vgg19Backbone backbone;
    if (config.backbone_weights.empty()) {
        std::cout << "No backbone weights configured, using random initialization" << std::endl;
    } else {
        auto const loaded = load_weights(*backbone, config.backbone_weights);
        if (loaded.ok()) {
            std::cout << "Loaded backbone weights from " << config.backbone_weights << std::endl;
        }
        backbone->freeze();
    }
    return backbone;
}

static TrainerOptions trainer_options(Wct2Config const& config) {
    TrainerOptions options;
    options.learning_rate = config.learning_rate;
    options.gram_loss_weight = config.gram_loss_weight;
    options.show_interval = config.show_interval;
    options.weights_path = config.weights_path();
    return options;
}

Wct2::Wct2(Wct2Config config)
    : config_(std::move(config)),
      backbone_(make_backbone(config_)),
      model_(build_wct2_layout(backbone_->layers()),
             backbone_,
             make_wavelet(config_.wavelet),
             config_.odd_size_policy),
      trainer_(model_, backbone_, trainer_options(config_)),
      staged_(make_stage_plan(model_), WctOptions{.epsilon = config_.wct_epsilon}),
      default_sink_(config_.base_dir) {}

TrainHistory Wct2::train(
    BatchSource& source,
    int epochs,
    BatchSource* validation,
    ImageSink* sink) {

    return trainer_.train(source, epochs, validation, sink != nullptr ? sink : &default_sink_);
}

torch::Tensor Wct2::transfer(
    torch::Tensor const& content,
    torch::Tensor const& style,
    double alpha) const {

    return staged_.transfer(content, style, alpha);
}

torch::Tensor Wct2::show_sample(
    torch::Tensor const& content,
    torch::Tensor const& style,
    double alpha,
    ImageSink* sink) {

    auto stylized = transfer(content, style, alpha);
    auto style_panel = style;
    if (style.size(2) != content.size(2) || style.size(3) != content.size(3)) {
        namespace F = torch::nn::functional;
        style_panel = F::interpolate(
            style, F::InterpolateFuncOptions()
                       .size(std::vector<int64_t>{content.size(2), content.size(3)})
                       .mode(torch::kBilinear)
                       .align_corners(false));
    }
    auto& target = sink != nullptr ? *sink : static_cast<ImageSink&>(default_sink_);
    try {
        target.show(torch::cat({content, style_panel, stylized}));
    } catch (PersistenceError const& e) {
        std::cerr << "Could not write sample, " << e.what() << std::endl;
    }
    return stylized;
}

torch::Tensor Wct2::reconstruct(torch::Tensor const& images) {
    torch::NoGradGuard no_grad;
    model_->eval();
    return model_->forward(images).detach();
}

PersistenceResult Wct2::save_weights() const {
    return ::save_weights(*model_, config_.weights_path());
}

PersistenceResult Wct2::load_weights() {
    auto result = ::load_weights(*model_, config_.weights_path());
    model_->freeze_encoder();
    return result;
}
