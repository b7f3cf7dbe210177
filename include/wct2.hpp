#pragma once

#include <torch/torch.h>

#include "autoencoder.hpp"
#include "backbone.hpp"
#include "config.hpp"
#include "data_source.hpp"
#include "image_sink.hpp"
#include "persistence.hpp"
#include "pipeline.hpp"
#include "trainer.hpp"

/// Backbone, autoencoder, trainer and staged transfer built from one config.
class Wct2 {
public:
    explicit Wct2(Wct2Config config);

    /// Train the decoder. Samples go to sink, or to a TensorFileSink in
    /// base_dir when sink is null.
    TrainHistory train(
        BatchSource& source,
        int epochs,
        BatchSource* validation = nullptr,
        ImageSink* sink = nullptr);

    /// Stylize content with style; alpha = 1 is full style strength.
    torch::Tensor transfer(
        torch::Tensor const& content,
        torch::Tensor const& style,
        double alpha = 1.0) const;

    /// Stylize content and show content, style and result side by side on
    /// sink (the base_dir TensorFileSink when null). Style is resized to the
    /// content's height and width for the panel. Returns the stylized batch.
    torch::Tensor show_sample(
        torch::Tensor const& content,
        torch::Tensor const& style,
        double alpha = 1.0,
        ImageSink* sink = nullptr);

    /// Autoencoder reconstruction without style transfer.
    torch::Tensor reconstruct(torch::Tensor const& images);

    PersistenceResult save_weights() const;
    PersistenceResult load_weights();

    Wct2Config const& config() const { return config_; }
    Wct2Autoencoder model() const { return model_; }
    Vgg19Backbone backbone() const { return backbone_; }

private:
    Wct2Config config_;
    Vgg19Backbone backbone_;
    Wct2Autoencoder model_;
    Trainer trainer_;
    StagedTransfer staged_;
    TensorFileSink default_sink_;
};
