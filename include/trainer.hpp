#pragma once

#include <torch/torch.h>

#include <string>
#include <vector>

#include "autoencoder.hpp"
#include "backbone.hpp"
#include "data_source.hpp"
#include "image_sink.hpp"

struct TrainHistory {
    std::vector<double> loss;       // mean training loss per epoch
    std::vector<double> val_loss;   // mean validation loss per epoch, 0 without validation data
};

struct TrainerOptions {
    double learning_rate = 1e-4;
    double gram_loss_weight = 1.0;
    int show_interval = 25;         // save and sample when epoch % show_interval == 0
    std::string weights_path;       // empty: never save
};

/// Trains the decoder of a Wct2Autoencoder to reconstruct its input.
/// Loss = MSE(reconstruction, input)
///      + gram_loss_weight * gram_loss(backbone(reconstruction), backbone(input)).
class Trainer {
public:
    Trainer(Wct2Autoencoder model, Vgg19Backbone backbone, TrainerOptions options);

    /// Scalar training loss of one batch, with gradients to the decoder.
    torch::Tensor compute_loss(torch::Tensor const& images);

    /// One optimizer step on a batch. Returns the loss before the step.
    double train_step(torch::Tensor const& images);

    /// Mean loss over one pass of source, without gradients.
    double evaluate(BatchSource& source);

    TrainHistory train(
        BatchSource& source,
        int epochs,
        BatchSource* validation = nullptr,
        ImageSink* sink = nullptr);

private:
    void emit_sample(BatchSource& source, ImageSink& sink);

    Wct2Autoencoder model_;
    Vgg19Backbone backbone_;
    TrainerOptions options_;
    torch::optim::Adam optimizer_;
};
