#include "trainer.hpp"

#include "errors.hpp"
#include "gram.hpp"
#include "persistence.hpp"

#include <chrono>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>

Trainer::Trainer(Wct2Autoencoder model, Vgg19Backbone backbone, TrainerOptions options)
    : model_(std::move(model)),
      backbone_(std::move(backbone)),
      options_(std::move(options)),
      optimizer_(model_->trainable_parameters(),
                 torch::optim::AdamOptions(options_.learning_rate)) {

    if (options_.show_interval < 1) {
        throw std::invalid_argument(
            "show_interval must be >= 1, got " + std::to_string(options_.show_interval));
    }
    backbone_->freeze();
}

torch::Tensor Trainer::compute_loss(torch::Tensor const& images) {
    auto reconstructed = model_->forward(images);
    auto loss = torch::mse_loss(reconstructed, images);

    if (options_.gram_loss_weight != 0.0) {
        std::vector<torch::Tensor> original_feats;
        {
            torch::NoGradGuard no_grad;
            original_feats = backbone_->forward(images);
        }
        auto generated_feats = backbone_->forward(reconstructed);
        loss = loss + options_.gram_loss_weight * gram_loss(generated_feats, original_feats);
    }
    return loss;
}

double Trainer::train_step(torch::Tensor const& images) {
    optimizer_.zero_grad();
    auto loss = compute_loss(images);
    loss.backward();
    optimizer_.step();
    return loss.item<double>();
}

double Trainer::evaluate(BatchSource& source) {
    torch::NoGradGuard no_grad;
    source.reset();
    double total = 0.0;
    int64_t batches = 0;
    while (auto batch = source.next_batch()) {
        total += compute_loss(*batch).item<double>();
        ++batches;
    }
    return batches > 0 ? total / static_cast<double>(batches) : 0.0;
}

void Trainer::emit_sample(BatchSource& source, ImageSink& sink) {
    torch::NoGradGuard no_grad;
    int64_t const index = torch::randint(source.size(), {1}, torch::kLong).item<int64_t>();
    auto image = source.sample(index);
    auto generated = model_->forward(image);
    try {
        sink.show(torch::cat({image, generated}));
    } catch (PersistenceError const& e) {
        std::cerr << "Could not write sample, " << e.what() << std::endl;
    }
}

TrainHistory Trainer::train(
    BatchSource& source,
    int epochs,
    BatchSource* validation,
    ImageSink* sink) {

    if (epochs < 0) {
        throw std::invalid_argument("epochs must be >= 0, got " + std::to_string(epochs));
    }
    if (source.size() == 0) {
        throw std::invalid_argument("Training source is empty");
    }

    TrainHistory history;
    std::cout << "Train on " << source.size() << " samples" << std::endl;

    for (int e = 0; e < epochs; ++e) {
        auto const start_time = std::chrono::steady_clock::now();
        std::cout << "Train epochs " << (e + 1) << "/" << epochs << " - " << std::flush;

        model_->train();
        source.reset();
        double total = 0.0;
        int64_t batches = 0;
        while (auto batch = source.next_batch()) {
            total += train_step(*batch);
            ++batches;
        }
        double const mean_loss = batches > 0 ? total / static_cast<double>(batches) : 0.0;

        model_->eval();
        double const mean_val_loss = validation != nullptr ? evaluate(*validation) : 0.0;

        history.loss.push_back(mean_loss);
        history.val_loss.push_back(mean_val_loss);

        auto const elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time);
        std::cout << "Loss: " << mean_loss << ", Val Loss: " << mean_val_loss
                  << " - " << elapsed.count() << "ms" << std::endl;

        if (e % options_.show_interval == 0) {
            if (!options_.weights_path.empty()) {
                auto const saved = save_weights(*model_, options_.weights_path);
                if (!saved.ok()) {
                    std::cerr << "Continuing without a checkpoint for epoch " << (e + 1) << std::endl;
                }
            }
            if (sink != nullptr) {
                emit_sample(source, *sink);
            }
        }
    }
    return history;
}
