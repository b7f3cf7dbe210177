#include "autoencoder.hpp"
#include "backbone.hpp"
#include "config.hpp"
#include "data_source.hpp"
#include "image_sink.hpp"
#include "layout.hpp"
#include "trainer.hpp"
#include "wct2.hpp"
#include "test_util.hpp"

#include <cassert>
#include <cmath>
#include <filesystem>
#include <iostream>
#include <set>
#include <vector>

/// Keeps every batch it is shown.
class RecordingSink : public ImageSink {
public:
    void show(torch::Tensor const& images) override { shown.push_back(images.clone()); }

    std::vector<torch::Tensor> shown;
};

static torch::Tensor constant_images(int64_t n, int64_t size) {
    auto values = torch::linspace(-1.0, 1.0, n).view({n, 1, 1, 1});
    return values.expand({n, 3, size, size}).contiguous();
}

// --- Batch source tests ---

static void test_batch_source_covers_every_sample() {
    auto images = torch::arange(5, torch::kFloat32).view({5, 1, 1, 1}).expand({5, 3, 2, 2}).contiguous();
    TensorBatchSource source(images, 2);
    assert(source.size() == 5);

    for (int pass = 0; pass < 2; ++pass) {
        source.reset();
        std::vector<int64_t> batch_sizes;
        std::set<int> seen;
        while (auto batch = source.next_batch()) {
            batch_sizes.push_back(batch->size(0));
            for (int64_t i = 0; i < batch->size(0); ++i) {
                seen.insert(static_cast<int>((*batch)[i][0][0][0].item<float>()));
            }
        }
        assert((batch_sizes == std::vector<int64_t>{2, 2, 1}));
        assert(seen.size() == 5);
    }

    auto sample = source.sample(3);
    assert(sample.sizes() == torch::IntArrayRef({1, 3, 2, 2}));
    assert(sample[0][0][0][0].item<float>() == 3.0f);
    std::cout << "  test_batch_source_covers_every_sample passed." << std::endl;
}

static void test_batch_source_in_order() {
    auto images = torch::arange(4, torch::kFloat32).view({4, 1, 1, 1}).expand({4, 3, 1, 1}).contiguous();
    TensorBatchSource source(images, 3, /*shuffle=*/false);
    auto first = source.next_batch();
    assert(first.has_value());
    assert(torch::equal(*first, images.slice(0, 0, 3)));
    auto second = source.next_batch();
    assert(second.has_value() && second->size(0) == 1);
    assert(!source.next_batch().has_value());

    bool caught = false;
    try {
        source.sample(4);
    } catch (std::out_of_range const&) {
        caught = true;
    }
    assert(caught);

    caught = false;
    try {
        TensorBatchSource empty_batches(images, 0);
    } catch (std::invalid_argument const&) {
        caught = true;
    }
    assert(caught);
    std::cout << "  test_batch_source_in_order passed." << std::endl;
}

// --- Trainer tests ---

static void test_training_loop() {
    auto const dir = scratch_dir("trainer");
    Vgg19Backbone backbone;
    Wct2Autoencoder model(build_wct2_layout(), backbone);
    auto const encoder_before = model->named_parameters()["block1_conv1_encode.weight"].clone();
    auto const decoder_before = model->named_parameters()["output.weight"].clone();

    TrainerOptions options;
    options.learning_rate = 1e-4;
    options.show_interval = 2;
    options.weights_path = dir + "/wct2.pt";
    Trainer trainer(model, backbone, options);

    TensorBatchSource source(constant_images(4, 32), 2);
    TensorBatchSource validation(constant_images(2, 32), 2, /*shuffle=*/false);
    RecordingSink sink;

    int const epochs = 3;
    auto history = trainer.train(source, epochs, &validation, &sink);
    assert(history.loss.size() == static_cast<size_t>(epochs));
    assert(history.val_loss.size() == static_cast<size_t>(epochs));
    for (int e = 0; e < epochs; ++e) {
        assert(std::isfinite(history.loss[e]) && history.loss[e] > 0.0);
        assert(std::isfinite(history.val_loss[e]) && history.val_loss[e] > 0.0);
    }
    assert(history.loss.back() < history.loss.front() * 2.0);

    // Samples and checkpoints at epochs 0 and 2.
    assert(sink.shown.size() == 2);
    assert(sink.shown[0].sizes() == torch::IntArrayRef({2, 3, 32, 32}));
    assert(std::filesystem::exists(options.weights_path));

    auto params = model->named_parameters();
    assert(torch::equal(params["block1_conv1_encode.weight"], encoder_before));
    assert(!torch::equal(params["output.weight"], decoder_before));
    std::cout << "  test_training_loop passed." << std::endl;
}

static void test_training_without_gram_loss() {
    Vgg19Backbone backbone;
    Wct2Autoencoder model(build_wct2_layout(), backbone);
    TrainerOptions options;
    options.gram_loss_weight = 0.0;
    Trainer trainer(model, backbone, options);

    auto images = constant_images(2, 16);
    torch::Tensor expected;
    {
        torch::NoGradGuard no_grad;
        expected = torch::mse_loss(model->forward(images), images);
    }
    double const loss = trainer.train_step(images);
    assert(std::abs(loss - expected.item<double>()) < 1e-6);

    TensorBatchSource source(images, 2);
    auto history = trainer.train(source, 1);
    assert(history.val_loss.size() == 1 && history.val_loss[0] == 0.0);
    std::cout << "  test_training_without_gram_loss passed." << std::endl;
}

static void test_trainer_rejects_bad_options() {
    Vgg19Backbone backbone;
    Wct2Autoencoder model(build_wct2_layout(), backbone);
    TrainerOptions options;
    options.show_interval = 0;
    bool caught = false;
    try {
        Trainer trainer(model, backbone, options);
    } catch (std::invalid_argument const&) {
        caught = true;
    }
    assert(caught);
    std::cout << "  test_trainer_rejects_bad_options passed." << std::endl;
}

// --- Facade tests ---

static void test_facade_train_and_reload() {
    Wct2Config config;
    config.base_dir = scratch_dir("facade");
    config.seed = 7;
    config.batch_size = 2;

    Wct2 first(config);
    assert(first.load_weights().status == PersistenceStatus::not_found);

    TensorBatchSource source(constant_images(2, 32), config.batch_size);
    auto history = first.train(source, 1);
    assert(history.loss.size() == 1);

    // Epoch 0 writes a checkpoint and a sample into base_dir.
    assert(std::filesystem::exists(config.weights_path()));
    assert(std::filesystem::exists(config.base_dir + "/sample_0.pt"));

    auto const content = constant_images(1, 32);
    auto const style = torch::randn({1, 3, 32, 32});
    auto stylized = first.transfer(content, style, 1.0);
    assert(stylized.sizes() == content.sizes());
    assert(torch::isfinite(stylized).all().item<bool>());

    Wct2 second(config);
    assert(second.load_weights().ok());
    assert(second.model()->trainable_parameters().size() ==
           first.model()->trainable_parameters().size());
    assert_close(second.reconstruct(content), first.reconstruct(content), 1e-6, "reloaded reconstruction");
    std::cout << "  test_facade_train_and_reload passed." << std::endl;
}

// Content, resized style and result go to the sink as one batch.
static void test_facade_show_sample() {
    Wct2Config config;
    config.base_dir = scratch_dir("facade_sample");
    Wct2 wct2(config);
    RecordingSink sink;

    auto const content = constant_images(2, 32);
    auto const style = torch::randn({2, 3, 48, 40});
    auto stylized = wct2.show_sample(content, style, 0.0, &sink);
    assert(stylized.sizes() == content.sizes());
    assert_close(stylized, wct2.reconstruct(content), 1e-5, "alpha 0 sample");

    assert(sink.shown.size() == 1);
    auto const& panel = sink.shown[0];
    assert(panel.sizes() == torch::IntArrayRef({6, 3, 32, 32}));
    assert(torch::equal(panel.slice(0, 0, 2), content));
    assert(torch::equal(panel.slice(0, 4, 6), stylized));

    // Without a sink the panel lands in base_dir.
    wct2.show_sample(content, style);
    assert(std::filesystem::exists(config.base_dir + "/sample_0.pt"));
    std::cout << "  test_facade_show_sample passed." << std::endl;
}

int main() {
    torch::manual_seed(0);

    std::cout << "Batch source tests:" << std::endl;
    test_batch_source_covers_every_sample();
    test_batch_source_in_order();

    std::cout << "Trainer tests:" << std::endl;
    test_training_loop();
    test_training_without_gram_loss();
    test_trainer_rejects_bad_options();

    std::cout << "Wct2 facade tests:" << std::endl;
    test_facade_train_and_reload();
    test_facade_show_sample();

    std::cout << "All trainer tests passed." << std::endl;
    return 0;
}
