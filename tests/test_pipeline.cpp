#include "autoencoder.hpp"
#include "backbone.hpp"
#include "errors.hpp"
#include "layout.hpp"
#include "pipeline.hpp"
#include "test_util.hpp"

#include <cassert>
#include <iostream>

static Wct2Autoencoder make_model() {
    Vgg19Backbone backbone;
    auto model = Wct2Autoencoder(build_wct2_layout(), backbone);
    model->eval();
    return model;
}

// Eleven stages; no blend after the output or after a decode that follows an unpool.
static void test_stage_plan() {
    auto plan = make_stage_plan(make_model());
    assert(plan.size() == 11);
    for (auto const& stage : plan) {
        bool const expect_blend = stage.spec.id != StageId::decode_2 &&
                                  stage.spec.id != StageId::decode_3 &&
                                  stage.spec.id != StageId::output;
        assert(stage.blend_after == expect_blend);
    }
    assert(plan.front().spec.id == StageId::encode_1);
    assert(plan.back().spec.id == StageId::output);
    std::cout << "  test_stage_plan passed." << std::endl;
}

// alpha = 0 leaves every feature untouched, so transfer reduces to reconstruction.
static void test_zero_alpha_is_reconstruction() {
    auto model = make_model();
    StagedTransfer staged(make_stage_plan(model));
    auto content = torch::randn({1, 3, 32, 32});
    auto style = torch::randn({1, 3, 32, 32});

    auto out = staged.transfer(content, style, 0.0);
    torch::Tensor expected;
    {
        torch::NoGradGuard no_grad;
        expected = model->forward(content);
    }
    assert_close(out, expected, 1e-5, "alpha 0 transfer");
    std::cout << "  test_zero_alpha_is_reconstruction passed." << std::endl;
}

static void test_full_transfer() {
    auto model = make_model();
    StagedTransfer staged(make_stage_plan(model));
    auto content = torch::randn({2, 3, 64, 64});
    auto style = torch::randn({2, 3, 48, 64});
    auto const content_copy = content.clone();
    auto const style_copy = style.clone();

    auto out = staged.transfer(content, style, 1.0);
    assert(out.sizes() == torch::IntArrayRef({2, 3, 64, 64}));
    assert(torch::isfinite(out).all().item<bool>());
    assert(!out.requires_grad());
    assert(out.is_contiguous());

    // Inputs are left as they were.
    assert(torch::equal(content, content_copy));
    assert(torch::equal(style, style_copy));

    // Style strength changes the result.
    auto half = staged.transfer(content, style, 0.5);
    assert(max_abs_diff(out, half) > 0.0);
    std::cout << "  test_full_transfer passed." << std::endl;
}

static void test_transfer_errors() {
    StagedTransfer staged(make_stage_plan(make_model()));
    auto image = torch::randn({1, 3, 32, 32});

    bool caught = false;
    try {
        staged.transfer(image, image, 1.5);
    } catch (std::invalid_argument const&) {
        caught = true;
    }
    assert(caught);

    caught = false;
    try {
        staged.transfer(image, torch::randn({2, 3, 32, 32}), 1.0);
    } catch (ShapeError const&) {
        caught = true;
    }
    assert(caught);

    caught = false;
    try {
        staged.transfer(torch::randn({1, 4, 32, 32}), torch::randn({1, 4, 32, 32}), 1.0);
    } catch (ShapeError const&) {
        caught = true;
    }
    assert(caught);

    auto plan = make_stage_plan(make_model());
    plan.pop_back();
    caught = false;
    try {
        StagedTransfer truncated(plan);
    } catch (std::invalid_argument const&) {
        caught = true;
    }
    assert(caught);
    std::cout << "  test_transfer_errors passed." << std::endl;
}

int main() {
    torch::manual_seed(0);

    std::cout << "Staged transfer tests:" << std::endl;
    test_stage_plan();
    test_zero_alpha_is_reconstruction();
    test_full_transfer();
    test_transfer_errors();

    std::cout << "All pipeline tests passed." << std::endl;
    return 0;
}
