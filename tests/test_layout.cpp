#include "errors.hpp"
#include "layout.hpp"
#include "skip_stack.hpp"

#include <cassert>
#include <iostream>
#include <string>
#include <vector>

static std::vector<std::string> layer_names(ModelLayout const& layout, StageSpec const& stage) {
    std::vector<std::string> names;
    for (size_t i = stage.first_layer; i < stage.end_layer; ++i) {
        names.push_back(layout.layers[i].name);
    }
    return names;
}

// Stage order and slices of the VGG19 layout.
static void test_stage_partition() {
    auto const layout = build_wct2_layout();
    std::vector<StageId> const expected_ids = {
        StageId::encode_1, StageId::pool_1, StageId::pool_2, StageId::pool_3,
        StageId::decode_1, StageId::unpool_1, StageId::decode_2, StageId::unpool_2,
        StageId::decode_3, StageId::unpool_3, StageId::output};
    assert(layout.stages.size() == expected_ids.size());
    for (size_t i = 0; i < expected_ids.size(); ++i) {
        assert(layout.stages[i].id == expected_ids[i]);
    }

    using Names = std::vector<std::string>;
    auto const& s = layout.stages;
    assert(layer_names(layout, s[0]) == Names({"block1_conv1_encode"}));
    assert(layer_names(layout, s[1]) ==
           Names({"block1_conv2_encode", "wavelet_pool_0", "block2_conv1_encode"}));
    assert(layer_names(layout, s[2]) ==
           Names({"block2_conv2_encode", "wavelet_pool_1", "block3_conv1_encode"}));
    assert(layer_names(layout, s[3]) ==
           Names({"block3_conv2_encode", "block3_conv3_encode", "block3_conv4_encode",
                  "wavelet_pool_2", "block4_conv1_encode"}));
    assert(layer_names(layout, s[4]) == Names({"block4_conv1_decode"}));
    assert(layer_names(layout, s[5]) ==
           Names({"wavelet_unpool_2", "block3_conv4_decode", "block3_conv3_decode",
                  "block3_conv2_decode"}));
    assert(layer_names(layout, s[6]) == Names({"block3_conv1_decode"}));
    assert(layer_names(layout, s[7]) == Names({"wavelet_unpool_1", "block2_conv2_decode"}));
    assert(layer_names(layout, s[8]) == Names({"block2_conv1_decode"}));
    assert(layer_names(layout, s[9]) == Names({"wavelet_unpool_0", "block1_conv2_decode"}));
    assert(layer_names(layout, s[10]) == Names({"output"}));
    std::cout << "  test_stage_partition passed." << std::endl;
}

// Channel counts: halving convs ahead of every unpool, 3-channel output.
static void test_channels() {
    auto const layout = build_wct2_layout();
    auto const& s = layout.stages;
    assert(s[0].in_channels == 3 && s[0].out_channels == 64);
    assert(s[3].out_channels == 512);
    assert(s[4].in_channels == 512 && s[4].out_channels == 256);
    assert(s[6].in_channels == 256 && s[6].out_channels == 128);
    assert(s[8].in_channels == 128 && s[8].out_channels == 64);
    assert(s[10].in_channels == 64 && s[10].out_channels == 3);
    assert(layout.layers.back().kind == LayerKind::output_conv);
    std::cout << "  test_channels passed." << std::endl;
}

// Pool depths 0, 1, 2 pair with unpool depths 2, 1, 0.
static void test_skip_pairing() {
    auto const layout = build_wct2_layout();
    std::vector<int> pools;
    std::vector<int> unpools;
    for (auto const& stage : layout.stages) {
        if (stage.kind == StageKind::pool) pools.push_back(stage.skip_depth);
        if (stage.kind == StageKind::unpool) unpools.push_back(stage.skip_depth);
    }
    assert(pools == std::vector<int>({0, 1, 2}));
    assert(unpools == std::vector<int>({2, 1, 0}));
    for (size_t i = 0; i < pools.size(); ++i) {
        assert(pools[i] == unpools[kPoolDepth - 1 - i]);
    }
    std::cout << "  test_skip_pairing passed." << std::endl;
}

// Encoder convs name their backbone source.
static void test_backbone_sources() {
    auto const layout = build_wct2_layout();
    int encode = 0;
    for (auto const& layer : layout.layers) {
        if (layer.kind == LayerKind::encode_conv) {
            assert(layer.name == layer.backbone_layer + "_encode");
            ++encode;
        } else {
            assert(layer.backbone_layer.empty());
        }
    }
    assert(encode == 9);
    std::cout << "  test_backbone_sources passed." << std::endl;
}

// Broken layouts are rejected.
static void test_validate_rejects_gaps() {
    auto layout = build_wct2_layout();
    layout.stages.erase(layout.stages.begin() + 2);
    bool caught = false;
    try {
        validate_layout(layout);
    } catch (std::logic_error const&) {
        caught = true;
    }
    assert(caught);

    layout = build_wct2_layout();
    layout.layers[13].in_channels = 128;   // wavelet_unpool_2
    layout.layers[13].out_channels = 128;
    caught = false;
    try {
        validate_layout(layout);
    } catch (ShapeError const&) {
        caught = true;
    }
    assert(caught);
    std::cout << "  test_validate_rejects_gaps passed." << std::endl;
}

static void test_stage_names() {
    assert(std::string(stage_name(StageId::pool_2)) == "pool_2");
    assert(std::string(stage_name(StageId::unpool_3)) == "unpool_3");
    assert(std::string(layer_kind_name(LayerKind::wavelet_unpool)) == "wavelet_unpool");
    std::cout << "  test_stage_names passed." << std::endl;
}

// --- SkipStack tests ---

static SkipConnection skip_of_size(int64_t size) {
    auto t = torch::zeros({1, 1, size, size});
    return SkipConnection{.original = t, .lh = t, .hl = t, .hh = t};
}

// Last pushed, first popped; each pop returns the matching push.
static void test_skip_stack_lifo() {
    SkipStack stack;
    stack.push(0, skip_of_size(8));
    stack.push(1, skip_of_size(4));
    stack.push(2, skip_of_size(2));
    assert(stack.full());
    assert(stack.size() == 3);

    assert(stack.pop(2).lh.size(2) == 2);
    assert(stack.pop(1).lh.size(2) == 4);
    assert(stack.pop(0).lh.size(2) == 8);
    assert(stack.size() == 0);
    std::cout << "  test_skip_stack_lifo passed." << std::endl;
}

static void test_skip_stack_order_errors() {
    SkipStack stack;
    bool caught = false;
    try {
        stack.push(1, skip_of_size(4));
    } catch (std::logic_error const&) {
        caught = true;
    }
    assert(caught);

    stack.push(0, skip_of_size(8));
    stack.push(1, skip_of_size(4));
    caught = false;
    try {
        stack.pop(0);   // depth 1 must come first
    } catch (std::logic_error const&) {
        caught = true;
    }
    assert(caught);

    stack.pop(1);
    caught = false;
    try {
        stack.push(2, skip_of_size(2));   // no pushes once popping started
    } catch (std::logic_error const&) {
        caught = true;
    }
    assert(caught);
    std::cout << "  test_skip_stack_order_errors passed." << std::endl;
}

int main() {
    std::cout << "Layout tests:" << std::endl;
    test_stage_partition();
    test_channels();
    test_skip_pairing();
    test_backbone_sources();
    test_validate_rejects_gaps();
    test_stage_names();

    std::cout << "SkipStack tests:" << std::endl;
    test_skip_stack_lifo();
    test_skip_stack_order_errors();

    std::cout << "All layout tests passed." << std::endl;
    return 0;
}
