#include "layout.hpp"

#include "errors.hpp"

#include <array>
#include <stdexcept>
#include <string>

char const* stage_name(StageId id) {
    switch (id) {
        case StageId::encode_1: return "encode_1";
        case StageId::pool_1: return "pool_1";
        case StageId::pool_2: return "pool_2";
        case StageId::pool_3: return "pool_3";
        case StageId::decode_1: return "decode_1";
        case StageId::unpool_1: return "unpool_1";
        case StageId::decode_2: return "decode_2";
        case StageId::unpool_2: return "unpool_2";
        case StageId::decode_3: return "decode_3";
        case StageId::unpool_3: return "unpool_3";
        case StageId::output: return "output";
    }
    throw std::logic_error("Invalid StageId");
}

char const* layer_kind_name(LayerKind kind) {
    switch (kind) {
        case LayerKind::encode_conv: return "encode_conv";
        case LayerKind::wavelet_pool: return "wavelet_pool";
        case LayerKind::decode_conv: return "decode_conv";
        case LayerKind::wavelet_unpool: return "wavelet_unpool";
        case LayerKind::output_conv: return "output_conv";
    }
    throw std::logic_error("Invalid LayerKind");
}

// ========================== Layer list ==========================

static std::vector<LayerSpec> build_layers(
    std::vector<BackboneLayer> const& backbone,
    int64_t image_channels) {

    if (backbone.size() < 2) {
        throw std::invalid_argument("Backbone needs at least two layers");
    }

    std::vector<LayerSpec> layers;
    std::vector<int64_t> pooled_channels;

    // Encoder
    for (auto const& layer : backbone) {
        layers.push_back(LayerSpec{
            .name = layer.name + "_encode",
            .kind = LayerKind::encode_conv,
            .in_channels = layer.in_channels,
            .out_channels = layer.out_channels,
            .backbone_layer = layer.name,
        });
        if (layer.pool_after) {
            int const depth = static_cast<int>(pooled_channels.size());
            layers.push_back(LayerSpec{
                .name = "wavelet_pool_" + std::to_string(depth),
                .kind = LayerKind::wavelet_pool,
                .in_channels = layer.out_channels,
                .out_channels = layer.out_channels,
                .skip_depth = depth,
            });
            pooled_channels.push_back(layer.out_channels);
        }
    }
    if (backbone.back().pool_after) {
        throw std::invalid_argument("Backbone must not end with a pooling layer");
    }

    // Decoder: reversed backbone without its first layer. A layer whose
    // predecessor pools is the first of its block and mirrors that pool.
    int64_t channels = backbone.back().out_channels;
    int skip_depth = static_cast<int>(pooled_channels.size()) - 1;
    for (size_t i = backbone.size() - 1; i >= 1; --i) {
        auto const& layer = backbone[i];
        if (backbone[i - 1].pool_after) {
            int64_t const halved = layer.out_channels / 2;
            layers.push_back(LayerSpec{
                .name = layer.name + "_decode",
                .kind = LayerKind::decode_conv,
                .in_channels = channels,
                .out_channels = halved,
            });
            layers.push_back(LayerSpec{
                .name = "wavelet_unpool_" + std::to_string(skip_depth),
                .kind = LayerKind::wavelet_unpool,
                .in_channels = halved,
                .out_channels = halved,
                .skip_depth = skip_depth,
            });
            --skip_depth;
            channels = halved;
        } else {
            layers.push_back(LayerSpec{
                .name = layer.name + "_decode",
                .kind = LayerKind::decode_conv,
                .in_channels = channels,
                .out_channels = layer.out_channels,
            });
            channels = layer.out_channels;
        }
    }

    layers.push_back(LayerSpec{
        .name = "output",
        .kind = LayerKind::output_conv,
        .in_channels = channels,
        .out_channels = image_channels,
    });
    return layers;
}

// ========================== Stage partition ==========================

static StageSpec make_stage(
    std::vector<LayerSpec> const& layers,
    StageId id,
    StageKind kind,
    size_t first,
    size_t end,
    int skip_depth) {

    return StageSpec{
        .id = id,
        .kind = kind,
        .first_layer = first,
        .end_layer = end,
        .skip_depth = skip_depth,
        .in_channels = layers[first].in_channels,
        .out_channels = layers[end - 1].out_channels,
    };
}

static bool starts_decode_stage(std::vector<LayerSpec> const& layers, size_t i) {
    return layers[i].kind == LayerKind::decode_conv &&
           i + 1 < layers.size() &&
           layers[i + 1].kind == LayerKind::wavelet_unpool;
}

/// Cut the layer list where WCT is injected:
///   encode_1: the first conv.
///   pool_n:   up to and including the wavelet pool plus the conv after it.
///   decode_n: the channel-halving conv in front of an unpool.
///   unpool_n: the unpool and the convs up to the next decode stage.
///   output:   the final conv.
static std::vector<StageSpec> partition_stages(std::vector<LayerSpec> const& layers) {
    static constexpr std::array<StageId, kPoolDepth> pool_ids = {
        StageId::pool_1, StageId::pool_2, StageId::pool_3};
    static constexpr std::array<StageId, kPoolDepth> decode_ids = {
        StageId::decode_1, StageId::decode_2, StageId::decode_3};
    static constexpr std::array<StageId, kPoolDepth> unpool_ids = {
        StageId::unpool_1, StageId::unpool_2, StageId::unpool_3};

    std::vector<StageSpec> stages;
    size_t const n = layers.size();
    size_t decoder_start = 0;
    while (decoder_start < n && (layers[decoder_start].kind == LayerKind::encode_conv ||
                                 layers[decoder_start].kind == LayerKind::wavelet_pool)) {
        ++decoder_start;
    }

    stages.push_back(make_stage(layers, StageId::encode_1, StageKind::encode, 0, 1, -1));

    size_t i = 1;
    size_t pools = 0;
    while (i < decoder_start) {
        size_t pool = i;
        while (pool < decoder_start && layers[pool].kind != LayerKind::wavelet_pool) {
            ++pool;
        }
        if (pool == decoder_start) {
            // Trailing encoder convs after the last pool join the last stage.
            if (stages.back().kind != StageKind::pool) {
                throw std::logic_error("Encoder has no wavelet pool");
            }
            stages.back() = make_stage(layers, stages.back().id, StageKind::pool,
                                       stages.back().first_layer, decoder_start,
                                       stages.back().skip_depth);
            break;
        }
        if (pool + 1 >= decoder_start || layers[pool + 1].kind != LayerKind::encode_conv) {
            throw std::logic_error("Wavelet pool " + layers[pool].name + " must be followed by a conv");
        }
        if (pools >= pool_ids.size()) {
            throw std::logic_error("Too many wavelet pools for a depth-" +
                                   std::to_string(kPoolDepth) + " pipeline");
        }
        stages.push_back(make_stage(layers, pool_ids[pools], StageKind::pool, i, pool + 2,
                                    layers[pool].skip_depth));
        ++pools;
        i = pool + 2;
    }

    size_t decodes = 0;
    size_t unpools = 0;
    i = decoder_start;
    while (i < n) {
        auto const& layer = layers[i];
        if (starts_decode_stage(layers, i)) {
            if (decodes >= decode_ids.size()) {
                throw std::logic_error("Too many decode stages");
            }
            stages.push_back(make_stage(layers, decode_ids[decodes], StageKind::decode,
                                        i, i + 1, -1));
            ++decodes;
            i += 1;
        } else if (layer.kind == LayerKind::wavelet_unpool) {
            if (unpools >= unpool_ids.size()) {
                throw std::logic_error("Too many unpool stages");
            }
            size_t end = i + 1;
            while (end < n && layers[end].kind == LayerKind::decode_conv &&
                   !starts_decode_stage(layers, end)) {
                ++end;
            }
            stages.push_back(make_stage(layers, unpool_ids[unpools], StageKind::unpool,
                                        i, end, layer.skip_depth));
            ++unpools;
            i = end;
        } else if (layer.kind == LayerKind::output_conv) {
            stages.push_back(make_stage(layers, StageId::output, StageKind::output,
                                        i, i + 1, -1));
            i += 1;
        } else {
            throw std::logic_error("Cannot place layer " + layer.name + " in a stage");
        }
    }
    return stages;
}

ModelLayout build_wct2_layout(
    std::vector<BackboneLayer> const& backbone,
    int64_t image_channels) {

    ModelLayout layout;
    layout.layers = build_layers(backbone, image_channels);
    layout.stages = partition_stages(layout.layers);
    validate_layout(layout);
    return layout;
}

// ========================== Validation ==========================

void validate_layout(ModelLayout const& layout) {
    auto const& layers = layout.layers;
    auto const& stages = layout.stages;
    if (layers.empty() || stages.empty()) {
        throw std::logic_error("Layout has no layers or no stages");
    }

    // Stages tile [0, layers.size()) in order, without gaps or overlaps.
    size_t cursor = 0;
    for (auto const& stage : stages) {
        if (stage.first_layer != cursor || stage.end_layer <= stage.first_layer) {
            throw std::logic_error(std::string("Stage ") + stage_name(stage.id) +
                                   " does not start where the previous stage ended");
        }
        cursor = stage.end_layer;
    }
    if (cursor != layers.size()) {
        throw std::logic_error("Stages do not cover the final layers");
    }

    for (size_t i = 1; i < layers.size(); ++i) {
        if (layers[i].in_channels != layers[i - 1].out_channels) {
            throw ShapeError(
                layers[i].name + " expects " + std::to_string(layers[i].in_channels) +
                " channels but " + layers[i - 1].name + " produces " +
                std::to_string(layers[i - 1].out_channels));
        }
    }

    // Pools push depths 0, 1, 2; unpools pop 2, 1, 0 with matching channels.
    std::vector<int64_t> pushed;
    int popped = 0;
    for (auto const& layer : layers) {
        if (layer.kind == LayerKind::wavelet_pool) {
            if (popped != 0 || layer.skip_depth != static_cast<int>(pushed.size())) {
                throw std::logic_error("Wavelet pool " + layer.name + " is out of order");
            }
            pushed.push_back(layer.out_channels);
        } else if (layer.kind == LayerKind::wavelet_unpool) {
            int const expected = static_cast<int>(pushed.size()) - 1 - popped;
            if (layer.skip_depth != expected || expected < 0) {
                throw std::logic_error("Wavelet unpool " + layer.name +
                                       " does not pair with the most recent pool");
            }
            if (layer.in_channels != pushed[expected]) {
                throw ShapeError(
                    layer.name + " receives " + std::to_string(layer.in_channels) +
                    " channels but its skip carries " + std::to_string(pushed[expected]));
            }
            ++popped;
        }
    }
    if (pushed.size() != static_cast<size_t>(kPoolDepth) || popped != kPoolDepth) {
        throw std::logic_error("Layout must have exactly " + std::to_string(kPoolDepth) +
                               " pool/unpool pairs");
    }
}
