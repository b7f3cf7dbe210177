#pragma once

#include "backbone.hpp"

#include <cstddef>
#include <string>
#include <vector>

/// Number of wavelet pooling levels (and matching unpooling levels).
inline constexpr int kPoolDepth = 3;

enum class LayerKind { encode_conv, wavelet_pool, decode_conv, wavelet_unpool, output_conv };

struct LayerSpec {
    std::string name;              // e.g. "block1_conv2_encode", "wavelet_pool_0"
    LayerKind kind;
    int64_t in_channels;
    int64_t out_channels;
    std::string backbone_layer;    // weight source of an encode_conv, empty otherwise
    int skip_depth = -1;           // wavelet_pool / wavelet_unpool only
};

/// Typed boundaries of the staged pipeline, in execution order.
enum class StageId {
    encode_1,
    pool_1, pool_2, pool_3,
    decode_1, unpool_1,
    decode_2, unpool_2,
    decode_3, unpool_3,
    output,
};

enum class StageKind { encode, pool, decode, unpool, output };

/// A contiguous slice [first_layer, end_layer) of ModelLayout::layers.
struct StageSpec {
    StageId id;
    StageKind kind;
    size_t first_layer;
    size_t end_layer;
    int skip_depth = -1;           // pool / unpool stages only
    int64_t in_channels;
    int64_t out_channels;
};

/// Immutable description of the whole autoencoder graph.
struct ModelLayout {
    std::vector<LayerSpec> layers;
    std::vector<StageSpec> stages;
};

char const* stage_name(StageId id);
char const* layer_kind_name(LayerKind kind);

/// Build the WCT2 graph around the given backbone layers.
///
/// Encoder: one frozen copy per backbone layer; a wavelet pool follows every
/// layer the classifier max-pools after. Decoder: the backbone in reverse
/// without its first layer; the first layer of each block halves the channel
/// count and is followed by the wavelet unpool of the matching depth.
/// Finally a linear conv to image_channels.
ModelLayout build_wct2_layout(
    std::vector<BackboneLayer> const& backbone = vgg19_encoder_layers(),
    int64_t image_channels = 3);

/// Check that stages tile the layer list, channels chain, and pool depths
/// 0..kPoolDepth-1 pair with unpool depths in reverse order.
/// Throws ShapeError on channel mismatches, std::logic_error otherwise.
void validate_layout(ModelLayout const& layout);
