#include "pipeline.hpp"

#include "errors.hpp"
#include "tensor_util.hpp"

#include <stdexcept>
#include <string>
#include <utility>

std::vector<Stage> make_stage_plan(Wct2Autoencoder model) {
    std::vector<Stage> plan;
    auto const& stages = model->layout().stages;
    plan.reserve(stages.size());

    for (size_t i = 0; i < stages.size(); ++i) {
        auto const& spec = stages[i];
        bool const after_unpool = i > 0 && stages[i - 1].kind == StageKind::unpool;
        bool blend_after = spec.kind != StageKind::output;
        if (spec.kind == StageKind::decode && after_unpool) {
            blend_after = false;
        }
        plan.push_back(Stage{
            .spec = spec,
            .run = [model, spec](torch::Tensor const& x, SkipConnection const* skip) mutable {
                return model->run_stage(spec, x, skip);
            },
            .blend_after = blend_after,
        });
    }
    return plan;
}

StagedTransfer::StagedTransfer(std::vector<Stage> plan, WctOptions options)
    : plan_(std::move(plan)), options_(options) {

    if (plan_.empty() || plan_.back().spec.kind != StageKind::output) {
        throw std::invalid_argument("Stage plan must end with the output stage");
    }
}

void StagedTransfer::check_stage_output(
    StageSpec const& spec,
    torch::Tensor const& content,
    torch::Tensor const& style) const {

    if (content.size(1) != spec.out_channels || style.size(1) != spec.out_channels) {
        throw ShapeError(
            std::string("Stage ") + stage_name(spec.id) + " should produce " +
            std::to_string(spec.out_channels) + " channels, got content " +
            shape_string(content) + " and style " + shape_string(style));
    }
}

/// Blend every tensor of a content skip with its style counterpart.
static SkipConnection blend_skip(
    SkipConnection const& content,
    SkipConnection const& style,
    double alpha,
    WctOptions const& options) {

    return SkipConnection{
        .original = whitening_coloring(content.original, style.original, alpha, options),
        .lh = whitening_coloring(content.lh, style.lh, alpha, options),
        .hl = whitening_coloring(content.hl, style.hl, alpha, options),
        .hh = whitening_coloring(content.hh, style.hh, alpha, options),
    };
}

torch::Tensor StagedTransfer::transfer(
    torch::Tensor const& content,
    torch::Tensor const& style,
    double alpha) const {

    if (alpha < 0.0 || alpha > 1.0) {
        throw std::invalid_argument("alpha must be in [0, 1], got " + std::to_string(alpha));
    }
    require_4d(content, "content image");
    require_4d(style, "style image");
    if (content.size(0) != style.size(0)) {
        throw ShapeError("content " + shape_string(content) + " and style " +
                         shape_string(style) + " differ in batch size");
    }

    torch::NoGradGuard no_grad;

    SkipStack content_skips;
    SkipStack style_skips;
    auto content_feat = content;
    auto style_feat = style;

    for (auto const& stage : plan_) {
        auto const& spec = stage.spec;

        if (spec.kind == StageKind::output) {
            content_feat = stage.run(content_feat, nullptr).features;
            break;
        }

        SkipConnection const* content_skip = nullptr;
        SkipConnection const* style_skip = nullptr;
        if (spec.kind == StageKind::unpool) {
            content_skip = &content_skips.pop(spec.skip_depth);
            style_skip = &style_skips.pop(spec.skip_depth);
        }

        auto content_out = stage.run(content_feat, content_skip);
        auto style_out = stage.run(style_feat, style_skip);
        check_stage_output(spec, content_out.features, style_out.features);

        if (spec.kind == StageKind::pool) {
            if (!content_out.skip || !style_out.skip) {
                throw std::logic_error(std::string("Pool stage ") + stage_name(spec.id) +
                                       " produced no skip");
            }
            content_skips.push(spec.skip_depth,
                               blend_skip(*content_out.skip, *style_out.skip, alpha, options_));
            style_skips.push(spec.skip_depth, std::move(*style_out.skip));
        }

        content_feat = std::move(content_out.features);
        style_feat = std::move(style_out.features);
        if (stage.blend_after) {
            content_feat = whitening_coloring(content_feat, style_feat, alpha, options_);
        }
    }

    return content_feat.detach().contiguous();
}
