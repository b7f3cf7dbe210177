#pragma once

#include <torch/torch.h>

#include <functional>
#include <vector>

#include "autoencoder.hpp"
#include "layout.hpp"
#include "skip_stack.hpp"
#include "wct.hpp"

/// One entry of the stage plan: the slice it covers, the callable that runs
/// it, and whether the content stream is blended with WCT afterwards.
struct Stage {
    using Function = std::function<StageOutput(torch::Tensor const&, SkipConnection const*)>;

    StageSpec spec;
    Function run;
    bool blend_after;
};

/// Build the ordered stage plan for a trained autoencoder. The plan shares
/// the model's weights. Every stage except the output blends afterwards,
/// with one exception: a decode stage right after an unpool does not.
std::vector<Stage> make_stage_plan(Wct2Autoencoder model);

/// Two-stream style transfer over a stage plan.
class StagedTransfer {
public:
    explicit StagedTransfer(std::vector<Stage> plan, WctOptions options = {});

    /// Stylize content with the statistics of style. Both are
    /// [N, 3, H, W] normalized images with equal N. Returns a concrete
    /// [N, 3, H, W] tensor detached from any graph.
    torch::Tensor transfer(
        torch::Tensor const& content,
        torch::Tensor const& style,
        double alpha = 1.0) const;

    std::vector<Stage> const& plan() const { return plan_; }

private:
    void check_stage_output(
        StageSpec const& spec,
        torch::Tensor const& content,
        torch::Tensor const& style) const;

    std::vector<Stage> plan_;
    WctOptions options_;
};
