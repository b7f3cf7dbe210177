#pragma once

#include <torch/torch.h>

#include <utility>

struct WctOptions {
    /// Diagonal regularizer added to both covariance matrices.
    double epsilon = 1e-5;
};

/// Per-channel mean [C, 1] and covariance [C, C] of a [C, N] matrix,
/// regularized by epsilon * I. Computed in double precision.
std::pair<torch::Tensor, torch::Tensor> channel_statistics(
    torch::Tensor const& features,
    double epsilon);

/// Whitening-and-coloring transform.
///
/// content and style are [N, C, H, W] with equal N and C; their spatial
/// extents may differ. For every batch item the content features are
/// whitened with their own covariance, colored with the style covariance and
/// shifted to the style mean, then blended:
///
///     alpha * colored + (1 - alpha) * content
///
/// Neither input is modified. alpha == 0 returns a copy of content.
torch::Tensor whitening_coloring(
    torch::Tensor const& content,
    torch::Tensor const& style,
    double alpha = 1.0,
    WctOptions const& options = {});
