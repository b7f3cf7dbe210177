#pragma once

#include <torch/torch.h>

#include <vector>

/// Channel-correlation matrix of an [N, C, H, W] feature map.
/// Returns [N, C, C] = F F^T / (H * W * C) with F the [N, C, H*W] reshape.
torch::Tensor gram_matrix(torch::Tensor const& features);

/// Mean over layers of mean((gram(generated) - gram(original))^2).
/// Both lists must be non-empty, of equal length, and shape-matched per layer.
torch::Tensor gram_loss(
    std::vector<torch::Tensor> const& generated,
    std::vector<torch::Tensor> const& original);
