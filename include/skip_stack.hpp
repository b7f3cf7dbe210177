#pragma once

#include "layout.hpp"

#include <torch/torch.h>

#include <array>

/// What one wavelet pool leaves behind for its matching unpool: the three
/// high-frequency sub-bands plus the pre-pooling feature map, which fixes the
/// unpooled height and width.
struct SkipConnection {
    torch::Tensor original;
    torch::Tensor lh;
    torch::Tensor hl;
    torch::Tensor hh;
};

/// Fixed-depth skip storage. Pools store depths 0, 1, ... in order; unpools
/// read the deepest unread depth first. Any other access order throws
/// std::logic_error, so a skip can never reach the wrong decoder depth.
class SkipStack {
public:
    void push(int depth, SkipConnection skip);

    /// Skip for the unpool at the given depth. It must be the most recently
    /// pushed depth that has not been consumed yet.
    SkipConnection const& pop(int depth);

    int size() const { return pushed_ - popped_; }
    bool full() const { return pushed_ == kPoolDepth; }

private:
    std::array<SkipConnection, kPoolDepth> slots_;
    int pushed_ = 0;
    int popped_ = 0;
};
