#pragma once

#include <torch/torch.h>

#include <optional>

/// Source of normalized [B, 3, H, W] image batches for training.
class BatchSource {
public:
    virtual ~BatchSource() = default;

    /// Start a new pass over the data.
    virtual void reset() = 0;

    /// Next batch of the current pass, or nullopt once the pass is exhausted.
    virtual std::optional<torch::Tensor> next_batch() = 0;

    /// Total number of samples.
    virtual int64_t size() const = 0;

    /// A single sample as a [1, 3, H, W] batch.
    virtual torch::Tensor sample(int64_t index) const = 0;
};

/// Serves batches from an in-memory [N, 3, H, W] tensor.
class TensorBatchSource : public BatchSource {
public:
    TensorBatchSource(torch::Tensor images, int64_t batch_size, bool shuffle = true);

    void reset() override;
    std::optional<torch::Tensor> next_batch() override;
    int64_t size() const override { return images_.size(0); }
    torch::Tensor sample(int64_t index) const override;

private:
    torch::Tensor images_;
    int64_t batch_size_;
    bool shuffle_;
    torch::Tensor order_;
    int64_t cursor_ = 0;
};
