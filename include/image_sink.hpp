#pragma once

#include <torch/torch.h>

#include <string>

/// ImageNet channel statistics used to normalize model inputs.
inline constexpr double kImageMean[3] = {0.485, 0.456, 0.406};
inline constexpr double kImageStd[3] = {0.229, 0.224, 0.225};

/// Map [N, 3, H, W] unit-range RGB to model-normalized space.
torch::Tensor normalize(torch::Tensor const& images);

/// Reverse normalize().
torch::Tensor denormalize(torch::Tensor const& images);

/// Clamp to [0, 1], scale to uint8 and reorder to [N, H, W, 3].
torch::Tensor deprocess(torch::Tensor const& images);

/// Receives model-space images for display. Nothing is returned.
class ImageSink {
public:
    virtual ~ImageSink() = default;
    virtual void show(torch::Tensor const& images) = 0;
};

/// Writes denormalized, deprocessed images to "<directory>/<prefix>_<n>.pt".
class TensorFileSink : public ImageSink {
public:
    TensorFileSink(std::string directory, std::string prefix = "sample");

    void show(torch::Tensor const& images) override;

    int count() const { return count_; }
    std::string last_path() const { return last_path_; }

private:
    std::string directory_;
    std::string prefix_;
    int count_ = 0;
    std::string last_path_;
};
