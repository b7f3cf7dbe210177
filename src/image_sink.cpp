#include "image_sink.hpp"

#include "errors.hpp"
#include "tensor_io.hpp"
#include "tensor_util.hpp"

#include <iostream>
#include <utility>

static torch::Tensor channel_tensor(double const (&values)[3], torch::Tensor const& like) {
    return torch::tensor({values[0], values[1], values[2]}, like.options()).view({1, 3, 1, 1});
}

static void require_rgb(torch::Tensor const& images, char const* what) {
    require_4d(images, what);
    if (images.size(1) != 3) {
        throw ShapeError(std::string(what) + " needs 3 channels, got " + shape_string(images));
    }
}

torch::Tensor normalize(torch::Tensor const& images) {
    require_rgb(images, "normalize input");
    return (images - channel_tensor(kImageMean, images)) / channel_tensor(kImageStd, images);
}

torch::Tensor denormalize(torch::Tensor const& images) {
    require_rgb(images, "denormalize input");
    return images * channel_tensor(kImageStd, images) + channel_tensor(kImageMean, images);
}

torch::Tensor deprocess(torch::Tensor const& images) {
    require_rgb(images, "deprocess input");
    return (images.clamp(0.0, 1.0) * 255.0)
        .round()
        .to(torch::kUInt8)
        .permute({0, 2, 3, 1})
        .contiguous();
}

TensorFileSink::TensorFileSink(std::string directory, std::string prefix)
    : directory_(std::move(directory)), prefix_(std::move(prefix)) {}

void TensorFileSink::show(torch::Tensor const& images) {
    auto const pixels = deprocess(denormalize(images.detach().cpu()));
    auto const path = directory_ + "/" + prefix_ + "_" + std::to_string(count_) + ".pt";
    save_tensor_file(pixels, path);
    ++count_;
    last_path_ = path;
    std::cout << "Wrote " << pixels.size(0) << " image(s) to " << path << std::endl;
}
