#include "data_source.hpp"

#include "errors.hpp"
#include "tensor_util.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>

TensorBatchSource::TensorBatchSource(torch::Tensor images, int64_t batch_size, bool shuffle)
    : images_(std::move(images)), batch_size_(batch_size), shuffle_(shuffle) {

    require_4d(images_, "TensorBatchSource images");
    if (images_.size(0) == 0) {
        throw std::invalid_argument("TensorBatchSource needs at least one image");
    }
    if (batch_size_ < 1) {
        throw std::invalid_argument("batch_size must be >= 1, got " + std::to_string(batch_size_));
    }
    reset();
}

void TensorBatchSource::reset() {
    int64_t const n = images_.size(0);
    order_ = shuffle_ ? torch::randperm(n, torch::kLong) : torch::arange(n, torch::kLong);
    cursor_ = 0;
}

std::optional<torch::Tensor> TensorBatchSource::next_batch() {
    int64_t const n = images_.size(0);
    if (cursor_ >= n) {
        return std::nullopt;
    }
    int64_t const end = std::min(cursor_ + batch_size_, n);
    auto indices = order_.slice(0, cursor_, end);
    cursor_ = end;
    return images_.index_select(0, indices);
}

torch::Tensor TensorBatchSource::sample(int64_t index) const {
    if (index < 0 || index >= images_.size(0)) {
        throw std::out_of_range("Sample index " + std::to_string(index) + " out of range");
    }
    return images_.slice(0, index, index + 1);
}
