#include "gram.hpp"

#include "errors.hpp"
#include "tensor_util.hpp"

#include <string>

torch::Tensor gram_matrix(torch::Tensor const& features) {
    require_4d(features, "gram_matrix input");
    int64_t const batch = features.size(0);
    int64_t const channels = features.size(1);
    int64_t const samples = features.size(2) * features.size(3);

    auto flat = features.reshape({batch, channels, samples});
    auto gram = torch::bmm(flat, flat.transpose(1, 2));
    return gram / static_cast<double>(samples * channels);
}

torch::Tensor gram_loss(
    std::vector<torch::Tensor> const& generated,
    std::vector<torch::Tensor> const& original) {

    if (generated.empty() || generated.size() != original.size()) {
        throw ShapeError(
            "gram_loss needs matching non-empty layer lists, got " +
            std::to_string(generated.size()) + " and " + std::to_string(original.size()));
    }

    auto total = torch::zeros({}, generated.front().options());
    for (size_t i = 0; i < generated.size(); ++i) {
        require_same_shape(generated[i], original[i], "gram_loss layer mismatch");
        auto diff = gram_matrix(generated[i]) - gram_matrix(original[i]);
        total = total + diff.square().mean();
    }
    return total / static_cast<double>(generated.size());
}
