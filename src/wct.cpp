#include "wct.hpp"

#include "errors.hpp"
#include "tensor_util.hpp"

#include <stdexcept>
#include <string>
#include <vector>

std::pair<torch::Tensor, torch::Tensor> channel_statistics(
    torch::Tensor const& features,
    double epsilon) {

    auto x = features.to(torch::kFloat64);
    int64_t const channels = x.size(0);
    int64_t const samples = x.size(1);

    auto mean = x.mean(/*dim=*/1, /*keepdim=*/true);
    auto centered = x - mean;
    auto covariance = torch::mm(centered, centered.t()) / static_cast<double>(samples - 1);
    covariance = covariance + epsilon * torch::eye(channels, covariance.options());
    return {mean, covariance};
}

/// E diag(lambda^power) E^T of a symmetric positive definite matrix.
static torch::Tensor matrix_power_sym(torch::Tensor const& covariance, double power) {
    auto [eigenvalues, eigenvectors] = torch::linalg_eigh(covariance);
    if (!torch::isfinite(eigenvalues).all().item<bool>() ||
        eigenvalues.min().item<double>() <= 0.0) {
        throw NumericalError(
            "Covariance is not positive definite after regularization (min eigenvalue " +
            std::to_string(eigenvalues.min().item<double>()) + ")");
    }
    auto scaled = eigenvectors * eigenvalues.pow(power).unsqueeze(0);
    return torch::mm(scaled, eigenvectors.t());
}

/// Transfer style statistics onto one [C, N] content matrix.
static torch::Tensor whiten_and_color(
    torch::Tensor const& content,
    torch::Tensor const& style,
    double epsilon) {

    auto [content_mean, content_cov] = channel_statistics(content, epsilon);
    auto [style_mean, style_cov] = channel_statistics(style, epsilon);

    auto centered = content.to(torch::kFloat64) - content_mean;
    auto whitened = torch::mm(matrix_power_sym(content_cov, -0.5), centered);
    return torch::mm(matrix_power_sym(style_cov, 0.5), whitened) + style_mean;
}

torch::Tensor whitening_coloring(
    torch::Tensor const& content,
    torch::Tensor const& style,
    double alpha,
    WctOptions const& options) {

    if (alpha < 0.0 || alpha > 1.0) {
        throw std::invalid_argument("alpha must be in [0, 1], got " + std::to_string(alpha));
    }
    if (!(options.epsilon > 0.0)) {
        throw std::invalid_argument(
            "WCT epsilon must be positive, got " + std::to_string(options.epsilon));
    }
    require_4d(content, "WCT content");
    require_4d(style, "WCT style");
    if (content.size(0) != style.size(0) || content.size(1) != style.size(1)) {
        throw ShapeError(
            "WCT content " + shape_string(content) + " and style " + shape_string(style) +
            " differ in batch or channel count");
    }

    int64_t const batch = content.size(0);
    int64_t const channels = content.size(1);
    int64_t const content_samples = content.size(2) * content.size(3);
    int64_t const style_samples = style.size(2) * style.size(3);
    if (content_samples < 2 || style_samples < 2) {
        throw ShapeError(
            "WCT needs at least two spatial positions, got content " + shape_string(content) +
            " and style " + shape_string(style));
    }

    if (alpha == 0.0) {
        return content.clone();
    }

    if (!torch::isfinite(content).all().item<bool>() ||
        !torch::isfinite(style).all().item<bool>()) {
        throw NumericalError("WCT input contains non-finite values");
    }

    auto content_flat = content.reshape({batch, channels, content_samples});
    auto style_flat = style.reshape({batch, channels, style_samples});

    std::vector<torch::Tensor> colored;
    colored.reserve(batch);
    for (int64_t b = 0; b < batch; ++b) {
        colored.push_back(whiten_and_color(content_flat[b], style_flat[b], options.epsilon));
    }

    auto result = torch::stack(colored).reshape(content.sizes()).to(content.dtype());
    if (!torch::isfinite(result).all().item<bool>()) {
        throw NumericalError("WCT produced non-finite values");
    }
    return alpha * result + (1.0 - alpha) * content;
}
