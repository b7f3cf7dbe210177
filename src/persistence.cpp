#include "persistence.hpp"

#include "tensor_util.hpp"

#include <filesystem>
#include <iostream>
#include <vector>

namespace fs = std::filesystem;

void write_archive(torch::nn::Module const& module, std::string const& path) {
    auto const parent = fs::path(path).parent_path();
    if (!parent.empty() && !fs::is_directory(parent)) {
        throw PersistenceError(PersistenceStatus::io_error,
                               "Directory does not exist: " + parent.string());
    }
    try {
        torch::serialize::OutputArchive archive;
        module.save(archive);
        archive.save_to(path);
    } catch (c10::Error const& e) {
        throw PersistenceError(PersistenceStatus::io_error,
                               "Could not write " + path + ": " + e.what_without_backtrace());
    }
}

/// A tensor of the module paired with the value read for it.
struct StagedTensor {
    torch::Tensor target;
    torch::Tensor value;
};

/// Read every parameter and buffer of module from archive without touching
/// the module. Missing keys and size mismatches throw PersistenceError.
static void stage_tensors(
    torch::nn::Module const& module,
    torch::serialize::InputArchive& archive,
    std::string const& prefix,
    std::string const& path,
    std::vector<StagedTensor>& staged) {

    auto stage = [&](std::string const& key, torch::Tensor const& target, bool is_buffer) {
        torch::Tensor value;
        if (!archive.try_read(key, value, is_buffer)) {
            throw PersistenceError(PersistenceStatus::corrupt,
                                   path + " has no entry for " + prefix + key);
        }
        if (value.sizes() != target.sizes()) {
            throw PersistenceError(
                PersistenceStatus::corrupt,
                path + " stores " + prefix + key + " as " + shape_string(value) +
                ", the model expects " + shape_string(target));
        }
        staged.push_back(StagedTensor{.target = target, .value = value});
    };

    for (auto const& param : module.named_parameters(/*recurse=*/false)) {
        stage(param.key(), param.value(), /*is_buffer=*/false);
    }
    for (auto const& buffer : module.named_buffers(/*recurse=*/false)) {
        stage(buffer.key(), buffer.value(), /*is_buffer=*/true);
    }
    for (auto const& child : module.named_children()) {
        torch::serialize::InputArchive child_archive;
        if (!archive.try_read(child.key(), child_archive)) {
            throw PersistenceError(PersistenceStatus::corrupt,
                                   path + " has no entry for " + prefix + child.key());
        }
        stage_tensors(*child.value(), child_archive, prefix + child.key() + ".", path, staged);
    }
}

void read_archive(torch::nn::Module& module, std::string const& path) {
    if (!fs::exists(path)) {
        throw PersistenceError(PersistenceStatus::not_found, "No weights at " + path);
    }
    if (!fs::is_regular_file(path)) {
        throw PersistenceError(PersistenceStatus::io_error, path + " is not a regular file");
    }
    try {
        torch::serialize::InputArchive archive;
        archive.load_from(path);

        // Validate the whole archive first so a failed load leaves module as it was.
        std::vector<StagedTensor> staged;
        stage_tensors(module, archive, "", path, staged);

        torch::NoGradGuard no_grad;
        for (auto& item : staged) {
            item.target.copy_(item.value);
        }
    } catch (c10::Error const& e) {
        throw PersistenceError(PersistenceStatus::corrupt,
                               "Could not read " + path + ": " + e.what_without_backtrace());
    }
}

PersistenceResult save_weights(torch::nn::Module const& module, std::string const& path) {
    try {
        write_archive(module, path);
    } catch (PersistenceError const& e) {
        std::cerr << "Save model failed, " << e.what() << std::endl;
        return {e.status(), e.what()};
    }
    return {};
}

PersistenceResult load_weights(torch::nn::Module& module, std::string const& path) {
    try {
        read_archive(module, path);
    } catch (PersistenceError const& e) {
        if (e.status() == PersistenceStatus::not_found) {
            std::cout << "Could not load model, " << e.what() << " (starting fresh)" << std::endl;
        } else {
            std::cerr << "ERROR: could not load model (" << persistence_status_name(e.status())
                      << "), " << e.what() << std::endl;
        }
        return {e.status(), e.what()};
    }
    return {};
}
