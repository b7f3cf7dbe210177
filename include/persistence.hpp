#pragma once

#include <torch/torch.h>

#include <string>

#include "errors.hpp"

/// Outcome of a weight save or load. not_found is the expected cold start;
/// corrupt and io_error point at a damaged artifact or file system trouble.
struct PersistenceResult {
    PersistenceStatus status = PersistenceStatus::ok;
    std::string message;

    bool ok() const { return status == PersistenceStatus::ok; }
};

/// Write every parameter and buffer of module to a LibTorch archive.
/// Throws PersistenceError.
void write_archive(torch::nn::Module const& module, std::string const& path);

/// Read an archive written by write_archive into module. Every entry is
/// checked for presence and size before any weight is overwritten; a
/// mismatch throws PersistenceError (corrupt) and leaves module unchanged.
/// Parameters keep their requires_grad flags.
void read_archive(torch::nn::Module& module, std::string const& path);

/// Non-throwing save; failures are logged to std::cerr.
PersistenceResult save_weights(torch::nn::Module const& module, std::string const& path);

/// Non-throwing load; a missing file is logged as a cold start, anything
/// else as an error. On failure the module keeps its current weights.
PersistenceResult load_weights(torch::nn::Module& module, std::string const& path);
