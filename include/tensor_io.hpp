#pragma once

#include <torch/torch.h>

#include <string>

/// Load a tensor saved with torch.save / torch::pickle_save.
/// Throws PersistenceError when the file is missing or unreadable.
torch::Tensor load_tensor_file(std::string const& path);

/// Save a tensor in the pickle format readable by load_tensor_file and
/// by torch.load. Throws PersistenceError on write failure.
void save_tensor_file(torch::Tensor const& tensor, std::string const& path);
