#include "tensor_io.hpp"

#include "errors.hpp"

#include <fstream>
#include <iterator>
#include <vector>

torch::Tensor load_tensor_file(std::string const& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw PersistenceError(PersistenceStatus::not_found, "Failed to open: " + path);
    }
    std::vector<char> bytes(
        (std::istreambuf_iterator<char>(file)),
        std::istreambuf_iterator<char>());
    try {
        auto ivalue = torch::pickle_load(bytes);
        if (!ivalue.isTensor()) {
            throw PersistenceError(PersistenceStatus::corrupt, path + " does not hold a tensor");
        }
        return ivalue.toTensor().contiguous();
    } catch (c10::Error const& e) {
        throw PersistenceError(PersistenceStatus::corrupt,
                               "Could not parse " + path + ": " + e.what_without_backtrace());
    }
}

void save_tensor_file(torch::Tensor const& tensor, std::string const& path) {
    std::vector<char> bytes;
    try {
        bytes = torch::pickle_save(tensor.contiguous());
    } catch (c10::Error const& e) {
        throw PersistenceError(PersistenceStatus::io_error,
                               "Could not serialize tensor for " + path + ": " +
                               e.what_without_backtrace());
    }
    std::ofstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw PersistenceError(PersistenceStatus::io_error, "Failed to open for writing: " + path);
    }
    file.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    if (!file) {
        throw PersistenceError(PersistenceStatus::io_error, "Failed to write: " + path);
    }
}
