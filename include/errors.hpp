#pragma once

#include <stdexcept>
#include <string>

/// Tensor dimensions do not line up (wavelet ops, WCT, stage joins).
class ShapeError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

/// Covariance could not be whitened or produced non-finite values.
class NumericalError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

enum class PersistenceStatus { ok, not_found, corrupt, io_error };

char const* persistence_status_name(PersistenceStatus status);

/// Weight archive or tensor file could not be read or written.
class PersistenceError : public std::runtime_error {
public:
    PersistenceError(PersistenceStatus status, std::string const& message)
        : std::runtime_error(message), status_(status) {}

    PersistenceStatus status() const { return status_; }

private:
    PersistenceStatus status_;
};
