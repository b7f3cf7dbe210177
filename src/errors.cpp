#include "errors.hpp"

char const* persistence_status_name(PersistenceStatus status) {
    switch (status) {
        case PersistenceStatus::ok: return "ok";
        case PersistenceStatus::not_found: return "not_found";
        case PersistenceStatus::corrupt: return "corrupt";
        case PersistenceStatus::io_error: return "io_error";
    }
    return "unknown";
}
