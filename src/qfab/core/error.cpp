#include "qfab/core/error.h"

namespace qfab {
namespace core {

const char* ErrorCodeName(Error::Code code) {
    switch (code) {
        case Error::Code::UNKNOWN: return "UNKNOWN";
        case Error::Code::INVALID_ARGUMENT: return "INVALID_ARGUMENT";
        case Error::Code::NOT_FOUND: return "NOT_FOUND";
        case Error::Code::ALREADY_EXISTS: return "ALREADY_EXISTS";
        case Error::Code::RESOURCE_EXHAUSTED: return "RESOURCE_EXHAUSTED";
        case Error::Code::INTERNAL: return "INTERNAL";
        case Error::Code::INVALID_CONFIGURATION: return "INVALID_CONFIGURATION";
        case Error::Code::UNSUPPORTED_STORAGE_BACKEND: return "UNSUPPORTED_STORAGE_BACKEND";
        case Error::Code::RESOURCE_RESOLUTION_FAILURE: return "RESOURCE_RESOLUTION_FAILURE";
        case Error::Code::PLANNING_FAILURE: return "PLANNING_FAILURE";
        case Error::Code::EXECUTION_FAILURE: return "EXECUTION_FAILURE";
        case Error::Code::WRITE_FAILURE: return "WRITE_FAILURE";
    }
    return "UNKNOWN";
}

} // namespace core
} // namespace qfab
