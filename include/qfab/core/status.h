#ifndef QFAB_CORE_STATUS_H_
#define QFAB_CORE_STATUS_H_

#include <string>

#include <arrow/status.h>

#include "qfab/core/result.h"

namespace qfab {
namespace core {

/**
 * @brief Converts an Arrow status into a Result<void>
 *
 * Out-of-memory statuses always map to RESOURCE_EXHAUSTED; every other
 * failure takes the caller supplied code.
 */
inline Result<void> FromStatus(const arrow::Status& status,
                               Error::Code code = Error::Code::EXECUTION_FAILURE,
                               const std::string& context = "") {
    if (status.ok()) {
        return Result<void>();
    }
    if (status.IsOutOfMemory()) {
        code = Error::Code::RESOURCE_EXHAUSTED;
    }
    std::string message = context.empty() ? status.ToString() : context + ": " + status.ToString();
    return Result<void>::error(message, code);
}

} // namespace core
} // namespace qfab

#endif // QFAB_CORE_STATUS_H_
