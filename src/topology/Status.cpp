// SPDX-License-Identifier: BSD-2-Clause

#include "linkwatch/topology/Status.h"

namespace linkwatch {

const char* to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Ok:                 return "ok";
        case ErrorCode::Validation:         return "validation";
        case ErrorCode::NotFound:           return "not_found";
        case ErrorCode::AlreadyExists:      return "already_exists";
        case ErrorCode::FailedPrecondition: return "failed_precondition";
        case ErrorCode::Conflict:           return "conflict";
        case ErrorCode::Internal:           return "internal";
    }
    return "unknown";
}

} // namespace linkwatch
