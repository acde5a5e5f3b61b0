#include "fastpack/core/result.hpp"

namespace fastpack::core {

const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::SUCCESS: return "success";
        case ErrorCode::VALIDATION_ERROR: return "validation_error";
        case ErrorCode::NOT_FOUND: return "not_found";
        case ErrorCode::INVALID_STATE: return "invalid_state";
        case ErrorCode::TRANSIENT_STORAGE_ERROR: return "transient_storage_error";
        case ErrorCode::PERMANENT_STORAGE_ERROR: return "permanent_storage_error";
        case ErrorCode::METADATA_ERROR: return "metadata_error";
        case ErrorCode::INCOMPLETE_UPLOAD: return "incomplete_upload";
        case ErrorCode::REPACKAGING_TIMEOUT: return "repackaging_timeout";
        case ErrorCode::REPACKAGING_FAILURE: return "repackaging_failure";
        case ErrorCode::EXPIRED: return "expired";
    }
    return "unknown";
}

} // namespace fastpack::core
