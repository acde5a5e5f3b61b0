#pragma once

#include <string>

namespace fastpack::core {

enum class ErrorCode {
    SUCCESS,
    VALIDATION_ERROR,
    NOT_FOUND,
    INVALID_STATE,
    TRANSIENT_STORAGE_ERROR,
    PERMANENT_STORAGE_ERROR,
    METADATA_ERROR,
    INCOMPLETE_UPLOAD,
    REPACKAGING_TIMEOUT,
    REPACKAGING_FAILURE,
    EXPIRED
};

struct Result {
    ErrorCode error;
    std::string message;
    
    Result(ErrorCode err = ErrorCode::SUCCESS, const std::string& msg = "")
        : error(err), message(msg) {}
    
    bool success() const { return error == ErrorCode::SUCCESS; }
    operator bool() const { return success(); }
    
    static Result ok() { return Result{}; }
};

const char* error_code_name(ErrorCode code);

} // namespace fastpack::core
