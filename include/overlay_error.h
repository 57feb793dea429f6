#pragma once

#include <stdexcept>
#include <string>

namespace fm {

enum class ErrorCode {
    InvalidArguments,
    NoScreenFound,
    RenderFailure,
    MeasureFailure,
    PresenterInit,
};

const char* to_string(ErrorCode code);

// Every error in the taxonomy is fatal for the one-shot process.
inline int exit_code(ErrorCode) { return 1; }

class OverlayError : public std::runtime_error {
public:
    OverlayError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

} // namespace fm
