#include "overlay_error.h"

namespace fm {

const char* to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::InvalidArguments: return "invalid arguments";
        case ErrorCode::NoScreenFound: return "no screen found";
        case ErrorCode::RenderFailure: return "render failure";
        case ErrorCode::MeasureFailure: return "measure failure";
        case ErrorCode::PresenterInit: return "presenter init";
    }
    return "unknown";
}

} // namespace fm
