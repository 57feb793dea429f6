#pragma once

#include <string>
#include <variant>

#include "fm_types.h"

namespace fm {

struct HighlightAnnotation {
    Rect rect{}; // global coordinates
};

struct PopupAnnotation {
    std::string text;
    Rect anchor{}; // global coordinates
};

using Annotation = std::variant<HighlightAnnotation, PopupAnnotation>;

inline const char* annotation_kind_name(const Annotation& a) {
    return std::holds_alternative<HighlightAnnotation>(a) ? "highlight" : "popup";
}

} // namespace fm
