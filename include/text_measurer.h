#pragma once

#include <string_view>

namespace fm {

struct FontSpec {
    std::string_view family;
    float size_px = 0.0f;
};

struct TextExtent {
    float width = 0.0f;
    float height = 0.0f;
};

// Font used both to size the popup and to draw its text. Measuring with one font and
// drawing with another produces a popup of the wrong width.
inline constexpr FontSpec kPopupFont{"fm-6x8", 15.0f};

class TextMeasurer {
public:
    virtual ~TextMeasurer() = default;

    // Throws OverlayError(MeasureFailure) when the font cannot be resolved.
    virtual TextExtent measure(std::string_view text, const FontSpec& font) const = 0;
};

} // namespace fm
