#pragma once

#include <string>
#include <string_view>

#include "text_measurer.h"
#include "ui/ui_canvas.h"

namespace fm::ui {

inline constexpr int kFont6x8Width = 6;
inline constexpr int kFont6x8Height = 8;
inline constexpr std::string_view kFont6x8Family = "fm-6x8";

struct TextDrawParams {
    Vec2 origin_px{0.0f, 0.0f};
    float size_px = 15.0f; // glyph cell height; the 6x8 cell is scaled by size_px / 8
    Color color{1.0f, 1.0f, 1.0f, 1.0f};
};

// The built-in 6x8 bitmap font. Measures exactly what draw_text puts on the canvas, so
// a popup sized with it always fits its own text.
class BitmapFontMeasurer : public TextMeasurer {
public:
    TextExtent measure(std::string_view text, const FontSpec& font) const override;
};

float glyph_scale(float size_px);
float glyph_advance_px(float size_px);

// Draws one line of ASCII. Bytes outside 32..127 render as blanks.
void draw_text(Canvas& canvas, std::string_view text, const TextDrawParams& params);

// Longest prefix that fits in max_width_px, with "..." appended when it was cut.
std::string ellipsize(std::string_view text, float max_width_px, float size_px);

} // namespace fm::ui
