#include "ui/ui_text.h"

#include <cmath>
#include <cstdint>

#include "overlay_error.h"

namespace fm::ui {

namespace {

// ASCII 32..127, one byte per row, bit0 is the leftmost pixel.
const std::uint8_t kFont6x8[96][8] = {
    /* 32 ' ' */ {0,0,0,0,0,0,0,0},
    /* 33 '!' */ {0x04,0x04,0x04,0x04,0x04,0x00,0x04,0x00},
    /* 34 '"'*/ {0x0a,0x0a,0x0a,0x00,0x00,0x00,0x00,0x00},
    /* 35 '#' */ {0x0a,0x1f,0x0a,0x0a,0x1f,0x0a,0x00,0x00},
    /* 36 '$' */ {0x04,0x1e,0x05,0x0e,0x14,0x0f,0x04,0x00},
    /* 37 '%' */ {0x03,0x13,0x08,0x04,0x02,0x19,0x18,0x00},
    /* 38 '&' */ {0x06,0x09,0x05,0x02,0x15,0x09,0x16,0x00},
    /* 39 '\''*/ {0x06,0x02,0x04,0x00,0x00,0x00,0x00,0x00},
    /* 40 '(' */ {0x08,0x04,0x02,0x02,0x02,0x04,0x08,0x00},
    /* 41 ')' */ {0x02,0x04,0x08,0x08,0x08,0x04,0x02,0x00},
    /* 42 '*' */ {0x04,0x15,0x0e,0x04,0x0e,0x15,0x04,0x00},
    /* 43 '+' */ {0x00,0x04,0x04,0x1f,0x04,0x04,0x00,0x00},
    /* 44 ',' */ {0x00,0x00,0x00,0x00,0x06,0x02,0x04,0x00},
    /* 45 '-' */ {0x00,0x00,0x00,0x1f,0x00,0x00,0x00,0x00},
    /* 46 '.' */ {0x00,0x00,0x00,0x00,0x00,0x06,0x06,0x00},
    /* 47 '/' */ {0x10,0x10,0x08,0x04,0x02,0x01,0x01,0x00},
    /* 48 '0' */ {0x0e,0x11,0x13,0x15,0x19,0x11,0x0e,0x00},
    /* 49 '1' */ {0x04,0x06,0x04,0x04,0x04,0x04,0x1f,0x00},
    /* 50 '2' */ {0x0e,0x11,0x10,0x0c,0x02,0x01,0x1f,0x00},
    /* 51 '3' */ {0x1f,0x10,0x0c,0x10,0x10,0x11,0x0e,0x00},
    /* 52 '4' */ {0x08,0x0c,0x0a,0x09,0x1f,0x08,0x08,0x00},
    /* 53 '5' */ {0x1f,0x01,0x0f,0x10,0x10,0x11,0x0e,0x00},
    /* 54 '6' */ {0x0c,0x02,0x01,0x0f,0x11,0x11,0x0e,0x00},
    /* 55 '7' */ {0x1f,0x10,0x08,0x04,0x02,0x02,0x02,0x00},
    /* 56 '8' */ {0x0e,0x11,0x11,0x0e,0x11,0x11,0x0e,0x00},
    /* 57 '9' */ {0x0e,0x11,0x11,0x1e,0x10,0x08,0x06,0x00},
    /* 58 ':' */ {0x00,0x06,0x06,0x00,0x06,0x06,0x00,0x00},
    /* 59 ';' */ {0x00,0x06,0x06,0x00,0x06,0x02,0x04,0x00},
    /* 60 '<' */ {0x08,0x04,0x02,0x01,0x02,0x04,0x08,0x00},
    /* 61 '=' */ {0x00,0x00,0x1f,0x00,0x1f,0x00,0x00,0x00},
    /* 62 '>' */ {0x02,0x04,0x08,0x10,0x08,0x04,0x02,0x00},
    /* 63 '?' */ {0x0e,0x11,0x10,0x08,0x04,0x00,0x04,0x00},
    /* 64 '@' */ {0x0e,0x11,0x1d,0x15,0x1d,0x01,0x0e,0x00},
    /* 65 'A' */ {0x0e,0x11,0x11,0x1f,0x11,0x11,0x11,0x00},
    /* 66 'B' */ {0x0f,0x11,0x11,0x0f,0x11,0x11,0x0f,0x00},
    /* 67 'C' */ {0x0e,0x11,0x01,0x01,0x01,0x11,0x0e,0x00},
    /* 68 'D' */ {0x0f,0x11,0x11,0x11,0x11,0x11,0x0f,0x00},
    /* 69 'E' */ {0x1f,0x01,0x01,0x0f,0x01,0x01,0x1f,0x00},
    /* 70 'F' */ {0x1f,0x01,0x01,0x0f,0x01,0x01,0x01,0x00},
    /* 71 'G' */ {0x0e,0x11,0x01,0x1d,0x11,0x11,0x1e,0x00},
    /* 72 'H' */ {0x11,0x11,0x11,0x1f,0x11,0x11,0x11,0x00},
    /* 73 'I' */ {0x0e,0x04,0x04,0x04,0x04,0x04,0x0e,0x00},
    /* 74 'J' */ {0x1c,0x08,0x08,0x08,0x08,0x09,0x06,0x00},
    /* 75 'K' */ {0x11,0x09,0x05,0x03,0x05,0x09,0x11,0x00},
    /* 76 'L' */ {0x01,0x01,0x01,0x01,0x01,0x01,0x1f,0x00},
    /* 77 'M' */ {0x11,0x1b,0x15,0x11,0x11,0x11,0x11,0x00},
    /* 78 'N' */ {0x11,0x11,0x13,0x15,0x19,0x11,0x11,0x00},
    /* 79 'O' */ {0x0e,0x11,0x11,0x11,0x11,0x11,0x0e,0x00},
    /* 80 'P' */ {0x0f,0x11,0x11,0x0f,0x01,0x01,0x01,0x00},
    /* 81 'Q' */ {0x0e,0x11,0x11,0x11,0x15,0x09,0x16,0x00},
    /* 82 'R' */ {0x0f,0x11,0x11,0x0f,0x05,0x09,0x11,0x00},
    /* 83 'S' */ {0x1e,0x01,0x01,0x0e,0x10,0x10,0x0f,0x00},
    /* 84 'T' */ {0x1f,0x04,0x04,0x04,0x04,0x04,0x04,0x00},
    /* 85 'U' */ {0x11,0x11,0x11,0x11,0x11,0x11,0x0e,0x00},
    /* 86 'V' */ {0x11,0x11,0x11,0x11,0x11,0x0a,0x04,0x00},
    /* 87 'W' */ {0x11,0x11,0x11,0x11,0x15,0x1b,0x11,0x00},
    /* 88 'X' */ {0x11,0x11,0x0a,0x04,0x0a,0x11,0x11,0x00},
    /* 89 'Y' */ {0x11,0x11,0x0a,0x04,0x04,0x04,0x04,0x00},
    /* 90 'Z' */ {0x1f,0x10,0x08,0x04,0x02,0x01,0x1f,0x00},
    /* 91 '[' */ {0x0e,0x02,0x02,0x02,0x02,0x02,0x0e,0x00},
    /* 92 '\\'*/ {0x01,0x01,0x02,0x04,0x08,0x10,0x10,0x00},
    /* 93 ']' */ {0x0e,0x08,0x08,0x08,0x08,0x08,0x0e,0x00},
    /* 94 '^' */ {0x04,0x0a,0x11,0x00,0x00,0x00,0x00,0x00},
    /* 95 '_' */ {0x00,0x00,0x00,0x00,0x00,0x00,0x1f,0x00},
    /* 96 '`' */ {0x06,0x04,0x08,0x00,0x00,0x00,0x00,0x00},
    /* 97 'a' */ {0x00,0x00,0x0e,0x10,0x1e,0x11,0x1e,0x00},
    /* 98 'b' */ {0x01,0x01,0x0f,0x11,0x11,0x11,0x0f,0x00},
    /* 99 'c' */ {0x00,0x00,0x0e,0x01,0x01,0x01,0x0e,0x00},
    /*100 'd' */ {0x10,0x10,0x1e,0x11,0x11,0x11,0x1e,0x00},
    /*101 'e' */ {0x00,0x00,0x0e,0x11,0x1f,0x01,0x0e,0x00},
    /*102 'f' */ {0x0c,0x02,0x0f,0x02,0x02,0x02,0x02,0x00},
    /*103 'g' */ {0x00,0x00,0x1e,0x11,0x11,0x1e,0x10,0x0e},
    /*104 'h' */ {0x01,0x01,0x0f,0x11,0x11,0x11,0x11,0x00},
    /*105 'i' */ {0x00,0x04,0x00,0x06,0x04,0x04,0x0e,0x00},
    /*106 'j' */ {0x00,0x08,0x00,0x0c,0x08,0x08,0x06,0x00},
    /*107 'k' */ {0x01,0x09,0x05,0x03,0x05,0x09,0x11,0x00},
    /*108 'l' */ {0x06,0x04,0x04,0x04,0x04,0x04,0x0e,0x00},
    /*109 'm' */ {0x00,0x00,0x1b,0x15,0x15,0x11,0x11,0x00},
    /*110 'n' */ {0x00,0x00,0x0f,0x11,0x11,0x11,0x11,0x00},
    /*111 'o' */ {0x00,0x00,0x0e,0x11,0x11,0x11,0x0e,0x00},
    /*112 'p' */ {0x00,0x00,0x0f,0x11,0x11,0x0f,0x01,0x01},
    /*113 'q' */ {0x00,0x00,0x1e,0x11,0x11,0x1e,0x10,0x10},
    /*114 'r' */ {0x00,0x00,0x0d,0x13,0x01,0x01,0x01,0x00},
    /*115 's' */ {0x00,0x00,0x1e,0x01,0x0e,0x10,0x0f,0x00},
    /*116 't' */ {0x02,0x02,0x0f,0x02,0x02,0x02,0x0c,0x00},
    /*117 'u' */ {0x00,0x00,0x11,0x11,0x11,0x11,0x1e,0x00},
    /*118 'v' */ {0x00,0x00,0x11,0x11,0x11,0x0a,0x04,0x00},
    /*119 'w' */ {0x00,0x00,0x11,0x11,0x15,0x1b,0x11,0x00},
    /*120 'x' */ {0x00,0x00,0x11,0x0a,0x04,0x0a,0x11,0x00},
    /*121 'y' */ {0x00,0x00,0x11,0x11,0x1e,0x10,0x0e,0x00},
    /*122 'z' */ {0x00,0x00,0x1f,0x08,0x04,0x02,0x1f,0x00},
    /*123 '{' */ {0x0c,0x04,0x04,0x03,0x04,0x04,0x0c,0x00},
    /*124 '|' */ {0x04,0x04,0x04,0x00,0x04,0x04,0x04,0x00},
    /*125 '}' */ {0x03,0x04,0x04,0x18,0x04,0x04,0x03,0x00},
    /*126 '~' */ {0x08,0x15,0x02,0x00,0x00,0x00,0x00,0x00},
    /*127     */ {0,0,0,0,0,0,0,0}
};

float snap(float v) { return std::round(v); }

} // namespace

TextExtent BitmapFontMeasurer::measure(std::string_view text, const FontSpec& font) const {
    if (font.family != kFont6x8Family) {
        throw OverlayError(ErrorCode::MeasureFailure, "Unknown font family '" + std::string(font.family) + "'");
    }
    if (!(font.size_px > 0.0f) || !std::isfinite(font.size_px)) {
        throw OverlayError(ErrorCode::MeasureFailure, "Invalid font size for '" + std::string(font.family) + "'");
    }
    TextExtent extent;
    extent.width = static_cast<float>(text.size()) * glyph_advance_px(font.size_px);
    extent.height = kFont6x8Height * glyph_scale(font.size_px);
    return extent;
}

float glyph_scale(float size_px) {
    return size_px / static_cast<float>(kFont6x8Height);
}

float glyph_advance_px(float size_px) {
    return kFont6x8Width * glyph_scale(size_px);
}

void draw_text(Canvas& canvas, std::string_view text, const TextDrawParams& params) {
    if (params.color.a <= 0.0f || params.size_px <= 0.0f) return;
    const float scale = glyph_scale(params.size_px);
    for (std::size_t ci = 0; ci < text.size(); ++ci) {
        unsigned char ch = static_cast<unsigned char>(text[ci]);
        if (ch < 32 || ch > 127) ch = 32;
        const std::uint8_t* rows = kFont6x8[ch - 32];
        const float cell_x = params.origin_px.x + static_cast<float>(ci * kFont6x8Width) * scale;
        for (int ry = 0; ry < kFont6x8Height; ++ry) {
            const std::uint8_t bits = rows[ry];
            if (!bits) continue;
            // Snap glyph pixels to the grid so neighbours share edges instead of blending twice.
            const float y0 = snap(params.origin_px.y + ry * scale);
            const float y1 = snap(params.origin_px.y + (ry + 1) * scale);
            for (int rx = 0; rx < kFont6x8Width; ++rx) {
                if (!(bits & (1u << rx))) continue;
                const float x0 = snap(cell_x + rx * scale);
                const float x1 = snap(cell_x + (rx + 1) * scale);
                canvas.fill_rect(Rect{x0, y0, x1 - x0, y1 - y0}, params.color);
            }
        }
    }
}

std::string ellipsize(std::string_view text, float max_width_px, float size_px) {
    const float advance = glyph_advance_px(size_px);
    if (advance <= 0.0f || max_width_px <= 0.0f) return {};
    const int max_fit = static_cast<int>(std::floor(max_width_px / advance));
    if (static_cast<int>(text.size()) <= max_fit) return std::string(text);
    if (max_fit < 3) return {};
    std::string line(text.substr(0, static_cast<std::size_t>(max_fit - 3)));
    line += "...";
    return line;
}

} // namespace fm::ui
