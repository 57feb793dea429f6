#include <gtest/gtest.h>

#include <string>

#include "overlay_error.h"
#include "ui/ui_canvas.h"
#include "ui/ui_text.h"

using namespace fm;
using namespace fm::ui;

namespace {

int lit_pixels(const Canvas& canvas, int x0, int y0, int x1, int y1) {
    int count = 0;
    for (int y = y0; y < y1; ++y) {
        for (int x = x0; x < x1; ++x) {
            if (canvas.pixel(x, y).a > 0.0f) ++count;
        }
    }
    return count;
}

} // namespace

TEST(BitmapFontTest, MeasuresScaledCells) {
    BitmapFontMeasurer font;
    const TextExtent e = font.measure("Hello", kPopupFont);
    EXPECT_FLOAT_EQ(e.width, 5 * 11.25f);
    EXPECT_FLOAT_EQ(e.height, 15.0f);
    EXPECT_FLOAT_EQ(font.measure("", kPopupFont).width, 0.0f);
}

TEST(BitmapFontTest, UnknownFamilyFails) {
    BitmapFontMeasurer font;
    try {
        font.measure("x", FontSpec{"Helvetica", 15.0f});
        FAIL() << "expected OverlayError";
    } catch (const OverlayError& e) {
        EXPECT_EQ(e.code(), ErrorCode::MeasureFailure);
    }
}

TEST(BitmapFontTest, InvalidSizeFails) {
    BitmapFontMeasurer font;
    EXPECT_THROW(font.measure("x", FontSpec{kFont6x8Family, 0.0f}), OverlayError);
    EXPECT_THROW(font.measure("x", FontSpec{kFont6x8Family, -3.0f}), OverlayError);
}

TEST(DrawTextTest, GlyphStaysInsideItsCell) {
    Canvas canvas(20, 12);
    TextDrawParams params;
    params.origin_px = Vec2{2.0f, 2.0f};
    params.size_px = 8.0f;
    draw_text(canvas, "A", params);

    const int inside = lit_pixels(canvas, 2, 2, 8, 10);
    EXPECT_GT(inside, 0);
    EXPECT_EQ(lit_pixels(canvas, 0, 0, 20, 12), inside);
}

TEST(DrawTextTest, ScaledGlyphCoversMorePixels) {
    Canvas small(40, 40);
    Canvas large(40, 40);
    TextDrawParams params;
    params.size_px = 8.0f;
    draw_text(small, "W", params);
    params.size_px = 16.0f;
    draw_text(large, "W", params);
    EXPECT_GT(lit_pixels(large, 0, 0, 40, 40), lit_pixels(small, 0, 0, 40, 40));
}

TEST(DrawTextTest, SpacesAndNonAsciiStayBlank) {
    Canvas canvas(40, 12);
    TextDrawParams params;
    params.size_px = 8.0f;
    draw_text(canvas, std::string("  \xc3\xa9\x01"), params);
    EXPECT_EQ(lit_pixels(canvas, 0, 0, 40, 12), 0);
}

TEST(DrawTextTest, TransparentColorDrawsNothing) {
    Canvas canvas(20, 12);
    TextDrawParams params;
    params.size_px = 8.0f;
    params.color.a = 0.0f;
    draw_text(canvas, "A", params);
    EXPECT_EQ(lit_pixels(canvas, 0, 0, 20, 12), 0);
}

TEST(EllipsizeTest, FittingTextIsUnchanged) {
    EXPECT_EQ(ellipsize("Hello", 5 * 11.25f, 15.0f), "Hello");
}

TEST(EllipsizeTest, LongTextIsCutWithDots) {
    // 100 px fits 8 glyphs of 11.25 px.
    const std::string line = ellipsize("A long message that cannot fit", 100.0f, 15.0f);
    EXPECT_EQ(line, "A lon...");
    BitmapFontMeasurer font;
    EXPECT_LE(font.measure(line, kPopupFont).width, 100.0f);
}

TEST(EllipsizeTest, TooNarrowForDotsIsEmpty) {
    EXPECT_EQ(ellipsize("Hello", 30.0f, 15.0f), "");
    EXPECT_EQ(ellipsize("Hello", 0.0f, 15.0f), "");
}
