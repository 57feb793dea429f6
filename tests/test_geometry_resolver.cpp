#include <gtest/gtest.h>

#include <cstdint>
#include <limits>
#include <vector>

#include "geometry_resolver.h"
#include "overlay_error.h"
#include "ui/ui_text.h"

using namespace fm;

namespace {

class FixedWidthMeasurer : public TextMeasurer {
public:
    explicit FixedWidthMeasurer(float width) : width_(width) {}

    TextExtent measure(std::string_view, const FontSpec&) const override {
        return TextExtent{width_, 15.0f};
    }

private:
    float width_;
};

ScreenGeometry screen(int id, Rect bounds, bool primary = false) {
    ScreenGeometry s;
    s.id = id;
    s.name = "screen-" + std::to_string(id);
    s.bounds = bounds;
    s.primary = primary;
    return s;
}

} // namespace

// ─────────────────────────────────────────────────────────────────────────────
// Popup placement
// ─────────────────────────────────────────────────────────────────────────────

TEST(PlacePopupTest, CenteredAboveAnchor) {
    const ScreenGeometry s = screen(0, Rect{0, 0, 1920, 1080}, true);
    EXPECT_EQ(place_popup(Rect{100, 100, 50, 50}, s, 200, 50), (Rect{25, 42, 200, 50}));
}

TEST(PlacePopupTest, FallsBelowNearTopEdge) {
    const ScreenGeometry s = screen(0, Rect{0, 0, 1920, 1080}, true);
    const Rect placed = place_popup(Rect{100, 5, 50, 50}, s, 200, 50);
    EXPECT_EQ(placed.x, 25);
    EXPECT_EQ(placed.y, 63);
}

TEST(PlacePopupTest, ClampsLeftEdge) {
    const ScreenGeometry s = screen(0, Rect{0, 0, 1920, 1080}, true);
    EXPECT_EQ(place_popup(Rect{0, 500, 20, 20}, s, 200, 50).x, 10);
}

TEST(PlacePopupTest, ClampsRightEdge) {
    const ScreenGeometry s = screen(0, Rect{0, 0, 1920, 1080}, true);
    EXPECT_EQ(place_popup(Rect{1900, 500, 20, 20}, s, 200, 50).x, 1920 - 10 - 200);
}

TEST(PlacePopupTest, LeftMarginWinsWhenPopupIsWiderThanScreen) {
    const ScreenGeometry s = screen(0, Rect{0, 0, 300, 300}, true);
    EXPECT_EQ(place_popup(Rect{100, 200, 20, 20}, s, 400, 50).x, 10);
}

TEST(PlacePopupTest, WorksInScreenLocalSpace) {
    // Second screen to the right of a 1920-wide primary, slightly raised.
    const ScreenGeometry s = screen(1, Rect{1920, -100, 1280, 1024});
    const Rect placed = place_popup(Rect{1920 + 100, -100 + 100, 50, 50}, s, 200, 50);
    EXPECT_EQ(placed, (Rect{1920 + 25, -100 + 42, 200, 50}));

    const Rect below = place_popup(Rect{1920 + 100, -100 + 5, 50, 50}, s, 200, 50);
    EXPECT_EQ(below.y, -100 + 63);
}

TEST(PlacePopupTest, BelowPlacementIsNotClampedToBottom) {
    const ScreenGeometry s = screen(0, Rect{0, 0, 800, 60}, true);
    const Rect placed = place_popup(Rect{100, 0, 50, 60}, s, 200, 50);
    EXPECT_EQ(placed.y, 68);
}

TEST(PlacePopupTest, StaysInsideMarginsForAnyIntersectingAnchor) {
    const std::vector<ScreenGeometry> screens = {
        screen(0, Rect{0, 0, 1920, 1080}, true),
        screen(1, Rect{1920, -100, 1280, 1024}),
        screen(2, Rect{-1280, 200, 1280, 1024}),
    };
    const int widths[] = {100, 117, 400, 1000};
    for (const ScreenGeometry& s : screens) {
        const Rect& b = s.bounds;
        for (int ax = b.x - 200; ax <= b.x + b.w + 200; ax += 37) {
            for (int ay = b.y - 100; ay <= b.y + b.h + 100; ay += 97) {
                for (int aw : {1, 50, 300}) {
                    const Rect anchor{ax, ay, aw, 40};
                    if (!intersects(anchor, b)) continue;
                    for (int pw : widths) {
                        const Rect placed = place_popup(anchor, s, pw, kPopupHeightPx);
                        SCOPED_TRACE(::testing::Message() << "screen " << s.id << " anchor " << ax << "," << ay
                                                          << " w " << aw << " popup " << pw);
                        EXPECT_GE(placed.x, b.x + kPopupEdgeMarginPx);
                        EXPECT_LE(placed.right(), b.right() - kPopupEdgeMarginPx);
                        EXPECT_EQ(placed.w, pw);
                        EXPECT_EQ(placed.h, kPopupHeightPx);
                    }
                }
            }
        }
    }
}

TEST(PlacePopupTest, ExtremeAnchorDoesNotOverflow) {
    const ScreenGeometry s = screen(0, Rect{0, 0, 1920, 1080}, true);
    const int big = std::numeric_limits<int>::max();
    const Rect right_edge = place_popup(Rect{big - 10, big - 10, 100, 100}, s, 200, 50);
    EXPECT_EQ(right_edge.x, 1920 - 10 - 200);
    EXPECT_EQ(right_edge.y, big - 10 - 50 - 8);

    const int small = std::numeric_limits<int>::min();
    const Rect above = place_popup(Rect{small, small, 100, 100}, s, 200, 50);
    EXPECT_EQ(above.x, 10);
    EXPECT_EQ(above.y, small + 100 + 8);
}

// ─────────────────────────────────────────────────────────────────────────────
// Screen resolution
// ─────────────────────────────────────────────────────────────────────────────

TEST(ResolveScreenTest, PicksScreenContainingCenter) {
    const std::vector<ScreenGeometry> screens = {
        screen(0, Rect{0, 0, 1920, 1080}, true),
        screen(1, Rect{1920, 0, 1920, 1080}),
    };
    // Mostly on screen 0 by area but centered on screen 1.
    EXPECT_EQ(resolve_screen(Rect{1800, 100, 300, 50}, screens).id, 1);
}

TEST(ResolveScreenTest, CenterOnSharedEdgeBelongsToRightScreen) {
    const std::vector<ScreenGeometry> screens = {
        screen(0, Rect{0, 0, 1920, 1080}, true),
        screen(1, Rect{1920, 0, 1920, 1080}),
    };
    EXPECT_EQ(resolve_screen(Rect{1910, 100, 20, 20}, screens).id, 1);
}

TEST(ResolveScreenTest, FallsBackToIntersectingScreen) {
    const std::vector<ScreenGeometry> screens = {
        screen(0, Rect{0, 0, 1920, 1080}, true),
        screen(1, Rect{1920, 0, 1920, 1080}),
    };
    // Center lies below every screen.
    EXPECT_EQ(resolve_screen(Rect{2000, 1000, 100, 400}, screens).id, 1);
}

TEST(ResolveScreenTest, FallsBackToPrimaryThenFirst) {
    std::vector<ScreenGeometry> screens = {
        screen(0, Rect{0, 0, 1920, 1080}),
        screen(1, Rect{1920, 0, 1920, 1080}, true),
    };
    const Rect offscreen{-5000, -5000, 10, 10};
    EXPECT_EQ(resolve_screen(offscreen, screens).id, 1);

    screens[1].primary = false;
    EXPECT_EQ(resolve_screen(offscreen, screens).id, 0);
}

TEST(ResolveScreenTest, ExtremeCoordinatesFallBackWithoutOverflow) {
    const std::vector<ScreenGeometry> screens = {
        screen(0, Rect{0, 0, 1920, 1080}),
        screen(1, Rect{1920, 0, 1280, 1024}, true),
    };
    const int big = std::numeric_limits<int>::max();
    const int small = std::numeric_limits<int>::min();
    EXPECT_EQ(resolve_screen(Rect{big - 10, 0, 100, 100}, screens).id, 1);
    EXPECT_EQ(resolve_screen(Rect{0, big - 10, big, big}, screens).id, 1);
    EXPECT_EQ(resolve_screen(Rect{small, small, 100, 100}, screens).id, 1);
    // Right edge lands at -1, just short of screen 0.
    EXPECT_EQ(resolve_screen(Rect{small, 10, big, 10}, screens).id, 1);
}

TEST(ResolveScreenTest, EmptyListThrows) {
    const std::vector<ScreenGeometry> screens;
    try {
        resolve_screen(Rect{0, 0, 10, 10}, screens);
        FAIL() << "expected OverlayError";
    } catch (const OverlayError& e) {
        EXPECT_EQ(e.code(), ErrorCode::NoScreenFound);
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// Popup sizing
// ─────────────────────────────────────────────────────────────────────────────

TEST(PopupSizeTest, AddsPaddingToMeasuredWidth) {
    const PopupSize size = popup_size("anything", FixedWidthMeasurer(200.2f));
    EXPECT_EQ(size.width, 201 + 60);
    EXPECT_EQ(size.height, 50);
}

TEST(PopupSizeTest, EnforcesMinimumWidth) {
    EXPECT_EQ(popup_size("", FixedWidthMeasurer(0.0f)).width, 100);
    EXPECT_EQ(popup_size("hi", FixedWidthMeasurer(39.0f)).width, 100);
    EXPECT_EQ(popup_size("hi", FixedWidthMeasurer(41.0f)).width, 101);
}

TEST(PopupSizeTest, UsesBitmapFontMetrics) {
    ui::BitmapFontMeasurer font;
    // 5 glyphs at 11.25 px advance = 56.25 px.
    EXPECT_EQ(popup_size("Hello", font).width, 57 + 60);
}

TEST(PopupSizeTest, InvalidMeasurementThrows) {
    const float bad[] = {-1.0f, std::numeric_limits<float>::quiet_NaN(), std::numeric_limits<float>::infinity()};
    for (float w : bad) {
        try {
            popup_size("x", FixedWidthMeasurer(w));
            FAIL() << "expected OverlayError for width " << w;
        } catch (const OverlayError& e) {
            EXPECT_EQ(e.code(), ErrorCode::MeasureFailure);
        }
    }
}

TEST(RectTest, MakeRectClampsNegativeSize) {
    EXPECT_EQ(make_rect(5, 6, -3, 4), (Rect{5, 6, 0, 4}));
    EXPECT_EQ(make_rect(5, 6, 3, -4), (Rect{5, 6, 3, 0}));
}

TEST(RectTest, EdgesAreComputedWithoutOverflow) {
    const int big = std::numeric_limits<int>::max();
    const Rect r{big - 10, 0, 100, 100};
    EXPECT_EQ(r.right(), std::int64_t{big} + 90);
    EXPECT_EQ(r.center_x(), std::int64_t{big} + 40);
    EXPECT_FALSE(contains(Rect{0, 0, 1920, 1080}, r.center_x(), r.center_y()));
    EXPECT_FALSE(intersects(r, Rect{0, 0, 1920, 1080}));
}

TEST(RectTest, CoordinateRange) {
    EXPECT_TRUE(within_coordinate_range(Rect{-1280, 200, 1920, 1080}));
    EXPECT_TRUE(within_coordinate_range(Rect{-kMaxCoordinate, kMaxCoordinate, kMaxCoordinate, 0}));
    EXPECT_FALSE(within_coordinate_range(Rect{kMaxCoordinate + 1, 0, 10, 10}));
    EXPECT_FALSE(within_coordinate_range(Rect{0, std::numeric_limits<int>::min(), 10, 10}));
    EXPECT_FALSE(within_coordinate_range(Rect{0, 0, std::numeric_limits<int>::max(), 10}));
}

TEST(RectTest, LocalGlobalConversion) {
    const ScreenGeometry s = screen(1, Rect{-1280, 200, 1280, 1024});
    const Rect global{-1000, 300, 40, 30};
    const Rect local = to_local(global, s);
    EXPECT_EQ(local, (Rect{280, 100, 40, 30}));
    EXPECT_EQ(to_global(local, s), global);
}
