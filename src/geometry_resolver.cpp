#include "geometry_resolver.h"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <string>

#include "overlay_error.h"

namespace fm {

namespace {

int saturate(std::int64_t v) {
    return static_cast<int>(std::clamp<std::int64_t>(v, std::numeric_limits<int>::min(),
                                                     std::numeric_limits<int>::max()));
}

} // namespace

const ScreenGeometry& resolve_screen(const Rect& target, std::span<const ScreenGeometry> screens) {
    if (screens.empty()) {
        throw OverlayError(ErrorCode::NoScreenFound, "No screens available to host the overlay");
    }
    const std::int64_t cx = target.center_x();
    const std::int64_t cy = target.center_y();
    for (const ScreenGeometry& s : screens) {
        if (contains(s.bounds, cx, cy)) return s;
    }
    for (const ScreenGeometry& s : screens) {
        if (intersects(s.bounds, target)) return s;
    }
    auto primary = std::find_if(screens.begin(), screens.end(),
                                [](const ScreenGeometry& s) { return s.primary; });
    return primary != screens.end() ? *primary : screens.front();
}

Rect place_popup(const Rect& anchor, const ScreenGeometry& screen, int popup_width, int popup_height) {
    // Screen-local, in 64 bits so far-off anchors cannot overflow.
    const std::int64_t ax = std::int64_t{anchor.x} - screen.bounds.x;
    const std::int64_t ay = std::int64_t{anchor.y} - screen.bounds.y;
    std::int64_t x = ax + (std::int64_t{anchor.w} - popup_width) / 2;
    std::int64_t y = ay - popup_height - kPopupGapPx;

    const std::int64_t screen_w = screen.bounds.w;
    if (x + popup_width > screen_w - kPopupEdgeMarginPx) x = screen_w - kPopupEdgeMarginPx - popup_width;
    if (x < kPopupEdgeMarginPx) x = kPopupEdgeMarginPx;
    // No room above: drop below the anchor. The bottom edge is not re-clamped.
    if (y < kPopupEdgeMarginPx) y = ay + anchor.h + kPopupGapPx;

    return Rect{saturate(x + screen.bounds.x), saturate(y + screen.bounds.y), popup_width, popup_height};
}

PopupSize popup_size(std::string_view text, const TextMeasurer& measurer) {
    const TextExtent extent = measurer.measure(text, kPopupFont);
    if (!std::isfinite(extent.width) || extent.width < 0.0f) {
        throw OverlayError(ErrorCode::MeasureFailure,
                           "Text measurement returned an invalid width for font '" +
                               std::string(kPopupFont.family) + "'");
    }
    const int measured = static_cast<int>(std::ceil(extent.width));
    PopupSize size;
    size.width = std::max(measured + kPopupPaddingPx + kPopupExtraPx, kPopupMinWidthPx);
    size.height = kPopupHeightPx;
    return size;
}

Rect to_local(const Rect& r, const ScreenGeometry& screen) {
    return Rect{saturate(std::int64_t{r.x} - screen.bounds.x), saturate(std::int64_t{r.y} - screen.bounds.y), r.w, r.h};
}

Rect to_global(const Rect& r, const ScreenGeometry& screen) {
    return Rect{saturate(std::int64_t{r.x} + screen.bounds.x), saturate(std::int64_t{r.y} + screen.bounds.y), r.w, r.h};
}

} // namespace fm
