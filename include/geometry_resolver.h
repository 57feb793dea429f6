#pragma once

#include <span>
#include <string_view>

#include "fm_types.h"
#include "text_measurer.h"

namespace fm {

inline constexpr int kPopupGapPx = 8;
inline constexpr int kPopupEdgeMarginPx = 10;
inline constexpr int kPopupPaddingPx = 40; // 20 px each side
inline constexpr int kPopupExtraPx = 20;
inline constexpr int kPopupMinWidthPx = 100;
inline constexpr int kPopupHeightPx = 50;

struct PopupSize {
    int width = 0;
    int height = 0;
};

// Display hosting the target: the one containing its center, else the first one it
// intersects, else the primary. Throws OverlayError(NoScreenFound) for an empty list.
const ScreenGeometry& resolve_screen(const Rect& target, std::span<const ScreenGeometry> screens);

// Centers the popup horizontally over the anchor and places it above, falling back to
// below when there is no room. Input and output are global coordinates.
Rect place_popup(const Rect& anchor, const ScreenGeometry& screen, int popup_width, int popup_height);

PopupSize popup_size(std::string_view text, const TextMeasurer& measurer);

Rect to_local(const Rect& r, const ScreenGeometry& screen);
Rect to_global(const Rect& r, const ScreenGeometry& screen);

} // namespace fm
