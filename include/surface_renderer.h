#pragma once

#include "annotation.h"
#include "fm_types.h"
#include "rendered_frame.h"
#include "text_measurer.h"
#include "ui/ui_canvas.h"
#include "ui/ui_text.h"

namespace fm {

struct RenderStyle {
    ui::Rgb8 accent{0, 122, 255};
    float border_width_px = 2.0f;
    float border_alpha_gain = 4.0f;

    ui::Rgb8 popup_start{38, 77, 191}; // bottom-left
    ui::Rgb8 popup_end{89, 64, 179};   // top-right
    float corner_radius_px = 16.0f;

    ui::Rgb8 text_color{255, 255, 255};
    ui::Rgb8 shadow_color{0, 0, 0};
    float shadow_alpha = 0.3f;
    float shadow_offset_px = 1.0f;
    float text_margin_px = 20.0f;
};

class SurfaceRenderer {
public:
    explicit SurfaceRenderer(const ui::BitmapFontMeasurer& font, RenderStyle style = {});

    // bounds is the render surface in global coordinates; the frame has its size and origin.
    RenderedFrame render(const Annotation& kind, float opacity, const Rect& bounds) const;

    const RenderStyle& style() const { return style_; }

private:
    void draw_highlight(ui::Canvas& canvas, const HighlightAnnotation& h, float opacity, const Rect& bounds) const;
    void draw_popup(ui::Canvas& canvas, const PopupAnnotation& p, float opacity) const;

    const ui::BitmapFontMeasurer& font_;
    RenderStyle style_;
};

} // namespace fm
