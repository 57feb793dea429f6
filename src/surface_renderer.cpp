#include "surface_renderer.h"

#include <algorithm>
#include <cmath>
#include <new>
#include <string>

#include "overlay_error.h"

namespace fm {

SurfaceRenderer::SurfaceRenderer(const ui::BitmapFontMeasurer& font, RenderStyle style)
    : font_(font), style_(style) {}

RenderedFrame SurfaceRenderer::render(const Annotation& kind, float opacity, const Rect& bounds) const {
    RenderedFrame frame;
    frame.origin = bounds.origin();
    frame.width = std::max(0, bounds.w);
    frame.height = std::max(0, bounds.h);
    try {
        ui::Canvas canvas(frame.width, frame.height);
        // Zero (or NaN) opacity must never touch the drawing path.
        if (opacity > 0.0f) {
            opacity = std::min(opacity, 1.0f);
            if (const auto* h = std::get_if<HighlightAnnotation>(&kind)) {
                draw_highlight(canvas, *h, opacity, bounds);
            } else {
                draw_popup(canvas, std::get<PopupAnnotation>(kind), opacity);
            }
        }
        frame.rgba = canvas.take_pixels();
    } catch (const std::bad_alloc&) {
        throw OverlayError(ErrorCode::RenderFailure,
                           "Out of memory rendering a " + std::to_string(frame.width) + "x" +
                               std::to_string(frame.height) + " surface");
    }
    return frame;
}

void SurfaceRenderer::draw_highlight(ui::Canvas& canvas, const HighlightAnnotation& h, float opacity,
                                     const Rect& bounds) const {
    const ui::Rect r{static_cast<float>(h.rect.x - bounds.x), static_cast<float>(h.rect.y - bounds.y),
                     static_cast<float>(h.rect.w), static_cast<float>(h.rect.h)};
    canvas.fill_rect(r, ui::to_color(style_.accent, opacity));
    const float border_alpha = std::min(1.0f, opacity * style_.border_alpha_gain);
    canvas.stroke_rect(r, ui::to_color(style_.accent, border_alpha), style_.border_width_px);
}

void SurfaceRenderer::draw_popup(ui::Canvas& canvas, const PopupAnnotation& p, float opacity) const {
    const float w = static_cast<float>(canvas.width());
    const float h = static_cast<float>(canvas.height());

    ui::LinearGradient gradient;
    gradient.start = ui::Vec2{0.0f, h};
    gradient.end = ui::Vec2{w, 0.0f};
    gradient.start_color = ui::to_color(style_.popup_start, opacity);
    gradient.end_color = ui::to_color(style_.popup_end, opacity);
    canvas.fill_round_rect(ui::Rect{0.0f, 0.0f, w, h}, style_.corner_radius_px, gradient);

    const float avail = w - 2.0f * style_.text_margin_px;
    const std::string line = ui::ellipsize(p.text, avail, kPopupFont.size_px);
    if (line.empty()) return;
    const TextExtent extent = font_.measure(line, kPopupFont);

    ui::TextDrawParams params;
    params.size_px = kPopupFont.size_px;
    params.origin_px.x = style_.text_margin_px + (avail - extent.width) * 0.5f;
    params.origin_px.y = (h - extent.height) * 0.5f;

    ui::TextDrawParams shadow = params;
    shadow.origin_px.y += style_.shadow_offset_px;
    shadow.color = ui::to_color(style_.shadow_color, opacity * style_.shadow_alpha);
    ui::draw_text(canvas, line, shadow);

    params.color = ui::to_color(style_.text_color, opacity);
    ui::draw_text(canvas, line, params);
}

} // namespace fm
