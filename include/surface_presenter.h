#pragma once

#include "fm_types.h"
#include "rendered_frame.h"

namespace fm {

class SurfacePresenter {
public:
    virtual ~SurfacePresenter() = default;

    // Shows the frame as a topmost, click-through layer with its top-left at origin
    // (global coordinates). Takes ownership of the frame. Returns false when the frame
    // was rejected.
    virtual bool present(Point origin, RenderedFrame&& frame) = 0;
};

} // namespace fm
