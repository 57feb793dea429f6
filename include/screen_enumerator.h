#pragma once

#include <iosfwd>
#include <span>
#include <vector>

#include "fm_types.h"

namespace fm {

// Connected monitors in desktop coordinates. GLFW must already be initialized.
std::vector<ScreenGeometry> enumerate_screens();

void print_screens(std::ostream& out, std::span<const ScreenGeometry> screens);

} // namespace fm
