#include "flypath/planning/viewport.hpp"

#include "flypath/core/errors.hpp"

#include <algorithm>
#include <cmath>
#include <string>

namespace flypath::planning {

Viewport resolve_viewport(const CameraState& state, const ImageInfo& image) {
    if (image.width < 1 || image.height < 1) {
        throw InvalidImageError("image has zero area");
    }
    if (!std::isfinite(state.zoom) || state.zoom < 1.0) {
        throw ValidationError("viewport zoom must be finite and >= 1.0, got " +
                              std::to_string(state.zoom));
    }

    Viewport vp;
    vp.width = std::max(1, static_cast<int>(std::floor(static_cast<double>(image.width) / state.zoom)));
    vp.height = std::max(1, static_cast<int>(std::floor(static_cast<double>(image.height) / state.zoom)));

    vp.x = state.x - vp.width / 2;
    vp.y = state.y - vp.height / 2;

    // Low bound first, high bound last.
    if (vp.x < 0) vp.x = 0;
    if (vp.x + vp.width > image.width) vp.x = image.width - vp.width;
    if (vp.y < 0) vp.y = 0;
    if (vp.y + vp.height > image.height) vp.y = image.height - vp.height;

    return vp;
}

} // namespace flypath::planning
