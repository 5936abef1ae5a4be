#pragma once

#include "flypath/core/types.hpp"

namespace flypath::planning {

// Size floor(W / zoom) x floor(H / zoom), at least 1x1, centered on the camera
// position and shifted (never scaled) to lie inside the image. Throws
// ValidationError for zoom < 1.0 or a non-finite zoom.
Viewport resolve_viewport(const CameraState& state, const ImageInfo& image);

} // namespace flypath::planning
