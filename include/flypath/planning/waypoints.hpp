#pragma once

#include "flypath/core/types.hpp"

#include <vector>

namespace flypath::planning {

// Highest scoring cells, best first. Equal scores keep the lower cell index
// first. k larger than cells.size() selects every cell.
std::vector<Cell> select_top_cells(const std::vector<Cell>& cells, int k);

// (W/2, H/2) at zoom 1.0
Waypoint image_center(const ImageInfo& image);

// [center] ++ top-k cell centers at zoom_medium ++ [center]
std::vector<Waypoint> build_waypoints(const ImageInfo& image,
                                      const std::vector<Cell>& cells,
                                      int k,
                                      double zoom_medium);

} // namespace flypath::planning
