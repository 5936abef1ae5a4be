#include "flypath/planning/waypoints.hpp"

#include "flypath/core/errors.hpp"

#include <algorithm>

namespace flypath::planning {

std::vector<Cell> select_top_cells(const std::vector<Cell>& cells, int k) {
    if (k < 0) {
        throw ValidationError("top_k must be >= 0");
    }

    const size_t n = std::min(static_cast<size_t>(k), cells.size());

    std::vector<Cell> ranked = cells;
    std::partial_sort(ranked.begin(), ranked.begin() + static_cast<std::ptrdiff_t>(n), ranked.end(),
                      [](const Cell& a, const Cell& b) {
                          if (a.score != b.score) return a.score > b.score;
                          return a.index < b.index;
                      });
    ranked.resize(n);
    return ranked;
}

Waypoint image_center(const ImageInfo& image) {
    Waypoint wp;
    wp.x = image.width / 2;
    wp.y = image.height / 2;
    wp.zoom = 1.0;
    return wp;
}

std::vector<Waypoint> build_waypoints(const ImageInfo& image,
                                      const std::vector<Cell>& cells,
                                      int k,
                                      double zoom_medium) {
    const std::vector<Cell> selected = select_top_cells(cells, k);
    const Waypoint center = image_center(image);

    std::vector<Waypoint> waypoints;
    waypoints.reserve(selected.size() + 2);
    waypoints.push_back(center);
    for (const Cell& c : selected) {
        Waypoint wp;
        wp.x = c.cx;
        wp.y = c.cy;
        wp.zoom = zoom_medium;
        waypoints.push_back(wp);
    }
    waypoints.push_back(center);
    return waypoints;
}

} // namespace flypath::planning
