#pragma once

#include "flypath/core/types.hpp"
#include "flypath/pipeline/ports.hpp"

#include <vector>

namespace flypath::planning {

// Row-major GRID x GRID cells covering the image exactly once. Base cell size
// is (W / grid, H / grid); the last column and row absorb the remainder.
// Scores are zero. Throws ValidationError for grid < 1 and also for grid > W
// or grid > H, a tighter bound than grid >= 1 alone: such a grid would have
// zero-width or zero-height cells.
std::vector<Cell> build_cell_grid(const ImageInfo& image, int grid);

// build_cell_grid plus one scorer call per cell, in row-major order.
// Throws ScoringError if the scorer throws or returns a non-finite value.
std::vector<Cell> score_detail_grid(const ImageInfo& image,
                                    int grid,
                                    pipeline::ICellScorer& scorer);

} // namespace flypath::planning
