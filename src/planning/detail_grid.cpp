#include "flypath/planning/detail_grid.hpp"

#include "flypath/core/errors.hpp"

#include <cmath>
#include <string>

namespace flypath::planning {

namespace {

std::string describe_cell(const Cell& c) {
    return "cell " + std::to_string(c.index) + " (row " + std::to_string(c.row) +
           ", col " + std::to_string(c.col) + ", " + std::to_string(c.rect.width) +
           "x" + std::to_string(c.rect.height) + "+" + std::to_string(c.rect.x) +
           "+" + std::to_string(c.rect.y) + ")";
}

} // namespace

std::vector<Cell> build_cell_grid(const ImageInfo& image, int grid) {
    if (image.width < 1 || image.height < 1) {
        throw InvalidImageError("image has zero area (" + std::to_string(image.width) +
                                "x" + std::to_string(image.height) + ")");
    }
    if (grid < 1) {
        throw ValidationError("grid size must be >= 1");
    }
    if (grid > image.width || grid > image.height) {
        throw ValidationError("grid size " + std::to_string(grid) +
                              " leaves empty cells on a " + std::to_string(image.width) +
                              "x" + std::to_string(image.height) + " image");
    }

    const int cell_w = image.width / grid;
    const int cell_h = image.height / grid;

    std::vector<Cell> cells;
    cells.reserve(static_cast<size_t>(grid) * static_cast<size_t>(grid));

    for (int gy = 0; gy < grid; ++gy) {
        for (int gx = 0; gx < grid; ++gx) {
            Cell c;
            c.index = gy * grid + gx;
            c.row = gy;
            c.col = gx;
            c.rect.x = gx * cell_w;
            c.rect.y = gy * cell_h;
            c.rect.width = (gx == grid - 1) ? image.width - c.rect.x : cell_w;
            c.rect.height = (gy == grid - 1) ? image.height - c.rect.y : cell_h;
            c.cx = c.rect.x + c.rect.width / 2;
            c.cy = c.rect.y + c.rect.height / 2;
            cells.push_back(c);
        }
    }

    return cells;
}

std::vector<Cell> score_detail_grid(const ImageInfo& image,
                                    int grid,
                                    pipeline::ICellScorer& scorer) {
    const std::vector<Cell> geometry = build_cell_grid(image, grid);

    std::vector<Cell> scored;
    scored.reserve(geometry.size());
    for (const Cell& c : geometry) {
        float score = 0.0f;
        try {
            score = scorer.cell_score(c.rect);
        } catch (const ScoringError&) {
            throw;
        } catch (const std::exception& e) {
            throw ScoringError(describe_cell(c) + ": " + e.what());
        }
        if (!std::isfinite(score)) {
            throw ScoringError(describe_cell(c) + ": non-finite score");
        }
        Cell out = c;
        out.score = score;
        scored.push_back(out);
    }

    return scored;
}

} // namespace flypath::planning
