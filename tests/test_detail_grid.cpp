#include "flypath/core/errors.hpp"
#include "flypath/planning/detail_grid.hpp"

#include <catch2/catch_test_macros.hpp>

#include <limits>
#include <stdexcept>
#include <vector>

using flypath::Cell;
using flypath::ImageInfo;
using flypath::PixelRect;
using flypath::ScoringError;
using flypath::ValidationError;
using flypath::planning::build_cell_grid;
using flypath::planning::score_detail_grid;

namespace {

// Records every rect it sees and scores cells by a caller-supplied list.
class RecordingScorer : public flypath::pipeline::ICellScorer {
public:
  std::vector<PixelRect> seen;
  std::vector<float> scores;

  float cell_score(const PixelRect &rect) override {
    const size_t i = seen.size();
    seen.push_back(rect);
    return i < scores.size() ? scores[i] : 0.0f;
  }
};

class ThrowingScorer : public flypath::pipeline::ICellScorer {
public:
  int calls = 0;
  float cell_score(const PixelRect &) override {
    if (++calls == 3)
      throw std::runtime_error("edge detector crashed");
    return 0.5f;
  }
};

} // namespace

TEST_CASE("cell_grid_uniform_1000x800_grid_10") {
  auto cells = build_cell_grid(ImageInfo{1000, 800}, 10);
  REQUIRE(cells.size() == 100);
  for (const Cell &c : cells) {
    REQUIRE(c.rect.width == 100);
    REQUIRE(c.rect.height == 80);
    REQUIRE(c.cx == c.rect.x + 50);
    REQUIRE(c.cy == c.rect.y + 40);
    REQUIRE(c.index == c.row * 10 + c.col);
  }
  REQUIRE(cells[0].cx == 50);
  REQUIRE(cells[0].cy == 40);
  REQUIRE(cells[99].rect.x == 900);
  REQUIRE(cells[99].rect.y == 720);
}

TEST_CASE("cell_grid_last_row_and_column_absorb_remainder") {
  const ImageInfo img{1003, 807};
  auto cells = build_cell_grid(img, 10);
  REQUIRE(cells.size() == 100);

  long long area = 0;
  for (const Cell &c : cells) {
    area += static_cast<long long>(c.rect.width) * c.rect.height;
    REQUIRE(c.rect.x + c.rect.width <= img.width);
    REQUIRE(c.rect.y + c.rect.height <= img.height);
  }
  REQUIRE(area == 1003LL * 807LL);
  REQUIRE(cells[9].rect.width == 103);
  REQUIRE(cells[90].rect.height == 87);
  REQUIRE(cells[0].rect.width == 100);
}

TEST_CASE("cell_grid_cells_do_not_overlap") {
  auto cells = build_cell_grid(ImageInfo{37, 23}, 4);
  std::vector<int> hits(37 * 23, 0);
  for (const Cell &c : cells) {
    for (int y = c.rect.y; y < c.rect.y + c.rect.height; ++y)
      for (int x = c.rect.x; x < c.rect.x + c.rect.width; ++x)
        hits[static_cast<size_t>(y * 37 + x)]++;
  }
  for (int h : hits)
    REQUIRE(h == 1);
}

TEST_CASE("cell_grid_rejects_bad_grid") {
  REQUIRE_THROWS_AS(build_cell_grid(ImageInfo{100, 100}, 0), ValidationError);
  REQUIRE_THROWS_AS(build_cell_grid(ImageInfo{100, 5}, 6), ValidationError);
  REQUIRE_THROWS_AS(build_cell_grid(ImageInfo{0, 100}, 2),
                    flypath::InvalidImageError);
}

TEST_CASE("score_detail_grid_calls_scorer_once_per_cell_in_row_major_order") {
  RecordingScorer scorer;
  scorer.scores = {0.1f, 0.9f, 0.3f, 0.4f};
  auto cells = score_detail_grid(ImageInfo{40, 20}, 2, scorer);

  REQUIRE(scorer.seen.size() == 4);
  REQUIRE(scorer.seen[0] == PixelRect{0, 0, 20, 10});
  REQUIRE(scorer.seen[1] == PixelRect{20, 0, 20, 10});
  REQUIRE(scorer.seen[2] == PixelRect{0, 10, 20, 10});
  REQUIRE(scorer.seen[3] == PixelRect{20, 10, 20, 10});
  REQUIRE(cells[1].score == 0.9f);
  REQUIRE(cells[3].score == 0.4f);
}

TEST_CASE("score_detail_grid_wraps_scorer_failure") {
  ThrowingScorer scorer;
  REQUIRE_THROWS_AS(score_detail_grid(ImageInfo{100, 100}, 3, scorer),
                    ScoringError);
  REQUIRE(scorer.calls == 3);
}

TEST_CASE("score_detail_grid_rejects_non_finite_score") {
  RecordingScorer scorer;
  scorer.scores = {0.2f, std::numeric_limits<float>::quiet_NaN()};
  REQUIRE_THROWS_AS(score_detail_grid(ImageInfo{10, 10}, 2, scorer),
                    ScoringError);

  RecordingScorer inf_scorer;
  inf_scorer.scores = {std::numeric_limits<float>::infinity()};
  REQUIRE_THROWS_AS(score_detail_grid(ImageInfo{10, 10}, 2, inf_scorer),
                    ScoringError);
}

TEST_CASE("score_detail_grid_checks_geometry_before_scoring") {
  RecordingScorer scorer;
  REQUIRE_THROWS_AS(score_detail_grid(ImageInfo{8, 8}, 9, scorer),
                    ValidationError);
  REQUIRE(scorer.seen.empty());
}
