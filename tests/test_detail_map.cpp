#include "flypath/core/errors.hpp"
#include "flypath/image/detail_map.hpp"
#include "flypath/planning/detail_grid.hpp"

#include <catch2/catch_test_macros.hpp>

#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>

using flypath::ImageInfo;
using flypath::PixelRect;
using flypath::config::DetailConfig;
using flypath::image::EdgeMapCellScorer;
using flypath::image::compute_edge_map;

namespace {

// Black 64x64 canvas with a white square covering [24,40)
cv::Mat square_image() {
  cv::Mat img(64, 64, CV_8UC3, cv::Scalar(0, 0, 0));
  cv::rectangle(img, cv::Rect(24, 24, 16, 16), cv::Scalar(255, 255, 255), cv::FILLED);
  return img;
}

} // namespace

TEST_CASE("edge_map_is_binary_and_image_sized") {
  auto map = compute_edge_map(square_image(), DetailConfig{});
  REQUIRE(map.rows() == 64);
  REQUIRE(map.cols() == 64);
  REQUIRE(map.maxCoeff() == 1.0f);
  REQUIRE(map.minCoeff() == 0.0f);
  for (int i = 0; i < map.size(); ++i) {
    const float v = map.data()[i];
    REQUIRE((v == 0.0f || v == 1.0f));
  }
}

TEST_CASE("edge_map_of_flat_image_is_empty") {
  cv::Mat flat(32, 48, CV_8UC1, cv::Scalar(128));
  auto map = compute_edge_map(flat, DetailConfig{});
  REQUIRE(map.maxCoeff() == 0.0f);
}

TEST_CASE("edge_scorer_prefers_cells_on_the_square_outline") {
  EdgeMapCellScorer scorer(compute_edge_map(square_image(), DetailConfig{}));
  auto cells = flypath::planning::score_detail_grid(ImageInfo{64, 64}, 4, scorer);

  // corner cell is blank, cell (1,1) holds the top-left corner of the square
  REQUIRE(cells[0].score == 0.0f);
  REQUIRE(cells[5].score > 0.0f);
  REQUIRE(cells[5].score <= 1.0f);
}

TEST_CASE("edge_scorer_rejects_rect_outside_map") {
  EdgeMapCellScorer scorer(compute_edge_map(square_image(), DetailConfig{}));
  REQUIRE_THROWS_AS(scorer.cell_score(PixelRect{60, 0, 8, 8}), flypath::ScoringError);
  REQUIRE_THROWS_AS(scorer.cell_score(PixelRect{0, 0, 0, 8}), flypath::ScoringError);
}

TEST_CASE("edge_map_rejects_empty_image") {
  REQUIRE_THROWS_AS(compute_edge_map(cv::Mat(), DetailConfig{}), flypath::InvalidImageError);
}
