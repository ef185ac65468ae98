#include "skydome/core/errors.hpp"
#include "skydome/geometry/dome_grid.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <cmath>

using skydome::CellClass;
using skydome::SampleBatch;
using skydome::geometry::DomeGrid;
using skydome::geometry::DomeGridSpec;

TEST_CASE("grid_dimensions_at_one_degree") {
  DomeGrid grid;
  REQUIRE(grid.theta_steps() == 61);
  REQUIRE(grid.phi_steps() == 361);
  REQUIRE(grid.total_cells() == 22021);
  REQUIRE(grid.sky_flags().size() == 22021);
  REQUIRE(grid.sample_counts().size() == 22021);
}

TEST_CASE("grid_dimensions_at_coarser_resolutions") {
  DomeGridSpec spec;
  spec.resolution_degrees = 2.0;
  DomeGrid two(spec);
  REQUIRE(two.theta_steps() == 31);
  REQUIRE(two.phi_steps() == 181);

  spec.resolution_degrees = 7.0;
  DomeGrid seven(spec);
  REQUIRE(seven.theta_steps() == 9);   // floor(60 / 7) + 1
  REQUIRE(seven.phi_steps() == 52);    // floor(360 / 7) + 1
}

TEST_CASE("grid_rejects_bad_resolution") {
  DomeGridSpec spec;
  spec.resolution_degrees = 0.0;
  REQUIRE_THROWS_AS(DomeGrid(spec), skydome::ValidationError);
  spec.resolution_degrees = -1.0;
  REQUIRE_THROWS_AS(DomeGrid(spec), skydome::ValidationError);
  spec.resolution_degrees = std::nan("");
  REQUIRE_THROWS_AS(DomeGrid(spec), skydome::ValidationError);
}

TEST_CASE("cell_center_maps_back_to_its_cell") {
  DomeGrid grid;
  for (int i = 0; i < grid.theta_steps(); ++i) {
    for (int j = 0; j < grid.phi_steps(); ++j) {
      const auto c = grid.cell_center(i, j);
      const auto idx = grid.spherical_to_grid_index(c.theta, c.phi);
      REQUIRE(idx.has_value());
      REQUIRE(idx->theta_idx == i);
      REQUIRE(idx->phi_idx == j);
    }
  }
}

TEST_CASE("spherical_to_grid_index_rejects_outside_values") {
  DomeGrid grid;
  REQUIRE_FALSE(grid.spherical_to_grid_index(-0.01, 0.0).has_value());
  REQUIRE_FALSE(grid.spherical_to_grid_index(0.1, -0.01).has_value());
  REQUIRE_FALSE(grid.spherical_to_grid_index(2.0, 0.0).has_value());
  REQUIRE_FALSE(grid.spherical_to_grid_index(std::nan(""), 0.0).has_value());
  REQUIRE_FALSE(grid.spherical_to_grid_index(0.1, INFINITY).has_value());

  const auto zenith = grid.spherical_to_grid_index(0.0, 0.0);
  REQUIRE(zenith.has_value());
  REQUIRE(zenith->theta_idx == 0);
  REQUIRE(zenith->phi_idx == 0);
}

TEST_CASE("fresh_grid_statistics") {
  DomeGrid grid;
  const auto st = grid.coverage_statistics();
  REQUIRE(st.total_cells == 22021);
  REQUIRE(st.sampled_cells == 0);
  REQUIRE(st.sky_cells == 0);
  REQUIRE(st.unsampled_cells == 22021);
  REQUIRE(st.coverage_percent == Catch::Approx(0.0));
  REQUIRE(st.sky_percent == Catch::Approx(0.0));
  REQUIRE(st.unsampled_percent == Catch::Approx(100.0));
  REQUIRE(grid.classify(0, 0) == CellClass::UNSAMPLED);
}

TEST_CASE("sky_flag_is_sticky") {
  DomeGrid grid;
  grid.add_sample(5, 10, true);
  grid.add_sample(5, 10, false);
  REQUIRE(grid.is_sky(5, 10));
  REQUIRE(grid.sample_count(5, 10) == 2);
  REQUIRE(grid.classify(5, 10) == CellClass::SKY);

  grid.add_sample(6, 10, false);
  REQUIRE_FALSE(grid.is_sky(6, 10));
  REQUIRE(grid.classify(6, 10) == CellClass::NOT_SKY);
}

TEST_CASE("counts_and_flags_never_decrease") {
  DomeGrid grid;
  auto prev_counts = grid.sample_counts();
  auto prev_sky = grid.sky_flags();

  const int cells[][3] = {{0, 0, 1}, {0, 0, 0}, {3, 4, 0}, {3, 4, 1}, {60, 360, 0}, {0, 0, 0}};
  for (const auto& c : cells) {
    grid.add_sample(c[0], c[1], c[2] != 0);
    const auto& counts = grid.sample_counts();
    const auto& sky = grid.sky_flags();
    for (size_t k = 0; k < counts.size(); ++k) {
      REQUIRE(counts[k] >= prev_counts[k]);
      REQUIRE(sky[k] >= prev_sky[k]);
    }
    prev_counts = counts;
    prev_sky = sky;
  }
  REQUIRE(grid.sample_count(0, 0) == 3);
}

TEST_CASE("statistics_after_samples") {
  DomeGridSpec spec;
  spec.resolution_degrees = 30.0;  // 3 x 13 cells
  DomeGrid grid(spec);
  REQUIRE(grid.total_cells() == 39);

  grid.add_sample(0, 0, true);
  grid.add_sample(0, 1, false);
  grid.add_sample(1, 1, false);
  grid.add_sample(1, 2, true);

  const auto st = grid.coverage_statistics();
  REQUIRE(st.sampled_cells == 4);
  REQUIRE(st.sky_cells == 2);
  REQUIRE(st.not_sky_cells == 2);
  REQUIRE(st.unsampled_cells == 35);
  REQUIRE(st.coverage_percent == Catch::Approx(100.0 * 4 / 39));
  REQUIRE(st.sky_percent == Catch::Approx(50.0));
  REQUIRE(st.not_sky_percent == Catch::Approx(50.0));
}

TEST_CASE("apply_rejects_out_of_range_batch_without_partial_update") {
  DomeGrid grid;
  SampleBatch batch;
  batch.index = 3;
  batch.samples.push_back({1, 1, true});
  batch.samples.push_back({61, 0, true});

  REQUIRE_THROWS_AS(grid.apply(batch), skydome::ValidationError);
  REQUIRE(grid.sample_count(1, 1) == 0);
  REQUIRE_FALSE(grid.is_sky(1, 1));
}

TEST_CASE("grids_compare_equal_by_content") {
  DomeGrid a;
  DomeGrid b;
  REQUIRE(a.equals(b));
  a.add_sample(2, 2, true);
  REQUIRE_FALSE(a.equals(b));
  b.add_sample(2, 2, true);
  REQUIRE(a.equals(b));
}
