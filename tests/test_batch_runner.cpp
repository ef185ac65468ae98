#include "skydome/core/errors.hpp"
#include "skydome/core/events.hpp"
#include "skydome/core/utils.hpp"
#include "skydome/io/image_io.hpp"
#include "skydome/pipeline/batch_runner.hpp"
#include "skydome/pipeline/bounded_channel.hpp"

#include <catch2/catch_test_macros.hpp>

#include <opencv2/imgcodecs.hpp>

#include <algorithm>
#include <atomic>
#include <filesystem>
#include <sstream>
#include <thread>

namespace fs = std::filesystem;
using skydome::PhotoRecord;
using skydome::config::Config;
using skydome::core::EventEmitter;
using skydome::geometry::DomeGrid;
using skydome::pipeline::BatchRunner;
using skydome::pipeline::BoundedChannel;

namespace {

Config small_config() {
  Config cfg;
  cfg.camera.image_width = 300;
  cfg.camera.image_height = 400;
  cfg.aggregation.sample_step = 5;
  cfg.runtime.parallel_workers = 2;
  return cfg;
}

PhotoRecord record(int index, double alpha, double beta) {
  PhotoRecord r;
  r.index = index;
  r.timestamp = 1718000000000LL + index;
  r.alpha = alpha;
  r.beta = beta;
  r.gamma = 0.0;
  r.photo_uri = "content://media/IMG_" + std::to_string(index) + ".png";
  return r;
}

// Writes IMG_<index>.png for every record except those listed in `skip`.
fs::path make_photos(const fs::path& dir, const std::vector<PhotoRecord>& records,
                     const std::vector<int>& skip = {}) {
  const fs::path photos = dir / "photos";
  fs::create_directories(photos);
  cv::Mat img(400, 300, CV_8UC3, cv::Scalar(40, 40, 40));
  img(cv::Rect(0, 0, 300, 100)).setTo(cv::Scalar(230, 210, 200));
  for (const auto& r : records) {
    if (std::find(skip.begin(), skip.end(), r.index) != skip.end()) {
      continue;
    }
    cv::imwrite((photos / ("IMG_" + std::to_string(r.index) + ".png")).string(), img);
  }
  return photos;
}

fs::path scratch(const std::string& name) {
  const fs::path dir = fs::temp_directory_path() / name;
  fs::remove_all(dir);
  fs::create_directories(dir);
  return dir;
}

} // namespace

TEST_CASE("bounded_channel_delivers_everything_then_closes") {
  BoundedChannel<int> channel(2);
  std::atomic<int> accepted{0};
  std::thread producer([&]() {
      for (int i = 0; i < 50; ++i) {
          if (channel.push(i)) {
              ++accepted;
          }
      }
      channel.close();
  });

  int sum = 0;
  int n = 0;
  while (auto v = channel.pop()) {
    sum += *v;
    ++n;
  }
  producer.join();
  REQUIRE(accepted == 50);
  REQUIRE(n == 50);
  REQUIRE(sum == 49 * 50 / 2);
  REQUIRE_FALSE(channel.push(1));
}

TEST_CASE("segmentation_failures_are_isolated") {
  const fs::path dir = scratch("skydome_test_stage1");
  const std::vector<PhotoRecord> records = {record(0, 0.0, 0.0), record(1, 1.0, 0.2),
                        record(2, 2.0, 0.4)};
  const fs::path photos = make_photos(dir, records, {1});

  std::ostringstream events;
  EventEmitter emitter;
  BatchRunner runner(small_config(), "test", emitter, events);
  const auto counters = runner.run_segmentation_stage(records, photos, dir / "masks");

  REQUIRE(counters.total == 3);
  REQUIRE(counters.success == 2);
  REQUIRE(counters.failed == 1);
  REQUIRE(runner.segmented_indices() == std::vector<int>{0, 2});
  REQUIRE(fs::exists(dir / "masks" / "0.png"));
  REQUIRE_FALSE(fs::exists(dir / "masks" / "1.png"));
  REQUIRE(fs::exists(dir / "masks" / "2.png"));
  REQUIRE(events.str().find("\"photo_processed\"") != std::string::npos);
  fs::remove_all(dir);
}

TEST_CASE("message_passing_matches_sequential") {
  const fs::path dir = scratch("skydome_test_stage2");
  std::vector<PhotoRecord> records;
  for (int i = 0; i < 8; ++i) {
    records.push_back(record(i, 0.7 * i, 0.1 * (i % 4)));
  }
  const fs::path photos = make_photos(dir, records);

  std::ostringstream events;
  EventEmitter emitter;

  Config seq_cfg = small_config();
  BatchRunner seq(seq_cfg, "seq", emitter, events);
  REQUIRE(seq.run_segmentation_stage(records, photos, dir / "masks").success == 8);
  DomeGrid seq_grid(skydome::pipeline::make_grid_spec(seq_cfg));
  const auto seq_counters = seq.run_aggregation_stage(records, dir / "masks", seq_grid);

  Config mp_cfg = small_config();
  mp_cfg.aggregation.mode = "message_passing";
  mp_cfg.aggregation.channel_capacity = 2;
  mp_cfg.runtime.parallel_workers = 3;
  BatchRunner mp(mp_cfg, "mp", emitter, events);
  DomeGrid mp_grid(skydome::pipeline::make_grid_spec(mp_cfg));
  const auto mp_counters = mp.run_aggregation_stage(records, dir / "masks", mp_grid);

  REQUIRE(seq_counters.success == 8);
  REQUIRE(mp_counters.success == 8);
  REQUIRE(mp_counters.failed == 0);
  REQUIRE(seq_grid.coverage_statistics().sampled_cells > 0);
  REQUIRE(seq_grid.equals(mp_grid));
  fs::remove_all(dir);
}

TEST_CASE("aggregation_counts_missing_masks_as_failures") {
  const fs::path dir = scratch("skydome_test_stage2_missing");
  const std::vector<PhotoRecord> records = {record(0, 0.0, 0.0), record(1, 0.5, 0.0)};
  cv::Mat mask(400, 300, CV_8UC1, cv::Scalar(255));
  skydome::io::write_mask(dir / "masks" / "0.png", mask);

  for (const std::string mode : {"sequential", "message_passing"}) {
    Config cfg = small_config();
    cfg.aggregation.mode = mode;
    std::ostringstream events;
    EventEmitter emitter;
    BatchRunner runner(cfg, "missing", emitter, events);
    DomeGrid grid(skydome::pipeline::make_grid_spec(cfg));
    const auto counters = runner.run_aggregation_stage(records, dir / "masks", grid);
    REQUIRE(counters.total == 2);
    REQUIRE(counters.success == 1);
    REQUIRE(counters.failed == 1);
  }
  fs::remove_all(dir);
}

TEST_CASE("aggregation_mode_is_case_sensitive") {
  const fs::path dir = scratch("skydome_test_stage2_mode");
  Config cfg = small_config();
  cfg.aggregation.mode = "Sequential";
  std::ostringstream events;
  EventEmitter emitter;
  BatchRunner runner(cfg, "mode", emitter, events);
  DomeGrid grid(skydome::pipeline::make_grid_spec(cfg));
  REQUIRE_THROWS_AS(runner.run_aggregation_stage({record(0, 0.0, 0.0)}, dir / "masks", grid),
                    skydome::ConfigError);
  REQUIRE(grid.equals(DomeGrid(skydome::pipeline::make_grid_spec(cfg))));
  fs::remove_all(dir);
}

TEST_CASE("batch_without_masks_is_fatal") {
  const fs::path dir = scratch("skydome_test_fatal");
  skydome::io::Manifest manifest;
  manifest.records = {record(0, 0.0, 0.0), record(1, 1.0, 0.0)};
  const fs::path photos = make_photos(dir, manifest.records, {0, 1});

  std::ostringstream events;
  EventEmitter emitter;
  BatchRunner runner(small_config(), "fatal", emitter, events);
  REQUIRE_THROWS_AS(runner.run(manifest, photos, dir / "run"), skydome::BatchFatalError);
  REQUIRE_FALSE(fs::exists(dir / "run" / "outputs" / "dome_sky_map.json"));
  fs::remove_all(dir);
}

TEST_CASE("full_batch_writes_all_artifacts") {
  const fs::path dir = scratch("skydome_test_full");
  skydome::io::Manifest manifest;
  manifest.records = {record(2, 0.0, 0.0), record(0, 1.5, 0.3), record(1, 3.0, 0.6)};
  manifest.sha256 = "deadbeef";
  const fs::path photos = make_photos(dir, manifest.records, {1});

  std::ostringstream events;
  EventEmitter emitter;
  BatchRunner runner(small_config(), "full", emitter, events);
  const auto report = runner.run(manifest, photos, dir / "run");

  REQUIRE(report.partial);
  REQUIRE(report.segmentation.success == 2);
  REQUIRE(report.aggregation.total == 2);
  REQUIRE(report.aggregation.success == 2);
  REQUIRE(report.coverage.sampled_cells > 0);
  REQUIRE(report.artifacts.size() == 3);
  REQUIRE(report.artifacts_ok());
  REQUIRE(report.errors.empty());

  REQUIRE(fs::exists(dir / "run" / "outputs" / "dome_sky_map.json"));
  REQUIRE(fs::exists(dir / "run" / "model" / "dome_sky_model.ply"));
  REQUIRE(fs::exists(dir / "run" / "outputs" / "dome_sky_texture.png"));
  REQUIRE(fs::exists(dir / "run" / "outputs" / "texture_metadata.json"));

  const auto map = nlohmann::json::parse(
      skydome::core::read_text(dir / "run" / "outputs" / "dome_sky_map.json"));
  REQUIRE(map["metadata"]["input_manifest_sha256"] == "deadbeef");
  REQUIRE(map["metadata"]["photos_segmented"] == 2);

  const std::string log = events.str();
  REQUIRE(log.find("\"SEGMENTATION\"") != std::string::npos);
  REQUIRE(log.find("\"EXPORT\"") != std::string::npos);
  fs::remove_all(dir);
}

TEST_CASE("export_failure_is_recorded_per_artifact") {
  const fs::path dir = scratch("skydome_test_export_failure");
  Config cfg = small_config();
  cfg.output.model_dir = "blocker";
  skydome::core::write_text(dir / "blocker", "not a directory");

  std::ostringstream events;
  EventEmitter emitter;
  BatchRunner runner(cfg, "export", emitter, events);
  DomeGrid grid(skydome::pipeline::make_grid_spec(cfg));
  const auto results = runner.export_outputs(grid, dir, nlohmann::json::object());

  REQUIRE(results.size() == 3);
  REQUIRE(results[0].ok);
  REQUIRE_FALSE(results[1].ok);
  REQUIRE_FALSE(results[1].error.empty());
  REQUIRE(results[2].ok);
  REQUIRE(fs::exists(dir / "outputs" / "dome_sky_map.json"));
  REQUIRE(fs::exists(dir / "outputs" / "dome_sky_texture.png"));
  fs::remove_all(dir);
}
