#include "runner_shared.hpp"

#include "skydome/config/configuration.hpp"
#include "skydome/core/errors.hpp"
#include "skydome/core/events.hpp"
#include "skydome/core/utils.hpp"
#include "skydome/io/manifest.hpp"
#include "skydome/pipeline/batch_runner.hpp"
#include "skydome/segmentation/sky_segmenter.hpp"

#include <CLI/CLI.hpp>

#include <fstream>
#include <iostream>
#include <string>

namespace fs = std::filesystem;

namespace {

using namespace skydome;

struct RunOptions {
  std::string config_path;
  std::string manifest_path;
  std::string photos_dir;
  std::string runs_dir = "runs";
  int workers = 0;          // 0 = keep config value
  std::string aggregation;  // empty = keep config value
  bool dry_run = false;
};

config::Config load_effective_config(const RunOptions &opt) {
  config::Config cfg;
  if (!opt.config_path.empty()) {
    cfg = config::Config::load(opt.config_path);
  }
  if (opt.workers > 0) {
    cfg.runtime.parallel_workers = opt.workers;
  }
  if (!opt.aggregation.empty()) {
    cfg.aggregation.mode = opt.aggregation;
  }
  cfg.validate();
  return cfg;
}

int run_command(const RunOptions &opt) {
  config::Config cfg;
  io::Manifest manifest;
  try {
    cfg = load_effective_config(opt);
    if (!fs::is_directory(opt.photos_dir)) {
      throw InputMissingError("photos directory not found: " + opt.photos_dir);
    }
    manifest = io::load_manifest(opt.manifest_path);
  } catch (const SkydomeError &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return runner::kExitUsage;
  }

  const std::string run_id = core::get_run_id();
  runner::RunDirs dirs;
  std::ofstream event_log_file;
  try {
    dirs = runner::create_run_dirs(opt.runs_dir, run_id);
    cfg.save(dirs.root / "config.yaml");
    event_log_file = runner::open_event_log(dirs);
  } catch (const SkydomeError &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return runner::kExitUsage;
  }

  runner::TeeBuf tee_buf(std::cout.rdbuf(), event_log_file.rdbuf());
  std::ostream log_file(&tee_buf);

  core::EventEmitter emitter;
  emitter.run_start(run_id,
                    {{"config_path", opt.config_path},
                     {"manifest", opt.manifest_path},
                     {"input_manifest_sha256", manifest.sha256},
                     {"photos_dir", opt.photos_dir},
                     {"run_dir", dirs.root.string()},
                     {"photos", manifest.records.size()},
                     {"workers", cfg.runtime.parallel_workers},
                     {"aggregation_mode", cfg.aggregation.mode},
                     {"dry_run", opt.dry_run}},
                    log_file);

  std::cout << "Run ID: " << run_id << std::endl;
  std::cout << "Photos: " << manifest.records.size() << std::endl;
  std::cout << "Output: " << dirs.root.string() << std::endl;

  if (opt.dry_run) {
    emitter.phase_start(run_id, Phase::SCAN_INPUT, "SCAN_INPUT", log_file);
    emitter.phase_end(run_id, Phase::SCAN_INPUT, "skipped",
                      {{"reason", "dry_run"}}, log_file);
    std::cout << "Dry run - no processing" << std::endl;
    emitter.run_end(run_id, true, "ok", log_file);
    return runner::kExitOk;
  }

  pipeline::BatchRunner batch(cfg, run_id, emitter, log_file);
  pipeline::BatchReport report;
  try {
    report = batch.run(manifest, opt.photos_dir, dirs.work);
  } catch (const BatchFatalError &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    emitter.run_error(run_id, e.what(), log_file);
    emitter.run_end(run_id, false, "fatal", log_file);
    return runner::kExitBatchFatal;
  } catch (const SkydomeError &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    emitter.run_error(run_id, e.what(), log_file);
    emitter.run_end(run_id, false, "error", log_file);
    return runner::kExitUsage;
  }

  std::cout << "Segmented: " << report.segmentation.success << "/"
            << report.segmentation.total << ", aggregated: "
            << report.aggregation.success << "/" << report.aggregation.total
            << std::endl;
  std::cout << "Coverage: " << report.coverage.coverage_percent
            << "%, sky: " << report.coverage.sky_percent << "%" << std::endl;

  if (!report.artifacts_ok()) {
    for (const auto &err : report.errors) {
      std::cerr << "Error: " << err << std::endl;
    }
    emitter.run_end(run_id, false, "partial_output", log_file);
    return runner::kExitPartialOutput;
  }

  emitter.run_end(run_id, true, report.partial ? "partial" : "ok", log_file);
  return runner::kExitOk;
}

int segment_command(const std::string &input, const std::string &output,
                    const std::string &config_path) {
  try {
    config::Config cfg;
    if (!config_path.empty()) {
      cfg = config::Config::load(config_path);
      cfg.validate();
    }
    const auto summary =
        segmentation::segment_sky_file(input, output, cfg.segmentation);
    std::cout << "Mask: " << output << " (" << summary.width << "x"
              << summary.height << ", " << summary.accepted_regions << "/"
              << summary.candidate_regions << " regions, sky "
              << summary.sky_fraction * 100.0 << "%)" << std::endl;
  } catch (const SkydomeError &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return runner::kExitUsage;
  }
  return runner::kExitOk;
}

} // namespace

int main(int argc, char *argv[]) {
  CLI::App app{"Skydome obstruction mapper"};
  app.require_subcommand(1);

  RunOptions run_opt;
  auto run_cmd = app.add_subcommand("run", "Segment photos and build the dome map");
  run_cmd->add_option("--config", run_opt.config_path, "Path to config.yaml");
  run_cmd->add_option("--manifest", run_opt.manifest_path,
                      "Orientation manifest (rotation.json)")
      ->required();
  run_cmd->add_option("--photos-dir", run_opt.photos_dir, "Photo directory")
      ->required();
  run_cmd->add_option("--runs-dir", run_opt.runs_dir, "Runs directory");
  run_cmd->add_option("--workers", run_opt.workers,
                      "Parallel workers (0 = config value)");
  run_cmd->add_option("--aggregation", run_opt.aggregation,
                      "Aggregation mode")
      ->check(CLI::IsMember({"sequential", "message_passing"}));
  run_cmd->add_flag("--dry-run", run_opt.dry_run, "Dry run");

  std::string seg_input, seg_output, seg_config;
  auto seg_cmd = app.add_subcommand("segment", "Segment a single photo");
  seg_cmd->add_option("--input", seg_input, "Photo path")->required();
  seg_cmd->add_option("--output", seg_output, "Mask path")->required();
  seg_cmd->add_option("--config", seg_config, "Path to config.yaml");

  auto schema_cmd = app.add_subcommand("schema", "Print the config JSON schema");

  CLI11_PARSE(app, argc, argv);

  if (run_cmd->parsed()) {
    return run_command(run_opt);
  }
  if (seg_cmd->parsed()) {
    return segment_command(seg_input, seg_output, seg_config);
  }
  if (schema_cmd->parsed()) {
    std::cout << skydome::config::get_schema_json() << std::endl;
    return skydome::runner::kExitOk;
  }

  std::cout << app.help() << std::endl;
  return skydome::runner::kExitUsage;
}
