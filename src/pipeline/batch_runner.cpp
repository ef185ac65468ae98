#include "skydome/pipeline/batch_runner.hpp"
#include "skydome/core/batch_gate.hpp"
#include "skydome/core/errors.hpp"
#include "skydome/core/utils.hpp"
#include "skydome/io/image_io.hpp"
#include "skydome/output/exporters.hpp"
#include "skydome/pipeline/bounded_channel.hpp"
#include "skydome/segmentation/sky_segmenter.hpp"

#include <algorithm>
#include <atomic>
#include <iostream>
#include <thread>

namespace skydome::pipeline {

using json = nlohmann::json;

namespace {

std::vector<PhotoRecord> sorted_by_index(const std::vector<PhotoRecord>& records) {
    std::vector<PhotoRecord> out = records;
    std::sort(out.begin(), out.end(),
              [](const PhotoRecord& a, const PhotoRecord& b) { return a.index < b.index; });
    return out;
}

json counters_to_json(const BatchCounters& c) {
    return {{"total", c.total}, {"success", c.success}, {"failed", c.failed}};
}

// One stage-2 message: a projected batch or the reason there is none.
struct ProjectionMessage {
    int index = 0;
    bool ok = false;
    SampleBatch batch;
    std::string error;
};

} // namespace

bool BatchReport::artifacts_ok() const {
    return std::all_of(artifacts.begin(), artifacts.end(),
                       [](const ArtifactResult& a) { return a.ok; });
}

geometry::CameraModel make_camera_model(const config::Config& cfg) {
    geometry::CameraIntrinsics intr;
    intr.width = cfg.camera.image_width;
    intr.height = cfg.camera.image_height;
    intr.fov_degrees = cfg.camera.fov_degrees;
    return geometry::CameraModel(intr, core::deg_to_rad(cfg.dome.theta_min_degrees),
                                 core::deg_to_rad(cfg.dome.theta_max_degrees));
}

geometry::DomeGridSpec make_grid_spec(const config::Config& cfg) {
    geometry::DomeGridSpec spec;
    spec.resolution_degrees = cfg.dome.resolution_degrees;
    spec.theta_min = core::deg_to_rad(cfg.dome.theta_min_degrees);
    spec.theta_max = core::deg_to_rad(cfg.dome.theta_max_degrees);
    return spec;
}

aggregation::AggregationParams make_aggregation_params(const config::Config& cfg) {
    aggregation::AggregationParams p;
    p.sample_step = cfg.aggregation.sample_step;
    p.sky_threshold = cfg.aggregation.sky_threshold;
    return p;
}

BatchRunner::BatchRunner(const config::Config& cfg, std::string run_id,
                         core::EventEmitter& emitter, std::ostream& events)
    : cfg_(cfg), run_id_(std::move(run_id)), emitter_(emitter), events_(events) {}

void BatchRunner::report_progress(Phase phase, int done, int total, const std::string& what) {
    std::lock_guard<std::mutex> lock(progress_mutex_);
    emitter_.phase_progress(run_id_, phase, done, total, what, events_);
}

BatchCounters BatchRunner::run_segmentation_stage(const std::vector<PhotoRecord>& records,
                                                  const fs::path& photos_dir,
                                                  const fs::path& masks_dir) {
    BatchCounters counters;
    counters.total = static_cast<int>(records.size());
    segmented_indices_.clear();
    if (records.empty()) {
        return counters;
    }

    const int n_workers = core::resolve_worker_count(cfg_.runtime.parallel_workers, records.size());
    std::cout << "[SEGMENT] " << records.size() << " photos, " << n_workers << " workers"
              << std::endl;

    // One slot per record; each worker only writes the slots it claimed.
    std::vector<char> ok(records.size(), 0);
    std::atomic<size_t> next{0};
    std::atomic<int> done{0};
    std::mutex log_mutex;

    auto worker = [&]() {
        while (true) {
            const size_t pos = next.fetch_add(1);
            if (pos >= records.size()) {
                break;
            }
            const PhotoRecord& rec = records[pos];
            const fs::path photo_path = io::resolve_photo_path(photos_dir, rec);
            const fs::path mask_path =
                io::mask_path_for(masks_dir, rec.index, cfg_.output.mask_extension);

            try {
                const auto summary =
                    segmentation::segment_sky_file(photo_path, mask_path, cfg_.segmentation);
                ok[pos] = 1;
                {
                    std::lock_guard<std::mutex> lock(log_mutex);
                    std::cout << "[SEGMENT] photo " << rec.index << ": "
                              << summary.accepted_regions << "/" << summary.candidate_regions
                              << " regions, sky " << summary.sky_fraction * 100.0 << "%"
                              << std::endl;
                }
                emitter_.photo_processed(run_id_, Phase::SEGMENTATION, rec.index, true,
                                         {{"mask", mask_path.string()},
                                          {"sky_fraction", summary.sky_fraction}},
                                         events_);
            } catch (const std::exception& e) {
                const PhotoProcessingError err(rec.index, e.what());
                {
                    std::lock_guard<std::mutex> lock(log_mutex);
                    std::cerr << "[SEGMENT] " << err.what() << std::endl;
                }
                emitter_.photo_processed(run_id_, Phase::SEGMENTATION, rec.index, false,
                                         {{"error", e.what()}}, events_);
            }

            const int n_done = done.fetch_add(1) + 1;
            if (n_done % 5 == 0 || n_done == counters.total) {
                report_progress(Phase::SEGMENTATION, n_done, counters.total, "segment");
            }
        }
    };

    std::vector<std::thread> workers;
    workers.reserve(static_cast<size_t>(n_workers));
    for (int w = 0; w < n_workers; ++w) {
        workers.emplace_back(worker);
    }
    for (auto& t : workers) {
        t.join();
    }

    for (size_t pos = 0; pos < records.size(); ++pos) {
        if (ok[pos]) {
            ++counters.success;
            segmented_indices_.push_back(records[pos].index);
        } else {
            ++counters.failed;
        }
    }
    std::sort(segmented_indices_.begin(), segmented_indices_.end());

    std::cout << "[SEGMENT] done: " << counters.success << " ok, " << counters.failed
              << " failed" << std::endl;
    return counters;
}

BatchCounters BatchRunner::aggregate_sequential(const std::vector<PhotoRecord>& records,
                                                const fs::path& masks_dir,
                                                aggregation::DomeAggregator& aggregator) {
    BatchCounters counters;
    counters.total = static_cast<int>(records.size());
    for (const auto& rec : records) {
        const fs::path mask_path =
            io::mask_path_for(masks_dir, rec.index, cfg_.output.mask_extension);
        const bool ok = aggregator.process_photo_file(rec, mask_path);
        if (ok) {
            ++counters.success;
        } else {
            ++counters.failed;
        }
        emitter_.photo_processed(run_id_, Phase::AGGREGATION, rec.index, ok, json::object(),
                                 events_);
        const int n_done = counters.success + counters.failed;
        if (n_done % 5 == 0 || n_done == counters.total) {
            report_progress(Phase::AGGREGATION, n_done, counters.total, "aggregate");
        }
    }
    return counters;
}

BatchCounters BatchRunner::aggregate_message_passing(const std::vector<PhotoRecord>& records,
                                                     const fs::path& masks_dir,
                                                     aggregation::DomeAggregator& aggregator) {
    BatchCounters counters;
    counters.total = static_cast<int>(records.size());
    if (records.empty()) {
        return counters;
    }

    const int n_workers = core::resolve_worker_count(cfg_.runtime.parallel_workers, records.size());
    BoundedChannel<ProjectionMessage> channel(
        static_cast<size_t>(std::max(1, cfg_.aggregation.channel_capacity)));
    std::atomic<size_t> next{0};
    std::atomic<int> active{n_workers};

    // Producers only read the aggregator (project_photo is const).
    auto producer = [&]() {
        while (true) {
            const size_t pos = next.fetch_add(1);
            if (pos >= records.size()) {
                break;
            }
            const PhotoRecord& rec = records[pos];
            ProjectionMessage msg;
            msg.index = rec.index;
            try {
                const cv::Mat mask = io::read_mask(
                    io::mask_path_for(masks_dir, rec.index, cfg_.output.mask_extension));
                msg.batch = aggregator.project_photo(rec, mask);
                msg.ok = true;
            } catch (const std::exception& e) {
                msg.error = e.what();
            }
            if (!channel.push(std::move(msg))) {
                break;
            }
        }
        if (active.fetch_sub(1) == 1) {
            channel.close();
        }
    };

    std::vector<std::thread> workers;
    workers.reserve(static_cast<size_t>(n_workers));
    for (int w = 0; w < n_workers; ++w) {
        workers.emplace_back(producer);
    }

    auto join_all = [&workers]() {
        for (auto& t : workers) {
            if (t.joinable()) {
                t.join();
            }
        }
    };

    // This thread is the only writer of the grid.
    try {
        while (auto msg = channel.pop()) {
            bool ok = msg->ok;
            if (ok) {
                try {
                    aggregator.apply(msg->batch);
                    aggregation::log_projection_stats(msg->batch.stats);
                } catch (const std::exception& e) {
                    ok = false;
                    msg->error = e.what();
                }
            }
            if (ok) {
                ++counters.success;
            } else {
                ++counters.failed;
                std::cerr << "[AGG] photo " << msg->index << " failed: " << msg->error
                          << std::endl;
            }
            emitter_.photo_processed(run_id_, Phase::AGGREGATION, msg->index, ok,
                                     ok ? json::object() : json{{"error", msg->error}},
                                     events_);
            const int n_done = counters.success + counters.failed;
            if (n_done % 5 == 0 || n_done == counters.total) {
                report_progress(Phase::AGGREGATION, n_done, counters.total, "aggregate");
            }
        }
    } catch (...) {
        channel.close();
        join_all();
        throw;
    }
    join_all();
    return counters;
}

BatchCounters BatchRunner::run_aggregation_stage(const std::vector<PhotoRecord>& records,
                                                 const fs::path& masks_dir,
                                                 geometry::DomeGrid& grid) {
    const std::vector<PhotoRecord> ordered = sorted_by_index(records);
    aggregation::DomeAggregator aggregator(grid, make_camera_model(cfg_),
                                           make_aggregation_params(cfg_));

    const std::string& mode = cfg_.aggregation.mode;
    std::cout << "[AGG] " << ordered.size() << " masks, mode " << mode << std::endl;

    BatchCounters counters;
    if (mode == "message_passing") {
        counters = aggregate_message_passing(ordered, masks_dir, aggregator);
    } else if (mode == "sequential") {
        counters = aggregate_sequential(ordered, masks_dir, aggregator);
    } else {
        throw ConfigError("unknown aggregation.mode '" + cfg_.aggregation.mode + "'");
    }

    const CoverageStats stats = grid.coverage_statistics();
    std::cout << "[AGG] done: " << counters.success << " ok, " << counters.failed
              << " failed, coverage " << stats.coverage_percent << "%, sky "
              << stats.sky_percent << "%" << std::endl;
    return counters;
}

std::vector<ArtifactResult> BatchRunner::export_outputs(const geometry::DomeGrid& grid,
                                                        const fs::path& output_root,
                                                        const json& provenance) {
    const geometry::CameraModel camera = make_camera_model(cfg_);
    const fs::path map_path = output_root / cfg_.output.map_dir / "dome_sky_map.json";
    const fs::path mesh_path = output_root / cfg_.output.model_dir / "dome_sky_model.ply";
    const fs::path texture_dir = output_root / cfg_.output.texture_dir;

    std::vector<ArtifactResult> results;
    auto attempt = [&](const std::string& name, const fs::path& path, auto&& write) {
        ArtifactResult r;
        r.name = name;
        r.path = path;
        try {
            write();
            r.ok = true;
        } catch (const SerializationError& e) {
            r.error = e.what();
            std::cerr << "[EXPORT] " << name << " failed: " << e.what() << std::endl;
            emitter_.error(run_id_, e.what(), events_);
        }
        results.push_back(std::move(r));
    };

    attempt("sky_map", map_path,
            [&]() { output::write_sky_map_json(grid, camera, map_path, provenance); });
    attempt("dome_model", mesh_path,
            [&]() { output::write_dome_ply(grid, mesh_path, cfg_.output.mesh_radius); });
    attempt("data_texture", texture_dir / "dome_sky_texture.png", [&]() {
        output::write_data_texture(grid, texture_dir / "dome_sky_texture.png",
                                   texture_dir / "texture_metadata.json");
    });
    return results;
}

BatchReport BatchRunner::run(const io::Manifest& manifest, const fs::path& photos_dir,
                             const fs::path& work_dir) {
    BatchReport report;
    const std::vector<PhotoRecord> records = sorted_by_index(manifest.records);
    const int total = static_cast<int>(records.size());
    const fs::path masks_dir = work_dir / cfg_.output.masks_dir;

    emitter_.phase_start(run_id_, Phase::SCAN_INPUT, "SCAN_INPUT", events_);
    int photos_present = 0;
    for (const auto& rec : records) {
        std::error_code ec;
        if (fs::exists(io::resolve_photo_path(photos_dir, rec), ec)) {
            ++photos_present;
        }
    }
    emitter_.phase_end(run_id_, Phase::SCAN_INPUT, "ok",
                       {{"photos", total}, {"photos_present", photos_present},
                        {"photos_dir", photos_dir.string()}},
                       events_);
    if (photos_present < total) {
        emitter_.warning(run_id_,
                         std::to_string(total - photos_present) + " photo(s) not found in " +
                             photos_dir.string(),
                         events_);
    }

    // Stage 1
    emitter_.phase_start(run_id_, Phase::SEGMENTATION, "SEGMENTATION", events_);
    report.segmentation = run_segmentation_stage(records, photos_dir, masks_dir);
    emitter_.phase_end(run_id_, Phase::SEGMENTATION,
                       report.segmentation.failed > 0 ? "partial" : "ok",
                       counters_to_json(report.segmentation), events_);

    const core::BatchGateDecision gate = core::evaluate_batch_gate(
        report.segmentation.success, total, cfg_.runtime.min_usable_masks);
    if (gate.should_abort) {
        throw BatchFatalError("only " + std::to_string(report.segmentation.success) + " of " +
                              std::to_string(total) + " photos produced a mask (need " +
                              std::to_string(std::max(1, cfg_.runtime.min_usable_masks)) + ")");
    }
    report.partial = gate.partial;
    if (gate.partial) {
        emitter_.warning(run_id_,
                         std::to_string(report.segmentation.failed) +
                             " photo(s) failed segmentation; continuing with " +
                             std::to_string(report.segmentation.success),
                         events_);
    }

    // Stage 2
    std::vector<PhotoRecord> usable;
    for (const auto& rec : records) {
        if (std::binary_search(segmented_indices_.begin(), segmented_indices_.end(), rec.index)) {
            usable.push_back(rec);
        }
    }

    geometry::DomeGrid grid(make_grid_spec(cfg_));
    emitter_.phase_start(run_id_, Phase::AGGREGATION, "AGGREGATION", events_);
    report.aggregation = run_aggregation_stage(usable, masks_dir, grid);
    report.coverage = grid.coverage_statistics();
    json agg_extra = counters_to_json(report.aggregation);
    agg_extra["coverage"] = output::coverage_to_json(report.coverage);
    agg_extra["mode"] = cfg_.aggregation.mode;
    emitter_.phase_end(run_id_, Phase::AGGREGATION,
                       report.aggregation.failed > 0 ? "partial" : "ok", agg_extra, events_);
    if (report.aggregation.success == 0) {
        emitter_.warning(run_id_, "no mask could be projected; exporting an unsampled dome",
                         events_);
    }

    // Stage 3
    json provenance = {
        {"run_id", run_id_},
        {"input_manifest_sha256", manifest.sha256},
        {"photos_total", total},
        {"photos_segmented", report.segmentation.success},
        {"photos_aggregated", report.aggregation.success},
        {"aggregation_mode", cfg_.aggregation.mode}
    };

    emitter_.phase_start(run_id_, Phase::EXPORT, "EXPORT", events_);
    report.artifacts = export_outputs(grid, work_dir, provenance);
    json artifacts = json::array();
    for (const auto& a : report.artifacts) {
        artifacts.push_back({{"name", a.name}, {"path", a.path.string()}, {"ok", a.ok}});
        if (!a.ok) {
            report.errors.push_back(a.name + ": " + a.error);
        }
    }
    emitter_.phase_end(run_id_, Phase::EXPORT, report.artifacts_ok() ? "ok" : "error",
                       {{"artifacts", artifacts}}, events_);
    return report;
}

} // namespace skydome::pipeline
