#pragma once

#include "skydome/aggregation/dome_aggregator.hpp"
#include "skydome/config/configuration.hpp"
#include "skydome/core/events.hpp"
#include "skydome/core/types.hpp"
#include "skydome/geometry/camera_model.hpp"
#include "skydome/geometry/dome_grid.hpp"
#include "skydome/io/manifest.hpp"

#include <mutex>
#include <ostream>
#include <string>
#include <vector>

namespace skydome::pipeline {

struct ArtifactResult {
    std::string name;
    fs::path path;
    bool ok = false;
    std::string error;
};

struct BatchReport {
    BatchCounters segmentation;
    BatchCounters aggregation;
    CoverageStats coverage;
    std::vector<ArtifactResult> artifacts;
    std::vector<std::string> errors;
    bool partial = false;  // some photos failed stage 1

    bool artifacts_ok() const;
};

geometry::CameraModel make_camera_model(const config::Config& cfg);
geometry::DomeGridSpec make_grid_spec(const config::Config& cfg);
aggregation::AggregationParams make_aggregation_params(const config::Config& cfg);

/**
 * Three-stage mapping run:
 *   1. segment every photo on a bounded worker pool, one mask file each;
 *   2. feed masks into one shared DomeGrid (single writer, or projection
 *      workers sending SampleBatches to one aggregator over a channel);
 *   3. write the sky map, mesh and texture.
 * Per-photo failures are counted and never stop the batch. A batch without
 * usable masks throws BatchFatalError before stage 2.
 */
class BatchRunner {
public:
    BatchRunner(const config::Config& cfg, std::string run_id,
                core::EventEmitter& emitter, std::ostream& events);

    BatchCounters run_segmentation_stage(const std::vector<PhotoRecord>& records,
                                         const fs::path& photos_dir,
                                         const fs::path& masks_dir);

    BatchCounters run_aggregation_stage(const std::vector<PhotoRecord>& records,
                                        const fs::path& masks_dir,
                                        geometry::DomeGrid& grid);

    std::vector<ArtifactResult> export_outputs(const geometry::DomeGrid& grid,
                                               const fs::path& output_root,
                                               const nlohmann::json& provenance);

    BatchReport run(const io::Manifest& manifest, const fs::path& photos_dir,
                    const fs::path& work_dir);

    // Indices whose mask was written by the last segmentation stage, ascending.
    const std::vector<int>& segmented_indices() const { return segmented_indices_; }

private:
    BatchCounters aggregate_sequential(const std::vector<PhotoRecord>& records,
                                       const fs::path& masks_dir,
                                       aggregation::DomeAggregator& aggregator);
    BatchCounters aggregate_message_passing(const std::vector<PhotoRecord>& records,
                                            const fs::path& masks_dir,
                                            aggregation::DomeAggregator& aggregator);

    void report_progress(Phase phase, int done, int total, const std::string& what);

    config::Config cfg_;
    std::string run_id_;
    core::EventEmitter& emitter_;
    std::ostream& events_;
    std::mutex progress_mutex_;
    std::vector<int> segmented_indices_;
};

} // namespace skydome::pipeline
