#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <mutex>
#include <string>

namespace skydome::core {

using json = nlohmann::json;

// JSON-lines event stream for the runner and anything that tails its log.
// Safe to call from several worker threads; each event is written as one line.
class EventEmitter {
public:
    EventEmitter() = default;

    void run_start(const std::string& run_id, const json& extra, std::ostream& out);
    void run_end(const std::string& run_id, bool success, const std::string& status, std::ostream& out);
    void run_error(const std::string& run_id, const std::string& error, std::ostream& out);

    void phase_start(const std::string& run_id, Phase phase, const std::string& name, std::ostream& out);
    void phase_progress(const std::string& run_id, Phase phase, int current, int total,
                        const std::string& message, std::ostream& out);
    void phase_end(const std::string& run_id, Phase phase, const std::string& status,
                   const json& extra, std::ostream& out);

    void photo_processed(const std::string& run_id, Phase phase, int photo_index,
                         bool success, const json& extra, std::ostream& out);

    void warning(const std::string& run_id, const std::string& message, std::ostream& out);
    void error(const std::string& run_id, const std::string& message, std::ostream& out);

private:
    void emit(const json& event, std::ostream& out);
    json base_event(const std::string& type, const std::string& run_id);

    std::mutex mutex_;
};

} // namespace skydome::core
