#pragma once

#include <filesystem>
#include <fstream>
#include <streambuf>
#include <string>

namespace skydome::runner {

// Process exit codes of skydome_runner.
enum ExitCode {
  kExitOk = 0,
  kExitUsage = 1,       // bad arguments, config or input
  kExitBatchFatal = 2,  // no usable masks
  kExitPartialOutput = 3,
};

struct RunDirs {
  std::filesystem::path root;
  std::filesystem::path logs;
  std::filesystem::path work;  // masks and artifacts live below this
};

// runs_dir/<run_id>/logs. Stage output directories are created by their writers.
RunDirs create_run_dirs(const std::filesystem::path &runs_dir,
                        const std::string &run_id);

// Opens logs/run_events.jsonl for writing. Throws IOError if it cannot.
std::ofstream open_event_log(const RunDirs &dirs);

class TeeBuf : public std::streambuf {
public:
  TeeBuf(std::streambuf *a, std::streambuf *b);

protected:
  int overflow(int c) override;
  int sync() override;

private:
  std::streambuf *a_;
  std::streambuf *b_;
};

} // namespace skydome::runner
