#include "runner_shared.hpp"

#include "skydome/core/errors.hpp"

#include <system_error>

namespace skydome::runner {

namespace fs = std::filesystem;

RunDirs create_run_dirs(const fs::path &runs_dir, const std::string &run_id) {
  RunDirs dirs;
  dirs.root = runs_dir / run_id;
  dirs.logs = dirs.root / "logs";
  dirs.work = dirs.root;

  std::error_code ec;
  fs::create_directories(dirs.logs, ec);
  if (ec) {
    throw IOError("cannot create run directory " + dirs.logs.string() + ": " +
                  ec.message());
  }
  return dirs;
}

std::ofstream open_event_log(const RunDirs &dirs) {
  const fs::path path = dirs.logs / "run_events.jsonl";
  std::ofstream out(path);
  if (!out.is_open()) {
    throw IOError("cannot open event log " + path.string());
  }
  return out;
}

TeeBuf::TeeBuf(std::streambuf *a, std::streambuf *b) : a_(a), b_(b) {}

int TeeBuf::overflow(int c) {
  if (c == EOF)
    return EOF;
  const int ra = a_ ? a_->sputc(static_cast<char>(c)) : c;
  const int rb = b_ ? b_->sputc(static_cast<char>(c)) : c;
  return (ra == EOF || rb == EOF) ? EOF : c;
}

int TeeBuf::sync() {
  int ra = a_ ? a_->pubsync() : 0;
  int rb = b_ ? b_->pubsync() : 0;
  return (ra == 0 && rb == 0) ? 0 : -1;
}

} // namespace skydome::runner
