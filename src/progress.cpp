#include "lfsync/progress.hpp"

#include "lfsync/fs.hpp"
#include "lfsync/log.hpp"

#include <ctime>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace lfsync {

ProgressReporter::ProgressReporter(std::filesystem::path progress_file,
                                   std::filesystem::path complete_file)
    : progress_file_(std::move(progress_file)), complete_file_(std::move(complete_file)) {}

void ProgressReporter::write(const ProgressSnapshot &snapshot) {
  json doc = {{"stage", snapshot.stage}, {"progress", snapshot.percent}};
  if (snapshot.current)
    doc["current"] = *snapshot.current;
  if (snapshot.total)
    doc["total"] = *snapshot.total;
  try {
    fs::write_text_atomic(progress_file_, doc.dump(2));
  } catch (const std::exception &e) {
    LOGE("Failed to write progress: %s", e.what());
  }
}

void ProgressReporter::mark_complete() {
  try {
    fs::write_text_atomic(complete_file_, std::to_string(static_cast<long long>(std::time(nullptr))));
    LOGI("Sync completed, other services can start");
  } catch (const std::exception &e) {
    LOGE("Failed to mark sync complete: %s", e.what());
    return;
  }
  write(ProgressSnapshot{.stage = "complete", .percent = 100, .current = {}, .total = {}});
}

std::optional<ProgressSnapshot> ProgressReporter::read() const {
  if (!fs::exists(progress_file_))
    return std::nullopt;
  try {
    const json doc = json::parse(fs::read_text(progress_file_));
    ProgressSnapshot s{.stage = doc.at("stage").get<std::string>(),
                       .percent = doc.at("progress").get<int>(),
                       .current = {},
                       .total = {}};
    if (doc.contains("current"))
      s.current = doc["current"].get<std::size_t>();
    if (doc.contains("total"))
      s.total = doc["total"].get<std::size_t>();
    return s;
  } catch (const std::exception &e) {
    LOGW("Unreadable progress file %s: %s", progress_file_.c_str(), e.what());
    return std::nullopt;
  }
}

bool ProgressReporter::complete() const { return fs::exists(complete_file_); }

} // namespace lfsync
