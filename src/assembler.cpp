/**
 * @file assembler.cpp
 * @brief Batch assembly implementation
 */

#include "voicesync/assembler.hpp"

#include <filesystem>
#include <fstream>

#include <fmt/core.h>

#include "voicesync/idea_loader.hpp"
#include "voicesync/logging.hpp"

namespace voicesync {

namespace fs = std::filesystem;

namespace {

ErrorCode write_text_file(const std::string &path, const std::string &text) {
  std::ofstream out(path);
  if (!out) {
    LOG_ERROR("Failed to open {} for writing", path);
    return ErrorCode::IoFailure;
  }
  out << text;
  if (!out) {
    LOG_ERROR("Failed to write {}", path);
    return ErrorCode::IoFailure;
  }
  return ErrorCode::Ok;
}

} // namespace

std::string batch_base_name(const std::string &first_title) {
  std::string name = sanitize_filename(first_title);

  /// Trim surrounding blanks left behind by removed characters
  const auto first = name.find_first_not_of(" \t");
  if (first == std::string::npos)
    return "voicesync_output";
  const auto last = name.find_last_not_of(" \t");
  return name.substr(first, last - first + 1);
}

std::string render_descriptions(const std::vector<const ClipResult *> &clips) {
  std::string text;
  for (size_t i = 0; i < clips.size(); ++i) {
    const ClipIdea &idea = clips[i]->idea;
    text += fmt::format("Clip {}: {}\n", i + 1, idea.title);
    text += fmt::format("Description: {}\n", idea.description);
    text += fmt::format("Script: {}\n\n", idea.script_text());
  }
  return text;
}

nlohmann::json build_batch_metadata(const std::vector<ClipIdea> &ideas,
                                    const std::vector<IdeaOutcome> &outcomes,
                                    const std::string &base_name) {
  nlohmann::json doc;
  doc["title"] = base_name;

  auto clips = nlohmann::json::array();
  auto failed = nlohmann::json::array();

  for (size_t i = 0; i < outcomes.size(); ++i) {
    const IdeaOutcome &o = outcomes[i];
    if (o.ok()) {
      const ClipResult &r = o.result;
      clips.push_back({{"index", i + 1},
                       {"title", r.idea.title},
                       {"description", r.idea.description},
                       {"script", r.idea.script_text()},
                       {"video", fs::path(r.video_path).filename().string()},
                       {"timing", fs::path(r.timing_path).filename().string()},
                       {"duration_s", r.audio.duration()}});
    } else {
      failed.push_back({{"index", i + 1},
                        {"title", i < ideas.size() ? ideas[i].title : ""},
                        {"state", state_name(o.reached)},
                        {"error", error_name(o.code)},
                        {"reason", o.reason}});
    }
  }

  doc["clips"] = std::move(clips);
  doc["failed"] = std::move(failed);
  return doc;
}

ErrorCode assemble_batch(const std::vector<ClipIdea> &ideas,
                         const std::vector<IdeaOutcome> &outcomes,
                         MediaToolkit &toolkit, const std::string &output_dir,
                         AssemblyReport &report) {
  report = AssemblyReport{};

  std::vector<const ClipResult *> clips;
  std::vector<std::string> videos;

  for (size_t i = 0; i < outcomes.size(); ++i) {
    if (outcomes[i].ok()) {
      report.included.push_back(i);
      clips.push_back(&outcomes[i].result);
      videos.push_back(outcomes[i].result.video_path);
    } else {
      report.failed.push_back(i);
    }
  }

  for (size_t i : report.failed) {
    LOG_WARN("Idea {} '{}' produced no clip: {} ({})", i + 1,
             i < ideas.size() ? ideas[i].title : std::string(),
             outcomes[i].reason, error_name(outcomes[i].code));
  }

  if (clips.empty()) {
    LOG_ERROR("No idea succeeded ({} failed); nothing to assemble",
              report.failed.size());
    return ErrorCode::InvalidInput;
  }

  report.base_name = batch_base_name(clips.front()->idea.title);
  const fs::path base = fs::path(output_dir) / report.base_name;

  // **----- SIDECARS -----**

  report.descriptions_path = base.string() + "_descriptions.txt";
  ErrorCode rc =
      write_text_file(report.descriptions_path, render_descriptions(clips));
  if (rc != ErrorCode::Ok)
    return rc;

  report.metadata_path = base.string() + "_metadata.json";
  rc = write_text_file(
      report.metadata_path,
      build_batch_metadata(ideas, outcomes, report.base_name).dump(2) + "\n");
  if (rc != ErrorCode::Ok)
    return rc;

  // **----- CONCATENATE -----**

  const std::string video_path = base.string() + ".mp4";
  TIMER_START(concat);
  rc = toolkit.concat(videos, output_dir, video_path);
  TIMER_END(concat);
  if (rc != ErrorCode::Ok) {
    LOG_ERROR("Concatenating {} clip(s) failed; individual clips are kept",
              videos.size());
    return rc;
  }
  report.video_path = video_path;

  LOG_SUCCESS("Assembled {} clip(s) into {} ({} failed)", clips.size(),
              video_path, report.failed.size());
  return ErrorCode::Ok;
}

} // namespace voicesync
