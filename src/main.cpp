/**
 * @file main.cpp
 * @brief Entry point for the VoiceSync application
 *
 * @details Main entry point that handles:
 *
 *          - Command-line argument parsing
 *
 *          - Batch mode: render every idea of an idea file against one source
 *            video, then assemble the successful clips
 *
 *          - Align mode: run the timing engine on one existing voiceover and
 *            write its timing map
 *
 * @note In batch mode ideas run on MAX_PARALLEL_IDEAS worker threads. Ctrl-C
 *       stops the batch after the running stages finish; ideas that never
 *       started are reported as cancelled.
 */

#include <atomic>
#include <csignal>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <string>
#include <thread>
#include <vector>

#include "voicesync/assembler.hpp"
#include "voicesync/audio_decoder.hpp"
#include "voicesync/batch_runner.hpp"
#include "voicesync/config.hpp"
#include "voicesync/idea_loader.hpp"
#include "voicesync/logging.hpp"
#include "voicesync/media_toolkit.hpp"
#include "voicesync/progress_queue.hpp"
#include "voicesync/speech_synthesizer.hpp"
#include "voicesync/sync_engine.hpp"
#include "voicesync/system.hpp"
#include "voicesync/timing_map_builder.hpp"

using namespace voicesync;

namespace {

std::atomic<bool> g_cancel{false};

void on_sigint(int) { g_cancel.store(true); }

void print_usage() {
  LOG_WARN("Usage:");
  LOG_WARN("  voicesync run <ideas.json> <source_video> <output_dir>");
  LOG_WARN("  voicesync align <voiceover> <script.txt> <target_sec> "
           "<timing.json>");
}

/// Non-empty lines of a script file, in order
bool read_script_lines(const std::string &path,
                       std::vector<std::string> &lines) {
  std::ifstream in(path);
  if (!in)
    return false;
  std::string line;
  while (std::getline(in, line)) {
    if (!line.empty() && line.back() == '\r')
      line.pop_back();
    if (line.find_first_not_of(" \t") != std::string::npos)
      lines.push_back(line);
  }
  return true;
}

// **---- BATCH MODE ----**

int run_batch(const std::string &ideas_path, const std::string &source_path,
              const std::string &output_dir) {
  namespace fs = std::filesystem;

  const EngineConfig cfg = Config::load_engine_config();
  if (cfg.tts_command.empty()) {
    LOG_ERROR("TTS_COMMAND is not set; see config/voicesync.env");
    return 1;
  }
  if (!fs::exists(source_path)) {
    LOG_ERROR("Source video not found: {}", source_path);
    return 1;
  }

  std::error_code ec;
  fs::create_directories(output_dir, ec);
  if (ec) {
    LOG_ERROR("Cannot create output directory {}: {}", output_dir,
              ec.message());
    return 1;
  }

  std::vector<ClipIdea> ideas;
  if (load_ideas(ideas_path, ideas) != ErrorCode::Ok)
    return 1;
  if (ideas.empty()) {
    LOG_WARN("No usable ideas in {}", ideas_path);
    return 1;
  }

  LOG_INFO("VoiceSync - Batch Mode");
  LOG_INFO("Ideas: {} ({} usable)", ideas_path, ideas.size());
  LOG_INFO("Source video: {}", source_path);
  LOG_INFO("Output directory: {}", output_dir);

  CommandSynthesizer tts(cfg.tts_command);
  tts.set_cancel_flag(&g_cancel);
  FFmpegToolkit toolkit(cfg.ffmpeg_bin);
  toolkit.set_cancel_flag(&g_cancel);

  /// Progress consumer: folds per-idea events into one batch percentage
  ProgressQueue progress;
  std::thread printer([&progress, n = ideas.size()]() {
    std::vector<int> percent(n, 0);
    ProgressEvent ev;
    while (progress.pop(ev)) {
      if (ev.idea_index >= n)
        continue;
      percent[ev.idea_index] = ev.percent;
      int sum = 0;
      for (int p : percent)
        sum += p;
      LOG_INFO("[Progress] {:>3}% | idea {} -> {}", sum / static_cast<int>(n),
               ev.idea_index + 1, state_name(ev.state));
    }
  });

  BatchRunner runner(cfg, tts, toolkit);
  runner.set_progress_queue(&progress);
  runner.set_cancel_flag(&g_cancel);

  std::vector<IdeaOutcome> outcomes = runner.run(ideas, source_path, output_dir);

  progress.finish();
  printer.join();

  if (g_cancel.load()) {
    LOG_WARN("Interrupted; assembling the clips finished so far");
  }

  AssemblyReport report;
  ErrorCode rc = assemble_batch(ideas, outcomes, toolkit, output_dir, report);

  TimingCollector::print_summary();

  if (rc != ErrorCode::Ok) {
    LOG_ERROR("Batch failed: {}", error_name(rc));
    return 1;
  }
  LOG_SUCCESS("Done: {} of {} idea(s) -> {}", report.included.size(),
              ideas.size(), report.video_path);
  return 0;
}

// **---- ALIGN MODE ----**

int run_align(const std::string &audio_path, const std::string &script_path,
              const std::string &target_arg, const std::string &out_path) {
  namespace fs = std::filesystem;

  const EngineConfig cfg = Config::load_engine_config();

  double target = 0.0;
  if (!parse_clock_time(target_arg, target) || !(target > 0.0)) {
    LOG_ERROR("Invalid target duration '{}'", target_arg);
    return 1;
  }

  std::vector<std::string> lines;
  if (!read_script_lines(script_path, lines)) {
    LOG_ERROR("Cannot read script {}", script_path);
    return 1;
  }

  AudioTrack raw;
  if (decode_audio_file(audio_path, raw) != ErrorCode::Ok)
    return 1;

  LOG_INFO("VoiceSync - Align Mode");
  LOG_INFO("Voiceover: {} ({:.2f}s)", audio_path, raw.duration());
  LOG_INFO("Script: {} ({} line(s))", script_path, lines.size());
  LOG_INFO("Target: {:.3f}s", target);

  fs::path out_dir = fs::path(out_path).parent_path();
  if (out_dir.empty())
    out_dir = ".";

  std::string scratch;
  if (create_scratch_dir(out_dir.string(), 0, scratch) != ErrorCode::Ok)
    return 1;

  FFmpegToolkit toolkit(cfg.ffmpeg_bin);
  toolkit.set_cancel_flag(&g_cancel);
  SyncResult result;
  ErrorCode rc =
      align_voiceover(raw, lines, target, cfg, toolkit, scratch, result);

  if (rc == ErrorCode::Ok) {
    rc = write_timing_map_json(result.timing, out_path);
  }
  if (rc == ErrorCode::Ok) {
    const std::string wav_path =
        (fs::path(out_path).parent_path() /
         (fs::path(out_path).stem().string() + "_audio.wav"))
            .string();
    rc = write_wav_pcm16(wav_path, result.audio);
    if (rc == ErrorCode::Ok)
      LOG_INFO("Reconciled voiceover: {}", wav_path);
  }

  if (!cfg.keep_scratch)
    remove_scratch_dir(scratch);

  TimingCollector::print_summary();

  if (rc != ErrorCode::Ok) {
    LOG_ERROR("Alignment failed: {}", error_name(rc));
    return 1;
  }
  LOG_SUCCESS("Timing map: {} ({} phrase(s))", out_path,
              result.timing.phrases.size());
  return 0;
}

} // namespace

// **---- MAIN ----**

int main(int argc, char *argv[]) {
  /// Disable stdout buffering for real-time log visibility
  std::setvbuf(stdout, nullptr, _IONBF, 0);

  if (argc < 2) {
    print_usage();
    return 1;
  }

  std::signal(SIGINT, on_sigint);

  const std::string mode = argv[1];
  if (mode == "run" && argc == 5)
    return run_batch(argv[2], argv[3], argv[4]);
  if (mode == "align" && argc == 6)
    return run_align(argv[2], argv[3], argv[4], argv[5]);

  print_usage();
  return 1;
}
