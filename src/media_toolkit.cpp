/**
 * @file media_toolkit.cpp
 * @brief FFmpeg command-line media toolkit implementation
 */

#include "voicesync/media_toolkit.hpp"

#include <cstdlib>
#include <filesystem>
#include <sys/syscall.h>
#include <sys/wait.h>
#include <unistd.h>
#include <utility>

#include <fmt/core.h>

#include "voicesync/audio_decoder.hpp"
#include "voicesync/logging.hpp"
#include "voicesync/subtitle_writer.hpp"
#include "voicesync/system.hpp"

#ifndef MFD_CLOEXEC
#define MFD_CLOEXEC 0x0001U
#endif

namespace voicesync {

std::string build_atempo_chain(double factor) {
  std::string chain;
  double remaining = factor;

  while (remaining > 2.0) {
    chain += "atempo=2.0,";
    remaining /= 2.0;
  }
  while (remaining < 0.5) {
    chain += "atempo=0.5,";
    remaining /= 0.5;
  }
  chain += fmt::format("atempo={:.6f}", remaining);
  return chain;
}

std::string build_vertical_crop_filter() {
  return fmt::format("crop=w='min(iw,ih*9/16)':h='min(ih,iw*16/9)',"
                     "scale={}:{},setsar=1,format=yuv420p",
                     OUTPUT_WIDTH, OUTPUT_HEIGHT);
}

std::string build_cut_args(const std::string &source_path, double start,
                           double end, const std::string &out_path) {
  return fmt::format("-ss {:.3f} -i {} -t {:.3f} -vf {} -c:v libx264 "
                     "-preset fast -c:a aac -movflags +faststart {}",
                     start, shell_quote(source_path), end - start,
                     shell_quote(build_vertical_crop_filter()),
                     shell_quote(out_path));
}

std::string escape_filter_path(const std::string &path) {
  std::string out;
  out.reserve(path.size() + 8);
  for (char c : path) {
    switch (c) {
    case '\\':
      out += '/';
      break;
    case ':':
      out += "\\:";
      break;
    case '\'':
      out += "'\\''";
      break;
    default:
      out += c;
    }
  }
  return out;
}

std::string shell_quote(const std::string &arg) {
  std::string out = "'";
  for (char c : arg) {
    if (c == '\'')
      out += "'\\''";
    else
      out += c;
  }
  out += '\'';
  return out;
}

FFmpegToolkit::FFmpegToolkit(std::string ffmpeg_bin)
    : ffmpeg_bin_(std::move(ffmpeg_bin)) {}

ErrorCode FFmpegToolkit::run_ffmpeg(const std::string &args, const char *what) {
  std::string cmd = fmt::format("{} -y -nostdin -hide_banner -loglevel error {}",
                                shell_quote(ffmpeg_bin_), args);

  int status = std::system(cmd.c_str());

  /// ffmpeg traps SIGINT itself and exits with 255
  if (interrupted_status(status) ||
      (WIFEXITED(status) && WEXITSTATUS(status) == 255)) {
    LOG_WARN("FFmpeg {} interrupted", what);
    if (cancel_)
      cancel_->store(true);
    return ErrorCode::Cancelled;
  }
  if (status != 0) {
    LOG_ERROR("FFmpeg {} failed with status {}", what, status);
    return ErrorCode::ToolkitFailure;
  }
  return ErrorCode::Ok;
}

ErrorCode FFmpegToolkit::cut(const std::string &source_path, double start,
                             double end, const std::string &out_path) {
  if (!(end > start) || start < 0.0) {
    LOG_ERROR("Invalid cut range [{:.3f}, {:.3f}]", start, end);
    return ErrorCode::InvalidInput;
  }

  TIMER_START(ffmpeg_cut);
  ErrorCode rc =
      run_ffmpeg(build_cut_args(source_path, start, end, out_path), "cut");
  TIMER_END(ffmpeg_cut);
  return rc;
}

ErrorCode FFmpegToolkit::media_duration(const std::string &media_path,
                                        double &duration) {
  if (read_media_duration(media_path, duration) != ErrorCode::Ok)
    return ErrorCode::ToolkitFailure;
  return ErrorCode::Ok;
}

ErrorCode FFmpegToolkit::stretch(const AudioTrack &track, double factor,
                                 const std::string &scratch_dir,
                                 AudioTrack &out) {
  if (!(factor > 0.0) || track.empty()) {
    LOG_ERROR("Cannot stretch an empty track or by factor {}", factor);
    return ErrorCode::InvalidInput;
  }

  const unsigned seq = scratch_seq_++;
  const std::string in_path =
      (std::filesystem::path(scratch_dir) / fmt::format("stretch_in_{}.wav", seq))
          .string();
  const std::string out_path =
      (std::filesystem::path(scratch_dir) /
       fmt::format("stretch_out_{}.wav", seq))
          .string();

  if (write_wav_pcm16(in_path, track) != ErrorCode::Ok)
    return ErrorCode::ToolkitFailure;

  TIMER_START(ffmpeg_stretch);
  ErrorCode rc = run_ffmpeg(
      fmt::format("-i {} -filter:a {} -ac 1 -ar {} -c:a pcm_s16le {}",
                  shell_quote(in_path), build_atempo_chain(factor),
                  track.sample_rate, shell_quote(out_path)),
      "stretch");
  TIMER_END(ffmpeg_stretch);
  if (rc != ErrorCode::Ok)
    return rc;

  if (decode_audio_file(out_path, out) != ErrorCode::Ok) {
    LOG_ERROR("Stretched audio {} could not be decoded", out_path);
    return ErrorCode::ToolkitFailure;
  }
  return ErrorCode::Ok;
}

ErrorCode FFmpegToolkit::merge(const std::string &video_path,
                               const AudioTrack &track,
                               const std::string &scratch_dir,
                               const std::string &out_path) {
  const std::string wav_path =
      (std::filesystem::path(scratch_dir) /
       fmt::format("voiceover_{}.wav", scratch_seq_++))
          .string();
  if (write_wav_pcm16(wav_path, track) != ErrorCode::Ok)
    return ErrorCode::ToolkitFailure;

  TIMER_START(ffmpeg_merge);
  ErrorCode rc = run_ffmpeg(
      fmt::format("-i {} -i {} -map 0:v:0 -map 1:a:0 -c:v copy -c:a aac "
                  "-map_metadata 0 {}",
                  shell_quote(video_path), shell_quote(wav_path),
                  shell_quote(out_path)),
      "merge");
  TIMER_END(ffmpeg_merge);
  return rc;
}

ErrorCode FFmpegToolkit::burn_subtitles(const std::string &video_path,
                                        const TimingMap &timing,
                                        const std::string &scratch_dir,
                                        const std::string &out_path) {
  const std::string ass_path =
      std::filesystem::absolute(std::filesystem::path(scratch_dir) /
                                fmt::format("subtitles_{}.ass", scratch_seq_++))
          .string();
  if (write_ass_file(timing, ass_path) != ErrorCode::Ok)
    return ErrorCode::ToolkitFailure;

  const std::string filter =
      fmt::format("ass='{}'", escape_filter_path(ass_path));

  TIMER_START(ffmpeg_burn);
  ErrorCode rc = run_ffmpeg(
      fmt::format("-i {} -vf {} -c:v libx264 -preset fast -c:a copy {}",
                  shell_quote(video_path), shell_quote(filter),
                  shell_quote(out_path)),
      "subtitle burn");
  TIMER_END(ffmpeg_burn);
  return rc;
}

ErrorCode FFmpegToolkit::concat(const std::vector<std::string> &video_paths,
                                const std::string & /*scratch_dir*/,
                                const std::string &out_path) {
  if (video_paths.empty()) {
    LOG_WARN("No clips to concatenate");
    return ErrorCode::InvalidInput;
  }

  /// Build concat list
  std::string list_content;
  list_content.reserve(256 * video_paths.size());
  for (const auto &p : video_paths) {
    std::string abs_path = std::filesystem::absolute(p).string();
    std::string escaped;
    for (char c : abs_path) {
      if (c == '\'')
        escaped += "'\\''";
      else
        escaped += c;
    }
    list_content += fmt::format("file '{}'\n", escaped);
  }

  /// Concat list lives in an anonymous memory file
  int fd = static_cast<int>(syscall(SYS_memfd_create, "concat_list_mem",
                                    MFD_CLOEXEC));
  if (fd == -1) {
    LOG_ERROR("Failed to create memory file!");
    return ErrorCode::IoFailure;
  }

  if (write(fd, list_content.c_str(), list_content.size()) !=
      static_cast<ssize_t>(list_content.size())) {
    LOG_ERROR("Failed to write to memory file");
    close(fd);
    return ErrorCode::IoFailure;
  }

  std::string mem_file_path = fmt::format("/proc/{}/fd/{}", getpid(), fd);

  LOG_INFO("[FFmpeg] Concatenating {} clip(s) into {}", video_paths.size(),
           std::filesystem::path(out_path).filename().string());

  TIMER_START(ffmpeg_concat);
  ErrorCode rc = run_ffmpeg(
      fmt::format("-f concat -safe 0 -protocol_whitelist file,pipe,fd -i {} "
                  "-c copy -fflags +genpts -avoid_negative_ts make_zero "
                  "-movflags +faststart {}",
                  shell_quote(mem_file_path), shell_quote(out_path)),
      "concat");
  TIMER_END(ffmpeg_concat);

  close(fd);
  return rc;
}

} // namespace voicesync
