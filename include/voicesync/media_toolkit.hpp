/**
 * @file media_toolkit.hpp
 * @brief Media collaborator interface and its FFmpeg implementation
 *
 * @details The engine never encodes or muxes media itself. Everything that
 *          touches containers goes through MediaToolkit:
 *
 *          - cut: extract the source segment of an idea
 *
 *          - media_duration: container duration of a media file
 *
 *          - stretch: pitch-preserving time-stretch of a track
 *
 *          - merge: replace a clip's audio with a track
 *
 *          - burn_subtitles: render a TimingMap onto a clip
 *
 *          - concat: join finished clips in order
 *
 * @note Implementations must be safe to call from several pipeline workers
 *       at once. All intermediate files go to the caller's scratch directory.
 */

#ifndef VOICESYNC_MEDIA_TOOLKIT_HPP
#define VOICESYNC_MEDIA_TOOLKIT_HPP

#include <atomic>
#include <string>
#include <vector>

#include "errors.hpp"
#include "types.hpp"

namespace voicesync {

class MediaToolkit {
public:
  virtual ~MediaToolkit() = default;

  /**
   * @brief Cut [start, end) of a source video into out_path (re-encoded so
   *        the cut is frame accurate).
   */
  virtual ErrorCode cut(const std::string &source_path, double start,
                        double end, const std::string &out_path) = 0;

  /**
   * @brief Container duration of a media file in seconds.
   */
  virtual ErrorCode media_duration(const std::string &media_path,
                                   double &duration) = 0;

  /**
   * @brief Pitch-preserving stretch: output duration = input / factor.
   */
  virtual ErrorCode stretch(const AudioTrack &track, double factor,
                            const std::string &scratch_dir,
                            AudioTrack &out) = 0;

  /**
   * @brief Replace the audio of video_path with track.
   */
  virtual ErrorCode merge(const std::string &video_path,
                          const AudioTrack &track,
                          const std::string &scratch_dir,
                          const std::string &out_path) = 0;

  /**
   * @brief Burn the cues of a timing map into the picture.
   */
  virtual ErrorCode burn_subtitles(const std::string &video_path,
                                   const TimingMap &timing,
                                   const std::string &scratch_dir,
                                   const std::string &out_path) = 0;

  /**
   * @brief Join clips in order (stream copy).
   */
  virtual ErrorCode concat(const std::vector<std::string> &video_paths,
                           const std::string &scratch_dir,
                           const std::string &out_path) = 0;
};

/**
 * @brief Build the atempo filter chain for a stretch factor.
 * @note A single atempo instance accepts [0.5, 2.0]; larger or smaller
 *       factors are split into several instances.
 * @return e.g. "atempo=2.0,atempo=1.250000"
 */
std::string build_atempo_chain(double factor);

/**
 * @brief Video filter that center-crops to 9:16 and scales to the output
 *        frame (OUTPUT_WIDTH x OUTPUT_HEIGHT, yuv420p).
 * @note The crop keeps the full height of landscape sources and the full
 *       width of sources that are already narrower than 9:16.
 */
std::string build_vertical_crop_filter();

/**
 * @brief Arguments of the cut invocation (everything after the common flags).
 */
std::string build_cut_args(const std::string &source_path, double start,
                           double end, const std::string &out_path);

/**
 * @brief Escape a path for use inside a quoted FFmpeg filter argument.
 */
std::string escape_filter_path(const std::string &path);

/// Single-quote an argument for /bin/sh
std::string shell_quote(const std::string &arg);

/**
 * @class FFmpegToolkit
 * @brief MediaToolkit backed by the ffmpeg command-line binary.
 * @note Commands are built with fmt and run through std::system with the
 *       log level kept at "error". Durations are read in-process with
 *       libavformat and stretched audio is decoded in-process.
 *
 * @note A child stopped by Ctrl-C yields Cancelled and raises the cancel
 *       flag, since std::system keeps SIGINT from reaching the caller.
 */
class FFmpegToolkit : public MediaToolkit {
public:
  /**
   * @param ffmpeg_bin Path or name of the ffmpeg binary
   */
  explicit FFmpegToolkit(std::string ffmpeg_bin = "ffmpeg");

  /// Flag raised when an ffmpeg child is interrupted (nullptr = none)
  void set_cancel_flag(std::atomic<bool> *flag) { cancel_ = flag; }

  ErrorCode cut(const std::string &source_path, double start, double end,
                const std::string &out_path) override;

  ErrorCode media_duration(const std::string &media_path,
                           double &duration) override;

  ErrorCode stretch(const AudioTrack &track, double factor,
                    const std::string &scratch_dir, AudioTrack &out) override;

  ErrorCode merge(const std::string &video_path, const AudioTrack &track,
                  const std::string &scratch_dir,
                  const std::string &out_path) override;

  ErrorCode burn_subtitles(const std::string &video_path,
                           const TimingMap &timing,
                           const std::string &scratch_dir,
                           const std::string &out_path) override;

  ErrorCode concat(const std::vector<std::string> &video_paths,
                   const std::string &scratch_dir,
                   const std::string &out_path) override;

private:
  std::string ffmpeg_bin_;
  std::atomic<unsigned> scratch_seq_{0}; //< Unique names for temp files
  std::atomic<bool> *cancel_ = nullptr;

  /**
   * @brief Run one ffmpeg invocation.
   * @param args Everything after the binary and the common flags
   * @param what Short label for logs
   * @return Ok, ToolkitFailure, or Cancelled if ffmpeg was interrupted
   */
  ErrorCode run_ffmpeg(const std::string &args, const char *what);
};

} // namespace voicesync

#endif // VOICESYNC_MEDIA_TOOLKIT_HPP
