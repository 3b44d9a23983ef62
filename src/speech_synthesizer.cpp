/**
 * @file speech_synthesizer.cpp
 * @brief Command-template TTS implementation
 */

#include "voicesync/speech_synthesizer.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <utility>

#include <fmt/args.h>
#include <fmt/core.h>

#include "voicesync/audio_decoder.hpp"
#include "voicesync/logging.hpp"
#include "voicesync/media_toolkit.hpp"
#include "voicesync/system.hpp"

namespace voicesync {

namespace {

bool write_text_file(const std::string &path, const std::string &content) {
  std::ofstream out(path);
  if (!out) {
    LOG_ERROR("Failed to open {} for writing", path);
    return false;
  }
  out << content;
  return static_cast<bool>(out);
}

} // namespace

CommandSynthesizer::CommandSynthesizer(std::string command_template)
    : command_template_(std::move(command_template)) {}

std::string CommandSynthesizer::expand(const std::string &text_file,
                                       const std::string &style_file,
                                       const std::string &output) const {
  try {
    return fmt::format(fmt::runtime(command_template_),
                       fmt::arg("text_file", shell_quote(text_file)),
                       fmt::arg("style_file", shell_quote(style_file)),
                       fmt::arg("output", shell_quote(output)));
  } catch (const fmt::format_error &e) {
    LOG_ERROR("Malformed TTS command template '{}': {}", command_template_,
              e.what());
    return {};
  }
}

ErrorCode CommandSynthesizer::synthesize(const std::string &text,
                                         const std::string &style,
                                         const std::string &scratch_dir,
                                         AudioTrack &out) {
  if (command_template_.empty()) {
    LOG_ERROR("No TTS command configured (set TTS_COMMAND)");
    return ErrorCode::SynthesisFailure;
  }
  if (text.empty()) {
    LOG_ERROR("Refusing to synthesize an empty script");
    return ErrorCode::SynthesisFailure;
  }

  const std::filesystem::path dir(scratch_dir);
  const std::string text_file = (dir / "script.txt").string();
  const std::string style_file = (dir / "style.txt").string();
  const std::string output = (dir / "tts_raw.wav").string();

  if (!write_text_file(text_file, text) ||
      !write_text_file(style_file, style))
    return ErrorCode::SynthesisFailure;

  std::error_code ec;
  std::filesystem::remove(output, ec);

  const std::string cmd = expand(text_file, style_file, output);
  if (cmd.empty())
    return ErrorCode::SynthesisFailure;

  TIMER_START(tts);
  int status = std::system(cmd.c_str());
  TIMER_END(tts);
  if (interrupted_status(status)) {
    LOG_WARN("TTS command interrupted");
    if (cancel_)
      cancel_->store(true);
    return ErrorCode::Cancelled;
  }
  if (status != 0) {
    LOG_ERROR("TTS command failed with status {}", status);
    return ErrorCode::SynthesisFailure;
  }

  if (!std::filesystem::exists(output, ec)) {
    LOG_ERROR("TTS command did not write {}", output);
    return ErrorCode::SynthesisFailure;
  }

  if (decode_audio_file(output, out) != ErrorCode::Ok) {
    LOG_ERROR("TTS output {} is not decodable audio", output);
    return ErrorCode::SynthesisFailure;
  }
  return ErrorCode::Ok;
}

} // namespace voicesync
