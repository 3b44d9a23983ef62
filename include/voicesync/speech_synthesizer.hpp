/**
 * @file speech_synthesizer.hpp
 * @brief Text-to-speech collaborator interface
 *
 * @details The engine consumes synthesized audio; it does not synthesize.
 *          CommandSynthesizer runs any local TTS binary through a command
 *          template, e.g.
 *
 *          `piper --model en_US-lessac-medium.onnx --output_file {output} < {text_file}`
 *
 *          Placeholders: {text_file} (UTF-8 script), {style_file} (voice
 *          style prompt), {output} (WAV path the command must write).
 */

#ifndef VOICESYNC_SPEECH_SYNTHESIZER_HPP
#define VOICESYNC_SPEECH_SYNTHESIZER_HPP

#include <atomic>
#include <string>

#include "errors.hpp"
#include "types.hpp"

namespace voicesync {

class SpeechSynthesizer {
public:
  virtual ~SpeechSynthesizer() = default;

  /**
   * @brief Synthesize a script.
   * @param text Script text
   * @param style Voice style prompt (may be empty)
   * @param scratch_dir Per-idea scratch directory
   * @param out Decoded raw track
   * @return Ok, SynthesisFailure, or Cancelled if the run was interrupted
   */
  virtual ErrorCode synthesize(const std::string &text,
                               const std::string &style,
                               const std::string &scratch_dir,
                               AudioTrack &out) = 0;
};

/**
 * @class CommandSynthesizer
 * @brief Runs an external TTS command and decodes the WAV it writes.
 */
class CommandSynthesizer : public SpeechSynthesizer {
public:
  explicit CommandSynthesizer(std::string command_template);

  /// Flag raised when the TTS command is interrupted (nullptr = none)
  void set_cancel_flag(std::atomic<bool> *flag) { cancel_ = flag; }

  ErrorCode synthesize(const std::string &text, const std::string &style,
                       const std::string &scratch_dir,
                       AudioTrack &out) override;

  /**
   * @brief Expand the command template.
   * @return Empty string if the template is malformed
   */
  std::string expand(const std::string &text_file,
                     const std::string &style_file,
                     const std::string &output) const;

private:
  std::string command_template_;
  std::atomic<bool> *cancel_ = nullptr;
};

} // namespace voicesync

#endif // VOICESYNC_SPEECH_SYNTHESIZER_HPP
