/**
 * @file audio_decoder.hpp
 * @brief Audio file decoding into mono float tracks
 *
 * @details Provides:
 *          - MappedFile: RAII read-only mmap of an input file
 *
 *          - AudioDecoder: FFmpeg decoder reading from a memory buffer
 *
 *          - decode_audio_file / read_media_duration / write_wav_pcm16
 *
 * @attention THREAD MODEL:
 *            Each pipeline worker creates its own AudioDecoder. FFmpeg
 *            decoder state is never shared between threads.
 */

#ifndef VOICESYNC_AUDIO_DECODER_HPP
#define VOICESYNC_AUDIO_DECODER_HPP

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
}

#include <cstdint>
#include <string>
#include <vector>

#include "errors.hpp"
#include "types.hpp"

namespace voicesync {

/**
 * @brief Read cursor over an in-memory file, handed to FFmpeg as opaque.
 */
struct MemReaderState {
  const uint8_t *ptr; //< Buffer start
  size_t size;        //< Total buffer size
  size_t pos;         //< Current read position
};

/**
 * @class MappedFile
 * @brief RAII wrapper for a read-only memory-mapped file.
 * @note Move-only. munmap/close happen on destruction.
 */
class MappedFile {
public:
  MappedFile() = default;
  ~MappedFile();

  MappedFile(const MappedFile &) = delete;
  MappedFile &operator=(const MappedFile &) = delete;

  MappedFile(MappedFile &&other) noexcept;
  MappedFile &operator=(MappedFile &&other) noexcept;

  /**
   * @brief Map path into memory, replacing any previous mapping.
   * @return false (and logs) if the file is missing, empty or unmappable
   */
  bool load(const std::string &path);

  const uint8_t *data() const { return data_; }
  size_t size() const { return size_; }
  bool is_valid() const { return data_ != nullptr; }

private:
  void release();

  uint8_t *data_ = nullptr;
  size_t size_ = 0;
  int fd_ = -1;
};

/**
 * @class AudioDecoder
 * @brief Decodes the best audio stream of an in-memory container.
 *
 * @attention
 * `MANAGEMENT`:
 *
 *            - Uses AVFMT_FLAG_CUSTOM_IO; the AVIO context and its buffer
 *              are freed by the destructor after the container is closed
 *
 *            - Destructor handles partial initialization failures
 *
 * `FORMATS`:
 *
 *            - u8, s16, s32, flt and dbl, packed or planar. Channels are
 *              averaged down to mono.
 */
class AudioDecoder {
  AVFormatContext *fmt_ctx = nullptr;
  AVCodecContext *dec_ctx = nullptr;
  AVFrame *frame = nullptr;
  AVPacket *pkt = nullptr;
  AVIOContext *avio_ctx = nullptr;
  uint8_t *avio_buffer = nullptr;

  MemReaderState mem_state;
  int audio_stream_idx = -1;

  /// Encoded bytes (not owned)
  const uint8_t *input_data;
  size_t input_size;

  /// Downmix one decoded frame and append it to samples
  void append_frame(const AVFrame *f, std::vector<float> &samples) const;

  /// Receive every pending frame from the decoder
  ErrorCode drain(std::vector<float> &samples);

public:
  AudioDecoder(const uint8_t *data, size_t size);
  ~AudioDecoder();

  AudioDecoder(const AudioDecoder &) = delete;
  AudioDecoder &operator=(const AudioDecoder &) = delete;

  /**
   * @brief Open the container and the audio decoder.
   * @return Ok or DecodeFailure
   */
  ErrorCode initialize();

  /// Container duration in seconds (0 when unknown)
  double get_duration() const;

  /// Decoder sample rate (valid after initialize)
  int sample_rate() const;

  /**
   * @brief Decode the whole stream.
   * @return Ok or DecodeFailure
   */
  ErrorCode decode_all(AudioTrack &out);
};

/// FFmpeg read callback over a MemReaderState
int mem_read(void *opaque, uint8_t *buf, int buf_size);

/// FFmpeg seek callback over a MemReaderState (supports AVSEEK_SIZE)
int64_t mem_seek(void *opaque, int64_t offset, int whence);

/**
 * @brief Map and decode an audio file.
 * @return Ok, or DecodeFailure (file missing, unreadable or not audio)
 */
ErrorCode decode_audio_file(const std::string &path, AudioTrack &out);

/**
 * @brief Container duration of any media file, in seconds.
 * @return Ok or DecodeFailure
 */
ErrorCode read_media_duration(const std::string &path, double &duration);

/**
 * @brief Write a track as 16-bit PCM mono WAV.
 * @return Ok or IoFailure
 */
ErrorCode write_wav_pcm16(const std::string &path, const AudioTrack &track);

} // namespace voicesync

#endif // VOICESYNC_AUDIO_DECODER_HPP
