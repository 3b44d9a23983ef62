/**
 * @file audio_decoder.cpp
 * @brief Audio decoding implementation
 *
 * @details Provides implementations for:
 *
 *          - MappedFile - mmap wrapper
 *
 *          - mem_read / mem_seek - FFmpeg custom I/O callbacks
 *
 *          - AudioDecoder - container open, decode and downmix
 *
 *          - WAV writing for the media toolkit
 */

#include "voicesync/audio_decoder.hpp"

#include <algorithm>
#include <cmath>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

extern "C" {
#include <libavformat/avio.h>
#include <libavutil/error.h>
#include <libavutil/samplefmt.h>
#include <libavutil/version.h>
}

#include "voicesync/logging.hpp"

namespace voicesync {

namespace {

int frame_channels(const AVFrame *f) {
#if LIBAVUTIL_VERSION_INT >= AV_VERSION_INT(57, 24, 100)
  return f->ch_layout.nb_channels;
#else
  return f->channels;
#endif
}

bool supported_format(AVSampleFormat fmt) {
  switch (av_get_packed_sample_fmt(fmt)) {
  case AV_SAMPLE_FMT_U8:
  case AV_SAMPLE_FMT_S16:
  case AV_SAMPLE_FMT_S32:
  case AV_SAMPLE_FMT_FLT:
  case AV_SAMPLE_FMT_DBL:
    return true;
  default:
    return false;
  }
}

/// One sample of one channel, scaled to [-1, 1]
float sample_at(const AVFrame *f, AVSampleFormat fmt, int channel,
                int channels, int index) {
  const bool planar = av_sample_fmt_is_planar(fmt);
  const uint8_t *plane = planar ? f->extended_data[channel]
                                : f->extended_data[0];
  const int i = planar ? index : index * channels + channel;

  switch (av_get_packed_sample_fmt(fmt)) {
  case AV_SAMPLE_FMT_U8:
    return (static_cast<int>(plane[i]) - 128) / 128.0f;
  case AV_SAMPLE_FMT_S16:
    return reinterpret_cast<const int16_t *>(plane)[i] / 32768.0f;
  case AV_SAMPLE_FMT_S32:
    return static_cast<float>(reinterpret_cast<const int32_t *>(plane)[i] /
                              2147483648.0);
  case AV_SAMPLE_FMT_FLT:
    return reinterpret_cast<const float *>(plane)[i];
  case AV_SAMPLE_FMT_DBL:
    return static_cast<float>(reinterpret_cast<const double *>(plane)[i]);
  default:
    return 0.0f;
  }
}

void put_le16(std::ofstream &out, uint16_t v) {
  const char b[2] = {static_cast<char>(v & 0xFF),
                     static_cast<char>((v >> 8) & 0xFF)};
  out.write(b, 2);
}

void put_le32(std::ofstream &out, uint32_t v) {
  const char b[4] = {
      static_cast<char>(v & 0xFF), static_cast<char>((v >> 8) & 0xFF),
      static_cast<char>((v >> 16) & 0xFF), static_cast<char>((v >> 24) & 0xFF)};
  out.write(b, 4);
}

} // namespace

// **---- MappedFile ----**

MappedFile::~MappedFile() { release(); }

MappedFile::MappedFile(MappedFile &&other) noexcept
    : data_(other.data_), size_(other.size_), fd_(other.fd_) {
  other.data_ = nullptr;
  other.size_ = 0;
  other.fd_ = -1;
}

MappedFile &MappedFile::operator=(MappedFile &&other) noexcept {
  if (this != &other) {
    release();
    data_ = other.data_;
    size_ = other.size_;
    fd_ = other.fd_;
    other.data_ = nullptr;
    other.size_ = 0;
    other.fd_ = -1;
  }
  return *this;
}

void MappedFile::release() {
  if (data_)
    munmap(data_, size_);
  if (fd_ != -1)
    close(fd_);
  data_ = nullptr;
  size_ = 0;
  fd_ = -1;
}

bool MappedFile::load(const std::string &path) {
  int fd = open(path.c_str(), O_RDONLY);
  if (fd == -1) {
    LOG_ERROR("Failed to open file: {}", path);
    return false;
  }

  struct stat sb;
  if (fstat(fd, &sb) == -1) {
    LOG_ERROR("Failed to stat file: {}", path);
    close(fd);
    return false;
  }
  if (sb.st_size <= 0) {
    LOG_ERROR("File is empty or invalid: {}", path);
    close(fd);
    return false;
  }

  ///\note MAP_POPULATE reads the whole (small) voiceover up front
  void *addr =
      mmap(nullptr, sb.st_size, PROT_READ, MAP_PRIVATE | MAP_POPULATE, fd, 0);
  if (addr == MAP_FAILED) {
    LOG_ERROR("Failed to mmap file: {}", path);
    close(fd);
    return false;
  }
  madvise(addr, sb.st_size, MADV_SEQUENTIAL);

  release();
  data_ = static_cast<uint8_t *>(addr);
  size_ = static_cast<size_t>(sb.st_size);
  fd_ = fd;
  return true;
}

// **---- Custom I/O ----**

int mem_read(void *opaque, uint8_t *buf, int buf_size) {
  MemReaderState *st = static_cast<MemReaderState *>(opaque);
  size_t bytes_left = st->size - st->pos;
  if (bytes_left == 0)
    return AVERROR_EOF;
  size_t copy = std::min(bytes_left, static_cast<size_t>(buf_size));
  memcpy(buf, st->ptr + st->pos, copy);
  st->pos += copy;
  return static_cast<int>(copy);
}

int64_t mem_seek(void *opaque, int64_t offset, int whence) {
  MemReaderState *st = static_cast<MemReaderState *>(opaque);

  if (whence == AVSEEK_SIZE)
    return static_cast<int64_t>(st->size);

  int64_t new_pos = static_cast<int64_t>(st->pos);
  switch (whence & ~AVSEEK_FORCE) {
  case SEEK_SET:
    new_pos = offset;
    break;
  case SEEK_CUR:
    new_pos += offset;
    break;
  case SEEK_END:
    new_pos = static_cast<int64_t>(st->size) + offset;
    break;
  default:
    return AVERROR(EINVAL);
  }

  new_pos = std::max<int64_t>(0, std::min<int64_t>(new_pos, st->size));
  st->pos = static_cast<size_t>(new_pos);
  return new_pos;
}

// **---- AudioDecoder ----**

AudioDecoder::AudioDecoder(const uint8_t *data, size_t size)
    : mem_state{data, size, 0}, input_data(data), input_size(size) {
  frame = av_frame_alloc();
  pkt = av_packet_alloc();
}

AudioDecoder::~AudioDecoder() {
  if (dec_ctx)
    avcodec_free_context(&dec_ctx);

  if (fmt_ctx)
    avformat_close_input(&fmt_ctx);

  /// With AVFMT_FLAG_CUSTOM_IO the I/O context stays ours to free. Its
  /// buffer may have been reallocated by FFmpeg, so free it through the
  /// context.
  if (avio_ctx) {
    av_freep(&avio_ctx->buffer);
    avio_context_free(&avio_ctx);
  } else if (avio_buffer) {
    av_free(avio_buffer);
  }

  av_frame_free(&frame);
  av_packet_free(&pkt);
}

ErrorCode AudioDecoder::initialize() {
  if (!frame || !pkt) {
    LOG_ERROR("Failed to allocate AVFrame/AVPacket");
    return ErrorCode::DecodeFailure;
  }
  if (!input_data || input_size == 0) {
    LOG_ERROR("Empty audio buffer");
    return ErrorCode::DecodeFailure;
  }

  fmt_ctx = avformat_alloc_context();
  if (!fmt_ctx) {
    LOG_ERROR("Failed to allocate AVFormatContext");
    return ErrorCode::DecodeFailure;
  }

  avio_buffer = static_cast<uint8_t *>(av_malloc(AVIO_BUFFER_SIZE));
  if (!avio_buffer) {
    LOG_ERROR("Failed to allocate AVIO buffer");
    return ErrorCode::DecodeFailure;
  }

  avio_ctx = avio_alloc_context(avio_buffer, AVIO_BUFFER_SIZE, 0, &mem_state,
                                mem_read, nullptr, mem_seek);
  if (!avio_ctx) {
    LOG_ERROR("Failed to allocate AVIOContext");
    return ErrorCode::DecodeFailure;
  }

  fmt_ctx->pb = avio_ctx;
  fmt_ctx->flags |= AVFMT_FLAG_CUSTOM_IO;

  if (avformat_open_input(&fmt_ctx, "RAM", nullptr, nullptr) < 0) {
    /// avformat_open_input frees fmt_ctx on failure but not our I/O context
    LOG_ERROR("avformat_open_input failed");
    return ErrorCode::DecodeFailure;
  }

  if (avformat_find_stream_info(fmt_ctx, nullptr) < 0) {
    LOG_ERROR("avformat_find_stream_info failed");
    return ErrorCode::DecodeFailure;
  }

  audio_stream_idx =
      av_find_best_stream(fmt_ctx, AVMEDIA_TYPE_AUDIO, -1, -1, nullptr, 0);
  if (audio_stream_idx < 0) {
    LOG_ERROR("No audio stream found");
    return ErrorCode::DecodeFailure;
  }

  for (unsigned int i = 0; i < fmt_ctx->nb_streams; i++) {
    if (i != static_cast<unsigned int>(audio_stream_idx))
      fmt_ctx->streams[i]->discard = AVDISCARD_ALL;
  }

  AVCodecParameters *param = fmt_ctx->streams[audio_stream_idx]->codecpar;
  const AVCodec *codec = avcodec_find_decoder(param->codec_id);
  if (!codec) {
    LOG_ERROR("No decoder found for codec ID {}",
              static_cast<int>(param->codec_id));
    return ErrorCode::DecodeFailure;
  }

  dec_ctx = avcodec_alloc_context3(codec);
  if (!dec_ctx) {
    LOG_ERROR("Failed to allocate decoder context");
    return ErrorCode::DecodeFailure;
  }
  if (avcodec_parameters_to_context(dec_ctx, param) < 0) {
    LOG_ERROR("avcodec_parameters_to_context failed");
    return ErrorCode::DecodeFailure;
  }

  /// Voiceovers are short; one decoder thread per worker is plenty
  dec_ctx->thread_count = 1;

  if (avcodec_open2(dec_ctx, codec, nullptr) < 0) {
    LOG_ERROR("avcodec_open2 failed");
    return ErrorCode::DecodeFailure;
  }

  if (!supported_format(dec_ctx->sample_fmt)) {
    const char *name = av_get_sample_fmt_name(dec_ctx->sample_fmt);
    LOG_ERROR("Unsupported sample format {}", name ? name : "unknown");
    return ErrorCode::DecodeFailure;
  }
  if (dec_ctx->sample_rate <= 0) {
    LOG_ERROR("Audio stream reports no sample rate");
    return ErrorCode::DecodeFailure;
  }

  return ErrorCode::Ok;
}

double AudioDecoder::get_duration() const {
  return (fmt_ctx && fmt_ctx->duration != AV_NOPTS_VALUE)
             ? fmt_ctx->duration / static_cast<double>(AV_TIME_BASE)
             : 0.0;
}

int AudioDecoder::sample_rate() const {
  return dec_ctx ? dec_ctx->sample_rate : 0;
}

void AudioDecoder::append_frame(const AVFrame *f,
                                std::vector<float> &samples) const {
  const AVSampleFormat fmt = static_cast<AVSampleFormat>(f->format);
  const int channels = std::max(1, frame_channels(f));
  const float scale = 1.0f / static_cast<float>(channels);

  samples.reserve(samples.size() + f->nb_samples);
  for (int i = 0; i < f->nb_samples; ++i) {
    float sum = 0.0f;
    for (int c = 0; c < channels; ++c)
      sum += sample_at(f, fmt, c, channels, i);
    samples.push_back(std::max(-1.0f, std::min(1.0f, sum * scale)));
  }
}

ErrorCode AudioDecoder::drain(std::vector<float> &samples) {
  while (true) {
    int ret = avcodec_receive_frame(dec_ctx, frame);
    if (ret == AVERROR(EAGAIN) || ret == AVERROR_EOF)
      return ErrorCode::Ok;
    if (ret < 0) {
      LOG_ERROR("avcodec_receive_frame failed ({})", ret);
      return ErrorCode::DecodeFailure;
    }
    append_frame(frame, samples);
    av_frame_unref(frame);
  }
}

ErrorCode AudioDecoder::decode_all(AudioTrack &out) {
  if (!dec_ctx) {
    LOG_ERROR("Decoder used before initialize()");
    return ErrorCode::DecodeFailure;
  }

  std::vector<float> samples;
  const double duration = get_duration();
  if (duration > 0.0)
    samples.reserve(static_cast<size_t>(duration * dec_ctx->sample_rate) + 1);

  while (av_read_frame(fmt_ctx, pkt) >= 0) {
    if (pkt->stream_index == audio_stream_idx) {
      int ret = avcodec_send_packet(dec_ctx, pkt);
      if (ret < 0 && ret != AVERROR(EAGAIN)) {
        LOG_WARN("Skipping undecodable audio packet ({})", ret);
      } else if (drain(samples) != ErrorCode::Ok) {
        av_packet_unref(pkt);
        return ErrorCode::DecodeFailure;
      }
    }
    av_packet_unref(pkt);
  }

  /// Flush the decoder
  avcodec_send_packet(dec_ctx, nullptr);
  if (drain(samples) != ErrorCode::Ok)
    return ErrorCode::DecodeFailure;

  if (samples.empty()) {
    LOG_ERROR("Audio stream decoded to zero samples");
    return ErrorCode::DecodeFailure;
  }

  out.samples = std::move(samples);
  out.sample_rate = dec_ctx->sample_rate;
  out.channels = 1;
  return ErrorCode::Ok;
}

// **---- Free functions ----**

ErrorCode decode_audio_file(const std::string &path, AudioTrack &out) {
  TIMER_START(decode_audio);

  MappedFile file;
  if (!file.load(path))
    return ErrorCode::DecodeFailure;

  AudioDecoder decoder(file.data(), file.size());
  ErrorCode rc = decoder.initialize();
  if (rc != ErrorCode::Ok) {
    LOG_ERROR("Cannot decode audio file {}", path);
    return rc;
  }
  rc = decoder.decode_all(out);
  if (rc != ErrorCode::Ok) {
    LOG_ERROR("Cannot decode audio file {}", path);
    return rc;
  }

  TIMER_END(decode_audio);
  return ErrorCode::Ok;
}

ErrorCode read_media_duration(const std::string &path, double &duration) {
  AVFormatContext *ctx = nullptr;
  if (avformat_open_input(&ctx, path.c_str(), nullptr, nullptr) < 0) {
    LOG_ERROR("Failed to open media file: {}", path);
    return ErrorCode::DecodeFailure;
  }
  if (avformat_find_stream_info(ctx, nullptr) < 0) {
    LOG_ERROR("avformat_find_stream_info failed for {}", path);
    avformat_close_input(&ctx);
    return ErrorCode::DecodeFailure;
  }

  const bool known = ctx->duration != AV_NOPTS_VALUE && ctx->duration > 0;
  const double value =
      known ? ctx->duration / static_cast<double>(AV_TIME_BASE) : 0.0;
  avformat_close_input(&ctx);

  if (!known) {
    LOG_ERROR("Media file {} has no duration", path);
    return ErrorCode::DecodeFailure;
  }
  duration = value;
  return ErrorCode::Ok;
}

ErrorCode write_wav_pcm16(const std::string &path, const AudioTrack &track) {
  if (track.sample_rate <= 0) {
    LOG_ERROR("Cannot write WAV without a sample rate: {}", path);
    return ErrorCode::InvalidInput;
  }

  std::ofstream out(path, std::ios::binary);
  if (!out) {
    LOG_ERROR("Failed to open {} for writing", path);
    return ErrorCode::IoFailure;
  }

  const uint32_t data_bytes =
      static_cast<uint32_t>(track.samples.size() * sizeof(int16_t));
  const uint32_t rate = static_cast<uint32_t>(track.sample_rate);

  out.write("RIFF", 4);
  put_le32(out, 36 + data_bytes);
  out.write("WAVE", 4);
  out.write("fmt ", 4);
  put_le32(out, 16);       // fmt chunk size
  put_le16(out, 1);        // PCM
  put_le16(out, 1);        // mono
  put_le32(out, rate);
  put_le32(out, rate * 2); // byte rate
  put_le16(out, 2);        // block align
  put_le16(out, 16);       // bits per sample
  out.write("data", 4);
  put_le32(out, data_bytes);

  for (float s : track.samples) {
    const float clamped = std::max(-1.0f, std::min(1.0f, s));
    const long v = std::lround(clamped * 32767.0f);
    put_le16(out, static_cast<uint16_t>(static_cast<int16_t>(v)));
  }

  if (!out) {
    LOG_ERROR("Failed to write WAV file {}", path);
    return ErrorCode::IoFailure;
  }
  return ErrorCode::Ok;
}

} // namespace voicesync
