/**
 * @file subtitle_writer.cpp
 * @brief ASS rendering implementation
 */

#include "voicesync/subtitle_writer.hpp"

#include <cctype>
#include <cmath>
#include <fstream>

#include <fmt/core.h>

#include "voicesync/logging.hpp"
#include "voicesync/timing_map_builder.hpp"
#include "voicesync/word_time_estimator.hpp"

namespace voicesync {

namespace {

constexpr const char *ASS_HEADER =
    "[Script Info]\n"
    "ScriptType: v4.00+\n"
    "PlayResX: 1080\n"
    "PlayResY: 1920\n"
    "\n"
    "[V4+ Styles]\n"
    "Format: Name, Fontname, Fontsize, PrimaryColour, SecondaryColour, "
    "OutlineColour, BackColour, Bold, Italic, Underline, StrikeOut, ScaleX, "
    "ScaleY, Spacing, Angle, BorderStyle, Outline, Shadow, Alignment, "
    "MarginL, MarginR, MarginV, Encoding\n"
    "Style: White,Arial Black,90,&H00FFFFFF,&H000000FF,&H00000000,&H00000000,"
    "-1,0,0,0,100,100,2,0,1,6,2,5,50,50,200,1\n"
    "\n"
    "[Events]\n"
    "Format: Layer, Start, End, Style, Name, MarginL, MarginR, MarginV, "
    "Effect, Text\n";

constexpr const char *HIGHLIGHT_ON = "{\\c&H00FFFF&}";
constexpr const char *HIGHLIGHT_OFF = "{\\c&HFFFFFF&}";

std::string ass_ms_time(int64_t ms) {
  return format_ass_time(static_cast<double>(ms) / 1000.0);
}

} // namespace

std::string format_ass_time(double seconds) {
  if (!(seconds > 0.0))
    seconds = 0.0;
  const long long total_cs = std::llround(seconds * 100.0);
  const long long h = total_cs / 360000;
  const long long m = (total_cs / 6000) % 60;
  const long long s = (total_cs / 100) % 60;
  const long long cs = total_cs % 100;
  return fmt::format("{}:{:02d}:{:02d}.{:02d}", h, m, s, cs);
}

std::string ass_display_text(const std::string &text) {
  std::string out;
  out.reserve(text.size());
  for (unsigned char c : text) {
    switch (c) {
    case '{':
      out.push_back('(');
      break;
    case '}':
      out.push_back(')');
      break;
    case '\\':
      out.push_back('/');
      break;
    case '\n':
    case '\r':
      out.push_back(' ');
      break;
    default:
      out.push_back(c < 0x80 ? static_cast<char>(std::toupper(c))
                             : static_cast<char>(c));
    }
  }
  return out;
}

std::string render_ass(const TimingMap &timing) {
  std::string doc = ASS_HEADER;

  // **---- LAYER 0: FULL PHRASES ----**

  for (const auto &p : timing.phrases) {
    doc += fmt::format("Dialogue: 0,{},{},White,,0,0,0,,{}\n",
                       ass_ms_time(to_ms(p.start)), ass_ms_time(to_ms(p.end)),
                       ass_display_text(p.text));
  }

  // **---- LAYER 1: HIGHLIGHTED WORD ----**

  for (const auto &cue : to_cues(timing)) {
    const auto words = split_words(cue.text);
    std::string line;
    for (size_t i = 0; i < words.size(); ++i) {
      if (i > 0)
        line += ' ';
      if (static_cast<int>(i) == cue.highlighted_word_index) {
        line += HIGHLIGHT_ON;
        line += ass_display_text(words[i]);
        line += HIGHLIGHT_OFF;
      } else {
        line += ass_display_text(words[i]);
      }
    }
    doc += fmt::format("Dialogue: 1,{},{},White,,0,0,0,,{}\n",
                       ass_ms_time(cue.start_ms), ass_ms_time(cue.end_ms),
                       line);
  }

  return doc;
}

ErrorCode write_ass_file(const TimingMap &timing, const std::string &path) {
  std::ofstream out(path);
  if (!out) {
    LOG_ERROR("Failed to open subtitle file {}", path);
    return ErrorCode::IoFailure;
  }
  out << render_ass(timing);
  if (!out) {
    LOG_ERROR("Failed to write subtitle file {}", path);
    return ErrorCode::IoFailure;
  }
  return ErrorCode::Ok;
}

} // namespace voicesync
