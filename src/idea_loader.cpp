/**
 * @file idea_loader.cpp
 * @brief Idea list parsing implementation
 */

#include "voicesync/idea_loader.hpp"

#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <utility>

#include "voicesync/logging.hpp"
#include "voicesync/word_time_estimator.hpp"

namespace voicesync {

namespace {

/// Strict decimal parse of a whole string
bool parse_number(const std::string &text, double &value) {
  if (text.empty())
    return false;
  const char *begin = text.c_str();
  char *end = nullptr;
  errno = 0;
  const double v = std::strtod(begin, &end);
  if (errno != 0 || end == begin || *end != '\0')
    return false;
  value = v;
  return true;
}

bool json_time(const nlohmann::json &node, const char *key, double &seconds) {
  auto it = node.find(key);
  if (it == node.end())
    return false;
  if (it->is_number()) {
    seconds = it->get<double>();
    return seconds >= 0.0;
  }
  if (it->is_string())
    return parse_clock_time(it->get<std::string>(), seconds);
  return false;
}

std::string json_string(const nlohmann::json &node, const char *key) {
  auto it = node.find(key);
  return (it != node.end() && it->is_string()) ? it->get<std::string>()
                                                : std::string();
}

double json_number(const nlohmann::json &node, const char *key,
                   double default_val) {
  auto it = node.find(key);
  return (it != node.end() && it->is_number()) ? it->get<double>()
                                                : default_val;
}

} // namespace

std::string ClipIdea::script_text() const {
  std::string text;
  for (const auto &line : lines) {
    for (const auto &word : split_words(line.text)) {
      if (!text.empty())
        text += ' ';
      text += word;
    }
  }
  return text;
}

bool parse_clock_time(const std::string &text, double &seconds) {
  std::vector<std::string> fields;
  size_t pos = 0;
  while (true) {
    size_t colon = text.find(':', pos);
    fields.push_back(text.substr(pos, colon - pos));
    if (colon == std::string::npos)
      break;
    pos = colon + 1;
  }
  if (fields.size() > 3)
    return false;

  double total = 0.0;
  for (size_t i = 0; i < fields.size(); ++i) {
    double v = 0.0;
    if (!parse_number(fields[i], v) || v < 0.0)
      return false;
    /// Minutes and seconds below the leading field stay under 60
    if (i > 0 && v >= 60.0)
      return false;
    total = total * 60.0 + v;
  }
  seconds = total;
  return true;
}

std::string sanitize_filename(const std::string &name) {
  static const std::string illegal = "\\/*?:\"<>|";
  std::string out;
  out.reserve(name.size());
  for (char c : name) {
    if (illegal.find(c) == std::string::npos)
      out += c;
  }
  return out;
}

ErrorCode parse_idea(const nlohmann::json &node, size_t index, ClipIdea &idea) {
  if (!node.is_object()) {
    LOG_ERROR("[Idea {}] Not a JSON object", index + 1);
    return ErrorCode::InvalidInput;
  }

  ClipIdea out;
  out.title = json_string(node, "clip_title");
  out.description = json_string(node, "description");
  out.voice_style = json_string(node, "voice_style_prompt");

  if (out.title.empty()) {
    LOG_ERROR("[Idea {}] Missing clip_title", index + 1);
    return ErrorCode::InvalidInput;
  }

  if (!json_time(node, "start_time", out.source_start) ||
      !json_time(node, "end_time", out.source_end)) {
    LOG_ERROR("[Idea {}] '{}': start_time/end_time missing or malformed",
              index + 1, out.title);
    return ErrorCode::InvalidInput;
  }
  if (!(out.source_end > out.source_start)) {
    LOG_ERROR("[Idea {}] '{}': end_time {:.3f}s is not after start_time "
              "{:.3f}s",
              index + 1, out.title, out.source_end, out.source_start);
    return ErrorCode::InvalidInput;
  }

  auto script = node.find("tts_sync_script");
  if (script != node.end() && script->is_array()) {
    for (const auto &entry : *script) {
      if (!entry.is_object())
        continue;
      ScriptLine line;
      line.text = json_string(entry, "text");
      line.start_s = json_number(entry, "start_s", 0.0);
      line.end_s = json_number(entry, "end_s", 0.0);
      if (!split_words(line.text).empty())
        out.lines.push_back(std::move(line));
    }
  } else {
    ScriptLine line;
    line.text = json_string(node, "script");
    line.end_s = out.source_end - out.source_start;
    if (!split_words(line.text).empty())
      out.lines.push_back(std::move(line));
  }

  if (out.lines.empty()) {
    LOG_ERROR("[Idea {}] '{}': script has no words", index + 1, out.title);
    return ErrorCode::InvalidInput;
  }

  idea = std::move(out);
  return ErrorCode::Ok;
}

ErrorCode load_ideas_from_json(const nlohmann::json &doc,
                               std::vector<ClipIdea> &ideas) {
  if (!doc.is_array()) {
    LOG_ERROR("Idea list must be a JSON array");
    return ErrorCode::InvalidInput;
  }

  ideas.clear();
  for (size_t i = 0; i < doc.size(); ++i) {
    ClipIdea idea;
    if (parse_idea(doc[i], i, idea) == ErrorCode::Ok)
      ideas.push_back(std::move(idea));
  }

  if (ideas.size() != doc.size())
    LOG_WARN("Skipped {} malformed idea(s)", doc.size() - ideas.size());
  return ErrorCode::Ok;
}

ErrorCode load_ideas(const std::string &path, std::vector<ClipIdea> &ideas) {
  std::ifstream in(path);
  if (!in) {
    LOG_ERROR("Failed to open idea file: {}", path);
    return ErrorCode::IoFailure;
  }

  nlohmann::json doc;
  try {
    doc = nlohmann::json::parse(in);
  } catch (const nlohmann::json::parse_error &e) {
    LOG_ERROR("Idea file {} is not valid JSON: {}", path, e.what());
    return ErrorCode::InvalidInput;
  }

  return load_ideas_from_json(doc, ideas);
}

} // namespace voicesync
