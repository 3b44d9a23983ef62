/**
 * @file idea_loader.hpp
 * @brief Reads the upstream clip idea list
 *
 * @details The idea file is a JSON array. Each element:
 *
 *          {"clip_title", "description", "start_time", "end_time",
 *           "voice_style_prompt", "tts_sync_script": [{"start_s", "end_s",
 *           "text"}]}
 *
 *          A plain "script" string may replace tts_sync_script. Times are
 *          "H:MM:SS(.fff)", "MM:SS" or seconds (string or number).
 *
 * @note Malformed ideas are logged and skipped; the rest still load.
 */

#ifndef VOICESYNC_IDEA_LOADER_HPP
#define VOICESYNC_IDEA_LOADER_HPP

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "errors.hpp"
#include "types.hpp"

namespace voicesync {

/**
 * @brief Parse a clock or seconds string.
 * @return false for empty, negative or malformed input
 */
bool parse_clock_time(const std::string &text, double &seconds);

/// Remove \ / * ? : " < > | from a title
std::string sanitize_filename(const std::string &name);

/**
 * @brief Validate and convert one idea object.
 * @param index Position in the list (for logs)
 * @return Ok or InvalidInput
 */
ErrorCode parse_idea(const nlohmann::json &node, size_t index, ClipIdea &idea);

/**
 * @brief Convert a parsed idea array, skipping malformed entries.
 * @return Ok, or InvalidInput if doc is not an array
 */
ErrorCode load_ideas_from_json(const nlohmann::json &doc,
                               std::vector<ClipIdea> &ideas);

/**
 * @brief Read and convert an idea file.
 * @return Ok, IoFailure (unreadable) or InvalidInput (not JSON / not an array)
 */
ErrorCode load_ideas(const std::string &path, std::vector<ClipIdea> &ideas);

} // namespace voicesync

#endif // VOICESYNC_IDEA_LOADER_HPP
