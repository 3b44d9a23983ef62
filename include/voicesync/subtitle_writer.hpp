/**
 * @file subtitle_writer.hpp
 * @brief Renders a TimingMap as an Advanced SubStation Alpha script
 *
 * @details Two layers per phrase:
 *
 *          - Layer 0: the whole phrase in white from phrase start to end
 *
 *          - Layer 1: one event per cue with the spoken word in yellow,
 *            drawn over layer 0
 *
 *          Nothing is emitted between phrases, so the screen is clear during
 *          hard breaks. The canvas is a 1080x1920 portrait frame.
 */

#ifndef VOICESYNC_SUBTITLE_WRITER_HPP
#define VOICESYNC_SUBTITLE_WRITER_HPP

#include <string>

#include "errors.hpp"
#include "types.hpp"

namespace voicesync {

/// H:MM:SS.cc as ASS expects (centiseconds, negative clamps to 0)
std::string format_ass_time(double seconds);

/**
 * @brief Make script text safe for an ASS event and uppercase it.
 * @note Braces and backslashes would start override tags; they are replaced.
 *       Only ASCII letters change case.
 */
std::string ass_display_text(const std::string &text);

/// Complete ASS document for a timing map
std::string render_ass(const TimingMap &timing);

/**
 * @brief Write render_ass(timing) to path.
 * @return Ok or IoFailure
 */
ErrorCode write_ass_file(const TimingMap &timing, const std::string &path);

} // namespace voicesync

#endif // VOICESYNC_SUBTITLE_WRITER_HPP
