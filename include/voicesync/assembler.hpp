/**
 * @file assembler.hpp
 * @brief Final batch assembly: concatenation and sidecar metadata
 *
 * @details After the batch, successful clips are joined in idea order into
 *          one video named after the first successful clip title:
 *
 *          - <title>.mp4                  concatenated clips
 *
 *          - <title>_descriptions.txt     "Clip N: ..." blocks
 *
 *          - <title>_metadata.json        the same, plus failed ideas
 *
 * @note The batch only fails when no idea succeeded. Failed ideas are
 *       reported with index, title and reason.
 */

#ifndef VOICESYNC_ASSEMBLER_HPP
#define VOICESYNC_ASSEMBLER_HPP

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "errors.hpp"
#include "media_toolkit.hpp"
#include "task_queue.hpp"
#include "types.hpp"

namespace voicesync {

/**
 * @struct AssemblyReport
 * @brief What the assembler produced.
 */
struct AssemblyReport {
  std::vector<size_t> included; //< Idea indices in output order
  std::vector<size_t> failed;   //< Idea indices that produced no clip
  std::string base_name;        //< Sanitized title used for file names
  std::string video_path;
  std::string descriptions_path;
  std::string metadata_path;
};

/**
 * @brief Base file name for the batch outputs.
 * @return The sanitized title, or "voicesync_output" if nothing is left
 */
std::string batch_base_name(const std::string &first_title);

/**
 * @brief Render the descriptions text for successful clips, in order.
 */
std::string render_descriptions(const std::vector<const ClipResult *> &clips);

/**
 * @brief Build the metadata document for a finished batch.
 */
nlohmann::json build_batch_metadata(const std::vector<ClipIdea> &ideas,
                                    const std::vector<IdeaOutcome> &outcomes,
                                    const std::string &base_name);

/**
 * @brief Concatenate successful clips and write sidecar files.
 *
 * @param ideas The batch's ideas (for titles of failed ideas)
 * @param outcomes One outcome per idea, in idea order
 * @param toolkit Media toolkit used for the concatenation
 * @param output_dir Directory receiving the outputs
 * @param report Output: produced files and idea partition
 * @return Ok; InvalidInput if no idea succeeded; IoFailure or ToolkitFailure
 *         if an output could not be written
 */
ErrorCode assemble_batch(const std::vector<ClipIdea> &ideas,
                         const std::vector<IdeaOutcome> &outcomes,
                         MediaToolkit &toolkit, const std::string &output_dir,
                         AssemblyReport &report);

} // namespace voicesync

#endif // VOICESYNC_ASSEMBLER_HPP
