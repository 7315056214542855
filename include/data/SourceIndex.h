#pragma once

#include "dsp/AudioFile.h"
#include <filesystem>
#include <string>
#include <vector>

namespace StemMix {
namespace Data {

/**
 * @brief Input/output file pair of one aligned track folder
 */
struct AlignedPair {
    std::filesystem::path input;
    std::filesystem::path output;
};

/**
 * @brief Expand a leading "~" to $HOME
 */
std::filesystem::path expandUser(const std::filesystem::path& path);

/**
 * @brief Shell-style wildcard match supporting '*', '?' and '[...]'
 */
bool matchesGlob(const std::string& name, const std::string& pattern);

/**
 * @brief Regular files in a directory whose name matches pattern, sorted
 */
std::vector<std::filesystem::path> globFiles(const std::filesystem::path& directory,
                                             const std::string& pattern);

/**
 * @brief root/split, checked to be an existing directory
 * @throws Core::ConfigurationError otherwise
 */
std::filesystem::path splitDirectory(const std::filesystem::path& root, const std::string& split);

/**
 * @brief Probe path, logging it to stderr and returning false if unreadable
 */
bool isReadableAudio(const DSP::AudioAccessor& accessor, const std::filesystem::path& path);

/**
 * @brief Per-folder file lists for root/split/<folder>/<glob>
 *
 * One list per folder name, in the given order. Files the accessor cannot
 * probe are left out.
 * @throws Core::ConfigurationError if a folder is missing or holds no readable match
 */
std::vector<std::vector<std::filesystem::path>> buildFolderIndex(const std::filesystem::path& root,
                                                                 const std::string& split,
                                                                 const std::vector<std::string>& folders,
                                                                 const std::string& glob,
                                                                 const DSP::AudioAccessor& accessor);

/**
 * @brief Track folders under root/split holding both an input and an output file
 *
 * Folders missing either file, or whose files cannot be probed, are skipped.
 * Patterns accept wildcards; the first match (by name) is used.
 */
std::vector<AlignedPair> buildAlignedIndex(const std::filesystem::path& root,
                                           const std::string& split,
                                           const std::string& inputPattern,
                                           const std::string& outputPattern,
                                           const DSP::AudioAccessor& accessor);

/**
 * @brief All track folders directly under root/split, sorted
 */
std::vector<std::filesystem::path> buildTrackIndex(const std::filesystem::path& root,
                                                   const std::string& split);

} // namespace Data
} // namespace StemMix
