#include "data/SourceIndex.h"
#include "core/Errors.h"
#include <algorithm>
#include <cstdlib>
#include <iostream>

namespace fs = std::filesystem;

namespace StemMix {
namespace Data {

namespace {

// Matches a '[...]' class starting at pattern[p]; advances p past ']'
bool matchClass(char c, const std::string& pattern, size_t& p) {
    size_t i = p + 1;
    bool negate = false;
    if (i < pattern.size() && (pattern[i] == '!' || pattern[i] == '^')) {
        negate = true;
        ++i;
    }

    bool matched = false;
    bool first = true;
    while (i < pattern.size() && (pattern[i] != ']' || first)) {
        if (i + 2 < pattern.size() && pattern[i + 1] == '-' && pattern[i + 2] != ']') {
            if (pattern[i] <= c && c <= pattern[i + 2]) {
                matched = true;
            }
            i += 3;
        } else {
            if (pattern[i] == c) {
                matched = true;
            }
            ++i;
        }
        first = false;
    }

    p = i + 1;
    return matched != negate;
}

std::vector<fs::path> sortedEntries(const fs::path& directory, bool wantDirectories) {
    std::vector<fs::path> entries;
    for (const auto& entry : fs::directory_iterator(directory)) {
        if (wantDirectories ? entry.is_directory() : entry.is_regular_file()) {
            entries.push_back(entry.path());
        }
    }
    std::sort(entries.begin(), entries.end());
    return entries;
}

} // namespace

fs::path expandUser(const fs::path& path) {
    const std::string text = path.string();
    if (text.empty() || text[0] != '~') {
        return path;
    }
    if (text.size() > 1 && text[1] != '/') {
        return path;
    }

    const char* home = std::getenv("HOME");
    if (!home) {
        return path;
    }
    return fs::path(std::string(home) + text.substr(1));
}

bool matchesGlob(const std::string& name, const std::string& pattern) {
    size_t n = 0;
    size_t p = 0;
    size_t starPattern = std::string::npos;
    size_t starName = 0;

    while (n < name.size()) {
        if (p < pattern.size() && pattern[p] == '*') {
            starPattern = p++;
            starName = n;
            continue;
        }
        if (p < pattern.size() && pattern[p] == '[' && pattern.find(']', p + 2) != std::string::npos) {
            size_t next = p;
            if (matchClass(name[n], pattern, next)) {
                p = next;
                ++n;
                continue;
            }
        } else if (p < pattern.size() && (pattern[p] == '?' || pattern[p] == name[n])) {
            ++p;
            ++n;
            continue;
        }

        // Backtrack to the last '*'
        if (starPattern == std::string::npos) {
            return false;
        }
        p = starPattern + 1;
        n = ++starName;
    }

    while (p < pattern.size() && pattern[p] == '*') {
        ++p;
    }
    return p == pattern.size();
}

std::vector<fs::path> globFiles(const fs::path& directory, const std::string& pattern) {
    std::vector<fs::path> matches;
    if (!fs::is_directory(directory)) {
        return matches;
    }
    for (const auto& file : sortedEntries(directory, false)) {
        if (matchesGlob(file.filename().string(), pattern)) {
            matches.push_back(file);
        }
    }
    return matches;
}

fs::path splitDirectory(const fs::path& root, const std::string& split) {
    const fs::path directory = expandUser(root) / split;
    if (!fs::is_directory(directory)) {
        throw Core::ConfigurationError("Dataset split directory not found: " + directory.string());
    }
    return directory;
}

bool isReadableAudio(const DSP::AudioAccessor& accessor, const fs::path& path) {
    try {
        accessor.probe(path);
        return true;
    } catch (const Core::UnreadableFileError& e) {
        std::cerr << "[FolderIndex] Skipping unreadable: " << e.what() << std::endl;
        return false;
    }
}

std::vector<std::vector<fs::path>> buildFolderIndex(const fs::path& root,
                                                    const std::string& split,
                                                    const std::vector<std::string>& folders,
                                                    const std::string& glob,
                                                    const DSP::AudioAccessor& accessor) {
    const fs::path base = splitDirectory(root, split);

    std::vector<std::vector<fs::path>> index;
    index.reserve(folders.size());
    for (const auto& folder : folders) {
        std::vector<fs::path> files;
        for (auto& file : globFiles(base / folder, glob)) {
            if (isReadableAudio(accessor, file)) {
                files.push_back(std::move(file));
            }
        }
        if (files.empty()) {
            throw Core::ConfigurationError("No readable files matching '" + glob + "' in " +
                                           (base / folder).string());
        }
        index.push_back(std::move(files));
    }
    return index;
}

std::vector<AlignedPair> buildAlignedIndex(const fs::path& root,
                                           const std::string& split,
                                           const std::string& inputPattern,
                                           const std::string& outputPattern,
                                           const DSP::AudioAccessor& accessor) {
    std::vector<AlignedPair> pairs;
    for (const auto& trackFolder : buildTrackIndex(root, split)) {
        const auto inputs = globFiles(trackFolder, inputPattern);
        const auto outputs = globFiles(trackFolder, outputPattern);
        if (inputs.empty() || outputs.empty()) {
            continue;
        }
        if (isReadableAudio(accessor, inputs.front()) && isReadableAudio(accessor, outputs.front())) {
            pairs.push_back({inputs.front(), outputs.front()});
        }
    }
    return pairs;
}

std::vector<fs::path> buildTrackIndex(const fs::path& root, const std::string& split) {
    return sortedEntries(splitDirectory(root, split), true);
}

} // namespace Data
} // namespace StemMix
