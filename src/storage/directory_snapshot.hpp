#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace codeexec::storage {

struct SnapshotEntry {
    std::uint64_t size = 0;
    std::string digest;
};

using DirectorySnapshot = std::map<std::string, SnapshotEntry>;

// Visits regular files below root (symlinks are neither followed nor reported,
// in-flight temp files are skipped). The path handed to visit is relative and
// uses '/' separators.
void WalkRegularFiles(const std::filesystem::path& root,
                      const std::function<void(const std::string&, const std::filesystem::path&,
                                               std::uintmax_t)>& visit);

// Content digests of every regular non-metadata file below root.
DirectorySnapshot SnapshotDirectory(const std::filesystem::path& root);

// Paths present in after that are new or whose content differs from before.
std::vector<std::string> ChangedPaths(const DirectorySnapshot& before, const DirectorySnapshot& after);

std::vector<std::string> RemovedPaths(const DirectorySnapshot& before, const DirectorySnapshot& after);

// Removes whatever sits at path unless it is a regular file (directory trees,
// symlinks, fifos). Returns true when something was removed.
bool RemoveIrregularEntry(const std::filesystem::path& path);

std::string ReadWholeFile(const std::filesystem::path& path);

// Write to a temp sibling, then rename over target.
void WriteFileAtomic(const std::filesystem::path& target, const std::string& data);

}  // namespace codeexec::storage
