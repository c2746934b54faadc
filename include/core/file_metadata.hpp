#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

/**
 * @brief Metadata of one successfully hashed image
 */
struct FileMetadata
{
    std::string path;      // Absolute file path, unique within a run
    uint64_t hash = 0;     // 64-bit difference hash of the pixel content
    uint64_t resolution = 0; // Pixel count (width x height)
    uint64_t size = 0;     // File size in bytes
    double mod_time = 0.0; // Last modification, seconds since epoch

    FileMetadata() = default;
    FileMetadata(const std::string &p, uint64_t h, uint64_t res, uint64_t sz, double mtime)
        : path(p), hash(h), resolution(res), size(sz), mod_time(mtime) {}
};

// Keyed by path; ordered so that iteration is deterministic
using FileMetadataMap = std::map<std::string, FileMetadata>;

// Each group is a sorted list of at least two distinct paths
using DuplicateGroup = std::vector<std::string>;
using DuplicateGroups = std::vector<DuplicateGroup>;
