#pragma once

#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>
#include <vector>

/*! Static description of one downloadable model variant. */
struct ModelInfo {
    std::string_view id;        // "small", "medium", "large"
    std::string_view label;     // shown in the settings panel
    std::string_view filename;
    uint64_t size_bytes{};      // approximate, used when the server does not report a length
    std::string_view sha;       // SHA-1 of the artifact. Empty to skip verification
    std::string_view download_url; // If it ends with '/', the file name is appended for download
};

using model_list_t = std::span<const ModelInfo>; // NB: Non owning

/*! Snapshot of a catalog entry, as seen by callers. */
struct ModelDescriptor {
    std::string id;
    std::string label;
    uint64_t size_bytes{};
    bool is_downloaded{false};
    std::filesystem::path local_path;
};

using model_descriptors_t = std::vector<ModelDescriptor>;

/*! The variants QDictate knows about, smallest first. */
model_list_t builtinWhisperModels() noexcept;
