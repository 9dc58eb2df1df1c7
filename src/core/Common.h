#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include <algorithm>
#include <stdexcept>
#include <cstdint>
#include <cctype>

namespace fs = std::filesystem;

/**
 * @brief Global definitions and utilities for the perceptual dedup tool.
 */
namespace PerceptualDedup
{
    // 8x8 grid -> 64-bit fingerprints
    constexpr int HASH_SIZE = 8;
    constexpr int HASH_DIFF_THRESHOLD = 5;
    constexpr int MAX_HASH_SIZE = 64;

    constexpr std::uintmax_t MAX_ARCHIVE_SIZE = 1024ULL * 1024 * 1024; // 1GB
    constexpr std::uintmax_t MAX_IMAGE_SIZE = 50ULL * 1024 * 1024;     // 50MB

    const std::vector<std::string> SUPPORTED_IMG_FORMATS = {
        "png", "jpg", "jpeg", "bmp", "gif", "tiff"
    };

    const std::string UNIQUE_DIR_NAME = "unique_images";

    /**
     * @brief Exception for configuration, input and invariant errors that abort a run.
     */
    class DedupException : public std::runtime_error {
    public:
        explicit DedupException(const std::string& message)
            : std::runtime_error("Dedup Error: " + message) {}
    };

    /**
     * @brief Raised when two fingerprints of different length are compared.
     *
     * This means mixed hash sizes within one run and is fatal to the run.
     */
    class LengthMismatchException : public DedupException {
    public:
        LengthMismatchException(std::size_t lhs, std::size_t rhs)
            : DedupException("fingerprint length mismatch (" + std::to_string(lhs) +
                             " vs " + std::to_string(rhs) + " bits)") {}
    };

    /**
     * @brief Helper to convert a string to lowercase.
     */
    inline std::string to_lower(const std::string& str) {
        std::string data = str;
        std::transform(data.begin(), data.end(), data.begin(),
            [](unsigned char c){ return std::tolower(c); });
        return data;
    }

    /**
     * @brief Normalizes an extension list to lower case with a leading dot.
     */
    inline std::vector<std::string> normalize_extensions(const std::vector<std::string>& extensions) {
        std::vector<std::string> exts = extensions.empty() ? SUPPORTED_IMG_FORMATS : extensions;
        for (auto& e : exts) {
            if (e.empty()) continue;
            if (e[0] != '.') e = "." + e;
            e = to_lower(e);
        }
        exts.erase(std::remove(exts.begin(), exts.end(), std::string()), exts.end());
        return exts;
    }

} // namespace PerceptualDedup
