#pragma once

#include "../core/Common.h"
#include "ArgParser.h"

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace PerceptualDedup
{
    using json = nlohmann::json;

    /**
     * @brief Settings of one dedup run.
     *
     * Layered as: built-in defaults, then an optional JSON config file, then
     * the options given on the command line.
     */
    struct DedupConfig {
        std::string inputDir;
        std::string outputDir;
        std::string reportPath;

        int hashSize{HASH_SIZE};
        int distanceThreshold{HASH_DIFF_THRESHOLD};
        std::uintmax_t maxImageSize{MAX_IMAGE_SIZE};
        std::uintmax_t maxArchiveSize{MAX_ARCHIVE_SIZE};
        int workers{1};
        int itemTimeoutMs{0};
        std::vector<std::string> extensions{SUPPORTED_IMG_FORMATS};
        bool quiet{false};

        /**
         * @brief Overlays the keys present in `j` (all optional).
         *
         * Recognized keys: hash_size, distance_threshold, max_image_size,
         * max_archive_size, workers, item_timeout_ms, extensions, report.
         * @throws DedupException on a key with the wrong type.
         */
        void applyJson(const json& j);

        // @throws DedupException if the file is missing or not valid JSON.
        void applyJsonFile(const std::string& path);

        void applyArguments(const ArgParser::Arguments& args);

        /**
         * @brief Rejects values that cannot produce a meaningful run.
         * @throws DedupException naming the offending option.
         */
        void validate() const;

        [[nodiscard]] json toJson() const;

        [[nodiscard]] std::chrono::milliseconds itemTimeout() const {
            return std::chrono::milliseconds(itemTimeoutMs);
        }

        /**
         * @brief Defaults <- config file (if --config given) <- command line.
         */
        static DedupConfig fromArguments(const ArgParser::Arguments& args);
    };

} // namespace PerceptualDedup
