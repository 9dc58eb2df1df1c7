#pragma once

#include "Common.h"
#include "Verdict.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace PerceptualDedup
{
    struct LoaderOptions {
        int hashSize{HASH_SIZE};
        std::uintmax_t maxImageSize{MAX_IMAGE_SIZE};
        // Upper bound on items in flight, counting timed-out items that are
        // still running.
        unsigned workers{1};
        std::chrono::milliseconds itemTimeout{0};   // 0 = unbounded
    };

    /**
     * @brief Size-checks, decodes and fingerprints image files.
     *
     * Per-item problems (missing file, oversize, corrupt data) come back as
     * failed ImageRecords and are never thrown.
     */
    class ImageLoader {
    public:
        // Per-item work run by loadBatch; empty means load().
        using ItemLoader = std::function<ImageRecord(const std::string&)>;

        explicit ImageLoader(LoaderOptions options = {}, ItemLoader itemLoader = nullptr);

        ImageRecord load(const std::string& path) const;

        /**
         * @brief Loads a batch, possibly on several threads.
         *
         * The result has one record per input path, in input order, no
         * matter which thread finished first. With a non-zero item timeout a
         * record that takes longer becomes SkipReason::Timeout. Its task keeps
         * its worker slot until it returns and is joined before this returns.
         */
        std::vector<ImageRecord> loadBatch(const std::vector<std::string>& paths) const;

        [[nodiscard]] const LoaderOptions& options() const { return m_options; }

    private:
        LoaderOptions m_options;
        ItemLoader m_itemLoader;

        ImageRecord loadItem(const std::string& path) const;
        std::vector<ImageRecord> loadStriped(const std::vector<std::string>& paths) const;
        std::vector<ImageRecord> loadWithDeadline(const std::vector<std::string>& paths) const;
    };

} // namespace PerceptualDedup
