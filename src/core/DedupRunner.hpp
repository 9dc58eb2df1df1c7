#pragma once

#include "StreamOrchestrator.hpp"
#include "../utils/DedupConfig.hpp"

#include <filesystem>
#include <vector>

namespace fs = std::filesystem;

namespace PerceptualDedup
{
    struct DedupResult {
        std::vector<Verdict> verdicts;
        std::vector<AcceptedEntry> accepted;
        RunSummary summary;
        fs::path uniqueDir;
    };

    /**
     * @brief End-to-end dedup of a directory.
     *
     * Discovers images, fingerprints them, classifies in sorted path order,
     * stages the unique ones in a private workspace, writes the report and
     * finally swaps the staged tree in as <output_dir>/unique_images. Nothing
     * is written to the output directory when the run aborts.
     */
    class DedupRunner {
    public:
        explicit DedupRunner(DedupConfig config);

        // @throws DedupException (including LengthMismatchException) on a structural failure.
        DedupResult run();

    private:
        DedupConfig m_config;

        void log(const std::string& message) const;
        static void commit(const fs::path& staging, const fs::path& destination);
    };

} // namespace PerceptualDedup
