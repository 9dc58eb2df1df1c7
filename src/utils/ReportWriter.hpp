#pragma once

#include "../core/DuplicateClassifier.hpp"
#include "../core/StreamOrchestrator.hpp"
#include "DedupConfig.hpp"

#include <ostream>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace PerceptualDedup
{
    class ReportWriter {
    public:
        // "Identified N unique images and M duplicates." plus the skipped count.
        static void printSummary(const RunSummary& summary, std::ostream& out);

        static json buildReport(const DedupConfig& config,
                                const std::vector<Verdict>& verdicts,
                                const std::vector<AcceptedEntry>& accepted,
                                const RunSummary& summary);

        // @throws DedupException if the file cannot be written.
        static void writeJson(const std::string& path, const json& report);
    };

} // namespace PerceptualDedup
