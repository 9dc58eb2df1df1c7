#include "ReportWriter.hpp"
#include "../core/FileSystemTool.hpp"

#include <fstream>

namespace PerceptualDedup
{

void ReportWriter::printSummary(const RunSummary& summary, std::ostream& out) {
    out << "Identified " << summary.unique << " unique images and "
        << summary.duplicates << " duplicates";
    if (summary.skipped > 0) {
        out << " (" << summary.skipped << " skipped)";
    }
    out << "." << std::endl;
}

json ReportWriter::buildReport(const DedupConfig& config,
                               const std::vector<Verdict>& verdicts,
                               const std::vector<AcceptedEntry>& accepted,
                               const RunSummary& summary) {
    json items = json::array();
    for (const auto& v : verdicts) {
        json item = {{"id", v.id}, {"verdict", verdictKindName(v.kind)}};
        if (v.kind == VerdictKind::Duplicate) {
            item["representative"] = v.representative;
        } else if (v.kind == VerdictKind::Skipped) {
            item["reason"] = skipReasonName(v.skipReason);
            item["message"] = v.message;
        }
        items.push_back(item);
    }

    json acceptedJson = json::array();
    for (const auto& entry : accepted) {
        acceptedJson.push_back({{"representative", entry.representative},
                                {"fingerprint", entry.fingerprint.toHex()}});
    }

    return json{
        {"config", config.toJson()},
        {"summary", {
            {"unique", summary.unique},
            {"duplicates", summary.duplicates},
            {"skipped", summary.skipped},
            {"accepted_set_size", summary.acceptedSetSize}
        }},
        {"items", items},
        {"accepted", acceptedJson}
    };
}

void ReportWriter::writeJson(const std::string& path, const json& report) {
    fs::path p(path);
    if (p.has_parent_path() && !FSETool::createDirectory(p.parent_path().string())) {
        throw DedupException("could not create report directory for '" + path + "'");
    }
    std::ofstream f(path);
    if (!f) {
        throw DedupException("could not write report '" + path + "'");
    }
    f << report.dump(4) << std::endl;
}

} // namespace PerceptualDedup
