#include "DedupRunner.hpp"
#include "FileSystemTool.hpp"
#include "ImageLoader.hpp"
#include "ScopedWorkspace.hpp"
#include "../utils/ReportWriter.hpp"

#include <algorithm>
#include <iostream>
#include <system_error>
#include <utility>

namespace PerceptualDedup
{

DedupRunner::DedupRunner(DedupConfig config)
    : m_config(std::move(config))
{
}

void DedupRunner::log(const std::string& message) const {
    if (!m_config.quiet) std::cout << message << std::endl;
}

// The new tree is built in a scratch directory beside the destination and
// swapped in with renames, so an existing result survives a failed copy.
void DedupRunner::commit(const fs::path& staging, const fs::path& destination) {
    ScopedWorkspace pending("." + destination.filename().string() + "_", destination.parent_path());
    const fs::path fresh = pending.path() / destination.filename();
    const fs::path previous = pending.path() / "previous";

    std::error_code ec;
    fs::copy(staging, fresh, fs::copy_options::recursive, ec);
    if (ec) {
        throw DedupException("could not write '" + destination.string() + "': " + ec.message());
    }
    if (fs::exists(destination, ec)) {
        fs::rename(destination, previous, ec);
        if (ec) {
            throw DedupException("could not replace '" + destination.string() + "': " + ec.message());
        }
    }
    fs::rename(fresh, destination, ec);
    if (ec) {
        std::error_code restore_ec;
        if (fs::exists(previous, restore_ec)) fs::rename(previous, destination, restore_ec);
        if (restore_ec) {
            std::cerr << "Warning: could not restore previous result: " << restore_ec.message() << std::endl;
        }
        throw DedupException("could not move result to '" + destination.string() + "': " + ec.message());
    }
}

DedupResult DedupRunner::run() {
    m_config.validate();

    const std::string input_dir = FSETool::toAbsolutePath(m_config.inputDir);
    const std::string output_dir = FSETool::toAbsolutePath(m_config.outputDir);
    if (!fs::is_directory(input_dir)) {
        throw DedupException("input directory not found: " + m_config.inputDir);
    }
    if (m_config.outputDir.empty()) {
        throw DedupException("no output directory given");
    }
    if (FSETool::pathContains(input_dir, output_dir)) {
        throw DedupException("output directory must not be inside the input directory");
    }

    auto images = FSETool::getImagesList(input_dir, m_config.extensions);
    log("Found " + std::to_string(images.size()) + " image files.");

    std::uintmax_t batch_size = FSETool::totalSize(images);
    if (batch_size > m_config.maxArchiveSize) {
        throw DedupException("input batch too large (" + std::to_string(batch_size) +
                             " bytes). Maximum allowed: " + std::to_string(m_config.maxArchiveSize) + " bytes");
    }

    // Released on every exit path, including exceptions below
    ScopedWorkspace workspace("dedup_");
    fs::path staging = workspace.subdir(UNIQUE_DIR_NAME);

    LoaderOptions loader_options;
    loader_options.hashSize = m_config.hashSize;
    loader_options.maxImageSize = m_config.maxImageSize;
    loader_options.workers = static_cast<unsigned>(m_config.workers);
    loader_options.itemTimeout = m_config.itemTimeout();
    ImageLoader loader(loader_options);

    std::vector<ImageRecord> records = loader.loadBatch(images);

    DuplicateClassifier classifier(m_config.distanceThreshold);
    StreamOrchestrator orchestrator(classifier);
    for (const auto& record : records) {
        const Verdict& verdict = orchestrator.process(record);
        if (verdict.kind == VerdictKind::Skipped) {
            if (!m_config.quiet) std::cerr << "Skipping " << verdict.id << ": " << verdict.message << std::endl;
        } else if (verdict.kind == VerdictKind::Duplicate) {
            log("Duplicate: " + verdict.id + " (of " + verdict.representative + ")");
        }
    }

    // A decoder that fails on every input of a real batch points at a broken
    // setup, not bad files. A lone corrupt file just yields zero uniques.
    bool all_undecodable = records.size() >= 2 && std::all_of(records.begin(), records.end(),
        [](const ImageRecord& r) { return r.failure == SkipReason::DecodeFailure; });
    if (all_undecodable) {
        throw DedupException("none of the " + std::to_string(records.size()) + " images could be decoded");
    }

    for (const auto& entry : classifier.acceptedSet()) {
        FSETool::copyPreservingStructure(entry.representative, input_dir, staging);
    }

    DedupResult result;
    result.verdicts = orchestrator.verdicts();
    result.accepted = classifier.acceptedSet();
    result.summary = orchestrator.summary();
    result.uniqueDir = fs::path(output_dir) / UNIQUE_DIR_NAME;

    // The report goes first: if it cannot be written the run fails before
    // the output directory is touched
    if (!m_config.reportPath.empty()) {
        ReportWriter::writeJson(m_config.reportPath,
                                ReportWriter::buildReport(m_config, result.verdicts, result.accepted, result.summary));
    }

    try {
        if (!FSETool::createDirectory(output_dir)) {
            throw DedupException("could not create output directory: " + output_dir);
        }
        commit(staging, result.uniqueDir);
    } catch (const DedupException&) {
        if (!m_config.reportPath.empty()) {
            std::error_code ec;
            fs::remove(m_config.reportPath, ec);
            if (ec) std::cerr << "Warning: could not remove report '" << m_config.reportPath << "': " << ec.message() << std::endl;
        }
        throw;
    }
    log("Unique images have been written to " + result.uniqueDir.string());
    if (!m_config.reportPath.empty()) log("Report written to " + m_config.reportPath);

    ReportWriter::printSummary(result.summary, std::cout);
    return result;
}

} // namespace PerceptualDedup
