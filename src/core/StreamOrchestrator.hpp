#pragma once

#include "DuplicateClassifier.hpp"
#include "Verdict.hpp"
#include <cstddef>
#include <vector>

namespace PerceptualDedup
{
    struct RunSummary {
        std::size_t unique{0};
        std::size_t duplicates{0};
        std::size_t skipped{0};
        std::size_t acceptedSetSize{0};

        [[nodiscard]] std::size_t total() const { return unique + duplicates + skipped; }
    };

    /**
     * @brief Feeds ImageRecords to a DuplicateClassifier in encounter order.
     *
     * Records without a fingerprint become Skipped verdicts and never reach
     * the classifier. Each record is processed exactly once; a per-item
     * failure never stops the stream. Structural errors raised by the
     * classifier (LengthMismatchException) propagate to the caller.
     */
    class StreamOrchestrator {
    public:
        explicit StreamOrchestrator(DuplicateClassifier& classifier);

        std::vector<Verdict> run(const std::vector<ImageRecord>& records);

        // Incremental form of run(): one record, appended to verdicts()
        const Verdict& process(const ImageRecord& record);

        [[nodiscard]] const std::vector<Verdict>& verdicts() const { return m_verdicts; }
        [[nodiscard]] RunSummary summary() const;

    private:
        DuplicateClassifier& m_classifier;
        std::vector<Verdict> m_verdicts;
    };

} // namespace PerceptualDedup
