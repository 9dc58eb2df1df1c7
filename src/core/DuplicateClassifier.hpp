#pragma once

#include "Common.h"
#include "Fingerprint.hpp"
#include "Verdict.hpp"
#include <string>
#include <vector>

namespace PerceptualDedup
{
    struct AcceptedEntry {
        Fingerprint fingerprint;
        std::string representative;
    };

    /**
     * @brief Incremental near-duplicate detector owning the accepted set.
     *
     * classify() scans the accepted set in insertion order and stops at the
     * first member within the threshold (first match, not nearest match). The
     * chosen representative therefore depends on encounter order. Otherwise
     * the fingerprint is admitted and the item is Unique.
     *
     * Cost is O(n) per call against the current set size.
     */
    class DuplicateClassifier {
    public:
        explicit DuplicateClassifier(int threshold = HASH_DIFF_THRESHOLD);

        /**
         * @brief Classifies one fingerprint; admits it when no member is within threshold.
         * @throws LengthMismatchException if fp's length differs from the accepted set's.
         */
        Verdict classify(const Fingerprint& fp, const std::string& id);

        [[nodiscard]] const std::vector<AcceptedEntry>& acceptedSet() const { return m_accepted; }
        [[nodiscard]] std::size_t size() const { return m_accepted.size(); }
        [[nodiscard]] int threshold() const { return m_threshold; }

        void reset();

    private:
        int m_threshold;
        std::vector<AcceptedEntry> m_accepted;
    };

} // namespace PerceptualDedup
