#include "DuplicateClassifier.hpp"

namespace PerceptualDedup
{

DuplicateClassifier::DuplicateClassifier(int threshold)
    : m_threshold(threshold)
{
    if (threshold < 0) {
        throw DedupException("distance threshold must be >= 0, got " + std::to_string(threshold));
    }
}

Verdict DuplicateClassifier::classify(const Fingerprint& fp, const std::string& id) {
    // Mixed hash sizes within one run are a configuration bug, even before
    // the set has a member to compare against lazily
    if (!m_accepted.empty() && m_accepted.front().fingerprint.size() != fp.size()) {
        throw LengthMismatchException(m_accepted.front().fingerprint.size(), fp.size());
    }

    for (const auto& member : m_accepted) {
        if (hammingDistance(fp, member.fingerprint) <= m_threshold) {
            return Verdict::duplicateOf(id, member.representative);
        }
    }

    m_accepted.push_back({fp, id});
    return Verdict::unique(id);
}

void DuplicateClassifier::reset() {
    m_accepted.clear();
}

} // namespace PerceptualDedup
