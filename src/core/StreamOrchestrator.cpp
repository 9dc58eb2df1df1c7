#include "StreamOrchestrator.hpp"

namespace PerceptualDedup
{

StreamOrchestrator::StreamOrchestrator(DuplicateClassifier& classifier)
    : m_classifier(classifier)
{
}

const Verdict& StreamOrchestrator::process(const ImageRecord& record) {
    if (record.fingerprint) {
        m_verdicts.push_back(m_classifier.classify(*record.fingerprint, record.id));
    } else {
        m_verdicts.push_back(Verdict::skipped(record.id, record.failure, record.failureMessage));
    }
    return m_verdicts.back();
}

std::vector<Verdict> StreamOrchestrator::run(const std::vector<ImageRecord>& records) {
    m_verdicts.reserve(m_verdicts.size() + records.size());
    for (const auto& record : records) {
        process(record);
    }
    return m_verdicts;
}

RunSummary StreamOrchestrator::summary() const {
    RunSummary s;
    for (const auto& v : m_verdicts) {
        switch (v.kind) {
            case VerdictKind::Unique:    s.unique++; break;
            case VerdictKind::Duplicate: s.duplicates++; break;
            case VerdictKind::Skipped:   s.skipped++; break;
        }
    }
    s.acceptedSetSize = m_classifier.size();
    return s;
}

} // namespace PerceptualDedup
