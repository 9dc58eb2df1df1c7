#pragma once

#include "Fingerprint.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace PerceptualDedup
{
    enum class SkipReason {
        None,
        DecodeFailure,  // corrupt, truncated or unsupported image
        Oversize,       // above max_image_size
        Timeout,        // exceeded the per-item time budget
        Unreadable      // could not stat or open the file
    };

    inline std::string skipReasonName(SkipReason reason) {
        switch (reason) {
            case SkipReason::DecodeFailure: return "decode_failure";
            case SkipReason::Oversize:      return "oversize";
            case SkipReason::Timeout:       return "timeout";
            case SkipReason::Unreadable:    return "unreadable";
            case SkipReason::None:          break;
        }
        return "none";
    }

    /**
     * @brief One input item as handed over by the loader.
     *
     * Holds either a fingerprint or a failure (reason + message), never both.
     */
    struct ImageRecord {
        std::string id;
        std::uintmax_t byteSize{0};
        std::optional<Fingerprint> fingerprint;
        SkipReason failure{SkipReason::None};
        std::string failureMessage;

        static ImageRecord withFingerprint(std::string id, std::uintmax_t size, Fingerprint fp) {
            ImageRecord r;
            r.id = std::move(id);
            r.byteSize = size;
            r.fingerprint = std::move(fp);
            return r;
        }

        static ImageRecord failed(std::string id, std::uintmax_t size, SkipReason reason, std::string message) {
            ImageRecord r;
            r.id = std::move(id);
            r.byteSize = size;
            r.failure = reason;
            r.failureMessage = std::move(message);
            return r;
        }
    };

    enum class VerdictKind { Unique, Duplicate, Skipped };

    inline std::string verdictKindName(VerdictKind kind) {
        switch (kind) {
            case VerdictKind::Unique:    return "unique";
            case VerdictKind::Duplicate: return "duplicate";
            case VerdictKind::Skipped:   return "skipped";
        }
        return "unknown";
    }

    struct Verdict {
        std::string id;
        VerdictKind kind{VerdictKind::Unique};
        std::string representative;   // Duplicate only
        SkipReason skipReason{SkipReason::None};
        std::string message;          // Skipped only

        static Verdict unique(const std::string& id) {
            return Verdict{id, VerdictKind::Unique, "", SkipReason::None, ""};
        }
        static Verdict duplicateOf(const std::string& id, const std::string& representative) {
            return Verdict{id, VerdictKind::Duplicate, representative, SkipReason::None, ""};
        }
        static Verdict skipped(const std::string& id, SkipReason reason, const std::string& message) {
            return Verdict{id, VerdictKind::Skipped, "", reason, message};
        }

        bool operator==(const Verdict& other) const {
            return id == other.id && kind == other.kind && representative == other.representative &&
                   skipReason == other.skipReason && message == other.message;
        }
        bool operator!=(const Verdict& other) const { return !(*this == other); }
    };

} // namespace PerceptualDedup
