#ifndef REDLINE_REPLACEMENT_REPLACEMENT_TYPES_H
#define REDLINE_REPLACEMENT_REPLACEMENT_TYPES_H

#include "redline/core/types.h"
#include "redline/host/host_surface.h"
#include <cstdint>
#include <string>
#include <utility>

namespace redline::replacement {

enum class FailureKind : std::uint32_t {
    ElementInvalid = 0,
    IndexOutOfBounds = 1,
    TextMismatch = 2,
    ContentNotReachable = 3,
    HostUnresponsive = 4,
    ClipboardUnavailable = 5,
    InjectionFailed = 6,
    SurfaceBusy = 7,
    Superseded = 8,
};

const char* toString(FailureKind kind);

struct ReplacementFailure {
    FailureKind kind{FailureKind::ElementInvalid};
    std::string detail;
};

/**
 * Everything one replacement needs, captured when the user accepts a
 * suggestion. `currentText` is the host text read at that moment; `errorText`
 * is what analysis saw at `range`. Used for one attempt, then dropped.
 */
struct ReplacementContext {
    host::ElementRef element;
    GraphemeRange range;
    std::string errorText;
    std::string currentText;
    std::string suggestion;
    std::uint64_t snapshotId{0};
};

enum class ReplacementStatus : std::uint8_t {
    Success = 0,
    Failure = 1,
};

struct ReplacementOutcome {
    ReplacementStatus status{ReplacementStatus::Failure};
    FailureKind kind{FailureKind::ElementInvalid}; // meaningful on Failure
    bool formattingPreserved{false};
    std::string detail;

    bool succeeded() const { return status == ReplacementStatus::Success; }

    static ReplacementOutcome success(bool formattingPreserved) {
        ReplacementOutcome o;
        o.status = ReplacementStatus::Success;
        o.formattingPreserved = formattingPreserved;
        return o;
    }
    static ReplacementOutcome failure(FailureKind kind, std::string detail = {}) {
        ReplacementOutcome o;
        o.kind = kind;
        o.detail = std::move(detail);
        return o;
    }
};

} // namespace redline::replacement

#endif // REDLINE_REPLACEMENT_REPLACEMENT_TYPES_H
