#include "redline/replacement/replacement_validator.h"
#include "redline/core/string_utils.h"
#include "redline/text/grapheme_index.h"

#include <string>

namespace redline::replacement {

const char* toString(FailureKind kind) {
    switch (kind) {
        case FailureKind::ElementInvalid: return "element invalid";
        case FailureKind::IndexOutOfBounds: return "index out of bounds";
        case FailureKind::TextMismatch: return "text mismatch";
        case FailureKind::ContentNotReachable: return "content not reachable";
        case FailureKind::HostUnresponsive: return "host unresponsive";
        case FailureKind::ClipboardUnavailable: return "clipboard unavailable";
        case FailureKind::InjectionFailed: return "injection failed";
        case FailureKind::SurfaceBusy: return "surface busy";
        case FailureKind::Superseded: return "superseded";
    }
    return "unknown";
}

std::optional<ReplacementFailure> ReplacementValidator::validate(
    const ReplacementContext& context,
    host::HostSurface& host) {
    if (!context.element.valid()) {
        return ReplacementFailure{FailureKind::ElementInvalid, "null element"};
    }
    const QueryResult<bool> alive = host.probeLiveness(context.element);
    if (!alive) {
        if (alive.error == QueryError::Timeout) {
            return ReplacementFailure{FailureKind::HostUnresponsive, "liveness probe timed out"};
        }
        return ReplacementFailure{FailureKind::ElementInvalid, toString(alive.error)};
    }
    if (!*alive) {
        return ReplacementFailure{FailureKind::ElementInvalid, "element gone"};
    }

    const auto index = text::GraphemeIndex::build(context.currentText);
    if (!index || context.range.empty()) {
        return ReplacementFailure{FailureKind::IndexOutOfBounds, "range not convertible"};
    }
    const auto units = index->toCodeUnits(context.range);
    if (!units || units->end() > index->codeUnitCount()) {
        return ReplacementFailure{FailureKind::IndexOutOfBounds,
                                  "range ends past " + std::to_string(index->codeUnitCount()) + " code units"};
    }

    const std::string_view actual = logicalSubstr(context.currentText, units->start, units->length);
    if (actual != context.errorText) {
        return ReplacementFailure{FailureKind::TextMismatch,
                                  "expected '" + context.errorText + "', found '" + std::string(actual) + "'"};
    }
    return std::nullopt;
}

} // namespace redline::replacement
