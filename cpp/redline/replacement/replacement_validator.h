#ifndef REDLINE_REPLACEMENT_REPLACEMENT_VALIDATOR_H
#define REDLINE_REPLACEMENT_REPLACEMENT_VALIDATOR_H

#include "redline/host/host_surface.h"
#include "redline/replacement/replacement_types.h"
#include <optional>

namespace redline::replacement {

/**
 * ReplacementValidator: last gate before any mutation.
 *
 * Checks, in order, that the element is alive, that the range fits the
 * current text in code units, and that the text at the range is still the
 * text analysis flagged. The only host call is the liveness probe.
 */
class ReplacementValidator {
public:
    /**
     * @return std::nullopt when the replacement may proceed, otherwise the first failure
     */
    static std::optional<ReplacementFailure> validate(const ReplacementContext& context, host::HostSurface& host);
};

} // namespace redline::replacement

#endif // REDLINE_REPLACEMENT_REPLACEMENT_VALIDATOR_H
