#ifndef REDLINE_REPLACEMENT_REPLACEMENT_EXECUTOR_H
#define REDLINE_REPLACEMENT_REPLACEMENT_EXECUTOR_H

#include "redline/config/host_profile.h"
#include "redline/host/host_surface.h"
#include "redline/replacement/clipboard_guard.h"
#include "redline/replacement/replacement_types.h"
#include <optional>

namespace redline::replacement {

/**
 * ReplacementExecutor: applies one accepted suggestion to the host.
 *
 * Pipeline, stopping at the first failure:
 *   validate -> select range -> read selection back -> save clipboard ->
 *   [copy and correct the rich-text delta] -> write payload -> paste ->
 *   restore clipboard.
 *
 * Nothing is written to the host before the selection reads back as the
 * expected text; a different selection is reported as ContentNotReachable.
 * Trouble with the rich payload only costs formatting: the executor falls
 * back to plain text. Hosts configured for direct mutation replace the
 * selection through the tree instead, falling back to paste if unsupported.
 * A host that throws ends the attempt as HostUnresponsive.
 */
class ReplacementExecutor {
public:
    ReplacementExecutor(host::HostSurface& host, const config::HostProfile& profile);

    ReplacementOutcome execute(const ReplacementContext& context);

private:
    ReplacementOutcome run(const ReplacementContext& context);
    ReplacementOutcome pasteReplacement(const ReplacementContext& context);
    std::optional<host::ClipboardItem> buildRichPayload(const ReplacementContext& context, ClipboardGuard& guard);
    void settle(std::uint32_t millis) const;

    host::HostSurface& host_;
    const config::HostProfile& profile_;
};

} // namespace redline::replacement

#endif // REDLINE_REPLACEMENT_REPLACEMENT_EXECUTOR_H
