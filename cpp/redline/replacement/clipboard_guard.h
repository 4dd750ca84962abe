#ifndef REDLINE_REPLACEMENT_CLIPBOARD_GUARD_H
#define REDLINE_REPLACEMENT_CLIPBOARD_GUARD_H

#include "redline/host/host_surface.h"
#include <cstdint>
#include <optional>

namespace redline::replacement {

/**
 * ClipboardGuard: puts the user's clipboard back when a replacement ends,
 * whichever way it ends.
 *
 * Every write the engine makes is followed by noteOwnWrite(), which records
 * the host's change count. On restore the original contents are written back
 * only if that count is unchanged, so a copy the user made in the meantime
 * is kept. If the count cannot be read the original is restored anyway.
 * Nothing is written back when the engine never touched the clipboard.
 */
class ClipboardGuard {
public:
    ClipboardGuard(host::HostSurface& host, host::ClipboardContents original);
    ~ClipboardGuard();

    ClipboardGuard(const ClipboardGuard&) = delete;
    ClipboardGuard& operator=(const ClipboardGuard&) = delete;

    void noteOwnWrite();

    /**
     * Restore now. Later calls, including the destructor's, do nothing.
     * @return Ok, or the error from the clipboard write
     */
    QueryError restore();

    bool restored() const { return done_; }

private:
    host::HostSurface& host_;
    host::ClipboardContents original_;
    std::optional<std::int64_t> expectedCount_;
    bool written_{false};
    bool done_{false};
};

} // namespace redline::replacement

#endif // REDLINE_REPLACEMENT_CLIPBOARD_GUARD_H
