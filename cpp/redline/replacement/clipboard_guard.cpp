#include "redline/replacement/clipboard_guard.h"
#include "redline/core/logging.h"

#include <exception>

namespace redline::replacement {

ClipboardGuard::ClipboardGuard(host::HostSurface& host, host::ClipboardContents original)
    : host_(host)
    , original_(std::move(original)) {
}

ClipboardGuard::~ClipboardGuard() {
    // May run while a host exception unwinds; nothing may escape.
    try {
        const QueryError err = restore();
        if (err != QueryError::Ok) {
            REDLINE_LOG_WARN("clipboard restore failed: %s", toString(err));
        }
    } catch (const std::exception& e) {
        REDLINE_LOG_WARN("clipboard restore threw: %s", e.what());
    }
}

void ClipboardGuard::noteOwnWrite() {
    written_ = true;
    const QueryResult<std::int64_t> count = host_.clipboardChangeCount();
    if (count) {
        expectedCount_ = *count;
    } else {
        expectedCount_.reset();
    }
}

QueryError ClipboardGuard::restore() {
    if (done_) return QueryError::Ok;
    done_ = true;
    if (!written_) return QueryError::Ok;

    if (expectedCount_) {
        const QueryResult<std::int64_t> current = host_.clipboardChangeCount();
        if (current && *current != *expectedCount_) {
            REDLINE_LOG_DEBUG("clipboard changed by someone else, leaving it");
            return QueryError::Ok;
        }
    }
    return host_.writeClipboard(original_);
}

} // namespace redline::replacement
