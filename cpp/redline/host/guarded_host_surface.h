#ifndef REDLINE_HOST_GUARDED_HOST_SURFACE_H
#define REDLINE_HOST_GUARDED_HOST_SURFACE_H

#include "redline/host/foreign_call_executor.h"
#include "redline/host/host_surface.h"
#include <chrono>
#include <string>
#include <vector>

namespace redline::host {

/**
 * GuardedHostSurface: forwards every capability of an inner surface through a
 * ForeignCallExecutor, so each call is serialized and bounded by a timeout.
 * A timed-out call reports QueryError::Timeout.
 *
 * The inner surface must outlive the executor.
 */
class GuardedHostSurface : public HostSurface {
public:
    GuardedHostSurface(HostSurface& inner, ForeignCallExecutor& executor, std::chrono::milliseconds timeout);

    void setTimeout(std::chrono::milliseconds timeout) { timeout_ = timeout; }
    std::chrono::milliseconds timeout() const { return timeout_; }

    QueryResult<bool> probeLiveness(ElementRef element) override;
    QueryResult<std::uint32_t> characterCount(ElementRef element) override;
    QueryResult<Rect> elementFrame(ElementRef element) override;
    QueryResult<Rect> queryBounds(ElementRef element, CodeUnitRange range) override;
    QueryResult<std::vector<ChildElement>> queryChildren(ElementRef element) override;
    QueryResult<std::string> queryText(ElementRef element, CodeUnitRange range) override;
    QueryResult<std::vector<StyleRun>> queryStyleRuns(ElementRef element, CodeUnitRange range) override;
    QueryResult<TextMarker> markerForIndex(ElementRef element, std::uint32_t index) override;
    QueryResult<Rect> boundsForMarkers(ElementRef element, TextMarker start, TextMarker end) override;
    QueryResult<std::uint32_t> lineForIndex(ElementRef element, std::uint32_t index) override;
    QueryResult<CodeUnitRange> rangeForLine(ElementRef element, std::uint32_t line) override;

    QueryError setSelection(ElementRef element, CodeUnitRange range) override;
    QueryResult<std::string> readSelection(ElementRef element) override;
    QueryError replaceSelectedText(ElementRef element, const std::string& text) override;
    QueryResult<ClipboardContents> readClipboard() override;
    QueryError writeClipboard(const ClipboardContents& contents) override;
    QueryResult<std::int64_t> clipboardChangeCount() override;
    QueryError injectCopy() override;
    QueryError injectPaste() override;
    QueryResult<float> displayHeight() override;

private:
    HostSurface& inner_;
    ForeignCallExecutor& executor_;
    std::chrono::milliseconds timeout_;
};

} // namespace redline::host

#endif // REDLINE_HOST_GUARDED_HOST_SURFACE_H
