#include "redline/host/guarded_host_surface.h"

namespace redline::host {

// Lambdas capture the inner surface by reference and every argument by value:
// a call that times out may still run after this frame is gone.

GuardedHostSurface::GuardedHostSurface(
    HostSurface& inner,
    ForeignCallExecutor& executor,
    std::chrono::milliseconds timeout)
    : inner_(inner)
    , executor_(executor)
    , timeout_(timeout) {
}

QueryResult<bool> GuardedHostSurface::probeLiveness(ElementRef element) {
    HostSurface& host = inner_;
    return executor_.call<bool>([&host, element]() { return host.probeLiveness(element); }, timeout_);
}

QueryResult<std::uint32_t> GuardedHostSurface::characterCount(ElementRef element) {
    HostSurface& host = inner_;
    return executor_.call<std::uint32_t>([&host, element]() { return host.characterCount(element); }, timeout_);
}

QueryResult<Rect> GuardedHostSurface::elementFrame(ElementRef element) {
    HostSurface& host = inner_;
    return executor_.call<Rect>([&host, element]() { return host.elementFrame(element); }, timeout_);
}

QueryResult<Rect> GuardedHostSurface::queryBounds(ElementRef element, CodeUnitRange range) {
    HostSurface& host = inner_;
    return executor_.call<Rect>([&host, element, range]() { return host.queryBounds(element, range); }, timeout_);
}

QueryResult<std::vector<ChildElement>> GuardedHostSurface::queryChildren(ElementRef element) {
    HostSurface& host = inner_;
    return executor_.call<std::vector<ChildElement>>(
        [&host, element]() { return host.queryChildren(element); }, timeout_);
}

QueryResult<std::string> GuardedHostSurface::queryText(ElementRef element, CodeUnitRange range) {
    HostSurface& host = inner_;
    return executor_.call<std::string>([&host, element, range]() { return host.queryText(element, range); }, timeout_);
}

QueryResult<std::vector<StyleRun>> GuardedHostSurface::queryStyleRuns(ElementRef element, CodeUnitRange range) {
    HostSurface& host = inner_;
    return executor_.call<std::vector<StyleRun>>(
        [&host, element, range]() { return host.queryStyleRuns(element, range); }, timeout_);
}

QueryResult<TextMarker> GuardedHostSurface::markerForIndex(ElementRef element, std::uint32_t index) {
    HostSurface& host = inner_;
    return executor_.call<TextMarker>([&host, element, index]() { return host.markerForIndex(element, index); }, timeout_);
}

QueryResult<Rect> GuardedHostSurface::boundsForMarkers(ElementRef element, TextMarker start, TextMarker end) {
    HostSurface& host = inner_;
    return executor_.call<Rect>(
        [&host, element, start, end]() { return host.boundsForMarkers(element, start, end); }, timeout_);
}

QueryResult<std::uint32_t> GuardedHostSurface::lineForIndex(ElementRef element, std::uint32_t index) {
    HostSurface& host = inner_;
    return executor_.call<std::uint32_t>([&host, element, index]() { return host.lineForIndex(element, index); }, timeout_);
}

QueryResult<CodeUnitRange> GuardedHostSurface::rangeForLine(ElementRef element, std::uint32_t line) {
    HostSurface& host = inner_;
    return executor_.call<CodeUnitRange>([&host, element, line]() { return host.rangeForLine(element, line); }, timeout_);
}

QueryError GuardedHostSurface::setSelection(ElementRef element, CodeUnitRange range) {
    HostSurface& host = inner_;
    return executor_.callStatus([&host, element, range]() { return host.setSelection(element, range); }, timeout_);
}

QueryResult<std::string> GuardedHostSurface::readSelection(ElementRef element) {
    HostSurface& host = inner_;
    return executor_.call<std::string>([&host, element]() { return host.readSelection(element); }, timeout_);
}

QueryError GuardedHostSurface::replaceSelectedText(ElementRef element, const std::string& text) {
    HostSurface& host = inner_;
    return executor_.callStatus([&host, element, text]() { return host.replaceSelectedText(element, text); }, timeout_);
}

QueryResult<ClipboardContents> GuardedHostSurface::readClipboard() {
    HostSurface& host = inner_;
    return executor_.call<ClipboardContents>([&host]() { return host.readClipboard(); }, timeout_);
}

QueryError GuardedHostSurface::writeClipboard(const ClipboardContents& contents) {
    HostSurface& host = inner_;
    return executor_.callStatus([&host, contents]() { return host.writeClipboard(contents); }, timeout_);
}

QueryResult<std::int64_t> GuardedHostSurface::clipboardChangeCount() {
    HostSurface& host = inner_;
    return executor_.call<std::int64_t>([&host]() { return host.clipboardChangeCount(); }, timeout_);
}

QueryError GuardedHostSurface::injectCopy() {
    HostSurface& host = inner_;
    return executor_.callStatus([&host]() { return host.injectCopy(); }, timeout_);
}

QueryError GuardedHostSurface::injectPaste() {
    HostSurface& host = inner_;
    return executor_.callStatus([&host]() { return host.injectPaste(); }, timeout_);
}

QueryResult<float> GuardedHostSurface::displayHeight() {
    HostSurface& host = inner_;
    return executor_.call<float>([&host]() { return host.displayHeight(); }, timeout_);
}

} // namespace redline::host
