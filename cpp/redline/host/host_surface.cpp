#include "redline/host/host_surface.h"

namespace redline::host {

QueryResult<std::vector<StyleRun>> HostSurface::queryStyleRuns(ElementRef, CodeUnitRange) {
    return QueryResult<std::vector<StyleRun>>::failure(QueryError::NotSupported);
}

QueryResult<TextMarker> HostSurface::markerForIndex(ElementRef, std::uint32_t) {
    return QueryResult<TextMarker>::failure(QueryError::NotSupported);
}

QueryResult<Rect> HostSurface::boundsForMarkers(ElementRef, TextMarker, TextMarker) {
    return QueryResult<Rect>::failure(QueryError::NotSupported);
}

QueryResult<std::uint32_t> HostSurface::lineForIndex(ElementRef, std::uint32_t) {
    return QueryResult<std::uint32_t>::failure(QueryError::NotSupported);
}

QueryResult<CodeUnitRange> HostSurface::rangeForLine(ElementRef, std::uint32_t) {
    return QueryResult<CodeUnitRange>::failure(QueryError::NotSupported);
}

QueryError HostSurface::replaceSelectedText(ElementRef, const std::string&) {
    return QueryError::NotSupported;
}

QueryError HostSurface::injectCopy() {
    return QueryError::NotSupported;
}

} // namespace redline::host
