#ifndef REDLINE_CORE_TYPES_H
#define REDLINE_CORE_TYPES_H

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

// Value types shared by every redline module.

namespace redline {

struct Rect {
    float x{0.0f};
    float y{0.0f};
    float w{0.0f};
    float h{0.0f};

    float maxX() const { return x + w; }
    float maxY() const { return y + h; }
    bool operator==(const Rect& o) const { return x == o.x && y == o.y && w == o.w && h == o.h; }
    bool operator!=(const Rect& o) const { return !(*this == o); }
};

// Half-open range [start, start + length) in UTF-16 code units.
struct CodeUnitRange {
    std::uint32_t start{0};
    std::uint32_t length{0};

    std::uint32_t end() const { return start + length; }
    bool empty() const { return length == 0; }
    bool operator==(const CodeUnitRange& o) const { return start == o.start && length == o.length; }
    bool operator!=(const CodeUnitRange& o) const { return !(*this == o); }
};

// Half-open range [start, end) in grapheme clusters.
struct GraphemeRange {
    std::uint32_t start{0};
    std::uint32_t end{0};

    std::uint32_t length() const { return end > start ? end - start : 0; }
    bool empty() const { return end <= start; }
    bool overlaps(const GraphemeRange& o) const { return start < o.end && o.start < end; }
    bool operator==(const GraphemeRange& o) const { return start == o.start && end == o.end; }
    bool operator!=(const GraphemeRange& o) const { return !(*this == o); }
};

inline bool rangesIntersect(const CodeUnitRange& a, const CodeUnitRange& b) {
    return a.start < b.end() && b.start < a.end();
}

// Error span produced by the analysis engine over one text snapshot.
struct ErrorSpan {
    GraphemeRange range;
    std::string category;
    std::string message;
    std::string suggestionText;
    std::string originalText;
};

// =============================================================================
// Foreign call results
// =============================================================================

enum class QueryError : std::uint32_t {
    Ok = 0,
    Unavailable = 1,
    Timeout = 2,
    InvalidElement = 3,
    NotSupported = 4,
};

const char* toString(QueryError error);

/**
 * Outcome of one foreign call: a value on success, otherwise the error that
 * prevented it. `error` is Ok exactly when `value` is engaged.
 */
template <typename T>
struct QueryResult {
    std::optional<T> value;
    QueryError error{QueryError::Unavailable};

    static QueryResult success(T v) {
        QueryResult r;
        r.value = std::move(v);
        r.error = QueryError::Ok;
        return r;
    }
    static QueryResult failure(QueryError e) {
        QueryResult r;
        r.error = e == QueryError::Ok ? QueryError::Unavailable : e;
        return r;
    }

    bool ok() const { return value.has_value(); }
    explicit operator bool() const { return ok(); }
    const T& operator*() const { return *value; }
    const T* operator->() const { return &*value; }
};

} // namespace redline

#endif // REDLINE_CORE_TYPES_H
