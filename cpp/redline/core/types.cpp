#include "redline/core/types.h"

namespace redline {

const char* toString(QueryError error) {
    switch (error) {
        case QueryError::Ok: return "ok";
        case QueryError::Unavailable: return "unavailable";
        case QueryError::Timeout: return "timeout";
        case QueryError::InvalidElement: return "invalid element";
        case QueryError::NotSupported: return "not supported";
    }
    return "unknown";
}

} // namespace redline
