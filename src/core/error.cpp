#include "core/error.h"

namespace pnt
{
const char* ErrorKindName(ErrorKind kind)
{
    switch (kind)
    {
        case ErrorKind::None: return "none";
        case ErrorKind::InvalidArgument: return "invalid-argument";
        case ErrorKind::NotFound: return "not-found";
        case ErrorKind::NotReady: return "not-ready";
        case ErrorKind::ValidationFailed: return "validation-failed";
        case ErrorKind::CountMismatch: return "count-mismatch";
        case ErrorKind::EmptyOutput: return "empty-output";
        case ErrorKind::GenerationFailed: return "generation-failed";
    }
    return "unknown";
}
} // namespace pnt
