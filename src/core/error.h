#pragma once

#include <string>
#include <utility>

namespace pnt
{
// Structured failure reported by orchestration entry points.
// Leaf helpers keep the plain `bool Foo(..., std::string& err)` convention; the session layer
// wraps those strings into an Error with a kind so callers can render a specific message.
enum class ErrorKind : int
{
    None = 0,
    InvalidArgument,  // unrecognized mode / quality / writer mode
    NotFound,         // missing file, template or resource
    NotReady,         // render/generate before image + template are set
    ValidationFailed, // artifact failed format or header checks
    CountMismatch,    // multi-tile output count != rows * cols
    EmptyOutput,      // zero-byte artifact or archive
    GenerationFailed, // controller did not produce an output file
};

const char* ErrorKindName(ErrorKind kind);

struct Error
{
    ErrorKind kind = ErrorKind::None;
    std::string message;

    bool Ok() const { return kind == ErrorKind::None; }

    void Clear()
    {
        kind = ErrorKind::None;
        message.clear();
    }

    // Always returns false so call sites can `return err.Set(...)`.
    bool Set(ErrorKind k, std::string msg)
    {
        kind = k;
        message = std::move(msg);
        return false;
    }
};
} // namespace pnt
