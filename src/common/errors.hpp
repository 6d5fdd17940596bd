#pragma once

#include <stdexcept>
#include <string>

namespace testline {

enum class ErrorKind {
    InvalidCutoff,
    InvalidWindow,
    InvalidRequest
};

inline std::string toErrorKindString(ErrorKind kind)
{
    switch (kind) {
    case ErrorKind::InvalidCutoff:
        return "invalid_cutoff";
    case ErrorKind::InvalidWindow:
        return "invalid_window";
    case ErrorKind::InvalidRequest:
        return "invalid_request";
    }
    return "invalid_request";
}

// Structural request errors. Bad individual records never raise this; they
// are skipped and counted by the normalizer instead.
class EngineError : public std::runtime_error
{
public:
    EngineError(ErrorKind kind, const std::string &message)
        : std::runtime_error(message)
        , m_kind(kind)
    {
    }

    ErrorKind kind() const
    {
        return m_kind;
    }

private:
    ErrorKind m_kind;
};

} // namespace testline
