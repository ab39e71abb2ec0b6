#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/core.h>
#include <fmt/format.h>

#include "json_path.hpp"

namespace JsonMend {

enum class ErrorKind {
    Required,
    Constraint,
    Internal,
    JsonDecode,
    JsonEncode,
    HookError,
    DiscriminatorMissing,
    DiscriminatorInvalid,
    TypeMismatch,
    MarshalError
};

constexpr std::string_view error_kind_to_string(ErrorKind e) {
    switch (e) {
    case ErrorKind::Required: return "required"; break;
    case ErrorKind::Constraint: return "constraint"; break;
    case ErrorKind::Internal: return "internal"; break;
    case ErrorKind::JsonDecode: return "json_decode"; break;
    case ErrorKind::JsonEncode: return "json_encode"; break;
    case ErrorKind::HookError: return "hook_error"; break;
    case ErrorKind::DiscriminatorMissing: return "discriminator_missing"; break;
    case ErrorKind::DiscriminatorInvalid: return "discriminator_invalid"; break;
    case ErrorKind::TypeMismatch: return "type_error"; break;
    case ErrorKind::MarshalError: return "marshal_error"; break;
    }
    return "N/A";
}

// A single failure, located by the member-name path of the value it concerns.
struct ValidationError {
    Path loc;
    std::string message;
    ErrorKind kind = ErrorKind::Internal;

    std::string location() const {
        return join_path(loc);
    }

    std::string to_string() const {
        if (loc.empty()) {
            return message;
        }
        return fmt::format("{}: {}", location(), message);
    }
};

using ValidationErrors = std::vector<ValidationError>;

inline std::string format_errors(const ValidationErrors& errors) {
    std::vector<std::string> parts;
    parts.reserve(errors.size());
    for (const ValidationError& e : errors) {
        parts.push_back(e.to_string());
    }
    return fmt::format("validation errors ({}): {}", errors.size(), fmt::join(parts, "; "));
}

inline bool has_json_decode_error(const ValidationErrors& errors) {
    for (const ValidationError& e : errors) {
        if (e.kind == ErrorKind::JsonDecode) {
            return true;
        }
    }
    return false;
}

// Outcome of a single walker step. An empty result means "keep going".
class WalkResult {
public:
    WalkResult() = default;
    WalkResult(ValidationError error) : m_error(std::move(error)) {}

    constexpr operator bool() const {
        return !m_error.has_value();
    }

    const ValidationError& error() const {
        return *m_error;
    }

private:
    std::optional<ValidationError> m_error;
};

} // namespace JsonMend
