#pragma once

#include <algorithm>
#include <string>
#include <string_view>
#include <vector>

#include <yyjson.h>

#include <JsonMend/errors.hpp>
#include <JsonMend/json_path.hpp>
#include <JsonMend/partial_parser.hpp>

namespace TestHelpers {

// ============================================================================
// Error Helpers
// ============================================================================

/// Some error sits at `location` ("a.b[0].c") with the given kind
inline bool HasError(const JsonMend::ValidationErrors& errors, std::string_view location, JsonMend::ErrorKind kind) {
    return std::any_of(errors.begin(), errors.end(), [&](const JsonMend::ValidationError& e) {
        return e.location() == location && e.kind == kind;
    });
}

/// Some error sits at `location` and its message contains `text`
inline bool HasErrorMessage(const JsonMend::ValidationErrors& errors, std::string_view location, std::string_view text) {
    return std::any_of(errors.begin(), errors.end(), [&](const JsonMend::ValidationError& e) {
        return e.location() == location && e.message.find(text) != std::string::npos;
    });
}

inline bool HasErrorAt(const JsonMend::ValidationErrors& errors, std::string_view location) {
    return std::any_of(errors.begin(), errors.end(), [&](const JsonMend::ValidationError& e) {
        return e.location() == location;
    });
}

inline bool HasErrorKind(const JsonMend::ValidationErrors& errors, JsonMend::ErrorKind kind) {
    return std::any_of(errors.begin(), errors.end(), [&](const JsonMend::ValidationError& e) {
        return e.kind == kind;
    });
}

// ============================================================================
// Repair Helpers
// ============================================================================

/// yyjson accepts the text as one complete document
inline bool IsValidJson(std::string_view text) {
    yyjson_doc* doc = yyjson_read(text.data(), text.size(), 0);
    if (!doc) {
        return false;
    }
    yyjson_doc_free(doc);
    return true;
}

/// Incomplete paths of a parse, joined ("a.b[0]")
inline std::vector<std::string> IncompletePaths(const JsonMend::partial::ParseResult& r) {
    std::vector<std::string> out;
    for (const JsonMend::Path& p : r.incomplete) {
        out.push_back(JsonMend::join_path(p));
    }
    return out;
}

/// Non-strict repair gives exactly `expected` at the expected site
inline bool RepairsTo(std::string_view input, std::string_view expected, JsonMend::partial::TruncationSite site) {
    JsonMend::partial::Parser parser;
    JsonMend::partial::ParseResult r = parser.parse(input);
    return r.repaired == expected && r.truncatedAt == site;
}

/// Non-strict repair gives `expected` with exactly these incomplete paths, in order
inline bool RepairsWithIncomplete(std::string_view input, std::string_view expected,
                                  const std::vector<std::string>& incomplete) {
    JsonMend::partial::Parser parser;
    JsonMend::partial::ParseResult r = parser.parse(input);
    return r.repaired == expected && IncompletePaths(r) == incomplete;
}

} // namespace TestHelpers
