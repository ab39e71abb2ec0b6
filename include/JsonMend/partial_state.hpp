#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "json_path.hpp"
#include "partial_parser.hpp"

namespace JsonMend {

struct IncompleteField {
    Path path;              // JSON names, e.g. {"user", "name"}
    std::string jsonPath;   // "user.name"
    std::string reason;     // truncation site, or "incomplete"
};

// Which parts of a partially received document are still being streamed.
struct PartialState {
    bool isComplete = true;
    std::vector<IncompleteField> incompleteFields;

    static PartialState from_parse(const partial::ParseResult& result) {
        PartialState state;
        state.isComplete = result.complete();
        state.merge_incomplete_fields(result.incomplete, reason_for(result.truncatedAt));
        return state;
    }

    static std::string reason_for(partial::TruncationSite site) {
        if (site == partial::TruncationSite::complete) {
            return "incomplete";
        }
        return std::string(partial::truncation_site_to_string(site));
    }

    template<class... Segments>
    bool is_field_complete(const Segments&... segments) const {
        return is_path_complete(Path{std::string(segments)...});
    }

    bool is_path_complete(const Path& path) const {
        if (isComplete) {
            return true;
        }
        const std::string wanted = join_path(path);
        for (const IncompleteField& f : incompleteFields) {
            if (f.jsonPath == wanted) {
                return false;
            }
        }
        return true;
    }

    std::vector<std::string> waiting_for() const {
        std::vector<std::string> out;
        if (isComplete) {
            return out;
        }
        out.reserve(incompleteFields.size());
        for (const IncompleteField& f : incompleteFields) {
            out.push_back(f.jsonPath);
        }
        return out;
    }

    void merge_incomplete_fields(const std::vector<Path>& paths, std::string_view reason) {
        for (const Path& p : paths) {
            incompleteFields.push_back(IncompleteField{p, join_path(p), std::string(reason)});
        }
        if (!incompleteFields.empty()) {
            isComplete = false;
        }
    }
};

} // namespace JsonMend
