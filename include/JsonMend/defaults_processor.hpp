#pragma once

#include "walker.hpp"

namespace JsonMend {

// Fills zero-valued fields from their declared defaults. A default whose type
// does not fit the field is ignored.
class DefaultsProcessor final : public CollectingProcessor {
public:
    WalkResult process_field(FieldContext& ctx) override {
        if (ctx.isRoot || !ctx.options || !ctx.options->hasDefault() || !ctx.settable) {
            return {};
        }
        if (!ctx.value.is_zero()) {
            return {};
        }
        if (!ctx.value.shape->assign_any(ctx.value.ptr, ctx.options->defaultValue)) {
            JSONMEND_LOG_DEBUG("default for {} not assignable to {}", join_path(ctx.path), ctx.value.shape->name());
        }
        return {};
    }
};

} // namespace JsonMend
