#pragma once

#include <typeindex>

#include <fmt/core.h>

#include "walker.hpp"

namespace JsonMend {

// Required checks and declared validators.
class ValidateProcessor final : public CollectingProcessor, public DescentController {
public:
    WalkResult process_field(FieldContext& ctx) override {
        if (ctx.isRoot || !ctx.options) {
            return {};
        }
        const FieldOptions& opts = *ctx.options;
        const ValueRef value = unwrap(ctx.value);
        const bool isStruct = value && value.kind() == ShapeKind::Object;
        const bool zero = !value || value.is_zero();

        if (opts.required && zero && !opts.hasDefault() && !isStruct) {
            record(ctx.path, "required field", ErrorKind::Required);
            return {};
        }
        // absent leaves are left to the defaults pass
        if (zero && !isStruct && (opts.hasDefault() || !opts.required)) {
            return {};
        }
        for (const FieldValidator& validator : opts.validators) {
            if (!validator.check) {
                record(ctx.path, fmt::format("validator '{}' has no check", validator.name), ErrorKind::Internal);
                continue;
            }
            const void* subject = nullptr;
            if (value && value.shape->type() == validator.accepts) {
                subject = value.ptr;
            } else if (ctx.value.shape->type() == validator.accepts) {
                subject = ctx.value.ptr;
            }
            if (!subject) {
                record(ctx.path, fmt::format("validator '{}' cannot check a value of type {}", validator.name,
                                             value ? value.shape->name() : ctx.value.shape->name()),
                       ErrorKind::TypeMismatch);
                continue;
            }
            if (std::optional<std::string> message = validator.check(subject)) {
                record(ctx.path, std::move(*message), ErrorKind::Constraint);
            }
        }
        return {};
    }

    bool should_descend(const FieldContext& ctx) const override {
        const ValueRef value = unwrap(ctx.value);
        if (!value) {
            return false;
        }
        return value.kind() == ShapeKind::Array || value.kind() == ShapeKind::Object;
    }
};

} // namespace JsonMend
