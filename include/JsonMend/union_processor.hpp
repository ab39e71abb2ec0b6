#pragma once

#include <string>
#include <string_view>
#include <vector>

#include <fmt/core.h>
#include <fmt/format.h>
#include <fmt/ranges.h>

#include "walker.hpp"

namespace JsonMend {

// Text of a value as compared against discriminator mapping keys.
inline std::string display_value(ValueRef v) {
    const ValueRef value = unwrap(v);
    if (!value) {
        return "<nil>";
    }
    const TypeShape& shape = *value.shape;
    switch (shape.kind()) {
    case ShapeKind::Bool:
        return shape.read_bool(value.ptr) ? "true" : "false";
    case ShapeKind::Integer:
        if (shape.is_unsigned()) {
            return fmt::format("{}", shape.read_uint(value.ptr));
        }
        return fmt::format("{}", shape.read_int(value.ptr));
    case ShapeKind::Number:
        return fmt::format("{}", shape.read_real(value.ptr));
    case ShapeKind::String:
        return std::string(shape.read_string(value.ptr));
    default:
        break;
    }
    if (json::EncodeResult encoded = json::encode(value)) {
        return encoded.json;
    }
    return shape.name();
}

inline bool matches_json_type(ValueRef value, std::string_view typeName) {
    if (!value) {
        return typeName == "null";
    }
    const ShapeKind k = value.kind();
    if (typeName == "string") return k == ShapeKind::String;
    if (typeName == "integer") return k == ShapeKind::Integer;
    if (typeName == "number") return k == ShapeKind::Integer || k == ShapeKind::Number;
    if (typeName == "boolean") return k == ShapeKind::Bool;
    if (typeName == "object") return k == ShapeKind::Object || k == ShapeKind::Map;
    if (typeName == "array") return k == ShapeKind::Array;
    return false;
}

// Checks populated polymorphic fields against their discriminator mapping or allowed type list.
class UnionValidateProcessor final : public CollectingProcessor, public DescentController {
public:
    WalkResult process_field(FieldContext& ctx) override {
        if (!ctx.options) {
            return {};
        }
        if (ctx.isRoot) {
            if (const Discriminator* d = ctx.options->discriminator()) {
                check_root(ctx, *d);
            }
            return {};
        }
        const ValueRef value = unwrap(ctx.value);
        if (!value || value.is_zero()) {
            return {};
        }
        if (const Discriminator* d = ctx.options->discriminator()) {
            check_discriminator(ctx.path, value, *d);
            return {};
        }
        check_any_of(ctx, value);
        return {};
    }

    bool should_descend(const FieldContext&) const override {
        return false;
    }

private:
    void check_discriminator(const Path& path, ValueRef value, const Discriminator& d) {
        if (d.propertyName.empty() || d.mapping.empty()) {
            return;
        }
        if (value.kind() == ShapeKind::Array) {
            const TypeShape* element = value.shape->element();
            const std::size_t n = value.shape->size(value.ptr);
            for (std::size_t i = 0; i < n; i ++) {
                Path at = path;
                at.push_back(index_segment(i));
                if (!check_one(at, ValueRef{value.shape->element_at(value.ptr, i), element}, d)) {
                    return;
                }
            }
            return;
        }
        check_one(path, value, d);
    }

    bool check_one(const Path& path, ValueRef slot, const Discriminator& d) {
        ValueRef value = slot;
        while (is_indirect(value.kind())) {
            value = step(value);
            if (!value) {
                record(path, "discriminated union value cannot be nil", ErrorKind::Constraint);
                return false;
            }
        }
        if (value.kind() != ShapeKind::Object) {
            record(path, "discriminated union requires a struct type", ErrorKind::Constraint);
            return false;
        }
        const FieldShape* property = find_property(*value.shape, d.propertyName);
        if (!property) {
            record(path, fmt::format("discriminator field '{}' not found", d.propertyName), ErrorKind::Constraint);
            return false;
        }
        const std::string found = display_value(ValueRef{property->access(value.ptr), &property->shape()});
        if (!d.mapping.contains(found)) {
            record(path, fmt::format("invalid discriminator value '{}', expected one of: [{}]", found, fmt::join(d.keys(), " ")),
                   ErrorKind::Constraint);
            return false;
        }
        return true;
    }

    // The root alternative must carry a mapped discriminator naming its own type.
    void check_root(const FieldContext& ctx, const Discriminator& d) {
        const ValueRef value = unwrap(ctx.value);
        if (!value || value.kind() != ShapeKind::Object) {
            return;
        }
        const Path at{d.propertyName};
        const FieldShape* property = find_property(*value.shape, d.propertyName);
        if (!property) {
            record(at, fmt::format("discriminator field '{}' not found in type {}", d.propertyName, value.shape->name()),
                   ErrorKind::DiscriminatorMissing);
            return;
        }
        const std::string found = display_value(ValueRef{property->access(value.ptr), &property->shape()});
        auto entry = d.mapping.find(found);
        if (entry == d.mapping.end() || !entry->second.shape) {
            record(at, fmt::format("invalid discriminator value '{}', expected one of: [{}]", found, fmt::join(d.keys(), " ")),
                   ErrorKind::DiscriminatorInvalid);
            return;
        }
        const TypeShape& expected = static_unwrap(*entry->second.shape);
        if (expected.type() != value.shape->type()) {
            record({}, fmt::format("type mismatch: expected {} for discriminator '{}', got {}", expected.name(), found, value.shape->name()),
                   ErrorKind::TypeMismatch);
        }
    }

    static const FieldShape* find_property(const TypeShape& shape, std::string_view jsonName) {
        for (const FieldShape& f : shape.fields()) {
            if (f.jsonName == jsonName) return &f;
        }
        for (const FieldShape& f : shape.fields()) {
            if (json::equal_fold(f.jsonName, jsonName) || json::equal_fold(f.name, jsonName)) return &f;
        }
        return nullptr;
    }

    void check_any_of(const FieldContext& ctx, ValueRef value) {
        const StringList* names = ctx.options->anyOf();
        const TypeList* types = ctx.options->anyOfTypes();
        if ((!names || names->empty()) && (!types || types->empty())) {
            return;
        }
        if (types) {
            for (const TypeShape* expected : *types) {
                if (expected->type() == value.shape->type()) {
                    return;
                }
                if (expected->kind() == ShapeKind::Array && value.kind() == ShapeKind::Array
                    && expected->element()->type() == value.shape->element()->type()) {
                    return;
                }
            }
        }
        if (names) {
            for (const std::string& name : *names) {
                if (matches_json_type(value, name)) {
                    return;
                }
            }
        }
        std::vector<std::string> all;
        if (names) {
            all = *names;
        }
        if (types) {
            for (const TypeShape* t : *types) {
                all.push_back(t->name());
            }
        }
        record(ctx.path, fmt::format("value does not match any allowed type: [{}]", fmt::join(all, " ")), ErrorKind::Constraint);
    }
};

} // namespace JsonMend
