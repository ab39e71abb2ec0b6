#pragma once

#include <deque>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <fmt/core.h>
#include <fmt/format.h>
#include <fmt/ranges.h>

#include "walker.hpp"

namespace JsonMend {

// Decodes each field from its fragment. Discriminated unions are resolved
// here; everything else goes through the plain decoder.
class UnmarshalProcessor final : public CollectingProcessor, public DescentController, public JsonConsumer {
public:
    WalkResult process_field(FieldContext& ctx) override {
        if (ctx.isRoot) {
            m_kept.clear();
        }
        if (ctx.rawJson.empty() || !ctx.settable) {
            return {};
        }
        // Object roots are filled member by member; array roots need their elements first
        // and a discriminated root needs its alternative chosen.
        if (ctx.isRoot) {
            const Discriminator* d = ctx.options ? ctx.options->discriminator() : nullptr;
            if (static_unwrap(*ctx.value.shape).kind() == ShapeKind::Array) {
                decode_plain(ctx);
            } else if (d) {
                decode_union(ctx, *d);
            }
            return {};
        }
        if (ctx.options) {
            if (const Discriminator* d = ctx.options->discriminator()) {
                if (static_unwrap(*ctx.value.shape).kind() == ShapeKind::Array) {
                    decode_union_sequence(ctx, *d);
                } else {
                    decode_union(ctx, *d);
                }
                return {};
            }
        }
        decode_plain(ctx);
        return {};
    }

    bool should_descend(const FieldContext& ctx) const override {
        const ValueRef value = unwrap(ctx.value);
        if (!value) {
            return false;
        }
        if (value.kind() == ShapeKind::Array) {
            return value.shape->element() && is_walkable(*value.shape->element());
        }
        return value.kind() == ShapeKind::Object;
    }

    void record_document_error(ValidationError error) override {
        m_errors.push_back(std::move(error));
    }

    // Members carrying a discriminator are left to the walker, which visits them with their options.
    static json::SkipField discriminated_members(const FieldScanner* scanner) {
        if (!scanner) {
            return {};
        }
        return [scanner](const TypeShape& object, const FieldShape& field) {
            const FieldOptionsMap options = scanner->scan_field_options(object);
            auto it = options.find(field.name);
            return it != options.end() && it->second && it->second->discriminator() != nullptr;
        };
    }

private:
    struct Resolved {
        std::shared_ptr<void> instance;
        const TypeShape* shape = nullptr;
    };

    void decode_plain(const FieldContext& ctx) {
        const json::SkipField skip = discriminated_members(ctx.scanner);
        if (json::DecodeResult r = json::decode(ctx.value, ctx.rawJson, &skip); !r) {
            record(ctx.path, "JSON unmarshal failed: " + r.message(), ErrorKind::JsonDecode);
        }
    }

    static Path with(const Path& base, std::string segment) {
        Path p = base;
        p.push_back(std::move(segment));
        return p;
    }

    // Reads the discriminator of one fragment and decodes it into a fresh instance of the mapped type.
    std::optional<Resolved> resolve(const Path& at, std::string_view fragment, const Discriminator& d,
                                    const FieldScanner* scanner, std::string_view parseContext, std::string_view decodeContext) {
        const json::PeekResult peek = json::peek_property(fragment, d.propertyName);
        if (peek.status == json::PeekResult::Status::Malformed) {
            record(at, fmt::format("failed to parse {}: {}", parseContext, peek.error), ErrorKind::JsonDecode);
            return std::nullopt;
        }
        if (peek.status == json::PeekResult::Status::Missing) {
            record(with(at, d.propertyName), fmt::format("discriminator field '{}' not found", d.propertyName),
                   ErrorKind::DiscriminatorMissing);
            return std::nullopt;
        }
        auto entry = d.mapping.find(peek.value);
        if (entry == d.mapping.end() || !entry->second.shape) {
            record(with(at, d.propertyName),
                   fmt::format("invalid discriminator value '{}', expected one of: [{}]", peek.value, fmt::join(d.keys(), " ")),
                   ErrorKind::DiscriminatorInvalid);
            return std::nullopt;
        }
        const TypeShape* shape = entry->second.shape;
        Resolved out{shape->create(), shape};
        if (!out.instance) {
            record(at, fmt::format("cannot construct {}", shape->name()), ErrorKind::Internal);
            return std::nullopt;
        }
        const json::SkipField skip = discriminated_members(scanner);
        if (json::DecodeResult r = json::decode(ValueRef{out.instance.get(), shape}, fragment, &skip); !r) {
            record(at, fmt::format("failed to unmarshal {}: {}", decodeContext, r.message()), ErrorKind::JsonDecode);
            return std::nullopt;
        }
        return out;
    }

    // Makes room for `shape` in `slot` and moves the decoded instance there.
    static bool store(ValueRef slot, const Resolved& resolved) {
        ValueRef target = slot;
        while (target) {
            if (target.shape->type() == resolved.shape->type()) {
                return target.shape->move_assign(target.ptr, resolved.instance.get());
            }
            switch (target.kind()) {
            case ShapeKind::Variant:
            case ShapeKind::Any: {
                void* placed = target.shape->emplace(target.ptr, *resolved.shape);
                return placed && resolved.shape->move_assign(placed, resolved.instance.get());
            }
            case ShapeKind::Reference:
                target = ValueRef{target.shape->ensure(target.ptr), target.shape->target()};
                break;
            default:
                return false;
            }
        }
        return false;
    }

    void decode_union(FieldContext& ctx, const Discriminator& d) {
        std::optional<Resolved> resolved = resolve(ctx.path, ctx.rawJson, d, ctx.scanner,
                                                   "discriminated union field", "discriminated union");
        if (!resolved) {
            return;
        }
        if (!store(ctx.value, *resolved)) {
            record(ctx.path, fmt::format("cannot store {} in field of type {}", resolved->shape->name(), ctx.value.shape->name()),
                   ErrorKind::TypeMismatch);
        }
    }

    void decode_union_sequence(FieldContext& ctx, const Discriminator& d) {
        if (ctx.rawJson == "null") {
            ctx.value.shape->reset(ctx.value.ptr);
            return;
        }
        std::string error;
        std::optional<std::vector<std::string>> elements = json::split_array(ctx.rawJson, error);
        if (!elements) {
            record(ctx.path, fmt::format("failed to parse array: {}", error), ErrorKind::JsonDecode);
            return;
        }
        std::vector<Resolved> decoded;
        std::vector<std::string_view> fragments;
        for (std::size_t i = 0; i < elements->size(); i ++) {
            const Path at = with(ctx.path, index_segment(i));
            if (std::optional<Resolved> r = resolve(at, (*elements)[i], d, ctx.scanner, "element", "element")) {
                decoded.push_back(std::move(*r));
                fragments.push_back((*elements)[i]);
            }
        }

        ValueRef sequence = ctx.value;
        while (sequence && sequence.kind() == ShapeKind::Reference) {
            sequence = ValueRef{sequence.shape->ensure(sequence.ptr), sequence.shape->target()};
        }
        if (!sequence || sequence.kind() != ShapeKind::Array) {
            record(ctx.path, fmt::format("cannot store elements in field of type {}", ctx.value.shape->name()), ErrorKind::TypeMismatch);
            return;
        }
        const TypeShape* element = sequence.shape->element();
        sequence.shape->reset(sequence.ptr);
        std::vector<std::string_view> stored;
        for (std::size_t i = 0; i < decoded.size(); i ++) {
            void* slot = sequence.shape->append(sequence.ptr);
            if (!slot || !store(ValueRef{slot, element}, decoded[i])) {
                if (slot) {
                    sequence.shape->pop_back(sequence.ptr);
                }
                record(ctx.path, fmt::format("cannot store {} in element of type {}", decoded[i].shape->name(), element->name()),
                       ErrorKind::TypeMismatch);
                continue;
            }
            stored.push_back(fragments[i]);
        }
        // the walker pairs elements with fragments by index
        m_kept.push_back(fmt::format("[{}]", fmt::join(stored, ",")));
        ctx.rawJson = m_kept.back();
    }

    std::deque<std::string> m_kept;
};

} // namespace JsonMend
