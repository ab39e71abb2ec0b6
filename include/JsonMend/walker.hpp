#pragma once

#include <cstddef>
#include <functional>
#include <set>
#include <string>
#include <string_view>
#include <typeindex>
#include <utility>
#include <vector>

#include "errors.hpp"
#include "field_options.hpp"
#include "json_codec.hpp"
#include "json_path.hpp"
#include "logging.hpp"
#include "shape.hpp"

namespace JsonMend {

// Everything a processor learns about the slot it is visiting. The path is the
// walker's live stack: copy it before keeping it.
struct FieldContext {
    const Path& path;
    const FieldShape* field = nullptr;
    ValueRef value;
    std::string_view rawJson;
    const FieldOptions* options = nullptr;
    const FieldScanner* scanner = nullptr;
    bool isRoot = false;
    bool settable = true;
};

class Processor {
public:
    virtual ~Processor() = default;

    // A failed result aborts the whole walk. Ordinary problems go to errors().
    virtual WalkResult process_field(FieldContext& ctx) = 0;
    virtual const ValidationErrors& errors() const = 0;
};

// Lets a processor decide whether the walker recurses below a field.
class DescentController {
public:
    virtual ~DescentController() = default;
    virtual bool should_descend(const FieldContext& ctx) const = 0;
};

// Receives the failure to decode the top-level document.
class JsonConsumer {
public:
    virtual ~JsonConsumer() = default;
    virtual void record_document_error(ValidationError error) = 0;
};

class CollectingProcessor : public Processor {
public:
    const ValidationErrors& errors() const override {
        return m_errors;
    }
    void clear_errors() {
        m_errors.clear();
    }

protected:
    void record(const Path& loc, std::string message, ErrorKind kind) {
        m_errors.push_back(ValidationError{loc, std::move(message), kind});
    }

    ValidationErrors m_errors;
};

class Walker {
public:
    template<class... Processors>
    explicit Walker(const FieldScanner& scanner, Processors&... processors)
        : m_scanner(scanner)
        , m_processors{static_cast<Processor*>(&processors)...}
    {
        for (Processor* p : m_processors) {
            if (!m_descent) {
                m_descent = dynamic_cast<const DescentController*>(p);
            }
            if (!m_consumer) {
                m_consumer = dynamic_cast<JsonConsumer*>(p);
            }
        }
    }

    // Walks `root`, decoding from `rawJson` when it is not empty.
    WalkResult walk(ValueRef root, std::string_view rawJson = {}) {
        m_settable = true;
        return run(root, rawJson);
    }

    template<class T>
    WalkResult walk(T& root, std::string_view rawJson = {}) {
        return walk(make_ref(root), rawJson);
    }

    // Processors see every slot as non-settable.
    template<class T>
    WalkResult walk_readonly(const T& root) {
        m_settable = false;
        return run(make_ref(root), {});
    }

    // Options the root is offered with, e.g. a root-level discriminator. Not owned.
    void set_root_options(const FieldOptions* options) {
        m_rootOptions = options;
    }

    // All processor errors, in processor order.
    ValidationErrors errors() const {
        ValidationErrors out;
        for (const Processor* p : m_processors) {
            const ValidationErrors& e = p->errors();
            out.insert(out.end(), e.begin(), e.end());
        }
        return out;
    }

private:
    class PathGuard {
    public:
        PathGuard(Path& path, std::string segment) : m_path(path) {
            m_path.push_back(std::move(segment));
        }
        ~PathGuard() { m_path.pop_back(); }
        PathGuard(const PathGuard&) = delete;
        PathGuard& operator=(const PathGuard&) = delete;
    private:
        Path& m_path;
    };

    WalkResult run(ValueRef root, std::string_view rawJson) {
        m_visited.clear();
        m_path.clear();
        if (!root) {
            return {};
        }
        JSONMEND_LOG_DEBUG("walk {} ({} bytes of JSON, {} processors)", root.shape->name(), rawJson.size(), m_processors.size());

        const bool arrayRoot = static_unwrap(*root.shape).kind() == ShapeKind::Array;
        json::RawFields rawFields;
        std::vector<std::string> rawElements;
        if (!rawJson.empty()) {
            std::string error;
            bool parsed = false;
            if (arrayRoot) {
                std::optional<std::vector<std::string>> elements = json::split_array(rawJson, error);
                parsed = elements.has_value();
                if (parsed) rawElements = std::move(*elements);
            } else {
                std::optional<json::RawFields> fields = json::split_object(rawJson, error);
                parsed = fields.has_value();
                if (parsed) rawFields = std::move(*fields);
            }
            if (!parsed) {
                if (m_consumer) {
                    m_consumer->record_document_error(ValidationError{{}, "json unmarshal failed: " + error, ErrorKind::JsonDecode});
                    return {};
                }
                JSONMEND_LOG_DEBUG("ignoring undecodable document: {}", error);
            }
        }

        FieldContext rootCtx{m_path, nullptr, root, rawJson, m_rootOptions, &m_scanner, true, m_settable};
        for (Processor* p : m_processors) {
            if (WalkResult r = p->process_field(rootCtx); !r) {
                return r;
            }
        }

        WalkResult result = arrayRoot ? walk_elements(root, rawElements) : walk_struct(root, rawFields);
        JSONMEND_LOG_DEBUG("walk {} finished with {} errors", root.shape->name(), errors().size());
        return result;
    }

    // Unwraps references and polymorphic slots, recording every identity passed through.
    // Returns a null ref for nil branches and for identities seen earlier in this walk.
    ValueRef enter(ValueRef v) {
        while (v && is_indirect(v.kind())) {
            v = step(v);
            if (v && !m_visited.emplace(v.ptr, v.shape->type()).second) {
                return {};
            }
        }
        if (v && v.kind() == ShapeKind::Object) {
            m_visited.emplace(v.ptr, v.shape->type());
        }
        return v;
    }

    WalkResult walk_struct(ValueRef slot, const json::RawFields& raw) {
        const ValueRef value = enter(slot);
        if (!value || value.kind() != ShapeKind::Object) {
            return {};
        }
        const FieldOptionsMap options = m_scanner.scan_field_options(*value.shape);
        for (const FieldShape& field : value.shape->fields()) {
            PathGuard guard(m_path, std::string(field.name));
            const std::string* fragment = json::lookup_raw(raw, field.jsonName, field.name);
            auto opt = options.find(field.name);
            FieldContext ctx{
                m_path,
                &field,
                ValueRef{field.access(value.ptr), &field.shape()},
                fragment ? std::string_view(*fragment) : std::string_view{},
                opt != options.end() ? opt->second.get() : nullptr,
                &m_scanner,
                false,
                m_settable};

            for (Processor* p : m_processors) {
                if (WalkResult r = p->process_field(ctx); !r) {
                    return r;
                }
            }

            if (!should_descend(ctx)) {
                continue;
            }
            const ValueRef target = unwrap(ctx.value);
            if (target && target.kind() == ShapeKind::Array) {
                if (WalkResult r = walk_sequence(target, ctx.rawJson); !r) {
                    return r;
                }
            } else {
                if (WalkResult r = walk_struct(ctx.value, json::split_object_lenient(ctx.rawJson)); !r) {
                    return r;
                }
            }
        }
        return {};
    }

    WalkResult walk_sequence(ValueRef sequence, std::string_view rawJson) {
        const TypeShape* element = sequence.shape->element();
        if (!element || !is_walkable(*element)) {
            return {};
        }
        return walk_elements(sequence, json::split_array_lenient(rawJson));
    }

    WalkResult walk_elements(ValueRef slot, const std::vector<std::string>& rawElements) {
        const ValueRef sequence = unwrap(slot);
        if (!sequence || sequence.kind() != ShapeKind::Array) {
            return {};
        }
        const TypeShape* element = sequence.shape->element();
        const std::size_t n = sequence.shape->size(sequence.ptr);
        for (std::size_t i = 0; i < n; i ++) {
            PathGuard guard(m_path, index_segment(i));
            const ValueRef item{sequence.shape->element_at(sequence.ptr, i), element};
            const json::RawFields fields = i < rawElements.size() ? json::split_object_lenient(rawElements[i]) : json::RawFields{};
            if (WalkResult r = walk_struct(item, fields); !r) {
                return r;
            }
        }
        return {};
    }

    bool should_descend(const FieldContext& ctx) const {
        if (m_descent) {
            return m_descent->should_descend(ctx);
        }
        const ValueRef target = unwrap(ctx.value);
        if (!target) {
            return false;
        }
        return target.kind() == ShapeKind::Array || target.kind() == ShapeKind::Object;
    }

    const FieldScanner& m_scanner;
    std::vector<Processor*> m_processors;
    const DescentController* m_descent = nullptr;
    JsonConsumer* m_consumer = nullptr;
    const FieldOptions* m_rootOptions = nullptr;

    std::set<std::pair<const void*, std::type_index>> m_visited;
    Path m_path;
    bool m_settable = true;
};

} // namespace JsonMend
