#pragma once

#include <charconv>
#include <concepts>
#include <cstdint>
#include <initializer_list>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>
#include <vector>

#include <fmt/core.h>
#include <fmt/format.h>

#include <yyjson.h>

#include "defaults_processor.hpp"
#include "errors.hpp"
#include "field_options.hpp"
#include "json_codec.hpp"
#include "json_path.hpp"
#include "partial_parser.hpp"
#include "partial_state.hpp"
#include "shape.hpp"
#include "union_processor.hpp"
#include "unmarshal_processor.hpp"
#include "validate_processor.hpp"
#include "walker.hpp"

namespace JsonMend {

// Optional hooks, found by signature on the target type.
template<class T>
concept HasBeforeValidate = requires(T& t, yyjson_mut_doc* doc) {
    { t.before_validate(doc) } -> std::convertible_to<std::optional<std::string>>;
};

template<class T>
concept HasAfterValidate = requires(T& t) {
    { t.after_validate() } -> std::convertible_to<std::optional<std::string>>;
};

template<class T>
concept HasBeforeSerialize = requires(T& t) {
    { t.before_serialize() } -> std::convertible_to<std::optional<std::string>>;
};

template<class T>
concept HasAfterSerialize = requires(T& t, yyjson_mut_doc* doc) {
    { t.after_serialize(doc) } -> std::convertible_to<std::optional<std::string>>;
};

template<class T>
struct Unmarshalled {
    std::optional<T> value;
    ValidationErrors errors;

    constexpr operator bool() const {
        return value.has_value() && errors.empty();
    }
};

template<class T>
struct PartialUnmarshalled {
    std::optional<T> value;
    PartialState state;
    ValidationErrors errors;

    constexpr operator bool() const {
        return value.has_value() && errors.empty();
    }
};

struct Marshalled {
    std::string json;
    ValidationErrors errors;

    constexpr operator bool() const {
        return errors.empty();
    }
};

// Maps a member-name path onto JSON names, following the static shape below `root`.
// Segments with no matching member are kept verbatim.
inline std::string json_location(const TypeShape& root, const Path& loc) {
    std::string out;
    const TypeShape* current = &root;
    for (const std::string& segment : loc) {
        const bool index = !segment.empty() && segment.front() == '[';
        const TypeShape* shape = current ? &static_unwrap(*current) : nullptr;
        if (index) {
            out += segment;
            current = shape && shape->kind() == ShapeKind::Array ? shape->element() : nullptr;
            continue;
        }
        const FieldShape* found = nullptr;
        if (shape && shape->kind() == ShapeKind::Object) {
            for (const FieldShape& f : shape->fields()) {
                if (f.name == segment) found = &f;
            }
        } else if (shape && shape->kind() == ShapeKind::Variant) {
            for (const TypeShape* alt : shape->alternatives()) {
                const TypeShape& concrete = static_unwrap(*alt);
                for (const FieldShape& f : concrete.fields()) {
                    if (!found && f.name == segment) found = &f;
                }
            }
        }
        if (!out.empty()) {
            out += '.';
        }
        if (found) {
            out += found->jsonName;
            current = &found->shape();
        } else {
            out += segment;
            current = nullptr;
        }
    }
    return out;
}

template<class T>
class Validator {
    static_assert(std::is_default_constructible_v<T>, "[[[ JsonMend ]]] Validator target must be default constructible");
    static_assert(std::is_move_constructible_v<T>, "[[[ JsonMend ]]] Validator target must be move constructible");

public:
    Validator() : m_scanner(std::make_shared<DeclaredScanner>()) {}

    explicit Validator(std::shared_ptr<const FieldScanner> scanner)
        : m_scanner(scanner ? std::move(scanner) : std::make_shared<DeclaredScanner>()) {}

    const FieldScanner& scanner() const {
        return *m_scanner;
    }

    // Makes the root a discriminated union: the document's `propertyName` picks the
    // alternative, which is then decoded and validated like any other value.
    Validator& with_discriminator(Discriminator discriminator) {
        auto options = std::make_shared<FieldOptions>();
        options->constraints[std::string(constraint_keys::discriminator)] = ConstraintValue(std::move(discriminator));
        m_rootOptions = std::move(options);
        return *this;
    }

    Validator& with_discriminator(std::string propertyName, std::initializer_list<std::pair<const std::string, UnionEntry>> entries) {
        Discriminator d;
        d.propertyName = std::move(propertyName);
        d.mapping.insert(entries.begin(), entries.end());
        return with_discriminator(std::move(d));
    }

    // Keys of any string-like type, such as an event-name wrapper.
    template<class K>
        requires std::convertible_to<const K&, std::string_view>
    Validator& with_discriminator(std::string propertyName, const std::map<K, UnionEntry>& entries) {
        Discriminator d;
        d.propertyName = std::move(propertyName);
        for (const auto& [key, entry] : entries) {
            d.mapping.emplace(std::string(std::string_view(key)), entry);
        }
        return with_discriminator(std::move(d));
    }

    const Discriminator* discriminator() const {
        return m_rootOptions ? m_rootOptions->discriminator() : nullptr;
    }

    ValidationErrors validate(const T& value) const {
        ValidateProcessor validate;
        UnionValidateProcessor unions;
        Walker walker(*m_scanner, validate, unions);
        walker.set_root_options(m_rootOptions.get());
        if (WalkResult r = walker.walk_readonly(value); !r) {
            return {r.error()};
        }
        return walker.errors();
    }

    ValidationErrors apply_defaults(T& value) const {
        DefaultsProcessor defaults;
        Walker walker(*m_scanner, defaults);
        if (WalkResult r = walker.walk(value); !r) {
            return {r.error()};
        }
        return walker.errors();
    }

    Unmarshalled<T> unmarshal(std::string_view json) const {
        Unmarshalled<T> out;
        if (partial::detail::trim(json).empty()) {
            out.errors.push_back(ValidationError{{}, "json unmarshal failed: empty input", ErrorKind::JsonDecode});
            return out;
        }
        T value{};
        std::string document(json);
        if (!run_before_validate(value, document, out.errors)) {
            return out;
        }
        out.errors = parse_into(value, document);
        if (has_json_decode_error(out.errors) || !root_resolved(value)) {
            return out;
        }
        if (out.errors.empty()) {
            run_after_validate(value, out.errors);
        }
        out.value = std::move(value);
        return out;
    }

    // Repairs a truncated document and decodes what is there. Errors located at
    // fields that are still being received are dropped.
    PartialUnmarshalled<T> unmarshal_partial(std::string_view json) const {
        PartialUnmarshalled<T> out;
        const partial::ParseResult parsed = m_parser.parse(json);
        out.state = PartialState::from_parse(parsed);

        if (!root_discriminator_known(parsed, out)) {
            return out;
        }

        T value{};
        std::string document = parsed.repaired;
        if (!run_before_validate(value, document, out.errors)) {
            return out;
        }
        ValidationErrors errors = parse_into(value, document);
        if (!parsed.incomplete.empty()) {
            const IncompleteSet incomplete = build_incomplete_set(parsed.incomplete);
            const TypeShape& root = shape_of<T>();
            for (ValidationError& e : errors) {
                if (!is_path_or_parent_incomplete(json_location(root, e.loc), incomplete)) {
                    out.errors.push_back(std::move(e));
                }
            }
        } else {
            out.errors = std::move(errors);
        }
        JSONMEND_LOG_DEBUG("partial unmarshal of {}: {} incomplete fields, {} errors", shape_of<T>().name(),
                           out.state.incompleteFields.size(), out.errors.size());
        if (has_json_decode_error(out.errors) || !root_resolved(value)) {
            return out;
        }
        if (out.state.isComplete && out.errors.empty()) {
            run_after_validate(value, out.errors);
        }
        out.value = std::move(value);
        return out;
    }

    // Validates, then encodes. A before_serialize hook runs on a copy, so `value` is left as is.
    Marshalled marshal(const T& value) const {
        if constexpr (HasBeforeSerialize<T> || HasAfterSerialize<T>) {
            static_assert(std::is_copy_constructible_v<T>, "[[[ JsonMend ]]] serialize hooks need a copy constructible target");
            T copy(value);
            return marshal_value(copy);
        } else {
            return marshal_value(value);
        }
    }

    // Flat string data such as path parameters or cookies, keyed by JSON name.
    Unmarshalled<T> validate_from_string_map(const std::map<std::string, std::string>& data) const {
        json::MutDocument doc(yyjson_mut_doc_new(nullptr));
        yyjson_mut_val* root = doc ? yyjson_mut_obj(doc.get()) : nullptr;
        if (!root) {
            return marshal_failure("out of memory");
        }
        yyjson_mut_doc_set_root(doc.get(), root);
        for (const auto& [key, text] : data) {
            const FieldShape* field = field_by_json_name(key);
            yyjson_mut_val* v = field ? convert(doc.get(), text, static_unwrap(field->shape()))
                                      : yyjson_mut_strncpy(doc.get(), text.data(), text.size());
            if (!add_member(doc.get(), root, key, v)) {
                return marshal_failure("out of memory");
            }
        }
        return unmarshal_document(doc.get());
    }

    // Multi-valued data such as query parameters or headers. Sequence fields take every
    // value; everything else takes the first.
    Unmarshalled<T> validate_from_multi_value_map(const std::map<std::string, std::vector<std::string>>& data) const {
        json::MutDocument doc(yyjson_mut_doc_new(nullptr));
        yyjson_mut_val* root = doc ? yyjson_mut_obj(doc.get()) : nullptr;
        if (!root) {
            return marshal_failure("out of memory");
        }
        yyjson_mut_doc_set_root(doc.get(), root);
        for (const auto& [key, values] : data) {
            if (values.empty()) {
                continue;
            }
            const FieldShape* field = field_by_json_name(key);
            yyjson_mut_val* v = nullptr;
            if (!field) {
                v = yyjson_mut_strncpy(doc.get(), values.front().data(), values.front().size());
            } else if (const TypeShape& shape = static_unwrap(field->shape()); shape.kind() == ShapeKind::Array) {
                v = yyjson_mut_arr(doc.get());
                const TypeShape& element = static_unwrap(*shape.element());
                for (const std::string& text : values) {
                    if (!v || !yyjson_mut_arr_append(v, convert(doc.get(), text, element))) {
                        v = nullptr;
                        break;
                    }
                }
            } else {
                v = convert(doc.get(), values.front(), shape);
            }
            if (!add_member(doc.get(), root, key, v)) {
                return marshal_failure("out of memory");
            }
        }
        return unmarshal_document(doc.get());
    }

private:
    template<class V>
    Marshalled marshal_value(V& value) const {
        Marshalled out;
        if constexpr (HasBeforeSerialize<T> && !std::is_const_v<V>) {
            if (std::optional<std::string> failed = value.before_serialize()) {
                out.errors.push_back(ValidationError{{}, "BeforeSerialize hook failed: " + *failed, ErrorKind::HookError});
                return out;
            }
        }
        if (discriminator() && !unwrap(make_ref(value))) {
            out.errors.push_back(ValidationError{{}, "discriminated union value is nil", ErrorKind::Internal});
            return out;
        }
        out.errors = validate(value);
        if (!out.errors.empty()) {
            return out;
        }
        json::EncodeResult encoded = json::encode(value);
        if (!encoded) {
            out.errors.push_back(ValidationError{{}, "json marshal failed: " + encoded.error, ErrorKind::JsonEncode});
            return out;
        }
        out.json = std::move(encoded.json);
        if constexpr (HasAfterSerialize<T> && !std::is_const_v<V>) {
            if (!run_after_serialize(value, out)) {
                out.json.clear();
            }
        }
        return out;
    }

    // Lets the target rewrite the encoded document, e.g. to wrap it in an envelope.
    static bool run_after_serialize(T& value, Marshalled& out) {
        std::string error;
        json::MutDocument doc = json::read_mutable(out.json, error);
        if (!doc) {
            out.errors.push_back(ValidationError{{}, "json marshal failed: " + error, ErrorKind::JsonEncode});
            return false;
        }
        if (std::optional<std::string> failed = value.after_serialize(doc.get())) {
            out.errors.push_back(ValidationError{{}, "AfterSerialize hook failed: " + *failed, ErrorKind::HookError});
            return false;
        }
        std::optional<std::string> rewritten = json::write(doc.get(), error);
        if (!rewritten) {
            out.errors.push_back(ValidationError{{}, "failed to marshal modified data: " + error, ErrorKind::JsonEncode});
            return false;
        }
        out.json = std::move(*rewritten);
        return true;
    }

    // A discriminated root that found no alternative has no value to hand out.
    bool root_resolved(const T& value) const {
        return !discriminator() || static_cast<bool>(unwrap(make_ref(value)));
    }

    // With a discriminated root nothing can be decoded until the discriminator has
    // arrived and names a mapped alternative.
    bool root_discriminator_known(const partial::ParseResult& parsed, PartialUnmarshalled<T>& out) const {
        const Discriminator* d = discriminator();
        if (!d) {
            return true;
        }
        const json::PeekResult peek = json::peek_property(parsed.repaired, d->propertyName);
        if (peek.status == json::PeekResult::Status::Malformed) {
            return true;
        }
        bool cut = false;
        for (const Path& p : parsed.incomplete) {
            if (p.size() == 1 && p.front() == d->propertyName) {
                cut = true;
            }
        }
        // a value still being streamed counts once it already names an alternative
        if (peek.status == json::PeekResult::Status::Found && (!cut || d->mapping.contains(peek.value))) {
            return true;
        }
        out.state.incompleteFields.insert(out.state.incompleteFields.begin(),
                                          IncompleteField{{d->propertyName}, d->propertyName, "discriminator_incomplete"});
        out.state.isComplete = false;
        out.errors.push_back(ValidationError{{d->propertyName},
                                             fmt::format("discriminator field '{}' is incomplete or missing", d->propertyName),
                                             ErrorKind::DiscriminatorMissing});
        return false;
    }

    ValidationErrors parse_into(T& value, std::string_view document) const {
        UnmarshalProcessor unmarshal;
        DefaultsProcessor defaults;
        ValidateProcessor validate;
        UnionValidateProcessor unions;
        Walker walker(*m_scanner, unmarshal, defaults, validate, unions);
        walker.set_root_options(m_rootOptions.get());
        if (WalkResult r = walker.walk(value, document); !r) {
            return {r.error()};
        }
        return walker.errors();
    }

    // Lets the target rewrite the parsed document before it is decoded.
    static bool run_before_validate(T& value, std::string& document, ValidationErrors& errors) {
        if constexpr (HasBeforeValidate<T>) {
            std::string error;
            json::MutDocument doc = json::read_mutable(document, error);
            if (!doc) {
                errors.push_back(ValidationError{{}, "failed to parse JSON: " + error, ErrorKind::JsonDecode});
                return false;
            }
            if (std::optional<std::string> failed = value.before_validate(doc.get())) {
                errors.push_back(ValidationError{{}, "BeforeValidate hook failed: " + *failed, ErrorKind::HookError});
                return false;
            }
            std::optional<std::string> rewritten = json::write(doc.get(), error);
            if (!rewritten) {
                errors.push_back(ValidationError{{}, "failed to marshal modified data: " + error, ErrorKind::JsonEncode});
                return false;
            }
            document = std::move(*rewritten);
        } else {
            (void)value;
            (void)document;
            (void)errors;
        }
        return true;
    }

    static void run_after_validate(T& value, ValidationErrors& errors) {
        if constexpr (HasAfterValidate<T>) {
            if (std::optional<std::string> failed = value.after_validate()) {
                errors.push_back(ValidationError{{}, "AfterValidate hook failed: " + *failed, ErrorKind::HookError});
            }
        } else {
            (void)value;
            (void)errors;
        }
    }

    static const FieldShape* field_by_json_name(std::string_view name) {
        const TypeShape& shape = static_unwrap(shape_of<T>());
        for (const FieldShape& f : shape.fields()) {
            if (f.jsonName == name) {
                return &f;
            }
        }
        return nullptr;
    }

    // Text that does not convert stays a string, for the decoder or the validators to reject.
    static yyjson_mut_val* convert(yyjson_mut_doc* doc, const std::string& text, const TypeShape& shape) {
        const char* first = text.data();
        const char* last = text.data() + text.size();
        switch (shape.kind()) {
        case ShapeKind::Integer: {
            std::int64_t i = 0;
            auto [ptr, ec] = std::from_chars(first, last, i);
            if (ec == std::errc() && ptr == last) {
                return yyjson_mut_sint(doc, i);
            }
            break;
        }
        case ShapeKind::Number: {
            double d = 0;
            auto [ptr, ec] = std::from_chars(first, last, d);
            if (ec == std::errc() && ptr == last) {
                return yyjson_mut_real(doc, d);
            }
            break;
        }
        case ShapeKind::Bool:
            if (text == "true" || text == "1") return yyjson_mut_bool(doc, true);
            if (text == "false" || text == "0") return yyjson_mut_bool(doc, false);
            break;
        default:
            break;
        }
        return yyjson_mut_strncpy(doc, text.data(), text.size());
    }

    static bool add_member(yyjson_mut_doc* doc, yyjson_mut_val* object, const std::string& key, yyjson_mut_val* value) {
        yyjson_mut_val* k = yyjson_mut_strncpy(doc, key.data(), key.size());
        return k && value && yyjson_mut_obj_add(object, k, value);
    }

    static Unmarshalled<T> marshal_failure(std::string_view reason) {
        Unmarshalled<T> out;
        out.errors.push_back(ValidationError{{}, fmt::format("failed to marshal data: {}", reason), ErrorKind::MarshalError});
        return out;
    }

    Unmarshalled<T> unmarshal_document(yyjson_mut_doc* doc) const {
        std::string error;
        std::optional<std::string> json = json::write(doc, error);
        if (!json) {
            return marshal_failure(error);
        }
        return unmarshal(*json);
    }

    std::shared_ptr<const FieldScanner> m_scanner;
    std::shared_ptr<const FieldOptions> m_rootOptions;
    partial::Parser m_parser;
};

} // namespace JsonMend
