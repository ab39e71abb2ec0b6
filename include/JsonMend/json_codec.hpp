#pragma once
#include <yyjson.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/core.h>
#include <fmt/format.h>

#include "shape.hpp"
#include "logging.hpp"

namespace JsonMend {

namespace json {

struct DocDeleter {
    void operator()(yyjson_doc* d) const noexcept { yyjson_doc_free(d); }
};
struct MutDocDeleter {
    void operator()(yyjson_mut_doc* d) const noexcept { yyjson_mut_doc_free(d); }
};
struct BufferDeleter {
    void operator()(char* p) const noexcept { std::free(p); }
};

using Document = std::unique_ptr<yyjson_doc, DocDeleter>;
using MutDocument = std::unique_ptr<yyjson_mut_doc, MutDocDeleter>;

inline Document read(std::string_view text, std::string& error) {
    yyjson_read_err err{};
    yyjson_doc* doc = yyjson_read_opts(const_cast<char*>(text.data()), text.size(), 0, nullptr, &err);
    if (!doc) {
        error = fmt::format("{} at offset {}", err.msg ? err.msg : "invalid JSON", err.pos);
    }
    return Document(doc);
}

inline MutDocument read_mutable(std::string_view text, std::string& error) {
    Document doc = read(text, error);
    if (!doc) {
        return nullptr;
    }
    MutDocument copy(yyjson_doc_mut_copy(doc.get(), nullptr));
    if (!copy) {
        error = "out of memory";
    }
    return copy;
}

inline std::optional<std::string> write(yyjson_mut_doc* doc, std::string& error) {
    yyjson_write_err err{};
    std::size_t len = 0;
    std::unique_ptr<char, BufferDeleter> out(yyjson_mut_write_opts(doc, 0, nullptr, &len, &err));
    if (!out) {
        error = err.msg ? err.msg : "write failed";
        return std::nullopt;
    }
    return std::string(out.get(), len);
}

inline std::string write_fragment(yyjson_val* v) {
    std::size_t len = 0;
    std::unique_ptr<char, BufferDeleter> out(yyjson_val_write(v, 0, &len));
    if (!out) {
        return "null";
    }
    return std::string(out.get(), len);
}

inline std::string_view kind_of(yyjson_val* v) {
    if (yyjson_is_null(v)) return "null";
    if (yyjson_is_bool(v)) return "bool";
    if (yyjson_is_int(v)) return "integer";
    if (yyjson_is_real(v)) return "number";
    if (yyjson_is_str(v)) return "string";
    if (yyjson_is_arr(v)) return "array";
    if (yyjson_is_obj(v)) return "object";
    return "N/A";
}

inline bool equal_fold(std::string_view a, std::string_view b) {
    return a.size() == b.size() && std::equal(a.begin(), a.end(), b.begin(), [](char l, char r) {
        return std::tolower(static_cast<unsigned char>(l)) == std::tolower(static_cast<unsigned char>(r));
    });
}

// A property of a JSON object kept as its own compact JSON text.
struct RawField {
    std::string name;
    std::string fragment;
};

struct RawFields {
    std::vector<RawField> entries;

    // Exact JSON name, then exact member name, then either of them case-insensitively.
    const std::string* find(std::string_view jsonName, std::string_view memberName) const {
        for (const RawField& f : entries) {
            if (f.name == jsonName) return &f.fragment;
        }
        for (const RawField& f : entries) {
            if (f.name == memberName) return &f.fragment;
        }
        for (const RawField& f : entries) {
            if (equal_fold(f.name, jsonName) || equal_fold(f.name, memberName)) return &f.fragment;
        }
        return nullptr;
    }
};

inline const std::string* lookup_raw(const RawFields& fields, std::string_view jsonName, std::string_view memberName) {
    return fields.find(jsonName, memberName);
}

// Splits an object document into its properties. A repeated key keeps its last value,
// and a `null` document has no properties.
inline std::optional<RawFields> split_object(std::string_view text, std::string& error) {
    Document doc = read(text, error);
    if (!doc) {
        return std::nullopt;
    }
    yyjson_val* root = yyjson_doc_get_root(doc.get());
    if (yyjson_is_null(root)) {
        return RawFields{};
    }
    if (!yyjson_is_obj(root)) {
        error = fmt::format("expected object, found {}", kind_of(root));
        return std::nullopt;
    }
    RawFields out;
    std::size_t idx, max;
    yyjson_val *key, *val;
    yyjson_obj_foreach(root, idx, max, key, val) {
        std::string name(yyjson_get_str(key), yyjson_get_len(key));
        auto existing = std::find_if(out.entries.begin(), out.entries.end(),
                                     [&](const RawField& f) { return f.name == name; });
        if (existing != out.entries.end()) {
            existing->fragment = write_fragment(val);
        } else {
            out.entries.push_back(RawField{std::move(name), write_fragment(val)});
        }
    }
    return out;
}

// Best effort: anything that is not an object yields no properties.
inline RawFields split_object_lenient(std::string_view text) {
    if (text.empty()) {
        return {};
    }
    std::string error;
    std::optional<RawFields> fields = split_object(text, error);
    if (!fields) {
        JSONMEND_LOG_TRACE("no properties available for descent: {}", error);
        return {};
    }
    return std::move(*fields);
}

inline std::optional<std::vector<std::string>> split_array(std::string_view text, std::string& error) {
    Document doc = read(text, error);
    if (!doc) {
        return std::nullopt;
    }
    yyjson_val* root = yyjson_doc_get_root(doc.get());
    if (!yyjson_is_arr(root)) {
        error = fmt::format("expected array, found {}", kind_of(root));
        return std::nullopt;
    }
    std::vector<std::string> out;
    out.reserve(yyjson_arr_size(root));
    std::size_t idx, max;
    yyjson_val* val;
    yyjson_arr_foreach(root, idx, max, val) {
        out.push_back(write_fragment(val));
    }
    return out;
}

inline std::vector<std::string> split_array_lenient(std::string_view text) {
    if (text.empty()) {
        return {};
    }
    std::string error;
    std::optional<std::vector<std::string>> elements = split_array(text, error);
    if (!elements) {
        JSONMEND_LOG_TRACE("no elements available for descent: {}", error);
        return {};
    }
    return std::move(*elements);
}

// Text form of a scalar as used in discriminator lookups and messages.
inline std::string display(yyjson_val* v) {
    if (yyjson_is_str(v)) {
        return std::string(yyjson_get_str(v), yyjson_get_len(v));
    }
    if (yyjson_is_sint(v)) {
        return fmt::format("{}", yyjson_get_sint(v));
    }
    if (yyjson_is_uint(v)) {
        return fmt::format("{}", yyjson_get_uint(v));
    }
    if (yyjson_is_real(v)) {
        return fmt::format("{}", yyjson_get_real(v));
    }
    if (yyjson_is_bool(v)) {
        return yyjson_get_bool(v) ? "true" : "false";
    }
    if (yyjson_is_null(v)) {
        return "<nil>";
    }
    return write_fragment(v);
}

struct PeekResult {
    enum class Status {
        Found,
        Missing,
        Malformed
    };
    Status status = Status::Missing;
    std::string value;
    std::string error;
};

// Reads one property of an object document without decoding the rest.
inline PeekResult peek_property(std::string_view text, std::string_view name) {
    PeekResult out;
    Document doc = read(text, out.error);
    if (!doc) {
        out.status = PeekResult::Status::Malformed;
        return out;
    }
    yyjson_val* root = yyjson_doc_get_root(doc.get());
    if (yyjson_is_null(root)) {
        out.status = PeekResult::Status::Missing;
        return out;
    }
    if (!yyjson_is_obj(root)) {
        out.status = PeekResult::Status::Malformed;
        out.error = fmt::format("expected object, found {}", kind_of(root));
        return out;
    }
    yyjson_val* prop = yyjson_obj_getn(root, name.data(), name.size());
    if (!prop) {
        out.status = PeekResult::Status::Missing;
        return out;
    }
    out.status = PeekResult::Status::Found;
    out.value = display(prop);
    return out;
}

struct DecodeResult {
    std::string error;

    constexpr operator bool() const {
        return error.empty();
    }
    const std::string& message() const {
        return error;
    }
};

// Members for which this returns true are left for someone else to fill.
using SkipField = std::function<bool(const TypeShape& object, const FieldShape& field)>;

class Decoder {
public:
    explicit Decoder(const SkipField* skip = nullptr) : skip_(skip) {}

    DecodeResult decode(ValueRef target, std::string_view text) {
        DecodeResult result;
        std::string error;
        Document doc = read(text, error);
        if (!doc) {
            result.error = error;
            return result;
        }
        path_ = "$";
        if (!decode_value(target, yyjson_doc_get_root(doc.get()))) {
            result.error = std::move(error_);
        }
        return result;
    }

private:
    bool fail(std::string message) {
        error_ = fmt::format("{}: {}", path_, message);
        return false;
    }

    bool mismatch(yyjson_val* v, const TypeShape& shape) {
        return fail(fmt::format("cannot decode {} into {}", kind_of(v), shape.name()));
    }

    class PathGuard {
    public:
        PathGuard(std::string& path, std::string_view segment) : path_(path), size_(path.size()) {
            path_ += segment;
        }
        ~PathGuard() { path_.resize(size_); }
    private:
        std::string& path_;
        std::size_t size_;
    };

    static bool compatible(const TypeShape& shape, yyjson_val* v) {
        const TypeShape& s = static_unwrap(shape);
        switch (s.kind()) {
        case ShapeKind::Bool: return yyjson_is_bool(v);
        case ShapeKind::Integer: return yyjson_is_int(v);
        case ShapeKind::Number: return yyjson_is_num(v);
        case ShapeKind::String: return yyjson_is_str(v);
        case ShapeKind::Array: return yyjson_is_arr(v);
        case ShapeKind::Map:
        case ShapeKind::Object: return yyjson_is_obj(v);
        case ShapeKind::Variant:
        case ShapeKind::Any: return true;
        default: return false;
        }
    }

    bool decode_value(ValueRef target, yyjson_val* v) {
        const TypeShape& shape = *target.shape;
        if (yyjson_is_null(v)) {
            // null clears what can be empty and leaves everything else as it is
            if (shape.kind() == ShapeKind::Reference || shape.kind() == ShapeKind::Array
                || shape.kind() == ShapeKind::Map || shape.kind() == ShapeKind::Variant
                || shape.kind() == ShapeKind::Any) {
                shape.reset(target.ptr);
            }
            return true;
        }
        switch (shape.kind()) {
        case ShapeKind::Bool:
            if (!yyjson_is_bool(v)) return mismatch(v, shape);
            shape.write_bool(target.ptr, yyjson_get_bool(v));
            return true;
        case ShapeKind::Integer:
            if (yyjson_is_sint(v)) {
                if (!shape.write_int(target.ptr, yyjson_get_sint(v))) {
                    return fail(fmt::format("value {} out of range for {}", yyjson_get_sint(v), shape.name()));
                }
                return true;
            }
            if (yyjson_is_uint(v)) {
                if (!shape.write_uint(target.ptr, yyjson_get_uint(v))) {
                    return fail(fmt::format("value {} out of range for {}", yyjson_get_uint(v), shape.name()));
                }
                return true;
            }
            return mismatch(v, shape);
        case ShapeKind::Number:
            if (!yyjson_is_num(v)) return mismatch(v, shape);
            if (yyjson_is_real(v)) {
                shape.write_real(target.ptr, yyjson_get_real(v));
            } else if (yyjson_is_sint(v)) {
                shape.write_real(target.ptr, static_cast<double>(yyjson_get_sint(v)));
            } else {
                shape.write_real(target.ptr, static_cast<double>(yyjson_get_uint(v)));
            }
            return true;
        case ShapeKind::String:
            if (!yyjson_is_str(v)) return mismatch(v, shape);
            shape.write_string(target.ptr, std::string_view(yyjson_get_str(v), yyjson_get_len(v)));
            return true;
        case ShapeKind::Array:
            return decode_array(target, v);
        case ShapeKind::Map:
            return decode_map(target, v);
        case ShapeKind::Object:
            return decode_object(target, v);
        case ShapeKind::Reference: {
            void* inner = shape.ensure(target.ptr);
            if (!inner) {
                return fail(fmt::format("cannot allocate target of {}", shape.name()));
            }
            return decode_value(ValueRef{inner, shape.target()}, v);
        }
        case ShapeKind::Variant:
            return decode_variant(target, v);
        case ShapeKind::Any:
            return decode_any(target, v);
        case ShapeKind::Leaf:
            return fail(fmt::format("unsupported type {}", shape.name()));
        }
        return fail("N/A");
    }

    bool decode_array(ValueRef target, yyjson_val* v) {
        const TypeShape& shape = *target.shape;
        if (!yyjson_is_arr(v)) return mismatch(v, shape);
        shape.reset(target.ptr);
        const TypeShape* element = shape.element();
        std::size_t idx, max;
        yyjson_val* item;
        yyjson_arr_foreach(v, idx, max, item) {
            PathGuard guard(path_, fmt::format("[{}]", idx));
            void* slot = shape.append(target.ptr);
            if (!slot) {
                return fail(fmt::format("cannot append to {}", shape.name()));
            }
            if (!decode_value(ValueRef{slot, element}, item)) {
                return false;
            }
        }
        return true;
    }

    bool decode_map(ValueRef target, yyjson_val* v) {
        const TypeShape& shape = *target.shape;
        if (!yyjson_is_obj(v)) return mismatch(v, shape);
        shape.reset(target.ptr);
        const TypeShape* element = shape.element();
        std::size_t idx, max;
        yyjson_val *key, *val;
        yyjson_obj_foreach(v, idx, max, key, val) {
            const std::string_view name(yyjson_get_str(key), yyjson_get_len(key));
            PathGuard guard(path_, fmt::format(".{}", name));
            void* slot = shape.map_emplace(target.ptr, name);
            if (!slot) {
                return fail(fmt::format("cannot insert into {}", shape.name()));
            }
            if (!decode_value(ValueRef{slot, element}, val)) {
                return false;
            }
        }
        return true;
    }

    static const FieldShape* match_field(const TypeShape& shape, std::string_view name) {
        const std::vector<FieldShape>& fields = shape.fields();
        for (const FieldShape& f : fields) {
            if (f.jsonName == name) return &f;
        }
        for (const FieldShape& f : fields) {
            if (f.name == name) return &f;
        }
        for (const FieldShape& f : fields) {
            if (equal_fold(f.jsonName, name) || equal_fold(f.name, name)) return &f;
        }
        return nullptr;
    }

    bool decode_object(ValueRef target, yyjson_val* v) {
        const TypeShape& shape = *target.shape;
        if (!yyjson_is_obj(v)) return mismatch(v, shape);
        std::size_t idx, max;
        yyjson_val *key, *val;
        yyjson_obj_foreach(v, idx, max, key, val) {
            const std::string_view name(yyjson_get_str(key), yyjson_get_len(key));
            const FieldShape* field = match_field(shape, name);
            if (!field) {
                continue;
            }
            if (skip_ && *skip_ && (*skip_)(shape, *field)) {
                continue;
            }
            PathGuard guard(path_, fmt::format(".{}", field->jsonName));
            if (!decode_value(ValueRef{field->access(target.ptr), &field->shape()}, val)) {
                return false;
            }
        }
        return true;
    }

    bool decode_variant(ValueRef target, yyjson_val* v) {
        const TypeShape& shape = *target.shape;
        const TypeShape* active = shape.active_shape(target.ptr);
        if (active && compatible(*active, v)) {
            return decode_value(ValueRef{shape.active_value(target.ptr), active}, v);
        }
        for (const TypeShape* alt : shape.alternatives()) {
            if (!compatible(*alt, v)) {
                continue;
            }
            std::shared_ptr<void> fresh = alt->create();
            if (!fresh) {
                continue;
            }
            if (!decode_value(ValueRef{fresh.get(), alt}, v)) {
                return false;
            }
            void* slot = shape.emplace(target.ptr, *alt);
            if (!slot || !alt->move_assign(slot, fresh.get())) {
                return fail(fmt::format("cannot store {} in {}", alt->name(), shape.name()));
            }
            return true;
        }
        return mismatch(v, shape);
    }

    bool decode_any(ValueRef target, yyjson_val* v) {
        const TypeShape& shape = *target.shape;
        const TypeShape* held = shape.active_shape(target.ptr);
        if (held) {
            return decode_value(ValueRef{shape.active_value(target.ptr), held}, v);
        }
        std::any& a = *static_cast<std::any*>(target.ptr);
        if (yyjson_is_bool(v)) {
            a = static_cast<bool>(yyjson_get_bool(v));
        } else if (yyjson_is_sint(v)) {
            a = static_cast<std::int64_t>(yyjson_get_sint(v));
        } else if (yyjson_is_uint(v)) {
            a = static_cast<std::uint64_t>(yyjson_get_uint(v));
        } else if (yyjson_is_real(v)) {
            a = yyjson_get_real(v);
        } else if (yyjson_is_str(v)) {
            a = std::string(yyjson_get_str(v), yyjson_get_len(v));
        } else if (yyjson_is_arr(v)) {
            const TypeShape& list = shape_of<std::vector<std::any>>();
            return decode_value(ValueRef{list.emplace_into_any(a), &list}, v);
        } else if (yyjson_is_obj(v)) {
            const TypeShape& object = shape_of<std::map<std::string, std::any>>();
            return decode_value(ValueRef{object.emplace_into_any(a), &object}, v);
        }
        return true;
    }

    const SkipField* skip_;
    std::string path_;
    std::string error_;
};

inline DecodeResult decode(ValueRef target, std::string_view text, const SkipField* skip = nullptr) {
    Decoder decoder(skip);
    return decoder.decode(target, text);
}

template<class T>
DecodeResult decode(T& target, std::string_view text) {
    return decode(make_ref(target), text);
}

struct EncodeResult {
    std::string json;
    std::string error;

    constexpr operator bool() const {
        return error.empty();
    }
};

class Encoder {
public:
    Encoder() : doc_(yyjson_mut_doc_new(nullptr)) {}

    EncodeResult encode(ValueRef value) {
        EncodeResult result;
        if (!doc_) {
            result.error = "out of memory";
            return result;
        }
        yyjson_mut_val* root = encode_value(value);
        if (!root) {
            result.error = std::move(error_);
            return result;
        }
        yyjson_mut_doc_set_root(doc_.get(), root);
        std::optional<std::string> text = write(doc_.get(), result.error);
        if (text) {
            result.json = std::move(*text);
        }
        return result;
    }

private:
    yyjson_mut_val* fail(std::string message) {
        if (error_.empty()) {
            error_ = std::move(message);
        }
        return nullptr;
    }

    yyjson_mut_val* encode_value(ValueRef value) {
        yyjson_mut_doc* doc = doc_.get();
        if (!value) {
            return yyjson_mut_null(doc);
        }
        const TypeShape& shape = *value.shape;
        switch (shape.kind()) {
        case ShapeKind::Bool:
            return yyjson_mut_bool(doc, shape.read_bool(value.ptr));
        case ShapeKind::Integer:
            if (shape.is_unsigned()) {
                return yyjson_mut_uint(doc, shape.read_uint(value.ptr));
            }
            return yyjson_mut_sint(doc, shape.read_int(value.ptr));
        case ShapeKind::Number: {
            const double d = shape.read_real(value.ptr);
            if (!std::isfinite(d)) {
                return fail(fmt::format("unsupported value: {}", d));
            }
            return yyjson_mut_real(doc, d);
        }
        case ShapeKind::String: {
            const std::string_view s = shape.read_string(value.ptr);
            return yyjson_mut_strncpy(doc, s.data(), s.size());
        }
        case ShapeKind::Array: {
            yyjson_mut_val* arr = yyjson_mut_arr(doc);
            const TypeShape* element = shape.element();
            const std::size_t n = shape.size(value.ptr);
            for (std::size_t i = 0; i < n; i ++) {
                const void* item = shape.element_at(static_cast<const void*>(value.ptr), i);
                yyjson_mut_val* v = encode_value(ValueRef{const_cast<void*>(item), element});
                if (!v || !yyjson_mut_arr_append(arr, v)) {
                    return fail(fmt::format("cannot encode element {} of {}", i, shape.name()));
                }
            }
            return arr;
        }
        case ShapeKind::Map: {
            std::vector<std::pair<std::string_view, const void*>> entries;
            shape.visit_entries(value.ptr, [&](std::string_view k, const void* v) {
                entries.emplace_back(k, v);
                return true;
            });
            std::sort(entries.begin(), entries.end());
            yyjson_mut_val* obj = yyjson_mut_obj(doc);
            for (const auto& [k, v] : entries) {
                yyjson_mut_val* item = encode_value(ValueRef{const_cast<void*>(v), shape.element()});
                if (!item || !yyjson_mut_obj_add(obj, yyjson_mut_strncpy(doc, k.data(), k.size()), item)) {
                    return fail(fmt::format("cannot encode key '{}' of {}", k, shape.name()));
                }
            }
            return obj;
        }
        case ShapeKind::Object: {
            yyjson_mut_val* obj = yyjson_mut_obj(doc);
            for (const FieldShape& f : shape.fields()) {
                yyjson_mut_val* item = encode_value(ValueRef{f.access(value.ptr), &f.shape()});
                if (!item || !yyjson_mut_obj_add(obj, yyjson_mut_strncpy(doc, f.jsonName.data(), f.jsonName.size()), item)) {
                    return fail(fmt::format("cannot encode member '{}' of {}", f.name, shape.name()));
                }
            }
            return obj;
        }
        case ShapeKind::Reference:
        case ShapeKind::Variant:
        case ShapeKind::Any: {
            if (shape.kind() == ShapeKind::Any && static_cast<const std::any*>(value.ptr)->has_value()
                && !shape.active_shape(value.ptr)) {
                return fail(fmt::format("unsupported type {}", static_cast<const std::any*>(value.ptr)->type().name()));
            }
            if (shape.kind() != ShapeKind::Reference) {
                return encode_value(step(value));
            }
            const ValueRef target = step(value);
            if (!target) {
                return yyjson_mut_null(doc);
            }
            // only the referents on the current path count, shared ones are fine
            const std::pair<const void*, const TypeShape*> id{target.ptr, target.shape};
            if (!onPath_.insert(id).second) {
                return fail(fmt::format("encountered a cycle via {}", shape.name()));
            }
            yyjson_mut_val* encoded = encode_value(target);
            onPath_.erase(id);
            return encoded;
        }
        case ShapeKind::Leaf:
            return fail(fmt::format("unsupported type {}", shape.name()));
        }
        return fail("N/A");
    }

    MutDocument doc_;
    std::string error_;
    std::set<std::pair<const void*, const TypeShape*>> onPath_;
};

inline EncodeResult encode(ValueRef value) {
    Encoder encoder;
    return encoder.encode(value);
}

template<class T>
EncodeResult encode(const T& value) {
    return encode(make_ref(value));
}

} // namespace json

} // namespace JsonMend
