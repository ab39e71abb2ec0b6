#include "../test_helpers.hpp"
#include "../test_model.hpp"
#include <JsonMend/validator.hpp>

#include <cassert>
#include <cmath>
#include <limits>
#include <map>
#include <memory>
#include <typeindex>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

using namespace JsonMend;
using namespace jsonmend_test_models;
using namespace TestHelpers;

// ============================================================================
// Unmarshal
// ============================================================================

bool test_unmarshal_valid_document() {
    Validator<User> validator;
    Unmarshalled<User> r = validator.unmarshal(R"({"name": "Ann", "age": 30, "email": "ann@example.com"})");
    if (!r) return false;
    // defaults are applied before validation
    return r.value->name == "Ann" && r.value->age == 30 && r.value->role == "member";
}

bool test_unmarshal_keeps_value_on_validation_errors() {
    Validator<User> validator;
    Unmarshalled<User> r = validator.unmarshal(R"({"name": "A", "age": 200, "address": {"city": "Oslo"}})");
    if (r) return false;
    if (!r.value || r.value->age != 200) return false;
    return r.errors.size() == 4
        && HasErrorMessage(r.errors, "name", "length must be >= 2")
        && HasErrorMessage(r.errors, "age", "value must be <= 150")
        && HasError(r.errors, "email", ErrorKind::Required)
        && HasError(r.errors, "address.street", ErrorKind::Required);
}

bool test_unmarshal_empty_input() {
    Validator<User> validator;
    for (const char* input : {"", "  \n\t "}) {
        Unmarshalled<User> r = validator.unmarshal(input);
        if (r.value || r.errors.size() != 1) return false;
        if (r.errors[0].kind != ErrorKind::JsonDecode || r.errors[0].message != "json unmarshal failed: empty input") return false;
    }
    return true;
}

bool test_unmarshal_malformed_document() {
    Validator<User> validator;
    Unmarshalled<User> r = validator.unmarshal(R"({"name": "Ann",)");
    return !r.value && r.errors.size() == 1 && r.errors[0].kind == ErrorKind::JsonDecode
        && r.errors[0].message.rfind("json unmarshal failed: ", 0) == 0;
}

bool test_unmarshal_null_document() {
    Validator<Address> validator;
    Unmarshalled<Address> r = validator.unmarshal("null");
    return r.value && r.errors.size() == 2
        && HasError(r.errors, "street", ErrorKind::Required)
        && HasError(r.errors, "city", ErrorKind::Required);
}

bool test_unmarshal_field_decode_error_drops_value() {
    Validator<User> validator;
    Unmarshalled<User> r = validator.unmarshal(R"({"name": "Ann", "age": "old", "email": "a@b"})");
    return !r.value && HasError(r.errors, "age", ErrorKind::JsonDecode);
}

bool test_unmarshal_unions() {
    Validator<Owner> validator;
    Unmarshalled<Owner> r = validator.unmarshal(R"({"name": "Ann", "pets": [
        {"type": "dog", "name": "Rex", "barkVolume": 11},
        {"type": "cat"}
    ]})");
    if (r) return false;
    // nested validation runs on the resolved alternatives
    return r.value && r.value->pets.size() == 2
        && r.errors.size() == 2
        && HasErrorMessage(r.errors, "pets[0].barkVolume", "value must be <= 10")
        && HasError(r.errors, "pets[1].name", ErrorKind::Required);
}

bool test_unmarshal_union_errors_keep_value() {
    Validator<Owner> validator;
    Unmarshalled<Owner> r = validator.unmarshal(R"({"name": "Ann", "pet": {"name": "Rex"}})");
    return r.value && HasError(r.errors, "pet.type", ErrorKind::DiscriminatorMissing);
}

// ============================================================================
// Validate and defaults on values built in code
// ============================================================================

bool test_validate_in_code() {
    Validator<Owner> validator;
    Owner owner;
    owner.name = "Ann";
    owner.pet = Dog{"wolf", "Rex"};
    const ValidationErrors errors = validator.validate(owner);
    return errors.size() == 1 && HasErrorMessage(errors, "pet", "invalid discriminator value 'wolf'");
}

bool test_apply_defaults_in_code() {
    Validator<ServerConfig> validator;
    ServerConfig config;
    config.port = 9000;
    if (!validator.apply_defaults(config).empty()) return false;
    return config.host == "localhost" && config.port == 9000 && config.workers == 4;
}

bool test_custom_scanner() {
    auto scanner = std::make_shared<AdapterScanner>([](const TypeShape& shape) -> FieldOptionsMap {
        if (shape.type() == std::type_index(typeid(Address))) {
            return {{"city", constraints::field<std::string>(constraints::one_of{"Oslo", "Rome"})}};
        }
        return {};
    });
    Validator<Address> validator(scanner);
    // declared options are replaced, not merged
    Unmarshalled<Address> ok = validator.unmarshal(R"({"city": "Rome"})");
    Unmarshalled<Address> bad = validator.unmarshal(R"({"city": "Paris"})");
    return ok && !bad && bad.errors.size() == 1 && HasErrorMessage(bad.errors, "city", "value must be one of [Oslo Rome]");
}

// ============================================================================
// Marshal
// ============================================================================

bool test_marshal_valid_value() {
    Validator<User> validator;
    User user{"Ann", 30, "ann@example.com"};
    user.role = "admin";
    user.session = std::string("secret");
    Marshalled m = validator.marshal(user);
    if (!m) return false;
    return m.json == R"({"name":"Ann","age":30,"email":"ann@example.com","address":null,"tags":[],"role":"admin"})";
}

bool test_marshal_uses_json_names() {
    Validator<Address> validator;
    Marshalled m = validator.marshal(Address{"Main", "Oslo", std::string("01500")});
    return m && m.json == R"({"street":"Main","city":"Oslo","zip_code":"01500"})";
}

bool test_marshal_refuses_invalid_value() {
    Validator<User> validator;
    Marshalled m = validator.marshal(User{});
    return !m && m.json.empty() && m.errors.size() == 2 && HasError(m.errors, "name", ErrorKind::Required);
}

bool test_marshal_encode_failure() {
    Validator<SearchQuery> validator;
    SearchQuery query;
    query.q = "shoes";
    query.minScore = std::numeric_limits<double>::quiet_NaN();
    Marshalled m = validator.marshal(query);
    return !m && m.errors.size() == 1 && m.errors[0].kind == ErrorKind::JsonEncode
        && m.errors[0].message.rfind("json marshal failed: ", 0) == 0;
}

bool test_marshal_self_reference() {
    Validator<Node> validator;
    Node self{"self"};
    self.next = &self;
    Marshalled m = validator.marshal(self);
    if (m || m.errors.size() != 1 || m.errors[0].kind != ErrorKind::JsonEncode) return false;
    return m.errors[0].message.rfind("json marshal failed: encountered a cycle via ", 0) == 0;
}

bool test_marshal_linked_nodes() {
    Validator<Node> validator;
    Node tail{"tail"};
    Node head{"head", &tail};
    Marshalled m = validator.marshal(head);
    return m && m.json == R"({"name":"head","next":{"name":"tail","next":null}})";
}

// ============================================================================
// Hooks
// ============================================================================

bool test_before_validate_rewrites_document() {
    Validator<Signup> validator;
    Unmarshalled<Signup> r = validator.unmarshal(R"({"username": "ALICE", "password": "correct horse"})");
    return r && r.value->username == "alice";
}

bool test_before_validate_failure() {
    Validator<Signup> validator;
    Unmarshalled<Signup> r = validator.unmarshal(R"({"username": 5, "password": "correct horse"})");
    return !r.value && r.errors.size() == 1 && r.errors[0].kind == ErrorKind::HookError
        && r.errors[0].message == "BeforeValidate hook failed: username must be a string";
}

bool test_hooked_type_malformed_document() {
    Validator<Signup> validator;
    Unmarshalled<Signup> r = validator.unmarshal(R"({"username": )");
    return !r.value && r.errors.size() == 1 && r.errors[0].kind == ErrorKind::JsonDecode
        && r.errors[0].message.rfind("failed to parse JSON: ", 0) == 0;
}

bool test_after_validate_failure() {
    Validator<Signup> validator;
    Unmarshalled<Signup> r = validator.unmarshal(R"({"username": "Bobby1234", "password": "bobby1234"})");
    return r.value && r.errors.size() == 1 && r.errors[0].kind == ErrorKind::HookError
        && r.errors[0].message == "AfterValidate hook failed: password must differ from username";
}

bool test_after_validate_skipped_on_errors() {
    Validator<Signup> validator;
    Unmarshalled<Signup> r = validator.unmarshal(R"({"username": "al", "password": "al"})");
    return r.errors.size() == 2 && !HasErrorKind(r.errors, ErrorKind::HookError);
}

// ============================================================================
// Serialize hooks
// ============================================================================

bool test_before_serialize_prepares_copy() {
    Validator<Report> validator;
    const Report report{"q3"};
    Marshalled m = validator.marshal(report);
    if (!m) return false;
    // the hook ran on a copy
    return report.name == "q3" && m.json == R"({"data":{"name":"draft_q3","locked":false},"version":"1.0"})";
}

bool test_before_serialize_failure() {
    Validator<Report> validator;
    Marshalled m = validator.marshal(Report{"q3", true});
    return !m && m.json.empty() && m.errors.size() == 1
        && m.errors[0].kind == ErrorKind::HookError
        && m.errors[0].message == "BeforeSerialize hook failed: report is locked";
}

bool test_before_serialize_runs_before_validation() {
    Validator<Report> validator;
    Marshalled m = validator.marshal(Report{});
    // the prefix keeps the name non-empty, so validation passes
    if (!m) return false;
    return m.json == R"({"data":{"name":"draft_","locked":false},"version":"1.0"})";
}

// ============================================================================
// Discriminated root
// ============================================================================

Validator<Pet> pet_validator() {
    Validator<Pet> validator;
    validator.with_discriminator("type", {{"cat", union_entry<Cat>()}, {"dog", union_entry<Dog>()}});
    return validator;
}

bool test_root_union_picks_alternative() {
    Unmarshalled<Pet> r = pet_validator().unmarshal(R"({"type": "dog", "name": "Rex", "barkVolume": 3})");
    if (!r) return false;
    const Dog* dog = std::get_if<Dog>(&*r.value);
    return dog && dog->name == "Rex" && dog->barkVolume == 3;
}

bool test_root_union_validates_alternative() {
    Unmarshalled<Pet> r = pet_validator().unmarshal(R"({"type": "dog", "barkVolume": 11})");
    if (r || !r.value || !std::holds_alternative<Dog>(*r.value)) return false;
    return r.errors.size() == 2
        && HasError(r.errors, "name", ErrorKind::Required)
        && HasErrorMessage(r.errors, "barkVolume", "value must be <= 10");
}

bool test_root_union_missing_discriminator() {
    Unmarshalled<Pet> r = pet_validator().unmarshal(R"({"name": "Rex"})");
    if (r.value || r.errors.size() != 1) return false;
    return HasError(r.errors, "type", ErrorKind::DiscriminatorMissing)
        && HasErrorMessage(r.errors, "type", "discriminator field 'type' not found");
}

bool test_root_union_unknown_discriminator() {
    Unmarshalled<Pet> r = pet_validator().unmarshal(R"({"type": "bird", "name": "Tweety"})");
    if (r.value || r.errors.size() != 1) return false;
    return HasError(r.errors, "type", ErrorKind::DiscriminatorInvalid)
        && HasErrorMessage(r.errors, "type", "invalid discriminator value 'bird', expected one of: [cat dog]");
}

bool test_root_union_alternative_decode_error() {
    Unmarshalled<Pet> r = pet_validator().unmarshal(R"({"type": "dog", "name": "Rex", "barkVolume": "loud"})");
    return !r.value && HasErrorKind(r.errors, ErrorKind::JsonDecode);
}

bool test_root_union_non_object_document() {
    Unmarshalled<Pet> r = pet_validator().unmarshal("[1, 2]");
    return !r.value && r.errors.size() == 1 && r.errors[0].kind == ErrorKind::JsonDecode;
}

struct EventName {
    std::string text;
    operator std::string_view() const { return text; }
    bool operator<(const EventName& other) const { return text < other.text; }
};

bool test_root_union_typed_keys() {
    const std::map<EventName, UnionEntry> mapping{
        {EventName{"cat"}, union_entry<Cat>()},
        {EventName{"dog"}, union_entry<Dog>()},
    };
    Validator<Pet> validator;
    validator.with_discriminator("type", mapping);
    Unmarshalled<Pet> r = validator.unmarshal(R"({"type": "cat", "name": "Tom", "indoor": true})");
    if (!r) return false;
    const Cat* cat = std::get_if<Cat>(&*r.value);
    return cat && cat->name == "Tom" && cat->indoor;
}

bool test_root_union_validate_in_code() {
    Validator<Pet> validator = pet_validator();
    if (!validator.validate(Pet{Dog{"dog", "Rex", 2}}).empty()) return false;
    ValidationErrors mismatched = validator.validate(Pet{Dog{"cat", "Rex", 2}});
    ValidationErrors unknown = validator.validate(Pet{Dog{"wolf", "Rex", 2}});
    return mismatched.size() == 1 && HasErrorKind(mismatched, ErrorKind::TypeMismatch)
        && unknown.size() == 1 && HasError(unknown, "type", ErrorKind::DiscriminatorInvalid);
}

bool test_root_union_marshal() {
    Validator<Pet> validator = pet_validator();
    Marshalled m = validator.marshal(Pet{Dog{"dog", "Rex", 2}});
    if (!m || m.json != R"({"type":"dog","name":"Rex","barkVolume":2})") return false;
    Marshalled empty = validator.marshal(Pet{});
    return !empty && empty.errors.size() == 1 && empty.errors[0].kind == ErrorKind::Internal
        && empty.errors[0].message == "discriminated union value is nil";
}

// ============================================================================
// Flat string data
// ============================================================================

bool test_string_map_conversions() {
    Validator<SearchQuery> validator;
    Unmarshalled<SearchQuery> r = validator.validate_from_string_map({
        {"q", "shoes"}, {"limit", "20"}, {"min_score", "0.5"}, {"exact", "1"}, {"unknown", "x"},
    });
    if (!r) return false;
    return r.value->q == "shoes" && r.value->limit == 20 && r.value->minScore.value == 0.5 && r.value->exact;
}

bool test_string_map_defaults_and_constraints() {
    Validator<SearchQuery> validator;
    Unmarshalled<SearchQuery> r = validator.validate_from_string_map({{"q", "shoes"}, {"min_score", "2"}, {"exact", "false"}});
    if (r) return false;
    return r.value && r.value->limit == 10 && !r.value->exact
        && r.errors.size() == 1 && HasErrorMessage(r.errors, "minScore", "value must be <= 1");
}

bool test_string_map_unconvertible_text() {
    Validator<SearchQuery> validator;
    Unmarshalled<SearchQuery> r = validator.validate_from_string_map({{"q", "shoes"}, {"limit", "many"}});
    return !r.value && HasErrorMessage(r.errors, "limit", "cannot decode string into int");
}

bool test_multi_value_map() {
    Validator<SearchQuery> validator;
    Unmarshalled<SearchQuery> r = validator.validate_from_multi_value_map({
        {"q", {"first", "second"}},
        {"ids", {"1", "2", "3"}},
        {"labels", {"red", "blue"}},
        {"exact", {"true"}},
    });
    if (!r) return false;
    return r.value->q == "first"
        && r.value->ids == std::vector<int>{1, 2, 3}
        && r.value->labels == std::vector<std::string>{"red", "blue"}
        && r.value->exact;
}

bool test_multi_value_map_skips_empty_entries() {
    Validator<SearchQuery> validator;
    Unmarshalled<SearchQuery> r = validator.validate_from_multi_value_map({{"q", {}}});
    return r.value && r.errors.size() == 1 && HasError(r.errors, "q", ErrorKind::Required);
}

int main() {
    assert(test_unmarshal_valid_document());
    assert(test_unmarshal_keeps_value_on_validation_errors());
    assert(test_unmarshal_empty_input());
    assert(test_unmarshal_malformed_document());
    assert(test_unmarshal_null_document() && "a null document reads as an empty object");
    assert(test_unmarshal_field_decode_error_drops_value());
    assert(test_unmarshal_unions());
    assert(test_unmarshal_union_errors_keep_value());

    assert(test_validate_in_code());
    assert(test_apply_defaults_in_code());
    assert(test_custom_scanner());

    assert(test_marshal_valid_value());
    assert(test_marshal_uses_json_names());
    assert(test_marshal_refuses_invalid_value());
    assert(test_marshal_encode_failure());
    assert(test_marshal_self_reference() && "a self-referential value is refused, not recursed into");
    assert(test_marshal_linked_nodes());

    assert(test_before_validate_rewrites_document());
    assert(test_before_validate_failure());
    assert(test_hooked_type_malformed_document());
    assert(test_after_validate_failure());
    assert(test_after_validate_skipped_on_errors());

    assert(test_before_serialize_prepares_copy() && "marshal leaves the caller's value untouched");
    assert(test_before_serialize_failure());
    assert(test_before_serialize_runs_before_validation());

    assert(test_root_union_picks_alternative());
    assert(test_root_union_validates_alternative());
    assert(test_root_union_missing_discriminator());
    assert(test_root_union_unknown_discriminator());
    assert(test_root_union_alternative_decode_error());
    assert(test_root_union_non_object_document());
    assert(test_root_union_typed_keys());
    assert(test_root_union_validate_in_code());
    assert(test_root_union_marshal());

    assert(test_string_map_conversions());
    assert(test_string_map_defaults_and_constraints());
    assert(test_string_map_unconvertible_text());
    assert(test_multi_value_map());
    assert(test_multi_value_map_skips_empty_entries());
    return 0;
}
