#include "../test_helpers.hpp"
#include "../test_model.hpp"
#include <JsonMend/constraints.hpp>
#include <JsonMend/union_processor.hpp>
#include <JsonMend/unmarshal_processor.hpp>
#include <JsonMend/walker.hpp>

#include <any>
#include <cassert>
#include <memory>
#include <string>
#include <typeindex>
#include <variant>
#include <vector>

using namespace JsonMend;
using namespace jsonmend_test_models;
using namespace TestHelpers;

static const DeclaredScanner kScanner;

template<class T>
ValidationErrors Unmarshal(T& value, std::string_view json) {
    UnmarshalProcessor unmarshal;
    Walker walker(kScanner, unmarshal);
    if (!walker.walk(value, json)) return {{{}, "walk aborted", ErrorKind::Internal}};
    return walker.errors();
}

template<class T>
ValidationErrors CheckUnions(const T& value, const FieldScanner& scanner = kScanner) {
    UnionValidateProcessor unions;
    Walker walker(scanner, unions);
    if (!walker.walk_readonly(value)) return {{{}, "walk aborted", ErrorKind::Internal}};
    return walker.errors();
}

// ============================================================================
// Decoding a single union
// ============================================================================

bool test_single_union_resolves_mapped_type() {
    Owner owner;
    const ValidationErrors errors = Unmarshal(owner, R"({"name": "Ann", "pet": {"type": "dog", "name": "Rex", "barkVolume": 3}})");
    if (!errors.empty()) return false;
    const Dog* dog = std::get_if<Dog>(&owner.pet);
    return dog && dog->type == "dog" && dog->name == "Rex" && dog->barkVolume == 3;
}

bool test_single_union_replaces_previous_alternative() {
    Owner owner;
    owner.pet = Dog{"dog", "Rex", 9};
    const ValidationErrors errors = Unmarshal(owner, R"({"pet": {"type": "cat", "name": "Tom", "indoor": true}})");
    if (!errors.empty()) return false;
    const Cat* cat = std::get_if<Cat>(&owner.pet);
    return cat && cat->name == "Tom" && cat->indoor;
}

bool test_missing_discriminator() {
    Owner owner;
    const ValidationErrors errors = Unmarshal(owner, R"({"pet": {"name": "Rex"}})");
    return errors.size() == 1
        && HasError(errors, "pet.type", ErrorKind::DiscriminatorMissing)
        && errors[0].message == "discriminator field 'type' not found"
        && std::holds_alternative<std::monostate>(owner.pet);
}

bool test_unknown_discriminator_lists_sorted_keys() {
    Owner owner;
    const ValidationErrors errors = Unmarshal(owner, R"({"pet": {"type": "bird"}})");
    return errors.size() == 1
        && HasError(errors, "pet.type", ErrorKind::DiscriminatorInvalid)
        && errors[0].message == "invalid discriminator value 'bird', expected one of: [cat dog]";
}

bool test_non_string_discriminator_compared_as_text() {
    Owner owner;
    const ValidationErrors errors = Unmarshal(owner, R"({"pet": {"type": 7}})");
    return errors.size() == 1 && HasErrorMessage(errors, "pet.type", "invalid discriminator value '7'");
}

bool test_union_fragment_must_be_an_object() {
    Owner owner;
    const ValidationErrors errors = Unmarshal(owner, R"({"pet": [1]})");
    return errors.size() == 1
        && HasError(errors, "pet", ErrorKind::JsonDecode)
        && errors[0].message == "failed to parse discriminated union field: expected object, found array";
}

bool test_union_payload_decode_error() {
    Owner owner;
    const ValidationErrors errors = Unmarshal(owner, R"({"pet": {"type": "dog", "barkVolume": "loud"}})");
    return errors.size() == 1
        && HasErrorMessage(errors, "pet", "failed to unmarshal discriminated union: $.barkVolume: cannot decode string into int");
}

bool test_null_union_reports_missing_discriminator() {
    Owner owner;
    const ValidationErrors errors = Unmarshal(owner, R"({"pet": null})");
    return errors.size() == 1 && HasError(errors, "pet.type", ErrorKind::DiscriminatorMissing);
}

// ============================================================================
// Decoding sequences of unions
// ============================================================================

bool test_sequence_keeps_good_elements() {
    Owner owner;
    const ValidationErrors errors = Unmarshal(owner, R"({"pets": [
        {"type": "cat", "name": "Tom"},
        {"type": "bird"},
        {"name": "Nameless"},
        {"type": "dog", "name": "Rex", "barkVolume": 4}
    ]})");
    if (errors.size() != 2) return false;
    if (!HasError(errors, "pets[1].type", ErrorKind::DiscriminatorInvalid)) return false;
    if (!HasError(errors, "pets[2].type", ErrorKind::DiscriminatorMissing)) return false;
    if (owner.pets.size() != 2) return false;
    const Cat* tom = std::get_if<Cat>(&owner.pets[0]);
    const Dog* rex = std::get_if<Dog>(&owner.pets[1]);
    // the failed elements' fragments must not leak into the survivors
    return tom && tom->name == "Tom" && rex && rex->name == "Rex" && rex->type == "dog" && rex->barkVolume == 4;
}

bool test_sequence_element_must_be_an_object() {
    Owner owner;
    const ValidationErrors errors = Unmarshal(owner, R"({"pets": [{"type": "cat", "name": "Tom"}, "dog"]})");
    return errors.size() == 1
        && HasErrorMessage(errors, "pets[1]", "failed to parse element: expected object, found string")
        && owner.pets.size() == 1;
}

bool test_sequence_must_be_an_array() {
    Owner owner;
    const ValidationErrors errors = Unmarshal(owner, R"({"pets": {"type": "cat"}})");
    return errors.size() == 1 && HasErrorMessage(errors, "pets", "failed to parse array: expected array, found object");
}

bool test_null_sequence_is_cleared() {
    Owner owner;
    owner.pets.push_back(Cat{"cat", "Tom"});
    const ValidationErrors errors = Unmarshal(owner, R"({"pets": null})");
    return errors.empty() && owner.pets.empty();
}

// ============================================================================
// Type-erased and pointer targets
// ============================================================================

bool test_any_target() {
    Kennel kennel;
    const ValidationErrors errors = Unmarshal(kennel, R"({"resident": {"type": "cat", "name": "Tom", "indoor": true}})");
    if (!errors.empty()) return false;
    const Cat* cat = std::any_cast<Cat>(&kennel.resident);
    return cat && cat->name == "Tom" && cat->indoor;
}

bool test_pointer_elements() {
    Kennel kennel;
    const ValidationErrors errors = Unmarshal(kennel, R"({"dogs": [{"type": "dog", "name": "Rex"}, {"type": "cat"}, {"type": "dog", "name": "Fido"}]})");
    if (errors.size() != 1 || !HasErrorMessage(errors, "dogs[1].type", "expected one of: [dog]")) return false;
    return kennel.dogs.size() == 2
        && kennel.dogs[0] && kennel.dogs[0]->name == "Rex"
        && kennel.dogs[1] && kennel.dogs[1]->name == "Fido";
}

// ============================================================================
// Checking values built in code
// ============================================================================

bool test_valid_values_pass() {
    Owner owner;
    owner.pet = Dog{"dog", "Rex"};
    owner.pets = {Cat{"cat", "Tom"}, Dog{"dog", "Fido"}};
    return CheckUnions(owner).empty();
}

bool test_unset_union_is_skipped() {
    return CheckUnions(Owner{}).empty();
}

bool test_unmapped_value() {
    Owner owner;
    owner.pet = Dog{"wolf", "Rex"};
    const ValidationErrors errors = CheckUnions(owner);
    return errors.size() == 1
        && HasError(errors, "pet", ErrorKind::Constraint)
        && errors[0].message == "invalid discriminator value 'wolf', expected one of: [cat dog]";
}

bool test_sequence_check_stops_at_first_bad_element() {
    Owner owner;
    owner.pets = {Cat{"cat", "Tom"}, Dog{"fish", "A"}, Dog{"bird", "B"}};
    const ValidationErrors errors = CheckUnions(owner);
    return errors.size() == 1 && HasErrorMessage(errors, "pets[1]", "invalid discriminator value 'fish'");
}

bool test_nil_element() {
    Kennel kennel;
    kennel.dogs.push_back(nullptr);
    const ValidationErrors errors = CheckUnions(kennel);
    return errors.size() == 1 && HasErrorMessage(errors, "dogs[0]", "discriminated union value cannot be nil");
}

bool test_non_struct_value() {
    Kennel kennel;
    kennel.resident = 5;
    const ValidationErrors errors = CheckUnions(kennel);
    return errors.size() == 1 && HasErrorMessage(errors, "resident", "discriminated union requires a struct type");
}

bool test_property_lookup() {
    auto scannerFor = [](std::string property) {
        return AdapterScanner([property](const TypeShape& shape) -> FieldOptionsMap {
            if (shape.type() == std::type_index(typeid(Owner))) {
                return {{"pet", constraints::field<Pet>(constraints::discriminator(
                                    property, {{"dog", union_entry<Dog>()}}))}};
            }
            return {};
        });
    };
    Owner owner;
    owner.pet = Dog{"dog", "Rex"};
    // property names match case-insensitively
    if (!CheckUnions(owner, scannerFor("TYPE")).empty()) return false;
    const ValidationErrors errors = CheckUnions(owner, scannerFor("kind"));
    return errors.size() == 1 && HasErrorMessage(errors, "pet", "discriminator field 'kind' not found");
}

int main() {
    assert(test_single_union_resolves_mapped_type());
    assert(test_single_union_replaces_previous_alternative());
    assert(test_missing_discriminator());
    assert(test_unknown_discriminator_lists_sorted_keys());
    assert(test_non_string_discriminator_compared_as_text());
    assert(test_union_fragment_must_be_an_object());
    assert(test_union_payload_decode_error());
    assert(test_null_union_reports_missing_discriminator());

    assert(test_sequence_keeps_good_elements() && "one bad element does not drop the others");
    assert(test_sequence_element_must_be_an_object());
    assert(test_sequence_must_be_an_array());
    assert(test_null_sequence_is_cleared());

    assert(test_any_target());
    assert(test_pointer_elements());

    assert(test_valid_values_pass());
    assert(test_unset_union_is_skipped());
    assert(test_unmapped_value());
    assert(test_sequence_check_stops_at_first_bad_element());
    assert(test_nil_element());
    assert(test_non_struct_value());
    assert(test_property_lookup());
    return 0;
}
