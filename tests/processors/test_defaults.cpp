#include "../test_helpers.hpp"
#include "../test_model.hpp"
#include <JsonMend/constraints.hpp>
#include <JsonMend/defaults_processor.hpp>
#include <JsonMend/walker.hpp>

#include <cassert>
#include <string>
#include <typeindex>
#include <vector>

using namespace JsonMend;
using namespace jsonmend_test_models;
using namespace TestHelpers;

static const DeclaredScanner kScanner;

template<class T>
bool ApplyDefaults(T& value, const FieldScanner& scanner = kScanner) {
    DefaultsProcessor defaults;
    Walker walker(scanner, defaults);
    return walker.walk(value) && walker.errors().empty();
}

// ============================================================================
// Zero fields take their defaults
// ============================================================================

bool test_all_defaults_applied() {
    ServerConfig config;
    if (!ApplyDefaults(config)) return false;
    return config.host == "localhost"
        && config.port == 8080
        && config.workers == 4
        && config.origins == std::vector<std::string>{"*"}
        && config.verbose
        && config.motd.empty();
}

bool test_set_fields_are_kept() {
    ServerConfig config;
    config.host = "example.org";
    config.port = 9000;
    config.workers = 16;
    config.origins = {"https://a.example"};
    if (!ApplyDefaults(config)) return false;
    return config.host == "example.org"
        && config.port == 9000
        && config.workers == 16
        && config.origins == std::vector<std::string>{"https://a.example"};
}

// An explicit false is indistinguishable from an absent bool.
bool test_false_bool_takes_default() {
    ServerConfig config;
    config.verbose = false;
    if (!ApplyDefaults(config)) return false;
    return config.verbose;
}

bool test_optional_holding_zero_is_not_zero() {
    ServerConfig config;
    config.workers = 0;
    if (!ApplyDefaults(config)) return false;
    return config.workers.has_value() && *config.workers == 0;
}

// ============================================================================
// Nested values
// ============================================================================

bool test_defaults_in_sequence_elements() {
    Team team;
    team.members.push_back(User{"Ann"});
    team.members.push_back(User{"Bob"});
    team.members[1].role = "admin";
    if (!ApplyDefaults(team)) return false;
    return team.members[0].role == "member" && team.members[1].role == "admin";
}

bool test_defaults_behind_pointer() {
    Team team;
    team.lead = std::make_shared<User>();
    if (!ApplyDefaults(team)) return false;
    return team.lead->role == "member";
}

// ============================================================================
// Defaults that cannot be applied
// ============================================================================

bool test_unassignable_default_is_ignored() {
    AdapterScanner scanner([](const TypeShape& shape) -> FieldOptionsMap {
        if (shape.type() == std::type_index(typeid(ServerConfig))) {
            auto opts = std::make_shared<FieldOptions>();
            opts->defaultValue = std::string("eighty");
            return {{"port", opts}};
        }
        return {};
    });
    ServerConfig config;
    if (!ApplyDefaults(config, scanner)) return false;
    return config.port == 0;
}

bool test_readonly_walk_changes_nothing() {
    const ServerConfig config{};
    DefaultsProcessor defaults;
    Walker walker(kScanner, defaults);
    if (!walker.walk_readonly(config)) return false;
    return config.host.empty() && config.port == 0 && !config.workers && !config.verbose;
}

int main() {
    assert(test_all_defaults_applied());
    assert(test_set_fields_are_kept());
    assert(test_false_bool_takes_default());
    assert(test_optional_holding_zero_is_not_zero());

    assert(test_defaults_in_sequence_elements());
    assert(test_defaults_behind_pointer());

    assert(test_unassignable_default_is_ignored() && "a default of the wrong type leaves the field alone");
    assert(test_readonly_walk_changes_nothing());
    return 0;
}
