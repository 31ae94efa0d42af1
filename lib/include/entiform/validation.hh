//
// Validation Engine
//
// Structurally parallel to the conversion compiler: a validator is compiled
// once per schema and yields a list of field errors instead of a converted
// value. Every field is checked; per field the chain is
//
//   required-ness → type shape (ValidatorRegistry) → custom rules
//
// and the first failing link stops that field only.
//
// USAGE EXAMPLE:
//   SchemaBuilder("User")
//       .field("name", type_tag::string).rule(rules::min_length(3))
//       .field("age", type_tag::number).rule(rules::minimum(0));
//
//   auto validator = JitCompiler::instance().compile_validator(user, ValidatorRegistry::instance());
//   for (const auto& error : (*validator)->run(data)) {
//       std::cerr << error.format() << "\n";
//   }
//

#pragma once

#include <entiform/errors.hh>
#include <entiform/jit.hh>
#include <entiform/schema.hh>
#include <entiform/value.hh>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace entiform {

// ============================================================================
// Validator Registry
// ============================================================================

/// Type-shape check of a present, non-null element value
using type_check = std::function<std::optional<rule_failure>(const field& property, const value& v)>;

/**
 * Per-type-tag shape checks, the validation counterpart of a Serializer's
 * compiler table. A default-constructed registry holds the built-in checks
 * for every primitive tag; union, entity and partial fields are checked by
 * the compiler itself.
 */
class ValidatorRegistry {
public:
    ValidatorRegistry();
    ValidatorRegistry(const ValidatorRegistry&) = delete;
    ValidatorRegistry& operator=(const ValidatorRegistry&) = delete;

    static ValidatorRegistry& instance();

    /// Replace the check for a tag
    void register_check(type_tag tag, type_check check);

    /// nullptr when the tag is not checked
    [[nodiscard]] const type_check* find(type_tag tag) const;

    [[nodiscard]] std::uint64_t id() const { return id_; }
    [[nodiscard]] std::uint64_t revision() const { return revision_; }

private:
    std::uint64_t id_;
    std::uint64_t revision_ = 0;
    std::map<type_tag, type_check> checks_;
};

// ============================================================================
// Compiled Validator
// ============================================================================

/// Checks a present, non-null value at a path and appends its errors
using validate_step = std::function<void(const value& v, const std::string& path, std::vector<field_error>& errors)>;

struct validation_plan {
    std::size_t index = 0;
    const field* property = nullptr;
    validate_step shape;   ///< Container, nested and type checks
};

class CompiledValidator {
public:
    CompiledValidator(const schema& s, std::vector<validation_plan> plans);

    [[nodiscard]] const schema& get_schema() const { return *schema_; }

    /// Every error of an object or entity, in field declaration order
    [[nodiscard]] std::vector<field_error> run(const value& data) const;

    /// Append the errors of data, prefixing paths with `path`. Sparse mode
    /// (partial-typed values) skips the required-ness check.
    void run(const value& data, const std::string& path, std::vector<field_error>& errors, bool sparse = false) const;

private:
    const schema* schema_;
    std::vector<validation_plan> plans_;
};

/// Dotted child path
std::string join_path(const std::string& parent, const std::string& child);

// ============================================================================
// Built-in Rules
// ============================================================================

namespace rules {

    /// Strings: character count; arrays and objects: element count
    validator_rule min_length(std::size_t n);
    validator_rule max_length(std::size_t n);

    validator_rule minimum(double n);
    validator_rule maximum(double n);

    /// ECMAScript regular expression that must match somewhere in a string
    validator_rule pattern(const std::string& regex);

    /// Non-empty string, array or object
    validator_rule not_empty();

    /// Arbitrary predicate reported with code "custom"
    validator_rule custom(std::string name, std::function<bool(const value&)> predicate, std::string message);

    /// Rule by name with a numeric or text argument, as written in schema documents
    /// @throws schema_definition_error for unknown names or missing arguments
    validator_rule from_name(const std::string& name, const std::optional<value>& argument);

} // namespace rules

} // namespace entiform
