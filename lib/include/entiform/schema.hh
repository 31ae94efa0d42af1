//
// Schema Model
//
// Immutable description of an entity: ordered field descriptors plus
// entity-level metadata (name, primary field, auto-increment field).
//
// USAGE EXAMPLE:
//   SchemaRegistry registry;
//   registry.add(SchemaBuilder("Product")
//       .field("id", type_tag::number).primary().auto_increment()
//       .field("title", type_tag::string)
//       .field("rating", type_tag::number).with_default(0)
//       .field("tags", type_tag::string).as_array()
//       .build());
//
//   const schema& product = registry.get("Product");
//

#pragma once

#include <entiform/value.hh>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace entiform {

class schema;
class SchemaRegistry;

// ============================================================================
// Type Tags
// ============================================================================

/// Selects the conversion and validation generators of a field.
enum class type_tag {
    any,
    string,
    number,
    boolean,
    date,
    enumeration,
    literal,
    binary,
    entity,      ///< Nested or foreign entity (referenced schema)
    partial,     ///< Subset-of-fields view of a referenced schema
    union_type   ///< Resolved through union candidates
};

/// Wraps the element type of a field
enum class container_kind {
    none,
    array,
    map
};

/// Element layout of binary fields; every kind is carried as raw bytes
enum class binary_kind {
    array_buffer,
    int8,
    uint8,
    uint8_clamped,
    int16,
    uint16,
    int32,
    uint32,
    float32,
    float64
};

const char* type_tag_name(type_tag tag);
std::optional<type_tag> type_tag_from_name(std::string_view name);

const char* binary_kind_name(binary_kind kind);
std::optional<binary_kind> binary_kind_from_name(std::string_view name);

// ============================================================================
// Enumerations
// ============================================================================

struct enum_def {
    std::string name;
    std::vector<std::pair<std::string, value>> items;  ///< (label, value) in declaration order

    /// Value declared for a label, nullptr if unknown
    [[nodiscard]] const value* find_by_label(std::string_view label) const;
    [[nodiscard]] bool contains_value(const value& v) const;
    [[nodiscard]] std::vector<std::string> labels() const;
    /// Rendered values, followed by labels when requested
    [[nodiscard]] std::vector<std::string> valid_values(bool with_labels) const;
};

// ============================================================================
// Validator Rules
// ============================================================================

struct rule_failure {
    std::string code;
    std::string message;
};

/// A custom check run after a field passed its type check.
struct validator_rule {
    std::string name;
    std::function<std::optional<rule_failure>(const value&)> check;
};

// ============================================================================
// Schema References
// ============================================================================

/// Reference to a nested schema, resolved lazily so that a schema may refer
/// to itself (directly or transitively) before it is fully built.
class schema_ref {
public:
    schema_ref() = default;
    schema_ref(std::string name) : name_(std::move(name)) {}
    schema_ref(const char* name) : name_(name) {}
    schema_ref(const schema& target);

    [[nodiscard]] bool empty() const { return name_.empty() && target_ == nullptr; }
    [[nodiscard]] const std::string& name() const { return name_; }

    /// Resolve through the registry owning the referencing schema.
    /// Throws schema_definition_error when the name cannot be resolved.
    [[nodiscard]] const schema& resolve(const SchemaRegistry* registry) const;

private:
    std::string name_;
    const schema* target_ = nullptr;
};

// ============================================================================
// Fields
// ============================================================================

/// Classifies a raw value as belonging to one union candidate
using guard_fn = std::function<bool(const value&)>;

struct union_candidate;

struct field {
    std::string name;
    type_tag type = type_tag::any;
    container_kind container = container_kind::none;

    bool is_optional = false;   ///< Absent input permitted
    bool is_nullable = false;   ///< Null passes through without the type step
    std::optional<value> default_value;

    std::optional<value> literal_value;
    std::shared_ptr<const enum_def> enumeration;
    bool enum_allows_labels = false;
    binary_kind binary = binary_kind::uint8;

    schema_ref referenced;                          ///< For entity and partial fields
    std::vector<union_candidate> union_candidates;  ///< For union fields, declaration order

    bool is_reference = false;         ///< Foreign entity; a bare primary key is accepted
    bool is_parent_reference = false;  ///< Filled from the enclosing entity chain
    bool is_primary = false;
    bool is_auto_increment = false;

    std::set<std::string> groups;
    std::vector<validator_rule> validators;

    [[nodiscard]] bool has_default() const { return default_value.has_value(); }
    [[nodiscard]] bool is_array() const { return container == container_kind::array; }
    [[nodiscard]] bool is_map() const { return container == container_kind::map; }
    [[nodiscard]] bool is_union() const { return type == type_tag::union_type; }
    /// Copy of this field describing a single element (container stripped)
    [[nodiscard]] field element() const;
};

struct union_candidate {
    field property;
    guard_fn guard;  ///< Derived from the candidate when empty
};

/// Candidate helpers for union fields
field literal_candidate(value literal);
field type_candidate(type_tag type);
field entity_candidate(schema_ref target);

// ============================================================================
// Schema
// ============================================================================

class schema {
public:
    schema(const schema&) = delete;
    schema& operator=(const schema&) = delete;
    schema(schema&&) noexcept = default;
    schema& operator=(schema&&) noexcept = default;

    /// Process-unique identity, used as cache key
    [[nodiscard]] std::uint64_t id() const { return id_; }
    [[nodiscard]] const std::string& name() const { return name_; }
    [[nodiscard]] const std::vector<field>& fields() const { return fields_; }

    [[nodiscard]] const field* find_field(std::string_view name) const;
    [[nodiscard]] std::optional<std::size_t> index_of(std::string_view name) const;

    [[nodiscard]] const field* primary_field() const;
    [[nodiscard]] const field* auto_increment_field() const;
    [[nodiscard]] std::optional<std::size_t> primary_index() const { return primary_; }

    /// Registry used to resolve schema references by name (may be null)
    [[nodiscard]] const SchemaRegistry* registry() const { return registry_; }

    /// Resolve the schema a field (or union candidate) of this schema refers to
    [[nodiscard]] const schema& resolve(const field& f) const;

private:
    friend class SchemaBuilder;
    friend class SchemaRegistry;

    schema(std::string name, std::vector<field> fields);

    std::uint64_t id_;
    std::string name_;
    std::vector<field> fields_;
    std::optional<std::size_t> primary_;
    std::optional<std::size_t> auto_increment_;
    const SchemaRegistry* registry_ = nullptr;
};

// ============================================================================
// Schema Builder
// ============================================================================

/// Fluent construction of a schema. Modifiers apply to the most recently
/// added field; build() checks internal consistency.
class SchemaBuilder {
public:
    explicit SchemaBuilder(std::string name);

    SchemaBuilder& field(std::string name, type_tag type);
    SchemaBuilder& add(entiform::field f);

    SchemaBuilder& optional(bool on = true);
    SchemaBuilder& nullable(bool on = true);
    SchemaBuilder& with_default(value v);
    SchemaBuilder& as_array();
    SchemaBuilder& as_map();
    SchemaBuilder& primary();
    SchemaBuilder& auto_increment();
    SchemaBuilder& reference();
    SchemaBuilder& parent_reference();
    SchemaBuilder& literal(value v);
    SchemaBuilder& enumeration(std::shared_ptr<const enum_def> def, bool allow_labels = false);
    SchemaBuilder& binary(binary_kind kind);
    SchemaBuilder& references(schema_ref target);
    SchemaBuilder& candidate(entiform::field property, guard_fn guard = {});
    SchemaBuilder& group(std::string name);
    SchemaBuilder& rule(validator_rule r);

    /// Throws schema_definition_error on inconsistent descriptors
    schema build();

private:
    entiform::field& current();

    std::string name_;
    std::vector<entiform::field> fields_;
};

} // namespace entiform
