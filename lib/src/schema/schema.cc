//
// Schema Model: fields, schemas and consistency checks
//

#include <entiform/schema.hh>
#include <entiform/schema_registry.hh>
#include <entiform/errors.hh>
#include <algorithm>
#include <array>
#include <atomic>

namespace entiform {

namespace {
    std::atomic<std::uint64_t> g_next_schema_id{1};

    constexpr std::array<std::pair<type_tag, const char*>, 11> TYPE_TAG_NAMES{{
        {type_tag::any, "any"},
        {type_tag::string, "string"},
        {type_tag::number, "number"},
        {type_tag::boolean, "boolean"},
        {type_tag::date, "date"},
        {type_tag::enumeration, "enum"},
        {type_tag::literal, "literal"},
        {type_tag::binary, "binary"},
        {type_tag::entity, "entity"},
        {type_tag::partial, "partial"},
        {type_tag::union_type, "union"},
    }};

    constexpr std::array<std::pair<binary_kind, const char*>, 10> BINARY_KIND_NAMES{{
        {binary_kind::array_buffer, "arraybuffer"},
        {binary_kind::int8, "int8"},
        {binary_kind::uint8, "uint8"},
        {binary_kind::uint8_clamped, "uint8clamped"},
        {binary_kind::int16, "int16"},
        {binary_kind::uint16, "uint16"},
        {binary_kind::int32, "int32"},
        {binary_kind::uint32, "uint32"},
        {binary_kind::float32, "float32"},
        {binary_kind::float64, "float64"},
    }};

    void check_field(const std::string& schema_name, const field& f, bool is_candidate) {
        const std::string where = is_candidate ? "union candidate of '" + f.name + "'" : "field '" + f.name + "'";

        switch (f.type) {
            case type_tag::union_type:
                if (is_candidate) {
                    throw schema_definition_error(schema_name, where + " is itself a union");
                }
                if (f.union_candidates.empty()) {
                    throw schema_definition_error(schema_name, where + " is a union without candidates");
                }
                for (const auto& candidate : f.union_candidates) {
                    check_field(schema_name, candidate.property, true);
                }
                break;
            case type_tag::entity:
            case type_tag::partial:
                if (f.referenced.empty()) {
                    throw schema_definition_error(schema_name, where + " does not reference a schema");
                }
                break;
            case type_tag::literal:
                if (!f.literal_value) {
                    throw schema_definition_error(schema_name, where + " is a literal without a value");
                }
                break;
            case type_tag::enumeration:
                if (!f.enumeration) {
                    throw schema_definition_error(schema_name, where + " has no enum definition");
                }
                break;
            default:
                break;
        }

        if (!is_candidate && f.type != type_tag::union_type && !f.union_candidates.empty()) {
            throw schema_definition_error(schema_name, where + " declares union candidates but is not a union");
        }
        if (f.is_parent_reference && f.type != type_tag::entity) {
            throw schema_definition_error(schema_name, where + " is a parent reference but not an entity");
        }
    }
}

// ============================================================================
// Names
// ============================================================================

const char* type_tag_name(type_tag tag) {
    for (const auto& [t, n] : TYPE_TAG_NAMES) {
        if (t == tag) return n;
    }
    return "unknown";
}

std::optional<type_tag> type_tag_from_name(std::string_view name) {
    for (const auto& [t, n] : TYPE_TAG_NAMES) {
        if (name == n) return t;
    }
    if (name == "class") return type_tag::entity;
    return std::nullopt;
}

const char* binary_kind_name(binary_kind kind) {
    for (const auto& [k, n] : BINARY_KIND_NAMES) {
        if (k == kind) return n;
    }
    return "unknown";
}

std::optional<binary_kind> binary_kind_from_name(std::string_view name) {
    for (const auto& [k, n] : BINARY_KIND_NAMES) {
        if (name == n) return k;
    }
    return std::nullopt;
}

// ============================================================================
// Enumerations
// ============================================================================

const value* enum_def::find_by_label(std::string_view label) const {
    for (const auto& [l, v] : items) {
        if (l == label) return &v;
    }
    return nullptr;
}

bool enum_def::contains_value(const value& v) const {
    return std::any_of(items.begin(), items.end(),
        [&](const auto& item) { return item.second == v; });
}

std::vector<std::string> enum_def::labels() const {
    std::vector<std::string> result;
    result.reserve(items.size());
    for (const auto& [l, _] : items) {
        result.push_back(l);
    }
    return result;
}

std::vector<std::string> enum_def::valid_values(bool with_labels) const {
    std::vector<std::string> result;
    for (const auto& [_, v] : items) {
        result.push_back(v.is_string() ? v.as_string() : v.to_string());
    }
    if (with_labels) {
        for (const auto& [l, _] : items) {
            result.push_back(l);
        }
    }
    return result;
}

// ============================================================================
// Schema References
// ============================================================================

schema_ref::schema_ref(const schema& target)
    : name_(target.name()), target_(&target) {
}

const schema& schema_ref::resolve(const SchemaRegistry* registry) const {
    if (target_) {
        return *target_;
    }
    if (!registry) {
        throw schema_definition_error(name_, "referenced by name but no registry is available to resolve it");
    }
    return registry->get(name_);
}

// ============================================================================
// Fields
// ============================================================================

field field::element() const {
    field copy = *this;
    copy.container = container_kind::none;
    return copy;
}

field literal_candidate(value literal) {
    field f;
    f.type = type_tag::literal;
    f.literal_value = std::move(literal);
    return f;
}

field type_candidate(type_tag type) {
    field f;
    f.type = type;
    return f;
}

field entity_candidate(schema_ref target) {
    field f;
    f.type = type_tag::entity;
    f.referenced = std::move(target);
    return f;
}

// ============================================================================
// Schema
// ============================================================================

schema::schema(std::string name, std::vector<field> fields)
    : id_(g_next_schema_id.fetch_add(1)),
      name_(std::move(name)),
      fields_(std::move(fields)) {
    for (std::size_t i = 0; i < fields_.size(); ++i) {
        if (fields_[i].is_primary) primary_ = i;
        if (fields_[i].is_auto_increment) auto_increment_ = i;
    }
}

const field* schema::find_field(std::string_view name) const {
    auto idx = index_of(name);
    return idx ? &fields_[*idx] : nullptr;
}

std::optional<std::size_t> schema::index_of(std::string_view name) const {
    for (std::size_t i = 0; i < fields_.size(); ++i) {
        if (fields_[i].name == name) return i;
    }
    return std::nullopt;
}

const field* schema::primary_field() const {
    return primary_ ? &fields_[*primary_] : nullptr;
}

const field* schema::auto_increment_field() const {
    return auto_increment_ ? &fields_[*auto_increment_] : nullptr;
}

const schema& schema::resolve(const field& f) const {
    return f.referenced.resolve(registry_);
}

// ============================================================================
// Schema Builder
// ============================================================================

SchemaBuilder::SchemaBuilder(std::string name)
    : name_(std::move(name)) {
}

SchemaBuilder& SchemaBuilder::field(std::string name, type_tag type) {
    entiform::field f;
    f.name = std::move(name);
    f.type = type;
    fields_.push_back(std::move(f));
    return *this;
}

SchemaBuilder& SchemaBuilder::add(entiform::field f) {
    fields_.push_back(std::move(f));
    return *this;
}

entiform::field& SchemaBuilder::current() {
    if (fields_.empty()) {
        throw schema_definition_error(name_, "field modifier used before any field was declared");
    }
    return fields_.back();
}

SchemaBuilder& SchemaBuilder::optional(bool on) { current().is_optional = on; return *this; }
SchemaBuilder& SchemaBuilder::nullable(bool on) { current().is_nullable = on; return *this; }
SchemaBuilder& SchemaBuilder::with_default(value v) { current().default_value = std::move(v); return *this; }
SchemaBuilder& SchemaBuilder::as_array() { current().container = container_kind::array; return *this; }
SchemaBuilder& SchemaBuilder::as_map() { current().container = container_kind::map; return *this; }
SchemaBuilder& SchemaBuilder::primary() { current().is_primary = true; return *this; }
SchemaBuilder& SchemaBuilder::auto_increment() { current().is_auto_increment = true; return *this; }
SchemaBuilder& SchemaBuilder::reference() { current().is_reference = true; return *this; }
SchemaBuilder& SchemaBuilder::parent_reference() { current().is_parent_reference = true; return *this; }
SchemaBuilder& SchemaBuilder::group(std::string name) { current().groups.insert(std::move(name)); return *this; }
SchemaBuilder& SchemaBuilder::rule(validator_rule r) { current().validators.push_back(std::move(r)); return *this; }

SchemaBuilder& SchemaBuilder::literal(value v) {
    auto& f = current();
    f.type = type_tag::literal;
    f.literal_value = std::move(v);
    return *this;
}

SchemaBuilder& SchemaBuilder::enumeration(std::shared_ptr<const enum_def> def, bool allow_labels) {
    auto& f = current();
    f.type = type_tag::enumeration;
    f.enumeration = std::move(def);
    f.enum_allows_labels = allow_labels;
    return *this;
}

SchemaBuilder& SchemaBuilder::binary(binary_kind kind) {
    auto& f = current();
    f.type = type_tag::binary;
    f.binary = kind;
    return *this;
}

SchemaBuilder& SchemaBuilder::references(schema_ref target) {
    current().referenced = std::move(target);
    return *this;
}

SchemaBuilder& SchemaBuilder::candidate(entiform::field property, guard_fn guard) {
    auto& f = current();
    f.type = type_tag::union_type;
    if (property.name.empty()) {
        property.name = f.name;
    }
    f.union_candidates.push_back(union_candidate{std::move(property), std::move(guard)});
    return *this;
}

schema SchemaBuilder::build() {
    std::set<std::string> names;
    const entiform::field* primary = nullptr;
    const entiform::field* auto_increment = nullptr;

    for (const auto& f : fields_) {
        if (f.name.empty()) {
            throw schema_definition_error(name_, "field without a name");
        }
        if (!names.insert(f.name).second) {
            throw schema_definition_error(name_, "duplicate field '" + f.name + "'");
        }
        if (f.is_primary) {
            if (primary) {
                throw schema_definition_error(name_,
                    "two primary fields: '" + primary->name + "' and '" + f.name + "'");
            }
            primary = &f;
        }
        if (f.is_auto_increment) {
            if (auto_increment) {
                throw schema_definition_error(name_,
                    "two auto-increment fields: '" + auto_increment->name + "' and '" + f.name + "'");
            }
            auto_increment = &f;
        }
        check_field(name_, f, false);
    }

    return schema(name_, fields_);
}

} // namespace entiform
