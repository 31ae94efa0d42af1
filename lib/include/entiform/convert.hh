//
// Boundary API
//
// Entry points used by collaborators (storage adapters, transports, the
// command line driver). Every function comes in two forms: one taking an
// explicit context, one using the process-wide instances.
//
// USAGE EXAMPLE:
//   value data = object{{"category", "toys"}, {"title", "Car"}, {"price", 499}};
//
//   auto car = convert(product, "json", direction::decode, data).as_entity();
//   value plain = convert(product, "json", direction::encode, value(car));
//
//   auto errors = validate(product, data);
//

#pragma once

#include <entiform/entity.hh>
#include <entiform/errors.hh>
#include <entiform/jit.hh>
#include <entiform/run_context.hh>
#include <entiform/schema.hh>
#include <entiform/schema_registry.hh>
#include <entiform/serializer.hh>
#include <entiform/serializer_registry.hh>
#include <entiform/validation.hh>
#include <entiform/value.hh>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace entiform {

/// Registries and compiler used by one caller
struct context {
    SchemaRegistry& schemas;
    SerializerRegistry& serializers;
    ValidatorRegistry& validators;
    JitCompiler& compiler;

    /// The process-wide instances
    static context global();

    /// Schema by name from the schema registry
    [[nodiscard]] const schema& get_schema(const std::string& name) const { return schemas.get(name); }
};

// ============================================================================
// Conversion
// ============================================================================

value convert(const context& ctx, const schema& s, const std::string& serializer_name,
              direction dir, const value& data, const convert_options& options = {});
value convert(const schema& s, const std::string& serializer_name,
              direction dir, const value& data, const convert_options& options = {});

/// Only the named fields; the result is an object of the converted fields
value convert_partial(const context& ctx, const schema& s, const std::string& serializer_name,
                      direction dir, const std::vector<std::string>& field_names,
                      const value& data, const convert_options& options = {});
value convert_partial(const schema& s, const std::string& serializer_name,
                      direction dir, const std::vector<std::string>& field_names,
                      const value& data, const convert_options& options = {});

/// Encode then decode with the json Serializer: a deep copy
std::shared_ptr<entity> clone_entity(const context& ctx, const entity& source, const convert_options& options = {});
std::shared_ptr<entity> clone_entity(const entity& source, const convert_options& options = {});

// ============================================================================
// Validation
// ============================================================================

std::vector<field_error> validate(const context& ctx, const schema& s, const value& data);
std::vector<field_error> validate(const schema& s, const value& data);

/// Decode with the json Serializer after a successful validation
/// @throws validation_failed carrying every error
std::shared_ptr<entity> validate_and_throw(const context& ctx, const schema& s, const value& data,
                                           const convert_options& options = {});
std::shared_ptr<entity> validate_and_throw(const schema& s, const value& data,
                                           const convert_options& options = {});

// ============================================================================
// Registry Extension
// ============================================================================

void register_type_converter(const context& ctx, const std::string& serializer_name,
                             direction dir, type_tag tag, generator gen);
void register_type_converter(const std::string& serializer_name,
                             direction dir, type_tag tag, generator gen);

void prepend_type_converter(const context& ctx, const std::string& serializer_name,
                            direction dir, type_tag tag, generator gen);
void prepend_type_converter(const std::string& serializer_name,
                            direction dir, type_tag tag, generator gen);

// ============================================================================
// Scoped Serializer
// ============================================================================

/// One schema bound to one Serializer
class ScopedSerializer {
public:
    ScopedSerializer(const context& ctx, const schema& s, const std::string& serializer_name);

    [[nodiscard]] const schema& get_schema() const { return schema_; }

    /// Entity → external
    value serialize(const value& data, const convert_options& options = {}) const;
    /// External → entity
    std::shared_ptr<entity> deserialize(const value& data, const convert_options& options = {}) const;

    value partial_serialize(const std::vector<std::string>& field_names, const value& data,
                            const convert_options& options = {}) const;
    value partial_deserialize(const std::vector<std::string>& field_names, const value& data,
                              const convert_options& options = {}) const;

    /// Decode the named fields onto an existing entity
    void patch(entity& target, const std::vector<std::string>& field_names, const value& data,
               const convert_options& options = {}) const;

private:
    context ctx_;
    const schema& schema_;
    Serializer& serializer_;
};

ScopedSerializer scoped_serializer(const context& ctx, const schema& s, const std::string& serializer_name);
ScopedSerializer scoped_serializer(const schema& s, const std::string& serializer_name);

// ============================================================================
// Property Converter
// ============================================================================

/// Single-field converter, e.g. for primary keys in storage adapters
CompiledProperty property_converter(const context& ctx, const schema& s, const std::string& field_name,
                                    const std::string& serializer_name, direction dir);
CompiledProperty property_converter(const schema& s, const std::string& field_name,
                                    const std::string& serializer_name, direction dir);

} // namespace entiform
