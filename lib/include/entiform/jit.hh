//
// JIT Compiler
//
// Builds, caches and executes conversion pipelines. A pipeline is compiled
// once per (schema, Serializer, direction, field subset) and is a list of
// field plans: for each field the prechecks and the conversion step the
// Serializer's generators emitted, plus the absent/null policy.
//
// USAGE EXAMPLE:
//   auto& json = SerializerRegistry::instance().require_serializer("json");
//   auto pipeline = JitCompiler::instance().compile(product, json, direction::decode);
//
//   value decoded = (*pipeline)->run(object{{"title", "Car"}, {"price", 499}});
//   auto car = decoded.as_entity();
//

#pragma once

#include <entiform/compile_cache.hh>
#include <entiform/compiler_state.hh>
#include <entiform/run_context.hh>
#include <entiform/schema.hh>
#include <entiform/value.hh>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <tuple>
#include <vector>

namespace entiform {

class Serializer;
class CompiledValidator;
class ValidatorRegistry;

// ============================================================================
// Cache Keys
// ============================================================================

struct pipeline_key {
    std::uint64_t schema_id = 0;
    std::uint64_t serializer_id = 0;
    std::uint64_t revision = 0;
    direction dir = direction::decode;
    /// Sorted and deduplicated; empty optional for full pipelines
    std::optional<std::vector<std::string>> subset;

    friend bool operator<(const pipeline_key& lhs, const pipeline_key& rhs) {
        return std::tie(lhs.schema_id, lhs.serializer_id, lhs.revision, lhs.dir, lhs.subset)
             < std::tie(rhs.schema_id, rhs.serializer_id, rhs.revision, rhs.dir, rhs.subset);
    }
    friend bool operator==(const pipeline_key& lhs, const pipeline_key& rhs) {
        return std::tie(lhs.schema_id, lhs.serializer_id, lhs.revision, lhs.dir, lhs.subset)
            == std::tie(rhs.schema_id, rhs.serializer_id, rhs.revision, rhs.dir, rhs.subset);
    }
};

struct validator_key {
    std::uint64_t schema_id = 0;
    std::uint64_t registry_id = 0;
    std::uint64_t revision = 0;

    friend bool operator<(const validator_key& lhs, const validator_key& rhs) {
        return std::tie(lhs.schema_id, lhs.registry_id, lhs.revision)
             < std::tie(rhs.schema_id, rhs.registry_id, rhs.revision);
    }
    friend bool operator==(const validator_key& lhs, const validator_key& rhs) {
        return std::tie(lhs.schema_id, lhs.registry_id, lhs.revision)
            == std::tie(rhs.schema_id, rhs.registry_id, rhs.revision);
    }
};

using validator_handle = std::shared_ptr<PipelineRef<CompiledValidator>>;

// ============================================================================
// Nested Pipeline Links
// ============================================================================

/// Link from a step to the pipeline of another schema. Links to pipelines of
/// the same build group are non-owning (see CompileCache), links to earlier
/// groups keep those alive.
template <typename Pipeline>
class pipeline_link {
public:
    using handle = std::shared_ptr<PipelineRef<Pipeline>>;

    pipeline_link() = default;
    explicit pipeline_link(handle h) : handle_(std::move(h)) {}

    /// Throws std::logic_error when the pipeline never finished compiling
    [[nodiscard]] const Pipeline& get() const { return handle_->get(); }

private:
    handle handle_;
};

// ============================================================================
// Compiled Pipeline
// ============================================================================

/// Conversion plan of one field
struct field_plan {
    std::size_t index = 0;               ///< Position in the schema
    const field* property = nullptr;
    std::vector<prepend_step> prechecks;
    convert_step step;                   ///< Present, non-null input
    const schema* parent = nullptr;      ///< Set for parent-reference fields
};

class CompiledPipeline {
public:
    CompiledPipeline(const schema& s,
                     const Serializer& serializer,
                     direction dir,
                     std::optional<std::vector<std::string>> subset,
                     std::vector<field_plan> plans);

    [[nodiscard]] const schema& get_schema() const { return *schema_; }
    [[nodiscard]] const Serializer& serializer() const { return *serializer_; }
    [[nodiscard]] direction dir() const { return dir_; }
    [[nodiscard]] const std::optional<std::vector<std::string>>& subset() const { return subset_; }
    [[nodiscard]] bool is_partial() const { return subset_.has_value(); }
    [[nodiscard]] const std::vector<field_plan>& plans() const { return plans_; }

    /**
     * Convert one value.
     *
     * Full decode: object (or an entity of this schema) → entity.
     * Full encode: entity (or object) → object.
     * Partial pipelines: object of the converted, present, requested fields.
     *
     * @throws conversion_error when the root input has the wrong shape
     */
    value run(const value& input, const convert_options& options = {}) const;
    value run(const value& input, run_context& ctx) const;

    /**
     * Decode onto an existing entity. Full pipelines assign every visible
     * field; partial pipelines only the present requested fields.
     */
    void apply(const value& input, entity& target, const convert_options& options = {}) const;

    /// Convert only the present, known keys of an object (partial-typed values)
    value run_sparse(const value& input, run_context& ctx) const;

private:
    std::shared_ptr<entity> decode_entity(const object& input, run_context& ctx) const;
    value encode_entity(const value& input, run_context& ctx) const;
    object decode_sparse(const object& input, run_context& ctx) const;
    void assign(const object& input, entity& target, run_context& ctx, bool sparse) const;

    /// Outcome of one plan for a raw input (nullptr when absent)
    std::optional<value> convert_field(const field_plan& plan, const value* raw, run_context& ctx) const;

    const schema* schema_;
    const Serializer* serializer_;
    direction dir_;
    std::optional<std::vector<std::string>> subset_;
    std::vector<field_plan> plans_;
};

/// Converter of a single field, for adapters converting primary keys
class CompiledProperty {
public:
    CompiledProperty(const field& property, std::vector<prepend_step> prechecks, convert_step step);

    [[nodiscard]] const field& property() const { return *property_; }

    /// Converted value, empty when the input is absent or does not convert
    std::optional<value> run(const value* input, const convert_options& options = {}) const;

private:
    const field* property_;
    std::vector<prepend_step> prechecks_;
    convert_step step_;
};

// ============================================================================
// JIT Compiler
// ============================================================================

class JitCompiler {
public:
    struct stats {
        std::size_t pipelines = 0;           ///< Currently cached conversion pipelines
        std::size_t builds = 0;              ///< Conversion pipelines built
        std::size_t forward_references = 0;  ///< Cycles answered with a forward reference
        std::size_t validators = 0;          ///< Currently cached validators
    };

    JitCompiler() = default;
    JitCompiler(const JitCompiler&) = delete;
    JitCompiler& operator=(const JitCompiler&) = delete;

    /// Process-wide compiler, for callers that do not carry their own
    static JitCompiler& instance();

    /// Full pipeline; cached
    pipeline_handle compile(const schema& s, const Serializer& serializer, direction dir);

    /**
     * Pipeline restricted to the named fields; cached per subset.
     * @throws schema_definition_error for names the schema does not declare
     */
    pipeline_handle compile_partial(const schema& s,
                                    const Serializer& serializer,
                                    direction dir,
                                    const std::vector<std::string>& field_names);

    /// Validator pipeline; cached
    validator_handle compile_validator(const schema& s, const ValidatorRegistry& registry);

    /// Converter for one field; not cached
    CompiledProperty compile_property(const schema& s,
                                      const std::string& field_name,
                                      const Serializer& serializer,
                                      direction dir);

    /// Drop every cached pipeline
    void reset();

    [[nodiscard]] stats get_stats() const;

private:
    friend class CompilerState;

    pipeline_handle compile_key(const schema& s, const Serializer& serializer, pipeline_key key);

    std::shared_ptr<const CompiledPipeline> build(const schema& s,
                                                  const Serializer& serializer,
                                                  direction dir,
                                                  const std::optional<std::vector<std::string>>& subset);

    /// Prechecks and step of one field
    field_plan plan_field(const schema& owner, std::size_t index, const Serializer& serializer, direction dir);

    /// Step for a value of the given field shape (containers unwrapped here)
    convert_step value_step(const schema& owner, const field& f, const Serializer& serializer, direction dir);

    /// Step for one element (no container)
    convert_step element_step(const schema& owner, const field& f, const Serializer& serializer, direction dir);

    convert_step entity_step(const schema& owner, const field& f, const Serializer& serializer, direction dir);
    convert_step partial_step(const schema& owner, const field& f, const Serializer& serializer, direction dir);
    convert_step union_step(const schema& owner, const field& f, const Serializer& serializer, direction dir);
    /// Primary generator of the Serializer table, identity when none is registered
    convert_step table_step(const schema& owner, const field& f, const Serializer& serializer, direction dir);

    CompileCache<pipeline_key, CompiledPipeline> pipelines_;
    CompileCache<validator_key, CompiledValidator> validators_;
};

} // namespace entiform
