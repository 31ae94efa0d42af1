//
// Boundary API
//

#include <entiform/convert.hh>

namespace entiform {

context context::global() {
    return context{
        SchemaRegistry::instance(),
        SerializerRegistry::instance(),
        ValidatorRegistry::instance(),
        JitCompiler::instance()
    };
}

// ============================================================================
// Conversion
// ============================================================================

value convert(const context& ctx, const schema& s, const std::string& serializer_name,
              direction dir, const value& data, const convert_options& options) {
    auto& serializer = ctx.serializers.require_serializer(serializer_name);
    auto pipeline = ctx.compiler.compile(s, serializer, dir);
    return pipeline->get().run(data, options);
}

value convert(const schema& s, const std::string& serializer_name,
              direction dir, const value& data, const convert_options& options) {
    return convert(context::global(), s, serializer_name, dir, data, options);
}

value convert_partial(const context& ctx, const schema& s, const std::string& serializer_name,
                      direction dir, const std::vector<std::string>& field_names,
                      const value& data, const convert_options& options) {
    auto& serializer = ctx.serializers.require_serializer(serializer_name);
    auto pipeline = ctx.compiler.compile_partial(s, serializer, dir, field_names);
    return pipeline->get().run(data, options);
}

value convert_partial(const schema& s, const std::string& serializer_name,
                      direction dir, const std::vector<std::string>& field_names,
                      const value& data, const convert_options& options) {
    return convert_partial(context::global(), s, serializer_name, dir, field_names, data, options);
}

std::shared_ptr<entity> clone_entity(const context& ctx, const entity& source, const convert_options& options) {
    const schema& s = source.get_schema();
    // Non-owning alias; the pipelines only read the source
    value input(std::shared_ptr<entity>(std::shared_ptr<entity>(), const_cast<entity*>(&source)));

    value plain = convert(ctx, s, "json", direction::encode, input, options);
    return convert(ctx, s, "json", direction::decode, plain, options).as_entity();
}

std::shared_ptr<entity> clone_entity(const entity& source, const convert_options& options) {
    return clone_entity(context::global(), source, options);
}

// ============================================================================
// Validation
// ============================================================================

std::vector<field_error> validate(const context& ctx, const schema& s, const value& data) {
    auto validator = ctx.compiler.compile_validator(s, ctx.validators);
    return validator->get().run(data);
}

std::vector<field_error> validate(const schema& s, const value& data) {
    return validate(context::global(), s, data);
}

std::shared_ptr<entity> validate_and_throw(const context& ctx, const schema& s, const value& data,
                                           const convert_options& options) {
    auto errors = validate(ctx, s, data);
    if (!errors.empty()) {
        throw validation_failed(std::move(errors));
    }
    return convert(ctx, s, "json", direction::decode, data, options).as_entity();
}

std::shared_ptr<entity> validate_and_throw(const schema& s, const value& data, const convert_options& options) {
    return validate_and_throw(context::global(), s, data, options);
}

// ============================================================================
// Registry Extension
// ============================================================================

void register_type_converter(const context& ctx, const std::string& serializer_name,
                             direction dir, type_tag tag, generator gen) {
    auto& table = ctx.serializers.require_serializer(serializer_name).table(dir);
    if (tag == type_tag::binary) {
        table.register_for_binary(std::move(gen));
    } else {
        table.register_type(tag, std::move(gen));
    }
}

void register_type_converter(const std::string& serializer_name,
                             direction dir, type_tag tag, generator gen) {
    register_type_converter(context::global(), serializer_name, dir, tag, std::move(gen));
}

void prepend_type_converter(const context& ctx, const std::string& serializer_name,
                            direction dir, type_tag tag, generator gen) {
    ctx.serializers.require_serializer(serializer_name).table(dir).prepend(tag, std::move(gen));
}

void prepend_type_converter(const std::string& serializer_name,
                            direction dir, type_tag tag, generator gen) {
    prepend_type_converter(context::global(), serializer_name, dir, tag, std::move(gen));
}

// ============================================================================
// Scoped Serializer
// ============================================================================

ScopedSerializer::ScopedSerializer(const context& ctx, const schema& s, const std::string& serializer_name)
    : ctx_(ctx),
      schema_(s),
      serializer_(ctx.serializers.require_serializer(serializer_name)) {
}

value ScopedSerializer::serialize(const value& data, const convert_options& options) const {
    return ctx_.compiler.compile(schema_, serializer_, direction::encode)->get().run(data, options);
}

std::shared_ptr<entity> ScopedSerializer::deserialize(const value& data, const convert_options& options) const {
    return ctx_.compiler.compile(schema_, serializer_, direction::decode)->get().run(data, options).as_entity();
}

value ScopedSerializer::partial_serialize(const std::vector<std::string>& field_names, const value& data,
                                          const convert_options& options) const {
    return ctx_.compiler.compile_partial(schema_, serializer_, direction::encode, field_names)
        ->get().run(data, options);
}

value ScopedSerializer::partial_deserialize(const std::vector<std::string>& field_names, const value& data,
                                            const convert_options& options) const {
    return ctx_.compiler.compile_partial(schema_, serializer_, direction::decode, field_names)
        ->get().run(data, options);
}

void ScopedSerializer::patch(entity& target, const std::vector<std::string>& field_names, const value& data,
                             const convert_options& options) const {
    ctx_.compiler.compile_partial(schema_, serializer_, direction::decode, field_names)
        ->get().apply(data, target, options);
}

ScopedSerializer scoped_serializer(const context& ctx, const schema& s, const std::string& serializer_name) {
    return ScopedSerializer(ctx, s, serializer_name);
}

ScopedSerializer scoped_serializer(const schema& s, const std::string& serializer_name) {
    return ScopedSerializer(context::global(), s, serializer_name);
}

// ============================================================================
// Property Converter
// ============================================================================

CompiledProperty property_converter(const context& ctx, const schema& s, const std::string& field_name,
                                    const std::string& serializer_name, direction dir) {
    auto& serializer = ctx.serializers.require_serializer(serializer_name);
    return ctx.compiler.compile_property(s, field_name, serializer, dir);
}

CompiledProperty property_converter(const schema& s, const std::string& field_name,
                                    const std::string& serializer_name, direction dir) {
    return property_converter(context::global(), s, field_name, serializer_name, dir);
}

} // namespace entiform
