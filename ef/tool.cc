#include "tool.hh"
#include <entiform/yaml/schema_loader.hh>
#include <entiform/yaml/value_yaml.hh>
#include <fstream>

namespace entiform::driver {

Tool::Tool(const CliOptions& options, Logger& logger)
    : options_(options)
    , logger_(logger)
{
}

int Tool::run() {
    try {
        logger_.verbose("Loading schema: " + options_.schema_file.string());

        yaml::SchemaLoader loader(schemas_);
        auto document = loader.load_file(options_.schema_file.string());
        entities_ = document.entities;

        logger_.debug("Declared " + std::to_string(document.entities.size()) + " entities, " +
                      std::to_string(document.enums.size()) + " enums");

        if (options_.list_entities) {
            return list_entities();
        }

        const schema& s = schemas_.get(options_.entity_name);

        logger_.verbose("Reading input: " + options_.input_file.string());
        value input = yaml::load_file(options_.input_file.string());

        logger_.verbose(std::string("Mode: ") + run_mode_name(options_.mode) +
                        ", serializer: " + options_.serializer_name);

        warn_hidden_fields(s);
        warn_unknown_keys(s, input);

        switch (options_.mode) {
            case RunMode::Decode: return run_decode(s, input);
            case RunMode::Encode: return run_encode(s, input);
            case RunMode::Roundtrip: return run_roundtrip(s, input);
            case RunMode::Validate: return run_validate(s, input);
        }
        return 1;

    } catch (const yaml::yaml_schema_error& e) {
        logger_.error(std::string("Schema document: ") + e.what());
        return 1;
    } catch (const schema_definition_error& e) {
        logger_.error(std::string("Schema definition: ") + e.what());
        return 1;
    } catch (const validation_failed& e) {
        logger_.error("Validation failed");
        for (const auto& err : e.errors()) {
            logger_.field_error(err.path, err.message, err.code);
        }
        return 1;
    } catch (const std::exception& e) {
        logger_.error(std::string("Error: ") + e.what());
        return 1;
    }
}

// ============================================================================
// Modes
// ============================================================================

int Tool::run_decode(const schema& s, const value& input) {
    auto ctx = make_context();
    auto opts = make_convert_options();

    if (!options_.fields.empty()) {
        value patch = convert_partial(ctx, s, options_.serializer_name, direction::decode,
                                      options_.fields, input, opts);
        write_output(patch);
        logger_.success("Decoded " + std::to_string(patch.as_object().size()) + " field(s) of " + s.name());
        return 0;
    }

    value decoded = convert(ctx, s, options_.serializer_name, direction::decode, input, opts);
    write_output(decoded);
    logger_.success("Decoded " + s.name());
    return 0;
}

int Tool::run_encode(const schema& s, const value& input) {
    auto ctx = make_context();
    auto opts = make_convert_options();

    if (!options_.fields.empty()) {
        value patch = convert_partial(ctx, s, options_.serializer_name, direction::decode,
                                      options_.fields, input, opts);
        value encoded = convert_partial(ctx, s, options_.serializer_name, direction::encode,
                                        options_.fields, patch, opts);
        write_output(encoded);
        logger_.success("Encoded " + std::to_string(encoded.as_object().size()) + " field(s) of " + s.name());
        return 0;
    }

    value decoded = convert(ctx, s, options_.serializer_name, direction::decode, input, opts);
    value encoded = convert(ctx, s, options_.serializer_name, direction::encode, decoded, opts);
    write_output(encoded);
    logger_.success("Encoded " + s.name());
    return 0;
}

int Tool::run_roundtrip(const schema& s, const value& input) {
    auto ctx = make_context();
    auto opts = make_convert_options();

    value first = convert(ctx, s, options_.serializer_name, direction::decode, input, opts);
    value encoded = convert(ctx, s, options_.serializer_name, direction::encode, first, opts);
    value second = convert(ctx, s, options_.serializer_name, direction::decode, encoded, opts);

    logger_.debug("Encoded form: " + encoded.to_string());

    if (first != second) {
        logger_.error("Round trip of " + s.name() + " is not stable");
        logger_.mismatch("first: ", first.to_string());
        logger_.mismatch("second:", second.to_string());
        return 1;
    }

    write_output(encoded);
    logger_.success("Round trip of " + s.name() + " is stable");
    return 0;
}

int Tool::run_validate(const schema& s, const value& input) {
    auto ctx = make_context();
    auto errors = validate(ctx, s, input);

    if (!errors.empty()) {
        logger_.error(std::to_string(errors.size()) + " validation error(s) in " + s.name());
        for (const auto& err : errors) {
            logger_.field_error(err.path, err.message, err.code);
        }
        return 1;
    }

    logger_.success(s.name() + " is valid");
    return 0;
}

// ============================================================================
// Utility Methods
// ============================================================================

int Tool::list_entities() {
    for (const auto& name : entities_) {
        const schema& s = schemas_.get(name);
        logger_.entity_heading(name, s.fields().size());
        for (const auto& f : s.fields()) {
            std::string line = f.name + ": " + type_tag_name(f.type);
            if (f.container == container_kind::array) line += "[]";
            if (f.container == container_kind::map) line += " (map)";
            if (f.is_primary) line += " primary";
            if (f.is_optional) line += " optional";
            if (f.is_nullable) line += " nullable";
            if (f.is_parent_reference) line += " parent";
            logger_.field_line(line);
        }
    }
    return 0;
}

void Tool::warn_hidden_fields(const schema& s) {
    if (options_.fields.empty()) {
        return;
    }
    const convert_options opts = make_convert_options();
    run_context filter(opts);
    for (const auto& name : options_.fields) {
        const field* f = s.find_field(name);
        if (f && !filter.is_visible(*f)) {
            logger_.warning("field '" + name + "' is hidden by the group filter and will not be converted");
        }
    }
}

void Tool::warn_unknown_keys(const schema& s, const value& input) {
    if (!input.is_object()) {
        return;
    }
    for (const auto& [key, member] : input.as_object()) {
        if (!s.find_field(key)) {
            logger_.warning("input key '" + key + "' is not a field of " + s.name() + " and is ignored");
        }
    }
}

convert_options Tool::make_convert_options() const {
    convert_options opts;
    opts.groups = options_.groups;
    opts.groups_exclude = options_.groups_exclude;
    opts.loosely = !options_.strict;
    return opts;
}

context Tool::make_context() {
    return context{
        schemas_,
        SerializerRegistry::instance(),
        ValidatorRegistry::instance(),
        JitCompiler::instance()
    };
}

void Tool::write_output(const value& v) {
    std::string text = yaml::dump(v);

    if (options_.output_file.empty()) {
        logger_.result(text);
        return;
    }

    std::ofstream out(options_.output_file);
    if (!out.is_open()) {
        throw std::runtime_error("Failed to open output file: " + options_.output_file.string());
    }
    out << text;
    logger_.verbose("Wrote: " + options_.output_file.string());
}

}  // namespace entiform::driver
