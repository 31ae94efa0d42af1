//
// JSON Serializer Plugin
//
// Built-in Serializer between entities and JSON-shaped neutral values:
// dates travel as ISO-8601 text, binary as base64, everything else as the
// matching JSON primitive. Registers itself with the SerializerRegistry
// during static initialization.
//

#include <entiform/serializer_plugin.hh>
#include <entiform/serializer_registry.hh>
#include <entiform/errors.hh>
#include <entiform/text_codec.hh>

namespace entiform {

namespace {

    // ========================================================================
    // Decoders (external → entity)
    // ========================================================================

    void decode_string(const field&, CompilerState& state) {
        state.add_setter([](const value& in, std::optional<value>& out, run_context& ctx) {
            if (in.is_string()) {
                out = in;
            } else if (ctx.options().loosely) {
                if (in.is_integer()) {
                    out = value(std::to_string(in.as_integer()));
                } else if (in.is_number()) {
                    out = value(format_number(in.as_number()));
                } else if (in.is_boolean()) {
                    out = value(in.as_boolean() ? "true" : "false");
                }
            }
        });
    }

    void decode_number(const field&, CompilerState& state) {
        state.add_setter([](const value& in, std::optional<value>& out, run_context& ctx) {
            if (in.is_number()) {
                out = in;
            } else if (ctx.options().loosely) {
                if (in.is_string()) {
                    out = parse_number(in.as_string());
                } else if (in.is_boolean()) {
                    out = value(in.as_boolean() ? 1 : 0);
                }
            }
        });
    }

    void decode_boolean(const field&, CompilerState& state) {
        state.add_setter([](const value& in, std::optional<value>& out, run_context& ctx) {
            if (in.is_boolean()) {
                out = in;
                return;
            }
            if (!ctx.options().loosely) {
                return;
            }
            if (in.is_string()) {
                const auto& s = in.as_string();
                if (s == "true" || s == "1") out = value(true);
                else if (s == "false" || s == "0") out = value(false);
            } else if (in.is_number()) {
                if (in == value(1)) out = value(true);
                else if (in == value(0)) out = value(false);
            }
        });
    }

    void decode_date(const field&, CompilerState& state) {
        state.add_setter([](const value& in, std::optional<value>& out, run_context& ctx) {
            if (in.is_date()) {
                out = in;
            } else if (in.is_string()) {
                if (auto parsed = parse_iso8601(in.as_string())) {
                    out = value(*parsed);
                }
            } else if (in.is_integer() && ctx.options().loosely) {
                out = value(date_time{in.as_integer()});
            }
        });
    }

    void decode_enumeration(const field& property, CompilerState& state) {
        auto def = property.enumeration;
        const bool allow_labels = property.enum_allows_labels;
        const std::string name = property.name;

        state.add_setter([def, allow_labels, name](const value& in, std::optional<value>& out, run_context& ctx) {
            if (def->contains_value(in)) {
                out = in;
                return;
            }
            if (in.is_string()) {
                if (allow_labels) {
                    if (const value* labelled = def->find_by_label(in.as_string())) {
                        out = *labelled;
                        return;
                    }
                }
                // Numeric enums given as text ("1")
                if (ctx.options().loosely) {
                    auto number = parse_number(in.as_string());
                    if (number && def->contains_value(*number)) {
                        out = *number;
                        return;
                    }
                }
            }
            throw invalid_enum_value(ctx.path(), name,
                                     in.is_string() ? in.as_string() : in.to_string(),
                                     def->valid_values(allow_labels));
        });
    }

    void decode_literal(const field& property, CompilerState& state) {
        value literal = *property.literal_value;
        state.add_setter([literal](const value&, std::optional<value>& out, run_context&) {
            out = literal;
        });
    }

    /// Absent input on a required literal field, and null on a non-nullable
    /// one, still decode to the literal
    void prepend_literal(const field& property, CompilerState& state) {
        value literal = *property.literal_value;
        const bool optional = property.is_optional;
        const bool nullable = property.is_nullable;

        state.add_precheck([literal, optional, nullable](const value* in, std::optional<value>& out, run_context&) {
            if ((!in && !optional) || (in && in->is_null() && !nullable)) {
                out = literal;
                return true;
            }
            return false;
        });
    }

    void decode_binary(const field&, CompilerState& state) {
        state.add_setter([](const value& in, std::optional<value>& out, run_context&) {
            if (in.is_binary()) {
                out = in;
            } else if (in.is_string()) {
                if (auto bytes = base64_decode(in.as_string())) {
                    out = value(std::move(*bytes));
                }
            }
        });
    }

    void copy_any(const field&, CompilerState& state) {
        state.add_setter([](const value& in, std::optional<value>& out, run_context&) {
            out = in;
        });
    }

    // ========================================================================
    // Encoders (entity → external)
    // ========================================================================

    void encode_number(const field&, CompilerState& state) {
        state.add_setter([](const value& in, std::optional<value>& out, run_context& ctx) {
            if (in.is_number()) {
                out = in;
            } else if (in.is_string() && ctx.options().loosely) {
                out = parse_number(in.as_string());
            }
        });
    }

    void encode_date(const field&, CompilerState& state) {
        state.add_setter([](const value& in, std::optional<value>& out, run_context&) {
            if (in.is_date()) {
                out = value(format_iso8601(in.as_date()));
            } else {
                out = in;
            }
        });
    }

    void encode_binary(const field&, CompilerState& state) {
        state.add_setter([](const value& in, std::optional<value>& out, run_context&) {
            if (in.is_binary()) {
                out = value(base64_encode(in.as_binary()));
            } else {
                out = in;
            }
        });
    }

    std::unique_ptr<Serializer> make_json_serializer() {
        auto json = std::make_unique<Serializer>("json");

        auto& decoders = json->decoders();
        decoders.register_type(type_tag::string, decode_string);
        decoders.register_type(type_tag::number, decode_number);
        decoders.register_type(type_tag::boolean, decode_boolean);
        decoders.register_type(type_tag::date, decode_date);
        decoders.register_type(type_tag::enumeration, decode_enumeration);
        decoders.register_type(type_tag::literal, decode_literal);
        decoders.register_type(type_tag::any, copy_any);
        decoders.register_for_binary(decode_binary);
        decoders.prepend(type_tag::literal, prepend_literal);

        auto& encoders = json->encoders();
        encoders.register_type(type_tag::string, copy_any);
        encoders.register_type(type_tag::number, encode_number);
        encoders.register_type(type_tag::boolean, copy_any);
        encoders.register_type(type_tag::date, encode_date);
        encoders.register_type(type_tag::enumeration, copy_any);
        encoders.register_type(type_tag::literal, copy_any);
        encoders.register_type(type_tag::any, copy_any);
        encoders.register_for_binary(encode_binary);

        return json;
    }
}

// ============================================================================
// JSON Serializer Plugin
// ============================================================================

class JsonSerializerPlugin : public SerializerPlugin {
public:
    void register_serializer(SerializerRegistry& registry) override {
        registry.register_serializer("json", make_json_serializer());
    }

    [[nodiscard]] std::string get_name() const override {
        return "json";
    }

    [[nodiscard]] std::string get_version() const override {
        return "1.0.0";
    }
};

ENTIFORM_REGISTER_SERIALIZER_PLUGIN(JsonSerializerPlugin);

/**
 * Registers the JSON Serializer unless it already is.
 *
 * Called by SerializerRegistry::instance() and register_builtin(); the call
 * from instance() also forces this translation unit to be linked.
 */
void ensure_json_serializer_registered(SerializerRegistry& registry) {
    if (!registry.has_plugin("json")) {
        registry.register_plugin(std::make_unique<JsonSerializerPlugin>());
    }
}

} // namespace entiform
