#include <entiform/convert.hh>
#include <doctest/doctest.h>

using namespace entiform;

namespace {
    struct fixture {
        SchemaRegistry schemas;
        SerializerRegistry serializers;
        JitCompiler compiler;
        context ctx{schemas, serializers, ValidatorRegistry::instance(), compiler};

        fixture() {
            serializers.register_builtin();

            schemas.add(SchemaBuilder("Owner")
                .field("id", type_tag::number).primary()
                .field("name", type_tag::string)
                .build());

            schemas.add(SchemaBuilder("Pet")
                .field("id", type_tag::string).primary()
                .field("name", type_tag::string)
                .field("born", type_tag::date).optional()
                .field("owner", type_tag::entity).references("Owner").optional()
                .field("toys", type_tag::string).as_array().optional()
                .build());
        }

        const schema& pet() { return schemas.get("Pet"); }

        value rex() {
            return object{
                {"id", "p1"},
                {"name", "Rex"},
                {"born", "2020-05-01T10:00:00.000Z"},
                {"owner", object{{"id", 7}, {"name", "Ann"}}},
                {"toys", array{"ball", "rope"}},
            };
        }
    };
}

TEST_SUITE("Boundary API") {

    TEST_CASE_FIXTURE(fixture, "Global overloads use the process-wide instances") {
        value data = object{{"id", "p2"}, {"name", "Tom"}};
        auto decoded = convert(pet(), "json", direction::decode, data).as_entity();
        CHECK(*decoded->get("name") == value("Tom"));
        CHECK(convert(pet(), "json", direction::encode, value(decoded)) == data);

        CHECK(validate(pet(), object{{"id", "p3"}}).size() == 1);
    }

    TEST_CASE_FIXTURE(fixture, "Unknown serializer names") {
        CHECK_THROWS_AS((void)convert(ctx, pet(), "xml", direction::decode, rex()), serializer_not_found);
        CHECK_THROWS_AS(scoped_serializer(ctx, pet(), "xml"), serializer_not_found);
    }

    TEST_CASE_FIXTURE(fixture, "Context schema lookup") {
        CHECK(&ctx.get_schema("Pet") == &pet());
        CHECK_THROWS_AS((void)ctx.get_schema("Cat"), schema_definition_error);
    }

    TEST_CASE_FIXTURE(fixture, "Clone is a deep copy") {
        auto original = convert(ctx, pet(), "json", direction::decode, rex()).as_entity();
        auto copy = clone_entity(ctx, *original);

        REQUIRE(copy);
        CHECK(copy != original);
        CHECK(*copy == *original);

        const auto& original_owner = original->get("owner")->as_entity();
        const auto& copied_owner = copy->get("owner")->as_entity();
        CHECK(copied_owner != original_owner);

        copied_owner->set("name", value("Bob"));
        CHECK(*original_owner->get("name") == value("Ann"));
    }

    TEST_CASE_FIXTURE(fixture, "Scoped serializer") {
        auto serializer = scoped_serializer(ctx, pet(), "json");
        CHECK(&serializer.get_schema() == &pet());

        auto decoded = serializer.deserialize(rex());
        CHECK(decoded->get("born")->is_date());
        CHECK(serializer.serialize(value(decoded)) == rex());

        value names = serializer.partial_deserialize({"name", "toys"}, rex());
        CHECK(names == value(object{{"name", "Rex"}, {"toys", array{"ball", "rope"}}}));
    }

    TEST_CASE_FIXTURE(fixture, "Property converter") {
        auto id_decoder = property_converter(ctx, pet(), "id", "json", direction::decode);
        CHECK(id_decoder.property().name == "id");

        value raw(12);
        auto converted = id_decoder.run(&raw);
        REQUIRE(converted.has_value());
        CHECK(*converted == value("12"));
        CHECK_FALSE(id_decoder.run(nullptr).has_value());

        auto born_encoder = property_converter(ctx, pet(), "born", "json", direction::encode);
        value when(date_time{0});
        CHECK(*born_encoder.run(&when) == value("1970-01-01T00:00:00.000Z"));

        CHECK_THROWS_AS(property_converter(ctx, pet(), "colour", "json", direction::decode), schema_definition_error);
    }

    TEST_CASE_FIXTURE(fixture, "Registering a type converter") {
        register_type_converter(ctx, "json", direction::encode, type_tag::date,
            [](const field&, CompilerState& state) {
                state.add_setter([](const value& in, std::optional<value>& out, run_context&) {
                    if (in.is_date()) {
                        out = value(in.as_date().millis);
                    }
                });
            });

        auto decoded = convert(ctx, pet(), "json", direction::decode, rex());
        value plain = convert(ctx, pet(), "json", direction::encode, decoded);
        CHECK(*plain.as_object().find("born") == value(std::int64_t{1588327200000}));
    }

    TEST_CASE_FIXTURE(fixture, "Prepended converters run before the primary one") {
        prepend_type_converter(ctx, "json", direction::decode, type_tag::string,
            [](const field& property, CompilerState& state) {
                if (property.name != "name") {
                    return;
                }
                state.add_precheck([](const value* in, std::optional<value>& out, run_context&) {
                    if (!in) {
                        out = value("unnamed");
                        return true;
                    }
                    return false;
                });
            });

        auto decoded = convert(ctx, pet(), "json", direction::decode, object{{"id", "p9"}}).as_entity();
        CHECK(*decoded->get("name") == value("unnamed"));

        decoded = convert(ctx, pet(), "json", direction::decode, rex()).as_entity();
        CHECK(*decoded->get("name") == value("Rex"));
    }

    TEST_CASE_FIXTURE(fixture, "Forked serializers") {
        auto mongo = serializers.require_serializer("json").fork("mongo");
        mongo->decoders().register_type(type_tag::string, [](const field&, CompilerState& state) {
            state.add_setter([](const value& in, std::optional<value>& out, run_context&) {
                if (in.is_string()) {
                    out = value("m:" + in.as_string());
                }
            });
        });
        serializers.register_serializer("mongo", std::move(mongo));

        auto from_mongo = convert(ctx, pet(), "mongo", direction::decode, rex()).as_entity();
        CHECK(*from_mongo->get("name") == value("m:Rex"));
        CHECK(*from_mongo->get("owner")->as_entity()->get("name") == value("m:Ann"));

        auto from_json = convert(ctx, pet(), "json", direction::decode, rex()).as_entity();
        CHECK(*from_json->get("name") == value("Rex"));
    }

    TEST_CASE_FIXTURE(fixture, "Generators see the compile-time context") {
        std::vector<std::string> seen;
        register_type_converter(ctx, "json", direction::decode, type_tag::number,
            [&seen](const field& property, CompilerState& state) {
                seen.push_back(state.setter() + " <- " + state.accessor());
                CHECK(state.dir() == direction::decode);
                CHECK(&state.property() == &property);
                state.add_setter([](const value& in, std::optional<value>& out, run_context&) {
                    out = in;
                });
            });

        (void)convert(ctx, pet(), "json", direction::decode, rex());
        CHECK(seen == std::vector<std::string>{"Owner.id <- data.id"});
    }
}
