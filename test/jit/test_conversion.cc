#include <entiform/convert.hh>
#include <doctest/doctest.h>
#include <cctype>

using namespace entiform;

namespace {
    std::shared_ptr<const enum_def> make_color() {
        auto def = std::make_shared<enum_def>();
        def->name = "Color";
        def->items = {{"red", 1}, {"green", 2}};
        return def;
    }

    struct fixture {
        SchemaRegistry schemas;
        JitCompiler compiler;
        context ctx{schemas, SerializerRegistry::instance(), ValidatorRegistry::instance(), compiler};

        fixture() {
            schemas.add(SchemaBuilder("Product")
                .field("id", type_tag::number).primary().auto_increment()
                .field("category", type_tag::string)
                .field("title", type_tag::string)
                .field("price", type_tag::number)
                .field("rating", type_tag::number).with_default(0)
                .build());

            schemas.add(SchemaBuilder("User")
                .field("id", type_tag::number).primary()
                .field("name", type_tag::string)
                .field("color", type_tag::enumeration).enumeration(make_color(), true).optional()
                .build());

            schemas.add(SchemaBuilder("Document")
                .field("title", type_tag::string)
                .field("created", type_tag::date)
                .field("payload", type_tag::binary).binary(binary_kind::uint8)
                .field("published", type_tag::boolean)
                .field("tags", type_tag::string).as_array()
                .field("scores", type_tag::number).as_map()
                .field("owner", type_tag::entity).references("User")
                .field("meta", type_tag::any).optional()
                .build());
        }

        value decode(const std::string& name, const value& data, const convert_options& options = {}) {
            return convert(ctx, schemas.get(name), "json", direction::decode, data, options);
        }

        value encode(const std::string& name, const value& data, const convert_options& options = {}) {
            return convert(ctx, schemas.get(name), "json", direction::encode, data, options);
        }
    };
}

TEST_SUITE("JIT Conversion") {

    TEST_CASE_FIXTURE(fixture, "Product scenario: defaults applied, auto-increment left unset") {
        value data = object{{"category", "toys"}, {"title", "Car"}, {"price", 499}};

        auto product = decode("Product", data).as_entity();
        REQUIRE(product);
        CHECK(product->get_schema().name() == "Product");
        CHECK(*product->get("category") == value("toys"));
        CHECK(*product->get("title") == value("Car"));
        CHECK(*product->get("price") == value(499));
        REQUIRE(product->has("rating"));
        CHECK(*product->get("rating") == value(0));
        CHECK_FALSE(product->has("id"));
        CHECK_FALSE(product->primary_key().has_value());
    }

    TEST_CASE_FIXTURE(fixture, "Round trip of every primitive kind") {
        value data = object{
            {"title", "Report"},
            {"created", "2024-01-01T00:00:00.000Z"},
            {"payload", "TWFu"},
            {"published", true},
            {"tags", array{"a", "b"}},
            {"scores", object{{"math", 9}, {"art", 7.5}}},
            {"owner", object{{"id", 1}, {"name", "Ann"}, {"color", 2}}},
            {"meta", object{{"free", array{1, "two"}}}},
        };

        auto doc = decode("Document", data).as_entity();
        REQUIRE(doc);
        CHECK(doc->get("created")->as_date().millis == 1704067200000);
        CHECK(doc->get("payload")->as_binary() == binary{'M', 'a', 'n'});
        REQUIRE(doc->get("owner")->is_entity());
        CHECK(doc->get("owner")->as_entity()->get_schema().name() == "User");

        value back = encode("Document", value(doc));
        CHECK(back == data);
    }

    TEST_CASE_FIXTURE(fixture, "Encoding omits unset fields") {
        value data = object{{"category", "toys"}, {"title", "Car"}, {"price", 499}};
        value plain = encode("Product", decode("Product", data));

        REQUIRE(plain.is_object());
        CHECK_FALSE(plain.as_object().contains("id"));
        CHECK(*plain.as_object().find("rating") == value(0));
    }

    TEST_CASE_FIXTURE(fixture, "Loose coercions") {
        value data = object{{"category", 12}, {"title", "Car"}, {"price", "499"}};

        auto product = decode("Product", data).as_entity();
        CHECK(*product->get("category") == value("12"));
        CHECK(*product->get("price") == value(499));
    }

    TEST_CASE_FIXTURE(fixture, "Strict mode leaves uncoercible fields unset") {
        convert_options strict;
        strict.loosely = false;

        value data = object{{"category", 12}, {"title", "Car"}, {"price", "499"}};
        auto product = decode("Product", data, strict).as_entity();
        CHECK_FALSE(product->has("category"));
        CHECK_FALSE(product->has("price"));
        CHECK(product->has("title"));
    }

    TEST_CASE_FIXTURE(fixture, "Null on a non-nullable field falls back to the default") {
        value data = object{{"title", "Car"}, {"rating", nullptr}};
        auto product = decode("Product", data).as_entity();
        CHECK(*product->get("rating") == value(0));
        CHECK_FALSE(product->has("price"));
    }

    TEST_CASE_FIXTURE(fixture, "Enumeration labels and invalid values") {
        auto user = decode("User", object{{"id", 1}, {"name", "Ann"}, {"color", "green"}}).as_entity();
        CHECK(*user->get("color") == value(2));

        try {
            (void)decode("User", object{{"id", 1}, {"name", "Ann"}, {"color", 5}});
            FAIL("expected invalid_enum_value");
        } catch (const invalid_enum_value& e) {
            CHECK(e.path() == "color");
            CHECK(e.offending() == "5");
            CHECK(e.valid_values() == std::vector<std::string>{"1", "2", "red", "green"});
        }
    }

    TEST_CASE_FIXTURE(fixture, "Nested errors carry the full path") {
        value data = object{{"title", "Report"}, {"owner", object{{"id", 1}, {"color", "blue"}}}};
        try {
            (void)decode("Document", data);
            FAIL("expected invalid_enum_value");
        } catch (const invalid_enum_value& e) {
            CHECK(e.path() == "owner.color");
        }
    }

    TEST_CASE_FIXTURE(fixture, "Containers") {
        value data = object{{"title", "x"}, {"tags", array{"a", nullptr, array{}}}, {"scores", "oops"}};
        auto doc = decode("Document", data).as_entity();

        REQUIRE(doc->get("tags")->is_array());
        const auto& tags = doc->get("tags")->as_array();
        REQUIRE(tags.size() == 3);
        CHECK(tags[0] == value("a"));
        CHECK(tags[1].is_null());
        CHECK(tags[2].is_null());

        CHECK(*doc->get("scores") == value(object{}));

        auto replaced = decode("Document", object{{"tags", "not-a-list"}}).as_entity();
        CHECK(*replaced->get("tags") == value(array{}));
    }

    TEST_CASE_FIXTURE(fixture, "Root input of the wrong shape") {
        CHECK_THROWS_AS((void)decode("Product", value("text")), conversion_error);
        CHECK_THROWS_AS((void)encode("Product", value(12)), conversion_error);
    }

    TEST_CASE_FIXTURE(fixture, "An entity of the same schema decodes to itself") {
        auto product = decode("Product", object{{"title", "Car"}}).as_entity();
        value again = decode("Product", value(product));
        CHECK(again.as_entity() == product);
    }

    TEST_CASE_FIXTURE(fixture, "Nested entity given as JSON text") {
        value data = object{{"title", "x"}, {"owner", R"({"id": 3, "name": "Bo"})"}};
        auto doc = decode("Document", data).as_entity();
        REQUIRE(doc->has("owner"));
        CHECK(*doc->get("owner")->as_entity()->get("name") == value("Bo"));

        auto broken = decode("Document", object{{"owner", "{not json"}}).as_entity();
        CHECK_FALSE(broken->has("owner"));

        auto block = decode("Document", object{{"owner", "name: Bo"}}).as_entity();
        CHECK_FALSE(block->has("owner"));

        convert_options strict;
        strict.loosely = false;
        auto strict_doc = decode("Document", data, strict).as_entity();
        CHECK_FALSE(strict_doc->has("owner"));
    }
}

TEST_SUITE("JIT Compiler Cache") {

    TEST_CASE_FIXTURE(fixture, "Same key yields the same pipeline") {
        auto& json = ctx.serializers.require_serializer("json");
        const schema& product = schemas.get("Product");

        auto first = compiler.compile(product, json, direction::decode);
        auto second = compiler.compile(product, json, direction::decode);
        CHECK(first == second);
        CHECK(compiler.get_stats().builds == 1);

        auto encoder = compiler.compile(product, json, direction::encode);
        CHECK(encoder != first);
        CHECK(compiler.get_stats().builds == 2);
    }

    TEST_CASE_FIXTURE(fixture, "Nested schemas are compiled once") {
        auto& json = ctx.serializers.require_serializer("json");
        (void)compiler.compile(schemas.get("Document"), json, direction::decode);
        (void)compiler.compile(schemas.get("User"), json, direction::decode);

        CHECK(compiler.get_stats().builds == 2);
        CHECK(compiler.get_stats().pipelines == 2);
    }

    TEST_CASE_FIXTURE(fixture, "Registering a generator invalidates cached pipelines") {
        SerializerRegistry local;
        local.register_builtin();
        context local_ctx{schemas, local, ValidatorRegistry::instance(), compiler};

        const schema& product = schemas.get("Product");
        value data = object{{"title", "car"}};

        auto before = convert(local_ctx, product, "json", direction::decode, data).as_entity();
        CHECK(*before->get("title") == value("car"));

        register_type_converter(local_ctx, "json", direction::decode, type_tag::string,
            [](const field&, CompilerState& state) {
                state.add_setter([](const value& in, std::optional<value>& out, run_context&) {
                    if (in.is_string()) {
                        std::string upper = in.as_string();
                        for (auto& c : upper) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
                        out = value(upper);
                    }
                });
            });

        auto after = convert(local_ctx, product, "json", direction::decode, data).as_entity();
        CHECK(*after->get("title") == value("CAR"));
    }

    TEST_CASE_FIXTURE(fixture, "Reset drops every pipeline") {
        auto& json = ctx.serializers.require_serializer("json");
        (void)compiler.compile(schemas.get("Product"), json, direction::decode);
        REQUIRE(compiler.get_stats().pipelines == 1);

        compiler.reset();
        CHECK(compiler.get_stats().pipelines == 0);
        CHECK(compiler.get_stats().builds == 0);
    }

    TEST_CASE_FIXTURE(fixture, "Pipeline metadata") {
        auto& json = ctx.serializers.require_serializer("json");
        auto handle = compiler.compile(schemas.get("Product"), json, direction::encode);
        const CompiledPipeline& pipeline = handle->get();

        CHECK(&pipeline.get_schema() == &schemas.get("Product"));
        CHECK(&pipeline.serializer() == &json);
        CHECK(pipeline.dir() == direction::encode);
        CHECK_FALSE(pipeline.is_partial());
        CHECK(pipeline.plans().size() == 5);
    }
}
