#include <entiform/convert.hh>
#include <doctest/doctest.h>

using namespace entiform;

namespace {
    struct fixture {
        SchemaRegistry schemas;
        JitCompiler compiler;
        context ctx{schemas, SerializerRegistry::instance(), ValidatorRegistry::instance(), compiler};

        fixture() {
            schemas.add(SchemaBuilder("Customer")
                .field("id", type_tag::number).primary()
                .field("name", type_tag::string)
                .build());

            schemas.add(SchemaBuilder("Order")
                .field("id", type_tag::number).primary()
                .field("customer", type_tag::entity).references("Customer").reference()
                .field("lines", type_tag::entity).references("Line").as_array()
                .build());

            schemas.add(SchemaBuilder("Line")
                .field("sku", type_tag::string)
                .field("order", type_tag::entity).references("Order").parent_reference()
                .build());

            schemas.add(SchemaBuilder("Note")
                .field("text", type_tag::string)
                .build());

            schemas.add(SchemaBuilder("Account")
                .field("name", type_tag::string).group("public")
                .field("secret", type_tag::string).group("private")
                .field("score", type_tag::number).group("public").group("stats")
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

TEST_SUITE("Foreign References") {

    TEST_CASE_FIXTURE(fixture, "A bare primary key becomes a reference placeholder") {
        auto order = decode("Order", object{{"id", 1}, {"customer", 7}}).as_entity();

        const value& customer = *order->get("customer");
        REQUIRE(customer.is_entity());
        CHECK(customer.as_entity()->is_reference());
        CHECK(customer.as_entity()->primary_key() == std::optional<value>(value(7)));
        CHECK_FALSE(customer.as_entity()->has("name"));
    }

    TEST_CASE_FIXTURE(fixture, "A full object decodes to a full entity") {
        auto order = decode("Order", object{{"id", 1}, {"customer", object{{"id", 7}, {"name", "Ann"}}}}).as_entity();

        const auto& customer = order->get("customer")->as_entity();
        CHECK_FALSE(customer->is_reference());
        CHECK(*customer->get("name") == value("Ann"));
    }

    TEST_CASE_FIXTURE(fixture, "Placeholders encode to their primary key object") {
        auto order = decode("Order", object{{"id", 1}, {"customer", 7}});
        value plain = encode("Order", order);

        CHECK(*plain.as_object().find("customer") == value(object{{"id", 7}}));
    }

    TEST_CASE_FIXTURE(fixture, "Arrays are not primary keys") {
        auto order = decode("Order", object{{"id", 1}, {"customer", array{7}}}).as_entity();
        CHECK_FALSE(order->has("customer"));
    }

    TEST_CASE_FIXTURE(fixture, "Referencing a schema without a primary field") {
        schemas.add(SchemaBuilder("Broken")
            .field("note", type_tag::entity).references("Note").reference()
            .build());

        auto& json = ctx.serializers.require_serializer("json");
        CHECK_THROWS_AS((void)compiler.compile(schemas.get("Broken"), json, direction::decode),
                        schema_definition_error);
        CHECK(compiler.get_stats().pipelines == 0);
    }
}

TEST_SUITE("Parent References") {

    TEST_CASE_FIXTURE(fixture, "Children point at the enclosing entity") {
        value data = object{{"id", 1}, {"lines", array{object{{"sku", "A"}}, object{{"sku", "B"}}}}};
        auto order = decode("Order", data).as_entity();

        const auto& lines = order->get("lines")->as_array();
        REQUIRE(lines.size() == 2);
        for (const auto& line : lines) {
            REQUIRE(line.as_entity()->has("order"));
            CHECK(line.as_entity()->get("order")->as_entity() == order);
            CHECK(line.as_entity()->parent("order") == order);
        }
    }

    TEST_CASE_FIXTURE(fixture, "Children do not keep the enclosing entity alive") {
        value data = object{{"id", 1}, {"lines", array{object{{"sku", "A"}}}}};
        auto order = decode("Order", data).as_entity();
        CHECK(order.use_count() == 1);

        auto line = order->get("lines")->as_array()[0].as_entity();
        std::weak_ptr<entity> released = order;
        order.reset();

        CHECK(released.expired());
        CHECK_FALSE(line->has("order"));
        CHECK(line->parent("order") == nullptr);
    }

    TEST_CASE_FIXTURE(fixture, "Trees with back links compare and print") {
        value data = object{{"id", 1}, {"lines", array{object{{"sku", "A"}}, object{{"sku", "B"}}}}};
        value first = decode("Order", data);
        value second = decode("Order", data);

        CHECK(first == second);
        CHECK_FALSE(first == decode("Order", object{{"id", 1}, {"lines", array{object{{"sku", "C"}}}}}));

        std::string text = first.to_string();
        CHECK(text.find("<parent Order>") != std::string::npos);
        CHECK(text.find("\"B\"") != std::string::npos);
    }

    TEST_CASE_FIXTURE(fixture, "Patched entities become the parent of new children") {
        auto order = make_entity(schemas.get("Order"));
        auto& json = SerializerRegistry::instance().require_serializer("json");
        compiler.compile(schemas.get("Order"), json, direction::decode)->get()
            .apply(object{{"id", 2}, {"lines", array{object{{"sku", "E"}}}}}, *order);

        auto line = order->get("lines")->as_array()[0].as_entity();
        CHECK(line->parent("order") == order);
    }

    TEST_CASE_FIXTURE(fixture, "Encoding skips parent references") {
        value data = object{{"id", 1}, {"lines", array{object{{"sku", "A"}}}}};
        auto order = decode("Order", data).as_entity();

        value plain = encode("Order", value(order));
        CHECK(plain == data);
    }

    TEST_CASE_FIXTURE(fixture, "Ancestors supplied through the options") {
        auto order = make_entity(schemas.get("Order"));
        order->set("id", value(9));

        convert_options options;
        options.parents.push_back(order);

        auto line = decode("Line", object{{"sku", "C"}}, options).as_entity();
        REQUIRE(line->has("order"));
        CHECK(line->get("order")->as_entity() == order);

        auto orphan = decode("Line", object{{"sku", "D"}}).as_entity();
        CHECK_FALSE(orphan->has("order"));
    }
}

TEST_SUITE("Visibility Groups") {

    TEST_CASE_FIXTURE(fixture, "Only fields of the requested groups") {
        value data = object{{"name", "Ann"}, {"secret", "hunter2"}, {"score", 10}};

        convert_options options;
        options.groups = {"public"};
        auto account = decode("Account", data, options).as_entity();

        CHECK(account->has("name"));
        CHECK(account->has("score"));
        CHECK_FALSE(account->has("secret"));
    }

    TEST_CASE_FIXTURE(fixture, "Excluded groups are skipped") {
        value data = object{{"name", "Ann"}, {"secret", "hunter2"}, {"score", 10}};

        convert_options options;
        options.groups_exclude = {"private", "stats"};
        value plain = encode("Account", decode("Account", data), options);

        CHECK(plain == value(object{{"name", "Ann"}}));
    }
}
