#include <entiform/convert.hh>
#include <doctest/doctest.h>
#include <thread>
#include <vector>

using namespace entiform;

namespace {
    struct fixture {
        SchemaRegistry schemas;
        JitCompiler compiler;
        context ctx{schemas, SerializerRegistry::instance(), ValidatorRegistry::instance(), compiler};

        fixture() {
            schemas.add(SchemaBuilder("Node")
                .field("label", type_tag::string)
                .field("next", type_tag::entity).references("Node").optional()
                .field("children", type_tag::entity).references("Node").as_array().optional()
                .build());

            // Declared in reverse dependency order on purpose
            schemas.declare("Book", []() {
                return SchemaBuilder("Book")
                    .field("title", type_tag::string)
                    .field("author", type_tag::entity).references("Author").optional()
                    .build();
            });
            schemas.declare("Author", []() {
                return SchemaBuilder("Author")
                    .field("name", type_tag::string)
                    .field("books", type_tag::entity).references("Book").as_array().optional()
                    .build();
            });
        }
    };

    std::string label_of(const value& node) {
        return node.as_entity()->get("label")->as_string();
    }
}

TEST_SUITE("Cyclic Schemas") {

    TEST_CASE_FIXTURE(fixture, "Self-referencing schema compiles once") {
        auto& json = ctx.serializers.require_serializer("json");
        const schema& node = schemas.get("Node");

        auto pipeline = compiler.compile(node, json, direction::decode);
        REQUIRE(pipeline->is_bound());

        auto stats = compiler.get_stats();
        CHECK(stats.builds == 1);
        CHECK(stats.pipelines == 1);
        CHECK(stats.forward_references >= 1);

        CHECK(compiler.compile(node, json, direction::decode) == pipeline);
    }

    TEST_CASE_FIXTURE(fixture, "Self-referencing data of arbitrary depth") {
        value data = object{
            {"label", "a"},
            {"next", object{{"label", "b"}, {"next", object{{"label", "c"}}}}},
            {"children", array{object{{"label", "x"}}, object{{"label", "y"}, {"children", array{}}}}},
        };

        value decoded = convert(ctx, schemas.get("Node"), "json", direction::decode, data);
        auto a = decoded.as_entity();

        CHECK(label_of(decoded) == "a");
        const value& b = *a->get("next");
        CHECK(label_of(b) == "b");
        const value& c = *b.as_entity()->get("next");
        CHECK(label_of(c) == "c");
        CHECK_FALSE(c.as_entity()->has("next"));

        const auto& children = a->get("children")->as_array();
        REQUIRE(children.size() == 2);
        CHECK(label_of(children[0]) == "x");
        CHECK(label_of(children[1]) == "y");

        value encoded = convert(ctx, schemas.get("Node"), "json", direction::encode, decoded);
        CHECK(encoded == data);
    }

    TEST_CASE_FIXTURE(fixture, "Mutually referencing schemas") {
        value data = object{
            {"name", "Ann"},
            {"books", array{
                object{{"title", "First"}, {"author", object{{"name", "Ann"}}}},
                object{{"title", "Second"}},
            }},
        };

        value decoded = convert(ctx, schemas.get("Author"), "json", direction::decode, data);
        const auto& books = decoded.as_entity()->get("books")->as_array();
        REQUIRE(books.size() == 2);
        CHECK(*books[0].as_entity()->get("title") == value("First"));

        const value& nested_author = *books[0].as_entity()->get("author");
        CHECK(nested_author.as_entity()->get_schema().name() == "Author");
        CHECK(*nested_author.as_entity()->get("name") == value("Ann"));

        CHECK(convert(ctx, schemas.get("Author"), "json", direction::encode, decoded) == data);

        auto stats = compiler.get_stats();
        CHECK(stats.forward_references >= 1);
        // Author and Book, once per direction
        CHECK(stats.pipelines == 4);
    }

    TEST_CASE_FIXTURE(fixture, "Compiling from either end of a cycle") {
        auto& json = ctx.serializers.require_serializer("json");

        auto book = compiler.compile(schemas.get("Book"), json, direction::decode);
        auto author = compiler.compile(schemas.get("Author"), json, direction::decode);
        CHECK(book->is_bound());
        CHECK(author->is_bound());
        CHECK(compiler.get_stats().builds == 2);
    }

    TEST_CASE_FIXTURE(fixture, "Cyclic validators") {
        value data = object{
            {"label", "a"},
            {"next", object{{"label", 5}}},
        };

        auto errors = validate(ctx, schemas.get("Node"), data);
        REQUIRE(errors.size() == 1);
        CHECK(errors[0].path == "next.label");
        CHECK(errors[0].code == "invalid_string");
    }

    TEST_CASE_FIXTURE(fixture, "Held pipelines outlive a reset") {
        auto& json = ctx.serializers.require_serializer("json");

        (void)compiler.compile(schemas.get("Author"), json, direction::decode);
        auto book = compiler.compile(schemas.get("Book"), json, direction::decode);
        compiler.reset();
        CHECK(compiler.get_stats().pipelines == 0);

        value data = object{
            {"title", "T"},
            {"author", object{{"name", "Ann"}, {"books", array{object{{"title", "U"}}}}}},
        };
        auto decoded = book->get().run(data).as_entity();
        const auto& author = decoded->get("author")->as_entity();
        CHECK(*author->get("name") == value("Ann"));
        CHECK(*author->get("books")->as_array()[0].as_entity()->get("title") == value("U"));
    }

    TEST_CASE_FIXTURE(fixture, "Held self-referencing pipeline outlives a reset") {
        auto& json = ctx.serializers.require_serializer("json");

        auto node = compiler.compile(schemas.get("Node"), json, direction::decode);
        compiler.reset();

        value decoded = node->get().run(object{{"label", "a"}, {"next", object{{"label", "b"}}}});
        CHECK(label_of(*decoded.as_entity()->get("next")) == "b");
    }

    TEST_CASE_FIXTURE(fixture, "Concurrent requests share one build") {
        auto& json = ctx.serializers.require_serializer("json");
        const schema& node = schemas.get("Node");

        constexpr std::size_t THREADS = 8;
        std::vector<pipeline_handle> handles(THREADS);
        std::vector<std::thread> workers;
        for (std::size_t i = 0; i < THREADS; ++i) {
            workers.emplace_back([&, i]() {
                handles[i] = compiler.compile(node, json, direction::decode);
            });
        }
        for (auto& worker : workers) {
            worker.join();
        }

        for (const auto& h : handles) {
            REQUIRE(h != nullptr);
            CHECK(h == handles.front());
            CHECK(h->is_bound());
        }
        CHECK(compiler.get_stats().builds == 1);
        CHECK(compiler.get_stats().pipelines == 1);
    }
}
