#include <entiform/convert.hh>
#include <entiform/yaml/schema_loader.hh>
#include <entiform/yaml/value_yaml.hh>
#include <doctest/doctest.h>
#include <algorithm>
#include <sstream>

using namespace entiform;

namespace {
    const char* SHOP_DOCUMENT = R"(
enums:
  Color:
    red: 1
    green: 2
entities:
  Product:
    fields:
      - { name: id, type: number, primary: true, auto_increment: true }
      - { name: title, type: string, validators: [ { min_length: 3 }, not_empty ] }
      - { name: price, type: number, validators: [ { minimum: 0 } ] }
      - { name: rating, type: number, default: 0 }
      - { name: color, type: enum, enum: Color, allow_labels: true, optional: true }
      - { name: tags, type: string, array: true, optional: true, groups: [ public ] }
      - { name: seller, type: entity, entity: Seller, reference: true, optional: true }
      - name: kind
        type: union
        optional: true
        candidates:
          - { type: literal, value: a }
          - { type: entity, entity: Seller }
  Seller:
    fields:
      - { name: id, type: number, primary: true }
      - { name: name, type: string }
      - { name: parts, type: entity, entity: Part, array: true, optional: true }
  Part:
    fields:
      - { name: label, type: string }
      - { name: seller, type: entity, entity: Seller, parent_reference: true }
)";

    fkyaml::node parse(const std::string& text) {
        return fkyaml::node::deserialize(text);
    }
}

TEST_SUITE("YAML Value Bridge") {

    TEST_CASE("Scalars and containers") {
        value v = yaml::from_node(parse("{ a: 1, b: 1.5, c: text, d: true, e: null, f: [ 1, two ] }"));
        REQUIRE(v.is_object());
        const auto& o = v.as_object();

        CHECK(o.find("a")->is_integer());
        CHECK(*o.find("a") == value(1));
        CHECK(*o.find("b") == value(1.5));
        CHECK(*o.find("c") == value("text"));
        CHECK(*o.find("d") == value(true));
        CHECK(o.find("e")->is_null());
        CHECK(*o.find("f") == value(array{1, "two"}));
    }

    TEST_CASE("Dumped documents load back") {
        value original = object{
            {"name", "Ann"},
            {"age", 30},
            {"ratio", 0.5},
            {"tags", array{"x", "y"}},
            {"nested", object{{"ok", true}, {"none", nullptr}}},
        };

        std::istringstream in(yaml::dump(original));
        CHECK(yaml::load_document(in) == original);
    }

    TEST_CASE("Decoded-side kinds are written as text") {
        CHECK(yaml::to_node(value(date_time{0})).get_value<std::string>() == "1970-01-01T00:00:00.000Z");
        CHECK(yaml::to_node(value(binary{'M', 'a', 'n'})).get_value<std::string>() == "TWFu");
    }

    TEST_CASE("JSON text") {
        auto parsed = yaml::parse_json_text(R"({"id": 3, "tags": ["a"]})");
        REQUIRE(parsed.has_value());
        CHECK(*parsed == value(object{{"id", 3}, {"tags", array{"a"}}}));

        CHECK(yaml::parse_json_text("  [1, 2]").has_value());
    }

    TEST_CASE("Text that is not a JSON object or array") {
        CHECK_FALSE(yaml::parse_json_text("name: Ann").has_value());
        CHECK_FALSE(yaml::parse_json_text("42").has_value());
        CHECK_FALSE(yaml::parse_json_text("").has_value());
        CHECK_FALSE(yaml::parse_json_text("{\"id\": ").has_value());
        CHECK_FALSE(yaml::parse_json_text("{[1, 2]: x}").has_value());
    }

    TEST_CASE("Missing files") {
        CHECK_THROWS_AS((void)yaml::load_file("/nonexistent/input.yaml"), std::runtime_error);
    }
}

TEST_SUITE("YAML Schema Loader") {

    TEST_CASE("Entities and enums of a document") {
        SchemaRegistry registry;
        yaml::SchemaLoader loader(registry);
        auto document = loader.load(parse(SHOP_DOCUMENT));

        auto entities = document.entities;
        std::sort(entities.begin(), entities.end());
        CHECK(entities == std::vector<std::string>{"Part", "Product", "Seller"});
        REQUIRE(document.enums.count("Color") == 1);
        CHECK(document.enums.at("Color")->items.size() == 2);

        const schema& product = registry.get("Product");
        REQUIRE(product.primary_field() != nullptr);
        CHECK(product.primary_field()->name == "id");
        CHECK(product.auto_increment_field() != nullptr);
        CHECK(product.find_field("title")->validators.size() == 2);
        CHECK(*product.find_field("rating")->default_value == value(0));
        CHECK(product.find_field("color")->enum_allows_labels);
        CHECK(product.find_field("tags")->is_array());
        CHECK(product.find_field("tags")->groups.count("public") == 1);
        CHECK(product.find_field("seller")->is_reference);
        CHECK(product.find_field("kind")->is_union());
        CHECK(product.find_field("kind")->union_candidates.size() == 2);
        CHECK(registry.get("Part").find_field("seller")->is_parent_reference);
    }

    TEST_CASE("Loaded schemas convert and validate") {
        SchemaRegistry registry;
        yaml::SchemaLoader loader(registry);
        (void)loader.load(parse(SHOP_DOCUMENT));

        JitCompiler compiler;
        context ctx{registry, SerializerRegistry::instance(), ValidatorRegistry::instance(), compiler};
        const schema& product = ctx.get_schema("Product");

        value data = object{
            {"title", "Car"},
            {"price", 499},
            {"color", "green"},
            {"seller", 4},
            {"kind", object{{"id", 2}, {"name", "Bo"}}},
        };
        auto car = convert(ctx, product, "json", direction::decode, data).as_entity();
        CHECK(*car->get("rating") == value(0));
        CHECK(*car->get("color") == value(2));
        CHECK(car->get("seller")->as_entity()->is_reference());
        CHECK(car->get("kind")->as_entity()->get_schema().name() == "Seller");

        auto errors = validate(ctx, product, object{{"title", "Ca"}, {"price", -1}});
        REQUIRE(errors.size() == 2);
        CHECK(errors[0].code == "min_length");
        CHECK(errors[1].code == "minimum");
    }

    TEST_CASE("Malformed documents") {
        SchemaRegistry registry;
        yaml::SchemaLoader loader(registry);

        CHECK_THROWS_AS(loader.load(parse("- just\n- a list\n")), yaml::yaml_schema_error);
        CHECK_THROWS_AS(loader.load(parse("enums: {}\n")), yaml::yaml_schema_error);
        CHECK_THROWS_AS(loader.load(parse("entities: { A: { fields: [ { name: x, type: decimal } ] } }")),
                        yaml::yaml_schema_error);
        CHECK_THROWS_AS(loader.load(parse("entities: { B: { fields: [ { name: x, type: enum, enum: Missing } ] } }")),
                        yaml::yaml_schema_error);
        CHECK_THROWS_AS(loader.load(parse("entities: { C: { fields: [ { type: string } ] } }")),
                        yaml::yaml_schema_error);
    }

    TEST_CASE("Inconsistent descriptors surface while loading") {
        SchemaRegistry registry;
        yaml::SchemaLoader loader(registry);

        CHECK_THROWS_AS(loader.load(parse(
            "entities: { D: { fields: [ { name: a, type: number, primary: true }, { name: b, type: number, primary: true } ] } }")),
            schema_definition_error);
    }

    TEST_CASE("Error location") {
        SchemaRegistry registry;
        yaml::SchemaLoader loader(registry);
        try {
            (void)loader.load(parse("entities: { E: { fields: [ { name: x, type: decimal } ] } }"));
            FAIL("expected yaml_schema_error");
        } catch (const yaml::yaml_schema_error& e) {
            CHECK(e.where() == "E.x");
            CHECK(std::string(e.what()) == "Schema document error in 'E.x': unknown type 'decimal'");
        }
    }
}
