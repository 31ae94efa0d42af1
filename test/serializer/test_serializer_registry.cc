#include <entiform/errors.hh>
#include <entiform/serializer.hh>
#include <entiform/serializer_plugin.hh>
#include <entiform/serializer_registry.hh>
#include <doctest/doctest.h>

using namespace entiform;

namespace {
    void mark_string(const field&, CompilerState& state) {
        state.add_setter([](const value& in, std::optional<value>& out, run_context&) {
            out = value("custom:" + in.to_string());
        });
    }

    class EchoPlugin : public SerializerPlugin {
    public:
        explicit EchoPlugin(int& calls) : calls_(calls) {}

        void register_serializer(SerializerRegistry& registry) override {
            ++calls_;
            registry.register_serializer("echo", std::make_unique<Serializer>("echo"));
        }

        [[nodiscard]] std::string get_name() const override { return "echo"; }
        [[nodiscard]] std::string get_version() const override { return "0.1.0"; }

    private:
        int& calls_;
    };
}

TEST_SUITE("Serializer Registry") {

    TEST_CASE("Global instance provides the JSON Serializer") {
        auto& registry = SerializerRegistry::instance();
        CHECK(registry.has_serializer("json"));
        CHECK(registry.has_serializer("JSON"));
        CHECK(registry.require_serializer("json").name() == "json");
    }

    TEST_CASE("Standalone registry starts empty") {
        SerializerRegistry registry;
        CHECK_FALSE(registry.has_serializer("json"));
        CHECK(registry.get_serializer("json") == nullptr);
        CHECK_THROWS_AS((void)registry.require_serializer("json"), serializer_not_found);

        registry.register_builtin();
        CHECK(registry.has_serializer("json"));
        CHECK(registry.has_plugin("json"));

        // A second registration is a no-op
        Serializer* before = registry.get_serializer("json");
        registry.register_builtin();
        CHECK(registry.get_serializer("json") == before);
    }

    TEST_CASE("Plugins register once per name") {
        SerializerRegistry registry;
        int calls = 0;

        registry.register_plugin(std::make_unique<EchoPlugin>(calls));
        registry.register_plugin(std::make_unique<EchoPlugin>(calls));

        CHECK(calls == 1);
        CHECK(registry.has_plugin("echo"));
        CHECK(registry.has_serializer("echo"));
    }

    TEST_CASE("Available names are sorted and lowercase") {
        SerializerRegistry registry;
        registry.register_serializer("Zeta", std::make_unique<Serializer>("zeta"));
        registry.register_serializer("alpha", std::make_unique<Serializer>("alpha"));

        CHECK(registry.get_available_serializers() == std::vector<std::string>{"alpha", "zeta"});
    }

    TEST_CASE("Unknown names raise serializer_not_found") {
        SerializerRegistry registry;
        try {
            (void)registry.require_serializer("mongo");
            FAIL("expected serializer_not_found");
        } catch (const serializer_not_found& e) {
            CHECK(e.name() == "mongo");
        }
    }
}

TEST_SUITE("Compiler Table") {

    TEST_CASE("Last primary registration wins") {
        CompilerTable table;
        CHECK_FALSE(table.has(type_tag::string));

        table.register_type(type_tag::string, mark_string);
        auto first_revision = table.revision();
        table.register_type(type_tag::string, mark_string);

        CHECK(table.has(type_tag::string));
        CHECK(table.revision() > first_revision);
    }

    TEST_CASE("Prepends accumulate in registration order") {
        CompilerTable table;
        table.prepend(type_tag::number, mark_string);
        table.prepend(type_tag::number, mark_string);

        CHECK(table.prepends(type_tag::number).size() == 2);
        CHECK(table.prepends(type_tag::string).empty());
    }

    TEST_CASE("Binary generator applies to the binary tag") {
        CompilerTable table;
        table.register_for_binary(mark_string);
        CHECK(table.has(type_tag::binary));
    }
}

TEST_SUITE("Serializer") {

    TEST_CASE("Fork copies both tables") {
        auto& json = SerializerRegistry::instance().require_serializer("json");
        auto forked = json.fork("mongo");

        CHECK(forked->name() == "mongo");
        CHECK(forked->id() != json.id());
        CHECK(forked->decoders().has(type_tag::string));
        CHECK(forked->encoders().has(type_tag::date));
    }

    TEST_CASE("Changes to a fork leave the original alone") {
        SerializerRegistry registry;
        registry.register_builtin();
        auto& json = registry.require_serializer("json");
        const auto json_revision = json.revision();

        auto forked = json.fork("custom");
        forked->decoders().register_type(type_tag::string, mark_string);

        CHECK(json.revision() == json_revision);
        CHECK(forked->revision() != json_revision);
    }

    TEST_CASE("Table by direction") {
        Serializer s("plain");
        CHECK(&s.table(direction::decode) == &s.decoders());
        CHECK(&s.table(direction::encode) == &s.encoders());
    }
}
