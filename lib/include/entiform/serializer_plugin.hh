//
// Serializer Plugin Interface
//
// Enables registration of serializers without modifying the
// SerializerRegistry, which therefore does not depend on any concrete
// Serializer implementation.
//

#pragma once

#include <memory>
#include <string>

namespace entiform {

// Forward declarations
class SerializerRegistry;

// ============================================================================
// Serializer Plugin Interface
// ============================================================================

/**
 * Abstract interface for Serializer plugins.
 *
 * Example usage:
 *
 * ```cpp
 * class BsonSerializerPlugin : public SerializerPlugin {
 * public:
 *     void register_serializer(SerializerRegistry& registry) override {
 *         registry.register_serializer("bson", make_bson_serializer());
 *     }
 *
 *     std::string get_name() const override { return "bson"; }
 *     std::string get_version() const override { return "1.0.0"; }
 * };
 *
 * ENTIFORM_REGISTER_SERIALIZER_PLUGIN(BsonSerializerPlugin);
 * ```
 *
 * The plugin is registered when the containing translation unit is linked
 * into the final executable.
 */
class SerializerPlugin {
public:
    virtual ~SerializerPlugin() = default;

    /**
     * Called during plugin registration to register the Serializer.
     *
     * @param registry The Serializer registry to register with
     */
    virtual void register_serializer(SerializerRegistry& registry) = 0;

    /// Name of the Serializer this plugin provides (e.g., "json")
    virtual std::string get_name() const = 0;

    /// Plugin version (e.g., "1.0.0")
    virtual std::string get_version() const = 0;
};

// ============================================================================
// Plugin Registration Helper
// ============================================================================

/**
 * Registers a plugin with the global SerializerRegistry during static
 * initialization (before main() is called).
 *
 * Usage:
 *   ENTIFORM_REGISTER_SERIALIZER_PLUGIN(MySerializerPlugin);
 */
#define ENTIFORM_REGISTER_SERIALIZER_PLUGIN(PluginClass)                        \
    namespace {                                                                 \
        struct PluginClass##_Registrar {                                        \
            PluginClass##_Registrar();                                          \
        };                                                                      \
        static PluginClass##_Registrar g_##PluginClass##_registrar;            \
        PluginClass##_Registrar::PluginClass##_Registrar() {                   \
            ::entiform::SerializerRegistry::instance().register_plugin(         \
                std::make_unique<PluginClass>()                                 \
            );                                                                  \
        }                                                                       \
    }

} // namespace entiform
