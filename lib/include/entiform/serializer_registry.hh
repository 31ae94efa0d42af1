#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>
#include <entiform/serializer.hh>

namespace entiform {

// Forward declaration
class SerializerPlugin;

// ============================================================================
// Serializer Registry
// ============================================================================

/**
 * Singleton registry of named serializers.
 *
 * The registry is the lookup point used by the boundary API when a caller
 * names a Serializer ("json"). Serializers are registered by plugins during
 * static initialization, or directly by applications that fork an existing
 * Serializer and customize its compiler tables.
 *
 * **Features:**
 * - Singleton pattern for global access
 * - Serializer lookup by name (case-insensitive)
 * - Query registered names
 * - Automatic JSON Serializer registration on first use
 *
 * **Usage Example:**
 * \code
 *   auto& registry = SerializerRegistry::instance();
 *
 *   // Derive a Serializer with one customized decoder
 *   auto mongo = registry.get_serializer("json")->fork("mongo");
 *   mongo->decoders().register_type(type_tag::string, my_generator);
 *   registry.register_serializer("mongo", std::move(mongo));
 * \endcode
 *
 * **Thread Safety:** Registrations happen during bootstrap; lookups after
 * that are read-only.
 */
class SerializerRegistry {
public:
    // ========================================================================
    // Singleton Access
    // ========================================================================

    /**
     * Get the global Serializer registry instance.
     * @return Reference to singleton registry
     */
    static SerializerRegistry& instance();

    /**
     * Standalone registry, used by explicit contexts and tests. It starts
     * empty; call register_builtin() to add the JSON Serializer.
     */
    SerializerRegistry();

    SerializerRegistry(const SerializerRegistry&) = delete;
    SerializerRegistry(SerializerRegistry&&) = delete;
    SerializerRegistry& operator=(const SerializerRegistry&) = delete;
    SerializerRegistry& operator=(SerializerRegistry&&) = delete;

    // ========================================================================
    // Serializer Registration & Lookup
    // ========================================================================

    /**
     * Register a Serializer under a name.
     *
     * @param name Serializer identifier (e.g., "json")
     * @param serializer Unique pointer to the Serializer
     *
     * @note Names are stored in lowercase for case-insensitive lookup
     * @note If a Serializer is already registered, it will be replaced
     */
    void register_serializer(const std::string& name,
                             std::unique_ptr<Serializer> serializer);

    /**
     * Look up a Serializer by name.
     *
     * @param name Serializer identifier (case-insensitive)
     * @return Pointer to the Serializer, or nullptr if not found
     */
    Serializer* get_serializer(const std::string& name) const;

    /**
     * Look up a Serializer by name.
     *
     * @throws serializer_not_found when no Serializer has that name
     */
    Serializer& require_serializer(const std::string& name) const;

    bool has_serializer(const std::string& name) const;

    /**
     * Register a Serializer plugin.
     *
     * The plugin's register_serializer() method is called immediately,
     * unless a plugin of the same name was registered before.
     *
     * @note This method is typically called via the
     *       ENTIFORM_REGISTER_SERIALIZER_PLUGIN macro
     */
    void register_plugin(std::unique_ptr<SerializerPlugin> plugin);

    bool has_plugin(const std::string& name) const;

    /// Register the built-in serializers ("json") into this registry
    void register_builtin();

    // ========================================================================
    // Queries
    // ========================================================================

    /**
     * Get list of all registered Serializer names.
     *
     * @return Vector of names (lowercase, sorted)
     */
    std::vector<std::string> get_available_serializers() const;

private:
    static std::string normalize_name(const std::string& name);

    /// Map of name (lowercase) → Serializer
    std::map<std::string, std::unique_ptr<Serializer>> serializers_;

    /// Registered plugins (for lifetime management and duplicate detection)
    std::vector<std::unique_ptr<SerializerPlugin>> plugins_;
};

} // namespace entiform
