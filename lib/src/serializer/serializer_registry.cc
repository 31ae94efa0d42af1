//
// Serializer Registry Implementation
//

#include <entiform/serializer_registry.hh>
#include <entiform/serializer_plugin.hh>
#include <entiform/errors.hh>
#include <algorithm>
#include <cctype>

namespace entiform {

// Defined in json_serializer.cc
void ensure_json_serializer_registered(SerializerRegistry& registry);

// ============================================================================
// Singleton Access
// ============================================================================

SerializerRegistry& SerializerRegistry::instance() {
    static SerializerRegistry registry;

    // Static initialization order is not guaranteed across translation
    // units, so the registry may be reached before the JSON plugin's
    // registrar ran. Registering here also forces that unit to be linked.
    static bool initialized = false;
    if (!initialized) {
        initialized = true;
        ensure_json_serializer_registered(registry);
    }

    return registry;
}

SerializerRegistry::SerializerRegistry() = default;

// ============================================================================
// Serializer Registration & Lookup
// ============================================================================

void SerializerRegistry::register_serializer(const std::string& name,
                                             std::unique_ptr<Serializer> serializer) {
    serializers_[normalize_name(name)] = std::move(serializer);
}

Serializer* SerializerRegistry::get_serializer(const std::string& name) const {
    auto it = serializers_.find(normalize_name(name));
    return (it != serializers_.end()) ? it->second.get() : nullptr;
}

Serializer& SerializerRegistry::require_serializer(const std::string& name) const {
    Serializer* found = get_serializer(name);
    if (!found) {
        throw serializer_not_found(name);
    }
    return *found;
}

bool SerializerRegistry::has_serializer(const std::string& name) const {
    return serializers_.find(normalize_name(name)) != serializers_.end();
}

void SerializerRegistry::register_plugin(std::unique_ptr<SerializerPlugin> plugin) {
    if (!plugin || has_plugin(plugin->get_name())) {
        return;
    }
    plugin->register_serializer(*this);
    plugins_.push_back(std::move(plugin));
}

bool SerializerRegistry::has_plugin(const std::string& name) const {
    const std::string normalized = normalize_name(name);
    return std::any_of(plugins_.begin(), plugins_.end(),
        [&](const auto& p) { return normalize_name(p->get_name()) == normalized; });
}

void SerializerRegistry::register_builtin() {
    ensure_json_serializer_registered(*this);
}

// ============================================================================
// Queries
// ============================================================================

std::vector<std::string> SerializerRegistry::get_available_serializers() const {
    std::vector<std::string> names;
    names.reserve(serializers_.size());

    for (const auto& [name, _] : serializers_) {
        names.push_back(name);
    }

    return names;
}

// ============================================================================
// Private Helpers
// ============================================================================

std::string SerializerRegistry::normalize_name(const std::string& name) {
    std::string normalized = name;
    std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return normalized;
}

} // namespace entiform
