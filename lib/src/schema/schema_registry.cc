//
// Schema Registry Implementation
//

#include <entiform/schema_registry.hh>
#include <entiform/errors.hh>

namespace entiform {

SchemaRegistry& SchemaRegistry::instance() {
    static SchemaRegistry registry;
    return registry;
}

const schema& SchemaRegistry::add(schema s) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    const std::string name = s.name();
    if (schemas_.count(name) || pending_.count(name)) {
        throw schema_definition_error(name, "already registered");
    }

    auto owned = std::make_unique<schema>(std::move(s));
    owned->registry_ = this;
    const schema& ref = *owned;
    schemas_.emplace(name, std::move(owned));
    return ref;
}

void SchemaRegistry::declare(const std::string& name, builder_fn builder) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    if (schemas_.count(name) || pending_.count(name)) {
        throw schema_definition_error(name, "already registered");
    }
    pending_.emplace(name, std::move(builder));
}

const schema& SchemaRegistry::get(const std::string& name) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    auto it = schemas_.find(name);
    if (it != schemas_.end()) {
        return *it->second;
    }

    auto pending = pending_.find(name);
    if (pending == pending_.end()) {
        throw schema_definition_error(name, "unknown schema");
    }
    if (building_.count(name)) {
        throw schema_definition_error(name,
            "schema builder requires its own schema; refer to it by name instead");
    }

    building_.insert(name);
    std::unique_ptr<schema> built;
    try {
        built = std::make_unique<schema>(pending->second());
    } catch (...) {
        building_.erase(name);
        throw;
    }
    building_.erase(name);

    if (built->name() != name) {
        throw schema_definition_error(name,
            "builder produced a schema named '" + built->name() + "'");
    }

    built->registry_ = this;
    pending_.erase(name);
    const schema& ref = *built;
    schemas_.emplace(name, std::move(built));
    return ref;
}

bool SchemaRegistry::has(const std::string& name) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return schemas_.count(name) > 0 || pending_.count(name) > 0;
}

std::vector<std::string> SchemaRegistry::names() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    std::set<std::string> all;
    for (const auto& [name, _] : schemas_) all.insert(name);
    for (const auto& [name, _] : pending_) all.insert(name);
    return {all.begin(), all.end()};
}

void SchemaRegistry::clear() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    schemas_.clear();
    pending_.clear();
    building_.clear();
}

} // namespace entiform
