//
// Schema Registry
//
// Arena of schemas addressed by name. Schemas are either added eagerly or
// declared with a builder that runs on first lookup (memoized). Fields refer
// to other schemas by name and are resolved through the registry owning
// their schema, which is what makes self-referencing schemas possible.
//

#pragma once

#include <entiform/schema.hh>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace entiform {

class SchemaRegistry {
public:
    using builder_fn = std::function<schema()>;

    SchemaRegistry() = default;
    SchemaRegistry(const SchemaRegistry&) = delete;
    SchemaRegistry& operator=(const SchemaRegistry&) = delete;

    /// Process-wide registry, for callers that do not carry their own
    static SchemaRegistry& instance();

    /// Take ownership of a built schema. Replacing an existing name is an error.
    const schema& add(schema s);

    /// Declare a schema built lazily on first get()
    void declare(const std::string& name, builder_fn builder);

    /// Memoized lookup. Throws schema_definition_error for unknown names or a
    /// builder that requires its own schema while running.
    const schema& get(const std::string& name) const;

    [[nodiscard]] bool has(const std::string& name) const;
    [[nodiscard]] std::vector<std::string> names() const;

    /// Drop every schema (tests only; compiled pipelines must be reset too)
    void clear();

private:
    mutable std::recursive_mutex mutex_;
    mutable std::map<std::string, std::unique_ptr<schema>> schemas_;
    mutable std::map<std::string, builder_fn> pending_;
    mutable std::set<std::string> building_;
};

} // namespace entiform
