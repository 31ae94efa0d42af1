#pragma once

#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>
#include <entiform/schema.hh>
#include <entiform/schema_registry.hh>

// fkYAML uses versioned namespaces, so we need to include the header
#include <fkYAML/node.hpp>

namespace entiform::yaml {

/**
 * Exception thrown for malformed schema documents.
 */
class yaml_schema_error : public std::runtime_error {
public:
    yaml_schema_error(const std::string& where, const std::string& message)
        : std::runtime_error(format_error(where, message))
        , where_(where) {}

    /// Entity or enum the error was found in, or the document section
    const std::string& where() const { return where_; }

private:
    std::string where_;

    static std::string format_error(const std::string& where,
                                    const std::string& message) {
        std::string result = "Schema document error in '";
        result += where;
        result += "': ";
        result += message;
        return result;
    }
};

/// What a document contributed to the registry
struct schema_document {
    std::vector<std::string> entities;  ///< In document order
    std::map<std::string, std::shared_ptr<const enum_def>> enums;
};

/**
 * Declares the entities of a YAML schema document in a SchemaRegistry.
 *
 * Document layout:
 * \code
 *   enums:
 *     Color: { red: 1, green: 2 }
 *   entities:
 *     Product:
 *       fields:
 *         - { name: id, type: number, primary: true, auto_increment: true }
 *         - { name: title, type: string, validators: [{ min_length: 3 }] }
 *         - { name: color, type: enum, enum: Color, allow_labels: true }
 *         - { name: owner, type: entity, entity: User, reference: true }
 *         - name: kind
 *           type: union
 *           candidates: [{ type: literal, value: a }, { type: entity, entity: Shape }]
 * \endcode
 *
 * Entities are declared lazily, so they may refer to each other (and to
 * themselves) by name in any order. Every declared entity is built before
 * load() returns, so descriptor errors surface here.
 */
class SchemaLoader {
public:
    explicit SchemaLoader(SchemaRegistry& registry);

    /**
     * @throws yaml_schema_error for malformed documents
     * @throws schema_definition_error for inconsistent descriptors
     * @throws std::runtime_error for file I/O and YAML syntax errors
     */
    schema_document load_file(const std::string& path);

    schema_document load(const fkyaml::node& root);

private:
    void parse_enums(const fkyaml::node& enums, schema_document& document);
    std::vector<field> parse_fields(const std::string& entity_name, const fkyaml::node& fields,
                                    const schema_document& document);
    field build_field(const std::string& entity_name, const fkyaml::node& item,
                      const schema_document& document, bool is_candidate);

    SchemaRegistry& registry_;
};

} // namespace entiform::yaml
