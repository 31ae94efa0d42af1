#include <entiform/yaml/schema_loader.hh>
#include <entiform/yaml/value_yaml.hh>
#include <entiform/validation.hh>
#include <fstream>

namespace entiform::yaml {

namespace {
    bool flag(const fkyaml::node& item, const char* key) {
        return item.contains(key) && item[key].is_boolean() && item[key].get_value<bool>();
    }

    std::string text(const std::string& where, const fkyaml::node& item, const char* key) {
        if (!item[key].is_string()) {
            throw yaml_schema_error(where, std::string("'") + key + "' must be a string");
        }
        return item[key].get_value<std::string>();
    }
}

SchemaLoader::SchemaLoader(SchemaRegistry& registry)
    : registry_(registry) {
}

schema_document SchemaLoader::load_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file: " + path);
    }

    fkyaml::node root;
    try {
        root = fkyaml::node::deserialize(file);
    } catch (const fkyaml::exception& e) {
        throw std::runtime_error("Failed to parse YAML: " + std::string(e.what()));
    }

    return load(root);
}

schema_document SchemaLoader::load(const fkyaml::node& root) {
    if (!root.is_mapping()) {
        throw yaml_schema_error("<document>", "root must be a mapping");
    }

    schema_document document;

    // Enums first, fields refer to them
    if (root.contains("enums")) {
        parse_enums(root["enums"], document);
    }

    if (!root.contains("entities") || !root["entities"].is_mapping()) {
        throw yaml_schema_error("<document>", "'entities' must be a mapping");
    }

    const auto& entities = root["entities"];
    for (auto it = entities.begin(); it != entities.end(); ++it) {
        std::string name = it.key().get_value<std::string>();
        const auto& definition = (*it);

        if (!definition.is_mapping() || !definition.contains("fields")) {
            throw yaml_schema_error(name, "entity needs a 'fields' sequence");
        }

        std::vector<field> fields = parse_fields(name, definition["fields"], document);
        registry_.declare(name, [name, fields]() {
            SchemaBuilder builder(name);
            for (const auto& f : fields) {
                builder.add(f);
            }
            return builder.build();
        });
        document.entities.push_back(name);
    }

    for (const auto& name : document.entities) {
        (void)registry_.get(name);
    }

    return document;
}

void SchemaLoader::parse_enums(const fkyaml::node& enums, schema_document& document) {
    if (!enums.is_mapping()) {
        throw yaml_schema_error("enums", "'enums' must be a mapping");
    }

    for (auto it = enums.begin(); it != enums.end(); ++it) {
        auto def = std::make_shared<enum_def>();
        def->name = it.key().get_value<std::string>();

        const auto& items = (*it);
        if (!items.is_mapping()) {
            throw yaml_schema_error(def->name, "enum definition must be a mapping of label to value");
        }
        for (auto item = items.begin(); item != items.end(); ++item) {
            def->items.emplace_back(item.key().get_value<std::string>(), from_node(*item));
        }

        document.enums[def->name] = std::move(def);
    }
}

std::vector<field> SchemaLoader::parse_fields(const std::string& entity_name, const fkyaml::node& fields,
                                              const schema_document& document) {
    if (!fields.is_sequence()) {
        throw yaml_schema_error(entity_name, "'fields' must be a sequence");
    }

    std::vector<field> result;
    for (std::size_t i = 0; i < fields.size(); ++i) {
        result.push_back(build_field(entity_name, fields[i], document, false));
    }
    return result;
}

field SchemaLoader::build_field(const std::string& entity_name, const fkyaml::node& item,
                                const schema_document& document, bool is_candidate) {
    if (!item.is_mapping()) {
        throw yaml_schema_error(entity_name, "field descriptors must be mappings");
    }

    field f;
    if (item.contains("name")) {
        f.name = text(entity_name, item, "name");
    } else if (!is_candidate) {
        throw yaml_schema_error(entity_name, "field without a 'name'");
    }
    const std::string where = entity_name + "." + f.name;

    if (item.contains("type")) {
        std::string type_name = text(where, item, "type");
        auto tag = type_tag_from_name(type_name);
        if (!tag) {
            throw yaml_schema_error(where, "unknown type '" + type_name + "'");
        }
        f.type = *tag;
    } else if (item.contains("candidates")) {
        f.type = type_tag::union_type;
    }

    if (flag(item, "array")) f.container = container_kind::array;
    if (flag(item, "map")) f.container = container_kind::map;
    f.is_optional = flag(item, "optional");
    f.is_nullable = flag(item, "nullable");
    f.is_primary = flag(item, "primary");
    f.is_auto_increment = flag(item, "auto_increment");
    f.is_reference = flag(item, "reference");
    f.is_parent_reference = flag(item, "parent_reference");
    f.enum_allows_labels = flag(item, "allow_labels");

    if (item.contains("default")) {
        f.default_value = from_node(item["default"]);
    }
    if (item.contains("value")) {
        f.literal_value = from_node(item["value"]);
    }

    if (item.contains("enum")) {
        std::string enum_name = text(where, item, "enum");
        auto found = document.enums.find(enum_name);
        if (found == document.enums.end()) {
            throw yaml_schema_error(where, "unknown enum '" + enum_name + "'");
        }
        f.enumeration = found->second;
    }

    if (item.contains("binary")) {
        std::string kind_name = text(where, item, "binary");
        auto kind = binary_kind_from_name(kind_name);
        if (!kind) {
            throw yaml_schema_error(where, "unknown binary kind '" + kind_name + "'");
        }
        f.binary = *kind;
    }

    if (item.contains("entity")) {
        f.referenced = schema_ref(text(where, item, "entity"));
    }

    if (item.contains("groups")) {
        const auto& groups = item["groups"];
        if (!groups.is_sequence()) {
            throw yaml_schema_error(where, "'groups' must be a sequence");
        }
        for (std::size_t i = 0; i < groups.size(); ++i) {
            f.groups.insert(groups[i].get_value<std::string>());
        }
    }

    if (item.contains("validators")) {
        const auto& validators = item["validators"];
        if (!validators.is_sequence()) {
            throw yaml_schema_error(where, "'validators' must be a sequence");
        }
        for (std::size_t i = 0; i < validators.size(); ++i) {
            const auto& rule = validators[i];
            if (rule.is_string()) {
                f.validators.push_back(rules::from_name(rule.get_value<std::string>(), std::nullopt));
            } else if (rule.is_mapping() && rule.size() == 1) {
                auto it = rule.begin();
                f.validators.push_back(rules::from_name(it.key().get_value<std::string>(), from_node(*it)));
            } else {
                throw yaml_schema_error(where, "validators are names or single-key mappings");
            }
        }
    }

    if (item.contains("candidates")) {
        const auto& candidates = item["candidates"];
        if (!candidates.is_sequence()) {
            throw yaml_schema_error(where, "'candidates' must be a sequence");
        }
        for (std::size_t i = 0; i < candidates.size(); ++i) {
            field candidate = build_field(entity_name, candidates[i], document, true);
            if (candidate.name.empty()) {
                candidate.name = f.name;
            }
            f.union_candidates.push_back(union_candidate{std::move(candidate), {}});
        }
    }

    return f;
}

} // namespace entiform::yaml
