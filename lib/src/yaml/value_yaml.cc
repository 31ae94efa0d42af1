//
// Value <-> fkYAML node conversion
//

#include <entiform/yaml/value_yaml.hh>
#include <entiform/entity.hh>
#include <entiform/schema.hh>
#include <entiform/text_codec.hh>
#include <fstream>

namespace entiform::yaml {

namespace {
    std::string key_text(const fkyaml::node& key) {
        if (key.is_string()) return key.get_value<std::string>();
        if (key.is_integer()) return std::to_string(key.get_value<std::int64_t>());
        if (key.is_boolean()) return key.get_value<bool>() ? "true" : "false";
        if (key.is_float_number()) return format_number(key.get_value<double>());
        if (key.is_null()) return "null";
        throw std::runtime_error("mapping keys must be scalars");
    }
}

value from_node(const fkyaml::node& node) {
    if (node.is_null()) {
        return value();
    }
    if (node.is_boolean()) {
        return value(node.get_value<bool>());
    }
    if (node.is_integer()) {
        return value(node.get_value<std::int64_t>());
    }
    if (node.is_float_number()) {
        return value(node.get_value<double>());
    }
    if (node.is_string()) {
        return value(node.get_value<std::string>());
    }
    if (node.is_sequence()) {
        array items;
        items.reserve(node.size());
        for (std::size_t i = 0; i < node.size(); ++i) {
            items.push_back(from_node(node[i]));
        }
        return value(std::move(items));
    }

    object members;
    for (auto it = node.begin(); it != node.end(); ++it) {
        members.set(key_text(it.key()), from_node(*it));
    }
    return value(std::move(members));
}

fkyaml::node to_node(const value& v) {
    switch (v.kind()) {
        case value_kind::null:
            return fkyaml::node();
        case value_kind::boolean:
            return fkyaml::node(v.as_boolean());
        case value_kind::integer:
            return fkyaml::node(v.as_integer());
        case value_kind::number:
            return fkyaml::node(v.as_number());
        case value_kind::string:
            return fkyaml::node(v.as_string());
        case value_kind::binary:
            return fkyaml::node(base64_encode(v.as_binary()));
        case value_kind::date:
            return fkyaml::node(format_iso8601(v.as_date()));
        case value_kind::array: {
            fkyaml::node::sequence_type items;
            for (const auto& item : v.as_array()) {
                items.push_back(to_node(item));
            }
            return fkyaml::node::sequence(items);
        }
        case value_kind::object: {
            fkyaml::node result = fkyaml::node::mapping();
            for (const auto& [key, member] : v.as_object()) {
                result[key] = to_node(member);
            }
            return result;
        }
        case value_kind::entity: {
            const auto& e = *v.as_entity();
            fkyaml::node result = fkyaml::node::mapping();
            const auto& fields = e.get_schema().fields();
            for (std::size_t i = 0; i < fields.size(); ++i) {
                // Parent references point back up the tree
                if (fields[i].is_parent_reference) continue;
                if (const value* slot = e.get(i)) {
                    result[fields[i].name] = to_node(*slot);
                }
            }
            return result;
        }
    }
    return fkyaml::node();
}

std::optional<value> parse_json_text(std::string_view text) {
    const auto start = text.find_first_not_of(" \t\r\n");
    if (start == std::string_view::npos || (text[start] != '{' && text[start] != '[')) {
        return std::nullopt;
    }

    fkyaml::node root;
    try {
        root = fkyaml::node::deserialize(std::string(text));
    } catch (const fkyaml::exception&) {
        return std::nullopt;
    }
    if (!root.is_mapping() && !root.is_sequence()) {
        return std::nullopt;
    }

    // Complex mapping keys have no value form
    try {
        return from_node(root);
    } catch (const std::runtime_error&) {
        return std::nullopt;
    }
}

value load_document(std::istream& in) {
    fkyaml::node root;
    try {
        root = fkyaml::node::deserialize(in);
    } catch (const fkyaml::exception& e) {
        throw std::runtime_error("Failed to parse YAML: " + std::string(e.what()));
    }
    return from_node(root);
}

value load_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file: " + path);
    }
    return load_document(file);
}

std::string dump(const value& v) {
    return fkyaml::node::serialize(to_node(v));
}

} // namespace entiform::yaml
