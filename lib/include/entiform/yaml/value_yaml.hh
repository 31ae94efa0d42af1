//
// Bridge between neutral values and fkYAML nodes.
//
// Documents are read with fkYAML, which also accepts JSON text (JSON is a
// subset of YAML flow style). Dates and binary values have no YAML
// counterpart and are written as ISO-8601 and base64 strings.
//

#pragma once

#include <entiform/value.hh>
#include <istream>
#include <optional>
#include <string>
#include <string_view>

// fkYAML uses versioned namespaces, so we need to include the header
#include <fkYAML/node.hpp>

namespace entiform::yaml {

value from_node(const fkyaml::node& node);

fkyaml::node to_node(const value& v);

/// Parse a JSON object or array. Block-style YAML, bare scalars and text
/// that is not well-formed give nullopt.
std::optional<value> parse_json_text(std::string_view text);

/// @throws std::runtime_error on syntax errors
value load_document(std::istream& in);

/// @throws std::runtime_error when the file cannot be read or parsed
value load_file(const std::string& path);

/// YAML text of a value
std::string dump(const value& v);

} // namespace entiform::yaml
