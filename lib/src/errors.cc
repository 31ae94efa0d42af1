//
// Error message construction
//

#include <entiform/errors.hh>
#include <sstream>

namespace entiform {

namespace {
    std::string join(const std::vector<std::string>& items, const char* separator) {
        std::string result;
        for (std::size_t i = 0; i < items.size(); ++i) {
            if (i > 0) result += separator;
            result += items[i];
        }
        return result;
    }
}

std::string field_error::format() const {
    std::ostringstream oss;
    oss << (path.empty() ? "<root>" : path) << ": " << message;
    if (!code.empty()) {
        oss << " [" << code << "]";
    }
    return oss.str();
}

std::string schema_definition_error::build_message(const std::string& schema_name,
                                                   const std::string& msg) {
    if (schema_name.empty()) {
        return msg;
    }
    return "Schema '" + schema_name + "': " + msg;
}

std::string no_matching_union_variant::build_message(const std::string& field_name,
                                                     const std::vector<std::string>& discriminants) {
    return "No valid discriminant was found for union field '" + field_name +
           "', so could not determine its type. Guards tried: [" + join(discriminants, ",") + "]";
}

std::string invalid_enum_value::build_message(const std::string& field_name,
                                              const std::string& offending,
                                              const std::vector<std::string>& valid_values) {
    return "Invalid enum value given in field '" + field_name + "': " + offending +
           ", valid: " + join(valid_values, ",");
}

std::string validation_failed::build_message(const std::vector<field_error>& errors) {
    std::ostringstream oss;
    oss << "Validation failed with " << errors.size() << " error" << (errors.size() != 1 ? "s" : "");
    for (const auto& e : errors) {
        oss << "\n  " << e.format();
    }
    return oss.str();
}

} // namespace entiform
