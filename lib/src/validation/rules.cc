//
// Built-in validator rules
//

#include <entiform/validation.hh>
#include <entiform/text_codec.hh>
#include <memory>
#include <regex>

namespace entiform::rules {

namespace {
    /// Code points of a string, elements of an array or object
    std::optional<std::size_t> length_of(const value& v) {
        if (v.is_string()) {
            std::size_t count = 0;
            for (unsigned char c : v.as_string()) {
                if ((c & 0xC0) != 0x80) ++count;
            }
            return count;
        }
        if (v.is_array()) return v.as_array().size();
        if (v.is_object()) return v.as_object().size();
        return std::nullopt;
    }

    std::optional<double> number_of(const value& v) {
        if (v.is_number()) return v.as_number();
        if (v.is_string()) {
            if (auto parsed = parse_number(v.as_string())) return parsed->as_number();
        }
        return std::nullopt;
    }

    std::size_t length_argument(const std::string& name, const std::optional<value>& argument) {
        if (!argument || !argument->is_integer() || argument->as_integer() < 0) {
            throw schema_definition_error("", "rule '" + name + "' needs a non-negative integer argument");
        }
        return static_cast<std::size_t>(argument->as_integer());
    }

    double number_argument(const std::string& name, const std::optional<value>& argument) {
        if (!argument || !argument->is_number()) {
            throw schema_definition_error("", "rule '" + name + "' needs a numeric argument");
        }
        return argument->as_number();
    }
}

validator_rule min_length(std::size_t n) {
    return validator_rule{"min_length", [n](const value& v) -> std::optional<rule_failure> {
        auto length = length_of(v);
        if (length && *length < n) {
            return rule_failure{"min_length", "Min length is " + std::to_string(n)};
        }
        return std::nullopt;
    }};
}

validator_rule max_length(std::size_t n) {
    return validator_rule{"max_length", [n](const value& v) -> std::optional<rule_failure> {
        auto length = length_of(v);
        if (length && *length > n) {
            return rule_failure{"max_length", "Max length is " + std::to_string(n)};
        }
        return std::nullopt;
    }};
}

validator_rule minimum(double n) {
    return validator_rule{"minimum", [n](const value& v) -> std::optional<rule_failure> {
        auto number = number_of(v);
        if (number && *number < n) {
            return rule_failure{"minimum", "Number needs to be greater than or equal to " + format_number(n)};
        }
        return std::nullopt;
    }};
}

validator_rule maximum(double n) {
    return validator_rule{"maximum", [n](const value& v) -> std::optional<rule_failure> {
        auto number = number_of(v);
        if (number && *number > n) {
            return rule_failure{"maximum", "Number needs to be smaller than or equal to " + format_number(n)};
        }
        return std::nullopt;
    }};
}

validator_rule pattern(const std::string& regex) {
    std::shared_ptr<const std::regex> compiled;
    try {
        compiled = std::make_shared<const std::regex>(regex, std::regex::ECMAScript);
    } catch (const std::regex_error& e) {
        throw schema_definition_error("", "invalid pattern '" + regex + "': " + e.what());
    }

    return validator_rule{"pattern", [compiled, regex](const value& v) -> std::optional<rule_failure> {
        if (v.is_string() && !std::regex_search(v.as_string(), *compiled)) {
            return rule_failure{"pattern", "Value does not match pattern " + regex};
        }
        return std::nullopt;
    }};
}

validator_rule not_empty() {
    return validator_rule{"not_empty", [](const value& v) -> std::optional<rule_failure> {
        auto length = length_of(v);
        if (length && *length == 0) {
            return rule_failure{"not_empty", "Value may not be empty"};
        }
        return std::nullopt;
    }};
}

validator_rule custom(std::string name, std::function<bool(const value&)> predicate, std::string message) {
    return validator_rule{std::move(name),
        [predicate = std::move(predicate), message = std::move(message)](const value& v) -> std::optional<rule_failure> {
            if (!predicate(v)) {
                return rule_failure{"custom", message};
            }
            return std::nullopt;
        }};
}

validator_rule from_name(const std::string& name, const std::optional<value>& argument) {
    if (name == "min_length") return min_length(length_argument(name, argument));
    if (name == "max_length") return max_length(length_argument(name, argument));
    if (name == "minimum") return minimum(number_argument(name, argument));
    if (name == "maximum") return maximum(number_argument(name, argument));
    if (name == "not_empty") return not_empty();
    if (name == "pattern") {
        if (!argument || !argument->is_string()) {
            throw schema_definition_error("", "rule 'pattern' needs a regular expression argument");
        }
        return pattern(argument->as_string());
    }
    throw schema_definition_error("", "unknown validator rule '" + name + "'");
}

} // namespace entiform::rules
