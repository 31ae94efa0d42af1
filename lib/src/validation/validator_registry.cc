//
// Validator Registry: built-in type-shape checks
//

#include <entiform/validation.hh>
#include <entiform/text_codec.hh>
#include <atomic>

namespace entiform {

namespace {
    std::atomic<std::uint64_t> g_next_registry_id{1};

    std::string join(const std::vector<std::string>& items) {
        std::string result;
        for (const auto& item : items) {
            if (!result.empty()) result += ", ";
            result += item;
        }
        return result;
    }

    std::optional<rule_failure> check_string(const field&, const value& v) {
        if (v.is_string()) return std::nullopt;
        return rule_failure{"invalid_string", "Not a string"};
    }

    std::optional<rule_failure> check_number(const field&, const value& v) {
        if (v.is_number()) return std::nullopt;
        if (v.is_string() && parse_number(v.as_string())) return std::nullopt;
        return rule_failure{"invalid_number", "Not a number"};
    }

    std::optional<rule_failure> check_boolean(const field&, const value& v) {
        if (v.is_boolean()) return std::nullopt;
        if (v.is_string()) {
            const auto& s = v.as_string();
            if (s == "true" || s == "false" || s == "1" || s == "0") return std::nullopt;
        }
        if (v == value(0) || v == value(1)) return std::nullopt;
        return rule_failure{"invalid_boolean", "Not a boolean"};
    }

    std::optional<rule_failure> check_date(const field&, const value& v) {
        if (v.is_date()) return std::nullopt;
        if (v.is_string() && parse_iso8601(v.as_string())) return std::nullopt;
        return rule_failure{"invalid_date", "Not a valid date"};
    }

    std::optional<rule_failure> check_enumeration(const field& property, const value& v) {
        const auto& def = *property.enumeration;
        if (def.contains_value(v)) return std::nullopt;
        if (v.is_string()) {
            if (property.enum_allows_labels && def.find_by_label(v.as_string())) return std::nullopt;
            auto number = parse_number(v.as_string());
            if (number && def.contains_value(*number)) return std::nullopt;
        }
        return rule_failure{"invalid_enum",
            "Invalid enum value, valid: " + join(def.valid_values(property.enum_allows_labels))};
    }

    std::optional<rule_failure> check_literal(const field& property, const value& v) {
        if (v == *property.literal_value) return std::nullopt;
        return rule_failure{"invalid_literal", "Expected literal " + property.literal_value->to_string()};
    }

    std::optional<rule_failure> check_binary(const field&, const value& v) {
        if (v.is_binary()) return std::nullopt;
        if (v.is_string() && base64_decode(v.as_string())) return std::nullopt;
        return rule_failure{"invalid_binary", "Not valid base64 binary data"};
    }
}

ValidatorRegistry::ValidatorRegistry()
    : id_(g_next_registry_id.fetch_add(1)) {
    checks_[type_tag::string] = check_string;
    checks_[type_tag::number] = check_number;
    checks_[type_tag::boolean] = check_boolean;
    checks_[type_tag::date] = check_date;
    checks_[type_tag::enumeration] = check_enumeration;
    checks_[type_tag::literal] = check_literal;
    checks_[type_tag::binary] = check_binary;
}

ValidatorRegistry& ValidatorRegistry::instance() {
    static ValidatorRegistry registry;
    return registry;
}

void ValidatorRegistry::register_check(type_tag tag, type_check check) {
    checks_[tag] = std::move(check);
    ++revision_;
}

const type_check* ValidatorRegistry::find(type_tag tag) const {
    auto it = checks_.find(tag);
    return it != checks_.end() ? &it->second : nullptr;
}

} // namespace entiform
