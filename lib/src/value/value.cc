//
// Neutral value model
//

#include <entiform/value.hh>
#include <entiform/entity.hh>
#include <entiform/schema.hh>
#include <entiform/text_codec.hh>
#include <algorithm>
#include <charconv>
#include <cmath>
#include <sstream>

namespace entiform {

namespace {
    void append_quoted(std::ostringstream& oss, const std::string& s) {
        oss << '"';
        for (char c : s) {
            switch (c) {
                case '"':  oss << "\\\""; break;
                case '\\': oss << "\\\\"; break;
                case '\n': oss << "\\n"; break;
                case '\t': oss << "\\t"; break;
                default:   oss << c; break;
            }
        }
        oss << '"';
    }
}

const char* value_kind_name(value_kind kind) {
    switch (kind) {
        case value_kind::null:    return "null";
        case value_kind::boolean: return "boolean";
        case value_kind::integer: return "integer";
        case value_kind::number:  return "number";
        case value_kind::string:  return "string";
        case value_kind::binary:  return "binary";
        case value_kind::date:    return "date";
        case value_kind::array:   return "array";
        case value_kind::object:  return "object";
        case value_kind::entity:  return "entity";
    }
    return "unknown";
}

// ============================================================================
// Value
// ============================================================================

value::value(array items)
    : data_(std::make_shared<const array>(std::move(items))) {
}

value::value(object members)
    : data_(std::make_shared<const object>(std::move(members))) {
}

value::value(std::shared_ptr<entity> e) {
    if (e) {
        data_ = std::move(e);
    }
}

value_kind value::kind() const {
    switch (data_.index()) {
        case 0: return value_kind::null;
        case 1: return value_kind::boolean;
        case 2: return value_kind::integer;
        case 3: return value_kind::number;
        case 4: return value_kind::string;
        case 5: return value_kind::binary;
        case 6: return value_kind::date;
        case 7: return value_kind::array;
        case 8: return value_kind::object;
        default: return value_kind::entity;
    }
}

bool value::is_array() const {
    return std::holds_alternative<std::shared_ptr<const array>>(data_);
}

bool value::is_object() const {
    return std::holds_alternative<std::shared_ptr<const object>>(data_);
}

bool value::is_entity() const {
    return std::holds_alternative<std::shared_ptr<entity>>(data_);
}

std::int64_t value::as_integer() const {
    if (const auto* d = std::get_if<double>(&data_)) {
        return static_cast<std::int64_t>(*d);
    }
    return std::get<std::int64_t>(data_);
}

double value::as_number() const {
    if (const auto* i = std::get_if<std::int64_t>(&data_)) {
        return static_cast<double>(*i);
    }
    return std::get<double>(data_);
}

const array& value::as_array() const {
    return *std::get<std::shared_ptr<const array>>(data_);
}

const object& value::as_object() const {
    return *std::get<std::shared_ptr<const object>>(data_);
}

const std::shared_ptr<entity>& value::as_entity() const {
    return std::get<std::shared_ptr<entity>>(data_);
}

std::string value::to_string() const {
    std::ostringstream oss;

    switch (kind()) {
        case value_kind::null:
            oss << "null";
            break;
        case value_kind::boolean:
            oss << (as_boolean() ? "true" : "false");
            break;
        case value_kind::integer:
            oss << std::get<std::int64_t>(data_);
            break;
        case value_kind::number:
            oss << format_number(std::get<double>(data_));
            break;
        case value_kind::string:
            append_quoted(oss, as_string());
            break;
        case value_kind::binary:
            oss << "<binary " << as_binary().size() << " bytes>";
            break;
        case value_kind::date:
            oss << "date(" << format_iso8601(as_date()) << ")";
            break;
        case value_kind::array: {
            oss << "[";
            bool first = true;
            for (const auto& item : as_array()) {
                if (!first) oss << ", ";
                first = false;
                oss << item.to_string();
            }
            oss << "]";
            break;
        }
        case value_kind::object: {
            oss << "{";
            bool first = true;
            for (const auto& [key, item] : as_object()) {
                if (!first) oss << ", ";
                first = false;
                append_quoted(oss, key);
                oss << ": " << item.to_string();
            }
            oss << "}";
            break;
        }
        case value_kind::entity: {
            const auto& e = *as_entity();
            const auto& fields = e.get_schema().fields();
            oss << e.get_schema().name() << (e.is_reference() ? "&{" : "{");
            bool first = true;
            for (std::size_t i = 0; i < fields.size(); ++i) {
                const value* slot = e.get(i);
                if (!slot) continue;
                if (!first) oss << ", ";
                first = false;
                oss << fields[i].name << ": ";
                // Guard against self-referencing graphs
                if (fields[i].is_parent_reference && slot->is_entity()) {
                    oss << "<parent " << slot->as_entity()->get_schema().name() << ">";
                } else if (slot->is_entity() && slot->as_entity().get() == &e) {
                    oss << "<self>";
                } else {
                    oss << slot->to_string();
                }
            }
            oss << "}";
            break;
        }
    }

    return oss.str();
}

bool operator==(const value& lhs, const value& rhs) {
    if (lhs.is_number() && rhs.is_number()) {
        if (lhs.is_integer() && rhs.is_integer()) {
            return lhs.as_integer() == rhs.as_integer();
        }
        return lhs.as_number() == rhs.as_number();
    }

    if (lhs.kind() != rhs.kind()) {
        return false;
    }

    switch (lhs.kind()) {
        case value_kind::array:
            return lhs.as_array() == rhs.as_array();
        case value_kind::object:
            return lhs.as_object() == rhs.as_object();
        case value_kind::entity: {
            const auto& a = lhs.as_entity();
            const auto& b = rhs.as_entity();
            return a == b || (a && b && *a == *b);
        }
        default:
            return lhs.data_ == rhs.data_;
    }
}

// ============================================================================
// Object
// ============================================================================

object::object(std::initializer_list<member> members) {
    for (const auto& m : members) {
        set(m.first, m.second);
    }
}

const value* object::find(std::string_view key) const {
    auto it = std::find_if(members_.begin(), members_.end(),
        [&](const member& m) { return m.first == key; });
    return it != members_.end() ? &it->second : nullptr;
}

void object::set(std::string key, value v) {
    auto it = std::find_if(members_.begin(), members_.end(),
        [&](const member& m) { return m.first == key; });
    if (it != members_.end()) {
        it->second = std::move(v);
        return;
    }
    members_.emplace_back(std::move(key), std::move(v));
}

bool object::erase(std::string_view key) {
    auto it = std::find_if(members_.begin(), members_.end(),
        [&](const member& m) { return m.first == key; });
    if (it == members_.end()) {
        return false;
    }
    members_.erase(it);
    return true;
}

bool operator==(const object& lhs, const object& rhs) {
    if (lhs.size() != rhs.size()) {
        return false;
    }
    for (const auto& [key, item] : lhs) {
        const value* other = rhs.find(key);
        if (!other || !(item == *other)) {
            return false;
        }
    }
    return true;
}

} // namespace entiform
