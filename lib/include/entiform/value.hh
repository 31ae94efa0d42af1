//
// Neutral value model
//
// The external side of every conversion: primitives, ordered sequences and
// string-keyed mappings, plus the decoded-side extras (dates, raw bytes and
// entity references). Arrays and objects are immutable once wrapped in a
// value, so copying a value is cheap and never aliases mutable state.
// Entities are the one reference type.
//

#pragma once

#include <cstdint>
#include <initializer_list>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace entiform {

class value;
class object;
class entity;

using array = std::vector<value>;
using binary = std::vector<std::uint8_t>;

/// Point in time, milliseconds since the Unix epoch (UTC).
struct date_time {
    std::int64_t millis = 0;

    bool operator==(const date_time&) const = default;
};

enum class value_kind {
    null,
    boolean,
    integer,
    number,
    string,
    binary,
    date,
    array,
    object,
    entity
};

/// Lowercase name of a kind, used in diagnostics ("string", "object", ...)
const char* value_kind_name(value_kind kind);

// ============================================================================
// Value
// ============================================================================

class value {
public:
    value() = default;
    value(std::nullptr_t) {}
    value(bool b) : data_(b) {}
    value(int i) : data_(static_cast<std::int64_t>(i)) {}
    value(std::int64_t i) : data_(i) {}
    value(double d) : data_(d) {}
    value(const char* s) : data_(std::string(s)) {}
    value(std::string s) : data_(std::move(s)) {}
    value(std::string_view s) : data_(std::string(s)) {}
    value(binary bytes) : data_(std::move(bytes)) {}
    value(date_time d) : data_(d) {}
    value(array items);
    value(object members);
    value(std::shared_ptr<entity> e);

    [[nodiscard]] value_kind kind() const;

    [[nodiscard]] bool is_null() const { return std::holds_alternative<std::monostate>(data_); }
    [[nodiscard]] bool is_boolean() const { return std::holds_alternative<bool>(data_); }
    [[nodiscard]] bool is_integer() const { return std::holds_alternative<std::int64_t>(data_); }
    /// True for both integers and floating point numbers
    [[nodiscard]] bool is_number() const {
        return std::holds_alternative<std::int64_t>(data_) || std::holds_alternative<double>(data_);
    }
    [[nodiscard]] bool is_string() const { return std::holds_alternative<std::string>(data_); }
    [[nodiscard]] bool is_binary() const { return std::holds_alternative<binary>(data_); }
    [[nodiscard]] bool is_date() const { return std::holds_alternative<date_time>(data_); }
    [[nodiscard]] bool is_array() const;
    [[nodiscard]] bool is_object() const;
    [[nodiscard]] bool is_entity() const;

    // Accessors throw std::bad_variant_access on a kind mismatch
    [[nodiscard]] bool as_boolean() const { return std::get<bool>(data_); }
    [[nodiscard]] std::int64_t as_integer() const;
    [[nodiscard]] double as_number() const;
    [[nodiscard]] const std::string& as_string() const { return std::get<std::string>(data_); }
    [[nodiscard]] const binary& as_binary() const { return std::get<binary>(data_); }
    [[nodiscard]] date_time as_date() const { return std::get<date_time>(data_); }
    [[nodiscard]] const array& as_array() const;
    [[nodiscard]] const object& as_object() const;
    [[nodiscard]] const std::shared_ptr<entity>& as_entity() const;

    /// Compact JSON-like rendering for messages and debugging
    [[nodiscard]] std::string to_string() const;

    friend bool operator==(const value& lhs, const value& rhs);

private:
    using storage = std::variant<
        std::monostate,
        bool,
        std::int64_t,
        double,
        std::string,
        binary,
        date_time,
        std::shared_ptr<const array>,
        std::shared_ptr<const object>,
        std::shared_ptr<entity>>;

    storage data_;
};

// ============================================================================
// Object
// ============================================================================

/// Ordered string-keyed mapping. Keys are unique; insertion order is kept.
class object {
public:
    using member = std::pair<std::string, value>;
    using const_iterator = std::vector<member>::const_iterator;

    object() = default;
    object(std::initializer_list<member> members);

    /// Returns nullptr when the key is absent
    [[nodiscard]] const value* find(std::string_view key) const;
    [[nodiscard]] bool contains(std::string_view key) const { return find(key) != nullptr; }

    /// Insert or replace; a replaced key keeps its original position
    void set(std::string key, value v);
    bool erase(std::string_view key);

    [[nodiscard]] std::size_t size() const { return members_.size(); }
    [[nodiscard]] bool empty() const { return members_.empty(); }
    [[nodiscard]] const_iterator begin() const { return members_.begin(); }
    [[nodiscard]] const_iterator end() const { return members_.end(); }

    /// Order-insensitive comparison
    friend bool operator==(const object& lhs, const object& rhs);

private:
    std::vector<member> members_;
};

} // namespace entiform
