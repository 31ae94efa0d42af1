//
// Structured entity values
//
// An entity holds one slot per schema field. An empty slot means the field
// is unset (absent), which is different from a slot holding null.
//
// Parent-reference fields do not own their ancestor: the entity keeps a weak
// link, and the slot reads as unset once the ancestor is gone.
//

#pragma once

#include <entiform/value.hh>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

namespace entiform {

class schema;

class entity : public std::enable_shared_from_this<entity> {
public:
    explicit entity(const schema& s);

    [[nodiscard]] const schema& get_schema() const { return *schema_; }
    [[nodiscard]] std::size_t size() const { return slots_.size(); }

    /// nullptr when the field is unset
    [[nodiscard]] const value* get(std::size_t index) const;
    /// nullptr when the field is unset or unknown
    [[nodiscard]] const value* get(std::string_view name) const;
    [[nodiscard]] bool has(std::string_view name) const { return get(name) != nullptr; }

    /// Ancestor of a parent-reference field, nullptr when unset or released
    [[nodiscard]] std::shared_ptr<entity> parent(std::string_view name) const;

    void set(std::size_t index, value v);
    /// Throws std::out_of_range for names the schema does not declare
    void set(std::string_view name, value v);
    void unset(std::size_t index);
    void unset(std::string_view name);

    [[nodiscard]] std::optional<value> primary_key() const;

    /// Placeholder for a foreign entity known only by its primary key
    [[nodiscard]] bool is_reference() const { return reference_; }
    void mark_reference(bool on = true) { reference_ = on; }

    /// Same schema and slot-wise equal values; parent references only
    /// compare by presence
    friend bool operator==(const entity& lhs, const entity& rhs);

private:
    std::size_t require_index(std::string_view name) const;
    [[nodiscard]] bool is_parent_slot(std::size_t index) const;

    const schema* schema_;
    std::vector<std::optional<value>> slots_;
    std::vector<std::weak_ptr<entity>> parents_;  ///< Only used by parent-reference slots
    bool reference_ = false;
};

std::shared_ptr<entity> make_entity(const schema& s);

/// Reference placeholder holding only the primary key
std::shared_ptr<entity> make_reference(const schema& s, value primary_key);

} // namespace entiform
