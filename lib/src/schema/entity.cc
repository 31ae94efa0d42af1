//
// Structured entity values
//

#include <entiform/entity.hh>
#include <entiform/schema.hh>
#include <entiform/errors.hh>
#include <stdexcept>

namespace entiform {

entity::entity(const schema& s)
    : schema_(&s), slots_(s.fields().size()), parents_(s.fields().size()) {
}

bool entity::is_parent_slot(std::size_t index) const {
    return schema_->fields()[index].is_parent_reference && slots_[index] && slots_[index]->is_entity();
}

const value* entity::get(std::size_t index) const {
    if (index >= slots_.size() || !slots_[index]) {
        return nullptr;
    }
    if (is_parent_slot(index) && parents_[index].expired()) {
        return nullptr;
    }
    return &*slots_[index];
}

const value* entity::get(std::string_view name) const {
    auto idx = schema_->index_of(name);
    return idx ? get(*idx) : nullptr;
}

std::shared_ptr<entity> entity::parent(std::string_view name) const {
    auto idx = schema_->index_of(name);
    if (!idx || !is_parent_slot(*idx)) {
        return nullptr;
    }
    return parents_[*idx].lock();
}

void entity::set(std::size_t index, value v) {
    auto& slot = slots_.at(index);
    parents_[index].reset();

    if (schema_->fields()[index].is_parent_reference && v.is_entity()) {
        // The slot holds a non-owning alias; liveness is tracked by the weak link
        const auto& ancestor = v.as_entity();
        parents_[index] = ancestor;
        slot = value(std::shared_ptr<entity>(std::shared_ptr<entity>(), ancestor.get()));
        return;
    }
    slot = std::move(v);
}

void entity::set(std::string_view name, value v) {
    set(require_index(name), std::move(v));
}

void entity::unset(std::size_t index) {
    slots_.at(index).reset();
    parents_[index].reset();
}

void entity::unset(std::string_view name) {
    unset(require_index(name));
}

std::optional<value> entity::primary_key() const {
    auto idx = schema_->primary_index();
    if (!idx || !slots_[*idx]) {
        return std::nullopt;
    }
    return slots_[*idx];
}

std::size_t entity::require_index(std::string_view name) const {
    auto idx = schema_->index_of(name);
    if (!idx) {
        throw std::out_of_range("Entity '" + schema_->name() + "' has no field '" + std::string(name) + "'");
    }
    return *idx;
}

bool operator==(const entity& lhs, const entity& rhs) {
    if (&lhs == &rhs) {
        return true;
    }
    if (lhs.schema_->id() != rhs.schema_->id() || lhs.reference_ != rhs.reference_) {
        return false;
    }

    const auto& fields = lhs.schema_->fields();
    for (std::size_t i = 0; i < fields.size(); ++i) {
        const value* a = lhs.get(i);
        const value* b = rhs.get(i);
        if (!a || !b) {
            if (a || b) return false;
            continue;
        }
        // Ancestors contain this entity; comparing them would not terminate
        if (fields[i].is_parent_reference) {
            continue;
        }
        if (!(*a == *b)) {
            return false;
        }
    }
    return true;
}

std::shared_ptr<entity> make_entity(const schema& s) {
    return std::make_shared<entity>(s);
}

std::shared_ptr<entity> make_reference(const schema& s, value primary_key) {
    auto idx = s.primary_index();
    if (!idx) {
        throw schema_definition_error(s.name(), "cannot reference an entity without a primary field");
    }
    auto e = std::make_shared<entity>(s);
    e->set(*idx, std::move(primary_key));
    e->mark_reference();
    return e;
}

} // namespace entiform
