//
// Union Resolver
//
// Orders the candidates of a union field most-specific first and pairs each
// with a guard, so that for typical input at most one candidate matches:
//
//   literal → entity with a literal discriminant → enumeration → date →
//   boolean/number → binary → string → plain entity/partial → containers → any
//
// The sort is stable: candidates of equal rank keep declaration order.
//

#pragma once

#include <entiform/run_context.hh>
#include <entiform/schema.hh>
#include <string>
#include <vector>

namespace entiform {

struct resolved_candidate {
    const field* property = nullptr;  ///< Points into the owning schema
    guard_fn guard;
    std::string discriminant;         ///< Name used in diagnostics
    int rank = 0;
};

class UnionResolver {
public:
    UnionResolver(const schema& owner, direction dir);

    /// Candidates of a union field in evaluation order
    [[nodiscard]] std::vector<resolved_candidate> resolve(const field& union_field) const;

    /// Lower is more specific
    [[nodiscard]] int rank(const field& candidate) const;

    /// Guard derived from the candidate's type for this direction
    [[nodiscard]] guard_fn derive_guard(const field& candidate) const;

    /// Literal value, schema name, enum name or type name
    [[nodiscard]] std::string discriminant(const field& candidate) const;

private:
    guard_fn element_guard(const field& candidate) const;
    guard_fn entity_guard(const schema& target) const;

    const schema& owner_;
    direction dir_;
};

/// True when an object's present members fit a schema: required fields are
/// present, literal fields equal, primitive members type-compatible
bool fits_shape(const schema& target, const object& candidate);

} // namespace entiform
