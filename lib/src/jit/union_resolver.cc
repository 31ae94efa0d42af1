//
// Union Resolver Implementation
//

#include <entiform/union_resolver.hh>
#include <entiform/entity.hh>
#include <entiform/text_codec.hh>
#include <algorithm>

namespace entiform {

namespace {
    constexpr int RANK_LITERAL = 0;
    constexpr int RANK_DISCRIMINATED_ENTITY = 1;
    constexpr int RANK_ENUMERATION = 2;
    constexpr int RANK_DATE = 3;
    constexpr int RANK_SCALAR = 4;
    constexpr int RANK_BINARY = 5;
    constexpr int RANK_STRING = 6;
    constexpr int RANK_ENTITY = 7;
    constexpr int RANK_CONTAINER = 8;
    constexpr int RANK_ANY = 9;

    bool has_literal_field(const schema& s) {
        return std::any_of(s.fields().begin(), s.fields().end(),
            [](const field& f) { return f.type == type_tag::literal && !f.is_optional; });
    }

    bool is_base64_text(const value& v) {
        return v.is_string() && !v.as_string().empty()
            && base64_decode(v.as_string()).has_value()
            && !parse_iso8601(v.as_string()).has_value();
    }

    bool is_date_text(const value& v) {
        return v.is_string() && parse_iso8601(v.as_string()).has_value();
    }

    /// Shape compatibility of one present, non-null member
    bool member_fits(const field& f, const value& v) {
        if (f.is_array()) return v.is_array();
        if (f.is_map()) return v.is_object();

        switch (f.type) {
            case type_tag::string:
                return v.is_string();
            case type_tag::number:
                return v.is_number();
            case type_tag::boolean:
                return v.is_boolean();
            case type_tag::date:
                return v.is_date() || is_date_text(v);
            case type_tag::literal:
                return *f.literal_value == v;
            case type_tag::enumeration:
                return f.enumeration->contains_value(v)
                    || (f.enum_allows_labels && v.is_string() && f.enumeration->find_by_label(v.as_string()));
            case type_tag::binary:
                return v.is_binary() || v.is_string();
            case type_tag::entity:
                return f.is_reference || v.is_object() || v.is_entity();
            case type_tag::partial:
                return v.is_object();
            default:
                return true;
        }
    }
}

bool fits_shape(const schema& target, const object& candidate) {
    for (const auto& f : target.fields()) {
        if (f.is_parent_reference) {
            continue;
        }
        const value* member = candidate.find(f.name);
        if (!member) {
            if (f.type == type_tag::literal && !f.is_optional) return false;
            if (!f.is_optional && !f.has_default() && !f.is_auto_increment) return false;
            continue;
        }
        if (member->is_null()) {
            if (!f.is_nullable && !f.is_optional) return false;
            continue;
        }
        if (!member_fits(f, *member)) {
            return false;
        }
    }
    return true;
}

// ============================================================================
// Union Resolver
// ============================================================================

UnionResolver::UnionResolver(const schema& owner, direction dir)
    : owner_(owner), dir_(dir) {
}

std::vector<resolved_candidate> UnionResolver::resolve(const field& union_field) const {
    std::vector<resolved_candidate> result;
    result.reserve(union_field.union_candidates.size());

    for (const auto& candidate : union_field.union_candidates) {
        resolved_candidate resolved;
        resolved.property = &candidate.property;
        resolved.guard = candidate.guard ? candidate.guard : derive_guard(candidate.property);
        resolved.discriminant = discriminant(candidate.property);
        resolved.rank = rank(candidate.property);
        result.push_back(std::move(resolved));
    }

    std::stable_sort(result.begin(), result.end(),
        [](const resolved_candidate& a, const resolved_candidate& b) { return a.rank < b.rank; });
    return result;
}

int UnionResolver::rank(const field& candidate) const {
    if (candidate.container != container_kind::none) {
        return RANK_CONTAINER;
    }

    switch (candidate.type) {
        case type_tag::literal:
            return RANK_LITERAL;
        case type_tag::entity:
            return has_literal_field(owner_.resolve(candidate)) ? RANK_DISCRIMINATED_ENTITY : RANK_ENTITY;
        case type_tag::partial:
            return RANK_ENTITY;
        case type_tag::enumeration:
            return RANK_ENUMERATION;
        case type_tag::date:
            return RANK_DATE;
        case type_tag::boolean:
        case type_tag::number:
            return RANK_SCALAR;
        case type_tag::binary:
            return RANK_BINARY;
        case type_tag::string:
            return RANK_STRING;
        default:
            return RANK_ANY;
    }
}

std::string UnionResolver::discriminant(const field& candidate) const {
    switch (candidate.type) {
        case type_tag::literal:
            return candidate.literal_value->is_string() ? candidate.literal_value->as_string()
                                                        : candidate.literal_value->to_string();
        case type_tag::entity:
        case type_tag::partial:
            return owner_.resolve(candidate).name();
        case type_tag::enumeration:
            return candidate.enumeration->name;
        default:
            break;
    }

    std::string name = type_tag_name(candidate.type);
    if (candidate.is_array()) name += "[]";
    if (candidate.is_map()) name = "map<" + name + ">";
    return name;
}

guard_fn UnionResolver::derive_guard(const field& candidate) const {
    if (candidate.is_array()) {
        return [](const value& v) { return v.is_array(); };
    }
    if (candidate.is_map()) {
        return [](const value& v) { return v.is_object(); };
    }
    return element_guard(candidate);
}

guard_fn UnionResolver::element_guard(const field& candidate) const {
    const bool decoding = dir_ == direction::decode;

    switch (candidate.type) {
        case type_tag::literal: {
            value literal = *candidate.literal_value;
            return [literal](const value& v) { return v == literal; };
        }
        case type_tag::string:
            return [](const value& v) { return v.is_string(); };
        case type_tag::number:
            return [](const value& v) { return v.is_number(); };
        case type_tag::boolean:
            return [](const value& v) { return v.is_boolean(); };
        case type_tag::date:
            if (decoding) {
                return [](const value& v) { return v.is_date() || is_date_text(v); };
            }
            return [](const value& v) { return v.is_date(); };
        case type_tag::binary:
            if (decoding) {
                return [](const value& v) { return v.is_binary() || is_base64_text(v); };
            }
            return [](const value& v) { return v.is_binary(); };
        case type_tag::enumeration: {
            auto def = candidate.enumeration;
            const bool labels = decoding && candidate.enum_allows_labels;
            return [def, labels](const value& v) {
                return def->contains_value(v)
                    || (labels && v.is_string() && def->find_by_label(v.as_string()) != nullptr);
            };
        }
        case type_tag::entity:
            return entity_guard(owner_.resolve(candidate));
        case type_tag::partial:
            return [](const value& v) { return v.is_object(); };
        default:
            return [](const value&) { return true; };
    }
}

guard_fn UnionResolver::entity_guard(const schema& target) const {
    const schema* s = &target;
    return [s](const value& v) {
        if (v.is_entity()) {
            return v.as_entity() && v.as_entity()->get_schema().id() == s->id();
        }
        return v.is_object() && fits_shape(*s, v.as_object());
    };
}

} // namespace entiform
