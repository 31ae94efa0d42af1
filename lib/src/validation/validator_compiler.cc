//
// Validator compilation and execution
//

#include <entiform/validation.hh>
#include <entiform/entity.hh>
#include <entiform/union_resolver.hh>

namespace entiform {

namespace {

    validate_step value_check(JitCompiler& compiler, const schema& owner, const field& f, const ValidatorRegistry& registry);

    validate_step union_check(JitCompiler& compiler, const schema& owner, const field& f, const ValidatorRegistry& registry) {
        struct branch {
            guard_fn guard;
            validate_step check;
        };

        std::vector<branch> branches;
        std::string expected;

        UnionResolver resolver(owner, direction::decode);
        for (auto& candidate : resolver.resolve(f)) {
            branches.push_back(branch{std::move(candidate.guard), value_check(compiler, owner, *candidate.property, registry)});
            if (!expected.empty()) expected += ", ";
            expected += candidate.discriminant;
        }

        const bool has_fallback = f.is_optional || f.is_nullable || f.has_default();
        return [branches, expected, has_fallback](const value& v, const std::string& path, std::vector<field_error>& errors) {
            for (const auto& b : branches) {
                if (b.guard(v)) {
                    b.check(v, path, errors);
                    return;
                }
            }
            if (!has_fallback) {
                errors.push_back(field_error{path, "invalid_union", "No matching union variant, expected one of: " + expected});
            }
        };
    }

    validate_step entity_check(JitCompiler& compiler, const schema& owner, const field& f, const ValidatorRegistry& registry) {
        const schema& target = owner.resolve(f);
        pipeline_link<CompiledValidator> link(compiler.compile_validator(target, registry));
        const schema* nested = &target;
        const bool reference = f.is_reference;
        const bool sparse = f.type == type_tag::partial;

        return [link, nested, reference, sparse](const value& v, const std::string& path, std::vector<field_error>& errors) {
            if (v.is_object() || (v.is_entity() && v.as_entity() && v.as_entity()->get_schema().id() == nested->id())) {
                link.get().run(v, path, errors, sparse);
                return;
            }
            if (reference && !v.is_array() && !v.is_object() && !v.is_entity()) {
                return;
            }
            errors.push_back(field_error{path, "invalid_type", "Expected an object of type '" + nested->name() + "'"});
        };
    }

    validate_step element_check(JitCompiler& compiler, const schema& owner, const field& f, const ValidatorRegistry& registry) {
        switch (f.type) {
            case type_tag::union_type:
                return union_check(compiler, owner, f, registry);
            case type_tag::entity:
            case type_tag::partial:
                return entity_check(compiler, owner, f, registry);
            default:
                break;
        }

        const type_check* found = registry.find(f.type);
        if (!found) {
            return [](const value&, const std::string&, std::vector<field_error>&) {};
        }

        type_check check = *found;
        const field* property = &f;
        return [check, property](const value& v, const std::string& path, std::vector<field_error>& errors) {
            if (auto failure = check(*property, v)) {
                errors.push_back(field_error{path, failure->code, failure->message});
            }
        };
    }

    validate_step value_check(JitCompiler& compiler, const schema& owner, const field& f, const ValidatorRegistry& registry) {
        validate_step element = element_check(compiler, owner, f, registry);

        if (f.is_array()) {
            return [element](const value& v, const std::string& path, std::vector<field_error>& errors) {
                if (!v.is_array()) {
                    errors.push_back(field_error{path, "invalid_type", "Expected an array"});
                    return;
                }
                std::size_t i = 0;
                for (const auto& item : v.as_array()) {
                    const std::string item_path = join_path(path, std::to_string(i++));
                    if (!item.is_null()) {
                        element(item, item_path, errors);
                    }
                }
            };
        }

        if (f.is_map()) {
            return [element](const value& v, const std::string& path, std::vector<field_error>& errors) {
                if (!v.is_object()) {
                    errors.push_back(field_error{path, "invalid_type", "Expected an object"});
                    return;
                }
                for (const auto& [key, item] : v.as_object()) {
                    if (!item.is_null()) {
                        element(item, join_path(path, key), errors);
                    }
                }
            };
        }

        return element;
    }
}

std::string join_path(const std::string& parent, const std::string& child) {
    return parent.empty() ? child : parent + "." + child;
}

// ============================================================================
// Compilation
// ============================================================================

validator_handle JitCompiler::compile_validator(const schema& s, const ValidatorRegistry& registry) {
    validator_key key;
    key.schema_id = s.id();
    key.registry_id = registry.id();
    key.revision = registry.revision();

    return validators_.get_or_build(key, [&]() {
        std::vector<validation_plan> plans;
        for (std::size_t i = 0; i < s.fields().size(); ++i) {
            const field& f = s.fields()[i];
            if (f.is_parent_reference) {
                continue;
            }
            validation_plan plan;
            plan.index = i;
            plan.property = &f;
            plan.shape = value_check(*this, s, f, registry);
            plans.push_back(std::move(plan));
        }
        return std::make_shared<const CompiledValidator>(s, std::move(plans));
    });
}

// ============================================================================
// Execution
// ============================================================================

CompiledValidator::CompiledValidator(const schema& s, std::vector<validation_plan> plans)
    : schema_(&s), plans_(std::move(plans)) {
}

std::vector<field_error> CompiledValidator::run(const value& data) const {
    std::vector<field_error> errors;
    run(data, "", errors);
    return errors;
}

void CompiledValidator::run(const value& data, const std::string& path, std::vector<field_error>& errors, bool sparse) const {
    const entity* source_entity = nullptr;
    const object* source_object = nullptr;

    if (data.is_entity() && data.as_entity() && data.as_entity()->get_schema().id() == schema_->id()) {
        source_entity = data.as_entity().get();
    } else if (data.is_object()) {
        source_object = &data.as_object();
    } else {
        errors.push_back(field_error{path, "invalid_type", "Expected an object of type '" + schema_->name() + "'"});
        return;
    }

    for (const auto& plan : plans_) {
        const field& f = *plan.property;
        const std::string field_path = join_path(path, f.name);
        const value* raw = source_entity ? source_entity->get(plan.index) : source_object->find(f.name);

        if (!raw) {
            if (!sparse && !f.is_optional && !f.has_default() && !f.is_auto_increment) {
                errors.push_back(field_error{field_path, "required", "Required value is undefined"});
            }
            continue;
        }
        if (raw->is_null()) {
            if (!f.is_nullable && !f.is_optional) {
                errors.push_back(field_error{field_path, "required", "Required value is null"});
            }
            continue;
        }

        const std::size_t before = errors.size();
        plan.shape(*raw, field_path, errors);
        if (errors.size() != before) {
            continue;
        }

        for (const auto& rule : f.validators) {
            if (auto failure = rule.check(*raw)) {
                errors.push_back(field_error{field_path, failure->code, failure->message});
                break;
            }
        }
    }
}

} // namespace entiform
