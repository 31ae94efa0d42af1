//
// JIT Compiler Implementation
//
// Walks a schema's fields and asks the Serializer's generators for the
// conversion steps of each one. Union, entity and partial fields are planned
// here; every other tag is delegated to the compiler table.
//

#include <entiform/jit.hh>
#include <entiform/entity.hh>
#include <entiform/errors.hh>
#include <entiform/serializer.hh>
#include <entiform/union_resolver.hh>
#include <entiform/yaml/value_yaml.hh>
#include <algorithm>
#include <iterator>

namespace entiform {

// ============================================================================
// Compiler State
// ============================================================================

CompilerState::CompilerState(JitCompiler& compiler,
                             const schema& owner,
                             const field& property,
                             const Serializer& target,
                             direction dir,
                             std::string accessor,
                             std::string setter)
    : compiler_(compiler),
      owner_(owner),
      property_(property),
      serializer_(target),
      dir_(dir),
      accessor_(std::move(accessor)),
      setter_(std::move(setter)) {
}

void CompilerState::add_setter(convert_step step) {
    setter_step_ = std::move(step);
}

void CompilerState::add_precheck(prepend_step step) {
    prechecks_.push_back(std::move(step));
}

pipeline_handle CompilerState::nested(const schema& s) {
    return compiler_.compile(s, serializer_, dir_);
}

const schema& CompilerState::resolve(const field& f) const {
    return owner_.resolve(f);
}

// ============================================================================
// Compilation Entry Points
// ============================================================================

JitCompiler& JitCompiler::instance() {
    static JitCompiler compiler;
    return compiler;
}

pipeline_handle JitCompiler::compile(const schema& s, const Serializer& serializer, direction dir) {
    pipeline_key key;
    key.schema_id = s.id();
    key.serializer_id = serializer.id();
    key.revision = serializer.revision();
    key.dir = dir;
    return compile_key(s, serializer, std::move(key));
}

pipeline_handle JitCompiler::compile_partial(const schema& s,
                                             const Serializer& serializer,
                                             direction dir,
                                             const std::vector<std::string>& field_names) {
    for (const auto& name : field_names) {
        if (!s.find_field(name)) {
            throw schema_definition_error(s.name(), "unknown field '" + name + "' in partial field list");
        }
    }

    std::vector<std::string> subset = field_names;
    std::sort(subset.begin(), subset.end());
    subset.erase(std::unique(subset.begin(), subset.end()), subset.end());

    pipeline_key key;
    key.schema_id = s.id();
    key.serializer_id = serializer.id();
    key.revision = serializer.revision();
    key.dir = dir;
    key.subset = std::move(subset);
    return compile_key(s, serializer, std::move(key));
}

CompiledProperty JitCompiler::compile_property(const schema& s,
                                               const std::string& field_name,
                                               const Serializer& serializer,
                                               direction dir) {
    auto index = s.index_of(field_name);
    if (!index) {
        throw schema_definition_error(s.name(), "unknown field '" + field_name + "'");
    }
    if (s.fields()[*index].is_parent_reference) {
        throw schema_definition_error(s.name(), "field '" + field_name + "' is a parent reference and has no converter");
    }

    field_plan plan = plan_field(s, *index, serializer, dir);
    return CompiledProperty(*plan.property, std::move(plan.prechecks), std::move(plan.step));
}

void JitCompiler::reset() {
    pipelines_.clear();
    validators_.clear();
}

JitCompiler::stats JitCompiler::get_stats() const {
    stats result;
    result.pipelines = pipelines_.size();
    result.builds = pipelines_.builds();
    result.forward_references = pipelines_.forward_references();
    result.validators = validators_.size();
    return result;
}

pipeline_handle JitCompiler::compile_key(const schema& s, const Serializer& serializer, pipeline_key key) {
    const direction dir = key.dir;
    const auto subset = key.subset;
    return pipelines_.get_or_build(key, [&]() {
        return build(s, serializer, dir, subset);
    });
}

std::shared_ptr<const CompiledPipeline> JitCompiler::build(const schema& s,
                                                           const Serializer& serializer,
                                                           direction dir,
                                                           const std::optional<std::vector<std::string>>& subset) {
    std::vector<field_plan> plans;
    plans.reserve(s.fields().size());

    for (std::size_t i = 0; i < s.fields().size(); ++i) {
        if (subset && !std::binary_search(subset->begin(), subset->end(), s.fields()[i].name)) {
            continue;
        }
        plans.push_back(plan_field(s, i, serializer, dir));
    }

    return std::make_shared<const CompiledPipeline>(s, serializer, dir, subset, std::move(plans));
}

// ============================================================================
// Field Planning
// ============================================================================

field_plan JitCompiler::plan_field(const schema& owner, std::size_t index, const Serializer& serializer, direction dir) {
    const field& f = owner.fields()[index];

    field_plan plan;
    plan.index = index;
    plan.property = &f;

    if (f.is_parent_reference) {
        plan.parent = &owner.resolve(f);
        return plan;
    }

    if (!f.is_union()) {
        for (const auto& gen : serializer.table(dir).prepends(f.type)) {
            CompilerState state(*this, owner, f, serializer, dir, "data." + f.name, owner.name() + "." + f.name);
            gen(f, state);
            auto prechecks = state.take_prechecks();
            std::move(prechecks.begin(), prechecks.end(), std::back_inserter(plan.prechecks));
        }
    }

    plan.step = value_step(owner, f, serializer, dir);
    return plan;
}

convert_step JitCompiler::value_step(const schema& owner, const field& f, const Serializer& serializer, direction dir) {
    convert_step element = element_step(owner, f, serializer, dir);

    if (f.is_array()) {
        return [element](const value& in, std::optional<value>& out, run_context& ctx) {
            if (!in.is_array()) {
                out = value(array{});
                return;
            }
            array result;
            result.reserve(in.as_array().size());
            std::size_t i = 0;
            for (const auto& item : in.as_array()) {
                path_scope path(ctx, std::to_string(i++));
                if (item.is_null()) {
                    result.emplace_back();
                    continue;
                }
                std::optional<value> converted;
                element(item, converted, ctx);
                result.push_back(converted ? std::move(*converted) : value());
            }
            out = value(std::move(result));
        };
    }

    if (f.is_map()) {
        return [element](const value& in, std::optional<value>& out, run_context& ctx) {
            if (!in.is_object()) {
                out = value(object{});
                return;
            }
            object result;
            for (const auto& [key, item] : in.as_object()) {
                path_scope path(ctx, key);
                if (item.is_null()) {
                    result.set(key, value());
                    continue;
                }
                std::optional<value> converted;
                element(item, converted, ctx);
                result.set(key, converted ? std::move(*converted) : value());
            }
            out = value(std::move(result));
        };
    }

    return element;
}

convert_step JitCompiler::element_step(const schema& owner, const field& f, const Serializer& serializer, direction dir) {
    switch (f.type) {
        case type_tag::union_type:
            return union_step(owner, f, serializer, dir);
        case type_tag::entity:
            return entity_step(owner, f, serializer, dir);
        case type_tag::partial:
            return partial_step(owner, f, serializer, dir);
        default:
            return table_step(owner, f, serializer, dir);
    }
}

convert_step JitCompiler::table_step(const schema& owner, const field& f, const Serializer& serializer, direction dir) {
    const generator* gen = serializer.table(dir).find(f.type);
    if (gen) {
        CompilerState state(*this, owner, f, serializer, dir, "data." + f.name, owner.name() + "." + f.name);
        (*gen)(f, state);
        if (state.has_setter()) {
            return state.take_setter();
        }
    }

    return [](const value& in, std::optional<value>& out, run_context&) {
        out = in;
    };
}

convert_step JitCompiler::entity_step(const schema& owner, const field& f, const Serializer& serializer, direction dir) {
    const schema& target = owner.resolve(f);
    if (f.is_reference && !target.primary_field()) {
        throw schema_definition_error(owner.name(),
            "field '" + f.name + "' is a reference to '" + target.name() + "', which has no primary field");
    }

    pipeline_link<CompiledPipeline> link(compile(target, serializer, dir));
    const schema* nested = &target;

    if (dir == direction::encode) {
        return [link](const value& in, std::optional<value>& out, run_context& ctx) {
            if (in.is_entity() || in.is_object()) {
                out = link.get().run(in, ctx);
            }
        };
    }

    const bool reference = f.is_reference;
    return [link, nested, reference](const value& in, std::optional<value>& out, run_context& ctx) {
        if (in.is_object()) {
            out = link.get().run(in, ctx);
            return;
        }
        if (in.is_entity()) {
            if (in.as_entity() && in.as_entity()->get_schema().id() == nested->id()) {
                out = in;
            }
            return;
        }
        if (reference) {
            if (!in.is_array()) {
                out = value(make_reference(*nested, in));
            }
            return;
        }
        if (in.is_string() && ctx.options().loosely) {
            // Nested entities serialized as JSON text; text that does not
            // parse leaves the field unset
            auto parsed = yaml::parse_json_text(in.as_string());
            if (parsed && parsed->is_object()) {
                out = link.get().run(*parsed, ctx);
            }
        }
    };
}

convert_step JitCompiler::partial_step(const schema& owner, const field& f, const Serializer& serializer, direction dir) {
    pipeline_link<CompiledPipeline> link(compile(owner.resolve(f), serializer, dir));
    const bool encoding = dir == direction::encode;

    return [link, encoding](const value& in, std::optional<value>& out, run_context& ctx) {
        if (in.is_object() || (encoding && in.is_entity())) {
            out = link.get().run_sparse(in, ctx);
        }
    };
}

convert_step JitCompiler::union_step(const schema& owner, const field& f, const Serializer& serializer, direction dir) {
    struct branch {
        guard_fn guard;
        convert_step step;
    };

    std::vector<branch> branches;
    std::vector<std::string> discriminants;

    UnionResolver resolver(owner, dir);
    for (auto& candidate : resolver.resolve(f)) {
        branches.push_back(branch{std::move(candidate.guard), value_step(owner, *candidate.property, serializer, dir)});
        discriminants.push_back(std::move(candidate.discriminant));
    }

    const field* property = &f;
    return [branches, discriminants, property](const value& in, std::optional<value>& out, run_context& ctx) {
        for (const auto& b : branches) {
            if (b.guard(in)) {
                b.step(in, out, ctx);
                return;
            }
        }

        if (property->is_optional) {
            return;
        }
        if (property->is_nullable) {
            out = value();
            return;
        }
        if (property->has_default()) {
            out = property->default_value;
            return;
        }
        throw no_matching_union_variant(ctx.path(), property->name, discriminants);
    };
}

} // namespace entiform
