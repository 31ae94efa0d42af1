//
// Compiled pipeline execution
//

#include <entiform/jit.hh>
#include <entiform/entity.hh>
#include <entiform/errors.hh>

namespace entiform {

namespace {
    std::string shape_error(const schema& s, direction dir, const value& input) {
        return std::string("cannot ") + direction_name(dir) + " '" + s.name()
            + "' from a value of kind " + value_kind_name(input.kind());
    }
}

// ============================================================================
// Compiled Pipeline
// ============================================================================

CompiledPipeline::CompiledPipeline(const schema& s,
                                   const Serializer& serializer,
                                   direction dir,
                                   std::optional<std::vector<std::string>> subset,
                                   std::vector<field_plan> plans)
    : schema_(&s),
      serializer_(&serializer),
      dir_(dir),
      subset_(std::move(subset)),
      plans_(std::move(plans)) {
}

value CompiledPipeline::run(const value& input, const convert_options& options) const {
    run_context ctx(options);
    return run(input, ctx);
}

value CompiledPipeline::run(const value& input, run_context& ctx) const {
    if (is_partial()) {
        return run_sparse(input, ctx);
    }

    if (dir_ == direction::encode) {
        return encode_entity(input, ctx);
    }

    if (input.is_object()) {
        return value(decode_entity(input.as_object(), ctx));
    }
    if (input.is_entity() && input.as_entity() && input.as_entity()->get_schema().id() == schema_->id()) {
        return input;
    }
    throw conversion_error(ctx.path(), shape_error(*schema_, dir_, input));
}

void CompiledPipeline::apply(const value& input, entity& target, const convert_options& options) const {
    if (dir_ != direction::decode) {
        throw conversion_error("", "only decode pipelines can be applied onto an entity");
    }
    if (target.get_schema().id() != schema_->id()) {
        throw conversion_error("", "cannot apply a '" + schema_->name() + "' pipeline onto a '"
            + target.get_schema().name() + "' entity");
    }

    run_context ctx(options);
    if (!input.is_object()) {
        throw conversion_error(ctx.path(), shape_error(*schema_, dir_, input));
    }

    // Children link back to the target only when it is shared-owned; a plain
    // entity gets a non-owning alias whose links read as unset
    std::shared_ptr<entity> self = target.weak_from_this().lock();
    if (!self) {
        self = std::shared_ptr<entity>(std::shared_ptr<entity>(), &target);
    }
    parent_scope parents(ctx, std::move(self));
    assign(input.as_object(), target, ctx, is_partial());
}

value CompiledPipeline::run_sparse(const value& input, run_context& ctx) const {
    if (dir_ == direction::encode) {
        return encode_entity(input, ctx);
    }
    if (!input.is_object()) {
        throw conversion_error(ctx.path(), shape_error(*schema_, dir_, input));
    }
    return value(decode_sparse(input.as_object(), ctx));
}

std::shared_ptr<entity> CompiledPipeline::decode_entity(const object& input, run_context& ctx) const {
    auto result = make_entity(*schema_);
    parent_scope parents(ctx, result);
    assign(input, *result, ctx, false);
    return result;
}

void CompiledPipeline::assign(const object& input, entity& target, run_context& ctx, bool sparse) const {
    for (const auto& plan : plans_) {
        const field& f = *plan.property;
        if (!ctx.is_visible(f)) {
            continue;
        }

        if (plan.parent) {
            if (auto ancestor = ctx.find_parent(*plan.parent)) {
                target.set(plan.index, value(ancestor));
            }
            continue;
        }

        const value* raw = input.find(f.name);
        if (sparse && (!raw || (raw->is_null() && !f.is_nullable))) {
            continue;
        }

        path_scope path(ctx, f.name);
        auto converted = convert_field(plan, raw, ctx);
        if (converted) {
            target.set(plan.index, std::move(*converted));
        } else if (!sparse) {
            target.unset(plan.index);
        }
    }
}

object CompiledPipeline::decode_sparse(const object& input, run_context& ctx) const {
    object result;
    for (const auto& plan : plans_) {
        const field& f = *plan.property;
        if (plan.parent || !ctx.is_visible(f)) {
            continue;
        }

        const value* raw = input.find(f.name);
        if (!raw || (raw->is_null() && !f.is_nullable)) {
            continue;
        }

        path_scope path(ctx, f.name);
        if (auto converted = convert_field(plan, raw, ctx)) {
            result.set(f.name, std::move(*converted));
        }
    }
    return result;
}

value CompiledPipeline::encode_entity(const value& input, run_context& ctx) const {
    const entity* source_entity = nullptr;
    const object* source_object = nullptr;

    if (input.is_entity() && input.as_entity()) {
        source_entity = input.as_entity().get();
        if (source_entity->get_schema().id() != schema_->id()) {
            throw conversion_error(ctx.path(), "cannot encode a '" + source_entity->get_schema().name()
                + "' entity with a '" + schema_->name() + "' pipeline");
        }
    } else if (input.is_object()) {
        source_object = &input.as_object();
    } else {
        throw conversion_error(ctx.path(), shape_error(*schema_, dir_, input));
    }

    object result;
    for (const auto& plan : plans_) {
        const field& f = *plan.property;
        if (plan.parent || !ctx.is_visible(f)) {
            continue;
        }

        const value* raw = source_entity ? source_entity->get(plan.index) : source_object->find(f.name);
        if (!raw) {
            continue;
        }

        path_scope path(ctx, f.name);
        if (auto converted = convert_field(plan, raw, ctx)) {
            result.set(f.name, std::move(*converted));
        }
    }
    return value(std::move(result));
}

std::optional<value> CompiledPipeline::convert_field(const field_plan& plan, const value* raw, run_context& ctx) const {
    const field& f = *plan.property;
    std::optional<value> out;

    for (const auto& precheck : plan.prechecks) {
        if (precheck(raw, out, ctx)) {
            return out;
        }
    }

    if (!raw) {
        return f.default_value;
    }
    if (raw->is_null()) {
        if (f.is_nullable) {
            return value();
        }
        return f.default_value;
    }

    plan.step(*raw, out, ctx);
    return out;
}

// ============================================================================
// Compiled Property
// ============================================================================

CompiledProperty::CompiledProperty(const field& property, std::vector<prepend_step> prechecks, convert_step step)
    : property_(&property),
      prechecks_(std::move(prechecks)),
      step_(std::move(step)) {
}

std::optional<value> CompiledProperty::run(const value* input, const convert_options& options) const {
    run_context ctx(options);
    path_scope path(ctx, property_->name);

    std::optional<value> out;
    for (const auto& precheck : prechecks_) {
        if (precheck(input, out, ctx)) {
            return out;
        }
    }

    if (!input) {
        return property_->default_value;
    }
    if (input->is_null()) {
        return property_->is_nullable ? std::optional<value>(value()) : property_->default_value;
    }

    step_(*input, out, ctx);
    return out;
}

} // namespace entiform
