//
// Compile-time context handed to conversion generators
//
// A generator inspects the field descriptor and emits conversion steps into
// the state. Steps are plain closures: everything that can be decided from
// the schema is decided while the generator runs, so executing a pipeline
// never consults a registry again.
//

#pragma once

#include <entiform/compile_cache.hh>
#include <entiform/run_context.hh>
#include <entiform/value.hh>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace entiform {

class schema;
class Serializer;
class JitCompiler;
class CompiledPipeline;
struct field;

/// Converts a present, non-null input. Leaving `out` empty leaves the
/// target unset.
using convert_step = std::function<void(const value& in, std::optional<value>& out, run_context& ctx)>;

/// Runs on the raw input (nullptr when absent) before absent/null handling
/// and the primary step. Returns true when it decided the outcome.
using prepend_step = std::function<bool(const value* in, std::optional<value>& out, run_context& ctx)>;

using pipeline_handle = std::shared_ptr<PipelineRef<CompiledPipeline>>;

class CompilerState {
public:
    CompilerState(JitCompiler& compiler,
                   const schema& owner,
                   const field& property,
                   const Serializer& target,
                   direction dir,
                   std::string accessor,
                   std::string setter);

    [[nodiscard]] const field& property() const { return property_; }
    [[nodiscard]] const schema& owner() const { return owner_; }
    [[nodiscard]] const Serializer& target_serializer() const { return serializer_; }
    [[nodiscard]] direction dir() const { return dir_; }

    /// Description of where the input is read from ("data.price")
    [[nodiscard]] const std::string& accessor() const { return accessor_; }
    /// Description of where the result is written to ("Product.price")
    [[nodiscard]] const std::string& setter() const { return setter_; }

    /// Primary step; a later call replaces an earlier one
    void add_setter(convert_step step);
    /// Precheck, kept in emission order
    void add_precheck(prepend_step step);

    /// Pipeline of a nested schema in the same Serializer and direction.
    /// May be a forward reference while that schema is still being compiled.
    pipeline_handle nested(const schema& s);

    /// Schema referenced by a field of the owner schema
    [[nodiscard]] const schema& resolve(const field& f) const;

    [[nodiscard]] bool has_setter() const { return static_cast<bool>(setter_step_); }
    convert_step take_setter() { return std::move(setter_step_); }
    std::vector<prepend_step> take_prechecks() { return std::move(prechecks_); }

private:
    JitCompiler& compiler_;
    const schema& owner_;
    const field& property_;
    const Serializer& serializer_;
    direction dir_;
    std::string accessor_;
    std::string setter_;

    convert_step setter_step_;
    std::vector<prepend_step> prechecks_;
};

} // namespace entiform
