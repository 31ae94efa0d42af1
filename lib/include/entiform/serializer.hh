//
// Compiler Registry ("Serializer")
//
// A Serializer is a named pair of generator tables, one per direction:
// decoders turn external data into entity values, encoders do the reverse.
// Each table maps a type tag to one primary generator (last registration
// wins) plus prepend generators that run before it, in registration order.
//
// USAGE EXAMPLE:
//   auto& json = *SerializerRegistry::instance().get_serializer("json");
//   json.decoders().register_type(type_tag::string,
//       [](const field&, CompilerState& state) {
//           state.add_setter([](const value& in, std::optional<value>& out, run_context&) {
//               if (in.is_string()) out = in;
//           });
//       });
//

#pragma once

#include <entiform/compiler_state.hh>
#include <entiform/schema.hh>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace entiform {

/// Emits conversion steps for one field into the compiler state
using generator = std::function<void(const field& property, CompilerState& state)>;

// ============================================================================
// Compiler Table
// ============================================================================

class CompilerTable {
public:
    /// Primary generator for a tag; replaces an earlier registration
    void register_type(type_tag tag, generator gen);

    /// Prepend generator for a tag; accumulates in registration order
    void prepend(type_tag tag, generator gen);

    /// Primary generator for every binary kind
    void register_for_binary(generator gen);

    /// Primary generator for a tag, nullptr when none is registered
    [[nodiscard]] const generator* find(type_tag tag) const;

    [[nodiscard]] const std::vector<generator>& prepends(type_tag tag) const;

    [[nodiscard]] bool has(type_tag tag) const { return find(tag) != nullptr; }

    /// Incremented by every registration
    [[nodiscard]] std::uint64_t revision() const { return revision_; }

private:
    std::map<type_tag, generator> primary_;
    std::map<type_tag, std::vector<generator>> prepends_;
    generator binary_;
    std::uint64_t revision_ = 0;
};

// ============================================================================
// Serializer
// ============================================================================

class Serializer {
public:
    explicit Serializer(std::string name);
    virtual ~Serializer() = default;

    Serializer(const Serializer&) = delete;
    Serializer& operator=(const Serializer&) = delete;

    [[nodiscard]] const std::string& name() const { return name_; }

    /// Process-unique identity, used as cache key
    [[nodiscard]] std::uint64_t id() const { return id_; }

    /// External → entity ("to class")
    CompilerTable& decoders() { return decoders_; }
    [[nodiscard]] const CompilerTable& decoders() const { return decoders_; }

    /// Entity → external ("from class")
    CompilerTable& encoders() { return encoders_; }
    [[nodiscard]] const CompilerTable& encoders() const { return encoders_; }

    CompilerTable& table(direction dir) { return dir == direction::decode ? decoders_ : encoders_; }
    [[nodiscard]] const CompilerTable& table(direction dir) const {
        return dir == direction::decode ? decoders_ : encoders_;
    }

    /// Changes whenever a generator is registered in either table; part of
    /// the pipeline cache key so stale pipelines are never reused
    [[nodiscard]] std::uint64_t revision() const { return decoders_.revision() + encoders_.revision(); }

    /// New Serializer starting with a copy of both tables
    [[nodiscard]] std::unique_ptr<Serializer> fork(std::string name) const;

private:
    std::string name_;
    std::uint64_t id_;
    CompilerTable decoders_;
    CompilerTable encoders_;
};

} // namespace entiform
