//
// Per-call conversion state
//

#pragma once

#include <entiform/value.hh>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace entiform {

class entity;
class schema;
struct field;

enum class direction {
    decode,  ///< External data → entity
    encode   ///< Entity → external data
};

const char* direction_name(direction dir);

/// Options recognized by every conversion entry point
struct convert_options {
    /// Ancestor chain used by parent-reference fields (outermost first)
    std::vector<std::shared_ptr<entity>> parents;
    /// Only fields sharing one of these groups are converted (empty: all)
    std::set<std::string> groups;
    /// Fields sharing one of these groups are skipped
    std::set<std::string> groups_exclude;
    /// Coerce mismatching shapes ("12" → 12, JSON text → nested entity)
    bool loosely = true;
};

/// Mutable state of one pipeline invocation: the field path used in error
/// messages and the chain of entities being decoded.
class run_context {
public:
    explicit run_context(const convert_options& options);

    [[nodiscard]] const convert_options& options() const { return options_; }

    /// Dotted path of the current position, optionally extended by a leaf
    [[nodiscard]] std::string path(const std::string& leaf = {}) const;
    void push_segment(std::string segment);
    void pop_segment();

    void push_parent(std::shared_ptr<entity> e);
    void pop_parent();
    /// Nearest enclosing entity of the given schema, excluding the innermost
    /// (the entity currently being populated)
    [[nodiscard]] std::shared_ptr<entity> find_parent(const schema& s) const;

    /// Group filter from the options
    [[nodiscard]] bool is_visible(const field& f) const;

private:
    const convert_options& options_;
    std::vector<std::string> segments_;
    std::vector<std::shared_ptr<entity>> parents_;
};

/// RAII path segment
class path_scope {
public:
    path_scope(run_context& ctx, std::string segment) : ctx_(ctx) {
        ctx_.push_segment(std::move(segment));
    }
    ~path_scope() { ctx_.pop_segment(); }

    path_scope(const path_scope&) = delete;
    path_scope& operator=(const path_scope&) = delete;

private:
    run_context& ctx_;
};

/// RAII parent entity
class parent_scope {
public:
    parent_scope(run_context& ctx, std::shared_ptr<entity> e) : ctx_(ctx) {
        ctx_.push_parent(std::move(e));
    }
    ~parent_scope() { ctx_.pop_parent(); }

    parent_scope(const parent_scope&) = delete;
    parent_scope& operator=(const parent_scope&) = delete;

private:
    run_context& ctx_;
};

} // namespace entiform
