//
// Compile cache with reentrancy (cycle) handling
//
// Shared by the conversion and validation compilers. A build for a key runs
// with a frame pushed on the compilation stack. When the build transitively
// asks for its own key (a self-referencing schema), the request is answered
// with the frame's forward reference, which is bound to the finished
// pipeline once the outer build completes.
//
// A failed build evicts every pipeline published while its frame was active,
// since those may hold forward references that will never be bound.
//
// Ownership: the pipelines built under one outermost request form a group.
// Links inside the group are non-owning; every handle given out to a caller
// owns the whole group, so a held pipeline keeps the rest of its cycle alive
// after the cache is cleared.
//
// Thread safety: one recursive mutex is held for the whole build. The
// building thread may re-enter; every other requester blocks until the build
// is published, so a key is never built twice at the same time.
//

#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <utility>
#include <vector>

namespace entiform {

/// Indirection to a (possibly not yet finished) pipeline
template <typename Pipeline>
class PipelineRef {
public:
    PipelineRef() = default;
    explicit PipelineRef(std::shared_ptr<const Pipeline> target) : target_(std::move(target)) {}

    [[nodiscard]] bool is_bound() const { return target_ != nullptr; }

    [[nodiscard]] const Pipeline& get() const {
        if (!target_) {
            throw std::logic_error("pipeline used before its compilation finished");
        }
        return *target_;
    }

    const Pipeline* operator->() const { return &get(); }
    const Pipeline& operator*() const { return get(); }

    void bind(std::shared_ptr<const Pipeline> target) { target_ = std::move(target); }

private:
    std::shared_ptr<const Pipeline> target_;
};

template <typename Key, typename Pipeline>
class CompileCache {
public:
    using handle = std::shared_ptr<PipelineRef<Pipeline>>;

    /// Return the cached pipeline for key, a forward reference when key is
    /// being built further up the stack, or build and publish it.
    ///
    /// Handles returned to the outermost caller share ownership of the whole
    /// build group. Handles returned to nested builds of the same group are
    /// non-owning, since the group already owns both ends of the link.
    template <typename Build>
    handle get_or_build(const Key& key, Build&& build) {
        std::lock_guard<std::recursive_mutex> lock(mutex_);

        if (auto it = cache_.find(key); it != cache_.end()) {
            return share(it->second);
        }

        for (auto& frame : stack_) {
            if (frame.key == key) {
                if (!frame.placeholder) {
                    frame.placeholder = adopt(std::make_shared<PipelineRef<Pipeline>>());
                }
                ++forward_references_;
                return borrow(frame.placeholder);
            }
        }

        const bool outermost = stack_.empty();
        if (outermost) {
            group_ = std::make_shared<group_t>();
        }
        std::shared_ptr<group_t> group = group_;

        stack_.push_back(frame_t{key, nullptr, {}});
        const std::size_t depth = stack_.size() - 1;

        std::shared_ptr<const Pipeline> pipeline;
        try {
            pipeline = build();
        } catch (...) {
            for (const auto& published : stack_[depth].published) {
                cache_.erase(published);
            }
            stack_.pop_back();
            if (outermost) {
                group_.reset();
            }
            throw;
        }

        frame_t frame = std::move(stack_[depth]);
        stack_.pop_back();

        PipelineRef<Pipeline>* ref = frame.placeholder ? frame.placeholder
                                                       : adopt(std::make_shared<PipelineRef<Pipeline>>());
        ref->bind(std::move(pipeline));
        entry_t entry{handle(group, ref), group.get()};
        cache_.emplace(key, entry);

        if (!stack_.empty()) {
            auto& parent = stack_.back().published;
            parent.insert(parent.end(), frame.published.begin(), frame.published.end());
            parent.push_back(key);
        }

        ++builds_;
        if (outermost) {
            group_.reset();
            return entry.owner;
        }
        return borrow(ref);
    }

    [[nodiscard]] bool contains(const Key& key) const {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        return cache_.count(key) > 0;
    }

    [[nodiscard]] std::size_t size() const {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        return cache_.size();
    }

    /// Number of pipelines physically built since the last clear()
    [[nodiscard]] std::size_t builds() const {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        return builds_;
    }

    /// Number of cyclic requests answered with a forward reference
    [[nodiscard]] std::size_t forward_references() const {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        return forward_references_;
    }

    [[nodiscard]] std::size_t depth() const {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        return stack_.size();
    }

    /// Drop the cached handles; groups still held by callers stay alive
    void clear() {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        cache_.clear();
        builds_ = 0;
        forward_references_ = 0;
    }

private:
    /// Every pipeline reference created by one outermost build
    struct group_t {
        std::vector<handle> members;
    };

    struct entry_t {
        handle owner;            ///< Shares ownership of the group
        const group_t* group;
    };

    struct frame_t {
        Key key;
        PipelineRef<Pipeline>* placeholder;
        std::vector<Key> published;
    };

    PipelineRef<Pipeline>* adopt(handle ref) {
        group_->members.push_back(ref);
        return ref.get();
    }

    static handle borrow(PipelineRef<Pipeline>* ref) {
        return handle(handle(), ref);
    }

    handle share(const entry_t& entry) const {
        if (group_ && entry.group == group_.get()) {
            return borrow(entry.owner.get());
        }
        return entry.owner;
    }

    mutable std::recursive_mutex mutex_;
    std::map<Key, entry_t> cache_;
    std::vector<frame_t> stack_;
    std::shared_ptr<group_t> group_;   ///< Set while an outermost build runs
    std::size_t builds_ = 0;
    std::size_t forward_references_ = 0;
};

} // namespace entiform
