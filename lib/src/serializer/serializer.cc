//
// Compiler Registry ("Serializer")
//

#include <entiform/serializer.hh>
#include <atomic>

namespace entiform {

namespace {
    std::atomic<std::uint64_t> g_next_serializer_id{1};

    const std::vector<generator> NO_PREPENDS;
}

// ============================================================================
// Compiler Table
// ============================================================================

void CompilerTable::register_type(type_tag tag, generator gen) {
    primary_[tag] = std::move(gen);
    ++revision_;
}

void CompilerTable::prepend(type_tag tag, generator gen) {
    prepends_[tag].push_back(std::move(gen));
    ++revision_;
}

void CompilerTable::register_for_binary(generator gen) {
    binary_ = std::move(gen);
    ++revision_;
}

const generator* CompilerTable::find(type_tag tag) const {
    if (tag == type_tag::binary) {
        return binary_ ? &binary_ : nullptr;
    }
    auto it = primary_.find(tag);
    return it != primary_.end() ? &it->second : nullptr;
}

const std::vector<generator>& CompilerTable::prepends(type_tag tag) const {
    auto it = prepends_.find(tag);
    return it != prepends_.end() ? it->second : NO_PREPENDS;
}

// ============================================================================
// Serializer
// ============================================================================

Serializer::Serializer(std::string name)
    : name_(std::move(name)),
      id_(g_next_serializer_id.fetch_add(1)) {
}

std::unique_ptr<Serializer> Serializer::fork(std::string name) const {
    auto forked = std::make_unique<Serializer>(std::move(name));
    forked->decoders_ = decoders_;
    forked->encoders_ = encoders_;
    return forked;
}

} // namespace entiform
