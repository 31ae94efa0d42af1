//
// Per-call conversion state
//

#include <entiform/run_context.hh>
#include <entiform/entity.hh>
#include <entiform/schema.hh>
#include <algorithm>

namespace entiform {

const char* direction_name(direction dir) {
    return dir == direction::decode ? "decode" : "encode";
}

run_context::run_context(const convert_options& options)
    : options_(options), parents_(options.parents) {
}

std::string run_context::path(const std::string& leaf) const {
    std::string result;
    for (const auto& segment : segments_) {
        if (!result.empty()) result += '.';
        result += segment;
    }
    if (!leaf.empty()) {
        if (!result.empty()) result += '.';
        result += leaf;
    }
    return result;
}

void run_context::push_segment(std::string segment) {
    segments_.push_back(std::move(segment));
}

void run_context::pop_segment() {
    segments_.pop_back();
}

void run_context::push_parent(std::shared_ptr<entity> e) {
    parents_.push_back(std::move(e));
}

void run_context::pop_parent() {
    parents_.pop_back();
}

std::shared_ptr<entity> run_context::find_parent(const schema& s) const {
    if (parents_.size() < 2) {
        return nullptr;
    }
    for (auto it = parents_.rbegin() + 1; it != parents_.rend(); ++it) {
        if (*it && (*it)->get_schema().id() == s.id()) {
            return *it;
        }
    }
    return nullptr;
}

bool run_context::is_visible(const field& f) const {
    const auto shares = [&](const std::set<std::string>& groups) {
        return std::any_of(f.groups.begin(), f.groups.end(),
            [&](const std::string& g) { return groups.count(g) > 0; });
    };

    if (!options_.groups.empty() && !shares(options_.groups)) {
        return false;
    }
    if (!options_.groups_exclude.empty() && shares(options_.groups_exclude)) {
        return false;
    }
    return true;
}

} // namespace entiform
