#include <gem/scene/registry.h>
#include <algorithm>

namespace gem::scene {

void ClassIndex::add(const std::string& class_name, NodeId node) {
    auto [it, inserted] = members_.try_emplace(class_name);
    if (inserted) {
        names_.push_back(class_name);
    }
    it->second.push_back(node);

    auto& classes = by_node_[node];
    if (std::find(classes.begin(), classes.end(), class_name) == classes.end()) {
        classes.push_back(class_name);
    }
}

const std::vector<NodeId>& ClassIndex::nodes(const std::string& class_name) const {
    static const std::vector<NodeId> empty;
    auto it = members_.find(class_name);
    return it == members_.end() ? empty : it->second;
}

const std::vector<std::string>& ClassIndex::classes_of(NodeId node) const {
    static const std::vector<std::string> empty;
    auto it = by_node_.find(node);
    return it == by_node_.end() ? empty : it->second;
}

bool ClassIndex::contains(const std::string& class_name) const {
    return members_.count(class_name) > 0;
}

bool IdIndex::insert(const std::string& id_name, NodeId node) {
    auto it = by_name_.find(id_name);
    if (it != by_name_.end()) {
        return it->second == node;
    }
    by_name_.emplace(id_name, node);
    by_node_[node] = id_name;
    return true;
}

std::optional<NodeId> IdIndex::find(const std::string& id_name) const {
    auto it = by_name_.find(id_name);
    if (it == by_name_.end()) return std::nullopt;
    return it->second;
}

std::optional<std::string> IdIndex::id_of(NodeId node) const {
    auto it = by_node_.find(node);
    if (it == by_node_.end()) return std::nullopt;
    return it->second;
}

} // namespace gem::scene
