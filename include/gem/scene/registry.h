#pragma once
#include <gem/scene/window.h>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace gem::scene {

// class name -> nodes carrying it, in registration order.
class ClassIndex {
public:
    void add(const std::string& class_name, NodeId node);

    const std::vector<NodeId>& nodes(const std::string& class_name) const;
    const std::vector<std::string>& classes_of(NodeId node) const;
    bool contains(const std::string& class_name) const;

    // Class names in first-registration order.
    const std::vector<std::string>& names() const { return names_; }
    size_t size() const { return names_.size(); }

private:
    std::vector<std::string> names_;
    std::unordered_map<std::string, std::vector<NodeId>> members_;
    std::unordered_map<NodeId, std::vector<std::string>> by_node_;
};

// id name <-> node; an id name is held by at most one node per document.
class IdIndex {
public:
    // False when the name already belongs to another node.
    bool insert(const std::string& id_name, NodeId node);

    std::optional<NodeId> find(const std::string& id_name) const;
    std::optional<std::string> id_of(NodeId node) const;
    size_t size() const { return by_name_.size(); }

private:
    std::unordered_map<std::string, NodeId> by_name_;
    std::unordered_map<NodeId, std::string> by_node_;
};

} // namespace gem::scene
