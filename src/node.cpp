#include "trellis/node.hpp"

#include <algorithm>
#include <format>

namespace fs = std::filesystem;

namespace trellis {

namespace {

void add_unique(std::vector<Node *> &list, Node *node) {
    if (std::ranges::find(list, node) == list.end())
        list.push_back(node);
}

std::string_view kind_name(NodeKind kind) {
    switch (kind) {
    case NodeKind::File:
        return "file";
    case NodeKind::Dir:
        return "directory";
    case NodeKind::Value:
        return "value";
    case NodeKind::Alias:
        return "alias";
    }
    return "node";
}

} // namespace

void Node::depends(Node *dep) {
    add_unique(explicit_deps_, dep);
}

void Node::depends_implicit(Node *dep) {
    add_unique(implicit_deps_, dep);
}

void Node::depends_order_only(Node *dep) {
    add_unique(order_only_deps_, dep);
}

Result<void> Node::set_producer(std::shared_ptr<BuildInvocation> producer) {
    if (producer_ && producer_ != producer) {
        return fail(ErrorKind::NodeConflict,
                    std::format("duplicate producer for output: {} (first declared at {})", name(),
                                format_origin(producer_->origin)),
                    producer ? producer->origin : origin_);
    }
    producer_ = std::move(producer);
    return {};
}

void DirNode::add_member(Node *member) {
    add_unique(members_, member);
}

void AliasNode::add_member(Node *member) {
    add_unique(members_, member);
}

NodeRegistry::NodeRegistry(fs::path root) : root_(fs::absolute(root).lexically_normal()) {
}

fs::path NodeRegistry::canonical(const fs::path &path) const {
    fs::path abs = path.is_absolute() ? path : root_ / path;
    abs = abs.lexically_normal();
    // "dir/" and "dir" name the same node.
    if (!abs.has_filename() && abs.has_parent_path() && abs != abs.root_path())
        abs = abs.parent_path();
    return abs;
}

Result<FileNode *> NodeRegistry::file(const fs::path &path, Origin origin) {
    fs::path key = canonical(path);
    if (auto it = paths_.find(key.string()); it != paths_.end()) {
        if (auto *node = dynamic_cast<FileNode *>(it->second))
            return node;
        return fail(ErrorKind::NodeConflict,
                    std::format("{} is already declared as a {} node", key.string(), kind_name(it->second->kind())),
                    origin);
    }

    auto node = std::make_unique<FileNode>(key, origin);
    auto *raw = node.get();
    nodes_.push_back(std::move(node));
    paths_.emplace(key.string(), raw);
    return raw;
}

Result<DirNode *> NodeRegistry::dir(const fs::path &path, DirRole role, Origin origin) {
    fs::path key = canonical(path);
    if (auto it = paths_.find(key.string()); it != paths_.end()) {
        auto *node = dynamic_cast<DirNode *>(it->second);
        if (!node) {
            return fail(ErrorKind::NodeConflict,
                        std::format("{} is already declared as a {} node", key.string(),
                                    kind_name(it->second->kind())),
                        origin);
        }
        if (node->role() != role) {
            return fail(ErrorKind::NodeConflict,
                        std::format("directory {} is already declared as a {}", key.string(),
                                    node->role() == DirRole::Target ? "target" : "source"),
                        origin);
        }
        return node;
    }

    auto node = std::make_unique<DirNode>(key, role, origin);
    auto *raw = node.get();
    nodes_.push_back(std::move(node));
    paths_.emplace(key.string(), raw);
    return raw;
}

ValueNode *NodeRegistry::value(const std::string &name, std::string value, Origin origin) {
    if (auto it = values_.find(name); it != values_.end()) {
        it->second->set_value(std::move(value));
        return it->second;
    }
    auto node = std::make_unique<ValueNode>(name, std::move(value), origin);
    auto *raw = node.get();
    nodes_.push_back(std::move(node));
    values_.emplace(name, raw);
    return raw;
}

AliasNode *NodeRegistry::alias(const std::string &name, Origin origin) {
    if (auto it = aliases_.find(name); it != aliases_.end())
        return it->second;
    auto node = std::make_unique<AliasNode>(name, origin);
    auto *raw = node.get();
    nodes_.push_back(std::move(node));
    aliases_.emplace(name, raw);
    return raw;
}

Node *NodeRegistry::find(const fs::path &path) const {
    if (auto it = paths_.find(canonical(path).string()); it != paths_.end())
        return it->second;
    return nullptr;
}

AliasNode *NodeRegistry::find_alias(const std::string &name) const {
    if (auto it = aliases_.find(name); it != aliases_.end())
        return it->second;
    return nullptr;
}

fs::path node_path(const Node &node) {
    if (const auto *file = dynamic_cast<const FileNode *>(&node))
        return file->path();
    if (const auto *dir = dynamic_cast<const DirNode *>(&node))
        return dir->path();
    return {};
}

} // namespace trellis
