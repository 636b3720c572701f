#pragma once

#include "trellis/utility.hpp"

#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace trellis {

class Environment;
class Node;
class Target;

enum class NodeKind { File, Dir, Value, Alias };

/// A directory is either a collector of outputs (target) or a fixed set of inputs (source).
enum class DirRole { Target, Source };

/**
 * @brief One token of a per-build command variable.
 *
 * Paths are kept separate from their flag prefix so the generator can rewrite them relative to the output directory
 * before quoting the whole token.
 */
struct CommandToken {
    std::string prefix;
    std::string value;
    bool is_path = false;
};

/**
 * @brief A concrete build step: one command producing one or more output nodes.
 *
 * The environment identity, tool and command variable select the rule; everything target-specific lives in
 * `variables`. `command` holds the expanded rule template and stays empty until the resolver expands it.
 */
struct BuildInvocation {
    const Environment *env = nullptr;
    std::string tool;
    std::string command_var;
    std::string command_template; ///< Custom command text; empty when the template comes from `tool.command_var`.
    std::string rule_name;        ///< Overrides the generated rule name (custom commands).
    std::string language;
    std::vector<std::string> command;
    std::vector<Node *> outputs;
    std::vector<Node *> inputs;
    std::vector<Node *> implicit_inputs;
    std::vector<Node *> order_only_inputs;
    std::map<std::string, std::vector<CommandToken>> variables;
    std::string depfile;
    std::string deps_style;
    std::string description;
    const Target *owner = nullptr; ///< Target whose resolution created the step; null for direct builder calls.
    Origin origin = {};
};

/**
 * @brief Abstract vertex of the build graph.
 *
 * Nodes are created only through a `NodeRegistry`, which guarantees one instance per identity. Adding a dependency
 * that is already present is a no-op.
 */
class Node {
public:
    virtual ~Node() = default;

    virtual NodeKind kind() const = 0;
    /// Identity as shown in diagnostics: the absolute path for file and directory nodes, the name otherwise.
    virtual std::string name() const = 0;

    void depends(Node *dep);
    void depends_implicit(Node *dep);
    void depends_order_only(Node *dep);

    const std::vector<Node *> &explicit_deps() const {
        return explicit_deps_;
    }
    const std::vector<Node *> &implicit_deps() const {
        return implicit_deps_;
    }
    const std::vector<Node *> &order_only_deps() const {
        return order_only_deps_;
    }

    BuildInvocation *producer() const {
        return producer_.get();
    }
    const std::shared_ptr<BuildInvocation> &producer_ptr() const {
        return producer_;
    }
    /// Fails with `NodeConflict` when a different invocation already produces this node.
    Result<void> set_producer(std::shared_ptr<BuildInvocation> producer);
    void clear_producer() {
        producer_.reset();
    }

    const Origin &origin() const {
        return origin_;
    }

protected:
    explicit Node(Origin origin) : origin_(origin) {
    }

private:
    std::vector<Node *> explicit_deps_;
    std::vector<Node *> implicit_deps_;
    std::vector<Node *> order_only_deps_;
    std::shared_ptr<BuildInvocation> producer_;
    Origin origin_;
};

class FileNode : public Node {
public:
    FileNode(std::filesystem::path path, Origin origin) : Node(origin), path_(std::move(path)) {
    }

    NodeKind kind() const override {
        return NodeKind::File;
    }
    std::string name() const override {
        return path_.string();
    }
    const std::filesystem::path &path() const {
        return path_;
    }

private:
    std::filesystem::path path_;
};

class DirNode : public Node {
public:
    DirNode(std::filesystem::path path, DirRole role, Origin origin)
        : Node(origin), path_(std::move(path)), role_(role) {
    }

    NodeKind kind() const override {
        return NodeKind::Dir;
    }
    std::string name() const override {
        return path_.string();
    }
    const std::filesystem::path &path() const {
        return path_;
    }
    DirRole role() const {
        return role_;
    }

    void add_member(Node *member);
    const std::vector<Node *> &members() const {
        return members_;
    }

private:
    std::filesystem::path path_;
    DirRole role_;
    std::vector<Node *> members_;
};

class ValueNode : public Node {
public:
    ValueNode(std::string name, std::string value, Origin origin)
        : Node(origin), name_(std::move(name)), value_(std::move(value)) {
    }

    NodeKind kind() const override {
        return NodeKind::Value;
    }
    std::string name() const override {
        return name_;
    }
    const std::string &value() const {
        return value_;
    }
    void set_value(std::string value) {
        value_ = std::move(value);
    }

private:
    std::string name_;
    std::string value_;
};

class AliasNode : public Node {
public:
    AliasNode(std::string name, Origin origin) : Node(origin), name_(std::move(name)) {
    }

    NodeKind kind() const override {
        return NodeKind::Alias;
    }
    std::string name() const override {
        return name_;
    }

    void add_member(Node *member);
    const std::vector<Node *> &members() const {
        return members_;
    }

private:
    std::string name_;
    std::vector<Node *> members_;
};

/**
 * @brief Owns every node of one project and deduplicates them by identity.
 *
 * File and directory nodes are keyed by their absolute, lexically normalized path (relative paths are taken relative
 * to the registry root). Value and alias nodes live in separate name spaces.
 */
class NodeRegistry {
public:
    explicit NodeRegistry(std::filesystem::path root);

    Result<FileNode *> file(const std::filesystem::path &path, Origin origin = Origin::current());
    Result<DirNode *> dir(const std::filesystem::path &path, DirRole role, Origin origin = Origin::current());
    ValueNode *value(const std::string &name, std::string value, Origin origin = Origin::current());
    AliasNode *alias(const std::string &name, Origin origin = Origin::current());

    /// Looks up a file or directory node without creating it.
    Node *find(const std::filesystem::path &path) const;
    AliasNode *find_alias(const std::string &name) const;

    std::filesystem::path canonical(const std::filesystem::path &path) const;

    const std::filesystem::path &root() const {
        return root_;
    }
    const std::vector<std::unique_ptr<Node>> &nodes() const {
        return nodes_;
    }
    size_t size() const {
        return nodes_.size();
    }

private:
    std::filesystem::path root_;
    std::vector<std::unique_ptr<Node>> nodes_;
    std::unordered_map<std::string, Node *> paths_;
    std::unordered_map<std::string, ValueNode *> values_;
    std::unordered_map<std::string, AliasNode *> aliases_;
};

/// Path of a file or directory node, empty for the other kinds.
std::filesystem::path node_path(const Node &node);

} // namespace trellis
