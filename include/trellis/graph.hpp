#pragma once

#include "trellis/node.hpp"
#include "trellis/utility.hpp"

#include <optional>
#include <unordered_map>
#include <vector>

namespace trellis {

class Project;

/**
 * @brief Index-based view of the resolved node graph.
 *
 * Built from a project's invocations and node dependency lists. Used to reject cycles and to order nodes for the
 * generators.
 */
class BuildGraph {
public:
    /** @brief A vertex: one node plus the vertices that depend on it. */
    struct Vertex {
        Node *node;
        std::vector<size_t> out_edges; ///< Indices of vertices that depend on this one.
        std::optional<size_t> step_id; ///< Index of the producing invocation in the project, if any.
    };

    /// Every invocation and node of `project`, in declaration order.
    static BuildGraph from_project(const Project &project);

    /**
     * @brief Retrieves the index of an existing vertex or creates a new one.
     * @param node The node the vertex stands for.
     * @return The index of the vertex in `nodes()`.
     */
    size_t get_or_create_node(Node *node);

    /// Records that `to` depends on `from`. Repeated edges are kept once.
    void add_edge(Node *from, Node *to);

    /**
     * @brief Adds the edges of one invocation.
     * @param invocation The invocation; every input gains an edge to every output.
     * @param step_id Index of the invocation in the project.
     */
    void add_step(const BuildInvocation &invocation, size_t step_id);

    const std::vector<Vertex> &nodes() const {
        return nodes_;
    }

    /**
     * @brief Performs a topological sort of the graph.
     * @return Vertex indices with dependencies first, or a `DependencyCycle` error whose chain lists the nodes of the
     *         cycle.
     */
    Result<std::vector<size_t>> topo_sort() const;

private:
    std::vector<Vertex> nodes_;
    std::unordered_map<Node *, size_t> index_;
};

} // namespace trellis
