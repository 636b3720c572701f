#include "trellis/graph.hpp"

#include "trellis/project.hpp"
#include "trellis/utility.hpp"

#include <algorithm>
#include <cstdint>
#include <format>
#include <functional>

namespace trellis {

size_t BuildGraph::get_or_create_node(Node *node) {
    if (auto it = index_.find(node); it != index_.end()) {
        return it->second;
    }

    size_t id = nodes_.size();
    nodes_.push_back({node, {}, std::nullopt});
    index_.emplace(node, id);
    return id;
}

void BuildGraph::add_edge(Node *from, Node *to) {
    size_t from_id = get_or_create_node(from);
    size_t to_id = get_or_create_node(to);
    auto &edges = nodes_[from_id].out_edges;
    if (std::ranges::find(edges, to_id) == edges.end())
        edges.push_back(to_id);
}

void BuildGraph::add_step(const BuildInvocation &invocation, size_t step_id) {
    for (auto *out : invocation.outputs) {
        nodes_[get_or_create_node(out)].step_id = step_id;

        for (auto *in : invocation.inputs)
            add_edge(in, out);
        for (auto *in : invocation.implicit_inputs)
            add_edge(in, out);
        for (auto *in : invocation.order_only_inputs)
            add_edge(in, out);
    }
}

BuildGraph BuildGraph::from_project(const Project &project) {
    BuildGraph graph;

    const auto &invocations = project.invocations();
    for (size_t i = 0; i < invocations.size(); ++i)
        graph.add_step(*invocations[i], i);

    for (const auto &owned : project.nodes().nodes()) {
        Node *node = owned.get();
        graph.get_or_create_node(node);
        for (auto *dep : node->explicit_deps())
            graph.add_edge(dep, node);
        for (auto *dep : node->implicit_deps())
            graph.add_edge(dep, node);
        for (auto *dep : node->order_only_deps())
            graph.add_edge(dep, node);

        if (const auto *dir = dynamic_cast<const DirNode *>(node)) {
            for (auto *member : dir->members())
                graph.add_edge(member, node);
        } else if (const auto *alias = dynamic_cast<const AliasNode *>(node)) {
            for (auto *member : alias->members())
                graph.add_edge(member, node);
        }
    }
    return graph;
}

Result<std::vector<size_t>> BuildGraph::topo_sort() const {
    enum class STATUS : uint8_t { UNSTARTED, WORKING, FINISHED };

    std::vector<STATUS> status(nodes_.size(), STATUS::UNSTARTED);
    std::vector<size_t> order;
    std::vector<size_t> path;
    order.reserve(nodes_.size());

    std::function<Result<void>(size_t)> dfs = [&](size_t u) -> Result<void> {
        status[u] = STATUS::WORKING;
        path.push_back(u);
        for (size_t v : nodes_[u].out_edges) {
            if (status[v] == STATUS::UNSTARTED) {
                if (auto res = dfs(v); !res)
                    return res;
            } else if (status[v] == STATUS::WORKING) {
                std::vector<std::string> chain;
                for (auto it = std::ranges::find(path, v); it != path.end(); ++it)
                    chain.push_back(nodes_[*it].node->name());
                chain.push_back(nodes_[v].node->name());
                return std::unexpected(Error{ErrorKind::DependencyCycle,
                                             std::format("cycle detected in the build graph: {}", join(chain, " -> ")),
                                             nodes_[v].node->origin(), chain});
            }
        }
        path.pop_back();
        status[u] = STATUS::FINISHED;
        order.push_back(u);
        return {};
    };

    for (size_t i = 0; i < nodes_.size(); ++i) {
        if (status[i] == STATUS::UNSTARTED) {
            if (auto res = dfs(i); !res)
                return std::unexpected(res.error());
        }
    }

    std::reverse(order.begin(), order.end());
    return order;
}

} // namespace trellis
