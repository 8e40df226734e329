#include <rlcf/graph/graph_store.h>

#include <spdlog/spdlog.h>

#include <mutex>
#include <shared_mutex>
#include <unordered_map>

namespace rlcf::graph {

namespace {

class InMemoryGraphStore final : public GraphStore {
public:
    Result<void> addNode(const GraphNode& node) override {
        if (node.id.empty())
            return Error{ErrorCode::InvalidArgument, "graph node id must not be empty"};

        std::unique_lock lock(mutex_);
        auto [it, inserted] = nodes_.try_emplace(node.id, node);
        if (!inserted && it->second.type != node.type) {
            return Error{ErrorCode::InvalidArgument, "graph node '" + node.id +
                                                         "' already exists with type '" +
                                                         it->second.type + "'"};
        }
        return {};
    }

    Result<void> addEdge(const GraphEdge& edge) override {
        if (edge.relation.empty())
            return Error{ErrorCode::InvalidArgument, "graph edge relation must not be empty"};

        std::unique_lock lock(mutex_);
        if (!nodes_.count(edge.from))
            return Error{ErrorCode::ReferenceError, "edge source '" + edge.from + "' is unknown"};
        if (!nodes_.count(edge.to))
            return Error{ErrorCode::ReferenceError, "edge target '" + edge.to + "' is unknown"};

        auto& out = outgoing_[edge.from];
        for (const auto& e : out) {
            if (e.to == edge.to && e.relation == edge.relation)
                return {};
        }
        out.push_back(edge);
        incoming_[edge.to].push_back(edge);
        ++edgeCount_;
        return {};
    }

    bool hasNode(const NodeId& id) const override {
        std::shared_lock lock(mutex_);
        return nodes_.count(id) > 0;
    }

    std::optional<GraphNode> getNode(const NodeId& id) const override {
        std::shared_lock lock(mutex_);
        auto it = nodes_.find(id);
        if (it == nodes_.end())
            return std::nullopt;
        return it->second;
    }

    std::vector<GraphEdge> outgoing(const NodeId& id) const override {
        std::shared_lock lock(mutex_);
        auto it = outgoing_.find(id);
        return it == outgoing_.end() ? std::vector<GraphEdge>{} : it->second;
    }

    std::vector<GraphEdge> incoming(const NodeId& id) const override {
        std::shared_lock lock(mutex_);
        auto it = incoming_.find(id);
        return it == incoming_.end() ? std::vector<GraphEdge>{} : it->second;
    }

    std::size_t nodeCount() const override {
        std::shared_lock lock(mutex_);
        return nodes_.size();
    }

    std::size_t edgeCount() const override {
        std::shared_lock lock(mutex_);
        return edgeCount_;
    }

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<NodeId, GraphNode> nodes_;
    std::unordered_map<NodeId, std::vector<GraphEdge>> outgoing_;
    std::unordered_map<NodeId, std::vector<GraphEdge>> incoming_;
    std::size_t edgeCount_ = 0;
};

} // namespace

std::shared_ptr<GraphStore> makeInMemoryGraphStore() {
    spdlog::debug("[GraphStore] using in-memory graph store");
    return std::make_shared<InMemoryGraphStore>();
}

} // namespace rlcf::graph
