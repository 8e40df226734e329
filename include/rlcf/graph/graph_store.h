#pragma once

#include <rlcf/core/types.h>

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace rlcf::graph {

/**
 * Node representation. Structure is produced by ingestion and never mutated here.
 */
struct GraphNode {
    NodeId id;        // Stable external id (e.g. a URN)
    std::string type; // Node type tag (article, concept, ruling, ...)
};

/**
 * Typed directed relationship between two nodes.
 */
struct GraphEdge {
    NodeId from;
    NodeId to;
    std::string relation; // Relation type; traversal weights are keyed on it
};

/**
 * Read-mostly graph used by traversal scoring. Implementations must be safe for
 * concurrent readers while ingestion appends.
 */
class GraphStore {
public:
    virtual ~GraphStore() = default;

    // Idempotent for an identical node; a conflicting type for an existing id is rejected.
    virtual Result<void> addNode(const GraphNode& node) = 0;

    // ReferenceError when either endpoint is unknown. Duplicate edges are ignored.
    virtual Result<void> addEdge(const GraphEdge& edge) = 0;

    virtual bool hasNode(const NodeId& id) const = 0;
    virtual std::optional<GraphNode> getNode(const NodeId& id) const = 0;

    virtual std::vector<GraphEdge> outgoing(const NodeId& id) const = 0;
    virtual std::vector<GraphEdge> incoming(const NodeId& id) const = 0;

    virtual std::size_t nodeCount() const = 0;
    virtual std::size_t edgeCount() const = 0;
};

std::shared_ptr<GraphStore> makeInMemoryGraphStore();

} // namespace rlcf::graph
