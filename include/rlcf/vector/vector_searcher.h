#pragma once

#include <rlcf/core/types.h>

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace rlcf::vector {

/**
 * Content chunk as produced by ingestion. Immutable once added.
 */
struct Chunk {
    ChunkId id;
    Embedding embedding;
    std::string contentType; // e.g. "article", "commentary", "ruling"
};

/**
 * Optional restriction on search candidates. Empty fields do not filter.
 */
struct ChunkFilter {
    std::vector<std::string> contentTypes;
    std::optional<std::unordered_set<ChunkId>> allowList;

    bool matches(const Chunk& chunk) const;
};

struct VectorMatch {
    ChunkId chunkId;
    double similarity = 0.0; // cosine mapped to [0,1]
};

/**
 * Existence check used by the bridge index to reject dangling chunk references.
 */
class ChunkCatalog {
public:
    virtual ~ChunkCatalog() = default;
    virtual bool containsChunk(const ChunkId& id) const = 0;
};

/**
 * Nearest-neighbour search over chunk embeddings. For a fixed index state the
 * result list is deterministic: similarity descending, then chunk id ascending.
 */
class VectorSearcher : public ChunkCatalog {
public:
    ~VectorSearcher() override = default;

    virtual Result<void> addChunk(Chunk chunk) = 0;

    virtual Result<std::vector<VectorMatch>> search(const Embedding& query, std::size_t topN,
                                                    const ChunkFilter* filter = nullptr) const = 0;

    virtual std::optional<Chunk> getChunk(const ChunkId& id) const = 0;

    // 0 until the first chunk fixes the dimension
    virtual std::size_t dimension() const = 0;
    virtual std::size_t size() const = 0;
};

// Cosine similarity mapped from [-1,1] to [0,1]. Zero-norm input yields 0.5.
double normalizedCosine(const Embedding& a, const Embedding& b);

std::shared_ptr<VectorSearcher> makeInMemoryVectorSearcher();

} // namespace rlcf::vector
