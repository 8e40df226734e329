#include <rlcf/vector/vector_searcher.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <map>
#include <mutex>
#include <shared_mutex>

namespace rlcf::vector {

bool ChunkFilter::matches(const Chunk& chunk) const {
    if (!contentTypes.empty() &&
        std::find(contentTypes.begin(), contentTypes.end(), chunk.contentType) ==
            contentTypes.end()) {
        return false;
    }
    if (allowList && !allowList->count(chunk.id)) {
        return false;
    }
    return true;
}

double normalizedCosine(const Embedding& a, const Embedding& b) {
    const std::size_t n = std::min(a.size(), b.size());
    double dot = 0.0, na = 0.0, nb = 0.0;
    for (std::size_t i = 0; i < n; ++i) {
        dot += static_cast<double>(a[i]) * b[i];
        na += static_cast<double>(a[i]) * a[i];
        nb += static_cast<double>(b[i]) * b[i];
    }
    if (na <= 0.0 || nb <= 0.0 || !std::isfinite(dot))
        return 0.5;
    double cos = dot / (std::sqrt(na) * std::sqrt(nb));
    cos = std::clamp(cos, -1.0, 1.0);
    return (cos + 1.0) / 2.0;
}

namespace {

class InMemoryVectorSearcher final : public VectorSearcher {
public:
    Result<void> addChunk(Chunk chunk) override {
        if (chunk.id.empty())
            return Error{ErrorCode::InvalidArgument, "chunk id must not be empty"};
        if (chunk.embedding.empty())
            return Error{ErrorCode::InvalidArgument, "chunk '" + chunk.id + "' has no embedding"};

        std::unique_lock lock(mutex_);
        if (dim_ != 0 && chunk.embedding.size() != dim_) {
            return Error{ErrorCode::InvalidArgument,
                         "chunk '" + chunk.id + "' embedding dimension " +
                             std::to_string(chunk.embedding.size()) + " != index dimension " +
                             std::to_string(dim_)};
        }
        auto it = chunks_.find(chunk.id);
        if (it != chunks_.end()) {
            if (it->second.embedding == chunk.embedding &&
                it->second.contentType == chunk.contentType)
                return {};
            return Error{ErrorCode::InvalidOperation, "chunk '" + chunk.id + "' is immutable"};
        }
        if (dim_ == 0)
            dim_ = chunk.embedding.size();
        auto id = chunk.id;
        chunks_.emplace(std::move(id), std::move(chunk));
        return {};
    }

    Result<std::vector<VectorMatch>> search(const Embedding& query, std::size_t topN,
                                            const ChunkFilter* filter) const override {
        std::shared_lock lock(mutex_);
        if (dim_ != 0 && query.size() != dim_) {
            return Error{ErrorCode::InvalidArgument,
                         "query dimension " + std::to_string(query.size()) +
                             " != index dimension " + std::to_string(dim_)};
        }

        std::vector<VectorMatch> matches;
        matches.reserve(chunks_.size());
        for (const auto& [id, chunk] : chunks_) {
            if (filter && !filter->matches(chunk))
                continue;
            matches.push_back({id, normalizedCosine(query, chunk.embedding)});
        }
        lock.unlock();

        auto byScore = [](const VectorMatch& a, const VectorMatch& b) {
            if (a.similarity != b.similarity)
                return a.similarity > b.similarity;
            return a.chunkId < b.chunkId;
        };
        if (topN < matches.size()) {
            std::partial_sort(matches.begin(), matches.begin() + static_cast<std::ptrdiff_t>(topN),
                              matches.end(), byScore);
            matches.resize(topN);
        } else {
            std::sort(matches.begin(), matches.end(), byScore);
        }
        return matches;
    }

    std::optional<Chunk> getChunk(const ChunkId& id) const override {
        std::shared_lock lock(mutex_);
        auto it = chunks_.find(id);
        if (it == chunks_.end())
            return std::nullopt;
        return it->second;
    }

    bool containsChunk(const ChunkId& id) const override {
        std::shared_lock lock(mutex_);
        return chunks_.count(id) > 0;
    }

    std::size_t dimension() const override {
        std::shared_lock lock(mutex_);
        return dim_;
    }

    std::size_t size() const override {
        std::shared_lock lock(mutex_);
        return chunks_.size();
    }

private:
    mutable std::shared_mutex mutex_;
    // Ordered so iteration (and therefore equal-score handling) is stable
    std::map<ChunkId, Chunk> chunks_;
    std::size_t dim_ = 0;
};

} // namespace

std::shared_ptr<VectorSearcher> makeInMemoryVectorSearcher() {
    spdlog::debug("[VectorSearcher] using in-memory brute-force index");
    return std::make_shared<InMemoryVectorSearcher>();
}

} // namespace rlcf::vector
