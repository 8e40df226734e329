#include <rlcf/weights/change_log.h>

#include <fmt/format.h>

#include <algorithm>
#include <charconv>
#include <cmath>
#include <iterator>

namespace rlcf::weights {

const char* parameterKindName(ParameterKind kind) noexcept {
    switch (kind) {
        case ParameterKind::Traversal: return "traversal";
        case ParameterKind::Alpha: return "alpha";
        case ParameterKind::Gating: return "gating";
        case ParameterKind::Rerank: return "rerank";
        case ParameterKind::Bridge: return "bridge";
    }
    return "unknown";
}

std::optional<ParameterKind> parseParameterKind(std::string_view name) {
    for (auto k : {ParameterKind::Traversal, ParameterKind::Alpha, ParameterKind::Gating,
                   ParameterKind::Rerank, ParameterKind::Bridge}) {
        if (name == parameterKindName(k))
            return k;
    }
    return std::nullopt;
}

ParameterRef ParameterRef::traversal(StrategyId s, std::string relation) {
    ParameterRef r;
    r.kind = ParameterKind::Traversal;
    r.strategy = s;
    r.relation = std::move(relation);
    return r;
}

ParameterRef ParameterRef::alpha(StrategyId s) {
    ParameterRef r;
    r.kind = ParameterKind::Alpha;
    r.strategy = s;
    return r;
}

ParameterRef ParameterRef::gating() {
    ParameterRef r;
    r.kind = ParameterKind::Gating;
    return r;
}

ParameterRef ParameterRef::rerank() {
    ParameterRef r;
    r.kind = ParameterKind::Rerank;
    return r;
}

ParameterRef ParameterRef::bridge(ChunkId chunk, NodeId node, std::string relation) {
    ParameterRef r;
    r.kind = ParameterKind::Bridge;
    r.chunkId = std::move(chunk);
    r.nodeId = std::move(node);
    r.relation = std::move(relation);
    return r;
}

std::string ParameterRef::describe() const {
    switch (kind) {
        case ParameterKind::Traversal:
            return fmt::format("traversal/{}/{}", strategyName(strategy), relation);
        case ParameterKind::Alpha:
            return fmt::format("alpha/{}", strategyName(strategy));
        case ParameterKind::Gating:
            return "gating";
        case ParameterKind::Rerank:
            return "rerank";
        case ParameterKind::Bridge:
            return fmt::format("bridge/{} -[{}]-> {}", chunkId, relation, nodeId);
    }
    return "unknown";
}

std::string formatScalar(double v) {
    return fmt::format("{:.17g}", v);
}

std::optional<double> parseScalar(std::string_view s) {
    if (s.empty())
        return std::nullopt;
    try {
        std::size_t used = 0;
        std::string str(s);
        double d = std::stod(str, &used);
        if (used != str.size() || !std::isfinite(d))
            return std::nullopt;
        return d;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

ChangeLog::ChangeLog(std::size_t retained) : retained_(std::max<std::size_t>(1, retained)) {}

std::uint64_t ChangeLog::append(ChangeLogEntry entry) {
    Listener listener;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        entry.sequence = nextSequence_++;
        entries_.push_back(entry);
        while (entries_.size() > retained_) {
            entries_.pop_front();
            firstSequence_ = entries_.front().sequence;
        }
        listener = listener_;
    }
    if (listener)
        listener(entry);
    return entry.sequence;
}

void ChangeLog::restore(std::vector<ChangeLogEntry> entries, std::uint64_t lastSequence) {
    std::sort(entries.begin(), entries.end(),
              [](const auto& a, const auto& b) { return a.sequence < b.sequence; });
    if (entries.size() > retained_)
        entries.erase(entries.begin(),
                      entries.begin() + static_cast<std::ptrdiff_t>(entries.size() - retained_));

    std::lock_guard<std::mutex> lock(mutex_);
    entries_.assign(std::make_move_iterator(entries.begin()),
                    std::make_move_iterator(entries.end()));
    const auto newest = entries_.empty() ? 0 : entries_.back().sequence;
    nextSequence_ = std::max(lastSequence, newest) + 1;
    firstSequence_ = entries_.empty() ? nextSequence_ : entries_.front().sequence;
}

std::vector<ChangeLogEntry> ChangeLog::collect(std::uint64_t afterSequence,
                                               std::size_t limit) const {
    std::vector<ChangeLogEntry> out;
    for (const auto& e : entries_) {
        if (e.sequence <= afterSequence)
            continue;
        out.push_back(e);
        if (limit > 0 && out.size() >= limit)
            break;
    }
    return out;
}

std::vector<ChangeLogEntry> ChangeLog::entries(std::uint64_t afterSequence,
                                               std::size_t limit) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return collect(afterSequence, limit);
}

std::vector<ChangeLogEntry> ChangeLog::entriesForFeedback(const std::string& feedbackId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ChangeLogEntry> out;
    for (const auto& e : entries_) {
        if (e.feedbackId == feedbackId)
            out.push_back(e);
    }
    return out;
}

Result<std::vector<ChangeLogEntry>> ChangeLog::history(std::uint64_t afterSequence,
                                                       std::size_t limit) const {
    Archive archive;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (afterSequence + 1 >= firstSequence_)
            return collect(afterSequence, limit);
        archive = archive_;
    }
    if (!archive)
        return Error{ErrorCode::NotFound,
                     fmt::format("change log before sequence {} is no longer retained",
                                 firstRetainedSequence())};
    return archive(afterSequence, limit);
}

std::uint64_t ChangeLog::lastSequence() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return nextSequence_ - 1;
}

std::uint64_t ChangeLog::firstRetainedSequence() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.empty() ? nextSequence_ : entries_.front().sequence;
}

std::size_t ChangeLog::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

void ChangeLog::setListener(Listener listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    listener_ = std::move(listener);
}

void ChangeLog::setArchive(Archive archive) {
    std::lock_guard<std::mutex> lock(mutex_);
    archive_ = std::move(archive);
}

} // namespace rlcf::weights
