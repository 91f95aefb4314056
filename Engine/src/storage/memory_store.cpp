#include <storage/memory_store.hpp>
#include <similarity/vector_math.hpp>
#include <utils/errors.hpp>
#include <algorithm>

namespace Coalesce {

MemoryStore::MemoryStore(VectorEngineInfo engine) : engine_(std::move(engine)) {}

void MemoryStore::set_vector_engine(VectorEngineInfo engine) {
    std::lock_guard<std::mutex> lock(mutex_);
    engine_ = std::move(engine);
}

// ============================================================================
// Records
// ============================================================================

std::optional<Record> MemoryStore::fetch_record(const std::string& collection, const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto c = records_.find(collection);
    if (c == records_.end()) return std::nullopt;
    auto it = c->second.find(id);
    if (it == c->second.end()) return std::nullopt;
    return it->second;
}

std::vector<Record> MemoryStore::fetch_records(const std::string& collection,
                                               const std::vector<RecordFilter>& filters,
                                               size_t offset, size_t limit) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Record> page;
    auto c = records_.find(collection);
    if (c == records_.end()) return page;

    size_t skipped = 0;
    for (const auto& [id, record] : c->second) {
        if (!matches_all(filters, record)) continue;
        if (skipped < offset) { ++skipped; continue; }
        if (page.size() >= limit) break;
        page.push_back(record);
    }
    return page;
}

size_t MemoryStore::count_records(const std::string& collection) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto c = records_.find(collection);
    return c == records_.end() ? 0 : c->second.size();
}

std::optional<std::vector<double>> MemoryStore::fetch_vector(const std::string& collection, const std::string& id,
                                                             const std::string& field) {
    auto record = fetch_record(collection, id);
    if (!record) return std::nullopt;
    return record->vector(field);
}

size_t MemoryStore::upsert_records(const std::string& collection, const std::vector<Record>& records) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& c = records_[collection];
    for (const auto& r : records) {
        if (r.id.empty()) throw StorageError("record without id in " + collection);
        c[r.id] = r;
    }
    return records.size();
}

size_t MemoryStore::update_records(const std::string& collection, const std::vector<RecordPatch>& patches) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto c = records_.find(collection);
    if (c == records_.end()) return 0;

    size_t updated = 0;
    for (const auto& [id, patch] : patches) {
        if (!patch.is_object()) throw StorageError("record patch for " + id + " is not an object");
        auto it = c->second.find(id);
        if (it == c->second.end()) continue;
        for (auto field = patch.begin(); field != patch.end(); ++field) {
            it->second.fields[field.key()] = field.value();
        }
        ++updated;
    }
    return updated;
}

// ============================================================================
// Native vector search
// ============================================================================

VectorEngineInfo MemoryStore::vector_engine() {
    std::lock_guard<std::mutex> lock(mutex_);
    return engine_;
}

std::vector<VectorMatch> MemoryStore::native_vector_search(const VectorQuery& query) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (engine_.version.empty()) {
        throw StorageError("native vector search is not supported by this store");
    }

    std::vector<VectorMatch> matches;
    auto c = records_.find(query.collection);
    if (c == records_.end()) return matches;

    for (const auto& [id, record] : c->second) {
        if (query.exclude_id && id == *query.exclude_id) continue;
        if (query.blocking_field &&
            (!record.has(*query.blocking_field) || record.fields.at(*query.blocking_field) != query.blocking_value)) {
            continue;
        }
        if (!matches_all(query.filters, record)) continue;

        auto v = record.vector(query.embedding_field);
        if (!v) continue;
        double sim = cosine_similarity(query.vector, *v);
        if (sim >= query.threshold) {
            matches.push_back({id, sim, "native_vector_search"});
        }
    }

    std::sort(matches.begin(), matches.end(), [](const VectorMatch& a, const VectorMatch& b) {
        if (a.similarity != b.similarity) return a.similarity > b.similarity;
        return a.id < b.id;
    });
    if (matches.size() > query.limit) matches.resize(query.limit);
    return matches;
}

// ============================================================================
// Edges
// ============================================================================

void MemoryStore::reindex(EdgeCollection& ec) {
    ec.index.clear();
    for (size_t i = 0; i < ec.edges.size(); ++i) {
        ec.index[{ec.edges[i].key, ec.edges[i].reverse}] = i;
    }
}

size_t MemoryStore::insert_edges(const std::string& collection, const std::vector<MatchEdge>& edges,
                                 bool ignore_on_conflict) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& ec = edges_[collection];

    size_t created = 0;
    for (const auto& e : edges) {
        if (e.key.empty()) throw StorageError("edge without key in " + collection);
        EdgeIdentity identity{e.key, e.reverse};
        auto it = ec.index.find(identity);
        if (it != ec.index.end()) {
            if (!ignore_on_conflict) ec.edges[it->second] = e;
            continue;
        }
        ec.index.emplace(identity, ec.edges.size());
        ec.edges.push_back(e);
        ++created;
    }
    return created;
}

std::vector<MatchEdge> MemoryStore::fetch_edges(const std::string& collection, const EdgeFilter& filter) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<MatchEdge> out;
    auto c = edges_.find(collection);
    if (c == edges_.end()) return out;

    for (const auto& e : c->second.edges) {
        if (!filter.matches(e)) continue;
        out.push_back(e);
        if (filter.limit > 0 && out.size() >= filter.limit) break;
    }
    return out;
}

size_t MemoryStore::remove_edges(const std::string& collection, const EdgeFilter& filter) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto c = edges_.find(collection);
    if (c == edges_.end()) return 0;

    auto& edges = c->second.edges;
    const size_t before = edges.size();
    edges.erase(std::remove_if(edges.begin(), edges.end(),
                               [&](const MatchEdge& e) { return filter.matches(e); }),
                edges.end());
    reindex(c->second);
    return before - edges.size();
}

// ============================================================================
// Clusters and golden records
// ============================================================================

void MemoryStore::replace_clusters(const std::string& collection, const std::vector<Cluster>& clusters) {
    std::lock_guard<std::mutex> lock(mutex_);
    clusters_[collection] = clusters;
}

std::vector<Cluster> MemoryStore::fetch_clusters(const std::string& collection) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto c = clusters_.find(collection);
    if (c == clusters_.end()) return {};
    return c->second;
}

size_t MemoryStore::upsert_golden_records(const std::string& collection, const std::vector<GoldenRecord>& records) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& c = golden_[collection];
    for (const auto& g : records) {
        if (g.key.empty()) throw StorageError("golden record without key in " + collection);
        c[g.key] = g;
    }
    return records.size();
}

std::vector<GoldenRecord> MemoryStore::fetch_golden_records(const std::string& collection) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<GoldenRecord> out;
    auto c = golden_.find(collection);
    if (c == golden_.end()) return out;
    for (const auto& [key, g] : c->second) out.push_back(g);
    return out;
}

} // namespace Coalesce
