#include <storage/postgres_store.hpp>
#include <database/bulk_copy.hpp>
#include <utils/errors.hpp>
#include <utils/identifiers.hpp>
#include <utils/logger.hpp>
#include <cstdio>

namespace Coalesce {

namespace {

/**
 * Numbered-parameter accumulator: add() returns "$n" for the next value.
 */
class SqlParams {
public:
    std::string add(std::string value) {
        values_.emplace_back(std::move(value));
        return "$" + std::to_string(values_.size());
    }

    const std::vector<PostgresConnection::Param>& values() const { return values_; }

private:
    std::vector<PostgresConnection::Param> values_;
};

std::string format_double(double v) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.17g", v);
    return buf;
}

std::string vector_literal(const std::vector<double>& v) {
    std::string out = "[";
    for (size_t i = 0; i < v.size(); ++i) {
        if (i) out += ",";
        out += format_double(v[i]);
    }
    out += "]";
    return out;
}

nlohmann::json parse_json(const std::string& text, const char* column) {
    try {
        return nlohmann::json::parse(text);
    } catch (const nlohmann::json::exception& e) {
        throw StorageError(std::string("invalid json in column ") + column + ": " + e.what());
    }
}

std::vector<std::string> string_list(const nlohmann::json& j) {
    std::vector<std::string> out;
    for (const auto& v : j) out.push_back(v.get<std::string>());
    return out;
}

// Same notion of presence as Record::has: not null and not a blank string
std::string present_sql(const std::string& f) {
    return "(jsonb_typeof(fields->" + f + ") IS NOT NULL AND jsonb_typeof(fields->" + f + ") <> 'null' AND "
           "(jsonb_typeof(fields->" + f + ") <> 'string' OR btrim(fields->>" + f + ") <> ''))";
}

std::string filter_sql(const RecordFilter& filter, SqlParams& params) {
    const std::string f = params.add(filter.field) + "::text";
    switch (filter.op) {
        case RecordFilter::Op::NotNull:
            return present_sql(f);
        case RecordFilter::Op::Equals:
            return "(" + present_sql(f) + " AND fields->" + f + " = " + params.add(filter.value.dump()) + "::jsonb)";
        case RecordFilter::Op::NotEquals:
            return "(NOT " + present_sql(f) + " OR fields->" + f + " <> " + params.add(filter.value.dump()) + "::jsonb)";
        case RecordFilter::Op::In:
            return "(" + present_sql(f) + " AND " + params.add(filter.value.dump()) +
                   "::jsonb @> jsonb_build_array(fields->" + f + "))";
        case RecordFilter::Op::Range: {
            const std::string num = "(CASE WHEN jsonb_typeof(fields->" + f + ") = 'number' THEN (fields->>" + f +
                                    ")::double precision END)";
            std::string sql = "(" + num + " IS NOT NULL";
            if (filter.min_value) sql += " AND " + num + " >= " + params.add(format_double(*filter.min_value)) + "::double precision";
            if (filter.max_value) sql += " AND " + num + " <= " + params.add(format_double(*filter.max_value)) + "::double precision";
            return sql + ")";
        }
        case RecordFilter::Op::MinLength:
            return "(" + present_sql(f) + " AND jsonb_typeof(fields->" + f + ") IN ('string', 'number', 'boolean') AND "
                   "octet_length(fields->>" + f + ") >= " + params.add(std::to_string(filter.min_length)) + "::int)";
    }
    throw ValidationError("unsupported filter operator");
}

std::string filters_sql(const std::vector<RecordFilter>& filters, SqlParams& params) {
    std::string sql;
    for (const auto& f : filters) sql += " AND " + filter_sql(f, params);
    return sql;
}

std::string edge_filter_sql(const EdgeFilter& filter, SqlParams& params) {
    std::string sql;
    if (filter.method) sql += " AND method = " + params.add(*filter.method);
    if (filter.older_than) sql += " AND created_at < " + params.add(*filter.older_than);
    if (filter.min_similarity) {
        sql += " AND similarity >= " + params.add(format_double(*filter.min_similarity)) + "::double precision";
    }
    return sql;
}

} // namespace

PostgresStore::PostgresStore(PostgresConnection& conn, std::string schema)
    : conn_(conn), schema_(std::move(schema)) {
    validate_identifier(schema_, "schema");
    ensure_schema();
}

std::string PostgresStore::table(const char* name) const {
    return quote_identifier(schema_) + "." + quote_identifier(name);
}

void PostgresStore::ensure_schema() {
    PostgresConnection::Transaction tx(conn_);
    conn_.execute("CREATE SCHEMA IF NOT EXISTS " + quote_identifier(schema_));
    conn_.execute("CREATE TABLE IF NOT EXISTS " + table("records") + " ("
                  "collection text NOT NULL, id text NOT NULL, fields jsonb NOT NULL DEFAULT '{}', "
                  "PRIMARY KEY (collection, id))");
    conn_.execute("CREATE TABLE IF NOT EXISTS " + table("edges") + " ("
                  "collection text NOT NULL, edge_key text NOT NULL, reverse boolean NOT NULL DEFAULT false, "
                  "from_id text NOT NULL, to_id text NOT NULL, similarity double precision NOT NULL, "
                  "method text, created_at text, attributes jsonb NOT NULL DEFAULT '{}', "
                  "PRIMARY KEY (collection, edge_key, reverse))");
    conn_.execute("CREATE INDEX IF NOT EXISTS edges_method_idx ON " + table("edges") + " (collection, method)");
    conn_.execute("CREATE TABLE IF NOT EXISTS " + table("clusters") + " ("
                  "collection text NOT NULL, cluster_id text NOT NULL, content_key text NOT NULL, "
                  "members jsonb NOT NULL, method text, created_at text, "
                  "PRIMARY KEY (collection, cluster_id))");
    conn_.execute("CREATE TABLE IF NOT EXISTS " + table("golden_records") + " ("
                  "collection text NOT NULL, golden_key text NOT NULL, cluster_id text, "
                  "member_ids jsonb NOT NULL, fields jsonb NOT NULL, provenance jsonb NOT NULL, "
                  "merge_policy text, run_id text, method text, created_at text, "
                  "PRIMARY KEY (collection, golden_key))");
    conn_.execute("ALTER TABLE " + table("golden_records") + " ADD COLUMN IF NOT EXISTS merge_policy text");
    tx.commit();
    Logger::debug("PostgreSQL store ready in schema " + schema_);
}

// ============================================================================
// Records
// ============================================================================

std::optional<Record> PostgresStore::fetch_record(const std::string& collection, const std::string& id) {
    auto fields = conn_.query_single("SELECT fields::text FROM " + table("records") +
                                     " WHERE collection = $1 AND id = $2", {collection, id});
    if (!fields) return std::nullopt;
    return Record(id, parse_json(*fields, "fields"));
}

std::vector<Record> PostgresStore::fetch_records(const std::string& collection,
                                                 const std::vector<RecordFilter>& filters,
                                                 size_t offset, size_t limit) {
    SqlParams params;
    std::string sql = "SELECT id, fields::text FROM " + table("records") +
                      " WHERE collection = " + params.add(collection);
    sql += filters_sql(filters, params);
    sql += " ORDER BY id OFFSET " + params.add(std::to_string(offset)) + "::bigint LIMIT " +
           params.add(std::to_string(limit)) + "::bigint";

    std::vector<Record> page;
    conn_.query(sql, params.values(), [&](const PostgresConnection::Row& row) {
        page.emplace_back(row[0], parse_json(row[1], "fields"));
    });
    return page;
}

size_t PostgresStore::count_records(const std::string& collection) {
    auto n = conn_.query_single("SELECT count(*) FROM " + table("records") + " WHERE collection = $1", {collection});
    return n ? std::stoull(*n) : 0;
}

std::optional<std::vector<double>> PostgresStore::fetch_vector(const std::string& collection, const std::string& id,
                                                               const std::string& field) {
    auto value = conn_.query_single("SELECT (fields->$3::text)::text FROM " + table("records") +
                                    " WHERE collection = $1 AND id = $2", {collection, id, field});
    if (!value) return std::nullopt;
    Record r(id, {{field, parse_json(*value, "fields")}});
    return r.vector(field);
}

size_t PostgresStore::upsert_records(const std::string& collection, const std::vector<Record>& records) {
    if (records.empty()) return 0;

    PostgresConnection::Transaction tx(conn_);
    BulkCopy copy(conn_);
    copy.begin_table(schema_ + ".records", {"collection", "id", "fields"});
    copy.set_conflict_clause("ON CONFLICT (collection, id) DO UPDATE SET fields = EXCLUDED.fields");
    for (const auto& r : records) {
        if (r.id.empty()) throw StorageError("record without id in " + collection);
        copy.add_row({collection, r.id, r.fields.dump()});
    }
    copy.flush();
    tx.commit();
    return records.size();
}

size_t PostgresStore::update_records(const std::string& collection, const std::vector<RecordPatch>& patches) {
    PostgresConnection::Transaction tx(conn_);
    size_t updated = 0;
    const std::string sql = "UPDATE " + table("records") +
                            " SET fields = fields || $3::jsonb WHERE collection = $1 AND id = $2";
    for (const auto& [id, patch] : patches) {
        if (!patch.is_object()) throw StorageError("record patch for " + id + " is not an object");
        updated += conn_.execute(sql, {collection, id, patch.dump()});
    }
    tx.commit();
    return updated;
}

// ============================================================================
// Native vector search (pgvector)
// ============================================================================

VectorEngineInfo PostgresStore::vector_engine() {
    auto version = conn_.query_single("SELECT extversion FROM pg_extension WHERE extname = 'vector'");
    return {"pgvector", version.value_or("")};
}

std::vector<VectorMatch> PostgresStore::native_vector_search(const VectorQuery& query) {
    SqlParams params;
    const std::string field = params.add(query.embedding_field) + "::text";
    const std::string probe = params.add(vector_literal(query.vector)) + "::vector";

    std::string inner = "SELECT id, 1 - ((fields->>" + field + ")::vector <=> " + probe + ") AS similarity FROM " +
                        table("records") + " WHERE collection = " + params.add(query.collection) +
                        " AND jsonb_typeof(fields->" + field + ") = 'array'";
    if (query.exclude_id) inner += " AND id <> " + params.add(*query.exclude_id);
    if (query.blocking_field) {
        const std::string bf = params.add(*query.blocking_field) + "::text";
        inner += " AND " + present_sql(bf) + " AND fields->" + bf + " = " + params.add(query.blocking_value.dump()) +
                 "::jsonb";
    }
    inner += filters_sql(query.filters, params);

    const std::string sql = "SELECT id, similarity FROM (" + inner + ") s WHERE similarity >= " +
                            params.add(format_double(query.threshold)) + "::double precision" +
                            " ORDER BY similarity DESC, id LIMIT " + params.add(std::to_string(query.limit)) + "::bigint";

    std::vector<VectorMatch> matches;
    conn_.query(sql, params.values(), [&](const PostgresConnection::Row& row) {
        matches.push_back({row[0], std::stod(row[1]), "native_vector_search"});
    });
    return matches;
}

// ============================================================================
// Edges
// ============================================================================

void PostgresStore::copy_edges(const std::string& collection, const std::vector<MatchEdge>& edges,
                               const std::string& conflict_clause, size_t& inserted) {
    BulkCopy copy(conn_);
    copy.begin_table(schema_ + ".edges", {"collection", "edge_key", "reverse", "from_id", "to_id", "similarity",
                                          "method", "created_at", "attributes"});
    copy.set_conflict_clause(conflict_clause);
    for (const auto& e : edges) {
        if (e.key.empty()) throw StorageError("edge without key in " + collection);
        copy.add_row({collection, e.key, e.reverse ? "t" : "f", e.from_id, e.to_id, format_double(e.similarity),
                      e.method, e.timestamp, e.attributes.dump()});
    }
    inserted = copy.flush();
}

size_t PostgresStore::insert_edges(const std::string& collection, const std::vector<MatchEdge>& edges,
                                   bool ignore_on_conflict) {
    if (edges.empty()) return 0;

    PostgresConnection::Transaction tx(conn_);
    size_t created = 0;
    copy_edges(collection, edges, "ON CONFLICT (collection, edge_key, reverse) DO NOTHING", created);

    if (!ignore_on_conflict) {
        // Second pass overwrites the identities that already existed
        size_t touched = 0;
        copy_edges(collection, edges,
                   "ON CONFLICT (collection, edge_key, reverse) DO UPDATE SET from_id = EXCLUDED.from_id, "
                   "to_id = EXCLUDED.to_id, similarity = EXCLUDED.similarity, method = EXCLUDED.method, "
                   "created_at = EXCLUDED.created_at, attributes = EXCLUDED.attributes",
                   touched);
    }
    tx.commit();
    return created;
}

std::vector<MatchEdge> PostgresStore::fetch_edges(const std::string& collection, const EdgeFilter& filter) {
    SqlParams params;
    std::string sql = "SELECT edge_key, reverse, from_id, to_id, similarity, method, created_at, attributes::text FROM " +
                      table("edges") + " WHERE collection = " + params.add(collection);
    sql += edge_filter_sql(filter, params);
    sql += " ORDER BY edge_key, reverse";
    if (filter.limit > 0) sql += " LIMIT " + params.add(std::to_string(filter.limit)) + "::bigint";

    std::vector<MatchEdge> edges;
    conn_.stream_query(sql, params.values(), [&](const PostgresConnection::Row& row) {
        MatchEdge e;
        e.key = row[0];
        e.reverse = row[1] == "t";
        e.from_id = row[2];
        e.to_id = row[3];
        e.similarity = std::stod(row[4]);
        e.method = row[5];
        e.timestamp = row[6];
        e.attributes = parse_json(row[7], "attributes");
        edges.push_back(std::move(e));
    });
    return edges;
}

size_t PostgresStore::remove_edges(const std::string& collection, const EdgeFilter& filter) {
    SqlParams params;
    std::string sql = "DELETE FROM " + table("edges") + " WHERE collection = " + params.add(collection);
    sql += edge_filter_sql(filter, params);
    return conn_.execute(sql, params.values());
}

// ============================================================================
// Clusters and golden records
// ============================================================================

void PostgresStore::replace_clusters(const std::string& collection, const std::vector<Cluster>& clusters) {
    PostgresConnection::Transaction tx(conn_);
    conn_.execute("DELETE FROM " + table("clusters") + " WHERE collection = $1", {collection});

    if (!clusters.empty()) {
        BulkCopy copy(conn_);
        copy.begin_table(schema_ + ".clusters", {"collection", "cluster_id", "content_key", "members", "method",
                                                 "created_at"});
        for (const auto& c : clusters) {
            copy.add_row({collection, c.id, c.content_key, nlohmann::json(c.members).dump(), c.method, c.timestamp});
        }
        copy.flush();
    }
    tx.commit();
}

std::vector<Cluster> PostgresStore::fetch_clusters(const std::string& collection) {
    std::vector<Cluster> clusters;
    conn_.query("SELECT cluster_id, content_key, members::text, method, created_at FROM " + table("clusters") +
                " WHERE collection = $1 ORDER BY cluster_id", {collection},
                [&](const PostgresConnection::Row& row) {
                    Cluster c;
                    c.id = row[0];
                    c.content_key = row[1];
                    c.members = string_list(parse_json(row[2], "members"));
                    c.method = row[3];
                    c.timestamp = row[4];
                    clusters.push_back(std::move(c));
                });
    return clusters;
}

size_t PostgresStore::upsert_golden_records(const std::string& collection, const std::vector<GoldenRecord>& records) {
    if (records.empty()) return 0;

    PostgresConnection::Transaction tx(conn_);
    BulkCopy copy(conn_);
    copy.begin_table(schema_ + ".golden_records", {"collection", "golden_key", "cluster_id", "member_ids", "fields",
                                                   "provenance", "merge_policy", "run_id", "method", "created_at"});
    copy.set_conflict_clause("ON CONFLICT (collection, golden_key) DO UPDATE SET cluster_id = EXCLUDED.cluster_id, "
                             "member_ids = EXCLUDED.member_ids, fields = EXCLUDED.fields, "
                             "provenance = EXCLUDED.provenance, merge_policy = EXCLUDED.merge_policy, "
                             "run_id = EXCLUDED.run_id, method = EXCLUDED.method, created_at = EXCLUDED.created_at");
    for (const auto& g : records) {
        if (g.key.empty()) throw StorageError("golden record without key in " + collection);
        copy.add_row({collection, g.key, g.cluster_id, nlohmann::json(g.member_ids).dump(), g.fields.dump(),
                      g.provenance.dump(), g.merge_policy, g.run_id, g.method, g.timestamp});
    }
    copy.flush();
    tx.commit();
    return records.size();
}

std::vector<GoldenRecord> PostgresStore::fetch_golden_records(const std::string& collection) {
    std::vector<GoldenRecord> out;
    conn_.query("SELECT golden_key, cluster_id, member_ids::text, fields::text, provenance::text, merge_policy, "
                "run_id, method, created_at FROM " + table("golden_records") + " WHERE collection = $1 ORDER BY golden_key",
                {collection}, [&](const PostgresConnection::Row& row) {
                    GoldenRecord g;
                    g.key = row[0];
                    g.cluster_id = row[1];
                    g.member_ids = string_list(parse_json(row[2], "member_ids"));
                    g.fields = parse_json(row[3], "fields");
                    g.provenance = parse_json(row[4], "provenance");
                    g.merge_policy = row[5];
                    g.run_id = row[6];
                    g.method = row[7];
                    g.timestamp = row[8];
                    out.push_back(std::move(g));
                });
    return out;
}

} // namespace Coalesce
