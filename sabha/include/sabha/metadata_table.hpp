#pragma once
// Metadata Table: the relational half of the memory store
//
// One row per record, keyed by the same id as the vector log entry.
// Writes happen inside explicit transactions so the store can hold a
// row uncommitted while the vector is made durable.

#include "codec.hpp"
#include "types.hpp"
#include <sqlite3.h>
#include <iostream>
#include <string>
#include <vector>

namespace sabha {

// Prepared statement with automatic finalize
class Statement {
public:
    Statement(sqlite3* db, const char* sql) {
        if (sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr) != SQLITE_OK) {
            stmt_ = nullptr;
        }
    }
    ~Statement() { if (stmt_) sqlite3_finalize(stmt_); }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    bool ok() const { return stmt_ != nullptr; }
    sqlite3_stmt* get() const { return stmt_; }

    void bind(int idx, const std::string& s) {
        sqlite3_bind_text(stmt_, idx, s.c_str(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
    }
    void bind(int idx, double v) { sqlite3_bind_double(stmt_, idx, v); }
    void bind(int idx, int64_t v) { sqlite3_bind_int64(stmt_, idx, v); }
    void bind_null(int idx) { sqlite3_bind_null(stmt_, idx); }

    int step() { return sqlite3_step(stmt_); }

    std::string text(int col) const {
        const unsigned char* t = sqlite3_column_text(stmt_, col);
        return t ? reinterpret_cast<const char*>(t) : "";
    }
    bool is_null(int col) const { return sqlite3_column_type(stmt_, col) == SQLITE_NULL; }

private:
    sqlite3_stmt* stmt_ = nullptr;
};

class MetadataTable {
public:
    MetadataTable() = default;
    ~MetadataTable() { close(); }

    MetadataTable(const MetadataTable&) = delete;
    MetadataTable& operator=(const MetadataTable&) = delete;

    bool open(const std::string& path, std::string& error) {
        close();
        if (sqlite3_open_v2(path.c_str(), &db_,
                            SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr) != SQLITE_OK) {
            error = "cannot open metadata table " + path + ": " +
                    (db_ ? sqlite3_errmsg(db_) : "out of memory");
            close();
            return false;
        }
        sqlite3_busy_timeout(db_, 2000);

        const char* schema =
            "PRAGMA synchronous = FULL;"
            "CREATE TABLE IF NOT EXISTS memory_records ("
            "  id TEXT PRIMARY KEY,"
            "  agent_id TEXT NOT NULL,"
            "  kind TEXT NOT NULL,"
            "  summary TEXT NOT NULL,"
            "  importance REAL NOT NULL,"
            "  created INTEGER NOT NULL,"
            "  outcome TEXT,"
            "  symbol TEXT NOT NULL DEFAULT '',"
            "  payload TEXT NOT NULL DEFAULT '{}'"
            ");"
            "CREATE INDEX IF NOT EXISTS idx_memory_created ON memory_records(created);";
        if (!exec(schema)) {
            error = "cannot create schema in " + path + ": " + last_error_;
            close();
            return false;
        }
        return true;
    }

    void close() {
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
    }

    bool is_open() const { return db_ != nullptr; }
    const std::string& last_error() const { return last_error_; }

    bool begin() { return exec("BEGIN IMMEDIATE"); }
    bool commit() { return exec("COMMIT"); }
    bool rollback() { return exec("ROLLBACK"); }

    bool insert(const MemoryRecord& r) {
        Statement stmt(db_,
            "INSERT INTO memory_records "
            "(id, agent_id, kind, summary, importance, created, outcome, symbol, payload) "
            "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)");
        if (!prepared(stmt)) return false;

        stmt.bind(1, r.id.to_string());
        stmt.bind(2, r.agent_id);
        stmt.bind(3, std::string(kind_name(r.kind)));
        stmt.bind(4, r.summary);
        stmt.bind(5, static_cast<double>(r.importance));
        stmt.bind(6, static_cast<int64_t>(r.created));
        if (r.outcome) stmt.bind(7, std::string(outcome_name(*r.outcome)));
        else stmt.bind_null(7);
        stmt.bind(8, r.symbol);
        stmt.bind(9, json(r.payload).dump());
        return done(stmt);
    }

    bool set_outcome(const RecordId& id, OutcomeLabel label) {
        Statement stmt(db_, "UPDATE memory_records SET outcome = ? WHERE id = ?");
        if (!prepared(stmt)) return false;
        stmt.bind(1, std::string(outcome_name(label)));
        stmt.bind(2, id.to_string());
        return done(stmt) && sqlite3_changes(db_) == 1;
    }

    bool remove(const RecordId& id) {
        Statement stmt(db_, "DELETE FROM memory_records WHERE id = ?");
        if (!prepared(stmt)) return false;
        stmt.bind(1, id.to_string());
        return done(stmt);
    }

    // Rows as records without vectors. Unparseable rows are reported, not loaded.
    std::vector<MemoryRecord> load_all(std::vector<std::string>* rejected = nullptr) {
        std::vector<MemoryRecord> out;
        Statement stmt(db_,
            "SELECT id, agent_id, kind, summary, importance, created, outcome, symbol, payload "
            "FROM memory_records");
        if (!prepared(stmt)) return out;

        while (stmt.step() == SQLITE_ROW) {
            std::string id_text = stmt.text(0);
            auto id = RecordId::parse(id_text);
            auto kind = parse_kind(stmt.text(2));
            if (!id || !kind) {
                if (rejected) rejected->push_back(id_text);
                continue;
            }

            MemoryRecord r;
            r.id = *id;
            r.agent_id = stmt.text(1);
            r.kind = *kind;
            r.summary = stmt.text(3);
            r.importance = static_cast<float>(sqlite3_column_double(stmt.get(), 4));
            r.created = sqlite3_column_int64(stmt.get(), 5);
            if (!stmt.is_null(6)) r.outcome = parse_outcome(stmt.text(6));
            r.symbol = stmt.text(7);
            try {
                r.payload = json::parse(stmt.text(8)).get<Payload>();
            } catch (const json::exception& e) {
                std::cerr << "[MetadataTable] Bad payload for " << id_text << ": " << e.what() << "\n";
                if (rejected) rejected->push_back(id_text);
                continue;
            }
            out.push_back(std::move(r));
        }
        return out;
    }

private:
    bool exec(const char* sql) {
        char* err = nullptr;
        if (sqlite3_exec(db_, sql, nullptr, nullptr, &err) != SQLITE_OK) {
            last_error_ = err ? err : sqlite3_errmsg(db_);
            sqlite3_free(err);
            return false;
        }
        return true;
    }

    bool prepared(const Statement& stmt) {
        if (!stmt.ok()) {
            last_error_ = sqlite3_errmsg(db_);
            return false;
        }
        return true;
    }

    bool done(Statement& stmt) {
        if (stmt.step() != SQLITE_DONE) {
            last_error_ = sqlite3_errmsg(db_);
            return false;
        }
        return true;
    }

    sqlite3* db_ = nullptr;
    std::string last_error_;
};

} // namespace sabha
