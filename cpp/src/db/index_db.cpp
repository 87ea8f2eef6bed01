#include "zff/db/index_db.hpp"

#include <sqlite3.h>

namespace zff::db {

using zff::core::Status;
using zff::core::StatusCode;
using zff::core::StatusDomain;

namespace {
    constexpr const char* kSchemaSQL = R"SQL(
        PRAGMA foreign_keys = ON;

        CREATE TABLE IF NOT EXISTS containers (
            uuid BLOB PRIMARY KEY,
            segment_count INTEGER NOT NULL
        );

        CREATE TABLE IF NOT EXISTS segments (
            uuid BLOB NOT NULL REFERENCES containers(uuid) ON DELETE CASCADE,
            number INTEGER NOT NULL,
            file_size INTEGER NOT NULL,
            main_header_offset INTEGER,
            main_footer_offset INTEGER,
            PRIMARY KEY (uuid, number)
        );

        CREATE TABLE IF NOT EXISTS chunks (
            uuid BLOB NOT NULL REFERENCES containers(uuid) ON DELETE CASCADE,
            chunk_number INTEGER NOT NULL,
            segment INTEGER NOT NULL,
            offset INTEGER NOT NULL,
            stored_size INTEGER NOT NULL,
            flags INTEGER NOT NULL,
            crc32 INTEGER NOT NULL,
            PRIMARY KEY (uuid, chunk_number)
        );

        CREATE TABLE IF NOT EXISTS objects (
            uuid BLOB NOT NULL REFERENCES containers(uuid) ON DELETE CASCADE,
            position INTEGER NOT NULL,
            object_id INTEGER NOT NULL,
            header_segment INTEGER NOT NULL,
            header_offset INTEGER NOT NULL,
            footer_segment INTEGER,
            footer_offset INTEGER,
            PRIMARY KEY (uuid, object_id)
        );
        CREATE INDEX IF NOT EXISTS idx_objects_position ON objects(uuid, position);
    )SQL";

    // Finalizes on every path.
    class Stmt {
    public:
        Stmt(sqlite3* db, const char* sql) noexcept {
            if (sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr) != SQLITE_OK) {
                if (stmt_ != nullptr) sqlite3_finalize(stmt_);
                stmt_ = nullptr;
            }
        }
        ~Stmt() {
            if (stmt_ != nullptr) sqlite3_finalize(stmt_);
        }
        Stmt(const Stmt&) = delete;
        Stmt& operator=(const Stmt&) = delete;

        [[nodiscard]] bool ok() const noexcept { return stmt_ != nullptr; }
        [[nodiscard]] sqlite3_stmt* get() const noexcept { return stmt_; }

    private:
        sqlite3_stmt* stmt_{nullptr};
    };

    [[nodiscard]] Status db_error(int rc) noexcept {
        return zff::core::make_status(StatusDomain::Db, StatusCode::Unknown, static_cast<u64>(rc));
    }

    void bind_uuid(sqlite3_stmt* stmt, int idx, const zff::core::Uuid& uuid) noexcept {
        sqlite3_bind_blob(stmt, idx, uuid.b.data(), static_cast<int>(uuid.b.size()), SQLITE_STATIC);
    }

    void bind_u64(sqlite3_stmt* stmt, int idx, u64 v) noexcept {
        sqlite3_bind_int64(stmt, idx, static_cast<sqlite3_int64>(v));
    }

    [[nodiscard]] u64 column_u64(sqlite3_stmt* stmt, int idx) noexcept {
        return static_cast<u64>(sqlite3_column_int64(stmt, idx));
    }
}

// ============================================================================
// Lifecycle
// ============================================================================

Status ChunkIndexDb::open(const std::string& path, std::unique_ptr<ChunkIndexDb>* out) noexcept {
    if (out == nullptr || path.empty()) {
        return zff::core::make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    std::unique_ptr<ChunkIndexDb> db(new ChunkIndexDb());
    int rc = sqlite3_open(path.c_str(), &db->db_);
    if (rc != SQLITE_OK) {
        return db_error(rc);
    }

    // Performance settings; failures are not fatal (in-memory databases
    // reject WAL).
    sqlite3_exec(db->db_, "PRAGMA journal_mode=WAL", nullptr, nullptr, nullptr);
    sqlite3_exec(db->db_, "PRAGMA synchronous=NORMAL", nullptr, nullptr, nullptr);

    const Status s = db->exec(kSchemaSQL);
    if (!zff::core::is_ok(s)) return s;

    *out = std::move(db);
    return zff::core::ok_status();
}

ChunkIndexDb::~ChunkIndexDb() {
    if (db_ != nullptr) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

Status ChunkIndexDb::exec(const char* sql) noexcept {
    char* err_msg = nullptr;
    const int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &err_msg);
    if (err_msg) sqlite3_free(err_msg);
    if (rc != SQLITE_OK) {
        return db_error(rc);
    }
    return zff::core::ok_status();
}

// ============================================================================
// Snapshots
// ============================================================================

Status ChunkIndexDb::load(const zff::core::Uuid& uuid, IndexSnapshot* out) noexcept {
    if (out == nullptr) {
        return zff::core::make_status(StatusDomain::Db, StatusCode::Invalid);
    }
    std::lock_guard<std::mutex> lock(mutex_);

    IndexSnapshot snap{};
    snap.uuid = uuid;

    {
        Stmt q(db_, "SELECT segment_count FROM containers WHERE uuid = ?");
        if (!q.ok()) return db_error(sqlite3_errcode(db_));
        bind_uuid(q.get(), 1, uuid);
        const int rc = sqlite3_step(q.get());
        if (rc == SQLITE_DONE) {
            return zff::core::make_status(StatusDomain::Db, StatusCode::NotFound);
        }
        if (rc != SQLITE_ROW) return db_error(rc);
    }

    {
        Stmt q(db_, "SELECT number, file_size, main_header_offset, main_footer_offset "
                    "FROM segments WHERE uuid = ? ORDER BY number");
        if (!q.ok()) return db_error(sqlite3_errcode(db_));
        bind_uuid(q.get(), 1, uuid);
        int rc;
        while ((rc = sqlite3_step(q.get())) == SQLITE_ROW) {
            IndexedSegment seg{};
            seg.number = column_u64(q.get(), 0);
            seg.file_size = column_u64(q.get(), 1);
            if (sqlite3_column_type(q.get(), 2) != SQLITE_NULL) {
                seg.has_main_header = true;
                seg.main_header_offset = column_u64(q.get(), 2);
            }
            if (sqlite3_column_type(q.get(), 3) != SQLITE_NULL) {
                seg.has_main_footer = true;
                seg.main_footer_offset = column_u64(q.get(), 3);
            }
            snap.segments.push_back(seg);
        }
        if (rc != SQLITE_DONE) return db_error(rc);
    }

    {
        Stmt q(db_, "SELECT chunk_number, segment, offset, stored_size, flags, crc32 "
                    "FROM chunks WHERE uuid = ? ORDER BY chunk_number");
        if (!q.ok()) return db_error(sqlite3_errcode(db_));
        bind_uuid(q.get(), 1, uuid);
        int rc;
        while ((rc = sqlite3_step(q.get())) == SQLITE_ROW) {
            storage::ChunkLocation loc{};
            loc.segment = column_u64(q.get(), 1);
            loc.offset = column_u64(q.get(), 2);
            loc.stored_size = column_u64(q.get(), 3);
            loc.flags = static_cast<zff::core::u8>(sqlite3_column_int(q.get(), 4));
            loc.crc32 = static_cast<zff::core::u32>(sqlite3_column_int64(q.get(), 5));
            const Status s = snap.chunks.insert(column_u64(q.get(), 0), loc);
            if (!zff::core::is_ok(s)) return s;
        }
        if (rc != SQLITE_DONE) return db_error(rc);
    }

    {
        Stmt q(db_, "SELECT object_id, header_segment, header_offset, footer_segment, footer_offset "
                    "FROM objects WHERE uuid = ? ORDER BY position");
        if (!q.ok()) return db_error(sqlite3_errcode(db_));
        bind_uuid(q.get(), 1, uuid);
        int rc;
        while ((rc = sqlite3_step(q.get())) == SQLITE_ROW) {
            IndexedObject o{};
            o.object_id = column_u64(q.get(), 0);
            o.header_segment = column_u64(q.get(), 1);
            o.header_offset = column_u64(q.get(), 2);
            if (sqlite3_column_type(q.get(), 3) != SQLITE_NULL) {
                o.has_footer = true;
                o.footer_segment = column_u64(q.get(), 3);
                o.footer_offset = column_u64(q.get(), 4);
            }
            snap.objects.push_back(o);
        }
        if (rc != SQLITE_DONE) return db_error(rc);
    }

    *out = std::move(snap);
    return zff::core::ok_status();
}

Status ChunkIndexDb::store(const IndexSnapshot& snap) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);

    Status s = exec("BEGIN TRANSACTION");
    if (!zff::core::is_ok(s)) return s;

    auto rollback = [this](Status failed) {
        (void)exec("ROLLBACK");
        return failed;
    };

    {
        Stmt q(db_, "DELETE FROM containers WHERE uuid = ?");
        if (!q.ok()) return rollback(db_error(sqlite3_errcode(db_)));
        bind_uuid(q.get(), 1, snap.uuid);
        const int rc = sqlite3_step(q.get());
        if (rc != SQLITE_DONE) return rollback(db_error(rc));
    }

    {
        Stmt q(db_, "INSERT INTO containers (uuid, segment_count) VALUES (?, ?)");
        if (!q.ok()) return rollback(db_error(sqlite3_errcode(db_)));
        bind_uuid(q.get(), 1, snap.uuid);
        bind_u64(q.get(), 2, snap.segments.size());
        const int rc = sqlite3_step(q.get());
        if (rc != SQLITE_DONE) return rollback(db_error(rc));
    }

    {
        Stmt q(db_, "INSERT INTO segments (uuid, number, file_size, main_header_offset, main_footer_offset) "
                    "VALUES (?, ?, ?, ?, ?)");
        if (!q.ok()) return rollback(db_error(sqlite3_errcode(db_)));
        for (const IndexedSegment& seg : snap.segments) {
            sqlite3_reset(q.get());
            bind_uuid(q.get(), 1, snap.uuid);
            bind_u64(q.get(), 2, seg.number);
            bind_u64(q.get(), 3, seg.file_size);
            if (seg.has_main_header) bind_u64(q.get(), 4, seg.main_header_offset);
            else sqlite3_bind_null(q.get(), 4);
            if (seg.has_main_footer) bind_u64(q.get(), 5, seg.main_footer_offset);
            else sqlite3_bind_null(q.get(), 5);
            const int rc = sqlite3_step(q.get());
            if (rc != SQLITE_DONE) return rollback(db_error(rc));
        }
    }

    {
        Stmt q(db_, "INSERT INTO chunks (uuid, chunk_number, segment, offset, stored_size, flags, crc32) "
                    "VALUES (?, ?, ?, ?, ?, ?, ?)");
        if (!q.ok()) return rollback(db_error(sqlite3_errcode(db_)));
        for (const auto& kv : snap.chunks.entries()) {
            sqlite3_reset(q.get());
            bind_uuid(q.get(), 1, snap.uuid);
            bind_u64(q.get(), 2, kv.first);
            bind_u64(q.get(), 3, kv.second.segment);
            bind_u64(q.get(), 4, kv.second.offset);
            bind_u64(q.get(), 5, kv.second.stored_size);
            sqlite3_bind_int(q.get(), 6, kv.second.flags);
            sqlite3_bind_int64(q.get(), 7, static_cast<sqlite3_int64>(kv.second.crc32));
            const int rc = sqlite3_step(q.get());
            if (rc != SQLITE_DONE) return rollback(db_error(rc));
        }
    }

    {
        Stmt q(db_, "INSERT INTO objects (uuid, position, object_id, header_segment, header_offset, "
                    "footer_segment, footer_offset) VALUES (?, ?, ?, ?, ?, ?, ?)");
        if (!q.ok()) return rollback(db_error(sqlite3_errcode(db_)));
        u64 position = 0;
        for (const IndexedObject& o : snap.objects) {
            sqlite3_reset(q.get());
            bind_uuid(q.get(), 1, snap.uuid);
            bind_u64(q.get(), 2, position++);
            bind_u64(q.get(), 3, o.object_id);
            bind_u64(q.get(), 4, o.header_segment);
            bind_u64(q.get(), 5, o.header_offset);
            if (o.has_footer) {
                bind_u64(q.get(), 6, o.footer_segment);
                bind_u64(q.get(), 7, o.footer_offset);
            } else {
                sqlite3_bind_null(q.get(), 6);
                sqlite3_bind_null(q.get(), 7);
            }
            const int rc = sqlite3_step(q.get());
            if (rc != SQLITE_DONE) return rollback(db_error(rc));
        }
    }

    s = exec("COMMIT");
    if (!zff::core::is_ok(s)) return rollback(s);
    return zff::core::ok_status();
}

Status ChunkIndexDb::remove(const zff::core::Uuid& uuid) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    Stmt q(db_, "DELETE FROM containers WHERE uuid = ?");
    if (!q.ok()) return db_error(sqlite3_errcode(db_));
    bind_uuid(q.get(), 1, uuid);
    const int rc = sqlite3_step(q.get());
    if (rc != SQLITE_DONE) return db_error(rc);
    return zff::core::ok_status();
}

} // namespace zff::db
