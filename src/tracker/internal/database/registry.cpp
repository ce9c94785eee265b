#include "tracker/internal/database/registry.hpp"
#include "tracker/internal/database/internal/queries.hpp"
#include "tracker/internal/database/internal/tableInfo.hpp"
#include "networking/internal/messageFormatting/byteOrdering.hpp"

#include <cstdlib>
#include <iostream>
#include <stdexcept>

namespace csw {

//SQLite integers are signed, file uuids are stored bit for bit
static int64_t toColumn(const uint64_t uuid) {
    return static_cast<int64_t>(uuid);
}

Registry::Registry(std::chrono::milliseconds ttl) : ttl(ttl) {
    if (sqlite3_open(":memory:", &db) != SQLITE_OK) {
        std::string msg = db ? sqlite3_errmsg(db) : "out of memory";
        sqlite3_close(db);
        throw std::runtime_error("[registry] Could not open database: " + msg);
    }

    auto err_val = createTable(db, PEER_NAME, PEER_KEYS, PEER_ATTRIBUTES);
    if (err_val) {
        sqlite3_close(db);
        throw std::runtime_error("[registry] Could not set up database: " + err_val.value());
    }
}

Registry::~Registry() {
    sqlite3_close(db);
}

std::string Registry::sqliteError() const {
    std::lock_guard<std::mutex> lock(mtx);
    return err_msg;
}

int Registry::reportError(const std::string& e) {
    err_msg = e;
    std::cerr << "[registry] " << e << std::endl;
    return EXIT_FAILURE;
}

int64_t Registry::nowMillis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now().time_since_epoch()).count();
}

int Registry::purgeStale(const uint64_t uuid) {
    int64_t oldest_live = nowMillis() - ttl.count();
    std::string query = "DELETE FROM " + std::string(PEER_NAME) + " WHERE "
                        + PEER_KEYS[0].first + "=? AND " + PEER_ATTRIBUTES[2].first + "<?;";

    auto err_val = runStatement(db, query, {toColumn(uuid), oldest_live});
    if (err_val)
        return reportError(err_val.value());

    int purged = changedRows(db);
    if (purged > 0)
        std::cout << "[registry] Dropped " << purged << " stale peer(s) of file " << uuid << std::endl;
    return EXIT_SUCCESS;
}

int Registry::registerPeer(const uint64_t uuid, const PeerRecord& record) {
    std::lock_guard<std::mutex> lock(mtx);

    //INSERT OR REPLACE keyed on (file_id, ip_addr, port) is the upsert
    std::string query = "INSERT OR REPLACE INTO " + std::string(PEER_NAME) + "("
                        + PEER_KEYS[0].first + "," + PEER_KEYS[1].first + "," + PEER_KEYS[2].first + ","
                        + PEER_ATTRIBUTES[0].first + "," + PEER_ATTRIBUTES[1].first + ","
                        + PEER_ATTRIBUTES[2].first + ") VALUES (?,?,?,?,?,?);";

    auto err_val = runStatement(db, query, {
        toColumn(uuid),
        record.peer.ip_addr,
        static_cast<int64_t>(record.peer.port),
        packBits(record.availability),
        static_cast<int64_t>(record.availability.size()),
        nowMillis()
    });
    if (err_val)
        return reportError(err_val.value());
    return EXIT_SUCCESS;
}

int Registry::deregisterPeer(const uint64_t uuid, const SourceInfo& peer) {
    std::lock_guard<std::mutex> lock(mtx);

    std::string query = "DELETE FROM " + std::string(PEER_NAME) + " WHERE "
                        + PEER_KEYS[0].first + "=? AND " + PEER_KEYS[1].first + "=? AND "
                        + PEER_KEYS[2].first + "=?;";

    auto err_val = runStatement(db, query, {
        toColumn(uuid),
        peer.ip_addr,
        static_cast<int64_t>(peer.port)
    });
    if (err_val)
        return reportError(err_val.value());
    return EXIT_SUCCESS;
}

int Registry::listPeers(const uint64_t           uuid,
                        const SourceInfo&        excluding,
                        std::vector<PeerRecord>& dest) {
    std::lock_guard<std::mutex> lock(mtx);
    dest.clear();

    if (purgeStale(uuid) != EXIT_SUCCESS)
        return EXIT_FAILURE;

    std::string query = "SELECT " + PEER_KEYS[1].first + "," + PEER_KEYS[2].first + ","
                        + PEER_ATTRIBUTES[0].first + "," + PEER_ATTRIBUTES[1].first
                        + " FROM " + std::string(PEER_NAME)
                        + " WHERE " + PEER_KEYS[0].first + "=? AND NOT ("
                        + PEER_KEYS[1].first + "=? AND " + PEER_KEYS[2].first + "=?)"
                        + " ORDER BY " + PEER_KEYS[1].first + "," + PEER_KEYS[2].first + ";";

    std::vector<Row> rows;
    auto err_val = runStatement(db, query, {
        toColumn(uuid),
        excluding.ip_addr,
        static_cast<int64_t>(excluding.port)
    }, &rows);
    if (err_val)
        return reportError(err_val.value());

    for (Row& r : rows) {
        auto ip        = std::get_if<std::string>(&r[0]);
        auto port      = std::get_if<int64_t>(&r[1]);
        auto bitmap    = std::get_if<std::vector<uint8_t>>(&r[2]);
        auto bit_count = std::get_if<int64_t>(&r[3]);
        if (!ip || !port || !bitmap || !bit_count
            || bitmap->size() != bitmapLen(static_cast<size_t>(*bit_count))) {
            dest.clear();
            return reportError("Malformed row for file " + std::to_string(uuid));
        }

        PeerRecord p;
        p.peer.ip_addr  = *ip;
        p.peer.port     = static_cast<uint16_t>(*port);
        p.availability  = unpackBits(bitmap->data(), static_cast<size_t>(*bit_count));
        dest.push_back(std::move(p));
    }

    return EXIT_SUCCESS;
}

size_t Registry::rowCount() const {
    std::lock_guard<std::mutex> lock(mtx);

    std::vector<Row> rows;
    auto err_val = runStatement(db, "SELECT COUNT(*) FROM " + std::string(PEER_NAME) + ";", {}, &rows);
    if (err_val || rows.empty())
        return 0;

    auto count = std::get_if<int64_t>(&rows.front()[0]);
    return count ? static_cast<size_t>(*count) : 0;
}

} //csw
