#pragma once

#include "db/idb_connection.hpp"
#include "executor/execution_types.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace sqlrunner {

/**
 * @brief Heuristics deciding whether a SELECT is worth a cursor
 */
class StreamingPolicy {
public:
    static constexpr size_t kDefaultMaxRowsBeforeStreaming = 1000;

    /**
     * @brief True for a plain SELECT without aggregates and without a
     *        LIMIT small enough to fetch in one go
     */
    [[nodiscard]] static bool should_stream(
        std::string_view query,
        size_t max_rows_before_streaming = kDefaultMaxRowsBeforeStreaming);

    [[nodiscard]] static bool is_streamable(std::string_view query);

    [[nodiscard]] static bool has_small_limit(std::string_view query, size_t max_rows);
};

/**
 * @brief Lazy, finite, non-restartable sequence of cursor batches
 *
 * Owns a server-side NO SCROLL cursor on a borrowed connection. If the
 * connection was idle, the stream also owns the transaction wrapping the
 * cursor. Both are closed when the stream is exhausted, closed, or
 * destroyed, whichever comes first. The connection must outlive the stream
 * and must not be used for anything else while the stream is open.
 */
class CursorStream {
public:
    /**
     * @brief Open the cursor
     * @throws StatementError if BEGIN or DECLARE fails
     */
    CursorStream(IDbConnection& conn, const std::string& query, size_t batch_size);

    ~CursorStream();

    CursorStream(CursorStream&& other) noexcept;
    CursorStream& operator=(CursorStream&&) = delete;

    CursorStream(const CursorStream&) = delete;
    CursorStream& operator=(const CursorStream&) = delete;

    /**
     * @brief Fetch the next batch
     * @return Batch, or std::nullopt once exhausted
     * @throws StatementError on FETCH failure (the cursor is closed first)
     */
    [[nodiscard]] std::optional<StreamBatch> next();

    /**
     * @brief Close cursor and owned transaction early (idempotent)
     */
    void close();

    [[nodiscard]] bool exhausted() const { return !open_; }
    [[nodiscard]] const std::string& cursor_name() const { return cursor_name_; }
    [[nodiscard]] uint64_t total_rows() const { return total_rows_; }
    [[nodiscard]] size_t batch_size() const { return batch_size_; }

private:
    void finish(bool success);

    IDbConnection* conn_;
    std::string cursor_name_;
    size_t batch_size_;
    bool owns_transaction_ = false;
    bool open_ = false;
    size_t batch_number_ = 0;
    uint64_t total_rows_ = 0;
};

/**
 * @brief Streams large SELECT results through server-side cursors
 */
class StreamingCursorReader {
public:
    static constexpr size_t kDefaultBatchSize = 200;

    /**
     * @brief Declare a cursor over query and return its batch stream
     * @param conn Session or pooled connection (borrowed)
     * @param query Single SELECT; a trailing ';' is removed
     * @param batch_size Rows per FETCH
     * @throws StatementError if the cursor cannot be declared
     */
    [[nodiscard]] static CursorStream stream(IDbConnection& conn,
                                             const std::string& query,
                                             size_t batch_size = kDefaultBatchSize);
};

} // namespace sqlrunner
