#include "executor/streaming_cursor_reader.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <array>
#include <atomic>
#include <format>
#include <regex>
#include <utility>

namespace sqlrunner {

namespace {

std::string next_cursor_name() {
    static std::atomic<uint64_t> counter{0};
    return std::format("sqlrunner_cursor_{}", counter.fetch_add(1) + 1);
}

std::string strip_trailing_semicolons(const std::string& query) {
    std::string body = utils::trim(query);
    while (!body.empty() && body.back() == ';') {
        body.pop_back();
        body = utils::trim(body);
    }
    return body;
}

} // anonymous namespace

// ============================================================================
// StreamingPolicy
// ============================================================================

bool StreamingPolicy::should_stream(std::string_view query, size_t max_rows_before_streaming) {
    return is_streamable(query) && !has_small_limit(query, max_rows_before_streaming);
}

bool StreamingPolicy::is_streamable(std::string_view query) {
    const std::string normalized = utils::to_lower(utils::trim(query));
    if (!normalized.starts_with("select")) {
        return false;
    }

    static constexpr std::array<std::string_view, 6> kAggregates = {
        "count(", "sum(", "avg(", "min(", "max(", "group by"};
    return std::none_of(kAggregates.begin(), kAggregates.end(),
        [&normalized](std::string_view kw) { return normalized.find(kw) != std::string::npos; });
}

bool StreamingPolicy::has_small_limit(std::string_view query, size_t max_rows) {
    static const std::regex kLimit(R"(limit\s+(\d+))");
    const std::string normalized = utils::to_lower(utils::trim(query));

    std::smatch match;
    if (!std::regex_search(normalized, match, kLimit)) {
        return false;
    }
    // Digits beyond uint64 range are certainly not "small"
    const auto limit = utils::try_parse_int<uint64_t>(match[1].str());
    return limit && *limit <= max_rows;
}

// ============================================================================
// CursorStream
// ============================================================================

CursorStream::CursorStream(IDbConnection& conn, const std::string& query, size_t batch_size)
    : conn_(&conn),
      cursor_name_(next_cursor_name()),
      batch_size_(std::max<size_t>(batch_size, 1)) {

    if (!conn_->in_transaction()) {
        auto begin = conn_->execute("BEGIN");
        if (!begin.success) {
            throw StatementError(begin.error_message);
        }
        owns_transaction_ = true;
    }

    const std::string declare = std::format("DECLARE {} NO SCROLL CURSOR FOR {}",
                                            cursor_name_, strip_trailing_semicolons(query));
    auto declared = conn_->execute(declare);
    if (!declared.success) {
        if (owns_transaction_) {
            auto rollback = conn_->execute("ROLLBACK");
            if (!rollback.success) {
                utils::log::warn(std::format("ROLLBACK after failed DECLARE failed: {}",
                                             rollback.error_message));
            }
        }
        throw StatementError(declared.error_message);
    }

    open_ = true;
    utils::log::debug(std::format("Opened cursor {} (batch size {})", cursor_name_, batch_size_));
}

CursorStream::CursorStream(CursorStream&& other) noexcept
    : conn_(other.conn_),
      cursor_name_(std::move(other.cursor_name_)),
      batch_size_(other.batch_size_),
      owns_transaction_(std::exchange(other.owns_transaction_, false)),
      open_(std::exchange(other.open_, false)),
      batch_number_(other.batch_number_),
      total_rows_(other.total_rows_) {}

CursorStream::~CursorStream() {
    close();
}

std::optional<StreamBatch> CursorStream::next() {
    if (!open_) {
        return std::nullopt;
    }

    auto fetched = conn_->execute(std::format("FETCH FORWARD {} FROM {}", batch_size_, cursor_name_));
    if (!fetched.success) {
        finish(false);
        throw StatementError(fetched.error_message);
    }

    if (fetched.rows.empty()) {
        finish(true);
        return std::nullopt;
    }

    StreamBatch batch;
    batch.batch_number = ++batch_number_;
    batch.is_first = batch_number_ == 1;
    batch.is_complete = fetched.rows.size() < batch_size_;
    total_rows_ += fetched.rows.size();
    batch.total_rows_so_far = total_rows_;
    batch.fields = std::move(fetched.fields);
    batch.rows = std::move(fetched.rows);

    // A short batch means the cursor has nothing left
    if (batch.is_complete) {
        finish(true);
    }
    return batch;
}

void CursorStream::close() {
    finish(true);
}

void CursorStream::finish(bool success) {
    if (!open_) {
        return;
    }
    open_ = false;

    // After a failure the transaction is aborted and the cursor is gone with it
    if (success) {
        auto closed = conn_->execute(std::format("CLOSE {}", cursor_name_));
        if (!closed.success) {
            utils::log::debug(std::format("CLOSE {} failed: {}", cursor_name_, closed.error_message));
        }
    }

    if (owns_transaction_) {
        owns_transaction_ = false;
        auto ended = conn_->execute(success ? "COMMIT" : "ROLLBACK");
        if (!ended.success) {
            utils::log::warn(std::format("Ending cursor transaction failed: {}", ended.error_message));
        }
    }

    utils::log::debug(std::format("Closed cursor {} after {} row(s)", cursor_name_, total_rows_));
}

// ============================================================================
// StreamingCursorReader
// ============================================================================

CursorStream StreamingCursorReader::stream(IDbConnection& conn,
                                           const std::string& query,
                                           size_t batch_size) {
    return CursorStream(conn, query, batch_size);
}

} // namespace sqlrunner
