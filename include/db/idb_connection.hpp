#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace sqlrunner {

/**
 * @brief Column metadata of a result set
 */
struct FieldInfo {
    std::string name;
    uint32_t type_oid = 0;
};

/// NULL cells are std::nullopt
using Row = std::vector<std::optional<std::string>>;

/**
 * @brief Result set from a query execution
 *
 * Returned by IDbConnection::execute().
 * Owns the result data (copied from native result handles).
 */
struct DbResultSet {
    bool success = false;
    std::string error_message;

    // For row-returning statements
    std::vector<FieldInfo> fields;
    std::vector<Row> rows;

    // For DML ("INSERT 0 3" -> 3)
    uint64_t affected_rows = 0;

    // Server command tag verb: "SELECT", "INSERT", "CREATE", ...
    std::string command_tag;

    bool has_rows = false;
};

/**
 * @brief Scoped notice listener registration
 *
 * Move-only. The listener is removed when the handle is destroyed or
 * reset(), on every exit path of the owning scope.
 */
class NoticeSubscription {
public:
    NoticeSubscription() = default;
    explicit NoticeSubscription(std::function<void()> unsubscribe)
        : unsubscribe_(std::move(unsubscribe)) {}

    ~NoticeSubscription() { reset(); }

    NoticeSubscription(NoticeSubscription&& other) noexcept
        : unsubscribe_(std::exchange(other.unsubscribe_, nullptr)) {}

    NoticeSubscription& operator=(NoticeSubscription&& other) noexcept {
        if (this != &other) {
            reset();
            unsubscribe_ = std::exchange(other.unsubscribe_, nullptr);
        }
        return *this;
    }

    NoticeSubscription(const NoticeSubscription&) = delete;
    NoticeSubscription& operator=(const NoticeSubscription&) = delete;

    void reset() {
        if (unsubscribe_) {
            auto fn = std::exchange(unsubscribe_, nullptr);
            fn();
        }
    }

    [[nodiscard]] bool active() const { return static_cast<bool>(unsubscribe_); }

private:
    std::function<void()> unsubscribe_;
};

/**
 * @brief Abstract database connection
 *
 * Wraps a single native connection handle (PGconn*).
 * Implementations are not thread-safe; exclusivity comes from the
 * pool lease or the session lease that hands it out.
 */
class IDbConnection {
public:
    using NoticeHandler = std::function<void(const std::string& message)>;

    virtual ~IDbConnection() = default;

    /**
     * @brief Execute a SQL statement
     * @param sql SQL text
     * @return Result set with rows or affected count; success=false on
     *         server error (the connection remains usable)
     */
    [[nodiscard]] virtual DbResultSet execute(const std::string& sql) = 0;

    /**
     * @brief Register a listener for server notices (RAISE NOTICE, warnings)
     */
    [[nodiscard]] virtual NoticeSubscription subscribe_notices(NoticeHandler handler) = 0;

    /**
     * @brief Check if connection is in a valid state (connected)
     */
    [[nodiscard]] virtual bool is_connected() const = 0;

    /**
     * @brief True while an explicit transaction block is open
     */
    [[nodiscard]] virtual bool in_transaction() const = 0;

    /**
     * @brief Close the connection and release resources
     */
    virtual void close() = 0;
};

} // namespace sqlrunner
