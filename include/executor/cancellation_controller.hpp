#pragma once

#include "config/config_types.hpp"
#include "core/error.hpp"
#include "db/connection_multiplexer.hpp"
#include <string>

namespace sqlrunner {

/**
 * @brief Target of a cancel/terminate request
 *
 * Carries everything needed to reach the server without touching the
 * (blocked) session connection that runs the statement.
 */
struct CancellationRequest {
    int backend_pid = 0;
    ConnectionProfile profile;
    std::string database;     // Empty = profile default
};

/**
 * @brief Out-of-band statement cancellation
 *
 * Each request borrows a short-lived pooled connection for the same
 * ConnectionKey and calls pg_cancel_backend / pg_terminate_backend on the
 * captured pid. Failures are returned (and logged), never thrown, and never
 * touch the target session.
 */
class CancellationController {
public:
    explicit CancellationController(ConnectionMultiplexer& multiplexer);

    /**
     * @brief Cancel the statement currently running on backend_pid
     * @return ok(true) if the server signalled the backend, ok(false) if it
     *         reported nothing to cancel; CANCELLATION_ERROR on failure
     */
    [[nodiscard]] Result<bool> request_cancel(int backend_pid,
                                              const ConnectionProfile& profile,
                                              const std::string& database = "");

    /**
     * @brief Terminate the whole backend (the session is lost)
     */
    [[nodiscard]] Result<bool> request_terminate(int backend_pid,
                                                 const ConnectionProfile& profile,
                                                 const std::string& database = "");

    [[nodiscard]] Result<bool> request_cancel(const CancellationRequest& request) {
        return request_cancel(request.backend_pid, request.profile, request.database);
    }

    [[nodiscard]] Result<bool> request_terminate(const CancellationRequest& request) {
        return request_terminate(request.backend_pid, request.profile, request.database);
    }

private:
    Result<bool> signal_backend(const char* function, int backend_pid,
                                const ConnectionProfile& profile, const std::string& database);

    ConnectionMultiplexer& multiplexer_;
};

} // namespace sqlrunner
