#include "executor/cancellation_controller.hpp"
#include "core/utils.hpp"

#include <format>

namespace sqlrunner {

CancellationController::CancellationController(ConnectionMultiplexer& multiplexer)
    : multiplexer_(multiplexer) {}

Result<bool> CancellationController::request_cancel(int backend_pid,
                                                    const ConnectionProfile& profile,
                                                    const std::string& database) {
    return signal_backend("pg_cancel_backend", backend_pid, profile, database);
}

Result<bool> CancellationController::request_terminate(int backend_pid,
                                                       const ConnectionProfile& profile,
                                                       const std::string& database) {
    return signal_backend("pg_terminate_backend", backend_pid, profile, database);
}

Result<bool> CancellationController::signal_backend(const char* function, int backend_pid,
                                                    const ConnectionProfile& profile,
                                                    const std::string& database) {
    if (backend_pid <= 0) {
        return Result<bool>::error(ErrorCategory::CANCELLATION_ERROR,
            std::format("Invalid backend pid {}", backend_pid));
    }

    PooledLease lease;
    try {
        lease = multiplexer_.acquire_pooled(profile, database);
    } catch (const ConnectionError& e) {
        utils::log::warn(std::format("{}({}) could not get a connection: {}",
                                     function, backend_pid, e.what()));
        return Result<bool>::error(ErrorCategory::CANCELLATION_ERROR, e.what());
    }

    auto rs = lease->get()->execute(std::format("SELECT {}({})", function, backend_pid));
    multiplexer_.release(std::move(lease));

    if (!rs.success) {
        utils::log::warn(std::format("{}({}) failed: {}", function, backend_pid, rs.error_message));
        return Result<bool>::error(ErrorCategory::CANCELLATION_ERROR, rs.error_message);
    }

    const bool signalled = !rs.rows.empty() && !rs.rows.front().empty() &&
                           rs.rows.front().front() && *rs.rows.front().front() == "t";
    utils::log::info(std::format("{}({}) -> {}", function, backend_pid, signalled));
    return Result<bool>::ok(signalled);
}

} // namespace sqlrunner
