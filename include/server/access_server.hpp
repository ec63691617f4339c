#pragma once

#include "core/types.hpp"
#include <nlohmann/json_fwd.hpp>
#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

// Forward-declare httplib types (avoids pulling in the header-only library)
namespace httplib {
struct Request;
struct Response;
class Server;
}

namespace ztgate {

class Gateway;

/**
 * @brief HTTP entry point for access decisions
 *
 * Routes:
 *   POST /api/v1/access          {user, action, resource, source_ip, device_id}
 *                                → {decision, reason, cloud, remediation_actions, permitted}
 *   GET  /api/v1/metrics         metrics snapshot + monitor stats
 *   GET  /health                 liveness
 *   POST /admin/policies/reload  re-read the config file (Bearer admin token)
 *
 * A body that is not a JSON object, or lacks a required field, gets 400 and
 * never reaches the decision pipeline.
 */
class AccessServer {
public:
    AccessServer(std::shared_ptr<Gateway> gateway,
                 std::string config_path,
                 std::string host = "0.0.0.0",
                 int port = 8080,
                 size_t thread_pool_size = 4,
                 std::string admin_token = "");

    ~AccessServer();

    /// Blocks until stop() is called
    void start();
    void stop();

    /**
     * @brief Parse a POST /api/v1/access body
     * @param error_out Receives the reason on failure
     */
    [[nodiscard]] static std::optional<AccessRequest> parse_access_request(
        const std::string& body, std::string& error_out);

    [[nodiscard]] static nlohmann::json outcome_to_json(const EnforcementOutcome& outcome);

    /// True for 127.0.0.0/8, ::1 and "localhost"
    [[nodiscard]] static bool is_loopback_host(std::string_view host);

    /// Admin routes accept unauthenticated calls from other machines
    [[nodiscard]] static bool admin_exposed(std::string_view host, std::string_view admin_token) {
        return admin_token.empty() && !is_loopback_host(host);
    }

    struct HttpStats {
        uint64_t requests;
        uint64_t bad_requests;
        uint64_t auth_rejects;
    };
    [[nodiscard]] HttpStats get_http_stats() const;

private:
    void register_routes(httplib::Server& svr);

    void handle_access(const httplib::Request& req, httplib::Response& res);
    void handle_metrics(const httplib::Request& req, httplib::Response& res);
    void handle_health(const httplib::Request& req, httplib::Response& res);
    void handle_policies_reload(const httplib::Request& req, httplib::Response& res);

    bool require_admin(const httplib::Request& req, httplib::Response& res);

    std::shared_ptr<Gateway> gateway_;
    const std::string config_path_;
    const std::string host_;
    const int port_;
    const size_t thread_pool_size_;
    const std::string admin_token_;

    std::unique_ptr<httplib::Server> server_;

    std::atomic<uint64_t> requests_{0};
    std::atomic<uint64_t> bad_requests_{0};
    std::atomic<uint64_t> auth_rejects_{0};
};

} // namespace ztgate
