#include "server/access_server.hpp"
#include "server/http_constants.hpp"
#include "core/gateway.hpp"
#include "core/utils.hpp"
#include "enforcement/policy_enforcement_point.hpp"
#include "monitoring/central_monitor.hpp"
#include "policy/policy_store.hpp"

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <httplib.h>
#pragma GCC diagnostic pop

#include <nlohmann/json.hpp>
#include <openssl/crypto.h>

#include <array>
#include <stdexcept>
#include <format>
#include <string_view>

namespace ztgate {

// ============================================================================
// Anonymous namespace helpers
// ============================================================================

namespace {

constexpr std::array<const char*, 5> kRequiredFields = {
    "user", "action", "resource", "source_ip", "device_id"
};

bool constant_time_equals(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) {
        return false;
    }
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

void send_error(httplib::Response& res, int status, const std::string& message) {
    res.status = status;
    const nlohmann::json body = {{"success", false}, {"error", message}};
    res.set_content(body.dump(), http::kJsonContentType);
}

} // anonymous namespace

// ============================================================================
// Construction
// ============================================================================

AccessServer::AccessServer(std::shared_ptr<Gateway> gateway,
                           std::string config_path,
                           std::string host,
                           int port,
                           size_t thread_pool_size,
                           std::string admin_token)
    : gateway_(std::move(gateway)),
      config_path_(std::move(config_path)),
      host_(std::move(host)),
      port_(port),
      thread_pool_size_(thread_pool_size),
      admin_token_(std::move(admin_token)),
      server_(std::make_unique<httplib::Server>()) {}

AccessServer::~AccessServer() = default;

void AccessServer::start() {
    auto& svr = *server_;

    const size_t pool_size = thread_pool_size_;
    svr.new_task_queue = [pool_size] {
        return new httplib::ThreadPool(pool_size);
    };

    register_routes(svr);

    utils::log::info(std::format("Starting ztgate access server on {}:{} ({} threads)",
                                 host_, port_, thread_pool_size_));
    if (admin_exposed(host_, admin_token_)) {
        utils::log::warn(std::format("No admin token set: {} is unauthenticated on {}",
                                     http::kPolicyReloadRoute, host_));
    }

    if (!svr.listen(host_.c_str(), port_)) {
        throw std::runtime_error(std::format("Failed to listen on {}:{}", host_, port_));
    }
}

void AccessServer::stop() {
    if (server_) {
        server_->stop();
    }
    utils::log::info("Server stopped");
}

AccessServer::HttpStats AccessServer::get_http_stats() const {
    return {
        requests_.load(std::memory_order_relaxed),
        bad_requests_.load(std::memory_order_relaxed),
        auth_rejects_.load(std::memory_order_relaxed)
    };
}

void AccessServer::register_routes(httplib::Server& svr) {
    svr.Post(http::kAccessRoute, [this](const httplib::Request& req, httplib::Response& res) {
        handle_access(req, res);
    });
    svr.Get(http::kMetricsRoute, [this](const httplib::Request& req, httplib::Response& res) {
        handle_metrics(req, res);
    });
    svr.Get(http::kHealthRoute, [this](const httplib::Request& req, httplib::Response& res) {
        handle_health(req, res);
    });
    svr.Post(http::kPolicyReloadRoute, [this](const httplib::Request& req, httplib::Response& res) {
        handle_policies_reload(req, res);
    });
}

// ============================================================================
// Request / response mapping
// ============================================================================

std::optional<AccessRequest> AccessServer::parse_access_request(const std::string& body,
                                                                std::string& error_out) {
    const auto doc = nlohmann::json::parse(body, nullptr, /*allow_exceptions=*/false);
    if (doc.is_discarded() || !doc.is_object()) {
        error_out = "Request body must be a JSON object";
        return std::nullopt;
    }

    for (const char* field : kRequiredFields) {
        const auto it = doc.find(field);
        if (it == doc.end() || !it->is_string() || utils::trim(it->get<std::string>()).empty()) {
            error_out = std::format("Missing or invalid field: {}", field);
            return std::nullopt;
        }
    }

    return AccessRequest(doc["user"].get<std::string>(),
                         doc["action"].get<std::string>(),
                         doc["resource"].get<std::string>(),
                         doc["source_ip"].get<std::string>(),
                         doc["device_id"].get<std::string>());
}

nlohmann::json AccessServer::outcome_to_json(const EnforcementOutcome& outcome) {
    return {
        {"decision", decision_to_string(outcome.decision)},
        {"reason", outcome.reason},
        {"cloud", outcome.cloud},
        {"permitted", outcome.permitted()},
        {"remediation_actions", outcome.remediation_actions},
    };
}

bool AccessServer::is_loopback_host(std::string_view host) {
    return host == "localhost" || host == "::1" || host == "[::1]" || host.starts_with("127.");
}

// ============================================================================
// Handler: POST /api/v1/access
// ============================================================================

void AccessServer::handle_access(const httplib::Request& req, httplib::Response& res) {
    requests_.fetch_add(1, std::memory_order_relaxed);

    std::string error;
    const auto request = parse_access_request(req.body, error);
    if (!request) {
        bad_requests_.fetch_add(1, std::memory_order_relaxed);
        send_error(res, httplib::StatusCode::BadRequest_400, error);
        return;
    }

    auto result = gateway_->enforce(*request);
    if (result.is_error()) {
        bad_requests_.fetch_add(1, std::memory_order_relaxed);
        const int status = (result.error_category() == ErrorCategory::MALFORMED_REQUEST)
            ? httplib::StatusCode::BadRequest_400
            : httplib::StatusCode::InternalServerError_500;
        send_error(res, status, result.error_message());
        return;
    }

    // REVIEW and DENY are still successful evaluations: 200 with the decision
    res.status = httplib::StatusCode::OK_200;
    res.set_content(outcome_to_json(result.value()).dump(), http::kJsonContentType);
}

// ============================================================================
// Handler: GET /api/v1/metrics
// ============================================================================

void AccessServer::handle_metrics(const httplib::Request& /*req*/, httplib::Response& res) {
    auto& monitor = gateway_->monitor();
    const auto stats = monitor.get_stats();
    const auto pep = gateway_->pep().get_stats();

    nlohmann::json body = {
        {"metrics", monitor.snapshot().to_json()},
        {"monitor", {
            {"total_recorded", stats.total_recorded},
            {"write_retries", stats.write_retries},
            {"write_failures", stats.write_failures},
            {"metrics_persist_failures", stats.metrics_persist_failures},
        }},
        {"enforcement", {
            {"total_requests", pep.total_requests},
            {"permitted", pep.permitted},
            {"blocked", pep.blocked},
            {"pending_review", pep.pending_review},
            {"malformed", pep.malformed},
            {"audit_failures", pep.audit_failures},
        }},
        {"policy", {
            {"version", gateway_->policy_store().version()},
            {"policies", gateway_->policy_store().policy_count()},
            {"generation", gateway_->policy_store().generation()},
        }},
    };
    res.set_content(body.dump(2), http::kJsonContentType);
}

// ============================================================================
// Handler: GET /health
// ============================================================================

void AccessServer::handle_health(const httplib::Request& /*req*/, httplib::Response& res) {
    const bool audit_ok = gateway_->monitor().get_stats().write_failures == 0;
    const nlohmann::json body = {
        {"status", audit_ok ? "healthy" : "degraded"},
        {"service", "ztgate"},
        {"policy_version", gateway_->policy_store().version()},
    };
    res.status = audit_ok ? httplib::StatusCode::OK_200
                          : httplib::StatusCode::ServiceUnavailable_503;
    res.set_content(body.dump(), http::kJsonContentType);
}

// ============================================================================
// Handler: POST /admin/policies/reload
// ============================================================================

bool AccessServer::require_admin(const httplib::Request& req, httplib::Response& res) {
    if (admin_token_.empty()) return true;
    const auto auth = req.get_header_value(http::kAuthorizationHeader);
    if (auth.size() <= http::kBearerPrefix.size() ||
        std::string_view(auth).substr(0, http::kBearerPrefix.size()) != http::kBearerPrefix ||
        !constant_time_equals(std::string_view(auth).substr(http::kBearerPrefix.size()), admin_token_)) {
        auth_rejects_.fetch_add(1, std::memory_order_relaxed);
        send_error(res, httplib::StatusCode::Unauthorized_401, "Unauthorized");
        return false;
    }
    return true;
}

void AccessServer::handle_policies_reload(const httplib::Request& req, httplib::Response& res) {
    if (!require_admin(req, res)) return;

    std::string error;
    if (!gateway_->reload_from_config(config_path_, &error)) {
        send_error(res, httplib::StatusCode::BadRequest_400, error);
        return;
    }

    const auto& store = gateway_->policy_store();
    const nlohmann::json body = {
        {"success", true},
        {"version", store.version()},
        {"policies_loaded", store.policy_count()},
    };
    res.status = httplib::StatusCode::OK_200;
    res.set_content(body.dump(), http::kJsonContentType);
}

} // namespace ztgate
