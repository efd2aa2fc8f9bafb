#pragma once
/**
 * @file constants.hpp
 * @brief Centralized named defaults for lifecycle and proxy components.
 * @details These values eliminate magic numbers from the codebase. Override via the
 *          JSON deployment file (see config_loader.hpp).
 */

#include <cstddef>
#include <cstdint>

namespace dockyard::config::constants {

// =====================
// Deployment unit defaults (the bundled notes stack)
// =====================
inline constexpr const char* DEPLOYMENT_NAME        = "notes";
inline constexpr const char* NETWORK_NAME           = "notes-net";

inline constexpr const char* POSTGRES_NAME          = "postgres-db";
inline constexpr const char* POSTGRES_IMAGE         = "postgres:14-alpine";
inline constexpr uint16_t    POSTGRES_PORT          = 5432;
inline constexpr const char* POSTGRES_DB            = "notes_db";
inline constexpr const char* POSTGRES_USER          = "postgres";
inline constexpr const char* POSTGRES_PASSWORD      = "your_password";
inline constexpr const char* POSTGRES_HEALTH_CMD    = "pg_isready -U postgres";

inline constexpr const char* BACKEND_NAME           = "backend";
inline constexpr const char* BACKEND_IMAGE          = "notes-backend:latest";
inline constexpr const char* BACKEND_CONTEXT        = "backend";
inline constexpr uint16_t    BACKEND_PORT           = 3001;

inline constexpr const char* FRONTEND_NAME          = "frontend";
inline constexpr const char* FRONTEND_IMAGE         = "notes-frontend:latest";
inline constexpr const char* FRONTEND_CONTEXT       = "frontend";
inline constexpr uint16_t    FRONTEND_PORT          = 3000;

inline constexpr const char* PROXY_NAME             = "nginx-proxy";
inline constexpr const char* PROXY_IMAGE            = "nginx-proxy:latest";
inline constexpr const char* PROXY_CONTEXT          = "nginx";
inline constexpr uint16_t    PROXY_HOST_PORT        = 8080;
inline constexpr uint16_t    PROXY_CONTAINER_PORT   = 80;

// =====================
// Health-check descriptor defaults (container runtime probe)
// Units: milliseconds
// =====================
inline constexpr uint32_t HEALTH_INTERVAL_MS     = 1000;  ///< Poll spacing while waiting for Running
inline constexpr uint32_t HEALTH_TIMEOUT_MS      = 3000;  ///< Single probe ceiling
inline constexpr uint32_t HEALTH_RETRIES         = 10;    ///< Polls after the grace period
inline constexpr uint32_t HEALTH_START_PERIOD_MS = 0;     ///< Grace before failures count

// =====================
// Teardown confirmation + exit codes
// =====================
inline constexpr const char* DESTROY_CONFIRM_PHRASE = "destroy-app";

inline constexpr int EXIT_OK        = 0;  ///< Success
inline constexpr int EXIT_FATAL     = 1;  ///< Prerequisite, usage or fatal runtime error
inline constexpr int EXIT_CANCELLED = 2;  ///< Destroy cancelled by operator
inline constexpr int EXIT_DEGRADED  = 3;  ///< Apply finished with failed/blocked services

/// Label carrying the configuration fingerprint on every managed instance.
inline constexpr const char* CONFIG_HASH_LABEL = "dockyard.config-hash";
/// Label naming the deployment unit an instance belongs to.
inline constexpr const char* DEPLOYMENT_LABEL  = "dockyard.deployment";

// =====================
// Rate-limit zone defaults
// Units: requests/second for rate; tokens for burst
// =====================
inline constexpr const char* ZONE_API_NAME     = "api";
inline constexpr const char* ZONE_GENERAL_NAME = "general";
inline constexpr const char* ZONE_KEY_CLIENT   = "client_addr"; ///< Only supported key rule
inline constexpr double   ZONE_API_RATE          = 10.0;
inline constexpr double   ZONE_API_BURST         = 20.0;
inline constexpr double   ZONE_GENERAL_RATE      = 30.0;
inline constexpr double   ZONE_GENERAL_BURST     = 50.0;
inline constexpr uint32_t ZONE_IDLE_EVICT_MS     = 60000; ///< Drop buckets idle this long
inline constexpr std::size_t ZONE_SHARDS         = 64;    ///< Lock stripes per zone

// =====================
// Upstream group defaults
// =====================
inline constexpr uint32_t UPSTREAM_KEEPALIVE          = 16;    ///< Idle connections kept per member
inline constexpr uint32_t UPSTREAM_RISE               = 2;     ///< Consecutive OK probes to rejoin
inline constexpr uint32_t UPSTREAM_FALL               = 1;     ///< Consecutive failed probes to eject
inline constexpr uint32_t UPSTREAM_CONNECT_TIMEOUT_MS = 1000;
inline constexpr uint32_t UPSTREAM_REQUEST_TIMEOUT_MS = 30000;
inline constexpr uint32_t PROBE_INTERVAL_MS           = 5000;
inline constexpr uint32_t PROBE_TIMEOUT_MS            = 1000;

// =====================
// Static liveness response
// =====================
inline constexpr const char* LIVENESS_PATH   = "/nginx-health";
inline constexpr uint16_t    LIVENESS_STATUS = 200;
inline constexpr const char* LIVENESS_BODY   = "healthy\n";

// =====================
// Dispatch rejection statuses
// =====================
inline constexpr uint16_t STATUS_BAD_REQUEST  = 400; ///< Target not starting with '/'
inline constexpr uint16_t STATUS_RATE_LIMITED = 429;
inline constexpr uint16_t STATUS_BAD_GATEWAY  = 502;
inline constexpr uint16_t STATUS_UNAVAILABLE  = 503;

} // namespace dockyard::config::constants
