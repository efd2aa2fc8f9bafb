/**
 * @file observability.cpp
 * @brief spdlog-backed implementation of Observer.
 */
#include "dockyard/obs/observability.hpp"

#include <mutex>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace dockyard::obs {

    namespace {
        // Quotes and backslashes are escaped; invalid UTF-8 is replaced, never thrown.
        std::string dump(const nlohmann::ordered_json& j) {
            return j.dump(-1, ' ', false, nlohmann::ordered_json::error_handler_t::replace);
        }
    } // namespace

    std::string to_json_line(const LifecycleEvent& e, bool with_dry_run) {
        nlohmann::ordered_json j{{"deployment", e.deployment}, {"service", e.service}, {"action", e.action},
                                 {"outcome", e.outcome}, {"reason", e.reason}};
        if (with_dry_run) j["dry_run"] = e.dry_run;
        return dump(j);
    }

    std::string to_json_line(const AdmissionEvent& e) {
        return dump(nlohmann::ordered_json{{"path", e.path}, {"route", e.route}, {"zone", e.zone},
                                           {"key", e.client_key}, {"status", e.status},
                                           {"decision", e.decision}});
    }

    class LogObserver : public Observer {
    public:
        void record(const LifecycleEvent& e) override {
            {
                std::lock_guard<std::mutex> lk(mu_);
                if (e.outcome == "ok" && !e.dry_run) ctr_.lifecycle_actions++;
                else if (e.outcome == "planned")     ctr_.planned_actions++;
                else if (e.outcome == "failed")      ctr_.service_failures++;
                else if (e.outcome == "blocked")     ctr_.services_blocked++;
            }
            if (e.outcome == "failed" || e.outcome == "blocked") {
                spdlog::error("{}", to_json_line(e, false));
            } else {
                spdlog::debug("{}", to_json_line(e));
            }
        }

        void record(const AdmissionEvent& e) override {
            {
                std::lock_guard<std::mutex> lk(mu_);
                if (e.decision == "static" || e.decision == "proxy") ctr_.admitted++;
                else if (e.decision == "rate_limited")               ctr_.rate_limited++;
                else if (e.decision != "bad_request")                ctr_.unavailable++;
            }
            spdlog::debug("{}", to_json_line(e));
        }

        Counters snapshot() const override {
            std::lock_guard<std::mutex> lk(mu_);
            return ctr_;
        }
    private:
        mutable std::mutex mu_;
        Counters ctr_;
    };

    Observer* make_log_observer() {
        static LogObserver obs; // process-wide singleton
        return &obs;
    }

    void init_logging(bool verbose) {
        auto logger = spdlog::get("dockyard");
        if (!logger) logger = spdlog::stderr_color_mt("dockyard");
        logger->set_pattern("[%^%l%$] %v");
        logger->set_level(verbose ? spdlog::level::debug : spdlog::level::info);
        spdlog::set_default_logger(std::move(logger));
    }

} // namespace dockyard::obs
