#include "hook.hpp"
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <istream>
#include <map>
#include <ostream>
#include <random>
#include <sstream>
#include <utility>
#include "errors.hpp"
#include "logger.hpp"

namespace hook {

Backends::Backends(ConfigFactory config, InspectorFactory inspector)
    : make_config_(std::move(config)), make_inspector_(std::move(inspector)) {}

policy::ConfigSource& Backends::config() {
    if (!config_) {
        config_ = make_config_();
        if (!config_)
            throw InternalError("no configuration source available");
    }
    return *config_;
}

git::CommitInspector& Backends::inspector() {
    if (!inspector_) {
        inspector_ = make_inspector_();
        if (!inspector_)
            throw InternalError("no commit inspector available");
    }
    return *inspector_;
}

std::string make_correlation_id() {
    std::random_device rd;
    auto seed = static_cast<std::uint64_t>(rd()) << 32 ^ static_cast<std::uint64_t>(rd()) ^
                static_cast<std::uint64_t>(
                    std::chrono::steady_clock::now().time_since_epoch().count());
    std::mt19937_64 gen(seed);
    char buf[17];
    std::snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(gen()));
    return buf;
}

std::optional<policy::RefUpdate> parse_update_line(const std::string& line) {
    std::istringstream iss(line);
    policy::RefUpdate update;
    std::string extra;
    if (!(iss >> update.old_commit >> update.new_commit >> update.ref_name) || (iss >> extra))
        return std::nullopt;
    return update;
}

RefResult internal_failure(const std::string& what, const std::string& kind,
                           const std::string& ref) {
    RefResult result;
    result.outcome = Outcome::Failed;
    result.correlation_id = make_correlation_id();
    std::map<std::string, std::string> fields{
        {"correlation_id", result.correlation_id}, {"kind", kind}, {"detail", what}};
    if (!ref.empty())
        fields["ref"] = ref;
    log_error("Internal error, update refused", fields);
    result.message = "refgate: internal error (reference " + result.correlation_id + ")";
    return result;
}

static std::map<std::string, std::string> audit_fields(const policy::RefUpdate& update,
                                                       const policy::BranchPolicy& pol) {
    std::string enforced;
    if (pol.merge_only)
        enforced = "merge-only";
    if (pol.auth_only)
        enforced += enforced.empty() ? "auth-only" : ",auth-only";
    return {{"ref", update.ref_name},
            {"old", update.old_commit},
            {"new", update.new_commit},
            {"policy", enforced.empty() ? "none" : enforced}};
}

RefResult check_ref(const policy::RefUpdate& update, Backends& backends,
                    policy::TrustStoreMode default_mode) {
    try {
        if (!policy::branch_short_name(update.ref_name)) {
            log_info("Update accepted", {{"ref", update.ref_name},
                                         {"old", update.old_commit},
                                         {"new", update.new_commit},
                                         {"policy", "none"}});
            return RefResult{};
        }
        policy::PolicyResolver resolver(backends.config(), default_mode);
        policy::BranchPolicy pol = resolver.resolve(update.ref_name);
        auto fields = audit_fields(update, pol);
        if (!pol.enforcing()) {
            log_info("Update accepted", fields);
            return RefResult{};
        }
        policy::Verdict verdict = policy::evaluate(update, pol, backends.inspector());
        if (verdict.accepted) {
            log_info("Update accepted", fields);
            return RefResult{};
        }
        fields["reason"] = verdict.reason;
        log_info("Update rejected", fields);
        RefResult result;
        result.outcome = Outcome::Rejected;
        result.message = "refgate: update rejected: " + verdict.reason;
        return result;
    } catch (const GateError& e) {
        return internal_failure(e.what(), e.kind(), update.ref_name);
    } catch (const std::exception& e) {
        return internal_failure(e.what(), "internal", update.ref_name);
    }
}

int run_update(const policy::RefUpdate& update, Backends& backends,
               policy::TrustStoreMode default_mode, std::ostream& err) {
    RefResult result = check_ref(update, backends, default_mode);
    if (result.outcome == Outcome::Accepted)
        return 0;
    err << result.message << std::endl;
    return 1;
}

int run_pre_receive(std::istream& in, Backends& backends, policy::TrustStoreMode default_mode,
                    std::ostream& err) {
    bool failed = false;
    std::string line;
    while (std::getline(in, line)) {
        if (line.find_first_not_of(" \t\r") == std::string::npos)
            continue;
        RefResult result;
        if (auto update = parse_update_line(line))
            result = check_ref(*update, backends, default_mode);
        else
            result = internal_failure("malformed update line: " + line, "input");
        if (result.outcome != Outcome::Accepted) {
            err << result.message << std::endl;
            failed = true;
        }
    }
    return failed ? 1 : 0;
}

} // namespace hook
