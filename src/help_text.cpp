#include "help_text.hpp"
#include <algorithm>
#include <cstring>
#include <iomanip>
#include <map>
#include <string>
#include <vector>

struct OptionInfo {
    const char* long_flag;
    const char* short_flag;
    const char* arg;
    const char* desc;
    const char* category;
};

void print_help(const char* prog, std::ostream& os) {
    static const std::vector<OptionInfo> opts = {
        {"--repo", "-r", "<path>", "Repository to inspect (default $GIT_DIR or .)", "Basics"},
        {"--config", "-c", "<file>", "Read options and branch policies from YAML or JSON",
         "Basics"},
        {"--git", "", "<path>", "git executable used for signature checks", "Basics"},
        {"--trust-store-mode", "-t", "<mode>",
         "ambient, strict or skip-if-missing (default ambient)", "Policy"},
        {"--log-file", "-l", "<path>", "Audit log (default $REFGATE_LOG_FILE or <repo>/refgate.log)",
         "Logging"},
        {"--log-level", "-L", "<level>", "DEBUG, INFO, WARNING or ERROR", "Logging"},
        {"--json-log", "", "", "Write log entries as JSON", "Logging"},
        {"--syslog", "", "", "Mirror log entries to syslog", "Logging"},
        {"--max-log-size", "", "<bytes>", "Rotate the log above this size (e.g. 10M)",
         "Logging"},
        {"--max-log-files", "", "<n>", "Rotated log files to keep", "Logging"},
        {"--compress-logs", "", "", "Gzip rotated log files", "Logging"},
        {"--help", "-h", "", "Show this message", "Info"},
        {"--version", "-V", "", "Show version", "Info"}};

    std::map<std::string, std::vector<const OptionInfo*>> groups;
    size_t width = 0;
    auto flag_text = [](const OptionInfo& o) {
        std::string flag = "  ";
        if (std::strlen(o.short_flag))
            flag += std::string(o.short_flag) + ", ";
        else
            flag += "    ";
        flag += o.long_flag;
        if (std::strlen(o.arg))
            flag += " " + std::string(o.arg);
        return flag;
    };
    for (const auto& o : opts) {
        groups[o.category].push_back(&o);
        width = std::max(width, flag_text(o).size());
    }

    os << "refgate - branch policy gate for git pushes\n";
    os << "Rejects pushes that break per-branch merge-only or signed-commit rules.\n\n";
    os << "Usage: " << prog << " [options] <ref> <old-commit> <new-commit>   (update hook)\n";
    os << "       " << prog << " [options] < <old> <new> <ref> lines        (pre-receive hook)\n\n";
    const std::vector<std::string> order{"Basics", "Policy", "Logging", "Info"};
    for (const auto& cat : order) {
        if (!groups.count(cat))
            continue;
        os << cat << ":\n";
        for (const auto* o : groups[cat])
            os << std::left << std::setw(static_cast<int>(width) + 2) << flag_text(*o) << o->desc
               << "\n";
        os << "\n";
    }
    os << "Branch keys (git config refgate.<branch>.<key>, or branches.<branch>.<key> in the\n"
          "config file): enforceMergeOnly, enforceAuthOnly, authTrustStorePath,\n"
          "authTrustStoreMode.\n";
}
