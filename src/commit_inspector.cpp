#include "commit_inspector.hpp"
#include <map>
#include <utility>
#include <vector>
#include "errors.hpp"
#include "logger.hpp"
#include "system_utils.hpp"

namespace git {

const char* to_string(VerificationVerdict v) {
    switch (v) {
    case VerificationVerdict::Good:
        return "good";
    case VerificationVerdict::Bad:
        return "bad";
    case VerificationVerdict::Unverifiable:
        return "unverifiable";
    case VerificationVerdict::NoSignature:
        return "unsigned";
    }
    return "unknown";
}

VerificationVerdict parse_verification_code(const std::string& code) {
    if (code == "G")
        return VerificationVerdict::Good;
    if (code == "B")
        return VerificationVerdict::Bad;
    if (code == "U")
        return VerificationVerdict::Unverifiable;
    if (code == "N")
        return VerificationVerdict::NoSignature;
    throw CorruptDataError("unexpected signature status '" + code + "'");
}

static std::string trim(const std::string& s) {
    auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos)
        return "";
    auto e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

// Commit ids reach us from the push; only full hex object ids are accepted.
static git_oid parse_commit_id(const std::string& commit) {
    git_oid oid;
    if (commit.size() != GIT_OID_HEXSZ ||
        commit.find_first_not_of("0123456789abcdefABCDEF") != std::string::npos ||
        git_oid_fromstr(&oid, commit.c_str()) != 0)
        throw CorruptDataError("malformed commit id '" + commit + "'");
    return oid;
}

RepositoryInspector::RepositoryInspector(fs::path repo, std::string git_executable)
    : repo_path_(std::move(repo)), git_(std::move(git_executable)) {}

git_repository* RepositoryInspector::repository() {
    if (!repo_) {
        std::string err;
        repo_ = open_repository(repo_path_, &err);
        if (!repo_)
            throw BackendError("cannot open repository " + repo_path_.string() + ": " + err);
    }
    return repo_.get();
}

std::size_t RepositoryInspector::parent_count(const std::string& commit) {
    git_oid oid = parse_commit_id(commit);
    git_object* raw = nullptr;
    int rc = git_object_lookup(&raw, repository(), &oid, GIT_OBJECT_ANY);
    if (rc != 0) {
        const git_error* e = git_error_last();
        // A present but unparseable object is corrupt data; everything else
        // means the object store could not answer.
        if (rc != GIT_ENOTFOUND && e &&
            (e->klass == GIT_ERROR_OBJECT || e->klass == GIT_ERROR_INVALID))
            throw CorruptDataError("cannot parse object " + commit + ": " + last_error_message());
        throw BackendError("cannot read object " + commit + ": " + last_error_message());
    }
    object_ptr obj(raw);
    if (git_object_type(obj.get()) != GIT_OBJECT_COMMIT)
        throw CorruptDataError(std::string("object ") + commit + " is a " +
                               git_object_type2string(git_object_type(obj.get())) +
                               ", not a commit");
    auto* c = reinterpret_cast<git_commit*>(obj.get());
    std::size_t parents = git_commit_parentcount(c);
    log_debug("Inspected commit", {{"commit", commit}, {"parents", std::to_string(parents)}});
    return parents;
}

VerificationVerdict RepositoryInspector::verify(const std::string& commit,
                                                const std::optional<fs::path>& trust_store) {
    parse_commit_id(commit);
    std::vector<std::string> argv{git_, "-C", repo_path_.string(), "log", "-1", "--format=%G?",
                                  commit, "--"};
    std::map<std::string, std::string> env{{"LC_ALL", "C"}};
    if (trust_store)
        env["GNUPGHOME"] = trust_store->string();
    std::string spawn_error;
    auto result = procutil::run_process(argv, env, &spawn_error);
    if (!result)
        throw BackendError("cannot run " + git_ + ": " + spawn_error);
    if (result->exit_code != 0 || !result->err.empty())
        throw BackendError("signature query for " + commit + " failed (exit " +
                           std::to_string(result->exit_code) + "): " + trim(result->err));
    VerificationVerdict verdict = parse_verification_code(trim(result->out));
    log_debug("Verified commit signature",
              {{"commit", commit},
               {"verdict", to_string(verdict)},
               {"trust_store", trust_store ? trust_store->string() : std::string("<ambient>")}});
    return verdict;
}

} // namespace git
