#include "test_common.hpp"

using namespace refgate::test_support;

TEST_CASE("run_process captures output and exit code") {
    auto result = procutil::run_process({"sh", "-c", "echo out; echo err >&2; exit 3"}, {});
    REQUIRE(result);
    REQUIRE(result->out == "out\n");
    REQUIRE(result->err == "err\n");
    REQUIRE(result->exit_code == 3);
}

TEST_CASE("run_process environment overrides stay in the child") {
    EnvGuard guard("REFGATE_TEST_VAR");
    setenv("REFGATE_TEST_VAR", "parent", 1);
    auto result = procutil::run_process({"sh", "-c", "printf %s \"$REFGATE_TEST_VAR\""},
                                        {{"REFGATE_TEST_VAR", "child"}});
    REQUIRE(result);
    REQUIRE(result->out == "child");
    REQUIRE(std::string(std::getenv("REFGATE_TEST_VAR")) == "parent");

    result = procutil::run_process({"sh", "-c", "printf %s \"$REFGATE_TEST_VAR\""}, {});
    REQUIRE(result);
    REQUIRE(result->out == "parent");
}

TEST_CASE("run_process reports exec failure") {
    auto result = procutil::run_process({"refgate-no-such-program"}, {});
    REQUIRE(result);
    REQUIRE(result->exit_code == 127);
    REQUIRE_FALSE(result->err.empty());
    std::string error;
    REQUIRE_FALSE(procutil::run_process({}, {}, &error));
    REQUIRE_FALSE(error.empty());
}

TEST_CASE("run_process reports signals") {
    auto result = procutil::run_process({"sh", "-c", "kill -TERM $$"}, {});
    REQUIRE(result);
    REQUIRE(result->exit_code == 128 + 15);
}

TEST_CASE("run_process stdin is empty") {
    auto result = procutil::run_process({"cat"}, {});
    REQUIRE(result);
    REQUIRE(result->exit_code == 0);
    REQUIRE(result->out.empty());
}

TEST_CASE("build_environment replaces existing entries") {
    EnvGuard guard("REFGATE_TEST_VAR");
    setenv("REFGATE_TEST_VAR", "old", 1);
    auto env = procutil::build_environment({{"REFGATE_TEST_VAR", "new"}});
    int matches = 0;
    for (const auto& e : env) {
        if (e.rfind("REFGATE_TEST_VAR=", 0) == 0) {
            ++matches;
            REQUIRE(e == "REFGATE_TEST_VAR=new");
        }
    }
    REQUIRE(matches == 1);
}

TEST_CASE("UniqueFd closes on reset") {
    int fds[2];
    REQUIRE(pipe(fds) == 0);
    procutil::UniqueFd r(fds[0]);
    procutil::UniqueFd w(fds[1]);
    procutil::UniqueFd moved(std::move(w));
    REQUIRE_FALSE(w);
    REQUIRE(moved);
    moved.reset();
    char c;
    REQUIRE(read(r.get(), &c, 1) == 0);
}
