#include "test_common.hpp"
#include "cli_commands.hpp"
#include <iostream>
#include <sstream>

using namespace pathmon;
using pathmon::test_support::TempDir;

namespace {
struct CoutCapture {
    CoutCapture() : old(std::cout.rdbuf(buffer.rdbuf())) {}
    ~CoutCapture() { std::cout.rdbuf(old); }
    std::string str() const { return buffer.str(); }

    std::ostringstream buffer;
    std::streambuf* old;
};
} // namespace

TEST_CASE("handle_resolve_only skipped without the flag") {
    Options opts;
    REQUIRE_FALSE(cli::handle_resolve_only(opts).has_value());
}

TEST_CASE("handle_resolve_only prints resolved paths") {
    TempDir tmp("cli_resolve");
    fs::create_directories(tmp.path() / "real" / "data");
    if (!test_support::make_dir_link(tmp.path() / "real", tmp.path() / "alias"))
        SKIP("directory links unavailable");

    Options opts;
    opts.resolve_only = true;
    opts.paths = {tmp.path() / "alias" / "data"};
    CoutCapture capture;
    auto rc = cli::handle_resolve_only(opts);
    REQUIRE(rc.has_value());
    REQUIRE(*rc == 0);
    std::string out = capture.str();
    REQUIRE(out.find((tmp.path() / "real" / "data").string()) != std::string::npos);
    REQUIRE(out.find("alias") == std::string::npos);
}

TEST_CASE("handle_monitoring_run requires paths") {
    Options opts;
    REQUIRE(cli::handle_monitoring_run(opts) == 1);
}

TEST_CASE("handle_monitoring_run stops at the runtime limit") {
    TempDir tmp("cli_run");
    Options opts;
    opts.paths = {tmp.path() / "missing"};
    opts.runtime_limit = std::chrono::seconds(1);
    CoutCapture capture;
    auto start = std::chrono::steady_clock::now();
    REQUIRE(cli::handle_monitoring_run(opts) == 0);
    REQUIRE(std::chrono::steady_clock::now() - start >= std::chrono::seconds(1));
    REQUIRE(capture.str().find(" watching") != std::string::npos);
}
