#include <catch2/catch_test_macros.hpp>

#include "platform/linux/lsof_stdin_probe.hpp"

#include <filesystem>
#include <fstream>
#include <signal.h>
#include <string>
#include <unistd.h>

namespace {

// Executable shell script standing in for lsof.
struct FakeTool {
    std::filesystem::path path;

    explicit FakeTool(const std::string& body) {
        path = std::filesystem::temp_directory_path() /
               ("pa_fake_lsof_" + std::to_string(getpid()));
        std::ofstream(path) << "#!/bin/sh\n" << body << "\n";
        std::filesystem::permissions(path, std::filesystem::perms::owner_all);
    }

    ~FakeTool() { std::filesystem::remove(path); }
};

} // namespace

TEST_CASE("lsof_reports_descriptor", "[lsof]") {

    SECTION("HeaderAndRow") {
        REQUIRE(lsof_reports_descriptor(
            "COMMAND   PID USER   FD   TYPE DEVICE SIZE/OFF NODE NAME\n"
            "claude  4321 dev    0u   CHR  136,3      0t0    6 /dev/pts/3\n"));
    }

    SECTION("NoTrailingNewline") {
        REQUIRE(lsof_reports_descriptor("HEADER\nrow"));
    }

    SECTION("HeaderOnlyOrEmpty") {
        REQUIRE_FALSE(lsof_reports_descriptor("COMMAND PID USER FD TYPE DEVICE SIZE/OFF NODE NAME\n"));
        REQUIRE_FALSE(lsof_reports_descriptor(""));
    }
}

TEST_CASE("LsofStdinProbe", "[lsof]") {

    SECTION("PassesPidAndDescriptorFilter") {
        FakeTool tool("echo \"$@\"");
        LsofStdinProbe probe(tool.path.string());
        auto out = probe.query(4321);
        REQUIRE(out.has_value());
        REQUIRE(*out == "-p 4321 -a -d 0\n");
        REQUIRE_FALSE(probe.reading_stdin(4321));
    }

    SECTION("MultiLineOutputMeansReading") {
        FakeTool tool("echo header; echo row");
        LsofStdinProbe probe(tool.path.string());
        REQUIRE(probe.reading_stdin(4321));
    }

    SECTION("NonZeroExitMeansNotReading") {
        FakeTool tool("echo header; echo row; exit 1");
        LsofStdinProbe probe(tool.path.string());
        REQUIRE_FALSE(probe.query(4321).has_value());
        REQUIRE_FALSE(probe.reading_stdin(4321));
    }

    SECTION("MissingToolMeansNotReading") {
        LsofStdinProbe probe("/nonexistent/proc-attention-lsof");
        auto out = probe.query(getpid());
        REQUIRE_FALSE(out.has_value());
        REQUIRE_FALSE(probe.reading_stdin(getpid()));
    }

    SECTION("ToolRunsWithSignalsUnblocked") {
        sigset_t block, old;
        sigemptyset(&block);
        sigaddset(&block, SIGINT);
        sigaddset(&block, SIGTERM);
        REQUIRE(sigprocmask(SIG_BLOCK, &block, &old) == 0);

        FakeTool tool("grep '^SigBlk:' /proc/$$/status");
        LsofStdinProbe probe(tool.path.string());
        auto out = probe.query(4321);

        sigprocmask(SIG_SETMASK, &old, nullptr);

        REQUIRE(out.has_value());
        REQUIRE(*out == "SigBlk:\t0000000000000000\n");
    }

    SECTION("InvalidPid") {
        FakeTool tool("echo header; echo row");
        LsofStdinProbe probe(tool.path.string());
        REQUIRE_FALSE(probe.reading_stdin(0));
    }
}
