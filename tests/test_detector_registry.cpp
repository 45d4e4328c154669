#include <catch2/catch_test_macros.hpp>

#include "detectors/detector_registry.hpp"
#include "detectors/process_state_detector.hpp"
#include "detectors/stall_detector.hpp"
#include "detectors/stdin_detector.hpp"
#include "fake_sources.hpp"

#include <chrono>
#include <climits>
#include <cstdlib>
#include <fcntl.h>
#include <memory>
#include <signal.h>
#include <string>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>
#include <vector>

using namespace std::chrono_literals;

namespace {

class FixedDetector : public AttentionDetector {
public:
    FixedDetector(std::string_view name, std::optional<AttentionReason> reason)
        : name_(name), reason_(std::move(reason)) {}

    std::string_view name() const override { return name_; }
    std::optional<AttentionReason> check(const Task&, const PollContext&) const override {
        return reason_;
    }

private:
    std::string_view name_;
    std::optional<AttentionReason> reason_;
};

} // namespace

TEST_CASE("DetectorRegistry", "[registry]") {
    PollContext ctx{.pid = getpid(), .last_check = {}, .last_cpu_time = std::nullopt, .idle_duration = 0ms};

    SECTION("DefaultHasStateThenStall") {
        auto registry = DetectorRegistry::create_default();
        REQUIRE(registry.size() == 2);

        auto& ds = registry.detectors();
        REQUIRE(ds[0]->name() == "process_state");
        REQUIRE(ds[1]->name() == "stall");
        REQUIRE(dynamic_cast<const ProcessStateDetector*>(ds[0].get()) != nullptr);

        auto* stall = dynamic_cast<const StallDetector*>(ds[1].get());
        REQUIRE(stall != nullptr);
        REQUIRE(stall->timeout() == 600s);

        for (const auto& d : ds) {
            REQUIRE(dynamic_cast<const StdinDetector*>(d.get()) == nullptr);
        }
    }

    SECTION("DefaultFlagsChildSleepingOnPty") {
        int master = posix_openpt(O_RDWR | O_NOCTTY);
        if (master < 0 || grantpt(master) != 0 || unlockpt(master) != 0) {
            if (master >= 0) ::close(master);
            SKIP("no pseudo-terminal support");
        }
        std::string slave_path = ptsname(master);

        pid_t child = fork();
        REQUIRE(child >= 0);
        if (child == 0) {
            int slave = ::open(slave_path.c_str(), O_RDWR | O_NOCTTY);
            if (slave < 0) _exit(1);
            ::dup2(slave, STDIN_FILENO);
            sleep(10);
            _exit(0);
        }
        usleep(100000);

        auto registry = DetectorRegistry::create_default();
        PollContext waiting{.pid = child, .last_check = {}, .last_cpu_time = std::nullopt, .idle_duration = 6s};
        auto findings = registry.check_all(task_aged(15s), waiting);

        kill(child, SIGTERM);
        waitpid(child, nullptr, 0);
        ::close(master);

        REQUIRE(findings.size() == 1);
        REQUIRE(findings[0].detector == "process_state");
        REQUIRE(findings[0].reason == AttentionReason(WaitingForInput{}));
    }

    SECTION("DefaultOnMissingProcessIsSilent") {
        auto registry = DetectorRegistry::create_default();
        PollContext gone{.pid = INT_MAX, .last_check = {}, .last_cpu_time = 1000, .idle_duration = 100000s};
        REQUIRE_FALSE(registry.check(task_aged(1000s), gone).has_value());
        REQUIRE(registry.check_all(task_aged(1000s), gone).empty());
    }

    SECTION("EveryVariantSilentWhenReadsFail") {
        DetectorRegistry::Sources sources{
            .stat_reader = std::make_shared<FakeStatReader>(std::unexpected(ProbeError::NotFound)),
            .fd_probe = std::make_shared<FakeFdProbe>(std::unexpected(ProbeError::NotFound)),
            .stdin_probe = std::make_shared<FakeStdinProbe>(false),
        };
        Config::Detectors cfg;
        cfg.stdin_probe.enabled = true;
        auto registry = DetectorRegistry::from_config(cfg, sources);
        REQUIRE(registry.size() == 3);

        PollContext stale{.pid = 4321, .last_check = {}, .last_cpu_time = 1000, .idle_duration = 100000s};
        REQUIRE(registry.check_all(task_aged(1000s), stale).empty());
    }

    SECTION("FirstVerdictWins") {
        DetectorRegistry registry({
            std::make_shared<FixedDetector>("quiet", std::nullopt),
            std::make_shared<FixedDetector>("custom", CustomReason{"needs review"}),
            std::make_shared<FixedDetector>("stalled", ProcessStalled{}),
        });
        auto reason = registry.check(task_aged(1s), ctx);
        REQUIRE(reason.has_value());
        REQUIRE(describe(*reason) == "needs review");
    }

    SECTION("CheckAllKeepsOrder") {
        DetectorRegistry registry({
            std::make_shared<FixedDetector>("stalled", ProcessStalled{}),
            std::make_shared<FixedDetector>("quiet", std::nullopt),
            std::make_shared<FixedDetector>("input", WaitingForInput{}),
        });
        auto findings = registry.check_all(task_aged(1s), ctx);
        REQUIRE(findings.size() == 2);
        REQUIRE(findings[0].detector == "stalled");
        REQUIRE(findings[0].reason == AttentionReason(ProcessStalled{}));
        REQUIRE(findings[1].detector == "input");
        REQUIRE(findings[1].reason == AttentionReason(WaitingForInput{}));
    }

    SECTION("EmptyRegistry") {
        DetectorRegistry registry(std::vector<DetectorRegistry::DetectorPtr>{});
        REQUIRE(registry.empty());
        REQUIRE_FALSE(registry.check(task_aged(1s), ctx).has_value());
    }

    SECTION("NullEntriesDropped") {
        DetectorRegistry registry({nullptr, std::make_shared<FixedDetector>("a", std::nullopt)});
        REQUIRE(registry.size() == 1);
    }

    SECTION("CopiesShareDetectors") {
        auto a = DetectorRegistry::create_default();
        auto b = a;
        REQUIRE(a.detectors()[0].get() == b.detectors()[0].get());
    }

    SECTION("FromConfigRespectsSwitchesAndOrder") {
        auto sources = DetectorRegistry::Sources{
            .stat_reader = std::make_shared<FakeStatReader>(make_stat('S')),
            .fd_probe = std::make_shared<FakeFdProbe>("/dev/pts/1"),
            .stdin_probe = std::make_shared<FakeStdinProbe>(true),
        };

        Config::Detectors cfg;
        REQUIRE(DetectorRegistry::from_config(cfg, sources).size() == 2);

        cfg.process_state.enabled = false;
        cfg.stdin_probe.enabled = true;
        auto registry = DetectorRegistry::from_config(cfg, sources);
        REQUIRE(registry.size() == 2);
        REQUIRE(registry.detectors()[0]->name() == "stall");
        REQUIRE(registry.detectors()[1]->name() == "stdin");

        cfg.stall.timeout_s = 120;
        registry = DetectorRegistry::from_config(cfg, sources);
        auto* stall = dynamic_cast<const StallDetector*>(registry.detectors()[0].get());
        REQUIRE(stall != nullptr);
        REQUIRE(stall->timeout() == 120s);
    }

    SECTION("StdinEnabledWithoutProbeIsSkipped") {
        auto sources = DetectorRegistry::Sources{
            .stat_reader = std::make_shared<FakeStatReader>(make_stat('S')),
            .fd_probe = std::make_shared<FakeFdProbe>("/dev/pts/1"),
            .stdin_probe = nullptr,
        };
        Config::Detectors cfg;
        cfg.stdin_probe.enabled = true;
        REQUIRE(DetectorRegistry::from_config(cfg, sources).size() == 2);
    }

    SECTION("ConcurrentChecksAgree") {
        auto sources = DetectorRegistry::Sources{
            .stat_reader = std::make_shared<FakeStatReader>(make_stat('S', 500, 500)),
            .fd_probe = std::make_shared<FakeFdProbe>("/dev/pts/3"),
            .stdin_probe = nullptr,
        };
        auto registry = DetectorRegistry::from_config(Config::Detectors{}, sources);
        auto task = task_aged(700s);
        PollContext both{.pid = 1, .last_check = {}, .last_cpu_time = 1000, .idle_duration = 650s};

        std::vector<std::size_t> counts(8);
        {
            std::vector<std::jthread> threads;
            for (std::size_t t = 0; t < counts.size(); ++t) {
                threads.emplace_back([&, t] {
                    for (int i = 0; i < 200; ++i) {
                        counts[t] += registry.check_all(task, both).size();
                    }
                });
            }
        }
        for (auto c : counts) REQUIRE(c == 400);
    }
}
