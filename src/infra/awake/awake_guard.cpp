#include "awake_guard.hpp"

#include <chrono>
#include <string>
#include <thread>
#include <utility>
#include <vector>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

#ifdef _WIN32
    #include <windows.h>
#else
    #include <cerrno>
    #include <csignal>
    #include <fcntl.h>
    #include <spawn.h>
    #include <sys/wait.h>
    #include <unistd.h>
extern char** environ;
#endif

namespace pcopy::infra {

std::string_view to_string(AwakeScope scope) {
    switch (scope) {
        case AwakeScope::Disabled:    return "disabled";
        case AwakeScope::DisplayOnly: return "display";
        case AwakeScope::System:      return "system";
    }
    return "unknown";
}

AwakeLease::AwakeLease(PowerManager& manager, std::uint64_t token) noexcept
    : manager_(&manager), token_(token) {}

AwakeLease::~AwakeLease() {
    release();
}

AwakeLease::AwakeLease(AwakeLease&& other) noexcept
    : manager_(std::exchange(other.manager_, nullptr))
    , token_(std::exchange(other.token_, 0)) {}

AwakeLease& AwakeLease::operator=(AwakeLease&& other) noexcept {
    if (this != &other) {
        release();
        manager_ = std::exchange(other.manager_, nullptr);
        token_ = std::exchange(other.token_, 0);
    }
    return *this;
}

void AwakeLease::release() noexcept {
    if (auto* manager = std::exchange(manager_, nullptr)) {
        manager->release(token_);
        spdlog::debug("Released keep-awake lease");
    }
}

AwakeLease acquire_awake(AwakeScope scope, PowerManager& manager, std::string_view reason) {
    if (scope == AwakeScope::Disabled) {
        return AwakeLease{};
    }
    auto token = manager.acquire(scope, reason);
    if (!token) {
        spdlog::warn("Could not keep the {} awake, continuing without it: {}",
                     scope == AwakeScope::DisplayOnly ? "display" : "system",
                     token.error().message);
        return AwakeLease{};
    }
    spdlog::debug("Acquired keep-awake lease ({})", to_string(scope));
    return AwakeLease{manager, *token};
}

namespace {

#ifdef _WIN32

class SystemPowerManager final : public PowerManager {
public:
    Result<std::uint64_t> acquire(AwakeScope scope, std::string_view) override {
        EXECUTION_STATE flags = ES_CONTINUOUS | ES_SYSTEM_REQUIRED;
        if (scope == AwakeScope::DisplayOnly) {
            flags = ES_CONTINUOUS | ES_DISPLAY_REQUIRED;
        }
        if (SetThreadExecutionState(flags) == 0) {
            return std::unexpected(make_error(ErrorCode::UnsupportedOperation,
                                              "SetThreadExecutionState refused"));
        }
        return 1;
    }

    void release(std::uint64_t) noexcept override {
        SetThreadExecutionState(ES_CONTINUOUS);
    }
};

#else

// Runs an inhibitor helper for the lease lifetime. The helper also watches
// our pid, so it goes away even if this process is killed.
class SystemPowerManager final : public PowerManager {
public:
    Result<std::uint64_t> acquire(AwakeScope scope, std::string_view reason) override {
        const auto self = std::to_string(::getpid());
        std::vector<std::string> argv;
#ifdef __APPLE__
        argv = {"caffeinate", scope == AwakeScope::DisplayOnly ? "-d" : "-is", "-w", self};
#else
        argv = {"systemd-inhibit",
                scope == AwakeScope::DisplayOnly ? "--what=idle" : "--what=sleep:idle",
                "--who=pcopy",
                fmt::format("--why={}", reason),
                "--mode=block",
                "tail", fmt::format("--pid={}", self), "-f", "/dev/null"};
#endif
        std::vector<char*> raw;
        raw.reserve(argv.size() + 1);
        for (auto& arg : argv) raw.push_back(arg.data());
        raw.push_back(nullptr);

        posix_spawn_file_actions_t actions;
        posix_spawn_file_actions_init(&actions);
        posix_spawn_file_actions_addopen(&actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0);
        posix_spawn_file_actions_addopen(&actions, STDOUT_FILENO, "/dev/null", O_WRONLY, 0);
        posix_spawn_file_actions_addopen(&actions, STDERR_FILENO, "/dev/null", O_WRONLY, 0);

        pid_t pid = 0;
        const int rc = ::posix_spawnp(&pid, raw[0], &actions, nullptr, raw.data(), environ);
        posix_spawn_file_actions_destroy(&actions);
        if (rc != 0) {
            return std::unexpected(make_system_error(ErrorCode::UnsupportedOperation,
                                                     "Cannot start", argv[0], rc));
        }

        // A helper that is refused by the OS exits right away
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        int status = 0;
        if (::waitpid(pid, &status, WNOHANG) == pid) {
            return std::unexpected(make_error(ErrorCode::UnsupportedOperation,
                fmt::format("{} exited with status {}", argv[0],
                            WIFEXITED(status) ? WEXITSTATUS(status) : -1)));
        }
        return static_cast<std::uint64_t>(pid);
    }

    void release(std::uint64_t token) noexcept override {
        const auto pid = static_cast<pid_t>(token);
        ::kill(pid, SIGTERM);
        int status = 0;
        while (::waitpid(pid, &status, 0) == -1 && errno == EINTR) {
        }
    }
};

#endif

} // namespace

PowerManager& system_power_manager() {
    static SystemPowerManager manager;
    return manager;
}

} // namespace pcopy::infra
