#include "proof/prover.hpp"
#include "common/errors.hpp"
#include "common/hex.hpp"
#include "common/debug_control.hpp"

#include <iostream>
#include <filesystem>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <csignal>

#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace typing_proof {

namespace {

double elapsed_ms(std::chrono::steady_clock::time_point start) {
    auto end = std::chrono::steady_clock::now();
    return std::chrono::duration<double, std::milli>(end - start).count();
}

// Closes both ends of a pipe pair that may be partially open
void close_pipe(int fds[2]) {
    for (int i = 0; i < 2; ++i) {
        if (fds[i] >= 0) {
            ::close(fds[i]);
            fds[i] = -1;
        }
    }
}

// Output of one child run
struct ChildResult {
    std::string stdout_text;
    std::string stderr_text;
    int status = 0;
    bool timed_out = false;
};

ChildResult run_child(const std::string& binary,
                      const std::vector<std::string>& args,
                      const HostProverConfig& config) {
    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    if (::pipe(stdout_pipe) < 0 || ::pipe(stderr_pipe) < 0) {
        std::string err = std::strerror(errno);
        close_pipe(stdout_pipe);
        close_pipe(stderr_pipe);
        throw ProverError("failed to create pipes for prover output: " + err);
    }

    // argv must outlive execv in the child; build it before forking
    std::vector<char*> argv;
    argv.push_back(const_cast<char*>(binary.c_str()));
    for (const auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        std::string err = std::strerror(errno);
        close_pipe(stdout_pipe);
        close_pipe(stderr_pipe);
        throw ProverError("failed to fork prover process: " + err);
    }

    if (pid == 0) {
        // Child: route output into the pipes and exec the host
        ::dup2(stdout_pipe[1], STDOUT_FILENO);
        ::dup2(stderr_pipe[1], STDERR_FILENO);
        close_pipe(stdout_pipe);
        close_pipe(stderr_pipe);

        // Keep a caller-provided value if one is already set
        ::setenv("TYPING_PROOF_RECEIPT_KIND", config.receipt_kind.c_str(), 0);
        ::setenv("RISC0_PROVER", config.risc0_prover.c_str(), 0);

        ::execv(binary.c_str(), argv.data());
        std::cerr << "[prover] Failed to exec proving host: " << std::strerror(errno) << std::endl;
        ::_exit(127);
    }

    ::close(stdout_pipe[1]);
    ::close(stderr_pipe[1]);

    ChildResult result;
    auto deadline = std::chrono::steady_clock::now() + config.timeout;
    struct pollfd fds[2];
    fds[0] = {stdout_pipe[0], POLLIN, 0};
    fds[1] = {stderr_pipe[0], POLLIN, 0};
    std::string* sinks[2] = {&result.stdout_text, &result.stderr_text};
    int open_fds = 2;
    char buffer[4096];

    while (open_fds > 0) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            result.timed_out = true;
            break;
        }
        int ready = ::poll(fds, 2, static_cast<int>(remaining.count()));
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            result.timed_out = true;  // unrecoverable: treat like a stuck child
            break;
        }
        if (ready == 0) {
            continue;  // deadline re-checked at loop top
        }
        for (int i = 0; i < 2; ++i) {
            if (fds[i].fd < 0 || fds[i].revents == 0) {
                continue;
            }
            ssize_t n = ::read(fds[i].fd, buffer, sizeof(buffer));
            if (n > 0) {
                sinks[i]->append(buffer, static_cast<size_t>(n));
            } else if (n == 0 || errno != EINTR) {
                ::close(fds[i].fd);
                fds[i].fd = -1;
                --open_fds;
            }
        }
    }

    if (result.timed_out) {
        ::kill(pid, SIGKILL);
    }
    for (int i = 0; i < 2; ++i) {
        if (fds[i].fd >= 0) {
            ::close(fds[i].fd);
        }
    }
    while (::waitpid(pid, &result.status, 0) < 0 && errno == EINTR) {
    }
    return result;
}

} // anonymous namespace

std::string resolve_host_binary(const std::string& explicit_path) {
    if (!explicit_path.empty()) {
        if (!std::filesystem::exists(explicit_path)) {
            throw ProverError("proving host binary not found at " + explicit_path);
        }
        return std::filesystem::absolute(explicit_path).string();
    }

    const char* env_path = std::getenv("TYPING_PROOF_HOST_BIN");
    if (env_path && *env_path) {
        if (!std::filesystem::exists(env_path)) {
            throw ProverError(std::string("TYPING_PROOF_HOST_BIN points to missing file: ") + env_path);
        }
        return env_path;
    }

    char exe_path[4096];
    ssize_t len = ::readlink("/proc/self/exe", exe_path, sizeof(exe_path) - 1);
    if (len > 0) {
        exe_path[len] = '\0';
        std::filesystem::path exe_dir = std::filesystem::path(exe_path).parent_path();

        auto candidate = exe_dir / "typing-proof-host";
        if (std::filesystem::exists(candidate)) {
            return candidate.string();
        }
        candidate = exe_dir / "../risc0/typing_proof/target/release/typing-proof-host";
        if (std::filesystem::exists(candidate)) {
            return std::filesystem::canonical(candidate).string();
        }
    }

    throw ProverError("typing-proof-host binary not found; set TYPING_PROOF_HOST_BIN "
                      "or build it with: cargo build --release -p typing-proof-host");
}

HostProcessProver::HostProcessProver(HostProverConfig config)
    : config_(std::move(config)), binary_(resolve_host_binary(config_.binary_path)) {}

std::vector<std::string> HostProcessProver::build_arguments(const ProofRequest& request) {
    return {
        std::to_string(request.challenge_id),
        hex::encode(request.player.data(), request.player.size()),
        request.prompt,
        hex::encode(request.encoded_replay),
    };
}

ProofArtifact HostProcessProver::prove(const ProofRequest& request) {
    auto start = std::chrono::steady_clock::now();
    std::cout << "[prover] Running " << binary_ << " challenge_id=" << request.challenge_id
              << " events_bytes=" << request.encoded_replay.size() << std::endl;

    ChildResult result = run_child(binary_, build_arguments(request), config_);
    double duration = elapsed_ms(start);

    if (result.timed_out) {
        std::cerr << "[prover] Proving host killed after " << config_.timeout.count() << " ms" << std::endl;
        throw ProverError("prover timed out after " + std::to_string(config_.timeout.count()) + " ms");
    }
    if (!WIFEXITED(result.status) || WEXITSTATUS(result.status) != 0) {
        int exit_code = WIFEXITED(result.status) ? WEXITSTATUS(result.status) : -1;
        std::cerr << "[prover] Proving host failed with exit code: " << exit_code << std::endl;
        if (!result.stderr_text.empty()) {
            std::cerr << "[prover] Proving host stderr:" << std::endl;
            std::cerr << result.stderr_text << std::endl;
        }
        throw ProverError(result.stderr_text.empty()
                              ? "prover exited with code " + std::to_string(exit_code)
                              : result.stderr_text);
    }

    TYPING_PROOF_DEBUG_COUT("[prover] Host output:\n" << result.stdout_text << std::endl);
    TYPING_PROOF_PROFILE_COUT("[prover] Proving host completed in " << duration << " ms" << std::endl);

    return parse_prover_output(result.stdout_text);
}

} // namespace typing_proof
