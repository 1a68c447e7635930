/**
 * Typing Proof Server - Main Entry Point
 * 
 * Socket server that validates typing-game submissions, obtains a proof from
 * the proving host, checks the proof is bound to the submission and returns
 * the leaderboard handoff.
 * 
 * Usage:
 *   ./typing_proof_server --tcp 127.0.0.1:5556
 *   ./typing_proof_server --unix /tmp/typing-proof.sock --config server.json
 *   
 * Environment Variables:
 *   TYPING_PROOF_HOST_BIN - Path to the proving host binary
 *   TYPING_PROOF_PROVER   - "host" (default) or "reference"
 *   TYPING_PROOF_DEBUG    - Enable debug output
 *   (see config/config.hpp for the full list)
 */

#include <iostream>
#include <memory>
#include <string>
#include <csignal>

#include "server.hpp"
#include "handler.hpp"
#include "pipeline.hpp"
#include "common/errors.hpp"
#include "config/config.hpp"
#include "prompt/normalizer.hpp"

using namespace typing_proof;
using namespace typing_proof::proof_server;

// Global server pointer for signal handling
static Server* g_server = nullptr;

void signal_handler(int sig) {
    std::cout << "\n[main] Received signal " << sig << ", stopping server..." << std::endl;
    if (g_server) {
        g_server->stop();
    }
}

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " [OPTIONS]" << std::endl;
    std::cerr << std::endl;
    std::cerr << "Options:" << std::endl;
    std::cerr << "  --tcp HOST:PORT    Listen on TCP socket (e.g., 127.0.0.1:5556)" << std::endl;
    std::cerr << "  --unix PATH        Listen on Unix socket (e.g., /tmp/typing-proof.sock)" << std::endl;
    std::cerr << "  --config PATH      Load settings from a JSON file" << std::endl;
    std::cerr << "  --print-config     Print the resolved configuration and exit" << std::endl;
    std::cerr << "  --help             Show this help message" << std::endl;
    std::cerr << std::endl;
    std::cerr << "Environment Variables:" << std::endl;
    std::cerr << "  TYPING_PROOF_HOST_BIN      Proving host binary" << std::endl;
    std::cerr << "  TYPING_PROOF_PROVER        host | reference" << std::endl;
    std::cerr << "  CHALLENGE_ID               Current challenge id" << std::endl;
    std::cerr << "  CHALLENGE_PROMPT           Current challenge prompt" << std::endl;
    std::cerr << "  TYPING_PROOF_DEBUG         Enable debug output" << std::endl;
}

static std::unique_ptr<Prover> make_prover(const ServerConfig& config) {
    if (config.prover_kind == ProverKind::Reference) {
        std::cout << "Prover: reference (unsealed, development only)" << std::endl;
        return std::make_unique<ReferenceProver>();
    }
    auto prover = std::make_unique<HostProcessProver>(config.host_prover);
    std::cout << "Prover: " << prover->binary() << std::endl;
    return prover;
}

int main(int argc, char* argv[]) {
    std::cout << "========================================" << std::endl;
    std::cout << "Typing Proof Server" << std::endl;
    std::cout << "========================================" << std::endl;

    // Parse command line arguments
    std::string mode;
    std::string address;
    std::string config_path;
    bool print_config = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--tcp") {
            if (i + 1 >= argc) {
                std::cerr << "Error: --tcp requires HOST:PORT argument" << std::endl;
                return 1;
            }
            mode = "tcp";
            address = argv[++i];
        } else if (arg == "--unix") {
            if (i + 1 >= argc) {
                std::cerr << "Error: --unix requires PATH argument" << std::endl;
                return 1;
            }
            mode = "unix";
            address = argv[++i];
        } else if (arg == "--config") {
            if (i + 1 >= argc) {
                std::cerr << "Error: --config requires PATH argument" << std::endl;
                return 1;
            }
            config_path = argv[++i];
        } else if (arg == "--print-config") {
            print_config = true;
        } else {
            std::cerr << "Error: Unknown option: " << arg << std::endl;
            print_usage(argv[0]);
            return 1;
        }
    }

    ServerConfig config;
    std::unique_ptr<Prover> prover;
    try {
        config = ServerConfig::resolve(config_path);
        if (print_config) {
            std::cout << config.to_json().dump(2) << std::endl;
            return 0;
        }
        prover = make_prover(config);
    } catch (const ConfigError& e) {
        std::cerr << "Error: invalid configuration: " << e.what() << std::endl;
        return 1;
    } catch (const ProverError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    std::cout << "Challenge: " << config.challenge.id << " \"" << config.challenge.prompt << "\"" << std::endl;
    std::cout << "Prompt hash: " << prompt_hash_hex(config.challenge.prompt) << std::endl;
    std::cout << "Timing enforced: " << (config.validator.enforce_timing ? "yes" : "no") << std::endl;
    std::cout << std::endl;

    // Default to TCP if not specified
    if (mode.empty()) {
        mode = "tcp";
        address = "127.0.0.1:5556";
        std::cout << "No mode specified, using default: --tcp " << address << std::endl;
    }

    SubmissionPipeline pipeline(RequestValidator(config.validator),
                                BindingChecker(config.binding),
                                *prover,
                                config.verifier_selector_hex);
    RequestRouter router(pipeline, config.challenge);

    // Create server
    Server server(config.validator.max_body_bytes);
    g_server = &server;

    // Set up signal handlers
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    server.set_request_handler([&router](const ServerRequest& request) {
        return router.handle(request);
    });

    // Start listening
    bool ok = false;
    if (mode == "tcp") {
        // Parse HOST:PORT
        size_t colon = address.find(':');
        if (colon == std::string::npos) {
            std::cerr << "Error: Invalid TCP address, expected HOST:PORT" << std::endl;
            return 1;
        }
        std::string host = address.substr(0, colon);
        int port = 0;
        try {
            port = std::stoi(address.substr(colon + 1));
        } catch (const std::exception&) {
            port = -1;
        }
        if (port <= 0 || port > 65535) {
            std::cerr << "Error: Invalid TCP port in " << address << std::endl;
            return 1;
        }
        ok = server.listen_tcp(host, static_cast<uint16_t>(port));
    } else if (mode == "unix") {
        ok = server.listen_unix(address);
    }

    if (!ok) {
        std::cerr << "Failed to start server" << std::endl;
        return 1;
    }

    std::cout << std::endl;
    std::cout << "Server ready. Press Ctrl+C to stop." << std::endl;
    std::cout << std::endl;

    // Run server (blocks until stopped)
    server.run();

    std::cout << "Server stopped." << std::endl;
    return 0;
}
