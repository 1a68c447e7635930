/**
 * Batch Re-scoring Utility
 * 
 * Recomputes score, wpm, accuracy and duration for every submission in a
 * JSON corpus and reports entries whose recorded values disagree with the
 * scoring engine. Exit status 0 when every entry matches, 2 when any entry
 * diverged or could not be scored.
 * 
 * Usage:
 *   ./typing_proof_rescore submissions.json [--json]
 * 
 * The input is either an array of entries or {"submissions": [...]}; see
 * scoring/rescore.hpp for the entry format.
 */

#include <iostream>
#include <fstream>
#include <chrono>
#include <string>
#include <nlohmann/json.hpp>

#include "scoring/rescore.hpp"
#include "common/debug_control.hpp"

using namespace typing_proof;

int main(int argc, char* argv[]) {
    if (argc < 2 || argc > 3) {
        std::cerr << "Usage: " << argv[0] << " <submissions.json> [--json]" << std::endl;
        return 1;
    }

    const std::string input_path = argv[1];
    bool json_output = false;
    if (argc == 3) {
        if (std::string(argv[2]) != "--json") {
            std::cerr << "Error: Unknown option: " << argv[2] << std::endl;
            return 1;
        }
        json_output = true;
    }

    try {
        std::ifstream f(input_path);
        if (!f.is_open()) {
            throw std::runtime_error("Could not open submissions file: " + input_path);
        }
        nlohmann::json doc = nlohmann::json::parse(f);
        const nlohmann::json& entries = doc.is_object() && doc.contains("submissions")
                                            ? doc["submissions"] : doc;

        auto start = std::chrono::steady_clock::now();
        std::vector<RescoreResult> results = rescore_batch(entries);
        auto end = std::chrono::steady_clock::now();
        TYPING_PROOF_PROFILE_COUT("[rescore] " << results.size() << " entries in "
                                  << (std::chrono::duration<double, std::milli>(end - start).count())
                                  << " ms" << std::endl);

        RescoreSummary summary = summarize(results);

        if (json_output) {
            nlohmann::json out = nlohmann::json::array();
            for (const auto& r : results) {
                out.push_back(r.to_json());
            }
            std::cout << nlohmann::json{
                {"results", out},
                {"matched", summary.matched},
                {"diverged", summary.diverged},
                {"invalid", summary.invalid},
            }.dump(2) << std::endl;
        } else {
            for (const auto& r : results) {
                if (r.status == RescoreStatus::Invalid) {
                    std::cout << "[rescore] " << r.id << ": invalid: " << r.error << std::endl;
                    continue;
                }
                if (r.status == RescoreStatus::Diverged) {
                    std::cout << "[rescore] " << r.id << ": DIVERGED" << std::endl;
                    for (const auto& d : r.differences) {
                        std::cout << "    " << d << std::endl;
                    }
                } else {
                    TYPING_PROOF_DEBUG_COUT("[rescore] " << r.id << ": match score=" << r.stats.score << std::endl);
                }
                for (const auto& v : r.timing_violations) {
                    std::cout << "[rescore] " << r.id << ": timing: " << v << std::endl;
                }
            }
            std::cout << std::endl;
            std::cout << "Entries:  " << results.size() << std::endl;
            std::cout << "Matched:  " << summary.matched << std::endl;
            std::cout << "Diverged: " << summary.diverged << std::endl;
            std::cout << "Invalid:  " << summary.invalid << std::endl;
        }

        return (summary.diverged == 0 && summary.invalid == 0) ? 0 : 2;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
