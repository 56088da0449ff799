#include <chrono>
#include <exception>
#include <iostream>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "merkletree/errors.hpp"
#include "merkletree/hex.hpp"
#include "merkletree/tree.hpp"
#include "merkletree/verify.hpp"

namespace {

merkletree::Bytes to_bytes(const std::string& s) {
    return merkletree::Bytes(s.begin(), s.end());
}

void print_usage(const char* argv0, std::ostream& os) {
    os << "Usage: " << argv0
       << " [--hash sha3-256|sha256] [--add RECORD]... [--prove RECORD]... [--root HEX] [--levels] [--profile]"
       << " [RECORD...]"
       << std::endl;
}

double seconds_between(std::chrono::steady_clock::time_point a, std::chrono::steady_clock::time_point b) {
    return std::chrono::duration<double>(b - a).count();
}

} // namespace

int main(int argc, char** argv) {
    bool profile = false;
    bool show_levels = false;
    merkletree::TreeConfig cfg;
    std::vector<std::string> records;
    std::vector<std::string> additions;
    std::vector<std::string> targets;
    std::optional<merkletree::Hash> trusted_root;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            const bool has_value = i + 1 < argc;
            if (arg == "--profile") {
                profile = true;
            } else if (arg == "--levels") {
                show_levels = true;
            } else if (arg == "--hash" && has_value) {
                cfg.algorithm = merkletree::parse_algorithm(argv[++i]);
            } else if (arg == "--add" && has_value) {
                additions.emplace_back(argv[++i]);
            } else if (arg == "--prove" && has_value) {
                targets.emplace_back(argv[++i]);
            } else if (arg == "--root" && has_value) {
                trusted_root = merkletree::parse_hash(argv[++i]);
            } else if (arg == "--help" || arg == "-h") {
                print_usage(argv[0], std::cout);
                return 0;
            } else if (arg.rfind("-", 0) == 0) {
                std::cerr << "Unknown option or missing value: " << arg << std::endl;
                print_usage(argv[0], std::cerr);
                return 1;
            } else {
                records.push_back(arg);
            }
        }
        if (records.empty()) {
            records = {"this", "is", "a", "merkle", "tree"};
        }

        const auto t_build_start = std::chrono::steady_clock::now();
        std::vector<merkletree::Bytes> data;
        data.reserve(records.size());
        for (const auto& r : records) {
            data.push_back(to_bytes(r));
        }
        merkletree::MerkleTree tree(std::move(data), cfg);
        for (const auto& r : additions) {
            tree.add(to_bytes(r));
        }
        const auto t_build_end = std::chrono::steady_clock::now();

        // Proofs are checked against the caller's root when one is given.
        const merkletree::Hash& expected_root = trusted_root ? *trusted_root : tree.root();
        bool all_ok = true;
        double prove_sec = 0.0;
        double verify_sec = 0.0;
        for (const auto& target : targets) {
            const auto t_prove_start = std::chrono::steady_clock::now();
            merkletree::Proof proof;
            try {
                proof = tree.generate_proof(to_bytes(target));
            } catch (const merkletree::NotFoundError&) {
                std::cerr << "not found: " << target << std::endl;
                all_ok = false;
                continue;
            }
            const auto t_verify_start = std::chrono::steady_clock::now();
            const bool ok = merkletree::verify_record(tree.hasher(), proof, to_bytes(target), expected_root);
            const auto t_verify_end = std::chrono::steady_clock::now();
            prove_sec += seconds_between(t_prove_start, t_verify_start);
            verify_sec += seconds_between(t_verify_start, t_verify_end);
            all_ok = all_ok && ok;

            if (!profile) {
                std::cout << "proof " << target << " (leaf " << proof.leaf_index << ")" << std::endl;
                for (const auto& step : proof.steps) {
                    std::cout << "  " << (step.side == merkletree::Side::LEFT ? "L " : "R ")
                              << merkletree::to_hex(step.sibling) << std::endl;
                }
                std::cout << "  " << (ok ? "VALID" : "INVALID") << std::endl;
            }
        }

        if (profile) {
            std::cout << "{\"hash\":\"" << merkletree::algorithm_name(cfg.algorithm) << "\",";
            std::cout << "\"leaves\":" << tree.size() << ",";
            std::cout << "\"height\":" << tree.height() << ",";
            std::cout << "\"root\":\"" << merkletree::to_hex(tree.root()) << "\",";
            std::cout << "\"build_time_sec\":" << seconds_between(t_build_start, t_build_end) << ",";
            std::cout << "\"prove_time_sec\":" << prove_sec << ",";
            std::cout << "\"verify_time_sec\":" << verify_sec << ",";
            std::cout << "\"proofs_ok\":" << (all_ok ? "true" : "false") << "}" << std::endl;
        } else {
            if (show_levels) {
                for (std::size_t depth = 0; depth < tree.levels().size(); ++depth) {
                    std::cout << "level " << depth << std::endl;
                    for (const auto& h : tree.levels()[depth]) {
                        std::cout << "  " << merkletree::to_hex(h) << std::endl;
                    }
                }
            }
            std::cout << "root " << merkletree::to_hex(tree.root()) << std::endl;
        }
        return all_ok ? 0 : 1;
    } catch (const std::exception& ex) {
        std::cerr << "error: " << ex.what() << std::endl;
        return 1;
    }
}
