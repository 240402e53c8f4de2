#include "clearhouse/config/SolverConfig.hpp"
#include "clearhouse/domain/Errors.hpp"
#include "clearhouse/governor/SolveGovernor.hpp"
#include "clearhouse/infra/Log.hpp"
#include "clearhouse/io/AuctionJson.hpp"

#include <chrono>
#include <cstring>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>

using namespace clearhouse;

static void usage() {
    std::cerr << "usage: clearhouse_solve --auction FILE [--config FILE] "
                 "[--timeout-ms N] [--out FILE]\n";
}

int main(int argc, char** argv) {
    std::string auction_path;
    std::string config_path;
    std::string out_path;
    long timeout_ms = -1;

    for (int i = 1; i < argc; ++i) {
        bool has_value = i + 1 < argc;
        if (std::strcmp(argv[i], "--auction") == 0 && has_value) {
            auction_path = argv[++i];
        } else if (std::strcmp(argv[i], "--config") == 0 && has_value) {
            config_path = argv[++i];
        } else if (std::strcmp(argv[i], "--out") == 0 && has_value) {
            out_path = argv[++i];
        } else if (std::strcmp(argv[i], "--timeout-ms") == 0 && has_value) {
            try {
                timeout_ms = std::stol(argv[++i]);
            } catch (const std::exception&) {
                usage();
                return 1;
            }
        } else {
            usage();
            return 1;
        }
    }
    if (auction_path.empty() || timeout_ms < -1) {
        usage();
        return 1;
    }

    SolverConfig cfg;
    std::unique_ptr<SolveGovernor> governor;
    try {
        cfg = config_path.empty() ? SolverConfig::defaults() : load_config(config_path);
        infra::Log::set_level(cfg.log_level);
        governor = std::make_unique<SolveGovernor>(cfg);
    } catch (const ConfigError& e) {
        std::cerr << e.what() << "\n";
        return 2;
    }
    infra::log_info("CONFIG") << (config_path.empty() ? "defaults" : config_path) << ": "
                              << cfg.strategies.size() << " strategies, max_hops " << cfg.max_hops
                              << (cfg.prioritization ? ", prioritized" : "");

    infra::MonoTime received = infra::now();
    try {
        Auction auction = io::load_auction(auction_path, received);

        // Without --timeout-ms the auction's own deadline is the only bound.
        infra::MonoTime deadline = timeout_ms >= 0
            ? received + std::chrono::milliseconds(timeout_ms)
            : infra::MonoTime::max();

        Solution solution = governor->solve(auction, deadline);
        std::string body = io::serialize_solution(auction, solution);

        if (out_path.empty()) {
            std::cout << body << "\n";
        } else {
            std::ofstream f(out_path);
            if (!f) {
                std::cerr << "[SOLVE] cannot write " << out_path << "\n";
                return 4;
            }
            f << body << "\n";
        }
    } catch (const InvalidAuction& e) {
        std::cerr << e.what() << "\n";
        return 3;
    }
    return 0;
}
