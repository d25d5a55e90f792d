#include "config.h"
#include "errors.h"
#include "monteCarlo.h"
#include <chrono>
#include <cstdint>
#include <iostream>
#include <map>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

// usage: slot_sim [totalSpins] [bet] [threads] [key=value ...]
int main(int argc, char* argv[]) {
    std::int64_t totalSpins = 1000000;
    std::int64_t bet = 100;
    size_t threads = std::thread::hardware_concurrency();
    std::map<std::string, double> overrides;

    try {
        std::vector<std::string> positional;
        for (int i = 1; i < argc; i++) {
            std::string arg = argv[i];
            auto pos = arg.find('=');
            if (pos == std::string::npos) {
                positional.push_back(arg);
                continue;
            }
            overrides[arg.substr(0, pos)] = std::stod(arg.substr(pos + 1));
        }
        if (positional.size() > 0) totalSpins = std::stoll(positional[0]);
        if (positional.size() > 1) bet = std::stoll(positional[1]);
        if (positional.size() > 2) threads = static_cast<size_t>(std::stoul(positional[2]));

        EngineConfig config = defaultEngineConfig();
        applyOverrides(config, overrides);

        std::cout << "Running " << totalSpins << " spins at bet " << bet
                  << " on " << threads << " threads, target RTP " << config.algorithm.targetRTP
                  << std::endl;

        auto seed = static_cast<std::uint64_t>(std::chrono::steady_clock::now().time_since_epoch().count());
        Simulation sim(config, seed, threads);
        SimulationReport report = sim.run(totalSpins, bet);

        std::cout << "Hit frequency=" << report.hitFrequency
                  << ", big wins=" << report.bigWins
                  << ", jackpots=" << report.jackpots
                  << ", bonus triggers=" << report.bonusTriggers
                  << ", max cascades=" << report.maxCascades
                  << std::endl;
        if (report.theoretical.supported) {
            std::cout << "Theoretical first-drop RTP=" << report.theoretical.firstDropRTP
                      << ", hit probability=" << report.theoretical.hitProbability
                      << std::endl;
        }
        if (!Simulation::writeReport(report, "sim_report.txt")) return 1;
    } catch (const SlotError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: malformed number (" << e.what() << ")" << std::endl;
        return 1;
    } catch (const std::out_of_range& e) {
        std::cerr << "Error: number out of range (" << e.what() << ")" << std::endl;
        return 1;
    }
    return 0;
}
