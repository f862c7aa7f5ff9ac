// =============================================================================
// SimPilot - Main Entry Point
// =============================================================================
// Reads JSON-line requests from stdin, writes responses to stdout, logs to
// stderr (and optionally a log file).
//
// Usage: simpilot [config.json]
// =============================================================================

#include "simpilot_log.hpp"
#include "config_loader.hpp"
#include "artifact_store.hpp"
#include "automation_service.hpp"
#include "bridge/bridge_registry.hpp"
#include "command_api.hpp"
#include "simctl/simctl_device_manager.hpp"

#include <iostream>

int main(int argc, char* argv[]) {
    const std::string config_path = argc > 1 ? argv[1] : "config.json";
    const bool strict = argc > 1;

    auto config = simpilot::config::loadConfig(config_path, strict);

    simpilot::log::setLogLevel(simpilot::log::parseLevel(config.log.level));
    if (!config.log.log_path.empty() && !simpilot::log::openLogFile(config.log.log_path.c_str())) {
        SPLOG_WARN("main", "cannot open log file %s", config.log.log_path.c_str());
    }
    SPLOG_INFO("main", "SimPilot starting (agent %s:%d, artifacts %s)",
               config.agent.host.c_str(), config.agent.port, config.artifacts.dir.c_str());

    simpilot::simctl::SimctlDeviceManager devices(config.simctl.xcrun_path);
    simpilot::ArtifactStore artifacts(config.artifacts.dir);
    simpilot::bridge::BridgeRegistry bridges(config);
    bridges.setChangeCallback([](const std::string& device_id,
                                 simpilot::bridge::BridgeState from,
                                 simpilot::bridge::BridgeState to) {
        SPLOG_INFO("main", "bridge %s: %s -> %s", device_id.c_str(),
                   simpilot::bridge::bridgeStateName(from), simpilot::bridge::bridgeStateName(to));
    });

    simpilot::AutomationService service(bridges, devices, artifacts, config.screenshot);
    simpilot::CommandApi api(service);

    std::ios::sync_with_stdio(false);
    api.serve(std::cin, std::cout);

    SPLOG_INFO("main", "SimPilot shutting down");
    simpilot::log::closeLogFile();
    return 0;
}
