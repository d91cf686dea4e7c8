#include "action/action.hpp"
#include "bridge/host_environment.hpp"
#include "host_config.hpp"
#include "host_context.hpp"
#include "ipc_server.hpp"
#include "logger.hpp"

#include <log4cplus/initializer.h>
#include <log4cplus/loggingmacros.h>

#include <atomic>
#include <csignal>
#include <cstring>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include <sys/prctl.h>
#include <unistd.h>

namespace {

std::atomic<bool> g_stop_requested{false};

void on_stop_signal(int) {
    g_stop_requested = true;
}

} // namespace

int main(int argc, char** argv) {
    log4cplus::Initializer log_initializer;

    bool enable_pdeathsig = false;
    std::optional<std::string> socket_override;
    std::string config_path = "log4cplus.ini";
    std::optional<std::string> bridge_config_path;

    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "--version") == 0) {
            std::cout << "Version: " << WEBBRIDGE_VERSION_STRING << std::endl;
            std::cout << "Commit: " << WEBBRIDGE_GIT_VERSION_STRING << std::endl;
            std::cout << "Build Time: " << WEBBRIDGE_BUILD_TIMESTAMP << std::endl;
            return 0;
        }

        if (strcmp(argv[i], "--pdeathsig") == 0) {
            enable_pdeathsig = true;
            continue;
        }

        if (strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_path = argv[++i];
            continue;
        }

        if (strncmp(argv[i], "--config=", 9) == 0) {
            config_path = argv[i] + 9;
            continue;
        }

        if (strcmp(argv[i], "--bridge-config") == 0 && i + 1 < argc) {
            bridge_config_path = argv[++i];
            continue;
        }

        if (strncmp(argv[i], "--bridge-config=", 16) == 0) {
            bridge_config_path = argv[i] + 16;
            continue;
        }

        if (strcmp(argv[i], "--socket") == 0 && i + 1 < argc) {
            socket_override = argv[++i];
            continue;
        }

        if (strncmp(argv[i], "--socket=", 9) == 0) {
            socket_override = argv[i] + 9;
            continue;
        }

        if (argv[i][0] != '-') {
            socket_override = argv[i];
        }
    }

#ifdef __linux__
    if (enable_pdeathsig) {
        prctl(PR_SET_PDEATHSIG, SIGTERM);
        if (getppid() == 1) {
            return 1;
        }
    }
#endif

    init_logging(config_path);

    webbridge::HostConfig config;
    config.app_version = WEBBRIDGE_VERSION_STRING;
    if (bridge_config_path) {
        try {
            config = webbridge::load_host_config(*bridge_config_path, WEBBRIDGE_VERSION_STRING);
        } catch (const webbridge::ConfigError& exc) {
            LOG4CPLUS_ERROR(core_logger(), "Invalid bridge config: " << exc.what());
            return 1;
        }
    }
    if (socket_override) {
        config.socket_path = *socket_override;
    }

    LOG4CPLUS_INFO(core_logger(), "webbridge_host starting");
    LOG4CPLUS_INFO(core_logger(), "Version: " << WEBBRIDGE_VERSION_STRING << ", Commit: " << WEBBRIDGE_GIT_VERSION_STRING);
    LOG4CPLUS_INFO(core_logger(), "Build Time: " << WEBBRIDGE_BUILD_TIMESTAMP);
    LOG4CPLUS_INFO(core_logger(), "Socket: " << config.socket_path);
    LOG4CPLUS_INFO(core_logger(), "Local content scheme: "
                                      << (config.security.allow_local_scheme ? "allowed" : "blocked"));
    LOG4CPLUS_INFO(core_logger(), "Parent death signal: " << (enable_pdeathsig ? "enabled" : "disabled"));

    auto shared_config = std::make_shared<const webbridge::HostConfig>(config);
    auto environment = std::make_shared<const webbridge::SystemEnvironment>(shared_config->user_name,
                                                                            shared_config->app_version);
    webbridge::ipc::HostContext context(shared_config, environment);

    webbridge::ipc::IpcServer server(shared_config->socket_path, [&context](const std::string& request_bytes) {
        return webbridge::ipc::actions::handle_action(request_bytes, context);
    });

    if (!server.start()) {
        LOG4CPLUS_ERROR(core_logger(), "Failed to start IPC server");
        return 1;
    }

    LOG4CPLUS_INFO(core_logger(), "IPC server started at " << shared_config->socket_path);

    std::signal(SIGINT, on_stop_signal);
    std::signal(SIGTERM, on_stop_signal);

    while (!g_stop_requested) {
        ::sleep(1);
    }

    LOG4CPLUS_INFO(core_logger(), "Shutting down");
    server.stop();
    for (const auto& id : context.list_instances()) {
        if (!context.remove_instance(id)) {
            LOG4CPLUS_DEBUG(core_logger(), "Surface already removed: " << id);
        }
    }
    return 0;
}
