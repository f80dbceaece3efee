#include "config.hpp"
#include "dispatcher.hpp"
#include "handler/builtin_handlers.hpp"
#include "logger.hpp"
#include "manifest.hpp"
#include "server.hpp"
#include "stream_server.hpp"

#include <log4cplus/initializer.h>
#include <log4cplus/loggingmacros.h>

#include <csignal>
#include <cstring>
#include <iostream>
#include <memory>
#include <string>

#include <signal.h>
#include <sys/prctl.h>
#include <unistd.h>

namespace {

volatile std::sig_atomic_t g_stop_requested = 0;

void on_stop_signal(int) {
    g_stop_requested = 1;
}

bool match_option(int argc, char** argv, int& i, const char* name, std::string& value) {
    size_t len = std::strlen(name);
    if (std::strcmp(argv[i], name) == 0 && i + 1 < argc) {
        value = argv[++i];
        return true;
    }
    if (std::strncmp(argv[i], name, len) == 0 && argv[i][len] == '=') {
        value = argv[i] + len + 1;
        return true;
    }
    return false;
}

} // namespace

int main(int argc, char** argv) {
    log4cplus::Initializer log_initializer;

    bool enable_pdeathsig = false;
    bool use_stream = false;
    std::string socket_path = "/tmp/janus_server.sock";
    std::string config_path = "log4cplus.ini";
    std::string server_config_path;
    std::string manifest_path;

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "-v") == 0 || std::strcmp(argv[i], "--version") == 0) {
            std::cout << "Version: " << JANUS_VERSION_STRING << std::endl;
            std::cout << "Commit: " << JANUS_GIT_VERSION_STRING << std::endl;
            std::cout << "Build Time: " << JANUS_BUILD_TIMESTAMP << std::endl;
            return 0;
        }
        if (std::strcmp(argv[i], "--pdeathsig") == 0) {
            enable_pdeathsig = true;
            continue;
        }
        if (std::strcmp(argv[i], "--stream") == 0) {
            use_stream = true;
            continue;
        }
        if (match_option(argc, argv, i, "--config", config_path) ||
            match_option(argc, argv, i, "--server-config", server_config_path) ||
            match_option(argc, argv, i, "--manifest", manifest_path) ||
            match_option(argc, argv, i, "--socket", socket_path)) {
            continue;
        }
        if (argv[i][0] != '-') {
            socket_path = argv[i];
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

    janus::init_logging(config_path);

    LOG4CPLUS_INFO(janus::core_logger(), "janus_daemon starting");
    LOG4CPLUS_INFO(janus::core_logger(), "Version: " << JANUS_VERSION_STRING << ", Commit: " << JANUS_GIT_VERSION_STRING);
    LOG4CPLUS_INFO(janus::core_logger(), "Socket: " << socket_path << (use_stream ? " (stream)" : " (datagram)"));

    janus::ServerConfig server_config;
    std::shared_ptr<const janus::Manifest> manifest;
    try {
        if (!server_config_path.empty()) {
            server_config = janus::load_server_config(janus::read_json_file(server_config_path));
        }
        if (!manifest_path.empty()) {
            manifest = std::make_shared<janus::Manifest>(
                janus::parse_manifest(janus::read_json_file(manifest_path)));
            LOG4CPLUS_INFO(janus::core_logger(), "Manifest " << manifest_path << ": " << manifest->commands.size()
                                                             << " commands");
        }
    } catch (const janus::JanusError& exc) {
        LOG4CPLUS_FATAL(janus::core_logger(), exc.what());
        return 1;
    }

    std::signal(SIGINT, on_stop_signal);
    std::signal(SIGTERM, on_stop_signal);

    try {
        if (use_stream) {
            auto registry = std::make_shared<janus::handler::CommandRegistry>();
            janus::handler::register_builtin_handlers(*registry, manifest);
            auto dispatcher = std::make_shared<janus::Dispatcher>(registry, manifest, server_config,
                                                                  std::make_shared<janus::TimeoutManager>());
            janus::StreamServer server(socket_path, dispatcher, server_config);
            server.start();
            while (!g_stop_requested) {
                ::usleep(100 * 1000);
            }
            server.stop();
        } else {
            janus::JanusServer server(server_config, manifest);
            janus::handler::register_builtin_handlers(server.registry(), manifest);
            server.start(socket_path);
            while (!g_stop_requested) {
                ::usleep(100 * 1000);
            }
            server.stop();
        }
    } catch (const janus::JanusError& exc) {
        LOG4CPLUS_FATAL(janus::core_logger(), "Failed to start server: " << exc.what());
        return 1;
    }

    LOG4CPLUS_INFO(janus::core_logger(), "janus_daemon stopped");
    return 0;
}
