#include "core/utils.hpp"
#include "config/config_loader.hpp"
#include "engine/anonymizer_engine.hpp"
#include "engine/deanonymize_engine.hpp"
#include "server/anonymizer_service.hpp"
#include "server/http_server.hpp"
#include "server/operation_dispatcher.hpp"

#include <csignal>
#include <format>
#include <memory>

using namespace anonymizer;

// Global instance for signal handling
std::shared_ptr<HttpServer> g_server;

namespace {

constexpr const char* kWelcomeBanner = R"(
    _    _   _  ___  _   _ __   ____  __ ___ __________ ____
   / \  | \ | |/ _ \| \ | |\ \ / /  \/  |_ _|__  / ____|  _ \
  / _ \ |  \| | | | |  \| | \ V /| |\/| || |  / /|  _| | |_) |
 / ___ \| |\  | |_| | |\  |  | | | |  | || | / /_| |___|  _ <
/_/   \_\_| \_|\___/|_| \_|  |_| |_|  |_|___/____|_____|_| \_\
)";

} // anonymous namespace

void signal_handler(int signal) {
    utils::log::info(std::format("Received signal {}, shutting down...", signal));
    if (g_server) {
        g_server->stop();
    }
}

int main(int argc, char* argv[]) {
    try {
        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        std::string config_file = "config/anonymizer.toml";
        if (argc > 1) {
            config_file = argv[1];
        }

        utils::log::info(std::format("[1/3] Loading configuration from {}", config_file));
        auto config_result = ConfigLoader::load_from_file(config_file);
        if (!config_result.success) {
            utils::log::error(config_result.error_message);
            return 1;
        }
        const auto& config = config_result.config;

        // Validated by the loader
        if (const auto level = utils::log::parse_level(config.logging.level)) {
            utils::log::set_level(*level);
        }

        utils::log::info("[2/3] Starting anonymizer engine");
        const auto dispatcher = std::make_shared<const OperationDispatcher>(
            std::make_shared<const AnonymizerEngine>(),
            std::make_shared<const DeanonymizeEngine>());
        const auto service = std::make_shared<const AnonymizerService>(dispatcher);

        utils::log::info(kWelcomeBanner);

        utils::log::info("[3/3] Binding HTTP routes");
        g_server = std::make_shared<HttpServer>(service, config.server, config.routes);

        // Blocks until a signal stops the server
        g_server->start();

    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal: {}", e.what()));
        return 1;
    }

    return 0;
}
