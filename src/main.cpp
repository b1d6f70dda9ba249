#include <asio.hpp>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "datasource/config.hpp"
#include "datasource/file_server.hpp"
#include "datasource/router.hpp"
#include "datasource/server.hpp"

using namespace datasource;

int main(int argc, char *argv[]) {
    // Check command line arguments.
    if (argc != 2) {
        std::cerr << "Usage: datasource_server <config.json>\n";
        std::cerr << "  Serves the mounts of the configuration, e.g.\n";
        std::cerr << "    {\"port\": 8080, \"mounts\": [{\"route\": \"/{path*}\",\n";
        std::cerr << "      \"source\": {\"type\": \"folders\", \"paths\": [\"www\"]}}]}\n";
        return 1;
    }

    ServerConfig config;
    std::string err;
    if (!loadConfigFile(argv[1], config, err)) {
        std::cerr << "config: " << err << "\n";
        return 1;
    }

    debugMsgCallback debugMsg = [](const std::string &) {};
    if (config.verbose_) {
        debugMsg = [](const std::string &msg) { std::cout << "[DEBUG] " << msg << std::endl; };
    }

    try {
        asio::io_context ioc;
        Router router;
        Settings settings(std::chrono::seconds(config.keepAliveTimeout_),
                          config.keepAliveMax_,
                          config.connectionLimit_,
                          config.workerThreads_);
        Server s(ioc, config.address_, config.port_, settings, config.maxContentSize_);
        s.setDebugMsgHandler(debugMsg);

        std::vector<std::string> banner;
        for (const auto &mount : config.mounts_) {
            std::shared_ptr<const DataSource> source =
                createDataSource(mount.source_, err, debugMsg);
            if (!source) {
                std::cerr << "mount '" << mount.route_ << "': " << err << "\n";
                return 1;
            }

            FileServer::Settings fileSettings(mount.index_, mount.maxFileSize_);
            fileSettings.headers_ = mount.headers_;
            auto fileServer = std::make_shared<FileServer>(source, fileSettings);
            fileServer->setDebugMsgHandler(debugMsg);

            if (!registerFileServerRoute(router, mount.route_, fileServer)) {
                std::cerr << "mount '" << mount.route_
                          << "': route must end with a catch-all segment such as {path*}\n";
                return 1;
            }
            banner.push_back("  " + mount.route_ + "  ->  " + source->describe());
        }

        s.addRequestHandler([&router](const Request &req, Reply &rep) { router.handle(req, rep); });

        std::cout << "\n";
        std::cout << "========================================\n";
        std::cout << " datasource server started\n";
        std::cout << "========================================\n";
        std::cout << "Listening on " << config.address_ << ":" << s.getBindedPort() << "\n";
        std::cout << "Workers: " << config.workerThreads_ << "\n";
        std::cout << "Mounts:\n";
        for (const auto &line : banner) {
            std::cout << line << "\n";
        }
        std::cout << "Stop Server: Press Ctrl+C for graceful shutdown\n";
        std::cout << "========================================\n";

        // Run the server until stopped with Ctrl-C.
        ioc.run();
    } catch (std::exception &e) {
        std::cerr << "exception: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
