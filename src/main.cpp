#include "contactform/config/AppConfig.hpp"
#include "contactform/controller/SubmissionController.hpp"
#include "contactform/repository/MySqlConnectionPool.hpp"
#include "contactform/repository/SubmissionsRepository.hpp"
#include "contactform/server/HttpServer.hpp"
#include "contactform/server/IoThreads.hpp"
#include "contactform/server/Router.hpp"
#include "contactform/service/SubmissionService.hpp"
#include "contactform/util/Logging.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include <csignal>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <memory>
#include <string>

namespace {

std::filesystem::path resolveConfigPath(int argc, char** argv) {
    if (argc > 1) {
        return argv[1];
    }
    if (const char* value = std::getenv("CONTACTFORM_CONFIG")) {
        return value;
    }
    return "config/contactform.json";
}

} // namespace

int main(int argc, char** argv) {
    using namespace contactform;

    auto appConfig = config::loadAppConfig(resolveConfigPath(argc, argv));
    util::initLogging(appConfig.logLevel);

    try {
        const auto& dbConfig = appConfig.database;
        util::log(util::LogLevel::info,
                  "Using MySQL: " + dbConfig.host + ":" + std::to_string(dbConfig.port) + "/" +
                      dbConfig.database + "." + dbConfig.table);

        repository::MySqlConnectionPool connectionPool{dbConfig};
        repository::SubmissionsRepository submissions{connectionPool, dbConfig.table};
        service::SubmissionService submissionService{submissions};

        auto router = std::make_shared<server::Router>();
        controller::SubmissionController submissionController{submissionService};
        submissionController.registerRoutes(*router);

        boost::asio::io_context io;
        auto server = std::make_shared<server::HttpServer>(io, router, appConfig.server.host, appConfig.server.port);
        server->start();

        boost::asio::signal_set signals(io, SIGINT, SIGTERM);
        signals.async_wait([&io, server](const boost::system::error_code& ec, int signalNumber) {
            if (ec) {
                return;
            }
            util::log(util::LogLevel::info, "Received signal " + std::to_string(signalNumber) + ", shutting down");
            server->stop();
            io.stop();
        });

        server::IoThreads ioThreads{io};
        ioThreads.spawn(appConfig.server.ioThreads > 1 ? appConfig.server.ioThreads - 1 : 0);

        util::log(util::LogLevel::info,
                  "contactform listening on " + appConfig.server.host + ":" + std::to_string(appConfig.server.port));
        io.run();
    } catch (const std::exception& ex) {
        util::log(util::LogLevel::error, std::string{"Fatal: "} + ex.what());
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
