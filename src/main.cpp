#include <cstdlib>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <Poco/Exception.h>

#include <boost/asio/io_context.hpp>

#include "uploadguard/core/config.h"
#include "uploadguard/core/logger.h"
#include "uploadguard/http/http_server.h"
#include "uploadguard/http/route_registration.h"
#include "uploadguard/http/router.h"
#include "uploadguard/upload/ingestion_pipeline.h"
#include "uploadguard/upload/retention_sweeper.h"
#include "uploadguard/upload/type_profile.h"

namespace {

std::string GetArgValue(int argc, char** argv, const std::string& key,
                        const std::string& default_value) {
    for (int i = 1; i < argc - 1; ++i) {
        if (argv[i] == key) {
            return argv[i + 1];
        }
    }
    return default_value;
}

}  // namespace

int main(int argc, char** argv) {
    const std::string config_path = GetArgValue(argc, argv, "--config", "config/server.json");

    uploadguard::core::Config config;
    try {
        config = uploadguard::core::LoadConfig(config_path);
    } catch (const std::invalid_argument& ex) {
        std::cerr << "invalid configuration " << config_path << ": " << ex.what() << std::endl;
        return EXIT_FAILURE;
    } catch (const Poco::Exception& ex) {
        std::cerr << "failed to load " << config_path << ": " << ex.displayText() << std::endl;
        return EXIT_FAILURE;
    }
    uploadguard::core::InitLogging(config.observability.log_level);

    auto registry = std::make_shared<const uploadguard::upload::TypeProfileRegistry>(
        config.storage.uploads_root, config.storage.staging_path);
    auto directories = registry->EnsureDirectories();
    if (!directories.ok()) {
        uploadguard::core::LogError(directories.error().message);
        return EXIT_FAILURE;
    }

    auto pipeline = std::make_shared<uploadguard::upload::IngestionPipeline>(registry);
    auto sweeper = std::make_shared<uploadguard::upload::RetentionSweeper>(
        registry, uploadguard::upload::RetentionPolicy{config.retention.max_age_seconds,
                                                       config.retention.min_age_seconds});

    uploadguard::http::Router router;
    uploadguard::http::RegisterDefaultRoutes(router, pipeline, sweeper, config);

    boost::asio::io_context ioc(config.server.threads);
    uploadguard::http::HttpServer server(ioc, config, std::move(router), pipeline, sweeper);
    if (!server.Run()) {
        return EXIT_FAILURE;
    }

    std::vector<std::thread> threads;
    threads.reserve(static_cast<size_t>(config.server.threads));
    for (int i = 0; i < config.server.threads; ++i) {
        threads.emplace_back([&ioc]() { ioc.run(); });
    }
    for (auto& t : threads) {
        t.join();
    }

    return 0;
}
