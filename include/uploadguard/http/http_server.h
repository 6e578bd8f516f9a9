#pragma once

#include <memory>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/steady_timer.hpp>

#include "uploadguard/core/config.h"
#include "uploadguard/http/router.h"
#include "uploadguard/upload/ingestion_pipeline.h"
#include "uploadguard/upload/retention_sweeper.h"

namespace uploadguard::http {

/// @brief HTTP server bootstrapper (acceptor + TLS context + retention timer).
class HttpServer {
public:
    HttpServer(boost::asio::io_context& ioc, const core::Config& config, Router router,
               std::shared_ptr<upload::IngestionPipeline> pipeline,
               std::shared_ptr<upload::RetentionSweeper> sweeper);
    /// @brief Starts accepting; false if the listening socket could not be set up.
    bool Run();

private:
    void StartRetentionJob();
    void ScheduleRetentionSweep();

    boost::asio::io_context& ioc_;
    core::Config config_;
    Router router_;
    std::shared_ptr<upload::IngestionPipeline> pipeline_;
    std::shared_ptr<upload::RetentionSweeper> sweeper_;
    std::unique_ptr<boost::asio::ssl::context> ssl_context_;
    std::unique_ptr<boost::asio::steady_timer> retention_timer_;
};

}  // namespace uploadguard::http
