#pragma once

#include <memory>

#include "uploadguard/core/config.h"
#include "uploadguard/http/router.h"

namespace uploadguard::upload {
class IngestionPipeline;
class RetentionSweeper;
}  // namespace uploadguard::upload

namespace uploadguard::http {

/// Registers the server's HTTP routes into the provided router.
void RegisterDefaultRoutes(Router& router, std::shared_ptr<upload::IngestionPipeline> pipeline,
                           std::shared_ptr<upload::RetentionSweeper> sweeper,
                           const core::Config& config);

}  // namespace uploadguard::http
