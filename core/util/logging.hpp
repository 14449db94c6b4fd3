#pragma once

#include <spdlog/spdlog.h>
#include <memory>

namespace zpdes::log {

/// Shared "zpdes" logger (stderr, colored). Created on first use.
std::shared_ptr<spdlog::logger> logger();

void setLevel(spdlog::level::level_enum level);

} // namespace zpdes::log
