#pragma once
#include <memory>

#include <spdlog/spdlog.h>

namespace agora {

// Shared "agora" logger, created on first use with a stdout colour sink.
std::shared_ptr<spdlog::logger> log();

} // namespace agora
