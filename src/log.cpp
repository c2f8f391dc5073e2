#include "agora/log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace agora {

std::shared_ptr<spdlog::logger> log() {
  static const std::shared_ptr<spdlog::logger> logger = [] {
    if (auto existing = spdlog::get("agora")) return existing;
    auto l = spdlog::stdout_color_mt("agora");
    l->set_level(spdlog::level::info);
    return l;
  }();
  return logger;
}

} // namespace agora
