#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <ypbank/common/logging.hpp>

#include <memory>
#include <string>

namespace ypbank::common {

void configure_logging(const std::string_view name, const bool verbose) {
  auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  auto logger =
      std::make_shared<spdlog::logger>(std::string{name}, console_sink);
  logger->set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  logger->set_level(verbose ? spdlog::level::debug : spdlog::level::info);
  spdlog::set_default_logger(logger);
}

}  // namespace ypbank::common
