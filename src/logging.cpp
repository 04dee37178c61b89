#include "logging.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>

bool setup_logging(const std::string& path, const std::string& level, std::string& msg) {
  try {
    auto logger = spdlog::basic_logger_mt("nvgrid", path);
    logger->set_level(spdlog::level::from_str(level));
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(logger);
  } catch (const spdlog::spdlog_ex& e) {
    msg = std::string("can not open log file: ") + e.what();
    return false;
  }
  return true;
}
