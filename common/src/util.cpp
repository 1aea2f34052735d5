#include <funcorch/common/util.hpp>

#include <algorithm>
#include <cctype>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace funcorch::common::util {

  std::shared_ptr<spdlog::logger> create_logger(std::string_view name)
  {
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>(std::string{name}, sink);
    logger->set_pattern("[%H:%M:%S:%f] [%n] [P %P] [T %t] [%l] %v ");
    logger->set_level(spdlog::get_level());
    return logger;
  }

  bool iequals(std::string_view lhs, std::string_view rhs)
  {
    return std::equal(lhs.begin(), lhs.end(), rhs.begin(), rhs.end(), [](char a, char b) {
      return std::tolower(static_cast<unsigned char>(a)) ==
             std::tolower(static_cast<unsigned char>(b));
    });
  }

} // namespace funcorch::common::util
