#include <tatar/detail/log-level.hxx>
#include <tatar/logging.hxx>

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/trim.hpp>

#include <spdlog/details/os.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <string>
#include <vector>

namespace tatar {
namespace detail {

std::optional<spdlog::level::level_enum>
find_logger_level(std::string_view levels, std::string_view name) {
  std::vector<std::string> entries;
  boost::algorithm::split(entries, levels, boost::algorithm::is_any_of(","));

  std::optional<spdlog::level::level_enum> found;
  for (const auto &entry : entries) {
    const auto equals = entry.find('=');
    if (equals == std::string::npos)
      continue;
    const auto key = boost::algorithm::trim_copy(entry.substr(0, equals));
    if (key != name)
      continue;

    const auto value = boost::algorithm::to_lower_copy(
        boost::algorithm::trim_copy(entry.substr(equals + 1)));
    const auto level = spdlog::level::from_str(value);
    if (level == spdlog::level::off && value != "off")
      continue;
    found = level;
  }
  return found;
}

} // namespace detail

namespace {

constexpr auto logger_name = "tatar";

std::shared_ptr<spdlog::logger> create_logger() {
  // An application may have registered its own "tatar" logger already.
  if (auto existing = spdlog::get(logger_name))
    return existing;

  auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  auto created = std::make_shared<spdlog::logger>(logger_name, sink);
  created->set_pattern("[%n] [%l] %v");

  // Only the tatar entry of SPDLOG_LEVEL applies; other loggers belong to
  // the application.
  const auto levels = spdlog::details::os::getenv("SPDLOG_LEVEL");
  created->set_level(
      detail::find_logger_level(levels, logger_name).value_or(spdlog::level::warn));
  spdlog::register_logger(created);
  return created;
}

} // unnamed namespace

std::shared_ptr<spdlog::logger> logger() {
  static const auto instance = create_logger();
  return instance;
}

void set_log_level(spdlog::level::level_enum level) {
  logger()->set_level(level);
}

} // namespace tatar
