#pragma once

#include <optional>
#include <string_view>

#include <spdlog/common.h>

namespace tatar::detail {

/**
 * @brief The level that an SPDLOG_LEVEL style string assigns to @p name.
 *
 * Only "<name>=<level>" entries count; global levels and entries for other
 * loggers are ignored, as are unknown level names.
 */
std::optional<spdlog::level::level_enum>
find_logger_level(std::string_view levels, std::string_view name);

} // namespace tatar::detail
