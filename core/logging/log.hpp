#pragma once

#include <memory>
#include <spdlog/spdlog.h>

namespace sweep {
namespace logsys {

/// The library logger ("sweep"). Created with a colored stderr sink,
/// at level warn or the last setLevel, whenever the registry lacks one.
std::shared_ptr<spdlog::logger> get();

/// Also applies to any logger recreated later.
void setLevel(spdlog::level::level_enum level);

} // namespace logsys
} // namespace sweep
