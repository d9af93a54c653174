#pragma once

#include <string>

namespace gitshort {

/// Configure the process-wide spdlog logger: a stderr colour sink and a
/// timestamped pattern. `GITSHORT_LOG_LEVEL` overrides `level`; an empty
/// or unknown level falls back to "info".
void init_logging(const std::string& level = "");

} // namespace gitshort
