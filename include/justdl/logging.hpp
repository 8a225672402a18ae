#pragma once

#include <string>

namespace justdl {

// Installs the process-wide default spdlog logger: colored stderr output plus
// an optional rotating log file. Throws ConfigError on an unknown level.
void initLogging(const std::string& level, const std::string& log_file = {});

} // namespace justdl
