#pragma once

#include <filesystem>
#include <string>

namespace kild {

// CLI logging: colored stderr sink at the given level ("trace".."off").
void init_cli_logging(const std::string& level);

// Daemon logging: rotating file sink, plus stderr when running in the foreground.
void init_daemon_logging(const std::filesystem::path& log_file, const std::string& level, bool foreground);

}
