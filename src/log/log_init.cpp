//! # Log Initialization from CLI
//!
//! Builds a LogConfig from the host's own argv and the ARGRUN_LOG variable.
//! Hosts call this before handing argv to the argument matcher; the log
//! options are not part of any wrapped command schema.

#include "log/log.hpp"

#include <cstdlib>
#include <string>

namespace argrun::log {

LogConfig parse_log_options(int argc, char* argv[]) {
    LogConfig config;

    bool has_cli_level = false;
    bool has_cli_filter = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg.starts_with("--log-level=")) {
            config.level = parse_level(arg.substr(12));
            has_cli_level = true;
        } else if (arg.starts_with("--log-filter=")) {
            config.filter_spec = arg.substr(13);
            has_cli_filter = true;
        } else if (arg.starts_with("--log-file=")) {
            config.log_file = arg.substr(11);
        } else if (arg == "-q" || arg == "--quiet") {
            config.level = LogLevel::Error;
            has_cli_level = true;
        }
    }

    if (!has_cli_level && !has_cli_filter) {
        const char* env_log = std::getenv("ARGRUN_LOG");
        std::string env_str = env_log ? env_log : "";
        if (!env_str.empty()) {
            // "process=debug,*=warn" or "process,state" is a filter, anything else a level
            if (env_str.find('=') != std::string::npos ||
                env_str.find(',') != std::string::npos) {
                config.filter_spec = env_str;
            } else {
                config.level = parse_level(env_str);
            }
        }
    }

    return config;
}

} // namespace argrun::log
