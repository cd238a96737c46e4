#pragma once
#include "gitwatch/config.hpp"

#include <string_view>

namespace gitwatch::cli {

// Build a WatchConfig from "<cmd> [path] [options]". A --config file is applied first,
// so flags override it. The root defaults to the current directory and is made
// canonical when it exists. Throws ConfigError on bad usage.
WatchConfig parse_watch_args(int argc, char **argv);

} // namespace gitwatch::cli
