#pragma once

#include "chronicle/config.hpp"
#include <optional>
#include <string>

namespace chronicle {

struct RunnerOptions {
    std::string db_path {":memory:"};
    std::string log_level {"info"};
    bool maintain {false};
    EngineConfig engine;
};

std::optional<std::string> get_arg(int argc, char** argv, const std::string& flag);
bool has_flag(int argc, char** argv, const std::string& flag);

// Throws std::invalid_argument on malformed numeric values.
RunnerOptions options_from_args(int argc, char** argv);

const char* runner_usage();

} // namespace chronicle
