#pragma once

#include <string>

struct GlobalConfig {
    bool verbose = false;
    std::string log_dir = "log";
};
