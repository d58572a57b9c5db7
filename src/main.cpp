// src/main.cpp
#include "cli.h"
#include "config.h"
#include "debug_utils.h"

#include <iostream>
#include <string>
#include <vector>

int main(int argc, char** argv) {
    auto config = elastic::Config::fromEnvironment();
    if (!config.isOk()) {
        std::cerr << "Error loading config: " << config.error().toString() << std::endl;
        return 1;
    }
    elastic::setLogLevel(config->log_level);
    LOG_DEBUG("Configuration: ", config->toString());

    std::vector<std::string> args(argv + 1, argv + argc);
    return elastic::runCli(*config, args, std::cout, std::cerr);
}
