#pragma once
#include <string>
#include "config.hpp"

class BaseCommand {
public:
    virtual ~BaseCommand() = default;
    virtual std::string name() const = 0;
    virtual std::string usage() const = 0;
    // Returns the process exit status.
    virtual int run(const Config& config) = 0;
};
