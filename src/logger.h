#pragma once

#include <memory>
#include <string>
#include "spdlog/spdlog.h"
#include "spdlog/sinks/stdout_color_sinks.h"

// Components share a logger per name; the first user creates it
inline std::shared_ptr<spdlog::logger> ObtainLogger(const std::string& name)
{
    if (auto logger = spdlog::get(name); logger)
        return logger;
    return spdlog::stderr_color_st(name);
}
