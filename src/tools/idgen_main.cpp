#include <iostream>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "tools/idgen.hpp"

int main(int argc, char** argv) {
    // 标准输出只留给ID，日志写到stderr
    spdlog::set_default_logger(spdlog::stderr_color_mt("todel_idgen"));
    spdlog::set_level(spdlog::level::info);
    return todel::tools::RunIdgen(argc, argv, std::cout);
}
