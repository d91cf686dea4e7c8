#pragma once

#include <string>
#include <log4cplus/logger.h>

log4cplus::Logger& core_logger();
log4cplus::Logger& bridge_logger();
log4cplus::Logger& security_logger();
log4cplus::Logger& ipc_logger();
void init_logging(const std::string& config_path);
