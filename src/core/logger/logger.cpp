#include "logger.hpp"
#include <iostream>
#include <stdexcept>

namespace Spindle {
namespace Core {

int Logger::level_ = LogLevel::LOG_ALL;

std::mutex Logger::mutex_;

namespace {
const std::string RESET  = "\033[0m";
const std::string RED    = "\033[31m";
const std::string GREEN  = "\033[32m";
const std::string YELLOW = "\033[33m";
const std::string BLUE   = "\033[34m";
}  // namespace

void Logger::set_level(int level) {
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = level;
}

int Logger::level() {
    std::lock_guard<std::mutex> lock(mutex_);
    return level_;
}

void Logger::info(const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (level_ & LogLevel::LOG_INFO) {
        std::cout << BLUE << "[INFO] " << RESET << message << std::endl;
    }
}

void Logger::success(const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (level_ & LogLevel::LOG_SUCCESS) {
        std::cout << GREEN << "[SUCCESS] " << RESET << message << std::endl;
    }
}

void Logger::warn(const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (level_ & LogLevel::LOG_WARN) {
        std::cerr << YELLOW << "[WARN] " << RESET << message << std::endl;
    }
}

void Logger::error(const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (level_ & LogLevel::LOG_ERROR) {
        std::cerr << RED << "[ERROR] " << RESET << message << std::endl;
    }
}

int Logger::parse_level(const std::string& name) {
    if (name == "none")
        return LOG_NONE;
    if (name == "error")
        return LOG_ERROR;
    if (name == "warn")
        return LOG_ERROR | LOG_WARN;
    if (name == "success")
        return LOG_ERROR | LOG_WARN | LOG_SUCCESS;
    if (name == "info" || name == "all")
        return LOG_ALL;
    throw std::invalid_argument("Unknown log level: " + name);
}

}  // namespace Core
}  // namespace Spindle
