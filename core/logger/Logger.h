/*
 * Copyright 2024 k8s-agents-injector Authors
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *      http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#pragma once
#include <map>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

namespace k8sagent {

// Owner of the spdlog loggers. Loggers and their sinks are read from a JSON file
// (--logger_config_file), a missing or broken file falls back to one rotating
// file. The injector writes its result to stdout, so no sink ever targets it.
class Logger {
public:
    using logger = std::shared_ptr<spdlog::logger>;

    static Logger& Instance();

    void InitGlobalLoggers();

    // If not found, return the default logger.
    logger GetLogger(const std::string& loggerName);

private:
    struct SinkConfig {
        std::string type;
        unsigned int maxLogFileNum = 0;
        unsigned long long maxLogFileSize = 0;
        std::string logFilePath;
    };

    struct LoggerConfig {
        std::string sinkName;
        spdlog::level::level_enum level;
    };

    Logger();
    ~Logger() = default;

    void LoadConfig(const std::string& filePath);
    bool ParseConfig(const std::string& filePath,
                     std::map<std::string, LoggerConfig>& loggerCfgs,
                     std::map<std::string, SinkConfig>& sinkCfgs);
    void AddDefaultConfig(std::map<std::string, LoggerConfig>& loggerCfgs,
                          std::map<std::string, SinkConfig>& sinkCfgs) const;
    logger CreateLogger(const std::string& loggerName, const SinkConfig& sinkCfg);

    // Messages produced before any logger exists, replayed by InitGlobalLoggers().
    std::vector<std::string> mInitMessages;
    std::map<std::string, spdlog::sink_ptr> mSinks;
};

} // namespace k8sagent

class LogMaker {
    std::ostringstream mOStringStream;

public:
    template <typename T>
    LogMaker& operator()(const std::string& key, const T& value) {
        return this->operator()(key.c_str(), value);
    }

    template <typename T>
    LogMaker& operator()(const char* key, const T& value) {
        mOStringStream << "\t" << key << ":" << value;
        return *this;
    }

    LogMaker& operator()(const std::string& key, bool value) {
        return this->operator()(key.c_str(), value ? "true" : "false");
    }
    LogMaker& operator()(const char* key, bool value) { return this->operator()(key, value ? "true" : "false"); }

    std::string GetContent() const { return mOStringStream.str(); }
};

#define LOG_X_IF(logger, condition, fields, level) \
    do { \
        if (condition && logger && logger->should_log(level)) { \
            LogMaker maker; \
            (void)maker fields; \
            logger->log(level, "{}:{}\t{}", __FILE__, __LINE__, maker.GetContent()); \
        } \
    } while (0)

#define LOG_TRACE(logger, fields) LOG_X_IF(logger, true, fields, spdlog::level::trace)
#define LOG_DEBUG(logger, fields) LOG_X_IF(logger, true, fields, spdlog::level::debug)
#define LOG_INFO(logger, fields) LOG_X_IF(logger, true, fields, spdlog::level::info)
#define LOG_WARNING(logger, fields) LOG_X_IF(logger, true, fields, spdlog::level::warn)
#define LOG_ERROR(logger, fields) LOG_X_IF(logger, true, fields, spdlog::level::err)

// Global logger.
// NOTE: call k8sagent::Logger::Instance().InitGlobalLoggers() in main() before using it.
extern k8sagent::Logger::logger sLogger;
