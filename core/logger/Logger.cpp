// Copyright 2024 k8s-agents-injector Authors
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "logger/Logger.h"

#include <boost/filesystem.hpp>
#include <json/json.h>
#include <spdlog/async.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_sinks.h>

#include "common/Flags.h"
#include "common/JsonUtil.h"
#include "common/RuntimeUtil.h"

DEFINE_FLAG_STRING(logger_config_file, "logger config file, relative to the execution dir", "k8sagent_log_conf.json");
DEFINE_FLAG_STRING(log_level, "overrides the level of the injector logger: TRACE, DEBUG, INFO, WARNING or ERROR", "");
DEFINE_FLAG_BOOL(async_logger_enable, "", true);
DEFINE_FLAG_INT32(async_logger_queue_size, "", 1024);
DEFINE_FLAG_INT32(async_logger_thread_num, "", 1);

k8sagent::Logger::logger sLogger;

namespace k8sagent {

namespace level = spdlog::level;

static const std::string DEFAULT_LOGGER_NAME = "/";
static const std::string INJECTOR_LOGGER_NAME = "/k8sagent/injector";
static const std::string DEFAULT_SINK_NAME = "FileSink";
static const std::string SINK_TYPE_FILE = "File";
static const std::string SINK_TYPE_STDERR = "Stderr";
static const std::string DEFAULT_PATTERN = "[%Y-%m-%d %H:%M:%S.%f]\t[%l]\t[%t]\t%v";

static bool MapStringToLevel(const std::string& str, level::level_enum& lvl) {
    if ("TRACE" == str)
        lvl = level::trace;
    else if ("DEBUG" == str)
        lvl = level::debug;
    else if ("INFO" == str)
        lvl = level::info;
    else if ("WARNING" == str)
        lvl = level::warn;
    else if ("ERROR" == str)
        lvl = level::err;
    else
        return false;
    return true;
}

Logger& Logger::Instance() {
    static Logger logger;
    return logger;
}

Logger::Logger() {
    if (BOOL_FLAG(async_logger_enable)) {
        spdlog::init_thread_pool(INT32_FLAG(async_logger_queue_size), INT32_FLAG(async_logger_thread_num));
    }
    LoadConfig(AbsolutePathFromExecutionDir(STRING_FLAG(logger_config_file)));
}

void Logger::InitGlobalLoggers() {
    if (sLogger) {
        return;
    }
    sLogger = GetLogger(INJECTOR_LOGGER_NAME);
    if (!sLogger) {
        sLogger = spdlog::stderr_logger_mt(INJECTOR_LOGGER_NAME);
        sLogger->set_pattern(DEFAULT_PATTERN);
    }
    if (!STRING_FLAG(log_level).empty()) {
        level::level_enum lvl;
        if (MapStringToLevel(STRING_FLAG(log_level), lvl)) {
            sLogger->set_level(lvl);
            sLogger->flush_on(lvl);
        } else {
            mInitMessages.push_back("unknown log_level " + STRING_FLAG(log_level) + ", keep the configured one");
        }
    }
    for (const auto& msg : mInitMessages) {
        LOG_DEBUG(sLogger, ("logger init", msg));
    }
    mInitMessages.clear();
}

Logger::logger Logger::GetLogger(const std::string& loggerName) {
    auto logger = spdlog::get(loggerName);
    return (logger != nullptr) ? logger : spdlog::get(DEFAULT_LOGGER_NAME);
}

Logger::logger Logger::CreateLogger(const std::string& loggerName, const SinkConfig& sinkCfg) {
    try {
        // Loggers writing the same file must share one sink, otherwise rotation races.
        spdlog::sink_ptr& sink = mSinks[sinkCfg.type == SINK_TYPE_FILE ? sinkCfg.logFilePath : sinkCfg.type];
        if (!sink) {
            if (sinkCfg.type == SINK_TYPE_STDERR) {
                sink = std::make_shared<spdlog::sinks::stderr_sink_mt>();
            } else {
                sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    sinkCfg.logFilePath, sinkCfg.maxLogFileSize, sinkCfg.maxLogFileNum);
            }
        }
        if (BOOL_FLAG(async_logger_enable)) {
            return std::make_shared<spdlog::async_logger>(
                loggerName, sink, spdlog::thread_pool(), spdlog::async_overflow_policy::overrun_oldest);
        }
        return std::make_shared<spdlog::logger>(loggerName, sink);
    } catch (const spdlog::spdlog_ex& e) {
        mInitMessages.push_back("failed to create logger " + loggerName + ": " + e.what());
    }
    return nullptr;
}

// Config file schema:
// {
//     "Loggers": {
//         "/": {"FileSink": "WARNING"},
//         "/k8sagent/injector": {"Console": "DEBUG"}
//     },
//     "Sinks": {
//         "FileSink": {"Type": "File", "MaxLogFileNum": 10, "MaxLogFileSize": 20000000,
//                      "LogFilePath": "k8sagent_injector.LOG"},
//         "Console": {"Type": "Stderr"}
//     }
// }
// A logger whose sink is not defined is dropped.
bool Logger::ParseConfig(const std::string& filePath,
                         std::map<std::string, LoggerConfig>& loggerCfgs,
                         std::map<std::string, SinkConfig>& sinkCfgs) {
    Json::Value jsonRoot;
    std::string errorMsg;
    if (!LoadJsonFile(filePath, jsonRoot, errorMsg)) {
        mInitMessages.push_back(errorMsg);
        return false;
    }
    if (!jsonRoot.isObject() || !jsonRoot["Sinks"].isObject() || !jsonRoot["Loggers"].isObject()) {
        mInitMessages.push_back("Sinks and Loggers are required in " + filePath);
        return false;
    }

    const auto& jsonSinks = jsonRoot["Sinks"];
    for (const auto& name : jsonSinks.getMemberNames()) {
        const auto& jsonSink = jsonSinks[name];
        SinkConfig sinkCfg;
        sinkCfg.type = GetStringValue(jsonSink, "Type");
        if (sinkCfg.type == SINK_TYPE_STDERR) {
            sinkCfgs[name] = std::move(sinkCfg);
            continue;
        }
        if (sinkCfg.type != SINK_TYPE_FILE || !jsonSink["MaxLogFileNum"].isIntegral()
            || jsonSink["MaxLogFileNum"].asInt() <= 0 || !jsonSink["MaxLogFileSize"].isIntegral()
            || jsonSink["MaxLogFileSize"].asInt64() <= 0 || GetStringValue(jsonSink, "LogFilePath").empty()) {
            mInitMessages.push_back("invalid sink config, skip sink " + name);
            continue;
        }
        sinkCfg.maxLogFileNum = jsonSink["MaxLogFileNum"].asUInt();
        sinkCfg.maxLogFileSize = jsonSink["MaxLogFileSize"].asUInt64();
        sinkCfg.logFilePath = AbsolutePathFromExecutionDir(jsonSink["LogFilePath"].asString());
        sinkCfgs[name] = std::move(sinkCfg);
    }

    const auto& jsonLoggers = jsonRoot["Loggers"];
    for (const auto& name : jsonLoggers.getMemberNames()) {
        const auto& jsonLogger = jsonLoggers[name];
        if (!jsonLogger.isObject() || jsonLogger.empty())
            continue;
        auto sinkName = jsonLogger.getMemberNames()[0];
        LoggerConfig logCfg;
        if (!jsonLogger[sinkName].isString() || sinkCfgs.find(sinkName) == sinkCfgs.end()
            || !MapStringToLevel(jsonLogger[sinkName].asString(), logCfg.level)) {
            mInitMessages.push_back("invalid logger config, skip logger " + name);
            continue;
        }
        logCfg.sinkName = std::move(sinkName);
        loggerCfgs[name] = std::move(logCfg);
    }
    return !loggerCfgs.empty();
}

void Logger::LoadConfig(const std::string& filePath) {
    std::map<std::string, LoggerConfig> loggerCfgs;
    std::map<std::string, SinkConfig> sinkCfgs;
    if (ParseConfig(filePath, loggerCfgs, sinkCfgs)) {
        mInitMessages.push_back("load log config from " + filePath);
    } else {
        loggerCfgs.clear();
        mInitMessages.push_back("use default log config");
    }
    AddDefaultConfig(loggerCfgs, sinkCfgs);

    bool defaultCreated = false;
    for (const auto& loggerIter : loggerCfgs) {
        const auto& name = loggerIter.first;
        const auto& loggerCfg = loggerIter.second;
        const auto& sinkCfg = sinkCfgs[loggerCfg.sinkName];

        if (sinkCfg.type == SINK_TYPE_FILE) {
            boost::system::error_code ec;
            boost::filesystem::path logPath(sinkCfg.logFilePath);
            if (logPath.has_parent_path()) {
                boost::filesystem::create_directories(logPath.parent_path(), ec);
                if (ec) {
                    mInitMessages.push_back("create log dir failed: " + logPath.parent_path().string() + ", error: "
                                            + ec.message());
                }
            }
        }

        auto logger = CreateLogger(name, sinkCfg);
        if (logger == nullptr) {
            continue;
        }
        spdlog::register_logger(logger);
        logger->set_level(loggerCfg.level);
        logger->set_pattern(DEFAULT_PATTERN);
        logger->flush_on(loggerCfg.level);
        defaultCreated = defaultCreated || name == DEFAULT_LOGGER_NAME;
    }

    // At least one logger has to be usable, the default one degrades to stderr.
    if (!defaultCreated) {
        try {
            spdlog::stderr_logger_mt(DEFAULT_LOGGER_NAME)->set_pattern(DEFAULT_PATTERN);
        } catch (const spdlog::spdlog_ex& e) {
            mInitMessages.push_back(std::string("failed to create stderr logger: ") + e.what());
        }
    }
}

void Logger::AddDefaultConfig(std::map<std::string, LoggerConfig>& loggerCfgs,
                              std::map<std::string, SinkConfig>& sinkCfgs) const {
    if (loggerCfgs.find(DEFAULT_LOGGER_NAME) != loggerCfgs.end()) {
        return;
    }
    if (sinkCfgs.find(DEFAULT_SINK_NAME) == sinkCfgs.end()) {
        SinkConfig sinkCfg;
        sinkCfg.type = SINK_TYPE_FILE;
        sinkCfg.maxLogFileNum = 10;
        sinkCfg.maxLogFileSize = 20000000;
        sinkCfg.logFilePath = AbsolutePathFromExecutionDir("k8sagent_injector.LOG");
        sinkCfgs[DEFAULT_SINK_NAME] = sinkCfg;
    }
    loggerCfgs[DEFAULT_LOGGER_NAME] = LoggerConfig{DEFAULT_SINK_NAME, level::warn};
    if (loggerCfgs.find(INJECTOR_LOGGER_NAME) == loggerCfgs.end()) {
        loggerCfgs[INJECTOR_LOGGER_NAME] = LoggerConfig{DEFAULT_SINK_NAME, level::info};
    }
}

} // namespace k8sagent
