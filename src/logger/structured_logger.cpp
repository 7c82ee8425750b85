// ---------------------------------------------------------------------------
// structured_logger.cpp
//
// spdlog 기반 구조화 JSON 감사 로거 구현.
// ---------------------------------------------------------------------------

#include "logger/structured_logger.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <json/json.h>
#include <spdlog/common.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_sinks.h>
#include <spdlog/spdlog.h>

namespace {

constexpr const char* kAuditLoggerName = "mcp-fw-audit";

// ---------------------------------------------------------------------------
// Helper: ISO8601 timestamp 포맷 (UTC, 밀리초)
// ---------------------------------------------------------------------------
std::string format_iso8601(const std::chrono::system_clock::time_point& tp) {
    const auto duration = tp.time_since_epoch();
    const auto seconds  = std::chrono::duration_cast<std::chrono::seconds>(duration);
    const auto millis   = std::chrono::duration_cast<std::chrono::milliseconds>(duration) - seconds;

    const std::time_t time_t_val = std::chrono::system_clock::to_time_t(tp);
    std::tm           tm_val{};
    gmtime_r(&time_t_val, &tm_val);

    std::ostringstream oss;
    oss << std::put_time(&tm_val, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
        << millis.count() << 'Z';
    return oss.str();
}

spdlog::level::level_enum to_spdlog_level(LogLevel level) {
    switch (level) {
        case LogLevel::kDebug: return spdlog::level::debug;
        case LogLevel::kInfo:  return spdlog::level::info;
        case LogLevel::kWarn:  return spdlog::level::warn;
        case LogLevel::kError: return spdlog::level::err;
    }
    return spdlog::level::info;
}

// ---------------------------------------------------------------------------
// Helper: JSON 한 줄 직렬화
// ---------------------------------------------------------------------------
std::string to_line(const Json::Value& event) {
    static const Json::StreamWriterBuilder kBuilder = [] {
        Json::StreamWriterBuilder b;
        b["indentation"] = "";
        b["emitUTF8"]    = true;
        return b;
    }();
    return Json::writeString(kBuilder, event);
}

Json::Value to_json_array(const std::vector<std::string>& items) {
    Json::Value arr(Json::arrayValue);
    for (const auto& item : items) {
        arr.append(item);
    }
    return arr;
}

}  // namespace

// ---------------------------------------------------------------------------
// StructuredLogger 생성자
// ---------------------------------------------------------------------------
StructuredLogger::StructuredLogger(LogLevel min_level, const std::filesystem::path& log_path)
    : min_level_(min_level)
    , log_path_(log_path)
{
    try {
        std::vector<spdlog::sink_ptr> sinks;

        // stderr sink (stdout 은 프로토콜 채널)
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_sink_mt>());

        if (!log_path_.empty()) {
            if (log_path_.has_parent_path()) {
                std::filesystem::create_directories(log_path_.parent_path());
            }
            // Rotating file sink (10MB, 3개 파일 유지)
            const std::size_t max_file_size = 10 * 1024 * 1024;
            const std::size_t max_files     = 3;
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                log_path_.string(), max_file_size, max_files));
        }

        logger_ = std::make_shared<spdlog::logger>(kAuditLoggerName, sinks.begin(), sinks.end());
        logger_->set_level(to_spdlog_level(min_level_));

        // 기본 패턴: 타임스탬프만 (구조화 로그는 각 메서드에서 JSON으로 생성)
        logger_->set_pattern("[%Y-%m-%d %H:%M:%S.%e] %v");

        // 매 이벤트마다 플러시 (감사 로그 유실 방지)
        logger_->flush_on(spdlog::level::trace);

    } catch (const spdlog::spdlog_ex& ex) {
        throw std::runtime_error(std::string("Audit logger initialization failed: ") + ex.what());
    } catch (const std::filesystem::filesystem_error& ex) {
        throw std::runtime_error(std::string("Audit logger initialization failed: ") + ex.what());
    }
}

StructuredLogger::~StructuredLogger() {
    if (logger_) {
        logger_->flush();
    }
}

// ---------------------------------------------------------------------------
// log_backend
// ---------------------------------------------------------------------------
void StructuredLogger::log_backend(const ConnectionLog& entry) {
    if (!logger_ || min_level_ > LogLevel::kInfo) {
        return;
    }

    Json::Value json(Json::objectValue);
    json["event"]     = entry.event;
    json["server"]    = entry.server;
    json["command"]   = entry.command;
    json["pid"]       = static_cast<Json::Int64>(entry.pid);
    if (entry.exit_status) {
        json["exit_status"] = *entry.exit_status;
    }
    json["timestamp"] = format_iso8601(entry.timestamp);

    logger_->info(to_line(json));
}

// ---------------------------------------------------------------------------
// log_catalog
// ---------------------------------------------------------------------------
void StructuredLogger::log_catalog(const CatalogLog& entry) {
    if (!logger_ || min_level_ > LogLevel::kInfo) {
        return;
    }

    Json::Value json(Json::objectValue);
    json["event"]             = "catalog_filtered";
    json["server"]            = entry.server;
    json["total"]             = static_cast<Json::UInt64>(entry.total);
    json["retained"]          = static_cast<Json::UInt64>(entry.retained);
    json["excluded"]          = to_json_array(entry.excluded);
    json["effective_allowed"] = to_json_array(entry.effective_allowed);
    json["timestamp"]         = format_iso8601(entry.timestamp);

    logger_->info(to_line(json));
}

// ---------------------------------------------------------------------------
// log_tool_call
// ---------------------------------------------------------------------------
void StructuredLogger::log_tool_call(const ToolCallLog& entry) {
    if (!logger_ || min_level_ > LogLevel::kInfo) {
        return;
    }

    Json::Value json(Json::objectValue);
    json["event"]         = "tool_call";
    json["server"]        = entry.server;
    json["tool"]          = entry.tool;
    json["backend_error"] = entry.backend_error;
    json["tool_error"]    = entry.tool_error;
    json["timestamp"]     = format_iso8601(entry.timestamp);
    json["duration_us"]   = static_cast<Json::Int64>(entry.duration.count());

    logger_->info(to_line(json));
}

// ---------------------------------------------------------------------------
// log_block
// ---------------------------------------------------------------------------
void StructuredLogger::log_block(const BlockLog& entry) {
    if (!logger_ || min_level_ > LogLevel::kWarn) {
        return;
    }

    Json::Value json(Json::objectValue);
    json["event"]     = "tool_blocked";
    json["server"]    = entry.server;
    json["tool"]      = entry.tool;
    json["reason"]    = entry.reason;
    json["timestamp"] = format_iso8601(entry.timestamp);

    logger_->warn(to_line(json));
}

void StructuredLogger::flush() {
    if (logger_) {
        logger_->flush();
    }
}
