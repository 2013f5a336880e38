#pragma once

#include <string>
#include <iostream>
#include <sstream>
#include <fstream>
#include <mutex>
#include <map>
#include <memory>
#include <vector>
#include <chrono>
#include <iomanip>
#include <nlohmann/json.hpp>

namespace intoto {
namespace utils {

// 日志级别枚举
enum class LogLevel : int {
    Panic = 0,    // 最严重的错误
    Fatal = 1,    // 严重错误
    Error = 2,    // 错误但可恢复
    Warn  = 3,    // 警告
    Info  = 4,    // 信息性消息
    Debug = 5     // 调试信息
};

// 日志配置
struct LoggingConfig {
    std::string level = "info";      // 日志级别: debug, info, warn, error, fatal, panic
    std::string format = "text";     // 日志格式: json, text
    std::string output = "console";  // 日志输出: console, file
    std::string file = "intoto.log"; // 日志文件路径(当output为file时使用)
};

// 获取当前时间字符串的工具函数
std::string GetTimeString();

// 日志条目结构
struct LogEntry {
    LogLevel level;
    std::string message;
    std::string time;
    std::map<std::string, std::string> fields;
};

// 日志格式化器接口
class LogFormatter {
public:
    virtual ~LogFormatter() = default;
    virtual std::string Format(const LogEntry& entry) = 0;
};

// JSON格式化器
class JSONFormatter : public LogFormatter {
public:
    std::string Format(const LogEntry& entry) override;
};

// 文本格式化器
class TextFormatter : public LogFormatter {
public:
    std::string Format(const LogEntry& entry) override;
};

// 日志输出接口
class LogOutput {
public:
    virtual ~LogOutput() = default;
    virtual void Write(const std::string& message) = 0;
};

// 控制台输出（stderr，stdout留给命令输出）
class ConsoleOutput : public LogOutput {
public:
    void Write(const std::string& message) override;
};

// 文件输出
class FileOutput : public LogOutput {
public:
    explicit FileOutput(const std::string& filename);
    ~FileOutput();
    void Write(const std::string& message) override;

private:
    std::ofstream file_;
};

// 内存输出，保存格式化后的每一行
class MemoryOutput : public LogOutput {
public:
    explicit MemoryOutput(std::shared_ptr<std::vector<std::string>> lines) : lines_(std::move(lines)) {}
    void Write(const std::string& message) override;

private:
    std::shared_ptr<std::vector<std::string>> lines_;
};

// 日志上下文
class LogContext {
public:
    LogContext() = default;
    LogContext(std::map<std::string, std::string> fields) : fields_(std::move(fields)) {}

    const std::map<std::string, std::string>& Fields() const { return fields_; }

    void WithField(const std::string& key, const std::string& value);

    // 创建带有新字段的上下文
    LogContext With(const std::string& key, const std::string& value) const;

private:
    std::map<std::string, std::string> fields_;
};

// 主日志类
class Logger {
public:
    static Logger& GetInstance();

    // 按配置重新初始化级别、格式和输出
    void Initialize(const LoggingConfig& config);

    void SetLevel(LogLevel level);
    void SetLevel(const std::string& level);
    LogLevel GetLevel() const;

    void AddOutput(std::unique_ptr<LogOutput> output);
    void ClearOutputs();
    void SetFormatter(std::unique_ptr<LogFormatter> formatter);

    void Log(const LogEntry& entry);
    void Log(LogLevel level, const std::string& message, const LogContext& ctx = LogContext());

    void Debug(const std::string& message, const LogContext& ctx = LogContext());
    void Info(const std::string& message, const LogContext& ctx = LogContext());
    void Warn(const std::string& message, const LogContext& ctx = LogContext());
    void Error(const std::string& message, const LogContext& ctx = LogContext());
    void Fatal(const std::string& message, const LogContext& ctx = LogContext());
    void Panic(const std::string& message, const LogContext& ctx = LogContext());

    // 调整日志级别，increment为true时输出更详细
    bool AdjustLogLevel(bool increment);

private:
    Logger();
    ~Logger() = default;

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    LogLevel level_ = LogLevel::Info;
    std::vector<std::unique_ptr<LogOutput>> outputs_;
    std::unique_ptr<LogFormatter> formatter_;
    mutable std::mutex mutex_;

    bool ShouldLog(LogLevel level) const;
};

inline Logger& GetLogger() {
    return Logger::GetInstance();
}

// 从字符串解析日志级别
LogLevel ParseLogLevel(const std::string& level);

// 获取日志级别名称
std::string LogLevelToString(LogLevel level);

} // namespace utils
} // namespace intoto
