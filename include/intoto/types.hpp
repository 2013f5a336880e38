#pragma once

#include <string>
#include <vector>
#include <optional>
#include <utility>
#include <cstdint>

namespace intoto {

// 签名方案常量
const std::string ED25519_SCHEME          = "ed25519";
const std::string ECDSA_P256_SCHEME       = "ecdsa-sha2-nistp256";
const std::string RSASSA_PSS_SHA256_SCHEME = "rsassa-pss-sha256";

// 密钥类型常量
const std::string ED25519_KEY = "ed25519";
const std::string ECDSA_KEY   = "ecdsa";
const std::string RSA_KEY     = "rsa";

// 错误分类
enum class ErrorKind {
    None,
    Encoding,            // 路径、字节或文档结构不合法
    IllegalArgument,     // 调用参数在结构上不兼容
    VerificationFailure, // 签名阈值未满足等
    Crypto,              // 密钥解析、签名原语失败
    Io                   // 文件读写
};

std::string ErrorKindToString(ErrorKind kind);

// 错误类型
class Error {
public:
    Error() : kind_(ErrorKind::None) {}
    Error(ErrorKind kind, const std::string& message) : kind_(kind), message_(message) {}

    const std::string& what() const { return message_; }
    ErrorKind kind() const { return kind_; }
    bool ok() const { return kind_ == ErrorKind::None; }
    bool hasError() const { return kind_ != ErrorKind::None; }

    // "Encoding: ..." 形式，用于日志和命令行输出
    std::string String() const;

private:
    ErrorKind kind_;
    std::string message_;
};

// 结果类型
template<typename T>
class Result {
public:
    Result(const T& value) : value_(value) {}
    Result(T&& value) : value_(std::move(value)) {}
    Result(const Error& error) : error_(error) {}

    bool ok() const { return value_.has_value(); }
    const T& value() const & { return *value_; }
    T& value() & { return *value_; }
    T&& value() && { return std::move(*value_); }
    const Error& error() const { return error_; }

private:
    std::optional<T> value_;
    Error error_;
};

} // namespace intoto
