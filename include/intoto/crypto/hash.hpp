#pragma once

#include <string>
#include <vector>
#include <ostream>
#include "intoto/types.hpp"

namespace intoto {
namespace crypto {

enum class HashAlgorithm {
    Sha256,
    Sha512
};

std::string HashAlgorithmToString(HashAlgorithm alg);
Result<HashAlgorithm> ParseHashAlgorithm(const std::string& name);

// 摘要值，以小写十六进制显示
class HashValue {
public:
    HashValue() = default;
    explicit HashValue(std::vector<uint8_t> value) : value_(std::move(value)) {}

    // 从十六进制字符串解析
    static Result<HashValue> FromHex(const std::string& hex);

    const std::vector<uint8_t>& Value() const { return value_; }
    std::string ToString() const;

    bool operator==(const HashValue& other) const { return value_ == other.value_; }
    bool operator!=(const HashValue& other) const { return value_ != other.value_; }

private:
    std::vector<uint8_t> value_;
};

std::ostream& operator<<(std::ostream& os, const HashValue& hash);

// 计算数据的摘要
Result<HashValue> CalculateHash(HashAlgorithm alg, const std::vector<uint8_t>& data);

} // namespace crypto
} // namespace intoto
