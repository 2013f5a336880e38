#pragma once
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <openssl/evp.h>
#include "intoto/types.hpp"

namespace intoto {
namespace utils {

// JSON 容器的最大嵌套层数，更深的输入视为编码错误
const int MAX_JSON_DEPTH = 128;

// 将JSON对象转换为规范化字符串
// 键按字节序排序，无空白，字符串只转义 '"' 和 '\\'，不接受浮点数
Result<std::string> MarshalCanonical(const nlohmann::json& obj);

// 内部哈希计算函数
Result<std::vector<uint8_t>> _CalculateSHAHash(const std::vector<uint8_t>& data, const EVP_MD* algorithm);

// 计算数据的SHA-256哈希
Result<std::vector<uint8_t>> CalculateSHA256Hash(const std::vector<uint8_t>& data);
// 计算数据的SHA-512哈希
Result<std::vector<uint8_t>> CalculateSHA512Hash(const std::vector<uint8_t>& data);

// 将字节数组转换为十六进制字符串
std::string HexEncode(const std::vector<uint8_t>& data);
// 将十六进制字符串转换为字节数组
Result<std::vector<uint8_t>> HexDecode(const std::string& hex);

// 读取整个文件
Result<std::vector<uint8_t>> ReadFile(const std::string& path);
// 写入整个文件（覆盖）
Error WriteFile(const std::string& path, const std::vector<uint8_t>& data);

// 将vector转换为字符串表示（用于日志记录）
std::string vectorToString(const std::vector<std::string>& vec);

}
}
