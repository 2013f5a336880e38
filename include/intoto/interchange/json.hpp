#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "intoto/types.hpp"
#include "intoto/utils/tools.hpp"

namespace intoto {
namespace interchange {

// 数据交换格式约定（DataInterchange）：
//
//   using RawData = ...;                                  支持结构相等比较
//   static std::string Extension();
//   template<typename T> static Result<RawData> Serialize(const T&);
//   template<typename T> static Result<T> Deserialize(const RawData&);
//   static Result<std::vector<uint8_t>> Canonicalize(const RawData&);
//   static Result<RawData> FromSlice(const std::vector<uint8_t>&);
//   static Result<std::vector<uint8_t>> ToVec(const RawData&);
//
// Canonicalize 对逻辑相等的值必须给出相同的字节，不依赖输入中的空白和键顺序。
// 可序列化类型提供 `nlohmann::json toJson() const` 和 `Error fromJson(const nlohmann::json&)`。

// JSON，ToVec 输出规范化的紧凑形式
class Json {
public:
    using RawData = nlohmann::json;

    static std::string Extension() { return "json"; }

    template<typename T>
    static Result<RawData> Serialize(const T& value) {
        try {
            return RawData(value.toJson());
        } catch (const nlohmann::json::exception& e) {
            return Error(ErrorKind::Encoding, std::string("failed to serialize: ") + e.what());
        }
    }

    template<typename T>
    static Result<T> Deserialize(const RawData& raw) {
        T value;
        try {
            Error err = value.fromJson(raw);
            if (err.hasError()) {
                return err;
            }
        } catch (const nlohmann::json::exception& e) {
            return Error(ErrorKind::Encoding, std::string("failed to deserialize: ") + e.what());
        }
        return value;
    }

    static Result<std::vector<uint8_t>> Canonicalize(const RawData& raw);

    static Result<RawData> FromSlice(const std::vector<uint8_t>& bytes);

    static Result<std::vector<uint8_t>> ToVec(const RawData& raw);
};

// 便于人阅读的JSON，规范化规则与 Json 相同，ToVec 带缩进
class JsonPretty : public Json {
public:
    static Result<std::vector<uint8_t>> ToVec(const RawData& raw);
};

} // namespace interchange
} // namespace intoto
