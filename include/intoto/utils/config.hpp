#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "intoto/types.hpp"
#include "intoto/utils/logger.hpp"

namespace intoto {
namespace utils {

// 验证相关的默认值
struct VerifyConfig {
    int threshold = 1;      // 未在命令行指定时使用的签名阈值
    bool parallel = false;  // 使用 VerifyParallel 代替顺序验证
};

// 工具配置，对应配置文件:
// {
//   "logging": {"level": "debug", "format": "json", "output": "file", "file": "intoto.log"},
//   "verify":  {"threshold": 2, "parallel": true}
// }
struct Config {
    LoggingConfig logging;
    VerifyConfig verify;

    nlohmann::json toJson() const;
    // 缺失的键保留默认值
    Error fromJson(const nlohmann::json& j);
};

// 从JSON文件加载配置
Result<Config> LoadConfig(const std::string& path);

} // namespace utils
} // namespace intoto
