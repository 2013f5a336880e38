#pragma once

#include <string>
#include <vector>
#include <ostream>
#include <nlohmann/json.hpp>
#include "intoto/types.hpp"
#include "intoto/crypto/hash.hpp"

namespace intoto {
namespace models {

// 元数据路径，不含扩展名（扩展名由数据交换格式决定）
//
//   MetadataPath::New("root")       正确
//   MetadataPath::New("root.json")  不要这样写
class MetadataPath {
public:
    static Result<MetadataPath> New(const std::string& path);

    const std::string& Value() const { return path_; }
    std::vector<std::string> Components() const;

    // 加上数据交换格式的扩展名，如 "root" -> "root.json"
    std::string WithExtension(const std::string& extension) const;

    bool operator==(const MetadataPath& other) const { return path_ == other.path_; }
    bool operator!=(const MetadataPath& other) const { return path_ != other.path_; }
    bool operator<(const MetadataPath& other) const { return path_ < other.path_; }

    nlohmann::json toJson() const { return path_; }

private:
    explicit MetadataPath(std::string path) : path_(std::move(path)) {}

    std::string path_;
};

std::ostream& operator<<(std::ostream& os, const MetadataPath& path);

// 目标文件的真实路径
class TargetPath {
public:
    static Result<TargetPath> New(const std::string& path);

    const std::string& Value() const { return path_; }

    // 拆分为组成部分，可拼接成URL路径或文件系统路径
    std::vector<std::string> Components() const;

    // 在最后一个组成部分前加上 "<hash>."，目录结构不变
    // TargetPath("foo/bar").WithHashPrefix(H) -> "foo/H.bar"
    Result<TargetPath> WithHashPrefix(const crypto::HashValue& hash) const;

    bool operator==(const TargetPath& other) const { return path_ == other.path_; }
    bool operator!=(const TargetPath& other) const { return path_ != other.path_; }
    bool operator<(const TargetPath& other) const { return path_ < other.path_; }

    nlohmann::json toJson() const { return path_; }

private:
    explicit TargetPath(std::string path) : path_(std::move(path)) {}

    std::string path_;
};

std::ostream& operator<<(std::ostream& os, const TargetPath& path);

} // namespace models
} // namespace intoto
