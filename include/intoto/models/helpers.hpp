#pragma once

#include <string>
#include <vector>
#include <map>
#include <ostream>
#include "intoto/types.hpp"

namespace intoto {
namespace models {

// 路径安全检查：非空、不以 '/' 开头、任何以 '/' 分隔的组成部分都不能恰好是 ".."
// 不做任何规范化
Error SafePath(const std::string& path);

// 按 '/' 拆分路径
std::vector<std::string> SplitPath(const std::string& path);

// 链接中 materials/products 的键，指向一个构件
class VirtualTargetPath {
public:
    static Result<VirtualTargetPath> New(const std::string& path);

    const std::string& Value() const { return path_; }
    std::vector<std::string> Components() const { return SplitPath(path_); }

    bool operator==(const VirtualTargetPath& other) const { return path_ == other.path_; }
    bool operator!=(const VirtualTargetPath& other) const { return path_ != other.path_; }
    bool operator<(const VirtualTargetPath& other) const { return path_ < other.path_; }

private:
    explicit VirtualTargetPath(std::string path) : path_(std::move(path)) {}

    std::string path_;
};

std::ostream& operator<<(std::ostream& os, const VirtualTargetPath& path);

// 构件描述：哈希算法名 -> 十六进制摘要
using TargetDescription = std::map<std::string, std::string>;

} // namespace models
} // namespace intoto
