#pragma once

#include <string>
#include <map>
#include <cstdint>
#include <nlohmann/json.hpp>
#include "intoto/types.hpp"
#include "intoto/crypto/hash.hpp"
#include "intoto/models/helpers.hpp"

namespace intoto {
namespace models {

const std::string LINK_TYPE = "link";

using ArtifactMap = std::map<VirtualTargetPath, TargetDescription>;

// in-toto 链接：记录一个供应链步骤的输入（materials）和输出（products）
// 仅是数据对象，不含任何验证逻辑
class LinkMetadata {
public:
    LinkMetadata() = default;

    static Result<LinkMetadata> New(const std::string& name,
                                    ArtifactMap materials,
                                    ArtifactMap products,
                                    std::map<std::string, std::string> env,
                                    std::map<std::string, std::string> byproducts);

    const std::string& Name() const { return name_; }
    const ArtifactMap& Materials() const { return materials_; }
    const ArtifactMap& Products() const { return products_; }
    const std::map<std::string, std::string>& Env() const { return env_; }
    const std::map<std::string, std::string>& Byproducts() const { return byproducts_; }

    // 链接没有版本字段
    uint32_t Version() const { return 1; }

    // JSON 序列化支持，线上格式带 "_type": "link"
    nlohmann::json toJson() const;
    Error fromJson(const nlohmann::json& j);

    bool operator==(const LinkMetadata& other) const;
    bool operator!=(const LinkMetadata& other) const { return !(*this == other); }

private:
    std::string name_;
    ArtifactMap materials_;
    ArtifactMap products_;
    std::map<std::string, std::string> env_;
    std::map<std::string, std::string> byproducts_;
};

// 逐步构造 LinkMetadata
class LinkMetadataBuilder {
public:
    LinkMetadataBuilder& Name(const std::string& name);
    LinkMetadataBuilder& AddMaterial(const VirtualTargetPath& path, const TargetDescription& description);
    LinkMetadataBuilder& AddProduct(const VirtualTargetPath& path, const TargetDescription& description);
    LinkMetadataBuilder& AddEnv(const std::string& key, const std::string& value);
    LinkMetadataBuilder& AddByproduct(const std::string& key, const std::string& value);

    // 读取本地文件并以其摘要登记为material/product
    Error AddMaterialFile(const VirtualTargetPath& path, const std::string& filePath,
                          crypto::HashAlgorithm alg = crypto::HashAlgorithm::Sha256);
    Error AddProductFile(const VirtualTargetPath& path, const std::string& filePath,
                         crypto::HashAlgorithm alg = crypto::HashAlgorithm::Sha256);

    Result<LinkMetadata> Build() const;

private:
    std::string name_;
    ArtifactMap materials_;
    ArtifactMap products_;
    std::map<std::string, std::string> env_;
    std::map<std::string, std::string> byproducts_;
};

// 计算文件摘要，生成构件描述
Result<TargetDescription> DescribeFile(const std::string& filePath, crypto::HashAlgorithm alg);

} // namespace models
} // namespace intoto
