#include "intoto/models/link.hpp"
#include "intoto/utils/tools.hpp"

namespace intoto {
namespace models {

using json = nlohmann::json;

namespace {

json artifactsToJson(const ArtifactMap& artifacts) {
    json j = json::object();
    for (const auto& [path, description] : artifacts) {
        json d = json::object();
        for (const auto& [alg, digest] : description) {
            d[alg] = digest;
        }
        j[path.Value()] = d;
    }
    return j;
}

Result<ArtifactMap> artifactsFromJson(const json& j, const std::string& field) {
    if (!j.is_object()) {
        return Error(ErrorKind::Encoding, "link field '" + field + "' must be an object");
    }
    ArtifactMap artifacts;
    for (auto it = j.begin(); it != j.end(); ++it) {
        auto path = VirtualTargetPath::New(it.key());
        if (!path.ok()) {
            return path.error();
        }
        artifacts.emplace(std::move(path).value(), it.value().get<TargetDescription>());
    }
    return artifacts;
}

} // namespace

Result<LinkMetadata> LinkMetadata::New(const std::string& name,
                                       ArtifactMap materials,
                                       ArtifactMap products,
                                       std::map<std::string, std::string> env,
                                       std::map<std::string, std::string> byproducts) {
    if (name.empty()) {
        return Error(ErrorKind::Encoding, "link name cannot be empty");
    }

    LinkMetadata link;
    link.name_ = name;
    link.materials_ = std::move(materials);
    link.products_ = std::move(products);
    link.env_ = std::move(env);
    link.byproducts_ = std::move(byproducts);
    return link;
}

json LinkMetadata::toJson() const {
    json j;
    j["_type"] = LINK_TYPE;
    j["name"] = name_;
    j["materials"] = artifactsToJson(materials_);
    j["products"] = artifactsToJson(products_);
    j["env"] = env_;
    j["byproducts"] = byproducts_;
    return j;
}

Error LinkMetadata::fromJson(const json& j) {
    if (!j.is_object()) {
        return Error(ErrorKind::Encoding, "link metadata must be a JSON object");
    }

    std::string type = j.at("_type").get<std::string>();
    if (type != LINK_TYPE) {
        return Error(ErrorKind::Encoding, "Attempted to decode link metadata labeled as \"" + type + "\"");
    }

    auto materials = artifactsFromJson(j.at("materials"), "materials");
    if (!materials.ok()) {
        return materials.error();
    }
    auto products = artifactsFromJson(j.at("products"), "products");
    if (!products.ok()) {
        return products.error();
    }

    std::map<std::string, std::string> env;
    if (j.contains("env")) {
        env = j.at("env").get<std::map<std::string, std::string>>();
    }
    std::map<std::string, std::string> byproducts;
    if (j.contains("byproducts")) {
        byproducts = j.at("byproducts").get<std::map<std::string, std::string>>();
    }

    auto link = New(j.at("name").get<std::string>(),
                    std::move(materials).value(),
                    std::move(products).value(),
                    std::move(env),
                    std::move(byproducts));
    if (!link.ok()) {
        return link.error();
    }
    *this = std::move(link).value();
    return Error();
}

bool LinkMetadata::operator==(const LinkMetadata& other) const {
    return name_ == other.name_ &&
           materials_ == other.materials_ &&
           products_ == other.products_ &&
           env_ == other.env_ &&
           byproducts_ == other.byproducts_;
}

Result<TargetDescription> DescribeFile(const std::string& filePath, crypto::HashAlgorithm alg) {
    auto content = utils::ReadFile(filePath);
    if (!content.ok()) {
        return content.error();
    }
    auto hash = crypto::CalculateHash(alg, content.value());
    if (!hash.ok()) {
        return hash.error();
    }
    TargetDescription description;
    description[crypto::HashAlgorithmToString(alg)] = hash.value().ToString();
    return description;
}

// LinkMetadataBuilder 实现

LinkMetadataBuilder& LinkMetadataBuilder::Name(const std::string& name) {
    name_ = name;
    return *this;
}

LinkMetadataBuilder& LinkMetadataBuilder::AddMaterial(const VirtualTargetPath& path,
                                                      const TargetDescription& description) {
    materials_.insert_or_assign(path, description);
    return *this;
}

LinkMetadataBuilder& LinkMetadataBuilder::AddProduct(const VirtualTargetPath& path,
                                                     const TargetDescription& description) {
    products_.insert_or_assign(path, description);
    return *this;
}

LinkMetadataBuilder& LinkMetadataBuilder::AddEnv(const std::string& key, const std::string& value) {
    env_[key] = value;
    return *this;
}

LinkMetadataBuilder& LinkMetadataBuilder::AddByproduct(const std::string& key, const std::string& value) {
    byproducts_[key] = value;
    return *this;
}

Error LinkMetadataBuilder::AddMaterialFile(const VirtualTargetPath& path, const std::string& filePath,
                                           crypto::HashAlgorithm alg) {
    auto description = DescribeFile(filePath, alg);
    if (!description.ok()) {
        return description.error();
    }
    AddMaterial(path, description.value());
    return Error();
}

Error LinkMetadataBuilder::AddProductFile(const VirtualTargetPath& path, const std::string& filePath,
                                          crypto::HashAlgorithm alg) {
    auto description = DescribeFile(filePath, alg);
    if (!description.ok()) {
        return description.error();
    }
    AddProduct(path, description.value());
    return Error();
}

Result<LinkMetadata> LinkMetadataBuilder::Build() const {
    return LinkMetadata::New(name_, materials_, products_, env_, byproducts_);
}

} // namespace models
} // namespace intoto
