#include "intoto/models/paths.hpp"
#include "intoto/models/helpers.hpp"

namespace intoto {
namespace models {

Result<MetadataPath> MetadataPath::New(const std::string& path) {
    Error err = SafePath(path);
    if (err.hasError()) {
        return err;
    }
    return MetadataPath(path);
}

std::vector<std::string> MetadataPath::Components() const {
    return SplitPath(path_);
}

std::string MetadataPath::WithExtension(const std::string& extension) const {
    return path_ + "." + extension;
}

std::ostream& operator<<(std::ostream& os, const MetadataPath& path) {
    return os << path.Value();
}

Result<TargetPath> TargetPath::New(const std::string& path) {
    Error err = SafePath(path);
    if (err.hasError()) {
        return err;
    }
    return TargetPath(path);
}

std::vector<std::string> TargetPath::Components() const {
    return SplitPath(path_);
}

Result<TargetPath> TargetPath::WithHashPrefix(const crypto::HashValue& hash) const {
    std::vector<std::string> components = Components();

    // SafePath 保证了路径非空，至少有一个组成部分
    std::string fileName = components.back();
    components.pop_back();
    components.push_back(hash.ToString() + "." + fileName);

    std::string joined;
    for (size_t i = 0; i < components.size(); ++i) {
        if (i > 0) joined += "/";
        joined += components[i];
    }
    return TargetPath::New(joined);
}

std::ostream& operator<<(std::ostream& os, const TargetPath& path) {
    return os << path.Value();
}

} // namespace models
} // namespace intoto
