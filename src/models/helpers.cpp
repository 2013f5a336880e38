#include "intoto/models/helpers.hpp"

namespace intoto {
namespace models {

Error SafePath(const std::string& path) {
    if (path.empty()) {
        return Error(ErrorKind::Encoding, "Path cannot be empty");
    }

    if (path.front() == '/') {
        return Error(ErrorKind::Encoding, "Cannot start with '/': " + path);
    }

    for (const auto& component : SplitPath(path)) {
        if (component == "..") {
            return Error(ErrorKind::Encoding, "Path cannot have a '..' component: " + path);
        }
    }

    return Error();
}

std::vector<std::string> SplitPath(const std::string& path) {
    std::vector<std::string> components;
    size_t start = 0;
    while (true) {
        size_t pos = path.find('/', start);
        if (pos == std::string::npos) {
            components.push_back(path.substr(start));
            break;
        }
        components.push_back(path.substr(start, pos - start));
        start = pos + 1;
    }
    return components;
}

Result<VirtualTargetPath> VirtualTargetPath::New(const std::string& path) {
    Error err = SafePath(path);
    if (err.hasError()) {
        return err;
    }
    return VirtualTargetPath(path);
}

std::ostream& operator<<(std::ostream& os, const VirtualTargetPath& path) {
    return os << path.Value();
}

} // namespace models
} // namespace intoto
