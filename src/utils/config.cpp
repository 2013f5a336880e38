#include "intoto/utils/config.hpp"
#include "intoto/utils/tools.hpp"

namespace intoto {
namespace utils {

using json = nlohmann::json;

json Config::toJson() const {
    json j;
    j["logging"] = {
        {"level", logging.level},
        {"format", logging.format},
        {"output", logging.output},
        {"file", logging.file}
    };
    j["verify"] = {
        {"threshold", verify.threshold},
        {"parallel", verify.parallel}
    };
    return j;
}

Error Config::fromJson(const json& j) {
    if (!j.is_object()) {
        return Error(ErrorKind::Encoding, "config must be a JSON object");
    }

    try {
        if (j.contains("logging")) {
            const json& l = j.at("logging");
            logging.level = l.value("level", logging.level);
            logging.format = l.value("format", logging.format);
            logging.output = l.value("output", logging.output);
            logging.file = l.value("file", logging.file);
        }
        if (j.contains("verify")) {
            const json& v = j.at("verify");
            verify.threshold = v.value("threshold", verify.threshold);
            verify.parallel = v.value("parallel", verify.parallel);
        }
    } catch (const json::exception& e) {
        return Error(ErrorKind::Encoding, std::string("invalid config: ") + e.what());
    }

    if (logging.format != "json" && logging.format != "text") {
        return Error(ErrorKind::Encoding, "invalid log format: " + logging.format);
    }
    if (logging.output != "console" && logging.output != "file") {
        return Error(ErrorKind::Encoding, "invalid log output: " + logging.output);
    }
    return Error();
}

Result<Config> LoadConfig(const std::string& path) {
    auto content = ReadFile(path);
    if (!content.ok()) {
        return content.error();
    }

    json j = json::parse(content.value().begin(), content.value().end(), nullptr, false);
    if (j.is_discarded()) {
        return Error(ErrorKind::Encoding, "config file is not valid JSON: " + path);
    }

    Config config;
    Error err = config.fromJson(j);
    if (err.hasError()) {
        return err;
    }
    return config;
}

} // namespace utils
} // namespace intoto
