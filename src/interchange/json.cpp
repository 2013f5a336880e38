#include "intoto/interchange/json.hpp"

namespace intoto {
namespace interchange {

Result<std::vector<uint8_t>> Json::Canonicalize(const RawData& raw) {
    auto canonical = utils::MarshalCanonical(raw);
    if (!canonical.ok()) {
        return canonical.error();
    }
    const std::string& s = canonical.value();
    return std::vector<uint8_t>(s.begin(), s.end());
}

Result<Json::RawData> Json::FromSlice(const std::vector<uint8_t>& bytes) {
    // 超过最大层数的容器不会被构造，解析结束后整体拒绝
    bool tooDeep = false;
    RawData::parser_callback_t limitDepth = [&tooDeep](int depth, RawData::parse_event_t event, RawData&) {
        if ((event == RawData::parse_event_t::object_start || event == RawData::parse_event_t::array_start) &&
            depth >= utils::MAX_JSON_DEPTH) {
            tooDeep = true;
            return false;
        }
        return true;
    };

    RawData raw = RawData::parse(bytes.begin(), bytes.end(), limitDepth, false);
    if (raw.is_discarded()) {
        return Error(ErrorKind::Encoding, "malformed JSON");
    }
    if (tooDeep) {
        return Error(ErrorKind::Encoding,
                     "JSON nesting exceeds " + std::to_string(utils::MAX_JSON_DEPTH) + " levels");
    }
    return raw;
}

Result<std::vector<uint8_t>> Json::ToVec(const RawData& raw) {
    return Canonicalize(raw);
}

Result<std::vector<uint8_t>> JsonPretty::ToVec(const RawData& raw) {
    try {
        std::string s = raw.dump(2, ' ', false, nlohmann::json::error_handler_t::strict);
        s.push_back('\n');
        return std::vector<uint8_t>(s.begin(), s.end());
    } catch (const nlohmann::json::exception& e) {
        return Error(ErrorKind::Encoding, std::string("failed to encode JSON: ") + e.what());
    }
}

} // namespace interchange
} // namespace intoto
