#include "intoto/utils/tools.hpp"
#include <openssl/sha.h>
#include <fstream>
#include <sstream>
#include <iomanip>
#include <cctype>

namespace intoto {
namespace utils {

namespace {

void writeCanonicalString(const std::string& s, std::string& out) {
    out.push_back('"');
    for (char c : s) {
        if (c == '"' || c == '\\') {
            out.push_back('\\');
        }
        out.push_back(c);
    }
    out.push_back('"');
}

// depth 为外层容器的个数
Error writeCanonical(const nlohmann::json& j, std::string& out, int depth) {
    if ((j.is_array() || j.is_object()) && depth >= MAX_JSON_DEPTH) {
        return Error(ErrorKind::Encoding, "JSON nesting exceeds " + std::to_string(MAX_JSON_DEPTH) + " levels");
    }

    switch (j.type()) {
        case nlohmann::json::value_t::null:
            out += "null";
            return Error();
        case nlohmann::json::value_t::boolean:
            out += j.get<bool>() ? "true" : "false";
            return Error();
        case nlohmann::json::value_t::number_integer:
            out += std::to_string(j.get<int64_t>());
            return Error();
        case nlohmann::json::value_t::number_unsigned:
            out += std::to_string(j.get<uint64_t>());
            return Error();
        case nlohmann::json::value_t::number_float:
            return Error(ErrorKind::Encoding, "canonical JSON does not support floating point numbers");
        case nlohmann::json::value_t::string:
            writeCanonicalString(j.get_ref<const std::string&>(), out);
            return Error();
        case nlohmann::json::value_t::array: {
            out.push_back('[');
            bool first = true;
            for (const auto& element : j) {
                if (!first) out.push_back(',');
                first = false;
                Error err = writeCanonical(element, out, depth + 1);
                if (err.hasError()) {
                    return err;
                }
            }
            out.push_back(']');
            return Error();
        }
        case nlohmann::json::value_t::object: {
            // nlohmann::json 的对象底层是 std::map，迭代顺序即键的字节序
            out.push_back('{');
            bool first = true;
            for (auto it = j.begin(); it != j.end(); ++it) {
                if (!first) out.push_back(',');
                first = false;
                writeCanonicalString(it.key(), out);
                out.push_back(':');
                Error err = writeCanonical(it.value(), out, depth + 1);
                if (err.hasError()) {
                    return err;
                }
            }
            out.push_back('}');
            return Error();
        }
        default:
            return Error(ErrorKind::Encoding, "value cannot be represented as canonical JSON");
    }
}

} // namespace

Result<std::string> MarshalCanonical(const nlohmann::json& obj) {
    std::string out;
    Error err = writeCanonical(obj, out, 0);
    if (err.hasError()) {
        return err;
    }
    return out;
}

Result<std::vector<uint8_t>> CalculateSHA256Hash(const std::vector<uint8_t>& data) {
    return _CalculateSHAHash(data, EVP_sha256());
}

Result<std::vector<uint8_t>> CalculateSHA512Hash(const std::vector<uint8_t>& data) {
    return _CalculateSHAHash(data, EVP_sha512());
}

Result<std::vector<uint8_t>> _CalculateSHAHash(const std::vector<uint8_t>& data, const EVP_MD* algorithm) {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hashLen = 0;
    EVP_MD_CTX* mdctx = EVP_MD_CTX_new();
    if (mdctx == nullptr) {
        return Error(ErrorKind::Crypto, "failed to create digest context");
    }

    if (EVP_DigestInit_ex(mdctx, algorithm, nullptr) != 1) {
        EVP_MD_CTX_free(mdctx);
        return Error(ErrorKind::Crypto, "failed to initialise digest");
    }

    if (EVP_DigestUpdate(mdctx, data.data(), data.size()) != 1) {
        EVP_MD_CTX_free(mdctx);
        return Error(ErrorKind::Crypto, "failed to update digest");
    }

    if (EVP_DigestFinal_ex(mdctx, hash, &hashLen) != 1) {
        EVP_MD_CTX_free(mdctx);
        return Error(ErrorKind::Crypto, "failed to finalise digest");
    }

    EVP_MD_CTX_free(mdctx);
    return std::vector<uint8_t>(hash, hash + hashLen);
}

std::string HexEncode(const std::vector<uint8_t>& data) {
    std::stringstream ss;
    ss << std::hex;
    for (size_t i = 0; i < data.size(); i++) {
        ss << std::setw(2) << std::setfill('0') << static_cast<int>(data[i]);
    }
    return ss.str();
}

Result<std::vector<uint8_t>> HexDecode(const std::string& hex) {
    if (hex.size() % 2 != 0) {
        return Error(ErrorKind::Encoding, "hex string must have even length");
    }

    std::vector<uint8_t> data;
    data.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2) {
        char hi = hex[i];
        char lo = hex[i + 1];
        if (!std::isxdigit(static_cast<unsigned char>(hi)) || !std::isxdigit(static_cast<unsigned char>(lo))) {
            return Error(ErrorKind::Encoding, "invalid hex character in: " + hex.substr(i, 2));
        }
        data.push_back(static_cast<uint8_t>(std::stoul(hex.substr(i, 2), nullptr, 16)));
    }
    return data;
}

Result<std::vector<uint8_t>> ReadFile(const std::string& path) {
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file) {
        return Error(ErrorKind::Io, "failed to open file: " + path);
    }

    auto size = file.tellg();
    if (size < 0) {
        return Error(ErrorKind::Io, "failed to determine size of file: " + path);
    }
    file.seekg(0, std::ios::beg);

    std::vector<uint8_t> content(static_cast<size_t>(size));
    if (size > 0 && !file.read(reinterpret_cast<char*>(content.data()), size)) {
        return Error(ErrorKind::Io, "failed to read file: " + path);
    }
    return content;
}

Error WriteFile(const std::string& path, const std::vector<uint8_t>& data) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        return Error(ErrorKind::Io, "failed to open file for writing: " + path);
    }
    file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    if (!file) {
        return Error(ErrorKind::Io, "failed to write file: " + path);
    }
    return Error();
}

std::string vectorToString(const std::vector<std::string>& vec) {
    std::string result = "[";
    for (size_t i = 0; i < vec.size(); ++i) {
        if (i > 0) result += ", ";
        result += vec[i];
    }
    result += "]";
    return result;
}

}
}
