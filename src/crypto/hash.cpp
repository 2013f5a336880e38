#include "intoto/crypto/hash.hpp"
#include "intoto/utils/tools.hpp"

namespace intoto {
namespace crypto {

std::string HashAlgorithmToString(HashAlgorithm alg) {
    switch (alg) {
        case HashAlgorithm::Sha256: return "sha256";
        case HashAlgorithm::Sha512: return "sha512";
        default: return "unknown";
    }
}

Result<HashAlgorithm> ParseHashAlgorithm(const std::string& name) {
    if (name == "sha256") return HashAlgorithm::Sha256;
    if (name == "sha512") return HashAlgorithm::Sha512;
    return Error(ErrorKind::Encoding, "unsupported hash algorithm: " + name);
}

Result<HashValue> HashValue::FromHex(const std::string& hex) {
    auto bytes = utils::HexDecode(hex);
    if (!bytes.ok()) {
        return bytes.error();
    }
    return HashValue(std::move(bytes).value());
}

std::string HashValue::ToString() const {
    return utils::HexEncode(value_);
}

std::ostream& operator<<(std::ostream& os, const HashValue& hash) {
    return os << hash.ToString();
}

Result<HashValue> CalculateHash(HashAlgorithm alg, const std::vector<uint8_t>& data) {
    auto digest = alg == HashAlgorithm::Sha512 ? utils::CalculateSHA512Hash(data)
                                               : utils::CalculateSHA256Hash(data);
    if (!digest.ok()) {
        return digest.error();
    }
    return HashValue(std::move(digest).value());
}

} // namespace crypto
} // namespace intoto
