#include "intoto/crypto/keys.hpp"
#include "intoto/crypto/verifiers.hpp"
#include "intoto/utils/tools.hpp"
#include <openssl/evp.h>
#include <openssl/ec.h>
#include <openssl/rsa.h>
#include <openssl/pem.h>
#include <openssl/x509.h>
#include <openssl/bio.h>
#include <openssl/obj_mac.h>

namespace intoto {
namespace crypto {

namespace {

constexpr int RSA_KEY_BITS = 3072;

// 加密的PEM不支持，避免OpenSSL默认回调去读终端
int noPassphrase(char*, int, int, void*) {
    return 0;
}

std::string keytypeForScheme(const std::string& scheme) {
    if (scheme == ED25519_SCHEME) return ED25519_KEY;
    if (scheme == ECDSA_P256_SCHEME) return ECDSA_KEY;
    if (scheme == RSASSA_PSS_SHA256_SCHEME) return RSA_KEY;
    return "unknown";
}

Result<std::string> schemeForKey(EVP_PKEY* pkey) {
    switch (EVP_PKEY_id(pkey)) {
        case EVP_PKEY_ED25519:
            return ED25519_SCHEME;
        case EVP_PKEY_EC:
            if (EVP_PKEY_bits(pkey) != 256) {
                return Error(ErrorKind::Crypto, "only P-256 ECDSA keys are supported");
            }
            return ECDSA_P256_SCHEME;
        case EVP_PKEY_RSA:
            return RSASSA_PSS_SHA256_SCHEME;
        default:
            return Error(ErrorKind::Crypto, "unsupported key type");
    }
}

Result<std::vector<uint8_t>> encodeSPKI(EVP_PKEY* pkey) {
    int len = i2d_PUBKEY(pkey, nullptr);
    if (len <= 0) {
        return Error(ErrorKind::Crypto, "failed to encode public key");
    }
    std::vector<uint8_t> der(static_cast<size_t>(len));
    unsigned char* p = der.data();
    if (i2d_PUBKEY(pkey, &p) != len) {
        return Error(ErrorKind::Crypto, "failed to encode public key");
    }
    return der;
}

Result<std::vector<uint8_t>> encodePKCS8(EVP_PKEY* pkey) {
    PKCS8_PRIV_KEY_INFO* p8 = EVP_PKEY2PKCS8(pkey);
    if (!p8) {
        return Error(ErrorKind::Crypto, "failed to convert private key to PKCS#8");
    }
    int len = i2d_PKCS8_PRIV_KEY_INFO(p8, nullptr);
    if (len <= 0) {
        PKCS8_PRIV_KEY_INFO_free(p8);
        return Error(ErrorKind::Crypto, "failed to encode PKCS#8 private key");
    }
    std::vector<uint8_t> der(static_cast<size_t>(len));
    unsigned char* p = der.data();
    i2d_PKCS8_PRIV_KEY_INFO(p8, &p);
    PKCS8_PRIV_KEY_INFO_free(p8);
    return der;
}

EVP_PKEY* parsePrivateDER(const std::vector<uint8_t>& der) {
    const unsigned char* p = der.data();
    return d2i_AutoPrivateKey(nullptr, &p, static_cast<long>(der.size()));
}

nlohmann::json keyJson(const std::string& scheme, const std::vector<uint8_t>& spki) {
    nlohmann::json j;
    j["keytype"] = keytypeForScheme(scheme);
    j["scheme"] = scheme;
    j["keyval"] = {{"public", utils::HexEncode(spki)}};
    return j;
}

Result<KeyId> calculateKeyId(const std::string& scheme, const std::vector<uint8_t>& spki) {
    auto canonical = utils::MarshalCanonical(keyJson(scheme, spki));
    if (!canonical.ok()) {
        return canonical.error();
    }
    const std::string& data = canonical.value();
    auto digest = utils::CalculateSHA256Hash(std::vector<uint8_t>(data.begin(), data.end()));
    if (!digest.ok()) {
        return digest.error();
    }
    return KeyId(utils::HexEncode(digest.value()));
}

} // namespace

Result<KeyId> KeyId::FromHex(const std::string& hex) {
    if (hex.empty()) {
        return Error(ErrorKind::Encoding, "key ID must not be empty");
    }
    for (char c : hex) {
        bool digit = c >= '0' && c <= '9';
        bool lower = c >= 'a' && c <= 'f';
        if (!digit && !lower) {
            return Error(ErrorKind::Encoding, "key ID must be lowercase hex: " + hex);
        }
    }
    return KeyId(hex);
}

std::ostream& operator<<(std::ostream& os, const KeyId& keyId) {
    return os << keyId.ToString();
}

nlohmann::json Signature::toJson() const {
    nlohmann::json j;
    j["keyid"] = keyId_.ToString();
    j["sig"] = utils::HexEncode(value_);
    return j;
}

Error Signature::fromJson(const nlohmann::json& j) {
    try {
        auto keyId = KeyId::FromHex(j.at("keyid").get<std::string>());
        if (!keyId.ok()) {
            return keyId.error();
        }
        auto value = utils::HexDecode(j.at("sig").get<std::string>());
        if (!value.ok()) {
            return value.error();
        }
        keyId_ = std::move(keyId).value();
        value_ = std::move(value).value();
    } catch (const nlohmann::json::exception& e) {
        return Error(ErrorKind::Encoding, std::string("malformed signature: ") + e.what());
    }
    return Error();
}

bool IsSupportedScheme(const std::string& scheme) {
    return Verifiers.find(scheme) != Verifiers.end();
}

// PublicKey 实现

Result<std::shared_ptr<PublicKey>> PublicKey::FromSPKI(const std::vector<uint8_t>& spki,
                                                       const std::string& scheme) {
    if (!IsSupportedScheme(scheme)) {
        return Error(ErrorKind::Crypto, "unsupported signature scheme: " + scheme);
    }

    const unsigned char* p = spki.data();
    EVP_PKEY* pkey = d2i_PUBKEY(nullptr, &p, static_cast<long>(spki.size()));
    if (!pkey) {
        return Error(ErrorKind::Crypto, "failed to parse SubjectPublicKeyInfo");
    }
    auto actual = schemeForKey(pkey);
    EVP_PKEY_free(pkey);
    if (!actual.ok()) {
        return actual.error();
    }
    if (actual.value() != scheme) {
        return Error(ErrorKind::Crypto, "key of scheme " + actual.value() + " cannot be used with " + scheme);
    }

    auto keyId = calculateKeyId(scheme, spki);
    if (!keyId.ok()) {
        return keyId.error();
    }
    return std::shared_ptr<PublicKey>(new PublicKey(scheme, spki, std::move(keyId).value()));
}

Result<std::shared_ptr<PublicKey>> PublicKey::FromPEM(const std::string& pem) {
    BIO* bio = BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size()));
    if (!bio) {
        return Error(ErrorKind::Crypto, "failed to create BIO for public key");
    }
    EVP_PKEY* pkey = PEM_read_bio_PUBKEY(bio, nullptr, noPassphrase, nullptr);
    BIO_free(bio);
    if (!pkey) {
        return Error(ErrorKind::Crypto, "failed to parse PEM public key");
    }

    auto scheme = schemeForKey(pkey);
    if (!scheme.ok()) {
        EVP_PKEY_free(pkey);
        return scheme.error();
    }
    auto spki = encodeSPKI(pkey);
    EVP_PKEY_free(pkey);
    if (!spki.ok()) {
        return spki.error();
    }
    return FromSPKI(spki.value(), scheme.value());
}

std::string PublicKey::Algorithm() const {
    return keytypeForScheme(scheme_);
}

Result<std::string> PublicKey::ToPEM() const {
    const unsigned char* p = spki_.data();
    EVP_PKEY* pkey = d2i_PUBKEY(nullptr, &p, static_cast<long>(spki_.size()));
    if (!pkey) {
        return Error(ErrorKind::Crypto, "failed to parse SubjectPublicKeyInfo");
    }

    BIO* bio = BIO_new(BIO_s_mem());
    if (!bio) {
        EVP_PKEY_free(pkey);
        return Error(ErrorKind::Crypto, "failed to create BIO");
    }
    int rc = PEM_write_bio_PUBKEY(bio, pkey);
    EVP_PKEY_free(pkey);
    if (rc != 1) {
        BIO_free(bio);
        return Error(ErrorKind::Crypto, "failed to write PEM public key");
    }

    char* data = nullptr;
    long len = BIO_get_mem_data(bio, &data);
    std::string pem(data, static_cast<size_t>(len));
    BIO_free(bio);
    return pem;
}

Error PublicKey::Verify(const std::vector<uint8_t>& message, const Signature& sig) const {
    if (sig.KeyID() != id_) {
        return Error(ErrorKind::Crypto, "signature key ID " + sig.KeyID().ToString() +
                     " does not match key " + id_.ToString());
    }

    auto it = Verifiers.find(scheme_);
    if (it == Verifiers.end()) {
        return Error(ErrorKind::Crypto, "signing scheme is not supported: " + scheme_);
    }
    return it->second->Verify(*this, sig.Value(), message);
}

nlohmann::json PublicKey::toJson() const {
    return keyJson(scheme_, spki_);
}

// PrivateKey 实现

namespace {

// 由OpenSSL密钥对象构造私钥，expectedScheme为空时不限制方案
Result<std::shared_ptr<PrivateKey>> fromEVPKey(EVP_PKEY* pkey, const std::string& expectedScheme) {
    auto scheme = schemeForKey(pkey);
    if (!scheme.ok()) {
        return scheme.error();
    }
    if (!expectedScheme.empty() && scheme.value() != expectedScheme) {
        return Error(ErrorKind::Crypto, "key of scheme " + scheme.value() + " cannot be used with " + expectedScheme);
    }

    auto pkcs8 = encodePKCS8(pkey);
    if (!pkcs8.ok()) {
        return pkcs8.error();
    }
    return PrivateKey::FromPKCS8(pkcs8.value(), scheme.value());
}

} // namespace

Result<std::shared_ptr<PrivateKey>> PrivateKey::Generate(const std::string& scheme) {
    int type = 0;
    if (scheme == ED25519_SCHEME) {
        type = EVP_PKEY_ED25519;
    } else if (scheme == ECDSA_P256_SCHEME) {
        type = EVP_PKEY_EC;
    } else if (scheme == RSASSA_PSS_SHA256_SCHEME) {
        type = EVP_PKEY_RSA;
    } else {
        return Error(ErrorKind::Crypto, "unsupported signature scheme: " + scheme);
    }

    EVP_PKEY_CTX* ctx = EVP_PKEY_CTX_new_id(type, nullptr);
    if (!ctx) {
        return Error(ErrorKind::Crypto, "failed to create key generation context");
    }
    if (EVP_PKEY_keygen_init(ctx) <= 0) {
        EVP_PKEY_CTX_free(ctx);
        return Error(ErrorKind::Crypto, "failed to initialise key generation");
    }
    if (type == EVP_PKEY_EC && EVP_PKEY_CTX_set_ec_paramgen_curve_nid(ctx, NID_X9_62_prime256v1) <= 0) {
        EVP_PKEY_CTX_free(ctx);
        return Error(ErrorKind::Crypto, "failed to select P-256 curve");
    }
    if (type == EVP_PKEY_RSA && EVP_PKEY_CTX_set_rsa_keygen_bits(ctx, RSA_KEY_BITS) <= 0) {
        EVP_PKEY_CTX_free(ctx);
        return Error(ErrorKind::Crypto, "failed to set RSA key size");
    }

    EVP_PKEY* pkey = nullptr;
    if (EVP_PKEY_keygen(ctx, &pkey) <= 0 || !pkey) {
        EVP_PKEY_CTX_free(ctx);
        return Error(ErrorKind::Crypto, "key generation failed");
    }
    EVP_PKEY_CTX_free(ctx);

    auto key = fromEVPKey(pkey, scheme);
    EVP_PKEY_free(pkey);
    return key;
}

Result<std::shared_ptr<PrivateKey>> PrivateKey::FromPKCS8(const std::vector<uint8_t>& der,
                                                          const std::string& scheme) {
    EVP_PKEY* pkey = parsePrivateDER(der);
    if (!pkey) {
        return Error(ErrorKind::Crypto, "failed to parse PKCS#8 private key");
    }

    auto actual = schemeForKey(pkey);
    if (!actual.ok()) {
        EVP_PKEY_free(pkey);
        return actual.error();
    }
    if (actual.value() != scheme) {
        EVP_PKEY_free(pkey);
        return Error(ErrorKind::Crypto, "key of scheme " + actual.value() + " cannot be used with " + scheme);
    }

    auto spki = encodeSPKI(pkey);
    EVP_PKEY_free(pkey);
    if (!spki.ok()) {
        return spki.error();
    }
    auto publicKey = PublicKey::FromSPKI(spki.value(), scheme);
    if (!publicKey.ok()) {
        return publicKey.error();
    }
    return std::shared_ptr<PrivateKey>(new PrivateKey(std::move(publicKey).value(), der));
}

Result<std::shared_ptr<PrivateKey>> PrivateKey::FromPEM(const std::string& pem) {
    BIO* bio = BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size()));
    if (!bio) {
        return Error(ErrorKind::Crypto, "failed to create BIO for private key");
    }
    EVP_PKEY* pkey = PEM_read_bio_PrivateKey(bio, nullptr, noPassphrase, nullptr);
    BIO_free(bio);
    if (!pkey) {
        return Error(ErrorKind::Crypto, "failed to parse PEM private key (encrypted keys are not supported)");
    }

    auto key = fromEVPKey(pkey, "");
    EVP_PKEY_free(pkey);
    return key;
}

Result<Signature> PrivateKey::Sign(const std::vector<uint8_t>& message) const {
    EVP_PKEY* pkey = parsePrivateDER(privateData_);
    if (!pkey) {
        return Error(ErrorKind::Crypto, "failed to parse private key");
    }

    EVP_MD_CTX* mdctx = EVP_MD_CTX_new();
    if (!mdctx) {
        EVP_PKEY_free(pkey);
        return Error(ErrorKind::Crypto, "failed to create signing context");
    }

    // Ed25519 自带摘要，其余方案使用 SHA-256
    const EVP_MD* md = Scheme() == ED25519_SCHEME ? nullptr : EVP_sha256();
    EVP_PKEY_CTX* pctx = nullptr;
    if (EVP_DigestSignInit(mdctx, &pctx, md, nullptr, pkey) != 1) {
        EVP_MD_CTX_free(mdctx);
        EVP_PKEY_free(pkey);
        return Error(ErrorKind::Crypto, "failed to initialise signing");
    }
    if (Scheme() == RSASSA_PSS_SHA256_SCHEME) {
        if (EVP_PKEY_CTX_set_rsa_padding(pctx, RSA_PKCS1_PSS_PADDING) <= 0 ||
            EVP_PKEY_CTX_set_rsa_pss_saltlen(pctx, RSA_PSS_SALTLEN_DIGEST) <= 0) {
            EVP_MD_CTX_free(mdctx);
            EVP_PKEY_free(pkey);
            return Error(ErrorKind::Crypto, "failed to configure PSS padding");
        }
    }

    size_t sigLen = 0;
    if (EVP_DigestSign(mdctx, nullptr, &sigLen, message.data(), message.size()) != 1) {
        EVP_MD_CTX_free(mdctx);
        EVP_PKEY_free(pkey);
        return Error(ErrorKind::Crypto, "failed to determine signature length");
    }
    std::vector<uint8_t> sig(sigLen);
    if (EVP_DigestSign(mdctx, sig.data(), &sigLen, message.data(), message.size()) != 1) {
        EVP_MD_CTX_free(mdctx);
        EVP_PKEY_free(pkey);
        return Error(ErrorKind::Crypto, "signing failed");
    }
    sig.resize(sigLen);

    EVP_MD_CTX_free(mdctx);
    EVP_PKEY_free(pkey);
    return Signature(ID(), std::move(sig));
}

Result<std::string> PrivateKey::ToPEM() const {
    EVP_PKEY* pkey = parsePrivateDER(privateData_);
    if (!pkey) {
        return Error(ErrorKind::Crypto, "failed to parse private key");
    }

    BIO* bio = BIO_new(BIO_s_mem());
    if (!bio) {
        EVP_PKEY_free(pkey);
        return Error(ErrorKind::Crypto, "failed to create BIO");
    }
    int rc = PEM_write_bio_PrivateKey(bio, pkey, nullptr, nullptr, 0, nullptr, nullptr);
    EVP_PKEY_free(pkey);
    if (rc != 1) {
        BIO_free(bio);
        return Error(ErrorKind::Crypto, "failed to write PEM private key");
    }

    char* data = nullptr;
    long len = BIO_get_mem_data(bio, &data);
    std::string pem(data, static_cast<size_t>(len));
    BIO_free(bio);
    return pem;
}

} // namespace crypto
} // namespace intoto
