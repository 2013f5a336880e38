#include "intoto/crypto/verifiers.hpp"
#include <openssl/evp.h>
#include <openssl/rsa.h>
#include <openssl/x509.h>

namespace intoto {
namespace crypto {

// 常量定义
constexpr int MIN_RSA_KEY_SIZE_BIT = 2048;
constexpr size_t ED25519_SIGNATURE_SIZE = 64;

// 全局静态映射表
const std::unordered_map<std::string, std::shared_ptr<Verifier>> Verifiers = {
    {ED25519_SCHEME, std::make_shared<Ed25519Verifier>()},
    {ECDSA_P256_SCHEME, std::make_shared<ECDSAVerifier>()},
    {RSASSA_PSS_SHA256_SCHEME, std::make_shared<RSAPSSVerifier>()},
};

namespace {

// 辅助函数：解析公钥并检查OpenSSL密钥类型
std::pair<EVP_PKEY*, Error> getPubKey(const PublicKey& key, int expectedType) {
    const std::vector<uint8_t>& spki = key.Public();
    const unsigned char* data = spki.data();
    EVP_PKEY* pubKey = d2i_PUBKEY(nullptr, &data, static_cast<long>(spki.size()));
    if (!pubKey) {
        return {nullptr, Error(ErrorKind::Crypto, "failed to parse PKIX public key")};
    }
    if (EVP_PKEY_id(pubKey) != expectedType) {
        EVP_PKEY_free(pubKey);
        return {nullptr, Error(ErrorKind::Crypto, "invalid key type for " + key.Scheme() + " verifier")};
    }
    return {pubKey, Error()};
}

// 辅助函数：EVP一次性验证，md为空时使用密钥自带的摘要（Ed25519）
Error digestVerify(EVP_PKEY* pubKey, const EVP_MD* md, bool pss,
                   const std::vector<uint8_t>& sig, const std::vector<uint8_t>& message) {
    EVP_MD_CTX* mdctx = EVP_MD_CTX_new();
    if (!mdctx) {
        return Error(ErrorKind::Crypto, "failed to create verification context");
    }

    EVP_PKEY_CTX* pctx = nullptr;
    if (EVP_DigestVerifyInit(mdctx, &pctx, md, nullptr, pubKey) != 1) {
        EVP_MD_CTX_free(mdctx);
        return Error(ErrorKind::Crypto, "failed to initialise verification");
    }

    if (pss) {
        if (EVP_PKEY_CTX_set_rsa_padding(pctx, RSA_PKCS1_PSS_PADDING) <= 0 ||
            EVP_PKEY_CTX_set_rsa_pss_saltlen(pctx, RSA_PSS_SALTLEN_DIGEST) <= 0) {
            EVP_MD_CTX_free(mdctx);
            return Error(ErrorKind::Crypto, "failed to configure PSS padding");
        }
    }

    int result = EVP_DigestVerify(mdctx, sig.data(), sig.size(), message.data(), message.size());
    EVP_MD_CTX_free(mdctx);

    if (result != 1) {
        return Error(ErrorKind::Crypto, "signature verification failed");
    }
    return Error();
}

} // namespace

Error Ed25519Verifier::Verify(const PublicKey& key,
                              const std::vector<uint8_t>& signature,
                              const std::vector<uint8_t>& message) const {
    if (signature.size() != ED25519_SIGNATURE_SIZE) {
        return Error(ErrorKind::Crypto, "signature length is incorrect, must be " +
                     std::to_string(ED25519_SIGNATURE_SIZE) + ", was " + std::to_string(signature.size()));
    }

    auto [pubKey, err] = getPubKey(key, EVP_PKEY_ED25519);
    if (err.hasError()) {
        return err;
    }
    Error result = digestVerify(pubKey, nullptr, false, signature, message);
    EVP_PKEY_free(pubKey);
    if (result.hasError()) {
        return Error(ErrorKind::Crypto, "failed ed25519 verification");
    }
    return Error();
}

Error ECDSAVerifier::Verify(const PublicKey& key,
                            const std::vector<uint8_t>& signature,
                            const std::vector<uint8_t>& message) const {
    auto [pubKey, err] = getPubKey(key, EVP_PKEY_EC);
    if (err.hasError()) {
        return err;
    }
    Error result = digestVerify(pubKey, EVP_sha256(), false, signature, message);
    EVP_PKEY_free(pubKey);
    if (result.hasError()) {
        return Error(ErrorKind::Crypto, "failed ECDSA verification");
    }
    return Error();
}

Error RSAPSSVerifier::Verify(const PublicKey& key,
                             const std::vector<uint8_t>& signature,
                             const std::vector<uint8_t>& message) const {
    auto [pubKey, err] = getPubKey(key, EVP_PKEY_RSA);
    if (err.hasError()) {
        return err;
    }

    int keySize = EVP_PKEY_bits(pubKey);
    if (keySize < MIN_RSA_KEY_SIZE_BIT) {
        EVP_PKEY_free(pubKey);
        return Error(ErrorKind::Crypto, "RSA keys less than " + std::to_string(MIN_RSA_KEY_SIZE_BIT) +
                     " bits are not acceptable, provided key has length " + std::to_string(keySize));
    }

    Error result = digestVerify(pubKey, EVP_sha256(), true, signature, message);
    EVP_PKEY_free(pubKey);
    if (result.hasError()) {
        return Error(ErrorKind::Crypto, "failed RSAPSS verification");
    }
    return Error();
}

} // namespace crypto
} // namespace intoto
