#pragma once

#include <vector>
#include <memory>
#include <string>
#include <ostream>
#include <functional>
#include <nlohmann/json.hpp>
#include "intoto/types.hpp"

namespace intoto {
namespace crypto {

// KeyId 是公钥规范JSON的SHA-256十六进制摘要，可排序、可哈希
class KeyId {
public:
    KeyId() = default;
    explicit KeyId(std::string id) : id_(std::move(id)) {}

    // 校验并构造，要求非空的小写十六进制
    static Result<KeyId> FromHex(const std::string& hex);

    const std::string& ToString() const { return id_; }
    bool Empty() const { return id_.empty(); }

    bool operator==(const KeyId& other) const { return id_ == other.id_; }
    bool operator!=(const KeyId& other) const { return id_ != other.id_; }
    bool operator<(const KeyId& other) const { return id_ < other.id_; }

private:
    std::string id_;
};

std::ostream& operator<<(std::ostream& os, const KeyId& keyId);

// 签名：密钥ID加上不透明的签名字节
class Signature {
public:
    Signature() = default;
    Signature(KeyId keyId, std::vector<uint8_t> value)
        : keyId_(std::move(keyId)), value_(std::move(value)) {}

    const KeyId& KeyID() const { return keyId_; }
    const std::vector<uint8_t>& Value() const { return value_; }

    bool operator==(const Signature& other) const {
        return keyId_ == other.keyId_ && value_ == other.value_;
    }
    bool operator!=(const Signature& other) const { return !(*this == other); }

    // {"keyid": "<hex>", "sig": "<hex>"}
    nlohmann::json toJson() const;
    Error fromJson(const nlohmann::json& j);

private:
    KeyId keyId_;
    std::vector<uint8_t> value_;
};

// 公钥，以 SubjectPublicKeyInfo DER 保存
class PublicKey {
public:
    static Result<std::shared_ptr<PublicKey>> FromSPKI(const std::vector<uint8_t>& spki,
                                                       const std::string& scheme);
    // 从PEM解析，签名方案由密钥类型推断
    static Result<std::shared_ptr<PublicKey>> FromPEM(const std::string& pem);

    const KeyId& ID() const { return id_; }
    const std::string& Scheme() const { return scheme_; }
    // 密钥类型: ed25519, ecdsa, rsa
    std::string Algorithm() const;
    const std::vector<uint8_t>& Public() const { return spki_; }

    Result<std::string> ToPEM() const;

    // 用本公钥验证消息上的签名
    Error Verify(const std::vector<uint8_t>& message, const Signature& sig) const;

    // {"keytype": ..., "scheme": ..., "keyval": {"public": "<hex spki>"}}
    nlohmann::json toJson() const;

private:
    PublicKey(std::string scheme, std::vector<uint8_t> spki, KeyId id)
        : scheme_(std::move(scheme)), spki_(std::move(spki)), id_(std::move(id)) {}

    std::string scheme_;
    std::vector<uint8_t> spki_;
    KeyId id_;
};

// 私钥，以未加密的 PKCS#8 DER 保存，签名时才解析
class PrivateKey {
public:
    // 生成新的密钥对
    static Result<std::shared_ptr<PrivateKey>> Generate(const std::string& scheme);
    static Result<std::shared_ptr<PrivateKey>> FromPKCS8(const std::vector<uint8_t>& der,
                                                         const std::string& scheme);
    static Result<std::shared_ptr<PrivateKey>> FromPEM(const std::string& pem);

    // 对消息签名，签名中的密钥ID即对应公钥的ID
    Result<Signature> Sign(const std::vector<uint8_t>& message) const;

    std::shared_ptr<PublicKey> Public() const { return publicKey_; }
    const KeyId& ID() const { return publicKey_->ID(); }
    const std::string& Scheme() const { return publicKey_->Scheme(); }

    const std::vector<uint8_t>& PKCS8() const { return privateData_; }
    Result<std::string> ToPEM() const;

private:
    PrivateKey(std::shared_ptr<PublicKey> publicKey, std::vector<uint8_t> privateData)
        : publicKey_(std::move(publicKey)), privateData_(std::move(privateData)) {}

    std::shared_ptr<PublicKey> publicKey_;
    std::vector<uint8_t> privateData_;
};

// 是否为支持的签名方案
bool IsSupportedScheme(const std::string& scheme);

} // namespace crypto
} // namespace intoto

namespace std {
template<>
struct hash<intoto::crypto::KeyId> {
    size_t operator()(const intoto::crypto::KeyId& keyId) const {
        return hash<string>()(keyId.ToString());
    }
};
} // namespace std
