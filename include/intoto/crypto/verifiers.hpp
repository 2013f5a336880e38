#pragma once

#include <string>
#include <vector>
#include <memory>
#include <unordered_map>
#include "intoto/types.hpp"
#include "intoto/crypto/keys.hpp"

namespace intoto {
namespace crypto {

// 验证器接口，每种签名方案一个实现
class Verifier {
public:
    virtual ~Verifier() = default;
    virtual Error Verify(const PublicKey& key,
                         const std::vector<uint8_t>& signature,
                         const std::vector<uint8_t>& message) const = 0;
};

// 全局验证器注册表，按签名方案索引
extern const std::unordered_map<std::string, std::shared_ptr<Verifier>> Verifiers;

// Ed25519验证器
class Ed25519Verifier : public Verifier {
public:
    Error Verify(const PublicKey& key,
                 const std::vector<uint8_t>& signature,
                 const std::vector<uint8_t>& message) const override;
};

// ECDSA P-256 / SHA-256 验证器，签名为DER编码
class ECDSAVerifier : public Verifier {
public:
    Error Verify(const PublicKey& key,
                 const std::vector<uint8_t>& signature,
                 const std::vector<uint8_t>& message) const override;
};

// RSA PSS / SHA-256 验证器
class RSAPSSVerifier : public Verifier {
public:
    Error Verify(const PublicKey& key,
                 const std::vector<uint8_t>& signature,
                 const std::vector<uint8_t>& message) const override;
};

} // namespace crypto
} // namespace intoto
