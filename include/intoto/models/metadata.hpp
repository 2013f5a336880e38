#pragma once

#include <string>
#include <vector>
#include <memory>
#include <functional>
#include <future>
#include <algorithm>
#include <unordered_map>
#include <unordered_set>
#include <type_traits>
#include <system_error>
#include <nlohmann/json.hpp>
#include "intoto/types.hpp"
#include "intoto/crypto/keys.hpp"
#include "intoto/utils/logger.hpp"

namespace intoto {
namespace models {

// 可签名的元数据类型约定：
//   uint32_t Version() const;
//   nlohmann::json toJson() const;
//   Error fromJson(const nlohmann::json&);
// 并且可默认构造
template<typename M, typename = void>
struct IsMetadata : std::false_type {};

template<typename M>
struct IsMetadata<M, std::void_t<
    decltype(static_cast<uint32_t>(std::declval<const M&>().Version())),
    decltype(std::declval<const M&>().toJson()),
    decltype(std::declval<M&>().fromJson(std::declval<const nlohmann::json&>()))>>
    : std::is_default_constructible<M> {};

// 单个签名在验证过程中的结果
struct VerificationEvent {
    enum class Kind {
        GoodSignature,    // 授权密钥的有效签名，计入阈值
        BadSignature,     // 授权密钥，但签名验证失败
        UnauthorizedKey   // 密钥不在授权集合中
    };

    Kind kind;
    crypto::KeyId keyId;
    std::string detail;
};

std::string VerificationEventKindToString(VerificationEvent::Kind kind);

// 验证过程的观察者，由调用方注入
using VerificationObserver = std::function<void(const VerificationEvent&)>;

// 默认观察者：有效签名记为Debug，其余记为Warn
void LogVerificationEvent(const VerificationEvent& event);

template<typename D, typename M> class SignedMetadata;
template<typename D, typename M> class SignedMetadataBuilder;

// 未验证的原始元数据字节，D 为数据交换格式，M 为元数据类型，二者只在编译期起作用
template<typename D, typename M>
class RawSignedMetadata {
public:
    RawSignedMetadata() = default;
    explicit RawSignedMetadata(std::vector<uint8_t> bytes) : bytes_(std::move(bytes)) {}

    const std::vector<uint8_t>& AsBytes() const { return bytes_; }

    // 解析为 SignedMetadata，不检查任何签名
    Result<SignedMetadata<D, M>> Parse() const;

    bool operator==(const RawSignedMetadata& other) const { return bytes_ == other.bytes_; }
    bool operator!=(const RawSignedMetadata& other) const { return bytes_ != other.bytes_; }

private:
    std::vector<uint8_t> bytes_;
};

// 在固定的规范化字节上累积签名，最终构造 SignedMetadata
template<typename D, typename M>
class SignedMetadataBuilder {
    static_assert(IsMetadata<M>::value, "M must satisfy the metadata contract");

public:
    using RawData = typename D::RawData;

    static Result<SignedMetadataBuilder> FromMetadata(const M& metadata);

    // metadata 必须能解析为 M，否则返回 Encoding 错误
    static Result<SignedMetadataBuilder> FromRawMetadata(RawData metadata);

    // 返回带有新签名的builder，同一密钥ID的旧签名被替换。自身不变
    Result<SignedMetadataBuilder> Sign(const crypto::PrivateKey& privateKey) const;

    // 按密钥ID升序排列签名
    SignedMetadata<D, M> Build() const &;
    SignedMetadata<D, M> Build() &&;

    const std::vector<uint8_t>& MetadataBytes() const { return metadataBytes_; }

private:
    SignedMetadataBuilder(RawData metadata, std::vector<uint8_t> metadataBytes)
        : metadata_(std::move(metadata)), metadataBytes_(std::move(metadataBytes)) {}

    static std::vector<crypto::Signature> sortedSignatures(
        std::unordered_map<crypto::KeyId, crypto::Signature> signatures);

    std::unordered_map<crypto::KeyId, crypto::Signature> signatures_;
    RawData metadata_;
    // 始终等于 D::Canonicalize(metadata_)，构造时计算一次
    std::vector<uint8_t> metadataBytes_;
};

// 带有未验证签名的元数据
//
// 线上格式: {"signatures": [{"keyid": ..., "sig": ...}, ...], "signed": <metadata>}
template<typename D, typename M>
class SignedMetadata {
public:
    using RawData = typename D::RawData;

    SignedMetadata() = default;

    // 用一个私钥对元数据签名
    static Result<SignedMetadata> New(const M& metadata, const crypto::PrivateKey& privateKey);

    const std::vector<crypto::Signature>& Signatures() const { return signatures_; }
    const RawData& Metadata() const { return metadata_; }

    // 序列化为规范化字节。只适用于本进程生成的元数据：
    // 解析时丢弃了未知字段，远端元数据原有的空白和字段顺序也不会保留
    Result<RawSignedMetadata<D, M>> ToRaw() const;

    // 仅当两者 signed 内容的规范化字节相同时合并，密钥ID冲突时保留自身的签名。
    // 新签名追加在末尾，不重新排序
    Error MergeSignatures(const SignedMetadata& other);

    // 不验证签名直接解析。对来自不可信来源的数据不安全
    Result<M> AssumeValid() const;

    // 至少 threshold 个不同的授权密钥对规范化字节给出有效签名时返回元数据。
    // 按存储顺序逐个验证，达到阈值即停止
    Result<M> Verify(int threshold,
                     const std::vector<std::shared_ptr<crypto::PublicKey>>& authorizedKeys,
                     const VerificationObserver& observer = LogVerificationEvent) const;

    // 与 Verify 结果相同，但并发验证所有授权签名，没有提前退出
    Result<M> VerifyParallel(int threshold,
                             const std::vector<std::shared_ptr<crypto::PublicKey>>& authorizedKeys,
                             const VerificationObserver& observer = LogVerificationEvent) const;

    // JSON 序列化支持
    nlohmann::json toJson() const;
    Error fromJson(const nlohmann::json& j);

    bool operator==(const SignedMetadata& other) const {
        return signatures_ == other.signatures_ && metadata_ == other.metadata_;
    }
    bool operator!=(const SignedMetadata& other) const { return !(*this == other); }

private:
    friend class SignedMetadataBuilder<D, M>;

    SignedMetadata(std::vector<crypto::Signature> signatures, RawData metadata)
        : signatures_(std::move(signatures)), metadata_(std::move(metadata)) {}

    // 验证前的公共检查，成功时返回需要被签名的规范化字节
    Result<std::vector<uint8_t>> canonicalBytesForVerify(int threshold) const;

    // 以密钥ID去重，同一密钥最多计一次
    std::unordered_map<crypto::KeyId, const crypto::Signature*> uniqueSignatures() const;

    static std::unordered_map<crypto::KeyId, std::shared_ptr<crypto::PublicKey>> keyLookup(
        const std::vector<std::shared_ptr<crypto::PublicKey>>& authorizedKeys);

    static void notify(const VerificationObserver& observer, VerificationEvent::Kind kind,
                       const crypto::KeyId& keyId, const std::string& detail = "");

    static Error thresholdNotMet(int satisfied, int threshold);

    std::vector<crypto::Signature> signatures_;
    RawData metadata_;
};

// RawSignedMetadata 实现

template<typename D, typename M>
Result<SignedMetadata<D, M>> RawSignedMetadata<D, M>::Parse() const {
    auto raw = D::FromSlice(bytes_);
    if (!raw.ok()) {
        return raw.error();
    }
    return D::template Deserialize<SignedMetadata<D, M>>(raw.value());
}

// SignedMetadataBuilder 实现

template<typename D, typename M>
Result<SignedMetadataBuilder<D, M>> SignedMetadataBuilder<D, M>::FromMetadata(const M& metadata) {
    auto raw = D::Serialize(metadata);
    if (!raw.ok()) {
        return raw.error();
    }
    return FromRawMetadata(std::move(raw).value());
}

template<typename D, typename M>
Result<SignedMetadataBuilder<D, M>> SignedMetadataBuilder<D, M>::FromRawMetadata(RawData metadata) {
    // 只用于确认能够解析，结果丢弃
    auto parsed = D::template Deserialize<M>(metadata);
    if (!parsed.ok()) {
        return parsed.error();
    }

    auto bytes = D::Canonicalize(metadata);
    if (!bytes.ok()) {
        return bytes.error();
    }
    return SignedMetadataBuilder(std::move(metadata), std::move(bytes).value());
}

template<typename D, typename M>
Result<SignedMetadataBuilder<D, M>> SignedMetadataBuilder<D, M>::Sign(const crypto::PrivateKey& privateKey) const {
    auto sig = privateKey.Sign(metadataBytes_);
    if (!sig.ok()) {
        return sig.error();
    }

    SignedMetadataBuilder next = *this;
    next.signatures_.insert_or_assign(sig.value().KeyID(), sig.value());
    return next;
}

template<typename D, typename M>
std::vector<crypto::Signature> SignedMetadataBuilder<D, M>::sortedSignatures(
    std::unordered_map<crypto::KeyId, crypto::Signature> signatures) {
    std::vector<crypto::Signature> sorted;
    sorted.reserve(signatures.size());
    for (auto& entry : signatures) {
        sorted.push_back(std::move(entry.second));
    }
    std::sort(sorted.begin(), sorted.end(), [](const crypto::Signature& a, const crypto::Signature& b) {
        return a.KeyID() < b.KeyID();
    });
    return sorted;
}

template<typename D, typename M>
SignedMetadata<D, M> SignedMetadataBuilder<D, M>::Build() const & {
    return SignedMetadata<D, M>(sortedSignatures(signatures_), metadata_);
}

template<typename D, typename M>
SignedMetadata<D, M> SignedMetadataBuilder<D, M>::Build() && {
    return SignedMetadata<D, M>(sortedSignatures(std::move(signatures_)), std::move(metadata_));
}

// SignedMetadata 实现

template<typename D, typename M>
Result<SignedMetadata<D, M>> SignedMetadata<D, M>::New(const M& metadata, const crypto::PrivateKey& privateKey) {
    auto builder = SignedMetadataBuilder<D, M>::FromMetadata(metadata);
    if (!builder.ok()) {
        return builder.error();
    }
    auto signedBuilder = builder.value().Sign(privateKey);
    if (!signedBuilder.ok()) {
        return signedBuilder.error();
    }
    return std::move(signedBuilder).value().Build();
}

template<typename D, typename M>
Result<RawSignedMetadata<D, M>> SignedMetadata<D, M>::ToRaw() const {
    auto raw = D::Serialize(*this);
    if (!raw.ok()) {
        return raw.error();
    }
    auto bytes = D::Canonicalize(raw.value());
    if (!bytes.ok()) {
        return bytes.error();
    }
    return RawSignedMetadata<D, M>(std::move(bytes).value());
}

template<typename D, typename M>
Error SignedMetadata<D, M>::MergeSignatures(const SignedMetadata& other) {
    // 以规范化字节比较，1 与 1.0 视为不同
    auto mine = D::Canonicalize(metadata_);
    if (!mine.ok()) {
        return mine.error();
    }
    auto theirs = D::Canonicalize(other.metadata_);
    if (!theirs.ok()) {
        return theirs.error();
    }
    if (mine.value() != theirs.value()) {
        return Error(ErrorKind::IllegalArgument, "Attempted to merge unequal metadata");
    }

    std::unordered_set<crypto::KeyId> keyIds;
    for (const auto& sig : signatures_) {
        keyIds.insert(sig.KeyID());
    }
    for (const auto& sig : other.signatures_) {
        if (keyIds.insert(sig.KeyID()).second) {
            signatures_.push_back(sig);
        }
    }
    return Error();
}

template<typename D, typename M>
Result<M> SignedMetadata<D, M>::AssumeValid() const {
    return D::template Deserialize<M>(metadata_);
}

template<typename D, typename M>
Result<std::vector<uint8_t>> SignedMetadata<D, M>::canonicalBytesForVerify(int threshold) const {
    if (signatures_.empty()) {
        return Error(ErrorKind::VerificationFailure, "The metadata was not signed with any authorized keys.");
    }

    if (threshold < 1) {
        return Error(ErrorKind::VerificationFailure, "Threshold must be strictly greater than zero");
    }

    return D::Canonicalize(metadata_);
}

template<typename D, typename M>
std::unordered_map<crypto::KeyId, const crypto::Signature*> SignedMetadata<D, M>::uniqueSignatures() const {
    std::unordered_map<crypto::KeyId, const crypto::Signature*> unique;
    for (const auto& sig : signatures_) {
        unique[sig.KeyID()] = &sig;
    }
    return unique;
}

template<typename D, typename M>
std::unordered_map<crypto::KeyId, std::shared_ptr<crypto::PublicKey>> SignedMetadata<D, M>::keyLookup(
    const std::vector<std::shared_ptr<crypto::PublicKey>>& authorizedKeys) {
    std::unordered_map<crypto::KeyId, std::shared_ptr<crypto::PublicKey>> lookup;
    for (const auto& key : authorizedKeys) {
        if (key) {
            lookup[key->ID()] = key;
        }
    }
    return lookup;
}

template<typename D, typename M>
void SignedMetadata<D, M>::notify(const VerificationObserver& observer, VerificationEvent::Kind kind,
                                  const crypto::KeyId& keyId, const std::string& detail) {
    if (observer) {
        observer(VerificationEvent{kind, keyId, detail});
    }
}

template<typename D, typename M>
Error SignedMetadata<D, M>::thresholdNotMet(int satisfied, int threshold) {
    return Error(ErrorKind::VerificationFailure,
                 "Signature threshold not met: " + std::to_string(satisfied) + "/" + std::to_string(threshold));
}

template<typename D, typename M>
Result<M> SignedMetadata<D, M>::Verify(int threshold,
                                       const std::vector<std::shared_ptr<crypto::PublicKey>>& authorizedKeys,
                                       const VerificationObserver& observer) const {
    auto canonicalBytes = canonicalBytesForVerify(threshold);
    if (!canonicalBytes.ok()) {
        return canonicalBytes.error();
    }

    auto keys = keyLookup(authorizedKeys);
    int signaturesNeeded = threshold;
    for (const auto& [keyId, sig] : uniqueSignatures()) {
        auto it = keys.find(keyId);
        if (it == keys.end()) {
            notify(observer, VerificationEvent::Kind::UnauthorizedKey, keyId);
        } else {
            Error err = it->second->Verify(canonicalBytes.value(), *sig);
            if (err.ok()) {
                notify(observer, VerificationEvent::Kind::GoodSignature, keyId);
                signaturesNeeded--;
            } else {
                notify(observer, VerificationEvent::Kind::BadSignature, keyId, err.what());
            }
        }
        if (signaturesNeeded == 0) {
            break;
        }
    }

    if (signaturesNeeded > 0) {
        return thresholdNotMet(threshold - signaturesNeeded, threshold);
    }

    // 签名刚刚验证过
    return AssumeValid();
}

template<typename D, typename M>
Result<M> SignedMetadata<D, M>::VerifyParallel(int threshold,
                                               const std::vector<std::shared_ptr<crypto::PublicKey>>& authorizedKeys,
                                               const VerificationObserver& observer) const {
    auto canonicalBytes = canonicalBytesForVerify(threshold);
    if (!canonicalBytes.ok()) {
        return canonicalBytes.error();
    }
    const std::vector<uint8_t>& message = canonicalBytes.value();

    auto keys = keyLookup(authorizedKeys);
    std::vector<std::pair<crypto::KeyId, std::future<Error>>> checks;
    for (const auto& [keyId, sig] : uniqueSignatures()) {
        auto it = keys.find(keyId);
        if (it == keys.end()) {
            notify(observer, VerificationEvent::Kind::UnauthorizedKey, keyId);
            continue;
        }
        std::shared_ptr<crypto::PublicKey> key = it->second;
        const crypto::Signature* signature = sig;
        auto check = [key, signature, &message]() {
            return key->Verify(message, *signature);
        };
        std::future<Error> pending;
        try {
            pending = std::async(std::launch::async, check);
        } catch (const std::system_error& e) {
            // 无法创建线程时退回到调用线程上验证
            utils::GetLogger().Debug("Verifying signature on the calling thread",
                                     utils::LogContext().With("keyid", keyId.ToString()).With("error", e.what()));
            pending = std::async(std::launch::deferred, check);
        }
        checks.emplace_back(keyId, std::move(pending));
    }

    // 观察者只在调用线程上被调用
    int valid = 0;
    for (auto& [keyId, check] : checks) {
        Error err = check.get();
        if (err.ok()) {
            notify(observer, VerificationEvent::Kind::GoodSignature, keyId);
            valid++;
        } else {
            notify(observer, VerificationEvent::Kind::BadSignature, keyId, err.what());
        }
    }

    if (valid < threshold) {
        return thresholdNotMet(valid, threshold);
    }
    return AssumeValid();
}

template<typename D, typename M>
nlohmann::json SignedMetadata<D, M>::toJson() const {
    static_assert(std::is_same<RawData, nlohmann::json>::value,
                  "the signed envelope is defined over JSON raw data");

    nlohmann::json sigs = nlohmann::json::array();
    for (const auto& sig : signatures_) {
        sigs.push_back(sig.toJson());
    }

    nlohmann::json j;
    j["signatures"] = sigs;
    j["signed"] = metadata_;
    return j;
}

template<typename D, typename M>
Error SignedMetadata<D, M>::fromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        return Error(ErrorKind::Encoding, "signed metadata must be a JSON object");
    }
    if (!j.contains("signatures") || !j.at("signatures").is_array()) {
        return Error(ErrorKind::Encoding, "signed metadata is missing a \"signatures\" array");
    }
    if (!j.contains("signed")) {
        return Error(ErrorKind::Encoding, "signed metadata is missing the \"signed\" field");
    }

    std::vector<crypto::Signature> signatures;
    for (const auto& entry : j.at("signatures")) {
        crypto::Signature sig;
        Error err = sig.fromJson(entry);
        if (err.hasError()) {
            return err;
        }
        signatures.push_back(std::move(sig));
    }

    signatures_ = std::move(signatures);
    metadata_ = j.at("signed");
    return Error();
}

} // namespace models
} // namespace intoto
