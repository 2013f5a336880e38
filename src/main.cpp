#include <iostream>
#include <string>
#include <vector>
#include <memory>
#include <CLI/CLI.hpp>
#include "intoto/types.hpp"
#include "intoto/crypto/keys.hpp"
#include "intoto/interchange/json.hpp"
#include "intoto/models/link.hpp"
#include "intoto/models/metadata.hpp"
#include "intoto/utils/config.hpp"
#include "intoto/utils/logger.hpp"
#include "intoto/utils/tools.hpp"

using namespace intoto;

using SignedLink = models::SignedMetadata<interchange::Json, models::LinkMetadata>;
using RawSignedLink = models::RawSignedMetadata<interchange::Json, models::LinkMetadata>;
using LinkBuilder = models::SignedMetadataBuilder<interchange::Json, models::LinkMetadata>;

namespace {

std::string bytesToString(const std::vector<uint8_t>& bytes) {
    return std::string(bytes.begin(), bytes.end());
}

std::vector<uint8_t> stringToBytes(const std::string& str) {
    return std::vector<uint8_t>(str.begin(), str.end());
}

// 打印错误并返回进程退出码
int fail(const std::string& context, const Error& err) {
    utils::GetLogger().Error(context, utils::LogContext()
        .With("kind", ErrorKindToString(err.kind()))
        .With("error", err.what()));
    std::cerr << context << ": " << err.String() << std::endl;
    return 1;
}

Result<std::shared_ptr<crypto::PrivateKey>> loadPrivateKey(const std::string& path) {
    auto pem = utils::ReadFile(path);
    if (!pem.ok()) {
        return pem.error();
    }
    return crypto::PrivateKey::FromPEM(bytesToString(pem.value()));
}

Result<std::shared_ptr<crypto::PublicKey>> loadPublicKey(const std::string& path) {
    auto pem = utils::ReadFile(path);
    if (!pem.ok()) {
        return pem.error();
    }
    return crypto::PublicKey::FromPEM(bytesToString(pem.value()));
}

Result<SignedLink> loadSignedLink(const std::string& path) {
    auto bytes = utils::ReadFile(path);
    if (!bytes.ok()) {
        return bytes.error();
    }
    return RawSignedLink(std::move(bytes).value()).Parse();
}

Error writeSignedLink(const std::string& path, const SignedLink& signedLink) {
    auto raw = interchange::Json::Serialize(signedLink);
    if (!raw.ok()) {
        return raw.error();
    }
    auto bytes = interchange::JsonPretty::ToVec(raw.value());
    if (!bytes.ok()) {
        return bytes.error();
    }
    return utils::WriteFile(path, bytes.value());
}

} // namespace

int main(int argc, char** argv) {
    CLI::App app{"intoto - 签名元数据工具"};
    app.require_subcommand(1);

    std::string configFile;
    std::string logLevel;
    std::string logFormat;
    bool parallel = false;
    int verbosity = 0;

    app.add_option("-c,--config", configFile, "Configuration file path");
    app.add_option("--log-level", logLevel, "日志级别: debug, info, warn, error, fatal, panic");
    app.add_option("--log-format", logFormat, "日志格式: json, text");
    app.add_flag("--parallel", parallel, "Verify signatures concurrently");
    app.add_flag("-v,--verbose", verbosity, "Increase log verbosity, may be repeated");

    utils::Config config;

    // 在子命令执行前加载配置并初始化日志，命令行参数覆盖配置文件
    app.parse_complete_callback([&]() {
        if (!configFile.empty()) {
            auto loaded = utils::LoadConfig(configFile);
            if (!loaded.ok()) {
                throw CLI::ValidationError("--config", loaded.error().String());
            }
            config = loaded.value();
        }
        if (!logLevel.empty()) {
            config.logging.level = logLevel;
        }
        if (!logFormat.empty()) {
            config.logging.format = logFormat;
        }
        if (parallel) {
            config.verify.parallel = true;
        }

        utils::GetLogger().Initialize(config.logging);
        for (int i = 0; i < verbosity; ++i) {
            utils::GetLogger().AdjustLogLevel(true);
        }
    });

    int exitCode = 0;

    // keygen
    auto keygen = app.add_subcommand("keygen", "Generate a new signing key");
    std::string scheme = ED25519_SCHEME;
    std::string privateOut;
    std::string publicOut;
    keygen->add_option("-s,--scheme", scheme, "Signature scheme")
        ->check(CLI::IsMember({ED25519_SCHEME, ECDSA_P256_SCHEME, RSASSA_PSS_SHA256_SCHEME}));
    keygen->add_option("-o,--output", privateOut, "Private key output path (PEM)")->required();
    keygen->add_option("--pub", publicOut, "Public key output path (PEM)");

    keygen->callback([&]() {
        auto key = crypto::PrivateKey::Generate(scheme);
        if (!key.ok()) {
            exitCode = fail("Error generating key", key.error());
            return;
        }

        auto pem = key.value()->ToPEM();
        if (!pem.ok()) {
            exitCode = fail("Error encoding private key", pem.error());
            return;
        }
        Error err = utils::WriteFile(privateOut, stringToBytes(pem.value()));
        if (err.hasError()) {
            exitCode = fail("Error writing private key", err);
            return;
        }

        if (!publicOut.empty()) {
            auto pubPem = key.value()->Public()->ToPEM();
            if (!pubPem.ok()) {
                exitCode = fail("Error encoding public key", pubPem.error());
                return;
            }
            err = utils::WriteFile(publicOut, stringToBytes(pubPem.value()));
            if (err.hasError()) {
                exitCode = fail("Error writing public key", err);
                return;
            }
        }

        utils::GetLogger().Info("Generated key", utils::LogContext()
            .With("scheme", scheme)
            .With("keyid", key.value()->ID().ToString()));
        std::cout << key.value()->ID() << std::endl;
    });

    // sign
    auto sign = app.add_subcommand("sign", "Sign a link document");
    std::vector<std::string> keyFiles;
    std::string linkIn;
    std::string signedOut;
    sign->add_option("-k,--key", keyFiles, "Private key file (PEM), may be repeated")->required();
    sign->add_option("-i,--input", linkIn, "Unsigned link document")->required();
    sign->add_option("-o,--output", signedOut, "Signed output path")->required();

    sign->callback([&]() {
        utils::GetLogger().Debug("Signing link", utils::LogContext()
            .With("input", linkIn)
            .With("keys", utils::vectorToString(keyFiles)));

        auto bytes = utils::ReadFile(linkIn);
        if (!bytes.ok()) {
            exitCode = fail("Error reading link", bytes.error());
            return;
        }
        auto raw = interchange::Json::FromSlice(bytes.value());
        if (!raw.ok()) {
            exitCode = fail("Error parsing link", raw.error());
            return;
        }

        auto builder = LinkBuilder::FromRawMetadata(std::move(raw).value());
        if (!builder.ok()) {
            exitCode = fail("Error decoding link", builder.error());
            return;
        }

        LinkBuilder current = std::move(builder).value();
        for (const auto& keyFile : keyFiles) {
            auto key = loadPrivateKey(keyFile);
            if (!key.ok()) {
                exitCode = fail("Error loading key " + keyFile, key.error());
                return;
            }
            auto next = current.Sign(*key.value());
            if (!next.ok()) {
                exitCode = fail("Error signing with " + keyFile, next.error());
                return;
            }
            current = std::move(next).value();
        }

        Error err = writeSignedLink(signedOut, std::move(current).Build());
        if (err.hasError()) {
            exitCode = fail("Error writing signed link", err);
            return;
        }
        utils::GetLogger().Info("Signed link written to " + signedOut);
    });

    // verify
    auto verify = app.add_subcommand("verify", "Verify a signed link against authorized keys");
    std::vector<std::string> pubFiles;
    std::string signedIn;
    int threshold = 0;
    auto thresholdOpt = verify->add_option("-t,--threshold", threshold, "Number of distinct valid signatures required");
    verify->add_option("-p,--pub", pubFiles, "Authorized public key file (PEM), may be repeated")->required();
    verify->add_option("signed", signedIn, "Signed link document")->required();

    verify->callback([&]() {
        if (thresholdOpt->count() == 0) {
            threshold = config.verify.threshold;
        }

        std::vector<std::shared_ptr<crypto::PublicKey>> authorizedKeys;
        for (const auto& pubFile : pubFiles) {
            auto key = loadPublicKey(pubFile);
            if (!key.ok()) {
                exitCode = fail("Error loading public key " + pubFile, key.error());
                return;
            }
            authorizedKeys.push_back(key.value());
        }

        auto signedLink = loadSignedLink(signedIn);
        if (!signedLink.ok()) {
            exitCode = fail("Error parsing signed link", signedLink.error());
            return;
        }

        auto link = config.verify.parallel
            ? signedLink.value().VerifyParallel(threshold, authorizedKeys)
            : signedLink.value().Verify(threshold, authorizedKeys);
        if (!link.ok()) {
            exitCode = fail("Verification failed", link.error());
            return;
        }

        utils::GetLogger().Info("Verified link", utils::LogContext()
            .With("name", link.value().Name())
            .With("threshold", std::to_string(threshold)));
        std::cout << "OK " << link.value().Name() << std::endl;
    });

    // merge
    auto merge = app.add_subcommand("merge", "Merge the signatures of two signed links");
    std::string mergeLeft;
    std::string mergeRight;
    std::string mergeOut;
    merge->add_option("first", mergeLeft, "Signed link whose signatures take precedence")->required();
    merge->add_option("second", mergeRight, "Signed link to merge in")->required();
    merge->add_option("-o,--output", mergeOut, "Merged output path")->required();

    merge->callback([&]() {
        auto left = loadSignedLink(mergeLeft);
        if (!left.ok()) {
            exitCode = fail("Error parsing " + mergeLeft, left.error());
            return;
        }
        auto right = loadSignedLink(mergeRight);
        if (!right.ok()) {
            exitCode = fail("Error parsing " + mergeRight, right.error());
            return;
        }

        SignedLink merged = std::move(left).value();
        Error err = merged.MergeSignatures(right.value());
        if (err.hasError()) {
            exitCode = fail("Error merging signatures", err);
            return;
        }

        err = writeSignedLink(mergeOut, merged);
        if (err.hasError()) {
            exitCode = fail("Error writing merged link", err);
            return;
        }
        utils::GetLogger().Info("Merged link written to " + mergeOut, utils::LogContext()
            .With("signatures", std::to_string(merged.Signatures().size())));
    });

    // keyid
    auto keyid = app.add_subcommand("keyid", "Print the key ID of a public key");
    std::string keyidFile;
    keyid->add_option("pub", keyidFile, "Public key file (PEM)")->required();

    keyid->callback([&]() {
        auto key = loadPublicKey(keyidFile);
        if (!key.ok()) {
            exitCode = fail("Error loading public key", key.error());
            return;
        }
        std::cout << key.value()->ID() << std::endl;
    });

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app.exit(e);
    }

    return exitCode;
}
