#include <catch2/catch.hpp>
#include <algorithm>
#include <memory>
#include <string>
#include <vector>
#include "intoto/crypto/keys.hpp"
#include "intoto/interchange/json.hpp"
#include "intoto/models/link.hpp"
#include "intoto/models/metadata.hpp"

using namespace intoto;
using namespace intoto::models;

using Json = interchange::Json;
using SignedLink = SignedMetadata<Json, LinkMetadata>;
using RawSignedLink = RawSignedMetadata<Json, LinkMetadata>;
using LinkBuilder = SignedMetadataBuilder<Json, LinkMetadata>;
using KeyList = std::vector<std::shared_ptr<crypto::PublicKey>>;

namespace {

std::shared_ptr<crypto::PrivateKey> newKey(const std::string& scheme = ED25519_SCHEME) {
    auto key = crypto::PrivateKey::Generate(scheme);
    REQUIRE(key.ok());
    return key.value();
}

// {name: "build", materials: {}, products: {"out.bin": {sha256: "abc"}}}
LinkMetadata buildLink(const std::string& name = "build") {
    auto link = LinkMetadataBuilder()
        .Name(name)
        .AddProduct(VirtualTargetPath::New("out.bin").value(), {{"sha256", "abc"}})
        .Build();
    REQUIRE(link.ok());
    return link.value();
}

SignedLink signWith(const LinkMetadata& link, const std::vector<std::shared_ptr<crypto::PrivateKey>>& keys) {
    auto builder = LinkBuilder::FromMetadata(link);
    REQUIRE(builder.ok());
    LinkBuilder current = builder.value();
    for (const auto& key : keys) {
        auto next = current.Sign(*key);
        REQUIRE(next.ok());
        current = next.value();
    }
    return std::move(current).Build();
}

SignedLink decode(const nlohmann::json& j) {
    auto decoded = Json::Deserialize<SignedLink>(j);
    REQUIRE(decoded.ok());
    return decoded.value();
}

// 记录验证过程中的所有事件
struct EventRecorder {
    std::shared_ptr<std::vector<VerificationEvent>> events = std::make_shared<std::vector<VerificationEvent>>();

    VerificationObserver Observer() const {
        auto sink = events;
        return [sink](const VerificationEvent& event) { sink->push_back(event); };
    }

    size_t Count(VerificationEvent::Kind kind) const {
        return static_cast<size_t>(std::count_if(events->begin(), events->end(),
            [kind](const VerificationEvent& event) { return event.kind == kind; }));
    }
};

} // namespace

TEST_CASE("SignedMetadataBuilder - signatures", "[metadata][builder]") {
    auto k1 = newKey();
    auto k2 = newKey();
    auto k3 = newKey();
    LinkMetadata link = buildLink();

    SECTION("Signing twice with the same key keeps one signature") {
        SignedLink signedLink = signWith(link, {k1, k1});
        REQUIRE(signedLink.Signatures().size() == 1);
        REQUIRE(signedLink.Signatures()[0].KeyID() == k1->ID());
    }

    SECTION("Build sorts signatures by key ID") {
        SignedLink signedLink = signWith(link, {k3, k1, k2});
        const auto& sigs = signedLink.Signatures();
        REQUIRE(sigs.size() == 3);
        REQUIRE(std::is_sorted(sigs.begin(), sigs.end(),
            [](const crypto::Signature& a, const crypto::Signature& b) { return a.KeyID() < b.KeyID(); }));
    }

    SECTION("Sign leaves the original builder unchanged") {
        auto builder = LinkBuilder::FromMetadata(link);
        REQUIRE(builder.ok());
        auto signedBuilder = builder.value().Sign(*k1);
        REQUIRE(signedBuilder.ok());
        REQUIRE(builder.value().Build().Signatures().empty());
        REQUIRE(signedBuilder.value().Build().Signatures().size() == 1);
    }

    SECTION("Signatures cover the canonical bytes") {
        auto builder = LinkBuilder::FromMetadata(link);
        REQUIRE(builder.ok());
        auto canonical = Json::Canonicalize(link.toJson());
        REQUIRE(canonical.ok());
        REQUIRE(builder.value().MetadataBytes() == canonical.value());

        SignedLink signedLink = signWith(link, {k1});
        REQUIRE_FALSE(k1->Public()->Verify(canonical.value(), signedLink.Signatures()[0]).hasError());
    }

    SECTION("Raw metadata must decode as the document type") {
        nlohmann::json notALink = {{"_type", "layout"}, {"name", "x"}};
        auto builder = LinkBuilder::FromRawMetadata(notALink);
        REQUIRE_FALSE(builder.ok());
        REQUIRE(builder.error().kind() == ErrorKind::Encoding);
    }

    SECTION("New signs with a single key") {
        auto signedLink = SignedLink::New(link, *k1);
        REQUIRE(signedLink.ok());
        REQUIRE(signedLink.value().Signatures().size() == 1);
        REQUIRE(signedLink.value().Verify(1, {k1->Public()}).ok());
    }
}

TEST_CASE("SignedMetadata - Verify", "[metadata][verify]") {
    auto k1 = newKey();
    auto k2 = newKey(ECDSA_P256_SCHEME);
    auto k3 = newKey();
    LinkMetadata link = buildLink();
    SignedLink signedLink = signWith(link, {k1, k2});
    KeyList authorized = {k1->Public(), k2->Public()};

    SECTION("Threshold met returns the document") {
        auto verified = signedLink.Verify(2, authorized);
        REQUIRE(verified.ok());
        REQUIRE(verified.value() == link);
    }

    SECTION("No signatures") {
        SignedLink unsignedLink = LinkBuilder::FromMetadata(link).value().Build();
        auto verified = unsignedLink.Verify(1, authorized);
        REQUIRE_FALSE(verified.ok());
        REQUIRE(verified.error().kind() == ErrorKind::VerificationFailure);
        REQUIRE(verified.error().what() == "The metadata was not signed with any authorized keys.");
    }

    SECTION("Threshold must be positive") {
        for (int threshold : {0, -1}) {
            auto verified = signedLink.Verify(threshold, authorized);
            REQUIRE_FALSE(verified.ok());
            REQUIRE(verified.error().kind() == ErrorKind::VerificationFailure);
            REQUIRE(verified.error().what() == "Threshold must be strictly greater than zero");
        }
    }

    SECTION("Threshold not met reports the count") {
        auto verified = signedLink.Verify(3, authorized);
        REQUIRE_FALSE(verified.ok());
        REQUIRE(verified.error().kind() == ErrorKind::VerificationFailure);
        REQUIRE(verified.error().what() == "Signature threshold not met: 2/3");
    }

    SECTION("Unauthorized signatures do not count") {
        EventRecorder recorder;
        auto verified = signedLink.Verify(1, {k3->Public()}, recorder.Observer());
        REQUIRE_FALSE(verified.ok());
        REQUIRE(verified.error().what() == "Signature threshold not met: 0/1");
        REQUIRE(recorder.Count(VerificationEvent::Kind::UnauthorizedKey) == 2);
        REQUIRE(recorder.Count(VerificationEvent::Kind::GoodSignature) == 0);
    }

    SECTION("Null keys are skipped") {
        auto verified = signedLink.Verify(1, {nullptr, k1->Public()});
        REQUIRE(verified.ok());
    }

    SECTION("Invalid signatures are ignored") {
        nlohmann::json j = signedLink.toJson();
        for (auto& sig : j["signatures"]) {
            if (sig["keyid"].get<std::string>() == k2->ID().ToString()) {
                sig["sig"] = std::string(sig["sig"].get<std::string>().size(), '0');
            }
        }
        SignedLink tampered = decode(j);

        EventRecorder recorder;
        auto verified = tampered.Verify(2, authorized, recorder.Observer());
        REQUIRE_FALSE(verified.ok());
        REQUIRE(verified.error().what() == "Signature threshold not met: 1/2");
        REQUIRE(recorder.Count(VerificationEvent::Kind::BadSignature) == 1);
        REQUIRE(recorder.Count(VerificationEvent::Kind::GoodSignature) == 1);

        REQUIRE(tampered.Verify(1, authorized).ok());
    }

    SECTION("Duplicate entries count once") {
        SignedLink single = signWith(link, {k1});
        nlohmann::json j = single.toJson();
        nlohmann::json entry = j["signatures"][0];
        j["signatures"].push_back(entry);
        j["signatures"].push_back(entry);
        SignedLink duplicated = decode(j);
        REQUIRE(duplicated.Signatures().size() == 3);

        auto verified = duplicated.Verify(2, {k1->Public()});
        REQUIRE_FALSE(verified.ok());
        REQUIRE(verified.error().what() == "Signature threshold not met: 1/2");
        REQUIRE(duplicated.Verify(1, {k1->Public()}).ok());
    }

    SECTION("Result does not depend on signature order") {
        nlohmann::json j = signedLink.toJson();
        std::reverse(j["signatures"].begin(), j["signatures"].end());
        SignedLink reversed = decode(j);
        REQUIRE(reversed.Signatures() != signedLink.Signatures());

        REQUIRE(reversed.Verify(2, authorized).ok());
        REQUIRE(reversed.Verify(3, authorized).error().what() == signedLink.Verify(3, authorized).error().what());
    }

    SECTION("Whitespace in the signed document does not matter") {
        auto pretty = Json::Serialize(signedLink);
        REQUIRE(pretty.ok());
        auto bytes = interchange::JsonPretty::ToVec(pretty.value());
        REQUIRE(bytes.ok());
        auto parsed = RawSignedLink(bytes.value()).Parse();
        REQUIRE(parsed.ok());
        REQUIRE(parsed.value().Verify(2, authorized).ok());
    }

    SECTION("Verification stops once the threshold is reached") {
        EventRecorder recorder;
        REQUIRE(signedLink.Verify(1, authorized, recorder.Observer()).ok());
        REQUIRE(recorder.events->size() == 1);
        REQUIRE(recorder.Count(VerificationEvent::Kind::GoodSignature) == 1);
    }

    SECTION("Empty observer is allowed") {
        REQUIRE(signedLink.Verify(2, authorized, VerificationObserver()).ok());
    }
}

TEST_CASE("SignedMetadata - VerifyParallel", "[metadata][verify]") {
    auto k1 = newKey();
    auto k2 = newKey(RSASSA_PSS_SHA256_SCHEME);
    auto k3 = newKey();
    LinkMetadata link = buildLink();
    SignedLink signedLink = signWith(link, {k1, k2, k3});
    KeyList authorized = {k1->Public(), k2->Public()};

    SECTION("Same outcome as sequential verification") {
        for (int threshold : {1, 2, 3}) {
            auto sequential = signedLink.Verify(threshold, authorized, VerificationObserver());
            auto parallel = signedLink.VerifyParallel(threshold, authorized, VerificationObserver());
            REQUIRE(sequential.ok() == parallel.ok());
            if (!sequential.ok()) {
                REQUIRE(sequential.error().what() == parallel.error().what());
            } else {
                REQUIRE(parallel.value() == link);
            }
        }
    }

    SECTION("Every signature is reported") {
        EventRecorder recorder;
        REQUIRE(signedLink.VerifyParallel(1, authorized, recorder.Observer()).ok());
        REQUIRE(recorder.Count(VerificationEvent::Kind::GoodSignature) == 2);
        REQUIRE(recorder.Count(VerificationEvent::Kind::UnauthorizedKey) == 1);
    }

    SECTION("Precondition failures") {
        REQUIRE(signedLink.VerifyParallel(0, authorized).error().what() ==
                "Threshold must be strictly greater than zero");
    }
}

TEST_CASE("SignedMetadata - MergeSignatures", "[metadata][merge]") {
    auto k1 = newKey();
    auto k2 = newKey();
    LinkMetadata link = buildLink();

    SECTION("Unequal metadata is rejected") {
        SignedLink a = signWith(link, {k1});
        SignedLink b = signWith(buildLink("package"), {k2});
        Error err = a.MergeSignatures(b);
        REQUIRE(err.hasError());
        REQUIRE(err.kind() == ErrorKind::IllegalArgument);
        REQUIRE(err.what() == "Attempted to merge unequal metadata");
        REQUIRE(a.Signatures().size() == 1);
    }

    SECTION("Existing signatures take precedence") {
        SignedLink a = signWith(link, {k1});
        nlohmann::json j = a.toJson();
        j["signatures"][0]["sig"] = "00";
        SignedLink b = decode(j);

        REQUIRE_FALSE(a.MergeSignatures(b).hasError());
        REQUIRE(a.Signatures().size() == 1);
        REQUIRE(a.Verify(1, {k1->Public()}).ok());

        REQUIRE_FALSE(b.MergeSignatures(a).hasError());
        REQUIRE(b.Signatures().size() == 1);
        REQUIRE_FALSE(b.Verify(1, {k1->Public()}).ok());
    }

    SECTION("New signatures are appended") {
        SignedLink a = signWith(link, {k1});
        SignedLink b = signWith(link, {k2});
        REQUIRE_FALSE(a.MergeSignatures(b).hasError());
        REQUIRE(a.Signatures().size() == 2);
        REQUIRE(a.Signatures()[0].KeyID() == k1->ID());
        REQUIRE(a.Signatures()[1].KeyID() == k2->ID());
    }

    SECTION("Two of two after merging") {
        KeyList authorized = {k1->Public(), k2->Public()};
        SignedLink a = signWith(link, {k1});

        auto partial = a.Verify(2, authorized);
        REQUIRE_FALSE(partial.ok());
        REQUIRE(partial.error().what() == "Signature threshold not met: 1/2");

        REQUIRE_FALSE(a.MergeSignatures(signWith(link, {k2})).hasError());
        auto verified = a.Verify(2, authorized);
        REQUIRE(verified.ok());
        REQUIRE(verified.value() == link);
    }
}

TEST_CASE("RawSignedMetadata - parse and serialize", "[metadata][raw]") {
    auto k1 = newKey();
    LinkMetadata link = buildLink();
    SignedLink signedLink = signWith(link, {k1});

    SECTION("ToRaw then Parse gives an equal document") {
        auto raw = signedLink.ToRaw();
        REQUIRE(raw.ok());
        auto parsed = raw.value().Parse();
        REQUIRE(parsed.ok());
        REQUIRE(parsed.value() == signedLink);

        // 规范化输出是稳定的
        REQUIRE(parsed.value().ToRaw().value() == raw.value());
    }

    SECTION("Wire format") {
        auto raw = signedLink.ToRaw();
        REQUIRE(raw.ok());
        std::string text(raw.value().AsBytes().begin(), raw.value().AsBytes().end());
        std::string prefix = "{\"signatures\":[{\"keyid\":\"" + k1->ID().ToString() + "\",\"sig\":\"";
        REQUIRE(text.rfind(prefix, 0) == 0);
        REQUIRE(text.find("\"signed\":{\"_type\":\"link\"") != std::string::npos);
    }

    SECTION("Malformed bytes") {
        std::string text = "{\"signatures\": [";
        auto parsed = RawSignedLink(std::vector<uint8_t>(text.begin(), text.end())).Parse();
        REQUIRE_FALSE(parsed.ok());
        REQUIRE(parsed.error().kind() == ErrorKind::Encoding);
    }

    SECTION("Missing envelope fields") {
        std::string text = "{\"signatures\": []}";
        auto parsed = RawSignedLink(std::vector<uint8_t>(text.begin(), text.end())).Parse();
        REQUIRE_FALSE(parsed.ok());
        REQUIRE(parsed.error().kind() == ErrorKind::Encoding);
    }

    SECTION("Parse does not decode the document") {
        std::string text = "{\"signatures\": [], \"signed\": {\"_type\": \"layout\"}}";
        auto parsed = RawSignedLink(std::vector<uint8_t>(text.begin(), text.end())).Parse();
        REQUIRE(parsed.ok());
        REQUIRE(parsed.value().Signatures().empty());

        auto assumed = parsed.value().AssumeValid();
        REQUIRE_FALSE(assumed.ok());
        REQUIRE(assumed.error().kind() == ErrorKind::Encoding);
    }

    SECTION("AssumeValid skips signature checks") {
        nlohmann::json j = signedLink.toJson();
        j["signatures"][0]["sig"] = "00";
        auto assumed = decode(j).AssumeValid();
        REQUIRE(assumed.ok());
        REQUIRE(assumed.value() == link);
    }
}

TEST_CASE("RawSignedMetadata - hostile nesting", "[metadata][raw]") {
    auto k1 = newKey();
    const size_t depth = 1000000;

    std::string text = "{\"signatures\":[{\"keyid\":\"" + k1->ID().ToString() + "\",\"sig\":\"00\"}],\"signed\":";
    text += std::string(depth, '[');
    text += std::string(depth, ']');
    text += "}";

    auto parsed = RawSignedLink(std::vector<uint8_t>(text.begin(), text.end())).Parse();
    REQUIRE_FALSE(parsed.ok());
    REQUIRE(parsed.error().kind() == ErrorKind::Encoding);
}

TEST_CASE("SignedMetadata - merge compares canonical bytes", "[metadata][merge]") {
    auto k1 = newKey();
    auto k2 = newKey();
    SignedLink base = signWith(buildLink(), {k1});

    SECTION("Integer and floating point payloads do not merge") {
        nlohmann::json withInteger = base.toJson();
        withInteger["signed"]["extra"] = 1;
        nlohmann::json withFloat = withInteger;
        withFloat["signed"]["extra"] = 1.0;
        withFloat["signatures"][0]["keyid"] = k2->ID().ToString();

        SignedLink a = decode(withInteger);
        SignedLink b = decode(withFloat);
        REQUIRE(a.Metadata() == b.Metadata());

        REQUIRE(a.MergeSignatures(b).hasError());
        REQUIRE(a.Signatures().size() == 1);
        REQUIRE(b.MergeSignatures(a).hasError());
        REQUIRE(b.Signatures().size() == 1);
    }

    SECTION("Key order in the payload does not matter") {
        std::string text = "{\"signatures\":[],\"signed\":{\"products\":{\"out.bin\":{\"sha256\":\"abc\"}},"
                           "\"name\":\"build\",\"materials\":{},\"env\":{},\"byproducts\":{},\"_type\":\"link\"}}";
        auto reordered = RawSignedLink(std::vector<uint8_t>(text.begin(), text.end())).Parse();
        REQUIRE(reordered.ok());

        SignedLink merged = signWith(buildLink(), {k2});
        REQUIRE_FALSE(merged.MergeSignatures(reordered.value()).hasError());
        REQUIRE_FALSE(reordered.value().MergeSignatures(base).hasError());
        REQUIRE(reordered.value().Signatures().size() == 1);
    }
}

TEST_CASE("SignedMetadata - VerifyParallel with many signers", "[metadata][verify]") {
    LinkMetadata link = buildLink();
    std::vector<std::shared_ptr<crypto::PrivateKey>> keys;
    KeyList authorized;
    for (int i = 0; i < 24; ++i) {
        keys.push_back(newKey());
        authorized.push_back(keys.back()->Public());
    }
    SignedLink signedLink = signWith(link, keys);

    EventRecorder recorder;
    auto verified = signedLink.VerifyParallel(24, authorized, recorder.Observer());
    REQUIRE(verified.ok());
    REQUIRE(verified.value() == link);
    REQUIRE(recorder.Count(VerificationEvent::Kind::GoodSignature) == 24);

    auto notMet = signedLink.VerifyParallel(25, authorized, VerificationObserver());
    REQUIRE_FALSE(notMet.ok());
    REQUIRE(notMet.error().what() == "Signature threshold not met: 24/25");
}
