// SPDX-License-Identifier: Apache-2.0
// Part of the StripRequest (SR) project.
// tests/minimizer_test.cpp

#include "sr/minimizer.hpp"
#include "sr/codec.hpp"
#include "sr/log.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <functional>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace {

// Answers by inspecting the parsed request. Safe for concurrent use.
class ScriptedTransport : public sr::Transport {
public:
    using Responder = std::function<std::string(const sr::Request&)>;

    explicit ScriptedTransport(Responder r) : _respond(std::move(r)) {}

    bool send(const sr::Target&, const std::string& raw,
              std::string& head, std::string& err) override {
        calls.fetch_add(1);
        {
            std::lock_guard<std::mutex> lk(_mtx);
            sent.push_back(raw);
        }
        const std::string out = _respond(sr::parse_request(raw));
        if (out.empty()) {
            err = "connection error";
            return false;
        }
        head = out;
        return true;
    }

    std::atomic<int> calls{0};
    std::vector<std::string> sent;

private:
    Responder _respond;
    std::mutex _mtx;
};

const char* kOk      = "HTTP/1.1 200 OK\r\nContent-Length: 1256\r\nDate: now\r\n\r\n";
const char* kBadReq  = "HTTP/1.1 400 Bad Request\r\nContent-Length: 349\r\n\r\n";
const char* kOkSmall = "HTTP/1.1 200 OK\r\nContent-Length: 612\r\n\r\n";

const char* kScenario =
    "GET / HTTP/1.1\n"
    "Host: example.com\n"
    "User-Agent: X\n"
    "Accept-Encoding: gzip, deflate\n"
    "\n";

class MinimizerTest : public ::testing::Test {
protected:
    void SetUp() override { sr::set_log_file(""); }

    sr::Target target{"example.com", 80, false};
};

sr::ResponseFingerprint fingerprint_of(const char* head) {
    sr::ResponseFingerprint fp;
    std::string err;
    EXPECT_TRUE(sr::parse_response(head, fp, err)) << err;
    return fp;
}

// ---------------------------------------------------------------------------
// enumerate_variants
// ---------------------------------------------------------------------------

TEST_F(MinimizerTest, VariantCountCoversEveryLocation) {
    const sr::Request base = sr::parse_request(
        "POST /p?a=1&b=2 HTTP/1.1\nHost: h\nAccept: */*\nCookie: s=1; t=2; u=3\n\nf1=x&f2=y\n");
    ASSERT_EQ(base.body_type, sr::BodyType::Form);

    const std::vector<sr::Variant> vs = sr::enumerate_variants(base);
    ASSERT_EQ(vs.size(), 2u + 2u + 2u + 3u);

    std::set<std::pair<int, std::string>> seen;
    for (const auto& v : vs) {
        // exactly one element gone, from exactly one location
        const sr::FieldMap& before = base.fields(v.removal.location);
        const sr::FieldMap& after  = v.request.fields(v.removal.location);
        EXPECT_TRUE(before.contains(v.removal.key));
        EXPECT_FALSE(after.contains(v.removal.key));
        EXPECT_EQ(after.size() + 1, before.size());

        sr::Request restored = v.request;
        restored.fields(v.removal.location) = before;
        EXPECT_EQ(restored, base);

        seen.insert({static_cast<int>(v.removal.location), v.removal.key});
    }
    EXPECT_EQ(seen.size(), vs.size());
}

TEST_F(MinimizerTest, VariantOrderIsQueryFormHeadersCookies) {
    const sr::Request base = sr::parse_request(
        "POST /p?q=1 HTTP/1.1\nHost: h\nCookie: c=1\n\nf=1\n");
    const std::vector<sr::Variant> vs = sr::enumerate_variants(base);
    ASSERT_EQ(vs.size(), 4u);
    EXPECT_EQ(vs[0].removal, (sr::Removal{"q", sr::Location::QueryParams}));
    EXPECT_EQ(vs[1].removal, (sr::Removal{"f", sr::Location::FormBody}));
    EXPECT_EQ(vs[2].removal, (sr::Removal{"Host", sr::Location::Headers}));
    EXPECT_EQ(vs[3].removal, (sr::Removal{"c", sr::Location::Cookies}));
}

TEST_F(MinimizerTest, EmptyBodyContributesNoBodyCandidates) {
    const sr::Request base = sr::parse_request(
        "GET /p?a=1 HTTP/1.1\nHost: h\nCookie: s=1\n\n");
    ASSERT_EQ(base.body_type, sr::BodyType::Empty);
    const std::vector<sr::Variant> vs = sr::enumerate_variants(base);
    EXPECT_EQ(vs.size(), 3u);
    for (const auto& v : vs) EXPECT_NE(v.removal.location, sr::Location::FormBody);
}

TEST_F(MinimizerTest, JsonBodyContributesNoBodyCandidates) {
    const sr::Request base = sr::parse_request(
        "POST /api HTTP/1.1\nHost: h\n\n{\"a\":1,\"b\":2}\n");
    ASSERT_EQ(base.body_type, sr::BodyType::Json);
    EXPECT_EQ(sr::enumerate_variants(base).size(), 1u);
}

TEST_F(MinimizerTest, BareRequestHasNoVariants) {
    EXPECT_TRUE(sr::enumerate_variants(sr::parse_request("GET / HTTP/1.1\n\n")).empty());
}

TEST_F(MinimizerTest, SameKeyInDifferentLocationsStaysDistinct) {
    sr::Request r = sr::parse_request("GET /?id=1 HTTP/1.1\nid: 2\nCookie: id=3\n\n");
    sr::remove_element(r, sr::Removal{"id", sr::Location::Headers});
    EXPECT_FALSE(r.headers.contains("id"));
    EXPECT_TRUE(r.query_params.contains("id"));
    EXPECT_TRUE(r.cookies.contains("id"));

    // absent key is a no-op
    const sr::Request before = r;
    sr::remove_element(r, sr::Removal{"nope", sr::Location::Cookies});
    EXPECT_EQ(r, before);
}

// ---------------------------------------------------------------------------
// probe_all / reduce / minimize
// ---------------------------------------------------------------------------

TEST_F(MinimizerTest, KeepsOnlyLoadBearingHeaders) {
    ScriptedTransport t([](const sr::Request& r) -> std::string {
        if (!r.headers.contains("Host")) return kBadReq;
        if (!r.headers.contains("Accept-Encoding")) return kOkSmall;
        return kOk;
    });

    const sr::ProbeOutcome base = sr::probe_baseline(t, target, kScenario);
    ASSERT_TRUE(base.ok) << base.error;

    const sr::Request stripped = sr::minimize(t, sr::parse_request(kScenario), base.fingerprint, target);
    EXPECT_EQ(sr::serialize_request(stripped),
              "GET / HTTP/1.1\n"
              "Host: example.com\n"
              "Accept-Encoding: gzip, deflate\n"
              "\n");
    EXPECT_EQ(t.calls.load(), 1 + 3);
}

TEST_F(MinimizerTest, ProbeAllReturnsOneResultPerVariantInOrder) {
    ScriptedTransport t([](const sr::Request&) -> std::string { return kOk; });

    const sr::Request base = sr::parse_request(
        "GET /?a=1&b=2&c=3 HTTP/1.1\nH1: 1\nH2: 2\nH3: 3\nH4: 4\nCookie: x=1; y=2; z=3\n\n");
    const std::vector<sr::Variant> vs = sr::enumerate_variants(base);
    const std::vector<sr::ProbeResult> rs = sr::probe_all(t, target, vs);

    ASSERT_EQ(rs.size(), vs.size());
    for (std::size_t i = 0; i < rs.size(); ++i) {
        EXPECT_EQ(rs[i].removal, vs[i].removal);
        EXPECT_TRUE(rs[i].ok);
        EXPECT_EQ(rs[i].fingerprint.content_length, 1256);
    }
    EXPECT_EQ(t.calls.load(), static_cast<int>(vs.size()));
    EXPECT_EQ(t.sent.size(), vs.size());
}

TEST_F(MinimizerTest, TransportFailureKeepsTheElement) {
    // Dropping the session cookie makes the server hang up.
    ScriptedTransport t([](const sr::Request& r) -> std::string {
        if (!r.cookies.contains("session")) return std::string();
        return kOk;
    });

    const sr::Request base = sr::parse_request(
        "GET / HTTP/1.1\nHost: h\nCookie: session=abc; tracking=1\n\n");
    const sr::Request stripped = sr::minimize(t, base, fingerprint_of(kOk), target);

    EXPECT_TRUE(stripped.cookies.contains("session"));
    EXPECT_FALSE(stripped.cookies.contains("tracking"));
    EXPECT_FALSE(stripped.headers.contains("Host"));
}

TEST_F(MinimizerTest, WrongProtocolResponseKeepsTheElement) {
    ScriptedTransport t([](const sr::Request& r) -> std::string {
        if (!r.query_params.contains("v")) return "\x15\x03\x01 garbage\n\n";
        return kOk;
    });

    const sr::Request base = sr::parse_request("GET /x?v=2&utm=1 HTTP/1.1\n\n");
    const std::vector<sr::ProbeResult> rs = sr::probe_all(t, target, sr::enumerate_variants(base));
    ASSERT_EQ(rs.size(), 2u);
    EXPECT_FALSE(rs[0].ok);
    EXPECT_FALSE(rs[0].error.empty());
    EXPECT_TRUE(rs[1].ok);

    const sr::Request stripped = sr::reduce(base, fingerprint_of(kOk), rs);
    EXPECT_EQ(sr::serialize_request(stripped), "GET /x?v=2 HTTP/1.1\n\n");
}

TEST_F(MinimizerTest, FormFieldRemovalFoldsIntoBody) {
    ScriptedTransport t([](const sr::Request& r) -> std::string {
        if (r.body_type != sr::BodyType::Form || !r.form_body.contains("k2")) return kBadReq;
        return kOk;
    });

    const sr::Request base = sr::parse_request("POST /f HTTP/1.1\nHost: h\n\nk1=v1&k2=v2\n");
    const sr::Request stripped = sr::minimize(t, base, fingerprint_of(kOk), target);
    EXPECT_EQ(sr::encode_body(stripped), "k2=v2");
    EXPECT_EQ(sr::serialize_request(stripped), "POST /f HTTP/1.1\n\nk2=v2\n\n");
}

TEST_F(MinimizerTest, RemovingEveryFormFieldLeavesNoBody) {
    ScriptedTransport t([](const sr::Request&) -> std::string { return kOk; });

    const sr::Request base = sr::parse_request("POST /f HTTP/1.1\n\nk1=v1&k2=v2\n");
    const sr::Request stripped = sr::minimize(t, base, fingerprint_of(kOk), target);
    EXPECT_EQ(stripped.body_type, sr::BodyType::Empty);
    EXPECT_EQ(sr::serialize_request(stripped), "POST /f HTTP/1.1\n\n");
    EXPECT_EQ(sr::parse_request(sr::serialize_request(stripped)), stripped);
}

TEST_F(MinimizerTest, ReduceIgnoresNonMatchingAndFailedResults) {
    const sr::Request base = sr::parse_request("GET / HTTP/1.1\nA: 1\nB: 2\nC: 3\n\n");
    const sr::ResponseFingerprint baseline = fingerprint_of(kOk);

    std::vector<sr::ProbeResult> rs(3);
    rs[0].removal = {"A", sr::Location::Headers};
    rs[0].ok = true;
    rs[0].fingerprint = baseline;
    rs[1].removal = {"B", sr::Location::Headers};
    rs[1].ok = true;
    rs[1].fingerprint = fingerprint_of(kBadReq);
    rs[2].removal = {"C", sr::Location::Headers};
    rs[2].ok = false;
    rs[2].fingerprint = baseline;
    rs[2].error = "read timeout waiting for response headers";

    const sr::Request out = sr::reduce(base, baseline, rs);
    EXPECT_FALSE(out.headers.contains("A"));
    EXPECT_TRUE(out.headers.contains("B"));
    EXPECT_TRUE(out.headers.contains("C"));
}

TEST_F(MinimizerTest, BaselineFailureIsReported) {
    ScriptedTransport t([](const sr::Request&) -> std::string { return std::string(); });
    const sr::ProbeOutcome o = sr::probe_baseline(t, target, kScenario);
    EXPECT_FALSE(o.ok);
    EXPECT_EQ(o.error, "connection error");
}

TEST_F(MinimizerTest, BaselineIsSentVerbatim) {
    ScriptedTransport t([](const sr::Request&) -> std::string { return kOk; });
    const std::string raw = "GET /?a=1&a=2 HTTP/1.1\r\nHost: h:1\r\n\r\n";
    ASSERT_TRUE(sr::probe_baseline(t, target, raw).ok);
    ASSERT_EQ(t.sent.size(), 1u);
    EXPECT_EQ(t.sent[0], raw);
}

} // namespace
