#include <gtest/gtest.h>

#include "../lib/apiVersion.hpp"
#include "../lib/errors.hpp"

using namespace Dockwire;

namespace {
    std::string versionBody(const std::string& apiVersion) {
        return "{\"Version\":\"24.0.7\",\"ApiVersion\":\"" + apiVersion + "\",\"MinAPIVersion\":\"1.12\"}";
    }

    VersionError::Code versionCode(const std::function<void()>& action) {
        try {
            action();
        } catch (const VersionError& e) {
            return e.code();
        }
        ADD_FAILURE() << "no VersionError thrown";
        return VersionError::Code::Unparseable;
    }
}

TEST(ApiVersionTest, ParsesWithAndWithoutPrefix) {
    EXPECT_EQ(ApiVersion::parse("1.41"), (ApiVersion{1, 41}));
    EXPECT_EQ(ApiVersion::parse("v1.43"), (ApiVersion{1, 43}));
    EXPECT_EQ(ApiVersion::parse("1.9").toString(), "1.9");
    EXPECT_LT(ApiVersion::parse("1.9"), ApiVersion::parse("1.10"));
}

TEST(ApiVersionTest, RejectsMalformedVersions) {
    for (const std::string& text : {"", "1", "1.", ".4", "1.x", "one.two", "1.41.2"}) {
        EXPECT_EQ(versionCode([&] { ApiVersion::parse(text); }), VersionError::Code::Unparseable) << text;
    }
}

TEST(VersionNegotiatorTest, OlderServerWins) {
    VersionNegotiator negotiator;
    EXPECT_EQ(negotiator.negotiate([] { return versionBody("1.41"); }), (ApiVersion{1, 41}));
    EXPECT_EQ(negotiator.path("/containers/json"), "/v1.41/containers/json");
}

TEST(VersionNegotiatorTest, NewerServerIsCappedAtDefault) {
    VersionNegotiator negotiator;
    EXPECT_EQ(negotiator.negotiate([] { return versionBody("1.47"); }), DEFAULT_API_VERSION);
}

TEST(VersionNegotiatorTest, FetchesOnlyOnce) {
    VersionNegotiator negotiator;
    int fetches = 0;
    auto fetch = [&] {
        ++fetches;
        return versionBody("1.43");
    };
    negotiator.negotiate(fetch);
    negotiator.negotiate(fetch);
    EXPECT_EQ(fetches, 1);
    EXPECT_EQ(negotiator.negotiated(), (ApiVersion{1, 43}));
}

TEST(VersionNegotiatorTest, ServerBelowMinimumIsTooOld) {
    VersionNegotiator negotiator;
    EXPECT_EQ(versionCode([&] { negotiator.negotiate([] { return versionBody("1.30"); }); }),
              VersionError::Code::VersionTooOld);
    EXPECT_FALSE(negotiator.negotiated().has_value());
}

TEST(VersionNegotiatorTest, PinnedVersionAboveServerFails) {
    VersionNegotiator negotiator(ApiVersion{1, 44});
    EXPECT_EQ(versionCode([&] { negotiator.negotiate([] { return versionBody("1.41"); }); }),
              VersionError::Code::PinnedAboveServer);
}

TEST(VersionNegotiatorTest, PinnedVersionIsUsedAsIs) {
    VersionNegotiator negotiator(ApiVersion{1, 41});
    EXPECT_EQ(negotiator.negotiate([] { return versionBody("1.45"); }), (ApiVersion{1, 41}));
}

TEST(VersionNegotiatorTest, UnparseableServerResponse) {
    VersionNegotiator negotiator;
    EXPECT_EQ(versionCode([&] { negotiator.negotiate([] { return std::string("{\"Version\":\"24.0\"}"); }); }),
              VersionError::Code::Unparseable);
    EXPECT_EQ(versionCode([&] { negotiator.negotiate([] { return std::string("<html>"); }); }),
              VersionError::Code::Unparseable);
}

TEST(VersionNegotiatorTest, PathRequiresNegotiation) {
    VersionNegotiator negotiator;
    EXPECT_THROW(negotiator.path("/info"), SessionError);
}
