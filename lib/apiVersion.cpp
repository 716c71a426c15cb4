#include "apiVersion.hpp"

#include <nlohmann/json.hpp>

#include "errors.hpp"
#include "log.hpp"

namespace Dockwire {
    namespace {
        bool parseNumber(const std::string& text, unsigned& value) {
            if (text.empty() || text.size() > 6) return false;
            value = 0;
            for (char c : text) {
                if (c < '0' || c > '9') return false;
                value = value * 10 + static_cast<unsigned>(c - '0');
            }
            return true;
        }
    }

    ApiVersion ApiVersion::parse(const std::string& text) {
        std::string value = !text.empty() && (text.front() == 'v' || text.front() == 'V') ? text.substr(1) : text;
        auto dot = value.find('.');
        ApiVersion version;
        if (dot == std::string::npos || !parseNumber(value.substr(0, dot), version.major) ||
            !parseNumber(value.substr(dot + 1), version.minor)) {
            throw VersionError(VersionError::Code::Unparseable, "invalid API version '" + text + "'");
        }
        return version;
    }

    std::string ApiVersion::toString() const {
        return std::to_string(major) + "." + std::to_string(minor);
    }

    VersionNegotiator::VersionNegotiator(std::optional<ApiVersion> pinned, ApiVersion compiledDefault, ApiVersion minimum)
        : pinned_(pinned), default_(compiledDefault), minimum_(minimum) {}

    ApiVersion VersionNegotiator::select(ApiVersion server) const {
        ApiVersion chosen;
        if (pinned_) {
            if (*pinned_ > server) {
                throw VersionError(VersionError::Code::PinnedAboveServer,
                                   "pinned API version " + pinned_->toString() + " is newer than the daemon's " +
                                       server.toString());
            }
            chosen = *pinned_;
        } else {
            chosen = server < default_ ? server : default_;
        }
        if (chosen < minimum_) {
            throw VersionError(VersionError::Code::VersionTooOld,
                               "API version " + chosen.toString() + " is older than the supported minimum " +
                                   minimum_.toString());
        }
        return chosen;
    }

    ApiVersion VersionNegotiator::serverVersion(const std::string& versionBody) {
        auto body = nlohmann::json::parse(versionBody, nullptr, false);
        if (body.is_discarded() || !body.is_object() || !body.contains("ApiVersion") || !body["ApiVersion"].is_string()) {
            throw VersionError(VersionError::Code::Unparseable, "version response carries no ApiVersion");
        }
        return ApiVersion::parse(body["ApiVersion"].get<std::string>());
    }

    ApiVersion VersionNegotiator::negotiate(const Fetch& fetch) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (negotiated_) return *negotiated_;

        ApiVersion server = serverVersion(fetch());
        negotiated_ = select(server);
        Log::debug("daemon API " + server.toString() + ", using " + negotiated_->toString());
        return *negotiated_;
    }

    std::optional<ApiVersion> VersionNegotiator::negotiated() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return negotiated_;
    }

    std::string VersionNegotiator::path(const std::string& resource) const {
        auto version = negotiated();
        if (!version) {
            throw SessionError(SessionError::Code::InvalidState, "API version has not been negotiated");
        }
        std::string suffix = resource.empty() || resource.front() == '/' ? resource : "/" + resource;
        return "/v" + version->toString() + suffix;
    }
}
