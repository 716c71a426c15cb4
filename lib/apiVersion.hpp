#ifndef DOCKWIRE_API_VERSION_HPP
#define DOCKWIRE_API_VERSION_HPP

#include <compare>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

namespace Dockwire {
    struct ApiVersion {
        unsigned major = 0;
        unsigned minor = 0;

        auto operator<=>(const ApiVersion& other) const = default;

        // "1.41" or "v1.41". Throws VersionError(Unparseable).
        static ApiVersion parse(const std::string& text);
        std::string toString() const;
    };

    constexpr ApiVersion DEFAULT_API_VERSION{1, 45};
    constexpr ApiVersion MINIMUM_API_VERSION{1, 40};

    class VersionNegotiator {
    public:
        // Returns the body of GET /version.
        using Fetch = std::function<std::string()>;

        explicit VersionNegotiator(std::optional<ApiVersion> pinned = std::nullopt,
                                   ApiVersion compiledDefault = DEFAULT_API_VERSION,
                                   ApiVersion minimum = MINIMUM_API_VERSION);

        ApiVersion select(ApiVersion server) const;

        // Fetches the server version once; later calls return the cached result.
        ApiVersion negotiate(const Fetch& fetch);

        std::optional<ApiVersion> negotiated() const;
        std::string path(const std::string& resource) const;

        static ApiVersion serverVersion(const std::string& versionBody);

    private:
        std::optional<ApiVersion> pinned_;
        ApiVersion default_;
        ApiVersion minimum_;
        mutable std::mutex mutex_;
        std::optional<ApiVersion> negotiated_;
    };
}

#endif // DOCKWIRE_API_VERSION_HPP
