#include "sessionProviders.hpp"

#include <algorithm>
#include <boost/asio/post.hpp>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <nlohmann/json.hpp>

#include "buildSession.hpp"
#include "log.hpp"

namespace Dockwire {
    namespace {
        const std::string HEALTH_CHECK = "/grpc.health.v1.Health/Check";
        const std::string AUTH_CREDENTIALS = "/moby.filesync.v1.Auth/Credentials";
        const std::string GET_SECRET = "/moby.buildkit.secrets.v1.Secrets/GetSecret";
        const std::string UPLOAD_PULL = "/moby.upload.v1.Upload/Pull";
        const std::string UPLOAD_HOST = "http://buildkit-session";
        constexpr std::size_t UPLOAD_CHUNK = 32 * 1024;

        nlohmann::json parseRequest(const std::string& request) {
            auto document = nlohmann::json::parse(request, nullptr, false);
            if (document.is_discarded() || !document.is_object()) {
                throw InvocationFailure(StatusCode::InvalidArgument, "request is not a JSON object");
            }
            return document;
        }

        std::string stringField(const nlohmann::json& document, const char* key) {
            if (!document.contains(key) || !document[key].is_string()) {
                throw InvocationFailure(StatusCode::InvalidArgument, std::string("request has no ") + key);
            }
            return document[key].get<std::string>();
        }

        // Streams one payload in chunks, one per turn of the call's context, then ends the call.
        class UploadPull : public Invocation {
            const UploadProvider& provider_;
            InvocationChannel* channel_ = nullptr;
            std::shared_ptr<const std::string> data_;
            std::size_t offset_ = 0;
            bool ended_ = false;

            void step() {
                if (ended_) return;
                if (offset_ >= data_->size()) {
                    ended_ = true;
                    channel_->finish();
                    return;
                }
                std::size_t size = std::min(UPLOAD_CHUNK, data_->size() - offset_);
                channel_->send(data_->substr(offset_, size));
                offset_ += size;
                boost::asio::post(channel_->context(), [this]() { step(); });
            }

        public:
            explicit UploadPull(const UploadProvider& provider) : provider_(provider) {}

            void start(InvocationChannel& channel) override {
                channel_ = &channel;
                data_ = provider_.find(channel.metadataValue("urlpath"));
                if (!data_) {
                    ended_ = true;
                    channel.fail(StatusCode::InvalidArgument, "invalid 'urlpath' in upload request");
                    return;
                }
                boost::asio::post(channel.context(), [this]() { step(); });
            }

            void onData(const std::string&) override {}
            void onClose() override {}
            void cancel() override { ended_ = true; }
        };
    }

    std::vector<std::string> HealthService::methods() const {
        return {HEALTH_CHECK};
    }

    std::unique_ptr<Invocation> HealthService::invoke(const std::string&) {
        return std::make_unique<UnaryInvocation>([](const std::string&, InvocationChannel&) {
            return nlohmann::json{{"status", "SERVING"}}.dump();
        });
    }

    std::vector<std::string> AuthProvider::methods() const {
        return {AUTH_CREDENTIALS};
    }

    std::unique_ptr<Invocation> AuthProvider::invoke(const std::string&) {
        return std::make_unique<UnaryInvocation>([this](const std::string& request, InvocationChannel&) {
            return answer(request);
        });
    }

    std::string AuthProvider::answer(const std::string& request) const {
        const std::string host = stringField(parseRequest(request), "Host");
        nlohmann::json response = {{"Username", ""}, {"Secret", ""}};
        auto it = credentials_.find(host);
        if (it != credentials_.end()) {
            response["Username"] = it->second.username;
            response["Secret"] = it->second.secret;
        } else {
            Log::debug("no credentials for " + host);
        }
        return response.dump();
    }

    std::vector<std::string> SecretsProvider::methods() const {
        return {GET_SECRET};
    }

    std::unique_ptr<Invocation> SecretsProvider::invoke(const std::string&) {
        return std::make_unique<UnaryInvocation>([this](const std::string& request, InvocationChannel&) {
            return answer(request);
        });
    }

    std::string SecretsProvider::answer(const std::string& request) const {
        const std::string id = stringField(parseRequest(request), "ID");
        auto it = secrets_.find(id);
        if (it == secrets_.end()) {
            throw InvocationFailure(StatusCode::NotFound, "secret " + id + " not found");
        }
        const SecretSource& source = it->second;
        if (!source.file.empty()) {
            std::ifstream file(source.file, std::ios::binary);
            if (!file) {
                throw InvocationFailure(StatusCode::NotFound, "secret " + id + ": cannot open " + source.file);
            }
            return std::string(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
        }
        const char* value = std::getenv(source.env.c_str());
        if (source.env.empty() || value == nullptr) {
            throw InvocationFailure(StatusCode::NotFound, "secret " + id + ": environment variable is not set");
        }
        return value;
    }

    std::vector<std::string> UploadProvider::methods() const {
        return {UPLOAD_PULL};
    }

    std::unique_ptr<Invocation> UploadProvider::invoke(const std::string&) {
        return std::make_unique<UploadPull>(*this);
    }

    std::string UploadProvider::add(std::string data) {
        const std::string id = newSessionId();
        std::lock_guard<std::mutex> lock(mutex_);
        uploads_["/" + id] = std::make_shared<const std::string>(std::move(data));
        return UPLOAD_HOST + "/" + id;
    }

    std::shared_ptr<const std::string> UploadProvider::find(const std::string& urlPath) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = uploads_.find(urlPath);
        return it == uploads_.end() ? nullptr : it->second;
    }
}
