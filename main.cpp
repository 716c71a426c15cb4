#include <filesystem>
#include <iostream>
#include <iterator>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "lib/buildSession.hpp"
#include "lib/dockerClient.hpp"
#include "lib/errors.hpp"
#include "lib/fileSync.hpp"
#include "lib/sessionProviders.hpp"
#include "lib/sshForward.hpp"

namespace {
    int usage() {
        std::cerr << "usage: dockwire version\n"
                  << "       dockwire ping\n"
                  << "       dockwire logs <container> [--follow] [--tail N]\n"
                  << "       dockwire build <dir|-> [-t tag] [-f dockerfile] [--session] [--ssh]" << std::endl;
        return 2;
    }

    int version(Dockwire::DockerClient& client) {
        auto info = client.version();
        std::cout << "Server: " << info.value("Version", "unknown") << '\n'
                  << "API version: " << info.value("ApiVersion", "unknown")
                  << " (using " << client.apiVersion().toString() << ")\n"
                  << "OS/Arch: " << info.value("Os", "") << "/" << info.value("Arch", "") << std::endl;
        return 0;
    }

    int logs(Dockwire::DockerClient& client, const std::vector<std::string>& args) {
        if (args.empty()) return usage();
        Dockwire::LogsOptions options;
        for (std::size_t i = 1; i < args.size(); ++i) {
            if (args[i] == "--follow" || args[i] == "-f") {
                options.follow = true;
            } else if (args[i] == "--tail" && i + 1 < args.size()) {
                options.tail = static_cast<unsigned>(std::stoul(args[++i]));
            } else {
                return usage();
            }
        }

        auto stream = client.logs(args[0], options);
        while (auto output = stream->next()) {
            if (output->kind == Dockwire::OutputKind::Stderr) {
                std::cerr << output->message << std::flush;
            } else {
                std::cout << output->message << std::flush;
            }
        }
        return 0;
    }

    int build(Dockwire::DockerClient& client, const std::vector<std::string>& args) {
        if (args.empty()) return usage();
        Dockwire::BuildOptions options;
        options.contextDirectory = args[0];
        bool useSession = false;
        bool forwardSsh = false;
        for (std::size_t i = 1; i < args.size(); ++i) {
            if (args[i] == "-t" && i + 1 < args.size()) {
                options.tags.push_back(args[++i]);
            } else if (args[i] == "-f" && i + 1 < args.size()) {
                options.dockerfile = args[++i];
            } else if (args[i] == "--session") {
                useSession = true;
            } else if (args[i] == "--ssh") {
                forwardSsh = useSession = true;
            } else {
                return usage();
            }
        }

        if (options.contextDirectory == "-") useSession = true;

        auto onProgress = [](const nlohmann::json& message) {
            if (message.contains("stream") && message["stream"].is_string()) {
                std::cout << message["stream"].get<std::string>() << std::flush;
            } else if (message.contains("status") && message["status"].is_string()) {
                std::cout << message["status"].get<std::string>() << std::endl;
            }
        };

        if (!useSession) {
            client.build(options, onProgress);
            return 0;
        }

        Dockwire::BuildSession session;
        if (options.contextDirectory == "-") {
            // A tar context on stdin is served to the daemon through the session.
            auto uploads = std::make_shared<Dockwire::UploadProvider>();
            options.remote = uploads->add(std::string(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>()));
            session.addService(uploads);
            session.addService(std::make_shared<Dockwire::AuthProvider>(std::map<std::string, Dockwire::Credentials>{}));
            client.build(options, session, onProgress);
            return 0;
        }

        const std::filesystem::path dockerfile = std::filesystem::path(options.contextDirectory) / options.dockerfile;
        session.addService(std::make_shared<Dockwire::FileSyncProvider>(std::map<std::string, std::filesystem::path>{
            {"context", options.contextDirectory},
            {"dockerfile", dockerfile.parent_path()},
        }));
        session.addService(std::make_shared<Dockwire::AuthProvider>(std::map<std::string, Dockwire::Credentials>{}));
        if (forwardSsh) {
            session.addService(std::make_shared<Dockwire::SshForwardProvider>(
                Dockwire::SshForwardProvider::agentsFromEnvironment()));
        }
        options.dockerfile = dockerfile.filename().string();
        client.build(options, session, onProgress);
        return 0;
    }
}

int main(int argc, char** argv) {
    try {
        std::vector<std::string> args(argv + 1, argv + argc);
        if (args.empty()) return usage();
        const std::string command = args.front();
        args.erase(args.begin());

        auto client = Dockwire::DockerClient::fromEnvironment();
        if (command == "version") return version(client);
        if (command == "ping") {
            std::cout << client.ping() << std::endl;
            return 0;
        }
        if (command == "logs") return logs(client, args);
        if (command == "build") return build(client, args);
        return usage();
    } catch (const Dockwire::DaemonError& e) {
        std::cerr << "Error response from daemon: " << e.message() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Unhandled exception: " << e.what() << std::endl;
        return 1;
    }
}
