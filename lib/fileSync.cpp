#include "fileSync.hpp"

#include <algorithm>
#include <cerrno>
#include <boost/asio/post.hpp>
#include <fstream>
#include <memory>
#include <nlohmann/json.hpp>
#include <set>
#include <sys/stat.h>

#include "errors.hpp"
#include "log.hpp"

namespace Dockwire {
    namespace {
        const std::string DIFF_COPY = "/moby.filesync.v1.FileSync/DiffCopy";

        void putU32(std::string& out, std::uint32_t value) {
            out += static_cast<char>((value >> 24) & 0xff);
            out += static_cast<char>((value >> 16) & 0xff);
            out += static_cast<char>((value >> 8) & 0xff);
            out += static_cast<char>(value & 0xff);
        }

        std::uint32_t getU32(const char* data) {
            return (static_cast<std::uint32_t>(static_cast<std::uint8_t>(data[0])) << 24) |
                   (static_cast<std::uint32_t>(static_cast<std::uint8_t>(data[1])) << 16) |
                   (static_cast<std::uint32_t>(static_cast<std::uint8_t>(data[2])) << 8) |
                   static_cast<std::uint32_t>(static_cast<std::uint8_t>(data[3]));
        }

        nlohmann::json toJson(const FileStat& stat) {
            return {
                {"path", stat.path},
                {"mode", stat.mode},
                {"uid", stat.uid},
                {"gid", stat.gid},
                {"size", stat.size},
                {"modTime", stat.modTime},
                {"linkname", stat.linkname}
            };
        }

        FileStat fromJson(const nlohmann::json& json) {
            FileStat stat;
            stat.path = json.value("path", std::string());
            stat.mode = json.value("mode", 0u);
            stat.uid = json.value("uid", 0u);
            stat.gid = json.value("gid", 0u);
            stat.size = json.value("size", std::int64_t{0});
            stat.modTime = json.value("modTime", std::int64_t{0});
            stat.linkname = json.value("linkname", std::string());
            return stat;
        }

        std::uint32_t goMode(mode_t mode) {
            std::uint32_t result = static_cast<std::uint32_t>(mode) & FileMode::Perm;
            if (S_ISDIR(mode)) result |= FileMode::Dir;
            else if (S_ISLNK(mode)) result |= FileMode::Symlink;
            else if (S_ISFIFO(mode)) result |= FileMode::NamedPipe;
            else if (S_ISSOCK(mode)) result |= FileMode::Socket;
            else if (S_ISBLK(mode)) result |= FileMode::Device;
            else if (S_ISCHR(mode)) result |= FileMode::Device | FileMode::CharDevice;
            if (mode & S_ISUID) result |= FileMode::Setuid;
            if (mode & S_ISGID) result |= FileMode::Setgid;
            if (mode & S_ISVTX) result |= FileMode::Sticky;
            return result;
        }

        // One DiffCopy call: lists the directory on the first REQ, then streams files by id.
        class DiffCopy : public Invocation {
            const FileSyncProvider& provider_;
            InvocationChannel* channel_ = nullptr;
            std::filesystem::path root_;
            PathFilter filter_;
            std::vector<std::string> followPaths_;
            std::vector<FileStat> entries_;
            std::map<std::uint32_t, std::shared_ptr<std::ifstream>> transfers_;
            bool listed_ = false;
            bool ended_ = false;

            void sendPacket(const Packet& packet) {
                channel_->send(encodePacket(packet));
            }

            void sendError(std::uint32_t id, const std::string& message) {
                Log::debug("filesync: id " + std::to_string(id) + ": " + message);
                sendPacket(Packet{PacketType::Err, id, std::nullopt, message});
            }

            bool known(std::uint32_t id) const {
                return listed_ && id < entries_.size();
            }

            void end() {
                ended_ = true;
                transfers_.clear();
            }

            void list(const std::string& request) {
                const std::string scope = cleanPath(request);
                const PathFilter scopeFilter = scope.empty() ? PathFilter() : PathFilter({scope}, {});
                for (auto& stat : walkDirectory(root_, filter_, followPaths_)) {
                    if (scopeFilter.included(stat.path, stat.isDir())) entries_.push_back(std::move(stat));
                }
                listed_ = true;
                for (std::size_t i = 0; i < entries_.size(); ++i) {
                    sendPacket(Packet{PacketType::Stat, static_cast<std::uint32_t>(i), entries_[i], {}});
                }
                sendPacket(Packet{PacketType::Stat, 0, std::nullopt, {}});
                Log::debug("filesync: listed " + std::to_string(entries_.size()) + " entries of " + root_.string());
            }

            void transfer(std::uint32_t id) {
                if (!known(id)) {
                    sendError(id, "unknown id");
                    return;
                }
                const FileStat& entry = entries_[id];
                if (!entry.isRegular()) {
                    sendError(id, entry.path + " is not a regular file");
                    return;
                }
                auto file = std::make_shared<std::ifstream>(root_ / entry.path, std::ios::binary);
                if (!*file) {
                    sendError(id, "cannot open " + entry.path);
                    return;
                }
                transfers_[id] = file;
                boost::asio::post(channel_->context(), [this, id]() { step(id); });
            }

            // One chunk per turn; an ERR from the receiver drops the transfer between turns.
            void step(std::uint32_t id) {
                if (ended_) return;
                auto it = transfers_.find(id);
                if (it == transfers_.end()) return;

                std::string chunk(FILE_CHUNK, '\0');
                it->second->read(chunk.data(), static_cast<std::streamsize>(chunk.size()));
                chunk.resize(static_cast<std::size_t>(it->second->gcount()));
                if (it->second->bad()) {
                    transfers_.erase(it);
                    sendError(id, "read failed for " + entries_[id].path);
                    return;
                }
                bool last = it->second->eof() || chunk.empty();
                if (!chunk.empty()) sendPacket(Packet{PacketType::Data, id, std::nullopt, std::move(chunk)});
                if (last) {
                    transfers_.erase(id);
                    sendPacket(Packet{PacketType::Fin, id, std::nullopt, {}});
                    return;
                }
                boost::asio::post(channel_->context(), [this, id]() { step(id); });
            }

        public:
            explicit DiffCopy(const FileSyncProvider& provider) : provider_(provider) {}

            void start(InvocationChannel& channel) override {
                channel_ = &channel;
                const std::string dirName = channel.metadataValue("dir-name");
                if (dirName.empty()) {
                    end();
                    channel.fail(StatusCode::InvalidArgument, "dir-name metadata is missing");
                    return;
                }
                auto directory = provider_.directory(dirName);
                if (!directory) {
                    end();
                    channel.fail(StatusCode::NotFound, "no directory named " + dirName);
                    return;
                }
                root_ = *directory;

                auto values = [&channel](const std::string& key) {
                    auto it = channel.metadata().find(key);
                    return it == channel.metadata().end() ? std::vector<std::string>() : it->second;
                };
                filter_ = PathFilter(values("include-patterns"), values("exclude-patterns"));
                followPaths_ = values("followpaths");
            }

            void onData(const std::string& data) override {
                if (ended_) return;
                Packet packet;
                try {
                    packet = decodePacket(data);
                } catch (const ProtocolError& e) {
                    end();
                    channel_->fail(StatusCode::InvalidArgument, e.what());
                    return;
                }

                switch (packet.type) {
                    case PacketType::Req:
                        if (!listed_) {
                            list(packet.data);
                        } else {
                            transfer(packet.id);
                        }
                        break;
                    case PacketType::Stat:
                        sendError(packet.id, "unexpected STAT from the receiver");
                        break;
                    case PacketType::Data:
                        sendError(packet.id, known(packet.id) ? "unexpected DATA from the receiver" : "unknown id");
                        break;
                    case PacketType::Fin:
                        if (!known(packet.id)) {
                            sendError(packet.id, "unknown id");
                            break;
                        }
                        // The receiver has everything it asked for.
                        end();
                        sendPacket(Packet{PacketType::Fin, packet.id, std::nullopt, {}});
                        channel_->finish();
                        break;
                    case PacketType::Err:
                        Log::debug("filesync: receiver aborted id " + std::to_string(packet.id) + ": " + packet.data);
                        transfers_.erase(packet.id);
                        break;
                }
            }

            void onClose() override {
                if (ended_) return;
                end();
                channel_->finish();
            }

            void cancel() override {
                end();
            }
        };
    }

    std::string encodePacket(const Packet& packet) {
        std::string stat = packet.stat ? toJson(*packet.stat).dump() : std::string();
        std::string out;
        out.reserve(9 + stat.size() + packet.data.size());
        out += static_cast<char>(packet.type);
        putU32(out, packet.id);
        putU32(out, static_cast<std::uint32_t>(stat.size()));
        out += stat;
        out += packet.data;
        return out;
    }

    Packet decodePacket(const std::string& bytes) {
        if (bytes.size() < 9) {
            throw ProtocolError(ProtocolError::Code::InvalidPacket, "packet shorter than its 9 byte header");
        }
        auto type = static_cast<std::uint8_t>(bytes[0]);
        if (type > static_cast<std::uint8_t>(PacketType::Err)) {
            throw ProtocolError(ProtocolError::Code::InvalidPacket, "unknown packet type " + std::to_string(type));
        }
        Packet packet;
        packet.type = static_cast<PacketType>(type);
        packet.id = getU32(bytes.data() + 1);
        std::uint32_t statLength = getU32(bytes.data() + 5);
        if (statLength > bytes.size() - 9) {
            throw ProtocolError(ProtocolError::Code::InvalidPacket, "stat length exceeds packet size");
        }
        if (statLength > 0) {
            auto json = nlohmann::json::parse(bytes.substr(9, statLength), nullptr, false);
            if (json.is_discarded() || !json.is_object()) {
                throw ProtocolError(ProtocolError::Code::InvalidPacket, "malformed stat");
            }
            try {
                packet.stat = fromJson(json);
            } catch (const nlohmann::json::exception& e) {
                throw ProtocolError(ProtocolError::Code::InvalidPacket, std::string("malformed stat: ") + e.what());
            }
        }
        packet.data = bytes.substr(9 + statLength);
        return packet;
    }

    FileStat statPath(const std::filesystem::path& root, const std::string& relative) {
        const std::filesystem::path full = root / relative;
        struct stat info {};
        if (::lstat(full.c_str(), &info) != 0) {
            throw std::filesystem::filesystem_error("lstat", full, std::error_code(errno, std::generic_category()));
        }
        FileStat stat;
        stat.path = relative;
        stat.mode = goMode(info.st_mode);
        stat.uid = static_cast<std::uint32_t>(info.st_uid);
        stat.gid = static_cast<std::uint32_t>(info.st_gid);
        stat.size = S_ISREG(info.st_mode) ? static_cast<std::int64_t>(info.st_size) : 0;
        stat.modTime = static_cast<std::int64_t>(info.st_mtim.tv_sec) * 1000000000 + info.st_mtim.tv_nsec;
        if (S_ISLNK(info.st_mode)) {
            std::error_code ec;
            stat.linkname = std::filesystem::read_symlink(full, ec).string();
        }
        return stat;
    }

    bool pathComponentsLess(const std::string& a, const std::string& b) {
        std::size_t i = 0;
        std::size_t j = 0;
        for (;;) {
            if (i >= a.size() || j >= b.size()) return i >= a.size() && j < b.size();
            auto endA = std::min(a.find('/', i), a.size());
            auto endB = std::min(b.find('/', j), b.size());
            int order = a.compare(i, endA - i, b, j, endB - j);
            if (order != 0) return order < 0;
            i = endA + 1;
            j = endB + 1;
        }
    }

    std::vector<FileStat> walkDirectory(const std::filesystem::path& root, const PathFilter& filter,
                                        const std::vector<std::string>& followPaths) {
        auto followed = [&followPaths](const std::string& path, bool directory) {
            for (const auto& follow : followPaths) {
                if (matchPath(follow, path) || (directory && matchesBelow(follow, path))) return true;
            }
            return false;
        };

        std::vector<FileStat> entries;
        std::set<std::string> seen;
        std::error_code ec;
        std::filesystem::recursive_directory_iterator it(root, ec);
        if (ec) throw std::filesystem::filesystem_error("walk", root, ec);
        const std::filesystem::recursive_directory_iterator end{};
        for (; it != end; it.increment(ec)) {
            if (ec) throw std::filesystem::filesystem_error("walk", root, ec);
            const std::string relative = it->path().lexically_relative(root).generic_string();
            std::error_code statusEc;
            const bool directory = it->symlink_status(statusEc).type() == std::filesystem::file_type::directory;
            if (directory && filter.skipDirectory(relative) && !followed(relative, true)) {
                it.disable_recursion_pending();
                continue;
            }
            if (!filter.included(relative, directory) && !followed(relative, directory)) continue;
            entries.push_back(statPath(root, relative));
            seen.insert(relative);
        }

        // Entries re-included below an excluded directory still need their parents.
        std::vector<FileStat> parents;
        for (const auto& entry : entries) {
            for (auto slash = entry.path.find('/'); slash != std::string::npos; slash = entry.path.find('/', slash + 1)) {
                std::string parent = entry.path.substr(0, slash);
                if (seen.insert(parent).second) parents.push_back(statPath(root, parent));
            }
        }
        entries.insert(entries.end(), parents.begin(), parents.end());

        std::sort(entries.begin(), entries.end(), [](const FileStat& a, const FileStat& b) {
            return pathComponentsLess(a.path, b.path);
        });
        return entries;
    }

    std::vector<std::string> FileSyncProvider::methods() const {
        return {DIFF_COPY};
    }

    std::unique_ptr<Invocation> FileSyncProvider::invoke(const std::string&) {
        return std::make_unique<DiffCopy>(*this);
    }

    std::optional<std::filesystem::path> FileSyncProvider::directory(const std::string& name) const {
        auto it = directories_.find(name);
        if (it == directories_.end()) return std::nullopt;
        return it->second;
    }
}
