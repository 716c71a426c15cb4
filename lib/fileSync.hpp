#ifndef DOCKWIRE_FILE_SYNC_HPP
#define DOCKWIRE_FILE_SYNC_HPP

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "pathFilter.hpp"
#include "sessionService.hpp"

namespace Dockwire {
    // Go os.FileMode bits as used on the wire.
    namespace FileMode {
        constexpr std::uint32_t Dir = 1u << 31;
        constexpr std::uint32_t Append = 1u << 30;
        constexpr std::uint32_t Exclusive = 1u << 29;
        constexpr std::uint32_t Temporary = 1u << 28;
        constexpr std::uint32_t Symlink = 1u << 27;
        constexpr std::uint32_t Device = 1u << 26;
        constexpr std::uint32_t NamedPipe = 1u << 25;
        constexpr std::uint32_t Socket = 1u << 24;
        constexpr std::uint32_t Setuid = 1u << 23;
        constexpr std::uint32_t Setgid = 1u << 22;
        constexpr std::uint32_t CharDevice = 1u << 21;
        constexpr std::uint32_t Sticky = 1u << 20;
        constexpr std::uint32_t Irregular = 1u << 19;
        constexpr std::uint32_t Type = Dir | Symlink | NamedPipe | Socket | Device | CharDevice | Irregular;
        constexpr std::uint32_t Perm = 0777;
    }

    struct FileStat {
        std::string path;
        std::uint32_t mode = 0;
        std::uint32_t uid = 0;
        std::uint32_t gid = 0;
        std::int64_t size = 0;
        std::int64_t modTime = 0;   // nanoseconds since the epoch
        std::string linkname;

        bool isDir() const { return (mode & FileMode::Dir) != 0; }
        bool isRegular() const { return (mode & FileMode::Type) == 0; }

        bool operator==(const FileStat& other) const = default;
    };

    enum class PacketType : std::uint8_t { Stat = 0, Req = 1, Data = 2, Fin = 3, Err = 4 };

    struct Packet {
        PacketType type = PacketType::Stat;
        std::uint32_t id = 0;
        std::optional<FileStat> stat;
        std::string data;
    };

    constexpr std::size_t FILE_CHUNK = 32 * 1024;

    // [u8 type][u32 BE id][u32 BE stat length][stat JSON][data]
    std::string encodePacket(const Packet& packet);
    // Throws ProtocolError(InvalidPacket).
    Packet decodePacket(const std::string& bytes);

    // lstat of root/relative, with the path recorded as `relative`.
    FileStat statPath(const std::filesystem::path& root, const std::string& relative);

    // Entries below root accepted by the filter, ordered by path components.
    std::vector<FileStat> walkDirectory(const std::filesystem::path& root, const PathFilter& filter,
                                        const std::vector<std::string>& followPaths = {});

    bool pathComponentsLess(const std::string& a, const std::string& b);

    // Serves /moby.filesync.v1.FileSync/DiffCopy over named local directories
    // ("context", "dockerfile", ...).
    class FileSyncProvider : public SessionService {
        std::map<std::string, std::filesystem::path> directories_;

    public:
        explicit FileSyncProvider(std::map<std::string, std::filesystem::path> directories)
            : directories_(std::move(directories)) {}

        std::string name() const override { return "moby.filesync.v1.FileSync"; }
        std::vector<std::string> methods() const override;
        std::unique_ptr<Invocation> invoke(const std::string& method) override;

        std::optional<std::filesystem::path> directory(const std::string& name) const;
    };
}

#endif // DOCKWIRE_FILE_SYNC_HPP
