#include "contextArchive.hpp"

#include <archive.h>
#include <archive_entry.h>
#include <fstream>
#include <iterator>
#include <stdexcept>

#include "fileSync.hpp"
#include "log.hpp"

namespace Dockwire {
    namespace {
        struct ArchiveWriteFree {
            void operator()(struct archive* a) const { archive_write_free(a); }
        };

        struct ArchiveReadFree {
            void operator()(struct archive* a) const { archive_read_free(a); }
        };

        struct EntryFree {
            void operator()(struct archive_entry* e) const { archive_entry_free(e); }
        };

        std::runtime_error archiveError(struct archive* a, const std::string& what) {
            const char* message = archive_error_string(a);
            return std::runtime_error(what + ": " + (message == nullptr ? "unknown archive error" : message));
        }

        void writeEntry(struct archive* a, const std::filesystem::path& root, const FileStat& stat) {
            std::unique_ptr<struct archive_entry, EntryFree> entry(archive_entry_new());
            archive_entry_set_pathname(entry.get(), stat.path.c_str());
            archive_entry_set_perm(entry.get(), stat.mode & FileMode::Perm);
            archive_entry_set_uid(entry.get(), stat.uid);
            archive_entry_set_gid(entry.get(), stat.gid);
            archive_entry_set_mtime(entry.get(), stat.modTime / 1000000000, stat.modTime % 1000000000);

            if (stat.isDir()) {
                archive_entry_set_filetype(entry.get(), AE_IFDIR);
            } else if (stat.mode & FileMode::Symlink) {
                archive_entry_set_filetype(entry.get(), AE_IFLNK);
                archive_entry_set_symlink(entry.get(), stat.linkname.c_str());
            } else if (stat.isRegular()) {
                archive_entry_set_filetype(entry.get(), AE_IFREG);
                archive_entry_set_size(entry.get(), stat.size);
            } else {
                Log::debug("skipping special file " + stat.path);
                return;
            }

            if (archive_write_header(a, entry.get()) < ARCHIVE_WARN) throw archiveError(a, "tar header for " + stat.path);
            if (!stat.isRegular()) return;

            std::ifstream file(root / stat.path, std::ios::binary);
            if (!file) {
                throw std::runtime_error("Failed to open file: " + (root / stat.path).string());
            }
            char buffer[8192];
            while (file) {
                file.read(buffer, sizeof(buffer));
                if (file.gcount() > 0 && archive_write_data(a, buffer, static_cast<std::size_t>(file.gcount())) < 0) {
                    throw archiveError(a, "tar data for " + stat.path);
                }
            }
        }
    }

    ContextArchive::ContextArchive(std::unique_ptr<std::FILE, FileCloser> file) : file_(std::move(file)) {}

    ContextArchive ContextArchive::fromDirectory(const std::filesystem::path& directory, const std::string& dockerfile) {
        if (!std::filesystem::is_directory(directory)) {
            throw std::runtime_error("Context path is not a directory: " + directory.string());
        }
        std::string ignore;
        std::ifstream ignoreFile(directory / ".dockerignore", std::ios::binary);
        if (ignoreFile) ignore.assign(std::istreambuf_iterator<char>(ignoreFile), std::istreambuf_iterator<char>());
        return write(directory, PathFilter::fromDockerignore(ignore), {dockerfile, ".dockerignore"});
    }

    ContextArchive ContextArchive::write(const std::filesystem::path& directory, const PathFilter& filter,
                                         const std::vector<std::string>& keep) {
        return fromEntries(directory, walkDirectory(directory, filter, keep));
    }

    ContextArchive ContextArchive::fromEntries(const std::filesystem::path& directory,
                                               const std::vector<FileStat>& entries) {
        std::unique_ptr<std::FILE, FileCloser> file(std::tmpfile());
        if (!file) throw std::runtime_error("Failed to create a temporary file for the build context");
        ContextArchive archive(std::move(file));

        // Freed before the archive's FILE is closed, on every path.
        std::unique_ptr<struct archive, ArchiveWriteFree> a(archive_write_new());
        archive_write_set_format_pax_restricted(a.get());
        archive_write_add_filter_none(a.get());
        if (archive_write_open_FILE(a.get(), archive.file_.get()) != ARCHIVE_OK) throw archiveError(a.get(), "open archive");

        for (const auto& stat : entries) {
            writeEntry(a.get(), directory, stat);
            ++archive.entryCount_;
        }
        if (archive_write_close(a.get()) != ARCHIVE_OK) throw archiveError(a.get(), "close archive");
        a.reset();

        std::fflush(archive.file_.get());
        std::fseek(archive.file_.get(), 0, SEEK_END);
        archive.size_ = static_cast<std::uint64_t>(std::ftell(archive.file_.get()));
        archive.rewind();
        Log::debug("build context " + directory.string() + ": " + std::to_string(archive.entryCount_) + " entries, " +
                   std::to_string(archive.size_) + " bytes");
        return archive;
    }

    void ContextArchive::rewind() {
        std::rewind(file_.get());
    }

    std::size_t ContextArchive::read(char* data, std::size_t size) {
        std::size_t n = std::fread(data, 1, size, file_.get());
        if (n == 0 && std::ferror(file_.get())) throw std::runtime_error("Failed to read the build context archive");
        return n;
    }

    RequestBody ContextArchive::body() {
        rewind();
        return RequestBody::producer([this](char* data, std::size_t size) { return read(data, size); },
                                     "application/x-tar");
    }

    std::vector<std::string> ContextArchive::list() {
        rewind();
        std::unique_ptr<struct archive, ArchiveReadFree> a(archive_read_new());
        archive_read_support_filter_all(a.get());
        archive_read_support_format_all(a.get());
        if (archive_read_open_FILE(a.get(), file_.get()) != ARCHIVE_OK) throw archiveError(a.get(), "Failed to open archive");

        std::vector<std::string> paths;
        struct archive_entry* entry;
        while (archive_read_next_header(a.get(), &entry) == ARCHIVE_OK) {
            const char* path = archive_entry_pathname(entry);
            if (path != nullptr) paths.emplace_back(path);
            archive_read_data_skip(a.get());
        }
        a.reset();
        rewind();
        return paths;
    }
}
