#ifndef DOCKWIRE_CONTEXT_ARCHIVE_HPP
#define DOCKWIRE_CONTEXT_ARCHIVE_HPP

#include <cstdio>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "fileSync.hpp"
#include "http.hpp"
#include "pathFilter.hpp"

namespace Dockwire {
    // Build context packed as a pax tar in an anonymous temporary file.
    class ContextArchive {
        struct FileCloser {
            void operator()(std::FILE* file) const { std::fclose(file); }
        };

        std::unique_ptr<std::FILE, FileCloser> file_;
        std::uint64_t size_ = 0;
        std::size_t entryCount_ = 0;

        explicit ContextArchive(std::unique_ptr<std::FILE, FileCloser> file);

    public:
        // Honors <directory>/.dockerignore; the Dockerfile and .dockerignore are always kept.
        static ContextArchive fromDirectory(const std::filesystem::path& directory,
                                            const std::string& dockerfile = "Dockerfile");
        static ContextArchive write(const std::filesystem::path& directory, const PathFilter& filter,
                                    const std::vector<std::string>& keep = {});
        // Archives exactly these entries, in order. Throws std::runtime_error when one cannot be read.
        static ContextArchive fromEntries(const std::filesystem::path& directory, const std::vector<FileStat>& entries);

        std::uint64_t size() const { return size_; }
        std::size_t entryCount() const { return entryCount_; }

        void rewind();
        std::size_t read(char* data, std::size_t size);

        // Streams the archive from the start. The archive must outlive the request.
        RequestBody body();

        // Entry paths in archive order.
        std::vector<std::string> list();
    };
}

#endif // DOCKWIRE_CONTEXT_ARCHIVE_HPP
