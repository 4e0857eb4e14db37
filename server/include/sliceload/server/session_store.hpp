#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "sliceload/file_meta.hpp"
#include "sliceload/server/layout.hpp"

namespace sliceload::server
{

    // Whole-document persistence of session metadata. Writes go through a
    // sibling temporary file and a rename, so a reader sees either the old or
    // the new document and never a partial one.
    class SessionStore
    {
    public:
        explicit SessionStore(const StorageLayout &layout);

        // std::nullopt when the session has no working document (unknown id or
        // already merged). Throws UploadError when the document is unreadable.
        std::optional<FileMeta> load_working(const std::string &file_id) const;
        void save_working(const FileMeta &meta) const;

        std::optional<FileMeta> load_archived(const std::string &file_id) const;
        void archive(const FileMeta &meta) const;

    private:
        static std::optional<FileMeta> read_document(const std::filesystem::path &path);
        static void write_document(const std::filesystem::path &path, const FileMeta &meta);

        const StorageLayout &layout_;
    };

} // namespace sliceload::server
