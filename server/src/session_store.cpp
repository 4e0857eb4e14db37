#include "sliceload/server/session_store.hpp"

#include <fstream>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "sliceload/server/errors.hpp"

namespace sliceload::server
{

    SessionStore::SessionStore(const StorageLayout &layout) : layout_(layout) {}

    std::optional<FileMeta> SessionStore::load_working(const std::string &file_id) const
    {
        return read_document(layout_.working_meta_path(file_id));
    }

    void SessionStore::save_working(const FileMeta &meta) const
    {
        write_document(layout_.working_meta_path(meta.file_id), meta);
    }

    std::optional<FileMeta> SessionStore::load_archived(const std::string &file_id) const
    {
        return read_document(layout_.archived_meta_path(file_id));
    }

    void SessionStore::archive(const FileMeta &meta) const
    {
        write_document(layout_.archived_meta_path(meta.file_id), meta);
    }

    std::optional<FileMeta> SessionStore::read_document(const std::filesystem::path &path)
    {
        std::ifstream in(path, std::ios::binary);
        if (!in.is_open())
        {
            std::error_code ec;
            if (!std::filesystem::exists(path, ec))
            {
                return std::nullopt;
            }
            throw UploadError(sliceload::ErrorCode::InternalError, "Failed to open session document " + path.string());
        }
        try
        {
            return nlohmann::json::parse(in).get<FileMeta>();
        }
        catch (const std::exception &ex)
        {
            spdlog::error("Corrupt session document {}: {}", path.string(), ex.what());
            throw UploadError(sliceload::ErrorCode::InternalError, "Corrupt session document " + path.filename().string());
        }
    }

    void SessionStore::write_document(const std::filesystem::path &path, const FileMeta &meta)
    {
        auto temp_path = path;
        temp_path += ".tmp";
        {
            std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
            if (!out.is_open())
            {
                throw UploadError(sliceload::ErrorCode::InternalError, "Failed to write session document " + path.string());
            }
            out << nlohmann::json(meta).dump();
            out.flush();
            if (!out)
            {
                throw UploadError(sliceload::ErrorCode::InternalError, "Short write on session document " + path.string());
            }
        }
        std::filesystem::rename(temp_path, path);
    }

} // namespace sliceload::server
