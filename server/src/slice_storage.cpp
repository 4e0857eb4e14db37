#include "sliceload/server/slice_storage.hpp"

#include <fstream>
#include <system_error>
#include <vector>

#include <spdlog/spdlog.h>

#include "sliceload/server/errors.hpp"

namespace sliceload::server
{

    namespace
    {

        constexpr std::size_t kCopyBufferSize = 256 * 1024;

        UploadError io_error(const std::string &what, const std::filesystem::path &path)
        {
            return UploadError(sliceload::ErrorCode::InternalError, what + ": " + path.string());
        }

        void write_bytes(std::ostream &out, std::span<const std::byte> data)
        {
            out.write(reinterpret_cast<const char *>(data.data()), static_cast<std::streamsize>(data.size()));
        }

        // rename() cannot cross filesystems; there the bytes are copied to the
        // staging path first so the destination only ever appears whole.
        void move_file(const std::filesystem::path &from, const std::filesystem::path &to,
                       const std::filesystem::path &staging)
        {
            std::error_code ec;
            std::filesystem::rename(from, to, ec);
            if (!ec)
            {
                return;
            }
            if (ec != std::errc::cross_device_link)
            {
                throw std::filesystem::filesystem_error("rename failed", from, to, ec);
            }
            std::filesystem::copy_file(from, staging, std::filesystem::copy_options::overwrite_existing);
            std::filesystem::rename(staging, to);
            std::filesystem::remove(from);
        }

    } // namespace

    DiscreteSliceStorage::DiscreteSliceStorage(const StorageLayout &layout) : layout_(layout) {}

    void DiscreteSliceStorage::write_slice(const FileMeta &meta, std::uint64_t index, const std::string &hash,
                                           std::span<const std::byte> data)
    {
        const auto path = layout_.slice_path(meta, index, hash);
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        if (!out.is_open())
        {
            throw io_error("Failed to create slice file", path);
        }
        write_bytes(out, data);
        out.flush();
        if (!out)
        {
            throw io_error("Failed to write slice file", path);
        }
    }

    void DiscreteSliceStorage::on_all_slices_uploaded(const FileMeta &meta)
    {
        const auto destination = layout_.destination_path(meta);
        std::filesystem::create_directories(destination.parent_path());
        const auto merging = layout_.staging_path(meta);

        std::vector<char> buffer(kCopyBufferSize);
        {
            std::ofstream out(merging, std::ios::binary | std::ios::trunc);
            if (!out.is_open())
            {
                throw io_error("Failed to create destination file", merging);
            }
            for (const auto index : slice_indices(meta))
            {
                const auto &slice = meta.slices.at(slice_key(index));
                const auto slice_file = layout_.slice_path(meta, index, slice.sha1);
                std::ifstream in(slice_file, std::ios::binary);
                if (!in.is_open())
                {
                    // The document claims the slice is uploaded but its bytes are
                    // gone; the session stays in the cache for manual repair.
                    out.close();
                    std::error_code ec;
                    std::filesystem::remove(merging, ec);
                    spdlog::error("Session {} cannot merge, slice {} missing at {}", meta.file_id, index,
                                  slice_file.string());
                    throw io_error("Slice file missing", slice_file);
                }
                while (in)
                {
                    in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
                    const auto count = in.gcount();
                    if (count > 0)
                    {
                        out.write(buffer.data(), count);
                    }
                }
                if (in.bad() || !out)
                {
                    out.close();
                    std::error_code ec;
                    std::filesystem::remove(merging, ec);
                    throw io_error("Failed to append slice", slice_file);
                }
            }
            out.flush();
            if (!out)
            {
                throw io_error("Failed to flush destination file", merging);
            }
        }
        std::filesystem::rename(merging, destination);
        spdlog::info("Session {} merged {} slices into {}", meta.file_id, meta.slices.size(), destination.string());
    }

    SparseSliceStorage::SparseSliceStorage(const StorageLayout &layout) : layout_(layout) {}

    void SparseSliceStorage::ensure_working_file(const FileMeta &meta) const
    {
        const auto path = layout_.working_file_path(meta);
        if (std::filesystem::exists(path))
        {
            return;
        }
        // A single byte at the final offset gives the file its full length;
        // the filesystem leaves everything before it as unallocated zeros.
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        if (!out.is_open())
        {
            throw io_error("Failed to create working file", path);
        }
        out.seekp(static_cast<std::streamoff>(meta.file_size - 1));
        out.put('\0');
        out.flush();
        if (!out)
        {
            throw io_error("Failed to size working file", path);
        }
    }

    void SparseSliceStorage::write_slice(const FileMeta &meta, std::uint64_t index, const std::string & /*hash*/,
                                         std::span<const std::byte> data)
    {
        ensure_working_file(meta);
        const auto path = layout_.working_file_path(meta);
        std::fstream file(path, std::ios::binary | std::ios::in | std::ios::out);
        if (!file.is_open())
        {
            throw io_error("Failed to open working file", path);
        }
        file.seekp(static_cast<std::streamoff>(slice_offset(meta, index)));
        write_bytes(file, data);
        file.flush();
        if (!file)
        {
            throw io_error("Failed to write slice into working file", path);
        }
    }

    void SparseSliceStorage::on_all_slices_uploaded(const FileMeta &meta)
    {
        const auto working = layout_.working_file_path(meta);
        const auto destination = layout_.destination_path(meta);
        if (!std::filesystem::exists(working))
        {
            throw io_error("Working file missing", working);
        }
        std::filesystem::create_directories(destination.parent_path());
        move_file(working, destination, layout_.staging_path(meta));
        spdlog::info("Session {} moved working file to {}", meta.file_id, destination.string());
    }

} // namespace sliceload::server
