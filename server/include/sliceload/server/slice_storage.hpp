#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>

#include "sliceload/file_meta.hpp"
#include "sliceload/server/layout.hpp"

namespace sliceload::server
{

    /**
     * Strategy for persisting slice bytes and producing the final artifact.
     *
     * Both calls happen while the caller holds the session's lock, and
     * on_all_slices_uploaded() runs at most once per session. A strategy
     * leaves the session document and cache directory to the caller.
     */
    class SliceStorage
    {
    public:
        virtual ~SliceStorage() = default;

        virtual void write_slice(const FileMeta &meta, std::uint64_t index, const std::string &hash,
                                 std::span<const std::byte> data) = 0;

        // Places the complete file at layout.destination_path(meta).
        virtual void on_all_slices_uploaded(const FileMeta &meta) = 0;
    };

    // One file per slice, concatenated in index order on completion.
    class DiscreteSliceStorage final : public SliceStorage
    {
    public:
        explicit DiscreteSliceStorage(const StorageLayout &layout);

        void write_slice(const FileMeta &meta, std::uint64_t index, const std::string &hash,
                         std::span<const std::byte> data) override;

        void on_all_slices_uploaded(const FileMeta &meta) override;

    private:
        const StorageLayout &layout_;
    };

    // One pre-sized sparse file written at slice offsets, renamed on completion.
    class SparseSliceStorage final : public SliceStorage
    {
    public:
        explicit SparseSliceStorage(const StorageLayout &layout);

        void write_slice(const FileMeta &meta, std::uint64_t index, const std::string &hash,
                         std::span<const std::byte> data) override;

        void on_all_slices_uploaded(const FileMeta &meta) override;

    private:
        void ensure_working_file(const FileMeta &meta) const;

        const StorageLayout &layout_;
    };

} // namespace sliceload::server
