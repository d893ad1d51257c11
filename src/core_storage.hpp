#ifndef DRIVEPROF_CORE_STORAGE_HEADER
#define DRIVEPROF_CORE_STORAGE_HEADER

#include "error_code.hpp"
#include "types.hpp"
#include "path.hpp"
#include "view.hpp"

#include <cstdint>
#include <vector>

namespace driveprof {

/**
 * The blocks of a single core, appended to one data file in the order they arrive,
 * which need not be block order. Where each block lives is only kept in memory, so
 * the file is truncated when opened.
 */
class core_storage
{
    struct block_location
    {
        int64_t offset = -1;
        int64_t length = 0;
    };

    path directory_;
    int file_handle_ = -1;
    int64_t file_size_ = 0;
    std::vector<block_location> index_;

public:

    /** The data file is `<directory>/data`. Nothing is touched until `open`. */
    explicit core_storage(path directory);
    ~core_storage();

    core_storage(const core_storage&) = delete;
    core_storage& operator=(const core_storage&) = delete;

    /** Creates the directory and the data file. */
    void open(error_code& error);
    void close() noexcept;

    bool is_open() const noexcept { return file_handle_ != -1; }

    const path& directory() const noexcept { return directory_; }

    bool has(const block_index_t index) const noexcept;

    /** Storing a block that is already stored is a no-op. */
    void write(const block_index_t index, const_view<uint8_t> block, error_code& error);

    /** Fails with `replication_errc::block_not_found` if the block isn't stored. */
    std::vector<uint8_t> read(const block_index_t index, error_code& error) const;
};

} // namespace driveprof

#endif // DRIVEPROF_CORE_STORAGE_HEADER
