#ifndef DRIVEPROF_DRIVE_HEADER
#define DRIVEPROF_DRIVE_HEADER

#include "replicated_tree.hpp"
#include "types.hpp"
#include "view.hpp"
#include "log.hpp"

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <asio/io_context.hpp>

namespace driveprof {

class core;

/** A file of a drive, as recorded in the metadata core. */
struct drive_entry
{
    std::string path;
    // The file's contents are blocks [blob_offset, blob_offset + num_blob_blocks) of
    // the blob core.
    int64_t blob_offset = 0;
    int64_t num_blob_blocks = 0;
    int64_t length = 0;
};

/**
 * A drive made of two cores. The first block of the metadata core is the header,
 * which names the blob core:
 *
 *  [4 bytes "DPRF"][u8 format version][32 bytes blob core key]
 *
 * every further block is an entry:
 *
 *  [u16 path length][path][u64 blob offset][u64 blob block count][u64 byte length]
 *
 * The version of a drive is the length of its metadata core.
 */
class drive final : public replicated_tree, public std::enable_shared_from_this<drive>
{
public:

    /** Opens (creating if needed) the core with the given key. May throw. */
    using core_opener =
        std::function<std::shared_ptr<core>(const key_type&, const bool is_writable)>;

private:

    asio::io_context& ios_;
    std::shared_ptr<core> metadata_;
    // Null until the header has been read.
    std::shared_ptr<core> blobs_;
    key_type discovery_key_;
    core_opener open_core_;
    int blob_block_size_;

public:

    drive(asio::io_context& ios, std::shared_ptr<core> metadata, core_opener open_core,
        const int blob_block_size);

    /** Writes the header of a new drive into its (empty, writable) metadata core. */
    void initialize(std::shared_ptr<core> blobs, error_code& error);

    /** Adds a file to a writable drive. */
    void put(const std::string& path, const_view<uint8_t> content, error_code& error);

    /** The entries held locally. */
    std::vector<drive_entry> entries(error_code& error) const;

    /** Reads the contents of a file held locally. */
    std::vector<uint8_t> read(const drive_entry& entry, error_code& error) const;

    void ready(completion_handler handler) override;

    const key_type& key() const override;
    const key_type& discovery_key() const override { return discovery_key_; }
    int64_t version() const override;

    replicated_stream& metadata() override;
    const replicated_stream& metadata() const override;
    replicated_stream* blobs() override;
    const replicated_stream* blobs() const override;

    void download(const std::string& path, completion_handler handler) override;

private:

    void on_header_downloaded(const std::string& path, const error_code& error,
        completion_handler handler);
    void on_metadata_downloaded(const std::string& path, const int64_t version,
        const error_code& error, completion_handler handler);

    /** Opens the blob core named by the header, if it's held locally. */
    error_code load_header();

    std::vector<drive_entry> read_entries(const int64_t begin, const int64_t end,
        error_code& error) const;

    template<typename... Args>
    void log(const log::priority priority, const char* format, Args&&... args) const;
};

/** Whether `entry_path` is `directory` or lies beneath it. */
bool is_under(const std::string& entry_path, const std::string& directory);

} // namespace driveprof

#endif // DRIVEPROF_DRIVE_HEADER
