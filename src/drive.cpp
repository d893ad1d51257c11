#include "drive.hpp"
#include "replication_error.hpp"
#include "payload_reader.hpp"
#include "sha256_hasher.hpp"
#include "string_utils.hpp"
#include "payload.hpp"
#include "core.hpp"

#include <algorithm>
#include <cstring>

#include <asio/post.hpp>

namespace driveprof {

#define SHARED_THIS this, self(shared_from_this())

static constexpr char header_magic[4] = {'D', 'P', 'R', 'F'};
static constexpr uint8_t format_version = 1;
static constexpr int header_size = 4 + 1 + 32;

bool is_under(const std::string& entry_path, const std::string& directory)
{
    if(directory.empty() || directory == "/") { return true; }
    std::string prefix = directory;
    if(prefix.back() == '/') { prefix.pop_back(); }
    return entry_path == prefix || util::starts_with(entry_path, prefix + '/');
}

drive::drive(asio::io_context& ios, std::shared_ptr<core> metadata,
    core_opener open_core, const int blob_block_size)
    : ios_(ios)
    , metadata_(std::move(metadata))
    , discovery_key_(make_discovery_key(metadata_->key()))
    , open_core_(std::move(open_core))
    , blob_block_size_(blob_block_size)
{}

void drive::initialize(std::shared_ptr<core> blobs, error_code& error)
{
    payload header(header_size);
    header.range(std::begin(header_magic), std::end(header_magic))
        .u8(format_version)
        .buffer(blobs->key());
    metadata_->append(header.data, error);
    if(error) { return; }
    blobs_ = std::move(blobs);
}

void drive::put(const std::string& path, const_view<uint8_t> content, error_code& error)
{
    error.clear();
    if(!blobs_)
    {
        error = make_error_code(replication_errc::invalid_drive_header);
        return;
    }

    drive_entry entry;
    entry.path = path;
    entry.blob_offset = blobs_->length();
    entry.length = content.size();
    while(!content.empty())
    {
        const auto n = std::min<size_t>(blob_block_size_, content.size());
        blobs_->append(content.subview(0, n), error);
        if(error) { return; }
        content.trim_front(n);
        ++entry.num_blob_blocks;
    }

    payload block(2 + int(path.size()) + 24);
    block.u16(uint16_t(path.size()))
        .buffer(path)
        .u64(entry.blob_offset)
        .u64(entry.num_blob_blocks)
        .u64(entry.length);
    metadata_->append(block.data, error);
}

std::vector<drive_entry> drive::entries(error_code& error) const
{
    return read_entries(1, metadata_->contiguous_length(), error);
}

std::vector<uint8_t> drive::read(const drive_entry& entry, error_code& error) const
{
    error.clear();
    std::vector<uint8_t> content;
    if(!blobs_)
    {
        error = make_error_code(replication_errc::block_not_found);
        return content;
    }
    content.reserve(entry.length);
    for(auto i = 0; i < entry.num_blob_blocks; ++i)
    {
        const auto block = blobs_->read(entry.blob_offset + i, error);
        if(error) { return {}; }
        content.insert(content.end(), block.begin(), block.end());
    }
    if(int64_t(content.size()) != entry.length)
    {
        error = make_error_code(replication_errc::invalid_drive_entry);
        return {};
    }
    return content;
}

void drive::ready(completion_handler handler)
{
    const auto error = load_header();
    asio::post(ios_, [handler = std::move(handler), error] { handler(error); });
}

const key_type& drive::key() const
{
    return metadata_->key();
}

int64_t drive::version() const
{
    return metadata_->length();
}

replicated_stream& drive::metadata()
{
    return *metadata_;
}

const replicated_stream& drive::metadata() const
{
    return *metadata_;
}

replicated_stream* drive::blobs()
{
    return blobs_.get();
}

const replicated_stream* drive::blobs() const
{
    return blobs_.get();
}

void drive::download(const std::string& path, completion_handler handler)
{
    if(metadata_->length() == 0)
    {
        log(log::priority::low, "waiting for the metadata core to be found");
        metadata_->on_append([SHARED_THIS, path, handler = std::move(handler)]() mutable
            { download(path, std::move(handler)); });
        return;
    }
    metadata_->download(0, 1,
        [SHARED_THIS, path, handler = std::move(handler)](const error_code& error)
        { on_header_downloaded(path, error, std::move(handler)); });
}

void drive::on_header_downloaded(const std::string& path, const error_code& error,
    completion_handler handler)
{
    auto ec = error ? error : load_header();
    if(ec)
    {
        handler(ec);
        return;
    }

    // Entries appended after this point belong to a later version.
    const int64_t version = metadata_->length();
    log(log::priority::normal, "downloading version %lli of %s",
        static_cast<long long>(version), path.c_str());
    metadata_->download(1, version,
        [SHARED_THIS, path, version, handler = std::move(handler)](
            const error_code& error)
        { on_metadata_downloaded(path, version, error, std::move(handler)); });
}

void drive::on_metadata_downloaded(const std::string& path, const int64_t version,
    const error_code& error, completion_handler handler)
{
    if(error)
    {
        handler(error);
        return;
    }

    error_code ec;
    auto entries = read_entries(1, version, ec);
    if(ec)
    {
        handler(ec);
        return;
    }

    std::vector<std::pair<int64_t, int64_t>> ranges;
    for(const auto& entry : entries)
    {
        if(!is_under(entry.path, path) || entry.num_blob_blocks == 0) { continue; }
        ranges.emplace_back(entry.blob_offset, entry.blob_offset + entry.num_blob_blocks);
    }
    std::sort(ranges.begin(), ranges.end());
    std::vector<std::pair<int64_t, int64_t>> merged;
    for(const auto& range : ranges)
    {
        if(!merged.empty() && range.first <= merged.back().second)
        {
            merged.back().second = std::max(merged.back().second, range.second);
        }
        else
        {
            merged.emplace_back(range);
        }
    }

    log(log::priority::normal, "%i entries, %i blob ranges to download",
        int(entries.size()), int(merged.size()));
    if(merged.empty())
    {
        handler(error_code());
        return;
    }

    struct download_state
    {
        int num_pending;
        bool is_done = false;
        completion_handler handler;
    };
    auto state = std::make_shared<download_state>();
    state->num_pending = int(merged.size());
    state->handler = std::move(handler);
    for(const auto& range : merged)
    {
        blobs_->download(range.first, range.second, [state](const error_code& result)
            {
                if(state->is_done) { return; }
                if(result || --state->num_pending == 0)
                {
                    state->is_done = true;
                    state->handler(result);
                }
            });
    }
}

error_code drive::load_header()
{
    if(blobs_ || !metadata_->has(0)) { return error_code(); }

    error_code error;
    const auto header = metadata_->read(0, error);
    if(error) { return error; }
    if(header.size() != header_size
       || std::memcmp(header.data(), header_magic, sizeof header_magic) != 0
       || header[4] != format_version)
    {
        return make_error_code(replication_errc::invalid_drive_header);
    }

    key_type blobs_key;
    std::copy(header.begin() + 5, header.end(), blobs_key.begin());
    try
    {
        blobs_ = open_core_(blobs_key, false);
    }
    catch(const system_error& e)
    {
        return e.code();
    }
    log(log::priority::normal, "found blob core %s",
        util::to_hex(blobs_key).substr(0, 8).c_str());
    return error_code();
}

std::vector<drive_entry> drive::read_entries(const int64_t begin, const int64_t end,
    error_code& error) const
{
    error.clear();
    std::vector<drive_entry> entries;
    for(auto i = begin; i < end; ++i)
    {
        const auto block = metadata_->read(i, error);
        if(error) { return {}; }

        payload_reader reader(block);
        drive_entry entry;
        const auto path_length = reader.read<uint16_t>();
        const auto path = reader.read_bytes(path_length);
        entry.path.assign(path.begin(), path.end());
        entry.blob_offset = reader.read_int64();
        entry.num_blob_blocks = reader.read_int64();
        entry.length = reader.read_int64();
        if(!reader.is_valid() || !reader.is_exhausted())
        {
            error = make_error_code(replication_errc::invalid_drive_entry);
            return {};
        }
        entries.emplace_back(std::move(entry));
    }
    return entries;
}

template<typename... Args>
void drive::log(const log::priority priority, const char* format, Args&&... args) const
{
    log::log_store("DRIVE", util::format(format, std::forward<Args>(args)...), priority);
}

} // namespace driveprof
