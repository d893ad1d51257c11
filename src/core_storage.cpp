#include "core_storage.hpp"
#include "replication_error.hpp"
#include "system.hpp"

#include <cerrno>
#include <filesystem>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace driveprof {

core_storage::core_storage(path directory) : directory_(std::move(directory)) {}

core_storage::~core_storage()
{
    close();
}

void core_storage::open(error_code& error)
{
    error.clear();
    if(is_open()) { return; }

    std::filesystem::create_directories(directory_, error);
    if(error) { return; }

    // use default permissions and let the OS decide the rest
    const int permissions = S_IRUSR | S_IWUSR | S_IRGRP | S_IWGRP | S_IROTH | S_IWOTH;
    int mode = O_RDWR | O_CREAT | O_TRUNC;
#ifdef O_NOATIME
    mode |= O_NOATIME;
#endif // O_NOATIME

    const auto file_path = directory_ / "data";
    file_handle_ = ::open(file_path.c_str(), mode, permissions);
#ifdef O_NOATIME
    if(file_handle_ == -1 && errno == EPERM)
    {
        // O_NOATIME is not allowed for files we don't own, so try again without it
        file_handle_ = ::open(file_path.c_str(), mode & ~O_NOATIME, permissions);
    }
#endif // O_NOATIME
    if(file_handle_ == -1)
    {
        error = system::last_error();
        return;
    }
    file_size_ = 0;
    index_.clear();
}

void core_storage::close() noexcept
{
    if(!is_open()) { return; }
    ::close(file_handle_);
    file_handle_ = -1;
}

bool core_storage::has(const block_index_t index) const noexcept
{
    return index >= 0 && index < block_index_t(index_.size())
        && index_[index].offset >= 0;
}

void core_storage::write(const block_index_t index, const_view<uint8_t> block,
    error_code& error)
{
    error.clear();
    if(!is_open())
    {
        error = make_error_code(replication_errc::store_closed);
        return;
    }
    if(has(index)) { return; }

    size_t num_written = 0;
    while(num_written < block.size())
    {
        const auto n = ::pwrite(file_handle_, block.data() + num_written,
            block.size() - num_written, file_size_ + num_written);
        if(n < 0)
        {
            if(errno == EINTR) { continue; }
            error = system::last_error();
            return;
        }
        num_written += n;
    }

    if(index >= block_index_t(index_.size())) { index_.resize(index + 1); }
    index_[index].offset = file_size_;
    index_[index].length = block.size();
    file_size_ += block.size();
}

std::vector<uint8_t> core_storage::read(const block_index_t index,
    error_code& error) const
{
    error.clear();
    if(!is_open())
    {
        error = make_error_code(replication_errc::store_closed);
        return {};
    }
    if(!has(index))
    {
        error = make_error_code(replication_errc::block_not_found);
        return {};
    }

    const auto& location = index_[index];
    std::vector<uint8_t> block(location.length);
    size_t num_read = 0;
    while(num_read < block.size())
    {
        const auto n = ::pread(file_handle_, block.data() + num_read,
            block.size() - num_read, location.offset + num_read);
        if(n < 0)
        {
            if(errno == EINTR) { continue; }
            error = system::last_error();
            return {};
        }
        if(n == 0)
        {
            error = make_error_code(replication_errc::block_not_found);
            return {};
        }
        num_read += n;
    }
    return block;
}

} // namespace driveprof
