#include "remote_peer_tracker.hpp"
#include "string_utils.hpp"
#include "id_encoding.hpp"
#include "settings.hpp"

#include <random>
#include <stdexcept>
#include <system_error>

namespace driveprof {

template<typename T, typename String>
void throw_if_below(const T& v, const T& min, const String& msg)
{
    if((v != values::none) && (v < min)) throw std::invalid_argument(msg);
}

template<typename T, typename String>
void throw_if_below_allow_unlimited(const T& v, const T& min, const String& msg)
{
    if((v != values::unlimited) && (v != values::none) && (v < min))
        throw std::invalid_argument(msg);
}

void verify(const session_settings& s)
{
    if(s.report_interval < seconds(1))
    {
        throw std::invalid_argument(
            "session_settings::report_interval must be at least 1 second");
    }
    if(!s.drive_key.empty() && !id_encoding::is_valid(s.drive_key))
    {
        throw std::invalid_argument(
            "session_settings::drive_key is not a valid key: " + s.drive_key);
    }
}

void verify(const swarm_settings& s)
{
    for(const auto& endpoint : s.bootstrap)
    {
        const auto colon = endpoint.rfind(':');
        if(colon == std::string::npos || colon == 0 || colon + 1 == endpoint.length())
        {
            throw std::invalid_argument(
                "swarm_settings::bootstrap entries must be host:port: " + endpoint);
        }
        const auto port = endpoint.substr(colon + 1);
        if(port.find_first_not_of("0123456789") != std::string::npos
            || port.length() > 5 || std::stoi(port) == 0 || std::stoi(port) > 65535)
        {
            throw std::invalid_argument(
                "swarm_settings::bootstrap entry has an invalid port: " + endpoint);
        }
    }
    if(s.reconnect_interval < seconds(0))
    {
        throw std::invalid_argument(
            "swarm_settings::reconnect_interval must not be negative");
    }
    if(s.max_reconnect_interval < s.reconnect_interval)
    {
        throw std::invalid_argument("swarm_settings::max_reconnect_interval must be"
            " at least swarm_settings::reconnect_interval");
    }
    if(s.connect_timeout < seconds(1))
    {
        throw std::invalid_argument(
            "swarm_settings::connect_timeout must be at least 1 second");
    }
    throw_if_below_allow_unlimited(s.max_connection_attempts, 1,
        "swarm_settings::max_connection_attempts must be unlimited or above 0");
}

void verify(const replication_settings& s)
{
    if(s.request_timeout < seconds(1))
    {
        throw std::invalid_argument(
            "replication_settings::request_timeout must be at least 1 second");
    }
    throw_if_below(s.max_outstanding_requests, 1,
        "replication_settings::max_outstanding_requests must be above 0");
    throw_if_below(s.blob_block_size, 1,
        "replication_settings::blob_block_size must be above 0");
    // A data message carries the block index (8 bytes) besides the block.
    throw_if_below(s.max_message_size, s.blob_block_size + 64,
        "replication_settings::max_message_size must fit a blob block");
    throw_if_below(s.max_core_length, int64_t(1),
        "replication_settings::max_core_length must be above 0");
}

void verify(const testnet_settings& s)
{
    throw_if_below(s.num_files, 1, "testnet_settings::num_files must be above 0");
    throw_if_below(s.file_size, 0, "testnet_settings::file_size must be 0 or more");
}

void verify(const profiler_settings& s)
{
    verify(s.session);
    verify(s.swarm);
    verify(s.replication);
    verify(s.testnet);
    if(!s.testnet.enabled && s.session.drive_key.empty())
    {
        throw std::invalid_argument("a drive key is required");
    }
    if(!s.testnet.enabled && s.swarm.bootstrap.empty())
    {
        throw std::invalid_argument(
            "at least one bootstrap endpoint is required to find peers");
    }
}

static std::string random_workspace_name()
{
    std::random_device rd;
    std::mt19937_64 gen(rd());
    return util::format("driveprof-tmp-%016llx",
        static_cast<unsigned long long>(gen()));
}

void fill_in_defaults(session_settings& s)
{
    if(s.workspace_root.empty())
    {
        std::error_code ec;
        s.workspace_root = std::filesystem::temp_directory_path(ec);
        if(ec) { s.workspace_root = "/tmp"; }
    }
    if(s.workspace_name.empty()) { s.workspace_name = random_workspace_name(); }
    if(!s.remote_peers_file.empty() && s.expected_peers.empty())
    {
        s.expected_peers = load_expected_peers(s.remote_peers_file);
    }
}

void fill_in_defaults(profiler_settings& s)
{
    fill_in_defaults(s.session);
}

} // driveprof
