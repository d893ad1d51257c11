#include <gtest/gtest.h>
#include "driveprof/settings.hpp"
#include "driveprof/string_utils.hpp"
#include "driveprof/id_encoding.hpp"

#include <filesystem>
#include <fstream>
#include <stdexcept>

using namespace driveprof;

namespace {

profiler_settings valid_settings()
{
    profiler_settings s;
    s.session.drive_key = std::string(64, 'a');
    s.swarm.bootstrap.push_back("127.0.0.1:4000");
    return s;
}

} // namespace

TEST(SettingsTest, DefaultsAreValid)
{
    EXPECT_NO_THROW(verify(session_settings()));
    EXPECT_NO_THROW(verify(swarm_settings()));
    EXPECT_NO_THROW(verify(replication_settings()));
    EXPECT_NO_THROW(verify(testnet_settings()));
    EXPECT_NO_THROW(verify(valid_settings()));
}

TEST(SettingsTest, DefaultInterval)
{
    EXPECT_EQ(session_settings().report_interval, seconds(10));
}

TEST(SettingsTest, IntervalMustBePositive)
{
    session_settings s;
    s.report_interval = seconds(0);
    EXPECT_THROW(verify(s), std::invalid_argument);
}

TEST(SettingsTest, DriveKeyMustBeValid)
{
    session_settings s;
    s.drive_key = "xyz";
    EXPECT_THROW(verify(s), std::invalid_argument);
}

TEST(SettingsTest, BootstrapEndpoints)
{
    swarm_settings s;
    s.bootstrap = {"localhost"};
    EXPECT_THROW(verify(s), std::invalid_argument);
    s.bootstrap = {"localhost:"};
    EXPECT_THROW(verify(s), std::invalid_argument);
    s.bootstrap = {"localhost:0"};
    EXPECT_THROW(verify(s), std::invalid_argument);
    s.bootstrap = {"localhost:70000"};
    EXPECT_THROW(verify(s), std::invalid_argument);
    s.bootstrap = {"localhost:4x"};
    EXPECT_THROW(verify(s), std::invalid_argument);
    s.bootstrap = {"localhost:4000", "10.0.0.1:65535"};
    EXPECT_NO_THROW(verify(s));
}

TEST(SettingsTest, ReconnectIntervals)
{
    swarm_settings s;
    s.reconnect_interval = seconds(4);
    s.max_reconnect_interval = seconds(2);
    EXPECT_THROW(verify(s), std::invalid_argument);
}

TEST(SettingsTest, ConnectionAttempts)
{
    swarm_settings s;
    s.max_connection_attempts = 0;
    EXPECT_THROW(verify(s), std::invalid_argument);
    s.max_connection_attempts = values::unlimited;
    EXPECT_NO_THROW(verify(s));
}

TEST(SettingsTest, MessageSizeMustFitABlock)
{
    replication_settings s;
    s.max_message_size = s.blob_block_size;
    EXPECT_THROW(verify(s), std::invalid_argument);
}

TEST(SettingsTest, MaxCoreLengthMustBePositive)
{
    replication_settings s;
    s.max_core_length = 0;
    EXPECT_THROW(verify(s), std::invalid_argument);
}

TEST(SettingsTest, KeyAndBootstrapRequiredWithoutTestnet)
{
    auto s = valid_settings();
    s.session.drive_key.clear();
    EXPECT_THROW(verify(s), std::invalid_argument);

    s = valid_settings();
    s.swarm.bootstrap.clear();
    EXPECT_THROW(verify(s), std::invalid_argument);

    s.session.drive_key.clear();
    s.testnet.enabled = true;
    EXPECT_NO_THROW(verify(s));
}

TEST(SettingsTest, FillInDefaultsPicksWorkspace)
{
    session_settings s;
    fill_in_defaults(s);
    EXPECT_FALSE(s.workspace_root.empty());
    EXPECT_TRUE(util::starts_with(s.workspace_name, std::string("driveprof-tmp-")));

    session_settings other;
    fill_in_defaults(other);
    EXPECT_NE(s.workspace_name, other.workspace_name);
}

TEST(SettingsTest, FillInDefaultsKeepsExplicitWorkspace)
{
    session_settings s;
    s.workspace_root = "/var/tmp";
    s.workspace_name = "mine";
    fill_in_defaults(s);
    EXPECT_EQ(s.workspace_root, path("/var/tmp"));
    EXPECT_EQ(s.workspace_name, "mine");
}

TEST(SettingsTest, FillInDefaultsLoadsRemotePeers)
{
    key_type key;
    key.fill(4);
    const auto file = std::filesystem::temp_directory_path() / "driveprof-settings-peers";
    {
        std::ofstream out(file);
        out << util::to_hex(key) << '\n';
    }
    session_settings s;
    s.remote_peers_file = file;
    fill_in_defaults(s);
    std::filesystem::remove(file);
    ASSERT_EQ(s.expected_peers.size(), 1u);
    EXPECT_EQ(s.expected_peers[0], id_encoding::encode(key));
}

TEST(SettingsTest, FillInDefaultsThrowsOnMissingPeerList)
{
    session_settings s;
    s.remote_peers_file = "/nonexistent/driveprof-peers";
    EXPECT_THROW(fill_in_defaults(s), std::invalid_argument);
}
