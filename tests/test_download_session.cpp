#include <gtest/gtest.h>
#include "driveprof/download_session.hpp"
#include "driveprof/profiler_error.hpp"
#include "driveprof/log.hpp"
#include "fakes.hpp"

#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>

#include <asio/io_context.hpp>

using namespace driveprof;
using namespace driveprof::test;

namespace {

class DownloadSessionTest : public ::testing::Test
{
protected:
    asio::io_context ios;
    std::shared_ptr<fake_tree> tree = std::make_shared<fake_tree>(ios);
    std::shared_ptr<fake_store> store = std::make_shared<fake_store>(ios, tree);
    std::shared_ptr<fake_swarm> swarm = std::make_shared<fake_swarm>(ios);
    int num_creates = 0;
    int num_removes = 0;
    std::ostringstream out;
    std::shared_ptr<download_session> session;

    int num_shutdowns = 0;
    error_code shutdown_error;

    void SetUp() override
    {
        log::set_stream(nullptr);
        make_session(session_settings());
    }

    void make_session(session_settings settings)
    {
        settings.drive_key = std::string(64, 'a');
        session = std::make_shared<download_session>(ios, store, swarm,
            std::make_unique<fake_workspace>(&num_creates, &num_removes),
            std::move(settings), out);
    }

    void TearDown() override { log::set_stream(&std::cout); }

    void start()
    {
        session->start([this](const error_code& error)
            {
                ++num_shutdowns;
                shutdown_error = error;
            });
    }

    /** Runs every handler that is ready, without waiting on timers. */
    void drain()
    {
        ios.restart();
        ios.poll();
    }

    bool output_contains(const std::string& s) const
    {
        return out.str().find(s) != std::string::npos;
    }

    int count_in_output(const std::string& s) const
    {
        const auto text = out.str();
        int n = 0;
        for(auto pos = text.find(s); pos != std::string::npos; pos = text.find(s, pos + 1))
        {
            ++n;
        }
        return n;
    }
};

} // namespace

TEST_F(DownloadSessionTest, JoinsSwarmAsClientOnceDriveIsReady)
{
    start();
    EXPECT_EQ(num_creates, 1);
    EXPECT_EQ(session->current_state(), download_session::state::initializing);

    drain();
    EXPECT_EQ(store->num_opens, 1);
    EXPECT_EQ(swarm->num_joins, 1);
    EXPECT_EQ(swarm->joined_topic, tree->discovery_key());
    EXPECT_FALSE(swarm->joined_options.server);
    EXPECT_TRUE(swarm->joined_options.client);
    EXPECT_EQ(session->current_state(), download_session::state::awaiting_metadata);
    EXPECT_EQ(tree->num_downloads, 0);

    session->cancel();
    drain();
}

TEST_F(DownloadSessionTest, InterruptWhileAwaitingMetadata)
{
    start();
    drain();
    ASSERT_EQ(session->current_state(), download_session::state::awaiting_metadata);

    session->cancel();
    drain();

    EXPECT_TRUE(session->is_finished());
    EXPECT_TRUE(output_contains("  - Metadata found in: unknown (still connecting...)"));
    EXPECT_TRUE(output_contains("Cancelling before the download is complete..."));
    EXPECT_FALSE(output_contains("Fully downloaded in"));
    EXPECT_EQ(swarm->num_destroys, 1);
    EXPECT_EQ(store->num_closes, 1);
    EXPECT_EQ(num_removes, 1);
    EXPECT_EQ(num_shutdowns, 1);
    EXPECT_FALSE(shutdown_error);
    EXPECT_FALSE(session->milestones().metadata_found_at());
}

TEST_F(DownloadSessionTest, RepeatedCancelTearsDownOnce)
{
    start();
    drain();
    session->cancel();
    session->cancel();
    drain();
    session->cancel();
    drain();

    EXPECT_EQ(swarm->num_destroys, 1);
    EXPECT_EQ(store->num_closes, 1);
    EXPECT_EQ(num_removes, 1);
    EXPECT_EQ(num_shutdowns, 1);
    EXPECT_EQ(count_in_output("General\n"), 1);
    EXPECT_EQ(count_in_output("fully done..."), 1);
}

TEST_F(DownloadSessionTest, TeardownRunsInOrder)
{
    start();
    drain();
    session->cancel();
    drain();

    const auto text = out.str();
    const auto report = text.find("General\n");
    const auto swarm_pos = text.find("Destroying swarm...");
    const auto store_pos = text.find("Closing store...");
    const auto workspace_pos = text.find("Cleaning up temporary directory...");
    const auto done = text.find("fully done...");
    ASSERT_NE(report, std::string::npos);
    ASSERT_NE(done, std::string::npos);
    EXPECT_LT(report, swarm_pos);
    EXPECT_LT(swarm_pos, store_pos);
    EXPECT_LT(store_pos, workspace_pos);
    EXPECT_LT(workspace_pos, done);
}

TEST_F(DownloadSessionTest, CompletesAfterMetadataArrives)
{
    start();
    drain();
    tree->metadata_.append(5);
    EXPECT_EQ(session->current_state(), download_session::state::downloading);
    EXPECT_TRUE(session->milestones().metadata_found_at());
    ASSERT_EQ(tree->num_downloads, 1);
    EXPECT_TRUE(output_contains("Downloading drive version 5"));

    tree->download_handler(error_code());
    drain();

    EXPECT_TRUE(session->is_finished());
    EXPECT_FALSE(session->error());
    EXPECT_EQ(num_shutdowns, 1);
    EXPECT_FALSE(shutdown_error);
    ASSERT_TRUE(session->milestones().fully_downloaded_at());
    EXPECT_LE(*session->milestones().metadata_found_at(),
        *session->milestones().fully_downloaded_at());
    EXPECT_TRUE(output_contains("  - Fully downloaded in "));
    EXPECT_FALSE(output_contains("Cancelling"));
    EXPECT_EQ(num_removes, 1);
}

TEST_F(DownloadSessionTest, MetadataAlreadyPresentStartsDownloadRightAway)
{
    tree->metadata_.length_ = 3;
    start();
    drain();
    EXPECT_EQ(session->current_state(), download_session::state::downloading);
    EXPECT_EQ(tree->num_downloads, 1);
    session->cancel();
    drain();
    EXPECT_TRUE(session->is_finished());
}

TEST_F(DownloadSessionTest, HeaderOnlyMetadataStillWaitsForAppend)
{
    tree->metadata_.length_ = 1;
    start();
    drain();
    EXPECT_EQ(session->current_state(), download_session::state::awaiting_metadata);
    EXPECT_EQ(tree->num_downloads, 0);
    tree->metadata_.append(1);
    EXPECT_EQ(tree->num_downloads, 1);
    session->cancel();
    drain();
}

TEST_F(DownloadSessionTest, CompletionAfterCancelIsIgnored)
{
    tree->metadata_.length_ = 3;
    start();
    drain();
    auto handler = tree->download_handler;
    session->cancel();
    handler(error_code());
    drain();

    EXPECT_TRUE(session->is_finished());
    EXPECT_FALSE(session->milestones().fully_downloaded_at());
    EXPECT_EQ(num_shutdowns, 1);
    EXPECT_EQ(num_removes, 1);
}

TEST_F(DownloadSessionTest, DownloadErrorEndsSessionWithError)
{
    tree->metadata_.length_ = 3;
    start();
    drain();
    tree->download_handler(make_error_code(profiler_errc::unknown));
    drain();

    EXPECT_TRUE(session->is_finished());
    EXPECT_EQ(session->error(), make_error_code(profiler_errc::unknown));
    EXPECT_EQ(shutdown_error, make_error_code(profiler_errc::unknown));
    EXPECT_TRUE(output_contains("Error: "));
    EXPECT_TRUE(output_contains("General\n"));
    EXPECT_EQ(num_removes, 1);
}

TEST_F(DownloadSessionTest, StoreOpenFailureSkipsReport)
{
    store->open_error = make_error_code(profiler_errc::workspace_unavailable);
    start();
    drain();

    EXPECT_TRUE(session->is_finished());
    EXPECT_EQ(shutdown_error, make_error_code(profiler_errc::workspace_unavailable));
    EXPECT_FALSE(output_contains("General\n"));
    EXPECT_EQ(swarm->num_joins, 0);
    EXPECT_EQ(swarm->num_destroys, 1);
    EXPECT_EQ(store->num_closes, 1);
    EXPECT_EQ(num_removes, 1);
}

TEST_F(DownloadSessionTest, InvalidKeyThrowsBeforeWorkspaceIsCreated)
{
    session_settings settings;
    settings.drive_key = "not a key";
    auto s = std::make_shared<download_session>(ios, store, swarm,
        std::make_unique<fake_workspace>(&num_creates, &num_removes), settings, out);
    EXPECT_THROW(s->start([](const error_code&) {}), std::invalid_argument);
    EXPECT_EQ(num_creates, 0);
    EXPECT_EQ(store->num_opens, 0);
}

TEST_F(DownloadSessionTest, StartingTwiceThrows)
{
    start();
    EXPECT_THROW(start(), system_error);
    session->cancel();
    drain();
}

TEST_F(DownloadSessionTest, ReportReflectsCounters)
{
    swarm->counters_.transport.bytes_received = 2000;
    swarm->counters_.connections.attempted = 3;
    store->counters_.hotswaps = 4;
    tree->metadata_.length_ = 3;
    tree->metadata_.contiguous_length_ = 2;
    start();
    drain();

    const auto report = session->make_report();
    EXPECT_NE(report.find("  - Bytes received: 2.00 kB"), std::string::npos);
    EXPECT_NE(report.find("    - Attempted: 3"), std::string::npos);
    EXPECT_NE(report.find("  - Hotswaps: 4"), std::string::npos);
    EXPECT_NE(report.find("  - Metadata db: 2 / 3 (contiguous length / length)"),
        std::string::npos);
    session->cancel();
    drain();
}

TEST_F(DownloadSessionTest, ReportsPeriodicallyWhileDownloading)
{
    session_settings settings;
    settings.report_interval = milliseconds(5);
    make_session(settings);
    tree->metadata_.length_ = 3;
    start();
    drain();
    ASSERT_EQ(session->current_state(), download_session::state::downloading);
    EXPECT_EQ(count_in_output("General\n"), 0);

    ios.restart();
    ios.run_for(milliseconds(100));
    EXPECT_GE(count_in_output("General\n"), 2);

    tree->download_handler(error_code());
    drain();
    ASSERT_TRUE(session->is_finished());
    const int num_reports = count_in_output("General\n");

    ios.restart();
    ios.run_for(milliseconds(30));
    EXPECT_EQ(count_in_output("General\n"), num_reports);
    const auto text = out.str();
    EXPECT_EQ(text.find("General\n", text.find("fully done...")), std::string::npos);
}

TEST_F(DownloadSessionTest, ExpiredTickIsDroppedOnCancel)
{
    session_settings settings;
    settings.report_interval = milliseconds(1);
    make_session(settings);
    tree->metadata_.length_ = 3;
    start();
    drain();
    ASSERT_EQ(session->current_state(), download_session::state::downloading);

    // Let the timer expire without running its handler.
    std::this_thread::sleep_for(milliseconds(10));
    session->cancel();
    drain();

    EXPECT_TRUE(session->is_finished());
    // Only the final report.
    EXPECT_EQ(count_in_output("General\n"), 1);
}

TEST_F(DownloadSessionTest, NoRemotePeersSectionWithoutExpectedPeers)
{
    remote_peer_info peer;
    peer.remote_public_key = std::string(52, 'y');
    peer.remote_length = 3;
    peer.remote_contiguous_length = 3;
    tree->metadata_.peers_.push_back(peer);
    tree->metadata_.length_ = 3;
    tree->blobs_ = std::make_unique<fake_stream>();
    tree->blobs_->peers_.push_back(peer);
    start();
    drain();

    const auto report = session->make_report();
    EXPECT_NE(report.find("1 peer)"), std::string::npos);
    EXPECT_EQ(report.find("Remote peers"), std::string::npos);
    session->cancel();
    drain();
    EXPECT_FALSE(output_contains("Remote peers"));
}

TEST_F(DownloadSessionTest, RemotePeersSectionWithExpectedPeers)
{
    const std::string id(52, 'y');
    session_settings settings;
    settings.expected_peers.push_back(id);
    make_session(settings);
    remote_peer_info peer;
    peer.remote_public_key = id;
    peer.remote_length = 3;
    peer.remote_contiguous_length = 3;
    tree->metadata_.peers_.push_back(peer);
    tree->metadata_.length_ = 3;
    start();
    drain();

    const auto report = session->make_report();
    EXPECT_NE(report.find("Remote peers\n"), std::string::npos);
    EXPECT_NE(report.find("  - " + id + " metadata: done (3 / 3)\n"), std::string::npos);
    session->cancel();
    drain();
}

TEST_F(DownloadSessionTest, ConnectionErrorIsReportedAndSessionContinues)
{
    tree->metadata_.length_ = 3;
    start();
    drain();
    ASSERT_EQ(session->current_state(), download_session::state::downloading);
    ASSERT_TRUE(swarm->connection_handler_);

    auto conn = std::make_shared<fake_connection>(ios, 9);
    swarm->connection_handler_(conn);
    EXPECT_EQ(store->num_replicated, 1);

    conn->close(make_error_code(std::errc::connection_reset));
    drain();

    EXPECT_TRUE(output_contains("Connection error: "
        + make_error_code(std::errc::connection_reset).message() + "\n"));
    EXPECT_EQ(session->current_state(), download_session::state::downloading);
    EXPECT_FALSE(session->is_finished());
    EXPECT_EQ(num_shutdowns, 0);
    EXPECT_EQ(swarm->num_destroys, 0);

    tree->download_handler(error_code());
    drain();
    EXPECT_TRUE(session->is_finished());
    EXPECT_FALSE(shutdown_error);
}
