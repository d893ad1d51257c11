#include <gtest/gtest.h>
#include "driveprof/report.hpp"
#include "fakes.hpp"

#include <memory>
#include <string>

#include <asio/io_context.hpp>

using namespace driveprof;

namespace {

report_input make_input()
{
    report_input in;
    in.elapsed_seconds = 12.5;
    in.metadata_found_at = 1.25;
    in.metadata = stream_progress{40, 42};
    in.snapshot.transport.bytes_received = 1600000;
    in.snapshot.transport.bytes_transmitted = 4000;
    in.snapshot.transport.packets_received = 250;
    in.snapshot.transport.packets_transmitted = 125;
    in.snapshot.connections.attempted = 2;
    in.snapshot.connections.opened = 1;
    in.snapshot.connections.closed = 1;
    in.snapshot.connections.retransmits = 3;
    in.snapshot.address.address = "203.0.113.7:4000";
    in.snapshot.address.is_firewalled = true;
    in.snapshot.replication.hotswaps = 2;
    in.snapshot.replication[message_type::sync] = message_counter{5, 6};
    in.rates = compute_rates(in.snapshot, in.elapsed_seconds);
    in.metadata_availability = stream_availability{42, 42, 1};
    return in;
}

bool contains(const std::string& s, const std::string& what)
{
    return s.find(what) != std::string::npos;
}

} // namespace

TEST(ReportTest, RenderingIsDeterministic)
{
    const auto in = make_input();
    EXPECT_EQ(render_report(in), render_report(in));
}

TEST(ReportTest, SectionsAppearInOrder)
{
    const auto text = render_report(make_input());
    const auto general = text.find("General\n");
    const auto network = text.find("Network\n");
    const auto connection = text.find("Connection info\n");
    const auto replication = text.find("Replication\n");
    const auto availability = text.find("Availability\n");
    EXPECT_EQ(general, 0u);
    EXPECT_LT(general, network);
    EXPECT_LT(network, connection);
    EXPECT_LT(connection, replication);
    EXPECT_LT(replication, availability);
}

TEST(ReportTest, GeneralSection)
{
    const auto text = render_report(make_input());
    EXPECT_TRUE(contains(text, "  - Runtime: 12.50 seconds\n"));
    EXPECT_TRUE(contains(text, "  - Metadata found in: 1.25 seconds\n"));
    EXPECT_TRUE(contains(text, "  - Metadata db: 40 / 42 (contiguous length / length)\n"));
    EXPECT_TRUE(contains(text, "  - Blobs core: loading\n"));
    EXPECT_FALSE(contains(text, "Fully downloaded"));
}

TEST(ReportTest, MetadataNotFoundYet)
{
    auto in = make_input();
    in.metadata_found_at.reset();
    EXPECT_TRUE(contains(render_report(in),
        "  - Metadata found in: unknown (still connecting...)\n"));
}

TEST(ReportTest, FullyDownloadedLine)
{
    auto in = make_input();
    in.blobs = stream_progress{7, 7};
    in.fully_downloaded_at = 9.0;
    const auto text = render_report(in);
    EXPECT_TRUE(contains(text, "  - Blobs core: 7 / 7 (contiguous length / length)\n"));
    EXPECT_TRUE(contains(text, "  - Fully downloaded in 9.00 seconds\n"));
}

TEST(ReportTest, ByteRatesAreScaledSeparately)
{
    const auto text = render_report(make_input());
    // 1.6 MB over 12.5 seconds is 128 kB per second.
    EXPECT_TRUE(contains(text, "  - Bytes received: 1.60 MB (128.00 kB / second)\n"));
    EXPECT_TRUE(contains(text, "  - Packets received: 250 (20 / second)\n"));
    EXPECT_TRUE(contains(text, "  - Packets transmitted: 125 (10 / second)\n"));
}

TEST(ReportTest, UnavailableCountersSaySo)
{
    const auto text = render_report(make_input());
    EXPECT_TRUE(contains(text, "  - Packets dropped: unavailable\n"));
    EXPECT_TRUE(contains(text, "    - Retransmission timeouts: unavailable\n"));
    EXPECT_TRUE(contains(text, "    - Fast recoveries: unavailable\n"));
    EXPECT_TRUE(contains(text, "    - Retransmits: 3\n"));
}

TEST(ReportTest, ZeroElapsedTimeHasNoRates)
{
    auto in = make_input();
    in.elapsed_seconds = 0.0;
    in.rates = compute_rates(in.snapshot, in.elapsed_seconds);
    EXPECT_TRUE(contains(render_report(in),
        "  - Bytes received: 1.60 MB (unavailable / second)\n"));
}

TEST(ReportTest, AddressIsRedactedByDefault)
{
    const auto text = render_report(make_input());
    EXPECT_TRUE(contains(text, "  - Address: xxx.xxx.xxx.xxx (firewalled: true)\n"));
    EXPECT_FALSE(contains(text, "203.0.113.7"));
}

TEST(ReportTest, AddressShownOnRequest)
{
    report_options options;
    options.show_address = true;
    EXPECT_TRUE(contains(render_report(make_input(), options),
        "  - Address: 203.0.113.7:4000 (firewalled: true)\n"));
}

TEST(ReportTest, UnknownAddress)
{
    auto in = make_input();
    in.snapshot.address.address.reset();
    in.snapshot.address.is_firewalled = false;
    report_options options;
    options.show_address = true;
    EXPECT_TRUE(contains(render_report(in, options),
        "  - Address: unknown (firewalled: false)\n"));
}

TEST(ReportTest, MessageCountsOnlyWithDetail)
{
    const auto in = make_input();
    const auto plain = render_report(in);
    EXPECT_TRUE(contains(plain, "  - Hotswaps: 2\n"));
    EXPECT_FALSE(contains(plain, "Messages"));

    report_options options;
    options.show_detail = true;
    const auto detailed = render_report(in, options);
    EXPECT_TRUE(contains(detailed, "  - Hotswaps: 2\n"));
    EXPECT_TRUE(contains(detailed, "    - Sync: 5 received / 6 transmitted\n"));
    EXPECT_TRUE(contains(detailed, "    - Extension: 0 received / 0 transmitted\n"));
}

TEST(ReportTest, DiscoveryCountersOnlyWithDetail)
{
    auto in = make_input();
    EXPECT_FALSE(contains(render_report(in), "Punches"));
    EXPECT_FALSE(contains(render_report(in), "DHT commands"));

    report_options options;
    options.show_detail = true;
    const auto text = render_report(in, options);
    EXPECT_TRUE(contains(text, "  - Punches:\n    - Consistent: unavailable\n"
        "    - Random: unavailable\n    - Open: unavailable\n"));
    EXPECT_TRUE(contains(text, "  - Total Queries: unavailable\n  - DHT commands\n"));
    EXPECT_TRUE(contains(text, "    - Ping: unavailable\n"));
    EXPECT_TRUE(contains(text, "    - Find Node: unavailable\n"));
    EXPECT_LT(text.find("Retransmits"), text.find("Punches"));
    EXPECT_LT(text.find("Find Node"), text.find("Replication\n"));
}

TEST(ReportTest, DiscoveryCountersWhenSupplied)
{
    auto in = make_input();
    in.snapshot.discovery.consistent_punches = 2;
    in.snapshot.discovery.random_punches = 0;
    in.snapshot.discovery.open_punches = 5;
    in.snapshot.discovery.total_queries = 17;
    in.snapshot.discovery.ping_nat = message_counter{1, 2};
    in.snapshot.discovery.find_node = message_counter{3, 4};

    report_options options;
    options.show_detail = true;
    const auto text = render_report(in, options);
    EXPECT_TRUE(contains(text, "    - Consistent: 2\n    - Random: 0\n    - Open: 5\n"));
    EXPECT_TRUE(contains(text, "  - Total Queries: 17\n"));
    EXPECT_TRUE(contains(text, "    - Ping: unavailable\n"));
    EXPECT_TRUE(contains(text, "    - Ping NAT: 1 received / 2 transmitted\n"));
    EXPECT_TRUE(contains(text, "    - Down Hint: unavailable\n"));
    EXPECT_TRUE(contains(text, "    - Find Node: 3 received / 4 transmitted\n"));
}

TEST(ReportTest, SnapshotCarriesEveryCounterGroup)
{
    asio::io_context ios;
    test::fake_swarm swarm(ios);
    test::fake_store store(ios, std::make_shared<test::fake_tree>(ios));
    swarm.counters_.transport.bytes_received = 10;
    swarm.counters_.discovery.total_queries = 9;
    swarm.counters_.discovery.ping = message_counter{1, 1};
    store.counters_.hotswaps = 3;

    const auto s = capture_snapshot(swarm, store, time_point(seconds(3)));
    EXPECT_EQ(s.captured_at, time_point(seconds(3)));
    EXPECT_EQ(s.transport.bytes_received, 10);
    ASSERT_TRUE(s.discovery.total_queries);
    EXPECT_EQ(*s.discovery.total_queries, 9);
    ASSERT_TRUE(s.discovery.ping);
    EXPECT_EQ(s.discovery.ping->received, 1);
    EXPECT_FALSE(s.discovery.find_node);
    EXPECT_EQ(s.replication.hotswaps, 3);
}

TEST(ReportTest, Availability)
{
    auto in = make_input();
    in.blob_availability = stream_availability{10, 8, 2};
    const auto text = render_report(in);
    EXPECT_TRUE(contains(text, "  - Metadata db: 42 / 42 (max remote contiguous length"
        " / max remote length, 1 peer)\n"));
    EXPECT_TRUE(contains(text, "  - Blobs core: 8 / 10 (max remote contiguous length"
        " / max remote length, 2 peers)\n"));
}

TEST(ReportTest, NoRemotePeersSectionWhenDisabled)
{
    EXPECT_FALSE(contains(render_report(make_input()), "Remote peers"));
}

TEST(ReportTest, RemotePeersSection)
{
    auto in = make_input();
    remote_peer_report peers;
    peers.num_expected = 1;
    peers.peers.push_back(
        peer_classification{"peera", stream_id::metadata, replication_status::done, 4, 4});
    peers.peers.push_back(peer_classification{
        "peera", stream_id::blobs, replication_status::downloading, 1, 3});
    peers.num_done = 1;
    in.remote_peers = peers;

    const auto text = render_report(in);
    EXPECT_TRUE(contains(text, "Remote peers\n"));
    EXPECT_TRUE(contains(text, "  - peera metadata: done (4 / 4)\n"));
    EXPECT_TRUE(contains(text, "  - peera blobs: downloading (1 / 3)\n"));
    EXPECT_TRUE(contains(text, "  - not all done (1 / 2 done)\n"));
}

TEST(ReportTest, AvailabilityIsTheBestReplica)
{
    std::vector<remote_peer_info> peers(2);
    peers[0].remote_length = 10;
    peers[0].remote_contiguous_length = 3;
    peers[1].remote_length = 6;
    peers[1].remote_contiguous_length = 6;
    const auto a = compute_availability(peers);
    EXPECT_EQ(a.max_remote_length, 10);
    EXPECT_EQ(a.max_remote_contiguous_length, 6);
    EXPECT_EQ(a.num_peers, 2);

    const auto none = compute_availability({});
    EXPECT_EQ(none.max_remote_length, 0);
    EXPECT_EQ(none.num_peers, 0);
}

TEST(ReportTest, CollectWithoutDrive)
{
    milestone_tracker milestones;
    metrics_snapshot snapshot;
    snapshot.captured_at = time_point(seconds(100));
    milestones.mark_start(time_point(seconds(96)));

    const auto in = collect_report_input(nullptr, snapshot, milestones,
        remote_peer_tracker());
    EXPECT_DOUBLE_EQ(in.elapsed_seconds, 4.0);
    EXPECT_EQ(in.metadata.length, 0);
    EXPECT_FALSE(in.blobs);
    EXPECT_FALSE(in.blob_availability);
    EXPECT_FALSE(in.remote_peers);
}

TEST(ReportTest, CollectFromTree)
{
    asio::io_context ios;
    test::fake_tree tree(ios);
    tree.metadata_.length_ = 5;
    tree.metadata_.contiguous_length_ = 4;
    remote_peer_info peer;
    peer.remote_public_key = "peera";
    peer.remote_length = 5;
    peer.remote_contiguous_length = 5;
    tree.metadata_.peers_.push_back(peer);
    tree.blobs_ = std::make_unique<test::fake_stream>();
    tree.blobs_->length_ = 9;

    milestone_tracker milestones;
    metrics_snapshot snapshot;
    snapshot.captured_at = time_point(seconds(10));
    milestones.mark_start(time_point(seconds(8)));

    const auto in = collect_report_input(&tree, snapshot, milestones,
        remote_peer_tracker(std::vector<std::string>{"peera"}));
    EXPECT_EQ(in.metadata.contiguous_length, 4);
    EXPECT_EQ(in.metadata.length, 5);
    ASSERT_TRUE(in.blobs);
    EXPECT_EQ(in.blobs->length, 9);
    EXPECT_EQ(in.metadata_availability.num_peers, 1);
    ASSERT_TRUE(in.blob_availability);
    EXPECT_EQ(in.blob_availability->num_peers, 0);
    ASSERT_TRUE(in.remote_peers);
    ASSERT_EQ(in.remote_peers->peers.size(), 1u);
    EXPECT_EQ(in.remote_peers->peers[0].status, replication_status::done);
    EXPECT_FALSE(in.remote_peers->all_done);
}
