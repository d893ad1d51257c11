#include "string_utils.hpp"
#include "report.hpp"

#include <sstream>

namespace driveprof {

stream_availability compute_availability(const std::vector<remote_peer_info>& peers)
{
    stream_availability a;
    for(const auto& peer : peers)
    {
        a.max_remote_length = running_max(a.max_remote_length, peer.remote_length);
        a.max_remote_contiguous_length = running_max(
            a.max_remote_contiguous_length, peer.remote_contiguous_length);
        ++a.num_peers;
    }
    return a;
}

report_input collect_report_input(const replicated_tree* tree,
    const metrics_snapshot& snapshot, const milestone_tracker& milestones,
    const remote_peer_tracker& remote_peers)
{
    report_input input;
    input.elapsed_seconds = milestones.elapsed_since_start(snapshot.captured_at);
    input.metadata_found_at = milestones.metadata_found_at();
    input.fully_downloaded_at = milestones.fully_downloaded_at();
    input.snapshot = snapshot;
    input.rates = compute_rates(snapshot, input.elapsed_seconds);

    std::vector<remote_peer_info> metadata_peers;
    std::vector<remote_peer_info> blob_peers;
    const replicated_stream* blobs = nullptr;
    if(tree)
    {
        const replicated_stream& metadata = tree->metadata();
        input.metadata.contiguous_length = metadata.contiguous_length();
        input.metadata.length = metadata.length();
        metadata_peers = metadata.peers();
        blobs = tree->blobs();
    }
    input.metadata_availability = compute_availability(metadata_peers);

    if(blobs)
    {
        input.blobs = stream_progress{blobs->contiguous_length(), blobs->length()};
        blob_peers = blobs->peers();
        input.blob_availability = compute_availability(blob_peers);
    }

    if(remote_peers.is_enabled())
    {
        input.remote_peers = remote_peers.evaluate(
            metadata_peers, blobs ? &blob_peers : nullptr);
    }
    return input;
}

namespace {

constexpr const char* unavailable = "unavailable";

std::string seconds_str(const double s)
{
    return util::format("%.2f seconds", s);
}

std::string progress_str(const stream_progress& p)
{
    return util::format("%lld / %lld (contiguous length / length)",
        static_cast<long long>(p.contiguous_length), static_cast<long long>(p.length));
}

std::string count_str(const std::optional<int64_t>& n)
{
    return n ? std::to_string(*n) : unavailable;
}

std::string exchange_str(const std::optional<message_counter>& c)
{
    if(!c) { return unavailable; }
    return util::format("%lld received / %lld transmitted",
        static_cast<long long>(c->received), static_cast<long long>(c->transmitted));
}

std::string bytes_line(const int64_t n, const std::optional<double>& per_second)
{
    return human_bytes(static_cast<double>(n)) + " ("
        + (per_second ? human_bytes(*per_second) : std::string(unavailable))
        + " / second)";
}

std::string packets_line(const std::optional<int64_t>& n,
    const std::optional<double>& per_second, const char* rate_format)
{
    if(!n) { return unavailable; }
    return std::to_string(*n) + " ("
        + (per_second ? util::format(rate_format, *per_second) : std::string(unavailable))
        + " / second)";
}

std::string availability_str(const stream_availability& a)
{
    return util::format("%lld / %lld (max remote contiguous length / max remote"
        " length, %d peer%s)",
        static_cast<long long>(a.max_remote_contiguous_length),
        static_cast<long long>(a.max_remote_length), a.num_peers,
        a.num_peers == 1 ? "" : "s");
}

void render_general(std::ostream& out, const report_input& in)
{
    out << "General\n";
    out << "  - Runtime: " << seconds_str(in.elapsed_seconds) << '\n';
    out << "  - Metadata found in: "
        << (in.metadata_found_at ? seconds_str(*in.metadata_found_at)
                                 : std::string("unknown (still connecting...)"))
        << '\n';
    out << "  - Metadata db: " << progress_str(in.metadata) << '\n';
    out << "  - Blobs core: " << (in.blobs ? progress_str(*in.blobs) : "loading")
        << '\n';
    if(in.fully_downloaded_at)
    {
        out << "  - Fully downloaded in " << seconds_str(*in.fully_downloaded_at)
            << '\n';
    }
}

void render_network(std::ostream& out, const report_input& in)
{
    const auto& t = in.snapshot.transport;
    const auto& r = in.rates;
    out << "Network\n";
    out << "  - Bytes received: " << bytes_line(t.bytes_received, r.bytes_received)
        << '\n';
    out << "  - Bytes transmitted: "
        << bytes_line(t.bytes_transmitted, r.bytes_transmitted) << '\n';
    out << "  - Packets received: "
        << packets_line(t.packets_received, r.packets_received, "%.0f") << '\n';
    out << "  - Packets transmitted: "
        << packets_line(t.packets_transmitted, r.packets_transmitted, "%.0f") << '\n';
    out << "  - Packets dropped: "
        << packets_line(t.packets_dropped, r.packets_dropped, "%.2f") << '\n';
}

void render_connection(
    std::ostream& out, const report_input& in, const report_options& options)
{
    const auto& a = in.snapshot.address;
    const auto& c = in.snapshot.connections;
    std::string address = "unknown";
    if(a.address) { address = options.show_address ? *a.address : "xxx.xxx.xxx.xxx"; }
    out << "Connection info\n";
    out << "  - Address: " << address
        << " (firewalled: " << (a.is_firewalled ? "true" : "false") << ")\n";
    out << "  - Connections:\n";
    out << "    - Attempted: " << c.attempted << '\n';
    out << "    - Opened: " << c.opened << '\n';
    out << "    - Closed: " << c.closed << '\n';
    out << "  - Connection issues:\n";
    out << "    - Retransmission timeouts: " << count_str(c.retransmission_timeouts)
        << '\n';
    out << "    - Fast recoveries: " << count_str(c.fast_recoveries) << '\n';
    out << "    - Retransmits: " << count_str(c.retransmits) << '\n';
    if(!options.show_detail) { return; }

    const auto& d = in.snapshot.discovery;
    out << "  - Punches:\n";
    out << "    - Consistent: " << count_str(d.consistent_punches) << '\n';
    out << "    - Random: " << count_str(d.random_punches) << '\n';
    out << "    - Open: " << count_str(d.open_punches) << '\n';
    out << "  - Total Queries: " << count_str(d.total_queries) << '\n';
    out << "  - DHT commands\n";
    out << "    - Ping: " << exchange_str(d.ping) << '\n';
    out << "    - Ping NAT: " << exchange_str(d.ping_nat) << '\n';
    out << "    - Down Hint: " << exchange_str(d.down_hint) << '\n';
    out << "    - Find Node: " << exchange_str(d.find_node) << '\n';
}

void render_replication(
    std::ostream& out, const report_input& in, const report_options& options)
{
    const auto& r = in.snapshot.replication;
    out << "Replication\n";
    out << "  - Hotswaps: " << r.hotswaps << '\n';
    if(!options.show_detail) { return; }
    out << "  - Messages:\n";
    for(int i = 0; i < num_message_types; ++i)
    {
        const auto type = static_cast<message_type>(i);
        out << "    - " << to_string(type) << ": " << r[type].received
            << " received / " << r[type].transmitted << " transmitted\n";
    }
}

void render_availability(std::ostream& out, const report_input& in)
{
    out << "Availability\n";
    out << "  - Metadata db: " << availability_str(in.metadata_availability) << '\n';
    out << "  - Blobs core: "
        << (in.blob_availability ? availability_str(*in.blob_availability) : "loading")
        << '\n';
}

void render_remote_peers(std::ostream& out, const remote_peer_report& report)
{
    out << "Remote peers\n";
    for(const auto& p : report.peers)
    {
        out << "  - " << p.id << ' ' << to_string(p.stream) << ": "
            << to_string(p.status) << " (" << p.contiguous_length << " / " << p.length
            << ")\n";
    }
    out << "  - " << (report.all_done ? "all done" : "not all done") << " ("
        << report.num_done << " / " << num_streams * report.num_expected
        << " done)\n";
}

} // anonymous namespace

std::string render_report(const report_input& input, const report_options& options)
{
    std::ostringstream out;
    render_general(out, input);
    render_network(out, input);
    render_connection(out, input, options);
    render_replication(out, input, options);
    render_availability(out, input);
    if(input.remote_peers) { render_remote_peers(out, *input.remote_peers); }
    return out.str();
}

} // namespace driveprof
