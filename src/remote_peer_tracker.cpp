#include "remote_peer_tracker.hpp"
#include "string_utils.hpp"
#include "id_encoding.hpp"

#include <algorithm>
#include <fstream>
#include <stdexcept>

namespace driveprof {

std::vector<peer_classification> classify(const std::vector<remote_peer_info>& peers,
    const std::vector<std::string>& expected, const stream_id stream)
{
    std::vector<peer_classification> result;
    for(const auto& id : expected)
    {
        auto it = std::find_if(peers.begin(), peers.end(),
            [&id](const auto& peer) { return peer.remote_public_key == id; });
        if(it == peers.end()) { continue; }
        peer_classification c;
        c.id = id;
        c.stream = stream;
        c.status = is_done(*it) ? replication_status::done
                                : replication_status::downloading;
        c.contiguous_length = it->remote_contiguous_length;
        c.length = it->remote_length;
        result.push_back(std::move(c));
    }
    return result;
}

remote_peer_tracker::remote_peer_tracker(std::vector<std::string> expected)
    : expected_(std::move(expected))
{}

remote_peer_report remote_peer_tracker::evaluate(
    const std::vector<remote_peer_info>& metadata_peers,
    const std::vector<remote_peer_info>* blob_peers) const
{
    remote_peer_report report;
    report.num_expected = expected_.size();
    if(!is_enabled()) { return report; }

    report.peers = classify(metadata_peers, expected_, stream_id::metadata);
    if(blob_peers)
    {
        auto blobs = classify(*blob_peers, expected_, stream_id::blobs);
        report.peers.insert(report.peers.end(),
            std::make_move_iterator(blobs.begin()), std::make_move_iterator(blobs.end()));
    }

    report.num_done = std::count_if(report.peers.begin(), report.peers.end(),
        [](const auto& p) { return p.status == replication_status::done; });
    report.all_done = report.num_done == num_streams * report.num_expected;
    return report;
}

std::vector<std::string> parse_expected_peers(std::istream& in)
{
    std::vector<std::string> peers;
    std::string line;
    int line_number = 0;
    while(std::getline(in, line))
    {
        ++line_number;
        util::trim(line);
        if(line.empty() || line[0] == '#') { continue; }
        std::string id;
        try
        {
            id = id_encoding::normalize(line);
        }
        catch(const std::invalid_argument& e)
        {
            throw std::invalid_argument("remote peer list line "
                + std::to_string(line_number) + ": " + e.what());
        }
        if(std::find(peers.begin(), peers.end(), id) == peers.end())
        {
            peers.push_back(std::move(id));
        }
    }
    return peers;
}

std::vector<std::string> load_expected_peers(const path& file)
{
    std::ifstream in(file);
    if(!in.is_open())
    {
        throw std::invalid_argument(
            "could not open remote peer list " + file.string());
    }
    return parse_expected_peers(in);
}

} // namespace driveprof
