#include <gtest/gtest.h>
#include "driveprof/log.hpp"
#include "tcp_connection.hpp"

#include <array>
#include <iostream>
#include <memory>

#include <asio/io_context.hpp>
#include <asio/ip/address.hpp>

using namespace driveprof;
using asio::ip::tcp;

TEST(EndpointTest, Ipv4IsMappedOnTheWire)
{
    std::array<uint8_t, endpoint_size> buffer;
    write_endpoint(buffer.data(), tcp::endpoint(asio::ip::make_address("10.1.2.3"), 443));

    const std::array<uint8_t, endpoint_size> expected = {
        0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0xff, 0xff, 10, 1, 2, 3, 0x01, 0xbb};
    EXPECT_EQ(buffer, expected);

    const auto endpoint = read_endpoint(buffer.data());
    EXPECT_TRUE(endpoint.address().is_v4());
    EXPECT_EQ(endpoint.address().to_string(), "10.1.2.3");
    EXPECT_EQ(endpoint.port(), 443);
}

TEST(EndpointTest, Ipv6IsKept)
{
    std::array<uint8_t, endpoint_size> buffer;
    write_endpoint(buffer.data(),
        tcp::endpoint(asio::ip::make_address("2001:db8::7"), 50000));
    const auto endpoint = read_endpoint(buffer.data());
    EXPECT_TRUE(endpoint.address().is_v6());
    EXPECT_EQ(endpoint.address().to_string(), "2001:db8::7");
    EXPECT_EQ(endpoint.port(), 50000);
}

TEST(EndpointTest, UnknownEndpointIsUnspecified)
{
    std::array<uint8_t, endpoint_size> buffer;
    buffer.fill(0xaa);
    write_endpoint(buffer.data(), tcp::endpoint());
    EXPECT_TRUE(read_endpoint(buffer.data()).address().is_unspecified());
}

TEST(TcpConnectionTest, HandshakeTellsEachEndItsObservedAddress)
{
    log::set_stream(nullptr);
    asio::io_context ios;
    tcp::acceptor acceptor(ios, tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0));
    tcp::socket client_socket(ios);
    client_socket.connect(acceptor.local_endpoint());
    tcp::socket server_socket = acceptor.accept();

    auto counters = std::make_shared<tcp_connection::byte_counters>();
    public_key_type client_key;
    public_key_type server_key;
    client_key.fill(1);
    server_key.fill(2);
    key_type topic;
    topic.fill(5);

    auto client = std::make_shared<tcp_connection>(
        std::move(client_socket), counters, client_key);
    auto server = std::make_shared<tcp_connection>(
        std::move(server_socket), counters, server_key);
    EXPECT_TRUE(client->observed_address().empty());

    int num_done = 0;
    error_code client_error = make_error_code(std::errc::io_error);
    error_code server_error = make_error_code(std::errc::io_error);
    client->start_outbound_handshake(topic, seconds(5), [&](const error_code& error)
        {
            client_error = error;
            ++num_done;
        });
    server->start_inbound_handshake([&](const key_type& t) { return t == topic; },
        seconds(5), [&](const error_code& error)
        {
            server_error = error;
            ++num_done;
        });
    ios.run_for(seconds(5));

    ASSERT_EQ(num_done, 2);
    EXPECT_FALSE(client_error) << client_error.message();
    EXPECT_FALSE(server_error) << server_error.message();
    EXPECT_EQ(client->remote_public_key(), server_key);
    EXPECT_EQ(server->remote_public_key(), client_key);
    EXPECT_EQ(server->topic(), topic);
    EXPECT_EQ(client->observed_address(), "127.0.0.1");
    EXPECT_EQ(server->observed_address(), "127.0.0.1");
    EXPECT_EQ(counters->received, 2 * swarm_handshake_size);

    client->close();
    server->close();
    ios.restart();
    ios.run_for(seconds(1));
    log::set_stream(&std::cout);
}
