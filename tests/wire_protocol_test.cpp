#include <gtest/gtest.h>
#include "../libcomiconv/include/tcp_socket.hpp"
#include "../libcomiconv/include/wire_protocol.hpp"

using namespace comiconv;

TEST(WireProtocolTest, FormatCodes) {
    EXPECT_EQ(wire::format_code(ImageFormat::Avif), 'A');
    EXPECT_EQ(wire::format_code(ImageFormat::Webp), 'W');
    EXPECT_EQ(wire::format_code(ImageFormat::Png), 'P');
    EXPECT_EQ(wire::format_code(ImageFormat::Jpeg), 'J');
    EXPECT_FALSE(wire::format_code(ImageFormat::JpegXl).has_value());
    EXPECT_EQ(wire::format_from_code('W'), ImageFormat::Webp);
    EXPECT_EQ(wire::format_from_code('X'), ImageFormat::Unknown);
}

TEST(WireProtocolTest, JobHeaderLayout) {
    wire::JobHeader h;
    h.format = 'A';
    h.speed = 3;
    h.quality = 30;
    h.payload_len = 0x01020304;

    const auto buf = wire::encode_job_header(h);
    const std::array<std::uint8_t, 8> expected = {'A', 3, 30, 0, 0x01, 0x02, 0x03, 0x04};
    EXPECT_EQ(buf, expected);
}

TEST(WireProtocolTest, BigEndianCounts) {
    std::uint8_t buf[4];
    wire::put_u32_be(5, buf);
    EXPECT_EQ(buf[0], 0);
    EXPECT_EQ(buf[3], 5);
    EXPECT_EQ(wire::get_u32_be(buf), 5U);

    const std::uint8_t big[4] = {0xFF, 0, 0, 1};
    EXPECT_EQ(wire::get_u32_be(big), 0xFF000001U);
}

TEST(ServerAddressTest, ParsesHostAndPort) {
    const auto a = parse_server_address("example.org:4000");
    EXPECT_EQ(a.host, "example.org");
    EXPECT_EQ(a.port, 4000);
    EXPECT_EQ(a.to_string(), "example.org:4000");

    const auto v6 = parse_server_address("[::1]:9000");
    EXPECT_EQ(v6.host, "::1");
    EXPECT_EQ(v6.port, 9000);
}

TEST(ServerAddressTest, RejectsMalformedAddresses) {
    EXPECT_THROW((void)parse_server_address("localhost"), std::invalid_argument);
    EXPECT_THROW((void)parse_server_address(":80"), std::invalid_argument);
    EXPECT_THROW((void)parse_server_address("host:"), std::invalid_argument);
    EXPECT_THROW((void)parse_server_address("host:70000"), std::invalid_argument);
    EXPECT_THROW((void)parse_server_address("host:12ab"), std::invalid_argument);
}
