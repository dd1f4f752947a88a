#include <gtest/gtest.h>
#include <sys/socket.h>
#include <unistd.h>

#include "qrelay/common/net_utils.h"
#include "qrelay/proxy/quic_listener.h"

#include "test_certificate.h"
#include "test_utils.h"

namespace qrelay::test {

class QuicListenerTest : public ::testing::Test {
protected:
    TestCertificate certificate;
    UdpPacketConnProvider provider;

    QuicListenerSettings make_settings() {
        QuicListenerSettings settings = QuicListenerSettings::get_default();
        settings.address = "127.0.0.1:0";
        settings.server_name = "dns.example";
        settings.tls.cert_chain_file = certificate.cert_file;
        settings.tls.private_key_file = certificate.key_file;
        return settings;
    }
};

TEST_F(QuicListenerTest, NeedsTlsMaterial) {
    QuicListenerSettings settings = make_settings();
    settings.tls.cert_chain_file.clear();
    QuicListener listener(settings, make_echo_handler());
    ErrString error = listener.listen(provider);
    ASSERT_TRUE(error.has_value());
    ASSERT_EQ(QuicListener::QLS_IDLE, listener.state());
}

TEST_F(QuicListenerTest, BadCertificateFiles) {
    QuicListenerSettings settings = make_settings();
    settings.tls.cert_chain_file = ::testing::TempDir() + "qrelay_no_such_cert.pem";
    QuicListener listener(settings, make_echo_handler());
    ASSERT_TRUE(listener.listen(provider).has_value());
    ASSERT_EQ(QuicListener::QLS_IDLE, listener.state());
}

TEST_F(QuicListenerTest, NeedsHandler) {
    QuicListener listener(make_settings(), nullptr);
    ASSERT_TRUE(listener.listen(provider).has_value());
}

TEST_F(QuicListenerTest, BadAddress) {
    QuicListenerSettings settings = make_settings();
    settings.address = "127.0.0.1:port";
    QuicListener listener(settings, make_echo_handler());
    ASSERT_TRUE(listener.listen(provider).has_value());
    ASSERT_EQ(QuicListener::QLS_IDLE, listener.state());
}

TEST_F(QuicListenerTest, Lifecycle) {
    QuicListener listener(make_settings(), make_echo_handler());
    ASSERT_EQ(QuicListener::QLS_IDLE, listener.state());
    listener.stop();
    ASSERT_EQ(QuicListener::QLS_IDLE, listener.state());

    ErrString error = listener.listen(provider);
    ASSERT_FALSE(error.has_value()) << error.value();
    ASSERT_EQ(QuicListener::QLS_LISTENING, listener.state());
    ASSERT_NE(0, listener.local_address().port());

    ASSERT_TRUE(listener.listen(provider).has_value());

    listener.stop();
    ASSERT_EQ(QuicListener::QLS_CLOSED, listener.state());
    listener.stop();
    ASSERT_TRUE(listener.listen(provider).has_value());
    ASSERT_EQ(0u, listener.sessions());
}

TEST_F(QuicListenerTest, AnswersUnknownVersionWithNegotiation) {
    QuicListener listener(make_settings(), make_echo_handler());
    ErrString error = listener.listen(provider);
    ASSERT_FALSE(error.has_value()) << error.value();

    int fd = ::socket(AF_INET, SOCK_DGRAM, 0);
    ASSERT_NE(-1, fd);
    utils::ScopeExit close_fd([fd] {
        ::close(fd);
    });
    timeval tv = utils::duration_to_timeval(Secs(2));
    ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

    // Long header Initial-like packet with an unknown version, padded to the minimum datagram size
    Uint8Vector packet(1200, 0);
    packet[0] = 0xc0;
    packet[1] = 0x1a;
    packet[2] = 0x2a;
    packet[3] = 0x3a;
    packet[4] = 0x4a;
    packet[5] = 8;
    for (int i = 0; i < 8; ++i) {
        packet[6 + i] = 0x10 + i;
    }
    packet[14] = 8;
    for (int i = 0; i < 8; ++i) {
        packet[15 + i] = 0x20 + i;
    }
    const SocketAddress &to = listener.local_address();
    ASSERT_EQ((ssize_t) packet.size(),
            ::sendto(fd, packet.data(), packet.size(), 0, to.c_sockaddr(), to.c_socklen()));

    uint8_t reply[1500];
    ssize_t r = ::recv(fd, reply, sizeof(reply), 0);
    ASSERT_GT(r, 7);
    ASSERT_TRUE(reply[0] & 0x80);
    // Version 0 marks a version negotiation packet
    ASSERT_EQ(0, reply[1] | reply[2] | reply[3] | reply[4]);
    // Its destination is the client's source connection ID
    ASSERT_EQ(8, reply[5]);
    ASSERT_EQ(0x20, reply[6]);

    ASSERT_EQ(0u, listener.sessions());
    listener.stop();
}

TEST_F(QuicListenerTest, IgnoresGarbage) {
    QuicListener listener(make_settings(), make_echo_handler());
    ErrString error = listener.listen(provider);
    ASSERT_FALSE(error.has_value()) << error.value();

    int fd = ::socket(AF_INET, SOCK_DGRAM, 0);
    ASSERT_NE(-1, fd);
    Uint8Vector junk{0x01, 0x02, 0x03};
    const SocketAddress &to = listener.local_address();
    ::sendto(fd, junk.data(), junk.size(), 0, to.c_sockaddr(), to.c_socklen());
    ::close(fd);

    ASSERT_EQ(QuicListener::QLS_LISTENING, listener.state());
    listener.stop();
    ASSERT_EQ(0u, listener.sessions());
}

} // namespace qrelay::test
