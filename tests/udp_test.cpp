#include <gtest/gtest.h>

#include <memory>
#include <sstream>

#include "fakes.h"
#include "protocol.h"
#include "udp.h"

TEST(EchoSender, PrintsAndForwards) {
    std::ostringstream out;
    auto inner = std::make_shared<RecordingSender>();
    EchoSender echo(out, inner);

    Frame f = encode_frame({0x40, 0xb0});
    echo.send(f.data(), "192.168.1.6", 8899);

    EXPECT_EQ(out.str(), "--> 40 b0 55  192.168.1.6:8899\n");
    ASSERT_EQ(inner->sent.size(), 1u);
    EXPECT_EQ(inner->sent[0].frame, f);
    EXPECT_EQ(echo.frames_sent(), 1);
}

TEST(EchoSender, DryRunOnlyPrints) {
    std::ostringstream out;
    EchoSender echo(out, nullptr);

    Frame f = encode_frame({0x42});
    echo.send(f.data(), "10.0.0.1", 50000);

    EXPECT_EQ(out.str(), "--> 42 00 55  10.0.0.1:50000  (dry run)\n");
}

TEST(UdpSender, SendsToLoopback) {
    UdpSender udp;
    Frame f = encode_frame({0x41});
    // Nothing listens there; a datagram write still succeeds.
    EXPECT_NO_THROW(udp.send(f.data(), "127.0.0.1", 8899));
}
