// ReceiverApp over real loopback TCP

#include <gtest/gtest.h>

#include "common/digest.hpp"
#include "common/protocol_io.hpp"
#include "common/socket.hpp"
#include "receiver/receiver_app.hpp"
#include "sender/sender_app.hpp"
#include "test_support.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace testing_support;
using namespace std::chrono_literals;

class ReceiverAppTest : public ::testing::Test {
protected:
    virtual int max_sessions() const { return 0; }

    void SetUp() override {
        ReceiverConfig cfg;
        cfg.listen       = Endpoint{"127.0.0.1", 0};
        cfg.dest_dir     = dst_.path().string();
        cfg.max_sessions = max_sessions();
        observer_ = std::make_shared<RecordingObserver>();
        app_ = std::make_unique<ReceiverApp>(cfg, observer_);
        app_->bind();
        port_ = app_->bound_port();
        server_ = std::thread([this] {
            serve_rc_ = app_->serve();
            served_ = true;
        });
    }

    void TearDown() override {
        app_->stop();
        if (server_.joinable()) server_.join();
    }

    // Plays the sender by hand. The name goes out alone and the rest only
    // after the receiver has created the destination, so the name read
    // cannot pick up size bytes.
    void send_raw(const std::string& name, const std::vector<u8>& payload,
                  u64 announced_size, bool with_trailer) {
        TcpSocket sock;
        sock.connect("127.0.0.1", port_);
        sock.send_all(name.data(), name.size());
        ASSERT_TRUE(wait_for_file(dst_ / name)) << "receiver never opened " << name;

        u8 size_buf[SIZE_FIELD_LEN];
        proto::put_be64(announced_size, size_buf);
        sock.send_all(size_buf, sizeof(size_buf));
        if (!payload.empty()) sock.send_all(payload.data(), payload.size());
        if (with_trailer) {
            Digest d = digest::sha256(payload.data(), payload.size());
            sock.send_all(d.data(), d.size());
        }
        sock.close();
    }

    static bool wait_for_file(const fs::path& p) {
        for (int i = 0; i < 500; ++i) {
            std::error_code ec;
            if (fs::exists(p, ec)) return true;
            std::this_thread::sleep_for(10ms);
        }
        return false;
    }

    template <typename Pred>
    static bool wait_until(Pred pred) {
        for (int i = 0; i < 500; ++i) {
            if (pred()) return true;
            std::this_thread::sleep_for(10ms);
        }
        return false;
    }

    TempDir                            dst_;
    std::shared_ptr<RecordingObserver> observer_;
    std::unique_ptr<ReceiverApp>       app_;
    std::thread                        server_;
    u16                                port_{0};
    int                                serve_rc_{-1};
    std::atomic<bool>                  served_{false};
};

class BoundedReceiverAppTest : public ReceiverAppTest {
protected:
    int max_sessions() const override { return 1; }
};

TEST_F(ReceiverAppTest, BindsEphemeralPort) {
    EXPECT_NE(port_, 0);
}

TEST_F(ReceiverAppTest, ReceivesAndVerifiesFile) {
    std::vector<u8> data = make_payload(256 * 1024);
    send_raw("a.bin", data, data.size(), true);

    ASSERT_TRUE(observer_->wait_for_results(1));
    TransferResult r = observer_->results()[0];
    ASSERT_TRUE(r.ok()) << r.error;
    EXPECT_EQ(r.file_name, "a.bin");
    EXPECT_TRUE(r.outcome->integrity_verified);
    EXPECT_EQ(r.outcome->bytes_transferred, data.size());
    EXPECT_EQ(read_file(dst_ / "a.bin"), data);
}

TEST_F(ReceiverAppTest, KeepsServingAfterFailedSession) {
    std::vector<u8> partial = make_payload(40);
    send_raw("broken.bin", partial, 100, false);
    ASSERT_TRUE(observer_->wait_for_results(1));
    TransferResult failed = observer_->results()[0];
    EXPECT_EQ(failed.state, SessionState::FAILED);
    EXPECT_EQ(failed.error_kind, ErrorKind::SHORT_TRANSFER);
    EXPECT_EQ(failed.bytes_transferred, 40u);
    EXPECT_EQ(read_file(dst_ / "broken.bin"), partial);

    std::vector<u8> data = make_payload(1000, 7);
    send_raw("after.bin", data, data.size(), true);
    ASSERT_TRUE(observer_->wait_for_results(2));
    TransferResult ok = observer_->results()[1];
    ASSERT_TRUE(ok.ok()) << ok.error;
    EXPECT_EQ(read_file(dst_ / "after.bin"), data);
    EXPECT_EQ(app_->sessions_started(), 2u);
}

TEST_F(ReceiverAppTest, ImmediateDisconnectIsReportedAndIgnored) {
    {
        TcpSocket sock;
        sock.connect("127.0.0.1", port_);
    }
    ASSERT_TRUE(observer_->wait_for_results(1));
    EXPECT_EQ(observer_->results()[0].error_kind, ErrorKind::PROTOCOL);
}

TEST_F(ReceiverAppTest, ConcurrentSessionsAreIndependent) {
    std::vector<std::thread> senders;
    std::vector<std::vector<u8>> payloads;
    for (int i = 0; i < 4; ++i) payloads.push_back(make_payload(50000 + i, (u32)i + 3));
    for (int i = 0; i < 4; ++i) {
        senders.emplace_back([this, i, &payloads] {
            send_raw("c" + std::to_string(i) + ".bin", payloads[i], payloads[i].size(), true);
        });
    }
    for (auto& t : senders) t.join();

    ASSERT_TRUE(observer_->wait_for_results(4));
    for (const auto& r : observer_->results()) EXPECT_TRUE(r.ok()) << r.error;
    for (int i = 0; i < 4; ++i) {
        EXPECT_EQ(read_file(dst_ / ("c" + std::to_string(i) + ".bin")), payloads[i]);
    }
}

TEST_F(ReceiverAppTest, StopEndsServe) {
    app_->stop();
    server_.join();
    EXPECT_EQ(serve_rc_, 0);
}

TEST_F(ReceiverAppTest, RepeatedStopCallsAreHarmless) {
    std::vector<std::thread> stoppers;
    for (int i = 0; i < 4; ++i) stoppers.emplace_back([this] { app_->stop(); });
    for (auto& t : stoppers) t.join();
    server_.join();
    EXPECT_EQ(serve_rc_, 0);
}

// Over real TCP the receiver's single name read may also pick up the size
// bytes. The sender cannot tell. Each file must then either arrive intact
// under its own name or fail as a short transfer; never a wrong file
// reported as success.
TEST_F(ReceiverAppTest, SenderAppOverTcpDeliversIntactOrFailsShort) {
    TempDir src;
    std::vector<std::string> paths;
    std::vector<std::string> names;
    for (int i = 0; i < 3; ++i) {
        std::string name = "t" + std::to_string(i) + ".bin";
        write_file(src / name, std::vector<u8>(4096, (u8)('A' + i)));
        paths.push_back((src / name).string());
        names.push_back(name);
    }

    SenderConfig cfg;
    cfg.target = Endpoint{"127.0.0.1", port_};
    SenderApp sender(cfg);
    std::vector<TransferResult> sent = sender.send_all(paths);
    ASSERT_EQ(sent.size(), paths.size());
    for (const auto& r : sent) EXPECT_TRUE(r.ok()) << r.error;

    ASSERT_TRUE(observer_->wait_for_results(paths.size()));
    for (const auto& r : observer_->results()) {
        if (r.ok()) {
            auto it = std::find(names.begin(), names.end(), r.file_name);
            ASSERT_NE(it, names.end()) << r.file_name;
            EXPECT_TRUE(r.outcome->integrity_verified);
            EXPECT_EQ(read_file(dst_ / r.file_name),
                      read_file(paths[(size_t)(it - names.begin())]));
        } else {
            EXPECT_EQ(r.error_kind, ErrorKind::SHORT_TRANSFER) << r.error;
        }
    }
}

TEST_F(BoundedReceiverAppTest, StopWakesConnectionWaitingForAdmission) {
    // Takes the only slot: the session waits for a name that never comes
    TcpSocket holder;
    holder.connect("127.0.0.1", port_);
    ASSERT_TRUE(wait_until([this] { return app_->sessions_started() == 1; }));

    // Accepted, then held in admission
    TcpSocket waiting;
    waiting.connect("127.0.0.1", port_);
    std::this_thread::sleep_for(200ms);
    EXPECT_EQ(app_->sessions_started(), 1u);

    app_->stop();
    ASSERT_TRUE(wait_until([this] { return served_.load(); }))
        << "serve() still blocked after stop()";
    server_.join();
    EXPECT_EQ(serve_rc_, 0);
    EXPECT_EQ(app_->sessions_started(), 1u);

    // The waiting connection is dropped without a session
    char b;
    EXPECT_EQ(waiting.recv_some(&b, 1), 0u);

    // The running session is left to finish on its own
    holder.close();
    ASSERT_TRUE(observer_->wait_for_results(1));
    EXPECT_EQ(observer_->results()[0].error_kind, ErrorKind::PROTOCOL);
}

TEST(ReceiverBackoffTest, AcceptRetryDelayDoublesUpToOneSecond) {
    using ms = std::chrono::milliseconds;
    EXPECT_EQ(ReceiverApp::accept_retry_delay(0), ms(0));
    EXPECT_EQ(ReceiverApp::accept_retry_delay(1), ms(10));
    EXPECT_EQ(ReceiverApp::accept_retry_delay(2), ms(20));
    EXPECT_EQ(ReceiverApp::accept_retry_delay(4), ms(80));
    EXPECT_EQ(ReceiverApp::accept_retry_delay(7), ms(640));
    EXPECT_EQ(ReceiverApp::accept_retry_delay(8), ms(1000));
    EXPECT_EQ(ReceiverApp::accept_retry_delay(1000), ms(1000));
}
