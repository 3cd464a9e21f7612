#include <gtest/gtest.h>
#include "metamcp/transport/stdio_transport.hpp"
#include "metamcp/codec.hpp"
#include "metamcp/error.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <chrono>
#include <thread>
#include <vector>

using namespace metamcp;
using namespace std::chrono_literals;

namespace {

/// Pipes around a transport: the test writes to `input` and reads `output`.
class PipeHarness {
public:
    PipeHarness() {
        if (::pipe(in_) < 0 || ::pipe(out_) < 0) throw std::runtime_error("pipe failed");
    }
    ~PipeHarness() {
        for (int fd : {in_[1], out_[0]}) {
            if (fd >= 0) ::close(fd);
        }
    }

    std::unique_ptr<StdioTransport> make_transport() {
        // Transport owns its ends
        auto t = std::make_unique<StdioTransport>(in_[0], out_[1]);
        in_[0] = -1;
        out_[1] = -1;
        return t;
    }

    void write_input(const std::string& data) {
        ASSERT_EQ(::write(in_[1], data.data(), data.size()), static_cast<ssize_t>(data.size()));
    }

    void close_input() {
        ::close(in_[1]);
        in_[1] = -1;
    }

    /// Read whole lines until `count` are available or the writer closes.
    std::vector<std::string> read_lines(size_t count) {
        std::vector<std::string> lines;
        std::string buffer;
        char chunk[1024];
        while (lines.size() < count) {
            ssize_t n = ::read(out_[0], chunk, sizeof(chunk));
            if (n <= 0) break;
            buffer.append(chunk, static_cast<size_t>(n));
            size_t nl;
            while ((nl = buffer.find('\n')) != std::string::npos) {
                lines.push_back(buffer.substr(0, nl));
                buffer.erase(0, nl + 1);
            }
        }
        return lines;
    }

private:
    int in_[2]{-1, -1};
    int out_[2]{-1, -1};
};

} // namespace

TEST(StdioTransport, NotConnectedBeforeStart) {
    PipeHarness pipes;
    auto t = pipes.make_transport();
    EXPECT_FALSE(t->is_connected());
}

TEST(StdioTransport, ShutdownBeforeStartReturnsImmediately) {
    PipeHarness pipes;
    auto t = pipes.make_transport();
    t->shutdown();
    t->start([](JsonRpcMessage) { FAIL() << "no messages expected"; });
    EXPECT_FALSE(t->is_connected());
    EXPECT_THROW(t->send(make_error_response(RequestId{int64_t{1}}, -1, "x")), McpTransportError);
}

TEST(StdioTransport, ReadsLinesUntilEndOfInput) {
    PipeHarness pipes;
    auto t = pipes.make_transport();

    pipes.write_input("{\"id\":1,\"method\":\"tools/list\"}\n"
                      "\r\n"
                      "{\"id\":2,\"method\":\"tools/call\",\"params\":{\"name\":\"x\"}}\r\n"
                      "{\"method\":\"notifications/initialized\"}");
    pipes.close_input();

    std::vector<JsonRpcMessage> received;
    t->start([&](JsonRpcMessage msg) { received.push_back(std::move(msg)); });

    ASSERT_EQ(received.size(), 3u);
    EXPECT_EQ(std::get<JsonRpcRequest>(received[0]).method, "tools/list");
    EXPECT_EQ(std::get<int64_t>(std::get<JsonRpcRequest>(received[1]).id), 2);
    // The final line had no newline but still counts
    EXPECT_TRUE(std::holds_alternative<JsonRpcNotification>(received[2]));
    EXPECT_FALSE(t->is_connected());
}

TEST(StdioTransport, MalformedLinesAreDropped) {
    PipeHarness pipes;
    auto t = pipes.make_transport();

    pipes.write_input("not json at all\n"
                      "{\"id\":1,\"method\":\"tools/list\"\n"
                      "[1,2]\n"
                      "{\"id\":7,\"method\":\"tools/list\"}\n");
    pipes.close_input();

    std::vector<JsonRpcMessage> received;
    int errors = 0;
    t->start([&](JsonRpcMessage msg) { received.push_back(std::move(msg)); },
             [&](std::exception_ptr) { ++errors; });

    ASSERT_EQ(received.size(), 1u);
    EXPECT_EQ(std::get<int64_t>(std::get<JsonRpcRequest>(received[0]).id), 7);
    EXPECT_EQ(errors, 3);
}

TEST(StdioTransport, ResponsesAreWrittenOnePerLine) {
    PipeHarness pipes;
    auto t = pipes.make_transport();

    pipes.write_input("{\"id\":1,\"method\":\"a\"}\n{\"id\":2,\"method\":\"b\"}\n");
    pipes.close_input();

    t->start([&](JsonRpcMessage msg) {
        auto& req = std::get<JsonRpcRequest>(msg);
        JsonRpcResponse resp;
        resp.id = req.id;
        resp.result = nlohmann::json{{"method", req.method}};
        t->send(resp);
    });
    t.reset();  // flushes and closes the write end

    auto lines = pipes.read_lines(2);
    ASSERT_EQ(lines.size(), 2u);
    auto first = nlohmann::json::parse(lines[0]);
    EXPECT_EQ(first.at("id"), 1);
    EXPECT_EQ(first.at("result").at("method"), "a");
    EXPECT_EQ(nlohmann::json::parse(lines[1]).at("id"), 2);
}

TEST(StdioTransport, ShutdownUnblocksReader) {
    PipeHarness pipes;
    auto t = pipes.make_transport();

    std::thread reader([&] { t->start([](JsonRpcMessage) {}); });
    for (int i = 0; i < 200 && !t->is_connected(); ++i) std::this_thread::sleep_for(5ms);
    EXPECT_TRUE(t->is_connected());

    t->shutdown();
    reader.join();
    EXPECT_FALSE(t->is_connected());
}

TEST(StdioTransport, BorrowedDescriptorsStayOpen) {
    int fds[2];
    ASSERT_EQ(::pipe(fds), 0);
    {
        StdioTransport t(fds[0], fds[1], false);
        t.shutdown();
    }
    EXPECT_NE(::fcntl(fds[0], F_GETFD), -1);
    EXPECT_NE(::fcntl(fds[1], F_GETFD), -1);
    ::close(fds[0]);
    ::close(fds[1]);
}
