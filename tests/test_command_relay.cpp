#include <iostream>
#include <cassert>
#include <string>
#include <vector>
#include "GranuBridge/CommandRelay.h"

using namespace GranuBridge;

namespace
{
    struct SentMessage
    {
        std::string address;
        std::vector<NormalizedArgument> args;
    };

    // In-memory transport recording every datagram
    class FakeTransport : public IOscTransport
    {
    public:
        bool open(const std::string &host, int port, std::string &error) override
        {
            ++openCount;
            if (failOpen)
            {
                error = "unreachable";
                ready = false;
                return false;
            }
            this->host = host;
            this->port = port;
            ready = true;
            return true;
        }

        void close() override { ready = false; }
        bool isReady() const override { return ready; }

        bool send(const std::string &address, const std::vector<NormalizedArgument> &args,
                  std::string &error) override
        {
            if (failSend)
            {
                error = "socket_error";
                return false;
            }
            sent.push_back(SentMessage{address, args});
            return true;
        }

        bool ready = false;
        bool failOpen = false;
        bool failSend = false;
        int openCount = 0;
        std::string host;
        int port = 0;
        std::vector<SentMessage> sent;
    };

    RelayConfig makeConfig(int rate = 60)
    {
        RelayConfig config;
        config.targetHost = "127.0.0.1";
        config.targetPort = 16447;
        config.channelPrefix = "/pose/out/";
        config.channelCount = 16;
        config.maxMessagesPerSecond = rate;
        return config;
    }
}

void test_not_ready()
{
    std::cout << "Testing relay readiness..." << std::endl;

    FakeTransport transport;
    ManualScheduler scheduler;
    CommandRelay relay(makeConfig(), transport, scheduler);

    SendResult result = relay.sendChannel(1, 0.5);
    assert(!result.sent);
    assert(result.error == "transport_not_ready");
    assert(transport.sent.empty());

    transport.failOpen = true;
    assert(!relay.open());
    assert(relay.lastError() == "unreachable");

    transport.failOpen = false;
    assert(relay.configure("10.0.0.2", 9000));
    assert(transport.host == "10.0.0.2");
    assert(transport.port == 9000);
    assert(relay.isReady());

    std::cout << "Relay readiness tests passed." << std::endl;
}

void test_channel_send()
{
    std::cout << "Testing channel sends..." << std::endl;

    FakeTransport transport;
    ManualScheduler scheduler;
    CommandRelay relay(makeConfig(), transport, scheduler);
    assert(relay.open());

    // Trailing slash removed from the prefix, channel zero-padded
    assert(relay.channelAddress(3) == "/pose/out/03");

    SendResult result = relay.sendChannel(3, 0.75);
    assert(result.sent);
    assert(result.address == "/pose/out/03");
    assert(*result.channel == 3);
    assert(*result.value == 0.75);
    assert(transport.sent.size() == 1);
    assert(transport.sent[0].address == "/pose/out/03");
    assert(std::get<float>(transport.sent[0].args[0]) == 0.75f);

    // Out-of-range channels and values are clamped
    scheduler.advance(100);
    result = relay.sendChannel(99, 4.0);
    assert(result.sent);
    assert(result.address == "/pose/out/16");
    assert(*result.channel == 16);
    assert(*result.value == 1.0);

    scheduler.advance(100);
    result = relay.sendChannel(-4, -1.0);
    assert(result.address == "/pose/out/01");
    assert(*result.value == 0.0);

    nlohmann::json j = result;
    assert(j["sent"] == true);
    assert(j["address"] == "/pose/out/01");
    assert(j["channel"] == 1);
    assert(!j.contains("error"));

    std::cout << "Channel send tests passed." << std::endl;
}

void test_rate_limiting()
{
    std::cout << "Testing relay rate limiting..." << std::endl;

    FakeTransport transport;
    ManualScheduler scheduler;
    CommandRelay relay(makeConfig(60), transport, scheduler);
    assert(relay.open());

    // 100 updates on one channel, 10 ms apart
    int sent = 0;
    int dropped = 0;
    for (int i = 0; i < 100; ++i)
    {
        SendResult result = relay.sendChannel(1, 0.5);
        if (result.sent)
        {
            ++sent;
        }
        else
        {
            assert(result.rateLimited);
            assert(result.error.empty());
            ++dropped;
        }
        scheduler.advance(10);
    }
    assert(sent <= 60);
    assert(dropped >= 40);
    assert(sent + dropped == 100);
    assert(relay.stats().sent == static_cast<std::uint64_t>(sent));
    assert(relay.stats().droppedRateLimited == static_cast<std::uint64_t>(dropped));

    // Another channel has its own budget
    assert(relay.sendChannel(2, 0.1).sent);

    // Explicit keys share a budget across addresses
    CommandRequest a{"/param/a", {}, std::string("shared")};
    CommandRequest b{"/param/b", {}, std::string("shared")};
    scheduler.advance(1000);
    assert(relay.send(a).sent);
    assert(relay.send(b).rateLimited);

    // Without a key the address is the key; an empty key counts as none
    CommandRequest c{"/param/c", {}, std::string()};
    CommandRequest d{"/param/d", {}, std::nullopt};
    assert(relay.send(c).sent);
    assert(relay.send(d).sent);
    assert(relay.send(d).rateLimited);

    std::cout << "Relay rate limiting tests passed." << std::endl;
}

void test_validation()
{
    std::cout << "Testing relay validation..." << std::endl;

    FakeTransport transport;
    ManualScheduler scheduler;
    CommandRelay relay(makeConfig(0), transport, scheduler);
    assert(relay.open());

    SendResult result = relay.send(CommandRequest{"no-slash", {}, std::nullopt});
    assert(!result.sent);
    assert(result.error == "invalid_address");

    result = relay.send(CommandRequest{"/x", {CommandArgument{'q', 1.0}}, std::nullopt});
    assert(result.error == "invalid_arg");

    result = relay.send(CommandRequest{"/x", {CommandArgument{'f', std::string("abc")}}, std::nullopt});
    assert(result.error == "invalid_arg");

    result = relay.send(CommandRequest{"/x", {CommandArgument{'i', 1e12}}, std::nullopt});
    assert(result.error == "invalid_arg");
    assert(relay.stats().rejectedValidation == 4);
    assert(transport.sent.empty());

    // Normalisation by type tag
    result = relay.send(CommandRequest{"/grain/params",
                                       {CommandArgument{'i', 7.9}, CommandArgument{'f', std::string("0.5")},
                                        CommandArgument{'d', 2.0}, CommandArgument{'s', 3.0},
                                        CommandArgument{'s', std::string("name")}},
                                       std::nullopt});
    assert(result.sent);
    const auto &args = transport.sent.back().args;
    assert(std::get<std::int32_t>(args[0]) == 7);
    assert(std::get<float>(args[1]) == 0.5f);
    assert(std::get<double>(args[2]) == 2.0);
    assert(std::get<std::string>(args[3]) == "3");
    assert(std::get<std::string>(args[4]) == "name");

    std::cout << "Relay validation tests passed." << std::endl;
}

void test_send_failure_and_batches()
{
    std::cout << "Testing relay failures and batches..." << std::endl;

    FakeTransport transport;
    ManualScheduler scheduler;
    CommandRelay relay(makeConfig(60), transport, scheduler);
    assert(relay.open());

    transport.failSend = true;
    SendResult result = relay.sendChannel(1, 0.2);
    assert(!result.sent);
    assert(result.error == "socket_error");
    assert(relay.stats().transportErrors == 1);
    // Readiness is cleared until the transport is re-opened
    assert(!relay.isReady());
    assert(relay.sendChannel(2, 0.2).error == "transport_not_ready");

    transport.failSend = false;
    assert(relay.open());

    // Duplicate channels in one batch are rate limited against each other
    BatchResult batch = relay.sendChannelBatch({{4, 0.1}, {4, 0.2}, {5, 0.3}});
    assert(batch.total == 3);
    assert(batch.sentCount == 2);
    assert(batch.droppedCount == 1);
    assert(batch.results.size() == 3);
    assert(batch.results[1].rateLimited);

    // Invalid items are neither sent nor counted as dropped
    batch = relay.sendBatch({CommandRequest{"/a", {}, std::nullopt}, CommandRequest{"bad", {}, std::nullopt}});
    assert(batch.total == 2);
    assert(batch.sentCount == 1);
    assert(batch.droppedCount == 0);
    assert(batch.results[1].error == "invalid_address");

    nlohmann::json j = batch;
    assert(j["total"] == 2);
    assert(j["results"].size() == 2);

    std::cout << "Relay failure and batch tests passed." << std::endl;
}

int main()
{
    std::cout << "Running CommandRelay tests..." << std::endl;

    try
    {
        test_not_ready();
        test_channel_send();
        test_rate_limiting();
        test_validation();
        test_send_failure_and_batches();

        std::cout << "All tests passed!" << std::endl;
        return 0;
    }
    catch (const std::exception &e)
    {
        std::cerr << "Exception: " << e.what() << std::endl;
    }

    return 1;
}
