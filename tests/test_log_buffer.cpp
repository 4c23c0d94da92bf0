#include <iostream>
#include <cassert>
#include <string>
#include <vector>
#include "GranuBridge/LogBuffer.h"

using namespace GranuBridge;

void test_line_splitting()
{
    std::cout << "Testing LogBuffer line splitting..." << std::endl;

    LogBuffer buffer(100);
    const size_t stored = buffer.append(LogChannel::Stdout, "first\n\n  second  \r\n   \nthird", 42);
    assert(stored == 3);
    assert(buffer.size() == 3);

    auto entries = buffer.entries(10);
    assert(entries.size() == 3);
    assert(entries[0].line == "first");
    assert(entries[1].line == "second");
    assert(entries[2].line == "third");
    assert(entries[2].timestampMs == 42);
    assert(entries[2].channel == LogChannel::Stdout);

    assert(buffer.append(LogChannel::Stderr, "   \n\n", 43) == 0);
    assert(buffer.size() == 3);

    std::cout << "LogBuffer line splitting tests passed." << std::endl;
}

void test_capacity()
{
    std::cout << "Testing LogBuffer capacity..." << std::endl;

    // Limits are bounded to [50, 2000]
    assert(LogBuffer(1).limit() == LogBuffer::kMinLimit);
    assert(LogBuffer(100000).limit() == LogBuffer::kMaxLimit);
    assert(LogBuffer().limit() == LogBuffer::kDefaultLimit);

    LogBuffer buffer(50);
    for (int i = 0; i < 120; ++i)
    {
        buffer.append(LogChannel::System, "line " + std::to_string(i), i);
    }
    assert(buffer.size() == 50);

    auto entries = buffer.entries(5);
    assert(entries.size() == 5);
    assert(entries.front().line == "line 115");
    assert(entries.back().line == "line 119");

    auto all = buffer.entries(1000);
    assert(all.size() == 50);
    assert(all.front().line == "line 70");

    buffer.clear();
    assert(buffer.size() == 0);
    assert(buffer.entries(10).empty());

    std::cout << "LogBuffer capacity tests passed." << std::endl;
}

void test_listeners()
{
    std::cout << "Testing LogBuffer listeners..." << std::endl;

    LogBuffer buffer;
    std::vector<std::string> seen;
    const int id = buffer.addListener([&seen](const LogEntry &entry)
                                      { seen.push_back(logChannelToString(entry.channel) + ":" + entry.line); });

    buffer.append(LogChannel::Stderr, "oops\nagain", 1);
    assert(seen.size() == 2);
    assert(seen[0] == "stderr:oops");
    assert(seen[1] == "stderr:again");

    buffer.removeListener(id);
    buffer.append(LogChannel::Stdout, "quiet", 2);
    assert(seen.size() == 2);

    nlohmann::json j = buffer.entries(1).front();
    assert(j["line"] == "quiet");
    assert(j["channel"] == "stdout");
    assert(j["timestampMs"] == 2);

    std::cout << "LogBuffer listener tests passed." << std::endl;
}

void test_unsubscribe_during_notify()
{
    std::cout << "Testing LogBuffer unsubscribe during notify..." << std::endl;

    LogBuffer buffer;
    int onceCalls = 0;
    int steadyCalls = 0;
    int onceId = 0;
    onceId = buffer.addListener([&](const LogEntry &)
                                {
                                    ++onceCalls;
                                    buffer.removeListener(onceId); });
    buffer.addListener([&steadyCalls](const LogEntry &)
                       { ++steadyCalls; });

    assert(buffer.append(LogChannel::System, "first\nsecond\nthird", 5) == 3);
    assert(onceCalls == 1);
    assert(steadyCalls == 3);

    buffer.append(LogChannel::System, "fourth", 6);
    assert(onceCalls == 1);
    assert(steadyCalls == 4);

    std::cout << "LogBuffer unsubscribe during notify tests passed." << std::endl;
}

int main()
{
    std::cout << "Running LogBuffer tests..." << std::endl;

    try
    {
        test_line_splitting();
        test_capacity();
        test_listeners();
        test_unsubscribe_during_notify();

        std::cout << "All tests passed!" << std::endl;
        return 0;
    }
    catch (const std::exception &e)
    {
        std::cerr << "Exception: " << e.what() << std::endl;
    }

    return 1;
}
