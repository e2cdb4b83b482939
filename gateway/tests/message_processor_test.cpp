
#include "message_processor.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>
#include <thread>
#include <vector>

namespace {

uint64_t sum_by_client(const GatewayStats& stats) {
    uint64_t sum = 0;
    for (auto client : kAllClientTypes) {
        sum += stats.messages_for(client);
    }
    return sum;
}

}

class MessageProcessorTest : public ::testing::Test {
protected:
    CountingGenerator generator;
    MessageProcessor processor{generator};
};

TEST_F(MessageProcessorTest, ResponseCorrelatesWithMessage) {
    for (auto client : kAllClientTypes) {
        CanonicalMessage message = make_message(client, "hello");
        CanonicalResponse response = processor.process(message);

        EXPECT_EQ(response.message_id, message.id());
        EXPECT_EQ(response.client_type, client);
        EXPECT_EQ(response.response_type, MessageType::TEXT);
        EXPECT_FALSE(response.error.has_value());
    }
}

TEST_F(MessageProcessorTest, TextIsAnsweredByGenerator) {
    CanonicalResponse response = processor.process(make_message(ClientType::WEB, "what time is it"));

    EXPECT_EQ(response.content, "reply: what time is it");
    EXPECT_EQ(generator.calls.load(), 1);
}

TEST_F(MessageProcessorTest, CountsPerClientAndTotal) {
    processor.process(make_message(ClientType::TELEGRAM, "a"));
    processor.process(make_message(ClientType::WEB, "b"));
    processor.process(make_message(ClientType::WEB, "c"));
    processor.process(make_message(ClientType::CLI, "d"));

    GatewayStats stats = processor.get_stats();
    EXPECT_EQ(stats.total_messages, 4u);
    EXPECT_EQ(stats.messages_for(ClientType::TELEGRAM), 1u);
    EXPECT_EQ(stats.messages_for(ClientType::WEB), 2u);
    EXPECT_EQ(stats.messages_for(ClientType::CLI), 1u);
    EXPECT_EQ(sum_by_client(stats), stats.total_messages);
    EXPECT_EQ(stats.errors, 0u);
}

TEST_F(MessageProcessorTest, StartGreetsByNameOrId) {
    CanonicalMessage named("m1", ClientType::TELEGRAM, MessageType::COMMAND, "/start", "42",
                           std::string("Alice"), Clock::now());
    EXPECT_NE(processor.process(named).content.find("Hello, Alice!"), std::string::npos);

    CanonicalMessage anonymous = make_message(ClientType::TELEGRAM, "/start", MessageType::COMMAND, "42");
    EXPECT_NE(processor.process(anonymous).content.find("Hello, 42!"), std::string::npos);

    EXPECT_EQ(generator.calls.load(), 0);
}

TEST_F(MessageProcessorTest, UnknownCommandIsEchoedBack) {
    CanonicalResponse response =
        processor.process(make_message(ClientType::CLI, "deploy prod", MessageType::COMMAND));

    EXPECT_EQ(response.content, "Unknown command: deploy prod");
    EXPECT_FALSE(response.error.has_value());
    EXPECT_EQ(generator.calls.load(), 0);
}

TEST_F(MessageProcessorTest, StatsCommandReportsCounts) {
    CanonicalResponse response =
        processor.process(make_message(ClientType::TELEGRAM, "/stats", MessageType::COMMAND));

    EXPECT_NE(response.content.find("Gateway status:"), std::string::npos);
    EXPECT_NE(response.content.find("Total messages: 1"), std::string::npos);
    EXPECT_NE(response.content.find("Telegram: 1"), std::string::npos);
}

TEST_F(MessageProcessorTest, HelpAndStatusPrefixesAreCaseInsensitive) {
    CanonicalResponse help = processor.process(make_message(ClientType::WEB, "/HELP me please"));
    EXPECT_EQ(help.content, MessageProcessor::help_text());

    CanonicalResponse status = processor.process(make_message(ClientType::WEB, "/Status"));
    EXPECT_NE(status.content.find("Gateway status:"), std::string::npos);

    EXPECT_EQ(generator.calls.load(), 0);
}

TEST_F(MessageProcessorTest, ActiveSessionsComeFromCounter) {
    EXPECT_EQ(processor.get_stats().active_sessions, 0u);

    processor.set_session_counter([]() { return size_t{7}; });
    EXPECT_EQ(processor.get_stats().active_sessions, 7u);

    processor.set_session_counter(nullptr);
    EXPECT_EQ(processor.get_stats().active_sessions, 0u);
}

TEST_F(MessageProcessorTest, UptimeIsNonNegative) {
    GatewayStats stats = processor.get_stats();
    EXPECT_GE(stats.uptime_seconds, 0.0);
    EXPECT_LE(stats.start_time, Clock::now());
}

TEST(MessageProcessorFailureTest, GeneratorFailureBecomesProcessingFailure) {
    ThrowingGenerator generator;
    MessageProcessor processor(generator);

    CanonicalMessage message = make_message(ClientType::WEB, "hello");
    CanonicalResponse response = processor.process(message);

    EXPECT_EQ(response.message_id, message.id());
    ASSERT_TRUE(response.error.has_value());
    EXPECT_EQ(*response.error, ErrorKind::PROCESSING_FAILURE);
    EXPECT_NE(response.content.find("model backend unavailable"), std::string::npos);

    GatewayStats stats = processor.get_stats();
    EXPECT_EQ(stats.errors, 1u);
    EXPECT_EQ(stats.total_messages, 1u);
}

TEST(MessageProcessorConcurrencyTest, CountsStayConsistentAcrossThreads) {
    EchoResponseGenerator generator;
    MessageProcessor processor(generator);

    constexpr int kThreads = 6;
    constexpr int kPerThread = 200;
    std::vector<std::thread> workers;
    for (int t = 0; t < kThreads; ++t) {
        workers.emplace_back([&processor, t]() {
            ClientType client = kAllClientTypes[t % kAllClientTypes.size()];
            for (int i = 0; i < kPerThread; ++i) {
                processor.process(make_message(client, "load"));
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    GatewayStats stats = processor.get_stats();
    EXPECT_EQ(stats.total_messages, static_cast<uint64_t>(kThreads * kPerThread));
    EXPECT_EQ(sum_by_client(stats), stats.total_messages);
    EXPECT_EQ(stats.messages_for(ClientType::CLI), static_cast<uint64_t>(2 * kPerThread));
}
