
#include "cli_adapter.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>
#include <thread>
#include <vector>

class CliAdapterTest : public ::testing::Test {
protected:
    void SetUp() override {
        adapter.initialize();
    }

    CliReply run(const std::string& command, std::vector<std::string> args = {}) {
        return adapter.dispatch({{"command", command}, {"args", args}, {"user_id", "u1"}});
    }

    EchoResponseGenerator generator;
    MessageProcessor processor{generator};
    CliAdapter adapter{processor, 50};
};

TEST_F(CliAdapterTest, SendForwardsJoinedArguments) {
    CliReply reply = run("send", {"hello", "world"});

    EXPECT_TRUE(reply.success);
    EXPECT_NE(reply.output.find("hello world"), std::string::npos);
    EXPECT_EQ(reply.to_json()["output"], reply.output);
    EXPECT_EQ(processor.get_stats().messages_for(ClientType::CLI), 1u);
    EXPECT_EQ(adapter.status().message_count, 1u);
}

TEST_F(CliAdapterTest, SendWithoutArgumentsIsUsageError) {
    CliReply reply = run("send");

    EXPECT_FALSE(reply.success);
    EXPECT_EQ(reply.error, "Usage: send <message>");
    EXPECT_EQ(*reply.error_kind, ErrorKind::VALIDATION);
    EXPECT_EQ(adapter.status().error_count, 1u);
    EXPECT_EQ(processor.get_stats().total_messages, 0u);
}

TEST_F(CliAdapterTest, UserIdDefaultsForBareCommands) {
    CliReply reply = adapter.dispatch({{"command", "status"}});

    EXPECT_TRUE(reply.success);
    auto history = adapter.recent_history();
    ASSERT_EQ(history.size(), 1u);
    EXPECT_EQ(history[0].user_id, "cli");
}

TEST_F(CliAdapterTest, ClearEmptiesHistory) {
    run("help");
    run("status");
    run("send", {"hi"});
    ASSERT_EQ(adapter.history_size(), 3u);

    CliReply reply = adapter.dispatch({{"command", "clear"}});

    EXPECT_TRUE(reply.success);
    EXPECT_EQ(reply.output, "Command history cleared");
    EXPECT_EQ(adapter.history_size(), 0u);
    EXPECT_EQ(run("history").output.find("Command history:\n"), 0u);
}

TEST_F(CliAdapterTest, HistoryRendersLastTenEntries) {
    for (int i = 0; i < 14; ++i) {
        run("status");
    }
    CliReply reply = run("history");

    EXPECT_TRUE(reply.success);
    EXPECT_EQ(reply.output.find("Command history:"), 0u);
    EXPECT_NE(reply.output.find("   1. ["), std::string::npos);
    EXPECT_NE(reply.output.find("  10. ["), std::string::npos);
    EXPECT_EQ(reply.output.find("  11. ["), std::string::npos);
    EXPECT_EQ(adapter.recent_history().size(), CliAdapter::kRenderedHistory);
    EXPECT_EQ(adapter.recent_history().back().command, "history");
}

TEST_F(CliAdapterTest, HelpListsBuiltins) {
    CliReply reply = run("help");

    EXPECT_TRUE(reply.success);
    for (const auto& [command, description] : CliAdapter::builtin_commands()) {
        EXPECT_NE(reply.output.find(command), std::string::npos) << command;
        EXPECT_NE(reply.output.find(description), std::string::npos) << command;
    }
}

TEST_F(CliAdapterTest, StatusAndStatsReportProcessorCounts) {
    run("send", {"one"});
    run("send", {"two"});

    CliReply status = run("status");
    EXPECT_NE(status.output.find("Gateway status:"), std::string::npos);
    EXPECT_NE(status.output.find("Total messages: 2"), std::string::npos);

    CliReply stats = run("stats");
    EXPECT_NE(stats.output.find("Detailed gateway statistics:"), std::string::npos);
    EXPECT_NE(stats.output.find("CLI: 2"), std::string::npos);
}

TEST_F(CliAdapterTest, BuiltinsCountAsAdapterActivity) {
    run("help");
    run("history");

    AdapterStatus status = adapter.status();
    EXPECT_EQ(status.message_count, 2u);
    EXPECT_TRUE(status.last_activity.has_value());
    EXPECT_EQ(processor.get_stats().total_messages, 0u);
}

TEST_F(CliAdapterTest, UnknownCommandsAreForwardedToProcessor) {
    CliReply reply = run("deploy", {"prod", "--fast"});

    EXPECT_TRUE(reply.success);
    EXPECT_EQ(reply.output, "Unknown command: deploy prod --fast");
    ASSERT_TRUE(reply.command.has_value());
    EXPECT_EQ(*reply.command, "deploy");
    EXPECT_TRUE(reply.timestamp.has_value());

    nlohmann::json j = reply.to_json();
    EXPECT_EQ(j["command"], "deploy");
    EXPECT_TRUE(j["timestamp"].is_string());
    EXPECT_EQ(processor.get_stats().messages_for(ClientType::CLI), 1u);
}

TEST_F(CliAdapterTest, RejectsMalformedRequests) {
    CliReply missing = adapter.dispatch({{"args", nlohmann::json::array()}});
    EXPECT_FALSE(missing.success);
    EXPECT_EQ(*missing.error_kind, ErrorKind::VALIDATION);

    CliReply bad_args = adapter.dispatch({{"command", "send"}, {"args", "hello"}});
    EXPECT_FALSE(bad_args.success);
    EXPECT_EQ(*bad_args.error_kind, ErrorKind::VALIDATION);

    EXPECT_EQ(adapter.status().error_count, 2u);
    EXPECT_EQ(adapter.history_size(), 0u);
}

TEST_F(CliAdapterTest, RoutedMessagesAreRecordedInHistory) {
    CanonicalMessage message = make_message(ClientType::CLI, "deploy staging", MessageType::COMMAND);

    DispatchOutcome outcome = adapter.handle_routed(message);

    ASSERT_TRUE(outcome.success);
    EXPECT_EQ(outcome.response->message_id, message.id());
    auto history = adapter.recent_history();
    ASSERT_EQ(history.size(), 1u);
    EXPECT_EQ(history[0].command, "deploy");
    ASSERT_EQ(history[0].args.size(), 1u);
    EXPECT_EQ(history[0].args[0], "staging");
}

TEST_F(CliAdapterTest, HelpDocumentDescribesUsage) {
    nlohmann::json doc = adapter.help_document();

    EXPECT_EQ(doc["commands"].size(), CliAdapter::builtin_commands().size());
    EXPECT_TRUE(doc["commands"].contains("send"));
    EXPECT_TRUE(doc["usage"].is_string());
    EXPECT_EQ(doc["examples"].size(), 3u);
}

TEST_F(CliAdapterTest, ShutdownClearsHistory) {
    run("help");
    adapter.shutdown();

    EXPECT_EQ(adapter.history_size(), 0u);
    EXPECT_EQ(adapter.health_check()["command_history_size"], 0);
    EXPECT_EQ(adapter.status().message_count, 1u);
}

TEST(CliAdapterLifecycleTest, RejectsCommandsBeforeInitialize) {
    EchoResponseGenerator generator;
    MessageProcessor processor(generator);
    CliAdapter adapter(processor, 20);

    CliReply reply = adapter.dispatch({{"command", "help"}});

    EXPECT_FALSE(reply.success);
    EXPECT_EQ(*reply.error_kind, ErrorKind::ADAPTER_NOT_READY);
    EXPECT_EQ(reply.error, "CLI adapter is not ready");
    EXPECT_EQ(adapter.status().message_count, 0u);
    EXPECT_EQ(adapter.history_size(), 0u);
}

TEST(CliAdapterLifecycleTest, HistoryIsCapacityBounded) {
    EchoResponseGenerator generator;
    MessageProcessor processor(generator);
    CliAdapter adapter(processor, 10);
    adapter.initialize();

    for (int i = 0; i < 25; ++i) {
        adapter.dispatch({{"command", "status"}});
    }

    EXPECT_EQ(adapter.history_size(), 10u);
}

TEST(CliAdapterConcurrencyTest, ParallelCommandsKeepCountsAndHistoryBounded) {
    EchoResponseGenerator generator;
    MessageProcessor processor(generator);
    CliAdapter adapter(processor, 10);
    adapter.initialize();

    constexpr int kThreads = 8;
    constexpr int kPerThread = 300;
    std::vector<std::thread> workers;
    for (int t = 0; t < kThreads; ++t) {
        workers.emplace_back([&adapter]() {
            for (int i = 0; i < kPerThread; ++i) {
                adapter.dispatch({{"command", "send"}, {"args", nlohmann::json::array({"load"})}});
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    EXPECT_EQ(adapter.status().message_count, static_cast<uint64_t>(kThreads * kPerThread));
    EXPECT_EQ(adapter.status().error_count, 0u);
    EXPECT_EQ(adapter.history_size(), 10u);

    GatewayStats stats = processor.get_stats();
    EXPECT_EQ(stats.total_messages, static_cast<uint64_t>(kThreads * kPerThread));
    EXPECT_EQ(stats.messages_for(ClientType::TELEGRAM) + stats.messages_for(ClientType::WEB)
                  + stats.messages_for(ClientType::CLI),
              stats.total_messages);
}
