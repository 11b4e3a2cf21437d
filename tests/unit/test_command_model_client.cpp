#include <string>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "llm/command_model_client.hpp"
#include "test_support.hpp"

namespace {

using simlab::core::errors::ErrorCategory;
using simlab::core::errors::get_error;
using simlab::core::errors::get_value;
using simlab::core::errors::is_error;
using simlab::llm::CommandModelClient;
using simlab::llm::CommandModelOptions;
using simlab::protocol::Message;
using simlab::protocol::ModelRequest;
using simlab::protocol::Role;
using simlab::testing::read_file;
using simlab::testing::TempWorkspace;

CommandModelOptions shell_model(const TempWorkspace& workspace, const std::string& script) {
    CommandModelOptions options;
    options.command = {"/bin/sh", "-c", script};
    options.model_name = "test-model";
    options.scratch_root = workspace.root() / "scratch";
    options.timeout_ms = 5000;
    return options;
}

ModelRequest sample_request() {
    ModelRequest request;
    request.system = "be brief";
    request.messages.push_back(Message{Role::User, "hello", std::nullopt, std::nullopt});
    return request;
}

TEST(CommandModelClientTest, SendsRequestOnStdinAndParsesReply) {
    TempWorkspace workspace("model_cmd");
    CommandModelClient client(shell_model(
        workspace,
        "cat > captured.json; printf '{\"content\": \"%s\"}' \"$SIMLAB_MODEL_NAME\""));

    auto reply = client.complete(sample_request());
    ASSERT_FALSE(is_error(reply)) << get_error(reply).message;
    EXPECT_EQ(get_value(reply).content, "test-model");
    EXPECT_FALSE(get_value(reply).tool_call.has_value());

    const auto sent = nlohmann::json::parse(read_file(workspace.root() / "scratch" / "captured.json"));
    EXPECT_EQ(sent.at("system"), "be brief");
    EXPECT_EQ(sent.at("messages")[0].at("role"), "user");
    EXPECT_EQ(sent.at("messages")[0].at("content"), "hello");
    EXPECT_TRUE(sent.at("tools").is_array());
}

TEST(CommandModelClientTest, ParsesToolCallReply) {
    TempWorkspace workspace("model_cmd");
    CommandModelClient client(shell_model(
        workspace,
        "cat > /dev/null; echo '{\"content\": null, \"tool_call\": {\"id\": \"c9\", "
        "\"name\": \"python_exec\", \"arguments\": {\"code\": \"print(1)\"}}}'"));

    auto reply = client.complete(sample_request());
    ASSERT_FALSE(is_error(reply));
    ASSERT_TRUE(get_value(reply).tool_call.has_value());
    EXPECT_EQ(get_value(reply).tool_call->id, "c9");
    EXPECT_EQ(nlohmann::json::parse(get_value(reply).tool_call->arguments).at("code"), "print(1)");
}

TEST(CommandModelClientTest, NonZeroExitIsProviderError) {
    TempWorkspace workspace("model_cmd");
    CommandModelClient client(shell_model(workspace, "cat > /dev/null; echo quota >&2; exit 3"));

    auto reply = client.complete(sample_request());
    ASSERT_TRUE(is_error(reply));
    EXPECT_EQ(get_error(reply).category, ErrorCategory::Provider);
    EXPECT_EQ(get_error(reply).code, "model_command_failed");
    EXPECT_NE(get_error(reply).message.find("quota"), std::string::npos);
}

TEST(CommandModelClientTest, GarbageOutputIsProviderError) {
    TempWorkspace workspace("model_cmd");
    CommandModelClient client(shell_model(workspace, "cat > /dev/null; echo not-json"));

    auto reply = client.complete(sample_request());
    ASSERT_TRUE(is_error(reply));
    EXPECT_EQ(get_error(reply).code, "invalid_model_response");
}

TEST(CommandModelClientTest, SlowCommandTimesOut) {
    TempWorkspace workspace("model_cmd");
    auto options = shell_model(workspace, "sleep 5");
    options.timeout_ms = 200;
    CommandModelClient client(options);

    auto reply = client.complete(sample_request());
    ASSERT_TRUE(is_error(reply));
    EXPECT_EQ(get_error(reply).code, "model_timeout");
}

TEST(CommandModelClientTest, RequestFileIsRemovedAfterCall) {
    TempWorkspace workspace("model_cmd");
    CommandModelClient client(shell_model(workspace, "cat > /dev/null; echo '{\"content\": \"x\"}'"));
    ASSERT_FALSE(is_error(client.complete(sample_request())));

    std::size_t leftovers = 0;
    for (const auto& entry :
         std::filesystem::directory_iterator(workspace.root() / "scratch")) {
        if (entry.path().filename().string().rfind("model-request-", 0) == 0) {
            ++leftovers;
        }
    }
    EXPECT_EQ(leftovers, 0u);
}

TEST(CommandModelClientTest, MissingCommandIsConfigurationError) {
    TempWorkspace workspace("model_cmd");
    CommandModelOptions options;
    options.scratch_root = workspace.root();
    CommandModelClient client(options);

    auto reply = client.complete(sample_request());
    ASSERT_TRUE(is_error(reply));
    EXPECT_EQ(get_error(reply).category, ErrorCategory::Input);
    EXPECT_EQ(get_error(reply).code, "model_not_configured");
}

}  // namespace
