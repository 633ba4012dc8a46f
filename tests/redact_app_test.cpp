#include <gtest/gtest.h>
#include "core/dlp_errors.hpp"
#include "core/file_utils.hpp"
#include "core/poco_config_manager.hpp"
#include "core/redact_app.hpp"
#include "stubs/stub_dlp_client.hpp"
#include <cstdlib>
#include <filesystem>
#include <sstream>

namespace fs = std::filesystem;

class RedactAppTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        unsetenv(PocoConfigManager::kConfigPathEnv);
        PocoConfigManager::getInstance().reset();

        test_dir_ = fs::temp_directory_path() / "dlp_redact_app_test";
        fs::create_directories(test_dir_);
    }

    void TearDown() override
    {
        fs::remove_all(test_dir_);
        PocoConfigManager::getInstance().reset();
    }

    int run(const std::vector<std::string> &args)
    {
        RedactApp app(StubDlpClient::factory(state_), out_, err_);
        return app.run(args);
    }

    std::string path(const std::string &name) const { return (test_dir_ / name).string(); }

    StubDlpState state_;
    std::ostringstream out_;
    std::ostringstream err_;
    fs::path test_dir_;
};

TEST_F(RedactAppTest, RedactsStringToStdout)
{
    std::string redacted = "call me at [hidden]";
    state_.response.items.emplace_back("text/plain", std::vector<uint8_t>(redacted.begin(), redacted.end()));

    int code = run({"-s", "call me at 555-1234", "-infoTypes", "PHONE_NUMBER", "-r", "[hidden]"});

    EXPECT_EQ(code, RedactApp::kExitSuccess);
    EXPECT_EQ(out_.str(), "call me at [hidden]\n");
    ASSERT_EQ(state_.requests.size(), 1);
    EXPECT_EQ(state_.requests[0].replace_configs[0].replace_with, "[hidden]");
}

TEST_F(RedactAppTest, DefaultsReachTheRequest)
{
    state_.response.items.emplace_back("text/plain", std::vector<uint8_t>{'o', 'k'});

    EXPECT_EQ(run({"-s", "my email is test@example.com"}), RedactApp::kExitSuccess);

    ASSERT_EQ(state_.requests.size(), 1);
    const auto &request = state_.requests[0];
    EXPECT_EQ(request.inspect_config.min_likelihood, Likelihood::LIKELIHOOD_UNSPECIFIED);
    ASSERT_EQ(request.replace_configs.size(), 1);
    EXPECT_FALSE(request.replace_configs[0].info_type.has_value());
    EXPECT_EQ(request.replace_configs[0].replace_with, "_REDACTED_");
}

TEST_F(RedactAppTest, RedactsImageToFile)
{
    std::vector<uint8_t> redacted = {0x89, 0x50, 0x4E, 0x47, 0x0D, 0x0A, 0x1A, 0x0A};
    FileUtils::writeBinaryFile(path("photo.png"), {0x89, 0x50, 0x4E, 0x47, 0x42});
    FileUtils::writeBinaryFile(path("out.png"), std::vector<uint8_t>(100, 0x00));
    state_.response.items.emplace_back("image/png", redacted);

    int code = run({"-f", path("photo.png"), "-o", path("out.png"), "-infoTypes", "FACE"});

    EXPECT_EQ(code, RedactApp::kExitSuccess);
    EXPECT_EQ(FileUtils::readBinaryFile(path("out.png")), redacted);
    ASSERT_EQ(state_.requests.size(), 1);
    ASSERT_EQ(state_.requests[0].image_redaction_configs.size(), 1);
    EXPECT_EQ(state_.requests[0].image_redaction_configs[0].action, ImageRedactionAction::CLEAR);
}

TEST_F(RedactAppTest, BothModesIsUsageErrorWithoutRemoteCall)
{
    int code = run({"-s", "text", "-f", path("photo.png"), "-o", path("out.png")});

    EXPECT_EQ(code, RedactApp::kExitUsage);
    EXPECT_EQ(state_.clients_created, 0);
    EXPECT_TRUE(state_.requests.empty());
    EXPECT_NE(err_.str().find("Usage:"), std::string::npos);
    EXPECT_TRUE(out_.str().empty());
}

TEST_F(RedactAppTest, NeitherModeIsUsageErrorWithoutRemoteCall)
{
    int code = run({"-infoTypes", "EMAIL_ADDRESS"});

    EXPECT_EQ(code, RedactApp::kExitUsage);
    EXPECT_EQ(state_.clients_created, 0);
    EXPECT_NE(err_.str().find("one of -s or -f"), std::string::npos);
}

TEST_F(RedactAppTest, InvalidLikelihoodIsUsageError)
{
    EXPECT_EQ(run({"-s", "text", "-minLikelihood", "MAYBE"}), RedactApp::kExitUsage);
    EXPECT_EQ(state_.clients_created, 0);
    EXPECT_NE(err_.str().find("MAYBE"), std::string::npos);
}

TEST_F(RedactAppTest, NonUtf8ReplacementIsUsageErrorWithoutRemoteCall)
{
    int code = run({"-s", "hello", "-r", "M\xFCller"});

    EXPECT_EQ(code, RedactApp::kExitUsage);
    EXPECT_EQ(state_.clients_created, 0);
    EXPECT_NE(err_.str().find("not valid UTF-8"), std::string::npos);
    EXPECT_TRUE(out_.str().empty());
}

TEST_F(RedactAppTest, EmptyTextResponseExitsAbnormally)
{
    EXPECT_EQ(run({"-s", "hello"}), RedactApp::kExitFailure);
    EXPECT_EQ(state_.requests.size(), 1);
    EXPECT_TRUE(out_.str().empty());
}

TEST_F(RedactAppTest, HelpPrintsUsageToStdout)
{
    EXPECT_EQ(run({"--help"}), RedactApp::kExitSuccess);
    EXPECT_NE(out_.str().find("Usage:"), std::string::npos);
    EXPECT_EQ(state_.clients_created, 0);
}

TEST_F(RedactAppTest, MissingExplicitConfigIsUsageError)
{
    EXPECT_EQ(run({"-s", "text", "-config", path("missing.json")}), RedactApp::kExitUsage);
    EXPECT_EQ(state_.clients_created, 0);
}

TEST_F(RedactAppTest, RemoteFailureExitsAbnormally)
{
    state_.fail = []()
    { throw AuthenticationError("DLP service rejected credentials: HTTP 401"); };

    int code = run({"-s", "text"});

    EXPECT_EQ(code, RedactApp::kExitFailure);
    EXPECT_EQ(state_.requests.size(), 1);
    EXPECT_TRUE(out_.str().empty());
    EXPECT_NE(err_.str().find("HTTP 401"), std::string::npos);
}

TEST_F(RedactAppTest, MissingInputFileExitsAbnormally)
{
    int code = run({"-f", path("missing.png"), "-o", path("out.png")});

    EXPECT_EQ(code, RedactApp::kExitFailure);
    EXPECT_TRUE(state_.requests.empty());
    EXPECT_FALSE(fs::exists(path("out.png")));
}
