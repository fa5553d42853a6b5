#include "test_helpers.hpp"
#include "es_error.hpp"
#include "es_startup.hpp"

#include <deque>
#include <memory>
#include <string>

using namespace envstage;
using envstage::test::TempTreeTest;

namespace {

const char* kSolution =
    "Microsoft Visual Studio Solution File, Format Version 12.00\r\n"
    "Project(\"{FAE04EC0-301F-11D3-BF4B-00C04F79EFBC}\") = \"Common\", \"Common\\Common.csproj\", \"{11111111-1111-1111-1111-111111111111}\"\r\n"
    "EndProject\r\n"
    "Project(\"{FAE04EC0-301F-11D3-BF4B-00C04F79EFBC}\") = \"Kernel.Service\", \"Kernel.Service\\Kernel.Service.csproj\", \"{22222222-2222-2222-2222-222222222222}\"\r\n"
    "\tProjectSection(ProjectDependencies) = postProject\r\n"
    "\t\t{11111111-1111-1111-1111-111111111111} = {11111111-1111-1111-1111-111111111111}\r\n"
    "\tEndProjectSection\r\n"
    "EndProject\r\n"
    "Global\r\n"
    "EndGlobal\r\n";

// Hands out queued keys, then reports nothing (or end of input) forever.
KeySource ScriptedKeys(std::string keys, bool end_after = false) {
    auto queue = std::make_shared<std::deque<int>>(keys.begin(), keys.end());
    return [queue, end_after](std::chrono::milliseconds) {
        if (queue->empty()) return end_after ? kEndOfInput : kNoKey;
        const int c = queue->front();
        queue->pop_front();
        return c;
    };
}

std::chrono::steady_clock::time_point Soon() {
    return std::chrono::steady_clock::now() + std::chrono::milliseconds(50);
}

} // namespace

TEST(StartupTests, ParseAnswer) {
    EXPECT_EQ(ParseAnswer("y"), PromptAnswer::Yes);
    EXPECT_EQ(ParseAnswer(" YES \r"), PromptAnswer::Yes);
    EXPECT_EQ(ParseAnswer(""), PromptAnswer::No);
    EXPECT_EQ(ParseAnswer("nope"), PromptAnswer::No);
}

TEST(StartupTests, FixedPromptRecordsQuestion) {
    FixedPrompt prompt(PromptAnswer::TimedOut);
    EXPECT_EQ(prompt.Ask("Set X?", std::chrono::seconds(1)), PromptAnswer::TimedOut);
    EXPECT_EQ(prompt.asked(), 1);
    EXPECT_EQ(prompt.last_question(), "Set X?");
}

TEST(StartupTests, ReadLineUntilStopsAtEnter) {
    auto line = ReadLineUntil(ScriptedKeys("yes\rignored"), Soon());
    ASSERT_TRUE(line.has_value());
    EXPECT_EQ(*line, "yes");
    EXPECT_EQ(ParseAnswer(*line), PromptAnswer::Yes);
}

TEST(StartupTests, ReadLineUntilAppliesBackspace) {
    auto line = ReadLineUntil(ScriptedKeys("nx\b\by\n"), Soon());
    ASSERT_TRUE(line.has_value());
    EXPECT_EQ(*line, "y");
}

TEST(StartupTests, ReadLineUntilTimesOutOnPartialLine) {
    const auto deadline = Soon();
    auto line = ReadLineUntil(ScriptedKeys("ye"), deadline);
    EXPECT_FALSE(line.has_value());
    EXPECT_GE(std::chrono::steady_clock::now(), deadline);
    EXPECT_LT(std::chrono::steady_clock::now(), deadline + std::chrono::seconds(2));
}

TEST(StartupTests, ReadLineUntilReturnsPartialLineAtEndOfInput) {
    auto line = ReadLineUntil(ScriptedKeys("y", true), Soon());
    ASSERT_TRUE(line.has_value());
    EXPECT_EQ(*line, "y");
}

TEST(StartupTests, ReadLineUntilHonoursPastDeadline) {
    auto line = ReadLineUntil(ScriptedKeys("y\r"),
                              std::chrono::steady_clock::now() - std::chrono::milliseconds(1));
    EXPECT_FALSE(line.has_value());
}

TEST(StartupTests, MoveProjectFirstKeepsWholeBlock) {
    std::string text = kSolution;
    bool changed = false;
    ASSERT_TRUE(MoveProjectFirst(text, "kernel.service.csproj", changed));
    EXPECT_TRUE(changed);

    const auto kernel = text.find("\"Kernel.Service\"");
    const auto common = text.find("\"Common\"");
    ASSERT_NE(kernel, std::string::npos);
    ASSERT_NE(common, std::string::npos);
    EXPECT_LT(kernel, common);
    // dependency section travelled with its project
    EXPECT_LT(text.find("EndProjectSection"), common);
    EXPECT_EQ(text.size(), std::string(kSolution).size());
    EXPECT_EQ(text.rfind("Global\r\nEndGlobal\r\n"), text.size() - 19);
}

TEST(StartupTests, MoveProjectFirstNoChangeWhenAlreadyFirst) {
    std::string text = kSolution;
    bool changed = true;
    ASSERT_TRUE(MoveProjectFirst(text, "Common.csproj", changed));
    EXPECT_FALSE(changed);
    EXPECT_EQ(text, kSolution);
}

TEST(StartupTests, MoveProjectFirstUnknownProject) {
    std::string text = kSolution;
    bool changed = false;
    EXPECT_FALSE(MoveProjectFirst(text, "Missing.csproj", changed));
    EXPECT_EQ(text, kSolution);
}

class SolutionRegistrarTests : public TempTreeTest {};

TEST_F(SolutionRegistrarTests, RewritesReferencingSolution) {
    auto sln = Write("Main.sln", kSolution);
    auto proj = Write("Kernel.Service/Kernel.Service.csproj", "<Project/>");

    SolutionStartupRegistrar registrar;
    const std::string result = registrar.Register(root_, proj);
    EXPECT_NE(result.find("Main.sln"), std::string::npos);
    EXPECT_LT(Read(sln).find("Kernel.Service"), Read(sln).find("\"Common\""));
}

TEST_F(SolutionRegistrarTests, NoSolutionIsExternalFailure) {
    auto proj = Write("Kernel.Service/Kernel.Service.csproj", "<Project/>");

    SolutionStartupRegistrar registrar;
    try {
        registrar.Register(root_, proj);
        FAIL() << "expected ExternalFailure";
    } catch (const DeployError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::ExternalFailure);
    }
}
