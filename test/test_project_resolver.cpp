#include "test_helpers.hpp"
#include "es_error.hpp"
#include "es_name_match.hpp"
#include "es_project_resolver.hpp"

using namespace envstage;
using envstage::test::TempTreeTest;

class ProjectResolverTests : public TempTreeTest {};

TEST_F(ProjectResolverTests, ExactNameBeatsSubstringMatches) {
    Write("src/Kernel.Service.Tests/Kernel.Service.Tests.csproj", "<Project/>");
    Write("Kernel.Service.Host/Kernel.Service.Host.csproj", "<Project/>");
    Write("deep/nested/Kernel.Service/Kernel.Service.csproj", "<Project/>");

    Settings settings;
    ProjectDescriptor p = ResolveProject(root_, "kernel.service", settings);
    EXPECT_EQ(p.project_file.filename().string(), "Kernel.Service.csproj");
    EXPECT_EQ(p.matched_rule, "exact-name");
    EXPECT_EQ(p.project_dir, p.project_file.parent_path());
    EXPECT_EQ(p.candidates.size(), 3u);
}

TEST_F(ProjectResolverTests, NamespacePrefixedName) {
    Write("a/Company.Kernel/Company.Kernel.csproj", "<Project/>");
    Write("Company.Kernel.Tests/Company.Kernel.Tests.csproj", "<Project/>");

    Settings settings;
    settings.namespace_prefix = "Company.";
    ProjectDescriptor p = ResolveProject(root_, "Kernel", settings);
    EXPECT_EQ(p.name, "Company.Kernel");
    EXPECT_EQ(p.matched_rule, "namespace-prefixed");
}

TEST_F(ProjectResolverTests, FallsBackToShallowestPath) {
    Write("x/y/Billing.Worker/Billing.Worker.csproj", "<Project/>");
    Write("Billing.Api/Billing.Api.csproj", "<Project/>");

    Settings settings;
    ProjectDescriptor p = ResolveProject(root_, "Billing", settings);
    EXPECT_EQ(p.name, "Billing.Api");
    EXPECT_EQ(p.matched_rule, "shallowest-path");
}

TEST_F(ProjectResolverTests, ShallowestTieIsDeterministic) {
    Write("B/Svc.B.csproj", "<Project/>");
    Write("A/Svc.A.csproj", "<Project/>");

    Settings settings;
    EXPECT_EQ(ResolveProject(root_, "Svc", settings).name, "Svc.A");
    EXPECT_EQ(ResolveProject(root_, "Svc", settings).name, "Svc.A");
}

TEST_F(ProjectResolverTests, IgnoresBuildOutputAndOtherExtensions) {
    Write("Tool/bin/Debug/Tool.csproj", "<Project/>");
    Write("Tool/Tool.sln", "");
    Write("Tool/Tool.vbproj", "<Project/>");

    Settings settings;
    auto candidates = FindProjectCandidates(root_, "tool", settings.project_extensions);
    ASSERT_EQ(candidates.size(), 1u);
    EXPECT_EQ(candidates[0].filename().string(), "Tool.vbproj");
}

TEST_F(ProjectResolverTests, NoCandidateIsNotFound) {
    Write("Other/Other.csproj", "<Project/>");
    Settings settings;
    try {
        ResolveProject(root_, "Missing", settings);
        FAIL() << "expected ProjectNotFound";
    } catch (const DeployError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::ProjectNotFound);
        EXPECT_NE(std::string(e.what()).find("Missing"), std::string::npos);
        EXPECT_EQ(e.path(), root_);
    }
}

TEST_F(ProjectResolverTests, CustomRuleListWithoutFallbackReportsAmbiguity) {
    Write("A/Svc.A.csproj", "<Project/>");
    Write("B/Svc.B.csproj", "<Project/>");

    Settings settings;
    std::vector<MatchRule> rules{ ExactStemRule("exact-name", "Svc") };
    EXPECT_THROW(ResolveProject(root_, "Svc", settings, rules), DeployError);
}

TEST_F(ProjectResolverTests, WorkspaceSelectorRelativeToBase) {
    MakeDir("Main");
    EXPECT_EQ(ResolveWorkspaceRoot("Main", root_), (root_ / "Main").lexically_normal());
    EXPECT_EQ(ResolveWorkspaceRoot((root_ / "Main").string(), "/nonexistent"),
              (root_ / "Main").lexically_normal());

    try {
        ResolveWorkspaceRoot("Nope", root_);
        FAIL() << "expected WorkspaceNotFound";
    } catch (const DeployError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::WorkspaceNotFound);
        EXPECT_TRUE(IsNotFound(e.kind()));
    }
}

TEST(NameMatchTests, StopsAtFirstUniqueRule) {
    std::vector<std::filesystem::path> c{ "/w/a/Foo.csproj", "/w/Foo.Bar.csproj", "/w/b/Foo.csproj" };
    std::vector<MatchRule> rules{
        ExactStemRule("exact-name", "Foo"),       // two hits, skipped
        ExactStemRule("second", "Foo.Bar"),       // one hit
        ShallowestPathRule("/w"),
    };
    auto m = SelectUnique(c, rules);
    ASSERT_TRUE(m.has_value());
    EXPECT_EQ(m->index, 1u);
    EXPECT_EQ(m->rule, "second");
}

TEST(NameMatchTests, EmptyCandidatesHaveNoMatch) {
    EXPECT_FALSE(SelectUnique({}, { ShallowestPathRule("/w") }).has_value());
}
