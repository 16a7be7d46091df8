#include <gtest/gtest.h>

#include <QThread>

#include <memory>
#include <vector>

#include "toolhub/diagnostics/enhanced_error.h"
#include "toolhub/diagnostics/error_history.h"

using namespace toolhub;

TEST(EnhancedErrorTest, StageNames) {
    EXPECT_EQ(errorStageName(ErrorStage::GitClone), "git_clone");
    EXPECT_EQ(errorStageName(ErrorStage::NpmInstall), "npm_install");
    EXPECT_EQ(errorStageName(ErrorStage::NpmBuild), "npm_build");
    EXPECT_EQ(errorStageName(ErrorStage::InterpreterEnv), "interpreter_env");
    EXPECT_EQ(errorStageName(ErrorStage::DependencyInstall), "dependency_install");
    EXPECT_EQ(errorStageName(ErrorStage::Startup), "startup");
    EXPECT_EQ(errorStageName(ErrorStage::ToolDiscovery), "tool_discovery");
}

TEST(EnhancedErrorTest, SuggestionMatchingIsCaseInsensitive) {
    const QStringList lower = suggestionsFor(ErrorStage::GitClone, "fatal: permission denied");
    const QStringList upper = suggestionsFor(ErrorStage::GitClone, "FATAL: PERMISSION DENIED");
    EXPECT_EQ(lower, upper);
    EXPECT_TRUE(lower.contains("Configure git authentication (SSH key or access token)"));
}

TEST(EnhancedErrorTest, UnmatchedTextFallsBackToStageDefaults) {
    const QStringList s = suggestionsFor(ErrorStage::GitClone, "something odd happened");
    EXPECT_TRUE(s.contains("Make sure git is installed and on PATH"));
    EXPECT_FALSE(s.contains("Configure git authentication (SSH key or access token)"));
}

TEST(EnhancedErrorTest, SeveralRulesCanMatch) {
    const QStringList s = suggestionsFor(ErrorStage::NpmInstall,
                                         "npm ERR! network error while resolving dependency");
    EXPECT_TRUE(s.contains("Check the internet connection"));
    EXPECT_TRUE(s.contains("Retry with --legacy-peer-deps"));
}

TEST(EnhancedErrorTest, GenericStageAlwaysSuggestsSomething) {
    EXPECT_FALSE(suggestionsFor(ErrorStage::Generic, QString()).isEmpty());
    EXPECT_FALSE(suggestionsFor(ErrorStage::Validation, "anything").isEmpty());
}

TEST(EnhancedErrorTest, ReporterFillsRecord) {
    const ErrorReporter reporter("github", "Installing GitHub");
    const EnhancedError err =
        reporter.installationError(ErrorStage::GitClone, "repository not found");

    EXPECT_EQ(err.type, "installation_error");
    EXPECT_EQ(err.stage, "git_clone");
    EXPECT_EQ(err.details, "repository not found");
    EXPECT_EQ(err.context, "Installing GitHub");
    EXPECT_EQ(err.severity, "error");
    EXPECT_TRUE(err.message.contains("github"));
    EXPECT_TRUE(err.timestamp.isValid());
    EXPECT_TRUE(err.suggestions.contains("Verify that the repository URL is correct and reachable"));

    const EnhancedError discovery = reporter.toolDiscoveryError("timed out after 45000 ms");
    EXPECT_EQ(discovery.type, "tool_discovery_error");
    EXPECT_EQ(discovery.severity, "warning");
}

TEST(EnhancedErrorTest, JsonRoundTripKeepsFields) {
    const EnhancedError err = ErrorReporter("slack", "Starting Slack").startupError("port in use");
    const EnhancedError back = EnhancedError::fromJson(err.toJson());
    EXPECT_EQ(back.type, err.type);
    EXPECT_EQ(back.stage, err.stage);
    EXPECT_EQ(back.suggestions, err.suggestions);
    EXPECT_EQ(back.timestamp, err.timestamp);
}

TEST(ErrorHistoryTest, KeepsMostRecentUpToCapacity) {
    ErrorHistory history(3);
    const ErrorReporter reporter("a", "ctx");
    for (int i = 0; i < 5; ++i) {
        history.add("a", reporter.startupError(QString("failure %1").arg(i)));
    }

    const QList<EnhancedError> errors = history.errors("a");
    ASSERT_EQ(errors.size(), 3);
    EXPECT_EQ(errors.first().details, "failure 2");
    EXPECT_EQ(errors.last().details, "failure 4");
}

TEST(ErrorHistoryTest, ClearIsPerBackend) {
    ErrorHistory history;
    const ErrorReporter reporter("x", "ctx");
    history.add("a", reporter.startupError("1"));
    history.add("b", reporter.startupError("2"));

    history.clear("a");
    EXPECT_TRUE(history.errors("a").isEmpty());
    EXPECT_EQ(history.errors("b").size(), 1);
    EXPECT_EQ(history.capacity(), ErrorHistory::kDefaultCapacity);
}

TEST(ErrorHistoryTest, ConcurrentAdds) {
    ErrorHistory history(1000);
    const ErrorReporter reporter("c", "ctx");

    std::vector<std::unique_ptr<QThread>> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back(QThread::create([&history, &reporter]() {
            for (int i = 0; i < 50; ++i) {
                history.add("c", reporter.startupError("x"));
            }
        }));
        threads.back()->start();
    }
    for (auto& thread : threads) {
        thread->wait();
    }
    EXPECT_EQ(history.errors("c").size(), 200);
}
