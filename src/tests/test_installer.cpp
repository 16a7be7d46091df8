#include <gtest/gtest.h>

#include <QCoreApplication>
#include <QDir>
#include <QFileInfo>
#include <QTemporaryDir>

#include "helpers/fake_command_runner.h"
#include "toolhub/backend/env_file.h"
#include "toolhub_server/manager/config_validator.h"
#include "toolhub_server/manager/installer.h"

using namespace toolhub_server;
using toolhub::BackendDefinition;
using toolhub::EnvMap;
using toolhub::ErrorStage;
using toolhub::RuntimeKind;

namespace {

BackendDefinition nodeDefinition() {
    BackendDefinition def;
    def.id = "alpha";
    def.name = "Alpha";
    def.repoUrl = "https://example.invalid/alpha.git";
    def.command = QCoreApplication::applicationFilePath();
    def.requiredEnv = {"ALPHA_KEY"};
    def.defaultConfig = {{"ALPHA_KEY", "default"}, {"MODE", "production"}};
    return def;
}

} // namespace

TEST(InstallerTest, NodePipelineWritesEnvFile) {
    QTemporaryDir tmp;
    ASSERT_TRUE(tmp.isValid());
    const QString path = tmp.path() + "/backends/alpha";

    FakeCommandRunner runner;
    ConfigValidator validator(&runner, ClientConfigTarget{});
    Installer installer(&runner, &validator);

    QStringList log;
    InstallFailure failure;
    ASSERT_TRUE(installer.install(InstallRequest{nodeDefinition(), path, {{"ALPHA_KEY", "secret"}}},
                                  [&log](const QString& line) { log.append(line); }, failure))
        << failure.text.toStdString();

    const QStringList commands = runner.commands();
    ASSERT_EQ(commands.size(), 3);
    EXPECT_TRUE(commands[0].startsWith("git clone https://example.invalid/alpha.git"));
    EXPECT_EQ(commands[1], "npm install");
    EXPECT_EQ(commands[2], "npm run build");

    EnvMap env;
    QString error;
    ASSERT_TRUE(toolhub::EnvFile::read(toolhub::EnvFile::pathFor(path), env, error));
    EXPECT_EQ(env.value("ALPHA_KEY"), "secret");
    EXPECT_EQ(env.value("MODE"), "production");
    EXPECT_FALSE(log.isEmpty());
}

TEST(InstallerTest, CloneFailureStopsPipeline) {
    QTemporaryDir tmp;
    ASSERT_TRUE(tmp.isValid());

    FakeCommandRunner runner;
    runner.fail("git clone", "fatal: repository not found");
    Installer installer(&runner, nullptr);

    InstallFailure failure;
    EXPECT_FALSE(installer.install(InstallRequest{nodeDefinition(), tmp.path() + "/a", {}},
                                   [](const QString&) {}, failure));
    EXPECT_EQ(failure.stage, ErrorStage::GitClone);
    EXPECT_TRUE(failure.text.contains("repository not found"));
    EXPECT_EQ(runner.count("npm"), 0);
}

TEST(InstallerTest, BuildFailureReportsStage) {
    QTemporaryDir tmp;
    ASSERT_TRUE(tmp.isValid());

    FakeCommandRunner runner;
    runner.fail("npm run", "tsc: error TS2304");
    Installer installer(&runner, nullptr);

    InstallFailure failure;
    EXPECT_FALSE(installer.install(InstallRequest{nodeDefinition(), tmp.path() + "/a", {}},
                                   [](const QString&) {}, failure));
    EXPECT_EQ(failure.stage, ErrorStage::NpmBuild);
}

TEST(InstallerTest, MissingRepositoryUrl) {
    QTemporaryDir tmp;
    ASSERT_TRUE(tmp.isValid());

    BackendDefinition def = nodeDefinition();
    def.repoUrl.clear();
    FakeCommandRunner runner;
    Installer installer(&runner, nullptr);

    InstallFailure failure;
    EXPECT_FALSE(installer.install(InstallRequest{def, tmp.path() + "/a", {}},
                                   [](const QString&) {}, failure));
    EXPECT_TRUE(runner.commands().isEmpty());
}

TEST(InstallerTest, StaleDirectoryIsReplaced) {
    QTemporaryDir tmp;
    ASSERT_TRUE(tmp.isValid());
    const QString path = tmp.path() + "/alpha";
    ASSERT_TRUE(QDir().mkpath(path + "/leftover"));

    FakeCommandRunner runner;
    Installer installer(&runner, nullptr);
    InstallFailure failure;
    ASSERT_TRUE(installer.install(InstallRequest{nodeDefinition(), path, {}},
                                  [](const QString&) {}, failure));
    EXPECT_FALSE(QFileInfo::exists(path + "/leftover"));
}

TEST(InstallerTest, PythonUsesUvWhenAvailable) {
    QTemporaryDir tmp;
    ASSERT_TRUE(tmp.isValid());

    BackendDefinition def = nodeDefinition();
    def.runtime = RuntimeKind::Python;
    FakeCommandRunner runner;
    runner.setAvailable({"uv"});
    Installer installer(&runner, nullptr);

    InstallFailure failure;
    ASSERT_TRUE(installer.install(InstallRequest{def, tmp.path() + "/py", {}},
                                  [](const QString&) {}, failure));
    EXPECT_EQ(runner.count("uv venv"), 1);
    EXPECT_EQ(runner.count("uv pip"), 1);
    EXPECT_EQ(runner.count("python3"), 0);
}

TEST(InstallerTest, PythonFallsBackToPip) {
    QTemporaryDir tmp;
    ASSERT_TRUE(tmp.isValid());

    BackendDefinition def = nodeDefinition();
    def.runtime = RuntimeKind::Python;
    FakeCommandRunner runner;
    runner.fail("python3 -m", "No module named venv");
    Installer installer(&runner, nullptr);

    InstallFailure failure;
    EXPECT_FALSE(installer.install(InstallRequest{def, tmp.path() + "/py", {}},
                                   [](const QString&) {}, failure));
    EXPECT_EQ(failure.stage, ErrorStage::InterpreterEnv);
}

TEST(InstallerTest, MergedConfigPrefersUserValues) {
    const EnvMap merged = Installer::mergedConfig(nodeDefinition(), {{"MODE", "dev"}, {"X", "1"}});
    EXPECT_EQ(merged.value("MODE"), "dev");
    EXPECT_EQ(merged.value("ALPHA_KEY"), "default");
    EXPECT_EQ(merged.value("X"), "1");
}
