#include <gtest/gtest.h>

#include <functional>
#include <thread>

#include "engine/execution_engine.hpp"
#include "executor/executor_registry.hpp"
#include "storage/local_storage.hpp"
#include "test_support.hpp"
#include "utils/errors.hpp"

namespace codeexec::engine {
namespace {

using utils::ErrorCode;
using utils::ServiceError;

config::Config EngineConfig() {
    config::Config config{};
    config.limits.max_execution_seconds = 3;
    config.limits.max_cpu_secs = 1;
    config.limits.max_memory_mb = 512;
    return config;
}

ErrorCode CodeOf(const std::function<void()>& action) {
    try {
        action();
    } catch (const ServiceError& ex) {
        return ex.Code();
    }
    ADD_FAILURE() << "expected ServiceError";
    return ErrorCode::kInternalError;
}

class ExecutionEngineTest : public ::testing::Test {
protected:
    ExecutionEngineTest()
        : dir_("engine-test")
        , storage_(dir_.Path())
        , executors_(executor::CreateExecutors(EngineConfig()))
        , sessions_(storage_, executors_->Languages())
        , engine_(sessions_, storage_, *executors_) {}

    void SetUp() override {
        if (!executors_->Has(session::Language::kPython) || !executors_->Has(session::Language::kBash)) {
            GTEST_SKIP() << "python3 and bash are required";
        }
    }

    ExecutionRecord Run(const std::string& session_id, const std::string& code,
                        std::optional<std::string> language = std::nullopt) {
        ExecuteRequest request{};
        request.session_id = session_id;
        request.code = code;
        request.language = std::move(language);
        return engine_.Execute(request);
    }

    static std::vector<std::string> Paths(const std::vector<storage::FileEntry>& files) {
        std::vector<std::string> paths;
        for (const auto& file : files) {
            paths.push_back(file.path);
        }
        return paths;
    }

    sandbox::ScopedTempDir dir_;
    storage::LocalStorage storage_;
    std::unique_ptr<executor::ExecutorRegistry> executors_;
    session::SessionRegistry sessions_;
    ExecutionEngine engine_;
};

TEST_F(ExecutionEngineTest, PythonHelloWorld) {
    const auto info = sessions_.Create("python");
    const auto record = Run(info.id, "print(\"hi\")");
    EXPECT_EQ(record.status, ExecutionStatus::kOk);
    EXPECT_EQ(record.exit_code, 0);
    EXPECT_NE(record.stdout_text.find("hi"), std::string::npos);
    EXPECT_EQ(record.stderr_text, "");
    EXPECT_TRUE(record.files.empty());
    EXPECT_TRUE(record.modified_files.empty());
}

TEST_F(ExecutionEngineTest, ReportsCreatedAndModifiedFiles) {
    const auto info = sessions_.Create("bash");
    sessions_.SaveFiles(info.id, {{"keep.txt", "same"}, {"edit.txt", "old"}});
    const auto record = Run(info.id, "echo new > edit.txt\nmkdir -p out\necho x > out/made.txt\n");
    EXPECT_EQ(record.exit_code, 0);
    EXPECT_EQ(record.modified_files, (std::vector<std::string>{"edit.txt", "out/made.txt"}));
    EXPECT_EQ(Paths(record.files), (std::vector<std::string>{"edit.txt", "keep.txt", "out/made.txt"}));
    EXPECT_EQ(sessions_.ReadFile(info.id, "edit.txt"), "new\n");
}

TEST_F(ExecutionEngineTest, FilesPersistAcrossRuns) {
    const auto info = sessions_.Create("python");
    Run(info.id, "open('state.txt', 'w').write('1')");
    const auto record = Run(info.id, "print(open('state.txt').read())");
    EXPECT_EQ(record.stdout_text, "1\n");
}

TEST_F(ExecutionEngineTest, TimeoutReturnsSentinelAndSessionSurvives) {
    const auto info = sessions_.Create("bash");
    const auto started = std::chrono::steady_clock::now();
    const auto record = Run(info.id, "sleep 999");
    const auto elapsed = std::chrono::steady_clock::now() - started;
    EXPECT_EQ(record.status, ExecutionStatus::kTimedOut);
    EXPECT_EQ(record.exit_code, kTimedOutExitCode);
    EXPECT_NE(record.stderr_text.find("Execution timed out after 3 seconds."), std::string::npos);
    EXPECT_LT(elapsed, std::chrono::seconds(8));
    EXPECT_EQ(sessions_.Get(info.id).language, session::Language::kBash);
}

TEST_F(ExecutionEngineTest, CpuLimitReturnsSentinel) {
    const auto info = sessions_.Create("python");
    const auto record = Run(info.id, "while True:\n    pass\n");
    EXPECT_EQ(record.status, ExecutionStatus::kResourceLimitExceeded);
    EXPECT_EQ(record.exit_code, kLimitExceededExitCode);
}

TEST_F(ExecutionEngineTest, MetadataTamperingIsUndone) {
    const auto info = sessions_.Create("python");
    const auto record = Run(info.id, "echo '{\"language\":\"bash\"}' > .meta.json", "bash");
    EXPECT_EQ(record.status, ExecutionStatus::kOk);
    EXPECT_TRUE(record.modified_files.empty());
    const auto after = sessions_.Get(info.id);
    EXPECT_EQ(after.language, session::Language::kPython);
    EXPECT_EQ(after.created_at, info.created_at);
    Run(info.id, "rm .meta.json", "bash");
    EXPECT_EQ(sessions_.Get(info.id).language, session::Language::kPython);
}

TEST_F(ExecutionEngineTest, MetadataReplacedByDirectoryIsRestored) {
    const auto info = sessions_.Create("bash");
    const auto record = Run(info.id, "rm .meta.json; mkdir .meta.json; echo x > .meta.json/inner");
    EXPECT_EQ(record.status, ExecutionStatus::kOk);
    EXPECT_EQ(record.exit_code, 0);
    const auto after = sessions_.Get(info.id);
    EXPECT_EQ(after.language, session::Language::kBash);
    EXPECT_EQ(after.created_at, info.created_at);
    EXPECT_TRUE(sessions_.ListFiles(info.id).empty());
    sessions_.Delete(info.id);
    EXPECT_EQ(CodeOf([&] { sessions_.Get(info.id); }), ErrorCode::kSessionNotFound);
}

TEST_F(ExecutionEngineTest, LanguageOverrideWins) {
    const auto info = sessions_.Create("python");
    const auto record = Run(info.id, "echo \"$BASH_VERSION\" | cut -c1", "bash");
    EXPECT_EQ(record.exit_code, 0);
    EXPECT_FALSE(record.stdout_text.empty());
    EXPECT_EQ(CodeOf([&] { Run(info.id, "1", "ruby"); }), ErrorCode::kUnsupportedLanguage);
}

TEST_F(ExecutionEngineTest, RejectsEmptyCodeAndUnknownSessions) {
    const auto info = sessions_.Create("python");
    EXPECT_EQ(CodeOf([&] { Run(info.id, ""); }), ErrorCode::kInvalidRequest);
    EXPECT_EQ(CodeOf([&] { Run("00000000-0000-4000-8000-000000000000", "print(1)"); }),
              ErrorCode::kSessionNotFound);
    sessions_.Delete(info.id);
    EXPECT_EQ(CodeOf([&] { Run(info.id, "print(1)"); }), ErrorCode::kSessionNotFound);
}

TEST_F(ExecutionEngineTest, ConcurrentSessionsAreIsolated) {
    const auto first = sessions_.Create("bash");
    const auto second = sessions_.Create("bash");
    ExecutionRecord first_record;
    ExecutionRecord second_record;
    std::thread a([&] { first_record = Run(first.id, "echo a > a.txt; sleep 0.3; ls"); });
    std::thread b([&] { second_record = Run(second.id, "echo b > b.txt; sleep 0.3; ls"); });
    a.join();
    b.join();
    EXPECT_EQ(first_record.stdout_text, "a.txt\n");
    EXPECT_EQ(second_record.stdout_text, "b.txt\n");
    EXPECT_EQ(Paths(first_record.files), (std::vector<std::string>{"a.txt"}));
    EXPECT_EQ(Paths(second_record.files), (std::vector<std::string>{"b.txt"}));
}

}  // namespace
}  // namespace codeexec::engine
