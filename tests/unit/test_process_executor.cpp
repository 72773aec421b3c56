/**
 * @file test_process_executor.cpp
 * @brief Unit tests for ProcessExecutor against small shell scripts.
 */

#include "executor/process_executor.hpp"

#include <gtest/gtest.h>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

using namespace task_orchestrator;

class ProcessExecutorTest : public ::testing::Test {
protected:
    std::filesystem::path temp_dir_;

    void SetUp() override {
        temp_dir_ = std::filesystem::temp_directory_path() / "to_test_process_executor"
            / ::testing::UnitTest::GetInstance()->current_test_info()->name();
        std::filesystem::remove_all(temp_dir_);
        std::filesystem::create_directories(temp_dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(temp_dir_);
    }

    std::filesystem::path write_script(const std::string& name, const std::string& body) {
        auto path = temp_dir_ / name;
        {
            std::ofstream ofs(path);
            ofs << "#!/bin/sh\n" << body;
        }
        std::filesystem::permissions(path, std::filesystem::perms::owner_all,
                                     std::filesystem::perm_options::add);
        return path;
    }

    ExecutionRequest request_for(const std::filesystem::path& program,
                                 std::vector<std::string> parameters = {}) {
        ExecutionRequest request;
        request.name = program.filename().string();
        request.program_path = program.string();
        request.parameters = std::move(parameters);
        request.output_sink = OutputSink{(temp_dir_ / (request.name + ".out")).string()};
        return request;
    }

    static std::string read_file(const std::string& path) {
        std::ifstream ifs(path);
        std::stringstream ss;
        ss << ifs.rdbuf();
        return ss.str();
    }
};

TEST_F(ProcessExecutorTest, CapturesStdoutAndStderr) {
    auto script = write_script("both.sh", "echo to-out\necho to-err 1>&2\n");
    ProcessExecutor executor;

    auto result = executor.run(request_for(script));
    ASSERT_FALSE(result.error_message.has_value()) << *result.error_message;
    ASSERT_TRUE(result.exit_code.has_value());
    EXPECT_EQ(*result.exit_code, 0);
    EXPECT_TRUE(result.succeeded());
    EXPECT_EQ(result.name, "both.sh");

    auto output = read_file(temp_dir_ / "both.sh.out");
    EXPECT_NE(output.find("to-out"), std::string::npos);
    EXPECT_NE(output.find("to-err"), std::string::npos);
}

TEST_F(ProcessExecutorTest, PassesParametersInOrder) {
    auto script = write_script("args.sh", "echo \"$1|$2|$#\"\n");
    ProcessExecutor executor;

    auto result = executor.run(request_for(script, {"first", "second arg"}));
    ASSERT_TRUE(result.succeeded());
    EXPECT_EQ(read_file(temp_dir_ / "args.sh.out"), "first|second arg|2\n");
}

TEST_F(ProcessExecutorTest, AppendsToExistingSink) {
    auto script = write_script("append.sh", "echo line\n");
    ProcessExecutor executor;
    auto request = request_for(script);

    ASSERT_TRUE(executor.run(request).succeeded());
    ASSERT_TRUE(executor.run(request).succeeded());
    EXPECT_EQ(read_file(request.output_sink.path), "line\nline\n");
}

TEST_F(ProcessExecutorTest, NonZeroExitReported) {
    auto script = write_script("fail.sh", "exit 3\n");
    ProcessExecutor executor;

    auto result = executor.run(request_for(script));
    EXPECT_FALSE(result.error_message.has_value());
    ASSERT_TRUE(result.exit_code.has_value());
    EXPECT_EQ(*result.exit_code, 3);
    EXPECT_FALSE(result.succeeded());
}

TEST_F(ProcessExecutorTest, SignalReported) {
    auto script = write_script("killed.sh", "kill -KILL $$\n");
    ProcessExecutor executor;

    auto result = executor.run(request_for(script));
    EXPECT_FALSE(result.exit_code.has_value());
    ASSERT_TRUE(result.term_signal.has_value());
    EXPECT_EQ(*result.term_signal, SIGKILL);
    EXPECT_FALSE(result.succeeded());
}

TEST_F(ProcessExecutorTest, MissingProgramIsLaunchFailure) {
    ProcessExecutor executor;
    auto result = executor.run(request_for(temp_dir_ / "does_not_exist"));
    EXPECT_TRUE(result.error_message.has_value());
    EXPECT_FALSE(result.exit_code.has_value());
    EXPECT_FALSE(result.succeeded());
}

TEST_F(ProcessExecutorTest, UnopenableSinkIsLaunchFailure) {
    auto script = write_script("ok.sh", "exit 0\n");
    ProcessExecutor executor;
    auto request = request_for(script);
    request.output_sink.path = (temp_dir_ / "missing_dir" / "out.txt").string();

    auto result = executor.run(request);
    ASSERT_TRUE(result.error_message.has_value());
    EXPECT_NE(result.error_message->find("output sink"), std::string::npos);
}

TEST_F(ProcessExecutorTest, InterpreterPrependedToArgv) {
    ProcessExecutor plain;
    ProcessExecutor with_sh("/bin/sh");

    ExecutionRequest request;
    request.program_path = "job.sh";
    request.parameters = {"-x", "y"};

    EXPECT_EQ(plain.build_argv(request), (std::vector<std::string>{"job.sh", "-x", "y"}));
    EXPECT_EQ(with_sh.build_argv(request),
              (std::vector<std::string>{"/bin/sh", "job.sh", "-x", "y"}));
    EXPECT_EQ(with_sh.interpreter(), "/bin/sh");
}

TEST_F(ProcessExecutorTest, InterpreterRunsNonExecutableScript) {
    auto path = temp_dir_ / "plain.sh";
    {
        std::ofstream ofs(path);
        ofs << "echo via-interpreter \"$1\"\n";
    }
    ProcessExecutor executor("/bin/sh");

    auto result = executor.run(request_for(path, {"p1"}));
    ASSERT_TRUE(result.succeeded());
    EXPECT_EQ(read_file(temp_dir_ / "plain.sh.out"), "via-interpreter p1\n");
}

TEST_F(ProcessExecutorTest, StdinIsDevNull) {
    auto script = write_script("stdin.sh", "if read line; then echo got; else echo eof; fi\n");
    ProcessExecutor executor;

    ASSERT_TRUE(executor.run(request_for(script)).succeeded());
    EXPECT_EQ(read_file(temp_dir_ / "stdin.sh.out"), "eof\n");
}
