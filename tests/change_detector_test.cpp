#include "kiln/cache.hpp"
#include "kiln/change_detector.hpp"
#include "kiln/console.hpp"
#include "kiln/file_resolver.hpp"
#include "kiln/fingerprint.hpp"
#include "test_support.hpp"

#include <chrono>
#include <gtest/gtest.h>

namespace {

using kiln::RunReason;
using kiln::Task;
using kiln::testing::ScopedTempDir;
using kiln::testing::touch;
using kiln::testing::write_file;
using namespace std::chrono_literals;

class ChangeDetectorTest : public ::testing::Test {
protected:
    Task make_task(std::vector<std::string> inputs, std::vector<std::string> outputs) {
        Task task;
        task.id = "t";
        task.command = "true";
        task.inputs = std::move(inputs);
        task.outputs = std::move(outputs);
        return task;
    }

    void remember(const Task &task) {
        auto fingerprint = fingerprinter.fingerprint(task.inputs);
        ASSERT_TRUE(fingerprint.has_value());
        cache.insert(*fingerprint);
    }

    ScopedTempDir dir;
    kiln::BufferConsole console;
    kiln::IncrementalCache cache;
    kiln::FileResolver resolver{console};
    kiln::Fingerprinter fingerprinter{resolver, console};
    kiln::ChangeDetector detector{cache, resolver, fingerprinter, console};
};

TEST_F(ChangeDetectorTest, NoInputsAlwaysRuns) {
    Task task = make_task({}, {});
    EXPECT_EQ(detector.evaluate(task), RunReason::NoInputs);
    EXPECT_TRUE(detector.should_run(task));
    EXPECT_TRUE(detector.should_run(task));
}

TEST_F(ChangeDetectorTest, MissingOutputRuns) {
    write_file("a.txt", "a");
    Task task = make_task({"a.txt"}, {"a.out"});
    remember(task);
    EXPECT_EQ(detector.evaluate(task), RunReason::OutputsMissing);
}

TEST_F(ChangeDetectorTest, OutputGlobWithoutMatchesCountsAsMissing) {
    write_file("a.txt", "a");
    Task task = make_task({"a.txt"}, {"build/*.o"});
    remember(task);
    EXPECT_EQ(detector.evaluate(task), RunReason::OutputsMissing);
}

TEST_F(ChangeDetectorTest, NewerInputRuns) {
    write_file("a.txt", "a");
    write_file("a.out", "out");
    touch("a.out", -60s);
    touch("a.txt", 0s);
    Task task = make_task({"a.txt"}, {"a.out"});
    remember(task);
    EXPECT_EQ(detector.evaluate(task), RunReason::OutputsOutdated);
}

TEST_F(ChangeDetectorTest, UncachedFingerprintRuns) {
    write_file("a.txt", "a");
    write_file("a.out", "out");
    touch("a.txt", -60s);
    Task task = make_task({"a.txt"}, {"a.out"});
    EXPECT_EQ(detector.evaluate(task), RunReason::InputsChanged);
}

TEST_F(ChangeDetectorTest, CachedAndFreshSkips) {
    write_file("a.txt", "a");
    write_file("a.out", "out");
    touch("a.txt", -60s);
    Task task = make_task({"a.txt"}, {"a.out"});
    remember(task);
    EXPECT_EQ(detector.evaluate(task), RunReason::UpToDate);
    EXPECT_FALSE(detector.should_run(task));
}

TEST_F(ChangeDetectorTest, ContentChangeWithOldTimestampRuns) {
    write_file("a.txt", "a");
    write_file("a.out", "out");
    Task task = make_task({"a.txt"}, {"a.out"});
    remember(task);

    write_file("a.txt", "b");
    touch("a.txt", -60s);
    EXPECT_EQ(detector.evaluate(task), RunReason::InputsChanged);
}

TEST_F(ChangeDetectorTest, NoOutputsDependsOnFingerprintOnly) {
    write_file("src/main.rs", "fn main() {}");
    Task task = make_task({"src/**/*.rs"}, {});
    EXPECT_EQ(detector.evaluate(task), RunReason::InputsChanged);
    remember(task);
    EXPECT_EQ(detector.evaluate(task), RunReason::UpToDate);
}

TEST_F(ChangeDetectorTest, ResolutionErrorMeansRunWithWarning) {
    write_file("a.out", "out");
    Task task = make_task({"src/[broken"}, {"a.out"});
    EXPECT_EQ(detector.evaluate(task), RunReason::CheckFailed);
    EXPECT_TRUE(detector.should_run(task));
    EXPECT_NE(console.err().find("Warning:"), std::string::npos);
}

} // namespace
