#include "kiln/console.hpp"
#include "kiln/graph.hpp"

#include <algorithm>
#include <gtest/gtest.h>
#include <string>
#include <unordered_map>
#include <vector>

namespace {

using kiln::ErrorKind;
using kiln::Task;
using kiln::TaskGraph;

Task make_task(std::string id, std::vector<std::string> deps = {}, std::vector<std::string> aliases = {}) {
    Task task;
    task.id = std::move(id);
    task.command = "true";
    task.dependencies = std::move(deps);
    task.aliases = std::move(aliases);
    return task;
}

TaskGraph make_graph(std::vector<Task> tasks) {
    TaskGraph graph;
    for (auto &task : tasks) {
        EXPECT_TRUE(graph.add_task(std::move(task)).has_value());
    }
    return graph;
}

size_t position(const std::vector<std::string> &order, const std::string &id) {
    return static_cast<size_t>(std::ranges::find(order, id) - order.begin());
}

void expect_dependencies_first(const TaskGraph &graph, const std::vector<std::string> &order) {
    for (const auto &id : order) {
        const Task *task = graph.find(id);
        ASSERT_NE(task, nullptr);
        for (const auto &dep : task->dependencies) {
            if (std::ranges::find(order, dep) == order.end())
                continue;
            EXPECT_LT(position(order, dep), position(order, id)) << dep << " should precede " << id;
        }
    }
}

TEST(TaskGraphTest, RejectsDuplicateIds) {
    TaskGraph graph;
    ASSERT_TRUE(graph.add_task(make_task("a")).has_value());
    auto res = graph.add_task(make_task("a"));
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().kind, ErrorKind::Dependency);
}

TEST(TaskGraphTest, RejectsMissingDependency) {
    auto graph = make_graph({make_task("a", {"ghost"})});
    auto res = graph.validate();
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().kind, ErrorKind::Dependency);
    EXPECT_NE(res.error().message.find("ghost"), std::string::npos);
}

TEST(TaskGraphTest, RejectsSelfDependency) {
    auto graph = make_graph({make_task("a", {"a"})});
    auto res = graph.validate();
    ASSERT_FALSE(res.has_value());
    EXPECT_NE(res.error().message.find("depends on itself"), std::string::npos);
}

TEST(TaskGraphTest, ReportsCycleWithPath) {
    auto graph = make_graph({make_task("a", {"b"}), make_task("b", {"a"})});
    auto res = graph.validate();
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().kind, ErrorKind::Dependency);
    EXPECT_EQ(res.error().message, "Circular dependency: a -> b -> a");
}

TEST(TaskGraphTest, RemovingBackEdgeMakesGraphValid) {
    auto cyclic = make_graph({make_task("a", {"b"}), make_task("b", {"c"}), make_task("c", {"a"})});
    EXPECT_FALSE(cyclic.validate().has_value());

    auto acyclic = make_graph({make_task("a", {"b"}), make_task("b", {"c"}), make_task("c")});
    EXPECT_TRUE(acyclic.validate().has_value());
}

TEST(TaskGraphTest, RejectsAliasCollidingWithTaskId) {
    auto graph = make_graph({make_task("build", {}, {"test"}), make_task("test")});
    auto res = graph.validate();
    ASSERT_FALSE(res.has_value());
    EXPECT_NE(res.error().message.find("conflicts with task ID"), std::string::npos);
}

TEST(TaskGraphTest, RejectsAliasUsedTwice) {
    auto graph = make_graph({make_task("build", {}, {"b"}), make_task("bench", {}, {"b"})});
    auto res = graph.validate();
    ASSERT_FALSE(res.has_value());
    EXPECT_NE(res.error().message.find("already used by task 'build'"), std::string::npos);
}

TEST(TaskGraphTest, TopologicalOrderPlacesDependenciesFirst) {
    auto graph = make_graph({
        make_task("test", {"build"}),
        make_task("build", {"clippy", "codegen"}),
        make_task("clippy", {"format"}),
        make_task("codegen"),
        make_task("format"),
        make_task("docs", {"codegen"}),
    });
    ASSERT_TRUE(graph.validate().has_value());

    auto order = graph.sort_topologically();
    EXPECT_EQ(order.size(), 6u);
    expect_dependencies_first(graph, order);
}

TEST(TaskGraphTest, RequiredTasksIsTheDependencyClosure) {
    auto graph = make_graph({
        make_task("c"),
        make_task("a", {"c"}),
        make_task("b", {"c"}),
        make_task("unrelated"),
    });
    ASSERT_TRUE(graph.validate().has_value());

    auto res = graph.get_required_tasks("a");
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(*res, (std::vector<std::string>{"c", "a"}));
}

TEST(TaskGraphTest, RequiredTasksResolvesAliases) {
    auto graph = make_graph({make_task("compile", {}, {"c", "cc"}), make_task("link", {"compile"}, {"l"})});
    ASSERT_TRUE(graph.validate().has_value());

    auto res = graph.get_required_tasks("l");
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(*res, (std::vector<std::string>{"compile", "link"}));
    EXPECT_EQ(graph.resolve("cc"), "compile");
}

TEST(TaskGraphTest, RequiredTasksUnknownTarget) {
    auto graph = make_graph({make_task("a")});
    auto res = graph.get_required_tasks("nope");
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().kind, ErrorKind::TaskNotFound);
    EXPECT_EQ(res.error().message, "Task 'nope' not found");
}

TEST(TaskGraphTest, LevelsFollowLongestDependencyPath) {
    auto graph = make_graph({
        make_task("d", {"b", "c"}),
        make_task("a"),
        make_task("b", {"a"}),
        make_task("c", {"a", "b"}),
        make_task("e"),
    });
    ASSERT_TRUE(graph.validate().has_value());

    auto levels = graph.calculate_dependency_levels(graph.sort_topologically());
    ASSERT_EQ(levels.size(), 4u);
    EXPECT_EQ(levels[0].level, 0u);
    EXPECT_EQ(levels[0].task_ids, (std::vector<std::string>{"a", "e"}));
    EXPECT_EQ(levels[1].task_ids, (std::vector<std::string>{"b"}));
    EXPECT_EQ(levels[2].task_ids, (std::vector<std::string>{"c"}));
    EXPECT_EQ(levels[3].task_ids, (std::vector<std::string>{"d"}));
}

TEST(TaskGraphTest, LevelInvariantHoldsForEveryTask) {
    auto graph = make_graph({
        make_task("t5", {"t3", "t4"}),
        make_task("t4", {"t1"}),
        make_task("t3", {"t2"}),
        make_task("t2", {"t1"}),
        make_task("t1"),
        make_task("t6"),
    });
    ASSERT_TRUE(graph.validate().has_value());

    auto levels = graph.calculate_dependency_levels(graph.sort_topologically());
    std::unordered_map<std::string, size_t> level_of;
    for (const auto &level : levels) {
        for (const auto &id : level.task_ids)
            level_of[id] = level.level;
    }

    for (const auto &task : graph.tasks()) {
        size_t expected = 0;
        for (const auto &dep : task.dependencies)
            expected = std::max(expected, level_of.at(dep) + 1);
        EXPECT_EQ(level_of.at(task.id), expected) << task.id;
    }
}

TEST(TaskGraphTest, LevelsOnlyCoverTheSelectedClosure) {
    auto graph = make_graph({make_task("c"), make_task("a", {"c"}), make_task("b", {"c"})});
    ASSERT_TRUE(graph.validate().has_value());

    auto levels = graph.calculate_dependency_levels(*graph.get_required_tasks("b"));
    ASSERT_EQ(levels.size(), 2u);
    EXPECT_EQ(levels[0].task_ids, (std::vector<std::string>{"c"}));
    EXPECT_EQ(levels[1].task_ids, (std::vector<std::string>{"b"}));
}

TEST(TaskGraphTest, OrderingOnlyEdgesAreReportedInVerboseMode) {
    Task producer = make_task("gen");
    producer.outputs = {"build/gen.h"};
    Task consumer = make_task("compile", {"gen"});
    consumer.inputs = {"build/**/*.h"};
    Task ordered = make_task("deploy", {"compile"});

    auto graph = make_graph({producer, consumer, ordered});

    kiln::BufferConsole quiet(false);
    graph.show_task_relationships(quiet);
    EXPECT_TRUE(quiet.out().empty());

    kiln::BufferConsole verbose(true);
    graph.show_task_relationships(verbose);
    EXPECT_EQ(verbose.out(), "Info: Task 'deploy' depends on 'compile' for ordering only\n");
}

} // namespace
