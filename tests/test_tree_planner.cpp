#include <gtest/gtest.h>

#include <algorithm>
#include <set>
#include <unistd.h>

#include "core/path_resolver/path_resolver.hpp"
#include "core/planner/tree_planner.hpp"
#include "test_utils.hpp"

using pcopy::core::SourceMapping;
using pcopy::core::TransferMode;
using pcopy::core::TransferPlan;
using pcopy::core::TreePlanner;
using pcopy::core::UnitKind;
using pcopy::infra::ErrorCode;
using pcopy::test_utils::TempDir;
using pcopy::test_utils::write_file;

namespace {

TransferPlan plan_tree(const std::filesystem::path& src, const std::filesystem::path& dst,
                       TransferMode mode = TransferMode::Copy)
{
    TransferPlan plan;
    TreePlanner{mode}.plan_source(SourceMapping{src, dst}, plan);
    return plan;
}

} // namespace

TEST(TreePlannerTest, SingleFileIsOneUnit)
{
    TempDir tmp;
    write_file(tmp / "a.bin", std::string(1234, 'z'));

    auto plan = plan_tree(tmp / "a.bin", tmp / "b.bin");
    ASSERT_EQ(plan.units.size(), 1u);
    EXPECT_TRUE(plan.failures.empty());
    EXPECT_EQ(plan.units[0].kind, UnitKind::File);
    EXPECT_EQ(plan.units[0].size_bytes, 1234u);
    EXPECT_EQ(plan.units[0].destination, tmp / "b.bin");
    EXPECT_EQ(plan.total_bytes(), 1234u);
}

TEST(TreePlannerTest, DirectoriesPrecedeTheirContentsInLexicographicOrder)
{
    TempDir tmp;
    write_file(tmp / "src" / "b.txt", "bb");
    write_file(tmp / "src" / "a" / "z.txt", "z");
    write_file(tmp / "src" / "a" / "y.txt", "yy");
    std::filesystem::create_directories(tmp / "src" / "empty");

    auto plan = plan_tree(tmp / "src", tmp / "dst");
    ASSERT_EQ(plan.units.size(), 6u);

    std::vector<std::filesystem::path> order;
    for (const auto& unit : plan.units) {
        order.push_back(unit.destination.lexically_relative(tmp / "dst"));
    }
    const std::vector<std::filesystem::path> expected{
        ".", "a", "a/y.txt", "a/z.txt", "b.txt", "empty"};
    EXPECT_EQ(order, expected);

    EXPECT_EQ(plan.units[0].kind, UnitKind::Directory);
    EXPECT_EQ(plan.units[5].kind, UnitKind::Directory);
    EXPECT_EQ(plan.total_bytes(), 5u);
}

TEST(TreePlannerTest, EveryNestedUnitFollowsItsParentDirectory)
{
    TempDir tmp;
    write_file(tmp / "src" / "x" / "y" / "z" / "deep", "d");
    write_file(tmp / "src" / "x" / "sibling", "s");

    auto plan = plan_tree(tmp / "src", tmp / "dst");
    std::set<std::filesystem::path> seen_dirs;
    std::set<std::filesystem::path> destinations;
    for (const auto& unit : plan.units) {
        EXPECT_TRUE(destinations.insert(unit.destination).second);
        if (unit.destination != tmp / "dst") {
            EXPECT_TRUE(seen_dirs.contains(unit.destination.parent_path()))
                << unit.destination << " planned before its parent";
        }
        if (unit.kind == UnitKind::Directory) {
            seen_dirs.insert(unit.destination);
        }
    }
}

TEST(TreePlannerTest, SymlinksAreNotFollowed)
{
    TempDir tmp;
    write_file(tmp / "src" / "real" / "file", "content");
    std::filesystem::create_directory_symlink("real", tmp / "src" / "alias");
    std::filesystem::create_symlink("/nonexistent/target", tmp / "src" / "dangling");

    auto plan = plan_tree(tmp / "src", tmp / "dst");
    EXPECT_TRUE(plan.failures.empty());

    auto find = [&](const char* name) {
        return std::find_if(plan.units.begin(), plan.units.end(), [&](const auto& unit) {
            return unit.source == tmp / "src" / name;
        });
    };
    auto alias = find("alias");
    ASSERT_NE(alias, plan.units.end());
    EXPECT_EQ(alias->kind, UnitKind::Symlink);
    EXPECT_EQ(alias->link_target, std::filesystem::path("real"));

    auto dangling = find("dangling");
    ASSERT_NE(dangling, plan.units.end());
    EXPECT_EQ(dangling->kind, UnitKind::Symlink);
    EXPECT_EQ(dangling->link_target, std::filesystem::path("/nonexistent/target"));

    // Nothing is planned beneath the symlinked directory
    for (const auto& unit : plan.units) {
        EXPECT_NE(unit.source.parent_path(), tmp / "src" / "alias");
    }
}

TEST(TreePlannerTest, UnreadableEntryBecomesTraversalFailure)
{
    if (::geteuid() == 0) {
        GTEST_SKIP() << "permission bits are not enforced for root";
    }
    TempDir tmp;
    write_file(tmp / "src" / "ok1", "1");
    write_file(tmp / "src" / "locked", "secret");
    write_file(tmp / "src" / "ok2", "2");
    std::filesystem::permissions(tmp / "src" / "locked", std::filesystem::perms::none);

    auto plan = plan_tree(tmp / "src", tmp / "dst");
    ASSERT_EQ(plan.failures.size(), 1u);
    EXPECT_EQ(plan.failures[0].error.code, ErrorCode::TraversalError);
    EXPECT_EQ(plan.failures[0].unit.source, tmp / "src" / "locked");
    EXPECT_EQ(plan.units.size(), 3u); // root dir + ok1 + ok2
    EXPECT_EQ(plan.unit_count(), 4u);
}

TEST(TreePlannerTest, UnreadableFileIsFineForLinkModes)
{
    if (::geteuid() == 0) {
        GTEST_SKIP() << "permission bits are not enforced for root";
    }
    TempDir tmp;
    write_file(tmp / "src" / "locked", "secret");
    std::filesystem::permissions(tmp / "src" / "locked", std::filesystem::perms::none);

    auto plan = plan_tree(tmp / "src", tmp / "dst", TransferMode::SymLink);
    EXPECT_TRUE(plan.failures.empty());
    EXPECT_EQ(plan.units.size(), 2u);
}

TEST(TreePlannerTest, UnitsCarryTheRequestedMode)
{
    TempDir tmp;
    write_file(tmp / "src" / "a", "a");

    auto plan = plan_tree(tmp / "src", tmp / "dst", TransferMode::HardLink);
    for (const auto& unit : plan.units) {
        EXPECT_EQ(unit.mode, TransferMode::HardLink);
    }
}

TEST(TreePlannerTest, PlanCoversAllMappings)
{
    TempDir tmp;
    write_file(tmp / "a", "aa");
    write_file(tmp / "b" / "c", "ccc");

    auto target = pcopy::core::resolve_paths({tmp / "a", tmp / "b"}, tmp / "out", false);
    ASSERT_TRUE(target);
    auto plan = TreePlanner{TransferMode::Copy}.plan(*target);
    EXPECT_EQ(plan.units.size(), 3u); // a, b/, b/c
    EXPECT_EQ(plan.total_bytes(), 5u);
}
