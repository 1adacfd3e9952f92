//
// Created by gregorian-rayne on 2/24/26.
//

#include "gcs/stats/credit_aggregator.hpp"
#include "gcs/stats/table_view.hpp"
#include "support/memory_repository.hpp"

#include <gtest/gtest.h>

namespace gcs::stats
{
    using identity::AuthorIdentity;

    namespace {

        std::shared_ptr<const StatisticsTable> build_table(const std::vector<std::pair<AuthorIdentity, int>>& commits) {
            CreditAggregator aggregator;
            std::int64_t t = 0;
            for (const auto& [who, lines] : commits) {
                CommitContribution c;
                c.id = "c" + std::to_string(++t);
                c.timestamp = test::at(t);
                c.identities = {who};
                c.changes = {test::change(who.display_name + ".txt", static_cast<std::uint64_t>(lines), 0)};
                aggregator.add(c);
            }
            return aggregator.finish();
        }

        const AuthorIdentity kAlice{"alice@example.com", "Alice Smith", "alice@example.com"};
        const AuthorIdentity kBob{"bob@example.com", "Bob Jones", "bob@example.com"};
        const AuthorIdentity kCarol{"carol@corp.io", "Carol Smithers", "carol@corp.io"};

    }  // namespace

    class TableViewTest : public ::testing::Test {
    protected:
        std::shared_ptr<const StatisticsTable> table = build_table({
            {kAlice, 10}, {kAlice, 10}, {kBob, 100}, {kCarol, 1}, {kCarol, 1}, {kCarol, 1}
        });
    };

    TEST_F(TableViewTest, DefaultsToCommitsDescending) {
        const TableView view(table);
        ASSERT_EQ(view.rows().size(), 3u);
        EXPECT_EQ(view.rows()[0].key, kCarol.key);
        EXPECT_EQ(view.rows()[1].key, kAlice.key);
        EXPECT_EQ(view.rows()[2].key, kBob.key);
        EXPECT_EQ(view.sort_key(), SortKey::Commits);
        EXPECT_EQ(view.sort_order(), SortOrder::Descending);
    }

    TEST_F(TableViewTest, ResortWithoutTouchingTable) {
        TableView view(table);
        const Totals before = view.table().totals();

        view.set_sort(SortKey::Insertions);
        EXPECT_EQ(view.rows()[0].key, kBob.key);

        view.toggle_order();
        EXPECT_EQ(view.sort_order(), SortOrder::Ascending);
        EXPECT_EQ(view.rows()[0].key, kCarol.key);

        EXPECT_EQ(view.table().totals().insertions, before.insertions);
        EXPECT_EQ(&view.table(), table.get());
    }

    TEST_F(TableViewTest, FilterMatchesNameOrKey) {
        TableView view(table);

        view.set_filter("smith");
        ASSERT_EQ(view.rows().size(), 2u);
        EXPECT_EQ(view.rows()[0].key, kCarol.key);
        EXPECT_EQ(view.rows()[1].key, kAlice.key);

        view.set_filter("corp.io");
        ASSERT_EQ(view.rows().size(), 1u);
        EXPECT_EQ(view.rows()[0].key, kCarol.key);

        view.set_filter("  ");
        EXPECT_EQ(view.rows().size(), 3u);
        EXPECT_TRUE(view.filter().empty());
    }

    TEST_F(TableViewTest, FilterSurvivesSortChange) {
        TableView view(table);
        view.set_filter("SMITH");
        view.set_sort(SortKey::Name);
        view.set_order(SortOrder::Ascending);
        ASSERT_EQ(view.rows().size(), 2u);
        EXPECT_EQ(view.rows()[0].key, kAlice.key);
    }

    TEST_F(TableViewTest, SetTableKeepsSortAndFilter) {
        TableView view(table, SortKey::Insertions);
        view.set_filter("bob");

        const auto replacement = build_table({{kBob, 1}, {kBob, 2}, {kAlice, 5}});
        view.set_table(replacement);
        ASSERT_EQ(view.rows().size(), 1u);
        EXPECT_EQ(view.rows()[0].insertions, 3u);
        EXPECT_EQ(view.sort_key(), SortKey::Insertions);

        view.set_table(nullptr);
        EXPECT_EQ(&view.table(), replacement.get());
    }

    TEST_F(TableViewTest, FilesOfUsesCurrentSort) {
        TableView view(table, SortKey::Insertions);
        const auto files = view.files_of(kBob.key);
        ASSERT_EQ(files.size(), 1u);
        EXPECT_EQ(files[0].path, "Bob Jones.txt");
        EXPECT_EQ(files[0].insertions, 100u);
    }

    TEST(TableViewNullTest, NullTableIsEmpty) {
        const TableView view(nullptr);
        EXPECT_TRUE(view.rows().empty());
        EXPECT_TRUE(view.table().empty());
    }

}  // namespace gcs::stats
