#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <stdexcept>
#include <string>
#include <vector>

#include "engine/update_attributes.hpp"
#include "exec/local_executor.hpp"
#include "test_helpers.hpp"
#include "util/log.hpp"

using namespace ddattr;
using namespace ddattr::testing;

namespace {

class UpdateAttributesTest : public ::testing::Test {
protected:
    void SetUp() override { ddattr::log::set_quiet(true); }
    void TearDown() override { ddattr::log::set_quiet(false); }

    static dataset three_partitions() {
        return dataset(dataset_kind::ddf, {make_partition("p1", 10), make_partition("p2", 0),
                                           make_partition("p3", 5, 100.0)});
    }

    local_executor exec;
};

}

TEST_F(UpdateAttributesTest, ComputesRowCountsAcrossEmptyPartitions) {
    auto ds = three_partitions();
    const auto report = update_attributes(ds, exec);
    EXPECT_TRUE(report.computed);

    const auto& a = ds.attributes();
    EXPECT_EQ(*a.n_row, 15u);
    EXPECT_EQ(*a.n_div, 3u);
    ASSERT_TRUE(a.split_row_distn);
    EXPECT_DOUBLE_EQ(*(*a.split_row_distn)[0].value, 0.0);
    EXPECT_DOUBLE_EQ(*(*a.split_row_distn)[50].value, 5.0);
    EXPECT_DOUBLE_EQ(*(*a.split_row_distn)[100].value, 10.0);

    auto keys = *a.keys;
    std::sort(keys.begin(), keys.end());
    EXPECT_EQ(keys, (key_list{"p1", "p2", "p3"}));
    ASSERT_TRUE(a.key_hashes);
    EXPECT_EQ(a.key_hashes->size(), 3u);

    double total = 0.0;
    for (const auto& p : ds.partitions()) total += estimate_object_size(p.value);
    EXPECT_DOUBLE_EQ(*a.tot_object_size, total);
}

TEST_F(UpdateAttributesTest, SummariesMatchPooledData) {
    auto ds = three_partitions();
    update_attributes(ds, exec);
    const auto& a = ds.attributes();
    ASSERT_TRUE(a.summary);
    ASSERT_EQ(a.summary->size(), 3u);
    EXPECT_EQ((*a.summary)[0].first, "x");
    EXPECT_EQ((*a.summary)[1].first, "g");
    EXPECT_EQ((*a.summary)[2].first, "t");

    // x = 0..9 and 100..104
    moment_accumulator direct;
    for (int i = 0; i < 10; ++i) direct.push(i);
    for (int i = 0; i < 5; ++i) direct.push(100.0 + i);
    const auto expected = to_statistics(direct);

    const auto& x = std::get<numeric_summary>(*a.find_summary("x"));
    EXPECT_EQ(x.na_count, 0u);
    EXPECT_EQ(*x.min, 0.0);
    EXPECT_EQ(*x.max, 104.0);
    EXPECT_NEAR(*x.stats.mean, *expected.mean, 1e-9);
    EXPECT_NEAR(*x.stats.variance, *expected.variance, 1e-7);

    const auto& g = std::get<categorical_summary>(*a.find_summary("g"));
    EXPECT_EQ(g.freq_table.at("a"), 8u);
    EXPECT_EQ(g.freq_table.at("b"), 7u);
    EXPECT_TRUE(g.complete);

    const auto& t = std::get<datetime_summary>(*a.find_summary("t"));
    EXPECT_EQ(*t.min, 1000);
    EXPECT_EQ(*t.max, 1009);
}

TEST_F(UpdateAttributesTest, SecondCallIsANoOp) {
    auto ds = three_partitions();
    ASSERT_TRUE(update_attributes(ds, exec).computed);
    const auto before = ds.attributes();

    const auto again = update_attributes(ds, exec);
    EXPECT_FALSE(again.computed);
    EXPECT_TRUE(again.attributes.empty());
    EXPECT_EQ(*ds.attributes().n_row, *before.n_row);
    EXPECT_EQ(*ds.attributes().keys, *before.keys);
    EXPECT_EQ(ds.attributes().summary->size(), before.summary->size());
}

TEST_F(UpdateAttributesTest, OnlyMissingAttributesAreComputed) {
    auto ds = three_partitions();
    global_attributes known;
    known.n_row = 999;   // deliberately wrong: must not be recomputed
    ds.set_attributes(known);

    const auto report = update_attributes(ds, exec);
    EXPECT_TRUE(report.computed);
    EXPECT_EQ(std::count(report.attributes.begin(), report.attributes.end(), attr::n_row), 0);
    EXPECT_EQ(*ds.attributes().n_row, 999u);
    EXPECT_EQ(*ds.attributes().n_div, 3u);
}

TEST_F(UpdateAttributesTest, DdoGetsNoRowLevelAttributes) {
    dataset ds(dataset_kind::ddo, {make_partition("p1", 3)});
    update_attributes(ds, exec);
    EXPECT_TRUE(ds.attributes().n_div);
    EXPECT_TRUE(ds.attributes().split_size_distn);
    EXPECT_FALSE(ds.attributes().n_row);
    EXPECT_FALSE(ds.attributes().summary);
}

TEST_F(UpdateAttributesTest, TransformChangesRowCountsButNotSizes) {
    auto ds = three_partitions();
    ds.set_trans_fn([](const std::string&, const frame& f) {
        frame out;
        out.columns.push_back(num_col("x", std::vector<std::optional<double>>(f.rows() > 0 ? 1 : 0, 1.0)));
        return out;
    });
    update_attributes(ds, exec, {}, [](const frame&) { return 10.0; });

    const auto& a = ds.attributes();
    EXPECT_EQ(*a.n_row, 2u);
    EXPECT_DOUBLE_EQ(*a.tot_object_size, 30.0);
    ASSERT_EQ(a.summary->size(), 1u);
    EXPECT_DOUBLE_EQ(*std::get<numeric_summary>(*a.find_summary("x")).stats.mean, 1.0);
}

TEST_F(UpdateAttributesTest, TransformedViewFailsBeforeAnyWork) {
    const auto base = three_partitions();
    auto view = base.add_transform([](const std::string&, const frame& f) { return f; });
    EXPECT_THROW(update_attributes(view, exec), precondition_error);
    EXPECT_TRUE(view.attributes().empty());
}

TEST_F(UpdateAttributesTest, MapFailureFailsTheWholeCall) {
    auto ds = three_partitions();
    ds.set_trans_fn([](const std::string& key, const frame& f) -> frame {
        if (key == "p3") throw std::runtime_error("bad partition");
        return f;
    });
    EXPECT_THROW(update_attributes(ds, exec), std::runtime_error);
    EXPECT_TRUE(ds.attributes().empty());
}

TEST_F(UpdateAttributesTest, CategoryCapIsApplied) {
    auto ds = three_partitions();
    engine_config cfg;
    cfg.max_categories = 1;
    exec_config one;
    one.workers = 1;
    update_attributes(ds, exec, cfg, estimate_object_size, one);
    const auto& g = std::get<categorical_summary>(*ds.attributes().find_summary("g"));
    EXPECT_EQ(g.freq_table.size(), 1u);
    EXPECT_FALSE(g.complete);
}

TEST_F(UpdateAttributesTest, CategoryCapAcrossPartitions) {
    auto one_column = [](const std::string& key, std::vector<std::optional<std::string>> g) {
        partition p;
        p.key = key;
        p.value.columns.push_back(cat_col("g", std::move(g)));
        return p;
    };
    const std::vector<partition> parts{one_column("p1", {"a", "a"}), one_column("p2", {"b"}),
                                       one_column("p3", {"c"})};
    engine_config cfg;
    cfg.max_categories = 2;

    for (std::size_t w : {1u, 3u}) {
        dataset ds(dataset_kind::ddf, parts);
        exec_config ec;
        ec.workers = w;
        update_attributes(ds, exec, cfg, estimate_object_size, ec);

        const auto& g = std::get<categorical_summary>(*ds.attributes().find_summary("g"));
        EXPECT_EQ(g.freq_table.size(), 2u);
        EXPECT_FALSE(g.complete);
        EXPECT_EQ(*ds.attributes().n_row, 4u);
        if (w == 1) {
            EXPECT_EQ(g.freq_table.at("a"), 2u);
            EXPECT_EQ(g.freq_table.at("b"), 1u);
        }
    }
}

TEST_F(UpdateAttributesTest, EmptyDatasetStillGetsEveryAttribute) {
    dataset ds(dataset_kind::ddf, {});
    const auto report = update_attributes(ds, exec);
    EXPECT_TRUE(report.computed);
    EXPECT_EQ(*ds.attributes().n_row, 0u);
    EXPECT_EQ(*ds.attributes().n_div, 0u);
    EXPECT_TRUE(ds.attributes().summary->empty());
    EXPECT_FALSE((*ds.attributes().split_row_distn)[0].value);
}

// ---------- local executor ----------
TEST(LocalExecutor, WorkerCountDoesNotChangeResults) {
    std::vector<partition> parts;
    for (int i = 0; i < 23; ++i) parts.push_back(make_partition("k" + std::to_string(i), i % 6, i * 3.0));

    ddattr::log::set_quiet(true);
    std::vector<global_attributes> runs;
    for (std::size_t w : {1u, 2u, 4u, 64u}) {
        dataset ds(dataset_kind::ddf, parts);
        local_executor exec;
        exec_config cfg;
        cfg.workers = w;
        update_attributes(ds, exec, {}, estimate_object_size, cfg);
        runs.push_back(ds.attributes());
    }
    ddattr::log::set_quiet(false);

    const auto& first = runs.front();
    for (const auto& r : runs) {
        EXPECT_EQ(*r.n_row, *first.n_row);
        EXPECT_EQ(*r.n_div, 23u);
        const auto& x0 = std::get<numeric_summary>(*first.find_summary("x"));
        const auto& x = std::get<numeric_summary>(*r.find_summary("x"));
        EXPECT_NEAR(*x.stats.mean, *x0.stats.mean, 1e-9);
        EXPECT_NEAR(*x.stats.variance, *x0.stats.variance, 1e-7);
        EXPECT_EQ(std::get<categorical_summary>(*r.find_summary("g")).freq_table,
                  std::get<categorical_summary>(*first.find_summary("g")).freq_table);
    }
}

TEST(LocalExecutor, RunsSetupOncePerSlice) {
    std::vector<partition> parts;
    for (int i = 0; i < 8; ++i) parts.push_back(make_partition("k" + std::to_string(i), 1));

    std::atomic<int> setups{0};
    mr_job job;
    job.setup = [&setups]() { ++setups; };
    job.map = build_local_contributions;
    job.combine = combine;
    job.finalize = finalize;
    job.params.needs[attr::n_div] = true;
    job.config.workers = 4;

    local_executor exec;
    const auto out = exec.run(parts, job);
    EXPECT_EQ(setups.load(), 4);
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(std::get<std::uint64_t>(out[0].second), 8u);
}
