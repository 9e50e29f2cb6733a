#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>
#include <functional>
#include <map>
#include <random>
#include <stdexcept>
#include <vector>

#include "engine/assembler.hpp"
#include "engine/combiner.hpp"
#include "engine/local_builder.hpp"
#include "engine/need_planner.hpp"
#include "test_helpers.hpp"

using namespace ddattr;
using namespace ddattr::testing;

namespace {

using emitted = std::vector<std::pair<contribution_key, contribution>>;

emitted run_builder(const job_params& p, const partition& part) {
    emitted out;
    build_local_contributions(p, part, [&out](contribution_key k, contribution c) {
        out.emplace_back(std::move(k), std::move(c));
    });
    return out;
}

const contribution* find_emitted(const emitted& e, attr_tag tag, const std::string& col = {}) {
    for (const auto& kv : e) if (kv.first == contribution_key{tag, col}) return &kv.second;
    return nullptr;
}

attribute_need need(std::initializer_list<const char*> names) {
    attribute_need n;
    for (const char* s : names) n[s] = true;
    return n;
}

}

// ---------- local builder ----------
TEST(LocalBuilder, EmitsOnlyNeededAttributes) {
    job_params p;
    p.needs = need({attr::n_row});
    p.needs[attr::n_div] = false;
    const auto out = run_builder(p, make_partition("k1", 4));

    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].first.tag, attr_tag::n_row);
    EXPECT_EQ(std::get<std::uint64_t>(out[0].second), 4u);
}

TEST(LocalBuilder, EmitsEveryAttributeWhenAllNeeded) {
    job_params p;
    p.needs = need({attr::keys, attr::tot_object_size, attr::split_size_distn, attr::n_div,
                    attr::n_row, attr::split_row_distn, attr::summary});
    p.estimate_size = [](const frame&) { return 123.0; };
    const auto out = run_builder(p, make_partition("k1", 3));

    EXPECT_EQ(std::get<double>(*find_emitted(out, attr_tag::tot_object_size)), 123.0);
    EXPECT_EQ(std::get<value_pool>(*find_emitted(out, attr_tag::split_size_distn)), value_pool{123.0});
    EXPECT_EQ(std::get<key_list>(*find_emitted(out, attr_tag::keys)), key_list{"k1"});
    EXPECT_EQ(std::get<std::uint64_t>(*find_emitted(out, attr_tag::n_div)), 1u);
    EXPECT_EQ(std::get<value_pool>(*find_emitted(out, attr_tag::split_row_distn)), value_pool{3.0});

    const auto& q = std::get<quant_partial>(*find_emitted(out, attr_tag::summary_quant, "x"));
    EXPECT_EQ(q.moments.n, 3u);
    EXPECT_EQ(*q.range.max, 2.0);
    const auto& f = std::get<frequency_accumulator>(*find_emitted(out, attr_tag::summary_categ, "g"));
    EXPECT_EQ(f.counts.at("a"), 2u);
    const auto& d = std::get<datetime_partial>(*find_emitted(out, attr_tag::summary_datetime, "t"));
    EXPECT_EQ(*d.range.min, 1000);
}

TEST(LocalBuilder, TransformAppliesToRowLevelAttributesOnly) {
    const auto part = make_partition("k1", 6);
    job_params p;
    p.needs = need({attr::tot_object_size, attr::n_row, attr::summary});
    // keep the first two rows
    p.trans_fn = transform_fn([](const std::string&, const frame& f) {
        frame out;
        for (const auto& c : f.columns) {
            if (const auto* n = std::get_if<numeric_column>(&c.data)) {
                out.columns.push_back(num_col(c.name, {n->values[0], n->values[1]}));
            }
        }
        return out;
    });
    const auto out = run_builder(p, part);

    EXPECT_EQ(std::get<double>(*find_emitted(out, attr_tag::tot_object_size)), estimate_object_size(part.value));
    EXPECT_EQ(std::get<std::uint64_t>(*find_emitted(out, attr_tag::n_row)), 2u);
    EXPECT_NE(find_emitted(out, attr_tag::summary_quant, "x"), nullptr);
    EXPECT_EQ(find_emitted(out, attr_tag::summary_categ, "g"), nullptr);
}

TEST(LocalBuilder, MissingValuesAndUnsupportedColumns) {
    partition part;
    part.key = "k";
    part.value.columns.push_back(num_col("x", {1.0, std::nullopt, std::nan("")}));
    part.value.columns.push_back(cat_col("g", {std::nullopt, "a", "a"}));
    part.value.columns.push_back(column{"blob", other_column{3, "list"}});

    job_params p;
    p.needs = need({attr::summary});
    const auto out = run_builder(p, part);

    ASSERT_EQ(out.size(), 2u);
    const auto& q = std::get<quant_partial>(*find_emitted(out, attr_tag::summary_quant, "x"));
    EXPECT_EQ(q.na_count, 2u);
    EXPECT_EQ(q.moments.n, 1u);
    const auto& f = std::get<frequency_accumulator>(*find_emitted(out, attr_tag::summary_categ, "g"));
    EXPECT_EQ(f.na_count, 1u);
    EXPECT_EQ(f.rows, 3u);
}

// ---------- combiner ----------
TEST(Combiner, FoldOrderDoesNotChangeFinalizedSummary) {
    std::vector<contribution> parts;
    std::mt19937_64 rng(3);
    std::uniform_real_distribution<double> du(-5.0, 20.0);
    for (int i = 0; i < 12; ++i) {
        numeric_column c;
        for (int j = 0; j < 5 + i; ++j) c.values.emplace_back(du(rng));
        if (i % 4 == 0) c.values.emplace_back(std::nullopt);
        parts.emplace_back(summarize_numeric(c));
    }
    parts.emplace_back(quant_partial{});   // all-missing / empty partition

    const contribution_key key{attr_tag::summary_quant, "x"};
    auto fold_left = [&](std::vector<contribution> v) {
        contribution acc = v[0];
        for (std::size_t i = 1; i < v.size(); ++i) acc = combine(key, acc, v[i]);
        return std::get<numeric_summary>(finalize(key, acc));
    };
    // pairwise tree fold
    std::function<contribution(std::size_t, std::size_t)> tree = [&](std::size_t lo, std::size_t hi) {
        if (hi - lo == 1) return parts[lo];
        const std::size_t mid = lo + (hi - lo) / 2;
        return combine(key, tree(mid, hi), tree(lo, mid));
    };

    const auto base = fold_left(parts);
    auto shuffled = parts;
    std::shuffle(shuffled.begin(), shuffled.end(), rng);
    const auto other = fold_left(shuffled);
    const auto treed = std::get<numeric_summary>(finalize(key, tree(0, parts.size())));

    for (const auto& s : {other, treed}) {
        EXPECT_EQ(s.na_count, base.na_count);
        EXPECT_EQ(*s.min, *base.min);
        EXPECT_EQ(*s.max, *base.max);
        EXPECT_NEAR(*s.stats.mean, *base.stats.mean, 1e-9);
        EXPECT_NEAR(*s.stats.variance, *base.stats.variance, 1e-9);
        EXPECT_NEAR(*s.stats.skewness, *base.stats.skewness, 1e-9);
        EXPECT_NEAR(*s.stats.kurtosis, *base.stats.kurtosis, 1e-9);
    }
    EXPECT_EQ(base.na_count, 3u);
}

TEST(Combiner, CountsSizesAndPools) {
    EXPECT_EQ(std::get<std::uint64_t>(combine({attr_tag::n_row, {}}, std::uint64_t{10}, std::uint64_t{5})), 15u);
    EXPECT_DOUBLE_EQ(std::get<double>(combine({attr_tag::tot_object_size, {}}, 1.5, 2.0)), 3.5);

    const auto keys = std::get<key_list>(combine({attr_tag::keys, {}}, key_list{"a"}, key_list{"b", "c"}));
    EXPECT_EQ(keys, (key_list{"a", "b", "c"}));

    const contribution_key rk{attr_tag::split_row_distn, {}};
    const auto pool = combine(rk, value_pool{10.0}, combine(rk, value_pool{0.0}, value_pool{5.0}));
    const auto t = std::get<percentile_table>(finalize(rk, pool));
    EXPECT_DOUBLE_EQ(*t[0].value, 0.0);
    EXPECT_DOUBLE_EQ(*t[50].value, 5.0);
    EXPECT_DOUBLE_EQ(*t[100].value, 10.0);
}

TEST(Combiner, DatetimeAndCategorical) {
    const contribution_key dk{attr_tag::summary_datetime, "t"};
    datetime_partial a, b;
    a.range.observe(50);
    b.na_count = 2;
    const auto d = std::get<datetime_summary>(finalize(dk, combine(dk, a, b)));
    EXPECT_EQ(d.na_count, 2u);
    EXPECT_EQ(*d.min, 50);
    EXPECT_EQ(*d.max, 50);

    const contribution_key ck{attr_tag::summary_categ, "g"};
    frequency_accumulator fa, fb;
    fa.cap = fb.cap = 1;
    fa.add("p");
    fb.add("q");
    const auto c = std::get<categorical_summary>(finalize(ck, combine(ck, fa, fb)));
    EXPECT_EQ(c.freq_table.size(), 1u);
    EXPECT_EQ(c.freq_table.at("p"), 1u);
    EXPECT_FALSE(c.complete);
}

TEST(Combiner, KindMismatchIsAnError) {
    EXPECT_THROW(combine({attr_tag::n_div, {}}, 1.0, std::uint64_t{1}), std::logic_error);
    EXPECT_THROW(finalize({attr_tag::summary_quant, "x"}, frequency_accumulator{}), std::logic_error);
}

// ---------- need planner ----------
TEST(NeedPlanner, DdoNeedsOnlyImplementedDdoAttributes) {
    const dataset ds(dataset_kind::ddo, {make_partition("k", 1)});
    const auto needs = plan_needs(ds, engine_config{});

    const attribute_need expected{{attr::keys, true}, {attr::tot_object_size, true},
                                  {attr::split_size_distn, true}, {attr::n_div, true}};
    EXPECT_EQ(needs, expected);
}

TEST(NeedPlanner, DdfAddsRowLevelAttributesAndSkipsKnownOnes) {
    dataset ds(dataset_kind::ddf, {make_partition("k", 1)});
    global_attributes known;
    known.n_row = 7;
    known.n_div = 1;
    ds.set_attributes(known);

    const auto needs = plan_needs(ds, engine_config{});
    EXPECT_EQ(needs.size(), 7u);
    EXPECT_FALSE(needs.at(attr::n_row));
    EXPECT_FALSE(needs.at(attr::n_div));
    EXPECT_TRUE(needs.at(attr::summary));
    EXPECT_TRUE(needs.at(attr::split_row_distn));
    EXPECT_EQ(needs.count(attr::vars), 0u);
    EXPECT_EQ(needs.count(attr::example), 0u);
}

TEST(NeedPlanner, HonoursImplementedSet) {
    const dataset ds(dataset_kind::ddf, {make_partition("k", 1)});
    engine_config cfg;
    cfg.implemented.erase(attr::summary);
    cfg.required_ddf.insert("somethingElse");
    const auto needs = plan_needs(ds, cfg);
    EXPECT_EQ(needs.count(attr::summary), 0u);
    EXPECT_EQ(needs.count("somethingElse"), 0u);
}

TEST(NeedPlanner, TransformedViewIsRejected) {
    const dataset base(dataset_kind::ddf, {make_partition("k", 2)});
    const auto view = base.add_transform([](const std::string&, const frame& f) { return f; });
    EXPECT_FALSE(base.transformed());
    EXPECT_TRUE(view.transformed());
    EXPECT_THROW(plan_needs(view, engine_config{}), precondition_error);
}

// ---------- assembler ----------
TEST(Assembler, OrdersSummariesByVarsAndDropsUndeclaredColumns) {
    dataset ds(dataset_kind::ddf, {make_partition("k", 1)});
    ds.set_vars({"t", "x", "g"});

    numeric_summary x;
    x.min = 1.0;
    categorical_summary g;
    datetime_summary t;
    t.min = 5;
    result_set rs;
    rs.emplace_back(contribution_key{attr_tag::summary_categ, "g"}, g);
    rs.emplace_back(contribution_key{attr_tag::summary_quant, "x"}, x);
    rs.emplace_back(contribution_key{attr_tag::summary_quant, "zz"}, x);
    rs.emplace_back(contribution_key{attr_tag::summary_datetime, "t"}, t);
    rs.emplace_back(contribution_key{attr_tag::keys, {}}, key_list{"k1", "k2"});

    const auto a = assemble_attributes(ds, need({attr::summary, attr::keys}), rs);
    ASSERT_TRUE(a.summary);
    ASSERT_EQ(a.summary->size(), 3u);
    EXPECT_EQ((*a.summary)[0].first, "t");
    EXPECT_EQ((*a.summary)[1].first, "x");
    EXPECT_EQ((*a.summary)[2].first, "g");
    EXPECT_EQ(a.find_summary("zz"), nullptr);

    ASSERT_TRUE(a.key_hashes);
    EXPECT_EQ(*a.key_hashes, (std::vector<std::string>{key_hash("k1"), key_hash("k2")}));
    EXPECT_FALSE(a.n_row);
}

TEST(Assembler, NeededAttributesWithoutContributionsGetEmptyValues) {
    const dataset ds(dataset_kind::ddf, {});
    const auto a = assemble_attributes(
        ds, need({attr::n_row, attr::n_div, attr::keys, attr::split_row_distn, attr::summary}), {});
    EXPECT_EQ(*a.n_row, 0u);
    EXPECT_EQ(*a.n_div, 0u);
    EXPECT_TRUE(a.keys->empty());
    EXPECT_TRUE(a.key_hashes->empty());
    EXPECT_EQ(a.split_row_distn->size(), percentile_points);
    EXPECT_TRUE(a.summary->empty());
    EXPECT_FALSE(a.tot_object_size);
}
