#pragma once

#include "TestModels.hpp"
#include "TestSupport.hpp"
#include <cassert>
#include <iostream>
#include <string>
#include <vector>

namespace query_tests {

using test_support::throws;

template<typename T>
std::vector<int64_t> ids_of(const strata::query<T>& q) {
    std::vector<int64_t> ids;
    for (auto object : q) {
        ids.push_back(*object.id());
    }
    return ids;
}

std::vector<int64_t> range_ids(int64_t first, int64_t last) {
    std::vector<int64_t> ids;
    for (int64_t i = first; i <= last; ++i) {
        ids.push_back(i);
    }
    return ids;
}

void populate_samples(strata::strata_db& db, int n) {
    for (int i = 1; i <= n; ++i) {
        db.create<Sample>({{"name", "s" + std::to_string(i)}, {"count", i % 5}});
    }
}

// ============================================================================
// test_filters_and_operators
// ============================================================================

void test_filters_and_operators() {
    std::cout << "  test_filters_and_operators..." << std::flush;

    auto db = test_support::fresh_db();
    populate_samples(db, 10);

    auto all = db.all<Sample>();
    assert(all.count() == 10);
    assert(db.filter<Sample>("name", "s3").count() == 1);
    assert(all.where("count", 0).count() == 2);
    assert(all.where("count__gt", 3).count() == 2);
    assert(all.where("count__gte", 3).count() == 4);
    assert(all.where("count__lt", 1).count() == 2);
    assert(all.where("count__lte", 1).count() == 4);
    assert(all.where("count", strata::cmp_op::gte, 4).count() == 2);
    assert(all.where("id__gt", 7).count() == 3);

    // terms combine with AND
    assert(all.where({{"count__gte", 1}, {"count__lte", 2}, {"id__gt", 5}}).count() == 2);
    assert(all.where("count__gt", 0).where("count__lt", 4).count() == 6);

    // filters never mutate the source query
    assert(all.count() == 10);
    assert(all.spec().filters.empty());

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_filter_validation
// ============================================================================

void test_filter_validation() {
    std::cout << "  test_filter_validation..." << std::flush;

    auto db = test_support::fresh_db();
    auto all = db.all<Sample>();

    assert(throws<strata::validation_error>([&] { all.where("missing", 1); }));
    assert(throws<strata::validation_error>([&] { all.where("count__between", 1); }));
    assert(throws<strata::validation_error>([&] { all.where("count__gt", nullptr); }));
    assert(throws<strata::validation_error>([&] { all.where("count", "text"); }));
    assert(throws<strata::validation_error>([&] { all.where("count", 1).where("count", 2); }));
    assert(throws<strata::validation_error>([&] { all.where({{"count__lt", 1}, {"count__lt", 2}}); }));
    assert(throws<strata::validation_error>([&] { all.order_by({"-missing"}); }));

    // the same field under different operators is fine
    auto window = all.where("count__gt", 1).where("count__lt", 4);
    assert(window.spec().filters.size() == 2);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_reference_and_null_filters
// ============================================================================

void test_reference_and_null_filters() {
    std::cout << "  test_reference_and_null_filters..." << std::flush;

    auto db = test_support::fresh_db();
    auto p = db.create<Sample1>({{"name", "p"}});
    auto q = db.create<Sample1>({{"name", "q"}});
    db.create<Sample3>({{"sample1", p}});
    db.create<Sample3>({{"sample1", p}});
    db.create<Sample3>({{"sample1", q}});
    db.create<Sample3>({{"sample1", nullptr}});

    assert(db.filter<Sample3>("sample1", p).count() == 2);
    assert(db.filter<Sample3>("sample1", *q.id()).count() == 1);
    assert(db.filter<Sample3>("sample1", nullptr).count() == 1);

    // referencing the wrong entity, or an unsaved one, is refused
    auto other = db.create<Sample>({{"name", "x"}});
    assert(throws<strata::validation_error>([&] { db.filter<Sample3>("sample1", other); }));
    auto unsaved = db.new_empty<Sample1>();
    assert(throws<strata::validation_error>([&] { db.filter<Sample3>("sample1", unsaved); }));

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_ordering_and_slicing
// ============================================================================

void test_ordering_and_slicing() {
    std::cout << "  test_ordering_and_slicing..." << std::flush;

    auto db = test_support::fresh_db();
    populate_samples(db, 10);
    auto all = db.all<Sample>();

    auto newest = all.order_by({"-id"});
    assert((ids_of(newest.slice(0, 3)) == std::vector<int64_t>{10, 9, 8}));
    assert((ids_of(newest.slice(8)) == std::vector<int64_t>{2, 1}));
    assert((ids_of(all.order_by({"id"}).slice(2, 5)) == std::vector<int64_t>{3, 4, 5}));

    // secondary keys break ties
    auto by_count = all.order_by({"count", "-id"}).slice(0, 4);
    assert((ids_of(by_count) == std::vector<int64_t>{10, 5, 6, 1}));

    // a later order_by replaces the earlier one
    assert(all.order_by({"-id"}).order_by({"+id"}).first()->id() == 1);

    // empty and inverted windows
    assert(ids_of(newest.slice(20)).empty());
    assert(ids_of(newest.slice(5, 5)).empty());
    assert(ids_of(newest.slice(6, 2)).empty());

    assert(throws<strata::validation_error>([&] { all.slice(-1); }));
    assert(throws<strata::validation_error>([&] { all.slice(0, -2); }));
    assert(throws<strata::validation_error>([&] { all.slice(1, 5).slice(0, 2); }));

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_count_matches_iteration - count ignores the window
// ============================================================================

void test_count_matches_iteration() {
    std::cout << "  test_count_matches_iteration..." << std::flush;

    auto db = test_support::fresh_db();
    populate_samples(db, 12);

    auto filtered = db.all<Sample>().where("count__gte", 2);
    assert(filtered.count() == static_cast<int64_t>(filtered.to_vector().size()));
    assert(filtered.count() == static_cast<int64_t>(ids_of(filtered).size()));

    auto windowed = filtered.order_by({"id"}).slice(1, 3);
    assert(windowed.to_vector().size() == 2);
    assert(windowed.count() == filtered.count());

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_iteration_is_restartable - each pass re-runs the query
// ============================================================================

void test_iteration_is_restartable() {
    std::cout << "  test_iteration_is_restartable..." << std::flush;

    auto db = test_support::fresh_db();
    populate_samples(db, 3);
    auto q = db.all<Sample>().order_by({"id"});

    assert(ids_of(q) == range_ids(1, 3));
    db.create<Sample>({{"name", "late"}});
    assert(ids_of(q) == range_ids(1, 4));

    // instances are materialized as they are reached
    auto it = q.begin();
    auto first = *it;
    assert(first.get<std::string>("name") == "s1");
    ++it;
    assert((*it).id() == 2);
    assert(it != q.end());

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_single_row_access
// ============================================================================

void test_single_row_access() {
    std::cout << "  test_single_row_access..." << std::flush;

    auto db = test_support::fresh_db();
    populate_samples(db, 5);

    auto one = db.all<Sample>().where("name", "s2").get_one();
    assert(one.id() == 2);

    assert(throws<strata::not_found_error>([&] { db.filter<Sample>("name", "nope").get_one(); }));
    assert(throws<strata::ambiguous_result_error>([&] { db.filter<Sample>("count__gt", 1).get_one(); }));
    assert(throws<strata::not_found_error>([&] { db.find<Sample>(99); }));

    assert(!db.filter<Sample>("name", "nope").get_opt());
    assert(db.filter<Sample>("name", "s4").get_opt()->id() == 4);
    assert(throws<strata::ambiguous_result_error>([&] { db.all<Sample>().get_opt(); }));

    assert(db.all<Sample>().order_by({"-count", "id"}).first()->id() == 4);
    assert(!db.filter<Sample>("count__gt", 10).first());

    // the window applies before the uniqueness check
    assert(db.all<Sample>().order_by({"id"}).slice(2, 3).get_one().id() == 3);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_windowed_delete - only the matched window goes
// ============================================================================

void test_windowed_delete() {
    std::cout << "  test_windowed_delete..." << std::flush;

    auto db = test_support::fresh_db();
    populate_samples(db, 20);

    // keep the ten newest
    auto removed = db.all<Sample>().order_by({"-id"}).slice(10).remove();
    assert(removed == 10);
    assert(db.all<Sample>().count() == 10);
    assert(ids_of(db.all<Sample>().order_by({"id"})) == range_ids(11, 20));

    // filtered delete, no window
    assert(db.filter<Sample>("id__gt", 18).remove() == 2);
    assert(db.all<Sample>().count() == 8);

    // entities with dependents go through the cascade row by row
    for (int i = 1; i <= 6; ++i) {
        auto parent = db.create<Sample1>({{"name", "p" + std::to_string(i)}});
        db.create<Sample2>({{"sample1", parent}});
        db.create<Sample3>({{"sample1", parent}});
    }
    removed = db.all<Sample1>().order_by({"id"}).slice(0, 4).remove();
    assert(removed == 4);
    assert(ids_of(db.all<Sample1>().order_by({"id"})) == range_ids(5, 6));
    assert(db.all<Sample2>().count() == 2);
    assert(db.all<Sample3>().count() == 6);
    assert(db.filter<Sample3>("sample1", nullptr).count() == 4);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_keep_newest_sessions - ordered, sliced bulk delete
// ============================================================================

void test_keep_newest_sessions() {
    std::cout << "  test_keep_newest_sessions..." << std::flush;

    auto db = test_support::fresh_db();
    for (int i = 0; i < 8; ++i) {
        // activity out of insertion order
        double activity = static_cast<double>((i * 5) % 8);
        db.create<Session>({{"token", "t" + std::to_string(i)}, {"last_activity", activity}});
    }

    const int keep = 3;
    db.all<Session>().order_by({"-last_activity"}).slice(keep).remove();

    assert(db.all<Session>().count() == keep);
    std::vector<double> remaining;
    for (auto s : db.all<Session>().order_by({"-last_activity"})) {
        remaining.push_back(s.get<double>("last_activity"));
    }
    assert((remaining == std::vector<double>{7.0, 6.0, 5.0}));

    std::cout << " OK" << std::endl;
}

void run_all() {
    std::cout << "Query tests:" << std::endl;
    test_filters_and_operators();
    test_filter_validation();
    test_reference_and_null_filters();
    test_ordering_and_slicing();
    test_count_matches_iteration();
    test_iteration_is_restartable();
    test_single_row_access();
    test_windowed_delete();
    test_keep_newest_sessions();
}

} // namespace query_tests
