#pragma once

#include "TestModels.hpp"
#include "TestSupport.hpp"
#include <cassert>
#include <iostream>
#include <string>

namespace object_tests {

using test_support::throws;

// ============================================================================
// test_full_construction - inserts immediately, assigns ids
// ============================================================================

void test_full_construction() {
    std::cout << "  test_full_construction..." << std::flush;

    auto db = test_support::fresh_db();

    auto a = db.create<Sample>({{"name", "a"}, {"count", 5}});
    assert(a.is_persisted());
    assert(a.id() == 1);
    assert(a.get<std::string>("name") == "a");
    assert(a.get<int64_t>("count") == 5);

    // positional, with the trailing default applied
    auto b = db.create<Sample>("b");
    assert(b.id() == 2);
    assert(b.get<int64_t>("count") == 0);
    assert(db.all<Sample>().count() == 2);

    // integers widen into floating point fields
    auto s = db.create<Session>({{"token", "t"}, {"last_activity", 3}});
    assert(s.get<double>("last_activity") == 3.0);

    // keyword-only entities refuse positional values
    assert(throws<strata::validation_error>([&] { db.create<Profile>(1, "x"); }));
    auto p = db.create<Profile>({{"handle", "x"}});
    assert(p.get<int64_t>("score") == 0);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_construction_errors
// ============================================================================

void test_construction_errors() {
    std::cout << "  test_construction_errors..." << std::flush;

    auto db = test_support::fresh_db();

    // missing non-defaulted field
    assert(throws<strata::validation_error>([&] { db.create<Sample>({{"count", 1}}); }));
    // unknown field
    assert(throws<strata::validation_error>([&] { db.create<Sample>({{"name", "a"}, {"colour", 1}}); }));
    // same field twice
    assert(throws<strata::validation_error>([&] { db.create<Sample>({{"name", "a"}, {"name", "b"}}); }));
    // too many positional values
    assert(throws<strata::validation_error>([&] { db.create<Sample>("a", 1, 2); }));
    // wrong type
    assert(throws<strata::validation_error>([&] { db.create<Sample>({{"name", 12}}); }));
    assert(throws<strata::validation_error>([&] { db.create<Sample>({{"name", "a"}, {"count", "many"}}); }));
    // null into a non-nullable field
    assert(throws<strata::validation_error>([&] { db.create<Sample>({{"name", nullptr}}); }));
    // negative explicit id
    assert(throws<strata::validation_error>([&] { db.create<Sample>({{"name", "a"}, {"id", -3}}); }));

    // nothing was written
    assert(db.all<Sample>().count() == 0);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_uniqueness - a second equal unique value raises already_exists
// ============================================================================

void test_uniqueness() {
    std::cout << "  test_uniqueness..." << std::flush;

    auto db = test_support::fresh_db();

    db.create<Sample1>({{"name", "x"}});
    assert(throws<strata::already_exists_error>([&] { db.create<Sample1>({{"name", "x"}}); }));

    // via save of a transient instance
    auto empty = db.new_empty<Sample1>();
    empty.set("name", "x");
    assert(throws<strata::already_exists_error>([&] { empty.save(); }));
    assert(!empty.is_persisted());

    // via update of a persisted one
    auto y = db.create<Sample1>({{"name", "y"}});
    y.set("name", "x");
    assert(throws<strata::already_exists_error>([&] { y.save(); }));

    // explicit id collisions are uniqueness violations too
    assert(throws<strata::already_exists_error>([&] {
        db.create<Sample1>({{"name", "z"}, {"id", *y.id()}});
    }));

    assert(db.all<Sample1>().count() == 2);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_empty_construction_and_save
// ============================================================================

void test_empty_construction_and_save() {
    std::cout << "  test_empty_construction_and_save..." << std::flush;

    auto db = test_support::fresh_db();

    auto s = db.new_empty<Sample>();
    assert(s.state() == strata::object_state::transient);
    assert(!s.id());
    assert(s.get<int64_t>("count") == 0);
    assert(!s.has_value("name"));
    assert(db.all<Sample>().count() == 0);

    // missing required field surfaces at save time
    assert(throws<strata::validation_error>([&] { s.save(); }));

    s.set("name", "late");
    s.save();
    assert(s.is_persisted());
    assert(s.id() == 1);
    assert(db.find<Sample>(1).get<std::string>("name") == "late");

    // default factories run once per new instance
    auto e1 = db.new_empty<Event>();
    auto e2 = db.new_empty<Event>();
    assert(e1.get<priority>("level") == priority::normal);
    assert(e1.get<strata::timestamp_t>("at") <= e2.get<strata::timestamp_t>("at"));

    // explicit id for administrative re-creation
    auto restored = db.new_empty<Sample>();
    restored.set("name", "restored").set_id(100).save();
    assert(restored.id() == 100);
    assert(db.find<Sample>(100).get<std::string>("name") == "restored");

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_full_row_overwrite - save writes every field, others unchanged
// ============================================================================

void test_full_row_overwrite() {
    std::cout << "  test_full_row_overwrite..." << std::flush;

    auto db = test_support::fresh_db();
    auto at = now_micros();
    strata::bytes_t data{1, 2, 3};

    auto obj = db.create<AllTypes>({{"i", 7}, {"r", 1.5}, {"flag", true}, {"text", "before"},
                                    {"data", data}, {"at", at}, {"note", nullptr}});

    obj.set("text", "after");
    obj.save();

    auto loaded = db.find<AllTypes>(*obj.id());
    assert(loaded.get<std::string>("text") == "after");
    assert(loaded.get<int64_t>("i") == 7);
    assert(loaded.get<double>("r") == 1.5);
    assert(loaded.get<bool>("flag") == true);
    assert(loaded.get<strata::bytes_t>("data") == data);
    assert(loaded.get<strata::timestamp_t>("at") == at);
    assert(loaded.is_null("note"));
    assert(!loaded.get_opt<std::string>("note"));

    // a stale copy overwrites everything it holds: last save wins
    loaded.set("note", "from loaded").save();
    obj.set("i", 8).save();
    auto final_row = db.find<AllTypes>(*obj.id());
    assert(final_row.get<int64_t>("i") == 8);
    assert(final_row.is_null("note"));

    // field writes stay in memory until save
    obj.set("i", 9);
    assert(db.find<AllTypes>(*obj.id()).get<int64_t>("i") == 8);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_lazy_reference - exactly one fetch, memoized in place
// ============================================================================

void test_lazy_reference() {
    std::cout << "  test_lazy_reference..." << std::flush;

    auto db = test_support::fresh_db();
    auto s1 = db.create<Sample1>({{"name", "parent"}});
    auto s2 = db.create<Sample2>({{"sample1", s1}});

    auto loaded = db.find<Sample2>(*s2.id());
    assert(loaded.ref_id("sample1") == s1.id());

    int fetches = 0;
    db.db().set_trace([&](const std::string& sql) {
        if (sql.find("FROM sample1") != std::string::npos) {
            ++fetches;
        }
    });

    auto first = loaded.ref<Sample1>("sample1");
    auto second = loaded.ref<Sample1>("sample1");
    db.db().set_trace(nullptr);

    assert(fetches == 1);
    assert(first.base() == second.base());
    assert(first.get<std::string>("name") == "parent");
    assert(first == s1);

    // asking for the wrong entity type is rejected before any fetch
    assert(throws<strata::validation_error>([&] { loaded.ref<Sample>("sample1"); }));

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_reference_assignment
// ============================================================================

void test_reference_assignment() {
    std::cout << "  test_reference_assignment..." << std::flush;

    auto db = test_support::fresh_db();
    auto a = db.create<Sample1>({{"name", "a"}});
    auto b = db.create<Sample1>({{"name", "b"}});

    auto s3 = db.create<Sample3>({{"sample1", nullptr}});
    assert(!s3.ref_opt<Sample1>("sample1"));
    assert(throws<strata::validation_error>([&] { s3.ref<Sample1>("sample1"); }));

    s3.set("sample1", a).save();
    assert(db.find<Sample3>(*s3.id()).ref<Sample1>("sample1").get<std::string>("name") == "a");

    s3.set("sample1", b).save();
    assert(db.find<Sample3>(*s3.id()).ref_id("sample1") == b.id());

    // unsaved targets and wrong entity types are refused
    auto unsaved = db.new_empty<Sample1>();
    assert(throws<strata::validation_error>([&] { s3.set("sample1", unsaved); }));
    auto other = db.create<Sample>({{"name", "x"}});
    assert(throws<strata::validation_error>([&] { s3.set("sample1", other); }));

    // non-nullable references cannot be cleared
    auto s2 = db.create<Sample2>({{"sample1", a}});
    assert(throws<strata::validation_error>([&] { s2.set_null("sample1"); }));

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_stale_instances - deleted rows fail loudly
// ============================================================================

void test_stale_instances() {
    std::cout << "  test_stale_instances..." << std::flush;

    auto db = test_support::fresh_db();
    auto s1 = db.create<Sample1>({{"name", "gone"}});
    auto s2 = db.create<Sample2>({{"sample1", s1}});
    auto copy = db.find<Sample1>(*s1.id());
    auto child = db.find<Sample2>(*s2.id());

    s1.remove();
    assert(s1.is_stale());
    assert(throws<strata::consistency_error>([&] { s1.save(); }));
    assert(throws<strata::consistency_error>([&] { s1.remove(); }));

    // a second handle to the deleted row finds out at save time
    copy.set("name", "resurrected");
    assert(throws<strata::consistency_error>([&] { copy.save(); }));
    assert(copy.is_stale());

    // the child row went with the cascade; its handle finds out at save time
    assert(child.is_persisted());
    assert(throws<strata::consistency_error>([&] { child.save(); }));
    assert(child.is_stale());
    assert(throws<strata::consistency_error>([&] { child.ref<Sample1>("sample1"); }));

    // a handle still holding the deleted parent refuses to write it
    assert(throws<strata::consistency_error>([&] { s2.save(); }));

    // transient instances have nothing to delete
    auto fresh = db.new_empty<Sample1>();
    assert(throws<strata::validation_error>([&] { fresh.remove(); }));

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_missing_referenced_row - dangling reference is a consistency error
// ============================================================================

void test_missing_referenced_row() {
    std::cout << "  test_missing_referenced_row..." << std::flush;

    auto db = test_support::fresh_db();
    auto s1 = db.create<Sample1>({{"name", "p"}});
    auto s2 = db.create<Sample2>({{"sample1", s1}});

    // bypass the cascade engine
    db.execute("DELETE FROM sample1 WHERE id = ?", {*s1.id()});

    auto loaded = db.find<Sample2>(*s2.id());
    assert(throws<strata::consistency_error>([&] { loaded.ref<Sample1>("sample1"); }));

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_rekey - administrative id change on a persisted row
// ============================================================================

void test_rekey() {
    std::cout << "  test_rekey..." << std::flush;

    auto db = test_support::fresh_db();
    auto s = db.create<Sample>({{"name", "k"}});
    assert(s.id() == 1);

    s.set_id(50).save();
    assert(s.id() == 50);
    assert(db.find<Sample>(50).get<std::string>("name") == "k");
    assert(throws<strata::not_found_error>([&] { db.find<Sample>(1); }));

    // later saves address the new id
    s.set("count", 2).save();
    assert(db.find<Sample>(50).get<int64_t>("count") == 2);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_rekey_moves_references - rows pointing at the old id follow it
// ============================================================================

void test_rekey_moves_references() {
    std::cout << "  test_rekey_moves_references..." << std::flush;

    auto db = test_support::fresh_db();
    auto parent = db.create<Sample1>({{"name", "p"}});
    auto child = db.create<Sample2>({{"sample1", parent}});
    auto optional_child = db.create<Sample3>({{"sample1", parent}, {"label", "o"}});
    assert(parent.id() == 1);

    parent.set_id(50).save();
    assert(db.find<Sample2>(*child.id()).ref_id("sample1") == 50);
    assert(db.find<Sample3>(*optional_child.id()).ref_id("sample1") == 50);
    assert(db.find<Sample2>(*child.id()).ref<Sample1>("sample1").get<std::string>("name") == "p");
    assert(db.filter<Sample2>("sample1", int64_t(1)).count() == 0);

    // a self reference follows too
    auto loop = db.create<Category>({{"name", "loop"}, {"parent", nullptr}});
    loop.set("parent", loop).save();
    auto loop_id = *loop.id();
    db.find<Category>(loop_id).set_id(70).save();
    assert(db.find<Category>(70).ref_id("parent") == 70);

    // deleting the re-keyed parent still cascades
    parent.remove();
    assert(db.all<Sample2>().count() == 0);
    assert(db.find<Sample3>(*optional_child.id()).is_null("sample1"));

    // the freed id is not inherited by anything
    auto newcomer = db.new_empty<Sample1>();
    newcomer.set("name", "new").set_id(1).save();
    assert(newcomer.id() == 1);
    assert(db.filter<Sample3>("sample1", newcomer).count() == 0);
    newcomer.remove();
    assert(db.all<Sample3>().count() == 1);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_reference_to_deleted_row - a handle to a removed row cannot be linked
// ============================================================================

void test_reference_to_deleted_row() {
    std::cout << "  test_reference_to_deleted_row..." << std::flush;

    auto db = test_support::fresh_db();
    auto parent = db.create<Sample1>({{"name", "p"}});
    auto other_handle = db.find<Sample1>(*parent.id());

    parent.remove();
    assert(!other_handle.is_stale());
    assert(throws<strata::consistency_error>([&] {
        db.create<Sample2>({{"sample1", other_handle}});
    }));
    assert(db.all<Sample2>().count() == 0);

    // an existing row cannot be pointed at it either
    auto live = db.create<Sample1>({{"name", "live"}});
    auto optional_child = db.create<Sample3>({{"sample1", live}, {"label", "c"}});
    assert(throws<strata::consistency_error>([&] {
        optional_child.set("sample1", other_handle).save();
    }));
    assert(optional_child.is_persisted());
    assert(db.find<Sample3>(*optional_child.id()).ref_id("sample1") == live.id());

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_json_dump_and_extensions
// ============================================================================

struct request_context {
    std::string user;
};

void test_json_dump_and_extensions() {
    std::cout << "  test_json_dump_and_extensions..." << std::flush;

    auto db = test_support::fresh_db();
    auto s1 = db.create<Sample1>({{"name", "p"}});
    auto s2 = db.create<Sample2>({{"sample1", s1}, {"label", "child"}});

    auto j = db.find<Sample2>(*s2.id()).to_json();
    assert(j["entity"] == "sample2");
    assert(j["id"] == *s2.id());
    assert(j["fields"]["label"] == "child");
    assert(j["fields"]["sample1"]["ref"] == "sample1");
    assert(j["fields"]["sample1"]["id"] == *s1.id());

    auto empty = db.new_empty<Sample>();
    auto je = empty.to_json();
    assert(je["id"].is_null());
    assert(je["fields"]["name"] == "<missing>");
    assert(je["fields"]["count"] == 0);
    assert(empty.describe() == "sample(<unsaved>)");

    assert(s1.describe() == "sample1.get_one(id=" + std::to_string(*s1.id()) + ")");
    s1.remove();
    assert(s1.to_json()["fields"] == "<deleted>");
    assert(s1.describe() == "sample1(<deleted>)");

    // auxiliary data keyed by type, shared by every handle to the instance
    auto handle = empty;
    assert(!empty.extensions().contains<request_context>());
    empty.extensions().set(request_context{"alice"});
    assert(handle.extensions().get<request_context>()->user == "alice");
    handle.extensions().get_or_create<int>() = 3;
    assert(*empty.extensions().get<int>() == 3);
    assert(empty.extensions().size() == 2);
    assert(empty.extensions().erase<request_context>());
    assert(empty.extensions().get<request_context>() == nullptr);
    assert(!empty.extensions().erase<request_context>());

    std::cout << " OK" << std::endl;
}

void run_all() {
    std::cout << "Object lifecycle tests:" << std::endl;
    test_full_construction();
    test_construction_errors();
    test_uniqueness();
    test_empty_construction_and_save();
    test_full_row_overwrite();
    test_lazy_reference();
    test_reference_assignment();
    test_stale_instances();
    test_missing_referenced_row();
    test_rekey();
    test_rekey_moves_references();
    test_reference_to_deleted_row();
    test_json_dump_and_extensions();
}

} // namespace object_tests
