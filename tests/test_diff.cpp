/**
 * @file test_diff.cpp
 * @brief Unit tests for the diff engine (GoogleTest)
 *
 * Covers:
 * - Object, array and scalar comparison
 * - Type changes
 * - Identity-matched arrays
 * - Epsilon, key exclusion, path filter, string normalization
 * - Brief and quiet modes
 * - Depth guard
 * - Independent calls on separate threads
 *
 * @copyright (c) 2026. MIT License.
 */

#include <gtest/gtest.h>

#include "diffx/Diff.hpp"
#include "diffx/Errors.hpp"
#include "diffx/Parsers.hpp"

#include <atomic>
#include <cmath>
#include <cstdint>
#include <limits>
#include <sstream>
#include <thread>
#include <vector>

using namespace diffx;

namespace {

Value J(const char* text) {
    return parse_json(text);
}

DiffOptions with(RawDiffOptions raw) {
    return validate_options(raw);
}

} // namespace

// ============================================================================
// Reflexivity
// ============================================================================

TEST(DiffReflexive, ScalarsAndContainers) {
    const std::vector<Value> values = {
        Value(), Value(true), Value(0), Value(-3.5), Value("text"),
        Value::array(), Value::object(),
        J(R"({"a": [1, {"b": null}], "c": {"d": "e"}})"),
        J(R"([[1, 2], [3, [4, [5]]]])")
    };
    for (const auto& v : values) {
        EXPECT_TRUE(diff(v, v).empty()) << v.dump();
    }
}

TEST(DiffReflexive, NaNEqualsItself) {
    Value v = std::numeric_limits<double>::quiet_NaN();
    EXPECT_TRUE(diff(v, v).empty());
}

TEST(DiffReflexive, IdenticalObjects) {
    Value obj = {{"name", "Alice"}, {"age", 30}};
    EXPECT_TRUE(diff(obj, obj).empty());
}

// ============================================================================
// Objects
// ============================================================================

TEST(DiffObject, AddedKey) {
    auto entries = diff(J(R"({"a": 1})"), J(R"({"a": 1, "b": 2})"));
    ASSERT_EQ(entries.size(), 1);
    EXPECT_EQ(entries[0], DiffEntry::added("b", 2));
}

TEST(DiffObject, RemovedKey) {
    auto entries = diff(J(R"({"a": 1, "b": 2})"), J(R"({"a": 1})"));
    ASSERT_EQ(entries.size(), 1);
    EXPECT_EQ(entries[0], DiffEntry::removed("b", 2));
    EXPECT_EQ(entries[0].value(), 2);
}

TEST(DiffObject, ModifiedValue) {
    auto entries = diff(J(R"({"a": 1, "b": 2})"), J(R"({"a": 1, "b": 3})"));
    ASSERT_EQ(entries.size(), 1);
    EXPECT_EQ(entries[0], DiffEntry::modified("b", 2, 3));
}

TEST(DiffObject, NestedPath) {
    auto entries = diff(J(R"({"user": {"profile": {"age": 30}}})"),
                        J(R"({"user": {"profile": {"age": 31}}})"));
    ASSERT_EQ(entries.size(), 1);
    EXPECT_EQ(entries[0].path, "user.profile.age");
}

TEST(DiffObject, NestedAddition) {
    auto entries = diff(J(R"({"user": {"name": "Alice"}})"),
                        J(R"({"user": {"name": "Alice", "email": "alice@example.com"}})"));
    ASSERT_EQ(entries.size(), 1);
    EXPECT_EQ(entries[0].type, DiffType::Added);
    EXPECT_EQ(entries[0].path, "user.email");
}

TEST(DiffObject, OrderFollowsOldKeysThenNewOnlyKeys) {
    auto entries = diff(J(R"({"c": 1, "a": 1, "b": 1})"),
                        J(R"({"z": 0, "b": 2, "y": 0, "c": 2})"));
    ASSERT_EQ(entries.size(), 5);
    EXPECT_EQ(entries[0], DiffEntry::modified("c", 1, 2));
    EXPECT_EQ(entries[1], DiffEntry::removed("a", 1));
    EXPECT_EQ(entries[2], DiffEntry::modified("b", 1, 2));
    EXPECT_EQ(entries[3], DiffEntry::added("z", 0));
    EXPECT_EQ(entries[4], DiffEntry::added("y", 0));
}

TEST(DiffObject, KeyOrderAloneIsNotADifference) {
    EXPECT_TRUE(diff(J(R"({"a": 1, "b": 2})"), J(R"({"b": 2, "a": 1})")).empty());
}

TEST(DiffObject, LargeObjects) {
    Value a = Value::object();
    Value b = Value::object();
    for (int i = 0; i < 200; ++i) {
        a["k" + std::to_string(i)] = i;
        b["k" + std::to_string(199 - i)] = 199 - i;
    }
    b["k150"] = -1;
    auto entries = diff(a, b);
    ASSERT_EQ(entries.size(), 1);
    EXPECT_EQ(entries[0], DiffEntry::modified("k150", 150, -1));
}

// ============================================================================
// Type changes
// ============================================================================

TEST(DiffTypeChange, NumberToString) {
    auto entries = diff(J(R"({"a": 1})"), J(R"({"a": "1"})"));
    ASSERT_EQ(entries.size(), 1);
    EXPECT_EQ(entries[0], DiffEntry::type_changed("a", 1, "1"));
}

TEST(DiffTypeChange, StringToNumber) {
    auto entries = diff(J(R"({"value": "42"})"), J(R"({"value": 42})"));
    ASSERT_EQ(entries.size(), 1);
    EXPECT_EQ(entries[0].type, DiffType::TypeChanged);
    EXPECT_EQ(entries[0].old_value, "42");
    EXPECT_EQ(entries[0].new_value, 42);
}

TEST(DiffTypeChange, NoRecursionBelow) {
    auto entries = diff(J(R"({"a": {"x": 1}})"), J(R"({"a": [1]})"));
    ASSERT_EQ(entries.size(), 1);
    EXPECT_EQ(entries[0].path, "a");
    EXPECT_EQ(entries[0].type, DiffType::TypeChanged);
}

TEST(DiffTypeChange, NullToObjectAtRoot) {
    auto entries = diff(Value(), J(R"({"value": 1})"));
    ASSERT_EQ(entries.size(), 1);
    EXPECT_EQ(entries[0].type, DiffType::TypeChanged);
    EXPECT_EQ(entries[0].path, "");
}

TEST(DiffTypeChange, IntegerAndFloatAreBothNumbers) {
    auto entries = diff(Value(1), Value(1.0));
    EXPECT_TRUE(entries.empty());
    entries = diff(Value(1), Value(1.5));
    ASSERT_EQ(entries.size(), 1);
    EXPECT_EQ(entries[0].type, DiffType::Modified);
}

// ============================================================================
// Scalars at the root
// ============================================================================

TEST(DiffScalar, Strings) {
    auto entries = diff(Value("hello"), Value("world"));
    ASSERT_EQ(entries.size(), 1);
    EXPECT_EQ(entries[0], DiffEntry::modified("", "hello", "world"));
}

TEST(DiffScalar, Numbers) {
    auto entries = diff(Value(42), Value(43));
    ASSERT_EQ(entries.size(), 1);
    EXPECT_EQ(entries[0].type, DiffType::Modified);
}

TEST(DiffScalar, Booleans) {
    auto entries = diff(Value(true), Value(false));
    ASSERT_EQ(entries.size(), 1);
    EXPECT_EQ(entries[0], DiffEntry::modified("", true, false));
}

TEST(DiffScalar, LargeIntegersCompareExactly) {
    Value a = static_cast<std::int64_t>(9007199254740993LL);
    Value b = static_cast<std::int64_t>(9007199254740992LL);
    EXPECT_EQ(diff(a, b).size(), 1);
}

// ============================================================================
// Arrays (positional)
// ============================================================================

TEST(DiffArray, ModifiedElement) {
    auto entries = diff(J(R"({"items": [1, 2, 3]})"), J(R"({"items": [1, 4, 3]})"));
    ASSERT_EQ(entries.size(), 1);
    EXPECT_EQ(entries[0], DiffEntry::modified("items[1]", 2, 4));
}

TEST(DiffArray, AddedElement) {
    auto entries = diff(J(R"({"items": [1, 2]})"), J(R"({"items": [1, 2, 3]})"));
    ASSERT_EQ(entries.size(), 1);
    EXPECT_EQ(entries[0], DiffEntry::added("items[2]", 3));
}

TEST(DiffArray, RemovedElements) {
    auto entries = diff(J(R"({"items": [1, 2, 3, 4]})"), J(R"({"items": [1, 2]})"));
    ASSERT_EQ(entries.size(), 2);
    EXPECT_EQ(entries[0], DiffEntry::removed("items[2]", 3));
    EXPECT_EQ(entries[1], DiffEntry::removed("items[3]", 4));
}

TEST(DiffArray, ReorderIsPositional) {
    auto entries = diff(J("[1, 2]"), J("[2, 1]"));
    ASSERT_EQ(entries.size(), 2);
    EXPECT_EQ(entries[0].path, "[0]");
    EXPECT_EQ(entries[1].path, "[1]");
}

TEST(DiffArray, NestedArrays) {
    auto entries = diff(J("[[1, 2], [3]]"), J("[[1, 2], [3, 4]]"));
    ASSERT_EQ(entries.size(), 1);
    EXPECT_EQ(entries[0], DiffEntry::added("[1][1]", 4));
}

TEST(DiffArray, ObjectsInsideArrays) {
    auto entries = diff(J(R"({"a": {"b": [{"c": 1}]}})"), J(R"({"a": {"b": [{"c": 2}]}})"));
    ASSERT_EQ(entries.size(), 1);
    EXPECT_EQ(entries[0].path, "a.b[0].c");
}

// ============================================================================
// Arrays (identity)
// ============================================================================

TEST(DiffIdentity, ReorderProducesNoEntries) {
    RawDiffOptions raw;
    raw.array_id_key = "id";
    auto entries = diff(J(R"([{"id": 1, "v": "a"}, {"id": 2, "v": "b"}])"),
                        J(R"([{"id": 2, "v": "b"}, {"id": 1, "v": "c"}])"),
                        with(raw));
    ASSERT_EQ(entries.size(), 1);
    EXPECT_EQ(entries[0], DiffEntry::modified("[id=1].v", "a", "c"));
}

TEST(DiffIdentity, NestedUnderKey) {
    RawDiffOptions raw;
    raw.array_id_key = "id";
    auto entries = diff(
        J(R"({"users": [{"id": 1, "name": "Alice"}, {"id": 2, "name": "Bob"}]})"),
        J(R"({"users": [{"id": 2, "name": "Bob"}, {"id": 1, "name": "Alice Updated"}]})"),
        with(raw));
    ASSERT_EQ(entries.size(), 1);
    EXPECT_EQ(entries[0], DiffEntry::modified("users[id=1].name", "Alice", "Alice Updated"));
}

TEST(DiffIdentity, AddedAndRemovedById) {
    RawDiffOptions raw;
    raw.array_id_key = "id";
    auto entries = diff(J(R"([{"id": 1}, {"id": 2}])"),
                        J(R"([{"id": 3}, {"id": 1}])"),
                        with(raw));
    ASSERT_EQ(entries.size(), 2);
    EXPECT_EQ(entries[0], DiffEntry::removed("[id=2]", J(R"({"id": 2})")));
    EXPECT_EQ(entries[1], DiffEntry::added("[id=3]", J(R"({"id": 3})")));
}

TEST(DiffIdentity, StringIdsAreQuoted) {
    RawDiffOptions raw;
    raw.array_id_key = "key";
    auto entries = diff(J(R"([{"key": "u7", "n": 1}])"),
                        J(R"([{"key": "u7", "n": 2}])"),
                        with(raw));
    ASSERT_EQ(entries.size(), 1);
    EXPECT_EQ(entries[0].path, "[key=\"u7\"].n");
}

TEST(DiffIdentity, StringAndNumberIdsDiffer) {
    RawDiffOptions raw;
    raw.array_id_key = "id";
    auto entries = diff(J(R"([{"id": 1}])"), J(R"([{"id": "1"}])"), with(raw));
    ASSERT_EQ(entries.size(), 2);
    EXPECT_EQ(entries[0].type, DiffType::Removed);
    EXPECT_EQ(entries[1].type, DiffType::Added);
}

TEST(DiffIdentity, IntegralFloatIdMatchesInteger) {
    RawDiffOptions raw;
    raw.array_id_key = "id";
    auto entries = diff(J(R"([{"id": 1, "v": 0}])"), J(R"([{"id": 1.0, "v": 1}])"), with(raw));
    ASSERT_EQ(entries.size(), 1);
    EXPECT_EQ(entries[0], DiffEntry::modified("[id=1].v", 0, 1));
}

TEST(DiffIdentity, DuplicateIdsPairInOrder) {
    RawDiffOptions raw;
    raw.array_id_key = "id";
    auto entries = diff(J(R"([{"id": 1, "v": "a"}, {"id": 1, "v": "b"}])"),
                        J(R"([{"id": 1, "v": "a"}, {"id": 1, "v": "c"}])"),
                        with(raw));
    ASSERT_EQ(entries.size(), 1);
    EXPECT_EQ(entries[0], DiffEntry::modified("[id=1].v", "b", "c"));
}

TEST(DiffIdentity, UnkeyedElementsArePositional) {
    RawDiffOptions raw;
    raw.array_id_key = "id";
    auto entries = diff(J(R"([{"id": 1}, "x", 5])"),
                        J(R"(["y", {"id": 1}, 5, 6])"),
                        with(raw));
    ASSERT_EQ(entries.size(), 2);
    EXPECT_EQ(entries[0], DiffEntry::modified("[0]", "x", "y"));
    EXPECT_EQ(entries[1], DiffEntry::added("[2]", 6));
}

TEST(DiffIdentity, ArraysWithoutKeyedElementsArePositional) {
    RawDiffOptions raw;
    raw.array_id_key = "id";
    auto entries = diff(J("[1, 2]"), J("[2, 1]"), with(raw));
    ASSERT_EQ(entries.size(), 2);
    EXPECT_EQ(entries[0].path, "[0]");
}

TEST(DiffIdentity, KeyedElementsOnOneSideOnlyArePositional) {
    RawDiffOptions raw;
    raw.array_id_key = "id";

    auto entries = diff(J(R"(["x"])"), J(R"([{"id": 1}])"), with(raw));
    ASSERT_EQ(entries.size(), 1);
    EXPECT_EQ(entries[0], DiffEntry::type_changed("[0]", "x", J(R"({"id": 1})")));

    entries = diff(J("[]"), J(R"([{"id": 1}])"), with(raw));
    ASSERT_EQ(entries.size(), 1);
    EXPECT_EQ(entries[0], DiffEntry::added("[0]", J(R"({"id": 1})")));
}

TEST(DiffIdentity, WithoutKeyOptionReorderIsReported) {
    auto entries = diff(J(R"([{"id": 1}, {"id": 2}])"), J(R"([{"id": 2}, {"id": 1}])"));
    ASSERT_EQ(entries.size(), 2);
    EXPECT_EQ(entries[0].path, "[0].id");
}

// ============================================================================
// Epsilon
// ============================================================================

TEST(DiffEpsilon, WithinTolerance) {
    RawDiffOptions raw;
    raw.epsilon = 1e-5;
    EXPECT_TRUE(diff(Value(1.0000001), Value(1.0000002), with(raw)).empty());
}

TEST(DiffEpsilon, OutsideTolerance) {
    RawDiffOptions raw;
    raw.epsilon = 1e-8;
    auto entries = diff(Value(1.0000001), Value(1.0000002), with(raw));
    ASSERT_EQ(entries.size(), 1);
    EXPECT_EQ(entries[0], DiffEntry::modified("", 1.0000001, 1.0000002));
}

TEST(DiffEpsilon, NestedValues) {
    RawDiffOptions raw;
    raw.epsilon = 0.01;
    EXPECT_TRUE(diff(J(R"({"name": "Alice", "age": 30.001})"),
                     J(R"({"name": "Alice", "age": 30.002})"), with(raw)).empty());
    EXPECT_EQ(diff(J(R"({"value": 1.0})"), J(R"({"value": 1.1})"), with(raw)).size(), 1);
}

TEST(DiffEpsilon, DefaultIsExact) {
    EXPECT_EQ(diff(Value(0.1 + 0.2), Value(0.3)).size(), 1);
}

TEST(DiffEpsilon, DoesNotApplyToStrings) {
    RawDiffOptions raw;
    raw.epsilon = 10.0;
    EXPECT_EQ(diff(Value("1"), Value("2"), with(raw)).size(), 1);
}

TEST(DiffEpsilon, InfinityOnlyEqualsItself) {
    const double inf = std::numeric_limits<double>::infinity();
    RawDiffOptions raw;
    raw.epsilon = 1e300;
    EXPECT_TRUE(diff(Value(inf), Value(inf), with(raw)).empty());
    EXPECT_EQ(diff(Value(inf), Value(-inf), with(raw)).size(), 1);
}

// ============================================================================
// Key exclusion
// ============================================================================

TEST(DiffIgnoreKeys, MatchingKeysAreSkipped) {
    RawDiffOptions raw;
    raw.ignore_keys_regex = "^_";
    EXPECT_TRUE(diff(J(R"({"a": 1, "_ts": 100})"), J(R"({"a": 1, "_ts": 200})"), with(raw)).empty());
}

TEST(DiffIgnoreKeys, AppliesToAddedAndRemoved) {
    RawDiffOptions raw;
    raw.ignore_keys_regex = "timestamp|updatedAt";
    EXPECT_TRUE(diff(J(R"({"name": "Alice", "timestamp": "2023-01-01"})"),
                     J(R"({"name": "Alice", "updatedAt": "2023-01-02"})"), with(raw)).empty());
}

TEST(DiffIgnoreKeys, OtherKeysStillCompared) {
    RawDiffOptions raw;
    raw.ignore_keys_regex = "timestamp";
    auto entries = diff(J(R"({"name": "Alice", "timestamp": "2023-01-01"})"),
                        J(R"({"name": "Bob", "timestamp": "2023-01-02"})"), with(raw));
    ASSERT_EQ(entries.size(), 1);
    EXPECT_EQ(entries[0].path, "name");
}

TEST(DiffIgnoreKeys, AppliesAtEveryDepth) {
    RawDiffOptions raw;
    raw.ignore_keys_regex = "^_";
    EXPECT_TRUE(diff(J(R"({"a": [{"_id": 1, "v": 2}]})"),
                     J(R"({"a": [{"_id": 9, "v": 2}]})"), with(raw)).empty());
}

TEST(DiffIgnoreKeys, SubtreeIsNotEntered) {
    RawDiffOptions raw;
    raw.ignore_keys_regex = "^meta$";
    raw.max_depth = 2;
    EXPECT_TRUE(diff(J(R"({"meta": {"x": {"y": 1}}})"),
                     J(R"({"meta": {"x": {"y": 2}}})"), with(raw)).empty());
}

// ============================================================================
// Path filter
// ============================================================================

TEST(DiffPathFilter, KeepsMatchingPaths) {
    RawDiffOptions raw;
    raw.path_filter = "user";
    auto entries = diff(J(R"({"user": {"name": "Alice", "age": 30}, "meta": {"version": 1}})"),
                        J(R"({"user": {"name": "Bob", "age": 31}, "meta": {"version": 2}})"),
                        with(raw));
    ASSERT_EQ(entries.size(), 2);
    EXPECT_EQ(entries[0].path, "user.name");
    EXPECT_EQ(entries[1].path, "user.age");
}

TEST(DiffPathFilter, MatchesAnySubstring) {
    RawDiffOptions raw;
    raw.path_filter = "[1]";
    auto entries = diff(J("[1, 2, 3]"), J("[0, 0, 0]"), with(raw));
    ASSERT_EQ(entries.size(), 1);
    EXPECT_EQ(entries[0].path, "[1]");
}

TEST(DiffPathFilter, NoMatchMeansNoEntries) {
    RawDiffOptions raw;
    raw.path_filter = "nothing";
    EXPECT_TRUE(diff(J(R"({"a": 1})"), J(R"({"a": 2})"), with(raw)).empty());
}

// ============================================================================
// String normalization
// ============================================================================

TEST(DiffStrings, IgnoreCase) {
    RawDiffOptions raw;
    raw.ignore_case = true;
    EXPECT_TRUE(diff(J(R"({"name": "Alice"})"), J(R"({"name": "ALICE"})"), with(raw)).empty());
    raw.ignore_case = false;
    EXPECT_EQ(diff(J(R"({"name": "Alice"})"), J(R"({"name": "ALICE"})"), with(raw)).size(), 1);
}

TEST(DiffStrings, IgnoreWhitespace) {
    RawDiffOptions raw;
    raw.ignore_whitespace = true;
    EXPECT_TRUE(diff(Value("hello world"), Value("hello  world"), with(raw)).empty());
    EXPECT_TRUE(diff(Value("  hello\tworld\n"), Value("hello world"), with(raw)).empty());
    EXPECT_EQ(diff(Value("helloworld"), Value("hello world"), with(raw)).size(), 1);
}

TEST(DiffStrings, BothFlags) {
    RawDiffOptions raw;
    raw.ignore_whitespace = true;
    raw.ignore_case = true;
    EXPECT_TRUE(diff(Value(" Hello   WORLD "), Value("hello world"), with(raw)).empty());
}

TEST(DiffStrings, EntriesKeepOriginalText) {
    RawDiffOptions raw;
    raw.ignore_case = true;
    auto entries = diff(Value("Alpha"), Value("BETA"), with(raw));
    ASSERT_EQ(entries.size(), 1);
    EXPECT_EQ(entries[0].old_value, "Alpha");
    EXPECT_EQ(entries[0].new_value, "BETA");
}

TEST(DiffStrings, KeysAreNotNormalized) {
    RawDiffOptions raw;
    raw.ignore_case = true;
    auto entries = diff(J(R"({"Name": 1})"), J(R"({"name": 1})"), with(raw));
    EXPECT_EQ(entries.size(), 2);
}

// ============================================================================
// Brief and quiet modes
// ============================================================================

TEST(DiffStatusOnly, BriefReportsDiffersWithoutEntries) {
    RawDiffOptions raw;
    raw.brief_mode = true;
    DiffReport report = compare(J(R"({"a": 1, "b": 2})"), J(R"({"a": 2, "b": 3})"), with(raw));
    EXPECT_TRUE(report.differs);
    EXPECT_TRUE(report.entries.empty());
}

TEST(DiffStatusOnly, QuietReportsDiffersWithoutEntries) {
    RawDiffOptions raw;
    raw.quiet_mode = true;
    DiffReport report = compare(J(R"({"a": 1})"), J(R"({"a": 2})"), with(raw));
    EXPECT_TRUE(report.differs);
    EXPECT_TRUE(report.entries.empty());
    EXPECT_TRUE(diff(J(R"({"a": 1})"), J(R"({"a": 2})"), with(raw)).empty());
}

TEST(DiffStatusOnly, EqualTrees) {
    RawDiffOptions raw;
    raw.brief_mode = true;
    EXPECT_FALSE(compare(J(R"({"a": 1})"), J(R"({"a": 1})"), with(raw)).differs);
}

TEST(DiffStatusOnly, RespectsPathFilter) {
    RawDiffOptions raw;
    raw.quiet_mode = true;
    raw.path_filter = "b";
    EXPECT_FALSE(compare(J(R"({"a": 1, "b": 1})"), J(R"({"a": 2, "b": 1})"), with(raw)).differs);
    EXPECT_TRUE(compare(J(R"({"a": 1, "b": 1})"), J(R"({"a": 2, "b": 2})"), with(raw)).differs);
}

TEST(DiffStatusOnly, ShortCircuitsBeforeDeepSubtree) {
    // The first key differs; the second would trip the depth guard if entered
    Value deep_old = Value::object();
    Value deep_new = Value::object();
    Value* a = &deep_old;
    Value* b = &deep_new;
    for (int i = 0; i < 10; ++i) {
        a = &((*a)["n"] = Value::object());
        b = &((*b)["n"] = Value::object());
    }
    (*b)["x"] = 1;

    Value old_doc = {{"first", 1}, {"second", deep_old}};
    Value new_doc = {{"first", 2}, {"second", deep_new}};

    RawDiffOptions raw;
    raw.brief_mode = true;
    raw.max_depth = 3;
    EXPECT_TRUE(compare(old_doc, new_doc, with(raw)).differs);

    raw.brief_mode = false;
    EXPECT_THROW(compare(old_doc, new_doc, with(raw)), DepthExceededError);
}

TEST(DiffStatusOnly, HasDifferences) {
    EXPECT_TRUE(has_differences(J("[1]"), J("[2]")));
    EXPECT_FALSE(has_differences(J("[1]"), J("[1]")));
}

TEST(DiffReport, FullModeCarriesEntries) {
    DiffReport report = compare(J(R"({"a": 1})"), J(R"({"a": 2})"));
    EXPECT_TRUE(report.differs);
    ASSERT_EQ(report.entries.size(), 1);
}

TEST(DiffReport, FilteredOutMeansNoDifference) {
    RawDiffOptions raw;
    raw.path_filter = "zzz";
    EXPECT_FALSE(compare(J(R"({"a": 1})"), J(R"({"a": 2})"), with(raw)).differs);
}

// ============================================================================
// Depth guard
// ============================================================================

namespace {

Value nested_arrays(int depth) {
    Value v = 0;
    for (int i = 0; i < depth; ++i) {
        v = Value::array({v});
    }
    return v;
}

} // namespace

TEST(DiffDepth, WithinLimit) {
    RawDiffOptions raw;
    raw.max_depth = 5;
    EXPECT_TRUE(diff(nested_arrays(5), nested_arrays(5), with(raw)).empty());
}

TEST(DiffDepth, ExceedingLimitThrows) {
    RawDiffOptions raw;
    raw.max_depth = 5;
    try {
        diff(nested_arrays(6), nested_arrays(6), with(raw));
        FAIL() << "Expected DepthExceededError";
    } catch (const DepthExceededError& e) {
        EXPECT_EQ(e.max_depth(), 5);
        EXPECT_EQ(e.path(), "[0][0][0][0][0]");
    }
}

TEST(DiffDepth, IsAnEngineError) {
    RawDiffOptions raw;
    raw.max_depth = 1;
    EXPECT_THROW(diff(J(R"({"a": {"b": 1}})"), J(R"({"a": {"b": 1}})"), with(raw)), EngineError);
}

TEST(DiffDepth, ScalarsBelowLimitAreFine) {
    RawDiffOptions raw;
    raw.max_depth = 1;
    auto entries = diff(J(R"({"a": 1})"), J(R"({"a": 2})"), with(raw));
    EXPECT_EQ(entries.size(), 1);
}

TEST(DiffDepth, DefaultLimitHandlesDeepTrees) {
    EXPECT_TRUE(diff(nested_arrays(500), nested_arrays(500)).empty());
    EXPECT_THROW(diff(nested_arrays(600), nested_arrays(600)), DepthExceededError);
}

TEST(DiffDepth, DeepAddedValueThrows) {
    Value new_doc = Value::object();
    new_doc["a"] = nested_arrays(600);
    try {
        diff(Value::object(), new_doc);
        FAIL() << "Expected DepthExceededError";
    } catch (const DepthExceededError& e) {
        EXPECT_EQ(e.path(), "a");
        EXPECT_EQ(e.max_depth(), 512);
    }
}

TEST(DiffDepth, DeepRemovedArrayElementThrows) {
    RawDiffOptions raw;
    raw.max_depth = 5;
    Value old_doc = Value::array({1, nested_arrays(5)});
    EXPECT_THROW(diff(old_doc, J("[1]"), with(raw)), DepthExceededError);
}

TEST(DiffDepth, DeepTypeChangedValueThrows) {
    RawDiffOptions raw;
    raw.max_depth = 5;

    Value at_limit = Value::object();
    at_limit["a"] = nested_arrays(4);
    auto entries = diff(J(R"({"a": "x"})"), at_limit, with(raw));
    ASSERT_EQ(entries.size(), 1);
    EXPECT_EQ(entries[0].type, DiffType::TypeChanged);

    Value past_limit = Value::object();
    past_limit["a"] = nested_arrays(5);
    try {
        diff(J(R"({"a": "x"})"), past_limit, with(raw));
        FAIL() << "Expected DepthExceededError";
    } catch (const DepthExceededError& e) {
        EXPECT_EQ(e.path(), "a");
    }
}

TEST(DiffDepth, DeepPayloadThrowsInStatusOnlyMode) {
    RawDiffOptions raw;
    raw.max_depth = 5;
    raw.quiet_mode = true;
    EXPECT_THROW(has_differences(J("{}"), J(R"({"a": [[[[[[0]]]]]]})"), with(raw)),
                 DepthExceededError);
}

// ============================================================================
// Raw options overload
// ============================================================================

TEST(DiffRawOptions, ValidatesBeforeDiffing) {
    RawDiffOptions raw;
    raw.ignore_keys_regex = "[";
    EXPECT_THROW(diff(Value(1), Value(2), raw), InvalidPatternError);
}

TEST(DiffRawOptions, AppliesOptions) {
    RawDiffOptions raw;
    raw.epsilon = 0.5;
    EXPECT_TRUE(diff(Value(1.0), Value(1.2), raw).empty());
}

// ============================================================================
// Entry model
// ============================================================================

TEST(DiffTypeName, RoundTrip) {
    for (auto type : {DiffType::Added, DiffType::Removed, DiffType::Modified, DiffType::TypeChanged}) {
        EXPECT_EQ(diff_type_from_name(diff_type_name(type)), type);
    }
    EXPECT_FALSE(diff_type_from_name("added").has_value());
}

TEST(DiffEntryPrint, ReadableForm) {
    std::ostringstream os;
    os << DiffEntry::modified("b", 2, 3);
    EXPECT_EQ(os.str(), "Modified(\"b\", 2, 3)");
}

// ============================================================================
// Concurrency
// ============================================================================

TEST(DiffConcurrency, IndependentCallsOnThreads) {
    const Value old_doc = J(R"({"users": [{"id": 1, "n": "a"}, {"id": 2, "n": "b"}], "v": 1})");
    const Value new_doc = J(R"({"users": [{"id": 2, "n": "b"}, {"id": 1, "n": "c"}], "v": 2})");

    RawDiffOptions raw;
    raw.array_id_key = "id";
    raw.ignore_keys_regex = "^_";
    const DiffOptions options = with(raw);
    const auto expected = diff(old_doc, new_doc, options);
    ASSERT_EQ(expected.size(), 2);

    std::atomic<int> mismatches{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&]() {
            for (int i = 0; i < 50; ++i) {
                if (diff(old_doc, new_doc, options) != expected) {
                    ++mismatches;
                }
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }
    EXPECT_EQ(mismatches.load(), 0);
}
