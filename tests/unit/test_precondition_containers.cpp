#include "../framework/test_framework.hpp"
#include "guard/precondition/precondition.hpp"
#include <array>
#include <deque>
#include <list>
#include <map>
#include <set>
#include <span>
#include <stdexcept>
#include <unordered_map>
#include <unordered_set>

using namespace guard;
using namespace guard::precondition;
using namespace guard::test;

static_assert(container_kind<Vector<int>>() == ContainerKind::LIST);
static_assert(container_kind<std::list<String>>() == ContainerKind::LIST);
static_assert(container_kind<std::deque<int>>() == ContainerKind::LIST);
static_assert(container_kind<std::map<String, int>>() == ContainerKind::MAP);
static_assert(container_kind<std::unordered_map<int, int>>() == ContainerKind::MAP);
static_assert(container_kind<std::set<int>>() == ContainerKind::SET);
static_assert(container_kind<std::unordered_set<String>>() == ContainerKind::SET);
static_assert(container_kind<std::array<int, 3>>() == ContainerKind::ARRAY);
static_assert(container_kind<std::span<const int>>() == ContainerKind::ARRAY);
static_assert(!ElementContainer<String>);
static_assert(!ElementContainer<StringView>);

void test_list() {
    Vector<String> names{"x"};
    Vector<String> empty;
    std::list<int> empty_list;

    ASSERT_NO_THROW(require_non_empty(names));
    ASSERT_THROW_MSG(require_non_empty(empty), EmptyContainerException,
                     "List must contain at least one or more elements");
    ASSERT_THROW_MSG(require_non_empty(empty_list), EmptyContainerException,
                     "List must contain at least one or more elements");
}

void test_map() {
    std::map<String, int> counts;
    ASSERT_THROW_MSG(require_non_empty(counts), EmptyContainerException,
                     "Map must contain at least one or more elements");

    counts["guard"] = 1;
    ASSERT_NO_THROW(require_non_empty(counts));
}

void test_set() {
    std::set<int> ids;
    ASSERT_THROW_MSG(require_non_empty(ids), EmptyContainerException,
                     "Set must contain at least one or more elements");

    ids.insert(3);
    ASSERT_NO_THROW(require_non_empty(ids));
}

void test_array() {
    std::array<int, 0> none{};
    std::array<int, 2> pair{1, 2};
    ASSERT_THROW_MSG(require_non_empty(none), EmptyContainerException,
                     "Array must contain at least one or more elements");
    ASSERT_NO_THROW(require_non_empty(pair));

    Vector<double> samples;
    std::span<const double> view(samples);
    ASSERT_THROW_MSG(require_non_empty(view), EmptyContainerException,
                     "Array must contain at least one or more elements");
}

void test_builtin_array() {
    int ids[] = {7, 8, 9};
    const char* names[] = {"north", "south"};
    ASSERT_NO_THROW(require_non_empty(ids));
    ASSERT_NO_THROW(require_non_empty(names, "no names"));
    ASSERT_NO_THROW(require_non_empty(ids, std::make_exception_ptr(std::logic_error("no ids"))));
    ASSERT_TRUE(check_non_empty(ids).is_success());

    // Character arrays are string literals, not element arrays.
    ASSERT_THROW_MSG(require_non_empty(""), PreconditionFailedException, "String must not be blank");
}

void test_null_literal_override() {
    Vector<int> filled{1};
    int ids[] = {1};
    ASSERT_THROW_MSG(require_non_empty(filled, nullptr), NullArgumentException,
                     "Error object must not be null");
    ASSERT_THROW(require_non_empty(&filled, nullptr), NullArgumentException);
    ASSERT_THROW(require_non_empty(ids, nullptr), NullArgumentException);
}

void test_empty_is_precondition_failure() {
    Vector<int> empty;
    ASSERT_THROW(require_non_empty(empty), PreconditionFailedException);
    ASSERT_THROW(require_non_empty(empty), GuardException);
}

void test_null_container() {
    const Vector<int>* absent = nullptr;
    const std::map<int, int>* absent_map = nullptr;
    ASSERT_THROW_MSG(require_non_empty(absent), NullArgumentException, "Object must not be null");
    ASSERT_THROW(require_non_empty(absent_map), NullArgumentException);

    Vector<int> filled{4};
    ASSERT_NO_THROW(require_non_empty(&filled));

    Vector<int> empty;
    ASSERT_THROW(require_non_empty(&empty), EmptyContainerException);
}

void test_null_container_with_override() {
    const Vector<int>* absent = nullptr;
    auto error = std::make_exception_ptr(std::logic_error("no rows"));
    // A missing container is reported as such, not through the override.
    ASSERT_THROW(require_non_empty(absent, error), NullArgumentException);
}

void test_check_non_empty() {
    std::set<String> tags;
    auto failed = check_non_empty(tags);
    ASSERT_TRUE(failed.is_error());
    ASSERT_EQ(failed.error().code, ErrorCode::EMPTY_CONTAINER);
    ASSERT_EQ(failed.error().message, "Set must contain at least one or more elements");

    tags.insert("a");
    ASSERT_TRUE(check_non_empty(tags).is_success());
}

int main() {
    TestSuite suite("Container Check Tests");

    suite.add_test("List", test_list);
    suite.add_test("Map", test_map);
    suite.add_test("Set", test_set);
    suite.add_test("Array", test_array);
    suite.add_test("Built-in array", test_builtin_array);
    suite.add_test("Null literal override", test_null_literal_override);
    suite.add_test("Empty is precondition failure", test_empty_is_precondition_failure);
    suite.add_test("Null container", test_null_container);
    suite.add_test("Null container with override", test_null_container_with_override);
    suite.add_test("check_non_empty", test_check_non_empty);

    TestRunner runner;
    runner.add_suite(&suite);
    return runner.run_all();
}
