// tests/di/test_tag.cpp
#define BOOST_TEST_MODULE tag_tests
#include <boost/test/unit_test.hpp>
#include <string>
#include <unordered_set>

#include "stratum/di/tag.hpp"

using namespace stratum::di;

struct NamedService {
    static constexpr const char* tag_name = "NamedService";
};

struct UnnamedService {};

BOOST_AUTO_TEST_SUITE(tag_suite)

BOOST_AUTO_TEST_CASE(test_same_label_different_identity) {
    auto first = Tag<std::string>::of("ApiKey");
    auto second = Tag<std::string>::of("ApiKey");

    BOOST_CHECK_EQUAL(first.label(), second.label());
    BOOST_CHECK(first != second);
    BOOST_CHECK(first.key() != second.key());
}

BOOST_AUTO_TEST_CASE(test_copies_share_identity) {
    auto tag = Tag<int>::of("Port");
    auto copy = tag;

    BOOST_CHECK(tag == copy);
    BOOST_CHECK_EQUAL(tag.key().hash(), copy.key().hash());

    TagKeySet keys{tag};
    BOOST_CHECK_EQUAL(keys.count(copy.key()), 1u);
}

BOOST_AUTO_TEST_CASE(test_anonymous_tags_get_distinct_labels) {
    auto first = Tag<int>::anonymous();
    auto second = Tag<int>::anonymous();

    BOOST_CHECK(first != second);
    BOOST_CHECK_NE(first.label(), second.label());
    BOOST_CHECK(first.label().rfind("anonymous#", 0) == 0);
}

BOOST_AUTO_TEST_CASE(test_service_tag_is_stable) {
    const auto& first = service_tag<NamedService>();
    const auto& second = service_tag<NamedService>();

    BOOST_CHECK(first == second);
    BOOST_CHECK_EQUAL(first.label(), "NamedService");
}

BOOST_AUTO_TEST_CASE(test_service_tag_falls_back_to_type_name) {
    const auto& tag = service_tag<UnnamedService>();
    BOOST_CHECK(tag.label().find("UnnamedService") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(test_describe_sorts_labels) {
    auto b = Tag<int>::of("B");
    auto a = Tag<int>::of("A");
    auto c = Tag<int>::of("C");

    BOOST_CHECK_EQUAL(describe(TagKeySet{c, a, b}), "A, B, C");
    BOOST_CHECK_EQUAL(describe_chain({c.key(), a.key(), b.key()}),
                      "C -> A -> B");
}

BOOST_AUTO_TEST_SUITE_END()
