#define BOOST_TEST_MODULE FuzzyMatcher
#define BOOST_TEST_DYN_LINK

#include <limits>
#include <string>
#include <vector>
#include <boost/test/unit_test.hpp>
#include "FuzzyMatcher.h"


BOOST_AUTO_TEST_CASE(TypoMatches) {
    const std::vector<BibRecord::Record> records_a{ { { "title", "Machine Learning in Healthcare" }, { "year", "2023" } } };
    const std::vector<BibRecord::Record> records_b{ { { "title", "Machine Learing in Healthcare" }, { "year", "2023" } } };

    const auto result(FuzzyMatcher::Match(records_a, records_b));
    BOOST_REQUIRE_EQUAL(result.matches_.size(), 1u);
    BOOST_CHECK(result.matches_[0].record_a_ == records_a[0]);
    BOOST_CHECK(result.matches_[0].record_b_ == records_b[0]);
    BOOST_CHECK_EQUAL(result.matches_[0].confidence_, 0.90);
    BOOST_CHECK_EQUAL(result.matches_[0].reason_, "High similarity (0.98)");
    BOOST_CHECK(result.matches_[0].is_fuzzy_);
    BOOST_CHECK(result.remaining_a_.empty());
    BOOST_CHECK(result.remaining_b_.empty());
    BOOST_CHECK_EQUAL(result.comparison_count_, 1u);
}


BOOST_AUTO_TEST_CASE(YearsMustAgree) {
    const std::vector<BibRecord::Record> records_a{ { { "title", "Cats and Dogs" }, { "year", "2020" } } };
    const std::vector<BibRecord::Record> records_b{ { { "title", "Cats and Dogs" }, { "year", "2021" } } };

    const auto result(FuzzyMatcher::Match(records_a, records_b));
    BOOST_CHECK(result.matches_.empty());
    BOOST_CHECK_EQUAL(result.remaining_a_.size(), 1u);
    BOOST_CHECK_EQUAL(result.remaining_b_.size(), 1u);
    BOOST_CHECK_EQUAL(result.comparison_count_, 0u);
}


BOOST_AUTO_TEST_CASE(YearsAreTruncated) {
    const std::vector<BibRecord::Record> records_a{ { { "title", "Cats and Dogs" }, { "year", "2020/05/01" } } };
    const std::vector<BibRecord::Record> records_b{ { { "title", "Cats and Dog" }, { "py", 2020 } } };

    const auto result(FuzzyMatcher::Match(records_a, records_b));
    BOOST_CHECK_EQUAL(result.matches_.size(), 1u);
}


BOOST_AUTO_TEST_CASE(MissingYearsOnBothSidesAgree) {
    const std::vector<BibRecord::Record> records_a{ { { "title", "Cats and Dogs" } } };
    const std::vector<BibRecord::Record> records_b{ { { "title", "Cats and Dog" } }, { { "title", "Cats and Dogs" }, { "year", "2000" } } };

    const auto result(FuzzyMatcher::Match(records_a, records_b));
    BOOST_REQUIRE_EQUAL(result.matches_.size(), 1u);
    BOOST_CHECK(result.matches_[0].record_b_ == records_b[0]);
    BOOST_REQUIRE_EQUAL(result.remaining_b_.size(), 1u);
    BOOST_CHECK(result.remaining_b_[0] == records_b[1]);
}


BOOST_AUTO_TEST_CASE(FirstSufficientCandidateWins) {
    const std::vector<BibRecord::Record> records_a{ { { "title", "Deep Learning for Cats" } } };
    const std::vector<BibRecord::Record> records_b{ { { "title", "Deep Learning for Cat" } }, { { "title", "Deep Learning for Cats" } } };

    // The second candidate would be a perfect match but the first one is good enough.
    const auto result(FuzzyMatcher::Match(records_a, records_b));
    BOOST_REQUIRE_EQUAL(result.matches_.size(), 1u);
    BOOST_CHECK(result.matches_[0].record_b_ == records_b[0]);
    BOOST_REQUIRE_EQUAL(result.remaining_b_.size(), 1u);
    BOOST_CHECK(result.remaining_b_[0] == records_b[1]);
}


BOOST_AUTO_TEST_CASE(MatchedCandidatesAreConsumed) {
    const std::vector<BibRecord::Record> records_a{ { { "title", "Deep Learning for Cats" } }, { { "title", "Deep Learning for Cats!" } } };
    const std::vector<BibRecord::Record> records_b{ { { "title", "Deep Learning for Cats" } } };

    const auto result(FuzzyMatcher::Match(records_a, records_b));
    BOOST_REQUIRE_EQUAL(result.matches_.size(), 1u);
    BOOST_CHECK(result.matches_[0].record_a_ == records_a[0]);
    BOOST_REQUIRE_EQUAL(result.remaining_a_.size(), 1u);
    BOOST_CHECK(result.remaining_a_[0] == records_a[1]);
    BOOST_CHECK(result.remaining_b_.empty());
}


BOOST_AUTO_TEST_CASE(RecordsWithoutUsableTitlesAreSkipped) {
    const std::vector<BibRecord::Record> records_a{ { { "title", "!!!" } }, { { "year", "2020" } } };
    const std::vector<BibRecord::Record> records_b{ { { "title", "???" } }, { { "title", 42 } } };

    const auto result(FuzzyMatcher::Match(records_a, records_b));
    BOOST_CHECK(result.matches_.empty());
    BOOST_CHECK_EQUAL(result.remaining_a_.size(), 2u);
    BOOST_CHECK_EQUAL(result.remaining_b_.size(), 2u);
    BOOST_CHECK_EQUAL(result.comparison_count_, 0u);
}


BOOST_AUTO_TEST_CASE(ThresholdIsInclusive) {
    const std::vector<BibRecord::Record> records_a{ { { "title", "abcdefghij" } } };
    const std::vector<BibRecord::Record> records_b{ { { "title", "abcdefghik" } } };
    BOOST_CHECK_EQUAL(FuzzyMatcher::Match(records_a, records_b).matches_.size(), 1u);

    const std::vector<BibRecord::Record> records_c{ { { "title", std::string(100, 'a') } } };
    const std::vector<BibRecord::Record> records_d{ { { "title", std::string(89, 'a') + std::string(11, 'b') } } };
    BOOST_CHECK(FuzzyMatcher::Match(records_c, records_d).matches_.empty());
}


BOOST_AUTO_TEST_CASE(CustomThreshold) {
    const std::vector<BibRecord::Record> records_a{ { { "title", std::string(100, 'a') } } };
    const std::vector<BibRecord::Record> records_b{ { { "title", std::string(89, 'a') + std::string(11, 'b') } } };
    BOOST_CHECK_EQUAL(FuzzyMatcher::Match(records_a, records_b, FuzzyMatcher::Options(0.85)).matches_.size(), 1u);
}


BOOST_AUTO_TEST_CASE(ComparisonLimit) {
    const std::vector<BibRecord::Record> records_a{ { { "title", "Alpha Beta Gamma" } }, { { "title", "Deep Learning for Cats" } } };
    const std::vector<BibRecord::Record> records_b{ { { "title", "Completely Unrelated" } }, { { "title", "Deep Learning for Cats" } } };

    const auto limited_result(FuzzyMatcher::Match(records_a, records_b, FuzzyMatcher::Options(FuzzyMatcher::DEFAULT_THRESHOLD, 1)));
    BOOST_CHECK(limited_result.matches_.empty());
    BOOST_CHECK(limited_result.comparison_limit_reached_);
    BOOST_CHECK_EQUAL(limited_result.comparison_count_, 1u);
    BOOST_CHECK_EQUAL(limited_result.remaining_a_.size(), 2u);
    BOOST_CHECK_EQUAL(limited_result.remaining_b_.size(), 2u);

    const auto unlimited_result(FuzzyMatcher::Match(records_a, records_b));
    BOOST_CHECK_EQUAL(unlimited_result.matches_.size(), 1u);
    BOOST_CHECK(not unlimited_result.comparison_limit_reached_);
    BOOST_CHECK_EQUAL(unlimited_result.comparison_count_, 4u);
}


BOOST_AUTO_TEST_CASE(TitlesAreSimilar) {
    BOOST_CHECK(FuzzyMatcher::TitlesAreSimilar("The Impact of AI", "Impact of AI"));
    BOOST_CHECK(FuzzyMatcher::TitlesAreSimilar("", ""));
    BOOST_CHECK(FuzzyMatcher::TitlesAreSimilar("Machine Learning in Healthcare", "Machine Learing in Healthcare"));
    BOOST_CHECK(not FuzzyMatcher::TitlesAreSimilar("abcdefghij", "abcdefghik"));
    BOOST_CHECK(not FuzzyMatcher::TitlesAreSimilar("Cats", "Dogs"));
}


BOOST_AUTO_TEST_CASE(IsValidThreshold) {
    BOOST_CHECK(FuzzyMatcher::IsValidThreshold(0.0));
    BOOST_CHECK(FuzzyMatcher::IsValidThreshold(FuzzyMatcher::DEFAULT_THRESHOLD));
    BOOST_CHECK(FuzzyMatcher::IsValidThreshold(1.0));
    BOOST_CHECK(not FuzzyMatcher::IsValidThreshold(-0.1));
    BOOST_CHECK(not FuzzyMatcher::IsValidThreshold(1.5));
    BOOST_CHECK(not FuzzyMatcher::IsValidThreshold(std::numeric_limits<double>::quiet_NaN()));
    BOOST_CHECK(not FuzzyMatcher::IsValidThreshold(std::numeric_limits<double>::infinity()));
}
