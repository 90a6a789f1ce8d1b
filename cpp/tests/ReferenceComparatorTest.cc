#define BOOST_TEST_MODULE ReferenceComparator
#define BOOST_TEST_DYN_LINK

#include <vector>
#include <boost/test/unit_test.hpp>
#include "ReferenceComparator.h"


namespace {


const std::vector<BibRecord::Record> NO_RECORDS;


bool HasTempKey(const std::vector<BibRecord::Record> &records) {
    for (const auto &record : records) {
        if (record.hasField(BibRecord::TEMP_KEY_FIELD))
            return true;
    }

    return false;
}


} // unnamed namespace


BOOST_AUTO_TEST_CASE(EmptySides) {
    const std::vector<BibRecord::Record> records{ { { "title", "Cats" } }, { { "title", "Dogs" } } };

    const auto only_a(ReferenceComparator::Compare(records, NO_RECORDS));
    BOOST_CHECK(only_a.overlap_.empty());
    BOOST_CHECK(only_a.unique_a_ == records);
    BOOST_CHECK(only_a.unique_b_.empty());

    const auto only_b(ReferenceComparator::Compare(NO_RECORDS, records));
    BOOST_CHECK(only_b.overlap_.empty());
    BOOST_CHECK(only_b.unique_a_.empty());
    BOOST_CHECK(only_b.unique_b_ == records);

    const auto neither(ReferenceComparator::Compare(NO_RECORDS, NO_RECORDS));
    BOOST_CHECK(neither.overlap_.empty());
    BOOST_CHECK(neither.unique_a_.empty());
    BOOST_CHECK(neither.unique_b_.empty());
}


BOOST_AUTO_TEST_CASE(FuzzyMatchIsFlagged) {
    const std::vector<BibRecord::Record> records_a{ { { "title", "Machine Learning in Healthcare" }, { "year", "2023" } } };
    const std::vector<BibRecord::Record> records_b{ { { "title", "Machine Learing in Healthcare" }, { "year", "2023" } } };

    const auto result(ReferenceComparator::Compare(records_a, records_b));
    BOOST_REQUIRE_EQUAL(result.overlap_.size(), 1u);
    BOOST_CHECK(result.overlap_[0].isFuzzyMatch());
    BOOST_CHECK_EQUAL(result.overlap_[0].getTitle(), "Machine Learning in Healthcare");
    BOOST_CHECK(result.unique_a_.empty());
    BOOST_CHECK(result.unique_b_.empty());

    BOOST_REQUIRE_EQUAL(result.fuzzy_pairs_.size(), 1u);
    BOOST_CHECK(result.fuzzy_pairs_[0].record_b_ == records_b[0]);
    BOOST_CHECK(result.fuzzy_pairs_[0].record_a_.isFuzzyMatch());
    BOOST_CHECK_EQUAL(result.fuzzy_pairs_[0].confidence_, 0.90);

    const ReferenceComparator::ComparisonStats stats(result, records_a.size(), records_b.size());
    BOOST_CHECK_EQUAL(stats.overlap_count_, 1u);
    BOOST_CHECK_EQUAL(stats.unique_a_count_, 0u);
    BOOST_CHECK_EQUAL(stats.unique_b_count_, 0u);
    BOOST_CHECK_EQUAL(stats.total_a_, 1u);
    BOOST_CHECK_EQUAL(stats.total_b_, 1u);
    BOOST_CHECK_EQUAL(stats.fuzzy_match_count_, 1u);
}


BOOST_AUTO_TEST_CASE(FuzzyMatchingCanBeDisabled) {
    const std::vector<BibRecord::Record> records_a{ { { "title", "Machine Learning in Healthcare" }, { "year", "2023" } } };
    const std::vector<BibRecord::Record> records_b{ { { "title", "Machine Learing in Healthcare" }, { "year", "2023" } } };

    const auto result(ReferenceComparator::Compare(records_a, records_b, ReferenceComparator::Options(/* use_fuzzy = */ false)));
    BOOST_CHECK(result.overlap_.empty());
    BOOST_CHECK(result.unique_a_ == records_a);
    BOOST_CHECK(result.unique_b_ == records_b);
    BOOST_CHECK(result.fuzzy_pairs_.empty());
}


BOOST_AUTO_TEST_CASE(DOIWinsOverTitles) {
    const std::vector<BibRecord::Record> records_a{ { { "doi", "10.1234/X" }, { "title", "T1" } } };
    const std::vector<BibRecord::Record> records_b{ { { "doi", "10.1234/x" }, { "title", "T2 (different)" } } };

    const auto result(ReferenceComparator::Compare(records_a, records_b));
    BOOST_REQUIRE_EQUAL(result.overlap_.size(), 1u);
    BOOST_CHECK(result.overlap_[0] == records_a[0]);
    BOOST_CHECK(not result.overlap_[0].isFuzzyMatch());
    BOOST_CHECK(result.unique_a_.empty());
    BOOST_CHECK(result.unique_b_.empty());
    BOOST_CHECK(result.fuzzy_pairs_.empty());
}


BOOST_AUTO_TEST_CASE(ExactThenFuzzy) {
    const std::vector<BibRecord::Record> records_a{
        { { "title", "The Shared Title" }, { "year", "2020" } },
        { { "title", "Deep Learning for Cats" }, { "year", "2019" } },
        { { "title", "Only in A" }, { "year", "2001" } },
    };
    const std::vector<BibRecord::Record> records_b{
        { { "title", "Deep Learning for Cat" }, { "year", "2019" } },
        { { "ti", "Shared Title" }, { "py", 2020 } },
        { { "title", "Only in B" }, { "year", "2002" } },
    };

    const auto result(ReferenceComparator::Compare(records_a, records_b));
    BOOST_REQUIRE_EQUAL(result.overlap_.size(), 2u);
    BOOST_CHECK(result.overlap_[0] == records_a[0]);
    BOOST_CHECK_EQUAL(result.overlap_[1].getTitle(), "Deep Learning for Cats");
    BOOST_CHECK(result.overlap_[1].isFuzzyMatch());
    BOOST_REQUIRE_EQUAL(result.unique_a_.size(), 1u);
    BOOST_CHECK(result.unique_a_[0] == records_a[2]);
    BOOST_REQUIRE_EQUAL(result.unique_b_.size(), 1u);
    BOOST_CHECK(result.unique_b_[0] == records_b[2]);
}


BOOST_AUTO_TEST_CASE(InternalKeysAreStripped) {
    const std::vector<BibRecord::Record> records_a{
        { { "title", "Cats" }, { "temp_key", "stale" } },
        { { "title", "Deep Learning for Cats" }, { "temp_key", "stale" } },
    };
    const std::vector<BibRecord::Record> records_b{
        { { "title", "Dogs" }, { "temp_key", "stale" } },
        { { "title", "Deep Learning for Cat" }, { "temp_key", "stale" } },
    };

    const auto result(ReferenceComparator::Compare(records_a, records_b));
    BOOST_CHECK_EQUAL(result.overlap_.size(), 1u);
    BOOST_CHECK(not HasTempKey(result.overlap_));
    BOOST_CHECK(not HasTempKey(result.unique_a_));
    BOOST_CHECK(not HasTempKey(result.unique_b_));
    BOOST_REQUIRE_EQUAL(result.fuzzy_pairs_.size(), 1u);
    BOOST_CHECK(not result.fuzzy_pairs_[0].record_a_.hasField(BibRecord::TEMP_KEY_FIELD));
    BOOST_CHECK(not result.fuzzy_pairs_[0].record_b_.hasField(BibRecord::TEMP_KEY_FIELD));
}


BOOST_AUTO_TEST_CASE(ComparisonLimitLeavesRecordsUnmatched) {
    const std::vector<BibRecord::Record> records_a{ { { "title", "Machine Learning in Healthcare" } } };
    const std::vector<BibRecord::Record> records_b{ { { "title", "Completely Unrelated" } },
                                                    { { "title", "Machine Learing in Healthcare" } } };

    const ReferenceComparator::Options options(true, FuzzyMatcher::Options(FuzzyMatcher::DEFAULT_THRESHOLD, 1));
    const auto result(ReferenceComparator::Compare(records_a, records_b, options));
    BOOST_CHECK(result.overlap_.empty());
    BOOST_CHECK_EQUAL(result.unique_a_.size(), 1u);
    BOOST_CHECK_EQUAL(result.unique_b_.size(), 2u);
}


BOOST_AUTO_TEST_CASE(SameSideDuplicatesAreKept) {
    const std::vector<BibRecord::Record> records_a{ { { "title", "Cats" }, { "year", "2020" } },
                                                    { { "title", "The Cats" }, { "year", "2020" } } };
    const std::vector<BibRecord::Record> records_b{ { { "title", "Cats!" }, { "year", "2020" } } };

    const auto result(ReferenceComparator::Compare(records_a, records_b));
    BOOST_CHECK(result.overlap_ == records_a);
    BOOST_CHECK(result.unique_a_.empty());
    BOOST_CHECK(result.unique_b_.empty());
}


BOOST_AUTO_TEST_CASE(MalformedUTF8InDOIDoesNotThrow) {
    const std::vector<BibRecord::Record> records_a{ { { "doi", "10.1/\xF7\xBF\xBF\xBF" }, { "title", "T" } } };
    const std::vector<BibRecord::Record> records_b{ { { "title", "T" } } };

    ReferenceComparator::ComparisonResult result;
    BOOST_REQUIRE_NO_THROW(result = ReferenceComparator::Compare(records_a, records_b));
    BOOST_REQUIRE_EQUAL(result.overlap_.size(), 1u);
    BOOST_CHECK(result.overlap_[0].isFuzzyMatch());
    BOOST_CHECK_EQUAL(result.overlap_[0].getDOI(), "10.1/\xF7\xBF\xBF\xBF");
    BOOST_REQUIRE_EQUAL(result.fuzzy_pairs_.size(), 1u);
    BOOST_CHECK_EQUAL(result.fuzzy_pairs_[0].confidence_, 0.90);
}
