#define BOOST_TEST_MODULE MatchConfidence
#define BOOST_TEST_DYN_LINK

#include <boost/test/unit_test.hpp>
#include "MatchConfidence.h"


BOOST_AUTO_TEST_CASE(DOIMatch) {
    const auto score(MatchConfidence::Calculate(BibRecord::Record{ { "doi", "10.1234/X " }, { "title", "T1" } },
                                                BibRecord::Record{ { "do", "10.1234/x" }, { "title", "Completely different" } }));
    BOOST_CHECK_EQUAL(score.confidence_, 1.0);
    BOOST_CHECK_EQUAL(score.reason_, "DOI match");
}


BOOST_AUTO_TEST_CASE(DifferentDOIsFallThrough) {
    const auto score(MatchConfidence::Calculate(BibRecord::Record{ { "doi", "10.1/a" }, { "title", "Same" }, { "year", "2020" } },
                                                BibRecord::Record{ { "doi", "10.1/b" }, { "title", "Same" }, { "year", "2020" } }));
    BOOST_CHECK_EQUAL(score.confidence_, 0.95);
}


BOOST_AUTO_TEST_CASE(ExactTitleAndYear) {
    const auto score(MatchConfidence::Calculate(BibRecord::Record{ { "title", "Machine Learning" }, { "year", "2023" } },
                                                BibRecord::Record{ { "title", "The Machine Learning" }, { "year", "2023" } }));
    BOOST_CHECK_GE(score.confidence_, 0.95);
    BOOST_CHECK_EQUAL(score.reason_, "exact title+year match");
}


BOOST_AUTO_TEST_CASE(HighSimilarity) {
    const auto score(MatchConfidence::Calculate(BibRecord::Record{ { "title", "Machine Learning in Healthcare" }, { "year", "2023" } },
                                                BibRecord::Record{ { "title", "Machine Learing in Healthcare" }, { "year", "2023" } }));
    BOOST_CHECK_EQUAL(score.confidence_, 0.90);
    BOOST_CHECK_EQUAL(score.reason_, "High similarity (0.98)");
}


BOOST_AUTO_TEST_CASE(GoodSimilarity) {
    const auto score(MatchConfidence::Calculate(BibRecord::Record{ { "title", "abcdefghij" }, { "year", "2023" } },
                                                BibRecord::Record{ { "title", "abcdefghik" }, { "year", "2023" } }));
    BOOST_CHECK_EQUAL(score.confidence_, 0.85);
    BOOST_CHECK_EQUAL(score.reason_, "Good similarity (0.90)");
}


BOOST_AUTO_TEST_CASE(FairSimilarity) {
    const auto score(MatchConfidence::Calculate(BibRecord::Record{ { "title", "abcdefghijklmnopqrst" }, { "year", "2023" } },
                                                BibRecord::Record{ { "title", "abcdefghijklmnopqxyz" }, { "year", "2023" } }));
    BOOST_CHECK_EQUAL(score.confidence_, 0.75);
    BOOST_CHECK_EQUAL(score.reason_, "Fair similarity (0.85)");
}


BOOST_AUTO_TEST_CASE(DifferentYearsAreLowConfidence) {
    const auto score(MatchConfidence::Calculate(BibRecord::Record{ { "title", "Machine Learning" }, { "year", "2023" } },
                                                BibRecord::Record{ { "title", "Machine Learning" }, { "year", "2022" } }));
    BOOST_CHECK_EQUAL(score.confidence_, 0.50);
    BOOST_CHECK_EQUAL(score.reason_, "low confidence match");
}


BOOST_AUTO_TEST_CASE(MissingYearsNeverGiveAnExactMatch) {
    const auto score(MatchConfidence::Calculate(BibRecord::Record{ { "title", "Machine Learning" } },
                                                BibRecord::Record{ { "title", "Machine Learning" } }));
    BOOST_CHECK_EQUAL(score.confidence_, 0.90);
    BOOST_CHECK_EQUAL(score.reason_, "High similarity (1.00)");
}


BOOST_AUTO_TEST_CASE(DissimilarTitles) {
    const auto score(MatchConfidence::Calculate(BibRecord::Record{ { "title", "abcdefghij" }, { "year", "2023" } },
                                                BibRecord::Record{ { "title", "abcdefgxyz" }, { "year", "2023" } }));
    BOOST_CHECK_EQUAL(score.confidence_, 0.50);
}


BOOST_AUTO_TEST_CASE(NoTitles) {
    const auto score(MatchConfidence::Calculate(BibRecord::Record{ { "year", "2023" } }, BibRecord::Record{ { "year", "2023" } }));
    BOOST_CHECK_EQUAL(score.confidence_, 0.95); // Two empty titles are equal.

    const auto other_score(MatchConfidence::Calculate(BibRecord::Record{}, BibRecord::Record{}));
    BOOST_CHECK_EQUAL(other_score.confidence_, 0.50);
}


BOOST_AUTO_TEST_CASE(BlankDOIsAreNoDOIMatch) {
    const auto score(MatchConfidence::Calculate(BibRecord::Record{ { "doi", "  " }, { "title", "Cats" }, { "year", "2020" } },
                                                BibRecord::Record{ { "doi", " " }, { "title", "Dogs" }, { "year", "2020" } }));
    BOOST_CHECK_EQUAL(score.confidence_, 0.50);
    BOOST_CHECK_EQUAL(score.reason_, "low confidence match");
}


BOOST_AUTO_TEST_CASE(MalformedUTF8InDOI) {
    const auto score(MatchConfidence::Calculate(BibRecord::Record{ { "doi", "10.1/x\xF7\xBF\xBF\xBF" } },
                                                BibRecord::Record{ { "doi", "10.1/X" } }));
    BOOST_CHECK_EQUAL(score.confidence_, 1.0);
    BOOST_CHECK_EQUAL(score.reason_, "DOI match");
}
