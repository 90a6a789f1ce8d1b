#define BOOST_TEST_MODULE RIS
#define BOOST_TEST_DYN_LINK

#include <string>
#include <vector>
#include <boost/test/unit_test.hpp>
#include "FileUtil.h"
#include "RIS.h"


BOOST_AUTO_TEST_CASE(ParseSimpleRecords) {
    const std::string ris_text("TY  - JOUR\r\n"
                               "TI  - Machine Learning in Healthcare\r\n"
                               "AU  - Doe, Jane\r\n"
                               "AU  - Roe, Richard\r\n"
                               "PY  - 2023\r\n"
                               "DO  - 10.1234/abc\r\n"
                               "JO  - Journal of Things\r\n"
                               "ER  - \r\n"
                               "\r\n"
                               "TY  - BOOK\r\n"
                               "T1  - A Book\r\n"
                               "ER  - \r\n");

    const auto records(RIS::ParseRecords(ris_text));
    BOOST_REQUIRE_EQUAL(records.size(), 2u);

    BOOST_CHECK_EQUAL(records[0].getTypeOfReference(), "JOUR");
    BOOST_CHECK_EQUAL(records[0].getTitle(), "Machine Learning in Healthcare");
    BOOST_CHECK(records[0].getAuthors() == (std::vector<std::string>{ "Doe, Jane", "Roe, Richard" }));
    BOOST_CHECK_EQUAL(records[0].getYear(), "2023");
    BOOST_CHECK_EQUAL(records[0].getDOI(), "10.1234/abc");
    BOOST_CHECK_EQUAL(records[0].getJournal(), "Journal of Things");

    BOOST_CHECK_EQUAL(records[1].getTypeOfReference(), "BOOK");
    BOOST_CHECK(records[1].getField("primary_title") == BibRecord::FieldValue("A Book"));
    BOOST_CHECK_EQUAL(records[1].getTitle(), "A Book");
}


BOOST_AUTO_TEST_CASE(ByteOrderMarkIsIgnored) {
    const auto records(RIS::ParseRecords("\xEF\xBB\xBFTY  - JOUR\nTI  - Cats\nER  - \n"));
    BOOST_REQUIRE_EQUAL(records.size(), 1u);
    BOOST_CHECK_EQUAL(records[0].getTitle(), "Cats");
}


BOOST_AUTO_TEST_CASE(ListFields) {
    const auto records(RIS::ParseRecords("TY  - JOUR\nA1  - Doe, Jane\nKW  - cats\nKW  - dogs\nER  - \n"));
    BOOST_REQUIRE_EQUAL(records.size(), 1u);
    BOOST_CHECK(records[0].getField("authors") == BibRecord::FieldValue(std::vector<std::string>{ "Doe, Jane" }));
    BOOST_CHECK(records[0].getField("keywords") == BibRecord::FieldValue(std::vector<std::string>{ "cats", "dogs" }));
}


BOOST_AUTO_TEST_CASE(RepeatedScalarTagsBecomeLists) {
    const auto records(RIS::ParseRecords("TY  - JOUR\nN1  - first note\nN1  - second note\nER  - \n"));
    BOOST_REQUIRE_EQUAL(records.size(), 1u);
    BOOST_CHECK(records[0].getField("n1") == BibRecord::FieldValue(std::vector<std::string>{ "first note", "second note" }));
}


BOOST_AUTO_TEST_CASE(ContinuationLines) {
    const auto records(RIS::ParseRecords("TY  - JOUR\nTI  - A Very Long\n   Title\nAU  - Doe,\nJane\nER  - \n"));
    BOOST_REQUIRE_EQUAL(records.size(), 1u);
    BOOST_CHECK_EQUAL(records[0].getTitle(), "A Very Long Title");
    BOOST_CHECK(records[0].getAuthors() == (std::vector<std::string>{ "Doe, Jane" }));
}


BOOST_AUTO_TEST_CASE(MalformedInput) {
    // Stray lines, an ER without a TY, an empty value, a missing ER and an unterminated last record.
    const auto records(RIS::ParseRecords("garbage\n"
                                         "ER  - \n"
                                         "TI  - Outside\n"
                                         "TY  - JOUR\n"
                                         "TI  - First\n"
                                         "PY  -\n"
                                         "TY  - JOUR\n"
                                         "TI  - Second\n"));
    BOOST_REQUIRE_EQUAL(records.size(), 2u);
    BOOST_CHECK_EQUAL(records[0].getTitle(), "First");
    BOOST_CHECK(not records[0].hasField("year"));
    BOOST_CHECK_EQUAL(records[1].getTitle(), "Second");
}


BOOST_AUTO_TEST_CASE(WriteRecords) {
    const std::vector<BibRecord::Record> records{
        { { "type_of_reference", "BOOK" }, { "ti", "A Book" }, { "au", "Doe, Jane" }, { "py", 1999 }, { "keywords", std::vector<std::string>{ "x" } } },
        { { "title", "An Article" }, { "y1", "2001" }, { "do", "10.1/x" }, { "t2", "Journal" }, { "n2", "Abstract." } },
    };

    BOOST_CHECK_EQUAL(RIS::WriteRecords(records),
                      "TY  - BOOK\n"
                      "TI  - A Book\n"
                      "AU  - Doe, Jane\n"
                      "PY  - 1999\n"
                      "ER  - \n"
                      "\n"
                      "TY  - JOUR\n"
                      "TI  - An Article\n"
                      "PY  - 2001\n"
                      "JO  - Journal\n"
                      "DO  - 10.1/x\n"
                      "AB  - Abstract.\n"
                      "ER  - \n");
    BOOST_CHECK_EQUAL(RIS::WriteRecords({}), "");
}


BOOST_AUTO_TEST_CASE(WriteAndReadFile) {
    const std::vector<BibRecord::Record> records{
        { { "type_of_reference", "JOUR" }, { "title", "Cats" }, { "authors", std::vector<std::string>{ "Doe, Jane" } }, { "year", "2020" } },
    };

    FileUtil::AutoTempFile temp_file;
    RIS::WriteRecordsOrDie(temp_file.getFilePath(), records);
    BOOST_CHECK(RIS::ReadRecordsOrDie(temp_file.getFilePath()) == records);
}
