#include "test_util.hpp"
#include "clean/sequence_validator.hpp"
#include "core/alphabet.hpp"

#include <string>

using namespace protfasta;

static void test_valid_sequences() {
    std::fprintf(stderr, "-- test_valid_sequences\n");

    auto r = check_sequence_is_valid("ACDEFGHIKLMNPQRSTVWY", false);
    CHECK(r.valid);
    CHECK(r.invalid_residue.empty());

    CHECK(check_sequence_is_valid("", false).valid);
    CHECK(check_sequence_is_valid("MKV-LA--", true).valid);
}

static void test_gap_depends_on_alignment() {
    std::fprintf(stderr, "-- test_gap_depends_on_alignment\n");

    auto r = check_sequence_is_valid("MKV-", false);
    CHECK(!r.valid);
    CHECK_STR_EQ(r.invalid_residue, "-");

    CHECK(check_sequence_is_valid("MKV-", true).valid);
}

static void test_reports_first_invalid_char() {
    std::fprintf(stderr, "-- test_reports_first_invalid_char\n");

    auto r = check_sequence_is_valid("MKXVBZ", false);
    CHECK(!r.valid);
    CHECK_STR_EQ(r.invalid_residue, "X");

    r = check_sequence_is_valid("BBBX", false);
    CHECK_STR_EQ(r.invalid_residue, "B");

    // Lowercase residues are not part of the alphabet.
    r = check_sequence_is_valid("MkV", false);
    CHECK(!r.valid);
    CHECK_STR_EQ(r.invalid_residue, "k");

    r = check_sequence_is_valid("MK V", true);
    CHECK(!r.valid);
    CHECK_STR_EQ(r.invalid_residue, " ");
}

static void test_reports_whole_multibyte_residue() {
    std::fprintf(stderr, "-- test_reports_whole_multibyte_residue\n");

    // "MK\u00e9": e-acute is two bytes in UTF-8.
    auto r = check_sequence_is_valid("MK\xC3\xA9", false);
    CHECK(!r.valid);
    CHECK_STR_EQ(r.invalid_residue, "\xC3\xA9");

    // Three-byte residue after an ASCII invalid one: the first wins.
    r = check_sequence_is_valid("MXK\xE2\x82\xAC", false);
    CHECK_STR_EQ(r.invalid_residue, "X");
    r = check_sequence_is_valid("MK\xE2\x82\xAC", true);
    CHECK_STR_EQ(r.invalid_residue, "\xE2\x82\xAC");

    // Truncated sequence at the end of the string.
    r = check_sequence_is_valid("MK\xE2\x82", false);
    CHECK_STR_EQ(r.invalid_residue, "\xE2\x82");

    Dataset records = {{"P1", "MK\xC3\xA9"}};
    Error err;
    CHECK(!fail_on_invalid_sequences(records, false, err));
    CHECK_STR_EQ(err.message, "Invalid character '\xC3\xA9' found in sequence: P1");
}

static void test_fail_on_invalid_sequences() {
    std::fprintf(stderr, "-- test_fail_on_invalid_sequences\n");

    Dataset ok = {{"a", "MKV"}, {"b", "ACD"}};
    Error err;
    CHECK(fail_on_invalid_sequences(ok, false, err));
    CHECK(err.ok());

    Dataset bad = {{"a", "MKV"}, {"b", "MKX"}, {"c", "MK*"}};
    CHECK(!fail_on_invalid_sequences(bad, false, err));
    CHECK(err.kind == ErrorKind::kInvalidSequence);
    CHECK_STR_EQ(err.message, "Invalid character 'X' found in sequence: b");

    Error err2;
    Dataset aligned = {{"a", "MK-V"}};
    CHECK(fail_on_invalid_sequences(aligned, true, err2));
    CHECK(!fail_on_invalid_sequences(aligned, false, err2));
    CHECK(err2.message.find("'-'") != std::string::npos);
}

static void test_remove_invalid_sequences() {
    std::fprintf(stderr, "-- test_remove_invalid_sequences\n");

    Dataset records = {
        {"r1", "MKV"}, {"r2", "MKB"}, {"r3", "ACD"}, {"r4", "M-K"}, {"r5", "WY"},
    };
    size_t removed = remove_invalid_sequences(records, false);
    CHECK_EQ(removed, 2u);
    CHECK_EQ(records.size(), 3u);
    CHECK_STR_EQ(records[0].header, "r1");
    CHECK_STR_EQ(records[1].header, "r3");
    CHECK_STR_EQ(records[2].header, "r5");
    for (const auto& rec : records)
        CHECK(check_sequence_is_valid(rec.sequence, false).valid);

    Dataset aligned = {{"r1", "M-K"}, {"r2", "MKB"}};
    CHECK_EQ(remove_invalid_sequences(aligned, true), 1u);
    CHECK_STR_EQ(aligned[0].header, "r1");
}

int main() {
    test_valid_sequences();
    test_gap_depends_on_alignment();
    test_reports_first_invalid_char();
    test_reports_whole_multibyte_residue();
    test_fail_on_invalid_sequences();
    test_remove_invalid_sequences();

    TEST_SUMMARY();
    return g_fail_count > 0 ? 1 : 0;
}
