#include "test_util.hpp"
#include "io/correction_table_reader.hpp"
#include "io/fasta_reader.hpp"
#include "io/fasta_splitter.hpp"
#include "io/fasta_writer.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

using namespace protfasta;

static std::string g_test_dir;
static const Logger g_quiet(Logger::kSilent);

static void write_file(const std::string& path, const std::string& content) {
    std::ofstream f(path);
    f << content;
}

static std::string read_file(const std::string& path) {
    std::ifstream f(path);
    std::ostringstream oss;
    oss << f.rdbuf();
    return oss.str();
}

static bool parse_string(const std::string& text, bool unique, Dataset& out,
                         Error& err) {
    std::istringstream in(text);
    FastaReadOptions opts;
    opts.expect_unique_header = unique;
    return read_fasta_stream(in, opts, out, err, g_quiet);
}

// ---------------------------------------------------------------------------
// Reader
// ---------------------------------------------------------------------------

static void test_read_basic() {
    std::fprintf(stderr, "-- test_read_basic\n");

    Dataset recs;
    Error err;
    CHECK(parse_string(">sp|P1 first protein\nmkv\nLA\n\n>P2\r\n  ACD  \n", true,
                       recs, err));
    CHECK_EQ(recs.size(), 2u);
    CHECK_STR_EQ(recs[0].header, "sp|P1 first protein");
    CHECK_STR_EQ(recs[0].sequence, "MKVLA");
    CHECK_STR_EQ(recs[1].header, "P2");
    CHECK_STR_EQ(recs[1].sequence, "ACD");
}

static void test_read_header_without_sequence() {
    std::fprintf(stderr, "-- test_read_header_without_sequence\n");

    Dataset recs;
    Error err;
    CHECK(parse_string(">empty\n>P1\nMKV\n>tail\n", true, recs, err));
    CHECK_EQ(recs.size(), 1u);
    CHECK_STR_EQ(recs[0].header, "P1");

    // Sequence lines before any header get an empty header.
    Dataset orphan;
    CHECK(parse_string("MKV\n>P1\nW\n", true, orphan, err));
    CHECK_EQ(orphan.size(), 2u);
    CHECK_STR_EQ(orphan[0].header, "");
    CHECK_STR_EQ(orphan[0].sequence, "MKV");
}

static void test_read_duplicate_headers() {
    std::fprintf(stderr, "-- test_read_duplicate_headers\n");

    const std::string text = ">A\nMKV\n>B\nMKV\n>A\nMKR\n";

    Dataset recs = {{"keep", "W"}};
    Error err;
    CHECK(!parse_string(text, true, recs, err));
    CHECK(err.kind == ErrorKind::kParse);
    CHECK_STR_EQ(err.message, "Found duplicate header (A)");
    CHECK_EQ(recs.size(), 1u);  // untouched on failure

    Error err2;
    CHECK(parse_string(text, false, recs, err2));
    CHECK_EQ(recs.size(), 3u);
    CHECK_STR_EQ(recs[2].sequence, "MKR");
}

static void test_read_header_parser() {
    std::fprintf(stderr, "-- test_read_header_parser\n");

    std::istringstream in(">sp|P1|ONE desc\nMKV\n>sp|P2|TWO\nW\n");
    FastaReadOptions opts;
    opts.header_parser = [](const std::string& h) {
        auto bar = h.rfind('|');
        auto sp = h.find(' ');
        return h.substr(bar + 1, sp == std::string::npos ? std::string::npos
                                                         : sp - bar - 1);
    };
    Dataset recs;
    Error err;
    CHECK(read_fasta_stream(in, opts, recs, err, g_quiet));
    CHECK_EQ(recs.size(), 2u);
    CHECK_STR_EQ(recs[0].header, "ONE");
    CHECK_STR_EQ(recs[1].header, "TWO");
}

static void test_read_missing_file() {
    std::fprintf(stderr, "-- test_read_missing_file\n");

    Dataset recs;
    Error err;
    CHECK(!read_fasta(g_test_dir + "/does_not_exist.fa", FastaReadOptions{}, recs,
                      err, g_quiet));
    CHECK(err.kind == ErrorKind::kFile);
    CHECK(err.message.find("does_not_exist.fa") != std::string::npos);
}

// ---------------------------------------------------------------------------
// Writer
// ---------------------------------------------------------------------------

static std::string write_string(const Dataset& recs, std::optional<size_t> width) {
    std::ostringstream out;
    FastaWriteOptions opts;
    opts.line_length = width;
    Error err;
    CHECK(write_fasta_stream(out, recs, opts, err));
    return out.str();
}

static void test_write_wrapping() {
    std::fprintf(stderr, "-- test_write_wrapping\n");

    Dataset recs = {{"P1", "MKVLAGH"}, {"P2", "MKV"}};
    CHECK_STR_EQ(write_string(recs, std::nullopt), ">P1\nMKVLAGH\n\n>P2\nMKV\n\n");
    CHECK_STR_EQ(write_string(recs, 5), ">P1\nMKVLA\nGH\n\n>P2\nMKV\n\n");
    // Widths below 5 are raised to 5.
    CHECK_STR_EQ(write_string({{"P", "MKVLA"}}, 3), ">P\nMKVLA\n\n");
    CHECK_STR_EQ(write_string({{"P", "MKVLAMKVLA"}}, 5), ">P\nMKVLA\nMKVLA\n\n");
    CHECK_STR_EQ(write_string({}, 60), "");
}

static void test_write_empty_sequence() {
    std::fprintf(stderr, "-- test_write_empty_sequence\n");

    std::ostringstream out;
    Error err;
    Dataset recs = {{"P1", "MKV"}, {"P2", ""}};
    CHECK(!write_fasta_stream(out, recs, FastaWriteOptions{}, err));
    CHECK(err.kind == ErrorKind::kWrite);
    CHECK_STR_EQ(err.message, "Sequence associated with [P2] is empty");
    CHECK(out.str().empty());
}

static void test_write_file_and_append() {
    std::fprintf(stderr, "-- test_write_file_and_append\n");

    std::string path = g_test_dir + "/out.fa";
    FastaWriteOptions opts;
    opts.line_length = 60;
    Error err;
    CHECK(write_fasta(path, {{"A", "MKV"}}, opts, err, g_quiet));
    CHECK(write_fasta(path, {{"B", "WWW"}}, opts, err, g_quiet));
    CHECK_STR_EQ(read_file(path), ">B\nWWW\n\n");

    opts.append = true;
    CHECK(write_fasta(path, {{"C", "YYY"}}, opts, err, g_quiet));
    CHECK_STR_EQ(read_file(path), ">B\nWWW\n\n>C\nYYY\n\n");

    // Round trip through the reader.
    Dataset back;
    CHECK(read_fasta(path, FastaReadOptions{}, back, err, g_quiet));
    CHECK_EQ(back.size(), 2u);
    CHECK(back[1] == (FastaRecord{"C", "YYY"}));

    Error bad;
    CHECK(!write_fasta(g_test_dir + "/no/such/dir/out.fa", {{"A", "M"}}, opts, bad, g_quiet));
    CHECK(bad.kind == ErrorKind::kWrite);
}

// ---------------------------------------------------------------------------
// Splitter
// ---------------------------------------------------------------------------

static Dataset numbered(size_t n) {
    Dataset recs;
    for (size_t i = 0; i < n; i++)
        recs.push_back({"r" + std::to_string(i), "MKV"});
    return recs;
}

static void test_split() {
    std::fprintf(stderr, "-- test_split\n");

    std::vector<Dataset> chunks;
    Error err;

    CHECK(split_fasta(numbered(10), 3, chunks, err));
    CHECK_EQ(chunks.size(), 3u);
    CHECK_EQ(chunks[0].size(), 4u);
    CHECK_EQ(chunks[1].size(), 4u);
    CHECK_EQ(chunks[2].size(), 2u);
    CHECK_STR_EQ(chunks[0][0].header, "r0");
    CHECK_STR_EQ(chunks[1][0].header, "r4");
    CHECK_STR_EQ(chunks[2][1].header, "r9");

    CHECK(split_fasta(numbered(9), 3, chunks, err));
    CHECK_EQ(chunks.size(), 3u);
    CHECK_EQ(chunks[2].size(), 3u);

    // More chunks than records: one record per chunk, no empty chunks.
    CHECK(split_fasta(numbered(2), 5, chunks, err));
    CHECK_EQ(chunks.size(), 2u);

    CHECK(split_fasta(numbered(0), 4, chunks, err));
    CHECK(chunks.empty());

    CHECK(split_fasta(numbered(7), 1, chunks, err));
    CHECK_EQ(chunks.size(), 1u);
    CHECK_EQ(chunks[0].size(), 7u);

    Error zero;
    CHECK(!split_fasta(numbered(3), 0, chunks, zero));
    CHECK(zero.kind == ErrorKind::kInvalidPolicy);
}

static void test_chunk_filename() {
    std::fprintf(stderr, "-- test_chunk_filename\n");

    CHECK_STR_EQ(chunk_filename("proteome", 1), "proteome_000001.fasta");
    CHECK_STR_EQ(chunk_filename("x", 123456), "x_123456.fasta");
}

// ---------------------------------------------------------------------------
// Correction table
// ---------------------------------------------------------------------------

static void test_correction_table() {
    std::fprintf(stderr, "-- test_correction_table\n");

    std::string path = g_test_dir + "/table.tsv";
    write_file(path, "# custom residues\nB\tD\r\nJ\tL\n\n*\nXX\tW\nB\tN\n");

    CorrectionTable table;
    Error err;
    CHECK(read_correction_table(path, table, err));
    CHECK_EQ(table.size(), 4u);
    CHECK_STR_EQ(table.at("B"), "N");  // later line wins
    CHECK_STR_EQ(table.at("J"), "L");
    CHECK_STR_EQ(table.at("*"), "");
    CHECK_STR_EQ(table.at("XX"), "W");

    std::string bad_path = g_test_dir + "/bad.tsv";
    write_file(bad_path, "B\tN\n\tQ\n");
    Error bad;
    CHECK(!read_correction_table(bad_path, table, bad));
    CHECK(bad.kind == ErrorKind::kParse);
    CHECK(bad.message.find(":2:") != std::string::npos);
    CHECK_EQ(table.size(), 4u);  // untouched on failure

    std::string empty_path = g_test_dir + "/empty.tsv";
    write_file(empty_path, "# nothing\n\n");
    Error empty;
    CHECK(!read_correction_table(empty_path, table, empty));
    CHECK(empty.kind == ErrorKind::kParse);

    Error missing;
    CHECK(!read_correction_table(g_test_dir + "/missing.tsv", table, missing));
    CHECK(missing.kind == ErrorKind::kFile);
}

int main() {
    g_test_dir = "/tmp/protfasta_io_test";
    std::filesystem::create_directories(g_test_dir);

    test_read_basic();
    test_read_header_without_sequence();
    test_read_duplicate_headers();
    test_read_header_parser();
    test_read_missing_file();

    test_write_wrapping();
    test_write_empty_sequence();
    test_write_file_and_append();

    test_split();
    test_chunk_filename();

    test_correction_table();

    std::filesystem::remove_all(g_test_dir);

    TEST_SUMMARY();
    return g_fail_count > 0 ? 1 : 0;
}
