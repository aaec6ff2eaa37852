#include "test_common.h"

#include "warden/wal.h"

#include <filesystem>
#include <fstream>
#include <vector>

using warden::Wal;
using warden::WalLine;

int main() {
    namespace fs = std::filesystem;
    TestDir dir("wal");
    fs::path p = dir.path / "sub" / "a.jsonl";

    {
        Wal wal(p);
        expect_true(!wal.append_json_line("{}").empty(), "append before open must fail");
        std::string err = wal.open();
        expect_true(err.empty(), "wal open should create parent dirs: " + err);
        expect_true(wal.is_open(), "open flag");
        expect_true(wal.append_json_line("{\"x\":1}").empty(), "append 1");
        expect_true(wal.append_json_line("{\"x\":2}\n").empty(), "append with newline already present");
        expect_eq_ll(wal.size_bytes(), 16, "two 8-byte lines");
    }

    std::vector<WalLine> lines;
    expect_true(warden::read_wal_lines(p, &lines).empty(), "read back");
    expect_eq_ll((long long)lines.size(), 2, "two lines");
    expect_eq_str(lines[1].text, "{\"x\":2}", "second record");
    expect_true(lines[0].complete && lines[1].complete, "both complete");

    // Simulate a crash mid-append.
    {
        std::ofstream f(p, std::ios::binary | std::ios::app);
        f << "{\"x\":3";
    }
    expect_true(warden::read_wal_lines(p, &lines).empty(), "read torn file");
    expect_eq_ll((long long)lines.size(), 3, "torn line listed");
    expect_true(!lines[2].complete, "torn line flagged");
    expect_eq_ll((long long)lines[2].line_no, 3, "line numbers are 1-based");

    // Re-opening starts the next record on a fresh line.
    {
        Wal wal(p);
        expect_true(wal.open().empty(), "reopen");
        expect_true(wal.append_json_line("{\"x\":4}").empty(), "append after torn tail");
    }
    expect_true(warden::read_wal_lines(p, &lines).empty(), "read after repair");
    expect_eq_ll((long long)lines.size(), 4, "torn fragment stays its own line");
    expect_eq_str(lines[3].text, "{\"x\":4}", "new record intact");

    std::vector<WalLine> none;
    expect_true(warden::read_wal_lines(dir.path / "missing.jsonl", &none).empty(), "missing file is not an error");
    expect_true(none.empty(), "missing file has no lines");

    std::cerr << "test_wal: ALL PASSED" << std::endl;
    return 0;
}
