#include <algorithm>
#include <cassert>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "lineset/entry_store.h"

namespace fs = std::filesystem;

static fs::path mk_tmp_dir() {
    auto base = fs::temp_directory_path();
    auto p = base / ("lineset_test_persist_" + std::to_string((uint64_t)std::time(nullptr)));
    fs::remove_all(p);
    fs::create_directories(p);
    return p;
}

static fs::path test_data_file(const char* name) {
#ifndef LINESET_TEST_DATA_DIR
    return fs::path("cpp/tests/data") / name; // fallback
#else
    return fs::path(LINESET_TEST_DATA_DIR) / name;
#endif
}

static std::string slurp(const fs::path& p) {
    std::ifstream in(p, std::ios::binary);
    std::ostringstream oss;
    oss << in.rdbuf();
    return oss.str();
}

static void put(const fs::path& p, const std::string& s) {
    std::ofstream out(p, std::ios::binary | std::ios::trunc);
    out << s;
}

static std::vector<std::string> sorted_items(const lineset::EntryStore& st) {
    auto v = st.items();
    std::sort(v.begin(), v.end());
    return v;
}

int main() {
    auto dir = mk_tmp_dir();

    // load: blank line ignored, case folded
    {
        const auto file = dir / "basic.txt";
        fs::copy_file(test_data_file("entries_basic.txt"), file);
        lineset::EntryStore st(file);
        assert((sorted_items(st) == std::vector<std::string>{"bar", "baz", "foo"}));

        // remove rewrites lowercase, no trailing newline
        st.remove("bar");
        lineset::EntryStore again(file);
        assert((sorted_items(again) == std::vector<std::string>{"baz", "foo"}));
        const auto disk = slurp(file);
        assert(disk == "foo\nbaz" || disk == "baz\nfoo");
    }

    // CRLF, duplicates, padding
    {
        const auto file = dir / "crlf.txt";
        put(file, "One\r\n  two  \r\n\r\nONE\r\n");
        lineset::EntryStore st(file);
        assert((sorted_items(st) == std::vector<std::string>{"one", "two"}));
    }

    // append: caller case kept on disk, separator only when non-empty
    {
        const auto file = dir / "append.txt";
        lineset::EntryStore st(file);
        assert(slurp(file).empty());

        st.add("  First ");
        assert(slurp(file) == "First");
        st.add("SECOND");
        assert(slurp(file) == "First\nSECOND");

        lineset::EntryStore again(file);
        assert(again.contains("first"));
        assert(again.contains("second"));
        assert(again.size() == 2);
    }

    // append onto a file that already ends with '\n' leaves a blank line, which loads fine
    {
        const auto file = dir / "trailing.txt";
        put(file, "a\n");
        lineset::EntryStore st(file);
        st.add("b");
        assert(slurp(file) == "a\n\nb");
        lineset::EntryStore again(file);
        assert((sorted_items(again) == std::vector<std::string>{"a", "b"}));
    }

    // reopen after add("X")
    {
        const auto file = dir / "reopen.txt";
        {
            lineset::EntryStore st(file);
            st.add("X");
        }
        lineset::EntryStore st(file);
        assert(st.contains("x"));
    }

    // removing the last entry leaves an empty file
    {
        const auto file = dir / "last.txt";
        lineset::EntryStore st(file);
        st.add("only");
        st.remove("ONLY");
        assert(slurp(file).empty());
        assert(st.size() == 0);
    }

    // reload picks up external edits
    {
        const auto file = dir / "reload.txt";
        lineset::EntryStore st(file);
        st.add("keep");
        put(file, "Other\nnew");
        st.reload();
        assert(!st.contains("keep"));
        assert(st.contains("other"));
        assert(st.contains("NEW"));

        fs::remove(file);
        st.reload();
        assert(st.size() == 0);
        assert(fs::exists(file));
    }

    // missing parent directory
    {
        const auto file = dir / "no" / "such" / "dir" / "list.txt";
        try {
            lineset::EntryStore st(file);
            assert(false && "expected IoError");
        } catch (const lineset::StoreError& e) {
            assert(e.code() == lineset::ErrorCode::IoError);
        }

        lineset::StoreOptions opt;
        opt.create_parent_dirs = true;
        lineset::EntryStore st(file, opt);
        assert(fs::exists(file));
        st.add("nested");
        assert(slurp(file) == "nested");
    }

    // a directory is not a readable entry file
    try {
        lineset::EntryStore st(dir);
        assert(false && "expected IoError");
    } catch (const lineset::StoreError& e) {
        assert(e.code() == lineset::ErrorCode::IoError);
    }

    // disk failure after the in-memory update is not rolled back
    {
        const auto sub = dir / "vanish";
        fs::create_directories(sub);
        const auto file = sub / "list.txt";
        lineset::EntryStore st(file);
        st.add("before");
        fs::remove_all(sub);

        try {
            st.add("after");
            assert(false && "expected IoError");
        } catch (const lineset::StoreError& e) {
            assert(e.code() == lineset::ErrorCode::IoError);
        }
        assert(st.contains("after"));

        try {
            st.remove("before");
            assert(false && "expected IoError");
        } catch (const lineset::StoreError& e) {
            assert(e.code() == lineset::ErrorCode::IoError);
        }
        assert(!st.contains("before"));

        // reload failure keeps the diverged memory as is
        try {
            st.reload();
            assert(false && "expected IoError");
        } catch (const lineset::StoreError& e) {
            assert(e.code() == lineset::ErrorCode::IoError);
        }
        assert(st.contains("after"));

        fs::create_directories(sub);
        st.reload();
        assert(st.size() == 0);
    }

    fs::remove_all(dir);
    std::cout << "OK\n";
    return 0;
}
