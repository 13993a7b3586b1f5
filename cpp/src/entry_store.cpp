// lineset/cpp/src/entry_store.cpp
#include "lineset/entry_store.h"
#include "lineset/file_io.h"

#include <cstdlib>
#include <cstring>
#include <iostream>
#include <utility>

#include "text_common.h"

namespace lineset {

static bool env_bool(const char* key, bool defv) {
    const char* s = std::getenv(key);
    if (!s || !*s) return defv;
    if (std::strcmp(s, "1") == 0) return true;
    if (std::strcmp(s, "0") == 0) return false;
    if (std::strcmp(s, "true") == 0 || std::strcmp(s, "TRUE") == 0) return true;
    if (std::strcmp(s, "false") == 0 || std::strcmp(s, "FALSE") == 0) return false;
    return defv;
}

StoreOptions StoreOptions::from_env() {
    StoreOptions o;
    o.create_parent_dirs = env_bool("LINESET_CREATE_DIRS", o.create_parent_dirs);
    o.verbose = env_bool("LINESET_VERBOSE", o.verbose);
    return o;
}

EntryStore::EntryStore(std::filesystem::path file, StoreOptions opt)
    : file_(std::move(file)), opt_(opt) {
    set_ = load_from_disk();
}

std::unordered_set<std::string> EntryStore::load_from_disk() const {
    std::unordered_set<std::string> out;

    auto data = read_file_if_exists(file_);
    if (!data) {
        if (opt_.create_parent_dirs) ensure_parent_dirs(file_);
        create_empty_file(file_);
        trace("created empty " + file_.string());
        return out;
    }

    for (const auto& line : split_lines(*data)) {
        std::string e = normalize_entry(line);
        if (!e.empty()) out.insert(std::move(e));
    }
    trace("loaded " + std::to_string(out.size()) + " entries from " + file_.string());
    return out;
}

void EntryStore::add(std::string_view item) {
    std::lock_guard<std::mutex> lk(mu_);

    const std::string trimmed = trim_copy(item);
    if (trimmed.empty()) throw StoreError(ErrorCode::EmptyEntry, "cannot add empty entry");
    if (contains_locked(trimmed)) throw StoreError(ErrorCode::AlreadyExists, "already exists: " + trimmed);

    // memory first, then disk; no rollback if the append throws
    set_.insert(to_lower_copy(trimmed));
    append_line(file_, trimmed);
    trace("appended '" + trimmed + "'");
}

void EntryStore::remove(std::string_view item) {
    std::lock_guard<std::mutex> lk(mu_);

    const std::string trimmed = trim_copy(item);
    if (trimmed.empty()) throw StoreError(ErrorCode::EmptyEntry, "cannot remove empty entry");
    if (!contains_locked(trimmed)) throw StoreError(ErrorCode::NotFound, "entry not found: " + trimmed);

    set_.erase(to_lower_copy(trimmed));
    rewrite_locked();
}

bool EntryStore::contains(std::string_view item) const {
    std::lock_guard<std::mutex> lk(mu_);
    return contains_locked(item);
}

bool EntryStore::contains_locked(std::string_view item) const {
    const std::string key = normalize_entry(item);
    if (key.empty()) return false;
    return set_.find(key) != set_.end();
}

std::vector<std::string> EntryStore::items() const {
    std::lock_guard<std::mutex> lk(mu_);
    return std::vector<std::string>(set_.begin(), set_.end());
}

void EntryStore::reload() {
    std::lock_guard<std::mutex> lk(mu_);
    auto fresh = load_from_disk();
    set_.swap(fresh);
}

size_t EntryStore::size() const {
    std::lock_guard<std::mutex> lk(mu_);
    return set_.size();
}

void EntryStore::rewrite_locked() const {
    std::vector<std::string> lines(set_.begin(), set_.end());
    write_file(file_, join_lines(lines));
    trace("rewrote " + std::to_string(lines.size()) + " entries to " + file_.string());
}

void EntryStore::trace(const std::string& msg) const {
    if (!opt_.verbose) return;
    std::cerr << "[lineset] " << msg << "\n";
}

} // namespace lineset
