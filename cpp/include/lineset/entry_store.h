// lineset/cpp/include/lineset/entry_store.h
#pragma once
#include <cstddef>
#include <filesystem>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

#include "lineset/errors.h"

namespace lineset {

struct StoreOptions {
    // mkdir -p for the file's parent before creating a missing file
    bool create_parent_dirs{false};

    // "[lineset] ..." trace on stderr for load/append/rewrite
    bool verbose{false};

    // LINESET_CREATE_DIRS, LINESET_VERBOSE (1/0/true/false)
    static StoreOptions from_env();
};

// Case-insensitive string set mirrored to a newline-separated text file.
//
// Memory holds the normalized (trimmed, lowercased) form of each entry.
// add() appends the trimmed entry with the caller's case; remove() rewrites
// the whole file from memory in normalized form.
//
// Every public method holds one store-wide mutex for its full duration.
//
// Failure contract: EmptyEntry / AlreadyExists / NotFound are thrown before
// anything changes. IoError from add()/remove() is thrown AFTER memory was
// updated and is not rolled back; call reload() to resync with disk.
class EntryStore {
public:
    // Loads `file`, creating it empty when missing. Throws StoreError(IoError).
    explicit EntryStore(std::filesystem::path file, StoreOptions opt = {});

    EntryStore(const EntryStore&) = delete;
    EntryStore& operator=(const EntryStore&) = delete;

    void add(std::string_view item);
    void remove(std::string_view item);
    bool contains(std::string_view item) const;

    // Owned snapshot, arbitrary order.
    std::vector<std::string> items() const;

    // Replaces memory with the file content. On failure memory is untouched.
    void reload();

    size_t size() const;
    const std::filesystem::path& path() const { return file_; }

private:
    std::unordered_set<std::string> load_from_disk() const;
    bool contains_locked(std::string_view item) const;
    void rewrite_locked() const;
    void trace(const std::string& msg) const;

private:
    std::filesystem::path file_;
    StoreOptions opt_;

    mutable std::mutex mu_;
    std::unordered_set<std::string> set_;
};

} // namespace lineset
