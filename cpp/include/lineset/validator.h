// lineset/cpp/include/lineset/validator.h
#pragma once
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace lineset {

struct ValidationResult {
    bool ok{false};                    // file exists and is readable
    std::vector<std::string> errors;   // fatal
    std::vector<std::string> warnings; // loadable, but not what a rewrite would produce

    uint64_t lines{0};
    uint64_t entries{0};          // distinct after normalization
    uint64_t blank_lines{0};
    uint64_t duplicate_lines{0};  // case-insensitive repeats
    uint64_t crlf_lines{0};
};

// Read-only; never creates the file.
ValidationResult validate_entry_file(const std::filesystem::path& file);

nlohmann::json to_json(const ValidationResult& r);

} // namespace lineset
