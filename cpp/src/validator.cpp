// lineset/cpp/src/validator.cpp
#include "lineset/validator.h"
#include "lineset/errors.h"
#include "lineset/file_io.h"

#include <sstream>
#include <unordered_map>

#include "text_common.h"

namespace lineset {

static uint64_t count_crlf(const std::string& s) {
    uint64_t n = 0;
    for (size_t i = 0; i + 1 < s.size(); ++i) {
        if (s[i] == '\r' && s[i + 1] == '\n') ++n;
    }
    return n;
}

ValidationResult validate_entry_file(const std::filesystem::path& file) {
    ValidationResult vr;

    std::optional<std::string> data;
    try {
        data = read_file_if_exists(file);
    } catch (const StoreError& e) {
        vr.errors.push_back(e.what());
        return vr;
    }
    if (!data) {
        vr.errors.push_back("file not found: " + file.string());
        return vr;
    }

    vr.crlf_lines = count_crlf(*data);
    if (vr.crlf_lines > 0) {
        vr.warnings.push_back(std::to_string(vr.crlf_lines) + " line(s) end with CRLF");
    }

    auto lines = split_lines(*data);
    // "a\n" splits into {"a", ""}; the empty tail is not a line
    if (!lines.empty() && lines.back().empty()) lines.pop_back();
    vr.lines = lines.size();

    std::unordered_map<std::string, uint64_t> first_seen; // normalized -> 1-based line
    for (size_t i = 0; i < lines.size(); ++i) {
        const uint64_t lineno = i + 1;
        const std::string& raw = lines[i];
        const std::string key = normalize_entry(raw);

        if (key.empty()) {
            ++vr.blank_lines;
            continue;
        }
        if (trim_view(raw).size() != raw.size()) {
            std::ostringstream oss;
            oss << "line " << lineno << ": surrounding whitespace";
            vr.warnings.push_back(oss.str());
        }

        auto it = first_seen.find(key);
        if (it != first_seen.end()) {
            ++vr.duplicate_lines;
            std::ostringstream oss;
            oss << "line " << lineno << ": duplicate of line " << it->second << " ('" << key << "')";
            vr.warnings.push_back(oss.str());
            continue;
        }
        first_seen.emplace(key, lineno);
    }

    if (vr.blank_lines > 0) {
        vr.warnings.push_back(std::to_string(vr.blank_lines) + " blank line(s)");
    }

    vr.entries = first_seen.size();
    vr.ok = vr.errors.empty();
    return vr;
}

nlohmann::json to_json(const ValidationResult& r) {
    nlohmann::json j;
    j["ok"] = r.ok;
    j["errors"] = r.errors;
    j["warnings"] = r.warnings;
    j["stats"] = {
        {"lines", r.lines},
        {"entries", r.entries},
        {"blank_lines", r.blank_lines},
        {"duplicate_lines", r.duplicate_lines},
        {"crlf_lines", r.crlf_lines},
    };
    return j;
}

} // namespace lineset
