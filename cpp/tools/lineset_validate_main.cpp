// lineset/cpp/tools/lineset_validate_main.cpp
#include <iostream>
#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>
#include "lineset/errors.h"
#include "lineset/validator.h"

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "Usage: lineset_validate <entries_file> [--strict]\n";
        return 1;
    }

    std::filesystem::path file = argv[1];
    bool strict = false;

    for (int i = 2; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--strict") {
            strict = true;
        } else {
            std::cerr << "lineset_validate: " << lineset::to_string(lineset::ErrorCode::InvalidArgs)
                      << ": unknown option " << a << "\n";
            return 1;
        }
    }

    try {
        auto vr = lineset::validate_entry_file(file);
        nlohmann::json j = lineset::to_json(vr);
        j["file"] = file.string();
        j["strict"] = strict;
        std::cout << j.dump() << "\n";

        if (!vr.ok) return 2;
        if (strict && !vr.warnings.empty()) return 2;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "lineset_validate failed: " << e.what() << "\n";
        return 2;
    }
}
