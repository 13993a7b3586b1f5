// lineset/cpp/src/file_io.cpp
#include "lineset/file_io.h"
#include "lineset/errors.h"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace lineset {

static std::string errno_detail() {
    const int e = errno;
    if (e == 0) return "stream error";
    return std::strerror(e);
}

[[noreturn]] static void throw_io(const std::string& what, const fs::path& p, const std::string& detail) {
    throw StoreError(ErrorCode::IoError, what + ": " + p.string() + " err=" + detail);
}

std::optional<std::string> read_file_if_exists(const fs::path& p) {
    std::error_code ec;
    const auto st = fs::status(p, ec);
    if (st.type() == fs::file_type::not_found) return std::nullopt;
    if (ec) throw_io("cannot stat file", p, ec.message());
    if (st.type() == fs::file_type::directory) throw_io("cannot read file", p, "is a directory");

    errno = 0;
    std::ifstream in(p, std::ios::binary);
    if (!in) throw_io("cannot read file", p, errno_detail());

    std::ostringstream oss;
    oss << in.rdbuf();
    if (in.bad()) throw_io("read failed", p, errno_detail());
    return oss.str();
}

void create_empty_file(const fs::path& p) {
    errno = 0;
    std::ofstream out(p, std::ios::binary | std::ios::trunc);
    if (!out) throw_io("cannot create file", p, errno_detail());
}

void ensure_parent_dirs(const fs::path& p) {
    const auto parent = p.parent_path();
    if (parent.empty()) return;
    std::error_code ec;
    fs::create_directories(parent, ec);
    if (ec) throw_io("mkdir failed", parent, ec.message());
}

void append_line(const fs::path& p, const std::string& line) {
    errno = 0;
    std::ofstream out(p, std::ios::binary | std::ios::app);
    if (!out) throw_io("cannot open for append", p, errno_detail());

    std::error_code ec;
    const auto size = fs::file_size(p, ec);
    if (!ec && size > 0) out.put('\n');

    out.write(line.data(), (std::streamsize)line.size());
    out.flush();
    if (!out) throw_io("append failed", p, errno_detail());
}

void write_file(const fs::path& p, const std::string& content) {
    errno = 0;
    std::ofstream out(p, std::ios::binary | std::ios::trunc);
    if (!out) throw_io("cannot write file", p, errno_detail());
    out.write(content.data(), (std::streamsize)content.size());
    out.flush();
    if (!out) throw_io("write failed", p, errno_detail());
}

} // namespace lineset
