#include <envinject/file_io.hpp>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>

namespace envinject {

namespace fs = std::filesystem;

Result<std::string> read_file(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return InjectError(InjectError::IO,
            std::string("cannot open for reading: ") + std::strerror(errno),
            "", path.string());
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    if (in.bad()) {
        return InjectError(InjectError::IO, "read failed", "", path.string());
    }
    return Result<std::string>::ok(ss.str());
}

Status write_file_atomic(const fs::path& path, const std::string& contents) {
    std::error_code ec;
    auto status = fs::status(path, ec);
    if (ec) {
        return InjectError(InjectError::IO,
            "cannot stat: " + ec.message(), "", path.string());
    }
    if (!fs::is_regular_file(status)) {
        return InjectError(InjectError::IO,
            "not a regular file (removed during the run?)", "", path.string());
    }

    fs::path tmp = path;
    tmp += ".envinject-tmp";

    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            return InjectError(InjectError::IO,
                "cannot open temporary file '" + tmp.filename().string() +
                "' for writing: " + std::strerror(errno),
                "check that the asset directory is writable", path.string());
        }
        out.write(contents.data(), static_cast<std::streamsize>(contents.size()));
        out.flush();
        if (!out) {
            out.close();
            fs::remove(tmp, ec);
            return InjectError(InjectError::IO,
                "write failed (disk full?)", "", path.string());
        }
    }

    fs::permissions(tmp, status.permissions(), fs::perm_options::replace, ec);
    if (ec) {
        auto msg = ec.message();
        fs::remove(tmp, ec);
        return InjectError(InjectError::IO,
            "cannot set permissions: " + msg, "", path.string());
    }

    fs::rename(tmp, path, ec);
    if (ec) {
        auto msg = ec.message();
        fs::remove(tmp, ec);
        return InjectError(InjectError::IO,
            "cannot replace file: " + msg, "", path.string());
    }

    return ok_status();
}

} // namespace envinject
