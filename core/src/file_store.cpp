#include "reviser/file_store.h"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <iostream>
#include <random>
#include <sstream>

#ifndef _WIN32
#include <fcntl.h>
#include <unistd.h>
#endif

namespace reviser {

namespace fs = std::filesystem;

std::string ConfinedFileStore::read(const fs::path& p) const {
    fs::path safe;
    std::string err;
    if (!guard_.check(p, &safe, &err)) {
        std::cerr << "[file_store] read rejected: " << err << "\n";
        return "";
    }

    std::error_code ec;
    if (!fs::is_regular_file(safe, ec)) {
        std::cerr << "[file_store] read failed: '" << p.string() << "' is not a regular file\n";
        return "";
    }

    std::ifstream f(safe, std::ios::binary);
    if (!f) {
        std::cerr << "[file_store] read failed: cannot open '" << p.string() << "': " << std::strerror(errno) << "\n";
        return "";
    }
    std::ostringstream ss;
    ss << f.rdbuf();
    if (f.bad()) {
        std::cerr << "[file_store] read failed: I/O error on '" << p.string() << "'\n";
        return "";
    }
    return ss.str();
}

WriteOutcome ConfinedFileStore::write(const fs::path& p, const std::string& content) const {
    fs::path target;
    std::string err;
    if (!guard_.check(p, &target, &err)) {
        std::cerr << "[file_store] write rejected: " << err << "\n";
        return {WriteOutcome::Kind::SANDBOX_VIOLATION, err};
    }

    std::error_code ec;
    fs::create_directories(target.parent_path(), ec);
    if (ec) {
        std::string msg = "error writing '" + p.string() + "': cannot create parent directory: " + ec.message();
        std::cerr << "[file_store] " << msg << "\n";
        return {WriteOutcome::Kind::IO_ERROR, msg};
    }
    if (fs::is_directory(target, ec)) {
        std::string msg = "error writing '" + p.string() + "': target is a directory";
        std::cerr << "[file_store] " << msg << "\n";
        return {WriteOutcome::Kind::IO_ERROR, msg};
    }

    // tmp -> fsync -> rename
    std::string tmp_path = target.string() + ".tmp." + std::to_string(std::random_device{}());

    std::ofstream f(tmp_path, std::ios::binary | std::ios::trunc);
    if (!f) {
        std::string msg = "error writing '" + p.string() + "': " + std::strerror(errno);
        std::cerr << "[file_store] " << msg << "\n";
        return {WriteOutcome::Kind::IO_ERROR, msg};
    }
    f.write(content.data(), (std::streamsize)content.size());
    f.close();
    if (!f) {
        fs::remove(tmp_path, ec);
        std::string msg = "error writing '" + p.string() + "': I/O error";
        std::cerr << "[file_store] " << msg << "\n";
        return {WriteOutcome::Kind::IO_ERROR, msg};
    }

#ifndef _WIN32
    int fd = ::open(tmp_path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd >= 0) { ::fsync(fd); ::close(fd); }
#endif

    std::error_code rename_ec;
    fs::rename(tmp_path, target, rename_ec);
    if (rename_ec) {
        fs::remove(tmp_path, ec);
        std::string msg = "error writing '" + p.string() + "': rename failed: " + rename_ec.message();
        std::cerr << "[file_store] " << msg << "\n";
        return {WriteOutcome::Kind::IO_ERROR, msg};
    }

#ifndef _WIN32
    int dfd = ::open(target.parent_path().c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (dfd >= 0) { ::fsync(dfd); ::close(dfd); }
#endif

    return {};
}

} // namespace reviser
