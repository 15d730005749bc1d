/**
 * @file AtomicFileWriter.cpp
 * @brief Implementation of AtomicFileWriter.
 */

#include "infrastructure/AtomicFileWriter.hpp"
#include "domain/StorageError.hpp"
#include <atomic>
#include <chrono>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace engram::infrastructure {

namespace fs = std::filesystem;
using domain::ErrorKind;
using domain::StorageError;

fs::path AtomicFileWriter::makeTempPath(const fs::path& finalPath) {
    // filename.<timestamp>.<seq>.tmp, unique per operation within the process
    static std::atomic<unsigned long> sequence{0};
    auto timestamp = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path tempPath = finalPath;
    tempPath += "." + std::to_string(timestamp) + "." + std::to_string(sequence++) + ".tmp";
    return tempPath;
}

void AtomicFileWriter::ensureParent(const fs::path& finalPath) {
    try {
        if (finalPath.has_parent_path() && !fs::exists(finalPath.parent_path())) {
            fs::create_directories(finalPath.parent_path());
        }
    } catch (const fs::filesystem_error& e) {
        throw StorageError(ErrorKind::IOFailure,
                           std::string("Cannot create directory for ") + finalPath.string() + ": " + e.what());
    }
}

void AtomicFileWriter::writeTemp(const fs::path& tempPath, const std::string& content) {
    std::ofstream ofs(tempPath, std::ios::binary | std::ios::trunc);
    if (!ofs.is_open()) {
        throw StorageError(ErrorKind::IOFailure, "Failed to open temp file: " + tempPath.string());
    }
    ofs << content;
    ofs.flush();
    if (ofs.fail()) {
        ofs.close();
        std::error_code ec;
        fs::remove(tempPath, ec);
        throw StorageError(ErrorKind::IOFailure, "Write failed during output: " + tempPath.string());
    }
}

void AtomicFileWriter::write(const fs::path& path, const std::string& content) {
    ensureParent(path);
    fs::path tempPath = makeTempPath(path);
    writeTemp(tempPath, content);

    std::error_code ec;
    fs::rename(tempPath, path, ec);
    if (ec) {
        std::error_code cleanup;
        fs::remove(tempPath, cleanup);
        throw StorageError(ErrorKind::IOFailure, "Rename failed for " + path.string() + ": " + ec.message());
    }
}

bool AtomicFileWriter::writeNew(const fs::path& path, const std::string& content) {
    ensureParent(path);
    fs::path tempPath = makeTempPath(path);
    writeTemp(tempPath, content);

    // A hard link fails if the target exists, so an existing file is never replaced.
    std::error_code ec;
    fs::create_hard_link(tempPath, path, ec);
    std::error_code cleanup;
    fs::remove(tempPath, cleanup);

    if (ec) {
        if (fs::exists(path)) {
            return false;
        }
        throw StorageError(ErrorKind::IOFailure, "Failed to create " + path.string() + ": " + ec.message());
    }
    return true;
}

std::string AtomicFileWriter::writeNumbered(const fs::path& dir, const std::string& stem,
                                            const std::string& content) {
    constexpr int kMaxSuffix = 9999;
    for (int attempt = 0; attempt <= kMaxSuffix; ++attempt) {
        std::ostringstream name;
        name << stem;
        if (attempt > 0) {
            name << '_' << std::setw(4) << std::setfill('0') << attempt;
        }
        name << ".json";
        if (writeNew(dir / name.str(), content)) {
            return name.str();
        }
    }
    throw StorageError(ErrorKind::IOFailure, "No free file name for " + (dir / stem).string());
}

std::string AtomicFileWriter::read(const fs::path& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        throw StorageError(ErrorKind::NotFound, "File not found: " + path.string());
    }
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        throw StorageError(ErrorKind::IOFailure, "Failed to open file: " + path.string());
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        throw StorageError(ErrorKind::IOFailure, "Read failed: " + path.string());
    }
    return buffer.str();
}

} // namespace engram::infrastructure
