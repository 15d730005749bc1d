/**
 * @file AtomicFileWriter.hpp
 * @brief Atomic (temp -> rename) file writes and whole-file reads.
 */

#pragma once
#include <string>
#include <filesystem>

namespace engram::infrastructure {

/**
 * @class AtomicFileWriter
 * @brief Readers never observe a half-written file: content goes to a unique
 * temp file next to the target which is then renamed over it.
 *
 * Failures throw domain::StorageError (IOFailure); reads of a missing file
 * throw domain::StorageError (NotFound).
 */
class AtomicFileWriter {
public:
    /**
     * @brief Writes content to path, replacing any existing file.
     * Parent directories are created on demand.
     */
    static void write(const std::filesystem::path& path, const std::string& content);

    /**
     * @brief Writes content to path only if no file exists there yet.
     * @return false if the target already existed (nothing written).
     */
    static bool writeNew(const std::filesystem::path& path, const std::string& content);

    /**
     * @brief Writes content to dir/<stem>.json, or the first free
     * dir/<stem>_NNNN.json when taken. Names sort lexically in write order.
     * @return File name that was written.
     */
    static std::string writeNumbered(const std::filesystem::path& dir, const std::string& stem,
                                     const std::string& content);

    /** @brief Reads the whole file as text. */
    static std::string read(const std::filesystem::path& path);

private:
    static std::filesystem::path makeTempPath(const std::filesystem::path& finalPath);
    static void writeTemp(const std::filesystem::path& tempPath, const std::string& content);
    static void ensureParent(const std::filesystem::path& finalPath);
};

} // namespace engram::infrastructure
