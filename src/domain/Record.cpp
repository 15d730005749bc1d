/**
 * @file Record.cpp
 * @brief Implementation of Record factory helpers.
 */

#include "domain/Record.hpp"
#include <random>
#include <mutex>

namespace engram::domain {

std::string Record::GenerateId() {
    static const char hexDigits[] = "0123456789abcdef";
    static std::mt19937_64 engine{std::random_device{}()};
    static std::mutex engineMutex;

    std::uniform_int_distribution<int> dist(0, 15);
    std::string s;
    s.reserve(32);
    std::lock_guard<std::mutex> lock(engineMutex);
    for (int i = 0; i < 32; ++i) {
        s += hexDigits[dist(engine)];
    }
    return s;
}

Record Record::Create(std::string content,
                      std::vector<std::string> entities,
                      RecordType type,
                      float valence,
                      RecordSource source,
                      float confidence) {
    Record record;
    record.id = GenerateId();
    record.content = std::move(content);
    record.timestamp = std::chrono::system_clock::now();
    for (const auto& entity : entities) {
        record.addEntity(entity);
    }
    record.recordType = type;
    record.valence = std::clamp(valence, -1.0f, 1.0f);
    record.source = std::move(source);
    record.confidence = std::clamp(confidence, 0.0f, 1.0f);
    return record;
}

} // namespace engram::domain
