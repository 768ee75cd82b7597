#ifndef MOCKS_HPP
#define MOCKS_HPP

#include "fileservice.hpp"
#include "eventsink.hpp"
#include "imagecodec.hpp"
#include "pausegate.hpp"
#include <cstdint>
#include <deque>
#include <filesystem>
#include <functional>
#include <fstream>
#include <set>
#include <string>
#include <system_error>
#include <tuple>
#include <utility>
#include <vector>

constexpr std::uint64_t MB = 1024 * 1024;

// Real filesystem underneath, with scripted free space and deletion failures
class MockFileService : public FileService {
public:
    std::tuple<uint64_t, uint64_t, uint64_t> memory_details = {100000 * MB, 0, 100000 * MB};
    bool space_query_fails = false;
    int space_queries = 0;
    std::set<std::string> delete_denied;      // delete_file throws permission_denied
    std::set<std::string> delete_vanished;    // delete_file throws no_such_file_or_directory
    std::vector<std::string> deleted;

    void setFreeMb(double freeMb) {
        auto bytes = static_cast<uint64_t>(freeMb * MB);
        memory_details = {bytes * 2, bytes, bytes};
    }

    std::tuple<uint64_t, uint64_t, uint64_t> get_memory_details(const std::string& path) override {
        space_queries++;
        if (space_query_fails) {
            throw std::filesystem::filesystem_error("space query failed", path,
                                                    std::make_error_code(std::errc::io_error));
        }
        return memory_details;
    }

    void delete_file(const std::string& file_path) override {
        if (delete_denied.count(file_path)) {
            throw std::filesystem::filesystem_error("Permission denied", file_path,
                                                    std::make_error_code(std::errc::permission_denied));
        }
        if (delete_vanished.count(file_path)) {
            throw std::filesystem::filesystem_error("File not found", file_path,
                                                    std::make_error_code(std::errc::no_such_file_or_directory));
        }
        FileService::delete_file(file_path);
        deleted.push_back(file_path);
    }
};

// Fails decode for names containing "corrupt", fails encode for names containing "badenc"
class ScriptedCodec : public ImageCodec {
public:
    std::uint64_t output_bytes = 1024;
    ConversionErrorKind decode_failure = ConversionErrorKind::CorruptData;
    std::vector<std::string> decoded;
    std::vector<std::vector<MetadataBlock>> encoded_metadata;
    std::function<void(const std::string&)> on_decode;
    int encode_calls = 0;

    DecodeResult decode(const std::string& sourcePath) override {
        decoded.push_back(sourcePath);
        if (on_decode) {
            on_decode(sourcePath);
        }
        if (sourcePath.find("corrupt") != std::string::npos) {
            return DecodeResult::failure(decode_failure, "LibRaw: data corrupted");
        }
        PixelBuffer buffer;
        buffer.width = 2;
        buffer.height = 2;
        buffer.channels = 3;
        buffer.data.assign(12, 128);
        lastSource = sourcePath;
        return DecodeResult::success(buffer);
    }

    EncodeResult encode(const PixelBuffer& buffer, const std::string& destPath, int quality,
                        const std::vector<MetadataBlock>& metadata) override {
        encode_calls++;
        encoded_metadata.push_back(metadata);
        std::ofstream out(destPath, std::ios::binary | std::ios::trunc);
        if (lastSource.find("badenc") != std::string::npos) {
            out << "partial";
            return EncodeResult::failure(ConversionErrorKind::EncodeFailure, "libjpeg: write failed");
        }
        out << std::string(static_cast<std::size_t>(output_bytes), 'j');
        return EncodeResult::success();
    }

private:
    std::string lastSource;
};

class ScriptedTransplanter : public MetadataTransplanter {
public:
    bool succeed = true;
    int calls = 0;

    MetadataResult extract(const std::string& sourcePath) override {
        calls++;
        MetadataResult result;
        if (succeed) {
            result.blocks.push_back(MetadataBlock{"Exif", std::vector<unsigned char>(sourcePath.begin(), sourcePath.end())});
            result.message = "Exif";
        } else {
            result.message = "No metadata found in " + sourcePath;
        }
        return result;
    }
};

// Returns queued decisions in order, then the fallback
class ScriptedPauseDecisionProvider : public PauseDecisionProvider {
public:
    std::deque<PauseDecision> decisions;
    PauseDecision fallback = PauseDecision::Continue;
    std::vector<Shortfall> seen;

    PauseDecision decide(const Shortfall& shortfall) override {
        seen.push_back(shortfall);
        if (decisions.empty()) {
            return fallback;
        }
        PauseDecision decision = decisions.front();
        decisions.pop_front();
        return decision;
    }
};

class ScriptedConfirmationProvider : public ConfirmationProvider {
public:
    bool answer = true;
    std::vector<std::string> prompts;

    bool confirm(const std::string& prompt) override {
        prompts.push_back(prompt);
        return answer;
    }
};

struct RecordedEvent {
    LogLevel level;
    std::string message;
    nlohmann::json details;
    std::string eventCode;
};

class RecordingSink : public EventSink {
public:
    std::vector<RecordedEvent> events;
    std::vector<ProgressReport> reports;

    void log(LogLevel level, const std::string& message,
             const nlohmann::json& details, const std::string& eventCode) override {
        events.push_back({level, message, details, eventCode});
    }

    void progress(const ProgressReport& report) override {
        reports.push_back(report);
    }

    bool hasEvent(const std::string& eventCode) const {
        return count(eventCode) > 0;
    }

    std::size_t count(const std::string& eventCode) const {
        std::size_t n = 0;
        for (const auto& event : events) {
            if (event.eventCode == eventCode) {
                n++;
            }
        }
        return n;
    }
};

#endif // MOCKS_HPP
