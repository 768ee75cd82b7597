#include <catch2/catch.hpp>
#include <libraw/libraw.h>
#include <nlohmann/json.hpp>
#include <pugixml.hpp>

#include "conversionpolicy.hpp"
#include "diskspacemonitor.hpp"
#include "librawcodec.hpp"
#include "loggingservice.hpp"
#include "metadatatransplanter.hpp"
#include "pausegate.hpp"
#include "statestore.hpp"
#include "mocks.hpp"

#include <cerrno>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

class TestLogger {
private:
    std::ofstream log_file;
    int total_tests = 0;
    int total_assertions = 0;
    int passed_assertions = 0;
    bool current_test_passed = true;
    int passed_tests = 0;

    std::string getCurrentDateTime() {
        auto now = std::chrono::system_clock::now();
        auto in_time_t = std::chrono::system_clock::to_time_t(now);
        std::stringstream ss;
        ss << std::put_time(std::localtime(&in_time_t), "%Y-%m-%d %H:%M:%S");
        return ss.str();
    }
public:
    TestLogger(const std::string& filename = "component_test_execution.log") {
        log_file.open(filename);
        log_file << "=================================================================" << std::endl;
        log_file << "RAWCONVERT COMPONENT TEST EXECUTION LOG" << std::endl;
        log_file << "=================================================================" << std::endl;
        log_file << "Execution Date: " << getCurrentDateTime() << std::endl;
    }
    void startTest(const std::string& testName) {
        if (total_tests > 0 && current_test_passed) {
            passed_tests++;
        }
        log_file << "\n-----------------------------------------------------------------" << std::endl;
        log_file << "TEST CASE: " << testName << std::endl;
        total_tests++;
        current_test_passed = true;
    }
    void logCheck(const std::string& check, bool passed) {
        log_file << "- " << check << " - " << (passed ? "PASSED" : "FAILED") << std::endl;
        total_assertions++;
        if (passed) {
            passed_assertions++;
        } else {
            current_test_passed = false;
        }
    }
    void finalize() {
        if (current_test_passed && total_tests > 0) {
            passed_tests++;
        }
        double success_rate = (total_tests > 0) ? (passed_tests * 100.0 / total_tests) : 0;

        log_file << "\n=================================================================" << std::endl;
        log_file << "SUMMARY" << std::endl;
        log_file << "=================================================================" << std::endl;
        log_file << "Total Test Cases: " << total_tests << std::endl;
        log_file << "Passed Test Cases: " << passed_tests << std::endl;
        log_file << "Total Assertions: " << total_assertions << std::endl;
        log_file << "Passed Assertions: " << passed_assertions << std::endl;
        log_file << "Success Rate: " << std::fixed << std::setprecision(1) << success_rate << "%" << std::endl;
        log_file.close();
    }
    ~TestLogger() {
        if (log_file.is_open()) {
            finalize();
        }
    }
};

// Global test logger
TestLogger logger;

// Scratch directory removed when the test case ends
class ScratchDir {
public:
    fs::path path;
    explicit ScratchDir(const std::string& name)
        : path(fs::temp_directory_path() / ("rawconvert_component_" + name)) {
        fs::remove_all(path);
        fs::create_directories(path);
    }
    ~ScratchDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }
    std::string file(const std::string& name) const { return (path / name).string(); }
};

// The production logger only has a protected constructor
class TestableLoggingService : public LoggingService {
public:
    TestableLoggingService(const std::string& name, const std::string& dir) : LoggingService(name, dir) {}
};

PixelBuffer gradient(int width, int height) {
    PixelBuffer buffer;
    buffer.width = width;
    buffer.height = height;
    buffer.channels = 3;
    for (int y = 0; y < height; ++y) {
        for (int x = 0; x < width; ++x) {
            buffer.data.push_back(static_cast<unsigned char>(x * 255 / width));
            buffer.data.push_back(static_cast<unsigned char>(y * 255 / height));
            buffer.data.push_back(128);
        }
    }
    return buffer;
}


TEST_CASE("10. Disk Space Classification") {
    logger.startTest("Disk Space Classification");

    SECTION("10.1 Threshold boundaries") {
        REQUIRE(DiskSpaceMonitor::classify(0.0, 500.0) == SpaceStatus::Critical);
        REQUIRE(DiskSpaceMonitor::classify(499.9, 500.0) == SpaceStatus::Critical);
        REQUIRE(DiskSpaceMonitor::classify(500.0, 500.0) == SpaceStatus::Warning);
        REQUIRE(DiskSpaceMonitor::classify(999.9, 500.0) == SpaceStatus::Warning);
        REQUIRE(DiskSpaceMonitor::classify(1000.0, 500.0) == SpaceStatus::Ok);
        REQUIRE(DiskSpaceMonitor::classify(1e9, 1.0) == SpaceStatus::Ok);
        logger.logCheck("critical / warning / ok boundaries", true);
    }

    SECTION("10.2 Check cadence follows the status") {
        MockFileService fileService;
        RecordingSink sink;
        DiskSpaceMonitor monitor("/tmp", 500, fileService, sink);
        REQUIRE(monitor.checkIntervalFor(SpaceStatus::Critical) == 1);
        REQUIRE(monitor.checkIntervalFor(SpaceStatus::Warning) == 3);
        REQUIRE(monitor.checkIntervalFor(SpaceStatus::Ok) == 5);
        logger.logCheck("cadence 1 / 3 / 5", true);
    }

    SECTION("10.3 Measured space is classified and logged") {
        MockFileService fileService;
        RecordingSink sink;
        DiskSpaceMonitor monitor("/tmp", 500, fileService, sink);

        fileService.setFreeMb(700);
        SpaceReport warning = monitor.check();
        REQUIRE(warning.status == SpaceStatus::Warning);
        REQUIRE(warning.freeMb == Approx(700.0));
        REQUIRE(sink.hasEvent("SPACE_WARNING"));

        fileService.setFreeMb(200);
        REQUIRE(monitor.check().status == SpaceStatus::Critical);
        REQUIRE(sink.hasEvent("SPACE_CRITICAL"));
        logger.logCheck("check() classification", true);
    }

    SECTION("10.4 Failed query fails safe") {
        MockFileService fileService;
        RecordingSink sink;
        fileService.space_query_fails = true;
        DiskSpaceMonitor monitor("/unreadable", 500, fileService, sink);

        SpaceReport report = monitor.check();
        REQUIRE(report.status == SpaceStatus::Critical);
        REQUIRE(report.freeMb == 0.0);
        REQUIRE(report.queryFailed);
        REQUIRE(sink.events.at(0).level == LogLevel::ERROR);
        REQUIRE(sink.events.at(0).eventCode == "SPACE_CHECK_FAIL");
        logger.logCheck("query failure reported as critical", true);
    }

    SECTION("10.5 Required space must be positive") {
        MockFileService fileService;
        RecordingSink sink;
        REQUIRE_THROWS_AS(DiskSpaceMonitor("/tmp", 0, fileService, sink), std::invalid_argument);
    }
}

TEST_CASE("11. Shortfall Prediction") {
    logger.startTest("Shortfall Prediction");
    MockFileService fileService;
    RecordingSink sink;

    SECTION("11.1 No prediction below five samples") {
        DiskSpaceMonitor monitor("/tmp", 500, fileService, sink);
        for (int i = 0; i < 4; ++i) {
            monitor.recordOutputSize(100.0);
        }
        REQUIRE_FALSE(monitor.predictShortfall(1000, 1.0).has_value());
        monitor.recordOutputSize(100.0);
        REQUIRE(monitor.predictShortfall(1000, 1.0).has_value());
        logger.logCheck("minimum sample count", true);
    }

    SECTION("11.2 Only the most recent window is averaged") {
        SpaceCheckIntervals intervals;
        DiskSpaceMonitor monitor("/tmp", 500, fileService, sink, intervals, 5, 5);
        for (int i = 1; i <= 10; ++i) {
            monitor.recordOutputSize(static_cast<double>(i));
        }
        REQUIRE(monitor.sampleCount() == 5);
        REQUIRE(monitor.averageOutputMb() == Approx(8.0));

        auto shortfall = monitor.predictShortfall(10, 50.0);
        REQUIRE(shortfall.has_value());
        REQUIRE(shortfall->estimatedNeedMb == Approx(80.0));
        REQUIRE(shortfall->remainingFiles == 10);

        REQUIRE_FALSE(monitor.predictShortfall(5, 50.0).has_value());
        REQUIRE_FALSE(monitor.predictShortfall(0, 0.0).has_value());
        logger.logCheck("rolling window average", true);
    }
}

TEST_CASE("12. State Store") {
    logger.startTest("State Store");
    ScratchDir dir("statestore");
    FileService fileService;
    RecordingSink sink;
    StateStore store(dir.path.string(), fileService, sink);

    SECTION("12.1 Missing partition loads empty with a warning") {
        REQUIRE(store.loadConverted().empty());
        REQUIRE(sink.hasEvent("STORE_LOAD_MISSING"));
        logger.logCheck("missing partition", true);
    }

    SECTION("12.2 Malformed partition loads empty with a warning") {
        std::ofstream(dir.file("corrupt_files.json")) << "{ \"truncated\": ";
        REQUIRE(store.loadCorrupt().empty());
        REQUIRE(sink.hasEvent("STORE_LOAD_FAIL"));

        std::ofstream(dir.file("corrupt_files.json"), std::ios::trunc) << "[1, 2, 3]";
        REQUIRE(store.loadCorrupt().empty());
        logger.logCheck("malformed partition", true);
    }

    SECTION("12.3 Entries without an output path are dropped") {
        std::ofstream(dir.file("conversion_log.json")) << R"({
            "/a.cr2": {"output_path": "/a.jpg", "converted_at": "x", "file_size": 3},
            "/b.cr2": {"converted_at": "x"}
        })";
        ConvertedLog log = store.loadConverted();
        REQUIRE(log.size() == 1);
        REQUIRE(log.find("/a.cr2")->outputPath == "/a.jpg");
        REQUIRE(log.find("/b.cr2") == nullptr);
        REQUIRE(sink.hasEvent("STORE_ENTRY_INVALID"));
    }

    SECTION("12.4 Save and load keep insertion order and field names") {
        ConvertedLog log;
        log.insert("/z.cr2", ConvertedRecord{"/z.jpg", "2024-05-01T10:00:00.000000", 10});
        log.insert("/a.cr2", ConvertedRecord{"/a.jpg", "2024-05-01T10:00:01.000000", 20});
        log.insert("/z.cr2", ConvertedRecord{"/z2.jpg", "2024-05-01T10:00:02.000000", 11});
        REQUIRE(store.saveConverted(log));
        REQUIRE_FALSE(fs::exists(dir.file("conversion_log.json.tmp")));

        ConvertedLog loaded = store.loadConverted();
        REQUIRE(loaded.size() == 2);
        REQUIRE(loaded.items()[0].first == "/z.cr2");
        REQUIRE(loaded.items()[0].second.outputPath == "/z2.jpg");
        REQUIRE(loaded.items()[1].second.sourceSize == 20);

        auto document = nlohmann::json::parse(fileService.read_file(dir.file("conversion_log.json")));
        REQUIRE(document["/a.cr2"].contains("output_path"));
        REQUIRE(document["/a.cr2"].contains("converted_at"));
        REQUIRE(document["/a.cr2"].contains("file_size"));
        logger.logCheck("save / load round trip", true);
    }

    SECTION("12.5 Failed save is reported, not thrown") {
        StateStore missingRoot((dir.path / "does_not_exist").string(), fileService, sink);
        DeletedLog log;
        log.insert("/a.cr2", DeletedRecord{"2024-05-01T10:00:00.000000", 5, "/a.jpg"});

        bool saved = true;
        REQUIRE_NOTHROW(saved = missingRoot.saveDeleted(log));
        REQUIRE_FALSE(saved);
        REQUIRE(sink.hasEvent("STORE_SAVE_FAIL"));
        logger.logCheck("save failure", true);
    }

    SECTION("12.6 Custom partition file names") {
        PartitionFiles files;
        files.converted = "converted_custom.json";
        StateStore custom(dir.path.string(), fileService, sink, files);
        REQUIRE(custom.partitionPath(Partition::Converted) == dir.file("converted_custom.json"));
        REQUIRE(custom.partitionPath(Partition::Deleted) == dir.file("deletion_log.json"));
    }
}

TEST_CASE("13. Conversion Policy") {
    logger.startTest("Conversion Policy");
    ScratchDir dir("policy");

    SECTION("13.1 Defaults") {
        ConversionPolicy policy;
        REQUIRE(policy.jpegQuality == 95);
        REQUIRE(policy.requiredSpaceMb == 500);
        REQUIRE(policy.flushInterval == 5);
        REQUIRE(policy.rawExtensions.size() == 9);
        REQUIRE(policy.isRawFile("/photos/IMG_0001.CR2"));
        REQUIRE(policy.isRawFile("/photos/p.Rw2"));
        REQUIRE_FALSE(policy.isRawFile("/photos/p.jpg"));
        REQUIRE_FALSE(policy.isRawFile("/photos/cr2"));
        REQUIRE(policy.outputPathFor("/photos/day1/IMG_0001.CR2") == "/photos/day1/IMG_0001.jpg");
        logger.logCheck("default policy", true);
    }

    SECTION("13.2 Absent file keeps defaults") {
        ConversionPolicy policy;
        REQUIRE_FALSE(policy.loadConfig(dir.file("missing.json")));
        REQUIRE(policy.requiredSpaceMb == 500);
    }

    SECTION("13.3 Sections override defaults") {
        std::ofstream(dir.file("config.json")) << R"({
            "conversion": {
                "raw_extensions": ["CR3", ".nef"],
                "jpeg_quality": 90,
                "required_space_mb": 2048,
                "space_check_interval": {"ok": 10},
                "conversion_log": "converted.json"
            },
            "deletion": {"deletion_log": "removed.json"}
        })";
        ConversionPolicy policy;
        REQUIRE(policy.loadConfig(dir.file("config.json")));
        REQUIRE(policy.rawExtensions == std::vector<std::string>{".cr3", ".nef"});
        REQUIRE(policy.jpegQuality == 90);
        REQUIRE(policy.requiredSpaceMb == 2048);
        REQUIRE(policy.spaceCheckIntervalOk == 10);
        REQUIRE(policy.spaceCheckIntervalWarning == 3);
        REQUIRE(policy.conversionLogName == "converted.json");
        REQUIRE(policy.deletionLogName == "removed.json");
        REQUIRE(policy.isRawFile("x.CR3"));
        REQUIRE_FALSE(policy.isRawFile("x.cr2"));
        logger.logCheck("config overlay", true);
    }

    SECTION("13.4 Malformed or invalid configuration throws") {
        std::ofstream(dir.file("broken.json")) << "{ \"conversion\": { \"jpeg_quality\": 90, } }";
        ConversionPolicy policy;
        REQUIRE_THROWS_AS(policy.loadConfig(dir.file("broken.json")), std::runtime_error);

        std::ofstream(dir.file("typed.json")) << R"({"conversion": {"jpeg_quality": "high"}})";
        REQUIRE_THROWS_AS(policy.loadConfig(dir.file("typed.json")), std::runtime_error);

        std::ofstream(dir.file("range.json")) << R"({"conversion": {"jpeg_quality": 0}})";
        REQUIRE_THROWS_AS(ConversionPolicy().loadConfig(dir.file("range.json")), std::runtime_error);
        logger.logCheck("invalid configuration", true);
    }

    SECTION("13.5 Negative counts are rejected, not wrapped") {
        std::ofstream(dir.file("negative.json")) << R"({"conversion": {"flush_interval": -1}})";
        ConversionPolicy policy;
        REQUIRE_THROWS_AS(policy.loadConfig(dir.file("negative.json")), std::runtime_error);
        REQUIRE(policy.flushInterval == 5);

        std::ofstream(dir.file("negative_interval.json"))
            << R"({"conversion": {"space_check_interval": {"critical": -3}}})";
        REQUIRE_THROWS_AS(ConversionPolicy().loadConfig(dir.file("negative_interval.json")), std::runtime_error);

        std::ofstream(dir.file("fraction.json")) << R"({"conversion": {"prediction_window": 7.5}})";
        REQUIRE_THROWS_AS(ConversionPolicy().loadConfig(dir.file("fraction.json")), std::runtime_error);
    }
}

TEST_CASE("14. JPEG Encoding And Metadata") {
    logger.startTest("JPEG Encoding And Metadata");
    ScratchDir dir("codec");
    LibRawJpegCodec codec;

    SECTION("14.1 Encoder writes a complete JPEG and no part file") {
        std::string dest = dir.file("out.jpg");
        EncodeResult result = codec.encode(gradient(32, 16), dest, 95, {});
        REQUIRE(result.ok());
        REQUIRE_FALSE(fs::exists(dest + ".part"));

        std::string bytes = FileService().read_file(dest);
        REQUIRE(bytes.size() > 4);
        REQUIRE(static_cast<unsigned char>(bytes[0]) == 0xFF);
        REQUIRE(static_cast<unsigned char>(bytes[1]) == 0xD8);
        REQUIRE(static_cast<unsigned char>(bytes[bytes.size() - 2]) == 0xFF);
        REQUIRE(static_cast<unsigned char>(bytes[bytes.size() - 1]) == 0xD9);
        logger.logCheck("baseline JPEG written", true);
    }

    SECTION("14.2 Inconsistent buffer fails without output") {
        PixelBuffer buffer = gradient(8, 8);
        buffer.data.resize(10);
        std::string dest = dir.file("bad.jpg");
        EncodeResult result = codec.encode(buffer, dest, 95, {});
        REQUIRE_FALSE(result.ok());
        REQUIRE(result.error->kind == ConversionErrorKind::EncodeFailure);
        REQUIRE_FALSE(fs::exists(dest));
    }

    SECTION("14.3 Non-raw input does not decode") {
        std::ofstream(dir.file("fake.cr2")) << "this is not a raw file";
        DecodeResult result = codec.decode(dir.file("fake.cr2"));
        REQUIRE_FALSE(result.ok());
        REQUIRE_FALSE(result.error.message.empty());
    }

    SECTION("14.4 LibRaw error classification") {
        REQUIRE(LibRawJpegCodec::classifyLibRawError(LIBRAW_FILE_UNSUPPORTED) == ConversionErrorKind::UnsupportedFormat);
        REQUIRE(LibRawJpegCodec::classifyLibRawError(LIBRAW_DATA_ERROR) == ConversionErrorKind::CorruptData);
        REQUIRE(LibRawJpegCodec::classifyLibRawError(LIBRAW_IO_ERROR) == ConversionErrorKind::CorruptData);
        REQUIRE(LibRawJpegCodec::classifyLibRawError(LIBRAW_UNSUFFICIENT_MEMORY) == ConversionErrorKind::IoError);
        REQUIRE(LibRawJpegCodec::classifyLibRawError(ENOENT) == ConversionErrorKind::IoError);
        REQUIRE(conversionErrorKindName(ConversionErrorKind::IoError) == "IoError");
    }

    SECTION("14.5 Metadata blocks are written as APP segments") {
        std::vector<MetadataBlock> metadata = {
            {"Exif", {'M', 'M', 0x00, 0x2A, 0x00, 0x00, 0x00, 0x08}},
            {"XMP", {'<', 'x', '/', '>'}},
            {"IPTC", {'P', 'h', 'o', 't', 'o', 's', 'h', 'o', 'p', ' ', '3', '.', '0', 0x00}},
            {"ICC", {0x01, 0x02}}
        };
        std::string dest = dir.file("tagged.jpg");
        REQUIRE(codec.encode(gradient(16, 16), dest, 90, metadata).ok());

        std::string bytes = FileService().read_file(dest);
        REQUIRE(bytes.find(std::string("Exif\0\0MM", 8)) != std::string::npos);

        std::vector<MetadataBlock> blocks;
        std::string error;
        REQUIRE(readJpegMetadataBlocks(reinterpret_cast<const unsigned char*>(bytes.data()), bytes.size(),
                                       blocks, error));
        REQUIRE(blocks.size() == 3);
        REQUIRE(blocks[0].type == "Exif");
        REQUIRE(blocks[0].data == metadata[0].data);
        REQUIRE(blocks[1].type == "XMP");
        REQUIRE(blocks[1].data == metadata[1].data);
        REQUIRE(blocks[2].type == "IPTC");
        REQUIRE(blocks[2].data == metadata[2].data);
        logger.logCheck("APP segments written", true);
    }

    SECTION("14.6 A block too large for one segment is left out") {
        std::vector<MetadataBlock> metadata = {{"XMP", std::vector<unsigned char>(70000, 'x')}};
        std::string dest = dir.file("oversized.jpg");
        REQUIRE(codec.encode(gradient(8, 8), dest, 90, metadata).ok());

        std::string bytes = FileService().read_file(dest);
        std::vector<MetadataBlock> blocks;
        std::string error;
        REQUIRE(readJpegMetadataBlocks(reinterpret_cast<const unsigned char*>(bytes.data()), bytes.size(),
                                       blocks, error));
        REQUIRE(blocks.empty());
    }

    SECTION("14.7 Reading markers from a non-JPEG stream fails") {
        const std::string gif = "GIF89a";
        std::vector<MetadataBlock> blocks;
        std::string error;
        REQUIRE_FALSE(readJpegMetadataBlocks(reinterpret_cast<const unsigned char*>(gif.data()), gif.size(),
                                             blocks, error));
        REQUIRE_FALSE(error.empty());
        REQUIRE(blocks.empty());

        REQUIRE_FALSE(readJpegMetadataBlocks(nullptr, 0, blocks, error));
    }

    SECTION("14.8 XMP packet carries escaped camera fields") {
        CaptureMetadata metadata;
        metadata.make = "Canon";
        metadata.model = "EOS R5";
        metadata.artist = "Smith & Sons";
        metadata.isoSpeed = 400;
        metadata.shutterSeconds = 0.004f;
        metadata.aperture = 2.8f;
        REQUIRE_FALSE(metadata.empty());
        REQUIRE(CaptureMetadata().empty());

        std::string packet = buildXmpPacket(metadata);
        REQUIRE(packet.rfind("<?xpacket begin=", 0) == 0);
        REQUIRE(packet.find("Smith &amp; Sons") != std::string::npos);

        pugi::xml_document doc;
        REQUIRE(doc.load_string(packet.c_str()).status == pugi::status_ok);
        pugi::xml_node description = doc.child("x:xmpmeta").child("rdf:RDF").child("rdf:Description");
        REQUIRE(std::string(description.attribute("tiff:Make").value()) == "Canon");
        REQUIRE(std::string(description.attribute("tiff:Artist").value()) == "Smith & Sons");
        REQUIRE(std::string(description.attribute("exif:ExposureTime").value()) == "1/250");
        REQUIRE(std::string(description.attribute("exif:FNumber").value()) == "28/10");
        REQUIRE(description.attribute("aux:Lens").empty());
        REQUIRE(description.child("exif:ISOSpeedRatings").child("rdf:Seq").child("rdf:li").text().as_int() == 400);
        logger.logCheck("XMP packet", true);
    }

    SECTION("14.9 Unreadable source yields no metadata") {
        std::ofstream(dir.file("fake.nef")) << "not raw";

        LibRawMetadataTransplanter transplanter;
        MetadataResult result = transplanter.extract(dir.file("fake.nef"));
        REQUIRE_FALSE(result.found());
        REQUIRE(result.message.find("fake.nef") != std::string::npos);
    }
}

TEST_CASE("15. Pause Gate And Confirmation") {
    logger.startTest("Pause Gate And Confirmation");
    Shortfall shortfall{700.0, 300.0, 25.0, 28};

    SECTION("15.1 Terminal decisions") {
        std::ostringstream out;
        std::istringstream exitInput("exit\n");
        REQUIRE(TerminalPauseDecisionProvider(exitInput, out).decide(shortfall) == PauseDecision::Abort);
        std::istringstream forceInput("  FORCE \n");
        REQUIRE(TerminalPauseDecisionProvider(forceInput, out).decide(shortfall) == PauseDecision::Force);
        std::istringstream enterInput("\n");
        REQUIRE(TerminalPauseDecisionProvider(enterInput, out).decide(shortfall) == PauseDecision::Continue);
        std::istringstream closedInput("");
        REQUIRE(TerminalPauseDecisionProvider(closedInput, out).decide(shortfall) == PauseDecision::Abort);
        REQUIRE(out.str().find("remaining 28 files") != std::string::npos);
        logger.logCheck("pause decisions", true);
    }

    SECTION("15.2 Confirmation needs the exact answer") {
        std::ostringstream out;
        std::istringstream yes(" YES\n");
        REQUIRE(TerminalConfirmationProvider("yes", yes, out).confirm("Proceed with deletion? (yes/no):"));
        std::istringstream y("y\n");
        REQUIRE_FALSE(TerminalConfirmationProvider("yes", y, out).confirm("Proceed with deletion? (yes/no):"));
        std::istringstream closed("");
        REQUIRE_FALSE(TerminalConfirmationProvider("y", closed, out).confirm("Proceed anyway? (y/n):"));
        logger.logCheck("confirmation", true);
    }
}

TEST_CASE("16. Logging Service") {
    logger.startTest("Logging Service");
    ScratchDir dir("logging");
    TestableLoggingService service("raw_conversion", dir.path.string());
    std::ostringstream out;
    std::ostringstream err;
    service.setConsoleStreams(out, err);

    SECTION("16.1 Log line format") {
        nlohmann::json details = {{"timestamp", "2024-05-01 10:00:00"}, {"file", "/a.cr2"}};
        std::string line = service.formatLog(LogLevel::WARN, "Skipping file", details, "FILE_SKIPPED");
        REQUIRE(line.rfind("LOG ", 0) == 0);
        REQUIRE(line.find("| WARN | 2024-05-01 10:00:00 | Skipping file | {\"file\":\"/a.cr2\"} | FILE_SKIPPED\n")
                != std::string::npos);
        REQUIRE(service.formatLog(LogLevel::INFO, "m", nlohmann::json::object(), "-").find("| m | - | -") != std::string::npos);
    }

    SECTION("16.2 Console mirror respects the threshold") {
        service.setConsoleLevel(LogLevel::INFO);
        service.debug("hidden detail");
        service.info("Converted: a.cr2 -> a.jpg");
        service.error("Could not process b.cr2");
        REQUIRE(out.str() == "Converted: a.cr2 -> a.jpg\n");
        REQUIRE(err.str() == "Error: Could not process b.cr2\n");

        std::string file = FileService().read_file(service.getLogFile());
        REQUIRE(file.find("hidden detail") != std::string::npos);
        REQUIRE(file.find("| ERROR |") != std::string::npos);
    }

    SECTION("16.3 Progress output") {
        ProgressReport report;
        report.totalFiles = 200;
        report.previouslyProcessed = 50;
        report.sessionProcessed = 10;
        report.processed = 60;
        report.percentDone = 30.0;
        report.filesPerSecond = 2.0;
        report.hasEstimate = true;
        report.estimatedRemainingSeconds = 70.0 / 2.0;
        service.progress(report);

        REQUIRE(out.str() == "Progress: 60/200 files (30.0%) - 2.00 files/sec\n"
                             "  (50 previously processed, 10 in this session)\n"
                             "  Est. remaining: 0.6 min\n");
    }
}
