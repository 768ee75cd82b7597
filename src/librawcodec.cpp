#include "librawcodec.hpp"
#include <cerrno>
#include <csetjmp>
#include <cstdio>
#include <libraw/libraw.h>
#include <jpeglib.h>
#include <cstring>
#include <filesystem>
#include <memory>
#include <system_error>
#include <vector>

namespace {

// RAII holder for a LibRaw instance and its processed image
class LibRawHandle {
public:
    LibRawHandle() : raw(std::make_unique<LibRaw>()), image(nullptr) {}
    ~LibRawHandle() {
        if (image) {
            LibRaw::dcraw_clear_mem(image);
        }
        raw->recycle();
    }

    LibRawHandle(const LibRawHandle&) = delete;
    LibRawHandle& operator=(const LibRawHandle&) = delete;

    LibRaw* get() { return raw.get(); }
    libraw_processed_image_t* processed() { return image; }
    void setProcessed(libraw_processed_image_t* img) { image = img; }

private:
    std::unique_ptr<LibRaw> raw;
    libraw_processed_image_t* image;
};

std::string describeLibRawError(int code) {
    if (code > 0) {
        return std::error_code(code, std::generic_category()).message();
    }
    return libraw_strerror(code);
}

// libjpeg reports fatal errors through error_exit; jump back instead of exiting
struct JpegErrorManager {
    jpeg_error_mgr pub;
    jmp_buf setjmpBuffer;
    char message[JMSG_LENGTH_MAX];
};

void jpegErrorExit(j_common_ptr cinfo) {
    JpegErrorManager* err = reinterpret_cast<JpegErrorManager*>(cinfo->err);
    (*cinfo->err->format_message)(cinfo, err->message);
    longjmp(err->setjmpBuffer, 1);
}

const char EXIF_IDENTIFIER[] = "Exif\0";                      // "Exif" followed by two NULs
const char XMP_IDENTIFIER[] = "http://ns.adobe.com/xap/1.0/";   // sent with its NUL

struct JpegSegment {
    int marker;
    std::vector<unsigned char> payload;
};

std::vector<JpegSegment> segmentsFor(const std::vector<MetadataBlock>& metadata) {
    std::vector<JpegSegment> segments;
    for (const auto& block : metadata) {
        JpegSegment segment;
        if (block.type == "Exif") {
            segment.marker = JPEG_APP0 + 1;
            segment.payload.assign(EXIF_IDENTIFIER, EXIF_IDENTIFIER + sizeof(EXIF_IDENTIFIER));
        } else if (block.type == "XMP") {
            segment.marker = JPEG_APP0 + 1;
            segment.payload.assign(XMP_IDENTIFIER, XMP_IDENTIFIER + sizeof(XMP_IDENTIFIER));
        } else if (block.type == "IPTC") {
            segment.marker = JPEG_APP0 + 13;
        } else {
            continue;
        }
        segment.payload.insert(segment.payload.end(), block.data.begin(), block.data.end());
        // A block that needs more than one segment is not carried over
        if (segment.payload.size() > MAX_SEGMENT_PAYLOAD) {
            continue;
        }
        segments.push_back(std::move(segment));
    }
    return segments;
}

void appendMetadataBlock(int marker, const JOCTET* data, unsigned int length, std::vector<MetadataBlock>& blocks) {
    auto startsWith = [data, length](const char* identifier, std::size_t identifierLength) {
        return length >= identifierLength && std::memcmp(data, identifier, identifierLength) == 0;
    };

    MetadataBlock block;
    std::size_t skip = 0;
    if (marker == JPEG_APP0 + 13) {
        block.type = "IPTC";
    } else if (startsWith(EXIF_IDENTIFIER, sizeof(EXIF_IDENTIFIER))) {
        block.type = "Exif";
        skip = sizeof(EXIF_IDENTIFIER);
    } else if (startsWith(XMP_IDENTIFIER, sizeof(XMP_IDENTIFIER))) {
        block.type = "XMP";
        skip = sizeof(XMP_IDENTIFIER);
    } else {
        return;
    }
    block.data.assign(data + skip, data + length);
    blocks.push_back(std::move(block));
}

// Only trivially destructible locals live in this frame, longjmp is safe here
bool readJpegMarkers(const unsigned char* jpeg, std::size_t size, std::vector<MetadataBlock>& blocks,
                     char* errorOut, std::size_t errorSize) {
    jpeg_decompress_struct dinfo;
    JpegErrorManager jerr;
    std::memset(jerr.message, 0, sizeof(jerr.message));

    dinfo.err = jpeg_std_error(&jerr.pub);
    jerr.pub.error_exit = jpegErrorExit;

    if (setjmp(jerr.setjmpBuffer)) {
        std::snprintf(errorOut, errorSize, "%s", jerr.message);
        jpeg_destroy_decompress(&dinfo);
        return false;
    }

    jpeg_create_decompress(&dinfo);
    jpeg_mem_src(&dinfo, const_cast<unsigned char*>(jpeg), static_cast<unsigned long>(size));
    jpeg_save_markers(&dinfo, JPEG_APP0 + 1, 0xFFFF);
    jpeg_save_markers(&dinfo, JPEG_APP0 + 13, 0xFFFF);
    jpeg_read_header(&dinfo, TRUE);

    for (jpeg_saved_marker_ptr marker = dinfo.marker_list; marker != nullptr; marker = marker->next) {
        appendMetadataBlock(marker->marker, marker->data, marker->data_length, blocks);
    }

    jpeg_destroy_decompress(&dinfo);
    return true;
}

// Only trivially destructible locals live in this frame, longjmp is safe here
bool writeJpegStream(FILE* file, const PixelBuffer& buffer, int quality, const std::vector<JpegSegment>& segments,
                     char* errorOut, std::size_t errorSize) {
    jpeg_compress_struct cinfo;
    JpegErrorManager jerr;
    std::memset(jerr.message, 0, sizeof(jerr.message));

    cinfo.err = jpeg_std_error(&jerr.pub);
    jerr.pub.error_exit = jpegErrorExit;

    if (setjmp(jerr.setjmpBuffer)) {
        std::snprintf(errorOut, errorSize, "%s", jerr.message);
        jpeg_destroy_compress(&cinfo);
        return false;
    }

    jpeg_create_compress(&cinfo);
    jpeg_stdio_dest(&cinfo, file);

    cinfo.image_width = static_cast<JDIMENSION>(buffer.width);
    cinfo.image_height = static_cast<JDIMENSION>(buffer.height);
    cinfo.input_components = buffer.channels;
    cinfo.in_color_space = buffer.channels == 1 ? JCS_GRAYSCALE : JCS_RGB;

    jpeg_set_defaults(&cinfo);
    jpeg_set_quality(&cinfo, quality, TRUE);
    jpeg_start_compress(&cinfo, TRUE);

    for (const JpegSegment& segment : segments) {
        jpeg_write_marker(&cinfo, segment.marker, segment.payload.data(),
                          static_cast<unsigned int>(segment.payload.size()));
    }

    const std::size_t rowStride = static_cast<std::size_t>(buffer.width) * buffer.channels;
    while (cinfo.next_scanline < cinfo.image_height) {
        JSAMPROW row = const_cast<JSAMPROW>(buffer.data.data() + cinfo.next_scanline * rowStride);
        jpeg_write_scanlines(&cinfo, &row, 1);
    }

    jpeg_finish_compress(&cinfo);
    jpeg_destroy_compress(&cinfo);
    return true;
}

} // namespace

bool readJpegMetadataBlocks(const unsigned char* jpeg, std::size_t size,
                            std::vector<MetadataBlock>& blocks, std::string& error) {
    if (jpeg == nullptr || size == 0) {
        error = "Empty JPEG stream";
        return false;
    }
    char jpegError[JMSG_LENGTH_MAX] = {0};
    if (!readJpegMarkers(jpeg, size, blocks, jpegError, sizeof(jpegError))) {
        error = std::string("libjpeg: ") + jpegError;
        return false;
    }
    return true;
}

LibRawJpegCodec::LibRawJpegCodec() {}

ConversionErrorKind LibRawJpegCodec::classifyLibRawError(int code) {
    if (code > 0) {
        return ConversionErrorKind::IoError;
    }
    switch (code) {
        case LIBRAW_FILE_UNSUPPORTED:
        case LIBRAW_NOT_IMPLEMENTED:
            return ConversionErrorKind::UnsupportedFormat;
        case LIBRAW_INPUT_CLOSED:
        case LIBRAW_UNSUFFICIENT_MEMORY:
            return ConversionErrorKind::IoError;
        case LIBRAW_IO_ERROR:
        case LIBRAW_DATA_ERROR:
        case LIBRAW_REQUEST_FOR_NONEXISTENT_IMAGE:
        default:
            return ConversionErrorKind::CorruptData;
    }
}

DecodeResult LibRawJpegCodec::decode(const std::string& sourcePath) {
    LibRawHandle handle;
    LibRaw* raw = handle.get();

    raw->imgdata.params.use_camera_wb = 1;
    raw->imgdata.params.use_auto_wb = 0;
    raw->imgdata.params.no_auto_bright = 0;
    raw->imgdata.params.output_bps = 8;
    raw->imgdata.params.output_color = 1; // sRGB

    int rc = raw->open_file(sourcePath.c_str());
    if (rc != LIBRAW_SUCCESS) {
        return DecodeResult::failure(classifyLibRawError(rc), "open_file: " + describeLibRawError(rc));
    }

    rc = raw->unpack();
    if (rc != LIBRAW_SUCCESS) {
        return DecodeResult::failure(classifyLibRawError(rc), "unpack: " + describeLibRawError(rc));
    }

    rc = raw->dcraw_process();
    if (rc != LIBRAW_SUCCESS) {
        return DecodeResult::failure(classifyLibRawError(rc), "dcraw_process: " + describeLibRawError(rc));
    }

    int memRc = LIBRAW_SUCCESS;
    handle.setProcessed(raw->dcraw_make_mem_image(&memRc));
    libraw_processed_image_t* img = handle.processed();
    if (!img || memRc != LIBRAW_SUCCESS) {
        return DecodeResult::failure(classifyLibRawError(memRc), "dcraw_make_mem_image: " + describeLibRawError(memRc));
    }

    if (img->type != LIBRAW_IMAGE_BITMAP || img->bits != 8 || (img->colors != 3 && img->colors != 1)) {
        return DecodeResult::failure(ConversionErrorKind::UnsupportedFormat,
                                     "Unsupported processed image layout: type " + std::to_string(img->type) +
                                     ", " + std::to_string(img->colors) + " colors, " +
                                     std::to_string(img->bits) + " bits");
    }
    if (img->width == 0 || img->height == 0) {
        return DecodeResult::failure(ConversionErrorKind::CorruptData, "Decoded image has no pixels");
    }

    PixelBuffer buffer;
    buffer.width = img->width;
    buffer.height = img->height;
    buffer.channels = img->colors;
    buffer.data.assign(img->data, img->data + img->data_size);
    return DecodeResult::success(std::move(buffer));
}

EncodeResult LibRawJpegCodec::encode(const PixelBuffer& buffer, const std::string& destPath, int quality,
                                     const std::vector<MetadataBlock>& metadata) {
    if (buffer.width <= 0 || buffer.height <= 0 || (buffer.channels != 1 && buffer.channels != 3) ||
        buffer.data.size() < static_cast<std::size_t>(buffer.width) * buffer.height * buffer.channels) {
        return EncodeResult::failure(ConversionErrorKind::EncodeFailure, "Pixel buffer does not match its dimensions");
    }

    const std::vector<JpegSegment> segments = segmentsFor(metadata);
    const std::string partPath = destPath + ".part";
    FILE* file = std::fopen(partPath.c_str(), "wb");
    if (!file) {
        return EncodeResult::failure(ConversionErrorKind::IoError,
                                     "Cannot open " + partPath + ": " +
                                     std::error_code(errno, std::generic_category()).message());
    }

    char jpegError[JMSG_LENGTH_MAX] = {0};
    bool written = writeJpegStream(file, buffer, quality, segments, jpegError, sizeof(jpegError));
    bool flushed = std::fflush(file) == 0;
    bool closed = std::fclose(file) == 0;

    std::error_code ec;
    if (!written || !flushed || !closed) {
        std::filesystem::remove(partPath, ec);
        std::string reason = written ? "write to " + partPath + " failed" : std::string("libjpeg: ") + jpegError;
        return EncodeResult::failure(ConversionErrorKind::EncodeFailure, reason);
    }

    std::filesystem::rename(partPath, destPath, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(partPath, ignored);
        return EncodeResult::failure(ConversionErrorKind::IoError, "Cannot move encoded file into place: " + ec.message());
    }
    return EncodeResult::success();
}
