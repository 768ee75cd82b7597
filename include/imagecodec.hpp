#ifndef IMAGECODEC_HPP
#define IMAGECODEC_HPP

#include <optional>
#include <string>
#include <utility>
#include <vector>

// Closed set of terminal per-file failure kinds, persisted as error_type
enum class ConversionErrorKind {
    UnsupportedFormat,
    CorruptData,
    IoError,
    EncodeFailure
};

std::string conversionErrorKindName(ConversionErrorKind kind);

// Interleaved 8-bit samples, row-major, channels is 1 (gray) or 3 (RGB)
struct PixelBuffer {
    int width = 0;
    int height = 0;
    int channels = 3;
    std::vector<unsigned char> data;
};

struct CodecError {
    ConversionErrorKind kind = ConversionErrorKind::CorruptData;
    std::string message;
};

struct DecodeResult {
    std::optional<PixelBuffer> image;
    CodecError error;

    bool ok() const { return image.has_value(); }

    static DecodeResult success(PixelBuffer buffer) {
        DecodeResult result;
        result.image = std::move(buffer);
        return result;
    }
    static DecodeResult failure(ConversionErrorKind kind, const std::string& message) {
        DecodeResult result;
        result.error = CodecError{kind, message};
        return result;
    }
};

struct EncodeResult {
    std::optional<CodecError> error;

    bool ok() const { return !error.has_value(); }

    static EncodeResult success() { return EncodeResult(); }
    static EncodeResult failure(ConversionErrorKind kind, const std::string& message) {
        EncodeResult result;
        result.error = CodecError{kind, message};
        return result;
    }
};

// One application segment carried from the source into the encoded JPEG
struct MetadataBlock {
    std::string type;                    // "Exif", "XMP" or "IPTC"
    std::vector<unsigned char> data;     // payload after the segment identifier
};

// Outcome of a metadata read; an empty result never fails the file
struct MetadataResult {
    std::vector<MetadataBlock> blocks;
    std::string message;

    bool found() const { return !blocks.empty(); }
};

/**
 * @brief Pixel decode/encode boundary used by the conversion controller
 *
 * Implementations report failures through the returned value and must not
 * leave a file at destPath when encode fails. Metadata blocks are written
 * as APP segments ahead of the image data.
 */
class ImageCodec {
public:
    virtual ~ImageCodec() = default;
    virtual DecodeResult decode(const std::string& sourcePath) = 0;
    virtual EncodeResult encode(const PixelBuffer& buffer, const std::string& destPath, int quality,
                                const std::vector<MetadataBlock>& metadata) = 0;
};

class MetadataTransplanter {
public:
    virtual ~MetadataTransplanter() = default;
    virtual MetadataResult extract(const std::string& sourcePath) = 0;
};

#endif // IMAGECODEC_HPP
