#ifndef LIBRAWCODEC_HPP
#define LIBRAWCODEC_HPP

#include <cstddef>
#include <string>
#include <vector>
#include "imagecodec.hpp"

// Largest payload one JPEG APP segment can hold
constexpr std::size_t MAX_SEGMENT_PAYLOAD = 65533;

/**
 * @brief Collects the Exif, XMP and IPTC segments of an in-memory JPEG
 *
 * Only the header is parsed, the image data is never decoded.
 * @return false with error set when libjpeg rejects the stream
 */
bool readJpegMetadataBlocks(const unsigned char* jpeg, std::size_t size,
                            std::vector<MetadataBlock>& blocks, std::string& error);

/**
 * @brief Decodes camera raw files with LibRaw and encodes baseline JPEG with libjpeg
 *
 * Decoding uses the camera white balance, automatic brightness and 8 bits per
 * sample. Encoding writes <dest>.part and renames it over dest once complete.
 * Metadata blocks are emitted with jpeg_write_marker right after the JFIF header.
 */
class LibRawJpegCodec : public ImageCodec {
public:
    LibRawJpegCodec();

    DecodeResult decode(const std::string& sourcePath) override;
    EncodeResult encode(const PixelBuffer& buffer, const std::string& destPath, int quality,
                        const std::vector<MetadataBlock>& metadata) override;

    // Maps a LibRaw return code (negative) or errno (positive) to a failure kind
    static ConversionErrorKind classifyLibRawError(int code);
};

#endif // LIBRAWCODEC_HPP
