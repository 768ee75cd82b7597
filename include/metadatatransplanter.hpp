#ifndef METADATATRANSPLANTER_HPP
#define METADATATRANSPLANTER_HPP

#include <ctime>
#include <string>
#include "imagecodec.hpp"

// Camera fields LibRaw parses from a raw file
struct CaptureMetadata {
    std::string make;
    std::string model;
    std::string lens;
    std::string artist;
    float isoSpeed = 0.0f;
    float shutterSeconds = 0.0f;
    float aperture = 0.0f;
    float focalLength = 0.0f;
    std::time_t captureTime = 0;

    bool empty() const;
};

/**
 * @brief Serializes capture metadata as an XMP packet
 * Fields that are empty or zero are left out.
 */
std::string buildXmpPacket(const CaptureMetadata& metadata);

/**
 * @brief Gathers the metadata blocks of a raw file for the encoder
 *
 * Exif, XMP and IPTC segments come from the JPEG preview embedded in the raw
 * file. When the preview carries no XMP, a packet is built from the camera
 * fields LibRaw parsed. Every failure is reported in the result, never thrown.
 */
class LibRawMetadataTransplanter : public MetadataTransplanter {
public:
    MetadataResult extract(const std::string& sourcePath) override;
};

#endif // METADATATRANSPLANTER_HPP
