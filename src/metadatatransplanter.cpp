#include "metadatatransplanter.hpp"
#include "librawcodec.hpp"
#include <libraw/libraw.h>
#include <pugixml.hpp>
#include <cmath>
#include <iomanip>
#include <memory>
#include <sstream>

namespace {

// XMP rationals are written as numerator/denominator
std::string tenths(float value) {
    return std::to_string(static_cast<long>(std::lround(value * 10.0f))) + "/10";
}

std::string exposureRational(float seconds) {
    if (seconds >= 1.0f) {
        return std::to_string(static_cast<long>(std::lround(seconds))) + "/1";
    }
    return "1/" + std::to_string(static_cast<long>(std::lround(1.0f / seconds)));
}

std::string xmpDate(std::time_t when) {
    std::tm local{};
    localtime_r(&when, &local);
    std::ostringstream ss;
    ss << std::put_time(&local, "%Y-%m-%dT%H:%M:%S");
    return ss.str();
}

void setIfPresent(pugi::xml_node& node, const char* name, const std::string& value) {
    if (!value.empty()) {
        node.append_attribute(name) = value.c_str();
    }
}

CaptureMetadata captureMetadataFrom(const libraw_data_t& data) {
    CaptureMetadata metadata;
    metadata.make = data.idata.make;
    metadata.model = data.idata.model;
    metadata.lens = data.lens.Lens;
    metadata.artist = data.other.artist;
    metadata.isoSpeed = data.other.iso_speed;
    metadata.shutterSeconds = data.other.shutter;
    metadata.aperture = data.other.aperture;
    metadata.focalLength = data.other.focal_len;
    metadata.captureTime = data.other.timestamp;
    return metadata;
}

bool hasBlock(const std::vector<MetadataBlock>& blocks, const std::string& type) {
    for (const auto& block : blocks) {
        if (block.type == type) {
            return true;
        }
    }
    return false;
}

} // namespace

bool CaptureMetadata::empty() const {
    return make.empty() && model.empty() && lens.empty() && artist.empty() && isoSpeed <= 0.0f &&
           shutterSeconds <= 0.0f && aperture <= 0.0f && focalLength <= 0.0f && captureTime <= 0;
}

std::string buildXmpPacket(const CaptureMetadata& metadata) {
    pugi::xml_document doc;
    pugi::xml_node xmpmeta = doc.append_child("x:xmpmeta");
    xmpmeta.append_attribute("xmlns:x") = "adobe:ns:meta/";
    pugi::xml_node rdf = xmpmeta.append_child("rdf:RDF");
    rdf.append_attribute("xmlns:rdf") = "http://www.w3.org/1999/02/22-rdf-syntax-ns#";

    pugi::xml_node description = rdf.append_child("rdf:Description");
    description.append_attribute("rdf:about") = "";
    description.append_attribute("xmlns:tiff") = "http://ns.adobe.com/tiff/1.0/";
    description.append_attribute("xmlns:exif") = "http://ns.adobe.com/exif/1.0/";
    description.append_attribute("xmlns:aux") = "http://ns.adobe.com/exif/1.0/aux/";
    description.append_attribute("xmlns:xmp") = "http://ns.adobe.com/xap/1.0/";

    setIfPresent(description, "tiff:Make", metadata.make);
    setIfPresent(description, "tiff:Model", metadata.model);
    setIfPresent(description, "tiff:Artist", metadata.artist);
    setIfPresent(description, "aux:Lens", metadata.lens);
    if (metadata.shutterSeconds > 0.0f) {
        setIfPresent(description, "exif:ExposureTime", exposureRational(metadata.shutterSeconds));
    }
    if (metadata.aperture > 0.0f) {
        setIfPresent(description, "exif:FNumber", tenths(metadata.aperture));
    }
    if (metadata.focalLength > 0.0f) {
        setIfPresent(description, "exif:FocalLength", tenths(metadata.focalLength));
    }
    if (metadata.captureTime > 0) {
        setIfPresent(description, "exif:DateTimeOriginal", xmpDate(metadata.captureTime));
        setIfPresent(description, "xmp:CreateDate", xmpDate(metadata.captureTime));
    }
    if (metadata.isoSpeed > 0.0f) {
        pugi::xml_node sequence = description.append_child("exif:ISOSpeedRatings").append_child("rdf:Seq");
        sequence.append_child("rdf:li").text().set(static_cast<int>(std::lround(metadata.isoSpeed)));
    }

    std::ostringstream out;
    out << "<?xpacket begin=\"\xEF\xBB\xBF\" id=\"W5M0MpCehiHzreSzNTczkc9d\"?>\n";
    doc.save(out, " ", pugi::format_default | pugi::format_no_declaration);
    out << "<?xpacket end=\"w\"?>";
    return out.str();
}

MetadataResult LibRawMetadataTransplanter::extract(const std::string& sourcePath) {
    MetadataResult result;

    auto raw = std::make_unique<LibRaw>();
    int rc = raw->open_file(sourcePath.c_str());
    if (rc != LIBRAW_SUCCESS) {
        result.message = "Cannot read metadata from " + sourcePath + ": " + libraw_strerror(rc);
        raw->recycle();
        return result;
    }

    std::string previewNote;
    rc = raw->unpack_thumb();
    if (rc == LIBRAW_SUCCESS && raw->imgdata.thumbnail.tformat == LIBRAW_THUMBNAIL_JPEG) {
        const libraw_thumbnail_t& preview = raw->imgdata.thumbnail;
        std::string error;
        if (!readJpegMetadataBlocks(reinterpret_cast<const unsigned char*>(preview.thumb), preview.tlength,
                                    result.blocks, error)) {
            previewNote = "preview unreadable (" + error + ")";
        }
    } else if (rc != LIBRAW_SUCCESS) {
        previewNote = std::string("no preview (") + libraw_strerror(rc) + ")";
    } else {
        previewNote = "preview is not a JPEG";
    }

    CaptureMetadata capture = captureMetadataFrom(raw->imgdata);
    raw->recycle();

    if (!hasBlock(result.blocks, "XMP") && !capture.empty()) {
        std::string packet = buildXmpPacket(capture);
        result.blocks.push_back(MetadataBlock{"XMP", std::vector<unsigned char>(packet.begin(), packet.end())});
    }

    if (!result.found()) {
        result.message = "No metadata found in " + sourcePath +
                         (previewNote.empty() ? std::string() : ": " + previewNote);
        return result;
    }

    for (const auto& block : result.blocks) {
        result.message += (result.message.empty() ? "" : ", ") + block.type;
    }
    return result;
}
