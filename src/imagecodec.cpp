#include "imagecodec.hpp"

std::string conversionErrorKindName(ConversionErrorKind kind) {
    switch (kind) {
        case ConversionErrorKind::UnsupportedFormat: return "UnsupportedFormat";
        case ConversionErrorKind::CorruptData: return "CorruptData";
        case ConversionErrorKind::IoError: return "IoError";
        case ConversionErrorKind::EncodeFailure: return "EncodeFailure";
    }
    return "Unknown";
}
