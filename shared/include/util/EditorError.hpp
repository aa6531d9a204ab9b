#pragma once
#include <stdexcept>
#include <string>

namespace cutout {

enum class ErrorKind
{
    OutOfBounds,       // buffer access outside allocated dimensions
    InvalidGeometry,   // non-positive sizes, negative radius
    DimensionMismatch, // segmentation/mask size disagrees with the source
    DecodeFailure,     // image could not be decoded
    NoImage,           // operation needs a loaded image
};

inline const char* errorKindName(ErrorKind k)
{
    switch (k)
    {
        case ErrorKind::OutOfBounds: return "OutOfBounds";
        case ErrorKind::InvalidGeometry: return "InvalidGeometry";
        case ErrorKind::DimensionMismatch: return "DimensionMismatch";
        case ErrorKind::DecodeFailure: return "DecodeFailure";
        case ErrorKind::NoImage: return "NoImage";
    }
    return "Unknown";
}

class EditorError : public std::runtime_error
{
public:
    EditorError(ErrorKind kind, const std::string& what)
        : std::runtime_error(std::string(errorKindName(kind)) + ": " + what), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

}
