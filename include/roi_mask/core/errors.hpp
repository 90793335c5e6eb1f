#pragma once

#include <stdexcept>
#include <string>

namespace roi_mask {

class RoiMaskError : public std::runtime_error {
public:
    explicit RoiMaskError(const std::string& message)
        : std::runtime_error(message) {}
};

class ConfigError : public RoiMaskError {
public:
    explicit ConfigError(const std::string& message)
        : RoiMaskError("Config error: " + message) {}
};

class ValidationError : public RoiMaskError {
public:
    explicit ValidationError(const std::string& message)
        : RoiMaskError("Validation error: " + message) {}
};

class IOError : public RoiMaskError {
public:
    explicit IOError(const std::string& message)
        : RoiMaskError("I/O error: " + message) {}
};

class FitsError : public IOError {
public:
    explicit FitsError(const std::string& message)
        : IOError("FITS error: " + message) {}
};

// Mask resolution failures
class MaskError : public RoiMaskError {
public:
    explicit MaskError(const std::string& message)
        : RoiMaskError(message) {}
};

// Soft failure: the resolver turns it into a warning and unsets the mask.
class UnrecognizedMaskOption : public MaskError {
public:
    explicit UnrecognizedMaskOption(const std::string& message)
        : MaskError(message) {}
};

class InvalidMaskType : public MaskError {
public:
    explicit InvalidMaskType(const std::string& message)
        : MaskError("Invalid mask type: " + message) {}
};

class UnsupportedMaskDimensionality : public MaskError {
public:
    explicit UnsupportedMaskDimensionality(const std::string& message)
        : MaskError("Unsupported mask dimensionality: " + message) {}
};

class MaskDataSizeMismatch : public MaskError {
public:
    explicit MaskDataSizeMismatch(const std::string& message)
        : MaskError("Mask/data size mismatch: " + message) {}
};

} // namespace roi_mask
