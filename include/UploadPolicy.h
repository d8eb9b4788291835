#pragma once
#include "CommonUtils.h"

#include <string>

// Adapter-level checks applied before bytes reach the engine.
namespace UploadPolicy {
inline constexpr const char* kAllowedExtension = ".csv";
inline constexpr const char* kInvalidFileTypeRule = "InvalidFileType";

inline bool hasAllowedExtension(const std::string& fileName) {
    return CommonUtils::endsWithIgnoreCase(fileName, kAllowedExtension);
}

inline std::string invalidFileTypeDetail() {
    return std::string("Invalid file type. Allowed types: ") + kAllowedExtension;
}
}
