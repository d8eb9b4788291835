#include "EncodingResolver.h"
#include "CommonUtils.h"
#include "SiftExceptions.h"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <iconv.h>
#include <initializer_list>

namespace {
struct EncodingEntry {
    const char* alias;
    const char* canonical;
    const char* iconvName;
};

// Aliases are matched after lowercasing and mapping '_' to '-'.
const EncodingEntry kEncodings[] = {
    {"utf-8", "utf-8", "UTF-8"},
    {"utf8", "utf-8", "UTF-8"},
    {"utf-16", "utf-16", "UTF-16"},
    {"utf16", "utf-16", "UTF-16"},
    {"utf-16le", "utf-16le", "UTF-16LE"},
    {"utf-16be", "utf-16be", "UTF-16BE"},
    {"latin-1", "latin-1", "ISO-8859-1"},
    {"latin1", "latin-1", "ISO-8859-1"},
    {"iso-8859-1", "latin-1", "ISO-8859-1"},
    {"ascii", "ascii", "US-ASCII"},
    {"us-ascii", "ascii", "US-ASCII"},
    {"cp1252", "windows-1252", "CP1252"},
    {"windows-1252", "windows-1252", "CP1252"},
};

const EncodingEntry* findEncoding(std::string_view name) {
    std::string key = CommonUtils::toLower(CommonUtils::trim(name));
    std::replace(key.begin(), key.end(), '_', '-');
    for (const auto& entry : kEncodings) {
        if (key == entry.alias) return &entry;
    }
    return nullptr;
}

class IconvHandle {
public:
    explicit IconvHandle(const char* from) : cd_(::iconv_open("UTF-8", from)) {}
    ~IconvHandle() {
        if (valid()) ::iconv_close(cd_);
    }
    IconvHandle(const IconvHandle&) = delete;
    IconvHandle& operator=(const IconvHandle&) = delete;

    bool valid() const noexcept { return cd_ != reinterpret_cast<iconv_t>(-1); }
    iconv_t get() const noexcept { return cd_; }

private:
    iconv_t cd_;
};

// Adapted from https://www.gnu.org/software/libc/manual/html_node/iconv-Examples.html
bool convertToUtf8(std::string_view bytes, const EncodingEntry& encoding, std::string& out, std::string& error) {
    IconvHandle cd(encoding.iconvName);
    if (!cd.valid()) {
        error = std::string("Can't convert from ") + encoding.canonical;
        return false;
    }

    out.assign(bytes.size() * 2 + 16, '\0');
    size_t written = 0;
    char* inPtr = const_cast<char*>(bytes.data());
    size_t inLeft = bytes.size();

    while (inLeft > 0) {
        char* outPtr = &out[written];
        size_t outLeft = out.size() - written;
        const size_t rc = ::iconv(cd.get(), &inPtr, &inLeft, &outPtr, &outLeft);
        written = out.size() - outLeft;
        if (rc != static_cast<size_t>(-1)) continue;

        const size_t offset = bytes.size() - inLeft;
        if (errno == E2BIG) {
            out.resize(out.size() * 2);
            continue;
        }
        if (errno == EILSEQ) {
            error = "invalid " + std::string(encoding.canonical) + " byte sequence at offset " + std::to_string(offset);
        } else if (errno == EINVAL) {
            error = "truncated " + std::string(encoding.canonical) + " sequence at offset " + std::to_string(offset);
        } else {
            error = std::string("iconv failed: ") + std::strerror(errno);
        }
        return false;
    }

    // Flush any shift state for stateful encodings.
    for (;;) {
        char* outPtr = &out[written];
        size_t outLeft = out.size() - written;
        const size_t rc = ::iconv(cd.get(), nullptr, nullptr, &outPtr, &outLeft);
        written = out.size() - outLeft;
        if (rc != static_cast<size_t>(-1)) break;
        if (errno != E2BIG) {
            error = std::string("iconv failed: ") + std::strerror(errno);
            return false;
        }
        out.resize(out.size() * 2);
    }

    out.resize(written);
    if (out.size() >= 3 &&
        static_cast<unsigned char>(out[0]) == 0xEF &&
        static_cast<unsigned char>(out[1]) == 0xBB &&
        static_cast<unsigned char>(out[2]) == 0xBF) {
        out.erase(0, 3);
    }
    return true;
}

bool startsWithBytes(std::string_view bytes, std::initializer_list<unsigned char> prefix) {
    if (bytes.size() < prefix.size()) return false;
    size_t i = 0;
    for (unsigned char b : prefix) {
        if (static_cast<unsigned char>(bytes[i++]) != b) return false;
    }
    return true;
}

// Picks the source encoding. When the strict UTF-8 trial is what settled it, the
// converted text is left in `utf8` and `converted` is set.
// A UTF-8 BOM settles on UTF-8 without a trial, so invalid bytes after it still fail to decode.
std::string detectInto(std::string_view bytes, std::string& utf8, bool& converted) {
    converted = false;
    if (startsWithBytes(bytes, {0xEF, 0xBB, 0xBF})) return "utf-8";
    if (startsWithBytes(bytes, {0xFF, 0xFE}) || startsWithBytes(bytes, {0xFE, 0xFF})) return "utf-16";

    std::string error;
    if (convertToUtf8(bytes, *findEncoding("utf-8"), utf8, error)) {
        converted = true;
        return "utf-8";
    }
    utf8.clear();
    return "latin-1";
}
}

std::optional<std::string> EncodingResolver::canonicalName(std::string_view name) {
    const EncodingEntry* entry = findEncoding(name);
    if (!entry) return std::nullopt;
    return std::string(entry->canonical);
}

std::string EncodingResolver::detect(std::string_view bytes) {
    std::string scratch;
    bool converted = false;
    return detectInto(bytes, scratch, converted);
}

DecodedText EncodingResolver::decode(std::string_view bytes, std::string_view hint) {
    const std::string requested = CommonUtils::trim(hint);
    DecodedText decoded;
    const EncodingEntry* entry = nullptr;

    if (requested.empty()) {
        bool converted = false;
        decoded.encoding = detectInto(bytes, decoded.text, converted);
        if (converted) return decoded;
        entry = findEncoding(decoded.encoding);
    } else {
        entry = findEncoding(requested);
        if (!entry) {
            throw Sift::EncodingException("unsupported encoding '" + requested + "'");
        }
        decoded.encoding = entry->canonical;
    }

    std::string error;
    if (!convertToUtf8(bytes, *entry, decoded.text, error)) {
        throw Sift::EncodingException(error);
    }
    return decoded;
}
