#pragma once
#include <optional>
#include <string>
#include <string_view>

struct RawFile {
    std::string bytes;
    std::string encodingHint;   // empty => detect
    std::string fileName;
};

struct DecodedText {
    std::string text;           // always UTF-8
    std::string encoding;       // canonical name of the source encoding
};

class EncodingResolver {
public:
    /**
     * @brief Maps a user-supplied encoding name onto its canonical spelling.
     * @return std::nullopt for names outside the supported set.
     */
    static std::optional<std::string> canonicalName(std::string_view name);

    /**
     * @brief Decodes bytes to UTF-8 under strict rules; invalid bytes are never replaced.
     * @details An empty hint triggers detection: BOM sniffing, then strict UTF-8, then Latin-1.
     * @throws Sift::EncodingException for unsupported hints or undecodable input.
     */
    static DecodedText decode(std::string_view bytes, std::string_view hint);

    /**
     * @brief Picks an encoding for unlabeled bytes.
     */
    static std::string detect(std::string_view bytes);
};
