#pragma once

#include <diagram_model/errors.hpp>
#include <optional>
#include <string>
#include <string_view>

namespace diagram_codec {

// Standard alphabet with padding. Decoding skips ASCII whitespace.
std::string base64_encode(std::string_view data);
std::optional<std::string> base64_decode(std::string_view text);

// Raw deflate streams (no zlib header), the form draw.io stores pages in.
std::optional<std::string> raw_deflate(std::string_view data);
std::optional<std::string> raw_inflate(std::string_view data);

// encodeURIComponent / decodeURIComponent over UTF-8 bytes.
std::string uri_encode(std::string_view text);
std::optional<std::string> uri_decode(std::string_view text);

struct UnpackedPage {
    std::string xml;
    bool uri_encoded = false;
};

// base64 -> raw inflate -> optional percent-decoding.
diagram_model::Result<UnpackedPage> unpack_page(std::string_view text);
// Inverse of unpack_page.
diagram_model::Result<std::string> pack_page(std::string_view xml, bool uri_encode);

} // namespace diagram_codec
