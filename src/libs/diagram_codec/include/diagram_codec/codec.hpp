#pragma once

#include <diagram_model/diagram.hpp>
#include <diagram_model/errors.hpp>
#include <diagram_model/types.hpp>
#include <string>
#include <string_view>
#include <vector>

namespace diagram_codec {

using diagram_model::Error;
using diagram_model::ErrorCode;
using diagram_model::Result;
using diagram_model::Status;

// What decode does with a connector end whose element is not in the page.
enum class DanglingPolicy {
    Retain, // keep the id and flag the end dangling
    Reject, // fail with UnresolvableReference
    Detach, // drop the id, the end floats
};

struct DecodeOptions {
    DanglingPolicy dangling = DanglingPolicy::Retain;
};

enum class Compression {
    Preserve, // compress exactly the pages that were compressed on load
    Always,
    Never,
};

struct EncodeOptions {
    Compression compression = Compression::Preserve;
    // Percent-encode page XML before deflating, as draw.io does.
    bool uri_encode = true;
    bool pretty = true;
};

// Recoverable problem found while decoding; the document is still usable.
struct Diagnostic {
    ErrorCode code = ErrorCode::None;
    std::string message;
    std::string path;
};

Result<diagram_model::Document> decode(std::string_view bytes, const DecodeOptions& options = {},
    std::vector<Diagnostic>* diagnostics = nullptr);

Result<std::string> encode(const diagram_model::Document& document, const EncodeOptions& options = {});

// decode + Diagram construction.
Result<diagram_model::Diagram> open(std::string_view bytes, const DecodeOptions& options = {},
    std::vector<Diagnostic>* diagnostics = nullptr);

Result<std::string> save(const diagram_model::Diagram& diagram, const EncodeOptions& options = {});
Result<std::string> save(const diagram_model::Diagram& diagram, bool compressed);

Result<diagram_model::Diagram> open_file(const std::string& path, const DecodeOptions& options = {},
    std::vector<Diagnostic>* diagnostics = nullptr);
Status save_file(const diagram_model::Diagram& diagram, const std::string& path, const EncodeOptions& options = {});

} // namespace diagram_codec
