#include <diagram_codec/codec.hpp>
#include <diagram_model/invariants.hpp>
#include <diagram_model/logging.hpp>
#include <fstream>
#include <sstream>

namespace diagram_codec {

using diagram_model::Diagram;
using diagram_model::make_error;

Result<Diagram> open(std::string_view bytes, const DecodeOptions& options, std::vector<Diagnostic>* diagnostics) {
    auto document = decode(bytes, options, diagnostics);
    if (!document.ok()) return document.status();
    return Diagram(std::move(*document));
}

Result<std::string> save(const Diagram& diagram, const EncodeOptions& options) {
    return encode(diagram.document(), options);
}

Result<std::string> save(const Diagram& diagram, bool compressed) {
    EncodeOptions options;
    options.compression = compressed ? Compression::Always : Compression::Never;
    return encode(diagram.document(), options);
}

Result<Diagram> open_file(const std::string& path, const DecodeOptions& options, std::vector<Diagnostic>* diagnostics) {
    std::ifstream f(path, std::ios::binary);
    if (!f) return make_error(ErrorCode::Io, "cannot open file", path);
    std::ostringstream buffer;
    buffer << f.rdbuf();
    if (f.bad()) return make_error(ErrorCode::Io, "read failed", path);

    auto diagram = open(buffer.str(), options, diagnostics);
    if (!diagram.ok()) {
        diagram_model::Error error = diagram.error();
        error.path = path + ": " + error.path;
        return error;
    }
    diagram_model::core_logger()->info("opened {} ({} page(s))", path, diagram->document().pages.size());
    return diagram;
}

Status save_file(const Diagram& diagram, const std::string& path, const EncodeOptions& options) {
    auto bytes = save(diagram, options);
    if (!bytes.ok()) return bytes.status();
    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    if (!f) return make_error(ErrorCode::Io, "cannot write file", path);
    f << *bytes;
    f.flush();
    if (!f) return make_error(ErrorCode::Io, "write failed", path);
    diagram_model::core_logger()->info("saved {}", path);
    return Status::success();
}

} // namespace diagram_codec
