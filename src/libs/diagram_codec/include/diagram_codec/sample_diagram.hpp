#pragma once

#include <diagram_model/types.hpp>

namespace diagram_codec {

// Two-page class diagram: an inheritance tree on "classes" and a grouped
// tile hierarchy on "tiles".
diagram_model::Document make_sample_document();

} // namespace diagram_codec
