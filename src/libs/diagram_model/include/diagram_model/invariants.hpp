#pragma once

#include <diagram_model/errors.hpp>
#include <diagram_model/types.hpp>
#include <string>
#include <vector>

namespace diagram_model {

// Checks the structural invariants of a page: unique cell ids, resolvable
// parents, group membership in step with parent links, acyclic containment,
// connector ends that resolve (or are flagged dangling) and dense z-order.
Status check_page_invariants(const Page& page);
Status check_document_invariants(const Document& document);

// True when `ancestor_id` appears on the parent chain of `cell_id`.
bool is_ancestor(const Page& page, const std::string& ancestor_id, const std::string& cell_id);

// Elements whose parent chain passes through `element_id`, in page order.
std::vector<std::string> descendants_of(const Page& page, const std::string& element_id);

// Absolute origin of the coordinate space used by children of `cell_id`.
Point container_origin(const Page& page, const std::string& cell_id);

// Last known absolute bounds of an element.
Rect absolute_bounds(const Page& page, const Element& element);

} // namespace diagram_model
