#pragma once

#include "cqa/extract/structural_element.h"
#include "cqa/source/line_scanner.h"
#include "cqa/source/source_unit.h"

#include <optional>
#include <vector>

namespace cqa::extract {

// ExtractionResult carries every structural fact the rule evaluator reads.
//
// On failure, elements and scanned are empty, metrics hold line counts only and failure
// describes why the source could not be decomposed. Extraction never throws.
struct ExtractionResult {
  std::vector<StructuralElement> elements;  // Source order of header lines
  SourceMetrics metrics;
  source::ScannedSource scanned;
  std::optional<source::ScanError> failure;

  [[nodiscard]] bool ok() const noexcept { return !failure.has_value(); }
};

// extract_structure finds every def / async def / class (top-level and nested) using
// indentation and bracket-depth heuristics over the scanned statements.
//
// This is a best-effort structural read, not a grammar: element boundaries follow
// indentation, which matches Python semantics for well-formed input.
[[nodiscard]] ExtractionResult extract_structure(const source::SourceUnit& unit);

// compute_line_metrics fills total/blank/comment line counts from raw text only.
[[nodiscard]] SourceMetrics compute_line_metrics(const source::SourceUnit& unit);

// Elements whose parent is the element at index (direct children), in source order.
[[nodiscard]] std::vector<std::size_t> child_elements(const std::vector<StructuralElement>& elements,
                                                      std::size_t index);

}  // namespace cqa::extract
