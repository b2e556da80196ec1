#pragma once

#include "cqa/core/result.h"
#include "cqa/source/source_unit.h"

#include <string>
#include <vector>

namespace cqa::source {

// load_source_file reads a file as raw bytes and wraps it in a SourceUnit named after
// the path. Read failures are reported as an error string; decoding problems are not
// checked here (the scanner reports them as unparsable source).
[[nodiscard]] core::Result<SourceUnit, std::string> load_source_file(const std::string& path);

// discover_python_files lists every regular ".py" file below root (recursive), sorted by
// path so batch runs are reproducible.
[[nodiscard]] core::Result<std::vector<std::string>, std::string> discover_python_files(
    const std::string& root);

}  // namespace cqa::source
