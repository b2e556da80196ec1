#include "cqa/extract/extractor.h"

#include "test_support.h"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

using namespace cqa::extract;
using cqa::source::SourceUnit;
using cqa::test_support::python;

namespace {

const std::string kModule = python({
    "import os",                                 // 1
    "",                                          // 2
    "",                                          // 3
    "@decorator",                                // 4
    "def load(path: str, retries=3) -> str:",   // 5
    "    \"\"\"Load.\"\"\"",                     // 6
    "    if path:",                              // 7
    "        for x in path:",                    // 8
    "            if x and retries:",             // 9
    "                return x",                  // 10
    "    return \"\"",                           // 11
    "",                                          // 12
    "",                                          // 13
    "class Store:",                              // 14
    "    def __init__(self):",                   // 15
    "        self.items = []",                   // 16
    "",                                          // 17
    "    async def fetch(self, key):",           // 18
    "        def helper():",                     // 19
    "            return key",                    // 20
    "        return helper()",                   // 21
});

ExtractionResult extract_module() {
  const auto unit = SourceUnit::from_text("module.py", kModule);
  auto result = extract_structure(unit);
  REQUIRE(result.ok());
  REQUIRE(result.elements.size() == 5);
  return result;
}

}  // namespace

TEST_CASE("extract_structure finds functions, methods and classes in source order",
          "[extract]") {
  const auto result = extract_module();
  CHECK(result.elements[0].name == "load");
  CHECK(result.elements[1].name == "Store");
  CHECK(result.elements[1].kind == ElementKind::kClass);
  CHECK(result.elements[2].name == "__init__");
  CHECK(result.elements[3].name == "fetch");
  CHECK(result.elements[4].name == "helper");
}

TEST_CASE("extract_structure: boundaries exclude decorators and trailing blanks", "[extract]") {
  const auto result = extract_module();
  const auto& load = result.elements[0];
  CHECK(load.start_line == 5);
  CHECK(load.end_line == 11);
  CHECK(load.length() == 7);

  const auto& store = result.elements[1];
  CHECK(store.start_line == 14);
  CHECK(store.end_line == 21);
}

TEST_CASE("extract_structure: nesting depth and parents", "[extract]") {
  const auto result = extract_module();
  CHECK(result.elements[0].nesting_depth == 0);
  CHECK_FALSE(result.elements[0].parent.has_value());
  CHECK(result.elements[2].nesting_depth == 1);
  CHECK(result.elements[2].parent == std::optional<std::size_t>{1});
  CHECK(result.elements[3].parent == std::optional<std::size_t>{1});
  CHECK(result.elements[3].is_async);
  CHECK(result.elements[4].nesting_depth == 2);
  CHECK(result.elements[4].parent == std::optional<std::size_t>{3});

  const auto children = child_elements(result.elements, 1);
  REQUIRE(children.size() == 2);
  CHECK(children[0] == 2);
  CHECK(children[1] == 3);
}

TEST_CASE("extract_structure: parameters, annotations and docstrings", "[extract]") {
  const auto result = extract_module();
  const auto& load = result.elements[0];
  REQUIRE(load.parameters.size() == 2);
  CHECK(load.parameters[0].name == "path");
  CHECK(load.parameters[0].annotated);
  CHECK(load.parameters[1].name == "retries");
  CHECK_FALSE(load.parameters[1].annotated);
  CHECK(load.parameters[1].default_value == "3");
  CHECK(load.has_return_annotation);
  CHECK(load.has_type_hints);
  CHECK(load.has_docstring);

  const auto& init = result.elements[2];
  CHECK_FALSE(init.has_type_hints);
  CHECK_FALSE(init.has_docstring);
  CHECK(result.elements[1].parameters.empty());
}

TEST_CASE("extract_structure: block depth and complexity of the own body", "[extract]") {
  const auto result = extract_module();
  const auto& load = result.elements[0];
  CHECK(load.block_depth == 3);
  CHECK(load.complexity == 5);  // if, for, if, and

  // fetch's own body is flat; helper is measured separately
  const auto& fetch = result.elements[3];
  CHECK(fetch.block_depth == 0);
  CHECK(fetch.complexity == 1);
}

TEST_CASE("extract_structure computes metrics", "[extract]") {
  const auto result = extract_module();
  const auto& metrics = result.metrics;
  CHECK(metrics.total_lines == 21);
  CHECK(metrics.blank_lines == 5);
  CHECK(metrics.comment_lines == 0);
  CHECK(metrics.function_count == 4);
  CHECK(metrics.class_count == 1);
  CHECK(metrics.max_function_length == 7);
  CHECK_THAT(metrics.average_function_length, Catch::Matchers::WithinAbs(3.75, 1e-9));
}

TEST_CASE("extract_structure: inline bodies and keyword-only parameters", "[extract]") {
  const auto unit = SourceUnit::from_text("inline.py", python({
                                                           "def f(): \"doc\"",
                                                           "def g(): return 1",
                                                           "def h(a, *, b: int = 2, **rest):",
                                                           "    return a",
                                                       }));
  const auto result = extract_structure(unit);
  REQUIRE(result.ok());
  REQUIRE(result.elements.size() == 3);
  CHECK(result.elements[0].has_docstring);
  CHECK(result.elements[0].length() == 1);
  CHECK_FALSE(result.elements[1].has_docstring);

  const auto& h = result.elements[2];
  REQUIRE(h.parameters.size() == 3);
  CHECK(h.parameters[1].name == "b");
  CHECK(h.parameters[1].annotated);
  CHECK(h.parameters[1].default_value == "2");
  CHECK(h.parameters[2].name == "rest");
  CHECK(h.has_type_hints);
}

TEST_CASE("extract_structure counts match arms as decisions", "[extract]") {
  const auto unit = SourceUnit::from_text("match.py", python({
                                                          "def route(command):",
                                                          "    match command:",
                                                          "        case \"go\":",
                                                          "            return 1",
                                                          "        case _:",
                                                          "            return 0",
                                                      }));
  const auto result = extract_structure(unit);
  REQUIRE(result.ok());
  REQUIRE(result.elements.size() == 1);
  CHECK(result.elements[0].complexity == 3);
  CHECK(result.elements[0].block_depth == 2);
}

TEST_CASE("extract_structure reports undecomposable source without throwing", "[extract]") {
  const auto unit = SourceUnit::from_text("broken.py", "def broken(:\n    return (1, 2\n");
  const auto result = extract_structure(unit);
  REQUIRE_FALSE(result.ok());
  CHECK(result.elements.empty());
  CHECK(result.metrics.total_lines == 2);
  CHECK(result.metrics.function_count == 0);
  CHECK(result.failure->reason == "'(' was never closed");
}

TEST_CASE("compute_line_metrics counts blank and comment lines", "[extract]") {
  const auto unit = SourceUnit::from_text("c.py", python({"# one", "", "x = 1  # two", "   # three"}));
  const auto metrics = compute_line_metrics(unit);
  CHECK(metrics.total_lines == 4);
  CHECK(metrics.blank_lines == 1);
  CHECK(metrics.comment_lines == 2);
}

TEST_CASE("extract_structure keeps functions and classes with non-ASCII names", "[extract]") {
  const auto unit = SourceUnit::from_text("unicode.py", python({
                                                            "def café(x: int) -> int:",
                                                            "    return x",
                                                            "class Größe:",
                                                            "    def übersetzen(self):",
                                                            "        return 1",
                                                        }));
  const auto result = extract_structure(unit);
  REQUIRE(result.ok());
  REQUIRE(result.elements.size() == 3);
  CHECK(result.elements[0].name == "café");
  CHECK(result.elements[0].has_type_hints);
  CHECK(result.elements[1].name == "Größe");
  CHECK(result.elements[1].kind == ElementKind::kClass);
  CHECK(result.elements[2].name == "übersetzen");
  CHECK(result.metrics.function_count == 2);
  CHECK(result.metrics.class_count == 1);
}
