#pragma once

// auton/research.hpp: Search and markup collaborators used to prepare
// planning notes.
//
// SearchProvider and HtmlToText are external services; the executor only
// sees these interfaces. License filtering is caller-side policy applied to
// the metadata a provider returns. ResearchAssembler glues the three
// together: query, filter, convert snippets, rank, and render one block of
// notes that the session hands to the planner.

#include <cstddef>
#include <string>
#include <vector>

namespace auton {

enum class SearchScope {
  code_host,
  package_registry,
  documentation,
};

std::string to_string(SearchScope scope);

struct SearchResult {
  std::string title;
  std::string url;
  std::string snippet_html;
  std::string license;  // SPDX id as reported by the provider; may be empty
  double score{0.0};
};

class SearchProvider {
 public:
  virtual ~SearchProvider() = default;
  virtual std::vector<SearchResult> search(const std::string& query, SearchScope scope,
                                           std::size_t limit) = 0;
};

class HtmlToText {
 public:
  virtual ~HtmlToText() = default;
  virtual std::string convert(const std::string& html) = 0;
};

// Tag stripper with entity decoding and whitespace folding. <script> and
// <style> bodies are dropped; block elements become line breaks.
class BasicHtmlToText : public HtmlToText {
 public:
  std::string convert(const std::string& html) override;
};

// Keeps results whose license matches one of `allowed` (case-insensitive).
// An empty allowlist keeps everything; results with no license are dropped
// whenever the allowlist is non-empty.
std::vector<SearchResult> filter_by_license(const std::vector<SearchResult>& results,
                                            const std::vector<std::string>& allowed);

struct ResearchConfig {
  std::vector<SearchScope> scopes{SearchScope::code_host, SearchScope::package_registry};
  std::size_t per_scope_limit{5};
  std::size_t max_notes{8};
  std::size_t max_snippet_chars{400};
  std::vector<std::string> allowed_licenses;
};

class ResearchAssembler {
 public:
  ResearchAssembler(SearchProvider& search, HtmlToText& html, ResearchConfig config);

  // Empty when nothing survives filtering.
  std::string notes_for(const std::string& query);

 private:
  SearchProvider& search_;
  HtmlToText& html_;
  ResearchConfig config_;
};

}  // namespace auton
