#include "auton/research.hpp"

#include <algorithm>
#include <cctype>
#include <set>

namespace auton {

namespace {

std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

bool is_block_tag(const std::string& name) {
  static const std::set<std::string> kBlock = {"p",  "br", "div", "li", "ul", "ol", "tr",
                                               "h1", "h2", "h3",  "h4", "h5", "h6", "pre",
                                               "table", "section", "article", "blockquote"};
  return kBlock.count(name) > 0;
}

void append_codepoint(std::string& out, unsigned long cp) {
  // NUL, surrogates and out-of-range values have no UTF-8 form; use U+FFFD.
  if (cp == 0 || (cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF) cp = 0xFFFD;
  if (cp < 0x80) {
    out += static_cast<char>(cp);
  } else if (cp < 0x800) {
    out += static_cast<char>(0xC0 | (cp >> 6));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  } else if (cp < 0x10000) {
    out += static_cast<char>(0xE0 | (cp >> 12));
    out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  } else if (cp < 0x110000) {
    out += static_cast<char>(0xF0 | (cp >> 18));
    out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
    out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  }
}

// Decodes the entity starting at html[i] == '&'. Returns the number of bytes
// consumed, 0 if it is not a recognised entity.
std::size_t decode_entity(const std::string& html, std::size_t i, std::string& out) {
  const std::size_t semi = html.find(';', i);
  if (semi == std::string::npos || semi - i > 10) return 0;
  const std::string name = html.substr(i + 1, semi - i - 1);
  if (name.empty()) return 0;
  if (name[0] == '#') {
    unsigned long cp = 0;
    try {
      cp = (name.size() > 1 && (name[1] == 'x' || name[1] == 'X'))
               ? std::stoul(name.substr(2), nullptr, 16)
               : std::stoul(name.substr(1), nullptr, 10);
    } catch (const std::exception&) {
      return 0;
    }
    append_codepoint(out, cp);
    return semi - i + 1;
  }
  static const std::pair<const char*, const char*> kNamed[] = {
      {"amp", "&"}, {"lt", "<"}, {"gt", ">"}, {"quot", "\""}, {"apos", "'"}, {"nbsp", " "}};
  for (const auto& [n, v] : kNamed) {
    if (name == n) {
      out += v;
      return semi - i + 1;
    }
  }
  return 0;
}

std::string fold_whitespace(const std::string& in) {
  std::string out;
  bool pending_space = false;
  int pending_newlines = 0;
  for (char c : in) {
    if (c == '\n') {
      pending_newlines = std::min(pending_newlines + 1, 2);
      pending_space = false;
      continue;
    }
    if (c == ' ' || c == '\t' || c == '\r') {
      pending_space = true;
      continue;
    }
    if (!out.empty()) {
      if (pending_newlines > 0) out.append(static_cast<std::size_t>(pending_newlines), '\n');
      else if (pending_space) out += ' ';
    }
    pending_newlines = 0;
    pending_space = false;
    out += c;
  }
  return out;
}

std::string clip(const std::string& s, std::size_t max_chars) {
  if (s.size() <= max_chars) return s;
  std::size_t cut = max_chars;
  // Do not split a UTF-8 sequence.
  while (cut > 0 && (static_cast<unsigned char>(s[cut]) & 0xC0) == 0x80) --cut;
  return s.substr(0, cut) + "...";
}

}  // namespace

std::string to_string(SearchScope scope) {
  switch (scope) {
    case SearchScope::code_host: return "code_host";
    case SearchScope::package_registry: return "package_registry";
    case SearchScope::documentation: return "documentation";
  }
  return "code_host";
}

std::string BasicHtmlToText::convert(const std::string& html) {
  std::string text;
  std::string skip_until;  // closing tag name while inside script/style
  std::size_t i = 0;
  while (i < html.size()) {
    const char c = html[i];
    if (c == '<') {
      const std::size_t close = html.find('>', i);
      if (close == std::string::npos) break;
      std::string tag = lower(html.substr(i + 1, close - i - 1));
      i = close + 1;
      const bool closing = !tag.empty() && tag[0] == '/';
      if (closing) tag.erase(0, 1);
      const std::size_t name_end = tag.find_first_of(" \t\r\n/");
      const std::string name = tag.substr(0, name_end);
      if (!skip_until.empty()) {
        if (closing && name == skip_until) skip_until.clear();
        continue;
      }
      if (!closing && (name == "script" || name == "style")) {
        skip_until = name;
        continue;
      }
      if (is_block_tag(name)) text += '\n';
      else text += ' ';
      continue;
    }
    if (!skip_until.empty()) {
      ++i;
      continue;
    }
    if (c == '&') {
      const std::size_t used = decode_entity(html, i, text);
      if (used > 0) {
        i += used;
        continue;
      }
    }
    text += c;
    ++i;
  }
  return fold_whitespace(text);
}

std::vector<SearchResult> filter_by_license(const std::vector<SearchResult>& results,
                                            const std::vector<std::string>& allowed) {
  if (allowed.empty()) return results;
  std::set<std::string> allow;
  for (const auto& a : allowed) allow.insert(lower(a));
  std::vector<SearchResult> out;
  for (const auto& r : results) {
    if (!r.license.empty() && allow.count(lower(r.license))) out.push_back(r);
  }
  return out;
}

ResearchAssembler::ResearchAssembler(SearchProvider& search, HtmlToText& html,
                                     ResearchConfig config)
    : search_(search), html_(html), config_(std::move(config)) {}

std::string ResearchAssembler::notes_for(const std::string& query) {
  std::vector<SearchResult> all;
  std::set<std::string> seen;
  for (SearchScope scope : config_.scopes) {
    for (auto& r : search_.search(query, scope, config_.per_scope_limit)) {
      if (r.url.empty() || !seen.insert(r.url).second) continue;
      all.push_back(std::move(r));
    }
  }
  all = filter_by_license(all, config_.allowed_licenses);
  std::stable_sort(all.begin(), all.end(),
                   [](const SearchResult& a, const SearchResult& b) { return a.score > b.score; });
  if (all.size() > config_.max_notes) all.resize(config_.max_notes);

  std::string notes;
  for (const auto& r : all) {
    notes += "- " + r.title + " <" + r.url + ">";
    if (!r.license.empty()) notes += " [" + r.license + "]";
    notes += "\n";
    const std::string body = clip(html_.convert(r.snippet_html), config_.max_snippet_chars);
    if (!body.empty()) notes += "  " + body + "\n";
  }
  return notes;
}

}  // namespace auton
