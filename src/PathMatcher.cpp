#include "PathMatcher.hpp"

namespace modsync {

namespace {

bool matchRange(const char *p, const char *pe, const char *t, const char *te,
                bool lit);

// Parses a [...] class starting at p ('['). Returns the position after ']'
// or nullptr when the class is unterminated.
const char *matchClass(const char *p, const char *pe, char ch, bool &matched) {
  const char *q = p + 1;
  bool negate = false;
  if (q < pe && (*q == '!' || *q == '^')) {
    negate = true;
    ++q;
  }
  matched = false;
  bool first = true;
  while (q < pe && (*q != ']' || first)) {
    first = false;
    char lo = *q;
    if (lo == '\\' && q + 1 < pe)
      lo = *++q;
    char hi = lo;
    if (q + 2 < pe && q[1] == '-' && q[2] != ']') {
      hi = q[2];
      q += 2;
    }
    if (lo <= ch && ch <= hi)
      matched = true;
    ++q;
  }
  if (q >= pe)
    return nullptr;
  if (negate)
    matched = !matched;
  return q + 1;
}

bool matchRange(const char *p, const char *pe, const char *t, const char *te,
                bool lit) {
  while (p < pe) {
    char c = *p;
    if (c == '*') {
      bool doubleStar = (p + 1 < pe && p[1] == '*');
      while (p < pe && *p == '*')
        ++p;
      if (doubleStar && p < pe && *p == '/') {
        // "**/" matches zero or more leading directories
        const char *rest = p + 1;
        if (matchRange(rest, pe, t, te, lit))
          return true;
        for (const char *q = t; q < te; ++q) {
          if (*q == '/' && matchRange(rest, pe, q + 1, te, lit))
            return true;
        }
        return false;
      }
      bool crossesSlash = doubleStar || !lit;
      for (const char *q = t;; ++q) {
        if (matchRange(p, pe, q, te, lit))
          return true;
        if (q == te || (!crossesSlash && *q == '/'))
          return false;
      }
    }
    if (c == '?') {
      if (t == te || (lit && *t == '/'))
        return false;
      ++p;
      ++t;
      continue;
    }
    if (c == '[') {
      if (t == te || (lit && *t == '/'))
        return false;
      bool matched = false;
      const char *next = matchClass(p, pe, *t, matched);
      if (next) {
        if (!matched)
          return false;
        p = next;
        ++t;
        continue;
      }
      // Unterminated class, '[' is literal
    }
    if (c == '\\' && p + 1 < pe)
      c = *++p;
    if (t == te || *t != c)
      return false;
    ++p;
    ++t;
  }
  return t == te;
}

} // namespace

bool globMatch(const std::string &pattern, const std::string &text,
               bool literalSeparator) {
  return matchRange(pattern.data(), pattern.data() + pattern.size(),
                    text.data(), text.data() + text.size(), literalSeparator);
}

void GlobSet::add(const std::string &pattern) {
  std::string p = pattern;
  if (p.size() > 2 && p.compare(0, 2, "./") == 0)
    p.erase(0, 2);
  m_patterns.push_back(p);
}

bool GlobSet::isMatch(const std::string &path) const {
  for (const auto &p : m_patterns) {
    if (globMatch(p, path, false))
      return true;
  }
  return false;
}

void IgnoreRules::addLine(const std::string &line) {
  std::string p = line;
  while (!p.empty() && (p.back() == ' ' || p.back() == '\t' ||
                        p.back() == '\r' || p.back() == '\n')) {
    if (p.size() >= 2 && p[p.size() - 2] == '\\')
      break;
    p.pop_back();
  }
  if (p.empty() || p[0] == '#')
    return;

  Rule rule{"", false, false};
  if (p[0] == '!') {
    rule.negated = true;
    p.erase(0, 1);
  } else if (p.size() > 1 && p[0] == '\\' && (p[1] == '#' || p[1] == '!')) {
    p.erase(0, 1);
  }
  if (!p.empty() && p.back() == '/') {
    rule.dirOnly = true;
    p.pop_back();
  }
  if (p.empty())
    return;

  bool anchored = p.find('/') != std::string::npos;
  if (p[0] == '/')
    p.erase(0, 1);
  rule.pattern = anchored ? p : "**/" + p;
  m_rules.push_back(rule);
}

int IgnoreRules::decide(const std::string &path, bool isDir) const {
  int decision = 0;
  for (const auto &rule : m_rules) {
    if (rule.dirOnly && !isDir)
      continue;
    if (globMatch(rule.pattern, path, true))
      decision = rule.negated ? -1 : 1;
  }
  return decision;
}

bool IgnoreRules::isIgnored(const std::string &path, bool isDir) const {
  if (m_rules.empty())
    return false;
  for (size_t pos = path.find('/'); pos != std::string::npos;
       pos = path.find('/', pos + 1)) {
    if (decide(path.substr(0, pos), true) > 0)
      return true;
  }
  return decide(path, isDir) > 0;
}

PathMatcher::PathMatcher(const std::vector<std::string> &includeGlobs,
                         const std::vector<std::string> &excludes) {
  for (const auto &g : includeGlobs)
    m_includes.add(g);
  for (const auto &e : excludes)
    m_excludes.addLine(e);
}

bool PathMatcher::matches(const std::string &path) const {
  return m_includes.isMatch(path) && !m_excludes.isIgnored(path, false);
}

bool PathMatcher::prunesDirectory(const std::string &path) const {
  return m_excludes.isIgnored(path, true);
}

} // namespace modsync
