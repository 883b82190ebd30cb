#ifndef PATHMATCHER_HPP
#define PATHMATCHER_HPP

#include <string>
#include <vector>

namespace modsync {

/**
 * Shell-style glob matching. With literalSeparator set, '*' and '?' stop at
 * '/' and only '**' crosses directory boundaries (gitignore flavour);
 * otherwise '*' behaves like '**'.
 */
bool globMatch(const std::string &pattern, const std::string &text,
               bool literalSeparator);

// Include set: a path passes when any pattern matches it.
class GlobSet {
public:
  void add(const std::string &pattern);
  bool isMatch(const std::string &path) const;
  bool empty() const { return m_patterns.empty(); }

private:
  std::vector<std::string> m_patterns;
};

// Ignore rules with gitignore precedence: the last matching rule wins and a
// path below an ignored directory stays ignored.
class IgnoreRules {
public:
  void addLine(const std::string &line);
  bool isIgnored(const std::string &path, bool isDir) const;

private:
  struct Rule {
    std::string pattern;
    bool negated;
    bool dirOnly;
  };
  std::vector<Rule> m_rules;

  // 1 ignored, -1 explicitly re-included, 0 no rule matched
  int decide(const std::string &path, bool isDir) const;
};

class PathMatcher {
public:
  PathMatcher(const std::vector<std::string> &includeGlobs,
              const std::vector<std::string> &excludes);

  // True when a relative file path is tracked
  bool matches(const std::string &path) const;
  // True when nothing below the directory can ever be tracked
  bool prunesDirectory(const std::string &path) const;

private:
  GlobSet m_includes;
  IgnoreRules m_excludes;
};

} // namespace modsync

#endif // PATHMATCHER_HPP
