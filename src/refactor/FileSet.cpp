#include "refactor/FileSet.hpp"

#include "llvm/ADT/Optional.h"
#include "llvm/ADT/SmallVector.h"
#include "llvm/Support/GlobPattern.h"

#include <algorithm>
#include <filesystem>
#include <set>

namespace stdfs = std::filesystem;

namespace refsafe {

namespace {

bool hasGlobChars(llvm::StringRef s) {
  return s.find_first_of("*?[") != llvm::StringRef::npos;
}

// One path pattern split into components. `texts` owns the strings the
// compiled globs point into, so it is filled before anything is compiled
// and never touched afterwards.
class PathPattern {
public:
  static llvm::Expected<PathPattern> parse(llvm::StringRef pattern) {
    PathPattern P;
    stdfs::path Full(pattern.str());
    stdfs::path Base;
    bool InBase = true;
    for (const auto& Part : Full) {
      std::string Text = Part.generic_string();
      if (Text.empty()) continue;
      if (InBase && !hasGlobChars(Text)) {
        Base /= Part;
        continue;
      }
      InBase = false;
      P.texts_.push_back(std::move(Text));
    }
    P.base_ = Base.empty() ? stdfs::path(".") : Base;
    P.relativeToCwd_ = Base.empty();

    P.globs_.reserve(P.texts_.size());
    for (const std::string& T : P.texts_) {
      if (T == "**") {
        P.globs_.emplace_back();
        P.recursive_ = true;
        continue;
      }
      auto G = llvm::GlobPattern::create(T);
      if (!G)
        return llvm::createStringError(std::errc::invalid_argument,
                                       "invalid glob '%s': %s", pattern.str().c_str(),
                                       llvm::toString(G.takeError()).c_str());
      P.globs_.emplace_back(std::move(*G));
    }
    if (P.texts_.size() > 1) P.recursive_ = true;
    return std::move(P);
  }

  const stdfs::path& base() const { return base_; }
  bool literal() const { return texts_.empty(); }
  bool recursive() const { return recursive_; }

  // Turns a walked path back into the form the user wrote the pattern in.
  std::string display(const stdfs::path& p) const {
    if (relativeToCwd_) return p.lexically_relative(".").lexically_normal().generic_string();
    return p.lexically_normal().generic_string();
  }

  bool matches(const stdfs::path& rel) const {
    std::vector<std::string> Segs;
    for (const auto& Part : rel) Segs.push_back(Part.generic_string());
    return matchFrom(0, Segs, 0);
  }

private:
  PathPattern() = default;

  bool matchFrom(size_t pi, const std::vector<std::string>& segs, size_t si) const {
    if (pi == globs_.size()) return si == segs.size();
    if (!globs_[pi]) {
      // '**': try every split
      for (size_t k = si; k <= segs.size(); ++k)
        if (matchFrom(pi + 1, segs, k)) return true;
      return false;
    }
    if (si == segs.size()) return false;
    return globs_[pi]->match(segs[si]) && matchFrom(pi + 1, segs, si + 1);
  }

  std::vector<std::string> texts_;
  std::vector<llvm::Optional<llvm::GlobPattern>> globs_;
  stdfs::path base_;
  bool relativeToCwd_ = false;
  bool recursive_ = false;
};

template <typename Iter, typename Fn>
void walk(const stdfs::path& dir, Fn&& fn) {
  std::error_code ec;
  Iter it(dir, stdfs::directory_options::skip_permission_denied, ec);
  for (Iter end; !ec && it != end; it.increment(ec)) {
    std::error_code sec;
    if (it->is_regular_file(sec)) fn(it->path());
  }
}

} // namespace

llvm::Expected<std::vector<std::string>> expandGlobs(llvm::StringRef patterns) {
  std::set<std::string> found;

  llvm::SmallVector<llvm::StringRef, 4> parts;
  patterns.split(parts, ',', -1, /*KeepEmpty=*/false);
  for (llvm::StringRef raw : parts) {
    llvm::StringRef text = raw.trim();
    if (text.empty()) continue;

    auto pattern = PathPattern::parse(text);
    if (!pattern) return pattern.takeError();

    std::error_code ec;
    if (pattern->literal()) {
      if (stdfs::is_regular_file(pattern->base(), ec)) found.insert(pattern->display(pattern->base()));
      continue;
    }
    if (!stdfs::is_directory(pattern->base(), ec)) continue;

    auto visit = [&](const stdfs::path& p) {
      if (pattern->matches(p.lexically_relative(pattern->base()))) found.insert(pattern->display(p));
    };
    if (pattern->recursive())
      walk<stdfs::recursive_directory_iterator>(pattern->base(), visit);
    else
      walk<stdfs::directory_iterator>(pattern->base(), visit);
  }
  return std::vector<std::string>(found.begin(), found.end());
}

llvm::Expected<std::vector<std::string>> listFiles(llvm::StringRef dir, llvm::StringRef nameGlob,
                                                   bool recursive) {
  std::error_code ec;
  const stdfs::path root(dir.str());
  if (!stdfs::is_directory(root, ec))
    return llvm::createStringError(std::errc::no_such_file_or_directory,
                                   "directory '%s' does not exist", dir.str().c_str());

  const std::string globText = nameGlob.empty() ? std::string("*") : nameGlob.str();
  auto glob = llvm::GlobPattern::create(globText);
  if (!glob)
    return llvm::createStringError(std::errc::invalid_argument, "invalid glob '%s': %s",
                                   globText.c_str(), llvm::toString(glob.takeError()).c_str());

  std::vector<std::string> files;
  auto visit = [&](const stdfs::path& p) {
    if (glob->match(p.filename().string())) files.push_back(p.generic_string());
  };
  if (recursive)
    walk<stdfs::recursive_directory_iterator>(root, visit);
  else
    walk<stdfs::directory_iterator>(root, visit);

  std::sort(files.begin(), files.end());
  return files;
}

} // namespace refsafe
