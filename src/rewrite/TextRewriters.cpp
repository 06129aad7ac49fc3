#include "rewrite/Edit.hpp"
#include "rewrite/SymbolRewriter.hpp"

#include <cctype>

namespace refsafe {

namespace {

bool isWordChar(char c) {
  return std::isalnum((unsigned char)c) || c == '_';
}

// Whole-line comments. `inBlock` carries an open /* */ across lines; a line
// starting with `*` is only a comment inside one.
bool isCommentLine(llvm::StringRef line, bool hashComments, bool& inBlock) {
  llvm::StringRef s = line.ltrim(" \t");
  if (hashComments) return s.startswith("#");

  if (inBlock) {
    if (s.contains("*/")) inBlock = false;
    return true;
  }
  if (s.startswith("/*")) {
    inBlock = !s.drop_front(2).contains("*/");
    return true;
  }
  return s.startswith("//");
}

class SafeTextRewriter final : public SymbolRewriter {
public:
  Backend backend() const override { return Backend::Regex; }
  bool supports(Language lang) const override { return isProgrammingLanguage(lang); }

  llvm::Expected<RewriteResult>
  rewrite(llvm::StringRef content, const RenameRequest& req) override {
    RewriteResult res{content.str(), 0, Backend::Regex};
    llvm::StringRef oldName = req.oldName;
    if (oldName.empty() || req.oldName == req.newName) return res;

    const bool hashComments = usesHashComments(req.language);
    bool inBlock = false;
    std::vector<Edit> edits;

    size_t lineStart = 0;
    while (lineStart < content.size()) {
      size_t lineEnd = content.find('\n', lineStart);
      if (lineEnd == llvm::StringRef::npos) lineEnd = content.size();
      llvm::StringRef line = content.slice(lineStart, lineEnd);

      if (!isCommentLine(line, hashComments, inBlock))
        scanLine(line, lineStart, oldName, req.newName, hashComments, edits);

      lineStart = lineEnd + 1;
    }

    std::string err;
    if (!applyEdits(res.content, edits, &err))
      return llvm::createStringError(std::make_error_code(std::errc::invalid_argument), err);
    res.changes = static_cast<unsigned>(edits.size());
    return res;
  }

private:
  // Only the start of a match needs a word boundary; a symbol that is a
  // prefix of a longer identifier is rewritten inside it as well.
  static void scanLine(llvm::StringRef line, size_t base, llvm::StringRef oldName,
                       const std::string& newName, bool hashComments, std::vector<Edit>& edits) {
    char quote = 0;
    size_t i = 0;
    while (i < line.size()) {
      char c = line[i];
      if (quote) {
        if (c == '\\') { i += 2; continue; }
        if (c == quote) quote = 0;
        ++i;
        continue;
      }
      if (c == '"' || c == '\'') { quote = c; ++i; continue; }
      // trailing comment: nothing after it is code
      if (hashComments ? c == '#' : line.substr(i).startswith("//")) return;

      if (line.substr(i).startswith(oldName) && (i == 0 || !isWordChar(line[i - 1]))) {
        edits.push_back(Edit{unsigned(base + i), unsigned(oldName.size()), newName});
        i += oldName.size();
        continue;
      }
      ++i;
    }
  }
};

class PlainTextRewriter final : public SymbolRewriter {
public:
  Backend backend() const override { return Backend::PlainText; }
  bool supports(Language) const override { return true; }

  llvm::Expected<RewriteResult>
  rewrite(llvm::StringRef content, const RenameRequest& req) override {
    RewriteResult res{std::string(), 0, Backend::PlainText};
    if (req.oldName.empty() || req.oldName == req.newName) {
      res.content = content.str();
      return res;
    }
    res.content.reserve(content.size());
    size_t pos = 0;
    while (true) {
      size_t hit = content.find(req.oldName, pos);
      if (hit == llvm::StringRef::npos) break;
      res.content.append(content.data() + pos, hit - pos);
      res.content += req.newName;
      pos = hit + req.oldName.size();
      ++res.changes;
    }
    res.content.append(content.data() + pos, content.size() - pos);
    return res;
  }
};

} // namespace

std::unique_ptr<SymbolRewriter> makeSafeTextRewriter() {
  return std::make_unique<SafeTextRewriter>();
}

std::unique_ptr<SymbolRewriter> makePlainTextRewriter() {
  return std::make_unique<PlainTextRewriter>();
}

} // namespace refsafe
