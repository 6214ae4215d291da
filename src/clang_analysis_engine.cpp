#include <surveyor/clang_analysis_engine.h>

#include <clang-c/CXCompilationDatabase.h>
#include <clang-c/Index.h>

#include <algorithm>
#include <fstream>
#include <iterator>
#include <map>
#include <optional>
#include <sstream>
#include <system_error>
#include <utility>

namespace surveyor {

namespace {
std::string ToString(CXString value) {
  std::string text;
  if (const auto *cstr = clang_getCString(value); cstr != nullptr) {
    text = cstr;
  }
  clang_disposeString(value);
  return text;
}

std::string Join(const std::vector<std::string> &values,
                 const std::string &separator) {
  std::ostringstream stream;
  for (std::size_t i = 0; i < values.size(); ++i) {
    if (i > 0) {
      stream << separator;
    }
    stream << values[i];
  }
  return stream.str();
}

bool IsHeader(const std::filesystem::path &path) {
  static const std::set<std::string> kHeaders = {".h", ".hh", ".hpp", ".hxx",
                                                 ".ipp"};
  return kHeaders.count(path.extension().string()) > 0;
}

bool IsWithin(const std::filesystem::path &candidate,
              const std::filesystem::path &parent) {
  if (parent.empty()) {
    return false;
  }
  const auto relative = candidate.lexically_relative(parent);
  return !relative.empty() && *relative.begin() != "..";
}

Severity ToSeverity(CXDiagnosticSeverity severity) {
  switch (severity) {
  case CXDiagnostic_Ignored:
    return Severity::kIgnored;
  case CXDiagnostic_Note:
    return Severity::kNote;
  case CXDiagnostic_Warning:
    return Severity::kWarning;
  case CXDiagnostic_Error:
    return Severity::kError;
  case CXDiagnostic_Fatal:
    return Severity::kFatal;
  }
  return Severity::kError;
}

using CompileCommandMap = std::map<std::string, std::vector<std::string>>;

std::optional<CompileCommandMap>
LoadCompileCommands(const std::filesystem::path &directory,
                    const std::filesystem::path &project_root) {
  std::error_code error_code;
  if (!std::filesystem::exists(directory / "compile_commands.json",
                               error_code)) {
    return std::nullopt;
  }

  CXCompilationDatabase_Error error = CXCompilationDatabase_NoError;
  CXCompilationDatabase database = clang_CompilationDatabase_fromDirectory(
      directory.string().c_str(), &error);
  if (error != CXCompilationDatabase_NoError || database == nullptr) {
    return std::nullopt;
  }

  CompileCommandMap commands_by_file;
  CXCompileCommands commands =
      clang_CompilationDatabase_getAllCompileCommands(database);
  const unsigned size = clang_CompileCommands_getSize(commands);
  for (unsigned index = 0; index < size; ++index) {
    CXCompileCommand command = clang_CompileCommands_getCommand(commands, index);
    std::filesystem::path file =
        ToString(clang_CompileCommand_getFilename(command));
    if (file.is_relative()) {
      file = std::filesystem::path(
                 ToString(clang_CompileCommand_getDirectory(command))) /
             file;
    }
    file = std::filesystem::weakly_canonical(file, error_code);
    if (error_code || !IsWithin(file, project_root) ||
        commands_by_file.count(file.string()) > 0) {
      continue;
    }

    std::vector<std::string> arguments;
    const unsigned count = clang_CompileCommand_getNumArgs(command);
    arguments.reserve(count);
    for (unsigned arg = 0; arg < count; ++arg) {
      arguments.push_back(ToString(clang_CompileCommand_getArg(command, arg)));
    }
    commands_by_file.emplace(file.string(),
                             NormalizeCompileArguments(arguments, file));
  }

  clang_CompileCommands_dispose(commands);
  clang_CompilationDatabase_dispose(database);
  return commands_by_file;
}

std::optional<std::string> ReadFile(const std::filesystem::path &path) {
  std::ifstream stream(path, std::ios::binary);
  if (!stream) {
    return std::nullopt;
  }
  return std::string((std::istreambuf_iterator<char>(stream)),
                     std::istreambuf_iterator<char>());
}

struct IndexDeleter {
  void operator()(void *index) const { clang_disposeIndex(index); }
};
using IndexHandle = std::unique_ptr<void, IndexDeleter>;

// Owns a translation unit and keeps its index alive while it is in use.
class ClangSyntaxUnit : public SyntaxUnit {
public:
  ClangSyntaxUnit(std::shared_ptr<IndexHandle> index,
                  CXTranslationUnit translation_unit)
      : index_(std::move(index)), translation_unit_(translation_unit) {}

  ClangSyntaxUnit(const ClangSyntaxUnit &) = delete;
  ClangSyntaxUnit &operator=(const ClangSyntaxUnit &) = delete;

  ~ClangSyntaxUnit() override {
    clang_disposeTranslationUnit(translation_unit_);
  }

  CXTranslationUnit Get() const { return translation_unit_; }

  void Traverse(
      const std::function<void(const SyntaxNode &)> &visit) const override {
    clang_visitChildren(
        clang_getTranslationUnitCursor(translation_unit_),
        [](CXCursor cursor, CXCursor, CXClientData data) {
          const auto location = clang_getCursorLocation(cursor);
          if (clang_Location_isFromMainFile(location) == 0) {
            return CXChildVisit_Continue;
          }
          const auto &callback =
              *static_cast<const std::function<void(const SyntaxNode &)> *>(
                  data);
          callback(ToNode(cursor, location));
          return CXChildVisit_Recurse;
        },
        const_cast<std::function<void(const SyntaxNode &)> *>(&visit));
  }

private:
  static SyntaxNode ToNode(CXCursor cursor, CXSourceLocation location) {
    const auto kind = clang_getCursorKind(cursor);
    SyntaxNode node;
    node.kind = ToString(clang_getCursorKindSpelling(kind));
    node.spelling = ToString(clang_getCursorSpelling(cursor));
    if (clang_isReference(kind) != 0) {
      // TypeRef spells "struct name"; report the referenced entity's name.
      const auto referenced = clang_getCursorReferenced(cursor);
      if (clang_Cursor_isNull(referenced) == 0) {
        node.spelling = ToString(clang_getCursorSpelling(referenced));
      }
    }
    unsigned offset = 0;
    clang_getFileLocation(location, nullptr, &node.line, &node.column,
                          &offset);
    node.offset = offset;
    node.declaration = clang_isDeclaration(kind) != 0;
    node.reference = clang_isReference(kind) != 0 ||
                     kind == CXCursor_DeclRefExpr ||
                     kind == CXCursor_MemberRefExpr;
    return node;
  }

  std::shared_ptr<IndexHandle> index_;
  CXTranslationUnit translation_unit_;
};

std::vector<DiagnosticRecord>
CollectDiagnostics(CXTranslationUnit translation_unit, const std::string &path,
                   const std::shared_ptr<const LineInfo> &line_info,
                   bool syntax_only) {
  std::vector<DiagnosticRecord> records;
  const unsigned count = clang_getNumDiagnostics(translation_unit);
  for (unsigned i = 0; i < count; ++i) {
    CXDiagnostic diagnostic = clang_getDiagnostic(translation_unit, i);
    const auto location = clang_getDiagnosticLocation(diagnostic);
    CXFile file = nullptr;
    unsigned line = 0;
    unsigned column = 0;
    unsigned offset = 0;
    clang_getFileLocation(location, &file, &line, &column, &offset);
    if (file == nullptr || clang_Location_isFromMainFile(location) != 0) {
      DiagnosticRecord record;
      record.file = path;
      record.offset = offset;
      record.line = line;
      record.column = column;
      record.severity = ToSeverity(clang_getDiagnosticSeverity(diagnostic));
      record.category = ToString(clang_getDiagnosticCategoryText(diagnostic));
      record.message = ToString(clang_getDiagnosticSpelling(diagnostic));
      record.line_info = line_info;
      if (!syntax_only || IsSyntaxCategory(record.category)) {
        records.push_back(std::move(record));
      }
    }
    clang_disposeDiagnostic(diagnostic);
  }
  return records;
}

class ClangFileResultStream : public FileResultStream {
public:
  ClangFileResultStream(std::shared_ptr<IndexHandle> index,
                        const std::vector<std::filesystem::path> &files,
                        const CompileCommandMap &commands, bool resolve_units,
                        std::shared_ptr<Logger> logger)
      : index_(std::move(index)), files_(&files), commands_(&commands),
        resolve_units_(resolve_units), logger_(std::move(logger)) {}

  std::optional<FileResult> Next() override {
    if (position_ >= files_->size()) {
      return std::nullopt;
    }
    return Analyze((*files_)[position_++]);
  }

private:
  std::vector<std::string> ArgumentsFor(const std::filesystem::path &file) const {
    const auto found = commands_->find(file.string());
    if (found != commands_->end()) {
      return found->second;
    }
    return DefaultCompileArguments(file);
  }

  FileResult Analyze(const std::filesystem::path &file) const {
    FileResult result;
    result.path = file.string();

    const auto content = ReadFile(file);
    if (!content) {
      result.failure = "unable to read file";
      return result;
    }
    result.line_info =
        std::make_shared<const LineInfo>(LineInfo::FromContent(*content));

    const auto arguments = ArgumentsFor(file);
    std::vector<const char *> argument_pointers;
    argument_pointers.reserve(arguments.size());
    for (const auto &argument : arguments) {
      argument_pointers.push_back(argument.c_str());
    }

    unsigned options = CXTranslationUnit_KeepGoing;
    if (!resolve_units_) {
      options |= CXTranslationUnit_SingleFileParse |
                 CXTranslationUnit_Incomplete;
    }

    CXTranslationUnit translation_unit = nullptr;
    const auto error = clang_parseTranslationUnit2(
        index_->get(), result.path.c_str(), argument_pointers.data(),
        static_cast<int>(argument_pointers.size()), nullptr, 0, options,
        &translation_unit);
    logger_->Log(LogLevel::kDebug, "engine.file.parse",
                 {{"file", result.path},
                  {"arguments", Join(arguments, " ")},
                  {"code", std::to_string(static_cast<int>(error))}});
    if (error != CXError_Success || translation_unit == nullptr) {
      result.failure = "libclang could not parse the file (error code " +
                       std::to_string(static_cast<int>(error)) + ")";
      return result;
    }

    auto unit = std::make_shared<const ClangSyntaxUnit>(index_,
                                                        translation_unit);
    result.diagnostics =
        CollectDiagnostics(unit->Get(), result.path, result.line_info,
                           !resolve_units_);
    if (resolve_units_) {
      result.unit = std::move(unit);
    }
    return result;
  }

  std::shared_ptr<IndexHandle> index_;
  const std::vector<std::filesystem::path> *files_;
  const CompileCommandMap *commands_;
  bool resolve_units_;
  std::shared_ptr<Logger> logger_;
  std::size_t position_ = 0;
};

class ClangAnalysisContext : public AnalysisContext {
public:
  ClangAnalysisContext(AnalysisRoot root,
                       std::vector<std::filesystem::path> files,
                       CompileCommandMap commands, bool resolve_units,
                       std::shared_ptr<Logger> logger)
      : root_(std::move(root)), files_(std::move(files)),
        commands_(std::move(commands)), resolve_units_(resolve_units),
        logger_(std::move(logger)),
        index_(std::make_shared<IndexHandle>(clang_createIndex(0, 0))) {
    if (!*index_) {
      throw AnalysisError("Failed to create libclang index for " +
                          root_.path.string());
    }
  }

  const AnalysisRoot &Root() const override { return root_; }

  std::unique_ptr<FileResultStream> Files() override {
    return std::make_unique<ClangFileResultStream>(index_, files_, commands_,
                                                   resolve_units_, logger_);
  }

private:
  AnalysisRoot root_;
  std::vector<std::filesystem::path> files_;
  CompileCommandMap commands_;
  bool resolve_units_;
  std::shared_ptr<Logger> logger_;
  std::shared_ptr<IndexHandle> index_;
};
} // namespace

bool IsSyntaxCategory(const std::string &category) {
  return category == "Parse Issue" ||
         category == "Lexical or Preprocessor Issue";
}

bool IsSourceFile(const std::filesystem::path &path) {
  static const std::set<std::string> kExtensions = {
      ".c", ".cc", ".cxx", ".cpp", ".h", ".hh", ".hpp", ".hxx", ".ipp", ".ixx"};
  return kExtensions.count(path.extension().string()) > 0;
}

bool IsExcludedPath(const std::filesystem::path &relative,
                    const std::set<std::string> &excluded_segments) {
  if (excluded_segments.empty()) {
    return false;
  }
  return std::any_of(relative.begin(), relative.end(), [&](const auto &part) {
    return excluded_segments.count(part.string()) > 0;
  });
}

std::vector<std::filesystem::path>
CollectSourceFiles(const std::filesystem::path &root,
                   const std::filesystem::path &build_directory,
                   const std::set<std::string> &excluded_segments) {
  std::vector<std::filesystem::path> files;
  try {
    for (std::filesystem::recursive_directory_iterator it(root), end;
         it != end; ++it) {
      const auto &entry = *it;
      const auto relative = entry.path().lexically_relative(root);
      const auto name = entry.path().filename().string();
      const bool hidden = !name.empty() && name.front() == '.';
      if (entry.is_directory()) {
        if (hidden || IsWithin(entry.path(), build_directory) ||
            entry.path() == build_directory ||
            IsExcludedPath(relative, excluded_segments)) {
          it.disable_recursion_pending();
        }
        continue;
      }
      if (!entry.is_regular_file() || hidden || !IsSourceFile(entry.path()) ||
          IsExcludedPath(relative, excluded_segments)) {
        continue;
      }
      files.push_back(entry.path());
    }
  } catch (const std::filesystem::filesystem_error &error) {
    throw AnalysisError("Unable to list sources under " + root.string() +
                        ": " + error.what());
  }

  std::sort(files.begin(), files.end());
  return files;
}

std::vector<std::string>
NormalizeCompileArguments(const std::vector<std::string> &arguments,
                          const std::filesystem::path &file) {
  std::vector<std::string> normalized;
  normalized.reserve(arguments.size());
  const auto file_name = file.filename().string();
  for (std::size_t i = 1; i < arguments.size(); ++i) {
    const auto &argument = arguments[i];
    if (argument == file.string() ||
        std::filesystem::path(argument).filename() == file_name) {
      continue;
    }
    if (argument == "-c") {
      continue;
    }
    if (argument == "-o" && i + 1 < arguments.size()) {
      ++i;
      continue;
    }
    normalized.push_back(argument);
  }
  return normalized;
}

std::vector<std::string>
DefaultCompileArguments(const std::filesystem::path &file) {
  if (file.extension() == ".c") {
    return {"-x", "c"};
  }
  if (IsHeader(file)) {
    return {"-x", "c++", "-std=c++17"};
  }
  return {"-std=c++17"};
}

ClangAnalysisEngine::ClangAnalysisEngine(std::shared_ptr<Logger> logger)
    : logger_(EnsureLogger(std::move(logger))) {}

std::unique_ptr<AnalysisContext>
ClangAnalysisEngine::Open(const AnalysisRoot &root,
                          const RunConfiguration &config) {
  std::error_code error;
  const auto project_root = std::filesystem::weakly_canonical(root.path, error);
  if (error || !std::filesystem::is_directory(project_root, error)) {
    throw AnalysisError("Analysis root is not a directory: " +
                        root.path.string());
  }

  auto build_directory = config.build_directory;
  if (build_directory.is_relative()) {
    build_directory = project_root / build_directory;
  }

  auto files = CollectSourceFiles(project_root, build_directory,
                                  config.excluded_paths);

  auto commands = LoadCompileCommands(build_directory, project_root);
  if (!commands) {
    commands = LoadCompileCommands(project_root, project_root);
  }

  logger_->Log(LogLevel::kInfo, "engine.open",
               {{"root", project_root.string()},
                {"files", std::to_string(files.size())},
                {"compile_commands",
                 std::to_string(commands ? commands->size() : 0)}});

  return std::make_unique<ClangAnalysisContext>(
      root, std::move(files), commands.value_or(CompileCommandMap{}),
      config.resolve_units, logger_);
}

} // namespace surveyor
