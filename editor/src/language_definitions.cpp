/**
 * @file language_definitions.cpp
 * @brief Language detection and lexical tables for syntax highlighting
 */

#include "McpIDE/editor/language_definitions.hpp"
#include <algorithm>
#include <cctype>
#include <unordered_map>

namespace McpIDE::editor {

namespace {

std::string toLower(std::string_view str) {
  std::string result(str);
  std::transform(result.begin(), result.end(), result.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return result;
}

std::string_view baseName(std::string_view path) {
  const auto pos = path.find_last_of("/\\");
  return pos == std::string_view::npos ? path : path.substr(pos + 1);
}

const std::vector<std::string> &cFamilyKeywords() {
  static const std::vector<std::string> keywords = {
      "break",  "case",   "const",  "continue", "default", "do",     "else",
      "enum",   "extern", "for",    "goto",     "if",      "inline", "register",
      "return", "sizeof", "static", "struct",   "switch",  "typedef", "union",
      "volatile", "while"};
  return keywords;
}

LanguageSpec makePython() {
  LanguageSpec spec;
  spec.id = LanguageId::Python;
  spec.displayName = "Python";
  spec.keywords = {"and",    "as",     "assert", "async", "await",  "break",    "class",
                   "continue", "def",  "del",    "elif",  "else",   "except",   "finally",
                   "for",    "from",   "global", "if",    "import", "in",       "is",
                   "lambda", "match",  "case",   "nonlocal", "not", "or",       "pass",
                   "raise",  "return", "try",    "while", "with",   "yield"};
  spec.types = {"bool",  "bytes", "dict", "float",  "frozenset", "int",
                "list",  "object", "set", "str",    "tuple",     "type",
                "Exception", "ValueError", "TypeError", "KeyError", "RuntimeError"};
  spec.builtins = {"True", "False", "None", "self", "cls", "print", "len", "range",
                   "open", "super", "isinstance", "enumerate", "zip", "map", "filter",
                   "sorted", "min", "max", "sum", "abs", "any", "all", "getattr",
                   "setattr", "hasattr"};
  spec.lineComments = {"#"};
  spec.blockCommentStart = "";
  spec.hasDecorators = true;
  spec.colonOpensBlock = true;
  return spec;
}

LanguageSpec makeC() {
  LanguageSpec spec;
  spec.id = LanguageId::C;
  spec.displayName = "C";
  spec.keywords = cFamilyKeywords();
  spec.keywords.insert(spec.keywords.end(), {"restrict", "_Bool", "_Static_assert"});
  spec.types = {"char",    "double",  "float",    "int",      "long",    "short",
                "signed",  "unsigned", "void",    "size_t",   "int8_t",  "int16_t",
                "int32_t", "int64_t", "uint8_t",  "uint16_t", "uint32_t", "uint64_t",
                "FILE",    "bool"};
  spec.builtins = {"NULL", "true", "false", "printf", "malloc", "free", "memcpy", "strlen"};
  spec.lineComments = {"//"};
  spec.blockCommentStart = "/*";
  spec.blockCommentEnd = "*/";
  return spec;
}

LanguageSpec makeCpp() {
  LanguageSpec spec = makeC();
  spec.id = LanguageId::Cpp;
  spec.displayName = "C++";
  spec.keywords = cFamilyKeywords();
  spec.keywords.insert(
      spec.keywords.end(),
      {"alignas",   "alignof",  "catch",     "class",      "co_await",  "co_return",
       "co_yield",  "concept",  "consteval", "constexpr",  "constinit", "const_cast",
       "decltype",  "delete",   "dynamic_cast", "explicit", "export",   "final",
       "friend",    "mutable",  "namespace", "new",        "noexcept",  "operator",
       "override",  "private",  "protected", "public",     "reinterpret_cast",
       "requires",  "static_assert", "static_cast", "template", "this", "throw",
       "try",       "typeid",   "typename",  "using",      "virtual"});
  spec.types.insert(spec.types.end(),
                    {"auto", "wchar_t", "char8_t", "char16_t", "char32_t", "std",
                     "string", "vector", "map", "unique_ptr", "shared_ptr", "optional"});
  spec.builtins = {"nullptr", "true", "false", "NULL"};
  return spec;
}

LanguageSpec makeJavaScript() {
  LanguageSpec spec;
  spec.id = LanguageId::JavaScript;
  spec.displayName = "JavaScript";
  spec.keywords = {"async",  "await",   "break",  "case",    "catch",  "class",  "const",
                   "continue", "debugger", "default", "delete", "do",   "else",   "export",
                   "extends", "finally", "for",   "function", "if",    "import", "in",
                   "instanceof", "let",  "new",    "of",      "return", "static", "super",
                   "switch", "this",    "throw",  "try",     "typeof", "var",    "void",
                   "while",  "with",    "yield"};
  spec.types = {"Array", "Boolean", "Date", "Error", "Map", "Number", "Object",
                "Promise", "RegExp", "Set", "String", "Symbol"};
  spec.builtins = {"true", "false", "null", "undefined", "NaN", "Infinity", "console",
                   "window", "document", "require", "module"};
  spec.lineComments = {"//"};
  spec.blockCommentStart = "/*";
  spec.blockCommentEnd = "*/";
  spec.stringDelimiters = "\"'`";
  return spec;
}

LanguageSpec makeTypeScript() {
  LanguageSpec spec = makeJavaScript();
  spec.id = LanguageId::TypeScript;
  spec.displayName = "TypeScript";
  spec.keywords.insert(spec.keywords.end(),
                       {"abstract", "as", "declare", "enum", "implements", "interface",
                        "keyof", "namespace", "private", "protected", "public",
                        "readonly", "type"});
  spec.types.insert(spec.types.end(),
                    {"any", "boolean", "never", "number", "string", "unknown", "void"});
  spec.hasDecorators = true;
  return spec;
}

LanguageSpec makeJson() {
  LanguageSpec spec;
  spec.id = LanguageId::Json;
  spec.displayName = "JSON";
  spec.builtins = {"true", "false", "null"};
  spec.stringDelimiters = "\"";
  return spec;
}

LanguageSpec makeMarkdown() {
  LanguageSpec spec;
  spec.id = LanguageId::Markdown;
  spec.displayName = "Markdown";
  spec.stringDelimiters = "`";
  spec.blockCommentStart = "<!--";
  spec.blockCommentEnd = "-->";
  spec.highlightsNumbers = false;
  return spec;
}

LanguageSpec makeShell() {
  LanguageSpec spec;
  spec.id = LanguageId::Shell;
  spec.displayName = "Shell";
  spec.keywords = {"case", "do",    "done",   "elif",   "else",  "esac",  "fi",
                   "for",  "function", "if",  "in",     "local", "return", "select",
                   "then", "until", "while",  "export", "readonly"};
  spec.builtins = {"echo", "cd", "exit", "source", "set", "unset", "shift", "test",
                   "printf", "read", "eval", "exec", "trap"};
  spec.lineComments = {"#"};
  return spec;
}

LanguageSpec makeCMake() {
  LanguageSpec spec;
  spec.id = LanguageId::CMake;
  spec.displayName = "CMake";
  spec.keywords = {"if", "elseif", "else", "endif", "foreach", "endforeach", "while",
                   "endwhile", "function", "endfunction", "macro", "endmacro", "return"};
  spec.builtins = {"add_executable", "add_library", "add_subdirectory", "add_test",
                   "cmake_minimum_required", "enable_testing", "find_package",
                   "include_directories", "install", "message", "option", "project",
                   "set", "target_compile_definitions", "target_compile_options",
                   "target_include_directories", "target_link_libraries"};
  spec.types = {"PUBLIC", "PRIVATE", "INTERFACE", "REQUIRED", "COMPONENTS", "STATIC",
                "SHARED", "ON", "OFF", "TRUE", "FALSE"};
  spec.lineComments = {"#"};
  spec.stringDelimiters = "\"";
  spec.caseSensitiveKeywords = false;
  return spec;
}

LanguageSpec makeHtml() {
  LanguageSpec spec;
  spec.id = LanguageId::Html;
  spec.displayName = "HTML";
  spec.keywords = {"html", "head", "body", "div", "span", "script", "style", "link",
                   "meta", "title", "a", "p", "ul", "ol", "li", "table", "tr", "td",
                   "img", "form", "input", "button"};
  spec.blockCommentStart = "<!--";
  spec.blockCommentEnd = "-->";
  spec.caseSensitiveKeywords = false;
  spec.highlightsNumbers = false;
  return spec;
}

LanguageSpec makeCss() {
  LanguageSpec spec;
  spec.id = LanguageId::Css;
  spec.displayName = "CSS";
  spec.keywords = {"important", "media", "import", "font-face", "keyframes"};
  spec.builtins = {"inherit", "initial", "none", "auto", "block", "flex", "grid",
                   "absolute", "relative", "solid"};
  spec.blockCommentStart = "/*";
  spec.blockCommentEnd = "*/";
  return spec;
}

LanguageSpec makeYaml() {
  LanguageSpec spec;
  spec.id = LanguageId::Yaml;
  spec.displayName = "YAML";
  spec.builtins = {"true", "false", "null", "yes", "no", "on", "off"};
  spec.lineComments = {"#"};
  spec.caseSensitiveKeywords = false;
  return spec;
}

LanguageSpec makeRust() {
  LanguageSpec spec;
  spec.id = LanguageId::Rust;
  spec.displayName = "Rust";
  spec.keywords = {"as",    "async", "await", "break", "const",  "continue", "crate",
                   "dyn",   "else",  "enum",  "extern", "fn",    "for",      "if",
                   "impl",  "in",    "let",   "loop",  "match",  "mod",      "move",
                   "mut",   "pub",   "ref",   "return", "self",  "Self",     "static",
                   "struct", "super", "trait", "type", "unsafe", "use",      "where",
                   "while"};
  spec.types = {"bool", "char", "f32",  "f64", "i8",    "i16",   "i32", "i64",
                "i128", "isize", "u8",  "u16", "u32",   "u64",   "u128", "usize",
                "str",  "String", "Vec", "Option", "Result", "Box"};
  spec.builtins = {"true", "false", "Some", "None", "Ok", "Err", "println", "vec"};
  spec.lineComments = {"//"};
  spec.blockCommentStart = "/*";
  spec.blockCommentEnd = "*/";
  spec.stringDelimiters = "\"";
  return spec;
}

LanguageSpec makeGo() {
  LanguageSpec spec;
  spec.id = LanguageId::Go;
  spec.displayName = "Go";
  spec.keywords = {"break",  "case",  "chan",   "const",  "continue", "default",
                   "defer",  "else",  "fallthrough", "for", "func",     "go",
                   "goto",   "if",    "import", "interface", "map",     "package",
                   "range",  "return", "select", "struct", "switch",   "type", "var"};
  spec.types = {"bool",  "byte",  "complex64", "complex128", "error", "float32",
                "float64", "int", "int8",      "int16",      "int32", "int64",
                "rune",  "string", "uint",     "uint8",      "uint16", "uint32",
                "uint64", "uintptr", "any"};
  spec.builtins = {"true", "false", "nil", "iota", "append", "cap", "close", "copy",
                   "delete", "len", "make", "new", "panic", "print", "println", "recover"};
  spec.lineComments = {"//"};
  spec.blockCommentStart = "/*";
  spec.blockCommentEnd = "*/";
  spec.stringDelimiters = "\"'`";
  return spec;
}

LanguageSpec makeJava() {
  LanguageSpec spec;
  spec.id = LanguageId::Java;
  spec.displayName = "Java";
  spec.keywords = {"abstract", "assert",    "break",      "case",     "catch",   "class",
                   "const",    "continue",  "default",    "do",       "else",    "enum",
                   "extends",  "final",     "finally",    "for",      "goto",    "if",
                   "implements", "import",  "instanceof", "interface", "native", "new",
                   "package",  "private",   "protected",  "public",   "return",  "static",
                   "strictfp", "super",     "switch",     "synchronized", "this", "throw",
                   "throws",   "transient", "try",        "var",      "volatile", "while",
                   "record",   "sealed",    "permits",    "yield"};
  spec.types = {"boolean", "byte", "char", "double", "float", "int", "long", "short",
                "void", "String", "Object", "Integer", "List", "Map"};
  spec.builtins = {"true", "false", "null"};
  spec.lineComments = {"//"};
  spec.blockCommentStart = "/*";
  spec.blockCommentEnd = "*/";
  spec.hasDecorators = true;
  return spec;
}

LanguageSpec makeIni() {
  LanguageSpec spec;
  spec.id = LanguageId::Ini;
  spec.displayName = "INI";
  spec.builtins = {"true", "false", "yes", "no", "on", "off"};
  spec.lineComments = {";", "#"};
  spec.caseSensitiveKeywords = false;
  return spec;
}

LanguageSpec makePlainText() {
  LanguageSpec spec;
  spec.id = LanguageId::PlainText;
  spec.displayName = "Text";
  spec.stringDelimiters.clear();
  spec.highlightsNumbers = false;
  return spec;
}

const std::unordered_map<std::string, LanguageId> &extensionTable() {
  static const std::unordered_map<std::string, LanguageId> table = {
      {"py", LanguageId::Python},      {"pyw", LanguageId::Python},
      {"pyi", LanguageId::Python},     {"cpp", LanguageId::Cpp},
      {"cc", LanguageId::Cpp},         {"cxx", LanguageId::Cpp},
      {"hpp", LanguageId::Cpp},        {"hh", LanguageId::Cpp},
      {"hxx", LanguageId::Cpp},        {"ipp", LanguageId::Cpp},
      {"c", LanguageId::C},            {"h", LanguageId::C},
      {"js", LanguageId::JavaScript},  {"mjs", LanguageId::JavaScript},
      {"cjs", LanguageId::JavaScript}, {"jsx", LanguageId::JavaScript},
      {"ts", LanguageId::TypeScript},  {"tsx", LanguageId::TypeScript},
      {"json", LanguageId::Json},      {"md", LanguageId::Markdown},
      {"markdown", LanguageId::Markdown}, {"sh", LanguageId::Shell},
      {"bash", LanguageId::Shell},     {"zsh", LanguageId::Shell},
      {"cmake", LanguageId::CMake},    {"html", LanguageId::Html},
      {"htm", LanguageId::Html},       {"xml", LanguageId::Html},
      {"css", LanguageId::Css},        {"qss", LanguageId::Css},
      {"yaml", LanguageId::Yaml},      {"yml", LanguageId::Yaml},
      {"rs", LanguageId::Rust},        {"go", LanguageId::Go},
      {"java", LanguageId::Java},      {"ini", LanguageId::Ini},
      {"cfg", LanguageId::Ini},        {"conf", LanguageId::Ini},
      {"toml", LanguageId::Ini}};
  return table;
}

const std::unordered_map<std::string, LanguageId> &fileNameTable() {
  static const std::unordered_map<std::string, LanguageId> table = {
      {"cmakelists.txt", LanguageId::CMake}, {"makefile", LanguageId::Shell},
      {"gnumakefile", LanguageId::Shell},    {".bashrc", LanguageId::Shell},
      {".bash_profile", LanguageId::Shell},  {".profile", LanguageId::Shell},
      {".zshrc", LanguageId::Shell},         {".gitconfig", LanguageId::Ini},
      {".editorconfig", LanguageId::Ini}};
  return table;
}

} // namespace

LanguageId detectLanguage(std::string_view fileName) {
  const std::string name = toLower(baseName(fileName));
  if (name.empty()) {
    return LanguageId::PlainText;
  }

  const auto &names = fileNameTable();
  if (auto it = names.find(name); it != names.end()) {
    return it->second;
  }

  const auto dot = name.find_last_of('.');
  if (dot == std::string::npos || dot + 1 >= name.size()) {
    return LanguageId::PlainText;
  }

  const auto &extensions = extensionTable();
  if (auto it = extensions.find(name.substr(dot + 1)); it != extensions.end()) {
    return it->second;
  }
  return LanguageId::PlainText;
}

const char *languageDisplayName(LanguageId id) { return languageSpec(id).displayName.c_str(); }

const LanguageSpec &languageSpec(LanguageId id) {
  static const std::unordered_map<LanguageId, LanguageSpec> specs = {
      {LanguageId::PlainText, makePlainText()}, {LanguageId::Python, makePython()},
      {LanguageId::Cpp, makeCpp()},             {LanguageId::C, makeC()},
      {LanguageId::JavaScript, makeJavaScript()}, {LanguageId::TypeScript, makeTypeScript()},
      {LanguageId::Json, makeJson()},           {LanguageId::Markdown, makeMarkdown()},
      {LanguageId::Shell, makeShell()},         {LanguageId::CMake, makeCMake()},
      {LanguageId::Html, makeHtml()},           {LanguageId::Css, makeCss()},
      {LanguageId::Yaml, makeYaml()},           {LanguageId::Rust, makeRust()},
      {LanguageId::Go, makeGo()},               {LanguageId::Java, makeJava()},
      {LanguageId::Ini, makeIni()}};

  auto it = specs.find(id);
  if (it == specs.end()) {
    return specs.at(LanguageId::PlainText);
  }
  return it->second;
}

} // namespace McpIDE::editor
