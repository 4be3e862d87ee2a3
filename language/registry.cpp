#include "language/registry.hpp"

#include <fstream>
#include <sstream>

#include "absl/strings/ascii.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_replace.h"
#include "glog/logging.h"
#include "google/protobuf/text_format.h"

namespace language {

namespace {

const constexpr int64_t kMiB = 1024 * 1024;
const char* const kDefaultSourceName = "code";

proto::LanguageConfig Interpreted(const std::string& id,
                                  const std::string& display_name,
                                  const std::string& image,
                                  const std::string& extension,
                                  const std::string& run, int64_t timeout_ms,
                                  int64_t memory_mib, float cpu_limit) {
  proto::LanguageConfig config;
  config.set_id(id);
  config.set_display_name(display_name);
  config.set_image(image);
  config.set_file_extension(extension);
  config.set_run_command(run);
  config.set_timeout_ms(timeout_ms);
  config.set_memory_limit_bytes(memory_mib * kMiB);
  config.set_cpu_limit(cpu_limit);
  config.set_pids_limit(64);
  config.set_max_files(64);
  return config;
}

proto::LanguageConfig Compiled(const std::string& id,
                               const std::string& display_name,
                               const std::string& image,
                               const std::string& extension,
                               const std::string& compile,
                               const std::string& run, int64_t timeout_ms,
                               int64_t memory_mib, float cpu_limit) {
  proto::LanguageConfig config = Interpreted(
      id, display_name, image, extension, run, timeout_ms, memory_mib,
      cpu_limit);
  config.set_compile_command(compile);
  return config;
}

std::vector<proto::LanguageConfig> BuiltinLanguages() {
  std::vector<proto::LanguageConfig> languages = {
      Interpreted("javascript", "JavaScript", "node:18-alpine", ".js",
                  "node {source} {args}", 10000, 128, 0.5),
      Interpreted("python", "Python", "python:3.11-alpine", ".py",
                  "python {source} {args}", 10000, 128, 0.5),
      Interpreted("ruby", "Ruby", "ruby:3.2-alpine", ".rb",
                  "ruby {source} {args}", 10000, 128, 0.5),
      Interpreted("php", "PHP", "php:8.2-cli-alpine", ".php",
                  "php {source} {args}", 10000, 128, 0.5),
      Interpreted("shell", "Shell", "alpine:latest", ".sh",
                  "sh {source} {args}", 5000, 64, 0.25),
      Interpreted("perl", "Perl", "perl:5.38-slim", ".pl",
                  "perl {source} {args}", 10000, 128, 0.5),
      Interpreted("lua", "Lua", "nickblah/lua:5.4-alpine", ".lua",
                  "lua {source} {args}", 10000, 128, 0.5),
      Interpreted("r", "R", "r-base:4.3.2", ".r", "Rscript {source} {args}",
                  15000, 256, 0.75),
      Interpreted("dart", "Dart", "dart:stable", ".dart",
                  "dart run {source} {args}", 15000, 256, 0.75),
      Interpreted("elixir", "Elixir", "elixir:1.15-alpine", ".exs",
                  "elixir {source} {args}", 15000, 256, 0.75),
      Compiled("c", "C", "gcc:latest", ".c",
               "gcc -O2 -o {dir}/program {source} -lm", "{dir}/program {args}",
               15000, 256, 0.75),
      Compiled("cpp", "C++", "gcc:latest", ".cpp",
               "g++ -std=c++17 -O2 -o {dir}/program {source}",
               "{dir}/program {args}", 15000, 256, 0.75),
      Compiled("java", "Java", "eclipse-temurin:17-jdk-alpine", ".java",
               "javac -d {dir} {source}", "java -cp {dir} Main {args}", 20000,
               512, 1.0),
      Compiled("go", "Go", "golang:1.21-alpine", ".go",
               "go build -o {dir}/program {source}", "{dir}/program {args}",
               15000, 256, 0.75),
      Compiled("rust", "Rust", "rust:1.75-alpine", ".rs",
               "rustc -o {dir}/program {source}", "{dir}/program {args}",
               20000, 512, 1.0),
      Compiled("csharp", "C#", "mono:6.12", ".cs",
               "mcs -out:{dir}/program.exe {source}",
               "mono {dir}/program.exe {args}", 20000, 512, 1.0),
      // Deno runs TypeScript as is; its cache goes to the writable sandbox.
      Interpreted("typescript", "TypeScript", "denoland/deno:alpine-1.40.2",
                  ".ts",
                  "DENO_DIR={dir}/.deno deno run --quiet --no-prompt {source} "
                  "{args}",
                  15000, 256, 0.75),
      Compiled("kotlin", "Kotlin", "zenika/kotlin:1.9-jdk17-alpine", ".kt",
               "kotlinc {source} -include-runtime -d {dir}/program.jar",
               "java -jar {dir}/program.jar {args}", 20000, 512, 1.0),
      Compiled("scala", "Scala", "hseeberger/scala-sbt:17.0.2_1.6.2_2.13.8",
               ".scala", "scalac -d {dir} {source}",
               "scala -cp {dir} Main {args}", 25000, 512, 1.0),
      Compiled("swift", "Swift", "swift:5.9-focal", ".swift",
               "swiftc -o {dir}/program {source}", "{dir}/program {args}",
               20000, 512, 1.0),
      Compiled("haskell", "Haskell", "haskell:9.4", ".hs",
               "ghc -o {dir}/program {source}", "{dir}/program {args}", 20000,
               512, 1.0),
      Compiled("ocaml", "OCaml", "ocaml/opam:alpine", ".ml",
               "ocamlc -o {dir}/program {source}", "{dir}/program {args}",
               15000, 256, 0.75),
  };
  for (proto::LanguageConfig& config : languages) {
    if (config.id() == "java") {
      config.set_source_name("Main");
      config.set_rename_public_class(true);
    }
    // The Go toolchain spawns many processes and opens many files.
    if (config.id() == "go") {
      config.set_pids_limit(128);
      config.set_max_files(256);
    }
  }
  return languages;
}

const std::string& SourceName(const proto::LanguageConfig& config) {
  static const std::string default_name = kDefaultSourceName;
  return config.source_name().empty() ? default_name : config.source_name();
}

// Skips the characters of s matching pred starting from pos, and returns the
// first position that does not match.
template <typename Pred>
size_t SkipWhile(const std::string& s, size_t pos, Pred pred) {
  while (pos < s.size() && pred(s[pos])) pos++;
  return pos;
}

bool IsSpace(char c) { return absl::ascii_isspace(c); }
bool IsWordChar(char c) { return absl::ascii_isalnum(c) || c == '_'; }

// Returns the end of the "public class X" starting at pos, or
// std::string::npos if there is none.
size_t PublicClassEnd(const std::string& code, size_t pos) {
  static const std::string kPublic = "public";
  static const std::string kClass = "class";
  size_t end = pos + kPublic.size();
  size_t next = SkipWhile(code, end, IsSpace);
  if (next == end || code.compare(next, kClass.size(), kClass) != 0) {
    return std::string::npos;
  }
  end = next + kClass.size();
  next = SkipWhile(code, end, IsSpace);
  if (next == end) return std::string::npos;
  end = SkipWhile(code, next, IsWordChar);
  if (end == next) return std::string::npos;
  return end;
}

}  // namespace

Registry::Registry() : Registry(BuiltinLanguages()) {}

Registry::Registry(const std::vector<proto::LanguageConfig>& languages) {
  for (const proto::LanguageConfig& config : languages) Add(config);
}

void Registry::Add(proto::LanguageConfig config) {
  if (config.id().empty()) {
    throw std::invalid_argument("Language without id");
  }
  if (config.image().empty() || config.run_command().empty()) {
    throw std::invalid_argument("Language " + config.id() +
                                " needs an image and a run command");
  }
  if (config.timeout_ms() <= 0) {
    throw std::invalid_argument("Language " + config.id() +
                                " needs a positive timeout");
  }
  // Sandboxes never get network access and never run as root.
  config.set_network_disabled(true);
  config.set_run_as_non_root(true);
  if (config.display_name().empty()) config.set_display_name(config.id());
  languages_[config.id()] = std::move(config);
}

void Registry::LoadOverrides(const std::string& path) {
  std::ifstream in(path);
  if (!in) throw std::runtime_error("Cannot open languages file " + path);
  std::stringstream contents;
  contents << in.rdbuf();
  proto::LanguageCatalog catalog;
  if (!google::protobuf::TextFormat::ParseFromString(contents.str(),
                                                     &catalog)) {
    throw std::runtime_error("Cannot parse languages file " + path);
  }
  for (const proto::LanguageConfig& entry : catalog.replacement()) {
    LOG(INFO) << "Replacing language " << entry.id() << " from " << path;
    proto::LanguageConfig config = entry;
    if (config.pids_limit() == 0) config.set_pids_limit(64);
    if (config.max_files() == 0) config.set_max_files(64);
    Add(std::move(config));
  }
  for (const proto::LanguageConfig& entry : catalog.language()) {
    auto it = languages_.find(entry.id());
    if (it == languages_.end()) {
      LOG(INFO) << "Adding language " << entry.id() << " from " << path;
      proto::LanguageConfig config = entry;
      if (config.pids_limit() == 0) config.set_pids_limit(64);
      if (config.max_files() == 0) config.set_max_files(64);
      Add(std::move(config));
    } else {
      LOG(INFO) << "Overriding language " << entry.id() << " from " << path;
      proto::LanguageConfig config = it->second;
      config.MergeFrom(entry);
      Add(std::move(config));
    }
  }
}

const proto::LanguageConfig* Registry::Find(const std::string& id) const {
  auto it = languages_.find(id);
  if (it == languages_.end()) return nullptr;
  return &it->second;
}

const proto::LanguageConfig& Registry::Resolve(const std::string& id) const {
  const proto::LanguageConfig* config = Find(id);
  if (config == nullptr) throw unsupported_language(id);
  return *config;
}

std::vector<const proto::LanguageConfig*> Registry::List() const {
  std::vector<const proto::LanguageConfig*> list;
  for (const auto& kv : languages_) list.push_back(&kv.second);
  return list;
}

std::string SourceFileName(const proto::LanguageConfig& config) {
  return SourceName(config) + config.file_extension();
}

std::string PrepareSource(const proto::LanguageConfig& config,
                          const std::string& code) {
  if (!config.rename_public_class()) return code;
  const std::string replacement =
      absl::StrCat("public class ", SourceName(config));
  std::string result;
  size_t pos = 0;
  for (size_t found = code.find("public"); found != std::string::npos;
       found = code.find("public", found + 1)) {
    if (found < pos) continue;
    size_t end = PublicClassEnd(code, found);
    if (end == std::string::npos) continue;
    result.append(code, pos, found - pos);
    result += replacement;
    pos = end;
  }
  result.append(code, pos, std::string::npos);
  return result;
}

std::string ExpandCommand(const std::string& command_template,
                          const proto::LanguageConfig& config,
                          const std::string& dir) {
  return absl::StrReplaceAll(
      command_template,
      {{"{source}", absl::StrCat(dir, "/", SourceFileName(config))},
       {"{dir}", dir},
       {"{name}", SourceName(config)},
       {"{args}", "\"$@\""}});
}

}  // namespace language
