#ifndef LANGUAGE_REGISTRY_HPP
#define LANGUAGE_REGISTRY_HPP

#include <map>
#include <stdexcept>
#include <string>
#include <vector>

#include "proto/language.pb.h"

namespace language {

class unsupported_language : public std::runtime_error {
 public:
  explicit unsupported_language(const std::string& id)
      : std::runtime_error("Language '" + id + "' is not supported") {}
};

// Catalog of the supported languages. It is filled before any request is
// served and only read afterwards.
class Registry {
 public:
  // A registry with the built-in catalog.
  Registry();
  explicit Registry(const std::vector<proto::LanguageConfig>& languages);

  // Loads a text-format proto::LanguageCatalog into the registry. Its
  // "language" entries with a known id are merged field by field, so they
  // cannot clear a built-in field; "replacement" entries take the place of
  // the built-in entry as a whole. Unknown ids are added. Throws
  // std::runtime_error if the file cannot be read or parsed.
  void LoadOverrides(const std::string& path);
  void Add(proto::LanguageConfig config);

  // Returns nullptr if the language is not known.
  const proto::LanguageConfig* Find(const std::string& id) const;
  // Throws unsupported_language if the language is not known.
  const proto::LanguageConfig& Resolve(const std::string& id) const;

  // All languages, sorted by id.
  std::vector<const proto::LanguageConfig*> List() const;

  Registry(const Registry&) = delete;
  Registry& operator=(const Registry&) = delete;

 private:
  std::map<std::string, proto::LanguageConfig> languages_;
};

// File name of the source inside the sandbox, e.g. "code.py".
std::string SourceFileName(const proto::LanguageConfig& config);

// Returns the code as it must be written into the sandbox. For languages
// with rename_public_class set, every "public class X" becomes
// "public class <source name>".
std::string PrepareSource(const proto::LanguageConfig& config,
                          const std::string& code);

// Substitutes {source}, {dir} and {name} with data from the registry, and
// {args} with "$@". The result is meant to be run with `sh -c`, with the
// arguments of the program as positional parameters.
std::string ExpandCommand(const std::string& command_template,
                          const proto::LanguageConfig& config,
                          const std::string& dir);

}  // namespace language

#endif
