#include "codenav/core/language_registry.hpp"

#include <algorithm>

#include "codenav/utils/path_utils.hpp"

namespace codenav::core {

LanguageRegistry::LanguageRegistry(std::vector<LanguageDefinition> languages)
    : languages_(std::move(languages)) {
}

auto LanguageRegistry::Find(std::string_view name) const
    -> const LanguageDefinition* {
  auto it = std::ranges::find_if(
      languages_, [name](const auto& language) { return language.name == name; });
  return it == languages_.end() ? nullptr : &*it;
}

auto LanguageRegistry::LanguageForFile(const CanonicalPath& path) const
    -> std::optional<std::string> {
  for (const auto& language : languages_) {
    if (HasExtension(path.Path(), language.extensions)) {
      return language.name;
    }
  }
  return std::nullopt;
}

auto LanguageRegistry::Names() const -> std::vector<std::string> {
  std::vector<std::string> names;
  names.reserve(languages_.size());
  for (const auto& language : languages_) {
    names.push_back(language.name);
  }
  return names;
}

auto LanguageRegistry::AllExtensions() const -> std::vector<std::string> {
  std::vector<std::string> extensions;
  for (const auto& language : languages_) {
    extensions.insert(
        extensions.end(), language.extensions.begin(),
        language.extensions.end());
  }
  return extensions;
}

auto LanguageRegistry::MakeServerConfig(
    const LanguageDefinition& language, const CanonicalPath& root,
    const ServerTimeouts& timeouts) const -> client::LanguageServerConfig {
  std::filesystem::path working_directory = root.Path();
  if (!language.working_directory.empty()) {
    std::filesystem::path configured(language.working_directory);
    working_directory =
        configured.is_absolute() ? configured : root.Path() / configured;
  }

  return client::LanguageServerConfig{
      .language = language.name,
      .launch =
          client::LaunchDescriptor{
              .command = language.command,
              .args = language.args,
              .working_directory = working_directory,
          },
      .max_concurrent_requests = language.max_concurrent_requests,
      .initialization_options = language.initialization_options,
      .request_timeout = timeouts.request_timeout,
      .startup_timeout = timeouts.startup_timeout,
      .shutdown_grace = timeouts.shutdown_grace,
  };
}

}  // namespace codenav::core
