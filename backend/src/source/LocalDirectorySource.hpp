#pragma once

#include "engine/ClientPool.hpp"
#include "engine/Collaborators.hpp"

#include <cstddef>
#include <filesystem>
#include <string>
#include <system_error>

namespace tf::source
{

// Connection-like handle onto one local directory. Stateless apart from the
// root, but pooled so the local source behaves like a remote one.
class LocalDirectoryClient
{
  public:
    explicit LocalDirectoryClient(std::filesystem::path root);

    // Regular files directly under the root. Subdirectories are ignored.
    engine::ListResult list() const;
    engine::RetrieveResult read(std::string const &name) const;

    std::filesystem::path const &root() const noexcept { return root_; }

  private:
    std::filesystem::path root_;
};

class LocalDirectorySource : public engine::SnapshotProvider,
                             public engine::ContentRetriever
{
  public:
    LocalDirectorySource(std::filesystem::path root, std::size_t pool_size);

    engine::ListResult list() override;
    engine::RetrieveResult retrieve(std::string const &name) override;

    engine::ClientPool<LocalDirectoryClient> &pool() noexcept { return pool_; }

  private:
    std::filesystem::path root_;
    engine::ClientPool<LocalDirectoryClient> pool_;
};

// Entry names must stay inside the polled directory.
bool is_safe_entry_name(std::string const &name);

// Turns a directory walk into a ListResult. A walk that ended on `ec` is a
// failure even though some entries were collected.
engine::ListResult finish_listing(std::filesystem::path const &root,
                                  engine::Snapshot snapshot,
                                  std::error_code const &ec);

} // namespace tf::source
