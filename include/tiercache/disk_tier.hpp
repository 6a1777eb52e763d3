#pragma once

#include "tiercache/record.hpp"
#include "tiercache/tier_store.hpp"

#include <condition_variable>
#include <filesystem>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace tiercache {

struct DiskTierConfig {
  bool enabled{true};
  std::string dir{"data/cache"};
  std::optional<Ttl> default_ttl{Ttl(86400LL * 1000)};
  std::chrono::milliseconds sweep_interval{300 * 1000};
};

struct DiskTierStats {
  std::uint64_t sweeps{0};
  std::uint64_t swept{0};
};

// L3: one value file and one metadata sidecar per key, plus one index file
// per tag, all under cfg.dir:
//   data/<h>.bin   value envelope
//   meta/<h>.meta  key, tags, access counters, absolute expiry
//   tags/<t>.tag   keys carrying the tag
// <h> and <t> are the FNV-1a 64 hex digests of the key and tag. Files are
// replaced via tmp + rename. A crash between files can leave a stale tag
// index entry or an orphan data file; both read as absent.
class DiskTier final : public TierStore {
public:
  explicit DiskTier(DiskTierConfig cfg);
  ~DiskTier() override;

  DiskTier(const DiskTier &) = delete;
  DiskTier &operator=(const DiskTier &) = delete;

  // Creates the directory layout and starts the sweep thread. A zero sweep
  // interval disables the thread; sweep_expired() still works.
  bool init(std::string *err = nullptr);
  void stop() override;

  Tier tier() const override { return Tier::L3; }
  std::optional<Ttl> default_ttl() const override { return cfg_.default_ttl; }

  std::optional<CacheEntry> get(const std::string &key,
                                std::string *err = nullptr) override;
  bool set(const std::string &key, const Bytes &value, std::optional<Ttl> ttl,
           const TagSet &tags, std::string *err = nullptr) override;
  bool del(const std::string &key, std::string *err = nullptr) override;
  std::size_t invalidate_by_tag(const std::string &tag,
                                std::string *err = nullptr) override;
  std::size_t invalidate_by_prefix(const std::string &prefix,
                                   std::string *err = nullptr) override;
  bool clear(std::string *err = nullptr) override;

  // Removes every entry whose expiry has passed. Returns the count.
  std::size_t sweep_expired();

  bool sweeping() const;
  DiskTierStats stats() const;

  std::filesystem::path data_path(const std::string &key) const;
  std::filesystem::path meta_path(const std::string &key) const;
  std::filesystem::path tag_path(const std::string &tag) const;

private:
  enum class MetaRead { Found, Missing, Corrupt };

  MetaRead read_meta_locked(const std::filesystem::path &path, EntryMeta *out,
                            std::string *err) const;
  bool remove_entry_locked(const std::string &key, const EntryMeta &meta,
                           std::string *err);
  bool add_to_tag_locked(const std::string &tag, const std::string &key,
                         std::string *err);
  bool remove_from_tag_locked(const std::string &tag, const std::string &key,
                              std::string *err);
  bool read_tag_locked(const std::string &tag, std::vector<std::string> *keys,
                       std::string *err) const;
  std::vector<std::filesystem::path> list_meta_files_locked(
      std::string *err) const;
  void sweep_loop();
  bool stop_requested();

  DiskTierConfig cfg_;
  std::filesystem::path root_;
  DiskTierStats stats_;
  mutable std::mutex mu_;

  std::thread sweeper_;
  std::mutex sweep_mu_;
  std::condition_variable sweep_cv_;
  bool stopping_{false};
};

} // namespace tiercache
