#pragma once

#include "dc3/Constants.hpp"
#include "dc3/Geometry.hpp"
#include "dc3/Move.hpp"

#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace search {

enum BoundKind : uint8_t { kExact = 0, kLowerBound = 1, kUpperBound = 2 };

const char* bound_kind_to_str(BoundKind kind);

/*
 * Persistent map from position fingerprint to the best known search result at that position.
 *
 * The table is shared by every engine in a process and is the only object that mutates its
 * entries. It is split into shards keyed by fingerprint: lookup() copies an entry out under a
 * shared lock, and store()/bias() take the shard's exclusive lock, so the depth-priority rule is
 * applied inside the same critical section as the write.
 *
 * Durability is an append-only journal:
 *
 *   JournalHeader (16 bytes), then JournalRecord (32 bytes) per flushed entry state.
 *
 * flush() appends the current state of every entry modified since the last flush; on load the
 * records are replayed in order and the last record for a fingerprint wins. When the journal grows
 * beyond compaction_ratio records per live entry, flush() rewrites the live table to a temporary
 * file and renames it over the journal.
 *
 * Storage faults never propagate. A file that cannot be read or written, or that belongs to another
 * geometry, makes the table fall back to in-memory operation for the rest of the session. Records
 * that fail validation are discarded and counted.
 */
class TranspositionTable {
 public:
  struct Params {
    auto make_options_description();

    std::string filename;  // empty means in-memory only
    int flush_threshold = 4096;
    double compaction_ratio = 4.0;
    int num_shards = 64;
  };

  struct Entry {
    bool operator==(const Entry& other) const = default;
    bool bias_only() const { return depth < 0; }

    dc3::score_t score = 0;
    dc3::score_t bias = 0;
    int16_t depth = -1;  // -1: holds only a bias, no search result
    dc3::Move best_move;
    BoundKind bound = kExact;
  };

  struct Stats {
    uint64_t lookups = 0;
    uint64_t hits = 0;
    uint64_t stores = 0;
    uint64_t rejected_stores = 0;  // shallower than the stored entry
    uint64_t biases = 0;
    uint64_t flushes = 0;
    uint64_t corrupt_records = 0;
    uint64_t truncated_records = 0;
  };

  using fingerprint_t = dc3::fingerprint_t;
  using snapshot_t = std::vector<std::pair<fingerprint_t, Entry>>;

  static constexpr int16_t kMaxDepth = 1000;
  static constexpr dc3::score_t kMaxBias = dc3::kMinWinScore / 2;

  // Loads the journal named by params.filename, if any.
  TranspositionTable(const Params& params, const dc3::Geometry& geometry);

  // Flushes pending writes.
  ~TranspositionTable();

  TranspositionTable(const TranspositionTable&) = delete;
  TranspositionTable& operator=(const TranspositionTable&) = delete;

  std::optional<Entry> lookup(fingerprint_t fingerprint) const;

  /*
   * Records a search result. The write is rejected, and false returned, if the stored entry was
   * searched deeper than depth. An accumulated bias survives the overwrite.
   */
  bool store(fingerprint_t fingerprint, dc3::score_t score, int depth, dc3::Move best_move,
             BoundKind bound);

  /*
   * Adds delta to the bias of the entry, creating a bias-only entry if needed. The accumulated bias
   * is clamped to +/-kMaxBias.
   */
  void bias(fingerprint_t fingerprint, dc3::score_t delta);

  // Appends all modified entries to the journal, compacting it if needed.
  void flush();

  // Discards the in-memory contents and replays the journal.
  void load();

  size_t size() const;
  void clear();

  // All entries, sorted by fingerprint.
  snapshot_t snapshot() const;

  Stats stats() const;
  bool persistent() const { return persistent_; }
  const Params& params() const { return params_; }

 private:
  struct JournalHeader {
    char magic[4] = {'D', 'C', '3', 'T'};
    uint32_t version = kVersion;
    uint32_t geometry_id = 0;
    uint32_t reserved = 0;
  };
  static_assert(sizeof(JournalHeader) == 16);

  struct JournalRecord {
    uint64_t fingerprint;
    int32_t score;
    int32_t bias;
    uint16_t move;
    int16_t depth;
    uint8_t bound;
    uint8_t flags;
    uint16_t reserved = 0;
    uint32_t reserved2 = 0;
    uint32_t crc;  // crc32 of the preceding 28 bytes
  };
  static_assert(sizeof(JournalRecord) == 32);

  struct Shard {
    mutable std::shared_mutex mutex;
    std::unordered_map<fingerprint_t, Entry> map;
    std::unordered_set<fingerprint_t> dirty;
  };

  static constexpr uint32_t kVersion = 1;

  Shard& shard_of(fingerprint_t fingerprint) const {
    return shards_[fingerprint % shards_.size()];
  }

  void mark_dirty(Shard& shard, fingerprint_t fingerprint);
  void maybe_auto_flush();

  void load_helper();
  void replay(const char* data, size_t size);
  Entry decode_record(const JournalRecord& record) const;  // throws CorruptEntry
  static JournalRecord encode_record(fingerprint_t fingerprint, const Entry& entry);
  static uint32_t checksum(const JournalRecord& record);

  void append(const std::vector<JournalRecord>& records);
  void compact();
  void disable_persistence(const std::exception& e, const char* action);

  const Params params_;
  const dc3::Geometry& geometry_;
  mutable std::vector<Shard> shards_;

  std::mutex file_mutex_;  // serializes flush() and load()
  std::atomic<bool> persistent_ = false;
  std::atomic<int> dirty_count_ = 0;
  size_t journal_records_ = 0;
  bool needs_compaction_ = false;  // the journal ends in a partial record

  mutable std::atomic<uint64_t> lookups_ = 0;
  mutable std::atomic<uint64_t> hits_ = 0;
  std::atomic<uint64_t> stores_ = 0;
  std::atomic<uint64_t> rejected_stores_ = 0;
  std::atomic<uint64_t> biases_ = 0;
  std::atomic<uint64_t> flushes_ = 0;
  std::atomic<uint64_t> corrupt_records_ = 0;
  std::atomic<uint64_t> truncated_records_ = 0;
};

}  // namespace search

#include "inline/search/TranspositionTable.inl"
