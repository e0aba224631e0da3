#include "search/TranspositionTable.hpp"

#include "search/Exceptions.hpp"
#include "util/Asserts.hpp"
#include "util/BoostUtil.hpp"
#include "util/Exception.hpp"
#include "util/FileUtil.hpp"
#include "util/LoggingUtil.hpp"

#include <boost/crc.hpp>
#include <boost/filesystem.hpp>

#include <algorithm>
#include <cstring>
#include <fstream>
#include <memory>

namespace search {

const char* bound_kind_to_str(BoundKind kind) {
  switch (kind) {
    case kExact:
      return "exact";
    case kLowerBound:
      return "lower";
    case kUpperBound:
      return "upper";
    default:
      return "?";
  }
}

TranspositionTable::TranspositionTable(const Params& params, const dc3::Geometry& geometry)
    : params_(params), geometry_(geometry), shards_(std::max(1, params.num_shards)) {
  RELEASE_ASSERT(params.flush_threshold > 0, "flush_threshold must be positive ({})",
                 params.flush_threshold);
  load();
}

TranspositionTable::~TranspositionTable() {
  if (dirty_count_ > 0) flush();
}

std::optional<TranspositionTable::Entry> TranspositionTable::lookup(
  fingerprint_t fingerprint) const {
  lookups_++;
  Shard& shard = shard_of(fingerprint);
  std::shared_lock lock(shard.mutex);
  auto it = shard.map.find(fingerprint);
  if (it == shard.map.end()) return std::nullopt;
  hits_++;
  return it->second;
}

bool TranspositionTable::store(fingerprint_t fingerprint, dc3::score_t score, int depth,
                               dc3::Move best_move, BoundKind bound) {
  RELEASE_ASSERT(depth >= 0 && depth <= kMaxDepth, "Invalid depth {}", depth);
  {
    Shard& shard = shard_of(fingerprint);
    std::unique_lock lock(shard.mutex);
    Entry& entry = shard.map[fingerprint];
    if (depth < entry.depth) {
      rejected_stores_++;
      return false;
    }
    entry.score = score;
    entry.depth = depth;
    entry.best_move = best_move;
    entry.bound = bound;
    mark_dirty(shard, fingerprint);
  }
  stores_++;
  maybe_auto_flush();
  return true;
}

void TranspositionTable::bias(fingerprint_t fingerprint, dc3::score_t delta) {
  {
    Shard& shard = shard_of(fingerprint);
    std::unique_lock lock(shard.mutex);
    Entry& entry = shard.map[fingerprint];
    entry.bias = std::clamp(entry.bias + delta, -kMaxBias, kMaxBias);
    mark_dirty(shard, fingerprint);
  }
  biases_++;
  maybe_auto_flush();
}

void TranspositionTable::mark_dirty(Shard& shard, fingerprint_t fingerprint) {
  if (shard.dirty.insert(fingerprint).second) {
    dirty_count_++;
  }
}

void TranspositionTable::maybe_auto_flush() {
  if (dirty_count_ >= params_.flush_threshold) {
    flush();
  }
}

void TranspositionTable::flush() {
  std::unique_lock file_lock(file_mutex_);

  std::vector<JournalRecord> records;
  for (Shard& shard : shards_) {
    std::unique_lock lock(shard.mutex);
    for (fingerprint_t fingerprint : shard.dirty) {
      auto it = shard.map.find(fingerprint);
      if (it != shard.map.end()) {
        records.push_back(encode_record(fingerprint, it->second));
      }
    }
    dirty_count_ -= int(shard.dirty.size());
    shard.dirty.clear();
  }

  if (!persistent_ || records.empty()) return;

  try {
    size_t live = std::max<size_t>(size(), 1);
    bool exists = boost::filesystem::exists(params_.filename);
    if (!exists || needs_compaction_ ||
        journal_records_ + records.size() > params_.compaction_ratio * live) {
      compact();
    } else {
      append(records);
    }
    flushes_++;
    LOG_DEBUG("Flushed {} transposition-table records to {} (journal: {} records)",
              records.size(), params_.filename, journal_records_);
  } catch (const util::Exception& e) {
    disable_persistence(e, "flush");
  } catch (const boost::filesystem::filesystem_error& e) {
    disable_persistence(e, "flush");
  }
}

void TranspositionTable::append(const std::vector<JournalRecord>& records) {
  std::ofstream output_file(params_.filename, std::ios::binary | std::ios::app);
  if (!output_file.is_open()) {
    throw StorageUnavailable("Unable to open {} for appending", params_.filename);
  }
  output_file.write(reinterpret_cast<const char*>(records.data()),
                    records.size() * sizeof(JournalRecord));
  output_file.flush();
  if (!output_file.good()) {
    throw StorageUnavailable("Failed to append to {}", params_.filename);
  }
  journal_records_ += records.size();
}

void TranspositionTable::compact() {
  JournalHeader header;
  header.geometry_id = geometry_.id();

  snapshot_t entries = snapshot();

  std::string buffer(sizeof(header) + entries.size() * sizeof(JournalRecord), '\0');
  std::memcpy(buffer.data(), &header, sizeof(header));
  char* out = buffer.data() + sizeof(header);
  for (const auto& [fingerprint, entry] : entries) {
    JournalRecord record = encode_record(fingerprint, entry);
    std::memcpy(out, &record, sizeof(record));
    out += sizeof(record);
  }

  boost_util::atomic_write_file(buffer, params_.filename);
  journal_records_ = entries.size();
  needs_compaction_ = false;
}

void TranspositionTable::load() {
  std::unique_lock file_lock(file_mutex_);

  clear();
  persistent_ = !params_.filename.empty();
  journal_records_ = 0;
  needs_compaction_ = false;
  if (!persistent_) return;

  try {
    load_helper();
  } catch (const util::Exception& e) {
    clear();
    disable_persistence(e, "load");
  } catch (const boost::filesystem::filesystem_error& e) {
    clear();
    disable_persistence(e, "load");
  }
}

void TranspositionTable::load_helper() {
  namespace bf = boost::filesystem;

  if (!bf::exists(params_.filename)) {
    LOG_INFO("No transposition table at {}, starting empty", params_.filename);
    return;
  }

  size_t file_size = 0;
  std::unique_ptr<char[]> buffer;
  try {
    buffer.reset(util::read_file(params_.filename.c_str(), &file_size));
  } catch (const util::Exception& e) {
    throw StorageUnavailable("{}", e.what());
  }

  if (file_size == 0) return;
  replay(buffer.get(), file_size);

  LOG_INFO("Loaded {} transposition-table entries from {} ({} records, {} corrupt)", size(),
           params_.filename, journal_records_, corrupt_records_.load());
}

void TranspositionTable::replay(const char* data, size_t size) {
  if (size < sizeof(JournalHeader)) {
    throw StorageUnavailable("{} is too short to hold a header", params_.filename);
  }

  JournalHeader header;
  std::memcpy(&header, data, sizeof(header));
  if (std::memcmp(header.magic, "DC3T", 4) != 0) {
    throw StorageUnavailable("{} is not a transposition table file", params_.filename);
  }
  if (header.version != kVersion) {
    throw StorageUnavailable("{} has unsupported version {}", params_.filename, header.version);
  }
  if (header.geometry_id != geometry_.id()) {
    throw StorageUnavailable("{} was written for another board geometry ({} != {})",
                             params_.filename, header.geometry_id, geometry_.id());
  }

  size_t payload = size - sizeof(JournalHeader);
  size_t n = payload / sizeof(JournalRecord);
  if (payload % sizeof(JournalRecord)) {
    truncated_records_++;
    needs_compaction_ = true;
    LOG_WARN("Dropping truncated final record of {}", params_.filename);
  }

  const char* p = data + sizeof(JournalHeader);
  for (size_t i = 0; i < n; ++i, p += sizeof(JournalRecord)) {
    JournalRecord record;
    std::memcpy(&record, p, sizeof(record));
    try {
      Entry entry = decode_record(record);
      Shard& shard = shard_of(record.fingerprint);
      std::unique_lock lock(shard.mutex);
      shard.map[record.fingerprint] = entry;
    } catch (const CorruptEntry& e) {
      corrupt_records_++;
      LOG_WARN("Discarding record {} of {}: {}", i, params_.filename, e.what());
    }
  }
  journal_records_ = n;
}

TranspositionTable::Entry TranspositionTable::decode_record(const JournalRecord& record) const {
  if (checksum(record) != record.crc) {
    throw CorruptEntry("checksum mismatch for fingerprint {:016x}", record.fingerprint);
  }
  if (record.bound > kUpperBound) {
    throw CorruptEntry("unknown bound kind {}", record.bound);
  }
  if (record.depth < -1 || record.depth > kMaxDepth) {
    throw CorruptEntry("depth {} out of range", record.depth);
  }
  if (record.score < -dc3::kInfinity || record.score > dc3::kInfinity) {
    throw CorruptEntry("score {} out of range", record.score);
  }
  if (record.bias < -kMaxBias || record.bias > kMaxBias) {
    throw CorruptEntry("bias {} out of range", record.bias);
  }

  if (record.move != dc3::Move::kNullEncoding) {
    int n = geometry_.num_cells();
    int src = record.move >> 8;
    int dst = record.move & 0xFF;
    if (src >= n || dst >= n || !(geometry_.neighbors(src) & (dc3::mask_t(1) << dst))) {
      throw CorruptEntry("invalid move encoding {:04x}", record.move);
    }
  }
  dc3::Move move = dc3::Move::decode(record.move);

  Entry entry;
  entry.score = record.score;
  entry.bias = record.bias;
  entry.depth = record.depth;
  entry.best_move = move;
  entry.bound = BoundKind(record.bound);
  return entry;
}

TranspositionTable::JournalRecord TranspositionTable::encode_record(fingerprint_t fingerprint,
                                                                    const Entry& entry) {
  JournalRecord record;
  record.fingerprint = fingerprint;
  record.score = entry.score;
  record.bias = entry.bias;
  record.move = entry.best_move.encode();
  record.depth = entry.depth;
  record.bound = entry.bound;
  record.flags = entry.bias_only() ? 1 : 0;
  record.crc = checksum(record);
  return record;
}

uint32_t TranspositionTable::checksum(const JournalRecord& record) {
  boost::crc_32_type crc;
  crc.process_bytes(&record, offsetof(JournalRecord, crc));
  return crc.checksum();
}

void TranspositionTable::disable_persistence(const std::exception& e, const char* action) {
  persistent_ = false;
  LOG_WARN("Transposition table {} failed, continuing in memory only: {}", action, e.what());
}

size_t TranspositionTable::size() const {
  size_t n = 0;
  for (const Shard& shard : shards_) {
    std::shared_lock lock(shard.mutex);
    n += shard.map.size();
  }
  return n;
}

void TranspositionTable::clear() {
  for (Shard& shard : shards_) {
    std::unique_lock lock(shard.mutex);
    dirty_count_ -= int(shard.dirty.size());
    shard.map.clear();
    shard.dirty.clear();
  }
}

TranspositionTable::snapshot_t TranspositionTable::snapshot() const {
  snapshot_t out;
  for (const Shard& shard : shards_) {
    std::shared_lock lock(shard.mutex);
    out.insert(out.end(), shard.map.begin(), shard.map.end());
  }
  std::sort(out.begin(), out.end(),
            [](const auto& a, const auto& b) { return a.first < b.first; });
  return out;
}

TranspositionTable::Stats TranspositionTable::stats() const {
  Stats s;
  s.lookups = lookups_;
  s.hits = hits_;
  s.stores = stores_;
  s.rejected_stores = rejected_stores_;
  s.biases = biases_;
  s.flushes = flushes_;
  s.corrupt_records = corrupt_records_;
  s.truncated_records = truncated_records_;
  return s;
}

}  // namespace search
