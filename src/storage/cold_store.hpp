// File: src/storage/cold_store.hpp
#pragma once

#include "core/pattern.hpp"
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <sqlite3.h>

namespace patex {

/// Tier 3: unbounded, best-effort durable pattern store
class IColdStore {
public:
    virtual ~IColdStore() = default;

    /// Persist synchronously
    /// @throws PatternError(SERIALIZATION_FAILED) if the record cannot be made durable
    virtual void Write(const Pattern& pattern) = 0;

    virtual std::optional<Pattern> Read(PatternID id) const = 0;
    virtual bool Contains(PatternID id) const = 0;
    virtual size_t Count() const = 0;
    virtual void Clear() = 0;
};

/// YAML document {patterns: {id: record}} rewritten in full on every write.
///
/// Rewrites go to "<path>.tmp" and are renamed over the old file. An empty
/// path keeps records in memory only.
class FileColdStore : public IColdStore {
public:
    struct Config {
        std::string path;
    };

    /// Loads an existing file; a missing or unreadable file starts empty
    explicit FileColdStore(const Config& config);

    void Write(const Pattern& pattern) override;
    std::optional<Pattern> Read(PatternID id) const override;
    bool Contains(PatternID id) const override;
    size_t Count() const override;
    void Clear() override;

private:
    void Load();
    bool SaveLocked() const;

    Config config_;
    std::map<PatternID, Pattern> records_;
    mutable std::mutex mutex_;
};

/// One row per pattern holding the same textual record
class SqliteColdStore : public IColdStore {
public:
    struct Config {
        std::string db_path;

        /// Enable Write-Ahead Logging
        bool enable_wal{true};

        /// Synchronous mode: FULL, NORMAL, or OFF
        std::string synchronous{"FULL"};
    };

    /// @throws std::runtime_error if the database cannot be opened or initialised
    explicit SqliteColdStore(const Config& config);
    ~SqliteColdStore() override;

    SqliteColdStore(const SqliteColdStore&) = delete;
    SqliteColdStore& operator=(const SqliteColdStore&) = delete;

    void Write(const Pattern& pattern) override;
    std::optional<Pattern> Read(PatternID id) const override;
    bool Contains(PatternID id) const override;
    size_t Count() const override;
    void Clear() override;

private:
    bool ExecuteSQL(const std::string& sql);

    Config config_;
    sqlite3* db_{nullptr};
    mutable std::mutex mutex_;
};

} // namespace patex
