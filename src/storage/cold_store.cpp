// File: src/storage/cold_store.cpp
#include "storage/cold_store.hpp"
#include "storage/record_format.hpp"
#include "core/errors.hpp"
#include <yaml.h>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <sstream>

namespace patex {

// ============================================================================
// FileColdStore
// ============================================================================

FileColdStore::FileColdStore(const Config& config) : config_(config) {
    if (!config_.path.empty()) {
        Load();
    }
}

void FileColdStore::Load() {
    std::ifstream file(config_.path);
    if (!file.is_open()) {
        return;  // Nothing persisted yet
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    const std::string content = buffer.str();

    yaml_parser_t parser;
    yaml_document_t document;

    if (!yaml_parser_initialize(&parser)) {
        std::cerr << "Failed to initialize YAML parser" << std::endl;
        return;
    }

    yaml_parser_set_input_string(&parser,
        reinterpret_cast<const unsigned char*>(content.c_str()), content.size());

    if (!yaml_parser_load(&parser, &document)) {
        std::cerr << "Cold store " << config_.path << " is not valid YAML, starting empty" << std::endl;
        yaml_parser_delete(&parser);
        return;
    }

    yaml_node_t* root = yaml_document_get_root_node(&document);
    if (root != nullptr && root->type == YAML_MAPPING_NODE) {
        for (yaml_node_pair_t* pair = root->data.mapping.pairs.start;
             pair < root->data.mapping.pairs.top; ++pair) {
            yaml_node_t* key = yaml_document_get_node(&document, pair->key);
            yaml_node_t* value = yaml_document_get_node(&document, pair->value);
            if (key == nullptr || key->type != YAML_SCALAR_NODE ||
                std::string(reinterpret_cast<char*>(key->data.scalar.value),
                            key->data.scalar.length) != "patterns" ||
                value == nullptr || value->type != YAML_MAPPING_NODE) {
                continue;
            }

            for (yaml_node_pair_t* rec = value->data.mapping.pairs.start;
                 rec < value->data.mapping.pairs.top; ++rec) {
                auto pattern = RecordFromNode(&document,
                                              yaml_document_get_node(&document, rec->value));
                if (pattern) {
                    records_[pattern->header.id] = *pattern;
                } else {
                    std::cerr << "Skipping malformed record in " << config_.path << std::endl;
                }
            }
        }
    }

    yaml_document_delete(&document);
    yaml_parser_delete(&parser);
}

bool FileColdStore::SaveLocked() const {
    if (config_.path.empty()) {
        return true;
    }

    const std::string tmp_path = config_.path + ".tmp";
    {
        std::ofstream file(tmp_path, std::ios::trunc);
        if (!file.is_open()) {
            return false;
        }

        file << "# PatEx cold tier\n";
        if (records_.empty()) {
            file << "patterns: {}\n";
        } else {
            file << "patterns:\n";
            for (const auto& entry : records_) {
                file << "  \"" << entry.first.value() << "\":\n";
                WriteRecordYaml(file, entry.second, 4);
            }
        }

        file.flush();
        if (!file.good()) {
            return false;
        }
    }

    return std::rename(tmp_path.c_str(), config_.path.c_str()) == 0;
}

void FileColdStore::Write(const Pattern& pattern) {
    std::lock_guard<std::mutex> lock(mutex_);

    const PatternID id = pattern.header.id;
    auto previous = records_.find(id);
    std::optional<Pattern> backup;
    if (previous != records_.end()) {
        backup = previous->second;
    }

    records_[id] = pattern;

    if (!SaveLocked()) {
        // Keep memory consistent with what is on disk
        if (backup) {
            records_[id] = *backup;
        } else {
            records_.erase(id);
        }
        throw PatternError(ErrorCode::SERIALIZATION_FAILED,
                           "failed to write cold store " + config_.path);
    }
}

std::optional<Pattern> FileColdStore::Read(PatternID id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(id);
    if (it == records_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool FileColdStore::Contains(PatternID id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.count(id) > 0;
}

size_t FileColdStore::Count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}

void FileColdStore::Clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    records_.clear();
    if (!SaveLocked()) {
        throw PatternError(ErrorCode::SERIALIZATION_FAILED,
                           "failed to write cold store " + config_.path);
    }
}

// ============================================================================
// SqliteColdStore
// ============================================================================

SqliteColdStore::SqliteColdStore(const Config& config) : config_(config) {
    int rc = sqlite3_open(config_.db_path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::string error = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error("Failed to open database: " + error);
    }

    sqlite3_busy_timeout(db_, 5000);

    if (config_.enable_wal) {
        ExecuteSQL("PRAGMA journal_mode=WAL;");
    }
    ExecuteSQL("PRAGMA synchronous=" + config_.synchronous + ";");

    const char* create_table = R"(
        CREATE TABLE IF NOT EXISTS patterns (
            id INTEGER PRIMARY KEY,
            type INTEGER NOT NULL,
            confidence INTEGER NOT NULL,
            record TEXT NOT NULL
        );
    )";

    if (!ExecuteSQL(create_table)) {
        sqlite3_close_v2(db_);
        db_ = nullptr;
        throw std::runtime_error("Failed to create patterns table");
    }
}

SqliteColdStore::~SqliteColdStore() {
    if (db_) {
        sqlite3_close_v2(db_);
        db_ = nullptr;
    }
}

bool SqliteColdStore::ExecuteSQL(const std::string& sql) {
    char* error_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error_msg);

    if (rc != SQLITE_OK) {
        if (error_msg) {
            std::cerr << "SQLite error: " << error_msg << std::endl;
            sqlite3_free(error_msg);
        }
        return false;
    }

    return true;
}

void SqliteColdStore::Write(const Pattern& pattern) {
    std::lock_guard<std::mutex> lock(mutex_);

    const char* sql =
        "INSERT OR REPLACE INTO patterns (id, type, confidence, record) VALUES (?, ?, ?, ?);";
    sqlite3_stmt* stmt = nullptr;

    int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        throw PatternError(ErrorCode::SERIALIZATION_FAILED,
                           std::string("prepare failed: ") + sqlite3_errmsg(db_));
    }

    const std::string record = RecordToYaml(pattern);
    sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(pattern.header.id.value()));
    sqlite3_bind_int(stmt, 2, static_cast<int>(pattern.header.type));
    sqlite3_bind_int(stmt, 3, static_cast<int>(pattern.header.confidence));
    sqlite3_bind_text(stmt, 4, record.c_str(), static_cast<int>(record.size()), SQLITE_TRANSIENT);

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        throw PatternError(ErrorCode::SERIALIZATION_FAILED,
                           std::string("insert failed: ") + sqlite3_errmsg(db_));
    }
}

std::optional<Pattern> SqliteColdStore::Read(PatternID id) const {
    std::lock_guard<std::mutex> lock(mutex_);

    const char* sql = "SELECT record FROM patterns WHERE id = ?;";
    sqlite3_stmt* stmt = nullptr;

    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return std::nullopt;
    }

    sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(id.value()));

    std::optional<Pattern> result;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        const unsigned char* text = sqlite3_column_text(stmt, 0);
        int length = sqlite3_column_bytes(stmt, 0);
        if (text != nullptr) {
            result = RecordFromYaml(std::string(reinterpret_cast<const char*>(text),
                                                static_cast<size_t>(length)));
        }
    }

    sqlite3_finalize(stmt);
    return result;
}

bool SqliteColdStore::Contains(PatternID id) const {
    std::lock_guard<std::mutex> lock(mutex_);

    const char* sql = "SELECT 1 FROM patterns WHERE id = ? LIMIT 1;";
    sqlite3_stmt* stmt = nullptr;

    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return false;
    }

    sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(id.value()));
    bool exists = sqlite3_step(stmt) == SQLITE_ROW;
    sqlite3_finalize(stmt);
    return exists;
}

size_t SqliteColdStore::Count() const {
    std::lock_guard<std::mutex> lock(mutex_);

    const char* sql = "SELECT COUNT(*) FROM patterns;";
    sqlite3_stmt* stmt = nullptr;

    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return 0;
    }

    size_t count = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        count = static_cast<size_t>(sqlite3_column_int64(stmt, 0));
    }

    sqlite3_finalize(stmt);
    return count;
}

void SqliteColdStore::Clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!ExecuteSQL("DELETE FROM patterns;")) {
        throw PatternError(ErrorCode::SERIALIZATION_FAILED, "failed to clear cold store");
    }
}

} // namespace patex
