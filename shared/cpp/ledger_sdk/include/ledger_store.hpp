#pragma once
#include "ledger.hpp"
#include "log.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

// Whole-document reads and writes of the shared ledger file. Holds no lock of
// its own: callers hold the LockManager lock across read-mutate-write.
class LedgerStore {
public:
    explicit LedgerStore(std::filesystem::path path, Logger log = Logger("ledger-store"));

    // Empty ledger when the file does not exist; nullopt when it exists but
    // cannot be read or parsed. Never overwrite a ledger that read as nullopt.
    std::optional<Ledger> read() const;
    // Same contract on the raw JSON document, for tools that inspect
    // malformed entries the typed model rejects.
    std::optional<nlohmann::json> read_document() const;

    // Full replace through a temporary file and rename.
    bool write(const Ledger& ledger) const;

    bool exists() const;
    // SHA-1 of the file; empty when it does not exist.
    std::string fingerprint() const;
    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
    Logger log_;
};
