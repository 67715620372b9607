#include "../include/ledger_store.hpp"
#include "../include/util.hpp"
#include <fstream>
#include <system_error>

using json = nlohmann::json;

LedgerStore::LedgerStore(std::filesystem::path path, Logger log)
    : path_(std::move(path)), log_(std::move(log)) {}

bool LedgerStore::exists() const {
    std::error_code ec;
    return std::filesystem::exists(path_, ec);
}

std::optional<json> LedgerStore::read_document() const {
    if (!exists()) {
        log_.debug(path_.string() + " not found. Using an empty ledger.");
        return json{{"tasks", json::array()}, {"task_pairs", json::array()}};
    }
    auto text = read_text_file(path_);
    if (!text) {
        log_.error("Error reading " + path_.string() + ".");
        return std::nullopt;
    }
    try {
        return json::parse(*text);
    } catch (const json::exception& e) {
        log_.error("Error parsing " + path_.string() + ": " + e.what());
        return std::nullopt;
    }
}

std::optional<Ledger> LedgerStore::read() const {
    auto doc = read_document();
    if (!doc) return std::nullopt;
    try {
        return doc->get<Ledger>();
    } catch (const std::exception& e) {
        log_.error("Ledger " + path_.string() + " does not match the expected schema: " + e.what());
        return std::nullopt;
    }
}

bool LedgerStore::write(const Ledger& ledger) const {
    std::string body;
    try {
        body = json(ledger).dump(2);
    } catch (const json::exception& e) {
        log_.error(std::string("Error serializing ledger: ") + e.what());
        return false;
    }

    std::filesystem::path tmp = path_;
    tmp += ".tmp." + gen_id().substr(0, 8);
    {
        std::ofstream f(tmp, std::ios::binary | std::ios::trunc);
        if (!f) {
            log_.error("Error opening " + tmp.string() + " for writing.");
            return false;
        }
        f << body << '\n';
        f.flush();
        if (!f) {
            log_.error("Error writing ledger to " + tmp.string() + ".");
            std::error_code ec;
            std::filesystem::remove(tmp, ec);
            return false;
        }
    }

    std::error_code ec;
    std::filesystem::rename(tmp, path_, ec);
    if (ec) {
        log_.error("Error replacing " + path_.string() + ": " + ec.message());
        std::error_code ignored;
        std::filesystem::remove(tmp, ignored);
        return false;
    }
    log_.debug("Ledger written to " + path_.string() + ".");
    return true;
}

std::string LedgerStore::fingerprint() const {
    if (!exists()) return {};
    return sha1_file(path_);
}
