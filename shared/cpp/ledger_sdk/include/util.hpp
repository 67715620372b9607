#pragma once
#include <string>
#include <chrono>
#include <optional>
#include <filesystem>

std::string getenv_or(const char* key, const std::string& def);
std::string gen_id();

// ISO-8601 UTC with microseconds, e.g. 2026-10-18T09:26:00.123456+00:00
std::string format_iso8601(std::chrono::system_clock::time_point tp);
std::string now_iso8601();
// Accepts 'T' or ' ' as separator, optional fraction, and Z / +HH:MM / -HH:MM
// or no offset (read as UTC).
std::optional<std::chrono::system_clock::time_point> parse_iso8601(const std::string& s);

// Hex SHA-1 of the file contents; empty when the file cannot be opened.
std::string sha1_file(const std::filesystem::path& p);
std::optional<std::string> read_text_file(const std::filesystem::path& p);
