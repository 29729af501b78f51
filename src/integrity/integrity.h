/*
 * integrity.h — SHA-256 fingerprints of generated artifacts
 */

#ifndef INTEGRITY_H
#define INTEGRITY_H

#include "action_log/action_log.h"

#include <optional>
#include <string>
#include <vector>

/// Lowercase hex SHA-256 of the file's contents, or nullopt if it cannot be
/// read.
std::optional<std::string> sha256_file(const std::string& path);

/// Write hashes.csv ("filename,sha256_hash"): one row per existing file,
/// keyed by basename, "ERROR" when hashing fails. Missing files are skipped.
/// Returns false if `csv_path` cannot be written.
bool write_hashes_csv(const std::vector<std::string>& files,
                      const std::string& csv_path,
                      ActionLog& log);

#endif // INTEGRITY_H
