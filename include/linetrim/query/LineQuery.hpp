#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace linetrim::query {

// One spectral line recovered from a combined line list.
struct FlatRecord {
  double wavelength = 0.0;
  std::string species_name; // normalized, e.g. "Fe II"
  double loggf = 0.0;
  std::string species_code; // e.g. "26.000"
  int ionization = 0;
};

// Strip quotes and the NLTE/LTE marker from a second header line and collapse
// whitespace runs: "'Fe II     '   NLTE" -> "Fe II".
std::string normalize_species_name(std::string_view raw);

// Walk header/data pairs of combined text (blank lines between blocks are ignored).
// Throws TrimError(MalformedRecord) on a bad header, short block or non-numeric column.
std::vector<FlatRecord> parse_flat_records(std::string_view text);

// Records with lo <= wavelength <= hi and loggf >= loggf_min, ascending by wavelength
// (stable, so equal wavelengths keep file order).
std::vector<FlatRecord> filter_lines(const std::vector<FlatRecord>& records, double lo, double hi, double loggf_min);

// Records whose species name equals `name` after whitespace normalization.
std::vector<FlatRecord> find_species(const std::vector<FlatRecord>& records, std::string_view name);

// Tab-separated table: wavelength, species, loggf (atomic write).
void write_query_table(const std::filesystem::path& path, const std::vector<FlatRecord>& records);

} // namespace linetrim::query
