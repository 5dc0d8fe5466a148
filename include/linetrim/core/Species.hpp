#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace linetrim {

// Species identifier as written in the first header token(s) of a line list,
// e.g. "'  26.000  '" -> {code="26", fraction="000"},
//      "'0608.012016'" -> {code="0608", fraction="012016"}.
struct SpeciesId {
  std::string code;     // integer part (atomic number, or concatenated numbers for molecules)
  std::string fraction; // digits after the dot (isotope encoding), may be empty

  std::string dotted() const { return fraction.empty() ? code : code + "." + fraction; }
};

enum class SpeciesKind {
  Atom,
  Molecule,
  Hydrogen,
};

inline constexpr const char* HYDROGEN_SENTINEL = "01.000000";

inline std::string species_kind_name(SpeciesKind k) {
  switch (k) {
    case SpeciesKind::Atom: return "atom";
    case SpeciesKind::Molecule: return "molecule";
    case SpeciesKind::Hydrogen: return "hydrogen";
  }
  return "atom";
}

// Parse the identifier from the raw text of the first two header tokens joined
// together (quote tokens included). Returns nullopt when no digits are present.
inline std::optional<SpeciesId> parse_species_id(std::string_view joined) {
  std::string body;
  body.reserve(joined.size());
  for (char c : joined) {
    if (c != '\'' && c != '"') body.push_back(c);
  }
  const auto dot = body.find('.');
  SpeciesId id;
  id.code = body.substr(0, dot);
  if (dot != std::string::npos) id.fraction = body.substr(dot + 1);
  if (id.code.empty()) return std::nullopt;
  for (char c : id.code) {
    if (c < '0' || c > '9') return std::nullopt;
  }
  return id;
}

// Molecules are encoded as two (or more) concatenated two-digit atomic numbers.
inline SpeciesKind classify_species(const SpeciesId& id) {
  if (id.dotted() == HYDROGEN_SENTINEL) return SpeciesKind::Hydrogen;
  if (id.code.size() > 2) return SpeciesKind::Molecule;
  return SpeciesKind::Atom;
}

} // namespace linetrim
