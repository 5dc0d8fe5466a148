#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "linetrim/core/Species.hpp"

namespace linetrim {

enum class FileClass {
  Atom,
  Molecule,
  Hydrogen,
  Excluded,   // readable, but rejected by include_molecules / include_hydrogen
  Unreadable,
  Empty,
};

inline std::string file_class_name(FileClass c) {
  switch (c) {
    case FileClass::Atom: return "atom";
    case FileClass::Molecule: return "molecule";
    case FileClass::Hydrogen: return "hydrogen";
    case FileClass::Excluded: return "excluded";
    case FileClass::Unreadable: return "unreadable";
    case FileClass::Empty: return "empty";
  }
  return "unreadable";
}

struct ClassifyFlags {
  bool include_molecules = true;
  bool include_hydrogen = true;
};

struct FileClassification {
  FileClass cls = FileClass::Unreadable;
  std::optional<SpeciesId> species;   // set whenever the first line could be parsed
  std::optional<SpeciesKind> kind;    // idem
  std::string message;                // reason for Unreadable/Empty/Excluded

  bool kept() const {
    return cls == FileClass::Atom || cls == FileClass::Molecule || cls == FileClass::Hydrogen;
  }
};

// Classify a first line that was already read (no I/O).
FileClassification classify_first_line(const std::string& first_line, const ClassifyFlags& flags);

// Read only the first line of `path` and classify it. Never throws for
// unreadable input; that is reported through FileClass::Unreadable.
FileClassification classify_linelist_file(const std::filesystem::path& path, const ClassifyFlags& flags);

// OS metadata files that can sit in a line list directory (.DS_Store, AppleDouble, ...).
bool is_os_metadata_file(const std::filesystem::path& path);

} // namespace linetrim
