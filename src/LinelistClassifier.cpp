#include "linetrim/io/LinelistClassifier.hpp"

#include <fstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "linetrim/util/Parse.hpp"

namespace linetrim {

namespace {

FileClassification make(FileClass cls, std::string msg) {
  FileClassification out;
  out.cls = cls;
  out.message = std::move(msg);
  return out;
}

// The identifier spans the first two tokens unless the first token already
// carries both quotes ("'26.000'").
std::string species_text(const std::vector<std::string_view>& toks) {
  const std::string_view t0 = toks[0];
  if (t0.size() > 1 && t0.front() == '\'' && t0.back() == '\'') return std::string(t0);
  std::string s(t0);
  s.append(toks[1].data(), toks[1].size());
  return s;
}

} // namespace

FileClassification classify_first_line(const std::string& first_line, const ClassifyFlags& flags) {
  if (!is_valid_utf8(first_line)) {
    return make(FileClass::Unreadable, "first line is not valid UTF-8 text");
  }
  if (is_blank(first_line)) {
    return make(FileClass::Empty, "first line is empty");
  }

  std::vector<std::string_view> toks;
  split_ws(first_line, toks);
  if (toks.size() < 2) {
    return make(FileClass::Unreadable, "first line has fewer than two tokens");
  }

  auto id = parse_species_id(species_text(toks));
  if (!id) {
    return make(FileClass::Unreadable, "first line does not start with a species identifier");
  }

  FileClassification out;
  out.species = *id;
  out.kind = classify_species(*id);
  switch (*out.kind) {
    case SpeciesKind::Hydrogen:
      out.cls = flags.include_hydrogen ? FileClass::Hydrogen : FileClass::Excluded;
      if (!flags.include_hydrogen) out.message = "hydrogen excluded by configuration";
      break;
    case SpeciesKind::Molecule:
      out.cls = flags.include_molecules ? FileClass::Molecule : FileClass::Excluded;
      if (!flags.include_molecules) out.message = "molecules excluded by configuration";
      break;
    case SpeciesKind::Atom:
      out.cls = FileClass::Atom;
      break;
  }
  return out;
}

FileClassification classify_linelist_file(const std::filesystem::path& path, const ClassifyFlags& flags) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) {
    return make(FileClass::Unreadable, "failed to open file");
  }
  std::string first;
  if (!std::getline(ifs, first)) {
    if (ifs.bad()) return make(FileClass::Unreadable, "read error");
    return make(FileClass::Empty, "file is empty");
  }
  if (!first.empty() && first.back() == '\r') first.pop_back();
  return classify_first_line(first, flags);
}

bool is_os_metadata_file(const std::filesystem::path& path) {
  const std::string name = path.filename().string();
  if (name == ".DS_Store" || name == "Thumbs.db" || name == "desktop.ini") return true;
  return name.rfind("._", 0) == 0;
}

} // namespace linetrim
