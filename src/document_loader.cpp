#include "document_loader.hpp"
#include "chunker.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include "utf8.hpp"
#include <poppler-document.h>
#include <poppler-page.h>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>

using std::string;
namespace fs = std::filesystem;

static bool is_policy_ext(const string& ext) {
  static const char* good[] = {".txt", ".md", ".markdown", ".pdf"};
  for (auto* g : good) if (ext == g) return true;
  return false;
}

static string lower_ext(const fs::path& p) {
  auto ext = p.extension().string();
  for (auto& c : ext) c = (char)tolower((unsigned char)c);
  return ext;
}

std::vector<string> list_policy_files(const string& root) {
  if (!fs::is_directory(root)) throw IngestionError("data dir not found: " + root);
  std::vector<string> out;
  for (auto& p : fs::recursive_directory_iterator(root)) {
    if (!p.is_regular_file()) continue;
    if (!is_policy_ext(lower_ext(p.path()))) continue;
    out.push_back(p.path().string());
  }
  std::sort(out.begin(), out.end());
  return out;
}

static string load_pdf_text(const string& path) {
  std::unique_ptr<poppler::document> doc(poppler::document::load_from_file(path));
  if (!doc) throw IngestionError("cannot open pdf: " + path);
  string out;
  for (int i = 0; i < doc->pages(); ++i) {
    std::unique_ptr<poppler::page> page(doc->create_page(i));
    if (!page) continue;
    auto bytes = page->text().to_utf8();
    out.append(bytes.begin(), bytes.end());
    out.push_back('\n');
  }
  return out;
}

string load_text_from_file(const string& path) {
  if (!fs::is_regular_file(path)) throw IngestionError("file not found: " + path);
  if (lower_ext(path) == ".pdf") return load_pdf_text(path);

  std::ifstream in(path, std::ios::binary);
  if (!in) throw IngestionError("cannot read file: " + path);
  std::ostringstream ss;
  ss << in.rdbuf();
  // files in legacy encodings lose their non-UTF-8 bytes
  return drop_invalid_utf8(ss.str());
}

std::vector<DocumentChunk> load_document(const string& path, const string& doc_id,
                                         int size, int overlap) {
  string text = normalize_ws(load_text_from_file(path));
  if (text.empty()) throw IngestionError("no text could be extracted from " + path);
  return chunk_document(text, doc_id, path, size, overlap);
}

std::vector<DocumentChunk> load_folder(const string& root, int size, int overlap) {
  std::vector<DocumentChunk> all;
  for (auto& f : list_policy_files(root)) {
    try {
      auto v = load_document(f, make_uuid(), size, overlap);
      all.insert(all.end(), v.begin(), v.end());
    } catch (const IngestionError& e) {
      logger()->warn("skipping {}: {}", f, e.what());
    }
  }
  return all;
}
