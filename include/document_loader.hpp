#pragma once
#include "chunk.hpp"
#include <string>
#include <vector>

// .txt, .md, .markdown and .pdf files below root, sorted by path.
std::vector<std::string> list_policy_files(const std::string& root);

// Text of one file as UTF-8; PDFs go through poppler, other files have
// bytes that are not valid UTF-8 dropped. Throws IngestionError when the
// file cannot be opened.
std::string load_text_from_file(const std::string& path);

// Load, normalize and chunk one file. Throws IngestionError when no text
// could be extracted.
std::vector<DocumentChunk> load_document(const std::string& path, const std::string& doc_id,
                                         int size=800, int overlap=120);

// Chunk a whole folder; every file gets a fresh doc_id. Unreadable or empty
// files are logged and skipped.
std::vector<DocumentChunk> load_folder(const std::string& root, int size=800, int overlap=120);
