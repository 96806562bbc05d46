#pragma once

#include <memory>
#include <string>

#include "rag_core/chunking/token_chunker.hpp"
#include "rag_core/store/retrieval_store.hpp"

namespace rag_core {

struct ChunkingOptions {
  size_t chunk_size = 500;
  size_t chunk_overlap = 50;
};

struct IngestResult {
  std::string document_name;
  size_t chunks_added;
  size_t total_vectors;
};

class IngestionService {
 public:
  IngestionService(std::shared_ptr<RetrievalStore> retrieval_store,
                   std::shared_ptr<TokenChunker> chunker,
                   ChunkingOptions options = {});

  virtual ~IngestionService() = default;

  // Chunks the text and adds every chunk under document_name. Blank text adds nothing.
  virtual IngestResult ingest_text(const std::string &document_name, const std::string &text);

  const ChunkingOptions &options() const {
    return options_;
  }

 private:
  std::shared_ptr<RetrievalStore> retrieval_store_;
  std::shared_ptr<TokenChunker> chunker_;
  ChunkingOptions options_;
};

}  // namespace rag_core
