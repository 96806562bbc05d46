#include "rag_core/services/ingestion_service.hpp"

#include <iostream>
#include <stdexcept>

#include "rag_core/chunking/text_utils.hpp"

namespace rag_core {

IngestionService::IngestionService(std::shared_ptr<RetrievalStore> retrieval_store,
                                   std::shared_ptr<TokenChunker> chunker,
                                   ChunkingOptions options)
    : retrieval_store_(std::move(retrieval_store)),
      chunker_(std::move(chunker)),
      options_(options) {
  if (options_.chunk_size == 0) {
    throw std::invalid_argument("chunk_size must be greater than 0");
  }
}

IngestResult IngestionService::ingest_text(const std::string &document_name,
                                           const std::string &text) {
  if (is_blank(document_name)) {
    throw std::invalid_argument("document_name cannot be empty");
  }

  std::cout << "Chunking text for '" << document_name << "' (" << text.size() << " characters)..."
            << std::endl;
  std::vector<Chunk> chunks = chunker_->chunk(text, options_.chunk_size, options_.chunk_overlap);
  std::cout << "Created " << chunks.size() << " chunks." << std::endl;

  std::vector<std::string> chunk_texts;
  chunk_texts.reserve(chunks.size());
  for (auto &chunk : chunks) {
    chunk_texts.push_back(std::move(chunk.content));
  }

  AddDocumentsResult added = retrieval_store_->add_documents(chunk_texts, document_name);
  return {document_name, added.chunks_added, added.total_vectors};
}

}  // namespace rag_core
