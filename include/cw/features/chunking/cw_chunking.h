/**
 * @file cw_chunking.h
 * @brief Chunkwise - Document Chunking Public API
 *
 * Splits document text into overlapping chunks for embedding and indexing:
 * - Five strategies: fixed, sentence, paragraph, semantic, sliding
 * - Heuristic token estimation (no tokenizer)
 * - Per-chunk quality scores and run metrics as JSON
 *
 * All text is UTF-8. Lengths in characters count grapheme clusters.
 */

#ifndef CW_CHUNKING_H
#define CW_CHUNKING_H

#include "cw/core/cw_types.h"
#include "cw/core/cw_error.h"

#ifdef __cplusplus
extern "C" {
#endif

// =============================================================================
// FORWARD DECLARATIONS
// =============================================================================

typedef struct cw_chunker cw_chunker_t;

// =============================================================================
// CONFIGURATION
// =============================================================================

/**
 * @brief Chunker configuration
 *
 * Out-of-range sizes are clamped when the chunker is created: chunk_size
 * below 1 becomes 1, negative overlap becomes 0, overlap >= chunk_size
 * becomes chunk_size - 1.
 */
typedef struct cw_chunking_config {
    /** Strategy id: "fixed", "sentence", "paragraph", "semantic" or "sliding".
     *  NULL means "sentence"; unknown ids fall back to "fixed". */
    const char* strategy;

    /** Target size: characters for fixed/sentence/paragraph,
     *  estimated tokens for semantic/sliding */
    int32_t chunk_size;

    /** Overlap between adjacent chunks, same unit as chunk_size */
    int32_t chunk_overlap;
} cw_chunking_config_t;

/**
 * @brief Get default chunking configuration (sentence, 512/50)
 */
static inline cw_chunking_config_t cw_chunking_config_default(void) {
    cw_chunking_config_t cfg;
    cfg.strategy = "sentence";
    cfg.chunk_size = 512;
    cfg.chunk_overlap = 50;
    return cfg;
}

/**
 * @brief Get the catalog defaults of a strategy
 *
 * @param strategy_id Strategy id; unknown ids give the "fixed" defaults
 * @return Configuration whose strategy string has static lifetime
 */
CW_API cw_chunking_config_t cw_chunking_config_for_strategy(const char* strategy_id);

// =============================================================================
// RESULTS
// =============================================================================

/**
 * @brief One chunk
 */
typedef struct cw_chunk {
    size_t sequence_index;       /**< 1-based position in the result */
    char* text;                  /**< Trimmed chunk text (freed by cw_chunk_result_free) */
    size_t estimated_tokens;
    size_t character_count;      /**< Grapheme clusters */
    size_t unit_count;           /**< Sentences, paragraphs or words in the chunk */
    size_t unit_first;           /**< First unit number, 1-based; 0 if not applicable */
    size_t unit_last;            /**< Last unit number, 1-based; 0 if not applicable */
    char* strategy;              /**< "fixed-size", "sentence-boundary", ... */
    char* quality_json;          /**< Strategy-specific quality fields as a JSON object */
} cw_chunk_t;

/**
 * @brief Chunking result
 */
typedef struct cw_chunk_result {
    cw_chunk_t* chunks;          /**< Array of num_chunks chunks */
    size_t num_chunks;
    char* metrics_json;          /**< Metrics summary JSON */
    char* insights_json;         /**< JSON array of insight strings */
    double processing_time_ms;
} cw_chunk_result_t;

// =============================================================================
// PUBLIC API
// =============================================================================

/**
 * @brief Create a chunker
 *
 * @param config Chunker configuration
 * @param out_chunker Pointer to receive chunker handle
 * @return CW_SUCCESS on success, error code otherwise
 */
CW_API cw_result_t cw_chunker_create(
    const cw_chunking_config_t* config,
    cw_chunker_t** out_chunker
);

/**
 * @brief Create a chunker from a saved configuration
 *
 * Format: {"strategy": "semantic", "chunkSize": 1024, "overlap": 128}.
 * Missing fields take the strategy's defaults.
 *
 * @return CW_ERROR_INVALID_FORMAT if config_json is malformed
 */
CW_API cw_result_t cw_chunker_create_from_json(
    const char* config_json,
    cw_chunker_t** out_chunker
);

/**
 * @brief Split a document into chunks
 *
 * Empty or whitespace-only text yields CW_SUCCESS with zero chunks.
 *
 * @param chunker Chunker handle
 * @param text NUL-terminated UTF-8 document
 * @param out_result Pointer to receive result (caller must free with cw_chunk_result_free)
 * @return CW_SUCCESS on success, CW_ERROR_INVALID_ENCODING for invalid UTF-8
 */
CW_API cw_result_t cw_chunker_chunk(
    cw_chunker_t* chunker,
    const char* text,
    cw_chunk_result_t* out_result
);

/**
 * @brief Chunk a document and encode the run as an export document
 *
 * @param out_json Pointer to receive JSON string (caller must free with cw_free)
 */
CW_API cw_result_t cw_chunker_export_json(
    cw_chunker_t* chunker,
    const char* text,
    char** out_json
);

/**
 * @brief Get the effective (clamped) configuration as JSON
 *
 * @param out_json Pointer to receive JSON string (caller must free with cw_free)
 */
CW_API cw_result_t cw_chunker_get_config_json(
    cw_chunker_t* chunker,
    char** out_json
);

/**
 * @brief Get the strategy catalog as a JSON array
 *
 * @param out_json Pointer to receive JSON string (caller must free with cw_free)
 */
CW_API cw_result_t cw_chunking_get_strategies_json(char** out_json);

/**
 * @brief Estimate the token count of text
 *
 * @return 0 for NULL, empty or invalid UTF-8 text, otherwise at least 1
 */
CW_API size_t cw_estimate_tokens(const char* text);

/**
 * @brief Free chunk result resources
 *
 * The struct itself is owned by the caller and is zeroed.
 */
CW_API void cw_chunk_result_free(cw_chunk_result_t* result);

/**
 * @brief Destroy chunker
 */
CW_API void cw_chunker_destroy(cw_chunker_t* chunker);

#ifdef __cplusplus
}
#endif

#endif // CW_CHUNKING_H
